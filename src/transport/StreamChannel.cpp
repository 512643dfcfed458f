#include "meshcast/transport/StreamChannel.hpp"

#include "meshcast/Error.hpp"
#include "meshcast/logging/StructuredLogger.hpp"

#include <algorithm>
#include <utility>

namespace meshcast::transport {

namespace {

using logging::StructuredLogger;

void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace

StreamChannel::StreamChannel(std::unique_ptr<BroadcastChannel> transport, const Config& config)
    : transport_(std::move(transport)),
      fragmenter_(config.max_subchunk_size),
      reassembler_(config.pending_frame_timeout) {
    if (!transport_) {
        throw ResourceError("E_TRANSPORT_UNAVAILABLE", "Stream channel requires a transport");
    }
}

StreamChannel::~StreamChannel() {
    close();
}

void StreamChannel::broadcast_chunk(std::span<const std::uint8_t> payload, std::int64_t frame_number) {
    const auto parts = fragmenter_.send(*transport_, payload, frame_number);
    std::scoped_lock lock(mutex_);
    ++statistics_.frames_sent;
    statistics_.parts_sent += parts;
}

void StreamChannel::broadcast_signal(std::span<const std::uint8_t> payload) {
    if (payload.size() <= fragmenter_.max_subchunk_size()) {
        transport_->send(payload, kSignalTag);
        std::scoped_lock lock(mutex_);
        ++statistics_.signals_sent;
        return;
    }
    const auto frame_number = next_control_frame_.fetch_add(1);
    log_event(StructuredLogger::Level::Debug,
              "channel.signal.fragmented",
              {{"bytes", std::to_string(payload.size())}, {"frame", std::to_string(frame_number)}});
    broadcast_chunk(payload, frame_number);
    std::scoped_lock lock(mutex_);
    ++statistics_.signals_sent;
}

void StreamChannel::send_presence() {
    transport_->announce_presence();
}

void StreamChannel::set_display_name(std::string name) {
    transport_->set_display_name(std::move(name));
}

std::string StreamChannel::ticket(const TicketOptions& options) const {
    return transport_->ticket(options);
}

std::vector<PeerId> StreamChannel::neighbors() const {
    return transport_->neighbors();
}

std::optional<StreamEvent> StreamChannel::next_event(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        auto event = transport_->next_event(std::max(remaining, std::chrono::milliseconds(0)));
        if (!event.has_value()) {
            return std::nullopt;
        }
        auto translated = translate(std::move(*event));
        if (translated.has_value()) {
            return translated;
        }
        if (Clock::now() >= deadline) {
            return std::nullopt;
        }
    }
}

std::optional<StreamEvent> StreamChannel::translate(TransportEvent event) {
    switch (event.kind) {
        case TransportEventKind::NeighborUp:
            return NeighborUp{std::move(event.sender)};
        case TransportEventKind::NeighborDown:
            return NeighborDown{std::move(event.sender)};
        case TransportEventKind::Presence:
            return Presence{std::move(event.sender), std::move(event.display_name), event.sent_timestamp_ms};
        case TransportEventKind::Lagged: {
            std::scoped_lock lock(mutex_);
            ++statistics_.lagged_events;
            return Lagged{};
        }
        case TransportEventKind::Signal:
            return Signal{std::move(event.sender), std::move(event.payload), event.arrival};
        case TransportEventKind::Chunk:
            break;
    }

    if (is_signal_tag(event.tag)) {
        return Signal{std::move(event.sender), std::move(event.payload), event.arrival};
    }

    std::scoped_lock lock(mutex_);
    auto frame = reassembler_.accept(event.sender, event.tag, std::move(event.payload), event.arrival);
    if (!frame.has_value()) {
        return std::nullopt;
    }
    if (frame->frame_number >= kControlFrameBase) {
        return Signal{std::move(frame->sender), std::move(frame->payload), event.arrival};
    }
    return MediaFrame{std::move(frame->sender), frame->frame_number, std::move(frame->payload), event.arrival};
}

void StreamChannel::close() {
    if (!transport_->closed()) {
        transport_->close();
    }
    std::scoped_lock lock(mutex_);
    reassembler_.clear();
}

bool StreamChannel::closed() const {
    return transport_->closed();
}

const PeerId& StreamChannel::local_id() const noexcept {
    return transport_->local_id();
}

const std::string& StreamChannel::topic() const noexcept {
    return transport_->topic();
}

std::size_t StreamChannel::pending_frames() const {
    std::scoped_lock lock(mutex_);
    return reassembler_.pending_frames();
}

Reassembler::Statistics StreamChannel::reassembly_statistics() const {
    std::scoped_lock lock(mutex_);
    return reassembler_.statistics();
}

StreamChannel::Statistics StreamChannel::statistics() const {
    std::scoped_lock lock(mutex_);
    return statistics_;
}

}  // namespace meshcast::transport
