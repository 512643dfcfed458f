#include "meshcast/session/LiveSession.hpp"

#include "meshcast/Error.hpp"
#include "meshcast/logging/StructuredLogger.hpp"
#include "meshcast/protocol/WireMessage.hpp"

#include <utility>

namespace meshcast::session {

namespace {

using logging::StructuredLogger;

void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

signaling::NegotiationEngine& require_engine(const std::unique_ptr<signaling::NegotiationEngine>& engine) {
    if (!engine) {
        throw ResourceError("E_ENGINE_UNAVAILABLE", "Live session requires a negotiation engine");
    }
    return *engine;
}

}  // namespace

LiveSession::LiveSession(std::unique_ptr<transport::StreamChannel> channel,
                         const Config& config,
                         std::unique_ptr<signaling::NegotiationEngine> engine,
                         signaling::MediaSource* source)
    : SessionLoop(std::move(channel), config),
      engine_(std::move(engine)),
      source_(source),
      signaling_(local_id(), this->channel(), require_engine(engine_), this->config(), source) {}

LiveSession::~LiveSession() {
    stop();
}

void LiveSession::set_state_observer(signaling::SignalingSession::StateObserver observer) {
    signaling_.set_state_observer(std::move(observer));
}

void LiveSession::set_track_observer(signaling::SignalingSession::TrackObserver observer) {
    signaling_.set_track_observer(std::move(observer));
}

void LiveSession::set_media_observer(MediaObserver observer) {
    std::scoped_lock lock(state_mutex());
    media_observer_ = std::move(observer);
}

std::int64_t LiveSession::send_media_frame(std::span<const std::uint8_t> data) {
    std::scoped_lock lock(state_mutex());
    const auto frame = next_media_frame_;
    // Frame numbers from kControlFrameBase up carry oversize signals.
    next_media_frame_ = (next_media_frame_ + 1) % transport::kControlFrameBase;
    channel().broadcast_chunk(data, frame);
    return frame;
}

signaling::PeerPhase LiveSession::phase(const PeerId& peer) const {
    return signaling_.phase(peer);
}

signaling::SignalingSnapshot LiveSession::snapshot() const {
    auto result = signaling_.snapshot();
    if (!result.last_error.has_value()) {
        result.last_error = last_error();
    }
    return result;
}

void LiveSession::on_start(Timestamp now) {
    log_event(StructuredLogger::Level::Info,
              "session.live.started",
              {{"topic", channel().topic()}, {"role", is_broadcaster() ? "broadcaster" : "viewer"}});
    if (!is_broadcaster()) {
        signaling_.begin_offer_requests(now);
    }
}

void LiveSession::on_event(const transport::StreamEvent& event, Timestamp) {
    if (const auto* down = std::get_if<transport::NeighborDown>(&event)) {
        signaling_.handle_peer_left(down->peer);
        return;
    }

    // Media frames are opaque; only the signal path carries wire messages.
    if (const auto* frame = std::get_if<transport::MediaFrame>(&event)) {
        if (frame->from != local_id() && media_observer_) {
            media_observer_(*frame);
        }
        return;
    }
    if (!std::holds_alternative<transport::Signal>(event)) {
        return;
    }

    auto message = decode_message(event);
    if (!message.has_value()) {
        return;
    }
    if (const auto* signal = std::get_if<protocol::SignalMessage>(&*message)) {
        signaling_.handle_signal(*signal);
    }
}

void LiveSession::on_tick(Timestamp now) {
    signaling_.tick(now);
}

void LiveSession::on_teardown() noexcept {
    signaling_.close_all();
}

}  // namespace meshcast::session
