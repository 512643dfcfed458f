#include "meshcast/session/SessionLoop.hpp"

#include "meshcast/Error.hpp"
#include "meshcast/logging/StructuredLogger.hpp"

#include <type_traits>
#include <utility>

namespace meshcast::session {

namespace {

using logging::StructuredLogger;

void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace

SessionLoop::SessionLoop(std::unique_ptr<transport::StreamChannel> channel, const Config& config)
    : channel_(std::move(channel)),
      config_(config) {
    if (!channel_) {
        throw ResourceError("E_TRANSPORT_UNAVAILABLE", "Session requires a stream channel");
    }
}

SessionLoop::~SessionLoop() {
    worker_running_.store(false);
    if (worker_.joinable()) {
        worker_.join();
    }
    channel_->close();
}

void SessionLoop::activate(Timestamp now) {
    std::scoped_lock lock(mutex_);
    if (started_ || stopped_.load()) {
        return;
    }
    started_ = true;
    next_presence_at_ = now;
    try {
        on_start(now);
    } catch (const TransportError& ex) {
        record_error(ex.what());
    } catch (const std::exception& ex) {
        log_event(StructuredLogger::Level::Error, "session.start.failed", {{"reason", ex.what()}});
        record_error(ex.what());
    }
    run_timers(now);
}

void SessionLoop::start() {
    activate(Clock::now());
    if (stopped_.load() || worker_running_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this] { run(); });
}

void SessionLoop::run() {
    while (worker_running_.load()) {
        if (!poll(config_.poll_interval)) {
            break;
        }
    }
}

void SessionLoop::stop() noexcept {
    if (stopped_.exchange(true)) {
        return;
    }
    worker_running_.store(false);
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }

    std::scoped_lock lock(mutex_);
    on_teardown();
    neighbors_.clear();
    channel_->close();
    log_event(StructuredLogger::Level::Info, "session.stopped", {{"topic", channel_->topic()}});
}

bool SessionLoop::poll(std::chrono::milliseconds timeout) {
    if (stopped_.load()) {
        return false;
    }
    activate(Clock::now());

    auto event = channel_->next_event(timeout);
    const auto now = Clock::now();

    std::scoped_lock lock(mutex_);
    if (stopped_.load()) {
        return false;
    }
    if (event.has_value()) {
        dispatch(*event, now);
    } else if (channel_->closed()) {
        record_error("transport closed");
        return false;
    }
    run_timers(now);
    return true;
}

void SessionLoop::tick(Timestamp now) {
    std::scoped_lock lock(mutex_);
    if (stopped_.load()) {
        return;
    }
    run_timers(now);
}

void SessionLoop::dispatch(const transport::StreamEvent& event, Timestamp now) {
    track_neighbor(event, now);
    if (std::holds_alternative<transport::Lagged>(event)) {
        log_event(StructuredLogger::Level::Warning, "session.channel.lagged", {{"topic", channel_->topic()}});
    }
    try {
        on_event(event, now);
    } catch (const TransportError& ex) {
        record_error(ex.what());
    } catch (const std::exception& ex) {
        log_event(StructuredLogger::Level::Error, "session.dispatch.failed", {{"reason", ex.what()}});
        record_error(ex.what());
    }
}

void SessionLoop::track_neighbor(const transport::StreamEvent& event, Timestamp now) {
    std::visit(
        [&](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, transport::NeighborUp>) {
                auto& info = neighbors_[value.peer];
                info.peer = value.peer;
                info.last_seen = now;
                log_event(StructuredLogger::Level::Info, "session.neighbor.up", {{"peer", short_peer_id(value.peer)}});
            } else if constexpr (std::is_same_v<T, transport::NeighborDown>) {
                neighbors_.erase(value.peer);
                log_event(StructuredLogger::Level::Info, "session.neighbor.down", {{"peer", short_peer_id(value.peer)}});
            } else if constexpr (std::is_same_v<T, transport::Presence>) {
                auto& info = neighbors_[value.peer];
                info.peer = value.peer;
                info.display_name = value.name;
                info.last_seen = now;
            }
        },
        event);
}

void SessionLoop::run_timers(Timestamp now) {
    try {
        if (config_.presence_interval.count() > 0 && now >= next_presence_at_) {
            next_presence_at_ = now + config_.presence_interval;
            channel_->send_presence();
        }
        on_tick(now);
    } catch (const TransportError& ex) {
        record_error(ex.what());
    } catch (const std::exception& ex) {
        log_event(StructuredLogger::Level::Error, "session.timer.failed", {{"reason", ex.what()}});
        record_error(ex.what());
    }
}

std::optional<protocol::WireMessage> SessionLoop::decode_message(const transport::StreamEvent& event) const {
    const Bytes* bytes = nullptr;
    const PeerId* from = nullptr;
    if (const auto* signal = std::get_if<transport::Signal>(&event)) {
        bytes = &signal->data;
        from = &signal->from;
    } else if (const auto* frame = std::get_if<transport::MediaFrame>(&event)) {
        bytes = &frame->data;
        from = &frame->from;
    } else {
        return std::nullopt;
    }
    if (*from == channel_->local_id()) {
        return std::nullopt;
    }
    auto message = protocol::decode_wire_message(*bytes);
    if (!message.has_value()) {
        log_event(StructuredLogger::Level::Warning,
                  "session.message.dropped",
                  {{"peer", short_peer_id(*from)}, {"bytes", std::to_string(bytes->size())}});
        return std::nullopt;
    }
    if (protocol::sender_of(*message) == channel_->local_id()) {
        return std::nullopt;
    }
    return message;
}

void SessionLoop::record_error(std::string message) {
    log_event(StructuredLogger::Level::Warning, "session.error", {{"reason", message}});
    std::scoped_lock lock(mutex_);
    last_error_ = std::move(message);
}

std::string SessionLoop::ticket(const transport::TicketOptions& options) const {
    return channel_->ticket(options);
}

std::vector<NeighborInfo> SessionLoop::neighbors() const {
    std::scoped_lock lock(mutex_);
    std::vector<NeighborInfo> result;
    result.reserve(neighbors_.size());
    for (const auto& [peer, info] : neighbors_) {
        result.push_back(info);
    }
    return result;
}

std::optional<std::string> SessionLoop::last_error() const {
    std::scoped_lock lock(mutex_);
    return last_error_;
}

}  // namespace meshcast::session
