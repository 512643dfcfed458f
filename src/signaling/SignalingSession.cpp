#include "meshcast/signaling/SignalingSession.hpp"

#include "meshcast/Error.hpp"
#include "meshcast/logging/StructuredLogger.hpp"
#include "meshcast/protocol/WireMessage.hpp"

#include <exception>
#include <type_traits>
#include <utility>

namespace meshcast::signaling {

namespace {

using logging::StructuredLogger;

void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

// Runs an engine step. Engine failures fail the peer instead of propagating;
// transport failures still reach the caller.
template <typename Step>
bool run_engine_step(Step&& step, const std::function<void(const std::string&)>& on_failure) {
    try {
        step();
        return true;
    } catch (const TransportError&) {
        throw;
    } catch (const std::exception& ex) {
        on_failure(ex.what());
        return false;
    }
}

}  // namespace

std::string_view connection_state_to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::New:
            return "new";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Connected:
            return "connected";
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Failed:
            return "failed";
        case ConnectionState::Closed:
            return "closed";
    }
    return "new";
}

std::string_view peer_phase_to_string(PeerPhase phase) noexcept {
    switch (phase) {
        case PeerPhase::Idle:
            return "idle";
        case PeerPhase::OfferSent:
            return "offer-sent";
        case PeerPhase::OfferReceived:
            return "offer-received";
        case PeerPhase::Connected:
            return "connected";
        case PeerPhase::Closed:
            return "closed";
    }
    return "idle";
}

SignalingSession::SignalingSession(PeerId self,
                                   transport::OutboundChannel& channel,
                                   NegotiationEngine& engine,
                                   const Config& config,
                                   MediaSource* source)
    : self_(std::move(self)),
      channel_(channel),
      engine_(engine),
      source_(source),
      retry_interval_(config.offer_retry_interval),
      retry_limit_(config.offer_retry_limit) {}

SignalingSession::~SignalingSession() {
    close_all();
}

void SignalingSession::set_state_observer(StateObserver observer) {
    std::scoped_lock lock(mutex_);
    state_observer_ = std::move(observer);
}

void SignalingSession::set_track_observer(TrackObserver observer) {
    std::scoped_lock lock(mutex_);
    track_observer_ = std::move(observer);
}

void SignalingSession::handle_signal(const protocol::SignalMessage& message) {
    std::scoped_lock lock(mutex_);
    if (message.from == self_ || !message.addressed_to(self_)) {
        return;
    }
    std::visit(
        [&](const auto& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, protocol::RequestOfferPayload>) {
                on_request_offer(message.from);
            } else if constexpr (std::is_same_v<T, protocol::OfferPayload>) {
                on_offer(message.from, payload.sdp);
            } else if constexpr (std::is_same_v<T, protocol::AnswerPayload>) {
                on_answer(message.from, payload.sdp);
            } else {
                on_candidate(message.from, payload.candidate);
            }
        },
        message.payload);
}

void SignalingSession::on_request_offer(const PeerId& peer) {
    if (!source_ || source_->live_track_count() == 0) {
        log_event(StructuredLogger::Level::Debug,
                  "signaling.request_offer.ignored",
                  {{"peer", short_peer_id(peer)}, {"reason", "no live tracks"}});
        return;
    }
    if (const auto it = records_.find(peer); it != records_.end()) {
        if (it->second.phase == PeerPhase::Connected) {
            return;
        }
        release_record(peer);
    }
    // Candidates queued before an outbound handle exists belong to an older negotiation.
    pending_candidates_.erase(peer);

    const auto generation = next_generation_++;
    records_[peer].generation = generation;
    const auto fail = [&](const std::string& reason) { fail_peer(peer, reason); };

    std::string sdp;
    const bool ok = run_engine_step(
        [&] {
            auto connection = engine_.create_outbound(peer, *source_, make_callbacks(peer, generation));
            auto* record = find_current(peer, generation);
            if (!record) {
                connection->close();
                return;
            }
            record->connection = std::move(connection);
            sdp = record->connection->create_offer();
        },
        fail);
    auto* record = find_current(peer, generation);
    if (!ok || !record || !record->connection) {
        return;
    }
    record->phase = PeerPhase::OfferSent;
    send(protocol::SignalMessage{self_, peer, protocol::OfferPayload{std::move(sdp)}});
    log_event(StructuredLogger::Level::Info, "signaling.offer.sent", {{"peer", short_peer_id(peer)}});
}

void SignalingSession::on_offer(const PeerId& peer, const std::string& sdp) {
    if (const auto it = records_.find(peer); it != records_.end()) {
        if (it->second.phase == PeerPhase::Connected) {
            log_event(StructuredLogger::Level::Debug,
                      "signaling.offer.ignored",
                      {{"peer", short_peer_id(peer)}, {"reason", "already connected"}});
            return;
        }
        release_record(peer);
    }

    const auto generation = next_generation_++;
    records_[peer].generation = generation;
    const auto fail = [&](const std::string& reason) { fail_peer(peer, reason); };

    std::string answer;
    const bool ok = run_engine_step(
        [&] {
            auto connection = engine_.create_inbound(peer, make_callbacks(peer, generation));
            auto* record = find_current(peer, generation);
            if (!record) {
                connection->close();
                return;
            }
            record->connection = std::move(connection);
            record->connection->apply_remote_description(
                SessionDescription{SessionDescription::Kind::Offer, sdp});
            record->phase = PeerPhase::OfferReceived;
            answer = record->connection->create_answer();
        },
        fail);
    auto* record = find_current(peer, generation);
    if (!ok || !record || !record->connection) {
        return;
    }
    send(protocol::SignalMessage{self_, peer, protocol::AnswerPayload{std::move(answer)}});
    log_event(StructuredLogger::Level::Info, "signaling.answer.sent", {{"peer", short_peer_id(peer)}});
    drain_candidates(peer, *record);
}

void SignalingSession::on_answer(const PeerId& peer, const std::string& sdp) {
    const auto it = records_.find(peer);
    if (it == records_.end() || !it->second.connection) {
        log_event(StructuredLogger::Level::Warning,
                  "signaling.answer.unexpected",
                  {{"peer", short_peer_id(peer)}, {"reason", "no connection"}});
        return;
    }
    if (it->second.phase != PeerPhase::OfferSent) {
        log_event(StructuredLogger::Level::Debug,
                  "signaling.answer.ignored",
                  {{"peer", short_peer_id(peer)},
                   {"phase", std::string(peer_phase_to_string(it->second.phase))}});
        return;
    }

    const auto generation = it->second.generation;
    const bool ok = run_engine_step(
        [&] {
            it->second.connection->apply_remote_description(
                SessionDescription{SessionDescription::Kind::Answer, sdp});
        },
        [&](const std::string& reason) { fail_peer(peer, reason); });
    auto* record = find_current(peer, generation);
    if (!ok || !record || !record->connection) {
        return;
    }
    record->phase = PeerPhase::Connected;
    log_event(StructuredLogger::Level::Info, "signaling.answer.applied", {{"peer", short_peer_id(peer)}});
    drain_candidates(peer, *record);
}

void SignalingSession::on_candidate(const PeerId& peer, const protocol::IceCandidate& candidate) {
    const auto it = records_.find(peer);
    if (it != records_.end() && it->second.connection && it->second.connection->has_remote_description()) {
        run_engine_step([&] { it->second.connection->add_remote_candidate(candidate); },
                        [&](const std::string& reason) {
                            last_error_ = reason;
                            log_event(StructuredLogger::Level::Warning,
                                      "signaling.candidate.rejected",
                                      {{"peer", short_peer_id(peer)}, {"reason", reason}});
                        });
        return;
    }
    pending_candidates_[peer].push_back(candidate);
}

void SignalingSession::drain_candidates(const PeerId& peer, PeerRecord& record) {
    const auto queued = pending_candidates_.find(peer);
    if (queued == pending_candidates_.end()) {
        return;
    }
    auto candidates = std::move(queued->second);
    pending_candidates_.erase(queued);
    const auto generation = record.generation;
    for (const auto& candidate : candidates) {
        auto* current = find_current(peer, generation);
        if (!current || !current->connection) {
            return;
        }
        run_engine_step([&] { current->connection->add_remote_candidate(candidate); },
                        [&](const std::string& reason) {
                            last_error_ = reason;
                            log_event(StructuredLogger::Level::Warning,
                                      "signaling.candidate.rejected",
                                      {{"peer", short_peer_id(peer)}, {"reason", reason}});
                        });
    }
    log_event(StructuredLogger::Level::Debug,
              "signaling.candidates.drained",
              {{"peer", short_peer_id(peer)}, {"count", std::to_string(candidates.size())}});
}

PeerConnectionCallbacks SignalingSession::make_callbacks(const PeerId& peer, std::uint64_t generation) {
    PeerConnectionCallbacks callbacks;
    callbacks.on_local_candidate = [this, peer, generation](const protocol::IceCandidate& candidate) {
        std::scoped_lock lock(mutex_);
        if (!find_current(peer, generation)) {
            return;
        }
        send(protocol::SignalMessage{self_, peer, protocol::IceCandidatePayload{candidate}});
    };
    callbacks.on_state_change = [this, peer, generation](ConnectionState state) {
        std::scoped_lock lock(mutex_);
        auto* record = find_current(peer, generation);
        if (!record) {
            return;
        }
        record->state = state;
        if (state == ConnectionState::Connected) {
            record->phase = PeerPhase::Connected;
        } else if (state == ConnectionState::Failed || state == ConnectionState::Closed) {
            record->phase = PeerPhase::Closed;
        }
        notify_state(peer, state);
    };
    callbacks.on_remote_track = [this, peer, generation]() {
        std::scoped_lock lock(mutex_);
        if (!find_current(peer, generation) || !track_observer_) {
            return;
        }
        track_observer_(peer);
    };
    return callbacks;
}

SignalingSession::PeerRecord* SignalingSession::find_current(const PeerId& peer, std::uint64_t generation) {
    const auto it = records_.find(peer);
    if (it == records_.end() || it->second.generation != generation) {
        return nullptr;
    }
    return &it->second;
}

void SignalingSession::fail_peer(const PeerId& peer, const std::string& reason) {
    last_error_ = reason;
    log_event(StructuredLogger::Level::Warning,
              "signaling.negotiation.failed",
              {{"peer", short_peer_id(peer)}, {"reason", reason}});
    const auto it = records_.find(peer);
    if (it == records_.end()) {
        return;
    }
    auto connection = std::move(it->second.connection);
    // Bump the generation so callbacks from the abandoned handle are ignored.
    it->second.generation = next_generation_++;
    it->second.phase = PeerPhase::Closed;
    it->second.state = ConnectionState::Failed;
    if (connection) {
        try {
            connection->close();
        } catch (const std::exception& ex) {
            log_event(StructuredLogger::Level::Warning,
                      "signaling.connection.close_failed",
                      {{"peer", short_peer_id(peer)}, {"reason", ex.what()}});
        }
    }
    notify_state(peer, ConnectionState::Failed);
}

void SignalingSession::release_record(const PeerId& peer) {
    const auto it = records_.find(peer);
    if (it == records_.end()) {
        return;
    }
    auto connection = std::move(it->second.connection);
    records_.erase(it);
    if (connection) {
        try {
            connection->close();
        } catch (const std::exception& ex) {
            log_event(StructuredLogger::Level::Warning,
                      "signaling.connection.close_failed",
                      {{"peer", short_peer_id(peer)}, {"reason", ex.what()}});
        }
    }
}

void SignalingSession::notify_state(const PeerId& peer, ConnectionState state) {
    if (state_observer_) {
        state_observer_(peer, state);
    }
}

void SignalingSession::send(protocol::SignalMessage message) {
    const auto bytes = protocol::encode(message);
    channel_.broadcast_signal(bytes);
}

void SignalingSession::handle_peer_left(const PeerId& peer) {
    std::scoped_lock lock(mutex_);
    pending_candidates_.erase(peer);
    if (!records_.contains(peer)) {
        return;
    }
    release_record(peer);
    log_event(StructuredLogger::Level::Info, "signaling.peer.left", {{"peer", short_peer_id(peer)}});
    notify_state(peer, ConnectionState::Closed);
}

void SignalingSession::begin_offer_requests(Timestamp now) {
    std::scoped_lock lock(mutex_);
    requests_active_ = true;
    request_attempts_ = 0;
    next_request_at_ = now + retry_interval_;
    send_offer_request();
}

void SignalingSession::tick(Timestamp now) {
    std::scoped_lock lock(mutex_);
    if (!requests_active_) {
        return;
    }
    if (has_live_connection()) {
        requests_active_ = false;
        log_event(StructuredLogger::Level::Debug,
                  "signaling.request_offer.satisfied",
                  {{"attempts", std::to_string(request_attempts_)}});
        return;
    }
    if (request_attempts_ >= retry_limit_) {
        requests_active_ = false;
        log_event(StructuredLogger::Level::Info,
                  "signaling.request_offer.exhausted",
                  {{"attempts", std::to_string(request_attempts_)}});
        return;
    }
    if (now < next_request_at_) {
        return;
    }
    next_request_at_ = now + retry_interval_;
    send_offer_request();
}

void SignalingSession::send_offer_request() {
    ++request_attempts_;
    send(protocol::SignalMessage{self_, std::nullopt, protocol::RequestOfferPayload{}});
    log_event(StructuredLogger::Level::Debug,
              "signaling.request_offer.sent",
              {{"attempt", std::to_string(request_attempts_)}});
    if (request_attempts_ >= retry_limit_) {
        requests_active_ = false;
    }
}

bool SignalingSession::has_live_connection() const {
    for (const auto& [peer, record] : records_) {
        if (record.connection && record.phase != PeerPhase::Closed) {
            return true;
        }
    }
    return false;
}

PeerPhase SignalingSession::phase(const PeerId& peer) const {
    std::scoped_lock lock(mutex_);
    const auto it = records_.find(peer);
    return it == records_.end() ? PeerPhase::Idle : it->second.phase;
}

std::size_t SignalingSession::queued_candidates(const PeerId& peer) const {
    std::scoped_lock lock(mutex_);
    const auto it = pending_candidates_.find(peer);
    return it == pending_candidates_.end() ? 0 : it->second.size();
}

std::size_t SignalingSession::peer_count() const {
    std::scoped_lock lock(mutex_);
    return records_.size();
}

SignalingSnapshot SignalingSession::snapshot() const {
    std::scoped_lock lock(mutex_);
    SignalingSnapshot snapshot;
    for (const auto& [peer, record] : records_) {
        PeerStatus status;
        status.peer = peer;
        status.phase = record.phase;
        status.connection_state = record.state;
        const auto queued = pending_candidates_.find(peer);
        status.queued_candidates = queued == pending_candidates_.end() ? 0 : queued->second.size();
        snapshot.peers.push_back(std::move(status));
    }
    snapshot.offer_request_attempts = request_attempts_;
    snapshot.offer_requests_active = requests_active_;
    snapshot.last_error = last_error_;
    return snapshot;
}

void SignalingSession::close_all() {
    std::scoped_lock lock(mutex_);
    requests_active_ = false;
    auto records = std::move(records_);
    records_.clear();
    pending_candidates_.clear();
    for (auto& [peer, record] : records) {
        if (!record.connection) {
            continue;
        }
        try {
            record.connection->close();
        } catch (const std::exception& ex) {
            log_event(StructuredLogger::Level::Warning,
                      "signaling.connection.close_failed",
                      {{"peer", short_peer_id(peer)}, {"reason", ex.what()}});
        }
    }
}

}  // namespace meshcast::signaling
