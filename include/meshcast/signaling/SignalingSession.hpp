#pragma once

#include "meshcast/Config.hpp"
#include "meshcast/Types.hpp"
#include "meshcast/protocol/SignalMessage.hpp"
#include "meshcast/signaling/NegotiationEngine.hpp"
#include "meshcast/transport/StreamChannel.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meshcast::test {
class SessionTestAccess;
}

namespace meshcast::signaling {

enum class PeerPhase {
    Idle,
    OfferSent,
    OfferReceived,
    Connected,
    Closed
};

std::string_view peer_phase_to_string(PeerPhase phase) noexcept;

struct PeerStatus {
    PeerId peer;
    PeerPhase phase{PeerPhase::Idle};
    ConnectionState connection_state{ConnectionState::New};
    std::size_t queued_candidates{0};
};

struct SignalingSnapshot {
    std::vector<PeerStatus> peers;
    std::size_t offer_request_attempts{0};
    bool offer_requests_active{false};
    std::optional<std::string> last_error{};
};

// Offer/answer/ICE negotiation with every remote peer of one stream. A session
// with a media source answers request-offer; one without asks for offers.
class SignalingSession {
public:
    using StateObserver = std::function<void(const PeerId&, ConnectionState)>;
    using TrackObserver = std::function<void(const PeerId&)>;

    SignalingSession(PeerId self,
                     transport::OutboundChannel& channel,
                     NegotiationEngine& engine,
                     const Config& config,
                     MediaSource* source = nullptr);
    ~SignalingSession();

    SignalingSession(const SignalingSession&) = delete;
    SignalingSession& operator=(const SignalingSession&) = delete;

    void set_state_observer(StateObserver observer);
    void set_track_observer(TrackObserver observer);

    void handle_signal(const protocol::SignalMessage& message);
    void handle_peer_left(const PeerId& peer);

    // Sends request-offer now and keeps retrying from tick() until a peer
    // connection exists or the retry ceiling is hit.
    void begin_offer_requests(Timestamp now);
    void tick(Timestamp now);

    PeerPhase phase(const PeerId& peer) const;
    std::size_t queued_candidates(const PeerId& peer) const;
    std::size_t peer_count() const;
    SignalingSnapshot snapshot() const;

    void close_all();

private:
    friend class test::SessionTestAccess;

    struct PeerRecord {
        std::unique_ptr<PeerConnection> connection;
        PeerPhase phase{PeerPhase::Idle};
        ConnectionState state{ConnectionState::New};
        std::uint64_t generation{0};
    };

    void on_request_offer(const PeerId& peer);
    void on_offer(const PeerId& peer, const std::string& sdp);
    void on_answer(const PeerId& peer, const std::string& sdp);
    void on_candidate(const PeerId& peer, const protocol::IceCandidate& candidate);

    PeerConnectionCallbacks make_callbacks(const PeerId& peer, std::uint64_t generation);
    PeerRecord* find_current(const PeerId& peer, std::uint64_t generation);
    void drain_candidates(const PeerId& peer, PeerRecord& record);
    void fail_peer(const PeerId& peer, const std::string& reason);
    void release_record(const PeerId& peer);
    void notify_state(const PeerId& peer, ConnectionState state);
    void send(protocol::SignalMessage message);
    void send_offer_request();
    bool has_live_connection() const;

    PeerId self_;
    transport::OutboundChannel& channel_;
    NegotiationEngine& engine_;
    MediaSource* source_;
    std::chrono::milliseconds retry_interval_;
    std::size_t retry_limit_;

    std::map<PeerId, PeerRecord> records_;
    std::map<PeerId, std::deque<protocol::IceCandidate>> pending_candidates_;
    std::uint64_t next_generation_{1};

    bool requests_active_{false};
    std::size_t request_attempts_{0};
    Timestamp next_request_at_{};

    std::optional<std::string> last_error_{};
    StateObserver state_observer_;
    TrackObserver track_observer_;
    mutable std::recursive_mutex mutex_;
};

}  // namespace meshcast::signaling
