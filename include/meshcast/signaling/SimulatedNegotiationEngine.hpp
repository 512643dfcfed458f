#pragma once

#include "meshcast/signaling/NegotiationEngine.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace meshcast::signaling {

class SimulatedMediaSource : public MediaSource {
public:
    explicit SimulatedMediaSource(std::size_t tracks = 2) : tracks_(tracks) {}

    std::size_t live_track_count() const override {
        return tracks_.load();
    }

    // Models the capture being revoked or suspended.
    void set_live_tracks(std::size_t tracks) {
        tracks_.store(tracks);
    }

private:
    std::atomic<std::size_t> tracks_;
};

// In-process negotiation: descriptions are synthetic SDP text and the
// connection reports Connected once both descriptions and one remote
// candidate are in place.
class SimulatedNegotiationEngine : public NegotiationEngine {
public:
    struct Statistics {
        std::uint64_t connections_created{0};
        std::uint64_t connections_connected{0};
    };

    explicit SimulatedNegotiationEngine(PeerId local_id);

    std::unique_ptr<PeerConnection> create_outbound(const PeerId& peer,
                                                    MediaSource& source,
                                                    PeerConnectionCallbacks callbacks) override;
    std::unique_ptr<PeerConnection> create_inbound(const PeerId& peer,
                                                   PeerConnectionCallbacks callbacks) override;

    Statistics statistics() const;

private:
    friend class SimulatedPeerConnection;

    void record_connected();

    PeerId local_id_;
    std::uint64_t next_session_{1};
    Statistics statistics_{};
    mutable std::mutex mutex_;
};

}  // namespace meshcast::signaling
