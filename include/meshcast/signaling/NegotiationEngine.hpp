#pragma once

#include "meshcast/Types.hpp"
#include "meshcast/protocol/SignalMessage.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace meshcast::signaling {

enum class ConnectionState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

std::string_view connection_state_to_string(ConnectionState state) noexcept;

struct SessionDescription {
    enum class Kind { Offer, Answer };

    Kind kind{Kind::Offer};
    std::string sdp;
};

// Local capture the broadcaster negotiates with.
class MediaSource {
public:
    virtual ~MediaSource() = default;

    virtual std::size_t live_track_count() const = 0;
};

struct PeerConnectionCallbacks {
    std::function<void(const protocol::IceCandidate&)> on_local_candidate;
    std::function<void(ConnectionState)> on_state_change;
    // Inbound connections only.
    std::function<void()> on_remote_track;
};

// One direct media path to a remote peer. Methods may throw NegotiationError.
class PeerConnection {
public:
    virtual ~PeerConnection() = default;

    virtual std::string create_offer() = 0;
    virtual std::string create_answer() = 0;
    virtual void apply_remote_description(const SessionDescription& description) = 0;
    virtual bool has_remote_description() const = 0;
    virtual void add_remote_candidate(const protocol::IceCandidate& candidate) = 0;
    virtual void close() = 0;
};

class NegotiationEngine {
public:
    virtual ~NegotiationEngine() = default;

    virtual std::unique_ptr<PeerConnection> create_outbound(const PeerId& peer,
                                                            MediaSource& source,
                                                            PeerConnectionCallbacks callbacks) = 0;
    virtual std::unique_ptr<PeerConnection> create_inbound(const PeerId& peer,
                                                           PeerConnectionCallbacks callbacks) = 0;
};

}  // namespace meshcast::signaling
