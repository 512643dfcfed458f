#pragma once

#include "meshcast/Types.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace meshcast::transport {

enum class TransportEventKind : std::uint8_t {
    NeighborUp,
    NeighborDown,
    Presence,
    Chunk,
    Signal,
    Lagged
};

struct TransportEvent {
    TransportEventKind kind{TransportEventKind::Chunk};
    PeerId sender;
    std::int64_t tag{0};
    Bytes payload;
    std::string display_name;
    std::uint64_t sent_timestamp_ms{0};
    Timestamp arrival{};
};

struct TicketOptions {
    bool include_myself{true};
    bool include_bootstrap{true};
    bool include_neighbors{true};
};

inline constexpr std::size_t kMaxTransportMessageSize = 64 * 1024;
inline constexpr std::string_view kTicketPrefix = "stream";

// Gossip topic membership as seen by one endpoint. Delivery is at-least-once,
// lossy, and unordered across senders. Sends throw TransportError.
class BroadcastChannel {
public:
    virtual ~BroadcastChannel() = default;

    virtual void send(std::span<const std::uint8_t> payload, std::int64_t tag) = 0;
    virtual void announce_presence() = 0;
    virtual void set_display_name(std::string name) = 0;
    virtual std::string ticket(const TicketOptions& options) const = 0;
    virtual std::vector<PeerId> neighbors() const = 0;

    // Waits up to timeout. Returns nullopt on timeout and, permanently, once closed.
    virtual std::optional<TransportEvent> next_event(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
    virtual bool closed() const = 0;

    virtual const PeerId& local_id() const noexcept = 0;
    virtual const std::string& topic() const noexcept = 0;
};

class ChannelFactory {
public:
    virtual ~ChannelFactory() = default;

    virtual std::future<std::unique_ptr<BroadcastChannel>> create(const PeerId& self, const std::string& topic_name) = 0;
    virtual std::future<std::unique_ptr<BroadcastChannel>> join(const std::string& ticket, const PeerId& self) = 0;
    virtual void shutdown() = 0;
};

}  // namespace meshcast::transport
