#pragma once

#include "meshcast/Config.hpp"
#include "meshcast/Types.hpp"
#include "meshcast/transport/BroadcastChannel.hpp"
#include "meshcast/transport/Fragmenter.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace meshcast::transport {

struct NeighborUp {
    PeerId peer;
};

struct NeighborDown {
    PeerId peer;
};

struct Presence {
    PeerId peer;
    std::string name;
    std::uint64_t sent_timestamp_ms{0};
};

struct MediaFrame {
    PeerId from;
    std::int64_t frame_number{0};
    Bytes data;
    Timestamp arrival{};
};

struct Signal {
    PeerId from;
    Bytes data;
    Timestamp arrival{};
};

struct Lagged {};

using StreamEvent = std::variant<NeighborUp, NeighborDown, Presence, MediaFrame, Signal, Lagged>;

// Send surface shared by signaling and file exchange.
class OutboundChannel {
public:
    virtual ~OutboundChannel() = default;

    virtual void broadcast_chunk(std::span<const std::uint8_t> payload, std::int64_t frame_number) = 0;
    virtual void broadcast_signal(std::span<const std::uint8_t> payload) = 0;
};

// Signals too large for one message travel as fragmented frames numbered from here.
inline constexpr std::int64_t kControlFrameBase = 900000;

class StreamChannel : public OutboundChannel {
public:
    struct Statistics {
        std::uint64_t frames_sent{0};
        std::uint64_t parts_sent{0};
        std::uint64_t signals_sent{0};
        std::uint64_t lagged_events{0};
    };

    StreamChannel(std::unique_ptr<BroadcastChannel> transport, const Config& config);
    ~StreamChannel() override;

    StreamChannel(const StreamChannel&) = delete;
    StreamChannel& operator=(const StreamChannel&) = delete;

    void broadcast_chunk(std::span<const std::uint8_t> payload, std::int64_t frame_number) override;
    void broadcast_signal(std::span<const std::uint8_t> payload) override;

    void send_presence();
    void set_display_name(std::string name);
    std::string ticket(const TicketOptions& options = {}) const;
    std::vector<PeerId> neighbors() const;

    // Single consumer only. Parts of incomplete frames are absorbed; the call
    // returns when a typed event is ready, the timeout elapses, or the channel closes.
    std::optional<StreamEvent> next_event(std::chrono::milliseconds timeout);

    void close();
    bool closed() const;

    const PeerId& local_id() const noexcept;
    const std::string& topic() const noexcept;

    std::size_t pending_frames() const;
    Reassembler::Statistics reassembly_statistics() const;
    Statistics statistics() const;

private:
    std::optional<StreamEvent> translate(TransportEvent event);

    std::unique_ptr<BroadcastChannel> transport_;
    Fragmenter fragmenter_;
    Reassembler reassembler_;
    std::atomic<std::int64_t> next_control_frame_{kControlFrameBase};
    mutable std::mutex mutex_;
    Statistics statistics_{};
};

}  // namespace meshcast::transport
