#pragma once

#include "meshcast/Types.hpp"
#include "meshcast/transport/BroadcastChannel.hpp"
#include "meshcast/transport/FrameTag.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace meshcast::transport {

struct FramePart {
    std::int64_t tag{0};
    std::size_t offset{0};
    std::size_t length{0};
};

class Fragmenter {
public:
    explicit Fragmenter(std::size_t max_subchunk_size);

    // Throws std::invalid_argument for a bad frame number and std::length_error
    // when the payload needs more than kMaxPartsPerFrame parts.
    std::vector<FramePart> split(std::span<const std::uint8_t> payload, std::int64_t frame_number) const;

    // Transmits every part in order. Returns the number of parts sent.
    std::size_t send(BroadcastChannel& channel, std::span<const std::uint8_t> payload, std::int64_t frame_number) const;

    std::size_t max_subchunk_size() const noexcept {
        return max_subchunk_size_;
    }

    std::size_t max_payload_size() const noexcept {
        return max_subchunk_size_ * kMaxPartsPerFrame;
    }

private:
    std::size_t max_subchunk_size_;
};

struct ReassembledFrame {
    PeerId sender;
    std::int64_t frame_number{0};
    Bytes payload;
    Timestamp first_arrival{};
    std::uint32_t parts{1};
};

class Reassembler {
public:
    struct Statistics {
        std::uint64_t frames_completed{0};
        std::uint64_t frames_expired{0};
        std::uint64_t frames_incomplete{0};
        std::uint64_t malformed_parts{0};
        std::uint64_t duplicates_ignored{0};
    };

    explicit Reassembler(std::chrono::milliseconds timeout = std::chrono::seconds(5));

    std::optional<ReassembledFrame> accept(const PeerId& sender,
                                           std::int64_t tag,
                                           Bytes bytes,
                                           Timestamp arrival);

    // Drops frames whose first part is older than the timeout. Returns the number dropped.
    std::size_t sweep(Timestamp now);

    std::size_t pending_frames() const noexcept {
        return pending_.size();
    }

    const Statistics& statistics() const noexcept {
        return statistics_;
    }

    void clear();

private:
    struct FrameKey {
        PeerId sender;
        std::int64_t frame_number{0};

        bool operator==(const FrameKey&) const = default;
    };

    struct FrameKeyHash {
        std::size_t operator()(const FrameKey& key) const noexcept;
    };

    struct PendingFrame {
        std::map<std::uint32_t, Bytes> parts;
        std::uint32_t total_parts{0};
        Timestamp created{};
    };

    std::optional<ReassembledFrame> assemble(const FrameKey& key, PendingFrame& frame);

    std::chrono::milliseconds timeout_;
    std::unordered_map<FrameKey, PendingFrame, FrameKeyHash> pending_;
    std::unordered_map<FrameKey, Timestamp, FrameKeyHash> recently_completed_;
    Statistics statistics_{};
};

}  // namespace meshcast::transport
