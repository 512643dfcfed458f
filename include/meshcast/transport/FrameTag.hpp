#pragma once

#include <cstdint>
#include <limits>
#include <optional>

namespace meshcast::transport {

inline constexpr std::int64_t kFrameTagBase = 10000;
inline constexpr std::int64_t kPartCountMultiplier = 100;
inline constexpr std::uint32_t kMaxPartsPerFrame = 99;

// Reserved band for out-of-band signals that bypass fragmentation.
inline constexpr std::int64_t kSignalTagMin = -10;
inline constexpr std::int64_t kSignalTagMax = -1;
inline constexpr std::int64_t kSignalTag = -1;

inline constexpr std::int64_t kMaxFrameNumber =
    (std::numeric_limits<std::int64_t>::max() - kFrameTagBase) / kFrameTagBase;

// totalParts of 0 or 1 marks an unsplit frame.
struct FrameTag {
    std::int64_t frame_number{0};
    std::uint32_t part_number{0};
    std::uint32_t total_parts{0};

    bool single_part() const noexcept { return total_parts <= 1; }

    friend bool operator==(const FrameTag&, const FrameTag&) = default;
};

constexpr bool is_signal_tag(std::int64_t tag) noexcept {
    return tag >= kSignalTagMin && tag <= kSignalTagMax;
}

constexpr bool is_valid_frame_number(std::int64_t frame_number) noexcept {
    return frame_number >= 0 && frame_number <= kMaxFrameNumber;
}

// Throws std::invalid_argument for an out-of-range frame number, part or part count.
std::int64_t pack_frame_tag(const FrameTag& tag);

// Returns nullopt for negative tags, including the signal band.
std::optional<FrameTag> unpack_frame_tag(std::int64_t tag) noexcept;

}  // namespace meshcast::transport
