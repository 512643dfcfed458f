#include "meshcast/transport/FrameTag.hpp"

#include <stdexcept>
#include <string>

namespace meshcast::transport {

std::int64_t pack_frame_tag(const FrameTag& tag) {
    if (!is_valid_frame_number(tag.frame_number)) {
        throw std::invalid_argument("frame number out of range: " + std::to_string(tag.frame_number));
    }
    if (tag.part_number >= static_cast<std::uint32_t>(kPartCountMultiplier)) {
        throw std::invalid_argument("part number out of range: " + std::to_string(tag.part_number));
    }
    if (tag.total_parts > kMaxPartsPerFrame) {
        throw std::invalid_argument("part count out of range: " + std::to_string(tag.total_parts));
    }
    return tag.frame_number * kFrameTagBase + static_cast<std::int64_t>(tag.part_number) +
           static_cast<std::int64_t>(tag.total_parts) * kPartCountMultiplier;
}

std::optional<FrameTag> unpack_frame_tag(std::int64_t tag) noexcept {
    if (tag < 0) {
        return std::nullopt;
    }
    const auto remainder = tag % kFrameTagBase;
    FrameTag decoded;
    decoded.frame_number = tag / kFrameTagBase;
    decoded.part_number = static_cast<std::uint32_t>(remainder % kPartCountMultiplier);
    decoded.total_parts = static_cast<std::uint32_t>(remainder / kPartCountMultiplier);
    return decoded;
}

}  // namespace meshcast::transport
