#include "meshcast/exchange/PlaybackPolicy.hpp"

#include <algorithm>
#include <cctype>

namespace meshcast::exchange {

namespace {

std::string to_lower(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

}  // namespace

bool allows_progressive_playback(const PlaybackPolicy& policy, std::string_view mime_type) {
    const auto lowered = to_lower(mime_type);
    return std::any_of(policy.progressive_mime_markers.begin(),
                       policy.progressive_mime_markers.end(),
                       [&](const std::string& marker) {
                           return !marker.empty() && lowered.find(to_lower(marker)) != std::string::npos;
                       });
}

std::uint32_t contiguous_prefix(const std::map<std::uint32_t, Bytes>& chunks) {
    std::uint32_t expected = 0;
    for (const auto& [index, data] : chunks) {
        if (index != expected) {
            break;
        }
        ++expected;
    }
    return expected;
}

double percent_of(std::uint64_t part, std::uint64_t total) noexcept {
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(part) / static_cast<double>(total) * 100.0;
}

}  // namespace meshcast::exchange
