#pragma once

#include "meshcast/Config.hpp"
#include "meshcast/Types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace meshcast::exchange {

struct PlaybackRequest {
    Bytes data;
    std::string mime_type;
    // Number of leading chunks in data.
    std::uint32_t chunk_count{0};
    bool complete{false};
};

// External player. Receives assembled bytes; never called concurrently.
class PlaybackSink {
public:
    virtual ~PlaybackSink() = default;

    virtual void play(const PlaybackRequest& request) = 0;
};

bool allows_progressive_playback(const PlaybackPolicy& policy, std::string_view mime_type);

// Length of the run of consecutive indices starting at zero.
std::uint32_t contiguous_prefix(const std::map<std::uint32_t, Bytes>& chunks);

double percent_of(std::uint64_t part, std::uint64_t total) noexcept;

}  // namespace meshcast::exchange
