#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace meshcast {

struct PlaybackPolicy {
    // Substrings of the MIME type that mark containers able to start from a prefix.
    std::vector<std::string> progressive_mime_markers{"webm"};
    double progressive_threshold_percent{10.0};
};

struct Config {
    std::size_t max_subchunk_size{55 * 1024};
    std::chrono::milliseconds pending_frame_timeout{std::chrono::seconds(5)};

    std::size_t file_chunk_size{64 * 1024};
    std::chrono::milliseconds broadcast_chunk_interval{100};
    std::size_t viewer_request_batch{5};
    std::chrono::milliseconds viewer_request_interval{500};
    std::chrono::milliseconds viewer_initial_request_delay{100};
    std::chrono::milliseconds metadata_request_interval{std::chrono::seconds(2)};
    std::size_t metadata_request_limit{10};
    std::size_t availability_announce_every{10};
    std::int64_t relay_frame_offset{100000};
    PlaybackPolicy playback{};

    std::chrono::milliseconds offer_retry_interval{std::chrono::seconds(2)};
    std::size_t offer_retry_limit{10};

    std::chrono::milliseconds presence_interval{std::chrono::seconds(5)};
    std::chrono::milliseconds join_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds poll_interval{50};

    std::string display_name{"anonymous"};
    std::string log_level{"info"};
    bool logging_enabled{true};
};

}  // namespace meshcast
