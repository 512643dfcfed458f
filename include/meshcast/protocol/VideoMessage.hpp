#pragma once

#include "meshcast/Types.hpp"
#include "meshcast/protocol/Json.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace meshcast::protocol {

inline constexpr std::string_view kDefaultFileName = "video";
inline constexpr std::string_view kDefaultMimeType = "video/mp4";

// Room for the chunk envelope: type, sender id and index.
inline constexpr std::size_t kChunkEnvelopeOverhead = 512;

// Worst-case encoded size of a chunk message. Chunk bytes are written as
// decimal array items, up to four characters each.
constexpr std::size_t max_encoded_chunk_size(std::size_t chunk_bytes) noexcept {
    return chunk_bytes * 4 + kChunkEnvelopeOverhead;
}

enum class VideoMessageType : std::uint8_t {
    Metadata,
    Chunk,
    RequestChunk,
    HaveChunks,
    RequestMetadata
};

struct VideoMetadata {
    std::string file_name{kDefaultFileName};
    std::uint64_t file_size{0};
    std::string mime_type{kDefaultMimeType};
    std::uint32_t total_chunks{0};
    std::optional<double> duration{};

    friend bool operator==(const VideoMetadata&, const VideoMetadata&) = default;
};

struct MetadataPayload {
    VideoMetadata metadata;
};

struct ChunkPayload {
    std::uint32_t chunk_index{0};
    Bytes chunk_data;
};

struct RequestChunkPayload {
    std::uint32_t chunk_index{0};
};

struct HaveChunksPayload {
    std::vector<std::uint32_t> available_chunks;
};

struct RequestMetadataPayload {};

using VideoPayload = std::variant<MetadataPayload,
                                  ChunkPayload,
                                  RequestChunkPayload,
                                  HaveChunksPayload,
                                  RequestMetadataPayload>;

struct VideoMessage {
    PeerId from;
    VideoPayload payload{RequestMetadataPayload{}};

    VideoMessageType type() const noexcept;
};

std::string_view video_message_type_to_string(VideoMessageType type) noexcept;
std::optional<VideoMessageType> video_message_type_from_string(std::string_view text) noexcept;

std::string encode_video_message(const VideoMessage& message);
std::optional<VideoMessage> decode_video_message(const JsonValue& document);

}  // namespace meshcast::protocol
