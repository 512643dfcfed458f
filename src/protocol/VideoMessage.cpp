#include "meshcast/protocol/VideoMessage.hpp"

#include <limits>
#include <type_traits>

namespace meshcast::protocol {

namespace {

std::optional<std::uint32_t> read_index(const JsonValue& value) {
    if (!value.is_number() || !value.integer_value.has_value()) {
        return std::nullopt;
    }
    const auto index = *value.integer_value;
    if (index < 0 || index > std::numeric_limits<std::uint32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(index);
}

std::optional<std::uint32_t> read_index_field(const JsonValue& document, std::string_view key) {
    const auto* node = document.find(key);
    if (!node) {
        return std::nullopt;
    }
    return read_index(*node);
}

std::optional<Bytes> read_bytes(const JsonValue* node) {
    if (!node || !node->is_array()) {
        return std::nullopt;
    }
    Bytes bytes;
    bytes.reserve(node->array_value.size());
    for (const auto& element : node->array_value) {
        if (!element.integer_value.has_value() || *element.integer_value < 0 || *element.integer_value > 0xFF) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<std::uint8_t>(*element.integer_value));
    }
    return bytes;
}

std::optional<std::vector<std::uint32_t>> read_indices(const JsonValue* node) {
    if (!node || !node->is_array()) {
        return std::nullopt;
    }
    std::vector<std::uint32_t> indices;
    indices.reserve(node->array_value.size());
    for (const auto& element : node->array_value) {
        const auto index = read_index(element);
        if (!index.has_value()) {
            return std::nullopt;
        }
        indices.push_back(*index);
    }
    return indices;
}

std::optional<VideoMetadata> read_metadata(const JsonValue& document) {
    const auto total = read_index_field(document, "totalChunks");
    const auto size = document.integer_field("fileSize");
    if (!total.has_value() || !size.has_value() || *size < 0) {
        return std::nullopt;
    }
    VideoMetadata metadata;
    metadata.total_chunks = *total;
    metadata.file_size = static_cast<std::uint64_t>(*size);
    if (auto name = document.string_field("fileName"); name.has_value() && !name->empty()) {
        metadata.file_name = std::move(*name);
    }
    if (auto mime = document.string_field("mimeType"); mime.has_value() && !mime->empty()) {
        metadata.mime_type = std::move(*mime);
    }
    metadata.duration = document.number_field("duration");
    return metadata;
}

}  // namespace

VideoMessageType VideoMessage::type() const noexcept {
    return std::visit(
        [](const auto& value) -> VideoMessageType {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, MetadataPayload>) {
                return VideoMessageType::Metadata;
            } else if constexpr (std::is_same_v<T, ChunkPayload>) {
                return VideoMessageType::Chunk;
            } else if constexpr (std::is_same_v<T, RequestChunkPayload>) {
                return VideoMessageType::RequestChunk;
            } else if constexpr (std::is_same_v<T, HaveChunksPayload>) {
                return VideoMessageType::HaveChunks;
            } else {
                return VideoMessageType::RequestMetadata;
            }
        },
        payload);
}

std::string_view video_message_type_to_string(VideoMessageType type) noexcept {
    switch (type) {
        case VideoMessageType::Metadata:
            return "video-metadata";
        case VideoMessageType::Chunk:
            return "video-chunk";
        case VideoMessageType::RequestChunk:
            return "video-request-chunk";
        case VideoMessageType::HaveChunks:
            return "video-have-chunks";
        case VideoMessageType::RequestMetadata:
            return "video-request-metadata";
    }
    return "video-request-metadata";
}

std::optional<VideoMessageType> video_message_type_from_string(std::string_view text) noexcept {
    if (text == "video-metadata") {
        return VideoMessageType::Metadata;
    }
    if (text == "video-chunk") {
        return VideoMessageType::Chunk;
    }
    if (text == "video-request-chunk") {
        return VideoMessageType::RequestChunk;
    }
    if (text == "video-have-chunks") {
        return VideoMessageType::HaveChunks;
    }
    if (text == "video-request-metadata") {
        return VideoMessageType::RequestMetadata;
    }
    return std::nullopt;
}

std::string encode_video_message(const VideoMessage& message) {
    JsonWriter writer;
    writer.begin_object();
    writer.field("type", video_message_type_to_string(message.type()));
    writer.field("from", message.from);
    std::visit(
        [&](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, MetadataPayload>) {
                const auto& metadata = value.metadata;
                writer.field("fileName", metadata.file_name);
                writer.field("fileSize", metadata.file_size);
                writer.field("mimeType", metadata.mime_type);
                writer.field("totalChunks", metadata.total_chunks);
                if (metadata.duration.has_value()) {
                    writer.field("duration", *metadata.duration);
                }
            } else if constexpr (std::is_same_v<T, ChunkPayload>) {
                writer.field("chunkIndex", value.chunk_index);
                writer.byte_array_field("chunkData", value.chunk_data);
            } else if constexpr (std::is_same_v<T, RequestChunkPayload>) {
                writer.field("chunkIndex", value.chunk_index);
            } else if constexpr (std::is_same_v<T, HaveChunksPayload>) {
                writer.index_array_field("availableChunks", value.available_chunks);
            }
        },
        message.payload);
    writer.end_object();
    return writer.take();
}

std::optional<VideoMessage> decode_video_message(const JsonValue& document) {
    const auto type_text = document.string_field("type");
    auto from = document.string_field("from");
    if (!type_text.has_value() || !from.has_value()) {
        return std::nullopt;
    }
    const auto type = video_message_type_from_string(*type_text);
    if (!type.has_value()) {
        return std::nullopt;
    }

    VideoMessage message;
    message.from = std::move(*from);
    switch (*type) {
        case VideoMessageType::Metadata: {
            auto metadata = read_metadata(document);
            if (!metadata.has_value()) {
                return std::nullopt;
            }
            message.payload = MetadataPayload{std::move(*metadata)};
            break;
        }
        case VideoMessageType::Chunk: {
            const auto index = read_index_field(document, "chunkIndex");
            auto data = read_bytes(document.find("chunkData"));
            if (!index.has_value() || !data.has_value()) {
                return std::nullopt;
            }
            message.payload = ChunkPayload{*index, std::move(*data)};
            break;
        }
        case VideoMessageType::RequestChunk: {
            const auto index = read_index_field(document, "chunkIndex");
            if (!index.has_value()) {
                return std::nullopt;
            }
            message.payload = RequestChunkPayload{*index};
            break;
        }
        case VideoMessageType::HaveChunks: {
            auto indices = read_indices(document.find("availableChunks"));
            if (!indices.has_value()) {
                return std::nullopt;
            }
            message.payload = HaveChunksPayload{std::move(*indices)};
            break;
        }
        case VideoMessageType::RequestMetadata:
            message.payload = RequestMetadataPayload{};
            break;
    }
    return message;
}

}  // namespace meshcast::protocol
