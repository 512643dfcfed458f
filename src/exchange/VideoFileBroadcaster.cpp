#include "meshcast/exchange/VideoFileBroadcaster.hpp"

#include "meshcast/Error.hpp"
#include "meshcast/logging/StructuredLogger.hpp"
#include "meshcast/protocol/WireMessage.hpp"
#include "meshcast/transport/FrameTag.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace meshcast::exchange {

namespace {

using logging::StructuredLogger;

void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace

std::vector<Bytes> slice_into_chunks(std::span<const std::uint8_t> data, std::size_t chunk_size) {
    std::vector<Bytes> chunks;
    if (chunk_size == 0) {
        return chunks;
    }
    chunks.reserve((data.size() + chunk_size - 1) / chunk_size);
    for (std::size_t offset = 0; offset < data.size(); offset += chunk_size) {
        const auto length = std::min(chunk_size, data.size() - offset);
        const auto slice = data.subspan(offset, length);
        chunks.emplace_back(slice.begin(), slice.end());
    }
    return chunks;
}

VideoFileBroadcaster::VideoFileBroadcaster(PeerId self,
                                           transport::OutboundChannel& channel,
                                           SourceFile source,
                                           const Config& config)
    : self_(std::move(self)),
      channel_(channel),
      source_(std::move(source)),
      chunk_size_(config.file_chunk_size),
      frame_capacity_(config.max_subchunk_size * transport::kMaxPartsPerFrame),
      interval_(config.broadcast_chunk_interval) {}

const protocol::VideoMetadata& VideoFileBroadcaster::prepare() {
    if (metadata_.has_value()) {
        return *metadata_;
    }
    if (source_.data.empty()) {
        throw ResourceError("E_SOURCE_EMPTY", "Source file '" + source_.name + "' is empty");
    }
    if (chunk_size_ == 0) {
        throw ResourceError("E_CHUNK_SIZE", "File chunk size must be positive");
    }
    if (protocol::max_encoded_chunk_size(chunk_size_) > frame_capacity_) {
        throw ResourceError("E_CHUNK_SIZE",
                            "File chunk size " + std::to_string(chunk_size_) + " does not fit in one frame of " +
                                std::to_string(frame_capacity_) + " bytes",
                            "Lower file_chunk_size or raise max_subchunk_size");
    }

    chunks_ = slice_into_chunks(source_.data, chunk_size_);

    protocol::VideoMetadata metadata;
    if (!source_.name.empty()) {
        metadata.file_name = source_.name;
    }
    if (!source_.mime_type.empty()) {
        metadata.mime_type = source_.mime_type;
    }
    metadata.file_size = source_.data.size();
    metadata.total_chunks = static_cast<std::uint32_t>(chunks_.size());
    metadata.duration = source_.duration;
    metadata_ = std::move(metadata);

    log_event(StructuredLogger::Level::Info,
              "exchange.broadcast.prepared",
              {{"file", metadata_->file_name},
               {"bytes", std::to_string(metadata_->file_size)},
               {"chunks", std::to_string(metadata_->total_chunks)}});
    return *metadata_;
}

void VideoFileBroadcaster::start_broadcast(Timestamp now) {
    start_broadcast(now, interval_);
}

void VideoFileBroadcaster::start_broadcast(Timestamp now, std::chrono::milliseconds interval) {
    if (running_) {
        return;
    }
    prepare();
    interval_ = interval;
    running_ = true;
    next_emit_at_ = now;
    broadcast_metadata();
    tick(now);
}

void VideoFileBroadcaster::stop_broadcast() {
    if (!running_) {
        return;
    }
    running_ = false;
    log_event(StructuredLogger::Level::Info,
              "exchange.broadcast.stopped",
              {{"sent", std::to_string(next_chunk_)}});
}

void VideoFileBroadcaster::tick(Timestamp now) {
    if (!running_ || !metadata_ || next_chunk_ >= metadata_->total_chunks || now < next_emit_at_) {
        return;
    }
    send_chunk(next_chunk_);
    ++next_chunk_;
    next_emit_at_ = now + interval_;
    if (progress_observer_) {
        progress_observer_(next_chunk_, metadata_->total_chunks);
    }
    if (next_chunk_ == metadata_->total_chunks) {
        log_event(StructuredLogger::Level::Info,
                  "exchange.broadcast.pass_complete",
                  {{"chunks", std::to_string(next_chunk_)}});
    }
}

void VideoFileBroadcaster::handle_message(const protocol::VideoMessage& message) {
    if (message.from == self_) {
        return;
    }
    std::visit(
        [&](const auto& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, protocol::RequestChunkPayload>) {
                handle_chunk_request(message.from, payload.chunk_index);
            } else if constexpr (std::is_same_v<T, protocol::RequestMetadataPayload>) {
                if (metadata_.has_value()) {
                    broadcast_metadata();
                }
            }
        },
        message.payload);
}

void VideoFileBroadcaster::handle_chunk_request(const PeerId& peer, std::uint32_t index) {
    if (peer_request_observer_) {
        peer_request_observer_(peer, index);
    }
    if (index >= chunks_.size()) {
        return;
    }
    send_chunk(index);
    ++requests_served_;
}

void VideoFileBroadcaster::broadcast_metadata() {
    const auto& metadata = prepare();
    const auto bytes = protocol::encode(protocol::VideoMessage{self_, protocol::MetadataPayload{metadata}});
    channel_.broadcast_signal(bytes);
}

void VideoFileBroadcaster::send_chunk(std::uint32_t index) {
    const auto bytes = protocol::encode(protocol::VideoMessage{self_, protocol::ChunkPayload{index, chunks_[index]}});
    channel_.broadcast_chunk(bytes, static_cast<std::int64_t>(index));
}

void VideoFileBroadcaster::set_peer_request_observer(PeerRequestObserver observer) {
    peer_request_observer_ = std::move(observer);
}

void VideoFileBroadcaster::set_progress_observer(ProgressObserver observer) {
    progress_observer_ = std::move(observer);
}

void VideoFileBroadcaster::close() {
    running_ = false;
    chunks_.clear();
    chunks_.shrink_to_fit();
    metadata_.reset();
    source_.data.clear();
    source_.data.shrink_to_fit();
    next_chunk_ = 0;
}

}  // namespace meshcast::exchange
