#include "meshcast/exchange/VideoFileViewer.hpp"

#include "meshcast/logging/StructuredLogger.hpp"
#include "meshcast/protocol/WireMessage.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace meshcast::exchange {

namespace {

using logging::StructuredLogger;

// Chunks held before metadata arrives must fall within this many request batches.
constexpr std::size_t kEarlyChunkBatches = 4;

void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace

VideoFileViewer::VideoFileViewer(PeerId self,
                                 transport::OutboundChannel& channel,
                                 const Config& config,
                                 PlaybackSink* sink)
    : self_(std::move(self)),
      channel_(channel),
      sink_(sink),
      batch_size_(config.viewer_request_batch),
      request_interval_(config.viewer_request_interval),
      initial_request_delay_(config.viewer_initial_request_delay),
      metadata_interval_(config.metadata_request_interval),
      metadata_limit_(config.metadata_request_limit),
      announce_every_(config.availability_announce_every),
      relay_offset_(config.relay_frame_offset),
      playback_policy_(config.playback) {}

void VideoFileViewer::begin(Timestamp now) {
    if (metadata_.has_value()) {
        return;
    }
    metadata_requests_active_ = true;
    metadata_attempts_ = 0;
    next_metadata_request_at_ = now + metadata_interval_;
    ++metadata_attempts_;
    request_metadata();
}

void VideoFileViewer::tick(Timestamp now) {
    if (metadata_requests_active_ && !metadata_.has_value() && now >= next_metadata_request_at_) {
        if (metadata_attempts_ >= metadata_limit_) {
            metadata_requests_active_ = false;
            log_event(StructuredLogger::Level::Info,
                      "exchange.metadata.unanswered",
                      {{"attempts", std::to_string(metadata_attempts_)}});
        } else {
            next_metadata_request_at_ = now + metadata_interval_;
            ++metadata_attempts_;
            request_metadata();
        }
    }

    if (acquiring_ && now >= next_request_at_) {
        next_request_at_ = now + request_interval_;
        request_batch();
    }
}

void VideoFileViewer::handle_message(const protocol::VideoMessage& message, Timestamp now) {
    if (message.from == self_) {
        return;
    }
    std::visit(
        [&](const auto& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, protocol::MetadataPayload>) {
                on_metadata(payload.metadata, now);
            } else if constexpr (std::is_same_v<T, protocol::ChunkPayload>) {
                on_chunk(payload.chunk_index, payload.chunk_data);
            } else if constexpr (std::is_same_v<T, protocol::RequestChunkPayload>) {
                on_chunk_request(message.from, payload.chunk_index);
            } else if constexpr (std::is_same_v<T, protocol::HaveChunksPayload>) {
                on_have_chunks(message.from, payload.available_chunks);
            }
        },
        message.payload);
}

void VideoFileViewer::request_metadata() {
    const auto bytes = protocol::encode(protocol::VideoMessage{self_, protocol::RequestMetadataPayload{}});
    channel_.broadcast_signal(bytes);
}

void VideoFileViewer::on_metadata(const protocol::VideoMetadata& metadata, Timestamp now) {
    if (metadata_.has_value()) {
        return;
    }
    metadata_ = metadata;
    metadata_requests_active_ = false;
    // Chunks that arrived before the metadata are kept when they fit the file.
    std::erase_if(received_, [&](const auto& entry) { return entry.first >= metadata.total_chunks; });

    log_event(StructuredLogger::Level::Info,
              "exchange.metadata.received",
              {{"file", metadata.file_name},
               {"mime", metadata.mime_type},
               {"chunks", std::to_string(metadata.total_chunks)}});
    if (metadata_observer_) {
        metadata_observer_(metadata);
    }

    acquiring_ = !is_complete();
    next_request_at_ = now + initial_request_delay_;
    evaluate_playback();
}

void VideoFileViewer::on_chunk(std::uint32_t index, Bytes data) {
    if (metadata_.has_value() && index >= metadata_->total_chunks) {
        log_event(StructuredLogger::Level::Warning,
                  "exchange.chunk.out_of_range",
                  {{"index", std::to_string(index)}, {"total", std::to_string(metadata_->total_chunks)}});
        return;
    }
    if (!metadata_.has_value() && index >= early_chunk_window()) {
        log_event(StructuredLogger::Level::Debug,
                  "exchange.chunk.premature",
                  {{"index", std::to_string(index)}, {"window", std::to_string(early_chunk_window())}});
        return;
    }
    if (received_.contains(index)) {
        return;
    }
    received_.emplace(index, std::move(data));
    requested_.erase(index);

    if (progress_observer_ && metadata_.has_value()) {
        progress_observer_(progress());
    }
    evaluate_playback();
    if (announce_every_ != 0 && received_.size() % announce_every_ == 0) {
        announce_availability();
    }
    if (is_complete()) {
        acquiring_ = false;
    }
}

void VideoFileViewer::on_chunk_request(const PeerId& peer, std::uint32_t index) {
    const auto it = received_.find(index);
    if (it == received_.end()) {
        return;
    }
    const auto bytes = protocol::encode(protocol::VideoMessage{self_, protocol::ChunkPayload{index, it->second}});
    channel_.broadcast_chunk(bytes, static_cast<std::int64_t>(index) + relay_offset_);
    ++chunks_relayed_;
    log_event(StructuredLogger::Level::Debug,
              "exchange.chunk.relayed",
              {{"peer", short_peer_id(peer)}, {"index", std::to_string(index)}});
}

void VideoFileViewer::on_have_chunks(const PeerId& peer, const std::vector<std::uint32_t>& indices) {
    availability_[peer] = std::set<std::uint32_t>(indices.begin(), indices.end());
}

void VideoFileViewer::request_batch() {
    if (!metadata_.has_value()) {
        return;
    }
    if (is_complete()) {
        acquiring_ = false;
        return;
    }
    std::size_t requested = 0;
    for (std::uint32_t index = 0; index < metadata_->total_chunks && requested < batch_size_; ++index) {
        if (received_.contains(index) || requested_.contains(index)) {
            continue;
        }
        const auto bytes = protocol::encode(protocol::VideoMessage{self_, protocol::RequestChunkPayload{index}});
        channel_.broadcast_signal(bytes);
        requested_.insert(index);
        ++requested;
    }
    if (requested == 0) {
        // Everything missing is already outstanding; treat those requests as lost.
        log_event(StructuredLogger::Level::Debug,
                  "exchange.requests.stale",
                  {{"outstanding", std::to_string(requested_.size())}});
        requested_.clear();
    }
}

void VideoFileViewer::evaluate_playback() {
    if (!metadata_.has_value() || metadata_->total_chunks == 0) {
        return;
    }
    const auto total = metadata_->total_chunks;
    const auto prefix = contiguous_prefix(received_);
    if (prefix == total) {
        if (full_playback_delivered_) {
            return;
        }
        full_playback_delivered_ = true;
        playback_started_ = true;
        log_event(StructuredLogger::Level::Info,
                  "exchange.playback.complete",
                  {{"file", metadata_->file_name}, {"chunks", std::to_string(total)}});
        if (sink_) {
            sink_->play(PlaybackRequest{assemble_prefix(total), metadata_->mime_type, total, true});
        }
        return;
    }
    if (playback_started_ || !allows_progressive_playback(playback_policy_, metadata_->mime_type)) {
        return;
    }
    if (percent_of(prefix, total) < playback_policy_.progressive_threshold_percent) {
        return;
    }
    playback_started_ = true;
    log_event(StructuredLogger::Level::Info,
              "exchange.playback.progressive",
              {{"file", metadata_->file_name}, {"prefix", std::to_string(prefix)}});
    if (sink_) {
        sink_->play(PlaybackRequest{assemble_prefix(prefix), metadata_->mime_type, prefix, false});
    }
}

void VideoFileViewer::announce_availability() {
    std::vector<std::uint32_t> held;
    held.reserve(received_.size());
    for (const auto& [index, data] : received_) {
        held.push_back(index);
    }
    const auto bytes = protocol::encode(protocol::VideoMessage{self_, protocol::HaveChunksPayload{std::move(held)}});
    channel_.broadcast_signal(bytes);
}

Bytes VideoFileViewer::assemble_prefix(std::uint32_t count) const {
    Bytes data;
    std::size_t size = 0;
    for (std::uint32_t index = 0; index < count; ++index) {
        size += received_.at(index).size();
    }
    data.reserve(size);
    for (std::uint32_t index = 0; index < count; ++index) {
        const auto& chunk = received_.at(index);
        data.insert(data.end(), chunk.begin(), chunk.end());
    }
    return data;
}

void VideoFileViewer::set_metadata_observer(MetadataObserver observer) {
    metadata_observer_ = std::move(observer);
}

void VideoFileViewer::set_progress_observer(ProgressObserver observer) {
    progress_observer_ = std::move(observer);
}

Progress VideoFileViewer::progress() const {
    Progress progress;
    progress.received = static_cast<std::uint32_t>(received_.size());
    progress.total = metadata_.has_value() ? metadata_->total_chunks : 0;
    progress.percent = percent_of(progress.received, progress.total);
    return progress;
}

double VideoFileViewer::buffered_percent() const {
    if (!metadata_.has_value()) {
        return 0.0;
    }
    return percent_of(contiguous_prefix(received_), metadata_->total_chunks);
}

bool VideoFileViewer::is_ready_to_play() const noexcept {
    return playback_started_;
}

bool VideoFileViewer::is_complete() const {
    return metadata_.has_value() && received_.size() == metadata_->total_chunks;
}

std::optional<std::set<std::uint32_t>> VideoFileViewer::peer_availability(const PeerId& peer) const {
    const auto it = availability_.find(peer);
    if (it == availability_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool VideoFileViewer::has_chunk(std::uint32_t index) const {
    return received_.contains(index);
}

std::optional<Bytes> VideoFileViewer::assemble() const {
    if (!is_complete()) {
        return std::nullopt;
    }
    return assemble_prefix(metadata_->total_chunks);
}

std::size_t VideoFileViewer::early_chunk_window() const noexcept {
    return std::max<std::size_t>(batch_size_, 1) * kEarlyChunkBatches;
}

void VideoFileViewer::close() {
    acquiring_ = false;
    metadata_requests_active_ = false;
    metadata_attempts_ = 0;
    metadata_.reset();
    received_.clear();
    requested_.clear();
    availability_.clear();
    playback_started_ = false;
    full_playback_delivered_ = false;
    chunks_relayed_ = 0;
}

}  // namespace meshcast::exchange
