#pragma once

#include "meshcast/Config.hpp"
#include "meshcast/Types.hpp"
#include "meshcast/protocol/VideoMessage.hpp"
#include "meshcast/transport/StreamChannel.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace meshcast::exchange {

struct SourceFile {
    std::string name;
    std::string mime_type;
    Bytes data;
    std::optional<double> duration{};
};

// Deterministic fixed-size slicing; the last chunk may be short.
std::vector<Bytes> slice_into_chunks(std::span<const std::uint8_t> data, std::size_t chunk_size);

// Serves one file to every viewer of a stream: an initial paced pass over all
// chunks, then re-broadcasts on request.
class VideoFileBroadcaster {
public:
    using PeerRequestObserver = std::function<void(const PeerId&, std::uint32_t)>;
    using ProgressObserver = std::function<void(std::uint32_t sent, std::uint32_t total)>;

    VideoFileBroadcaster(PeerId self, transport::OutboundChannel& channel, SourceFile source, const Config& config);

    // Throws ResourceError when the source is empty.
    const protocol::VideoMetadata& prepare();

    void start_broadcast(Timestamp now);
    void start_broadcast(Timestamp now, std::chrono::milliseconds interval);
    void stop_broadcast();
    [[nodiscard]] bool is_broadcasting() const noexcept { return running_; }

    void tick(Timestamp now);

    void handle_message(const protocol::VideoMessage& message);
    void handle_chunk_request(const PeerId& peer, std::uint32_t index);
    void broadcast_metadata();

    void set_peer_request_observer(PeerRequestObserver observer);
    void set_progress_observer(ProgressObserver observer);

    std::uint32_t chunks_sent() const noexcept { return next_chunk_; }
    std::uint64_t requests_served() const noexcept { return requests_served_; }
    const std::optional<protocol::VideoMetadata>& metadata() const noexcept { return metadata_; }
    const std::vector<Bytes>& chunks() const noexcept { return chunks_; }

    void close();

private:
    void send_chunk(std::uint32_t index);

    PeerId self_;
    transport::OutboundChannel& channel_;
    SourceFile source_;
    std::size_t chunk_size_;
    std::size_t frame_capacity_;
    std::chrono::milliseconds interval_;

    std::optional<protocol::VideoMetadata> metadata_{};
    std::vector<Bytes> chunks_;

    bool running_{false};
    std::uint32_t next_chunk_{0};
    Timestamp next_emit_at_{};
    std::uint64_t requests_served_{0};

    PeerRequestObserver peer_request_observer_;
    ProgressObserver progress_observer_;
};

}  // namespace meshcast::exchange
