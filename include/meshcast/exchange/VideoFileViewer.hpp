#pragma once

#include "meshcast/Config.hpp"
#include "meshcast/Types.hpp"
#include "meshcast/exchange/PlaybackPolicy.hpp"
#include "meshcast/protocol/VideoMessage.hpp"
#include "meshcast/transport/StreamChannel.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

namespace meshcast::test {
class SessionTestAccess;
}

namespace meshcast::exchange {

struct Progress {
    std::uint32_t received{0};
    std::uint32_t total{0};
    double percent{0.0};

    friend bool operator==(const Progress&, const Progress&) = default;
};

// Pulls one file from the stream, relays what it holds to other viewers and
// hands assembled bytes to the player.
class VideoFileViewer {
public:
    using MetadataObserver = std::function<void(const protocol::VideoMetadata&)>;
    using ProgressObserver = std::function<void(const Progress&)>;

    VideoFileViewer(PeerId self,
                    transport::OutboundChannel& channel,
                    const Config& config,
                    PlaybackSink* sink = nullptr);

    // Asks for metadata now and keeps asking from tick() until it arrives.
    void begin(Timestamp now);
    void tick(Timestamp now);

    void handle_message(const protocol::VideoMessage& message, Timestamp now);
    void request_metadata();

    void set_metadata_observer(MetadataObserver observer);
    void set_progress_observer(ProgressObserver observer);

    Progress progress() const;
    double buffered_percent() const;
    bool is_ready_to_play() const noexcept;
    bool is_complete() const;
    bool acquiring() const noexcept { return acquiring_; }
    std::size_t outstanding_requests() const noexcept { return requested_.size(); }
    std::uint64_t chunks_relayed() const noexcept { return chunks_relayed_; }

    const std::optional<protocol::VideoMetadata>& metadata() const noexcept { return metadata_; }
    std::optional<std::set<std::uint32_t>> peer_availability(const PeerId& peer) const;
    bool has_chunk(std::uint32_t index) const;

    // Whole file in index order, once every chunk is held.
    std::optional<Bytes> assemble() const;

    void close();

private:
    friend class test::SessionTestAccess;

    void on_metadata(const protocol::VideoMetadata& metadata, Timestamp now);
    void on_chunk(std::uint32_t index, Bytes data);
    void on_chunk_request(const PeerId& peer, std::uint32_t index);
    void on_have_chunks(const PeerId& peer, const std::vector<std::uint32_t>& indices);

    void request_batch();
    void evaluate_playback();
    void announce_availability();
    Bytes assemble_prefix(std::uint32_t count) const;
    std::size_t early_chunk_window() const noexcept;

    PeerId self_;
    transport::OutboundChannel& channel_;
    PlaybackSink* sink_;

    std::size_t batch_size_;
    std::chrono::milliseconds request_interval_;
    std::chrono::milliseconds initial_request_delay_;
    std::chrono::milliseconds metadata_interval_;
    std::size_t metadata_limit_;
    std::size_t announce_every_;
    std::int64_t relay_offset_;
    PlaybackPolicy playback_policy_;

    std::optional<protocol::VideoMetadata> metadata_{};
    std::map<std::uint32_t, Bytes> received_;
    std::set<std::uint32_t> requested_;
    std::unordered_map<PeerId, std::set<std::uint32_t>> availability_;

    bool acquiring_{false};
    Timestamp next_request_at_{};

    bool metadata_requests_active_{false};
    std::size_t metadata_attempts_{0};
    Timestamp next_metadata_request_at_{};

    bool playback_started_{false};
    bool full_playback_delivered_{false};
    std::uint64_t chunks_relayed_{0};

    MetadataObserver metadata_observer_;
    ProgressObserver progress_observer_;
};

}  // namespace meshcast::exchange
