#pragma once

#include "meshcast/exchange/PlaybackPolicy.hpp"
#include "meshcast/exchange/VideoFileBroadcaster.hpp"
#include "meshcast/exchange/VideoFileViewer.hpp"
#include "meshcast/session/SessionLoop.hpp"

#include <memory>
#include <optional>

namespace meshcast::session {

// Shares one prepared file with every viewer of the stream.
class FileBroadcastSession : public SessionLoop {
public:
    FileBroadcastSession(std::unique_ptr<transport::StreamChannel> channel,
                         const Config& config,
                         exchange::SourceFile source);
    ~FileBroadcastSession() override;

    // Throws ResourceError when the source is empty.
    protocol::VideoMetadata prepare();

    void set_peer_request_observer(exchange::VideoFileBroadcaster::PeerRequestObserver observer);
    void set_progress_observer(exchange::VideoFileBroadcaster::ProgressObserver observer);

    bool is_broadcasting() const;
    std::uint32_t chunks_sent() const;
    std::uint64_t requests_served() const;
    std::optional<protocol::VideoMetadata> metadata() const;

protected:
    void on_start(Timestamp now) override;
    void on_event(const transport::StreamEvent& event, Timestamp now) override;
    void on_tick(Timestamp now) override;
    void on_teardown() noexcept override;

private:
    exchange::VideoFileBroadcaster broadcaster_;
};

// Downloads the broadcast file, relays held chunks and drives playback.
class FileViewerSession : public SessionLoop {
public:
    FileViewerSession(std::unique_ptr<transport::StreamChannel> channel,
                      const Config& config,
                      exchange::PlaybackSink* sink = nullptr);
    ~FileViewerSession() override;

    void set_metadata_observer(exchange::VideoFileViewer::MetadataObserver observer);
    void set_progress_observer(exchange::VideoFileViewer::ProgressObserver observer);

    exchange::Progress progress() const;
    double buffered_percent() const;
    bool is_ready_to_play() const;
    bool is_complete() const;
    std::optional<protocol::VideoMetadata> metadata() const;
    std::optional<Bytes> assemble() const;

protected:
    void on_start(Timestamp now) override;
    void on_event(const transport::StreamEvent& event, Timestamp now) override;
    void on_tick(Timestamp now) override;
    void on_teardown() noexcept override;

private:
    exchange::VideoFileViewer viewer_;
};

}  // namespace meshcast::session
