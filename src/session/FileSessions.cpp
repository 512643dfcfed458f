#include "meshcast/session/FileSessions.hpp"

#include "meshcast/logging/StructuredLogger.hpp"

#include <utility>

namespace meshcast::session {

namespace {

using logging::StructuredLogger;

void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace

FileBroadcastSession::FileBroadcastSession(std::unique_ptr<transport::StreamChannel> channel,
                                           const Config& config,
                                           exchange::SourceFile source)
    : SessionLoop(std::move(channel), config),
      broadcaster_(local_id(), this->channel(), std::move(source), this->config()) {}

FileBroadcastSession::~FileBroadcastSession() {
    stop();
}

protocol::VideoMetadata FileBroadcastSession::prepare() {
    std::scoped_lock lock(state_mutex());
    if (broadcaster_.metadata().has_value()) {
        return *broadcaster_.metadata();
    }
    return broadcaster_.prepare();
}

void FileBroadcastSession::set_peer_request_observer(exchange::VideoFileBroadcaster::PeerRequestObserver observer) {
    std::scoped_lock lock(state_mutex());
    broadcaster_.set_peer_request_observer(std::move(observer));
}

void FileBroadcastSession::set_progress_observer(exchange::VideoFileBroadcaster::ProgressObserver observer) {
    std::scoped_lock lock(state_mutex());
    broadcaster_.set_progress_observer(std::move(observer));
}

bool FileBroadcastSession::is_broadcasting() const {
    std::scoped_lock lock(state_mutex());
    return broadcaster_.is_broadcasting();
}

std::uint32_t FileBroadcastSession::chunks_sent() const {
    std::scoped_lock lock(state_mutex());
    return broadcaster_.chunks_sent();
}

std::uint64_t FileBroadcastSession::requests_served() const {
    std::scoped_lock lock(state_mutex());
    return broadcaster_.requests_served();
}

std::optional<protocol::VideoMetadata> FileBroadcastSession::metadata() const {
    std::scoped_lock lock(state_mutex());
    return broadcaster_.metadata();
}

void FileBroadcastSession::on_start(Timestamp now) {
    if (!broadcaster_.metadata().has_value()) {
        broadcaster_.prepare();
    }
    log_event(StructuredLogger::Level::Info,
              "session.file.broadcasting",
              {{"topic", channel().topic()}, {"chunks", std::to_string(broadcaster_.chunks().size())}});
    broadcaster_.start_broadcast(now);
}

void FileBroadcastSession::on_event(const transport::StreamEvent& event, Timestamp) {
    auto message = decode_message(event);
    if (!message.has_value()) {
        return;
    }
    if (const auto* video = std::get_if<protocol::VideoMessage>(&*message)) {
        broadcaster_.handle_message(*video);
    }
}

void FileBroadcastSession::on_tick(Timestamp now) {
    broadcaster_.tick(now);
}

void FileBroadcastSession::on_teardown() noexcept {
    broadcaster_.close();
}

FileViewerSession::FileViewerSession(std::unique_ptr<transport::StreamChannel> channel,
                                     const Config& config,
                                     exchange::PlaybackSink* sink)
    : SessionLoop(std::move(channel), config),
      viewer_(local_id(), this->channel(), this->config(), sink) {}

FileViewerSession::~FileViewerSession() {
    stop();
}

void FileViewerSession::set_metadata_observer(exchange::VideoFileViewer::MetadataObserver observer) {
    std::scoped_lock lock(state_mutex());
    viewer_.set_metadata_observer(std::move(observer));
}

void FileViewerSession::set_progress_observer(exchange::VideoFileViewer::ProgressObserver observer) {
    std::scoped_lock lock(state_mutex());
    viewer_.set_progress_observer(std::move(observer));
}

exchange::Progress FileViewerSession::progress() const {
    std::scoped_lock lock(state_mutex());
    return viewer_.progress();
}

double FileViewerSession::buffered_percent() const {
    std::scoped_lock lock(state_mutex());
    return viewer_.buffered_percent();
}

bool FileViewerSession::is_ready_to_play() const {
    std::scoped_lock lock(state_mutex());
    return viewer_.is_ready_to_play();
}

bool FileViewerSession::is_complete() const {
    std::scoped_lock lock(state_mutex());
    return viewer_.is_complete();
}

std::optional<protocol::VideoMetadata> FileViewerSession::metadata() const {
    std::scoped_lock lock(state_mutex());
    return viewer_.metadata();
}

std::optional<Bytes> FileViewerSession::assemble() const {
    std::scoped_lock lock(state_mutex());
    return viewer_.assemble();
}

void FileViewerSession::on_start(Timestamp now) {
    log_event(StructuredLogger::Level::Info, "session.file.viewing", {{"topic", channel().topic()}});
    viewer_.begin(now);
}

void FileViewerSession::on_event(const transport::StreamEvent& event, Timestamp now) {
    auto message = decode_message(event);
    if (!message.has_value()) {
        return;
    }
    if (const auto* video = std::get_if<protocol::VideoMessage>(&*message)) {
        viewer_.handle_message(*video, now);
    }
}

void FileViewerSession::on_tick(Timestamp now) {
    viewer_.tick(now);
}

void FileViewerSession::on_teardown() noexcept {
    viewer_.close();
}

}  // namespace meshcast::session
