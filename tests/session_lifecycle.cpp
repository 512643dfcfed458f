#include "meshcast/Config.hpp"
#include "meshcast/Error.hpp"
#include "meshcast/session/FileSessions.hpp"
#include "meshcast/session/LiveSession.hpp"
#include "meshcast/session/StreamNode.hpp"
#include "meshcast/signaling/SimulatedNegotiationEngine.hpp"
#include "meshcast/transport/LoopbackHub.hpp"
#include "test_access.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

using meshcast::Bytes;
using meshcast::Config;
using meshcast::PeerId;
using meshcast::session::FileBroadcastSession;
using meshcast::session::FileViewerSession;
using meshcast::session::LiveSession;
using meshcast::session::SessionLoop;
using meshcast::session::StreamNode;
using meshcast::signaling::PeerPhase;
using meshcast::signaling::SimulatedMediaSource;
using meshcast::signaling::SimulatedNegotiationEngine;
using meshcast::test::SessionTestAccess;
using meshcast::transport::LoopbackHub;

namespace {

Config fast_config() {
    Config config;
    config.file_chunk_size = 1024;
    config.broadcast_chunk_interval = 1ms;
    config.viewer_initial_request_delay = 10ms;
    config.viewer_request_interval = 50ms;
    config.metadata_request_interval = 50ms;
    config.offer_retry_interval = 50ms;
    config.presence_interval = 20ms;
    config.poll_interval = 5ms;
    config.join_timeout = 200ms;
    return config;
}

template <typename Done>
bool pump(std::initializer_list<SessionLoop*> loops, Done done, std::chrono::milliseconds limit = 5s) {
    const auto deadline = meshcast::Clock::now() + limit;
    while (meshcast::Clock::now() < deadline) {
        for (auto* loop : loops) {
            loop->poll(2ms);
        }
        if (done()) {
            return true;
        }
    }
    return false;
}

class RecordingSink : public meshcast::exchange::PlaybackSink {
public:
    void play(const meshcast::exchange::PlaybackRequest& request) override {
        requests.push_back(request);
    }

    std::vector<meshcast::exchange::PlaybackRequest> requests;
};

Bytes make_bytes(std::size_t size) {
    Bytes data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>(i % 253);
    }
    return data;
}

bool has_neighbor(const SessionLoop& loop, const PeerId& peer, const std::string& name) {
    const auto neighbors = loop.neighbors();
    return std::any_of(neighbors.begin(), neighbors.end(), [&](const auto& info) {
        return info.peer == peer && info.display_name == name;
    });
}

void test_file_session_end_to_end() {
    const auto config = fast_config();
    auto hub = LoopbackHub::make();
    StreamNode broadcaster_node(hub, config, "aa01");
    StreamNode viewer_node(hub, config, "bb02");

    const auto data = make_bytes(10 * 1024 + 100);
    FileBroadcastSession broadcaster(broadcaster_node.create_stream("demo"),
                                     config,
                                     meshcast::exchange::SourceFile{"clip.webm", "video/webm", data, 12.5});
    const auto metadata = broadcaster.prepare();
    assert(metadata.total_chunks == 11);
    assert(metadata.duration == 12.5);

    RecordingSink sink;
    FileViewerSession viewer(viewer_node.join_stream(broadcaster.ticket(), "viewer"), config, &sink);
    std::vector<meshcast::protocol::VideoMetadata> seen;
    viewer.set_metadata_observer([&seen](const meshcast::protocol::VideoMetadata& value) { seen.push_back(value); });

    const bool done = pump({&broadcaster, &viewer}, [&] {
        return viewer.is_complete() && has_neighbor(broadcaster, "bb02", "viewer");
    });
    assert(done);
    assert(viewer.assemble() == data);
    assert(viewer.buffered_percent() == 100.0);
    assert(viewer.is_ready_to_play());
    assert(seen.size() == 1 && seen.front() == metadata);
    assert(!sink.requests.empty());
    assert(sink.requests.back().complete);
    assert(sink.requests.back().mime_type == "video/webm");
    assert(broadcaster.chunks_sent() == 11);
    assert(broadcaster.is_broadcasting());
    assert(!broadcaster.last_error().has_value());

    viewer.stop();
    assert(!viewer.running());
    assert(viewer.channel().closed());
    assert(SessionTestAccess::neighbor_count(viewer) == 0);
    assert(!viewer.poll(1ms));
    viewer.stop();

    // The broadcaster sees the viewer leave.
    assert(pump({&broadcaster}, [&] { return SessionTestAccess::neighbor_count(broadcaster) == 0; }, 1s));

    broadcaster.stop();
    assert(!broadcaster.is_broadcasting());
    assert(!broadcaster.metadata().has_value());
}

void test_live_session_connects() {
    const auto config = fast_config();
    auto hub = LoopbackHub::make();
    StreamNode broadcaster_node(hub, config, "aa01");
    StreamNode viewer_node(hub, config, "bb02");

    SimulatedMediaSource source(2);
    LiveSession broadcaster(broadcaster_node.create_stream("live"),
                            config,
                            std::make_unique<SimulatedNegotiationEngine>("aa01"),
                            &source);
    LiveSession viewer(viewer_node.join_stream(broadcaster.ticket()),
                       config,
                       std::make_unique<SimulatedNegotiationEngine>("bb02"));
    assert(broadcaster.is_broadcaster());
    assert(!viewer.is_broadcaster());

    std::vector<PeerId> tracks;
    std::vector<meshcast::transport::MediaFrame> frames;
    viewer.set_track_observer([&tracks](const PeerId& peer) { tracks.push_back(peer); });
    viewer.set_media_observer([&frames](const meshcast::transport::MediaFrame& frame) { frames.push_back(frame); });

    const bool connected = pump({&broadcaster, &viewer}, [&] {
        return viewer.phase("aa01") == PeerPhase::Connected && broadcaster.phase("bb02") == PeerPhase::Connected;
    });
    assert(connected);
    assert((tracks == std::vector<PeerId>{"aa01"}));

    const Bytes media{0x1a, 0x45, 0xdf, 0xa3, 0x00, 0x01};
    assert(broadcaster.send_media_frame(media) == 0);
    assert(broadcaster.send_media_frame(media) == 1);
    assert(pump({&viewer}, [&] { return frames.size() == 2; }, 1s));
    assert(frames.front().from == "aa01");
    assert(frames.front().data == media);
    assert(frames.back().frame_number == 1);

    // Payloads that happen to start like JSON are still media.
    const std::vector<Bytes> lookalikes{
        Bytes{0x7b, 0x00, 0xff},
        Bytes{0x20, 0x7b, 0x99},
        Bytes{0x7b, 0x22, 0x74, 0x79, 0x70, 0x65, 0x22, 0x7d},
        Bytes{0x01},
    };
    for (const auto& payload : lookalikes) {
        broadcaster.send_media_frame(payload);
    }
    assert(pump({&viewer}, [&] { return frames.size() == 2 + lookalikes.size(); }, 1s));
    for (std::size_t i = 0; i < lookalikes.size(); ++i) {
        assert(frames[2 + i].data == lookalikes[i]);
        assert(frames[2 + i].frame_number == static_cast<std::int64_t>(2 + i));
    }

    // Offer requests stop once connected.
    const auto snapshot = viewer.snapshot();
    assert(!snapshot.offer_requests_active);
    assert(!snapshot.last_error.has_value());

    viewer.stop();
    assert(pump({&broadcaster}, [&] { return broadcaster.phase("bb02") == PeerPhase::Idle; }, 1s));
    broadcaster.stop();
}

void test_revoked_tracks_never_connect() {
    auto config = fast_config();
    config.offer_retry_interval = 10ms;
    config.offer_retry_limit = 3;
    auto hub = LoopbackHub::make();
    StreamNode broadcaster_node(hub, config, "aa01");
    StreamNode viewer_node(hub, config, "bb02");

    SimulatedMediaSource source(0);
    LiveSession broadcaster(broadcaster_node.create_stream("live"),
                            config,
                            std::make_unique<SimulatedNegotiationEngine>("aa01"),
                            &source);
    LiveSession viewer(viewer_node.join_stream(broadcaster.ticket()),
                       config,
                       std::make_unique<SimulatedNegotiationEngine>("bb02"));

    const bool exhausted = pump({&broadcaster, &viewer}, [&] {
        const auto snapshot = viewer.snapshot();
        return snapshot.offer_request_attempts == 3 && !snapshot.offer_requests_active;
    });
    assert(exhausted);
    assert(broadcaster.phase("bb02") == PeerPhase::Idle);
    assert(viewer.phase("aa01") == PeerPhase::Idle);
    assert(!viewer.snapshot().last_error.has_value());
}

void test_worker_threads() {
    const auto config = fast_config();
    auto hub = LoopbackHub::make();
    StreamNode broadcaster_node(hub, config, "aa01");
    StreamNode viewer_node(hub, config, "bb02");

    const auto data = make_bytes(4096);
    FileBroadcastSession broadcaster(broadcaster_node.create_stream("threads"),
                                     config,
                                     meshcast::exchange::SourceFile{"clip.mp4", "video/mp4", data, {}});
    FileViewerSession viewer(viewer_node.join_stream(broadcaster.ticket()), config);

    broadcaster.start();
    viewer.start();
    assert(SessionTestAccess::worker_running(broadcaster));

    const auto deadline = meshcast::Clock::now() + 5s;
    while (!viewer.is_complete() && meshcast::Clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    assert(viewer.is_complete());
    assert(viewer.assemble() == data);

    viewer.stop();
    broadcaster.stop();
    assert(!SessionTestAccess::worker_running(viewer));
    assert(!SessionTestAccess::worker_running(broadcaster));
}

void test_transport_failures_are_recorded() {
    const auto config = fast_config();
    auto hub = LoopbackHub::make();
    StreamNode broadcaster_node(hub, config, "aa01");
    StreamNode viewer_node(hub, config, "bb02");

    SimulatedMediaSource source(1);
    LiveSession broadcaster(broadcaster_node.create_stream("live"),
                            config,
                            std::make_unique<SimulatedNegotiationEngine>("aa01"),
                            &source);
    LiveSession viewer(viewer_node.join_stream(broadcaster.ticket()),
                       config,
                       std::make_unique<SimulatedNegotiationEngine>("bb02"));

    LoopbackHub::TestHooks hooks;
    hooks.fail_sends = true;
    hub->set_test_hooks(hooks);

    assert(viewer.poll(1ms));
    assert(viewer.last_error().has_value());
    assert(viewer.running());

    hub->set_test_hooks({});
    assert(pump({&broadcaster, &viewer}, [&] { return viewer.phase("aa01") == PeerPhase::Connected; }));
}

void test_start_failures_are_recorded() {
    auto config = fast_config();
    config.max_subchunk_size = 1024;
    config.file_chunk_size = 256 * 1024;
    auto hub = LoopbackHub::make();
    StreamNode node(hub, config, "aa01");

    FileBroadcastSession broadcaster(node.create_stream("oversized"),
                                     config,
                                     meshcast::exchange::SourceFile{"clip.webm", "video/webm", make_bytes(4096), {}});
    assert(broadcaster.poll(1ms));
    assert(broadcaster.last_error().has_value());
    assert(broadcaster.last_error()->find("does not fit") != std::string::npos);
    assert(!broadcaster.is_broadcasting());
    assert(!broadcaster.metadata().has_value());

    // Later polls keep running without retrying the start.
    assert(broadcaster.poll(1ms));
    broadcaster.stop();
}

void test_node_errors() {
    auto config = fast_config();
    config.join_timeout = 50ms;
    auto hub = LoopbackHub::make();
    StreamNode node(hub, config, "cc03");

    bool threw = false;
    try {
        node.join_stream("stream" + std::string(32, '0'));
    } catch (const meshcast::TimeoutError& error) {
        threw = error.code() == "E_JOIN_TIMEOUT";
    }
    assert(threw);

    threw = false;
    try {
        node.join_stream("nonsense");
    } catch (const meshcast::ResourceError& error) {
        threw = error.code() == "E_TICKET_INVALID";
    }
    assert(threw);

    threw = false;
    try {
        node.join_stream("streamzz");
    } catch (const meshcast::ResourceError& error) {
        threw = error.code() == "E_TICKET_INVALID";
    }
    assert(threw);

    threw = false;
    try {
        StreamNode invalid(hub, config, "not-hex!");
    } catch (const meshcast::ResourceError& error) {
        threw = error.code() == "E_PEER_ID_INVALID";
    }
    assert(threw);

    threw = false;
    try {
        StreamNode invalid(nullptr, config);
    } catch (const meshcast::ResourceError& error) {
        threw = error.code() == "E_TRANSPORT_UNAVAILABLE";
    }
    assert(threw);

    threw = false;
    try {
        LiveSession session(node.create_stream("no-engine"), config, nullptr);
    } catch (const meshcast::ResourceError& error) {
        threw = error.code() == "E_ENGINE_UNAVAILABLE";
    }
    assert(threw);

    threw = false;
    try {
        FileBroadcastSession empty(node.create_stream("empty"), config, meshcast::exchange::SourceFile{});
        empty.prepare();
    } catch (const meshcast::ResourceError& error) {
        threw = error.code() == "E_SOURCE_EMPTY";
    }
    assert(threw);

    node.shutdown();
    threw = false;
    try {
        node.create_stream("late");
    } catch (const meshcast::ResourceError& error) {
        threw = error.code() == "E_TRANSPORT_UNAVAILABLE";
    }
    assert(threw);

    hub->shutdown();
    StreamNode after(hub, config, "dd04");
    threw = false;
    try {
        after.create_stream("closed");
    } catch (const meshcast::ResourceError& error) {
        threw = error.code() == "E_TRANSPORT_UNAVAILABLE";
    }
    assert(threw);
}

}  // namespace

int main() {
    test_file_session_end_to_end();
    test_live_session_connects();
    test_revoked_tracks_never_connect();
    test_worker_threads();
    test_transport_failures_are_recorded();
    test_start_failures_are_recorded();
    test_node_errors();
    return 0;
}
