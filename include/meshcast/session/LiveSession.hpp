#pragma once

#include "meshcast/session/SessionLoop.hpp"
#include "meshcast/signaling/NegotiationEngine.hpp"
#include "meshcast/signaling/SignalingSession.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <span>

namespace meshcast::session {

// A live stream: WebRTC negotiation over the signal path, plus raw media
// frames over the gossip path. A session holding a media source broadcasts.
class LiveSession : public SessionLoop {
public:
    using MediaObserver = std::function<void(const transport::MediaFrame&)>;

    LiveSession(std::unique_ptr<transport::StreamChannel> channel,
                const Config& config,
                std::unique_ptr<signaling::NegotiationEngine> engine,
                signaling::MediaSource* source = nullptr);
    ~LiveSession() override;

    bool is_broadcaster() const noexcept { return source_ != nullptr; }

    void set_state_observer(signaling::SignalingSession::StateObserver observer);
    void set_track_observer(signaling::SignalingSession::TrackObserver observer);
    void set_media_observer(MediaObserver observer);

    // Sends one encoded media segment with the next frame number.
    std::int64_t send_media_frame(std::span<const std::uint8_t> data);

    signaling::PeerPhase phase(const PeerId& peer) const;
    signaling::SignalingSnapshot snapshot() const;

protected:
    void on_start(Timestamp now) override;
    void on_event(const transport::StreamEvent& event, Timestamp now) override;
    void on_tick(Timestamp now) override;
    void on_teardown() noexcept override;

private:
    std::unique_ptr<signaling::NegotiationEngine> engine_;
    signaling::MediaSource* source_;
    signaling::SignalingSession signaling_;
    MediaObserver media_observer_;
    std::int64_t next_media_frame_{0};
};

}  // namespace meshcast::session
