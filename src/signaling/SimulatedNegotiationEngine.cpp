#include "meshcast/signaling/SimulatedNegotiationEngine.hpp"

#include "meshcast/Error.hpp"

#include <sstream>
#include <utility>

namespace meshcast::signaling {

namespace {

std::string make_sdp(const PeerId& local, std::uint64_t session, std::string_view role, std::size_t tracks) {
    std::ostringstream oss;
    oss << "v=0\r\n"
        << "o=meshcast " << session << " 2 IN IP4 127.0.0.1\r\n"
        << "s=" << role << "\r\n"
        << "t=0 0\r\n"
        << "a=fingerprint:sim " << short_peer_id(local) << "\r\n";
    for (std::size_t track = 0; track < tracks; ++track) {
        oss << (track == 0 ? "m=video" : "m=audio") << " 9 UDP/TLS/RTP/SAVPF 96\r\n"
            << "a=mid:" << track << "\r\n";
    }
    return oss.str();
}

}  // namespace

class SimulatedPeerConnection : public PeerConnection {
public:
    SimulatedPeerConnection(SimulatedNegotiationEngine& engine,
                            PeerId peer,
                            bool outbound,
                            std::size_t tracks,
                            std::uint64_t session,
                            PeerConnectionCallbacks callbacks)
        : engine_(engine),
          peer_(std::move(peer)),
          outbound_(outbound),
          tracks_(tracks),
          session_(session),
          callbacks_(std::move(callbacks)) {}

    std::string create_offer() override {
        ensure_open();
        if (!outbound_) {
            throw NegotiationError("inbound connection cannot create an offer");
        }
        has_local_ = true;
        auto sdp = make_sdp(engine_.local_id_, session_, "offer", tracks_);
        change_state(ConnectionState::Connecting);
        emit_candidate();
        return sdp;
    }

    std::string create_answer() override {
        ensure_open();
        if (outbound_ || !has_remote_) {
            throw NegotiationError("answer requires a remote offer");
        }
        has_local_ = true;
        auto sdp = make_sdp(engine_.local_id_, session_, "answer", tracks_);
        emit_candidate();
        maybe_connect();
        return sdp;
    }

    void apply_remote_description(const SessionDescription& description) override {
        ensure_open();
        const auto expected = outbound_ ? SessionDescription::Kind::Answer : SessionDescription::Kind::Offer;
        if (description.kind != expected) {
            throw NegotiationError("unexpected session description kind");
        }
        if (!description.sdp.starts_with("v=0")) {
            throw NegotiationError("malformed session description");
        }
        if (!outbound_) {
            tracks_ = count_media_sections(description.sdp);
            change_state(ConnectionState::Connecting);
        }
        has_remote_ = true;
        maybe_connect();
    }

    bool has_remote_description() const override {
        return has_remote_;
    }

    void add_remote_candidate(const protocol::IceCandidate& candidate) override {
        ensure_open();
        if (!has_remote_) {
            throw NegotiationError("remote description must be applied before candidates");
        }
        if (candidate.candidate.empty()) {
            return;
        }
        ++remote_candidates_;
        maybe_connect();
    }

    void close() override {
        if (state_ == ConnectionState::Closed) {
            return;
        }
        change_state(ConnectionState::Closed);
    }

private:
    static std::size_t count_media_sections(const std::string& sdp) {
        std::size_t count = 0;
        std::size_t pos = 0;
        while ((pos = sdp.find("\r\nm=", pos)) != std::string::npos) {
            ++count;
            pos += 4;
        }
        return count;
    }

    void ensure_open() const {
        if (state_ == ConnectionState::Closed) {
            throw NegotiationError("connection is closed");
        }
    }

    void emit_candidate() {
        if (!callbacks_.on_local_candidate) {
            return;
        }
        protocol::IceCandidate candidate;
        std::ostringstream oss;
        oss << "candidate:" << session_ << " 1 udp 2122260223 127.0.0.1 " << (50000 + session_ % 10000)
            << " typ host";
        candidate.candidate = oss.str();
        candidate.sdp_mid = "0";
        candidate.sdp_mline_index = 0;
        candidate.username_fragment = short_peer_id(engine_.local_id_);
        callbacks_.on_local_candidate(candidate);
    }

    void maybe_connect() {
        if (state_ == ConnectionState::Connected || !has_local_ || !has_remote_ || remote_candidates_ == 0) {
            return;
        }
        change_state(ConnectionState::Connected);
        engine_.record_connected();
        if (!outbound_ && tracks_ > 0 && callbacks_.on_remote_track) {
            callbacks_.on_remote_track();
        }
    }

    void change_state(ConnectionState state) {
        if (state_ == state) {
            return;
        }
        state_ = state;
        if (callbacks_.on_state_change) {
            callbacks_.on_state_change(state);
        }
    }

    SimulatedNegotiationEngine& engine_;
    PeerId peer_;
    bool outbound_;
    std::size_t tracks_;
    std::uint64_t session_;
    PeerConnectionCallbacks callbacks_;
    ConnectionState state_{ConnectionState::New};
    bool has_local_{false};
    bool has_remote_{false};
    std::size_t remote_candidates_{0};
};

SimulatedNegotiationEngine::SimulatedNegotiationEngine(PeerId local_id)
    : local_id_(std::move(local_id)) {}

std::unique_ptr<PeerConnection> SimulatedNegotiationEngine::create_outbound(const PeerId& peer,
                                                                           MediaSource& source,
                                                                           PeerConnectionCallbacks callbacks) {
    std::uint64_t session = 0;
    {
        std::scoped_lock lock(mutex_);
        session = next_session_++;
        ++statistics_.connections_created;
    }
    return std::make_unique<SimulatedPeerConnection>(*this, peer, true, source.live_track_count(), session,
                                                     std::move(callbacks));
}

std::unique_ptr<PeerConnection> SimulatedNegotiationEngine::create_inbound(const PeerId& peer,
                                                                          PeerConnectionCallbacks callbacks) {
    std::uint64_t session = 0;
    {
        std::scoped_lock lock(mutex_);
        session = next_session_++;
        ++statistics_.connections_created;
    }
    return std::make_unique<SimulatedPeerConnection>(*this, peer, false, 0, session, std::move(callbacks));
}

SimulatedNegotiationEngine::Statistics SimulatedNegotiationEngine::statistics() const {
    std::scoped_lock lock(mutex_);
    return statistics_;
}

void SimulatedNegotiationEngine::record_connected() {
    std::scoped_lock lock(mutex_);
    ++statistics_.connections_connected;
}

}  // namespace meshcast::signaling
