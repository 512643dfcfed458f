#include "meshcast/Config.hpp"
#include "meshcast/protocol/WireMessage.hpp"
#include "meshcast/signaling/SignalingSession.hpp"
#include "meshcast/signaling/SimulatedNegotiationEngine.hpp"
#include "test_access.hpp"

#include <cassert>
#include <chrono>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using namespace std::chrono_literals;

using meshcast::Config;
using meshcast::PeerId;
using meshcast::protocol::AnswerPayload;
using meshcast::protocol::IceCandidate;
using meshcast::protocol::IceCandidatePayload;
using meshcast::protocol::OfferPayload;
using meshcast::protocol::RequestOfferPayload;
using meshcast::protocol::SignalMessage;
using meshcast::protocol::SignalType;
using meshcast::signaling::ConnectionState;
using meshcast::signaling::PeerPhase;
using meshcast::signaling::SignalingSession;
using meshcast::signaling::SimulatedMediaSource;
using meshcast::signaling::SimulatedNegotiationEngine;
using meshcast::test::SessionTestAccess;

namespace {

// Captures outbound signals so the test decides when and in what order they arrive.
class RecordingChannel : public meshcast::transport::OutboundChannel {
public:
    void broadcast_chunk(std::span<const std::uint8_t>, std::int64_t) override {
        ++chunks;
    }

    void broadcast_signal(std::span<const std::uint8_t> payload) override {
        auto decoded = meshcast::protocol::decode_wire_message(payload);
        assert(decoded.has_value());
        assert(std::holds_alternative<SignalMessage>(*decoded));
        sent.push_back(std::get<SignalMessage>(std::move(*decoded)));
    }

    std::vector<SignalMessage> take() {
        return std::exchange(sent, {});
    }

    std::vector<SignalMessage> sent;
    std::size_t chunks{0};
};

struct Endpoint {
    Endpoint(PeerId id, const Config& config, SimulatedMediaSource* source)
        : self(std::move(id)), engine(self), session(self, channel, engine, config, source) {
        session.set_state_observer([this](const PeerId& peer, ConnectionState state) {
            states.emplace_back(peer, state);
        });
        session.set_track_observer([this](const PeerId& peer) { tracks.push_back(peer); });
    }

    PeerId self;
    RecordingChannel channel;
    SimulatedNegotiationEngine engine;
    SignalingSession session;
    std::vector<std::pair<PeerId, ConnectionState>> states;
    std::vector<PeerId> tracks;
};

void deliver(Endpoint& from, Endpoint& to) {
    for (const auto& message : from.channel.take()) {
        to.session.handle_signal(message);
    }
}

std::size_t count_type(const std::vector<SignalMessage>& messages, SignalType type) {
    std::size_t count = 0;
    for (const auto& message : messages) {
        if (message.type() == type) {
            ++count;
        }
    }
    return count;
}

IceCandidate make_candidate(std::string text) {
    IceCandidate candidate;
    candidate.candidate = std::move(text);
    candidate.sdp_mid = "0";
    candidate.sdp_mline_index = 0;
    return candidate;
}

void test_full_negotiation() {
    Config config;
    SimulatedMediaSource source(2);
    Endpoint broadcaster("b0b0", config, &source);
    Endpoint viewer("v1v1", config, nullptr);

    const auto start = meshcast::Clock::now();
    viewer.session.begin_offer_requests(start);
    assert(viewer.channel.sent.size() == 1);
    assert(viewer.channel.sent.front().type() == SignalType::RequestOffer);
    assert(!viewer.channel.sent.front().to.has_value());

    deliver(viewer, broadcaster);
    assert(broadcaster.session.phase("v1v1") == PeerPhase::OfferSent);
    const auto& outbound = broadcaster.channel.sent;
    assert(count_type(outbound, SignalType::Offer) == 1);
    assert(count_type(outbound, SignalType::IceCandidate) == 1);
    for (const auto& message : outbound) {
        assert(message.to == PeerId("v1v1"));
    }

    // The broadcaster's candidate reaches the viewer ahead of the offer and waits.
    deliver(broadcaster, viewer);
    assert(viewer.session.phase("b0b0") == PeerPhase::Connected);
    assert(viewer.session.queued_candidates("b0b0") == 0);
    assert((viewer.tracks == std::vector<PeerId>{"b0b0"}));
    assert(count_type(viewer.channel.sent, SignalType::Answer) == 1);

    deliver(viewer, broadcaster);
    assert(broadcaster.session.phase("v1v1") == PeerPhase::Connected);
    assert(broadcaster.engine.statistics().connections_connected == 1);
    assert(viewer.engine.statistics().connections_connected == 1);
    assert(!broadcaster.states.empty());
    assert(broadcaster.states.back().second == ConnectionState::Connected);

    // A connected peer no longer needs offers.
    viewer.session.tick(start + 5s);
    assert(viewer.channel.sent.empty());
    assert(!viewer.session.snapshot().offer_requests_active);

    // Offers and request-offer from an already connected peer are ignored.
    const auto generation = SessionTestAccess::generation(viewer.session, "b0b0");
    viewer.session.handle_signal(SignalMessage{"b0b0", PeerId("v1v1"), OfferPayload{"v=0\r\n"}});
    assert(SessionTestAccess::generation(viewer.session, "b0b0") == generation);
    broadcaster.session.handle_signal(SignalMessage{"v1v1", std::nullopt, RequestOfferPayload{}});
    assert(broadcaster.channel.sent.empty());

    // A late answer is dropped once the offer is settled.
    broadcaster.session.handle_signal(SignalMessage{"v1v1", PeerId("b0b0"), AnswerPayload{"v=0\r\n"}});
    assert(broadcaster.session.phase("v1v1") == PeerPhase::Connected);

    broadcaster.session.handle_peer_left("v1v1");
    assert(broadcaster.session.peer_count() == 0);
    assert(broadcaster.states.back() == std::make_pair(PeerId("v1v1"), ConnectionState::Closed));

    viewer.session.close_all();
    assert(viewer.session.peer_count() == 0);
}

void test_candidates_queue_in_order() {
    Config config;
    Endpoint viewer("v1v1", config, nullptr);

    for (const auto* text : {"candidate:1", "candidate:2", "candidate:3"}) {
        viewer.session.handle_signal(
            SignalMessage{"b0b0", PeerId("v1v1"), IceCandidatePayload{make_candidate(text)}});
    }
    assert((SessionTestAccess::queued_candidate_strings(viewer.session, "b0b0") ==
            std::vector<std::string>{"candidate:1", "candidate:2", "candidate:3"}));
    assert(viewer.session.phase("b0b0") == PeerPhase::Idle);

    SimulatedMediaSource source(1);
    SimulatedNegotiationEngine remote("b0b0");
    auto connection = remote.create_outbound("v1v1", source, {});
    const auto offer = connection->create_offer();

    viewer.session.handle_signal(SignalMessage{"b0b0", PeerId("v1v1"), OfferPayload{offer}});
    assert(viewer.session.queued_candidates("b0b0") == 0);
    assert(viewer.session.phase("b0b0") == PeerPhase::Connected);
    assert(SessionTestAccess::has_connection(viewer.session, "b0b0"));
}

void test_ignored_messages() {
    Config config;
    SimulatedMediaSource source(2);
    Endpoint broadcaster("b0b0", config, &source);

    // Our own echo.
    broadcaster.session.handle_signal(SignalMessage{"b0b0", std::nullopt, RequestOfferPayload{}});
    // Addressed to someone else.
    broadcaster.session.handle_signal(SignalMessage{"v1v1", PeerId("c2c2"), RequestOfferPayload{}});
    assert(broadcaster.channel.sent.empty());
    assert(broadcaster.session.peer_count() == 0);

    // An answer with no outstanding offer.
    broadcaster.session.handle_signal(SignalMessage{"v1v1", PeerId("b0b0"), AnswerPayload{"v=0\r\n"}});
    assert(broadcaster.session.peer_count() == 0);
    assert(!broadcaster.session.snapshot().last_error.has_value());

    // Revoked capture: request-offer is ignored.
    source.set_live_tracks(0);
    broadcaster.session.handle_signal(SignalMessage{"v1v1", std::nullopt, RequestOfferPayload{}});
    assert(broadcaster.channel.sent.empty());
    assert(broadcaster.session.peer_count() == 0);

    // A viewer without a source ignores request-offer too.
    Endpoint viewer("v1v1", config, nullptr);
    viewer.session.handle_signal(SignalMessage{"c2c2", std::nullopt, RequestOfferPayload{}});
    assert(viewer.channel.sent.empty());
}

void test_repeated_request_replaces_handle() {
    Config config;
    SimulatedMediaSource source(2);
    Endpoint broadcaster("b0b0", config, &source);

    broadcaster.session.handle_signal(SignalMessage{"v1v1", std::nullopt, RequestOfferPayload{}});
    const auto first = SessionTestAccess::generation(broadcaster.session, "v1v1");
    assert(first.has_value());
    broadcaster.channel.take();

    // A candidate that raced the first negotiation is discarded with it.
    broadcaster.session.handle_signal(
        SignalMessage{"v1v1", PeerId("b0b0"), IceCandidatePayload{make_candidate("candidate:stale")}});
    assert(broadcaster.session.queued_candidates("v1v1") == 1);

    broadcaster.session.handle_signal(SignalMessage{"v1v1", std::nullopt, RequestOfferPayload{}});
    const auto second = SessionTestAccess::generation(broadcaster.session, "v1v1");
    assert(second.has_value() && *second > *first);
    assert(broadcaster.session.queued_candidates("v1v1") == 0);
    assert(count_type(broadcaster.channel.sent, SignalType::Offer) == 1);
    assert(broadcaster.session.peer_count() == 1);
}

void test_retry_ceiling() {
    Config config;
    config.offer_retry_interval = 2s;
    config.offer_retry_limit = 10;
    Endpoint viewer("v1v1", config, nullptr);

    const auto start = meshcast::Clock::now();
    viewer.session.begin_offer_requests(start);
    viewer.session.tick(start + 1s);
    assert(viewer.channel.sent.size() == 1);

    for (int step = 1; step <= 20; ++step) {
        viewer.session.tick(start + std::chrono::seconds(2 * step));
    }
    assert(count_type(viewer.channel.sent, SignalType::RequestOffer) == 10);
    const auto snapshot = viewer.session.snapshot();
    assert(snapshot.offer_request_attempts == 10);
    assert(!snapshot.offer_requests_active);
    assert(!snapshot.last_error.has_value());
}

void test_negotiation_failure() {
    Config config;
    Endpoint viewer("v1v1", config, nullptr);

    viewer.session.handle_signal(SignalMessage{"b0b0", PeerId("v1v1"), OfferPayload{"not an sdp"}});
    assert(viewer.session.phase("b0b0") == PeerPhase::Closed);
    assert(!SessionTestAccess::has_connection(viewer.session, "b0b0"));
    assert(viewer.session.snapshot().last_error.has_value());
    assert(!viewer.states.empty());
    assert(viewer.states.back() == std::make_pair(PeerId("b0b0"), ConnectionState::Failed));
    assert(count_type(viewer.channel.sent, SignalType::Answer) == 0);

    // A fresh offer recovers the peer.
    SimulatedMediaSource source(1);
    SimulatedNegotiationEngine remote("b0b0");
    auto connection = remote.create_outbound("v1v1", source, {});
    viewer.session.handle_signal(SignalMessage{"b0b0", PeerId("v1v1"), OfferPayload{connection->create_offer()}});
    assert(viewer.session.phase("b0b0") == PeerPhase::OfferReceived);
    assert(count_type(viewer.channel.sent, SignalType::Answer) == 1);
}

}  // namespace

int main() {
    test_full_negotiation();
    test_candidates_queue_in_order();
    test_ignored_messages();
    test_repeated_request_replaces_handle();
    test_retry_ceiling();
    test_negotiation_failure();
    return 0;
}
