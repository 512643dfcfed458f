#include "meshcast/protocol/SignalMessage.hpp"

#include <type_traits>

namespace meshcast::protocol {

namespace {

constexpr std::string_view kOffer = "webrtc-offer";
constexpr std::string_view kAnswer = "webrtc-answer";
constexpr std::string_view kIceCandidate = "webrtc-ice-candidate";
constexpr std::string_view kRequestOffer = "webrtc-request-offer";
constexpr std::string_view kPrefix = "webrtc-";

void write_candidate(JsonWriter& writer, const IceCandidate& candidate) {
    writer.key("candidate");
    writer.begin_object();
    writer.field("candidate", candidate.candidate);
    if (candidate.sdp_mid.has_value()) {
        writer.field("sdpMid", *candidate.sdp_mid);
    } else {
        writer.key("sdpMid");
        writer.null();
    }
    if (candidate.sdp_mline_index.has_value()) {
        writer.field("sdpMLineIndex", *candidate.sdp_mline_index);
    } else {
        writer.key("sdpMLineIndex");
        writer.null();
    }
    if (candidate.username_fragment.has_value()) {
        writer.field("usernameFragment", *candidate.username_fragment);
    }
    writer.end_object();
}

std::optional<IceCandidate> read_candidate(const JsonValue* node) {
    if (!node || !node->is_object()) {
        return std::nullopt;
    }
    auto text = node->string_field("candidate");
    if (!text.has_value()) {
        return std::nullopt;
    }
    IceCandidate candidate;
    candidate.candidate = std::move(*text);
    candidate.sdp_mid = node->string_field("sdpMid");
    candidate.sdp_mline_index = node->integer_field("sdpMLineIndex");
    candidate.username_fragment = node->string_field("usernameFragment");
    return candidate;
}

}  // namespace

SignalType SignalMessage::type() const noexcept {
    return std::visit(
        [](const auto& value) -> SignalType {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, OfferPayload>) {
                return SignalType::Offer;
            } else if constexpr (std::is_same_v<T, AnswerPayload>) {
                return SignalType::Answer;
            } else if constexpr (std::is_same_v<T, IceCandidatePayload>) {
                return SignalType::IceCandidate;
            } else {
                return SignalType::RequestOffer;
            }
        },
        payload);
}

bool SignalMessage::addressed_to(const PeerId& peer) const noexcept {
    return !to.has_value() || *to == peer;
}

std::string_view signal_type_to_string(SignalType type) noexcept {
    switch (type) {
        case SignalType::Offer:
            return kOffer;
        case SignalType::Answer:
            return kAnswer;
        case SignalType::IceCandidate:
            return kIceCandidate;
        case SignalType::RequestOffer:
            return kRequestOffer;
    }
    return kRequestOffer;
}

std::optional<SignalType> signal_type_from_string(std::string_view text) noexcept {
    if (text.starts_with(kPrefix)) {
        text.remove_prefix(kPrefix.size());
    }
    if (text == "offer") {
        return SignalType::Offer;
    }
    if (text == "answer") {
        return SignalType::Answer;
    }
    if (text == "ice-candidate") {
        return SignalType::IceCandidate;
    }
    if (text == "request-offer") {
        return SignalType::RequestOffer;
    }
    return std::nullopt;
}

std::string encode_signal(const SignalMessage& message) {
    JsonWriter writer;
    writer.begin_object();
    writer.field("type", signal_type_to_string(message.type()));
    writer.field("from", message.from);
    if (message.to.has_value()) {
        writer.field("to", *message.to);
    }
    std::visit(
        [&](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, OfferPayload> || std::is_same_v<T, AnswerPayload>) {
                writer.field("sdp", value.sdp);
            } else if constexpr (std::is_same_v<T, IceCandidatePayload>) {
                write_candidate(writer, value.candidate);
            }
        },
        message.payload);
    writer.end_object();
    return writer.take();
}

std::optional<SignalMessage> decode_signal(const JsonValue& document) {
    const auto type_text = document.string_field("type");
    auto from = document.string_field("from");
    if (!type_text.has_value() || !from.has_value()) {
        return std::nullopt;
    }
    const auto type = signal_type_from_string(*type_text);
    if (!type.has_value()) {
        return std::nullopt;
    }

    SignalMessage message;
    message.from = std::move(*from);
    message.to = document.string_field("to");

    switch (*type) {
        case SignalType::Offer:
        case SignalType::Answer: {
            auto sdp = document.string_field("sdp");
            if (!sdp.has_value()) {
                return std::nullopt;
            }
            if (*type == SignalType::Offer) {
                message.payload = OfferPayload{std::move(*sdp)};
            } else {
                message.payload = AnswerPayload{std::move(*sdp)};
            }
            break;
        }
        case SignalType::IceCandidate: {
            auto candidate = read_candidate(document.find("candidate"));
            if (!candidate.has_value()) {
                return std::nullopt;
            }
            message.payload = IceCandidatePayload{std::move(*candidate)};
            break;
        }
        case SignalType::RequestOffer:
            message.payload = RequestOfferPayload{};
            break;
    }
    return message;
}

}  // namespace meshcast::protocol
