#pragma once

#include "meshcast/Types.hpp"
#include "meshcast/protocol/Json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace meshcast::protocol {

enum class SignalType : std::uint8_t {
    Offer,
    Answer,
    IceCandidate,
    RequestOffer
};

struct IceCandidate {
    std::string candidate;
    std::optional<std::string> sdp_mid{};
    std::optional<std::int64_t> sdp_mline_index{};
    std::optional<std::string> username_fragment{};

    friend bool operator==(const IceCandidate&, const IceCandidate&) = default;
};

struct OfferPayload {
    std::string sdp;
};

struct AnswerPayload {
    std::string sdp;
};

struct IceCandidatePayload {
    IceCandidate candidate;
};

struct RequestOfferPayload {};

using SignalPayload = std::variant<OfferPayload, AnswerPayload, IceCandidatePayload, RequestOfferPayload>;

struct SignalMessage {
    PeerId from;
    // Absent means every listener.
    std::optional<PeerId> to{};
    SignalPayload payload{RequestOfferPayload{}};

    SignalType type() const noexcept;
    bool addressed_to(const PeerId& peer) const noexcept;
};

std::string_view signal_type_to_string(SignalType type) noexcept;
// Accepts both the prefixed wire names and the bare ones ("offer", ...).
std::optional<SignalType> signal_type_from_string(std::string_view text) noexcept;

std::string encode_signal(const SignalMessage& message);
std::optional<SignalMessage> decode_signal(const JsonValue& document);

}  // namespace meshcast::protocol
