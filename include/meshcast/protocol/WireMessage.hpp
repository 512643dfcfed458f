#pragma once

#include "meshcast/Types.hpp"
#include "meshcast/protocol/SignalMessage.hpp"
#include "meshcast/protocol/VideoMessage.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <variant>

namespace meshcast::protocol {

using WireMessage = std::variant<SignalMessage, VideoMessage>;

Bytes encode(const SignalMessage& message);
Bytes encode(const VideoMessage& message);

// Single dispatch on the "type" discriminant. Malformed documents and unknown
// types yield nullopt; nothing is thrown.
std::optional<WireMessage> decode_wire_message(std::span<const std::uint8_t> bytes);

// Cheap check that the bytes could hold a JSON object rather than raw media.
bool looks_like_wire_message(std::span<const std::uint8_t> bytes) noexcept;

const PeerId& sender_of(const WireMessage& message) noexcept;

}  // namespace meshcast::protocol
