#include "meshcast/protocol/WireMessage.hpp"

#include <cctype>
#include <string_view>

namespace meshcast::protocol {

namespace {

Bytes to_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

}  // namespace

Bytes encode(const SignalMessage& message) {
    return to_bytes(encode_signal(message));
}

Bytes encode(const VideoMessage& message) {
    return to_bytes(encode_video_message(message));
}

bool looks_like_wire_message(std::span<const std::uint8_t> bytes) noexcept {
    for (const auto byte : bytes) {
        if (std::isspace(byte) != 0) {
            continue;
        }
        return byte == '{';
    }
    return false;
}

std::optional<WireMessage> decode_wire_message(std::span<const std::uint8_t> bytes) {
    if (!looks_like_wire_message(bytes)) {
        return std::nullopt;
    }
    JsonValue document;
    try {
        document = parse_json(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    } catch (const JsonError&) {
        return std::nullopt;
    }
    if (!document.is_object()) {
        return std::nullopt;
    }
    const auto type = document.string_field("type");
    if (!type.has_value()) {
        return std::nullopt;
    }
    if (signal_type_from_string(*type).has_value()) {
        if (auto signal = decode_signal(document)) {
            return WireMessage{std::move(*signal)};
        }
        return std::nullopt;
    }
    if (video_message_type_from_string(*type).has_value()) {
        if (auto video = decode_video_message(document)) {
            return WireMessage{std::move(*video)};
        }
    }
    return std::nullopt;
}

const PeerId& sender_of(const WireMessage& message) noexcept {
    return std::visit([](const auto& value) -> const PeerId& { return value.from; }, message);
}

}  // namespace meshcast::protocol
