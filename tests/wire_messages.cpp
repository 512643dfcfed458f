#include "meshcast/protocol/WireMessage.hpp"

#include <cassert>
#include <string>
#include <variant>

using meshcast::Bytes;
using meshcast::protocol::AnswerPayload;
using meshcast::protocol::ChunkPayload;
using meshcast::protocol::HaveChunksPayload;
using meshcast::protocol::IceCandidate;
using meshcast::protocol::IceCandidatePayload;
using meshcast::protocol::MetadataPayload;
using meshcast::protocol::OfferPayload;
using meshcast::protocol::RequestOfferPayload;
using meshcast::protocol::SignalMessage;
using meshcast::protocol::SignalType;
using meshcast::protocol::VideoMessage;
using meshcast::protocol::VideoMessageType;
using meshcast::protocol::decode_wire_message;

namespace {

Bytes as_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

std::string as_text(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace

int main() {
    // Signals carry the prefixed type names on the wire.
    SignalMessage offer{"aa11", std::string("bb22"), OfferPayload{"v=0\r\n"}};
    const auto offer_text = as_text(meshcast::protocol::encode(offer));
    assert(offer_text.find(R"("type":"webrtc-offer")") != std::string::npos);
    assert(offer_text.find(R"("to":"bb22")") != std::string::npos);

    auto decoded = decode_wire_message(as_bytes(offer_text));
    assert(decoded.has_value());
    const auto* signal = std::get_if<SignalMessage>(&*decoded);
    assert(signal != nullptr);
    assert(signal->type() == SignalType::Offer);
    assert(signal->from == "aa11");
    assert(signal->addressed_to("bb22"));
    assert(!signal->addressed_to("cc33"));
    assert(std::get<OfferPayload>(signal->payload).sdp == "v=0\r\n");
    assert(meshcast::protocol::sender_of(*decoded) == "aa11");

    // Broadcast request-offer has no "to" and reaches everyone.
    SignalMessage request{"aa11", std::nullopt, RequestOfferPayload{}};
    const auto request_text = as_text(meshcast::protocol::encode(request));
    assert(request_text.find("\"to\"") == std::string::npos);
    decoded = decode_wire_message(as_bytes(request_text));
    assert(decoded.has_value());
    assert(std::get<SignalMessage>(*decoded).addressed_to("anyone"));

    // Bare type names are accepted on decode.
    decoded = decode_wire_message(as_bytes(R"({"type":"answer","from":"bb22","to":"aa11","sdp":"v=0"})"));
    assert(decoded.has_value());
    assert(std::get<AnswerPayload>(std::get<SignalMessage>(*decoded).payload).sdp == "v=0");

    IceCandidate candidate{"candidate:1 1 udp 1 127.0.0.1 5000 typ host", std::string("0"), 0, std::string("ufrag")};
    SignalMessage ice{"aa11", std::string("bb22"), IceCandidatePayload{candidate}};
    decoded = decode_wire_message(meshcast::protocol::encode(ice));
    assert(decoded.has_value());
    assert(std::get<IceCandidatePayload>(std::get<SignalMessage>(*decoded).payload).candidate == candidate);

    // Video messages.
    meshcast::protocol::VideoMetadata metadata;
    metadata.file_name = "clip.webm";
    metadata.file_size = 200000;
    metadata.mime_type = "video/webm";
    metadata.total_chunks = 4;
    metadata.duration = 12.0;
    decoded = decode_wire_message(meshcast::protocol::encode(VideoMessage{"aa11", MetadataPayload{metadata}}));
    assert(decoded.has_value());
    const auto& video = std::get<VideoMessage>(*decoded);
    assert(video.type() == VideoMessageType::Metadata);
    assert(std::get<MetadataPayload>(video.payload).metadata == metadata);

    // Missing name and MIME type fall back to defaults.
    decoded = decode_wire_message(
        as_bytes(R"({"type":"video-metadata","from":"aa11","fileSize":10,"totalChunks":1})"));
    assert(decoded.has_value());
    const auto& defaults = std::get<MetadataPayload>(std::get<VideoMessage>(*decoded).payload).metadata;
    assert(defaults.file_name == "video");
    assert(defaults.mime_type == "video/mp4");
    assert(!defaults.duration.has_value());

    const auto chunk_text =
        as_text(meshcast::protocol::encode(VideoMessage{"aa11", ChunkPayload{2, Bytes{1, 2, 255}}}));
    assert(chunk_text.find(R"("chunkData":[1,2,255])") != std::string::npos);
    decoded = decode_wire_message(as_bytes(chunk_text));
    assert(decoded.has_value());
    const auto& chunk = std::get<ChunkPayload>(std::get<VideoMessage>(*decoded).payload);
    assert(chunk.chunk_index == 2);
    assert((chunk.chunk_data == Bytes{1, 2, 255}));

    decoded = decode_wire_message(
        meshcast::protocol::encode(VideoMessage{"aa11", HaveChunksPayload{{0, 1, 5}}}));
    assert(decoded.has_value());
    assert((std::get<HaveChunksPayload>(std::get<VideoMessage>(*decoded).payload).available_chunks ==
            std::vector<std::uint32_t>{0, 1, 5}));

    // Anything malformed decodes to nothing.
    assert(!decode_wire_message(as_bytes("not json")).has_value());
    assert(!decode_wire_message(as_bytes(R"({"from":"aa11"})")).has_value());
    assert(!decode_wire_message(as_bytes(R"({"type":"webrtc-teleport","from":"aa11"})")).has_value());
    assert(!decode_wire_message(as_bytes(R"({"type":"webrtc-offer","from":"aa11"})")).has_value());
    assert(!decode_wire_message(as_bytes(R"({"type":"video-chunk","from":"aa11","chunkIndex":1,"chunkData":[256]})"))
                .has_value());
    assert(!decode_wire_message(as_bytes(R"({"type":"video-request-chunk","from":"aa11","chunkIndex":-1})"))
                .has_value());
    assert(!decode_wire_message(as_bytes(R"(["array"])")).has_value());
    assert(!decode_wire_message(as_bytes(R"({"type":"video-metadata","from":"aa11","totalChunks":1)"))
                .has_value());

    assert(meshcast::protocol::looks_like_wire_message(as_bytes("  {")));
    assert(!meshcast::protocol::looks_like_wire_message(Bytes{0x1a, 0x45, 0xdf, 0xa3}));
    assert(!meshcast::protocol::looks_like_wire_message(Bytes{}));

    return 0;
}
