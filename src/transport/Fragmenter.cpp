#include "meshcast/transport/Fragmenter.hpp"

#include "meshcast/logging/StructuredLogger.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace meshcast::transport {

namespace {

using logging::StructuredLogger;

void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace

Fragmenter::Fragmenter(std::size_t max_subchunk_size)
    : max_subchunk_size_(max_subchunk_size) {
    if (max_subchunk_size_ == 0 || max_subchunk_size_ > kMaxTransportMessageSize) {
        throw std::invalid_argument("max sub-chunk size must be between 1 and " +
                                    std::to_string(kMaxTransportMessageSize));
    }
}

std::vector<FramePart> Fragmenter::split(std::span<const std::uint8_t> payload, std::int64_t frame_number) const {
    if (!is_valid_frame_number(frame_number)) {
        throw std::invalid_argument("frame number out of range: " + std::to_string(frame_number));
    }

    std::vector<FramePart> parts;
    if (payload.size() <= max_subchunk_size_) {
        parts.push_back(FramePart{pack_frame_tag(FrameTag{frame_number, 0, 0}), 0, payload.size()});
        return parts;
    }

    const auto total = (payload.size() + max_subchunk_size_ - 1) / max_subchunk_size_;
    if (total > kMaxPartsPerFrame) {
        throw std::length_error("payload of " + std::to_string(payload.size()) + " bytes needs " +
                                std::to_string(total) + " parts; at most " +
                                std::to_string(kMaxPartsPerFrame) + " are allowed");
    }

    parts.reserve(total);
    for (std::size_t index = 0; index < total; ++index) {
        const auto offset = index * max_subchunk_size_;
        const auto length = std::min(max_subchunk_size_, payload.size() - offset);
        const FrameTag tag{frame_number, static_cast<std::uint32_t>(index), static_cast<std::uint32_t>(total)};
        parts.push_back(FramePart{pack_frame_tag(tag), offset, length});
    }
    return parts;
}

std::size_t Fragmenter::send(BroadcastChannel& channel,
                             std::span<const std::uint8_t> payload,
                             std::int64_t frame_number) const {
    const auto parts = split(payload, frame_number);
    for (const auto& part : parts) {
        channel.send(payload.subspan(part.offset, part.length), part.tag);
    }
    return parts.size();
}

std::size_t Reassembler::FrameKeyHash::operator()(const FrameKey& key) const noexcept {
    const auto a = std::hash<std::string>{}(key.sender);
    const auto b = std::hash<std::int64_t>{}(key.frame_number);
    return a ^ (b + 0x9e3779b97f4a7c15ULL + (a << 6) + (a >> 2));
}

Reassembler::Reassembler(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

std::optional<ReassembledFrame> Reassembler::accept(const PeerId& sender,
                                                    std::int64_t tag,
                                                    Bytes bytes,
                                                    Timestamp arrival) {
    const auto decoded = unpack_frame_tag(tag);
    if (!decoded.has_value() || (!decoded->single_part() && decoded->part_number >= decoded->total_parts)) {
        ++statistics_.malformed_parts;
        log_event(StructuredLogger::Level::Warning,
                  "fragment.part.malformed",
                  {{"peer", short_peer_id(sender)}, {"tag", std::to_string(tag)}});
        return std::nullopt;
    }

    sweep(arrival);

    if (decoded->single_part()) {
        return ReassembledFrame{sender, decoded->frame_number, std::move(bytes), arrival, 1};
    }

    FrameKey key{sender, decoded->frame_number};
    if (recently_completed_.contains(key)) {
        ++statistics_.duplicates_ignored;
        return std::nullopt;
    }

    auto [it, created] = pending_.try_emplace(key);
    auto& frame = it->second;
    if (created) {
        frame.created = arrival;
    }
    frame.total_parts = std::max(frame.total_parts, decoded->total_parts);
    frame.parts.insert_or_assign(decoded->part_number, std::move(bytes));

    if (frame.parts.size() < frame.total_parts) {
        return std::nullopt;
    }

    auto result = assemble(key, frame);
    pending_.erase(it);
    if (result.has_value()) {
        recently_completed_.emplace(std::move(key), result->first_arrival);
    }
    return result;
}

std::optional<ReassembledFrame> Reassembler::assemble(const FrameKey& key, PendingFrame& frame) {
    std::size_t total_size = 0;
    for (std::uint32_t index = 0; index < frame.total_parts; ++index) {
        const auto part = frame.parts.find(index);
        if (part == frame.parts.end()) {
            ++statistics_.frames_incomplete;
            log_event(StructuredLogger::Level::Warning,
                      "fragment.frame.incomplete",
                      {{"peer", short_peer_id(key.sender)},
                       {"frame", std::to_string(key.frame_number)},
                       {"missing_part", std::to_string(index)},
                       {"total_parts", std::to_string(frame.total_parts)}});
            return std::nullopt;
        }
        total_size += part->second.size();
    }

    Bytes payload;
    payload.reserve(total_size);
    for (std::uint32_t index = 0; index < frame.total_parts; ++index) {
        const auto& part = frame.parts.at(index);
        payload.insert(payload.end(), part.begin(), part.end());
    }
    ++statistics_.frames_completed;
    return ReassembledFrame{key.sender, key.frame_number, std::move(payload), frame.created, frame.total_parts};
}

std::size_t Reassembler::sweep(Timestamp now) {
    std::size_t dropped = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (now - it->second.created > timeout_) {
            ++statistics_.frames_expired;
            ++dropped;
            log_event(StructuredLogger::Level::Warning,
                      "fragment.frame.expired",
                      {{"peer", short_peer_id(it->first.sender)},
                       {"frame", std::to_string(it->first.frame_number)},
                       {"received_parts", std::to_string(it->second.parts.size())},
                       {"total_parts", std::to_string(it->second.total_parts)}});
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
    std::erase_if(recently_completed_, [&](const auto& entry) {
        return now - entry.second > timeout_;
    });
    return dropped;
}

void Reassembler::clear() {
    pending_.clear();
    recently_completed_.clear();
}

}  // namespace meshcast::transport
