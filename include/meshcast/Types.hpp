#pragma once

#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace meshcast {

using PeerId = std::string;
using Bytes = std::vector<std::uint8_t>;
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;

PeerId random_peer_id();
PeerId peer_id_from_seed(std::uint64_t seed);
std::string short_peer_id(const PeerId& id);
bool is_valid_peer_id(const std::string& text);

std::string random_hex(std::mt19937_64& generator, std::size_t byte_count);

std::uint64_t unix_time_ms();

}  // namespace meshcast
