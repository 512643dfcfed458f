#include "meshcast/Types.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace meshcast {

namespace {
std::string to_hex(const std::uint8_t value) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setw(2) << std::setfill('0') << static_cast<int>(value);
    return oss.str();
}

constexpr std::size_t kPeerIdBytes = 32;
}  // namespace

std::string random_hex(std::mt19937_64& generator, std::size_t byte_count) {
    std::uniform_int_distribution<int> distribution(0, 0xFF);
    std::string text;
    text.reserve(byte_count * 2);
    for (std::size_t i = 0; i < byte_count; ++i) {
        text += to_hex(static_cast<std::uint8_t>(distribution(generator)));
    }
    return text;
}

PeerId random_peer_id() {
    std::random_device device;
    std::mt19937_64 generator((static_cast<std::uint64_t>(device()) << 32) ^ device());
    return random_hex(generator, kPeerIdBytes);
}

PeerId peer_id_from_seed(std::uint64_t seed) {
    std::mt19937_64 generator(seed);
    return random_hex(generator, kPeerIdBytes);
}

std::string short_peer_id(const PeerId& id) {
    return id.substr(0, 8);
}

bool is_valid_peer_id(const std::string& text) {
    if (text.empty() || text.size() > kPeerIdBytes * 2) {
        return false;
    }
    for (const unsigned char ch : text) {
        if (std::isxdigit(ch) == 0) {
            return false;
        }
    }
    return true;
}

std::uint64_t unix_time_ms() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

}  // namespace meshcast
