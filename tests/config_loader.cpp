#include "meshcast/Error.hpp"
#include "meshcast/config/ConfigLoader.hpp"
#include "meshcast/protocol/Json.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

using namespace std::chrono_literals;

using meshcast::Config;
using meshcast::config::parse_config;

namespace {

std::string expect_config_error(const std::string& document, const std::optional<std::string>& profile = std::nullopt) {
    try {
        parse_config(document, profile);
    } catch (const meshcast::ConfigError& error) {
        return error.code();
    }
    return {};
}

constexpr const char* kProfiles = R"({
    "display_name": "studio",
    "viewer_request_batch": 8,
    "profiles": {
        "base": {"offer_retry_limit": 4, "presence_interval_ms": 1000},
        "lan": {"extends": "base", "file_chunk_size": 32768, "presence_interval_ms": 250},
        "wan": {"extends": "lan", "progressive_mime_markers": ["webm", "matroska"], "display_name": "remote"}
    },
    "profile": "lan"
})";

void test_defaults_and_top_level() {
    const auto defaults = parse_config("{}");
    assert(defaults.max_subchunk_size == 55 * 1024);
    assert(defaults.file_chunk_size == 64 * 1024);
    assert(defaults.offer_retry_limit == 10);
    assert(defaults.offer_retry_interval == 2s);
    assert(defaults.relay_frame_offset == 100000);

    const auto config = parse_config(R"({"max_subchunk_size": 1024, "file_chunk_size": 16384, "join_timeout_ms": 1500, "logging_enabled": false})");
    assert(config.max_subchunk_size == 1024);
    assert(config.file_chunk_size == 16384);
    assert(config.join_timeout == 1500ms);
    assert(!config.logging_enabled);
}

void test_profiles() {
    // The document selects "lan".
    const auto lan = parse_config(kProfiles);
    assert(lan.display_name == "studio");
    assert(lan.viewer_request_batch == 8);
    assert(lan.offer_retry_limit == 4);
    assert(lan.file_chunk_size == 32768);
    assert(lan.presence_interval == 250ms);

    // An explicit profile wins over the document's choice.
    const auto wan = parse_config(kProfiles, std::string("wan"));
    assert(wan.display_name == "remote");
    assert(wan.offer_retry_limit == 4);
    assert((wan.playback.progressive_mime_markers == std::vector<std::string>{"webm", "matroska"}));

    const auto base = parse_config(kProfiles, std::string("base"));
    assert(base.presence_interval == 1000ms);
    assert(base.file_chunk_size == 64 * 1024);

    assert(expect_config_error(kProfiles, std::string("missing")) == "E_CONFIG_PROFILE");
    assert(expect_config_error(R"({"profile": "x"})") == "E_CONFIG_STRUCTURE");
    assert(expect_config_error(R"({"profiles": {"a": {"extends": "b"}, "b": {"extends": "a"}}})", std::string("a")) ==
           "E_CONFIG_PROFILE");
    assert(expect_config_error(R"({"profiles": {"a": {"extends": 3}}})", std::string("a")) == "E_CONFIG_PROFILE");
    assert(expect_config_error(R"({"profiles": {"a": 3}})", std::string("a")) == "E_CONFIG_STRUCTURE");
}

void test_invalid_documents() {
    assert(expect_config_error("{not json") == "E_CONFIG_PARSE");
    assert(expect_config_error("[1, 2]") == "E_CONFIG_STRUCTURE");
    assert(expect_config_error(R"({"chunk_size": 10})") == "E_CONFIG_KEY");
    assert(expect_config_error(R"({"file_chunk_size": 0})") == "E_CONFIG_VALUE");
    assert(expect_config_error(R"({"file_chunk_size": "big"})") == "E_CONFIG_VALUE");
    assert(expect_config_error(R"({"file_chunk_size": 1.5})") == "E_CONFIG_VALUE");
    assert(expect_config_error(R"({"max_subchunk_size": 70000})") == "E_CONFIG_VALUE");
    assert(expect_config_error(R"({"poll_interval_ms": -1})") == "E_CONFIG_VALUE");
}

void test_chunk_size_must_fit_one_frame() {
    // Encoded chunk bytes grow up to four times, so two million bytes cannot fit 99 parts of 55 KiB.
    assert(expect_config_error(R"({"file_chunk_size": 2000000})") == "E_CONFIG_VALUE");

    // The default chunk size no longer fits once subchunks shrink, unless a profile lowers it too.
    assert(expect_config_error(R"({"max_subchunk_size": 1024})") == "E_CONFIG_VALUE");
    assert(expect_config_error(R"({"max_subchunk_size": 1, "file_chunk_size": 1})") == "E_CONFIG_VALUE");
    const auto small = parse_config(R"({
        "max_subchunk_size": 1024,
        "profile": "small",
        "profiles": {"small": {"file_chunk_size": 8192}}
    })");
    assert(small.file_chunk_size == 8192);

    // The largest chunk that still fits the default subchunk size is accepted.
    const auto largest = parse_config(R"({"file_chunk_size": 1393792})");
    assert(largest.file_chunk_size == 1393792);
    assert(expect_config_error(R"({"file_chunk_size": 1393793})") == "E_CONFIG_VALUE");

    try {
        parse_config(R"({"file_chunk_size": 2000000})");
        assert(false);
    } catch (const meshcast::ConfigError& error) {
        assert(error.hint().find("1393792") != std::string::npos);
    }
    assert(expect_config_error(R"({"progressive_threshold_percent": 120})") == "E_CONFIG_VALUE");
    assert(expect_config_error(R"({"progressive_mime_markers": "webm"})") == "E_CONFIG_VALUE");
    assert(expect_config_error(R"({"log_level": "loud"})") == "E_CONFIG_VALUE");
    assert(expect_config_error(R"({"logging_enabled": "yes"})") == "E_CONFIG_VALUE");
}

void test_describe_round_trip() {
    Config config;
    config.display_name = "edge";
    config.poll_interval = 7ms;
    config.playback.progressive_threshold_percent = 25.5;
    const auto text = meshcast::config::describe_config(config);

    const auto document = meshcast::protocol::parse_json(text);
    assert(document.is_object());
    assert(document.string_field("display_name") == std::string("edge"));
    assert(document.integer_field("poll_interval_ms") == 7);

    const auto reloaded = parse_config(text);
    assert(reloaded.display_name == "edge");
    assert(reloaded.poll_interval == 7ms);
    assert(reloaded.playback.progressive_threshold_percent == 25.5);
    assert(reloaded.max_subchunk_size == config.max_subchunk_size);
    assert(reloaded.playback.progressive_mime_markers == config.playback.progressive_mime_markers);
}

void test_load_from_file() {
    const auto path = std::filesystem::temp_directory_path() / "meshcast_config_loader_test.json";
    {
        std::ofstream output(path);
        output << kProfiles;
    }
    const auto config = meshcast::config::load_config(path, std::string("wan"));
    assert(config.display_name == "remote");
    std::filesystem::remove(path);

    bool threw = false;
    try {
        meshcast::config::load_config(path);
    } catch (const meshcast::ConfigError& error) {
        threw = error.code() == "E_CONFIG_NOT_FOUND";
    }
    assert(threw);
}

}  // namespace

int main() {
    test_defaults_and_top_level();
    test_profiles();
    test_invalid_documents();
    test_chunk_size_must_fit_one_frame();
    test_describe_round_trip();
    test_load_from_file();
    return 0;
}
