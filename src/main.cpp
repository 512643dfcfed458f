#include "meshcast/Config.hpp"
#include "meshcast/Error.hpp"
#include "meshcast/Types.hpp"
#include "meshcast/config/ConfigLoader.hpp"
#include "meshcast/exchange/PlaybackPolicy.hpp"
#include "meshcast/logging/StructuredLogger.hpp"
#include "meshcast/media/SourceLoader.hpp"
#include "meshcast/session/FileSessions.hpp"
#include "meshcast/session/LiveSession.hpp"
#include "meshcast/session/StreamNode.hpp"
#include "meshcast/signaling/SimulatedNegotiationEngine.hpp"
#include "meshcast/transport/Fragmenter.hpp"
#include "meshcast/transport/LoopbackHub.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

constexpr std::string_view kMeshcastVersion = "0.1.0";

struct GlobalOptions {
    std::optional<std::string> config_path{};
    std::optional<std::string> profile_name{};
    std::optional<std::string> log_level{};
    bool quiet{false};
};

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& code() const& {
        return code_;
    }

    const std::string& message() const& {
        return message_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

void print_cli_error(const CliException& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

void print_usage() {
    std::cout << "meshcast CLI" << std::endl;
    std::cout << "Usage: meshcast [options] <command> [args]\n\n";
    std::cout << "Global options:\n"
              << "  --config <path>           JSON configuration file\n"
              << "  --profile <name>          Profile to apply from the configuration file\n"
              << "  --log-level <level>       debug, info, warning or error\n"
              << "  --quiet                   Disable structured logging\n"
              << "  --help, -h                Show this help\n"
              << "  --version                 Show the version\n\n";
    std::cout << "Commands:\n"
              << "  simulate-file <path|url> [--viewers <n>] [--loss <0..1>] [--interval <ms>]\n"
              << "                [--timeout <sec>] [--out <file>]\n"
              << "                           Share a file over an in-process stream and report progress\n"
              << "  simulate-live [--viewers <n>] [--frames <n>] [--revoke-tracks] [--timeout <sec>]\n"
              << "                           Negotiate simulated peer connections with every viewer\n"
              << "  defaults                  Print the effective configuration as JSON\n"
              << "  fragment <bytes> <frame>  Show how a payload of <bytes> is tagged and split\n";
}

bool parse_uint64(std::string_view text, std::uint64_t& value) {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, value);
    return result.ec == std::errc{} && result.ptr == end;
}

bool parse_int64(std::string_view text, std::int64_t& value) {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, value);
    return result.ec == std::errc{} && result.ptr == end;
}

bool parse_probability(std::string_view text, double& value) {
    try {
        std::size_t consumed = 0;
        const std::string copy(text);
        value = std::stod(copy, &consumed);
        return consumed == copy.size() && value >= 0.0 && value < 1.0;
    } catch (const std::exception&) {
        return false;
    }
}

std::string format_bytes(std::size_t bytes) {
    constexpr std::array<const char*, 4> kUnits{"B", "KiB", "MiB", "GiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit_index = 0;
    while (value >= 1024.0 && unit_index + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit_index;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit_index == 0 ? 0 : 1) << value << ' ' << kUnits[unit_index];
    return oss.str();
}

meshcast::Config load_effective_config(const GlobalOptions& options) {
    meshcast::Config config;
    if (options.config_path) {
        config = meshcast::config::load_config(*options.config_path, options.profile_name);
    } else if (options.profile_name) {
        throw_cli_error("E_CONFIG_PROFILE",
                        "--profile requires --config",
                        "Pass the configuration file that defines the profile");
    }
    if (options.log_level) {
        if (!meshcast::logging::StructuredLogger::parse_level(*options.log_level)) {
            throw_cli_error("E_INVALID_LOG_LEVEL",
                            "Unknown log level: " + *options.log_level,
                            "Use debug, info, warning or error");
        }
        config.log_level = *options.log_level;
    }
    if (options.quiet) {
        config.logging_enabled = false;
    }
    return config;
}

void configure_logging(const meshcast::Config& config) {
    auto& logger = meshcast::logging::StructuredLogger::instance();
    logger.set_enabled(config.logging_enabled);
    if (auto level = meshcast::logging::StructuredLogger::parse_level(config.log_level)) {
        logger.set_min_level(*level);
    }
}

// Remembers what the player was handed.
class RecordingSink : public meshcast::exchange::PlaybackSink {
public:
    void play(const meshcast::exchange::PlaybackRequest& request) override {
        std::scoped_lock lock(mutex_);
        if (request.complete) {
            ++complete_plays_;
        } else {
            ++progressive_plays_;
        }
    }

    std::size_t complete_plays() const {
        std::scoped_lock lock(mutex_);
        return complete_plays_;
    }

    std::size_t progressive_plays() const {
        std::scoped_lock lock(mutex_);
        return progressive_plays_;
    }

private:
    std::size_t complete_plays_{0};
    std::size_t progressive_plays_{0};
    mutable std::mutex mutex_;
};

void install_loss(const std::shared_ptr<meshcast::transport::LoopbackHub>& hub, double loss) {
    if (loss <= 0.0) {
        return;
    }
    struct LossState {
        std::mt19937_64 generator{std::random_device{}()};
        std::uniform_real_distribution<double> distribution{0.0, 1.0};
        std::mutex mutex;
    };
    auto state = std::make_shared<LossState>();
    meshcast::transport::LoopbackHub::TestHooks hooks;
    hooks.drop = [state, loss](const meshcast::PeerId&, const meshcast::PeerId&, std::int64_t) {
        std::scoped_lock lock(state->mutex);
        return state->distribution(state->generator) < loss;
    };
    hub->set_test_hooks(std::move(hooks));
}

int run_simulate_file(const meshcast::Config& base_config, const std::vector<std::string_view>& args) {
    std::optional<std::string> source_uri;
    std::uint64_t viewers = 2;
    double loss = 0.0;
    std::uint64_t timeout_seconds = 60;
    std::optional<std::string> out_path;
    meshcast::Config config = base_config;

    std::size_t index = 0;
    auto require_value = [&](std::string_view option) -> std::string {
        if (index >= args.size()) {
            throw_cli_error("E_MISSING_VALUE",
                            std::string(option) + " requires a value",
                            "Provide an argument immediately after " + std::string(option));
        }
        return std::string(args[index++]);
    };

    while (index < args.size()) {
        const auto arg = args[index++];
        if (arg == "--viewers") {
            const auto value = require_value(arg);
            if (!parse_uint64(value, viewers) || viewers == 0 || viewers > 64) {
                throw_cli_error("E_INVALID_VIEWERS", "--viewers must be between 1 and 64", "For example: --viewers 3");
            }
            continue;
        }
        if (arg == "--loss") {
            const auto value = require_value(arg);
            if (!parse_probability(value, loss)) {
                throw_cli_error("E_INVALID_LOSS", "--loss must be a probability in [0, 1)", "For example: --loss 0.1");
            }
            continue;
        }
        if (arg == "--interval") {
            const auto value = require_value(arg);
            std::uint64_t interval{};
            if (!parse_uint64(value, interval) || interval > 60000) {
                throw_cli_error("E_INVALID_INTERVAL", "--interval must be between 0 and 60000 milliseconds");
            }
            config.broadcast_chunk_interval = std::chrono::milliseconds(interval);
            continue;
        }
        if (arg == "--timeout") {
            const auto value = require_value(arg);
            if (!parse_uint64(value, timeout_seconds) || timeout_seconds == 0) {
                throw_cli_error("E_INVALID_TIMEOUT", "--timeout must be a positive number of seconds");
            }
            continue;
        }
        if (arg == "--out") {
            out_path = require_value(arg);
            continue;
        }
        if (arg.starts_with("-")) {
            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option for simulate-file: " + std::string(arg),
                            "Run 'meshcast --help' for usage");
        }
        if (source_uri) {
            throw_cli_error("E_UNEXPECTED_ARGUMENT", "simulate-file takes a single source");
        }
        source_uri = std::string(arg);
    }
    if (!source_uri) {
        throw_cli_error("E_MISSING_SOURCE",
                        "simulate-file requires a source path or URL",
                        "Usage: meshcast simulate-file <path|url>");
    }

    auto source = meshcast::media::load_source(*source_uri);
    const auto source_bytes = source.data.size();

    auto hub = meshcast::transport::LoopbackHub::make();
    install_loss(hub, loss);

    meshcast::session::StreamNode broadcaster_node(hub, config);
    auto channel = broadcaster_node.create_stream(source.name);
    auto broadcaster =
        std::make_unique<meshcast::session::FileBroadcastSession>(std::move(channel), config, std::move(source));
    const auto metadata = broadcaster->prepare();
    const auto ticket = broadcaster->ticket();
    broadcaster->start();

    std::cout << "Broadcasting " << metadata.file_name << " (" << format_bytes(metadata.file_size) << ", "
              << metadata.total_chunks << " chunks, " << metadata.mime_type << ")" << std::endl;
    std::cout << "Ticket: " << ticket << std::endl;

    std::vector<std::unique_ptr<meshcast::session::StreamNode>> viewer_nodes;
    std::vector<std::unique_ptr<RecordingSink>> sinks;
    std::vector<std::unique_ptr<meshcast::session::FileViewerSession>> viewers_sessions;
    for (std::uint64_t i = 0; i < viewers; ++i) {
        auto node = std::make_unique<meshcast::session::StreamNode>(hub, config);
        auto sink = std::make_unique<RecordingSink>();
        auto session = std::make_unique<meshcast::session::FileViewerSession>(
            node->join_stream(ticket, "viewer-" + std::to_string(i + 1)), config, sink.get());
        session->start();
        viewer_nodes.push_back(std::move(node));
        sinks.push_back(std::move(sink));
        viewers_sessions.push_back(std::move(session));
    }

    const auto deadline = meshcast::Clock::now() + std::chrono::seconds(timeout_seconds);
    bool all_complete = false;
    while (meshcast::Clock::now() < deadline) {
        all_complete = std::all_of(viewers_sessions.begin(), viewers_sessions.end(), [](const auto& session) {
            return session->is_complete();
        });
        if (all_complete) {
            break;
        }
        std::this_thread::sleep_for(50ms);
    }

    for (std::size_t i = 0; i < viewers_sessions.size(); ++i) {
        const auto progress = viewers_sessions[i]->progress();
        std::cout << "viewer-" << (i + 1) << ": " << progress.received << "/" << progress.total << " chunks ("
                  << std::fixed << std::setprecision(1) << progress.percent << "%)"
                  << " plays=" << sinks[i]->complete_plays()
                  << " progressive=" << sinks[i]->progressive_plays() << std::endl;
    }
    std::cout << "broadcaster: sent=" << broadcaster->chunks_sent()
              << " re-sent=" << broadcaster->requests_served() << std::endl;

    if (all_complete && out_path) {
        auto assembled = viewers_sessions.front()->assemble();
        if (!assembled || assembled->size() != source_bytes) {
            throw_cli_error("E_ASSEMBLY_FAILED", "Viewer could not assemble the file");
        }
        std::ofstream out(*out_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw_cli_error("E_OUTPUT_WRITE", "Unable to open output file: " + *out_path);
        }
        out.write(reinterpret_cast<const char*>(assembled->data()), static_cast<std::streamsize>(assembled->size()));
        if (!out) {
            throw_cli_error("E_OUTPUT_WRITE", "Failed writing output file: " + *out_path);
        }
        std::cout << "Wrote " << format_bytes(assembled->size()) << " to " << *out_path << std::endl;
    }

    for (auto& session : viewers_sessions) {
        session->stop();
    }
    broadcaster->stop();
    hub->shutdown();

    if (!all_complete) {
        throw_cli_error("E_SIMULATION_INCOMPLETE",
                        "Not every viewer received the whole file before the timeout",
                        "Increase --timeout or lower --loss");
    }
    std::cout << "All " << viewers << " viewer(s) completed" << std::endl;
    return 0;
}

int run_simulate_live(const meshcast::Config& config, const std::vector<std::string_view>& args) {
    std::uint64_t viewers = 2;
    std::uint64_t frames = 3;
    std::uint64_t timeout_seconds = 10;
    bool revoke_tracks = false;

    std::size_t index = 0;
    auto require_value = [&](std::string_view option) -> std::string {
        if (index >= args.size()) {
            throw_cli_error("E_MISSING_VALUE",
                            std::string(option) + " requires a value",
                            "Provide an argument immediately after " + std::string(option));
        }
        return std::string(args[index++]);
    };

    while (index < args.size()) {
        const auto arg = args[index++];
        if (arg == "--viewers") {
            const auto value = require_value(arg);
            if (!parse_uint64(value, viewers) || viewers == 0 || viewers > 64) {
                throw_cli_error("E_INVALID_VIEWERS", "--viewers must be between 1 and 64", "For example: --viewers 3");
            }
            continue;
        }
        if (arg == "--frames") {
            const auto value = require_value(arg);
            if (!parse_uint64(value, frames) || frames > 1000) {
                throw_cli_error("E_INVALID_FRAMES", "--frames must be between 0 and 1000");
            }
            continue;
        }
        if (arg == "--timeout") {
            const auto value = require_value(arg);
            if (!parse_uint64(value, timeout_seconds) || timeout_seconds == 0) {
                throw_cli_error("E_INVALID_TIMEOUT", "--timeout must be a positive number of seconds");
            }
            continue;
        }
        if (arg == "--revoke-tracks") {
            revoke_tracks = true;
            continue;
        }
        throw_cli_error("E_UNKNOWN_OPTION",
                        "Unknown option for simulate-live: " + std::string(arg),
                        "Run 'meshcast --help' for usage");
    }

    auto hub = meshcast::transport::LoopbackHub::make();
    meshcast::signaling::SimulatedMediaSource media(revoke_tracks ? 0 : 2);

    meshcast::session::StreamNode broadcaster_node(hub, config);
    const auto broadcaster_id = broadcaster_node.id();
    auto broadcaster = std::make_unique<meshcast::session::LiveSession>(
        broadcaster_node.create_stream("live"),
        config,
        std::make_unique<meshcast::signaling::SimulatedNegotiationEngine>(broadcaster_id),
        &media);
    const auto ticket = broadcaster->ticket();
    broadcaster->start();
    std::cout << "Live stream ticket: " << ticket << std::endl;

    std::atomic<std::uint64_t> frames_received{0};
    std::vector<std::unique_ptr<meshcast::session::StreamNode>> viewer_nodes;
    std::vector<std::unique_ptr<meshcast::session::LiveSession>> viewer_sessions;
    for (std::uint64_t i = 0; i < viewers; ++i) {
        auto node = std::make_unique<meshcast::session::StreamNode>(hub, config);
        auto session = std::make_unique<meshcast::session::LiveSession>(
            node->join_stream(ticket, "viewer-" + std::to_string(i + 1)),
            config,
            std::make_unique<meshcast::signaling::SimulatedNegotiationEngine>(node->id()));
        session->set_media_observer([&frames_received](const meshcast::transport::MediaFrame&) {
            frames_received.fetch_add(1);
        });
        session->start();
        viewer_nodes.push_back(std::move(node));
        viewer_sessions.push_back(std::move(session));
    }

    auto connected_count = [&]() {
        return static_cast<std::uint64_t>(std::count_if(
            viewer_sessions.begin(), viewer_sessions.end(), [&](const auto& session) {
                return session->phase(broadcaster_id) == meshcast::signaling::PeerPhase::Connected;
            }));
    };

    const auto deadline = meshcast::Clock::now() + std::chrono::seconds(timeout_seconds);
    while (meshcast::Clock::now() < deadline && connected_count() < viewers) {
        std::this_thread::sleep_for(50ms);
    }
    const auto connected = connected_count();

    if (connected == viewers && frames > 0) {
        const std::array<std::uint8_t, 4> segment{0x1a, 0x45, 0xdf, 0xa3};
        for (std::uint64_t i = 0; i < frames; ++i) {
            broadcaster->send_media_frame(segment);
        }
        const auto expected = frames * viewers;
        const auto frame_deadline = meshcast::Clock::now() + 2s;
        while (frames_received.load() < expected && meshcast::Clock::now() < frame_deadline) {
            std::this_thread::sleep_for(20ms);
        }
    }

    for (std::size_t i = 0; i < viewer_sessions.size(); ++i) {
        const auto snapshot = viewer_sessions[i]->snapshot();
        std::cout << "viewer-" << (i + 1) << ": "
                  << meshcast::signaling::peer_phase_to_string(viewer_sessions[i]->phase(broadcaster_id))
                  << " offer-requests=" << snapshot.offer_request_attempts << std::endl;
    }
    std::cout << "connected=" << connected << "/" << viewers << " media-frames=" << frames_received.load() << std::endl;

    for (auto& session : viewer_sessions) {
        session->stop();
    }
    broadcaster->stop();
    hub->shutdown();

    if (revoke_tracks) {
        if (connected != 0) {
            throw_cli_error("E_SIMULATION_UNEXPECTED", "Viewers connected although the capture had no live tracks");
        }
        std::cout << "Offer requests were ignored: capture has no live tracks" << std::endl;
        return 0;
    }
    if (connected != viewers) {
        throw_cli_error("E_SIMULATION_INCOMPLETE",
                        "Not every viewer connected before the timeout",
                        "Increase --timeout");
    }
    return 0;
}

int run_defaults(const meshcast::Config& config, const std::vector<std::string_view>& args) {
    if (!args.empty()) {
        throw_cli_error("E_UNEXPECTED_ARGUMENT", "defaults takes no arguments");
    }
    std::cout << meshcast::config::describe_config(config) << std::endl;
    return 0;
}

int run_fragment(const meshcast::Config& config, const std::vector<std::string_view>& args) {
    if (args.size() != 2) {
        throw_cli_error("E_MISSING_VALUE",
                        "fragment requires <bytes> and <frame>",
                        "Usage: meshcast fragment 120000 7");
    }
    std::uint64_t size{};
    if (!parse_uint64(args[0], size)) {
        throw_cli_error("E_INVALID_SIZE", "<bytes> must be an unsigned integer");
    }
    std::int64_t frame{};
    if (!parse_int64(args[1], frame) || !meshcast::transport::is_valid_frame_number(frame)) {
        throw_cli_error("E_INVALID_FRAME",
                        "<frame> must be between 0 and " + std::to_string(meshcast::transport::kMaxFrameNumber));
    }

    const meshcast::transport::Fragmenter fragmenter(config.max_subchunk_size);
    if (size > fragmenter.max_payload_size()) {
        throw_cli_error("E_PAYLOAD_TOO_LARGE",
                        "Payload needs more than " + std::to_string(meshcast::transport::kMaxPartsPerFrame) + " parts",
                        "At most " + std::to_string(fragmenter.max_payload_size()) + " bytes fit in one frame");
    }
    const meshcast::Bytes payload(static_cast<std::size_t>(size));
    const auto parts = fragmenter.split(payload, frame);
    std::cout << "frame " << frame << ": " << parts.size() << " part(s) of at most "
              << config.max_subchunk_size << " bytes" << std::endl;
    for (const auto& part : parts) {
        const auto tag = meshcast::transport::unpack_frame_tag(part.tag);
        std::cout << "  tag=" << part.tag;
        if (tag) {
            std::cout << " part=" << tag->part_number << " total=" << tag->total_parts;
        }
        std::cout << " offset=" << part.offset << " length=" << part.length << std::endl;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        GlobalOptions options{};
        std::size_t index = 0;

        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return std::string(args[index++]);
        };

        std::optional<std::string> command;
        while (index < args.size()) {
            if (!args[index].starts_with("-")) {
                command = std::string(args[index++]);
                break;
            }
            const auto opt = args[index++];
            if (opt == "--help" || opt == "-h") {
                print_usage();
                return 0;
            }
            if (opt == "--version") {
                std::cout << "meshcast " << kMeshcastVersion << std::endl;
                return 0;
            }
            if (opt == "--config") {
                if (options.config_path.has_value()) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --config specified multiple times",
                                    "Provide the configuration file only once");
                }
                options.config_path = require_value(opt);
                continue;
            }
            if (opt == "--profile") {
                if (options.profile_name.has_value()) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --profile specified multiple times",
                                    "Select a single profile");
                }
                options.profile_name = require_value(opt);
                continue;
            }
            if (opt == "--log-level") {
                options.log_level = require_value(opt);
                continue;
            }
            if (opt == "--quiet") {
                options.quiet = true;
                continue;
            }
            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option: " + std::string(opt),
                            "Run 'meshcast --help' to see the list of available options");
        }

        if (!command) {
            print_usage();
            return 1;
        }

        const std::vector<std::string_view> command_args(args.begin() + static_cast<std::ptrdiff_t>(index), args.end());

        meshcast::Config config;
        try {
            config = load_effective_config(options);
        } catch (const meshcast::ConfigError& ex) {
            throw_cli_error(ex.code(), ex.message(), ex.hint());
        }
        configure_logging(config);

        try {
            if (*command == "simulate-file") {
                return run_simulate_file(config, command_args);
            }
            if (*command == "simulate-live") {
                return run_simulate_live(config, command_args);
            }
            if (*command == "defaults") {
                return run_defaults(config, command_args);
            }
            if (*command == "fragment") {
                return run_fragment(config, command_args);
            }
        } catch (const meshcast::Error& ex) {
            throw_cli_error(ex.code(), ex.message(), ex.hint());
        }

        throw_cli_error("E_UNKNOWN_COMMAND",
                        "Unknown command: " + *command,
                        "Run 'meshcast --help' to see the list of available commands");
    } catch (const CliException& ex) {
        print_cli_error(ex);
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "[E_UNEXPECTED] " << ex.what() << std::endl;
        return 1;
    }
}
