#include "meshcast/config/ConfigLoader.hpp"

#include "meshcast/Error.hpp"
#include "meshcast/logging/StructuredLogger.hpp"
#include "meshcast/protocol/VideoMessage.hpp"
#include "meshcast/transport/BroadcastChannel.hpp"
#include "meshcast/transport/FrameTag.hpp"

#include <fstream>
#include <functional>
#include <iterator>
#include <limits>
#include <sstream>
#include <utility>
#include <vector>

namespace meshcast::config {

namespace {

using protocol::JsonValue;

std::size_t max_file_chunk_size(std::size_t max_subchunk_size) {
    const auto capacity = max_subchunk_size * transport::kMaxPartsPerFrame;
    if (capacity <= protocol::kChunkEnvelopeOverhead) {
        return 0;
    }
    return (capacity - protocol::kChunkEnvelopeOverhead) / 4;
}

struct Setting {
    std::string_view key;
    std::function<void(const JsonValue&, Config&)> apply;
};

std::int64_t require_integer(const JsonValue& value, std::string_view key, std::int64_t min, std::int64_t max) {
    if (!value.is_number() || !value.integer_value.has_value()) {
        throw ConfigError("E_CONFIG_VALUE", "'" + std::string(key) + "' must be an integer");
    }
    const auto number = *value.integer_value;
    if (number < min || number > max) {
        throw ConfigError("E_CONFIG_VALUE",
                          "'" + std::string(key) + "' is out of range",
                          "Expected a value between " + std::to_string(min) + " and " + std::to_string(max));
    }
    return number;
}

std::size_t require_count(const JsonValue& value, std::string_view key) {
    return static_cast<std::size_t>(require_integer(value, key, 1, std::numeric_limits<std::int32_t>::max()));
}

std::chrono::milliseconds require_duration(const JsonValue& value, std::string_view key) {
    return std::chrono::milliseconds(require_integer(value, key, 0, std::numeric_limits<std::int32_t>::max()));
}

std::string require_string(const JsonValue& value, std::string_view key) {
    if (!value.is_string()) {
        throw ConfigError("E_CONFIG_VALUE", "'" + std::string(key) + "' must be a string");
    }
    return value.string_value;
}

bool require_bool(const JsonValue& value, std::string_view key) {
    if (!value.is_bool()) {
        throw ConfigError("E_CONFIG_VALUE", "'" + std::string(key) + "' must be true or false");
    }
    return value.bool_value;
}

const std::vector<Setting>& settings_table() {
    static const std::vector<Setting> table{
        {"max_subchunk_size",
         [](const JsonValue& v, Config& c) {
             c.max_subchunk_size = static_cast<std::size_t>(
                 require_integer(v, "max_subchunk_size", 1, static_cast<std::int64_t>(transport::kMaxTransportMessageSize)));
         }},
        {"pending_frame_timeout_ms",
         [](const JsonValue& v, Config& c) { c.pending_frame_timeout = require_duration(v, "pending_frame_timeout_ms"); }},
        {"file_chunk_size",
         [](const JsonValue& v, Config& c) { c.file_chunk_size = require_count(v, "file_chunk_size"); }},
        {"broadcast_chunk_interval_ms",
         [](const JsonValue& v, Config& c) { c.broadcast_chunk_interval = require_duration(v, "broadcast_chunk_interval_ms"); }},
        {"viewer_request_batch",
         [](const JsonValue& v, Config& c) { c.viewer_request_batch = require_count(v, "viewer_request_batch"); }},
        {"viewer_request_interval_ms",
         [](const JsonValue& v, Config& c) { c.viewer_request_interval = require_duration(v, "viewer_request_interval_ms"); }},
        {"viewer_initial_request_delay_ms",
         [](const JsonValue& v, Config& c) {
             c.viewer_initial_request_delay = require_duration(v, "viewer_initial_request_delay_ms");
         }},
        {"metadata_request_interval_ms",
         [](const JsonValue& v, Config& c) { c.metadata_request_interval = require_duration(v, "metadata_request_interval_ms"); }},
        {"metadata_request_limit",
         [](const JsonValue& v, Config& c) { c.metadata_request_limit = require_count(v, "metadata_request_limit"); }},
        {"availability_announce_every",
         [](const JsonValue& v, Config& c) { c.availability_announce_every = require_count(v, "availability_announce_every"); }},
        {"relay_frame_offset",
         [](const JsonValue& v, Config& c) {
             c.relay_frame_offset = require_integer(v, "relay_frame_offset", 1, std::numeric_limits<std::int32_t>::max());
         }},
        {"progressive_mime_markers",
         [](const JsonValue& v, Config& c) {
             if (!v.is_array()) {
                 throw ConfigError("E_CONFIG_VALUE", "'progressive_mime_markers' must be a list of strings");
             }
             std::vector<std::string> markers;
             for (const auto& entry : v.array_value) {
                 markers.push_back(require_string(entry, "progressive_mime_markers"));
             }
             c.playback.progressive_mime_markers = std::move(markers);
         }},
        {"progressive_threshold_percent",
         [](const JsonValue& v, Config& c) {
             if (!v.is_number() || v.number_value < 0.0 || v.number_value > 100.0) {
                 throw ConfigError("E_CONFIG_VALUE", "'progressive_threshold_percent' must be a number between 0 and 100");
             }
             c.playback.progressive_threshold_percent = v.number_value;
         }},
        {"offer_retry_interval_ms",
         [](const JsonValue& v, Config& c) { c.offer_retry_interval = require_duration(v, "offer_retry_interval_ms"); }},
        {"offer_retry_limit",
         [](const JsonValue& v, Config& c) { c.offer_retry_limit = require_count(v, "offer_retry_limit"); }},
        {"presence_interval_ms",
         [](const JsonValue& v, Config& c) { c.presence_interval = require_duration(v, "presence_interval_ms"); }},
        {"join_timeout_ms",
         [](const JsonValue& v, Config& c) { c.join_timeout = require_duration(v, "join_timeout_ms"); }},
        {"poll_interval_ms",
         [](const JsonValue& v, Config& c) { c.poll_interval = require_duration(v, "poll_interval_ms"); }},
        {"display_name",
         [](const JsonValue& v, Config& c) { c.display_name = require_string(v, "display_name"); }},
        {"log_level",
         [](const JsonValue& v, Config& c) {
             auto level = require_string(v, "log_level");
             if (!logging::StructuredLogger::parse_level(level)) {
                 throw ConfigError("E_CONFIG_VALUE", "Unknown log level: " + level, "Use debug, info, warning or error");
             }
             c.log_level = std::move(level);
         }},
        {"logging_enabled",
         [](const JsonValue& v, Config& c) { c.logging_enabled = require_bool(v, "logging_enabled"); }},
    };
    return table;
}

JsonValue remove_key(const JsonValue& object, std::string_view key) {
    JsonValue filtered;
    filtered.type = protocol::JsonType::Object;
    for (const auto& [k, v] : object.object_value) {
        if (k != key) {
            filtered.object_value.emplace_back(k, v);
        }
    }
    return filtered;
}

JsonValue merge_objects(JsonValue base, const JsonValue& overlay) {
    for (const auto& [key, value] : overlay.object_value) {
        bool replaced = false;
        for (auto& entry : base.object_value) {
            if (entry.first == key) {
                entry.second = value;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            base.object_value.emplace_back(key, value);
        }
    }
    return base;
}

JsonValue resolve_profile(const JsonValue& profiles, const std::string& name, std::set<std::string>& visiting) {
    if (!profiles.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "'profiles' section must be a mapping");
    }
    const auto* profile = profiles.find(name);
    if (!profile) {
        std::string names;
        for (const auto& [candidate, _] : profiles.object_value) {
            if (!names.empty()) {
                names += ", ";
            }
            names += candidate;
        }
        throw ConfigError("E_CONFIG_PROFILE",
                          "Profile not found: " + name,
                          "Available profiles: " + (names.empty() ? std::string{"<none>"} : names));
    }
    if (!profile->is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Profile must be a mapping: " + name);
    }
    if (visiting.contains(name)) {
        throw ConfigError("E_CONFIG_PROFILE", "Profile inheritance cycle detected at " + name);
    }
    visiting.insert(name);

    JsonValue result;
    result.type = protocol::JsonType::Object;
    if (const auto* extends = profile->find("extends")) {
        if (!extends->is_string()) {
            throw ConfigError("E_CONFIG_PROFILE", "'extends' must be a string in profile " + name);
        }
        result = resolve_profile(profiles, extends->string_value, visiting);
    }
    result = merge_objects(std::move(result), remove_key(*profile, "extends"));
    visiting.erase(name);
    return result;
}

}  // namespace

JsonValue resolve_profile(const JsonValue& profiles, const std::string& name) {
    std::set<std::string> visiting;
    return resolve_profile(profiles, name, visiting);
}

void apply_settings(const JsonValue& settings, Config& config) {
    if (!settings.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Settings must be a mapping");
    }
    for (const auto& [key, value] : settings.object_value) {
        bool known = false;
        for (const auto& setting : settings_table()) {
            if (setting.key == key) {
                setting.apply(value, config);
                known = true;
                break;
            }
        }
        if (!known) {
            throw ConfigError("E_CONFIG_KEY", "Unknown configuration key: " + key, "Run 'meshcast defaults' to list keys");
        }
    }
}

Config parse_config(std::string_view document, const std::optional<std::string>& profile) {
    JsonValue root;
    try {
        root = protocol::parse_json(document);
    } catch (const protocol::JsonError& ex) {
        throw ConfigError("E_CONFIG_PARSE", std::string("Configuration is not valid JSON: ") + ex.what());
    }
    if (!root.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be a mapping");
    }

    Config config;
    JsonValue top_level = remove_key(remove_key(root, "profiles"), "profile");
    apply_settings(top_level, config);

    std::optional<std::string> selected = profile;
    if (!selected) {
        if (const auto* default_profile = root.find("profile")) {
            if (!default_profile->is_string()) {
                throw ConfigError("E_CONFIG_PROFILE", "'profile' must be a string");
            }
            selected = default_profile->string_value;
        }
    }
    if (selected) {
        const auto* profiles = root.find("profiles");
        if (!profiles) {
            throw ConfigError("E_CONFIG_STRUCTURE",
                              "Profile '" + *selected + "' requested but the configuration has no 'profiles' section",
                              "Define the profile under 'profiles'");
        }
        apply_settings(resolve_profile(*profiles, *selected), config);
    }

    const auto frame_capacity = config.max_subchunk_size * transport::kMaxPartsPerFrame;
    if (protocol::max_encoded_chunk_size(config.file_chunk_size) > frame_capacity) {
        throw ConfigError("E_CONFIG_VALUE",
                          "'file_chunk_size' " + std::to_string(config.file_chunk_size) +
                              " does not fit in one frame of " + std::to_string(frame_capacity) + " bytes",
                          "Keep file_chunk_size at most " +
                              std::to_string(max_file_chunk_size(config.max_subchunk_size)) +
                              " or raise max_subchunk_size");
    }
    return config;
}

Config load_config(const std::filesystem::path& path, const std::optional<std::string>& profile) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND",
                          "Unable to open configuration file: " + path.string(),
                          "Check the --config path");
    }
    std::string document((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    return parse_config(document, profile);
}

std::string describe_config(const Config& config) {
    protocol::JsonWriter writer;
    writer.begin_object();
    writer.field("max_subchunk_size", static_cast<std::uint64_t>(config.max_subchunk_size));
    writer.field("pending_frame_timeout_ms", static_cast<std::int64_t>(config.pending_frame_timeout.count()));
    writer.field("file_chunk_size", static_cast<std::uint64_t>(config.file_chunk_size));
    writer.field("broadcast_chunk_interval_ms", static_cast<std::int64_t>(config.broadcast_chunk_interval.count()));
    writer.field("viewer_request_batch", static_cast<std::uint64_t>(config.viewer_request_batch));
    writer.field("viewer_request_interval_ms", static_cast<std::int64_t>(config.viewer_request_interval.count()));
    writer.field("viewer_initial_request_delay_ms",
                 static_cast<std::int64_t>(config.viewer_initial_request_delay.count()));
    writer.field("metadata_request_interval_ms", static_cast<std::int64_t>(config.metadata_request_interval.count()));
    writer.field("metadata_request_limit", static_cast<std::uint64_t>(config.metadata_request_limit));
    writer.field("availability_announce_every", static_cast<std::uint64_t>(config.availability_announce_every));
    writer.field("relay_frame_offset", config.relay_frame_offset);
    writer.key("progressive_mime_markers");
    writer.begin_array();
    for (const auto& marker : config.playback.progressive_mime_markers) {
        writer.value(marker);
    }
    writer.end_array();
    writer.field("progressive_threshold_percent", config.playback.progressive_threshold_percent);
    writer.field("offer_retry_interval_ms", static_cast<std::int64_t>(config.offer_retry_interval.count()));
    writer.field("offer_retry_limit", static_cast<std::uint64_t>(config.offer_retry_limit));
    writer.field("presence_interval_ms", static_cast<std::int64_t>(config.presence_interval.count()));
    writer.field("join_timeout_ms", static_cast<std::int64_t>(config.join_timeout.count()));
    writer.field("poll_interval_ms", static_cast<std::int64_t>(config.poll_interval.count()));
    writer.field("display_name", config.display_name);
    writer.field("log_level", config.log_level);
    writer.field("logging_enabled", config.logging_enabled);
    writer.end_object();
    return writer.take();
}

}  // namespace meshcast::config
