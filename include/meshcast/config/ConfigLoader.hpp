#pragma once

#include "meshcast/Config.hpp"
#include "meshcast/protocol/Json.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace meshcast::config {

// Top-level keys override the defaults, then the selected profile (argument,
// else the document's "profile" key) is applied. Throws ConfigError.
Config load_config(const std::filesystem::path& path, const std::optional<std::string>& profile = std::nullopt);
Config parse_config(std::string_view document, const std::optional<std::string>& profile = std::nullopt);

// Flattens a profile and the chain it extends into one object.
protocol::JsonValue resolve_profile(const protocol::JsonValue& profiles, const std::string& name);

void apply_settings(const protocol::JsonValue& settings, Config& config);

// JSON rendering of every tunable, using the same keys the loader accepts.
std::string describe_config(const Config& config);

}  // namespace meshcast::config
