#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace meshcast::logging {

class StructuredLogger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;
    // Receives one fully formatted JSON line (without the trailing newline).
    using Sink = std::function<void(Level, const std::string&)>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    void set_min_level(Level level);
    [[nodiscard]] Level min_level() const noexcept;

    // Replaces std::clog as the destination; an empty sink restores it.
    void set_sink(Sink sink);

    static std::optional<Level> parse_level(std::string_view text);
    static std::string level_to_string(Level level);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string format_timestamp();

    bool enabled_{true};
    Level min_level_{Level::Info};
    Sink sink_;
    mutable std::mutex mutex_;
};

}  // namespace meshcast::logging
