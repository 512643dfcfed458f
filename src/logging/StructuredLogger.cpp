#include "meshcast/logging/StructuredLogger.hpp"

#include "meshcast/protocol/Json.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace meshcast::logging {

namespace {

int severity(StructuredLogger::Level level) {
    return static_cast<int>(level);
}

}  // namespace

StructuredLogger& StructuredLogger::instance() {
    static StructuredLogger logger;
    return logger;
}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    std::scoped_lock lock(mutex_);
    if (!enabled_ || severity(level) < severity(min_level_)) {
        return;
    }

    protocol::JsonWriter writer;
    writer.begin_object();
    writer.field("ts", format_timestamp());
    writer.field("level", level_to_string(level));
    writer.field("event", event);
    if (!fields.empty()) {
        writer.key("fields");
        writer.begin_object();
        for (const auto& [key, value] : fields) {
            writer.field(key, value);
        }
        writer.end_object();
    }
    writer.end_object();

    if (sink_) {
        sink_(level, writer.str());
        return;
    }
    std::clog << writer.str() << '\n';
    std::clog.flush();
}

void StructuredLogger::set_enabled(bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
}

bool StructuredLogger::enabled() const noexcept {
    std::scoped_lock lock(mutex_);
    return enabled_;
}

void StructuredLogger::set_min_level(Level level) {
    std::scoped_lock lock(mutex_);
    min_level_ = level;
}

StructuredLogger::Level StructuredLogger::min_level() const noexcept {
    std::scoped_lock lock(mutex_);
    return min_level_;
}

void StructuredLogger::set_sink(Sink sink) {
    std::scoped_lock lock(mutex_);
    sink_ = std::move(sink);
}

std::optional<StructuredLogger::Level> StructuredLogger::parse_level(std::string_view text) {
    if (text == "debug") {
        return Level::Debug;
    }
    if (text == "info") {
        return Level::Info;
    }
    if (text == "warning" || text == "warn") {
        return Level::Warning;
    }
    if (text == "error") {
        return Level::Error;
    }
    return std::nullopt;
}

std::string StructuredLogger::level_to_string(Level level) {
    switch (level) {
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warning:
            return "warning";
        case Level::Error:
            return "error";
    }
    return "info";
}

std::string StructuredLogger::format_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto fractional = std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(seconds);

    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now_c);
#else
    gmtime_r(&now_c, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << fractional << 'Z';
    return oss.str();
}

}  // namespace meshcast::logging
