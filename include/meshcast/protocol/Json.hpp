#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace meshcast::protocol {

enum class JsonType { Null, Boolean, Number, String, Object, Array };

struct JsonValue {
    JsonType type{JsonType::Null};
    bool bool_value{false};
    double number_value{0.0};
    // Set when the literal had no fraction or exponent and fits in 64 bits.
    std::optional<std::int64_t> integer_value{};
    std::string string_value;
    std::vector<JsonValue> array_value;
    std::vector<std::pair<std::string, JsonValue>> object_value;

    bool is_null() const { return type == JsonType::Null; }
    bool is_object() const { return type == JsonType::Object; }
    bool is_array() const { return type == JsonType::Array; }
    bool is_string() const { return type == JsonType::String; }
    bool is_number() const { return type == JsonType::Number; }
    bool is_bool() const { return type == JsonType::Boolean; }

    const JsonValue* find(std::string_view key) const;

    std::optional<std::string> string_field(std::string_view key) const;
    std::optional<std::int64_t> integer_field(std::string_view key) const;
    std::optional<double> number_field(std::string_view key) const;
    std::optional<bool> bool_field(std::string_view key) const;
};

class JsonError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throws JsonError on malformed input.
JsonValue parse_json(std::string_view input);

// Streaming writer producing compact JSON. Commas are inserted automatically.
class JsonWriter {
public:
    void begin_object();
    void end_object();
    void begin_array();
    void end_array();
    void key(std::string_view name);

    void value(std::string_view text);
    void value(const char* text) { value(std::string_view(text)); }
    void value(std::int64_t number);
    void value(std::uint64_t number);
    void value(int number) { value(static_cast<std::int64_t>(number)); }
    void value(std::uint32_t number) { value(static_cast<std::uint64_t>(number)); }
    void value(double number);
    void value(bool flag);
    void null();

    template <typename T>
    void field(std::string_view name, const T& v) {
        key(name);
        value(v);
    }

    void byte_array_field(std::string_view name, std::span<const std::uint8_t> bytes);
    void index_array_field(std::string_view name, std::span<const std::uint32_t> indices);

    const std::string& str() const noexcept { return out_; }
    std::string take() { return std::move(out_); }

private:
    void separate();

    std::string out_;
    std::vector<bool> first_in_scope_;
    bool after_key_{false};
};

std::string escape_json(std::string_view value);

}  // namespace meshcast::protocol
