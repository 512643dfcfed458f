#include "meshcast/protocol/Json.hpp"

#include <cerrno>
#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace meshcast::protocol {

namespace {

// Guards against hostile nesting in wire messages.
constexpr std::size_t kMaxDepth = 64;

class JsonParser {
public:
    explicit JsonParser(std::string_view input) : input_(input) {}

    JsonValue parse() {
        skip_whitespace();
        JsonValue value = parse_value();
        skip_whitespace();
        if (!eof()) {
            throw JsonError("Unexpected trailing data after JSON document");
        }
        return value;
    }

private:
    JsonValue parse_value() {
        if (eof()) {
            throw JsonError("Unexpected end of JSON input");
        }
        const char ch = peek();
        if (ch == '"') {
            JsonValue value;
            value.type = JsonType::String;
            value.string_value = parse_string();
            return value;
        }
        if (ch == '{') {
            return parse_object();
        }
        if (ch == '[') {
            return parse_array();
        }
        if (ch == 't' || ch == 'f') {
            return parse_boolean();
        }
        if (ch == 'n') {
            return parse_null();
        }
        if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch)) != 0) {
            return parse_number();
        }
        throw JsonError("Invalid JSON token start");
    }

    JsonValue parse_object() {
        enter();
        JsonValue value;
        value.type = JsonType::Object;
        expect('{');
        skip_whitespace();
        if (match('}')) {
            leave();
            return value;
        }
        while (true) {
            skip_whitespace();
            if (eof() || peek() != '"') {
                throw JsonError("Expected string key in object");
            }
            std::string key = parse_string();
            skip_whitespace();
            expect(':');
            skip_whitespace();
            JsonValue child = parse_value();
            value.object_value.emplace_back(std::move(key), std::move(child));
            skip_whitespace();
            if (match('}')) {
                break;
            }
            expect(',');
        }
        leave();
        return value;
    }

    JsonValue parse_array() {
        enter();
        JsonValue value;
        value.type = JsonType::Array;
        expect('[');
        skip_whitespace();
        if (match(']')) {
            leave();
            return value;
        }
        while (true) {
            skip_whitespace();
            value.array_value.push_back(parse_value());
            skip_whitespace();
            if (match(']')) {
                break;
            }
            expect(',');
        }
        leave();
        return value;
    }

    JsonValue parse_boolean() {
        JsonValue value;
        value.type = JsonType::Boolean;
        if (match_literal("true")) {
            value.bool_value = true;
            return value;
        }
        if (match_literal("false")) {
            value.bool_value = false;
            return value;
        }
        throw JsonError("Invalid boolean literal");
    }

    JsonValue parse_null() {
        if (!match_literal("null")) {
            throw JsonError("Invalid null literal");
        }
        return JsonValue{};
    }

    JsonValue parse_number() {
        const std::size_t start = pos_;
        bool integral = true;
        match('-');
        if (match('0')) {
            // single zero allowed
        } else if (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
            skip_digits();
        } else {
            throw JsonError("Invalid number literal");
        }
        if (match('.')) {
            integral = false;
            if (eof() || std::isdigit(static_cast<unsigned char>(peek())) == 0) {
                throw JsonError("Invalid fractional number");
            }
            skip_digits();
        }
        if (!eof() && (peek() == 'e' || peek() == 'E')) {
            integral = false;
            ++pos_;
            if (!eof() && (peek() == '+' || peek() == '-')) {
                ++pos_;
            }
            if (eof() || std::isdigit(static_cast<unsigned char>(peek())) == 0) {
                throw JsonError("Invalid exponent in number");
            }
            skip_digits();
        }

        const std::string_view slice = input_.substr(start, pos_ - start);
        JsonValue value;
        value.type = JsonType::Number;
        if (integral) {
            std::int64_t parsed = 0;
            const auto result = std::from_chars(slice.data(), slice.data() + slice.size(), parsed);
            if (result.ec == std::errc{} && result.ptr == slice.data() + slice.size()) {
                value.integer_value = parsed;
                value.number_value = static_cast<double>(parsed);
                return value;
            }
        }
        const std::string buffer(slice);
        char* end = nullptr;
        errno = 0;
        const double parsed = std::strtod(buffer.c_str(), &end);
        if (errno == ERANGE || end != buffer.c_str() + buffer.size()) {
            throw JsonError("Unable to parse number literal");
        }
        value.number_value = parsed;
        return value;
    }

    std::string parse_string() {
        expect('"');
        std::string output;
        while (true) {
            if (eof()) {
                throw JsonError("Unterminated string literal");
            }
            const char ch = get();
            if (ch == '"') {
                break;
            }
            if (ch != '\\') {
                output.push_back(ch);
                continue;
            }
            if (eof()) {
                throw JsonError("Unterminated escape sequence");
            }
            const char esc = get();
            switch (esc) {
                case '"':
                case '\\':
                case '/':
                    output.push_back(esc);
                    break;
                case 'b':
                    output.push_back('\b');
                    break;
                case 'f':
                    output.push_back('\f');
                    break;
                case 'n':
                    output.push_back('\n');
                    break;
                case 'r':
                    output.push_back('\r');
                    break;
                case 't':
                    output.push_back('\t');
                    break;
                case 'u':
                    append_utf8(parse_codepoint(), output);
                    break;
                default:
                    throw JsonError("Invalid escape sequence in string");
            }
        }
        return output;
    }

    unsigned int parse_hex4() {
        if (pos_ + 4 > input_.size()) {
            throw JsonError("Truncated unicode escape");
        }
        unsigned int codepoint = 0;
        for (const char ch : input_.substr(pos_, 4)) {
            codepoint <<= 4;
            if (ch >= '0' && ch <= '9') {
                codepoint |= static_cast<unsigned int>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                codepoint |= static_cast<unsigned int>(10 + ch - 'a');
            } else if (ch >= 'A' && ch <= 'F') {
                codepoint |= static_cast<unsigned int>(10 + ch - 'A');
            } else {
                throw JsonError("Invalid unicode escape");
            }
        }
        pos_ += 4;
        return codepoint;
    }

    // Combines surrogate pairs; a lone surrogate is rejected.
    unsigned int parse_codepoint() {
        const unsigned int high = parse_hex4();
        if (high < 0xD800 || high > 0xDFFF) {
            return high;
        }
        if (high > 0xDBFF || !match_literal("\\u")) {
            throw JsonError("Unpaired surrogate in unicode escape");
        }
        const unsigned int low = parse_hex4();
        if (low < 0xDC00 || low > 0xDFFF) {
            throw JsonError("Invalid low surrogate in unicode escape");
        }
        return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
    }

    static void append_utf8(unsigned int codepoint, std::string& out) {
        if (codepoint <= 0x7F) {
            out.push_back(static_cast<char>(codepoint));
        } else if (codepoint <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else if (codepoint <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((codepoint >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        }
    }

    void enter() {
        if (++depth_ > kMaxDepth) {
            throw JsonError("JSON nesting too deep");
        }
    }

    void leave() {
        --depth_;
    }

    void skip_digits() {
        while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
            ++pos_;
        }
    }

    void expect(char expected) {
        if (eof() || input_[pos_] != expected) {
            throw JsonError("Unexpected character in JSON input");
        }
        ++pos_;
    }

    bool match(char expected) {
        if (!eof() && input_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool match_literal(std::string_view literal) {
        if (input_.substr(pos_, literal.size()) == literal) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    void skip_whitespace() {
        while (!eof() && std::isspace(static_cast<unsigned char>(peek())) != 0) {
            ++pos_;
        }
    }

    bool eof() const { return pos_ >= input_.size(); }
    char peek() const { return input_[pos_]; }
    char get() { return input_[pos_++]; }

    std::string_view input_;
    std::size_t pos_{0};
    std::size_t depth_{0};
};

}  // namespace

const JsonValue* JsonValue::find(std::string_view key) const {
    if (!is_object()) {
        return nullptr;
    }
    for (const auto& [k, value] : object_value) {
        if (k == key) {
            return &value;
        }
    }
    return nullptr;
}

std::optional<std::string> JsonValue::string_field(std::string_view key) const {
    const auto* value = find(key);
    if (!value || !value->is_string()) {
        return std::nullopt;
    }
    return value->string_value;
}

std::optional<std::int64_t> JsonValue::integer_field(std::string_view key) const {
    const auto* value = find(key);
    if (!value || !value->is_number() || !value->integer_value.has_value()) {
        return std::nullopt;
    }
    return value->integer_value;
}

std::optional<double> JsonValue::number_field(std::string_view key) const {
    const auto* value = find(key);
    if (!value || !value->is_number()) {
        return std::nullopt;
    }
    return value->number_value;
}

std::optional<bool> JsonValue::bool_field(std::string_view key) const {
    const auto* value = find(key);
    if (!value || !value->is_bool()) {
        return std::nullopt;
    }
    return value->bool_value;
}

JsonValue parse_json(std::string_view input) {
    JsonParser parser(input);
    return parser.parse();
}

std::string escape_json(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (const unsigned char ch : value) {
        switch (ch) {
            case '"':
                escaped.append("\\\"");
                break;
            case '\\':
                escaped.append("\\\\");
                break;
            case '\b':
                escaped.append("\\b");
                break;
            case '\f':
                escaped.append("\\f");
                break;
            case '\n':
                escaped.append("\\n");
                break;
            case '\r':
                escaped.append("\\r");
                break;
            case '\t':
                escaped.append("\\t");
                break;
            default:
                if (ch < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                        << static_cast<int>(ch);
                    escaped.append(oss.str());
                } else {
                    escaped.push_back(static_cast<char>(ch));
                }
                break;
        }
    }
    return escaped;
}

void JsonWriter::separate() {
    if (after_key_) {
        after_key_ = false;
        return;
    }
    if (!first_in_scope_.empty()) {
        if (!first_in_scope_.back()) {
            out_.push_back(',');
        }
        first_in_scope_.back() = false;
    }
}

void JsonWriter::begin_object() {
    separate();
    out_.push_back('{');
    first_in_scope_.push_back(true);
}

void JsonWriter::end_object() {
    out_.push_back('}');
    first_in_scope_.pop_back();
}

void JsonWriter::begin_array() {
    separate();
    out_.push_back('[');
    first_in_scope_.push_back(true);
}

void JsonWriter::end_array() {
    out_.push_back(']');
    first_in_scope_.pop_back();
}

void JsonWriter::key(std::string_view name) {
    separate();
    out_.push_back('"');
    out_.append(escape_json(name));
    out_.append("\":");
    after_key_ = true;
}

void JsonWriter::value(std::string_view text) {
    separate();
    out_.push_back('"');
    out_.append(escape_json(text));
    out_.push_back('"');
}

void JsonWriter::value(std::int64_t number) {
    separate();
    out_.append(std::to_string(number));
}

void JsonWriter::value(std::uint64_t number) {
    separate();
    out_.append(std::to_string(number));
}

void JsonWriter::value(double number) {
    separate();
    if (!std::isfinite(number)) {
        out_.append("null");
        return;
    }
    std::ostringstream oss;
    oss << std::setprecision(17) << number;
    out_.append(oss.str());
}

void JsonWriter::value(bool flag) {
    separate();
    out_.append(flag ? "true" : "false");
}

void JsonWriter::null() {
    separate();
    out_.append("null");
}

void JsonWriter::byte_array_field(std::string_view name, std::span<const std::uint8_t> bytes) {
    key(name);
    separate();
    out_.reserve(out_.size() + bytes.size() * 4 + 2);
    out_.push_back('[');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i != 0) {
            out_.push_back(',');
        }
        out_.append(std::to_string(static_cast<unsigned int>(bytes[i])));
    }
    out_.push_back(']');
}

void JsonWriter::index_array_field(std::string_view name, std::span<const std::uint32_t> indices) {
    key(name);
    separate();
    out_.push_back('[');
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (i != 0) {
            out_.push_back(',');
        }
        out_.append(std::to_string(indices[i]));
    }
    out_.push_back(']');
}

}  // namespace meshcast::protocol
