//! # JSON Parser
//!
//! Recursive descent over the raw input. Strings are decoded eagerly,
//! `\uXXXX` escapes (including surrogate pairs) are re-encoded as UTF-8.
//! Nesting is capped at MAX_DEPTH to keep recursion bounded.

#include "simdbuild/json/json.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace simdbuild::json {

std::string JsonError::to_string() const {
    return message + " at line " + std::to_string(line) + ", column " + std::to_string(column);
}

// ============================================================================
// JsonValue
// ============================================================================

JsonValue::JsonValue(const JsonValue& other) {
    *this = other;
}

JsonValue& JsonValue::operator=(const JsonValue& other) {
    if (this == &other) {
        return *this;
    }
    if (other.is_array()) {
        data = make_box<JsonArray>(other.as_array());
    } else if (other.is_object()) {
        data = make_box<JsonObject>(other.as_object());
    } else {
        std::visit(
            [this](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (!std::is_same_v<T, Box<JsonArray>> &&
                              !std::is_same_v<T, Box<JsonObject>>) {
                    data = v;
                }
            },
            other.data);
    }
    return *this;
}

int64_t JsonValue::as_i64() const {
    if (const auto* i = std::get_if<int64_t>(&data)) {
        return *i;
    }
    return static_cast<int64_t>(std::get<double>(data));
}

double JsonValue::as_f64() const {
    if (const auto* d = std::get_if<double>(&data)) {
        return *d;
    }
    return static_cast<double>(std::get<int64_t>(data));
}

const JsonValue* JsonValue::get(std::string_view key) const {
    if (!is_object()) {
        return nullptr;
    }
    const auto& obj = as_object();
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &it->second;
}

std::string_view JsonValue::get_string(std::string_view key) const {
    const auto* v = get(key);
    if (v && v->is_string()) {
        return v->as_string();
    }
    return {};
}

bool JsonValue::get_bool(std::string_view key, bool fallback) const {
    const auto* v = get(key);
    if (v && v->is_bool()) {
        return v->as_bool();
    }
    return fallback;
}

const JsonArray& JsonValue::get_array(std::string_view key) const {
    static const JsonArray empty;
    const auto* v = get(key);
    if (v && v->is_array()) {
        return v->as_array();
    }
    return empty;
}

// ============================================================================
// Parser
// ============================================================================

namespace {

class Parser {
public:
    explicit Parser(std::string_view input) : input_(input) {}

    auto parse_document() -> Result<JsonValue, JsonError> {
        skip_whitespace();
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        skip_whitespace();
        if (pos_ != input_.size()) {
            return error("Trailing characters after JSON document");
        }
        return value;
    }

private:
    static constexpr size_t MAX_DEPTH = 2048;

    std::string_view input_;
    size_t pos_ = 0;
    size_t depth_ = 0;

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= input_.size();
    }

    [[nodiscard]] auto peek() const -> char {
        return at_end() ? '\0' : input_[pos_];
    }

    void skip_whitespace() {
        while (!at_end()) {
            char c = input_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
                break;
            }
            ++pos_;
        }
    }

    [[nodiscard]] auto error(const std::string& msg) const -> JsonError {
        JsonError err;
        err.message = msg;
        err.line = 1;
        err.column = 1;
        for (size_t i = 0; i < pos_ && i < input_.size(); ++i) {
            if (input_[i] == '\n') {
                ++err.line;
                err.column = 1;
            } else {
                ++err.column;
            }
        }
        return err;
    }

    auto parse_value() -> Result<JsonValue, JsonError> {
        if (at_end()) {
            return error("Unexpected end of input");
        }
        switch (peek()) {
        case '{':
            return parse_object();
        case '[':
            return parse_array();
        case '"': {
            auto s = parse_string();
            if (is_err(s)) {
                return unwrap_err(s);
            }
            return JsonValue(std::move(unwrap(s)));
        }
        case 't':
            return parse_keyword("true", JsonValue(true));
        case 'f':
            return parse_keyword("false", JsonValue(false));
        case 'n':
            return parse_keyword("null", JsonValue());
        default:
            return parse_number();
        }
    }

    auto parse_keyword(std::string_view word, JsonValue value) -> Result<JsonValue, JsonError> {
        if (input_.substr(pos_, word.size()) != word) {
            return error("Invalid literal");
        }
        pos_ += word.size();
        return value;
    }

    auto parse_number() -> Result<JsonValue, JsonError> {
        size_t start = pos_;
        bool is_float = false;
        if (peek() == '-') {
            ++pos_;
        }
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return error("Unexpected character '" + std::string(1, peek()) + "'");
        }
        while (!at_end()) {
            char c = peek();
            if (std::isdigit(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') {
                is_float = true;
                ++pos_;
            } else {
                break;
            }
        }
        std::string_view text = input_.substr(start, pos_ - start);

        if (!is_float) {
            int64_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec == std::errc() && ptr == text.data() + text.size()) {
                return JsonValue(value);
            }
        }
        // Out-of-range integers fall back to double like any other number.
        std::string owned(text);
        char* end = nullptr;
        double d = std::strtod(owned.c_str(), &end);
        if (end != owned.c_str() + owned.size()) {
            return error("Malformed number '" + owned + "'");
        }
        return JsonValue(d);
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    auto parse_hex4() -> Result<uint32_t, JsonError> {
        if (pos_ + 4 > input_.size()) {
            return error("Truncated \\u escape");
        }
        uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(input_.data() + pos_, input_.data() + pos_ + 4, value, 16);
        if (ec != std::errc() || ptr != input_.data() + pos_ + 4) {
            return error("Invalid \\u escape");
        }
        pos_ += 4;
        return value;
    }

    auto parse_string() -> Result<std::string, JsonError> {
        ++pos_; // opening quote
        std::string out;
        while (true) {
            if (at_end()) {
                return error("Unterminated string");
            }
            char c = input_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (at_end()) {
                return error("Unterminated escape");
            }
            char e = input_[pos_++];
            switch (e) {
            case '"':
            case '\\':
            case '/':
                out.push_back(e);
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u': {
                auto hi = parse_hex4();
                if (is_err(hi)) {
                    return unwrap_err(hi);
                }
                uint32_t cp = unwrap(hi);
                if (cp >= 0xD800 && cp <= 0xDBFF && input_.substr(pos_, 2) == "\\u") {
                    pos_ += 2;
                    auto lo = parse_hex4();
                    if (is_err(lo)) {
                        return unwrap_err(lo);
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (unwrap(lo) - 0xDC00);
                }
                append_utf8(out, cp);
                break;
            }
            default:
                return error("Invalid escape character");
            }
        }
    }

    auto parse_array() -> Result<JsonValue, JsonError> {
        if (++depth_ > MAX_DEPTH) {
            return error("Maximum nesting depth exceeded");
        }
        ++pos_; // [
        JsonArray items;
        skip_whitespace();
        if (peek() == ']') {
            ++pos_;
            --depth_;
            return JsonValue(std::move(items));
        }
        while (true) {
            skip_whitespace();
            auto item = parse_value();
            if (is_err(item)) {
                return item;
            }
            items.push_back(std::move(unwrap(item)));
            skip_whitespace();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == ']') {
                ++pos_;
                break;
            }
            return error("Expected ',' or ']' in array");
        }
        --depth_;
        return JsonValue(std::move(items));
    }

    auto parse_object() -> Result<JsonValue, JsonError> {
        if (++depth_ > MAX_DEPTH) {
            return error("Maximum nesting depth exceeded");
        }
        ++pos_; // {
        JsonObject members;
        skip_whitespace();
        if (peek() == '}') {
            ++pos_;
            --depth_;
            return JsonValue(std::move(members));
        }
        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                return error("Expected string key in object");
            }
            auto key = parse_string();
            if (is_err(key)) {
                return unwrap_err(key);
            }
            skip_whitespace();
            if (peek() != ':') {
                return error("Expected ':' after object key");
            }
            ++pos_;
            skip_whitespace();
            auto value = parse_value();
            if (is_err(value)) {
                return value;
            }
            members.insert_or_assign(std::move(unwrap(key)), std::move(unwrap(value)));
            skip_whitespace();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == '}') {
                ++pos_;
                break;
            }
            return error("Expected ',' or '}' in object");
        }
        --depth_;
        return JsonValue(std::move(members));
    }
};

} // namespace

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    Parser parser(input);
    return parser.parse_document();
}

} // namespace simdbuild::json
