//! # JSON Reader
//!
//! A small JSON value type and recursive descent parser. The binding bridge
//! uses it to read the declaration extractor's AST dump, which can be
//! several megabytes for a header that pulls in the C standard headers.
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(R"({"kind": "FunctionDecl", "name": "add"})");
//! if (is_ok(result)) {
//!     const auto& node = unwrap(result);
//!     std::string_view kind = node.get_string("kind");
//! }
//! ```

#ifndef SIMDBUILD_JSON_HPP
#define SIMDBUILD_JSON_HPP

#include "simdbuild/common.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace simdbuild::json {

struct JsonValue;

using JsonArray = std::vector<JsonValue>;
using JsonObject = std::map<std::string, JsonValue, std::less<>>;

/// Parse error with 1-based position information.
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;

    [[nodiscard]] auto to_string() const -> std::string;
};

/// A JSON value.
///
/// Integers without fraction or exponent are kept as `int64_t`, everything
/// else numeric is `double`. Arrays and objects are boxed so the variant
/// stays small.
struct JsonValue {
    struct Null {
        bool operator==(const Null&) const = default;
    };

    using Data = std::variant<Null, bool, int64_t, double, std::string, Box<JsonArray>,
                              Box<JsonObject>>;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int64_t value) : data(value) {}
    explicit JsonValue(double value) : data(value) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    JsonValue(const JsonValue& other);
    JsonValue& operator=(const JsonValue& other);
    JsonValue(JsonValue&&) noexcept = default;
    JsonValue& operator=(JsonValue&&) noexcept = default;

    [[nodiscard]] bool is_null() const {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] bool is_bool() const {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] bool is_integer() const {
        return std::holds_alternative<int64_t>(data);
    }
    [[nodiscard]] bool is_number() const {
        return is_integer() || std::holds_alternative<double>(data);
    }
    [[nodiscard]] bool is_string() const {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] bool is_array() const {
        return std::holds_alternative<Box<JsonArray>>(data);
    }
    [[nodiscard]] bool is_object() const {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    [[nodiscard]] bool as_bool() const {
        return std::get<bool>(data);
    }
    [[nodiscard]] int64_t as_i64() const;
    [[nodiscard]] double as_f64() const;
    [[nodiscard]] const std::string& as_string() const {
        return std::get<std::string>(data);
    }
    [[nodiscard]] const JsonArray& as_array() const {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] const JsonObject& as_object() const {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Object member lookup. Returns nullptr for non-objects and missing keys.
    [[nodiscard]] const JsonValue* get(std::string_view key) const;

    /// String member lookup. Returns "" when missing or not a string.
    [[nodiscard]] std::string_view get_string(std::string_view key) const;

    /// Boolean member lookup. Returns `fallback` when missing or not a bool.
    [[nodiscard]] bool get_bool(std::string_view key, bool fallback = false) const;

    /// Array member lookup. Returns an empty array when missing.
    [[nodiscard]] const JsonArray& get_array(std::string_view key) const;

    Data data;
};

/// Parses a complete JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace simdbuild::json

#endif // SIMDBUILD_JSON_HPP
