#include "simdbuild/bindings/type_mapper.hpp"

#include <utility>

namespace simdbuild::bindings {

namespace {

constexpr std::string_view RUST_KEYWORDS[] = {
    "as",      "break",    "const",  "continue", "crate", "else",   "enum",   "extern",
    "false",   "fn",       "for",    "if",       "impl",  "in",     "let",    "loop",
    "match",   "mod",      "move",   "mut",      "pub",   "ref",    "return", "self",
    "Self",    "static",   "struct", "super",    "trait", "true",   "type",   "unsafe",
    "use",     "where",    "while",  "async",    "await", "dyn",    "abstract", "become",
    "box",     "do",       "final",  "macro",    "override", "priv", "typeof", "unsized",
    "virtual", "yield",    "try",    "gen",      "union",
};

// Keywords that cannot be written as raw identifiers.
constexpr std::string_view NON_RAW_KEYWORDS[] = {"self", "Self", "super", "crate"};

constexpr std::pair<std::string_view, std::string_view> BUILTINS[] = {
    {"_Bool", "bool"},
    {"bool", "bool"},
    {"char", "::core::ffi::c_char"},
    {"signed char", "i8"},
    {"unsigned char", "u8"},
    {"short", "i16"},
    {"short int", "i16"},
    {"signed short", "i16"},
    {"signed short int", "i16"},
    {"unsigned short", "u16"},
    {"unsigned short int", "u16"},
    {"int", "i32"},
    {"signed", "i32"},
    {"signed int", "i32"},
    {"unsigned", "u32"},
    {"unsigned int", "u32"},
    {"long", "::core::ffi::c_long"},
    {"long int", "::core::ffi::c_long"},
    {"signed long", "::core::ffi::c_long"},
    {"unsigned long", "::core::ffi::c_ulong"},
    {"unsigned long int", "::core::ffi::c_ulong"},
    {"long long", "i64"},
    {"long long int", "i64"},
    {"signed long long", "i64"},
    {"unsigned long long", "u64"},
    {"unsigned long long int", "u64"},
    {"float", "f32"},
    {"double", "f64"},
    {"int8_t", "i8"},
    {"int16_t", "i16"},
    {"int32_t", "i32"},
    {"int64_t", "i64"},
    {"uint8_t", "u8"},
    {"uint16_t", "u16"},
    {"uint32_t", "u32"},
    {"uint64_t", "u64"},
    {"size_t", "usize"},
    {"ssize_t", "isize"},
    {"ptrdiff_t", "isize"},
    {"intptr_t", "isize"},
    {"uintptr_t", "usize"},
    {"__int8_t", "i8"},
    {"__int32_t", "i32"},
    {"__uint32_t", "u32"},
};

std::string_view builtin(std::string_view spelling) {
    for (const auto& [c, rust] : BUILTINS) {
        if (c == spelling) {
            return rust;
        }
    }
    return {};
}

} // namespace

auto rust_ident(std::string_view name) -> std::string {
    for (auto kw : NON_RAW_KEYWORDS) {
        if (kw == name) {
            return std::string(name) + "_";
        }
    }
    for (auto kw : RUST_KEYWORDS) {
        if (kw == name) {
            return "r#" + std::string(name);
        }
    }
    return std::string(name);
}

auto rust_integer_for(std::string_view c_spelling) -> std::string {
    auto rust = builtin(c_spelling);
    if (rust.empty() || rust == "bool" || rust == "f32" || rust == "f64") {
        return {};
    }
    return std::string(rust);
}

auto TypeMapper::map_type(const CType& type) const -> Result<std::string, TypeError> {
    switch (type.kind) {
    case CType::Kind::Void:
        return TypeError{"'void' is only valid behind a pointer or as a return type"};
    case CType::Kind::Builtin:
    case CType::Kind::Named: {
        auto rust = builtin(type.name);
        if (!rust.empty()) {
            return std::string(rust);
        }
        if (typedefs_.count(type.name) || records_.count(type.name) || enums_.count(type.name)) {
            return rust_ident(type.name);
        }
        return TypeError{"unknown type '" + type.name + "'"};
    }
    case CType::Kind::Record:
        if (records_.count(type.name)) {
            return rust_ident(type.name);
        }
        return TypeError{"struct '" + type.name + "' is not declared in the compiler headers"};
    case CType::Kind::Enum:
        if (enums_.count(type.name)) {
            return rust_ident(type.name);
        }
        return TypeError{"enum '" + type.name + "' is not declared in the compiler headers"};
    case CType::Kind::Pointer: {
        auto pointee = map_pointee(*type.element);
        if (is_err(pointee)) {
            return pointee;
        }
        return std::string(type.element->is_const ? "*const " : "*mut ") + unwrap(pointee);
    }
    case CType::Kind::Array: {
        auto element = map_type(*type.element);
        if (is_err(element)) {
            return element;
        }
        return "[" + unwrap(element) + "; " + std::to_string(type.array_len) + "]";
    }
    case CType::Kind::Unsupported:
        return TypeError{"unsupported type " + type.name};
    }
    return TypeError{"unsupported type"};
}

auto TypeMapper::map_pointee(const CType& type) const -> Result<std::string, TypeError> {
    if (type.kind == CType::Kind::Void) {
        return std::string("::core::ffi::c_void");
    }
    return map_type(type);
}

auto TypeMapper::map(std::string_view spelling) const -> Result<std::string, TypeError> {
    return map_type(parse_c_type(spelling));
}

auto TypeMapper::map_param(std::string_view spelling) const -> Result<std::string, TypeError> {
    auto type = parse_c_type(spelling);
    if (type.kind == CType::Kind::Array) {
        CType decayed;
        decayed.kind = CType::Kind::Pointer;
        decayed.element = type.element;
        return map_type(decayed);
    }
    return map_type(type);
}

auto TypeMapper::map_return(std::string_view spelling) const -> Result<std::string, TypeError> {
    auto type = parse_c_type(spelling);
    if (type.kind == CType::Kind::Void) {
        return std::string();
    }
    if (type.kind == CType::Kind::Array) {
        return TypeError{"functions cannot return arrays"};
    }
    return map_type(type);
}

} // namespace simdbuild::bindings
