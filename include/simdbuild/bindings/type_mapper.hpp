//! # C to Rust Type Mapping
//!
//! Maps C type spellings to explicit-width Rust FFI types. No mapping ever
//! narrows: `long` stays `c_long`, fixed-width typedefs become their exact
//! Rust integer.
//!
//! | C                              | Rust                          |
//! |--------------------------------|-------------------------------|
//! | `int8_t` ... `uint64_t`        | `i8` ... `u64`                |
//! | `int` / `unsigned int`         | `i32` / `u32`                 |
//! | `long long` / `unsigned long long` | `i64` / `u64`             |
//! | `long` / `unsigned long`       | `::core::ffi::c_long` / `c_ulong` |
//! | `char`                         | `::core::ffi::c_char`         |
//! | `float` / `double` / `bool`    | `f32` / `f64` / `bool`        |
//! | `size_t`, `uintptr_t`          | `usize`                       |
//! | `ptrdiff_t`, `intptr_t`        | `isize`                       |
//! | `T *` / `const T *`            | `*mut T` / `*const T`         |
//! | `void *`                       | `*mut ::core::ffi::c_void`    |
//! | `T[N]`                         | `[T; N]`                      |

#ifndef SIMDBUILD_BINDINGS_TYPE_MAPPER_HPP
#define SIMDBUILD_BINDINGS_TYPE_MAPPER_HPP

#include "simdbuild/bindings/c_decl.hpp"

#include <set>
#include <string>
#include <string_view>

namespace simdbuild::bindings {

/// Why a type could not be mapped.
struct TypeError {
    std::string reason;
};

/// Escapes Rust keywords: `r#type`, or `self_` where raw identifiers are
/// not allowed.
[[nodiscard]] auto rust_ident(std::string_view name) -> std::string;

/// Rust integer for a builtin C integer spelling, "" if not an integer.
[[nodiscard]] auto rust_integer_for(std::string_view c_spelling) -> std::string;

class TypeMapper {
public:
    void add_record(const std::string& name) {
        records_.insert(name);
    }
    void add_enum(const std::string& name) {
        enums_.insert(name);
    }
    void add_typedef(const std::string& name) {
        typedefs_.insert(name);
    }
    void remove(const std::string& name) {
        records_.erase(name);
        enums_.erase(name);
        typedefs_.erase(name);
    }

    /// Maps a value type (field, parameter, typedef target).
    [[nodiscard]] auto map(std::string_view spelling) const -> Result<std::string, TypeError>;

    /// Maps a parameter type; arrays decay to pointers.
    [[nodiscard]] auto map_param(std::string_view spelling) const -> Result<std::string, TypeError>;

    /// Maps a return type; "" for void.
    [[nodiscard]] auto map_return(std::string_view spelling) const
        -> Result<std::string, TypeError>;

    [[nodiscard]] auto map_type(const CType& type) const -> Result<std::string, TypeError>;

private:
    std::set<std::string> records_;
    std::set<std::string> enums_;
    std::set<std::string> typedefs_;

    auto map_pointee(const CType& type) const -> Result<std::string, TypeError>;
};

} // namespace simdbuild::bindings

#endif // SIMDBUILD_BINDINGS_TYPE_MAPPER_HPP
