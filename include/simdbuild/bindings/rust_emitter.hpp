//! # Rust Binding Emitter
//!
//! Turns a `DeclarationSet` into a Rust module:
//!
//! ```rust
//! #[allow(non_camel_case_types, dead_code, ...)]
//! pub mod simple {
//!     #[repr(C)]
//!     #[derive(Debug, Copy, Clone)]
//!     pub struct Point {
//!         pub x: f32,
//!         pub y: f32,
//!     }
//!     unsafe extern "C" {
//!         pub unsafe fn scale(p: *mut Point, n: u32);
//!     }
//! }
//! ```
//!
//! Declarations that cannot be expressed are left out and reported as
//! warnings. Dropping a record or typedef also drops everything that uses
//! it by value or by pointer, so the module always compiles.

#ifndef SIMDBUILD_BINDINGS_RUST_EMITTER_HPP
#define SIMDBUILD_BINDINGS_RUST_EMITTER_HPP

#include "simdbuild/bindings/c_decl.hpp"

#include <string>
#include <vector>

namespace simdbuild::bindings {

/// Bumped whenever the emitted text changes for the same declarations.
constexpr const char* EMITTER_VERSION = "rust-emitter/2";

struct RustModule {
    std::string text;
    size_t declaration_count = 0;
    std::vector<std::string> warnings;
    std::vector<std::string> function_names; ///< Emitted extern functions
};

/// Runtime entry points the compiled code imports rather than exports.
[[nodiscard]] bool is_runtime_entry_point(const std::string& name);

[[nodiscard]] auto emit_rust_module(const std::string& module_name, const DeclarationSet& decls)
    -> RustModule;

} // namespace simdbuild::bindings

#endif // SIMDBUILD_BINDINGS_RUST_EMITTER_HPP
