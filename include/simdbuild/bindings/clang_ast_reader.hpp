//! # Clang AST Reader
//!
//! Extracts C declarations from the JSON AST dump written by
//! `clang -x c -fsyntax-only -Xclang -ast-dump=json <header>`.
//!
//! ## Source Locations
//!
//! Clang writes a location's `file` only when it differs from the previous
//! location printed, so the reader replays every location in print order
//! (`loc` with its spelling and expansion parts, then `range`, then the
//! inner nodes) to know which file each top-level declaration came from.
//! Only declarations from the given headers are kept; everything pulled in
//! from system headers is dropped.

#ifndef SIMDBUILD_BINDINGS_CLANG_AST_READER_HPP
#define SIMDBUILD_BINDINGS_CLANG_AST_READER_HPP

#include "simdbuild/bindings/c_decl.hpp"
#include "simdbuild/json/json.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace simdbuild::bindings {

/// Reads the declarations of `headers` from a translation-unit node.
///
/// Returns an error message if `tu` is not a TranslationUnitDecl.
[[nodiscard]] auto read_declarations(const json::JsonValue& tu, const std::vector<fs::path>& headers)
    -> Result<DeclarationSet, std::string>;

} // namespace simdbuild::bindings

#endif // SIMDBUILD_BINDINGS_CLANG_AST_READER_HPP
