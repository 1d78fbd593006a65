//! # Link Directives
//!
//! What the host build needs to know to link a produced (or located)
//! library, printable as `cargo:` metadata lines:
//!
//! ```text
//! cargo:rerun-if-changed=/src/kernel.ispc
//! cargo:rustc-link-lib=static=kernelsx86_64-unknown-linux-gnu
//! cargo:rustc-link-search=native=/out
//! cargo:rustc-env=SIMDBUILD_OUT_DIR=/out
//! ```

#ifndef SIMDBUILD_BUILD_LINK_DIRECTIVES_HPP
#define SIMDBUILD_BUILD_LINK_DIRECTIVES_HPP

#include "simdbuild/build/archiver.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace simdbuild::build {

/// Name of the variable pointing the host build at the bindings module.
constexpr const char* OUT_DIR_VARIABLE = "SIMDBUILD_OUT_DIR";

struct LinkDirectives {
    std::vector<fs::path> rerun_if_changed;
    std::vector<std::string> link_libs; ///< "static=<name>" or "dylib=<name>"
    std::vector<fs::path> link_search;
    std::vector<std::pair<std::string, std::string>> env;
    std::vector<std::string> warnings;

    /// Adds a path to `rerun_if_changed` unless already present.
    void watch(const fs::path& path);
};

/// Link-lib/search/env directives for `library` living in `dir`.
[[nodiscard]] auto directives_for_library(const Library& library, const fs::path& dir)
    -> LinkDirectives;

/// Renders directives as `cargo:` lines, warnings first.
[[nodiscard]] auto render_cargo_metadata(const LinkDirectives& directives) -> std::string;

/// Writes `render_cargo_metadata()` to `out`.
void emit_cargo_metadata(const LinkDirectives& directives, std::ostream& out);

} // namespace simdbuild::build

#endif // SIMDBUILD_BUILD_LINK_DIRECTIVES_HPP
