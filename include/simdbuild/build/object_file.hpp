//! # Native Object Inspection
//!
//! Reads object files through the LLVM-C object API. The archiver uses it
//! to refuse truncated or foreign files before they reach the archive, and
//! the binding bridge uses the defined symbols to spot declarations the
//! library does not implement.

#ifndef SIMDBUILD_BUILD_OBJECT_FILE_HPP
#define SIMDBUILD_BUILD_OBJECT_FILE_HPP

#include "simdbuild/common.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace simdbuild::build {

/// Symbols of one object file.
struct ObjectSymbols {
    std::string format;               ///< e.g. "ELF64L", "MachO64L", "COFF"
    std::vector<std::string> defined; ///< Symbols with a containing section
};

/// Parses `path` as a native object file.
///
/// Returns the reason as an error string if the file is unreadable, not an
/// object file (archives and IR are rejected), or malformed.
[[nodiscard]] auto read_object_symbols(const fs::path& path) -> Result<ObjectSymbols, std::string>;

/// LLVM's default target triple for this host, e.g. "x86_64-pc-linux-gnu".
[[nodiscard]] auto default_target_triple() -> std::string;

} // namespace simdbuild::build

#endif // SIMDBUILD_BUILD_OBJECT_FILE_HPP
