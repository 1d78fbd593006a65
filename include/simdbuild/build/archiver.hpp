//! # Object Linker / Archiver
//!
//! Merges the objects of one build into a single linkable library.
//!
//! ## Steps
//!
//! 1. Every member must exist with the mtime it had when collected and
//!    parse as a native object file (`read_object_symbols()`); otherwise
//!    LinkFailure and nothing is written.
//! 2. Unless forced, an existing library is kept when it is newer than every
//!    member and its member manifest (`<library>.members`) lists exactly the
//!    requested members.
//! 3. The previous library and manifest are deleted.
//! 4. The library is rebuilt from scratch:
//!    - static: `ar rcsD lib<name><triple>.a <objects...>` (deterministic
//!      mode, so unchanged inputs give a byte-identical archive)
//!    - MSVC triples: `lib.exe /OUT:<name><triple>.lib <objects...>`
//!    - shared: `cc -shared -o lib<name><triple>.so <objects...>`
//!
//! 5. The manifest is written.
//!
//! Members keep the order they are given in, which `collect_artifacts()`
//! makes deterministic.

#ifndef SIMDBUILD_BUILD_ARCHIVER_HPP
#define SIMDBUILD_BUILD_ARCHIVER_HPP

#include "simdbuild/build/build_env.hpp"
#include "simdbuild/build/build_error.hpp"
#include "simdbuild/build/compile_unit.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace simdbuild::build {

enum class LibraryKind { Static, Shared };

/// A linkable library produced by (or found for) a build.
struct Library {
    fs::path path;
    LibraryKind kind = LibraryKind::Static;
    std::string link_name; ///< Name for the linker, e.g. "kernelsx86_64-unknown-linux-gnu"
    std::vector<fs::path> members;
    std::vector<std::string> defined_symbols;
};

/// `<library>.members`: one member path per line, in archive order.
[[nodiscard]] auto member_manifest_path(const fs::path& library) -> fs::path;

/// Linker-facing library name: `<name><triple>`.
[[nodiscard]] auto library_link_name(const std::string& name, const std::string& triple)
    -> std::string;

/// File name of a library for `triple`, e.g. `libfoox86_64-unknown-linux-gnu.a`.
[[nodiscard]] auto library_file_name(const std::string& name, const std::string& triple,
                                     LibraryKind kind) -> std::string;

struct ArchiveRequest {
    std::string name;
    std::string triple;
    LibraryKind kind = LibraryKind::Static;
    fs::path out_dir;
    std::vector<GeneratedArtifact> members;
    /// Rebuild even if the library is up to date with its members.
    bool force = true;
};

class Archiver {
public:
    explicit Archiver(BuildEnv env);

    /// Validates the members and (re)creates the library.
    [[nodiscard]] auto create(const ArchiveRequest& request) -> BuildResult<Library>;

private:
    BuildEnv env_;

    auto resolve_tool(const std::string& override_name, const char* fallback) const
        -> BuildResult<fs::path>;
    auto run_tool(const fs::path& tool, const std::vector<std::string>& args,
                  const fs::path& cwd, const std::string& what) const -> MaybeError;
};

} // namespace simdbuild::build

#endif // SIMDBUILD_BUILD_ARCHIVER_HPP
