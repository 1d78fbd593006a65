//! # Prebuilt Artifact Locator
//!
//! Finds a library built earlier (and shipped with the consuming project)
//! so it can be linked without the SIMD compiler or the extractor.
//!
//! ## Search Order
//!
//! 1. Paths added with `search_path()`, in order
//! 2. Entries of `SIMDBUILD_PREBUILT_PATH`
//! 3. `<cwd>/prebuilt`
//!
//! In each directory the static library is tried before the shared one.

#ifndef SIMDBUILD_RUNTIME_ARTIFACT_LOCATOR_HPP
#define SIMDBUILD_RUNTIME_ARTIFACT_LOCATOR_HPP

#include "simdbuild/build/archiver.hpp"
#include "simdbuild/build/build_env.hpp"
#include "simdbuild/build/build_error.hpp"
#include "simdbuild/build/link_directives.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace simdbuild::runtime {

struct LocatedArtifact {
    fs::path library;
    build::LibraryKind kind = build::LibraryKind::Static;
    std::optional<fs::path> bindings; ///< `<name>.rs` beside the library, if present
    fs::path directory;
    build::LinkDirectives directives;
};

class ArtifactLocator {
public:
    ArtifactLocator(std::string name, build::BuildEnv env);

    /// Adds an explicit directory, searched before the environment.
    auto search_path(const fs::path& dir) -> ArtifactLocator&;

    /// Overrides the target triple (default: `TARGET`, then the host).
    auto target(std::string triple) -> ArtifactLocator&;

    /// Directories in search order.
    [[nodiscard]] auto search_dirs() const -> std::vector<fs::path>;

    [[nodiscard]] auto locate() const -> build::BuildResult<LocatedArtifact>;

private:
    std::string name_;
    build::BuildEnv env_;
    std::vector<fs::path> explicit_dirs_;
    std::string triple_;

    [[nodiscard]] auto resolved_triple() const -> std::string;
};

} // namespace simdbuild::runtime

#endif // SIMDBUILD_RUNTIME_ARTIFACT_LOCATOR_HPP
