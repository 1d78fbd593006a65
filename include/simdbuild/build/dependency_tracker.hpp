//! # Dependency Tracker
//!
//! Decides which sources need recompiling by comparing a persisted
//! dependency record with the filesystem.
//!
//! ## Record Format
//!
//! One record per source, next to its objects (`<stem>_ispc.deprec`),
//! pipe-delimited with the mtime before the path so paths may contain '|':
//!
//! ```text
//! simdbuild-deprec|1
//! fingerprint|<16 hex digits>
//! source|<mtime_ns>|<path>
//! dep|<mtime_ns>|<path>
//! output|<mtime_ns>|<path>
//! ```
//!
//! ## Classification
//!
//! A source is FRESH only if its record loads, the fingerprint matches and
//! every recorded path still exists with exactly the recorded mtime.
//! Anything else (missing or malformed record, a changed or vanished file,
//! different compiler arguments) makes it STALE.

#ifndef SIMDBUILD_BUILD_DEPENDENCY_TRACKER_HPP
#define SIMDBUILD_BUILD_DEPENDENCY_TRACKER_HPP

#include "simdbuild/build/build_error.hpp"
#include "simdbuild/build/compile_unit.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace simdbuild::build {

/// A path with the mtime it had when recorded.
struct FileStamp {
    fs::path path;
    int64_t mtime_ns = 0;
};

/// Everything needed to decide whether a source is up to date.
struct DependencyRecord {
    std::string fingerprint;
    FileStamp source;
    std::vector<FileStamp> dependencies;
    std::vector<FileStamp> outputs;
};

/// Mtimes observed just before a compile starts.
///
/// The record written afterwards uses these stamps, so a source or include
/// edited while the compiler runs never looks up to date.
struct CompileSnapshot {
    FileStamp source;
    std::vector<FileStamp> dependencies; ///< As known from the previous compile
    int64_t started_ns = 0;
};

enum class Freshness { Fresh, Stale };

/// Classification with a human readable reason for the logs.
struct Classification {
    Freshness state = Freshness::Stale;
    std::string reason;

    [[nodiscard]] bool is_fresh() const {
        return state == Freshness::Fresh;
    }
};

/// Modification time in nanoseconds, nullopt if the file does not exist.
[[nodiscard]] auto file_mtime(const fs::path& path) -> std::optional<int64_t>;

/// Parses a compiler dependency file.
///
/// Accepts one path per line, or make syntax (`target: dep dep \`).
/// Relative paths are resolved against `base_dir`. Duplicates are dropped,
/// first occurrence wins.
[[nodiscard]] auto parse_dep_file(std::string_view content, const fs::path& base_dir)
    -> std::vector<fs::path>;

/// Loads a record; nullopt if it is missing or malformed.
[[nodiscard]] auto load_record(const fs::path& path) -> std::optional<DependencyRecord>;

/// Writes a record via a temporary file and rename.
[[nodiscard]] auto save_record(const fs::path& path, const DependencyRecord& record) -> MaybeError;

/// Hash of every argument that influences compiler output.
[[nodiscard]] auto compute_fingerprint(const std::vector<std::string>& parts) -> std::string;

/// Per-build tracker bound to one argument fingerprint.
class DependencyTracker {
public:
    /// @param base_dir Directory the compiler runs in; relative paths in
    ///                 dependency files are resolved against it.
    DependencyTracker(std::string fingerprint, fs::path base_dir);

    /// Compares the plan's record against the filesystem.
    [[nodiscard]] auto classify(const SourcePlan& plan) const -> Classification;

    /// Removes the plan's record. Called before a stale source compiles so
    /// an interrupted compile never leaves a trusted record behind.
    [[nodiscard]] auto invalidate(const SourcePlan& plan) const -> MaybeError;

    /// Stats the source and its known dependencies. Called before the
    /// compiler runs.
    [[nodiscard]] auto snapshot(const SourcePlan& plan) const -> BuildResult<CompileSnapshot>;

    /// Derives and persists a fresh record after a successful compile.
    ///
    /// No record is written (and the source stays stale) when:
    /// - the compiler wrote no dependency file
    /// - a reported dependency cannot be stat'ed
    /// - the source or a dependency changed after `before` was taken
    [[nodiscard]] auto record(const SourcePlan& plan, const CompileSnapshot& before) const
        -> MaybeError;

    /// Dependencies of a source as last recorded (or read from its
    /// dependency file), excluding the source itself.
    [[nodiscard]] auto dependencies_of(const SourcePlan& plan) const -> std::vector<fs::path>;

    [[nodiscard]] const std::string& fingerprint() const {
        return fingerprint_;
    }

private:
    std::string fingerprint_;
    fs::path base_dir_;
};

} // namespace simdbuild::build

#endif // SIMDBUILD_BUILD_DEPENDENCY_TRACKER_HPP
