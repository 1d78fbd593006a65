//! # Build Errors
//!
//! Every fatal condition of a build is reported as one `BuildError`. The
//! `message` is a single line naming what failed; `detail` carries tool
//! output (compiler stderr, archiver stderr) exactly as the tool wrote it.

#ifndef SIMDBUILD_BUILD_BUILD_ERROR_HPP
#define SIMDBUILD_BUILD_BUILD_ERROR_HPP

#include "simdbuild/common.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace simdbuild::build {

/// Classification of a build failure.
enum class ErrorKind {
    Configuration,      ///< Invalid or contradictory options
    ToolNotFound,       ///< A required executable is not on the search path
    CompilationFailure, ///< The SIMD compiler exited non-zero
    LinkFailure,        ///< An object is missing/corrupt or the archiver failed
    BindingGeneration,  ///< The declaration extractor failed or its output is unusable
    ArtifactNotFound,   ///< No prebuilt library matched the search
    Io,                 ///< Filesystem failure in the output directory
};

[[nodiscard]] auto error_kind_name(ErrorKind kind) -> std::string_view;

/// A fatal build error.
struct BuildError {
    ErrorKind kind;
    std::string message;
    std::string detail;

    /// "<kind>: <message>" followed by the detail on the next lines.
    [[nodiscard]] auto to_string() const -> std::string;
};

[[nodiscard]] inline auto make_error(ErrorKind kind, std::string message, std::string detail = {})
    -> BuildError {
    return BuildError{kind, std::move(message), std::move(detail)};
}

/// Result of a fallible build step.
template <typename T> using BuildResult = Result<T, BuildError>;

/// Outcome of a fallible step with no value: nullopt on success.
using MaybeError = std::optional<BuildError>;

} // namespace simdbuild::build

#endif // SIMDBUILD_BUILD_BUILD_ERROR_HPP
