//! # Child Processes
//!
//! Runs external tools (compiler, archiver, declaration extractor) with
//! their output captured.
//!
//! ## Process Model
//!
//! - **Unix**: fork + execv with pipe-based capture of stdout and stderr.
//!   Both pipes are drained with `poll()` while the child runs so a chatty
//!   tool never blocks on a full pipe.
//! - Every live child is registered in a fixed table of pid slots.
//!   SIGINT and SIGTERM are blocked from fork until registration. The
//!   handlers installed by `install_interrupt_handlers()` (which
//!   `BuildConfig::compile()` calls) terminate every registered child
//!   before the default signal action runs.

#ifndef SIMDBUILD_BUILD_PROCESS_HPP
#define SIMDBUILD_BUILD_PROCESS_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace simdbuild::build {

/// Outcome of running a child process.
struct ProcessResult {
    bool launched = false; ///< False if pipes/fork failed or exec failed
    int exit_code = -1;
    int term_signal = 0; ///< Signal number if the child was killed
    std::string stdout_output;
    std::string stderr_output;
    int64_t duration_ms = 0;

    [[nodiscard]] bool success() const {
        return launched && term_signal == 0 && exit_code == 0;
    }
};

/// Exit code the child reports when execv itself fails.
constexpr int EXEC_FAILED_EXIT_CODE = 127;

/// Resolves `name` to an executable file.
///
/// Names containing a directory separator are checked as given. Bare names
/// are looked up in `search_dirs` in order.
[[nodiscard]] auto find_executable(std::string_view name, const std::vector<fs::path>& search_dirs)
    -> std::optional<fs::path>;

/// Runs `exe` with `args` and waits for it to exit.
///
/// @param exe  Path to the executable (not searched)
/// @param args Arguments, not including argv[0]
/// @param cwd  Working directory for the child, inherited when empty
[[nodiscard]] auto run_process(const fs::path& exe, const std::vector<std::string>& args,
                               const fs::path& cwd = {}) -> ProcessResult;

/// Formats a command line for logs.
[[nodiscard]] auto format_command(const fs::path& exe, const std::vector<std::string>& args)
    -> std::string;

/// Installs SIGINT/SIGTERM handlers that terminate running children.
/// Safe to call more than once.
void install_interrupt_handlers();

/// Number of children currently registered.
[[nodiscard]] auto live_child_count() -> size_t;

} // namespace simdbuild::build

#endif // SIMDBUILD_BUILD_PROCESS_HPP
