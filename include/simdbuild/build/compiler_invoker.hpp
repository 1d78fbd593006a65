//! # Compiler Invoker
//!
//! Runs the SIMD compiler once per stale source. The compiler performs the
//! multi-target fan-out itself: one invocation writes the dispatch stub and
//! every per-ISA object of its source.
//!
//! ## Argument Order
//!
//! ```text
//! <source> -o <object> -h <header> -MMM <depfile> <common arguments...>
//! ```
//!
//! The common arguments are built once per build by `BuildConfig` and are
//! also the input of the dependency fingerprint.
//!
//! ## Parallelism
//!
//! Sequential by default. With more than one job, sources are pulled from a
//! shared queue by a bounded set of workers. The first failure stops the
//! queue: no further sources start, running ones drain, and only that first
//! failure is reported.

#ifndef SIMDBUILD_BUILD_COMPILER_INVOKER_HPP
#define SIMDBUILD_BUILD_COMPILER_INVOKER_HPP

#include "simdbuild/build/build_error.hpp"
#include "simdbuild/build/compile_unit.hpp"
#include "simdbuild/build/dependency_tracker.hpp"

#include <condition_variable>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace simdbuild::build {

/// Thread-safe queue of pending sources.
class SourceQueue {
public:
    void push(const SourcePlan* plan);

    /// Next plan, or nullptr once the queue is empty or stopped.
    const SourcePlan* pop();

    /// Drops everything still queued.
    void stop();

    bool is_stopped();

private:
    std::deque<const SourcePlan*> queue_;
    std::mutex mutex_;
    bool stop_flag_ = false;
};

/// Counters for one invocation round.
struct InvokeStats {
    size_t compiled = 0;
    size_t not_started = 0; ///< Skipped because an earlier source failed
};

class CompilerInvoker {
public:
    /// @param compiler    Resolved compiler executable
    /// @param common_args Arguments after the per-source ones
    /// @param isa_list    Requested ISAs, as named in failure messages
    /// @param working_dir Working directory of every compiler process
    /// @param jobs        Maximum concurrent compiler processes (>= 1)
    CompilerInvoker(fs::path compiler, std::vector<std::string> common_args, std::string isa_list,
                    fs::path working_dir, size_t jobs);

    /// Full argument list for one source.
    [[nodiscard]] auto arguments_for(const SourcePlan& plan) const -> std::vector<std::string>;

    /// Compiles `plans`, recording each success with `tracker`.
    [[nodiscard]] auto compile(const std::vector<const SourcePlan*>& plans,
                               const DependencyTracker& tracker) -> BuildResult<InvokeStats>;

private:
    fs::path compiler_;
    std::vector<std::string> common_args_;
    std::string isa_list_;
    fs::path working_dir_;
    size_t jobs_;

    auto compile_one(const SourcePlan& plan, const DependencyTracker& tracker) const -> MaybeError;
};

} // namespace simdbuild::build

#endif // SIMDBUILD_BUILD_COMPILER_INVOKER_HPP
