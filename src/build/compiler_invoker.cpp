//! # Compiler Invoker
//!
//! Per-source compile step and the fail-fast worker pool.

#include "simdbuild/build/compiler_invoker.hpp"

#include "simdbuild/build/process.hpp"
#include "simdbuild/log/log.hpp"

#include <algorithm>
#include <atomic>
#include <optional>
#include <sstream>
#include <thread>

namespace simdbuild::build {

// ============================================================================
// SourceQueue
// ============================================================================

void SourceQueue::push(const SourcePlan* plan) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stop_flag_) {
        queue_.push_back(plan);
    }
}

const SourcePlan* SourceQueue::pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_flag_ || queue_.empty()) {
        return nullptr;
    }
    auto* plan = queue_.front();
    queue_.pop_front();
    return plan;
}

void SourceQueue::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_flag_ = true;
    queue_.clear();
}

bool SourceQueue::is_stopped() {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_flag_;
}

// ============================================================================
// CompilerInvoker
// ============================================================================

CompilerInvoker::CompilerInvoker(fs::path compiler, std::vector<std::string> common_args,
                                 std::string isa_list, fs::path working_dir, size_t jobs)
    : compiler_(std::move(compiler)), common_args_(std::move(common_args)),
      isa_list_(std::move(isa_list)), working_dir_(std::move(working_dir)),
      jobs_(std::max<size_t>(jobs, 1)) {}

auto CompilerInvoker::arguments_for(const SourcePlan& plan) const -> std::vector<std::string> {
    std::vector<std::string> args;
    args.reserve(common_args_.size() + 7);
    args.push_back(plan.source.string());
    args.push_back("-o");
    args.push_back(plan.primary_object().string());
    args.push_back("-h");
    args.push_back(plan.header.string());
    args.push_back("-MMM");
    args.push_back(plan.dep_file.string());
    args.insert(args.end(), common_args_.begin(), common_args_.end());
    return args;
}

auto CompilerInvoker::compile_one(const SourcePlan& plan, const DependencyTracker& tracker) const
    -> MaybeError {
    auto before = tracker.snapshot(plan);
    if (is_err(before)) {
        return unwrap_err(before);
    }
    if (auto err = tracker.invalidate(plan)) {
        return err;
    }

    SIMDBUILD_LOG_INFO("invoke", "Compiling " << plan.source.string() << " for " << isa_list_);
    auto result = run_process(compiler_, arguments_for(plan), working_dir_);

    if (!result.launched) {
        return make_error(ErrorKind::ToolNotFound,
                          "Failed to run compiler " + compiler_.string(), result.stderr_output);
    }
    if (!result.success()) {
        std::ostringstream msg;
        msg << "Failed to compile " << plan.source.string() << " for " << isa_list_;
        if (result.term_signal != 0) {
            msg << " (compiler killed by signal " << result.term_signal << ")";
        } else {
            msg << " (exit code " << result.exit_code << ")";
        }
        return make_error(ErrorKind::CompilationFailure, msg.str(), result.stderr_output);
    }

    if (!result.stderr_output.empty()) {
        std::istringstream lines(result.stderr_output);
        std::string line;
        while (std::getline(lines, line)) {
            if (!line.empty()) {
                SIMDBUILD_LOG_WARN("invoke", plan.source.filename().string() << ": " << line);
            }
        }
    }

    for (const auto& output : plan.expected_outputs()) {
        if (!file_mtime(output)) {
            return make_error(ErrorKind::CompilationFailure,
                              "Compiler reported success for " + plan.source.string() +
                                  " but did not produce " + output.string(),
                              result.stderr_output);
        }
    }

    SIMDBUILD_LOG_DEBUG("invoke", "Compiled " << plan.source.string() << " in "
                                              << result.duration_ms << " ms");
    return tracker.record(plan, unwrap(before));
}

auto CompilerInvoker::compile(const std::vector<const SourcePlan*>& plans,
                              const DependencyTracker& tracker) -> BuildResult<InvokeStats> {
    InvokeStats stats;
    if (plans.empty()) {
        return stats;
    }

    size_t workers = std::min(jobs_, plans.size());
    if (workers <= 1) {
        for (size_t i = 0; i < plans.size(); ++i) {
            if (auto err = compile_one(*plans[i], tracker)) {
                stats.not_started = plans.size() - i - 1;
                return std::move(*err);
            }
            ++stats.compiled;
        }
        return stats;
    }

    SourceQueue queue;
    for (const auto* plan : plans) {
        queue.push(plan);
    }

    std::mutex error_mutex;
    std::optional<BuildError> first_error;
    std::atomic<size_t> compiled{0};
    std::atomic<size_t> started{0};

    auto worker = [&]() {
        while (auto* plan = queue.pop()) {
            started++;
            auto err = compile_one(*plan, tracker);
            if (!err) {
                compiled++;
                continue;
            }
            {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::move(err);
                } else {
                    SIMDBUILD_LOG_DEBUG("invoke", "Additional failure suppressed: " << err->message);
                }
            }
            queue.stop();
        }
    };

    SIMDBUILD_LOG_DEBUG("invoke", "Compiling " << plans.size() << " sources on " << workers
                                               << " workers");
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    stats.compiled = compiled.load();
    stats.not_started = plans.size() - started.load();
    if (first_error) {
        SIMDBUILD_LOG_DEBUG("invoke", stats.not_started << " sources not started after failure");
        return std::move(*first_error);
    }
    return stats;
}

} // namespace simdbuild::build
