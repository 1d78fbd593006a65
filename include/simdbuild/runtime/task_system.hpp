//! # Task Runtime
//!
//! Executes the tasks that compiled SIMD code starts with `launch` and
//! waits for with `sync`. The compiled code calls three C entry points:
//!
//! | Entry point  | Forwards to            |
//! |--------------|------------------------|
//! | `ISPCAlloc`  | `TaskSystem::alloc()`  |
//! | `ISPCLaunch` | `TaskSystem::launch()` |
//! | `ISPCSync`   | `TaskSystem::sync()`   |
//!
//! ## Contexts
//!
//! The first `alloc` of a function (or the first after a `sync`) receives
//! a null handle and opens a new context. The context owns every parameter
//! block allocated for it and every task group launched in it, and is
//! freed by `sync`.
//!
//! ## Default System
//!
//! `ParallelTaskSystem` runs tasks on a pool sized to the hardware. The
//! thread inside `sync` runs the unclaimed tasks of its own context, so a
//! task that launches and syncs nested tasks always makes progress.
//!
//! ```cpp
//! // Install before any compiled code launches tasks.
//! simdbuild::runtime::set_task_system(make_box<SerialTaskSystem>());
//! ```

#ifndef SIMDBUILD_RUNTIME_TASK_SYSTEM_HPP
#define SIMDBUILD_RUNTIME_TASK_SYSTEM_HPP

#include "simdbuild/common.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace simdbuild::runtime {

extern "C" {
/// Task body emitted by the compiler for each `task` function.
typedef void (*TaskFn)(void* data, int thread_index, int thread_count, int task_index,
                       int task_count, int task_index0, int task_index1, int task_index2,
                       int task_count0, int task_count1, int task_count2);
}

// ============================================================================
// Task System Interface
// ============================================================================

class TaskSystem {
public:
    virtual ~TaskSystem() = default;

    /// Returns `size` bytes aligned to `alignment`, owned by the context in
    /// `*handle`. Opens a new context when `*handle` is null.
    virtual void* alloc(void** handle, int64_t size, int32_t alignment) = 0;

    /// Schedules `count0 * count1 * count2` runs of `fn` in the context.
    virtual void launch(void** handle, TaskFn fn, void* data, int count0, int count1,
                        int count2) = 0;

    /// Returns once every task launched in the context has finished, then
    /// releases the context.
    virtual void sync(void* handle) = 0;
};

// ============================================================================
// Contexts
// ============================================================================

struct TaskGroup {
    TaskFn fn = nullptr;
    void* data = nullptr;
    int count0 = 1;
    int count1 = 1;
    int count2 = 1;
    int total = 0;
    int next = 0;     ///< Next unclaimed task index
    int finished = 0; ///< Tasks that returned

    [[nodiscard]] bool unclaimed() const {
        return next < total;
    }
    [[nodiscard]] bool done() const {
        return finished == total;
    }

    /// Runs task `index` with the nested-loop coordinates it stands for.
    void run(int index, int thread_index, int thread_count) const;
};

/// Per-launch state: the parameter blocks and task groups of one function.
class TaskContext {
public:
    explicit TaskContext(uint64_t id) : id_(id) {}
    ~TaskContext();

    TaskContext(const TaskContext&) = delete;
    TaskContext& operator=(const TaskContext&) = delete;

    [[nodiscard]] uint64_t id() const {
        return id_;
    }

    void* allocate(int64_t size, int32_t alignment);

    std::vector<Rc<TaskGroup>> groups;

    [[nodiscard]] bool all_done() const;

private:
    struct Block {
        void* ptr;
        size_t alignment;
    };

    uint64_t id_;
    std::vector<Block> blocks_;
};

// ============================================================================
// Built-in Systems
// ============================================================================

/// Worker pool. Tasks are claimed one index at a time under the queue lock.
class ParallelTaskSystem : public TaskSystem {
public:
    /// `workers == 0` sizes the pool to the hardware concurrency.
    explicit ParallelTaskSystem(size_t workers = 0);
    ~ParallelTaskSystem() override;

    void* alloc(void** handle, int64_t size, int32_t alignment) override;
    void launch(void** handle, TaskFn fn, void* data, int count0, int count1,
                int count2) override;
    void sync(void* handle) override;

    [[nodiscard]] size_t worker_count() const {
        return workers_.size();
    }

    /// Contexts opened and not yet synced.
    [[nodiscard]] size_t live_contexts() const;

private:
    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable done_cv_;
    std::deque<Box<TaskContext>> contexts_;
    uint64_t next_context_id_ = 0;
    bool stop_ = false;

    struct Claim {
        Rc<TaskGroup> group;
        int index = -1;
    };

    void worker_loop(int thread_index);
    /// Claims a task from `context`, or from any context when null.
    bool claim(TaskContext* context, Claim& out);
    void execute(const Claim& claim, int thread_index);
    [[nodiscard]] int thread_count() const;
};

/// Runs every task on the syncing thread.
class SerialTaskSystem : public TaskSystem {
public:
    void* alloc(void** handle, int64_t size, int32_t alignment) override;
    void launch(void** handle, TaskFn fn, void* data, int count0, int count1,
                int count2) override;
    void sync(void* handle) override;

private:
    std::mutex mutex_;
    std::vector<Box<TaskContext>> contexts_;
    uint64_t next_context_id_ = 0;
};

// ============================================================================
// Global Installation
// ============================================================================

/// Installs the task system used by the entry points. Only the first call
/// (or the first use of `task_system()`) wins; returns false afterwards.
bool set_task_system(Box<TaskSystem> system);

/// The installed task system, a `ParallelTaskSystem` if none was set.
[[nodiscard]] TaskSystem& task_system();

} // namespace simdbuild::runtime

extern "C" {
void* ISPCAlloc(void** handle, int64_t size, int32_t alignment);
void ISPCLaunch(void** handle, void* fn, void* data, int count0, int count1, int count2);
void ISPCSync(void* handle);
}

#endif // SIMDBUILD_RUNTIME_TASK_SYSTEM_HPP
