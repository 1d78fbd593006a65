#include "simdbuild/runtime/task_system.hpp"

#include "simdbuild/log/log.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>

namespace simdbuild::runtime {

namespace {

/// Pool index of the current thread, -1 outside the pool.
thread_local int t_worker_index = -1;

} // namespace

// ============================================================================
// TaskGroup / TaskContext
// ============================================================================

void TaskGroup::run(int index, int thread_index, int thread_count) const {
    int x = index % count0;
    int y = (index / count0) % count1;
    int z = index / (count0 * count1);
    fn(data, thread_index, thread_count, index, total, x, y, z, count0, count1, count2);
}

TaskContext::~TaskContext() {
    for (const auto& block : blocks_) {
        ::operator delete(block.ptr, std::align_val_t(block.alignment));
    }
}

void* TaskContext::allocate(int64_t size, int32_t alignment) {
    size_t align = alignment > 0 ? static_cast<size_t>(alignment) : alignof(std::max_align_t);
    size_t bytes = size > 0 ? static_cast<size_t>(size) : 1;
    void* ptr = ::operator new(bytes, std::align_val_t(align));
    blocks_.push_back(Block{ptr, align});
    return ptr;
}

bool TaskContext::all_done() const {
    return std::all_of(groups.begin(), groups.end(),
                       [](const Rc<TaskGroup>& group) { return group->done(); });
}

static Rc<TaskGroup> make_group(TaskFn fn, void* data, int count0, int count1, int count2) {
    auto group = make_rc<TaskGroup>();
    group->fn = fn;
    group->data = data;
    group->count0 = std::max(count0, 1);
    group->count1 = std::max(count1, 1);
    group->count2 = std::max(count2, 1);
    if (count0 <= 0 || count1 <= 0 || count2 <= 0) {
        group->total = 0;
        return group;
    }
    int64_t total = int64_t{count0} * count1 * count2;
    if (total > std::numeric_limits<int>::max()) {
        SIMDBUILD_LOG_ERROR("rt", "Task launch [" << count0 << ", " << count1 << ", " << count2
                                                  << "] exceeds " << std::numeric_limits<int>::max()
                                                  << " tasks; not launched");
        group->total = 0;
        return group;
    }
    group->total = static_cast<int>(total);
    return group;
}

// ============================================================================
// ParallelTaskSystem
// ============================================================================

ParallelTaskSystem::ParallelTaskSystem(size_t workers) {
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back([this, i] { worker_loop(static_cast<int>(i)); });
    }
    SIMDBUILD_LOG_DEBUG("rt", "Parallel task system with " << workers << " workers");
}

ParallelTaskSystem::~ParallelTaskSystem() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    work_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

int ParallelTaskSystem::thread_count() const {
    // Threads outside the pool run as index `workers_.size()`.
    return static_cast<int>(workers_.size()) + 1;
}

size_t ParallelTaskSystem::live_contexts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.size();
}

void* ParallelTaskSystem::alloc(void** handle, int64_t size, int32_t alignment) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* context = static_cast<TaskContext*>(*handle);
    if (!context) {
        contexts_.push_back(make_box<TaskContext>(next_context_id_++));
        context = contexts_.back().get();
        *handle = context;
        SIMDBUILD_LOG_TRACE("rt", "context " << context->id() << " opened");
    }
    return context->allocate(size, alignment);
}

void ParallelTaskSystem::launch(void** handle, TaskFn fn, void* data, int count0, int count1,
                                int count2) {
    auto group = make_group(fn, data, count0, count1, count2);
    if (group->total == 0) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* context = static_cast<TaskContext*>(*handle);
        context->groups.push_back(group);
        SIMDBUILD_LOG_TRACE("rt", "context " << context->id() << " launch [" << count0 << ", "
                                             << count1 << ", " << count2 << "]");
    }
    work_cv_.notify_all();
}

bool ParallelTaskSystem::claim(TaskContext* context, Claim& out) {
    auto try_context = [&out](TaskContext& ctx) {
        for (auto& group : ctx.groups) {
            if (group->unclaimed()) {
                out.group = group;
                out.index = group->next++;
                return true;
            }
        }
        return false;
    };
    if (context) {
        return try_context(*context);
    }
    for (auto& ctx : contexts_) {
        if (try_context(*ctx)) {
            return true;
        }
    }
    return false;
}

void ParallelTaskSystem::execute(const Claim& claim, int thread_index) {
    claim.group->run(claim.index, thread_index, thread_count());
    bool group_done = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++claim.group->finished;
        group_done = claim.group->done();
    }
    if (group_done) {
        done_cv_.notify_all();
    }
}

void ParallelTaskSystem::worker_loop(int thread_index) {
    t_worker_index = thread_index;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        Claim claimed;
        if (claim(nullptr, claimed)) {
            lock.unlock();
            execute(claimed, thread_index);
            lock.lock();
            continue;
        }
        if (stop_) {
            return;
        }
        work_cv_.wait(lock);
    }
}

void ParallelTaskSystem::sync(void* handle) {
    auto* context = static_cast<TaskContext*>(handle);
    if (!context) {
        return;
    }
    int thread_index = t_worker_index >= 0 ? t_worker_index : static_cast<int>(workers_.size());

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        Claim claimed;
        if (claim(context, claimed)) {
            lock.unlock();
            execute(claimed, thread_index);
            lock.lock();
            continue;
        }
        if (context->all_done()) {
            break;
        }
        done_cv_.wait(lock);
    }

    SIMDBUILD_LOG_TRACE("rt", "context " << context->id() << " synced");
    auto it = std::find_if(contexts_.begin(), contexts_.end(),
                           [context](const Box<TaskContext>& c) { return c.get() == context; });
    if (it != contexts_.end()) {
        contexts_.erase(it);
    }
}

// ============================================================================
// SerialTaskSystem
// ============================================================================

void* SerialTaskSystem::alloc(void** handle, int64_t size, int32_t alignment) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* context = static_cast<TaskContext*>(*handle);
    if (!context) {
        contexts_.push_back(make_box<TaskContext>(next_context_id_++));
        context = contexts_.back().get();
        *handle = context;
    }
    return context->allocate(size, alignment);
}

void SerialTaskSystem::launch(void** handle, TaskFn fn, void* data, int count0, int count1,
                              int count2) {
    auto group = make_group(fn, data, count0, count1, count2);
    if (group->total == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    static_cast<TaskContext*>(*handle)->groups.push_back(group);
}

void SerialTaskSystem::sync(void* handle) {
    auto* context = static_cast<TaskContext*>(handle);
    if (!context) {
        return;
    }
    // Groups run in launch order; nested launches open their own contexts.
    for (size_t g = 0; g < context->groups.size(); ++g) {
        auto group = context->groups[g];
        while (group->unclaimed()) {
            int index = group->next++;
            group->run(index, 0, 1);
            ++group->finished;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(contexts_.begin(), contexts_.end(),
                           [context](const Box<TaskContext>& c) { return c.get() == context; });
    if (it != contexts_.end()) {
        contexts_.erase(it);
    }
}

// ============================================================================
// Global Installation
// ============================================================================

namespace {

std::once_flag g_task_system_once;
TaskSystem* g_task_system = nullptr;

} // namespace

bool set_task_system(Box<TaskSystem> system) {
    bool installed = false;
    std::call_once(g_task_system_once, [&] {
        // Never destroyed.
        g_task_system = system.release();
        installed = true;
    });
    return installed;
}

TaskSystem& task_system() {
    std::call_once(g_task_system_once, [] { g_task_system = new ParallelTaskSystem(); });
    return *g_task_system;
}

} // namespace simdbuild::runtime

// ============================================================================
// C Entry Points
// ============================================================================

extern "C" {

void* ISPCAlloc(void** handle, int64_t size, int32_t alignment) {
    return simdbuild::runtime::task_system().alloc(handle, size, alignment);
}

void ISPCLaunch(void** handle, void* fn, void* data, int count0, int count1, int count2) {
    simdbuild::runtime::task_system().launch(
        handle, reinterpret_cast<simdbuild::runtime::TaskFn>(fn), data, count0, count1, count2);
}

void ISPCSync(void* handle) {
    simdbuild::runtime::task_system().sync(handle);
}

} // extern "C"
