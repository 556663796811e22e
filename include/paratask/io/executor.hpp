// ============================================================================
// paratask/io/executor.hpp - Abstract Worker Pool Interface
// ============================================================================
//
// An Executor runs posted callbacks. Every stage of every task pipeline is
// posted separately, so implementations must accept Post() from any thread,
// including from inside a callback they are currently running.
//
// IMPLEMENTATIONS:
// ----------------
//   ThreadPoolExecutor - fixed set of worker threads (the default pool)
//   InlineExecutor     - runs callbacks on the posting thread, for
//                        deterministic single-threaded schedules
//
// USAGE:
// ------
//   ThreadPoolExecutor pool(8);
//
//   TaskGroup<std::string>::Options options;
//   options.executor = &pool;     // shared between groups, not owned
//
// ============================================================================

#pragma once

#include <functional>

namespace paratask {

class Executor;

namespace detail {

// Executor whose callback the calling thread is running, if any
inline Executor*& RunningExecutorSlot() noexcept {
    thread_local Executor* running = nullptr;
    return running;
}

}  // namespace detail

class Executor {
   public:
    virtual ~Executor() = default;

    // Run the callback as soon as possible on one of the executor's threads.
    // Once the executor is stopped the callback is dropped.
    virtual void Post(std::function<void()> callback) = 0;

    // Stop accepting work; callbacks already queued may be dropped
    virtual void Stop() = 0;

    [[nodiscard]] virtual bool IsRunning() const = 0;

    // True while the calling thread is inside one of this executor's
    // callbacks. A blocking wait issued there may starve the executor.
    [[nodiscard]] bool IsRunningCallback() const noexcept { return detail::RunningExecutorSlot() == this; }
};

// Marks the calling thread as running callbacks of `executor` for the
// lifetime of the scope. Scopes nest; the outer executor is restored.
class ExecutorScope {
   public:
    explicit ExecutorScope(Executor* executor) noexcept : outer_(detail::RunningExecutorSlot()) {
        detail::RunningExecutorSlot() = executor;
    }
    ~ExecutorScope() { detail::RunningExecutorSlot() = outer_; }

    ExecutorScope(const ExecutorScope&) = delete;
    ExecutorScope& operator=(const ExecutorScope&) = delete;

   private:
    Executor* outer_;
};

}  // namespace paratask
