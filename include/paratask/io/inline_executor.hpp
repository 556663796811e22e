// ============================================================================
// paratask/io/inline_executor.hpp - Run-on-Caller Executor
// ============================================================================
//
// InlineExecutor runs each posted callback immediately on the posting
// thread. A TaskGroup driven by it executes its pipelines one after another,
// in registration order, with every stage of a task running before the next
// task's work starts. That makes race outcomes reproducible, which is what
// tests of the cancellation sweep need.
//
// Posting from inside a running callback nests: the inner callback completes
// before Post() returns.
//
// ============================================================================

#pragma once

#include <atomic>
#include <functional>

#include "paratask/io/executor.hpp"

namespace paratask {

class InlineExecutor : public Executor {
   public:
    InlineExecutor() = default;

    InlineExecutor(const InlineExecutor&) = delete;
    InlineExecutor& operator=(const InlineExecutor&) = delete;

    void Post(std::function<void()> callback) override {
        if (!callback || stopped_.load(std::memory_order_acquire)) return;
        ExecutorScope scope(this);
        callback();
    }

    void Stop() override { stopped_.store(true, std::memory_order_release); }

    bool IsRunning() const override { return !stopped_.load(std::memory_order_acquire); }

   private:
    std::atomic<bool> stopped_{false};
};

}  // namespace paratask
