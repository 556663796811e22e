// ============================================================================
// paratask/sync/completion_signal.hpp - Aggregate Completion Primitives
// ============================================================================
//
// The aggregate completion signal of a TaskGroup is built from two pieces:
//
//   CountdownLatch  - armed with the number of pipelines at Start(); every
//                     pipeline counts down once when it settles. Exactly one
//                     CountDown() call observes the transition to zero.
//
//   CompletionEvent - one-shot, thread-blocking event. Set() after the
//                     completion callback has run; WaitForTasks() and the
//                     group destructor block in Wait().
//
// USAGE:
// ------
//   CountdownLatch latch(3);
//   CompletionEvent done;
//
//   // on each worker
//   if (latch.CountDown()) done.Set();
//
//   // on the caller
//   done.Wait();
//
// ============================================================================

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace paratask {

class CountdownLatch {
   public:
    explicit CountdownLatch(size_t count) : count_(count) {}

    CountdownLatch(const CountdownLatch&) = delete;
    CountdownLatch& operator=(const CountdownLatch&) = delete;

    // Returns true for the call that brings the count to zero. Counting down
    // a released latch is a no-op returning false.
    bool CountDown();

    size_t Count() const { return count_.load(std::memory_order_acquire); }

    bool IsReleased() const { return Count() == 0; }

   private:
    std::atomic<size_t> count_;
};

class CompletionEvent {
   public:
    CompletionEvent() = default;

    CompletionEvent(const CompletionEvent&) = delete;
    CompletionEvent& operator=(const CompletionEvent&) = delete;

    // Wakes every waiter. Later calls are no-ops.
    void Set();

    bool IsSet() const;

    // Blocks the calling thread until Set()
    void Wait();

   private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool signaled_ = false;
};

}  // namespace paratask
