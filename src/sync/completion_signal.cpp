// ============================================================================
// paratask/sync/completion_signal.cpp - CountdownLatch and CompletionEvent
// ============================================================================

#include "paratask/sync/completion_signal.hpp"

namespace paratask {

bool CountdownLatch::CountDown() {
    size_t current = count_.load(std::memory_order_acquire);
    while (current != 0) {
        if (count_.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel,
                                         std::memory_order_acquire)) {
            return current == 1;
        }
    }
    return false;
}

void CompletionEvent::Set() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (signaled_) {
        return;
    }
    signaled_ = true;
    // Notify under the lock: a waiter may destroy this event as soon as it
    // observes signaled_.
    cv_.notify_all();
}

bool CompletionEvent::IsSet() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signaled_;
}

void CompletionEvent::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return signaled_; });
}

}  // namespace paratask
