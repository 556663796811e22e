// ============================================================================
// paratask/core/cancellation.hpp - Cooperative Cancellation
// ============================================================================
//
// Every task owns a CancellationSource. The TaskGroup cancels it during a
// sweep, after a sibling's outcome satisfied the definition of done; the
// task's work receives the matching CancellationToken.
//
// CONTRACT:
// ---------
// 1. COOPERATIVE: nothing is interrupted. Work that never looks at its token
//    runs to completion; only stages that have not begun yet are skipped.
// 2. THREAD-SAFE: a token may be cancelled from any thread, any number of
//    times. Only the first request has an effect.
// 3. THREE WAYS TO OBSERVE: poll IsCancelled(), register an OnCancel hook
//    (e.g. to abort a blocking call), or ThrowIfCancelled() to unwind. The
//    pipeline reports work that unwinds with OperationCancelled as Cancelled
//    rather than Failed.
// 4. SCOPED HOOKS: once a CancellationCallbackGuard is destroyed its hook is
//    neither running nor will run, so the hook may capture work locals.
//
// IN WORK:
// --------
//   group.AddTask("scan", [](const CancellationToken& token) {
//       for (auto& chunk : chunks) {
//           token.ThrowIfCancelled();
//           Scan(chunk);
//       }
//       return summary;
//   });
//
// ============================================================================

#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "paratask/core/defer.hpp"

namespace paratask {

// Thrown by CancellationToken::ThrowIfCancelled()
class OperationCancelled : public std::runtime_error {
   public:
    OperationCancelled() : std::runtime_error("operation cancelled") {}
};

// ============================================================================
// CancellationState - Shared state between source and tokens
// ============================================================================
// Hooks run one at a time on the cancelling thread, outside the lock.
// Unregistering a hook that is running on another thread waits for it to
// return; from inside the hook itself it returns at once.
class CancellationState {
   public:
    CancellationState() = default;

    CancellationState(const CancellationState&) = delete;
    CancellationState& operator=(const CancellationState&) = delete;

    bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    // Returns true if this call performed the cancellation
    bool Cancel() {
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return false;
        }

        while (true) {
            std::function<void()> callback;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (hooks_.empty()) {
                    break;
                }
                running_handle_ = hooks_.front().handle;
                running_thread_ = std::this_thread::get_id();
                callback = std::move(hooks_.front().callback);
                hooks_.erase(hooks_.begin());
            }
            PARATASK_DEFER([this] {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    running_handle_ = 0;
                }
                hook_done_.notify_all();
            });
            callback();
        }
        return true;
    }

    size_t RegisterCallback(std::function<void()> callback) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancelled_.load(std::memory_order_acquire)) {
                size_t handle = next_handle_++;
                hooks_.push_back(Hook{handle, std::move(callback)});
                return handle;
            }
        }
        // Already cancelled: run now, outside the lock
        callback();
        return 0;
    }

    void UnregisterCallback(size_t handle) {
        if (handle == 0) return;

        std::unique_lock<std::mutex> lock(mutex_);
        auto it = std::find_if(hooks_.begin(), hooks_.end(), [handle](const Hook& hook) { return hook.handle == handle; });
        if (it != hooks_.end()) {
            hooks_.erase(it);
            return;
        }
        if (running_handle_ == handle && running_thread_ != std::this_thread::get_id()) {
            hook_done_.wait(lock, [this, handle] { return running_handle_ != handle; });
        }
    }

   private:
    struct Hook {
        size_t handle;
        std::function<void()> callback;
    };

    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable hook_done_;
    std::vector<Hook> hooks_;
    size_t next_handle_{1};
    size_t running_handle_{0};  // guarded by mutex_
    std::thread::id running_thread_;
};

// ============================================================================
// CancellationToken - Read-only view handed to work
// ============================================================================
class CancellationToken {
   public:
    // A token that is never cancelled
    CancellationToken() = default;

    bool IsCancelled() const noexcept { return state_ && state_->IsCancelled(); }

    // True while work may continue
    explicit operator bool() const noexcept { return !IsCancelled(); }

    void ThrowIfCancelled() const {
        if (IsCancelled()) {
            throw OperationCancelled();
        }
    }

    // Runs immediately if already cancelled. Returns a handle for Unregister().
    size_t OnCancel(std::function<void()> callback) const {
        if (state_) {
            return state_->RegisterCallback(std::move(callback));
        }
        return 0;
    }

    void Unregister(size_t handle) const {
        if (state_) {
            state_->UnregisterCallback(handle);
        }
    }

    bool IsValid() const noexcept { return state_ != nullptr; }

    [[nodiscard]] static CancellationToken None() { return CancellationToken{}; }

   private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<CancellationState> state) : state_(std::move(state)) {}

    std::shared_ptr<CancellationState> state_;
};

// ============================================================================
// CancellationSource - Owned by the task, cancelled by the sweep
// ============================================================================
class CancellationSource {
   public:
    CancellationSource() : state_(std::make_shared<CancellationState>()) {}

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;
    CancellationSource(CancellationSource&&) = default;
    CancellationSource& operator=(CancellationSource&&) = default;

    [[nodiscard]] CancellationToken GetToken() const { return CancellationToken(state_); }

    // Returns true if this call performed the cancellation
    bool Cancel() { return state_ && state_->Cancel(); }

    bool IsCancelled() const noexcept { return state_ && state_->IsCancelled(); }

   private:
    std::shared_ptr<CancellationState> state_;
};

// ============================================================================
// CancellationCallbackGuard - Scoped OnCancel registration
// ============================================================================
class CancellationCallbackGuard {
   public:
    CancellationCallbackGuard(CancellationToken token, std::function<void()> callback)
        : token_(std::move(token)), handle_(token_.OnCancel(std::move(callback))) {}

    ~CancellationCallbackGuard() { token_.Unregister(handle_); }

    CancellationCallbackGuard(const CancellationCallbackGuard&) = delete;
    CancellationCallbackGuard& operator=(const CancellationCallbackGuard&) = delete;

   private:
    CancellationToken token_;
    size_t handle_;
};

}  // namespace paratask
