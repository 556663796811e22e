// ============================================================================
// paratask/core/defer.hpp - Deferred Cleanup
// ============================================================================
//
// Defer runs a function when it goes out of scope, on every exit path. The
// group finalizer uses it so that the aggregate signal resolves even when the
// completion callback throws.
//
// USAGE:
// ------
//   PARATASK_DEFER([&] { done.Set(); });
//   RunCompletionCallback();
//
// ============================================================================

#pragma once

#include <functional>
#include <utility>

namespace paratask {

class Defer {
public:
    template <typename F>
    explicit Defer(F&& func) : cleanup_(std::forward<F>(func)) {}

    ~Defer() {
        if (cleanup_) {
            cleanup_();
        }
    }

    Defer(const Defer&) = delete;
    Defer& operator=(const Defer&) = delete;

    Defer(Defer&& other) noexcept : cleanup_(std::move(other.cleanup_)) {
        other.cleanup_ = nullptr;
    }
    Defer& operator=(Defer&&) = delete;

    // Drop the deferred action
    void Cancel() {
        cleanup_ = nullptr;
    }

private:
    std::function<void()> cleanup_;
};

#define PARATASK_DEFER_CONCAT_IMPL(a, b) a##b
#define PARATASK_DEFER_CONCAT(a, b) PARATASK_DEFER_CONCAT_IMPL(a, b)
#define PARATASK_DEFER(lambda) \
    ::paratask::Defer PARATASK_DEFER_CONCAT(_paratask_defer_, __LINE__){lambda}

}  // namespace paratask
