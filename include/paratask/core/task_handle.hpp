// ============================================================================
// paratask/core/task_handle.hpp - Typed Task Surface
// ============================================================================
//
// TaskHandle<T> is what TaskGroup::AddTask() returns: a task whose work
// produces a T. The group owns it; the pointer stays valid for the group's
// lifetime.
//
// Work may take the task's CancellationToken or nothing:
//
//   group.AddTask("fetch", [] { return Fetch(url); });
//   group.AddTask("scan", [](const CancellationToken& token) { ... });
//
// Work returning void produces std::monostate.
//
// CALLBACKS:
// ----------
// A callback sees the work's value, or its exception, exactly once, on a pool
// worker, after the work finished. It must be attached before the group
// starts. A task with a callback does not report its work failure through the
// group's error channel: the callback is expected to handle it.
//
//   auto task = group.AddTask("fetch", [] { return Fetch(url); }).Value();
//   task->AttachCallback([](const std::optional<Response>& response,
//                           std::exception_ptr error) {
//       if (error) { ... } else { Log(response->code); }
//   });
//
// ============================================================================

#pragma once

#include <any>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "paratask/core/cancellation.hpp"
#include "paratask/core/error.hpp"
#include "paratask/core/task_pipeline.hpp"

namespace paratask {

namespace detail {

template <typename F, bool = std::is_invocable_v<F&, const CancellationToken&>>
struct WorkInvokeResult {
    using type = std::invoke_result_t<F&, const CancellationToken&>;
};

template <typename F>
struct WorkInvokeResult<F, false> {
    using type = std::invoke_result_t<F&>;
};

template <typename F>
using RawWorkResultT = typename WorkInvokeResult<std::decay_t<F>>::type;

}  // namespace detail

// Value type a work callable produces, with void mapped to std::monostate
template <typename F>
using WorkResultT = std::conditional_t<std::is_void_v<detail::RawWorkResultT<F>>, std::monostate,
                                       std::decay_t<detail::RawWorkResultT<F>>>;

template <typename T>
using WorkFn = std::function<T(const CancellationToken&)>;

namespace detail {

// Normalize any accepted work callable to WorkFn<T>. Returns an empty
// function if `work` is itself an empty function object.
template <typename T, typename F>
WorkFn<T> MakeWorkFn(F&& work) {
    using Fn = std::decay_t<F>;
    if constexpr (std::is_constructible_v<bool, const Fn&>) {
        if (!static_cast<bool>(work)) {
            return {};
        }
    }

    if constexpr (std::is_invocable_v<Fn&, const CancellationToken&>) {
        if constexpr (std::is_void_v<RawWorkResultT<Fn>>) {
            return [fn = Fn(std::forward<F>(work))](const CancellationToken& token) mutable -> T {
                fn(token);
                return T{};
            };
        } else {
            return [fn = Fn(std::forward<F>(work))](const CancellationToken& token) mutable -> T {
                return fn(token);
            };
        }
    } else {
        if constexpr (std::is_void_v<RawWorkResultT<Fn>>) {
            return [fn = Fn(std::forward<F>(work))](const CancellationToken&) mutable -> T {
                fn();
                return T{};
            };
        } else {
            return [fn = Fn(std::forward<F>(work))](const CancellationToken&) mutable -> T { return fn(); };
        }
    }
}

}  // namespace detail

template <typename T>
class TaskHandle : public TaskPipeline {
    static_assert(std::is_copy_constructible_v<T>, "task values are shared with the evaluator and must be copyable");

   public:
    using Callback = std::function<void(const std::optional<T>& value, std::exception_ptr error)>;

    TaskHandle(std::string name, WorkFn<T> work, detail::PipelineHost& host)
        : TaskPipeline(std::move(name), host), work_(std::move(work)) {}

    // AlreadyStarted once the group has started, InvalidArgument for an empty
    // callback. Attaching again before start replaces the callback.
    [[nodiscard]] paratask::Error AttachCallback(Callback callback) {
        if (!callback) {
            return make_error_code(Errc::InvalidArgument);
        }
        return Host().MutateBeforeStart([this, &callback] { callback_ = std::move(callback); });
    }

    bool HasCallback() const noexcept override { return static_cast<bool>(callback_); }

    // The work's value once it has succeeded
    std::optional<T> GetValue() const {
        if (const T* value = std::any_cast<T>(&Value())) {
            return *value;
        }
        return std::nullopt;
    }

   protected:
    std::any InvokeWork(const CancellationToken& token) override { return std::any(work_(token)); }

    void InvokeCallback(const std::any& value, const std::exception_ptr& error) override {
        std::optional<T> typed;
        if (const T* v = std::any_cast<T>(&value)) {
            typed = *v;
        }
        callback_(typed, error);
    }

   private:
    WorkFn<T> work_;
    Callback callback_;
};

}  // namespace paratask
