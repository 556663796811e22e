// ============================================================================
// paratask/core/task_group.hpp - Parallel Tasks with a Definition of Done
// ============================================================================
//
// TaskGroup<R> runs independent tasks in parallel on a shared pool. Each task
// may have its own completion callback; the group may have a completion
// callback of its own and a "definition of done" (Evaluator) that races the
// tasks against each other: the first task whose result satisfies it makes
// the group cancel every sibling that has not finished. R is the type of the
// value the evaluator extracts from a winning task.
//
// LIFECYCLE:
// ----------
//   1. Build: AddTask, AttachCallback, SetEvaluator, SetCompletionCallback.
//   2. Start(): freezes the group and begins every task. Nothing runs before
//      this point. Further mutation fails with Errc::AlreadyStarted.
//   3. Wait: WaitForTasks / WaitForResults / WaitForSingleResult block until
//      every task pipeline has settled and the completion callback has run.
//
// USAGE:
// ------
//   TaskGroup<std::string> group;
//   group.AddTask("google", [&] { return Get(google_url); });
//   group.AddTask("apple", [&] { return Get(apple_url); });
//   group.SetEvaluator([](const std::any& value, std::exception_ptr, const std::string& name) {
//       Outcome<std::string> outcome;
//       if (const auto* html = std::any_cast<std::string>(&value)) {
//           outcome.SetValue(*html).SetSucceeded(html->find("apple") != std::string::npos);
//       }
//       return outcome;
//   });
//
//   auto html = group.WaitForSingleResult();
//   if (html.IsErr()) { /* NoResult or AmbiguousResult */ }
//
// RACES:
// ------
// No lock decides a single winner. Every successful outcome sweeps its
// siblings independently, so two tasks that succeed within the same window
// are both recorded. WaitForSingleResult() reports that as AmbiguousResult.
//
// THREADING:
// ----------
// The Wait* calls block the calling thread. Do not call them from a worker of
// the group's own executor. A started group blocks in its destructor until
// every pipeline has settled.
//
// ============================================================================

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "paratask/core/check.hpp"
#include "paratask/core/defer.hpp"
#include "paratask/core/error.hpp"
#include "paratask/core/evaluator.hpp"
#include "paratask/core/log.hpp"
#include "paratask/core/logging_context.hpp"
#include "paratask/core/outcome.hpp"
#include "paratask/core/result.hpp"
#include "paratask/core/result_registry.hpp"
#include "paratask/core/task_handle.hpp"
#include "paratask/core/task_pipeline.hpp"
#include "paratask/io/executor.hpp"
#include "paratask/io/thread_pool_executor.hpp"
#include "paratask/io/thread_utils.hpp"
#include "paratask/sync/completion_signal.hpp"

namespace paratask {

template <typename R>
class TaskGroup : private detail::PipelineHost {
   public:
    using CompletionCallback = std::function<void()>;

    struct Options {
        // Shared pool, not owned. When null the group creates its own.
        Executor* executor = nullptr;

        // Size of the group's own pool; 0 means hardware concurrency
        size_t num_threads = 0;

        std::string thread_name_prefix = "paratask";

        // Acquired around every stage the group runs
        std::shared_ptr<LoggingContext> logging_context;

        // Receives work failures of tasks without a callback. Default: log.
        TaskErrorHandler error_handler;

        Options() = default;
    };

    TaskGroup() : TaskGroup(Options{}) {}

    explicit TaskGroup(Executor& executor) : TaskGroup(WithExecutor(executor)) {}

    explicit TaskGroup(Options options) : options_(std::move(options)) {
        if (options_.executor != nullptr) {
            executor_ = options_.executor;
        } else {
            ThreadPoolExecutor::Options pool;
            pool.num_threads = options_.num_threads != 0 ? options_.num_threads : DefaultParallelism();
            pool.thread_name_prefix = options_.thread_name_prefix;
            owned_executor_ = std::make_unique<ThreadPoolExecutor>(pool);
            executor_ = owned_executor_.get();
        }
    }

    // Pipelines refer back to the group
    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;
    TaskGroup(TaskGroup&&) = delete;
    TaskGroup& operator=(TaskGroup&&) = delete;

    ~TaskGroup() override {
        if (started_.load(std::memory_order_acquire)) {
            done_.Wait();
        }
    }

    // ========================================================================
    // Building
    // ========================================================================

    // Register a task. Its work runs once the group starts.
    template <typename F>
    Result<TaskHandle<WorkResultT<F>>*, Error> AddTask(std::string name, F&& work) {
        using T = WorkResultT<F>;

        WorkFn<T> fn = detail::MakeWorkFn<T>(std::forward<F>(work));
        if (!fn) {
            return Err(make_error_code(Errc::InvalidArgument));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (started_.load(std::memory_order_acquire)) {
            return Err(make_error_code(Errc::AlreadyStarted));
        }
        auto task = std::make_unique<TaskHandle<T>>(std::move(name), std::move(fn), AsHost());
        TaskHandle<T>* handle = task.get();
        tasks_.push_back(std::move(task));
        return Ok(handle);
    }

    // Applies to every task of the group, registered before or after this call
    [[nodiscard]] Error SetEvaluator(EvaluatorFn<R> fn) {
        if (!fn) {
            return make_error_code(Errc::InvalidArgument);
        }
        return MutateBeforeStart([this, &fn] { evaluator_.emplace(std::move(fn)); });
    }

    // Runs once, on the pool, after every task pipeline has settled
    [[nodiscard]] Error SetCompletionCallback(CompletionCallback callback) {
        if (!callback) {
            return make_error_code(Errc::InvalidArgument);
        }
        return MutateBeforeStart([this, &callback] { completion_callback_ = std::move(callback); });
    }

    // ========================================================================
    // Running
    // ========================================================================

    // Begin every task without blocking. Idempotent; NoTasks if the group is
    // empty, ExecutorStopped if nothing would ever run its stages.
    Error Start() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (started_.load(std::memory_order_acquire)) {
                return {};
            }
            if (tasks_.empty()) {
                return make_error_code(Errc::NoTasks);
            }
            if (!executor_->IsRunning()) {
                PARATASK_LOG_ERROR("Cannot start {} tasks on a stopped executor", tasks_.size());
                return make_error_code(Errc::ExecutorStopped);
            }
            remaining_ = std::make_unique<CountdownLatch>(tasks_.size());
            started_.store(true, std::memory_order_release);
        }

        // tasks_ is frozen from here on. Pipelines may run inline, so the
        // registration lock is not held while they begin.
        PARATASK_LOG_DEBUG("Starting {} tasks", tasks_.size());
        for (auto& task : tasks_) {
            task->Begin();
        }
        return {};
    }

    // Start(), then block until the group is done. Work failures never
    // surface here; only structural errors do.
    Error WaitForTasks() {
        if (auto ec = Start()) {
            return ec;
        }
        if (executor_->IsRunningCallback() && !done_.IsSet()) {
            PARATASK_LOG_WARN("Waiting for tasks from a worker of the group's own executor");
        }
        done_.Wait();
        return {};
    }

    Result<Results<R>, Error> WaitForResults() {
        if (auto ec = WaitForTasks()) {
            return Err(ec);
        }
        return Ok(registry_.Snapshot());
    }

    // The value of the one successful outcome. NoResult when no task
    // succeeded, AmbiguousResult when several did, EmptyResult when the
    // winner carries no value.
    Result<R, Error> WaitForSingleResult() {
        auto results = WaitForResults();
        if (results.IsErr()) {
            return Err(results.Error());
        }
        auto single = results.Value().GetSingleResult();
        if (single.IsErr()) {
            return Err(single.Error());
        }
        if (!single.Value().HasValue()) {
            return Err(make_error_code(Errc::EmptyResult));
        }
        return Ok(*std::move(single).Value().Value());
    }

    // Best-effort cancellation of every unfinished task except `excluding`.
    // Safe to call repeatedly and from any thread.
    void CancelRemaining(const TaskPipeline* excluding = nullptr) {
        // Before start tasks_ may still grow; afterwards it is frozen and the
        // sweep runs without the registration lock.
        std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
        if (!started_.load(std::memory_order_acquire)) {
            lock.lock();
        }

        size_t requested = 0;
        for (auto& task : tasks_) {
            if (task.get() == excluding || task->IsFinished()) {
                continue;
            }
            if (task->Cancel()) {
                ++requested;
            }
        }
        if (requested > 0) {
            PARATASK_LOG_DEBUG("Requested cancellation of {} tasks", requested);
        }
    }

    // ========================================================================
    // Query
    // ========================================================================

    // False until started, then whether the group is done
    bool IsDone() const { return started_.load(std::memory_order_acquire) && done_.IsSet(); }

    bool IsStarted() const noexcept { return started_.load(std::memory_order_acquire); }

    bool HasEvaluator() const noexcept override { return evaluator_.has_value(); }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    // Tasks whose pipeline has not settled yet
    size_t CountRemaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& task : tasks_) {
            if (!task->IsFinished()) ++count;
        }
        return count;
    }

    // Live view of the recorded outcomes
    const ResultRegistry<R>& Registry() const noexcept { return registry_; }

    Executor& GetExecutor() noexcept { return *executor_; }

   private:
    static Options WithExecutor(Executor& executor) {
        Options options;
        options.executor = &executor;
        return options;
    }

    static size_t DefaultParallelism() {
        size_t n = std::thread::hardware_concurrency();
        return n != 0 ? n : GetNumCpus();
    }

    detail::PipelineHost& AsHost() noexcept { return *this; }

    // ========================================================================
    // PipelineHost
    // ========================================================================

    Executor& PipelineExecutor() noexcept override { return *executor_; }

    LoggingContext* PipelineLoggingContext() noexcept override { return options_.logging_context.get(); }

    Error MutateBeforeStart(const std::function<void()>& mutation) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_.load(std::memory_order_acquire)) {
            return make_error_code(Errc::AlreadyStarted);
        }
        mutation();
        return {};
    }

    bool EvaluateAndRecord(TaskPipeline& task) override {
        Outcome<R> outcome = evaluator_->Apply(task.Value(), task.Exception(), task.Name());
        bool succeeded = outcome.IsSuccessful();
        bool recorded = registry_.Record(task.Id(), task.Name(), std::move(outcome));
        PARATASK_CHECK(recorded, "task outcome recorded twice");
        if (succeeded) {
            PARATASK_LOG_DEBUG("Definition of done satisfied by task [{}]", task.Name());
        }
        return succeeded;
    }

    void CancelSiblings(TaskPipeline& task) override { CancelRemaining(&task); }

    void ReportTaskError(TaskPipeline& task) override {
        if (!options_.error_handler) {
            PARATASK_LOG_ERROR("Exception running task [{}]: {}", task.Name(), DescribeException(task.Exception()));
            return;
        }
        try {
            options_.error_handler(task.Name(), task.Exception());
        } catch (...) {
            PARATASK_LOG_ERROR("Exception in error handler for task [{}]: {}", task.Name(),
                               DescribeException(std::current_exception()));
        }
    }

    void OnPipelineSettled(TaskPipeline&) override {
        if (remaining_->CountDown()) {
            executor_->Post([this] { Finish(); });
        }
    }

    // Last step of the group: completion callback, then the aggregate signal
    void Finish() {
        PARATASK_DEFER([this] { done_.Set(); });
        if (!completion_callback_) {
            return;
        }
        ScopedLoggingContext context(options_.logging_context.get());
        try {
            completion_callback_();
        } catch (...) {
            PARATASK_LOG_ERROR("Exception executing completion callback: {}",
                               DescribeException(std::current_exception()));
        }
    }

    // Declared first so that it is destroyed last
    std::unique_ptr<ThreadPoolExecutor> owned_executor_;

    Options options_;
    Executor* executor_ = nullptr;

    // Registration lock: tasks_, evaluator_, completion_callback_ and the
    // started_ transition. Pipelines never take it.
    mutable std::mutex mutex_;
    std::atomic<bool> started_{false};
    std::vector<std::unique_ptr<TaskPipeline>> tasks_;
    std::optional<Evaluator<R>> evaluator_;
    CompletionCallback completion_callback_;

    ResultRegistry<R> registry_;
    std::unique_ptr<CountdownLatch> remaining_;
    CompletionEvent done_;
};

}  // namespace paratask
