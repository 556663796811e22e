// ============================================================================
// paratask/core/task_pipeline.hpp - Per-Task Completion Pipeline
// ============================================================================
//
// TaskPipeline drives one task through its stages, each posted to the group's
// executor as a separate unit of work:
//
//   1. work        - run the user computation; capture value or exception
//   2. callback    - optional per-task handler, sees (value, error)
//   3. evaluation  - optional definition of done; writes the registry and,
//                    on success, asks the group to cancel the siblings
//
// A stage posts its successor when it finishes, so stages of one task never
// overlap and always run in this order. At every stage boundary the pipeline
// checks its cancellation token; a stage that has not begun when the request
// arrives is skipped and the task ends Cancelled. Whatever path it takes, a
// pipeline settles exactly once, which is what the group's aggregate signal
// counts.
//
// Evaluation reads the task's terminal outcome directly, so it runs the same
// way whether or not a callback is attached.
//
// This class is type-erased: the work's value travels as std::any. The typed
// surface is TaskHandle<T>.
//
// ============================================================================

#pragma once

#include <any>
#include <atomic>
#include <exception>
#include <functional>
#include <string>

#include "paratask/core/cancellation.hpp"
#include "paratask/core/error.hpp"
#include "paratask/core/logging_context.hpp"
#include "paratask/core/task_state.hpp"
#include "paratask/io/executor.hpp"

namespace paratask {

template <typename R>
class TaskGroup;

class TaskPipeline;

namespace detail {

// What a pipeline needs from the group that owns it
class PipelineHost {
   public:
    virtual ~PipelineHost() = default;

    virtual Executor& PipelineExecutor() noexcept = 0;

    virtual LoggingContext* PipelineLoggingContext() noexcept = 0;

    // Runs the mutation under the group's registration lock unless the group
    // has started, in which case it returns AlreadyStarted.
    virtual Error MutateBeforeStart(const std::function<void()>& mutation) = 0;

    virtual bool HasEvaluator() const noexcept = 0;

    // Apply the evaluator and record the outcome; returns whether it succeeded
    virtual bool EvaluateAndRecord(TaskPipeline& task) = 0;

    virtual void CancelSiblings(TaskPipeline& task) = 0;

    // Work failed and no callback will see the error
    virtual void ReportTaskError(TaskPipeline& task) = 0;

    virtual void OnPipelineSettled(TaskPipeline& task) = 0;
};

}  // namespace detail

class TaskPipeline {
   public:
    TaskPipeline(std::string name, detail::PipelineHost& host);
    virtual ~TaskPipeline() = default;

    TaskPipeline(const TaskPipeline&) = delete;
    TaskPipeline& operator=(const TaskPipeline&) = delete;

    TaskId Id() const noexcept { return id_; }

    // Label only; several tasks may share a name
    const std::string& Name() const noexcept { return name_; }

    TaskState State() const noexcept { return state_.load(std::memory_order_acquire); }

    TaskStatus Status() const noexcept;

    // The pipeline has settled: no stage of this task will run again
    bool IsFinished() const noexcept { return settled_.load(std::memory_order_acquire); }

    bool IsCancellationRequested() const noexcept { return cancellation_.IsCancelled(); }

    // Request cancellation. Returns false if the pipeline already finished or
    // a request was already made.
    bool Cancel();

    virtual bool HasCallback() const noexcept = 0;

    // The work's terminal value (empty on failure or if the work never ran)
    // and error. Read them from this task's own stages, or after the group
    // is done.
    const std::any& Value() const noexcept { return value_; }
    const std::exception_ptr& Exception() const noexcept { return error_; }

   protected:
    virtual std::any InvokeWork(const CancellationToken& token) = 0;

    virtual void InvokeCallback(const std::any& value, const std::exception_ptr& error) = 0;

    detail::PipelineHost& Host() noexcept { return host_; }

   private:
    template <typename R>
    friend class TaskGroup;

    using Stage = void (TaskPipeline::*)();

    // Called by the group at Start()
    void Begin();

    void Post(Stage stage);

    void RunWorkStage();
    void RunCallbackStage();
    void RunEvaluationStage();

    // Callback, evaluation or settle, whichever comes next after `after`
    void Continue(TaskState after);

    bool CancelIfRequested();

    void SettleCancelled();

    void Transition(TaskState to);

    void Settle();

    const TaskId id_;
    const std::string name_;
    detail::PipelineHost& host_;

    std::atomic<TaskState> state_{TaskState::Pending};
    std::atomic<bool> settled_{false};
    CancellationSource cancellation_;

    // Written by the work stage only
    std::any value_;
    std::exception_ptr error_;
};

}  // namespace paratask
