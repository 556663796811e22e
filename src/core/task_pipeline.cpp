// ============================================================================
// paratask/core/task_pipeline.cpp - Stage Driver
// ============================================================================

#include "paratask/core/task_pipeline.hpp"

#include <utility>

#include "paratask/core/check.hpp"
#include "paratask/core/log.hpp"

namespace paratask {

TaskPipeline::TaskPipeline(std::string name, detail::PipelineHost& host)
    : id_(NextTaskId()), name_(std::move(name)), host_(host) {}

TaskStatus TaskPipeline::Status() const noexcept {
    TaskState state = State();
    switch (state) {
        case TaskState::Pending:
            return TaskStatus::Pending;
        case TaskState::Running:
            return TaskStatus::Running;
        case TaskState::Cancelled:
            return TaskStatus::Cancelled;
        default:
            // error_ is written before the release store that left Running
            return error_ ? TaskStatus::Failed : TaskStatus::Succeeded;
    }
}

bool TaskPipeline::Cancel() {
    if (IsFinished()) {
        return false;
    }
    return cancellation_.Cancel();
}

void TaskPipeline::Begin() {
    Post(&TaskPipeline::RunWorkStage);
}

void TaskPipeline::Post(Stage stage) {
    host_.PipelineExecutor().Post([this, stage] { (this->*stage)(); });
}

// ============================================================================
// Stages
// ============================================================================

void TaskPipeline::RunWorkStage() {
    if (CancelIfRequested()) return;

    Transition(TaskState::Running);

    bool cancelled = false;
    {
        ScopedLoggingContext context(host_.PipelineLoggingContext());
        try {
            value_ = InvokeWork(cancellation_.GetToken());
        } catch (const OperationCancelled&) {
            cancelled = true;
        } catch (...) {
            error_ = std::current_exception();
        }
    }

    if (cancelled) {
        PARATASK_LOG_DEBUG("Task [{}] stopped on cancellation", name_);
        Transition(TaskState::Cancelled);
        Settle();
        return;
    }

    if (!error_) {
        Transition(TaskState::Succeeded);
        Continue(TaskState::Succeeded);
        return;
    }

    Transition(TaskState::Failed);
    // With a callback attached the callback owns the error
    if (!HasCallback()) {
        ScopedLoggingContext context(host_.PipelineLoggingContext());
        host_.ReportTaskError(*this);
    }
    Continue(TaskState::Failed);
}

void TaskPipeline::RunCallbackStage() {
    if (cancellation_.IsCancelled()) {
        // The skipped callback owned the work's error
        if (error_) {
            ScopedLoggingContext context(host_.PipelineLoggingContext());
            host_.ReportTaskError(*this);
        }
        SettleCancelled();
        return;
    }

    {
        ScopedLoggingContext context(host_.PipelineLoggingContext());
        try {
            InvokeCallback(value_, error_);
        } catch (...) {
            PARATASK_LOG_ERROR("Exception executing callback for [{}]: {}", name_,
                               DescribeException(std::current_exception()));
        }
    }

    Transition(TaskState::CallbackDone);
    Continue(TaskState::CallbackDone);
}

void TaskPipeline::RunEvaluationStage() {
    if (CancelIfRequested()) return;

    {
        ScopedLoggingContext context(host_.PipelineLoggingContext());
        bool succeeded = host_.EvaluateAndRecord(*this);
        Transition(TaskState::EvaluationDone);
        if (succeeded) {
            host_.CancelSiblings(*this);
        }
    }

    Settle();
}

// ============================================================================
// Transitions
// ============================================================================

void TaskPipeline::Continue(TaskState after) {
    if (after != TaskState::CallbackDone && HasCallback()) {
        Transition(TaskState::CallbackScheduled);
        Post(&TaskPipeline::RunCallbackStage);
    } else if (host_.HasEvaluator()) {
        Post(&TaskPipeline::RunEvaluationStage);
    } else {
        Settle();
    }
}

bool TaskPipeline::CancelIfRequested() {
    if (!cancellation_.IsCancelled()) {
        return false;
    }
    SettleCancelled();
    return true;
}

void TaskPipeline::SettleCancelled() {
    PARATASK_LOG_DEBUG("Task [{}] cancelled in state {}", name_, ToString(State()));
    Transition(TaskState::Cancelled);
    Settle();
}

void TaskPipeline::Transition(TaskState to) {
    TaskState from = state_.load(std::memory_order_relaxed);
    PARATASK_CHECK(CanTransition(from, to), "illegal task state transition");
    state_.store(to, std::memory_order_release);
}

void TaskPipeline::Settle() {
    PARATASK_CHECK(!settled_.exchange(true, std::memory_order_acq_rel), "task pipeline settled twice");
    // The group may be destroyed once the last pipeline settles: nothing may
    // touch this object after the call below.
    host_.OnPipelineSettled(*this);
}

}  // namespace paratask
