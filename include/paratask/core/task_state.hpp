// ============================================================================
// paratask/core/task_state.hpp - Task Pipeline State Machine
// ============================================================================
//
// Each task moves through an explicit state machine. Only the task's own
// pipeline performs transitions, one stage at a time; other threads only read
// the state or raise a cancellation request that the pipeline observes at its
// next stage boundary.
//
//   Pending ──► Running ──► Succeeded ──┬──► CallbackScheduled ──► CallbackDone ──┐
//      │           │    └─► Failed ─────┤                                         │
//      │           │                    └─────────────────────────────────────────┴─► EvaluationDone
//      │           │
//      └───────────┴──────────── (any pre-terminal state) ──────────────────────────► Cancelled
//
// The callback states are skipped when no callback is attached and
// EvaluationDone is skipped when the group has no evaluator, so Succeeded or
// Failed may be where a pipeline ends.
//
// ============================================================================

#pragma once

#include <cstdint>
#include <string_view>

namespace paratask {

// Generated per task, unique within the process. Names are only labels.
using TaskId = std::uint64_t;

[[nodiscard]] TaskId NextTaskId() noexcept;

enum class TaskState : std::uint8_t {
    Pending,
    Running,
    Succeeded,
    Failed,
    CallbackScheduled,
    CallbackDone,
    EvaluationDone,
    Cancelled,
};

// What happened to the work itself, independent of the later stages
enum class TaskStatus : std::uint8_t {
    Pending,
    Running,
    Succeeded,
    Failed,
    Cancelled,
};

[[nodiscard]] bool CanTransition(TaskState from, TaskState to) noexcept;

std::string_view ToString(TaskState state) noexcept;
std::string_view ToString(TaskStatus status) noexcept;

}  // namespace paratask
