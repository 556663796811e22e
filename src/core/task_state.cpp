// ============================================================================
// paratask/core/task_state.cpp - Transition Table
// ============================================================================

#include "paratask/core/task_state.hpp"

#include <array>
#include <atomic>
#include <cstddef>

namespace paratask {

namespace {

constexpr std::size_t kNumStates = static_cast<std::size_t>(TaskState::Cancelled) + 1;

using Row = std::array<bool, kNumStates>;

// kTransitions[from][to]
// Columns: Pending, Running, Succeeded, Failed, CallbackScheduled, CallbackDone, EvaluationDone, Cancelled
constexpr std::array<Row, kNumStates> kTransitions = {{
    /* Pending           */ {false, true, false, false, false, false, false, true},
    /* Running           */ {false, false, true, true, false, false, false, true},
    /* Succeeded         */ {false, false, false, false, true, false, true, true},
    /* Failed            */ {false, false, false, false, true, false, true, true},
    /* CallbackScheduled */ {false, false, false, false, false, true, false, true},
    /* CallbackDone      */ {false, false, false, false, false, false, true, true},
    /* EvaluationDone    */ {false, false, false, false, false, false, false, false},
    /* Cancelled         */ {false, false, false, false, false, false, false, false},
}};

std::atomic<TaskId> g_next_task_id{1};

}  // namespace

TaskId NextTaskId() noexcept {
    return g_next_task_id.fetch_add(1, std::memory_order_relaxed);
}

bool CanTransition(TaskState from, TaskState to) noexcept {
    return kTransitions[static_cast<std::size_t>(from)][static_cast<std::size_t>(to)];
}

std::string_view ToString(TaskState state) noexcept {
    switch (state) {
        case TaskState::Pending:
            return "Pending";
        case TaskState::Running:
            return "Running";
        case TaskState::Succeeded:
            return "Succeeded";
        case TaskState::Failed:
            return "Failed";
        case TaskState::CallbackScheduled:
            return "CallbackScheduled";
        case TaskState::CallbackDone:
            return "CallbackDone";
        case TaskState::EvaluationDone:
            return "EvaluationDone";
        case TaskState::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

std::string_view ToString(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:
            return "Pending";
        case TaskStatus::Running:
            return "Running";
        case TaskStatus::Succeeded:
            return "Succeeded";
        case TaskStatus::Failed:
            return "Failed";
        case TaskStatus::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

}  // namespace paratask
