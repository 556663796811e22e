// ============================================================================
// paratask/paratask.hpp - Main Include Header
// ============================================================================
//
// This convenience header includes the complete paratask library.
// For smaller builds, include individual headers as needed.
//
// USAGE:
// ------
//   #include <paratask/paratask.hpp>
//   using namespace paratask;
//
// ============================================================================

#pragma once

// Core primitives
#include "paratask/core/check.hpp"
#include "paratask/core/defer.hpp"
#include "paratask/core/error.hpp"
#include "paratask/core/log.hpp"
#include "paratask/core/result.hpp"

// Cancellation
#include "paratask/core/cancellation.hpp"

// Tasks and groups
#include "paratask/core/evaluator.hpp"
#include "paratask/core/logging_context.hpp"
#include "paratask/core/outcome.hpp"
#include "paratask/core/result_registry.hpp"
#include "paratask/core/task_group.hpp"
#include "paratask/core/task_handle.hpp"
#include "paratask/core/task_pipeline.hpp"
#include "paratask/core/task_state.hpp"

// Executors
#include "paratask/io/executor.hpp"
#include "paratask/io/inline_executor.hpp"
#include "paratask/io/thread_pool_executor.hpp"
#include "paratask/io/thread_utils.hpp"

// Synchronization
#include "paratask/sync/completion_signal.hpp"
