// ============================================================================
// paratask/core/error.hpp - Error Codes for paratask
// ============================================================================
//
// Structural errors (misuse of a TaskGroup, missing or ambiguous results) are
// reported synchronously as std::error_code values in the paratask category.
// Failures raised by user code (work, callbacks, evaluators) are captured as
// std::exception_ptr and never cross the library boundary as exceptions.
//
// USAGE:
// ------
//   Error ec = group.Start();
//   if (ec == Errc::NoTasks) { /* nothing registered */ }
//
// ============================================================================

#pragma once

#include <exception>
#include <functional>
#include <string>
#include <system_error>

namespace paratask {

enum class Errc {
    AlreadyStarted = 1,
    NoTasks,
    NoResult,
    AmbiguousResult,
    EmptyResult,
    InvalidArgument,
    ExecutorStopped,
};

const std::error_category& ParataskCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

// Convenient alias used throughout the library
using Error = std::error_code;

// Render a captured exception for logs: what() for std::exception, otherwise
// a fixed placeholder. An empty pointer renders as "no error".
std::string DescribeException(const std::exception_ptr& error);

// Error channel for work failures of tasks that have no callback attached.
using TaskErrorHandler = std::function<void(const std::string& task_name, std::exception_ptr error)>;

}  // namespace paratask

// Register with std::error_code
namespace std {
template <>
struct is_error_code_enum<paratask::Errc> : true_type {};
}  // namespace std
