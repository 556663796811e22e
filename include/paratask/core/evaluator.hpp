// ============================================================================
// paratask/core/evaluator.hpp - Definition of Done
// ============================================================================
//
// An Evaluator is the group-wide stopping rule. It sees each task's terminal
// result exactly once (after the task's callback, if any) and decides whether
// that result is what the caller was waiting for. The first successful
// Outcome makes the group cancel every sibling that has not finished yet.
//
// Tasks in one group may produce different types, so the value reaches the
// evaluator type-erased; it is empty when the work failed. The error is the
// exception the work threw, or null.
//
// USAGE:
// ------
//   group.SetEvaluator([](const std::any& value, std::exception_ptr error,
//                         const std::string& name) {
//       Outcome<std::string> outcome;
//       if (const auto* body = std::any_cast<std::string>(&value)) {
//           outcome.SetValue(*body);
//           outcome.SetSucceeded(body->find("apple") != std::string::npos);
//       }
//       return outcome;
//   });
//
// ============================================================================

#pragma once

#include <any>
#include <exception>
#include <functional>
#include <string>
#include <utility>

#include "paratask/core/error.hpp"
#include "paratask/core/log.hpp"
#include "paratask/core/outcome.hpp"

namespace paratask {

template <typename R>
using EvaluatorFn = std::function<Outcome<R>(const std::any& value, std::exception_ptr error, const std::string& name)>;

template <typename R>
class Evaluator {
   public:
    explicit Evaluator(EvaluatorFn<R> fn) : fn_(std::move(fn)) {}

    // Exceptions from the user function are logged and turn into an
    // unsuccessful Outcome; they never reach the pipeline.
    Outcome<R> Apply(const std::any& value, const std::exception_ptr& error, const std::string& name) const {
        try {
            return fn_(value, error, name);
        } catch (...) {
            PARATASK_LOG_ERROR("Exception with definition of done on task [{}]: {}", name,
                               DescribeException(std::current_exception()));
            return Outcome<R>::Failure();
        }
    }

   private:
    EvaluatorFn<R> fn_;
};

}  // namespace paratask
