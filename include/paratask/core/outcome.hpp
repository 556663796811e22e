// ============================================================================
// paratask/core/outcome.hpp - Definition-of-Done Verdict
// ============================================================================
//
// Outcome<R> is what an Evaluator returns for one task: whether the task's
// result satisfies the stopping condition, and the value extracted from it.
// A default-constructed Outcome is unsuccessful and empty.
//
// USAGE:
// ------
//   Outcome<std::string> outcome;
//   outcome.SetValue(body);
//   if (Contains(body, "apple")) outcome.SetSucceeded(true);
//   return outcome;
//
// ============================================================================

#pragma once

#include <optional>
#include <utility>

namespace paratask {

template <typename R>
class Outcome {
   public:
    Outcome() = default;

    Outcome(bool succeeded, R value) : succeeded_(succeeded), value_(std::move(value)) {}

    [[nodiscard]] static Outcome Success(R value) { return Outcome(true, std::move(value)); }

    [[nodiscard]] static Outcome Failure() { return Outcome(); }

    Outcome& SetSucceeded(bool succeeded) {
        succeeded_ = succeeded;
        return *this;
    }

    Outcome& SetValue(R value) {
        value_ = std::move(value);
        return *this;
    }

    bool IsSuccessful() const noexcept { return succeeded_; }

    bool HasValue() const noexcept { return value_.has_value(); }

    const std::optional<R>& Value() const& noexcept { return value_; }
    std::optional<R>&& Value() && noexcept { return std::move(value_); }

   private:
    bool succeeded_ = false;
    std::optional<R> value_;
};

template <typename R>
bool operator==(const Outcome<R>& lhs, const Outcome<R>& rhs) {
    return lhs.IsSuccessful() == rhs.IsSuccessful() && lhs.Value() == rhs.Value();
}

}  // namespace paratask
