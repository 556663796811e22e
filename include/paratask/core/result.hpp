// ============================================================================
// paratask/core/result.hpp - Value-or-Error Return Type
// ============================================================================
//
// Result<T, E> holds either a value (T) or an error (E). TaskGroup returns it
// from calls that produce something and can fail structurally: AddTask,
// WaitForResults, WaitForSingleResult.
//
// USAGE:
// ------
//   auto single = group.WaitForSingleResult();
//   if (single.IsErr()) {
//       if (single.Error() == Errc::AmbiguousResult) { /* pick one */ }
//       return;
//   }
//   Use(single.Value());
//
// ============================================================================

#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace paratask {

template <typename T, typename E>
class Result;

// ============================================================================
// Ok and Err Tag Types
// ============================================================================

template <typename T>
struct OkTag {
    T value;

    template <typename U>
    explicit OkTag(U&& v) : value(std::forward<U>(v)) {}
};

template <typename E>
struct ErrTag {
    E error;

    template <typename U>
    explicit ErrTag(U&& e) : error(std::forward<U>(e)) {}
};

template <typename T>
OkTag<std::decay_t<T>> Ok(T&& value) {
    return OkTag<std::decay_t<T>>(std::forward<T>(value));
}

template <typename E>
ErrTag<std::decay_t<E>> Err(E&& error) {
    return ErrTag<std::decay_t<E>>(std::forward<E>(error));
}

// ============================================================================
// Result<T, E>
// ============================================================================
template <typename T, typename E>
class Result {
   public:
    template <typename U>
    Result(OkTag<U>&& ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    template <typename U>
    Result(ErrTag<U>&& err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool IsOk() const noexcept { return data_.index() == 0; }
    bool IsErr() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return IsOk(); }

    // Undefined behavior if IsErr()
    T& Value() & { return std::get<0>(data_); }
    const T& Value() const& { return std::get<0>(data_); }
    T&& Value() && { return std::get<0>(std::move(data_)); }

    // Undefined behavior if IsOk()
    E& Error() & { return std::get<1>(data_); }
    const E& Error() const& { return std::get<1>(data_); }
    E&& Error() && { return std::get<1>(std::move(data_)); }

   private:
    std::variant<T, E> data_;
};

}  // namespace paratask
