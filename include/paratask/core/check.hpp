// ============================================================================
// paratask/core/check.hpp - Always-on Invariant Checks
// ============================================================================
//
// PARATASK_CHECK(cond, msg) guards internal invariants of the task pipeline
// (legal state transitions, single settlement, single registry write). It is
// never compiled out. A failure prints the condition, message and source
// location to stderr, then aborts.
//
// User mistakes that can be reported (adding tasks after start, asking for a
// single result when there are several) are returned as Error values instead.
//
// ============================================================================

#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>

namespace paratask::detail {

[[noreturn]] inline void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc) {
    std::fputs("PARATASK_CHECK(", stderr);
    std::fputs(cond_str, stderr);
    std::fputs(") failed: ", stderr);
    std::fputs(msg, stderr);
    std::fputs("\n  in ", stderr);
    std::fputs(loc.function_name(), stderr);
    std::fputs(" (", stderr);
    std::fputs(loc.file_name(), stderr);
    std::fputs(":", stderr);
    std::fputs(std::to_string(loc.line()).c_str(), stderr);
    std::fputs(")\n", stderr);
    std::abort();
}

}  // namespace paratask::detail

#define PARATASK_CHECK(cond, msg)                                                       \
    do {                                                                                \
        if (!(cond)) [[unlikely]] {                                                     \
            ::paratask::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                               \
    } while (0)
