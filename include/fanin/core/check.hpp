// ============================================================================
// fanin/core/check.hpp - Precondition Checks
// ============================================================================
//
// FANIN_CHECK(cond, msg) aborts the process when `cond` is false, in every
// build type. It guards caller mistakes that have no sensible recovery: a
// threshold below 1, Go() on a drained group, a second Wait(), Done() on an
// idle WaitGroup. Failures that units report never come through here.
//
// ============================================================================

#pragma once

#include <source_location>

namespace fanin::detail {

// Reports the failed condition with its location on stderr, then aborts
[[noreturn]] void CheckFailed(const char* expr, const char* msg, std::source_location where) noexcept;

}  // namespace fanin::detail

#define FANIN_CHECK(cond, msg)                                                          \
    do {                                                                                \
        if (!(cond)) [[unlikely]] {                                                     \
            ::fanin::detail::CheckFailed(#cond, (msg), std::source_location::current()); \
        }                                                                               \
    } while (0)
