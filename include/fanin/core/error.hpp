// ============================================================================
// fanin/core/error.hpp - Error Codes for fanin
// ============================================================================
//
// Defines a std::error_code-based error infrastructure for the library.
// Units of work report failures as std::error_code values; a default
// constructed code means "no error".
//
// USAGE:
// ------
//   group.Go([&]() -> UnitResult<int> {
//       if (token.IsCancelled()) return {{}, token.Reason()};
//       return {{}, make_error_code(Errc::UnitFailed)};
//   });
//
// ============================================================================

#pragma once

#include <system_error>

namespace fanin {

enum class Errc {
    Cancelled = 1,
    DeadlineExceeded,
    InvalidArgument,
    UnitFailed,
};

const std::error_category& FaninCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

// Convenient alias used throughout the library
using Error = std::error_code;

}  // namespace fanin

// Register with std::error_code
namespace std {
template <>
struct is_error_code_enum<fanin::Errc> : true_type {};
}  // namespace std
