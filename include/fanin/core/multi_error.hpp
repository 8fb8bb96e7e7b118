// ============================================================================
// fanin/core/multi_error.hpp - Aggregate Error
// ============================================================================
//
// MultiError is the single error value a ResultGroup hands back from Wait()
// when one or more units failed. It keeps every recorded component error in
// the order the units reported them.
//
// A group that recorded nothing returns std::nullopt instead of an empty
// MultiError, so "no value" is the only success signal.
//
// USAGE:
// ------
//   auto [results, err] = group.Wait();
//   if (err) {
//       std::cerr << err->Message() << std::endl;
//       if (err->Is(std::errc::operation_canceled)) { ... }
//   }
//
// ============================================================================

#pragma once

#include "fanin/core/error.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fanin {

class MultiError {
   public:
    explicit MultiError(std::vector<Error> errors) : errors_(std::move(errors)) {}

    // Component messages joined with '\n', in recorded order
    std::string Message() const;

    // Ordered component errors
    const std::vector<Error>& Errors() const noexcept { return errors_; }

    size_t Size() const noexcept { return errors_.size(); }

    // True if any component compares equal to `error`
    bool Is(const Error& error) const noexcept;

    // True if any component is equivalent to `condition`
    bool Is(const std::error_condition& condition) const noexcept;

   private:
    std::vector<Error> errors_;
};

std::ostream& operator<<(std::ostream& os, const MultiError& error);

}  // namespace fanin
