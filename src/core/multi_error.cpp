// ============================================================================
// fanin/core/multi_error.cpp - Aggregate Error Implementation
// ============================================================================

#include "fanin/core/multi_error.hpp"

#include <algorithm>
#include <ostream>

namespace fanin {

std::string MultiError::Message() const {
    std::string out;
    for (size_t i = 0; i < errors_.size(); ++i) {
        if (i > 0) {
            out.push_back('\n');
        }
        out += errors_[i].message();
    }
    return out;
}

bool MultiError::Is(const Error& error) const noexcept {
    return std::any_of(errors_.begin(), errors_.end(), [&](const Error& e) { return e == error; });
}

bool MultiError::Is(const std::error_condition& condition) const noexcept {
    return std::any_of(errors_.begin(), errors_.end(), [&](const Error& e) { return e == condition; });
}

std::ostream& operator<<(std::ostream& os, const MultiError& error) {
    return os << error.Message();
}

}  // namespace fanin
