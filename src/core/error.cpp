// ============================================================================
// fanin/core/error.cpp - Error Category Implementation
// ============================================================================

#include "fanin/core/error.hpp"

#include <string>

namespace fanin {

namespace {

class FaninCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "fanin"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::Cancelled:
                return "Operation cancelled";
            case Errc::DeadlineExceeded:
                return "Deadline exceeded";
            case Errc::InvalidArgument:
                return "Invalid argument";
            case Errc::UnitFailed:
                return "Unit of work failed";
            default:
                return "Unknown fanin error";
        }
    }

    // Cancelled units are equivalent to the generic operation_canceled
    // condition so callers can test without naming the fanin category.
    bool equivalent(int code, const std::error_condition& condition) const noexcept override {
        if (condition == std::errc::operation_canceled) {
            return static_cast<Errc>(code) == Errc::Cancelled;
        }
        if (condition == std::errc::timed_out) {
            return static_cast<Errc>(code) == Errc::DeadlineExceeded;
        }
        if (condition == std::errc::invalid_argument) {
            return static_cast<Errc>(code) == Errc::InvalidArgument;
        }
        return default_error_condition(code) == condition;
    }
};

}  // namespace

const std::error_category& FaninCategory() noexcept {
    static const FaninCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), FaninCategory()};
}

}  // namespace fanin
