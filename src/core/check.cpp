// ============================================================================
// fanin/core/check.cpp - Precondition Failure Reporting
// ============================================================================

#include "fanin/core/check.hpp"

#include <cstdio>
#include <cstdlib>

namespace fanin::detail {

void CheckFailed(const char* expr, const char* msg, std::source_location where) noexcept {
    std::fprintf(stderr, "fanin: check `%s` failed: %s\n    at %s:%u in %s\n", expr, msg, where.file_name(),
                 static_cast<unsigned>(where.line()), where.function_name());
    std::fflush(stderr);
    std::abort();
}

}  // namespace fanin::detail
