// ============================================================================
// Example 02: Error Threshold And Cancellation
// ============================================================================
//
// A group with an error threshold cancels its derived token once enough units
// have failed, and the slow units watching that token give up early.
//
// RUN:
//   cd build && ./examples/02_error_threshold
//
// ============================================================================

#include "fanin/fanin.hpp"

#include <chrono>
#include <iostream>

using namespace fanin;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== fanin Example 02: Error Threshold ===" << std::endl;
    std::cout << std::endl;

    CancellationSource root;
    auto [group, token] = WithErrorThreshold<int>(root.GetToken(), 2);

    // Two fast failures
    for (int i = 0; i < 2; ++i) {
        group->Go([]() -> UnitResult<int> { return {{}, make_error_code(Errc::UnitFailed)}; });
    }

    // Slow units that stop as soon as the threshold cancels the token
    for (int i = 0; i < 4; ++i) {
        group->Go([token = token, i]() -> UnitResult<int> {
            if (token.WaitFor(2s)) {
                return {{}, token.Reason()};
            }
            return {{i}, {}};
        });
    }

    auto start = std::chrono::steady_clock::now();
    auto [results, err] = group->Wait();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    std::cout << "Wait() returned after " << elapsed.count() << " ms" << std::endl;
    std::cout << "Results: " << results.size() << std::endl;
    std::cout << "Token cancelled: " << (token.IsCancelled() ? "yes" : "no") << std::endl;
    if (err) {
        std::cout << "Recorded errors (" << err->Size() << "):" << std::endl;
        std::cout << *err << std::endl;
    }

    return 0;
}
