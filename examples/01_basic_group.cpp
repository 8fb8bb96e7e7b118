// ============================================================================
// Example 01: Basic ResultGroup Usage
// ============================================================================
//
// Fans a batch of lookups out to parallel units and gathers their results and
// failures with a single Wait().
//
// RUN:
//   cd build && ./examples/01_basic_group
//
// ============================================================================

#include "fanin/fanin.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace fanin;
using namespace std::chrono_literals;

// Pretend lookup: odd ids fail, even ids return two records
UnitResult<std::string> Lookup(int id) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10 * id));
    if (id % 2 == 1) {
        return {{}, make_error_code(Errc::UnitFailed)};
    }
    return {{"record-" + std::to_string(id) + "a", "record-" + std::to_string(id) + "b"}, {}};
}

int main() {
    std::cout << "=== fanin Example 01: Basic Group ===" << std::endl;
    std::cout << std::endl;

    ResultGroup<std::string> group;
    for (int id = 0; id < 6; ++id) {
        group.Go([id] { return Lookup(id); });
    }

    auto [results, err] = group.Wait();

    std::cout << "Collected " << results.size() << " records:" << std::endl;
    for (const auto& r : results) {
        std::cout << "  " << r << std::endl;
    }

    if (err) {
        std::cout << err->Size() << " unit(s) failed:" << std::endl;
        std::cout << *err << std::endl;
    }

    return 0;
}
