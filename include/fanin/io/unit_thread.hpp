// ============================================================================
// fanin/io/unit_thread.hpp - Per-Unit Thread Setup
// ============================================================================
//
// ResultGroup resolves its Options into one UnitThreadConfig per unit on the
// launching thread, and the unit thread applies it to itself before running
// the unit.
//
// ============================================================================

#pragma once

#include <string>

namespace fanin {

struct UnitThreadConfig {
    std::string name;    // empty: keep the inherited name (Linux caps at 15 chars)
    int cpu = -1;        // negative: no pinning
    int nice_value = 0;  // 0: keep the inherited priority
};

// Applies every set field to the calling thread. Returns false if the kernel
// rejected any of them; the remaining fields are still applied.
bool ApplyUnitThreadConfig(const UnitThreadConfig& config);

// Name of the calling thread, empty if it cannot be read
std::string CurrentThreadName();

}  // namespace fanin
