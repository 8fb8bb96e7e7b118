// ============================================================================
// fanin/io/unit_thread.cpp - Per-Unit Thread Setup
// ============================================================================

#include "fanin/io/unit_thread.hpp"

#include <pthread.h>
#include <sched.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <algorithm>

namespace fanin {

namespace {

constexpr size_t kMaxThreadName = 15;

bool PinToCpu(int cpu) {
    if (cpu >= CPU_SETSIZE) {
        return false;
    }
    cpu_set_t set;
    CPU_ZERO(&set);
    CPU_SET(cpu, &set);
    return pthread_setaffinity_np(pthread_self(), sizeof(set), &set) == 0;
}

bool Renice(int nice_value) {
    nice_value = std::clamp(nice_value, -20, 19);
    auto tid = static_cast<id_t>(syscall(SYS_gettid));
    return setpriority(PRIO_PROCESS, tid, nice_value) == 0;
}

}  // namespace

bool ApplyUnitThreadConfig(const UnitThreadConfig& config) {
    bool ok = true;
    if (config.cpu >= 0) {
        ok = PinToCpu(config.cpu) && ok;
    }
    if (!config.name.empty()) {
        ok = pthread_setname_np(pthread_self(), config.name.substr(0, kMaxThreadName).c_str()) == 0 && ok;
    }
    if (config.nice_value != 0) {
        ok = Renice(config.nice_value) && ok;
    }
    return ok;
}

std::string CurrentThreadName() {
    char buf[kMaxThreadName + 1] = {};
    if (pthread_getname_np(pthread_self(), buf, sizeof(buf)) != 0) {
        return {};
    }
    return buf;
}

}  // namespace fanin
