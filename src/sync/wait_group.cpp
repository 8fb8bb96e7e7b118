// ============================================================================
// fanin/sync/wait_group.cpp - WaitGroup Implementation
// ============================================================================

#include "fanin/sync/wait_group.hpp"

#include "fanin/core/check.hpp"

namespace fanin {

void WaitGroup::Add(size_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    count_ += n;
}

void WaitGroup::Done() {
    bool drained = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        FANIN_CHECK(count_ > 0, "WaitGroup::Done() called with no outstanding work");
        drained = --count_ == 0;
    }
    if (drained) {
        drained_.notify_all();
    }
}

void WaitGroup::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_.wait(lock, [this] { return count_ == 0; });
}

size_t WaitGroup::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

}  // namespace fanin
