// ============================================================================
// fanin/sync/wait_group.hpp - Blocking Outstanding-Work Counter
// ============================================================================
//
// WaitGroup counts launched-but-unfinished units of work. Launchers call Add()
// before handing work to another thread, workers call Done() when they are
// finished, and any number of threads can block in Wait() until the count
// drains to zero.
//
// Unlike a one-shot latch, a WaitGroup can go back up after reaching zero;
// Wait() only observes the count at the moment it is satisfied.
//
// USAGE:
// ------
//   WaitGroup wg;
//   for (auto& item : items) {
//       wg.Add(1);
//       std::thread([&wg, &item] {
//           Defer done([&] { wg.Done(); });
//           Process(item);
//       }).detach();
//   }
//   wg.Wait();
//
// ============================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace fanin {

class WaitGroup {
   public:
    WaitGroup() = default;

    // Non-copyable, non-movable
    WaitGroup(const WaitGroup&) = delete;
    WaitGroup& operator=(const WaitGroup&) = delete;

    void Add(size_t n = 1);

    // Aborts if called more times than Add() accounted for
    void Done();

    // Block until the count reaches zero
    void Wait();

    // Block until the count reaches zero or `timeout` elapses.
    // Returns true if the count reached zero.
    template <typename Rep, typename Period>
    bool WaitFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return drained_.wait_for(lock, timeout, [this] { return count_ == 0; });
    }

    size_t Count() const;

   private:
    mutable std::mutex mutex_;
    std::condition_variable drained_;
    size_t count_{0};
};

}  // namespace fanin
