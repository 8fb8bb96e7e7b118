// ============================================================================
// fanin/core/defer.hpp - Scope-Exit Action
// ============================================================================
//
// Defer calls its function when it goes out of scope. A unit thread holds
// one so the group's outstanding count drops on every exit path.
//
//   Defer done([&] { wg.Done(); });
//
// ============================================================================

#pragma once

#include <utility>

namespace fanin {

template <typename F>
class Defer {
   public:
    explicit Defer(F func) : func_(std::move(func)) {}
    ~Defer() { func_(); }

    Defer(const Defer&) = delete;
    Defer& operator=(const Defer&) = delete;

   private:
    F func_;
};

}  // namespace fanin
