// ============================================================================
// fanin/core/cancellation.hpp - Cancellation Token Support
// ============================================================================
//
// CancellationToken provides cooperative cancellation for units of work.
// A token can be handed to any number of units, and each unit checks it (or
// blocks on it) to stop early.
//
// DESIGN PHILOSOPHY:
// ------------------
// 1. COOPERATIVE: Units must check the token - nothing is interrupted
// 2. THREAD-SAFE: Token can be cancelled from any thread
// 3. DERIVABLE: A source can be derived from a parent token; cancelling the
//    parent cancels the child, never the other way around
//
// USAGE:
// ------
//   CancellationSource root;
//   CancellationSource child(root.GetToken());
//   auto token = child.GetToken();
//
//   group.Go([token]() -> UnitResult<int> {
//       if (token.WaitFor(100ms)) {
//           return {{}, token.Reason()};  // Errc::Cancelled
//       }
//       return {{1}, {}};
//   });
//
//   root.Cancel();  // child and token observe cancellation
//
// ============================================================================

#pragma once

#include "fanin/core/error.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace fanin {

// Forward declaration
class CancellationSource;

// ============================================================================
// CancellationState - Shared state between source and tokens
// ============================================================================
class CancellationState {
   public:
    CancellationState() = default;

    // Non-copyable, non-movable
    CancellationState(const CancellationState&) = delete;
    CancellationState& operator=(const CancellationState&) = delete;

    bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    void Cancel() {
        std::vector<std::function<void()>> callbacks_to_call;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
                return;  // Already cancelled
            }
            callbacks_to_call = std::move(callbacks_);
            callback_handles_.clear();
        }
        cv_.notify_all();

        for (auto& callback : callbacks_to_call) {
            callback();
        }
    }

    // Register a callback to be called when cancelled
    // Returns a handle that can be used to unregister
    size_t RegisterCallback(std::function<void()> callback) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancelled_.load(std::memory_order_acquire)) {
                size_t handle = next_handle_++;
                callbacks_.push_back(std::move(callback));
                callback_handles_.push_back(handle);
                return handle;
            }
        }
        // Already cancelled: invoke outside the lock
        callback();
        return 0;
    }

    void UnregisterCallback(size_t handle) {
        if (handle == 0) return;

        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < callback_handles_.size(); ++i) {
            if (callback_handles_[i] == handle) {
                callbacks_.erase(callbacks_.begin() + static_cast<long>(i));
                callback_handles_.erase(callback_handles_.begin() + static_cast<long>(i));
                break;
            }
        }
    }

    // Block until cancelled or `timeout` elapses. Returns true if cancelled.
    template <typename Rep, typename Period>
    bool WaitFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return cancelled_.load(std::memory_order_acquire); });
    }

    void Wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return cancelled_.load(std::memory_order_acquire); });
    }

   private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::function<void()>> callbacks_;
    std::vector<size_t> callback_handles_;
    size_t next_handle_{1};
};

// ============================================================================
// CancellationToken - Read-only view of cancellation state
// ============================================================================
class CancellationToken {
   public:
    // Default token that is never cancelled
    CancellationToken() : state_(nullptr) {}

    // Check if cancellation has been requested
    bool IsCancelled() const noexcept { return state_ && state_->IsCancelled(); }

    // True while not cancelled
    explicit operator bool() const noexcept { return !IsCancelled(); }

    // Errc::Cancelled once cancelled, empty otherwise
    Error Reason() const noexcept { return IsCancelled() ? make_error_code(Errc::Cancelled) : Error{}; }

    // Register callback for cancellation notification
    size_t OnCancel(std::function<void()> callback) const {
        if (state_) {
            return state_->RegisterCallback(std::move(callback));
        }
        return 0;
    }

    // Unregister a previously registered callback
    void Unregister(size_t handle) const {
        if (state_) {
            state_->UnregisterCallback(handle);
        }
    }

    // Block until cancelled or `timeout` elapses. Returns true if cancelled.
    // A token without state never fires, so this sleeps the full timeout.
    template <typename Rep, typename Period>
    bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
        if (!state_) {
            std::this_thread::sleep_for(timeout);
            return false;
        }
        return state_->WaitFor(timeout);
    }

    // Check if this is a valid token (has associated state)
    bool IsValid() const noexcept { return state_ != nullptr; }

    // Create a "never cancelled" token
    [[nodiscard]] static CancellationToken None() { return CancellationToken{}; }

   private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<CancellationState> state) : state_(std::move(state)) {}

    std::shared_ptr<CancellationState> state_;
};

// ============================================================================
// CancellationSource - Creates and controls tokens
// ============================================================================
class CancellationSource {
   public:
    CancellationSource() : state_(std::make_shared<CancellationState>()) {}

    // Derive from `parent`: the new source is cancelled when the parent is.
    // A parent that is already cancelled yields a cancelled source.
    explicit CancellationSource(CancellationToken parent)
        : state_(std::make_shared<CancellationState>()), parent_(std::move(parent)) {
        std::weak_ptr<CancellationState> weak = state_;
        parent_handle_ = parent_.OnCancel([weak] {
            if (auto state = weak.lock()) {
                state->Cancel();
            }
        });
    }

    ~CancellationSource() { parent_.Unregister(parent_handle_); }

    // Non-copyable but movable
    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    CancellationSource(CancellationSource&& other) noexcept
        : state_(std::move(other.state_)),
          parent_(std::move(other.parent_)),
          parent_handle_(std::exchange(other.parent_handle_, 0)) {}

    CancellationSource& operator=(CancellationSource&& other) noexcept {
        if (this != &other) {
            parent_.Unregister(parent_handle_);
            state_ = std::move(other.state_);
            parent_ = std::move(other.parent_);
            parent_handle_ = std::exchange(other.parent_handle_, 0);
        }
        return *this;
    }

    // Get a token that can be passed to units of work
    [[nodiscard]] CancellationToken GetToken() const { return CancellationToken(state_); }

    // Request cancellation. Idempotent.
    void Cancel() {
        if (state_) {
            state_->Cancel();
        }
    }

    // Check if cancellation was requested
    bool IsCancelled() const noexcept { return state_ && state_->IsCancelled(); }

   private:
    std::shared_ptr<CancellationState> state_;
    CancellationToken parent_;
    size_t parent_handle_{0};
};

// ============================================================================
// RAII guard for callback registration
// ============================================================================
class CancellationCallbackGuard {
   public:
    CancellationCallbackGuard(CancellationToken token, std::function<void()> callback)
        : token_(std::move(token)), handle_(token_.OnCancel(std::move(callback))) {}

    ~CancellationCallbackGuard() { token_.Unregister(handle_); }

    // Non-copyable, non-movable
    CancellationCallbackGuard(const CancellationCallbackGuard&) = delete;
    CancellationCallbackGuard& operator=(const CancellationCallbackGuard&) = delete;

   private:
    CancellationToken token_;
    size_t handle_;
};

}  // namespace fanin
