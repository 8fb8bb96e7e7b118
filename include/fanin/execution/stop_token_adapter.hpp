// ============================================================================
// fanin/execution/stop_token_adapter.hpp - std::stop_token <-> CancellationToken
// ============================================================================
//
// Bridges the standard stop_token machinery and fanin cancellation, so a
// std::jthread or std::stop_source owner can act as the parent of a
// threshold ResultGroup, and a group's derived token can stop std code.
//
// USAGE:
// ------
//   // std::stop_token -> parent of a ResultGroup
//   std::jthread worker([](std::stop_token st) {
//       auto [parent, bridge] = fanin::execution::FromStopToken(st);
//       ResultGroup<int> group(parent, 3);
//       ...
//   });
//
//   // Group token -> std::stop_source
//   std::stop_source ss;
//   auto link = fanin::execution::LinkCancellation(group.Token(), ss);
//
// ============================================================================

#pragma once

#include "fanin/core/cancellation.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <stop_token>

namespace fanin::execution {

// ============================================================================
// FromStopToken - std::stop_token -> CancellationToken
// ============================================================================
// The bridge holds a std::stop_callback that cancels its CancellationSource.
// Keep the bridge alive for as long as the token should follow the stop_token.

class StopTokenBridge {
   public:
    explicit StopTokenBridge(std::stop_token st) {
        if (st.stop_possible()) {
            callback_.emplace(std::move(st), [this] { source_.Cancel(); });
        }
    }

    ~StopTokenBridge() = default;

    StopTokenBridge(const StopTokenBridge&) = delete;
    StopTokenBridge& operator=(const StopTokenBridge&) = delete;

    [[nodiscard]] CancellationToken GetToken() const { return source_.GetToken(); }

   private:
    CancellationSource source_;
    std::optional<std::stop_callback<std::function<void()>>> callback_;
};

struct StopTokenBridgeHandle {
    CancellationToken token;
    std::shared_ptr<StopTokenBridge> bridge;
};

inline StopTokenBridgeHandle FromStopToken(std::stop_token st) {
    auto bridge = std::make_shared<StopTokenBridge>(std::move(st));
    auto token = bridge->GetToken();
    return {std::move(token), std::move(bridge)};
}

// ============================================================================
// LinkCancellation - CancellationToken -> std::stop_source
// ============================================================================
// Requests a stop on `source` when `token` is cancelled. The callback is
// unregistered when the returned link is destroyed.

class CancellationLink {
   public:
    // std::stop_source has shared-ownership semantics, so it is held by value
    CancellationLink(CancellationToken token, std::stop_source source) : token_(std::move(token)) {
        handle_ = token_.OnCancel([s = std::move(source)]() mutable { s.request_stop(); });
    }

    ~CancellationLink() { token_.Unregister(handle_); }

    CancellationLink(const CancellationLink&) = delete;
    CancellationLink& operator=(const CancellationLink&) = delete;
    CancellationLink(CancellationLink&&) = delete;
    CancellationLink& operator=(CancellationLink&&) = delete;

   private:
    CancellationToken token_;
    size_t handle_ = 0;
};

inline std::unique_ptr<CancellationLink> LinkCancellation(CancellationToken token, std::stop_source source) {
    return std::make_unique<CancellationLink>(std::move(token), std::move(source));
}

}  // namespace fanin::execution
