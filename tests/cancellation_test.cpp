// ============================================================================
// Cancellation Tests
// ============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "fanin/core/cancellation.hpp"

using namespace fanin;
using namespace std::chrono_literals;

// ============================================================================
// Basic Token Tests
// ============================================================================

TEST(CancellationTest, DefaultTokenNotCancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.IsCancelled());
    EXPECT_FALSE(token.IsValid());
}

TEST(CancellationTest, CancelPropagates) {
    CancellationSource source;
    auto token = source.GetToken();

    EXPECT_TRUE(token.IsValid());
    EXPECT_FALSE(token.IsCancelled());

    source.Cancel();

    EXPECT_TRUE(token.IsCancelled());
    EXPECT_TRUE(source.IsCancelled());
}

TEST(CancellationTest, BoolConversion) {
    CancellationSource source;
    auto token = source.GetToken();

    EXPECT_TRUE(static_cast<bool>(token));
    source.Cancel();
    EXPECT_FALSE(static_cast<bool>(token));
}

TEST(CancellationTest, Reason) {
    CancellationSource source;
    auto token = source.GetToken();

    EXPECT_FALSE(token.Reason());
    source.Cancel();
    EXPECT_EQ(token.Reason(), make_error_code(Errc::Cancelled));
    EXPECT_TRUE(token.Reason() == std::errc::operation_canceled);
}

TEST(CancellationTest, DoubleCancelIsIdempotent) {
    CancellationSource source;
    auto token = source.GetToken();
    std::atomic<int> count{0};
    token.OnCancel([&count] { count++; });

    source.Cancel();
    source.Cancel();

    EXPECT_TRUE(token.IsCancelled());
    EXPECT_EQ(count.load(), 1);
}

// ============================================================================
// Callback Tests
// ============================================================================

TEST(CancellationTest, CallbackOnCancel) {
    CancellationSource source;
    auto token = source.GetToken();

    std::atomic<bool> called{false};
    token.OnCancel([&called] { called = true; });
    EXPECT_FALSE(called.load());

    source.Cancel();
    EXPECT_TRUE(called.load());
}

TEST(CancellationTest, CallbackIfAlreadyCancelled) {
    CancellationSource source;
    source.Cancel();

    std::atomic<bool> called{false};
    source.GetToken().OnCancel([&called] { called = true; });

    EXPECT_TRUE(called.load());
}

TEST(CancellationTest, UnregisterCallback) {
    CancellationSource source;
    auto token = source.GetToken();

    std::atomic<bool> called{false};
    size_t handle = token.OnCancel([&called] { called = true; });
    token.Unregister(handle);

    source.Cancel();
    EXPECT_FALSE(called.load());
}

TEST(CancellationTest, CallbackGuard) {
    CancellationSource source;
    auto token = source.GetToken();

    std::atomic<bool> called{false};
    {
        CancellationCallbackGuard guard(token, [&called] { called = true; });
    }

    source.Cancel();
    EXPECT_FALSE(called.load());
}

TEST(CancellationTest, NoneToken) {
    auto token = CancellationToken::None();

    EXPECT_FALSE(token.IsValid());
    EXPECT_FALSE(token.IsCancelled());
    EXPECT_EQ(token.OnCancel([] {}), 0u);
}

// ============================================================================
// Derived Sources
// ============================================================================

TEST(CancellationTest, ParentCancelsChild) {
    CancellationSource parent;
    CancellationSource child(parent.GetToken());
    auto token = child.GetToken();

    EXPECT_FALSE(token.IsCancelled());
    parent.Cancel();
    EXPECT_TRUE(token.IsCancelled());
}

TEST(CancellationTest, ChildDoesNotCancelParent) {
    CancellationSource parent;
    CancellationSource child(parent.GetToken());

    child.Cancel();

    EXPECT_TRUE(child.IsCancelled());
    EXPECT_FALSE(parent.IsCancelled());
}

TEST(CancellationTest, DerivedFromCancelledParent) {
    CancellationSource parent;
    parent.Cancel();

    CancellationSource child(parent.GetToken());
    EXPECT_TRUE(child.IsCancelled());
}

TEST(CancellationTest, DerivedFromNoneToken) {
    CancellationSource child(CancellationToken::None());
    EXPECT_FALSE(child.IsCancelled());
    child.Cancel();
    EXPECT_TRUE(child.IsCancelled());
}

TEST(CancellationTest, GrandchildFollowsRoot) {
    CancellationSource root;
    CancellationSource child(root.GetToken());
    CancellationSource grandchild(child.GetToken());

    root.Cancel();
    EXPECT_TRUE(grandchild.IsCancelled());
}

TEST(CancellationTest, DestroyedChildUnregistersFromParent) {
    CancellationSource parent;
    CancellationToken child_token;
    {
        CancellationSource child(parent.GetToken());
        child_token = child.GetToken();
    }

    // The child's state outlives the source through the token, but the
    // parent link is gone
    parent.Cancel();
    EXPECT_FALSE(child_token.IsCancelled());
}

TEST(CancellationTest, MovedChildStillFollowsParent) {
    CancellationSource parent;
    CancellationSource child(parent.GetToken());
    CancellationSource moved(std::move(child));

    parent.Cancel();
    EXPECT_TRUE(moved.IsCancelled());
}

// ============================================================================
// Blocking Waits
// ============================================================================

TEST(CancellationTest, WaitForTimesOut) {
    CancellationSource source;
    auto token = source.GetToken();

    EXPECT_FALSE(token.WaitFor(10ms));
}

TEST(CancellationTest, WaitForWakesOnCancel) {
    CancellationSource source;
    auto token = source.GetToken();

    std::thread canceller([&source] {
        std::this_thread::sleep_for(10ms);
        source.Cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.WaitFor(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);

    canceller.join();
}

TEST(CancellationTest, WaitForNoneTokenSleeps) {
    auto token = CancellationToken::None();
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.WaitFor(20ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(CancellationTest, CancelFromAnotherThread) {
    CancellationSource source;
    auto token = source.GetToken();

    std::atomic<bool> saw_cancel{false};
    std::thread worker([&token, &saw_cancel] {
        while (!token.IsCancelled()) {
            std::this_thread::sleep_for(1ms);
        }
        saw_cancel = true;
    });

    std::this_thread::sleep_for(10ms);
    source.Cancel();
    worker.join();

    EXPECT_TRUE(saw_cancel.load());
}

// ============================================================================
// Bug regression: callbacks must not run under the state mutex
// ============================================================================

TEST(CancellationTest, RegisterCallbackOnCancelledTokenNoDeadlock) {
    CancellationSource source;
    source.Cancel();

    auto token = source.GetToken();
    std::atomic<int> call_count{0};
    token.OnCancel([&] {
        call_count++;
        token.OnCancel([&] { call_count++; });
    });

    EXPECT_EQ(call_count.load(), 2);
}

TEST(CancellationTest, CallbackCanQueryStateDuringCancel) {
    CancellationSource source;
    auto token = source.GetToken();
    std::atomic<bool> saw_cancelled{false};

    token.OnCancel([&] { saw_cancelled = token.IsCancelled(); });
    source.Cancel();

    EXPECT_TRUE(saw_cancelled.load());
}
