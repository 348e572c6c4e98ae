#include <chrono>
#include <thread>
#include <gtest/gtest.h>
#include "core/context/execution_context.hpp"

namespace {

using conduit::core::context::Clock;
using conduit::core::context::ExecutionContext;
using namespace std::chrono_literals;

TEST(ExecutionContextTest, BackgroundIsNeverCancelled) {
    const auto ctx = ExecutionContext::background();
    EXPECT_FALSE(ctx.is_cancelled());
    EXPECT_FALSE(ctx.has_deadline());
    EXPECT_FALSE(ctx.remaining().has_value());
}

TEST(ExecutionContextTest, CancellingParentCancelsChildren) {
    const auto parent = ExecutionContext::background();
    const auto child = parent.with_cancel();
    const auto grandchild = child.with_timeout(10s);

    parent.cancel();
    EXPECT_TRUE(child.is_cancelled());
    EXPECT_TRUE(grandchild.is_cancelled());
}

TEST(ExecutionContextTest, CancellingChildLeavesParentRunning) {
    const auto parent = ExecutionContext::background();
    const auto child = parent.with_cancel();

    child.cancel();
    EXPECT_TRUE(child.is_cancelled());
    EXPECT_FALSE(parent.is_cancelled());
}

TEST(ExecutionContextTest, TimeoutKeepsEarlierDeadline) {
    const auto ctx = ExecutionContext::background().with_timeout(50ms);
    const auto widened = ctx.with_timeout(10s);
    ASSERT_TRUE(widened.deadline().has_value());
    EXPECT_EQ(widened.deadline().value(), ctx.deadline().value());
}

TEST(ExecutionContextTest, DeadlineExpires) {
    const auto ctx = ExecutionContext::background().with_timeout(20ms);
    EXPECT_FALSE(ctx.deadline_exceeded());
    std::this_thread::sleep_for(40ms);
    EXPECT_TRUE(ctx.deadline_exceeded());
    EXPECT_TRUE(ctx.is_cancelled());
    EXPECT_FALSE(ctx.token_cancelled());
    EXPECT_EQ(ctx.remaining().value(), Clock::duration::zero());
}

TEST(ExecutionContextTest, ExternalTokenIsObserved) {
    auto token = std::make_shared<std::atomic_bool>(false);
    const auto ctx = ExecutionContext::background().with_token(token);
    EXPECT_FALSE(ctx.is_cancelled());

    token->store(true);
    EXPECT_TRUE(ctx.is_cancelled());
}

TEST(ExecutionContextTest, SleepCompletesWhenUndisturbed) {
    const auto ctx = ExecutionContext::background();
    const auto started = Clock::now();
    EXPECT_TRUE(ctx.sleep_for(30ms));
    EXPECT_GE(Clock::now() - started, 30ms);
}

TEST(ExecutionContextTest, SleepIsInterruptedByCancel) {
    const auto ctx = ExecutionContext::background().with_cancel();
    std::thread canceller([ctx] {
        std::this_thread::sleep_for(20ms);
        ctx.cancel();
    });

    const auto started = Clock::now();
    EXPECT_FALSE(ctx.sleep_for(5s));
    EXPECT_LT(Clock::now() - started, 2s);
    canceller.join();
}

TEST(ExecutionContextTest, SleepIsInterruptedByDeadline) {
    const auto ctx = ExecutionContext::background().with_timeout(20ms);
    EXPECT_FALSE(ctx.sleep_for(5s));
}

}  // namespace
