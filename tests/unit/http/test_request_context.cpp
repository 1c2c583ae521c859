/**
 * @file test_request_context.cpp
 * @brief Unit tests for cancellation, deadlines and try state
 */

#include <gtest/gtest.h>

#include "kcenon/blob_storage/http/request_context.h"

#include <chrono>
#include <thread>

namespace kcenon::blob_storage {
namespace {

using namespace std::chrono_literals;
using clock_type = request_context::clock;

class RequestContextTest : public ::testing::Test {
protected:
    request_context root_;
};

TEST_F(RequestContextTest, FreshContextIsUnbounded) {
    EXPECT_FALSE(root_.is_cancelled());
    EXPECT_FALSE(root_.deadline().has_value());
    EXPECT_FALSE(root_.deadline_exceeded());
    EXPECT_EQ(root_.try_number(), 0u);
}

TEST_F(RequestContextTest, WithTimeoutSetsDeadline) {
    auto before = clock_type::now();
    auto ctx = request_context::with_timeout(200ms);

    ASSERT_TRUE(ctx.deadline().has_value());
    EXPECT_GE(*ctx.deadline(), before + 200ms);
    EXPECT_FALSE(ctx.deadline_exceeded());
}

TEST_F(RequestContextTest, CancelPropagatesToDescendants) {
    auto operation = root_.begin_operation();
    auto attempt = operation.begin_try(1, std::nullopt);

    root_.cancel();

    EXPECT_TRUE(operation.is_cancelled());
    EXPECT_TRUE(attempt.is_cancelled());
}

TEST_F(RequestContextTest, CancelDoesNotPropagateUpward) {
    auto operation = root_.begin_operation();
    auto attempt = operation.begin_try(1, std::nullopt);

    attempt.cancel();

    EXPECT_TRUE(attempt.is_cancelled());
    EXPECT_FALSE(operation.is_cancelled());
    EXPECT_FALSE(root_.is_cancelled());
}

TEST_F(RequestContextTest, ChildOfCancelledContextStartsCancelled) {
    root_.cancel();
    EXPECT_TRUE(root_.begin_operation().is_cancelled());
}

TEST_F(RequestContextTest, CopiesShareState) {
    request_context copy = root_;
    copy.cancel();
    EXPECT_TRUE(root_.is_cancelled());
}

TEST_F(RequestContextTest, ChildDeadlineIsClampedToParent) {
    auto parent = request_context::with_timeout(100ms);
    auto child = parent.begin_try(1, clock_type::now() + 10s);

    ASSERT_TRUE(child.deadline().has_value());
    EXPECT_EQ(*child.deadline(), *parent.deadline());
}

TEST_F(RequestContextTest, EarlierChildDeadlineWins) {
    auto parent = request_context::with_timeout(10s);
    auto tight = clock_type::now() + 50ms;
    auto child = parent.begin_try(1, tight);

    ASSERT_TRUE(child.deadline().has_value());
    EXPECT_EQ(*child.deadline(), tight);
}

TEST_F(RequestContextTest, TryNumberAndOperationStart) {
    auto operation = root_.begin_operation();
    auto attempt = operation.begin_try(3, std::nullopt);

    EXPECT_EQ(operation.try_number(), 0u);
    EXPECT_EQ(attempt.try_number(), 3u);
    EXPECT_EQ(attempt.operation_start(), operation.operation_start());
}

TEST_F(RequestContextTest, WaitElapses) {
    auto start = clock_type::now();
    EXPECT_EQ(root_.wait_for(20ms), request_context::wait_status::elapsed);
    EXPECT_GE(clock_type::now() - start, 20ms);
}

TEST_F(RequestContextTest, WaitStopsAtDeadline) {
    auto ctx = request_context::with_timeout(30ms);
    auto start = clock_type::now();

    EXPECT_EQ(ctx.wait_for(10s), request_context::wait_status::deadline_exceeded);
    EXPECT_LT(clock_type::now() - start, 5s);
    EXPECT_TRUE(ctx.deadline_exceeded());
}

TEST_F(RequestContextTest, WaitWakesOnCancel) {
    auto operation = root_.begin_operation();
    std::thread canceller([this]() {
        std::this_thread::sleep_for(30ms);
        root_.cancel();
    });

    auto start = clock_type::now();
    auto status = operation.wait_for(10s);
    canceller.join();

    EXPECT_EQ(status, request_context::wait_status::cancelled);
    EXPECT_LT(clock_type::now() - start, 5s);
}

TEST_F(RequestContextTest, WaitOnCancelledContextReturnsImmediately) {
    root_.cancel();
    EXPECT_EQ(root_.wait_for(10s), request_context::wait_status::cancelled);
}

}  // namespace
}  // namespace kcenon::blob_storage
