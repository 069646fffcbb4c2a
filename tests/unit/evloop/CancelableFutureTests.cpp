//------------------------------------------------------------------------------
/*
    This file is part of evloop
    Copyright (c) 2024, the evloop developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include "evloop/CancelableFuture.hpp"
#include "evloop/Error.hpp"
#include "evloop/EventLoop.hpp"
#include "evloop/StopToken.hpp"
#include "util/LoggerFixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <compare>
#include <latch>
#include <stdexcept>
#include <string>
#include <thread>

using namespace evloop;
using namespace std::chrono_literals;
using testing::HasSubstr;

struct CancelableFutureTest : NoLoggerFixture {
    EventLoop loop{2};
};

TEST_F(CancelableFutureTest, GetReturnsTheValue)
{
    auto future = loop.submit([] { return std::string{"value"}; });

    auto const result = future.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "value");
    EXPECT_TRUE(future.isDone());
    EXPECT_FALSE(future.isCancelled());
}

TEST_F(CancelableFutureTest, GetOnFailureCarriesTheOriginalException)
{
    auto future = loop.submit([]() -> int { throw std::out_of_range{"index 7"}; });

    auto const result = future.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ExecutionError::Kind::Failed);
    EXPECT_THAT(result.error().message, HasSubstr("exit with exception: index 7"));
    EXPECT_THAT(result.error().message, HasSubstr(loop.name()));
    ASSERT_TRUE(result.error().cause);

    try {
        result.error().rethrow();
        FAIL() << "exception expected";
    } catch (std::out_of_range const& e) {
        EXPECT_STREQ(e.what(), "index 7");
    }

    EXPECT_TRUE(future.isDone());
    EXPECT_FALSE(future.isCancelled());
}

TEST_F(CancelableFutureTest, CancelBeforeDelayPreventsTheRun)
{
    std::atomic_bool ran{false};
    auto future = loop.schedule([&ran] { ran = true; }, 100ms);

    EXPECT_TRUE(future.cancel());
    EXPECT_TRUE(future.isCancelled());
    EXPECT_TRUE(future.isDone());

    std::this_thread::sleep_for(200ms);
    EXPECT_FALSE(ran);

    auto const result = future.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ExecutionError::Kind::Cancelled);
}

TEST_F(CancelableFutureTest, CancelAfterCompletionHasNoEffect)
{
    auto future = loop.submit([] { return 42; });
    future.wait();

    EXPECT_FALSE(future.cancel(true));
    EXPECT_FALSE(future.isCancelled());
    EXPECT_EQ(future.get(), 42);
}

TEST_F(CancelableFutureTest, SecondCancelHasNoEffect)
{
    auto future = loop.schedule([] {}, 1s);

    EXPECT_TRUE(future.cancel());
    EXPECT_FALSE(future.cancel());
}

TEST_F(CancelableFutureTest, CancelRunningWorkWithInterruptRequestsStop)
{
    std::latch started{1};
    std::atomic_bool observedStop{false};

    auto future = loop.submit([&](StopToken token) {
        started.count_down();
        while (not token.isStopRequested())
            std::this_thread::sleep_for(1ms);
        observedStop = true;
    });

    started.wait();
    EXPECT_TRUE(future.cancel(true));
    EXPECT_TRUE(future.isCancelled());
    EXPECT_TRUE(future.isDone());

    auto const result = future.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ExecutionError::Kind::Cancelled);

    loop.shutdown();
    ASSERT_TRUE(loop.awaitTermination(1s));
    EXPECT_TRUE(observedStop);
}

TEST_F(CancelableFutureTest, CancelRunningWorkWithoutInterruptLetsItFinish)
{
    std::latch started{1};
    std::latch release{1};
    std::atomic_bool sawStop{true};

    auto future = loop.submit([&](StopToken token) {
        started.count_down();
        release.wait();
        sawStop = token.isStopRequested();
        return 1;
    });

    started.wait();
    EXPECT_TRUE(future.cancel(false));
    release.count_down();

    loop.shutdown();
    ASSERT_TRUE(loop.awaitTermination(1s));

    EXPECT_FALSE(sawStop);
    EXPECT_TRUE(future.isCancelled());
    EXPECT_EQ(future.get().error().kind, ExecutionError::Kind::Cancelled);
}

TEST_F(CancelableFutureTest, GetWithTimeoutReportsTimeoutNotFailure)
{
    std::latch release{1};
    auto future = loop.submit([&release] {
        release.wait();
        return 5;
    });

    auto const early = future.get(20ms);
    ASSERT_FALSE(early.has_value());
    EXPECT_EQ(early.error().kind, ExecutionError::Kind::Timeout);
    EXPECT_FALSE(future.isDone());

    release.count_down();
    EXPECT_EQ(future.get(1s), 5);
}

TEST_F(CancelableFutureTest, WaitForReportsCompletion)
{
    auto future = loop.schedule([] {}, 50ms);

    EXPECT_FALSE(future.waitFor(5ms));
    EXPECT_TRUE(future.waitFor(1s));
}

TEST_F(CancelableFutureTest, GetDelayCountsDownToTheScheduledRun)
{
    auto future = loop.schedule([] {}, 500ms);

    auto const delay = future.getDelay();
    EXPECT_GT(delay, 0ms);
    EXPECT_LE(delay, 500ms);

    EXPECT_TRUE(future.cancel());
}

TEST_F(CancelableFutureTest, GetDelayIsNegativeWhenOverdue)
{
    auto future = loop.submit([] {});
    future.wait();

    std::this_thread::sleep_for(5ms);
    EXPECT_LT(future.getDelay(), 0ms);
}

TEST_F(CancelableFutureTest, CompareToOrdersByScheduledRun)
{
    auto early = loop.schedule([] {}, 100ms);
    auto late = loop.schedule([] { return 1; }, 1s);

    EXPECT_EQ(early.compareTo(late), std::strong_ordering::less);
    EXPECT_EQ(late.compareTo(early), std::strong_ordering::greater);
    EXPECT_EQ(early.compareTo(early), std::strong_ordering::equal);

    early.cancel();
    late.cancel();
}

TEST_F(CancelableFutureTest, AttributesAreSharedBetweenCopiesAndOutliveTheTask)
{
    auto future = loop.submit([] { return 3; });
    auto copy = future;

    future.attributes().set("request", std::string{"heartbeat"});
    future.wait();

    EXPECT_EQ(copy.attributes().get<std::string>("request"), "heartbeat");
    copy.attributes().set("attempt", 2);
    EXPECT_EQ(future.attributes().get<int>("attempt"), 2);

    EXPECT_EQ(future.get(), 3);
}

TEST_F(CancelableFutureTest, EveryHandleHasItsOwnAttributes)
{
    auto first = loop.submit([] {});
    auto second = loop.submit([] {});

    first.attributes().set("key", 1);
    EXPECT_FALSE(second.attributes().contains("key"));
}
