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

#include "util/Thread.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

using namespace std::chrono_literals;

TEST(ThreadTest, NamedThreadReportsFullName)
{
    std::string seen;
    std::thread thread{[&seen] {
        util::setThreadName("evloop42-general-17");
        seen = util::threadName();
    }};
    thread.join();

    EXPECT_EQ(seen, "evloop42-general-17");
}

TEST(ThreadTest, UnnamedThreadReportsOsName)
{
    std::string seen;
    std::thread thread{[&seen] { seen = util::threadName(); }};
    thread.join();

    EXPECT_FALSE(seen.empty());
}

TEST(ThreadTest, ShortNameIsAcceptedByOs)
{
    bool applied = false;
    std::thread thread{[&applied] { applied = util::setThreadName("evloop1-T-0"); }};
    thread.join();

    EXPECT_TRUE(applied);
}

TEST(ThreadTest, SleepBlocksForAtLeastTheDuration)
{
    auto const start = std::chrono::steady_clock::now();
    util::sleep(20ms);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(ThreadTest, SleepAcceptsAnyUnit)
{
    auto const start = std::chrono::steady_clock::now();
    util::sleep(std::chrono::microseconds{5000});
    util::sleep(std::chrono::duration<double, std::milli>{5.0});
    EXPECT_GE(std::chrono::steady_clock::now() - start, 10ms);
}

TEST(ThreadTest, NonPositiveSleepReturnsImmediately)
{
    auto const start = std::chrono::steady_clock::now();
    util::sleep(0ms);
    util::sleep(-5s);
    util::sleepSeconds(0);
    util::sleepMinutes(-1);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}
