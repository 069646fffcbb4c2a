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

#include "util/LoggerFixtures.hpp"
#include "util/ShutdownHook.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace util;
using testing::ElementsAre;
using testing::HasSubstr;

struct ShutdownHookTest : LoggerFixture {
    ShutdownHook hook;
    std::vector<std::string> calls;
};

TEST_F(ShutdownHookTest, NothingRunsBeforeRun)
{
    hook.registerHook([this] { calls.emplace_back("hook"); });

    EXPECT_TRUE(calls.empty());
    EXPECT_FALSE(hook.hasRun());
}

TEST_F(ShutdownHookTest, RunsHooksInPriorityOrder)
{
    hook.registerHook([this] { calls.emplace_back("last"); }, ShutdownHook::Priority::RunLast);
    hook.registerHook([this] { calls.emplace_back("normal1"); });
    hook.registerHook([this] { calls.emplace_back("first"); }, ShutdownHook::Priority::RunFirst);
    hook.registerHook([this] { calls.emplace_back("normal2"); }, ShutdownHook::Priority::Normal);

    hook.run();

    EXPECT_THAT(calls, ElementsAre("first", "normal1", "normal2", "last"));
    EXPECT_TRUE(hook.hasRun());
}

TEST_F(ShutdownHookTest, RunsOnlyOnce)
{
    hook.registerHook([this] { calls.emplace_back("hook"); });

    hook.run();
    hook.run();
    hook.run();

    EXPECT_THAT(calls, ElementsAre("hook"));
}

TEST_F(ShutdownHookTest, DisconnectedHookDoesNotRun)
{
    auto connection = hook.registerHook([this] { calls.emplace_back("removed"); });
    hook.registerHook([this] { calls.emplace_back("kept"); });
    connection.disconnect();

    hook.run();

    EXPECT_THAT(calls, ElementsAre("kept"));
}

TEST_F(ShutdownHookTest, FailingHookIsLoggedAndOthersStillRun)
{
    hook.registerHook([] { throw std::runtime_error{"boom"}; }, ShutdownHook::Priority::RunFirst);
    hook.registerHook([this] { calls.emplace_back("after"); });

    hook.run();

    EXPECT_THAT(calls, ElementsAre("after"));
    EXPECT_THAT(takeOutput(), HasSubstr("Shutdown:ERR Shutdown hook threw: boom"));
}

TEST(ShutdownHookInstanceTest, InstanceIsAlwaysTheSame)
{
    EXPECT_EQ(&ShutdownHook::instance(), &ShutdownHook::instance());
}
