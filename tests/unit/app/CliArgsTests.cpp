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

#include "app/CliArgs.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string_view>

using namespace app;

struct CliArgsTests : testing::Test {
    testing::StrictMock<testing::MockFunction<int(CliArgs::Action::Run)>> onRunMock;
    testing::StrictMock<testing::MockFunction<int(CliArgs::Action::Exit)>> onExitMock;

    static constexpr int kRETURN_CODE = 123;
};

TEST_F(CliArgsTests, NoArgsUsesDefaultConfig)
{
    std::array argv{"evloop_runner"};
    auto const action = CliArgs::parse(argv.size(), argv.data());

    EXPECT_CALL(onRunMock, Call).WillOnce([](CliArgs::Action::Run const& run) {
        EXPECT_EQ(run.configPath, CliArgs::defaultConfigPath);
        EXPECT_EQ(run.ticks, std::nullopt);
        return kRETURN_CODE;
    });
    EXPECT_EQ(action.apply(onRunMock.AsStdFunction(), onExitMock.AsStdFunction()), kRETURN_CODE);
}

TEST_F(CliArgsTests, HelpExits)
{
    for (auto& argv : {std::array{"evloop_runner", "--help"}, std::array{"evloop_runner", "-h"}}) {
        auto const action = CliArgs::parse(argv.size(), const_cast<char const**>(argv.data()));

        EXPECT_CALL(onExitMock, Call).WillOnce([](CliArgs::Action::Exit const& exit) { return exit.exitCode; });
        EXPECT_EQ(action.apply(onRunMock.AsStdFunction(), onExitMock.AsStdFunction()), EXIT_SUCCESS);
    }
}

TEST_F(CliArgsTests, ConfigFromOptionOrPosition)
{
    std::string_view const configPath = "some_config_path";

    for (auto& argv :
         {std::array{"evloop_runner", "--conf", configPath.data()},
          std::array{"evloop_runner", "-c", configPath.data()}}) {
        auto const action = CliArgs::parse(argv.size(), const_cast<char const**>(argv.data()));

        EXPECT_CALL(onRunMock, Call).WillOnce([&configPath](CliArgs::Action::Run const& run) {
            EXPECT_EQ(run.configPath, configPath);
            return kRETURN_CODE;
        });
        EXPECT_EQ(action.apply(onRunMock.AsStdFunction(), onExitMock.AsStdFunction()), kRETURN_CODE);
    }

    std::array argv{"evloop_runner", configPath.data()};
    auto const action = CliArgs::parse(argv.size(), argv.data());

    EXPECT_CALL(onRunMock, Call).WillOnce([&configPath](CliArgs::Action::Run const& run) {
        EXPECT_EQ(run.configPath, configPath);
        return kRETURN_CODE;
    });
    EXPECT_EQ(action.apply(onRunMock.AsStdFunction(), onExitMock.AsStdFunction()), kRETURN_CODE);
}

TEST_F(CliArgsTests, TicksOverride)
{
    std::array argv{"evloop_runner", "--ticks", "5"};
    auto const action = CliArgs::parse(argv.size(), argv.data());

    EXPECT_CALL(onRunMock, Call).WillOnce([](CliArgs::Action::Run const& run) {
        EXPECT_EQ(run.ticks, std::optional<std::size_t>{5});
        return kRETURN_CODE;
    });
    EXPECT_EQ(action.apply(onRunMock.AsStdFunction(), onExitMock.AsStdFunction()), kRETURN_CODE);
}
