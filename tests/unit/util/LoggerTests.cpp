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
#include "util/config/Config.hpp"
#include "util/log/Logger.hpp"

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_to.hpp>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>

using namespace util;

// Used as a fixture for tests with enabled logging
class LoggerTest : public LoggerFixture {};

// Used as a fixture for tests with disabled logging
class NoLoggerTest : public NoLoggerFixture {};

TEST_F(LoggerTest, Basic)
{
    Logger const log{"General"};
    log.info() << "Info line logged";
    checkEqual("General:NFO Info line logged");

    LogService::debug() << "Debug line with numbers " << 12345;
    checkEqual("General:DBG Debug line with numbers 12345");

    LogService::warn() << "Warning is logged";
    checkEqual("General:WRN Warning is logged");
}

TEST_F(LoggerTest, Filtering)
{
    Logger const log{"General"};
    log.trace() << "Should not be logged";
    checkEmpty();

    log.warn() << "Warning is logged";
    checkEqual("General:WRN Warning is logged");

    Logger const tlog{"Trace"};
    tlog.trace() << "Trace line logged for 'Trace' component";
    checkEqual("Trace:TRC Trace line logged for 'Trace' component");
}

TEST_F(LoggerTest, EventLoopChannelOnlyReportsWarnings)
{
    Logger const log{"EventLoop"};
    log.info() << "Not interesting";
    checkEmpty();

    log.error() << "Task failed";
    checkEqual("EventLoop:ERR Task failed");
}

#ifndef COVERAGE_ENABLED
TEST_F(LoggerTest, LOGMacro)
{
    Logger const log{"General"};

    auto computeCalled = false;
    auto compute = [&computeCalled]() {
        computeCalled = true;
        return "computed";
    };

    LOG(log.trace()) << compute();
    EXPECT_FALSE(computeCalled);

    log.trace() << compute();
    EXPECT_TRUE(computeCalled);
}
#endif

TEST_F(NoLoggerTest, Basic)
{
    Logger const log{"Trace"};
    log.trace() << "Nothing";
    checkEmpty();

    LogService::fatal() << "Still nothing";
    checkEmpty();
}

struct SeverityParsingTest : testing::TestWithParam<std::pair<std::string, Severity>> {};

TEST_P(SeverityParsingTest, ParsesLevelNames)
{
    auto const& [name, expected] = GetParam();
    EXPECT_EQ(boost::json::value_to<Severity>(boost::json::value{name.c_str()}), expected);
}

INSTANTIATE_TEST_SUITE_P(
    LoggerTest,
    SeverityParsingTest,
    testing::Values(
        std::make_pair("trace", Severity::TRC),
        std::make_pair("Debug", Severity::DBG),
        std::make_pair("info", Severity::NFO),
        std::make_pair("warn", Severity::WRN),
        std::make_pair("WARNING", Severity::WRN),
        std::make_pair("error", Severity::ERR),
        std::make_pair("fatal", Severity::FTL)
    )
);

TEST(SeverityParsing, RejectsUnknownLevel)
{
    EXPECT_THROW((void)boost::json::value_to<Severity>(boost::json::value{"loud"}), std::runtime_error);
    EXPECT_THROW((void)boost::json::value_to<Severity>(boost::json::value{42}), std::runtime_error);
}

TEST_F(LoggerTest, InitAppliesChannelOverrides)
{
    auto const config = Config{boost::json::parse(R"JSON({
        "log_level": "error",
        "log_channels": [ { "channel": "Shutdown", "log_level": "debug" } ]
    })JSON")};
    LogService::init(config);
    checkEmpty();

    Logger const general{"General"};
    general.warn() << "Below the default level";
    checkEmpty();

    Logger const shutdown{"Shutdown"};
    shutdown.debug() << "Channel override applies";
    checkEqual("Shutdown:DBG Channel override applies");

    LogService::alert() << "Alerts always pass";
    checkEqual("Alert:WRN Alerts always pass");
}

TEST_F(NoLoggerTest, InitRejectsUnknownChannel)
{
    auto const config = Config{boost::json::parse(R"JSON({
        "log_channels": [ { "channel": "Network", "log_level": "debug" } ]
    })JSON")};

    EXPECT_THROW(LogService::init(config), std::runtime_error);
}
