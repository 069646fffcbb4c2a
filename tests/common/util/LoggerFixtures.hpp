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

#pragma once

#include "util/log/Logger.hpp"

#include <boost/log/core/core.hpp>
#include <boost/log/expressions/predicates/channel_severity_filter.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <gtest/gtest.h>

#include <cstddef>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

/**
 * @brief Fixture with util::Logger support.
 */
class LoggerFixture : virtual public ::testing::Test {
    /**
     * @brief A simple string buffer that can be used to mock std::cout for
     * console logging.
     */
    class FakeBuffer final : public std::stringbuf {
    public:
        std::string
        getStrAndReset()
        {
            auto value = str();
            str("");
            return value;
        }
    };

    FakeBuffer buffer_;
    std::ostream stream_ = std::ostream{&buffer_};

public:
    // Simulates the `util::LogService::init(config)` call
    LoggerFixture()
    {
        static std::once_flag once_;
        std::call_once(once_, [] {
            boost::log::add_common_attributes();
            boost::log::register_simple_formatter_factory<util::Severity, char>("Severity");
        });

        namespace keywords = boost::log::keywords;
        namespace expr = boost::log::expressions;
        auto core = boost::log::core::get();

        core->remove_all_sinks();
        boost::log::add_console_log(stream_, keywords::format = "%Channel%:%Severity% %Message%");
        auto minSeverity = expr::channel_severity_filter(util::LogChannel, util::LogSeverity);
        minSeverity["General"] = util::Severity::DBG;
        minSeverity["EventLoop"] = util::Severity::WRN;
        minSeverity["Shutdown"] = util::Severity::DBG;
        minSeverity["Trace"] = util::Severity::TRC;
        core->set_filter(minSeverity);
        core->set_logging_enabled(true);
    }

    ~LoggerFixture() override
    {
        boost::log::core::get()->remove_all_sinks();
    }

protected:
    void
    checkEqual(std::string expected)
    {
        auto value = buffer_.getStrAndReset();
        ASSERT_EQ(value, expected + '\n');
    }

    void
    checkEmpty()
    {
        ASSERT_TRUE(buffer_.getStrAndReset().empty());
    }

    /** @return Everything logged since the last check; clears the buffer */
    std::string
    takeOutput()
    {
        return buffer_.getStrAndReset();
    }

    /** @return Number of times the text occurs in the output logged since the last check; clears the buffer */
    std::size_t
    countOccurrences(std::string const& text)
    {
        auto const output = buffer_.getStrAndReset();
        std::size_t count = 0;
        for (auto pos = output.find(text); pos != std::string::npos; pos = output.find(text, pos + text.size()))
            ++count;
        return count;
    }
};

/**
 * @brief Fixture with util::Logger support but completely disabled logging.
 *
 * This is meant to be used as a base for other fixtures.
 */
struct NoLoggerFixture : virtual LoggerFixture {
    NoLoggerFixture()
    {
        boost::log::core::get()->set_logging_enabled(false);
    }
};
