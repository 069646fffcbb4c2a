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

#include <boost/filesystem/operations.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_to.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace util;

namespace {

constexpr auto kJSON_DATA = R"JSON(
    {
        "arr": [
            { "first": 1234 },
            { "second": true },
            { "inner_section": [{ "inner": "works" }] }
        ],
        "event_loop": {
            "general_threads": 4,
            "daemon": false
        },
        "section": {
            "test": {
                "str": "hello",
                "int": 9042,
                "bool": true
            }
        },
        "top": 420
    }
)JSON";

}  // namespace

class ConfigTest : public NoLoggerFixture {
protected:
    Config cfg{boost::json::parse(kJSON_DATA)};
};

TEST_F(ConfigTest, SanityCheck)
{
    // throw on wrong key format etc.:
    ASSERT_ANY_THROW((void)cfg.value<bool>(""));
    ASSERT_ANY_THROW((void)cfg.value<bool>("a."));
    ASSERT_ANY_THROW((void)cfg.value<bool>(".a"));
    ASSERT_ANY_THROW((void)cfg.valueOr<bool>("", false));
    ASSERT_ANY_THROW((void)cfg.valueOr<bool>("a.", false));
    ASSERT_ANY_THROW((void)cfg.maybeValue<bool>(".a"));
    ASSERT_ANY_THROW((void)cfg.valueOrThrow<bool>("", "custom"));
    ASSERT_ANY_THROW((void)cfg.contains("a."));
    ASSERT_ANY_THROW((void)cfg.section(".a"));

    // valid path, value does not exists -> optional functions should not throw
    ASSERT_ANY_THROW((void)cfg.value<bool>("b"));
    ASSERT_EQ(cfg.valueOr<bool>("b", false), false);
    ASSERT_EQ(cfg.maybeValue<bool>("b"), std::nullopt);
    ASSERT_ANY_THROW((void)cfg.valueOrThrow<bool>("b", "custom"));
}

TEST_F(ConfigTest, Access)
{
    ASSERT_EQ(cfg.value<int64_t>("top"), 420);
    ASSERT_EQ(cfg.value<std::string>("section.test.str"), "hello");
    ASSERT_EQ(cfg.value<int64_t>("section.test.int"), 9042);
    ASSERT_EQ(cfg.value<bool>("section.test.bool"), true);

    ASSERT_ANY_THROW((void)cfg.value<uint64_t>("section.test.bool"));  // wrong type requested
    ASSERT_ANY_THROW((void)cfg.value<bool>("section.doesnotexist"));

    ASSERT_EQ(cfg.valueOr<std::string>("section.test.str", "fallback"), "hello");
    ASSERT_EQ(cfg.valueOr<std::string>("section.test.nonexistent", "fallback"), "fallback");
    ASSERT_EQ(cfg.valueOr("section.test.bool", false), true);
    ASSERT_EQ(cfg.valueOr<uint32_t>("top.nested", 7u), 7u);  // path crosses a non-object

    ASSERT_ANY_THROW((void)cfg.valueOr("section.test.bool", 1234));  // wrong type requested
}

TEST_F(ConfigTest, ErrorHandling)
{
    try {
        (void)cfg.valueOrThrow<bool>("section.test.int", "msg");
        FAIL() << "should not get here";
    } catch (std::runtime_error const& e) {
        EXPECT_STREQ(e.what(), "msg");
    }

    EXPECT_EQ(cfg.valueOrThrow<bool>("section.test.bool", ""), true);
    EXPECT_THROW((void)cfg.array("nonexisting.key"), std::logic_error);
    EXPECT_THROW((void)cfg.section("top"), std::logic_error);
}

TEST_F(ConfigTest, Section)
{
    auto const sub = cfg.section("section.test");

    EXPECT_EQ(sub.value<std::string>("str"), "hello");
    EXPECT_EQ(sub.value<int64_t>("int"), 9042);
    EXPECT_EQ(sub.value<bool>("bool"), true);

    auto const missing = cfg.sectionOr("runner", {});
    EXPECT_EQ(missing.valueOr<uint32_t>("threads", 2u), 2u);
    EXPECT_FALSE(missing.contains("threads"));
}

TEST_F(ConfigTest, Array)
{
    auto const arr = cfg.array("arr");

    ASSERT_EQ(arr.size(), 3u);
    EXPECT_EQ(arr[0].value<int64_t>("first"), 1234);

    // check twice to verify that previous array(key) access did not destroy the store by using move
    EXPECT_EQ(arr[2].array("inner_section")[0].value<std::string>("inner"), "works");
    EXPECT_EQ(arr[2].array("inner_section")[0].value<std::string>("inner"), "works");

    EXPECT_TRUE(cfg.arrayOr("nope", {}).empty());
    EXPECT_FALSE(cfg.maybeArray("section").has_value());
}

namespace {

/**
 * @brief Simple custom data type with json parsing support
 */
struct Custom {
    std::string a;
    int64_t b;
    bool c;

    friend Custom
    tag_invoke(boost::json::value_to_tag<Custom>, boost::json::value const& value)
    {
        auto const& obj = value.as_object();
        return {obj.at("str").as_string().c_str(), obj.at("int").as_int64(), obj.at("bool").as_bool()};
    }
};

/**
 * @brief Simple temporary file util
 */
class TmpFile {
    std::string tmpPath_;

public:
    TmpFile(std::string const& data) : tmpPath_{boost::filesystem::unique_path().string()}
    {
        std::ofstream of;
        of.open(tmpPath_);
        of << data;
        of.close();
    }

    ~TmpFile()
    {
        std::remove(tmpPath_.c_str());
    }

    std::string
    path() const
    {
        return tmpPath_;
    }
};

}  // namespace

TEST_F(ConfigTest, Extend)
{
    auto const custom = cfg.value<Custom>("section.test");

    EXPECT_EQ(custom.a, "hello");
    EXPECT_EQ(custom.b, 9042);
    EXPECT_EQ(custom.c, true);
}

TEST_F(ConfigTest, File)
{
    auto const tmp = TmpFile(kJSON_DATA);
    auto const conf = ConfigReader::open(tmp.path());

    EXPECT_TRUE(conf);
    EXPECT_EQ(conf.value<int64_t>("top"), 420);

    auto const doesntexist = ConfigReader::open("nope");
    EXPECT_FALSE(doesntexist);
    EXPECT_EQ(doesntexist.valueOr<bool>("found", false), false);
}

TEST_F(ConfigTest, FileWithComments)
{
    auto const tmp = TmpFile(R"JSON({
        // a comment
        "event_loop": { "io_threads": 16 } /* another one */
    })JSON");
    auto const conf = ConfigReader::open(tmp.path());

    EXPECT_EQ(conf.value<uint32_t>("event_loop.io_threads"), 16u);
}

TEST_F(ConfigTest, FileWithTrailingCommas)
{
    auto const tmp = TmpFile(R"JSON({
        "runner": { "ticks": 3, },
    })JSON");
    auto const conf = ConfigReader::open(tmp.path());

    EXPECT_EQ(conf.value<uint32_t>("runner.ticks"), 3u);
}

TEST_F(ConfigTest, MalformedFile)
{
    auto const tmp = TmpFile(R"JSON({ "runner": )JSON");
    auto const conf = ConfigReader::open(tmp.path());

    EXPECT_FALSE(conf);
    EXPECT_EQ(conf.valueOr<uint32_t>("runner.ticks", 7), 7u);
}
