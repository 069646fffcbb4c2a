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

#include "evloop/AttributeMap.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <any>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

using namespace evloop;

struct AttributeMapTest : testing::Test {
    AttributeMap attributes;
};

TEST_F(AttributeMapTest, EmptyByDefault)
{
    EXPECT_EQ(attributes.size(), 0u);
    EXPECT_FALSE(attributes.contains("key"));
    EXPECT_FALSE(attributes.get("key").has_value());
    EXPECT_FALSE(attributes.get<int>("key").has_value());
}

TEST_F(AttributeMapTest, SetAndGet)
{
    attributes.set("retries", 3);
    attributes.set("owner", std::string{"scheduler"});

    EXPECT_EQ(attributes.size(), 2u);
    EXPECT_TRUE(attributes.contains("retries"));
    EXPECT_EQ(attributes.get<int>("retries"), 3);
    EXPECT_EQ(attributes.get<std::string>("owner"), "scheduler");

    auto const raw = attributes.get("owner");
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(std::any_cast<std::string>(*raw), "scheduler");
}

TEST_F(AttributeMapTest, TypedGetWithWrongTypeIsEmpty)
{
    attributes.set("retries", 3);
    EXPECT_FALSE(attributes.get<std::string>("retries").has_value());
    EXPECT_TRUE(attributes.contains("retries"));
}

TEST_F(AttributeMapTest, SetReplacesPreviousValue)
{
    attributes.set("retries", 3);
    attributes.set("retries", 4);

    EXPECT_EQ(attributes.size(), 1u);
    EXPECT_EQ(attributes.get<int>("retries"), 4);
}

TEST_F(AttributeMapTest, RemoveReturnsTheValue)
{
    attributes.set("retries", 3);

    auto const removed = attributes.remove("retries");
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(std::any_cast<int>(*removed), 3);
    EXPECT_FALSE(attributes.contains("retries"));
    EXPECT_FALSE(attributes.remove("retries").has_value());
}

TEST_F(AttributeMapTest, ClearAndSnapshot)
{
    attributes.set("a", 1);
    attributes.set("b", 2);

    auto const snapshot = attributes.all();
    attributes.clear();

    EXPECT_EQ(attributes.size(), 0u);
    EXPECT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(std::any_cast<int>(snapshot.at("b")), 2);
}

TEST_F(AttributeMapTest, ConcurrentWriters)
{
    static constexpr std::size_t kNUM_THREADS = 8;
    static constexpr std::size_t kKEYS_PER_THREAD = 100;

    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < kNUM_THREADS; ++t) {
        threads.emplace_back([this, t] {
            for (std::size_t i = 0; i < kKEYS_PER_THREAD; ++i) {
                auto const key = std::to_string(t) + "-" + std::to_string(i);
                attributes.set(key, i);
                EXPECT_EQ(attributes.get<std::size_t>(key), i);
            }
        });
    }

    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(attributes.size(), kNUM_THREADS * kKEYS_PER_THREAD);
}
