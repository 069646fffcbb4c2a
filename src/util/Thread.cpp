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

#include <pthread.h>

#include <array>
#include <cstddef>
#include <string>
#include <utility>

namespace util {

namespace {

// Linux limits thread names to 16 bytes including the terminating zero
constexpr std::size_t kOS_THREAD_NAME_LIMIT = 15;

thread_local std::string currentThreadName;

}  // namespace

bool
setThreadName(std::string name)
{
    auto const osName = name.substr(0, kOS_THREAD_NAME_LIMIT);
    auto const applied = pthread_setname_np(pthread_self(), osName.c_str()) == 0;
    currentThreadName = std::move(name);
    return applied;
}

std::string
threadName()
{
    if (not currentThreadName.empty())
        return currentThreadName;

    std::array<char, kOS_THREAD_NAME_LIMIT + 1> buffer{};
    if (pthread_getname_np(pthread_self(), buffer.data(), buffer.size()) != 0)
        return {};
    return std::string{buffer.data()};
}

}  // namespace util
