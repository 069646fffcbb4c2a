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

#include "evloop/ThreadFactory.hpp"

#include "util/Thread.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace evloop {

namespace {

std::atomic_size_t sequence{0};

}  // namespace

ThreadFactory::ThreadFactory(std::string_view role, bool daemon)
    : prefix_{fmt::format("evloop{}-{}", sequence.fetch_add(1) + 1, role)}, daemon_{daemon}
{
}

std::optional<std::thread>
ThreadFactory::newThread(std::function<void()> fn)
{
    auto name = fmt::format("{}-{}", prefix_, nextIndex_.fetch_add(1));

    std::thread thread{[log = log_, name = std::move(name), fn = std::move(fn)]() mutable {
        if (not util::setThreadName(name))
            LOG(log.debug()) << "OS did not accept thread name " << name;

        fn();
    }};

    if (daemon_) {
        thread.detach();
        return std::nullopt;
    }

    return thread;
}

}  // namespace evloop
