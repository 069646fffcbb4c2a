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

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace evloop {

/**
 * @brief Creates the named worker threads of one EventLoop.
 *
 * Workers are named `evloop<seq>-<role>-<index>`, where `seq` is unique per factory within the process and `index`
 * counts the threads created by the factory.
 */
class ThreadFactory {
    util::Logger log_{"EventLoop"};
    std::string prefix_;
    bool daemon_;
    std::atomic_size_t nextIndex_{0};

public:
    /**
     * @brief Construct a factory for a new loop
     *
     * @param role The role of the loop, e.g. `general` or `T` for loops owned by the caller
     * @param daemon Whether the threads are detached so that they never hold up the process
     */
    ThreadFactory(std::string_view role, bool daemon);

    /**
     * @brief Start a new named thread
     *
     * @param fn The body of the thread
     * @return The joinable thread; std::nullopt for a daemon factory, whose threads are detached
     */
    [[nodiscard]] std::optional<std::thread>
    newThread(std::function<void()> fn);

    /** @return The common prefix of all thread names, e.g. `evloop3-io` */
    [[nodiscard]] std::string const&
    prefix() const noexcept
    {
        return prefix_;
    }

    /** @return true if threads are detached */
    [[nodiscard]] bool
    isDaemon() const noexcept
    {
        return daemon_;
    }

    /** @return Number of threads created so far */
    [[nodiscard]] std::size_t
    threadCount() const noexcept
    {
        return nextIndex_;
    }
};

}  // namespace evloop
