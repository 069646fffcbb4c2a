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

#include <boost/signals2/connection.hpp>
#include <boost/signals2/signal.hpp>
#include <boost/signals2/variadic_signal.hpp>

#include <atomic>
#include <functional>
#include <mutex>

namespace util {

/**
 * @brief Runs registered cleanup routines once, when the process exits.
 *
 * The process-wide instance (see @ref instance) is triggered by std::atexit. Other instances are only triggered by an
 * explicit call to @ref run, which makes them usable in tests.
 */
class ShutdownHook {
    util::Logger log_{"Shutdown"};
    boost::signals2::signal<void()> onShutdown_;
    std::once_flag once_;
    std::atomic_bool hasRun_{false};

public:
    /**
     * @brief Order in which hooks run; hooks of the same priority run in registration order.
     */
    enum class Priority { RunFirst = 0, Normal = 1, RunLast = 2 };

    ShutdownHook() = default;

    ShutdownHook(ShutdownHook const&) = delete;
    ShutdownHook(ShutdownHook&&) = delete;
    ShutdownHook&
    operator=(ShutdownHook const&) = delete;
    ShutdownHook&
    operator=(ShutdownHook&&) = delete;

    /**
     * @brief Register a cleanup routine.
     *
     * Exceptions escaping the routine are logged and do not prevent other routines from running.
     *
     * @param hook The routine to run at shutdown
     * @param priority The priority of the routine
     * @return The connection; disconnecting it unregisters the routine
     */
    boost::signals2::connection
    registerHook(std::function<void()> hook, Priority priority = Priority::Normal);

    /**
     * @brief Run all registered routines. Only the first call has any effect.
     */
    void
    run();

    /**
     * @return true if @ref run was already called; false otherwise
     */
    [[nodiscard]] bool
    hasRun() const noexcept;

    /**
     * @brief Get the process-wide instance, run automatically at process exit
     *
     * @return Reference to the global shutdown hook
     */
    [[nodiscard]] static ShutdownHook&
    instance();
};

}  // namespace util
