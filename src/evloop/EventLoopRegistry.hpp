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

#include "evloop/EventLoop.hpp"
#include "util/ShutdownHook.hpp"
#include "util/log/Logger.hpp"

#include <boost/signals2/connection.hpp>

#include <array>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace util {
class Config;
}  // namespace util

namespace evloop {

/** @brief The process-wide event loops */
enum class GlobalLoop {
    General, /**< One worker per hardware thread */
    Serial,  /**< One worker; work runs in submission order */
    Io,      /**< Many workers for blocking work */
};

/**
 * @brief Get the name of a global loop
 *
 * @param which The loop
 * @return `general`, `serial` or `io`
 */
[[nodiscard]] std::string_view
toString(GlobalLoop which);

/**
 * @brief Find a global loop by its name
 *
 * @param name The name, as returned by @ref toString
 * @return The loop if the name is known; std::nullopt otherwise
 */
[[nodiscard]] std::optional<GlobalLoop>
globalLoopFromString(std::string_view name);

/**
 * @brief Sizes and daemon flag of the global loops
 */
struct GlobalLoopSettings {
    static constexpr std::size_t kDEFAULT_IO_THREADS = 128;

    std::size_t generalThreads = EventLoop::coreCount();
    std::size_t serialThreads = 1;
    std::size_t ioThreads = kDEFAULT_IO_THREADS;
    bool daemon = true;

    /**
     * @brief Read the settings from the `event_loop` section of a config
     *
     * Recognised keys are `general_threads`, `io_threads` and `daemon`; missing keys keep their defaults.
     *
     * @param config The whole config
     * @return The settings
     */
    [[nodiscard]] static GlobalLoopSettings
    fromConfig(util::Config const& config);
};

/**
 * @brief Owner of the global event loops.
 *
 * Each loop is created on first use, exactly once, no matter how many threads ask for it at the same time. Global
 * loops refuse to be shut down by their users. A non-daemon loop is shut down and joined by the shutdown hook instead.
 * A daemon loop is stopped by a hook of priority RunLast and its workers are never joined.
 */
class EventLoopRegistry {
    static constexpr std::size_t kNUM_LOOPS = 3;

    struct Slot {
        std::once_flag once;
        std::atomic<EventLoop*> ready{nullptr};
        std::atomic_size_t constructions{0};
        std::unique_ptr<EventLoop> loop;
        boost::signals2::scoped_connection shutdownConnection;
    };

    util::Logger log_{"EventLoop"};
    GlobalLoopSettings settings_;
    std::reference_wrapper<util::ShutdownHook> shutdownHook_;
    std::array<Slot, kNUM_LOOPS> slots_;

public:
    /**
     * @brief Construct a registry
     *
     * @param settings Sizes and daemon flag of the loops
     * @param shutdownHook Where non-daemon loops register their shutdown
     */
    explicit EventLoopRegistry(
        GlobalLoopSettings settings = {},
        util::ShutdownHook& shutdownHook = util::ShutdownHook::instance()
    );

    EventLoopRegistry(EventLoopRegistry const&) = delete;
    EventLoopRegistry(EventLoopRegistry&&) = delete;
    EventLoopRegistry&
    operator=(EventLoopRegistry const&) = delete;
    EventLoopRegistry&
    operator=(EventLoopRegistry&&) = delete;

    /**
     * @brief Get a global loop, creating it on first use
     *
     * @param which The loop
     * @return Reference to the loop; the same for every call
     */
    [[nodiscard]] EventLoop&
    get(GlobalLoop which);

    /**
     * @brief Get a global loop by name, creating it on first use
     *
     * @param name `general`, `serial` or `io`
     * @return Reference to the loop; the same for every call
     * @throws std::invalid_argument If the name is unknown
     */
    [[nodiscard]] EventLoop&
    get(std::string_view name);

    /**
     * @param which The loop
     * @return true if the loop was already created
     */
    [[nodiscard]] bool
    isCreated(GlobalLoop which) const;

    /**
     * @param which The loop
     * @return How many times the loop was constructed; never more than one
     */
    [[nodiscard]] std::size_t
    constructionCount(GlobalLoop which) const;

    /** @return The settings the loops are created with */
    [[nodiscard]] GlobalLoopSettings const&
    settings() const noexcept
    {
        return settings_;
    }

    /**
     * @brief Get the process-wide registry
     *
     * The instance lives until the process ends, so daemon loops never block exit.
     *
     * @return Reference to the registry
     */
    [[nodiscard]] static EventLoopRegistry&
    instance();

    /**
     * @brief Set the settings of the process-wide registry
     *
     * @param settings The settings
     * @return true if applied; false if the process-wide registry already exists
     */
    static bool
    configure(GlobalLoopSettings settings);

private:
    [[nodiscard]] Slot&
    slot(GlobalLoop which);

    [[nodiscard]] Slot const&
    slot(GlobalLoop which) const;

    void
    create(GlobalLoop which, Slot& slot);
};

/** @return The process-wide multi-threaded loop */
[[nodiscard]] EventLoop&
general();

/** @return The process-wide single-threaded loop */
[[nodiscard]] EventLoop&
serial();

/** @return The process-wide loop for blocking work */
[[nodiscard]] EventLoop&
io();

}  // namespace evloop
