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

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace evloop::impl {

class TaskBase;

/**
 * @brief State of an EventLoop shared with its workers and its tasks.
 *
 * Tasks keep the state (and therefore the io_context their timers belong to) alive for as long as they exist. The
 * state keeps every task that is not finished yet, so a shut down loop can find the work it has to cancel.
 */
class LoopState {
    using WorkGuardType = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    boost::asio::io_context ioc_;

    mutable std::mutex mtx_;
    mutable std::condition_variable terminated_;
    std::optional<WorkGuardType> workGuard_;
    std::unordered_map<TaskBase const*, std::shared_ptr<TaskBase>> tasks_;
    std::size_t activeWorkers_;
    bool isShutdown_ = false;

public:
    /**
     * @brief Construct the state for a loop that is about to start the given number of workers
     *
     * @param numWorkers The number of workers that will call @ref runWorker
     */
    explicit LoopState(std::size_t numWorkers);

    LoopState(LoopState const&) = delete;
    LoopState(LoopState&&) = delete;
    LoopState&
    operator=(LoopState const&) = delete;
    LoopState&
    operator=(LoopState&&) = delete;

    /** @return The io_context all work of the loop runs on */
    [[nodiscard]] boost::asio::io_context&
    context() noexcept;

    /**
     * @brief Run the io_context on the calling thread until the loop is shut down and drained
     */
    void
    runWorker();

    /**
     * @brief Start tracking a task
     *
     * @param task The task
     * @return true if the task was admitted; false if the loop is shut down
     */
    [[nodiscard]] bool
    admit(std::shared_ptr<TaskBase> task);

    /**
     * @brief Stop tracking a task; does nothing if the task is not tracked
     *
     * Once the loop is shut down, releasing the last task lets the workers exit.
     *
     * @param task The task
     */
    void
    release(TaskBase const* task);

    /**
     * @brief Stop accepting tasks and let the workers exit once every tracked task is released
     *
     * @return All tasks that are not finished yet
     */
    [[nodiscard]] std::vector<std::shared_ptr<TaskBase>>
    beginShutdown();

    /**
     * @brief Make the workers exit as soon as their current handler returns
     */
    void
    stop();

    /** @return true once @ref beginShutdown was called */
    [[nodiscard]] bool
    isShutdown() const;

    /** @return true once shut down and all workers exited */
    [[nodiscard]] bool
    isTerminated() const;

    /**
     * @brief Block until all workers exited or the timeout expires
     *
     * @param timeout The maximum time to wait
     * @return true if terminated; false if the timeout expired first
     */
    [[nodiscard]] bool
    awaitTermination(std::chrono::steady_clock::duration timeout) const;

    /** @brief Block until all workers exited */
    void
    awaitTermination() const;

    /** @return Number of tracked tasks */
    [[nodiscard]] std::size_t
    pendingTasks() const;

private:
    void
    workerFinished();
};

}  // namespace evloop::impl
