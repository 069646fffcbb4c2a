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

#include "evloop/Error.hpp"
#include "evloop/StopToken.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <condition_variable>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace evloop::impl {

class LoopState;

/** @brief How a task is repeated */
enum class Schedule {
    Once,
    FixedRate,  /**< Next start is the previous scheduled start plus the period */
    FixedDelay, /**< Next start is the end of the previous run plus the period */
};

/**
 * @brief Type-erased part of a scheduled task.
 *
 * Every task owns a timer and a strand on the loop's io_context. The timer fires on the strand, so runs of one task
 * never overlap and cancellation is serialized with them. Status transitions are guarded by the task mutex:
 *
 * Scheduled -> Running -> Scheduled (periodic) | Completed | Cancelled
 * Scheduled -> Cancelled
 */
class TaskBase : public std::enable_shared_from_this<TaskBase> {
public:
    using ClockType = std::chrono::steady_clock;
    using RunnableType = std::function<void()>;

    enum class Status { Scheduled, Running, Completed, Cancelled };

private:
    std::shared_ptr<LoopState> loop_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    Schedule schedule_;
    ClockType::duration period_;
    StopSource stopSource_;

    ClockType::time_point nextRun_;
    Status status_ = Status::Scheduled;

protected:
    mutable std::mutex mtx_;
    mutable std::condition_variable done_;

public:
    /**
     * @brief Construct a new task
     *
     * @param loop The loop the task belongs to
     * @param firstRun When the task should run for the first time
     * @param schedule How the task is repeated
     * @param period The period for repeated tasks; ignored for Schedule::Once
     */
    TaskBase(
        std::shared_ptr<LoopState> loop,
        ClockType::time_point firstRun,
        Schedule schedule,
        ClockType::duration period
    );

    virtual ~TaskBase() = default;

    TaskBase(TaskBase const&) = delete;
    TaskBase(TaskBase&&) = delete;
    TaskBase&
    operator=(TaskBase const&) = delete;
    TaskBase&
    operator=(TaskBase&&) = delete;

    /**
     * @brief Arm the timer for the first run; called once the loop admitted the task
     */
    void
    start();

    /**
     * @brief Cancel the task
     *
     * @param mayInterruptIfRunning Request a stop through the task's stop token if it is running right now
     * @return true if the task was cancelled by this call; false if it was already done
     */
    bool
    cancel(bool mayInterruptIfRunning);

    /**
     * @brief Cancel the task if it is not running right now
     *
     * Used by a loop that shuts down immediately. A running task gets a stop request instead.
     *
     * @return A callable running the work once if the task was waiting for its (next) run; std::nullopt otherwise
     */
    [[nodiscard]] std::optional<RunnableType>
    drain();

    /** @return true if the task was cancelled */
    [[nodiscard]] bool
    isCancelled() const;

    /** @return true if the task completed, failed or was cancelled */
    [[nodiscard]] bool
    isDone() const;

    /** @return true if the task is repeated */
    [[nodiscard]] bool
    isPeriodic() const noexcept
    {
        return schedule_ != Schedule::Once;
    }

    /** @return The time of the current or next scheduled run */
    [[nodiscard]] ClockType::time_point
    nextRunTime() const;

    /** @brief Block until the task is done */
    void
    wait() const;

    /**
     * @brief Block until the task is done or the timeout expires
     *
     * @param timeout The maximum time to wait
     * @return true if the task is done; false if the timeout expired first
     */
    [[nodiscard]] bool
    waitFor(ClockType::duration timeout) const;

protected:
    /**
     * @brief Run the work once and keep its value aside; exceptions are propagated
     *
     * @param token The stop token of this task
     */
    virtual void
    invoke(StopToken token) = 0;

    /** @brief Publish the value kept aside by @ref invoke as the result; called with the mutex held */
    virtual void
    publishValue() = 0;

    /**
     * @brief Publish an error as the result; called with the mutex held
     *
     * @param error The error
     */
    virtual void
    publishError(ExecutionError error) = 0;

    /** @return A callable running the work once and discarding its result */
    [[nodiscard]] virtual RunnableType
    makeRunnable() const = 0;

    [[nodiscard]] bool
    isDoneLocked() const
    {
        return status_ == Status::Completed or status_ == Status::Cancelled;
    }

private:
    void
    arm(ClockType::time_point when);

    void
    onTimer(boost::system::error_code const& ec);

    void
    cancelTimer();
};

/**
 * @brief A scheduled task producing values of type T
 *
 * @tparam T The type of the value produced by one run of the work
 */
template <typename T>
class TaskState final : public TaskBase {
public:
    using ValueType = T;
    using ResultType = std::expected<T, ExecutionError>;
    using FnType = std::function<T(StopToken)>;

private:
    using StoredValueType = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    FnType fn_;
    std::optional<StoredValueType> value_;
    std::optional<ResultType> result_;

public:
    /**
     * @brief Construct a new task
     *
     * @param loop The loop the task belongs to
     * @param fn The work
     * @param firstRun When the task should run for the first time
     * @param schedule How the task is repeated
     * @param period The period for repeated tasks; ignored for Schedule::Once
     */
    TaskState(
        std::shared_ptr<LoopState> loop,
        FnType fn,
        ClockType::time_point firstRun,
        Schedule schedule = Schedule::Once,
        ClockType::duration period = ClockType::duration::zero()
    )
        : TaskBase{std::move(loop), firstRun, schedule, period}, fn_{std::move(fn)}
    {
    }

    /**
     * @brief Block until the task is done and get its result
     *
     * @return The value or the error the task finished with
     */
    [[nodiscard]] ResultType
    get() const
    {
        wait();

        std::lock_guard const lock{mtx_};
        return *result_;
    }

    /**
     * @brief Block until the task is done or the timeout expires and get its result
     *
     * @param timeout The maximum time to wait
     * @return The value or the error the task finished with; an error of kind Timeout if the timeout expired first
     */
    [[nodiscard]] ResultType
    get(ClockType::duration timeout) const
    {
        if (not waitFor(timeout)) {
            return std::unexpected{
                ExecutionError::timeout(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count())
            };
        }

        std::lock_guard const lock{mtx_};
        return *result_;
    }

protected:
    void
    invoke(StopToken token) override
    {
        if constexpr (std::is_void_v<T>) {
            fn_(std::move(token));
        } else {
            value_.emplace(fn_(std::move(token)));
        }
    }

    void
    publishValue() override
    {
        if constexpr (std::is_void_v<T>) {
            result_.emplace();
        } else {
            result_.emplace(std::move(*value_));
            value_.reset();
        }
    }

    void
    publishError(ExecutionError error) override
    {
        result_.emplace(std::unexpected{std::move(error)});
    }

    [[nodiscard]] RunnableType
    makeRunnable() const override
    {
        return [fn = fn_]() mutable { std::invoke(fn, StopSource{}.getToken()); };
    }
};

}  // namespace evloop::impl
