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

#include "evloop/AttributeMap.hpp"
#include "evloop/Concepts.hpp"
#include "evloop/Error.hpp"
#include "evloop/impl/TaskState.hpp"
#include "util/Assert.hpp"

#include <chrono>
#include <compare>
#include <expected>
#include <memory>
#include <utility>

namespace evloop {

/**
 * @brief Handle to a task scheduled on an @ref EventLoop.
 *
 * Copies refer to the same task and share the same @ref AttributeMap.
 *
 * @tparam T The type of the value produced by the task
 */
template <typename T>
class CancelableFuture {
public:
    using ClockType = std::chrono::steady_clock;
    using ValueType = T;
    using ResultType = std::expected<T, ExecutionError>;

private:
    std::shared_ptr<impl::TaskState<T>> task_;
    std::shared_ptr<AttributeMap> attributes_;

public:
    /**
     * @brief Construct a handle for the given task
     *
     * @param task The task
     */
    explicit CancelableFuture(std::shared_ptr<impl::TaskState<T>> task)
        : task_{std::move(task)}, attributes_{std::make_shared<AttributeMap>()}
    {
        ASSERT(task_ != nullptr, "CancelableFuture requires a task");
    }

    /** @return Time left until the current or next scheduled run; negative when overdue */
    [[nodiscard]] std::chrono::nanoseconds
    getDelay() const
    {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(task_->nextRunTime() - ClockType::now());
    }

    /** @return The time of the current or next scheduled run */
    [[nodiscard]] ClockType::time_point
    scheduledAt() const
    {
        return task_->nextRunTime();
    }

    /**
     * @brief Order two handles by their scheduled run
     *
     * @param other The other handle
     * @return The ordering of this handle's scheduled run relative to the other's
     */
    template <typename U>
    [[nodiscard]] std::strong_ordering
    compareTo(CancelableFuture<U> const& other) const
    {
        auto const lhs = scheduledAt();
        auto const rhs = other.scheduledAt();

        if (lhs < rhs)
            return std::strong_ordering::less;
        if (rhs < lhs)
            return std::strong_ordering::greater;
        return std::strong_ordering::equal;
    }

    /**
     * @brief Cancel the task
     *
     * A task that did not start yet will never run. A running task is marked cancelled; its stop token is triggered
     * if requested.
     *
     * @param mayInterruptIfRunning Whether to request a stop of the running work
     * @return true if the cancellation took effect; false if the task was already done
     */
    bool
    cancel(bool mayInterruptIfRunning = false)
    {
        return task_->cancel(mayInterruptIfRunning);
    }

    /** @return true if the task was cancelled */
    [[nodiscard]] bool
    isCancelled() const
    {
        return task_->isCancelled();
    }

    /** @return true if the task completed, failed or was cancelled */
    [[nodiscard]] bool
    isDone() const
    {
        return task_->isDone();
    }

    /** @return true if the task is repeated at a fixed rate or with a fixed delay */
    [[nodiscard]] bool
    isPeriodic() const noexcept
    {
        return task_->isPeriodic();
    }

    /** @brief Block until the task is done */
    void
    wait() const
    {
        task_->wait();
    }

    /**
     * @brief Block until the task is done or the timeout expires
     *
     * @param timeout The maximum time to wait
     * @return true if the task is done
     */
    [[nodiscard]] bool
    waitFor(SomeStdDuration auto timeout) const
    {
        return task_->waitFor(std::chrono::duration_cast<ClockType::duration>(timeout));
    }

    /**
     * @brief Block until the task is done and get its result
     *
     * @return The value or an error of kind Failed or Cancelled
     */
    [[nodiscard]] ResultType
    get() const
    {
        return task_->get();
    }

    /**
     * @brief Block until the task is done or the timeout expires and get its result
     *
     * @param timeout The maximum time to wait
     * @return The value or an error of kind Failed, Cancelled or Timeout
     */
    [[nodiscard]] ResultType
    get(SomeStdDuration auto timeout) const
    {
        return task_->get(std::chrono::duration_cast<ClockType::duration>(timeout));
    }

    /** @return The metadata store attached to this handle */
    [[nodiscard]] AttributeMap&
    attributes() const noexcept
    {
        return *attributes_;
    }
};

}  // namespace evloop
