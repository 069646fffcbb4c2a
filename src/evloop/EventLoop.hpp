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

#include "evloop/CancelableFuture.hpp"
#include "evloop/Concepts.hpp"
#include "evloop/Error.hpp"
#include "evloop/StopToken.hpp"
#include "evloop/TaskWrapper.hpp"
#include "evloop/ThreadFactory.hpp"
#include "evloop/impl/LoopState.hpp"
#include "evloop/impl/TaskState.hpp"
#include "util/Thread.hpp"
#include "util/log/Logger.hpp"

#include <boost/json/object.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace util {
class Config;
}  // namespace util

namespace evloop {

class EventLoopRegistry;

/**
 * @brief A fixed-size group of named worker threads running immediate, delayed and periodic work.
 *
 * Work is any callable taking either nothing or a @ref StopToken. Every unit of work is decorated with @ref wrapped
 * before it is scheduled, so its failure is always logged. The outcome is available through the returned
 * @ref CancelableFuture.
 *
 * Destroying a loop that is still running shuts it down immediately and waits for its workers.
 */
class EventLoop {
public:
    using ClockType = std::chrono::steady_clock;
    using PendingTask = std::function<void()>;

    /** @brief Number of workers used by @ref newCoreLoop */
    static std::size_t
    coreCount();

private:
    util::Logger log_{"EventLoop"};
    std::size_t numThreads_;
    bool protected_;
    ThreadFactory threadFactory_;
    std::shared_ptr<impl::LoopState> state_;
    std::vector<std::thread> threads_;

    friend class EventLoopRegistry;

public:
    /**
     * @brief Create a loop owned by the caller
     *
     * @param numThreads Number of worker threads; must be positive
     * @param daemon Whether the workers are detached so that they never hold up the process
     * @throws std::invalid_argument If numThreads is zero
     */
    explicit EventLoop(std::size_t numThreads, bool daemon = false);

    ~EventLoop();

    EventLoop(EventLoop const&) = delete;
    EventLoop(EventLoop&&) = delete;
    EventLoop&
    operator=(EventLoop const&) = delete;
    EventLoop&
    operator=(EventLoop&&) = delete;

    /**
     * @brief Create a loop with one worker
     *
     * @param daemon Whether the worker is detached
     * @return The loop
     */
    [[nodiscard]] static std::unique_ptr<EventLoop>
    newSingle(bool daemon = false);

    /**
     * @brief Create a loop with one worker per hardware thread
     *
     * @param daemon Whether the workers are detached
     * @return The loop
     */
    [[nodiscard]] static std::unique_ptr<EventLoop>
    newCoreLoop(bool daemon = false);

    /**
     * @brief Create a loop with the given number of workers
     *
     * @param numThreads Number of worker threads; must be positive
     * @param daemon Whether the workers are detached
     * @return The loop
     */
    [[nodiscard]] static std::unique_ptr<EventLoop>
    newEventLoop(std::size_t numThreads, bool daemon = false);

    /**
     * @brief Create a loop from a config section with the optional keys `threads` and `daemon`
     *
     * @param config The config section
     * @return The loop
     */
    [[nodiscard]] static std::unique_ptr<EventLoop>
    makeEventLoop(util::Config const& config);

    /**
     * @brief Schedule work to run as soon as a worker is free
     *
     * @param fn The work
     * @return Handle to the scheduled work
     * @throws RejectedExecutionError If the loop is shut down
     */
    template <typename FnType>
    [[nodiscard]] auto
    submit(FnType&& fn)
    {
        return schedule(std::forward<FnType>(fn), std::chrono::nanoseconds::zero());
    }

    /**
     * @brief Schedule work to run as soon as a worker is free; the handle resolves to the given value on success
     *
     * @param fn The work; its own result is discarded
     * @param result The value the handle resolves to
     * @return Handle to the scheduled work
     * @throws RejectedExecutionError If the loop is shut down
     */
    template <typename FnType, typename ResultType>
    [[nodiscard]] CancelableFuture<ResultType>
    submit(FnType&& fn, ResultType result)
    {
        auto task = wrapped(impl::withStopToken(std::forward<FnType>(fn)));
        return CancelableFuture<ResultType>{enqueue<ResultType>(
            [task = std::move(task), result = std::move(result)](StopToken token) mutable -> ResultType {
                std::invoke(task, std::move(token));
                return result;
            },
            ClockType::now()
        )};
    }

    /**
     * @brief Run work as soon as a worker is free without tracking its outcome; a failure is still logged
     *
     * @param fn The work
     * @throws RejectedExecutionError If the loop is shut down
     */
    template <typename FnType>
    void
    execute(FnType&& fn)
    {
        using RetType = impl::TaskResultType<FnType>;
        enqueue<RetType>(wrapped(impl::withStopToken(std::forward<FnType>(fn))), ClockType::now());
    }

    /**
     * @brief Schedule work to run once after a delay
     *
     * @param fn The work
     * @param delay The delay measured from now; zero or negative means as soon as possible
     * @return Handle to the scheduled work
     * @throws RejectedExecutionError If the loop is shut down
     */
    template <typename FnType>
    [[nodiscard]] auto
    schedule(FnType&& fn, SomeStdDuration auto delay)
    {
        using RetType = impl::TaskResultType<FnType>;
        return CancelableFuture<RetType>{
            enqueue<RetType>(wrapped(impl::withStopToken(std::forward<FnType>(fn))), ClockType::now() + toClock(delay))
        };
    }

    /**
     * @brief Schedule work to run periodically; runs start `period` apart
     *
     * A run that takes longer than the period delays the next one, and missed runs follow back to back. Runs never
     * overlap. The registration ends when it is cancelled, when a run fails or when the loop shuts down.
     *
     * @param fn The work; its result is discarded
     * @param initialDelay The delay before the first run
     * @param period The time between the starts of two consecutive runs; must be positive
     * @return Handle to the registration; it only completes with an error
     * @throws RejectedExecutionError If the loop is shut down
     * @throws std::invalid_argument If period is not positive
     */
    template <typename FnType>
    [[nodiscard]] CancelableFuture<void>
    scheduleAtFixedRate(FnType&& fn, SomeStdDuration auto initialDelay, SomeStdDuration auto period)
    {
        return schedulePeriodic(
            std::forward<FnType>(fn), toClock(initialDelay), toClock(period), impl::Schedule::FixedRate
        );
    }

    /**
     * @brief Schedule work to run periodically; a run starts `delay` after the previous one ended
     *
     * @param fn The work; its result is discarded
     * @param initialDelay The delay before the first run
     * @param delay The time between the end of one run and the start of the next; must be positive
     * @return Handle to the registration; it only completes with an error
     * @throws RejectedExecutionError If the loop is shut down
     * @throws std::invalid_argument If delay is not positive
     */
    template <typename FnType>
    [[nodiscard]] CancelableFuture<void>
    scheduleWithFixedDelay(FnType&& fn, SomeStdDuration auto initialDelay, SomeStdDuration auto delay)
    {
        return schedulePeriodic(
            std::forward<FnType>(fn), toClock(initialDelay), toClock(delay), impl::Schedule::FixedDelay
        );
    }

    /**
     * @brief Run a batch of work and wait until all of it is done
     *
     * @param tasks The work
     * @return Handles in the order of the input, all of them done
     * @throws RejectedExecutionError If the loop is shut down; work submitted so far is cancelled
     */
    template <typename FnType>
    [[nodiscard]] auto
    invokeAll(std::vector<FnType> tasks)
    {
        auto futures = submitAll(std::move(tasks));
        for (auto const& future : futures)
            future.wait();

        return futures;
    }

    /**
     * @brief Run a batch of work and wait until all of it is done or the timeout expires
     *
     * @param tasks The work
     * @param timeout The maximum time to wait for the whole batch
     * @return Handles in the order of the input; work not done when the timeout expired is cancelled
     * @throws RejectedExecutionError If the loop is shut down; work submitted so far is cancelled
     */
    template <typename FnType>
    [[nodiscard]] auto
    invokeAll(std::vector<FnType> tasks, SomeStdDuration auto timeout)
    {
        auto const deadline = ClockType::now() + toClock(timeout);
        auto futures = submitAll(std::move(tasks));

        for (auto const& future : futures) {
            if (not future.waitFor(deadline - ClockType::now()))
                break;
        }

        for (auto& future : futures)
            future.cancel(true);

        return futures;
    }

    /**
     * @brief Run a batch of work and get the first successful result; the rest of the batch is cancelled
     *
     * @param tasks The work; must not be empty
     * @return The first successful result, or the error of the last failure if all of the work failed
     * @throws RejectedExecutionError If the loop is shut down
     * @throws std::invalid_argument If tasks is empty
     */
    template <typename FnType>
    [[nodiscard]] std::expected<impl::TaskResultType<FnType>, ExecutionError>
    invokeAny(std::vector<FnType> tasks)
    {
        return invokeAnyImpl(std::move(tasks), std::nullopt);
    }

    /**
     * @brief Run a batch of work and get the first successful result within a timeout
     *
     * @param tasks The work; must not be empty
     * @param timeout The maximum time to wait
     * @return The first successful result; the error of the last failure if all of the work failed; an error of kind
     * Timeout if the timeout expired first
     * @throws RejectedExecutionError If the loop is shut down
     * @throws std::invalid_argument If tasks is empty
     */
    template <typename FnType>
    [[nodiscard]] std::expected<impl::TaskResultType<FnType>, ExecutionError>
    invokeAny(std::vector<FnType> tasks, SomeStdDuration auto timeout)
    {
        return invokeAnyImpl(std::move(tasks), std::make_optional(toClock(timeout)));
    }

    /**
     * @brief Stop accepting work; work that is already scheduled once still runs, periodic work is cancelled
     *
     * Does not block. Use @ref awaitTermination to wait for the workers.
     *
     * @throws UnsupportedOperationError If this is a global loop
     */
    void
    shutdown();

    /**
     * @brief Stop accepting work, cancel everything that did not start and ask running work to stop
     *
     * @return The work that never started, as callables that run it once
     * @throws UnsupportedOperationError If this is a global loop
     */
    [[nodiscard]] std::vector<PendingTask>
    shutdownNow();

    /**
     * @brief Block until all workers exited after a shutdown, or the timeout expires
     *
     * @param timeout The maximum time to wait
     * @return true if the loop terminated; false if the timeout expired first
     */
    [[nodiscard]] bool
    awaitTermination(SomeStdDuration auto timeout) const
    {
        return state_->awaitTermination(toClock(timeout));
    }

    /** @return true once a shutdown was requested */
    [[nodiscard]] bool
    isShutdown() const;

    /** @return true once shut down and all workers exited */
    [[nodiscard]] bool
    isTerminated() const;

    /** @return Number of worker threads */
    [[nodiscard]] std::size_t
    size() const noexcept
    {
        return numThreads_;
    }

    /** @return true if the workers are detached */
    [[nodiscard]] bool
    isDaemon() const noexcept
    {
        return threadFactory_.isDaemon();
    }

    /** @return true if this is a global loop that can't be shut down by its users */
    [[nodiscard]] bool
    isProtected() const noexcept
    {
        return protected_;
    }

    /** @return The prefix of the names of the worker threads */
    [[nodiscard]] std::string const&
    name() const noexcept
    {
        return threadFactory_.prefix();
    }

    /**
     * @brief Generate a report of the loop state
     *
     * @return The report as a JSON object
     */
    [[nodiscard]] boost::json::object
    report() const;

private:
    EventLoop(std::size_t numThreads, bool daemon, std::string_view role, bool isProtected);

    static constexpr ClockType::duration kINVOKE_ANY_POLL_INTERVAL = std::chrono::milliseconds{10};

    template <typename Rep, typename Period>
    static ClockType::duration
    toClock(std::chrono::duration<Rep, Period> duration)
    {
        return std::chrono::duration_cast<ClockType::duration>(duration);
    }

    template <typename RetType>
    std::shared_ptr<impl::TaskState<RetType>>
    enqueue(
        typename impl::TaskState<RetType>::FnType fn,
        ClockType::time_point firstRun,
        impl::Schedule schedule = impl::Schedule::Once,
        ClockType::duration period = ClockType::duration::zero()
    )
    {
        auto task = std::make_shared<impl::TaskState<RetType>>(state_, std::move(fn), firstRun, schedule, period);
        admit(task);
        return task;
    }

    template <typename FnType>
    CancelableFuture<void>
    schedulePeriodic(FnType&& fn, ClockType::duration initialDelay, ClockType::duration period, impl::Schedule schedule)
    {
        if (period <= ClockType::duration::zero())
            throw std::invalid_argument("Period of a periodic task must be positive");

        return CancelableFuture<void>{enqueue<void>(
            [task = wrapped(impl::withStopToken(std::forward<FnType>(fn)))](StopToken token) mutable {
                std::invoke(task, std::move(token));
            },
            ClockType::now() + initialDelay,
            schedule,
            period
        )};
    }

    template <typename FnType>
    static auto
    prepareAll(std::vector<FnType> tasks)
    {
        std::vector<decltype(impl::withStopToken(std::declval<FnType>()))> adapted;
        adapted.reserve(tasks.size());

        for (auto& task : tasks)
            adapted.push_back(impl::withStopToken(std::move(task)));

        return wrappedAll(std::move(adapted));
    }

    template <typename FnType>
    auto
    submitAll(std::vector<FnType> tasks)
    {
        using RetType = impl::TaskResultType<FnType>;

        std::vector<CancelableFuture<RetType>> futures;
        futures.reserve(tasks.size());

        try {
            for (auto& task : prepareAll(std::move(tasks)))
                futures.emplace_back(enqueue<RetType>(std::move(task), ClockType::now()));
        } catch (RejectedExecutionError const&) {
            for (auto& future : futures)
                future.cancel(true);
            throw;
        }

        return futures;
    }

    template <typename FnType>
    std::expected<impl::TaskResultType<FnType>, ExecutionError>
    invokeAnyImpl(std::vector<FnType> tasks, std::optional<ClockType::duration> timeout)
    {
        using RetType = impl::TaskResultType<FnType>;
        using ResultType = std::expected<RetType, ExecutionError>;

        if (tasks.empty())
            throw std::invalid_argument("invokeAny requires at least one task");

        struct Race {
            std::mutex mtx;
            std::condition_variable cv;
            std::optional<ResultType> winner;
            std::optional<ExecutionError> lastError;
            std::size_t remaining;
        };

        auto const deadline = ClockType::now() + timeout.value_or(ClockType::duration::zero());
        auto race = std::make_shared<Race>();
        race->remaining = tasks.size();

        auto const finish = [race](std::optional<ResultType> success, std::optional<ExecutionError> error) {
            {
                std::lock_guard const lock{race->mtx};
                --race->remaining;
                if (success and not race->winner)
                    race->winner = std::move(success);
                if (error)
                    race->lastError = std::move(error);
            }
            race->cv.notify_all();
        };

        std::vector<CancelableFuture<RetType>> futures;
        futures.reserve(tasks.size());

        auto const cancelAll = [&futures] {
            for (auto& future : futures)
                future.cancel(true);
        };

        try {
            for (auto& work : prepareAll(std::move(tasks))) {
                futures.emplace_back(enqueue<RetType>(
                    [task = std::move(work), finish](StopToken token) mutable -> RetType {
                        try {
                            if constexpr (std::is_void_v<RetType>) {
                                std::invoke(task, std::move(token));
                                finish(ResultType{}, std::nullopt);
                            } else {
                                auto value = std::invoke(task, std::move(token));
                                finish(ResultType{value}, std::nullopt);
                                return value;
                            }
                        } catch (...) {
                            finish(
                                std::nullopt, ExecutionError::failed(util::threadName(), std::current_exception())
                            );
                            throw;
                        }
                    },
                    ClockType::now()
                ));
            }
        } catch (RejectedExecutionError const&) {
            cancelAll();
            throw;
        }

        // tasks cancelled before they started never report back, so their futures are polled as well
        auto const isSettled = [&race, &futures] {
            return race->winner.has_value() or race->remaining == 0 or
                std::ranges::all_of(futures, [](auto const& future) { return future.isDone(); });
        };

        std::unique_lock lock{race->mtx};
        auto settled = isSettled();
        while (not settled) {
            auto waitTime = kINVOKE_ANY_POLL_INTERVAL;
            if (timeout) {
                auto const left = deadline - ClockType::now();
                if (left <= ClockType::duration::zero())
                    break;
                waitTime = std::min(waitTime, left);
            }

            race->cv.wait_for(lock, waitTime);
            settled = isSettled();
        }

        auto result = [&]() -> ResultType {
            if (race->winner)
                return std::move(*race->winner);
            if (not settled) {
                return std::unexpected{ExecutionError::timeout(
                    std::chrono::duration_cast<std::chrono::milliseconds>(*timeout).count()
                )};
            }
            if (race->lastError)
                return std::unexpected{std::move(*race->lastError)};
            return std::unexpected{ExecutionError::cancelled()};
        }();
        lock.unlock();

        cancelAll();
        return result;
    }

    void
    admit(std::shared_ptr<impl::TaskBase> const& task);

    void
    doShutdown();

    [[nodiscard]] std::vector<PendingTask>
    doShutdownNow();

    void
    shutdownAndJoin();
};

}  // namespace evloop
