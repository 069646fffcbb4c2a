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

#include "evloop/impl/TaskState.hpp"

#include "evloop/Error.hpp"
#include "evloop/impl/LoopState.hpp"
#include "util/Assert.hpp"
#include "util/Thread.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace evloop::impl {

TaskBase::TaskBase(
    std::shared_ptr<LoopState> loop,
    ClockType::time_point firstRun,
    Schedule schedule,
    ClockType::duration period
)
    : loop_{std::move(loop)}
    , strand_{boost::asio::make_strand(loop_->context())}
    , timer_{strand_}
    , schedule_{schedule}
    , period_{period}
    , nextRun_{firstRun}
{
    ASSERT(schedule_ == Schedule::Once or period_ > ClockType::duration::zero(), "Period must be positive");
}

void
TaskBase::start()
{
    boost::asio::dispatch(strand_, [weak = weak_from_this()] {
        if (auto self = weak.lock(); self and not self->isDone())
            self->arm(self->nextRunTime());
    });
}

bool
TaskBase::cancel(bool mayInterruptIfRunning)
{
    bool wasRunning = false;
    {
        std::lock_guard const lock{mtx_};
        if (isDoneLocked())
            return false;

        wasRunning = status_ == Status::Running;
        status_ = Status::Cancelled;
        publishError(ExecutionError::cancelled());
    }

    done_.notify_all();

    if (wasRunning and mayInterruptIfRunning)
        stopSource_.requestStop();

    cancelTimer();
    loop_->release(this);
    return true;
}

std::optional<TaskBase::RunnableType>
TaskBase::drain()
{
    {
        std::lock_guard const lock{mtx_};
        if (status_ == Status::Running)
            stopSource_.requestStop();

        if (status_ != Status::Scheduled)
            return std::nullopt;

        status_ = Status::Cancelled;
        publishError(ExecutionError::cancelled());
    }

    done_.notify_all();
    cancelTimer();
    loop_->release(this);
    return makeRunnable();
}

bool
TaskBase::isCancelled() const
{
    std::lock_guard const lock{mtx_};
    return status_ == Status::Cancelled;
}

bool
TaskBase::isDone() const
{
    std::lock_guard const lock{mtx_};
    return isDoneLocked();
}

TaskBase::ClockType::time_point
TaskBase::nextRunTime() const
{
    std::lock_guard const lock{mtx_};
    return nextRun_;
}

void
TaskBase::wait() const
{
    std::unique_lock lock{mtx_};
    done_.wait(lock, [this] { return isDoneLocked(); });
}

bool
TaskBase::waitFor(ClockType::duration timeout) const
{
    std::unique_lock lock{mtx_};
    return done_.wait_for(lock, timeout, [this] { return isDoneLocked(); });
}

void
TaskBase::arm(ClockType::time_point when)
{
    timer_.expires_at(when);
    timer_.async_wait([weak = weak_from_this()](boost::system::error_code const& ec) {
        if (auto self = weak.lock())
            self->onTimer(ec);
    });
}

void
TaskBase::onTimer(boost::system::error_code const& ec)
{
    if (ec == boost::asio::error::operation_aborted)
        return;

    {
        std::lock_guard const lock{mtx_};
        if (status_ != Status::Scheduled)
            return;

        status_ = Status::Running;
    }

    std::optional<ExecutionError> error;
    try {
        invoke(stopSource_.getToken());
    } catch (...) {
        error.emplace(ExecutionError::failed(util::threadName(), std::current_exception()));
    }

    std::optional<ClockType::time_point> next;
    {
        std::lock_guard const lock{mtx_};
        ASSERT(
            status_ == Status::Running or status_ == Status::Cancelled,
            "Task changed status while running: {}",
            static_cast<int>(status_)
        );

        if (status_ == Status::Running) {
            if (error) {
                publishError(std::move(*error));
                status_ = Status::Completed;
            } else if (schedule_ == Schedule::Once) {
                publishValue();
                status_ = Status::Completed;
            } else if (loop_->isShutdown()) {
                publishError(ExecutionError::cancelled());
                status_ = Status::Cancelled;
            } else {
                nextRun_ = schedule_ == Schedule::FixedRate ? nextRun_ + period_ : ClockType::now() + period_;
                next = nextRun_;
                status_ = Status::Scheduled;
            }
        }
    }

    if (next) {
        arm(*next);
        return;
    }

    done_.notify_all();
    loop_->release(this);
}

void
TaskBase::cancelTimer()
{
    boost::asio::dispatch(strand_, [weak = weak_from_this()] {
        if (auto self = weak.lock())
            self->timer_.cancel();
    });
}

}  // namespace evloop::impl
