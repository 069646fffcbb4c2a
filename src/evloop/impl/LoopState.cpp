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

#include "evloop/impl/LoopState.hpp"

#include "evloop/impl/TaskState.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace evloop::impl {

LoopState::LoopState(std::size_t numWorkers)
    : workGuard_{boost::asio::make_work_guard(ioc_)}, activeWorkers_{numWorkers}
{
}

boost::asio::io_context&
LoopState::context() noexcept
{
    return ioc_;
}

void
LoopState::runWorker()
{
    ioc_.run();
    workerFinished();
}

bool
LoopState::admit(std::shared_ptr<TaskBase> task)
{
    std::lock_guard const lock{mtx_};
    if (isShutdown_)
        return false;

    auto const* key = task.get();
    tasks_.emplace(key, std::move(task));
    return true;
}

void
LoopState::release(TaskBase const* task)
{
    std::shared_ptr<TaskBase> released;
    {
        std::lock_guard const lock{mtx_};
        if (auto it = tasks_.find(task); it != tasks_.end()) {
            released = std::move(it->second);
            tasks_.erase(it);
        }

        if (isShutdown_ and tasks_.empty())
            workGuard_.reset();
    }
    // the last reference to the task may be dropped here, outside of the lock
}

std::vector<std::shared_ptr<TaskBase>>
LoopState::beginShutdown()
{
    std::vector<std::shared_ptr<TaskBase>> snapshot;

    std::lock_guard const lock{mtx_};
    isShutdown_ = true;

    // admitted tasks may not have posted their first run yet; workers must stay until every one is released
    if (tasks_.empty())
        workGuard_.reset();

    snapshot.reserve(tasks_.size());
    for (auto const& [_, task] : tasks_)
        snapshot.push_back(task);

    return snapshot;
}

void
LoopState::stop()
{
    ioc_.stop();
}

bool
LoopState::isShutdown() const
{
    std::lock_guard const lock{mtx_};
    return isShutdown_;
}

bool
LoopState::isTerminated() const
{
    std::lock_guard const lock{mtx_};
    return isShutdown_ and activeWorkers_ == 0;
}

bool
LoopState::awaitTermination(std::chrono::steady_clock::duration timeout) const
{
    std::unique_lock lock{mtx_};
    return terminated_.wait_for(lock, timeout, [this] { return activeWorkers_ == 0; });
}

void
LoopState::awaitTermination() const
{
    std::unique_lock lock{mtx_};
    terminated_.wait(lock, [this] { return activeWorkers_ == 0; });
}

std::size_t
LoopState::pendingTasks() const
{
    std::lock_guard const lock{mtx_};
    return tasks_.size();
}

void
LoopState::workerFinished()
{
    {
        std::lock_guard const lock{mtx_};
        --activeWorkers_;
    }
    terminated_.notify_all();
}

}  // namespace evloop::impl
