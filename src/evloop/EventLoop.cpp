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

#include "evloop/EventLoop.hpp"

#include "evloop/Error.hpp"
#include "evloop/impl/LoopState.hpp"
#include "evloop/impl/TaskState.hpp"
#include "util/config/Config.hpp"
#include "util/log/Logger.hpp"

#include <boost/json/object.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace evloop {

namespace {

std::size_t
checkedThreadCount(std::size_t numThreads)
{
    if (numThreads == 0)
        throw std::invalid_argument("EventLoop requires at least one thread");
    return numThreads;
}

}  // namespace

std::size_t
EventLoop::coreCount()
{
    return std::max(1u, std::thread::hardware_concurrency());
}

EventLoop::EventLoop(std::size_t numThreads, bool daemon) : EventLoop{numThreads, daemon, "T", false}
{
}

EventLoop::EventLoop(std::size_t numThreads, bool daemon, std::string_view role, bool isProtected)
    : numThreads_{checkedThreadCount(numThreads)}
    , protected_{isProtected}
    , threadFactory_{role, daemon}
    , state_{std::make_shared<impl::LoopState>(numThreads_)}
{
    threads_.reserve(daemon ? 0 : numThreads_);
    for (std::size_t i = 0; i < numThreads_; ++i) {
        if (auto thread = threadFactory_.newThread([state = state_] { state->runWorker(); }); thread.has_value())
            threads_.push_back(std::move(*thread));
    }

    LOG(log_.debug()) << "Started " << name() << " with " << numThreads_ << " threads"
                      << (daemon ? " (daemon)" : "");
}

EventLoop::~EventLoop()
{
    if (auto const pending = doShutdownNow(); not pending.empty())
        LOG(log_.debug()) << "Dropped " << pending.size() << " tasks of " << name() << " that never started";

    for (auto& thread : threads_) {
        if (thread.joinable())
            thread.join();
    }

    // daemon workers are detached; they still hold the state but must not outlive the loop's users
    state_->awaitTermination();
}

std::unique_ptr<EventLoop>
EventLoop::newSingle(bool daemon)
{
    return std::make_unique<EventLoop>(1, daemon);
}

std::unique_ptr<EventLoop>
EventLoop::newCoreLoop(bool daemon)
{
    return std::make_unique<EventLoop>(coreCount(), daemon);
}

std::unique_ptr<EventLoop>
EventLoop::newEventLoop(std::size_t numThreads, bool daemon)
{
    return std::make_unique<EventLoop>(numThreads, daemon);
}

std::unique_ptr<EventLoop>
EventLoop::makeEventLoop(util::Config const& config)
{
    static util::Logger const log{"EventLoop"};
    auto const numThreads = config.valueOr<uint32_t>("threads", static_cast<uint32_t>(coreCount()));
    auto const daemon = config.valueOr("daemon", false);

    LOG(log.info()) << "Number of workers = " << numThreads << ". Daemon = " << daemon;
    return std::make_unique<EventLoop>(numThreads, daemon);
}

void
EventLoop::shutdown()
{
    if (protected_)
        throw UnsupportedOperationError{fmt::format("{} is a global event loop and can't be shut down", name())};

    doShutdown();
}

std::vector<EventLoop::PendingTask>
EventLoop::shutdownNow()
{
    if (protected_)
        throw UnsupportedOperationError{fmt::format("{} is a global event loop and can't be shut down", name())};

    return doShutdownNow();
}

bool
EventLoop::isShutdown() const
{
    return state_->isShutdown();
}

bool
EventLoop::isTerminated() const
{
    return state_->isTerminated();
}

boost::json::object
EventLoop::report() const
{
    auto obj = boost::json::object{};

    obj["name"] = name();
    obj["threads"] = numThreads_;
    obj["daemon"] = isDaemon();
    obj["protected"] = protected_;
    obj["shutdown"] = isShutdown();
    obj["terminated"] = isTerminated();
    obj["pending_tasks"] = state_->pendingTasks();

    return obj;
}

void
EventLoop::admit(std::shared_ptr<impl::TaskBase> const& task)
{
    if (not state_->admit(task)) {
        LOG(log_.warn()) << name() << " is shut down, rejecting incoming task.";
        throw RejectedExecutionError{fmt::format("{} is shut down", name())};
    }

    task->start();
}

void
EventLoop::doShutdown()
{
    auto const tasks = state_->beginShutdown();
    LOG(log_.info()) << "Shutting down " << name() << "; " << tasks.size() << " tasks pending";

    for (auto const& task : tasks) {
        if (task->isPeriodic())
            task->cancel(false);
    }
}

std::vector<EventLoop::PendingTask>
EventLoop::doShutdownNow()
{
    auto const tasks = state_->beginShutdown();
    LOG(log_.info()) << "Shutting down " << name() << " now; " << tasks.size() << " tasks pending";

    std::vector<PendingTask> notStarted;
    for (auto const& task : tasks) {
        if (auto runnable = task->drain(); runnable.has_value())
            notStarted.push_back(std::move(*runnable));
    }

    state_->stop();
    return notStarted;
}

void
EventLoop::shutdownAndJoin()
{
    doShutdown();

    for (auto& thread : threads_) {
        if (thread.joinable())
            thread.join();
    }

    LOG(log_.info()) << name() << " terminated";
}

}  // namespace evloop
