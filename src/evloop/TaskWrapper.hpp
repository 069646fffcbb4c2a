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

#include "evloop/Concepts.hpp"
#include "evloop/StopToken.hpp"
#include "util/Thread.hpp"
#include "util/log/Logger.hpp"

#include <exception>
#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

namespace evloop {

namespace impl {

/** @return The logger used to report failures of scheduled work */
util::Logger const&
taskLogger();

/**
 * @brief Turn work that does not care about cancellation into work taking a stop token
 *
 * @param fn The work
 * @return Work invocable with a @ref StopToken
 */
template <typename FnType>
[[nodiscard]] auto
withStopToken(FnType&& fn)
{
    using DecayedType = std::decay_t<FnType>;

    if constexpr (SomeHandlerWith<DecayedType&, StopToken>) {
        return DecayedType(std::forward<FnType>(fn));
    } else {
        static_assert(SomeHandlerWithoutStopToken<DecayedType&>, "Work must be invocable with or without a StopToken");
        return [fn = std::forward<FnType>(fn)](StopToken) mutable { return std::invoke(fn); };
    }
}

/**
 * @brief The type of the value produced by a unit of work
 */
template <typename FnType>
using TaskResultType = std::decay_t<std::invoke_result_t<decltype(withStopToken(std::declval<FnType>()))&, StopToken>>;

}  // namespace impl

/**
 * @brief Decorate a unit of work so that a failure is logged before it propagates
 *
 * The returned callable invokes the work with whatever arguments it is given. A value is forwarded unchanged. An
 * exception is logged at error severity on the `EventLoop` channel, together with the name of the thread it happened
 * on, and then rethrown as the same exception object.
 *
 * @param fn The work
 * @return The decorated work
 */
template <typename FnType>
[[nodiscard]] auto
wrapped(FnType&& fn)
{
    return [fn = std::forward<FnType>(fn)]<typename... Args>(Args&&... args) mutable -> decltype(auto) {
        try {
            return std::invoke(fn, std::forward<Args>(args)...);
        } catch (std::exception const& e) {
            LOG(impl::taskLogger().error())
                << "Scheduled task failed on thread " << util::threadName() << ": " << e.what();
            throw;
        } catch (...) {
            LOG(impl::taskLogger().error())
                << "Scheduled task failed on thread " << util::threadName() << " with an unknown exception";
            throw;
        }
    };
}

/**
 * @brief Decorate a batch of work element by element
 *
 * @param tasks The work
 * @return The decorated work, in the same order
 */
template <typename FnType>
[[nodiscard]] auto
wrappedAll(std::vector<FnType> tasks)
{
    std::vector<decltype(wrapped(std::declval<FnType>()))> result;
    result.reserve(tasks.size());

    for (auto& task : tasks)
        result.push_back(wrapped(std::move(task)));

    return result;
}

}  // namespace evloop
