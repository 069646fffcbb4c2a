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

#include "evloop/Error.hpp"

#include <fmt/core.h>

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace evloop {

namespace {

std::string
describe(std::exception_ptr const& cause)
{
    try {
        if (cause)
            std::rethrow_exception(cause);
    } catch (std::exception const& e) {
        return e.what();
    } catch (...) {
        return "unknown";
    }
    return "unknown";
}

}  // namespace

ExecutionError
ExecutionError::failed(std::string_view threadName, std::exception_ptr cause)
{
    auto message = fmt::format("Thread {} exit with exception: {}", threadName, describe(cause));
    return ExecutionError{Kind::Failed, std::move(message), std::move(cause)};
}

ExecutionError
ExecutionError::cancelled()
{
    return ExecutionError{Kind::Cancelled, "Task was cancelled"};
}

ExecutionError
ExecutionError::timeout(long long waitedMs)
{
    return ExecutionError{Kind::Timeout, fmt::format("Task did not complete within {}ms", waitedMs)};
}

void
ExecutionError::rethrow() const
{
    if (cause)
        std::rethrow_exception(cause);
    throw std::runtime_error(message);
}

}  // namespace evloop
