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

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace evloop {

/**
 * @brief Error channel of every handle produced by an EventLoop
 */
struct ExecutionError {
    /** @brief What went wrong */
    enum class Kind {
        Failed,    /**< The work itself threw; see @ref cause */
        Cancelled, /**< The task was cancelled before producing a result */
        Timeout,   /**< A bounded wait for the result expired */
    };

    /**
     * @brief Construct a new Execution Error object
     *
     * @param kind The kind of the error
     * @param message Human readable description
     * @param cause The exception thrown by the work, if any
     */
    ExecutionError(Kind kind, std::string message, std::exception_ptr cause = nullptr)
        : kind{kind}, message{std::move(message)}, cause{std::move(cause)}
    {
    }

    /**
     * @brief Make an error for work that threw on the given thread
     *
     * @param threadName Name of the thread the work ran on
     * @param cause The exception thrown by the work
     * @return The error
     */
    [[nodiscard]] static ExecutionError
    failed(std::string_view threadName, std::exception_ptr cause);

    /** @return An error for a cancelled task */
    [[nodiscard]] static ExecutionError
    cancelled();

    /**
     * @brief Make an error for an expired wait
     *
     * @param waitedMs How long the caller waited, in milliseconds
     * @return The error
     */
    [[nodiscard]] static ExecutionError
    timeout(long long waitedMs);

    /**
     * @brief Rethrow the original exception if there is one, otherwise throw std::runtime_error with the message
     */
    [[noreturn]] void
    rethrow() const;

    /**
     * @brief Conversion to string
     *
     * @return The error message as a C string
     */
    [[nodiscard]] operator char const*() const noexcept
    {
        return message.c_str();
    }

    Kind kind;
    std::string message;
    std::exception_ptr cause;
};

/**
 * @brief Thrown when work is submitted to an EventLoop that is shut down or shutting down
 */
class RejectedExecutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Thrown when an operation is not allowed on a particular EventLoop, e.g. shutting down a global one
 */
class UnsupportedOperationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

}  // namespace evloop
