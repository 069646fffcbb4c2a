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

#include <atomic>
#include <memory>

namespace evloop {

/**
 * @brief Requests cooperative interruption of a running task.
 *
 * Copies share the same state. Work that wants to be interruptible takes a @ref StopSource::Token and polls it.
 */
class StopSource {
    struct State {
        std::atomic_bool isStopRequested{false};
    };

    std::shared_ptr<State> shared_ = std::make_shared<State>();

public:
    /**
     * @brief The read side of a stop source; handed to the work
     */
    class Token {
        friend class StopSource;
        std::shared_ptr<State const> shared_;

        explicit Token(StopSource const* source) : shared_{source->shared_}
        {
        }

    public:
        Token(Token const&) = default;
        Token(Token&&) = default;

        /** @return true if a stop was requested; false otherwise */
        [[nodiscard]] bool
        isStopRequested() const noexcept
        {
            return shared_->isStopRequested;
        }

        [[nodiscard]] operator bool() const noexcept
        {
            return isStopRequested();
        }
    };

    /** @return A token observing this stop source */
    [[nodiscard]] Token
    getToken() const
    {
        return Token{this};
    }

    /** @brief Ask the work to stop as soon as possible */
    void
    requestStop() noexcept
    {
        shared_->isStopRequested = true;
    }

    /** @return true if a stop was requested; false otherwise */
    [[nodiscard]] bool
    isStopRequested() const noexcept
    {
        return shared_->isStopRequested;
    }
};

using StopToken = StopSource::Token;

static_assert(SomeStopToken<StopToken>);

}  // namespace evloop
