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

#include <chrono>
#include <string>
#include <thread>

namespace util {

/**
 * @brief Set the name of the calling thread.
 *
 * The full name is kept for @ref threadName; the name visible to the OS (e.g. in `top -H` or a debugger) is truncated
 * to the platform limit.
 *
 * @param name The new name
 * @return true if the OS accepted the name; the full name is kept either way
 */
bool
setThreadName(std::string name);

/**
 * @brief Get the name of the calling thread
 *
 * @return The name given via @ref setThreadName, or the OS-level name for threads that were never named
 */
[[nodiscard]] std::string
threadName();

/**
 * @brief Block the calling thread for the given duration
 *
 * @param duration How long to sleep, in any std::chrono unit; non-positive durations return immediately
 */
template <typename Rep, typename Period>
void
sleep(std::chrono::duration<Rep, Period> duration)
{
    if (duration > std::chrono::duration<Rep, Period>::zero())
        std::this_thread::sleep_for(duration);
}

/** @brief Block the calling thread for the given number of seconds */
inline void
sleepSeconds(long seconds)
{
    sleep(std::chrono::seconds{seconds});
}

/** @brief Block the calling thread for the given number of minutes */
inline void
sleepMinutes(long minutes)
{
    sleep(std::chrono::minutes{minutes});
}

}  // namespace util
