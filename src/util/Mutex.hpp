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

#include <concepts>
#include <mutex>
#include <shared_mutex>
#include <type_traits>
#include <utility>

namespace util {

template <typename ProtectedDataType, typename MutexType>
class Mutex;

/**
 * @brief A held lock together with access to the data it protects.
 *
 * @tparam ProtectedDataType data type to hold
 * @tparam LockType type of lock
 * @tparam MutexType type of the underlying mutex
 */
template <typename ProtectedDataType, template <typename> typename LockType, typename MutexType>
class Lock {
    LockType<MutexType> lock_;
    ProtectedDataType& data_;

public:
    /** @cond */
    ProtectedDataType&
    operator*() const
    {
        return data_;
    }

    ProtectedDataType&
    get() const
    {
        return data_;
    }

    ProtectedDataType*
    operator->() const
    {
        return &data_;
    }
    /** @endcond */

private:
    friend class Mutex<std::remove_const_t<ProtectedDataType>, MutexType>;

    Lock(MutexType& mutex, ProtectedDataType& data) : lock_(mutex), data_(data)
    {
    }
};

/**
 * @brief A container for data that is protected by a mutex. Inspired by Mutex in Rust.
 *
 * With a shared mutex type readers can use @ref lockShared to access the data concurrently.
 *
 * @tparam ProtectedDataType data type to hold
 * @tparam MutexType type of the underlying mutex
 */
template <typename ProtectedDataType, typename MutexType = std::mutex>
class Mutex {
    mutable MutexType mutex_;
    ProtectedDataType data_{};

public:
    Mutex() = default;

    /**
     * @brief Construct a new Mutex object with the given data
     *
     * @param data The data to protect
     */
    explicit Mutex(ProtectedDataType data) : data_(std::move(data))
    {
    }

    /**
     * @brief Lock the mutex exclusively and get read-only access to the protected data
     *
     * @tparam LockType The type of lock to use
     * @return A lock on the mutex and a reference to the protected data
     */
    template <template <typename> typename LockType = std::lock_guard>
    Lock<ProtectedDataType const, LockType, MutexType>
    lock() const
    {
        return {mutex_, data_};
    }

    /**
     * @brief Lock the mutex exclusively and get access to the protected data
     *
     * @tparam LockType The type of lock to use
     * @return A lock on the mutex and a reference to the protected data
     */
    template <template <typename> typename LockType = std::lock_guard>
    Lock<ProtectedDataType, LockType, MutexType>
    lock()
    {
        return {mutex_, data_};
    }

    /**
     * @brief Take a shared lock and get read-only access to the protected data
     *
     * @return A shared lock on the mutex and a reference to the protected data
     */
    Lock<ProtectedDataType const, std::shared_lock, MutexType>
    lockShared() const
        requires std::same_as<MutexType, std::shared_mutex>
    {
        return {mutex_, data_};
    }
};

}  // namespace util
