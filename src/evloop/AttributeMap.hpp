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

#include "util/Mutex.hpp"

#include <any>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace evloop {

/**
 * @brief Thread-safe store of caller metadata attached to a task handle.
 *
 * The store never takes part in the task's result and can be used before, during and after the task runs.
 */
class AttributeMap {
public:
    using MapType = std::unordered_map<std::string, std::any>;

    /**
     * @brief Store a value, replacing any previous value under the same key
     *
     * @param key The key
     * @param value The value
     */
    void
    set(std::string key, std::any value);

    /**
     * @brief Get the value stored under a key
     *
     * @param key The key
     * @return The value if present; std::nullopt otherwise
     */
    [[nodiscard]] std::optional<std::any>
    get(std::string const& key) const;

    /**
     * @brief Get the value stored under a key as a specific type
     *
     * @tparam T The expected type of the value
     * @param key The key
     * @return The value if present and of type T; std::nullopt otherwise
     */
    template <typename T>
    [[nodiscard]] std::optional<T>
    get(std::string const& key) const
    {
        auto const data = attributes_.lockShared();
        auto const it = data->find(key);
        if (it == data->end())
            return std::nullopt;

        if (auto const* value = std::any_cast<T>(&it->second); value != nullptr)
            return *value;
        return std::nullopt;
    }

    /**
     * @brief Remove a key
     *
     * @param key The key
     * @return The removed value if the key was present; std::nullopt otherwise
     */
    std::optional<std::any>
    remove(std::string const& key);

    /** @return true if the key is present; false otherwise */
    [[nodiscard]] bool
    contains(std::string const& key) const;

    /** @return Number of stored attributes */
    [[nodiscard]] std::size_t
    size() const;

    /** @brief Remove all attributes */
    void
    clear();

    /** @return A snapshot of all attributes */
    [[nodiscard]] MapType
    all() const;

private:
    util::Mutex<MapType, std::shared_mutex> attributes_;
};

}  // namespace evloop
