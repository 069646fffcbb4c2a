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

#include "util/config/detail/Helpers.hpp"

#include <boost/json/conversion.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_to.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace util {

/**
 * @brief Convenience wrapper to query a JSON configuration file.
 *
 * Keys are dotted paths (e.g. `event_loop.io_threads`). Any custom data type can be supported by implementing the
 * right `tag_invoke` for `boost::json::value_to`.
 */
class Config final {
    boost::json::value store_;
    static constexpr char kSEPARATOR = '.';

public:
    using KeyType = std::string;           /*! The type of key used */
    using ArrayType = std::vector<Config>; /*! The type of array used */

    /**
     * @brief Construct a new Config object.
     *
     * @param store boost::json::value that backs this instance
     */
    explicit Config(boost::json::value store = {});

    /**
     * @brief Checks whether underlying store is not null.
     *
     * @return true If the store is not null; false otherwise
     */
    operator bool() const noexcept;

    /**
     * @brief Checks whether something exists under given key.
     *
     * @param key The key to check
     * @return true If something exists under key; false otherwise
     * @throws std::logic_error If the key is of invalid format
     */
    [[nodiscard]] bool
    contains(KeyType key) const;

    /**
     * @brief Fetch a value by key, wrapped in std::optional.
     *
     * If the value exists but can't be represented by Result a std::runtime_error is thrown. A missing value yields
     * std::nullopt.
     *
     * @tparam Result The desired return type
     * @param key The key to check
     * @return Optional value of desired type
     * @throws std::logic_error Thrown if the key is of invalid format
     */
    template <typename Result>
    [[nodiscard]] std::optional<Result>
    maybeValue(KeyType key) const
    {
        auto maybeElement = lookup(key);
        if (maybeElement)
            return std::make_optional<Result>(checkedAs<Result>(key, *maybeElement));
        return std::nullopt;
    }

    /**
     * @brief Fetch a value by key; throws if it is missing or of the wrong type.
     *
     * @tparam Result The desired return type
     * @param key The key to check
     * @return Value of desired type
     */
    template <typename Result>
    [[nodiscard]] Result
    value(KeyType key) const
    {
        return maybeValue<Result>(key).value();
    }

    /**
     * @brief Fetch a value by key with fallback.
     *
     * The fallback is used when nothing is stored under the key or the path crosses a non-object. A value of the wrong
     * type still throws.
     *
     * @tparam Result The desired return type
     * @param key The key to check
     * @param fallback The fallback value
     * @return Value of desired type
     */
    template <typename Result>
    [[nodiscard]] Result
    valueOr(KeyType key, Result fallback) const
    {
        try {
            return maybeValue<Result>(key).value_or(fallback);
        } catch (detail::StoreException const&) {
            return fallback;
        }
    }

    /**
     * @brief Fetch a value by key; any failure is reported as std::runtime_error carrying the given message.
     *
     * @tparam Result The desired return type
     * @param key The key to check
     * @param err The custom error message
     * @return Value of desired type
     */
    template <typename Result>
    [[nodiscard]] Result
    valueOrThrow(KeyType key, std::string_view err) const
    {
        try {
            return maybeValue<Result>(key).value();
        } catch (std::exception const&) {
            throw std::runtime_error(std::string{err});
        }
    }

    /**
     * @brief Fetch an array by key, wrapped in std::optional.
     *
     * @param key The key to check
     * @return Optional array; std::nullopt if nothing or a non-array is stored under key
     * @throws std::logic_error Thrown if the key is of invalid format
     */
    [[nodiscard]] std::optional<ArrayType>
    maybeArray(KeyType key) const;

    /**
     * @brief Fetch an array by key.
     *
     * @param key The key to check
     * @return The array
     * @throws std::logic_error Thrown if there is no array under the key
     */
    [[nodiscard]] ArrayType
    array(KeyType key) const;

    /**
     * @brief Fetch an array by key with fallback.
     *
     * @param key The key to check
     * @param fallback The fallback array
     * @return The array or the fallback
     */
    [[nodiscard]] ArrayType
    arrayOr(KeyType key, ArrayType fallback) const;

    /**
     * @brief Fetch a sub section by key.
     *
     * @param key The key to check
     * @return Section represented as a separate instance of Config
     * @throws std::logic_error Thrown if there is no section under the key
     */
    [[nodiscard]] Config
    section(KeyType key) const;

    /**
     * @brief Fetch a sub section by key with a fallback object.
     *
     * @param key The key to check
     * @param fallback The fallback object
     * @return Section represented as a separate instance of Config
     */
    [[nodiscard]] Config
    sectionOr(KeyType key, boost::json::object fallback) const;

    /**
     * @brief Read the array directly referred to by this instance.
     *
     * @return The array
     * @throws std::logic_error Thrown if this instance does not hold an array
     */
    [[nodiscard]] ArrayType
    array() const;

private:
    template <typename Return>
    [[nodiscard]] Return
    checkedAs(KeyType key, boost::json::value const& value) const
    {
        using boost::json::value_to;

        auto hasError = false;
        if constexpr (std::is_same_v<Return, bool>) {
            if (not value.is_bool())
                hasError = true;
        } else if constexpr (std::is_same_v<Return, std::string>) {
            if (not value.is_string())
                hasError = true;
        } else if constexpr (std::is_same_v<Return, double>) {
            if (not value.is_number())
                hasError = true;
        } else if constexpr (std::is_convertible_v<Return, uint64_t> || std::is_convertible_v<Return, int64_t>) {
            if (not value.is_int64() && not value.is_uint64())
                hasError = true;
        }

        if (hasError) {
            throw std::runtime_error(
                "Type for key '" + key + "' is '" + std::string{to_string(value.kind())} +
                "' in JSON but requested '" + detail::typeName<Return>() + "'"
            );
        }

        return value_to<Return>(value);
    }

    std::optional<boost::json::value>
    lookup(KeyType key) const;
};

/**
 * @brief Simple configuration file reader.
 *
 * Reads the JSON file under specified path and creates a @ref Config object from its contents.
 */
class ConfigReader final {
public:
    /**
     * @brief Read and parse the given file; comments are allowed.
     *
     * @param path The path to the JSON file
     * @return The config; a null config if the file could not be read or parsed
     */
    static Config
    open(std::filesystem::path path);
};

}  // namespace util
