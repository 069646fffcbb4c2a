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

#include "util/config/Config.hpp"

#include "util/config/detail/Helpers.hpp"
#include "util/log/Logger.hpp"

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/parse_options.hpp>
#include <boost/json/value.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace util {

namespace {

Config::ArrayType
toConfigs(boost::json::array const& arr)
{
    Config::ArrayType out;
    out.reserve(arr.size());

    std::ranges::transform(arr, std::back_inserter(out), [](boost::json::value const& element) {
        return Config{element};
    });
    return out;
}

}  // namespace

// `()` keeps gcc from picking the initializer_list constructor of boost::json::value
Config::Config(boost::json::value store) : store_(std::move(store))
{
}

Config::operator bool() const noexcept
{
    return not store_.is_null();
}

bool
Config::contains(KeyType key) const
{
    return lookup(key).has_value();
}

std::optional<boost::json::value>
Config::lookup(KeyType key) const
{
    if (store_.is_null())
        return std::nullopt;

    auto const* cur = &store_;
    auto tokenized = detail::Tokenizer<KeyType, kSEPARATOR>{key};
    std::string path;

    for (auto section = tokenized.next(); section.has_value(); section = tokenized.next()) {
        if (not path.empty())
            path += kSEPARATOR;
        path += *section;

        if (cur == nullptr)
            continue;  // keep tokenizing so malformed keys are still reported

        if (not cur->is_object())
            throw detail::StoreException("Not an object at '" + path + "'");

        auto const& object = cur->as_object();
        auto const it = object.find(*section);
        cur = it == object.end() ? nullptr : &it->value();
    }

    if (cur == nullptr)
        return std::nullopt;
    return *cur;
}

std::optional<Config::ArrayType>
Config::maybeArray(KeyType key) const
{
    if (auto const element = lookup(key); element.has_value() and element->is_array())
        return toConfigs(element->as_array());

    return std::nullopt;
}

Config::ArrayType
Config::array(KeyType key) const
{
    if (auto arr = maybeArray(key); arr.has_value())
        return std::move(*arr);

    throw std::logic_error("No array found at '" + key + "'");
}

Config::ArrayType
Config::arrayOr(KeyType key, ArrayType fallback) const
{
    return maybeArray(key).value_or(std::move(fallback));
}

Config
Config::section(KeyType key) const
{
    if (auto element = lookup(key); element.has_value() and element->is_object())
        return Config{std::move(*element)};

    throw std::logic_error("No section found at '" + key + "'");
}

Config
Config::sectionOr(KeyType key, boost::json::object fallback) const
{
    if (auto element = lookup(key); element.has_value() and element->is_object())
        return Config{std::move(*element)};

    return Config{std::move(fallback)};
}

Config::ArrayType
Config::array() const
{
    if (not store_.is_array())
        throw std::logic_error("Config root is not an array");

    return toConfigs(store_.as_array());
}

Config
ConfigReader::open(std::filesystem::path path)
{
    std::ifstream const in(path, std::ios::in | std::ios::binary);
    if (not in) {
        LOG(LogService::error()) << "Configuration file '" << path.string() << "' can't be opened";
        return Config{};
    }

    std::stringstream contents;
    contents << in.rdbuf();

    auto opts = boost::json::parse_options{};
    opts.allow_comments = true;
    opts.allow_trailing_commas = true;

    boost::system::error_code ec;
    auto parsed = boost::json::parse(contents.str(), ec, {}, opts);
    if (ec) {
        LOG(LogService::error()) << "Could not parse configuration file '" << path.string() << "': " << ec.message();
        return Config{};
    }

    return Config{std::move(parsed)};
}

}  // namespace util
