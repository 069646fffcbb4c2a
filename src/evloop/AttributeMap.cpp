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

#include "evloop/AttributeMap.hpp"

#include <any>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace evloop {

void
AttributeMap::set(std::string key, std::any value)
{
    auto data = attributes_.lock();
    data->insert_or_assign(std::move(key), std::move(value));
}

std::optional<std::any>
AttributeMap::get(std::string const& key) const
{
    auto const data = attributes_.lockShared();
    if (auto const it = data->find(key); it != data->end())
        return it->second;
    return std::nullopt;
}

std::optional<std::any>
AttributeMap::remove(std::string const& key)
{
    auto data = attributes_.lock();
    auto node = data->extract(key);
    if (node.empty())
        return std::nullopt;
    return std::move(node.mapped());
}

bool
AttributeMap::contains(std::string const& key) const
{
    return attributes_.lockShared()->contains(key);
}

std::size_t
AttributeMap::size() const
{
    return attributes_.lockShared()->size();
}

void
AttributeMap::clear()
{
    attributes_.lock()->clear();
}

AttributeMap::MapType
AttributeMap::all() const
{
    return *attributes_.lockShared();
}

}  // namespace evloop
