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

#include "util/config/Config.hpp"
#include "util/log/Logger.hpp"

#include <cstddef>
#include <optional>

namespace app {

/**
 * @brief The runner application: drives heartbeat work through the global event loops and a loop of its own
 */
class Runner {
    util::Config const& config_;
    util::Logger log_{"General"};

public:
    /**
     * @brief Construct a new Runner object
     *
     * @param config The configuration of the application
     */
    Runner(util::Config const& config);

    /**
     * @brief Run the application
     *
     * @param ticks Number of heartbeats before exit; overrides `runner.ticks` if set
     * @return exit code
     */
    int
    run(std::optional<std::size_t> ticks);
};

}  // namespace app
