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

#include "app/CliArgs.hpp"
#include "app/Runner.hpp"
#include "util/config/Config.hpp"
#include "util/log/Logger.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>

int
main(int argc, char const* argv[])
try {
    auto const action = app::CliArgs::parse(argc, argv);
    return action.apply(
        [](app::CliArgs::Action::Run const& run) {
            auto const config = util::ConfigReader::open(run.configPath);
            if (not config) {
                std::cerr << "Couldnt parse config '" << run.configPath << "'." << std::endl;
                return EXIT_FAILURE;
            }

            util::LogService::init(config);
            app::Runner runner{config};
            return runner.run(run.ticks);
        },
        [](app::CliArgs::Action::Exit const& exit) { return exit.exitCode; }
    );
} catch (std::exception const& e) {
    LOG(util::LogService::fatal()) << "Exit on exception: " << e.what();
    return EXIT_FAILURE;
} catch (...) {
    LOG(util::LogService::fatal()) << "Exit on exception: unknown";
    return EXIT_FAILURE;
}
