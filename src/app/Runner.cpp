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

#include "app/Runner.hpp"

#include "evloop/EventLoop.hpp"
#include "evloop/EventLoopRegistry.hpp"
#include "util/Thread.hpp"
#include "util/config/Config.hpp"
#include "util/log/Logger.hpp"

#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <latch>
#include <memory>
#include <optional>

namespace app {

namespace {

struct Progress {
    explicit Progress(std::size_t ticks) : finished{static_cast<std::ptrdiff_t>(ticks)}
    {
    }

    std::atomic_size_t beats{0};
    std::latch finished;
};

}  // namespace

Runner::Runner(util::Config const& config) : config_{config}
{
}

int
Runner::run(std::optional<std::size_t> ticks)
{
    if (not evloop::EventLoopRegistry::configure(evloop::GlobalLoopSettings::fromConfig(config_)))
        LOG(log_.warn()) << "Global event loops were configured before; event_loop section is ignored";

    auto const runnerConfig = config_.sectionOr("runner", {});
    auto const period = std::chrono::milliseconds{runnerConfig.valueOr<uint32_t>("period_ms", 100)};
    auto const numTicks = ticks.value_or(runnerConfig.valueOr<uint32_t>("ticks", 10));

    std::shared_ptr<evloop::EventLoop> const loop = evloop::EventLoop::makeEventLoop(runnerConfig);
    auto const progress = std::make_shared<Progress>(numTicks);

    auto heartbeat = evloop::general().scheduleAtFixedRate(
        [log = log_, loop, progress, numTicks](evloop::StopToken token) {
            if (token.isStopRequested())
                return;

            auto const beat = ++progress->beats;
            if (beat > numTicks)
                return;

            // record every beat in order on the serial loop, then let the runner's own loop count it down
            evloop::serial().execute([log, loop, progress, beat] {
                LOG(log.info()) << "Heartbeat " << beat << " on " << util::threadName();
                loop->execute([progress] { progress->finished.count_down(); });
            });
        },
        std::chrono::milliseconds::zero(),
        period
    );

    progress->finished.wait();
    heartbeat.cancel();

    auto report = boost::json::object{};
    report["general"] = evloop::general().report();
    report["serial"] = evloop::serial().report();
    report["runner"] = loop->report();
    std::cout << boost::json::serialize(report) << std::endl;

    loop->shutdown();
    if (not loop->awaitTermination(std::chrono::seconds{1})) {
        LOG(log_.warn()) << "Runner event loop did not terminate in time";
        return EXIT_FAILURE;
    }

    LOG(log_.info()) << "Done after " << numTicks << " heartbeats";
    return EXIT_SUCCESS;
}

}  // namespace app
