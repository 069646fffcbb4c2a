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

#include "evloop/EventLoopRegistry.hpp"

#include "evloop/EventLoop.hpp"
#include "util/Assert.hpp"
#include "util/Mutex.hpp"
#include "util/ShutdownHook.hpp"
#include "util/config/Config.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace evloop {

namespace {

struct ProcessWideState {
    std::optional<GlobalLoopSettings> settings;
    bool isCreated = false;
};

util::Mutex<ProcessWideState>&
processWideState()
{
    static util::Mutex<ProcessWideState> state;
    return state;
}

}  // namespace

std::string_view
toString(GlobalLoop which)
{
    switch (which) {
        case GlobalLoop::General:
            return "general";
        case GlobalLoop::Serial:
            return "serial";
        case GlobalLoop::Io:
            return "io";
    }
    ASSERT(false, "Unknown global loop: {}", static_cast<int>(which));
    return {};
}

std::optional<GlobalLoop>
globalLoopFromString(std::string_view name)
{
    for (auto const which : {GlobalLoop::General, GlobalLoop::Serial, GlobalLoop::Io}) {
        if (toString(which) == name)
            return which;
    }
    return std::nullopt;
}

GlobalLoopSettings
GlobalLoopSettings::fromConfig(util::Config const& config)
{
    GlobalLoopSettings settings;
    auto const section = config.sectionOr("event_loop", {});

    settings.generalThreads =
        section.valueOr<uint32_t>("general_threads", static_cast<uint32_t>(settings.generalThreads));
    settings.ioThreads = section.valueOr<uint32_t>("io_threads", static_cast<uint32_t>(settings.ioThreads));
    settings.daemon = section.valueOr("daemon", settings.daemon);

    return settings;
}

EventLoopRegistry::EventLoopRegistry(GlobalLoopSettings settings, util::ShutdownHook& shutdownHook)
    : settings_{std::move(settings)}, shutdownHook_{std::ref(shutdownHook)}
{
}

EventLoop&
EventLoopRegistry::get(GlobalLoop which)
{
    auto& target = slot(which);
    if (auto* loop = target.ready.load(std::memory_order_acquire); loop != nullptr)
        return *loop;

    std::call_once(target.once, [&] { create(which, target); });
    return *target.ready.load(std::memory_order_acquire);
}

EventLoop&
EventLoopRegistry::get(std::string_view name)
{
    auto const which = globalLoopFromString(name);
    if (not which.has_value())
        throw std::invalid_argument(fmt::format("Unknown global event loop '{}'", name));

    return get(*which);
}

bool
EventLoopRegistry::isCreated(GlobalLoop which) const
{
    return slot(which).ready.load(std::memory_order_acquire) != nullptr;
}

std::size_t
EventLoopRegistry::constructionCount(GlobalLoop which) const
{
    return slot(which).constructions.load();
}

EventLoopRegistry&
EventLoopRegistry::instance()
{
    // never destroyed; daemon workers may still be running while the process exits
    static EventLoopRegistry* const registry = [] {
        auto state = processWideState().lock();
        state->isCreated = true;
        return std::make_unique<EventLoopRegistry>(state->settings.value_or(GlobalLoopSettings{})).release();
    }();

    return *registry;
}

bool
EventLoopRegistry::configure(GlobalLoopSettings settings)
{
    auto state = processWideState().lock();
    if (state->isCreated)
        return false;

    state->settings = std::move(settings);
    return true;
}

EventLoopRegistry::Slot&
EventLoopRegistry::slot(GlobalLoop which)
{
    return slots_.at(static_cast<std::size_t>(which));
}

EventLoopRegistry::Slot const&
EventLoopRegistry::slot(GlobalLoop which) const
{
    return slots_.at(static_cast<std::size_t>(which));
}

void
EventLoopRegistry::create(GlobalLoop which, Slot& slot)
{
    auto const numThreads = [&] {
        switch (which) {
            case GlobalLoop::General:
                return settings_.generalThreads;
            case GlobalLoop::Serial:
                return settings_.serialThreads;
            case GlobalLoop::Io:
                return settings_.ioThreads;
        }
        ASSERT(false, "Unknown global loop: {}", static_cast<int>(which));
        return std::size_t{0};
    }();

    // the constructor is private; only the registry creates global loops
    slot.loop = std::unique_ptr<EventLoop>{new EventLoop{numThreads, settings_.daemon, toString(which), true}};
    ++slot.constructions;

    if (settings_.daemon) {
        // daemon workers are never joined; they are only stopped after every other hook had a chance to use them
        slot.shutdownConnection = shutdownHook_.get().registerHook(
            [loop = slot.loop.get(), log = log_] {
                if (auto const dropped = loop->doShutdownNow(); not dropped.empty())
                    LOG(log.debug()) << "Dropped " << dropped.size() << " tasks of " << loop->name() << " at exit";
            },
            util::ShutdownHook::Priority::RunLast
        );
    } else {
        slot.shutdownConnection = shutdownHook_.get().registerHook([loop = slot.loop.get()] {
            loop->shutdownAndJoin();
        });
    }

    LOG(log_.info()) << "Created global event loop '" << toString(which) << "' (" << slot.loop->name() << ") with "
                     << numThreads << " threads" << (settings_.daemon ? ", daemon" : "");

    slot.ready.store(slot.loop.get(), std::memory_order_release);
}

EventLoop&
general()
{
    return EventLoopRegistry::instance().get(GlobalLoop::General);
}

EventLoop&
serial()
{
    return EventLoopRegistry::instance().get(GlobalLoop::Serial);
}

EventLoop&
io()
{
    return EventLoopRegistry::instance().get(GlobalLoop::Io);
}

}  // namespace evloop
