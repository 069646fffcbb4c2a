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

#include "util/ShutdownHook.hpp"

#include "util/log/Logger.hpp"

#include <boost/signals2/connection.hpp>

#include <cstdlib>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace util {

boost::signals2::connection
ShutdownHook::registerHook(std::function<void()> hook, Priority priority)
{
    return onShutdown_.connect(
        static_cast<int>(priority),
        [this, hook = std::move(hook)]() {
            try {
                hook();
            } catch (std::exception const& e) {
                LOG(log_.error()) << "Shutdown hook threw: " << e.what();
            }
        }
    );
}

void
ShutdownHook::run()
{
    std::call_once(once_, [this]() {
        LOG(log_.info()) << "Running " << onShutdown_.num_slots() << " shutdown hook(s)";
        hasRun_ = true;
        onShutdown_();
    });
}

bool
ShutdownHook::hasRun() const noexcept
{
    return hasRun_;
}

ShutdownHook&
ShutdownHook::instance()
{
    // Never destroyed: the atexit handler below may run after static destructors of other translation units.
    static ShutdownHook* const hook = [] {
        auto instance = std::make_unique<ShutdownHook>();
        if (std::atexit([] { ShutdownHook::instance().run(); }) != 0)
            LOG(LogService::alert()) << "Could not register the process exit handler. Shutdown hooks will not run.";
        return instance.release();
    }();
    return *hook;
}

}  // namespace util
