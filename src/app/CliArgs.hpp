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

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace app {

/**
 * @brief Parsed command line arguments of evloop_runner.
 */
class CliArgs {
public:
    /**
     * @brief Default configuration path.
     */
    static constexpr char defaultConfigPath[] = "/etc/opt/evloop/config.json";

    /**
     * @brief An action parsed from the command line.
     */
    class Action {
    public:
        /** @brief Run action. */
        struct Run {
            /** @brief Configuration file path. */
            std::string configPath;

            /** @brief Number of heartbeats overriding `runner.ticks` from the config. */
            std::optional<std::size_t> ticks;
        };

        /** @brief Exit action. */
        struct Exit {
            /** @brief Exit code. */
            int exitCode;
        };

        /**
         * @brief Construct an action.
         *
         * @param action Run or Exit action.
         */
        template <typename ActionType>
            requires std::is_same_v<ActionType, Run> or std::is_same_v<ActionType, Exit>
        explicit Action(ActionType&& action) : action_(std::forward<ActionType>(action))
        {
        }

        /**
         * @brief Apply the processor matching the action.
         *
         * @param onRun Called with the Run action; returns the exit code
         * @param onExit Called with the Exit action; returns the exit code
         * @return Exit code.
         */
        template <typename RunProcessor, typename ExitProcessor>
        int
        apply(RunProcessor&& onRun, ExitProcessor&& onExit) const
        {
            if (auto const* run = std::get_if<Run>(&action_); run != nullptr)
                return std::forward<RunProcessor>(onRun)(*run);
            return std::forward<ExitProcessor>(onExit)(std::get<Exit>(action_));
        }

    private:
        std::variant<Run, Exit> action_;
    };

    /**
     * @brief Parse command line arguments.
     *
     * @param argc Number of arguments.
     * @param argv Array of arguments.
     * @return Parsed command line arguments.
     */
    static Action
    parse(int argc, char const* argv[]);
};

}  // namespace app
