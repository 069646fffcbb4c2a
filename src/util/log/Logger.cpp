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

#include "util/log/Logger.hpp"

#include "util/config/Config.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/date_time/posix_time/posix_time_duration.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/json/conversion.hpp>
#include <boost/json/value.hpp>
#include <boost/log/core/core.hpp>
#include <boost/log/expressions/predicates/channel_severity_filter.hpp>
#include <boost/log/keywords/auto_flush.hpp>
#include <boost/log/keywords/file_name.hpp>
#include <boost/log/keywords/format.hpp>
#include <boost/log/keywords/max_size.hpp>
#include <boost/log/keywords/open_mode.hpp>
#include <boost/log/keywords/rotation_size.hpp>
#include <boost/log/keywords/target.hpp>
#include <boost/log/keywords/target_file_name.hpp>
#include <boost/log/keywords/time_based_rotation.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <ios>
#include <iostream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace util {

namespace {

constexpr auto kDEFAULT_FORMAT = "%TimeStamp% (%SourceLocation%) [%ThreadID%] %Channel%:%Severity% %Message%";
constexpr std::uint64_t kMEGABYTE = 1024u * 1024u;

struct SeverityName {
    std::string_view name;
    Severity severity;
};

constexpr std::array<SeverityName, 7> kSEVERITY_NAMES = {{
    {"trace", Severity::TRC},
    {"debug", Severity::DBG},
    {"info", Severity::NFO},
    {"warning", Severity::WRN},
    {"warn", Severity::WRN},
    {"error", Severity::ERR},
    {"fatal", Severity::FTL},
}};

/**
 * @brief Rotation and retention of the log files
 */
struct FileLogSettings {
    boost::filesystem::path directory;
    std::uint64_t rotationSize;
    std::uint32_t rotationHours;
    std::uint64_t directoryMaxSize;

    static std::optional<FileLogSettings>
    fromConfig(Config const& config)
    {
        auto const directory = config.maybeValue<std::string>("log_directory");
        if (not directory.has_value())
            return std::nullopt;

        return FileLogSettings{
            .directory = boost::filesystem::path{*directory},
            .rotationSize = config.valueOr<std::uint64_t>("log_rotation_size", 2048u) * kMEGABYTE,
            .rotationHours = config.valueOr<std::uint32_t>("log_rotation_hour_interval", 12u),
            .directoryMaxSize = config.valueOr<std::uint64_t>("log_directory_max_size", 50u * 1024u) * kMEGABYTE,
        };
    }
};

void
addFileLog(FileLogSettings const& settings, std::string const& format)
{
    namespace keywords = boost::log::keywords;
    namespace sinks = boost::log::sinks;

    if (not boost::filesystem::exists(settings.directory))
        boost::filesystem::create_directories(settings.directory);

    auto sink = boost::log::add_file_log(
        keywords::file_name = settings.directory / "evloop.log",
        keywords::target_file_name = settings.directory / "evloop_%Y-%m-%d_%H-%M-%S.log",
        keywords::auto_flush = true,
        keywords::format = format,
        keywords::open_mode = std::ios_base::app,
        keywords::rotation_size = settings.rotationSize,
        keywords::time_based_rotation =
            sinks::file::rotation_at_time_interval(boost::posix_time::hours(settings.rotationHours))
    );

    auto backend = sink->locked_backend();
    backend->set_file_collector(
        sinks::file::make_collector(keywords::target = settings.directory, keywords::max_size = settings.directoryMaxSize)
    );
    backend->scan_for_files();
}

bool
isKnownChannel(std::string_view name)
{
    return std::ranges::any_of(LogService::CHANNELS, [name](char const* channel) { return name == channel; });
}

}  // namespace

Logger LogService::generalLog_ = Logger{"General"};
Logger LogService::alertLog_ = Logger{"Alert"};

std::ostream&
operator<<(std::ostream& stream, Severity sev)
{
    switch (sev) {
        case Severity::TRC:
            return stream << "TRC";
        case Severity::DBG:
            return stream << "DBG";
        case Severity::NFO:
            return stream << "NFO";
        case Severity::WRN:
            return stream << "WRN";
        case Severity::ERR:
            return stream << "ERR";
        case Severity::FTL:
            return stream << "FTL";
    }
    return stream << "???";
}

Severity
tag_invoke(boost::json::value_to_tag<Severity>, boost::json::value const& value)
{
    if (not value.is_string())
        throw std::runtime_error("`log_level` must be a string");

    auto const level = std::string_view{value.as_string()};
    auto const it = std::ranges::find_if(kSEVERITY_NAMES, [level](SeverityName const& entry) {
        return boost::iequals(entry.name, level);
    });

    if (it == kSEVERITY_NAMES.end()) {
        throw std::runtime_error(
            "Could not parse `log_level`: expected `trace`, `debug`, `info`, `warning`, `error` or `fatal`"
        );
    }

    return it->severity;
}

void
LogService::init(Config const& config)
{
    boost::log::add_common_attributes();
    boost::log::register_simple_formatter_factory<Severity, char>("Severity");

    auto const format = config.valueOr<std::string>("log_format", kDEFAULT_FORMAT);

    if (config.valueOr("log_to_console", false))
        boost::log::add_console_log(std::cout, boost::log::keywords::format = format);

    if (auto const fileSettings = FileLogSettings::fromConfig(config); fileSettings.has_value())
        addFileLog(*fileSettings, format);

    // every channel starts at `log_level`; `log_channels` entries override single channels
    auto const defaultSeverity = config.valueOr<Severity>("log_level", Severity::NFO);
    auto filter = boost::log::expressions::channel_severity_filter(LogChannel, LogSeverity);

    for (auto const* channel : CHANNELS)
        filter[channel] = defaultSeverity;
    filter["Alert"] = Severity::WRN;

    for (auto const& channelConfig : config.arrayOr("log_channels", {})) {
        auto const name = channelConfig.valueOrThrow<std::string>("channel", "Channel name is required");
        if (not isKnownChannel(name))
            throw std::runtime_error("Can't override settings for log channel " + name + ": invalid channel");

        filter[name] = channelConfig.valueOr<Severity>("log_level", defaultSeverity);
    }

    boost::log::core::get()->set_filter(filter);
    LOG(LogService::info()) << "Default log level = " << defaultSeverity;
}

Logger::Pump
Logger::trace(SourceLocationType const& loc) const
{
    return {logger_, Severity::TRC, loc};
}

Logger::Pump
Logger::debug(SourceLocationType const& loc) const
{
    return {logger_, Severity::DBG, loc};
}

Logger::Pump
Logger::info(SourceLocationType const& loc) const
{
    return {logger_, Severity::NFO, loc};
}

Logger::Pump
Logger::warn(SourceLocationType const& loc) const
{
    return {logger_, Severity::WRN, loc};
}

Logger::Pump
Logger::error(SourceLocationType const& loc) const
{
    return {logger_, Severity::ERR, loc};
}

Logger::Pump
Logger::fatal(SourceLocationType const& loc) const
{
    return {logger_, Severity::FTL, loc};
}

std::string
Logger::Pump::prettyPath(SourceLocationType const& loc, std::size_t maxDepth)
{
    // keep the last `maxDepth` components of the path
    std::string_view path{loc.file_name()};
    auto start = path.size();
    for (std::size_t depth = 0; depth < maxDepth and start > 0; ++depth) {
        auto const slash = path.rfind('/', start - 1);
        if (slash == std::string_view::npos or slash == 0) {
            start = slash == 0 ? 1 : 0;
            break;
        }
        start = slash;
    }

    if (start < path.size() and path[start] == '/')
        ++start;

    return fmt::format("{}:{}", path.substr(start), loc.line());
}

}  // namespace util
