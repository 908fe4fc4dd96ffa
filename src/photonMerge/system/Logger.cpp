// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#include "Logger.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <array>
#include <cstdlib>
#include <utility>

namespace photonMerge {
namespace system {

namespace {

using LevelName = std::pair<EVerboseLevel, const char*>;

const std::array<LevelName, 6> levelNames = {{
  {EVerboseLevel::Fatal, "fatal"},
  {EVerboseLevel::Error, "error"},
  {EVerboseLevel::Warning, "warning"},
  {EVerboseLevel::Info, "info"},
  {EVerboseLevel::Debug, "debug"},
  {EVerboseLevel::Trace, "trace"},
}};

boost::log::trivial::severity_level toSeverity(EVerboseLevel level)
{
    switch (level)
    {
        case EVerboseLevel::Fatal:
            return boost::log::trivial::fatal;
        case EVerboseLevel::Error:
            return boost::log::trivial::error;
        case EVerboseLevel::Warning:
            return boost::log::trivial::warning;
        case EVerboseLevel::Info:
            return boost::log::trivial::info;
        case EVerboseLevel::Debug:
            return boost::log::trivial::debug;
        case EVerboseLevel::Trace:
            return boost::log::trivial::trace;
    }
    throw std::out_of_range("Invalid verbose level enum");
}

}  // namespace

std::string EVerboseLevel_informations()
{
    std::string names;
    for (const LevelName& levelName : levelNames)
    {
        if (!names.empty())
            names += ", ";
        names += levelName.second;
    }
    return names;
}

std::string EVerboseLevel_enumToString(EVerboseLevel verboseLevel)
{
    for (const LevelName& levelName : levelNames)
    {
        if (levelName.first == verboseLevel)
            return levelName.second;
    }
    throw std::out_of_range("Invalid verbose level enum");
}

EVerboseLevel EVerboseLevel_stringToEnum(const std::string& verboseLevel)
{
    const std::string level = boost::to_lower_copy(verboseLevel);

    for (const LevelName& levelName : levelNames)
    {
        if (level == levelName.second)
            return levelName.first;
    }
    throw std::out_of_range("Invalid verbose level: '" + verboseLevel + "'");
}

std::ostream& operator<<(std::ostream& os, EVerboseLevel verboseLevel) { return os << EVerboseLevel_enumToString(verboseLevel); }

std::istream& operator>>(std::istream& in, EVerboseLevel& verboseLevel)
{
    std::string token;
    in >> token;
    verboseLevel = EVerboseLevel_stringToEnum(token);
    return in;
}

Logger& Logger::get()
{
    static Logger logger;
    return logger;
}

EVerboseLevel Logger::getDefaultVerboseLevel()
{
    const char* envLevel = std::getenv("PHOTONMERGE_LOG_LEVEL");
    if (envLevel == nullptr)
        return EVerboseLevel::Info;

    try
    {
        return EVerboseLevel_stringToEnum(envLevel);
    }
    catch (const std::out_of_range&)
    {
        PHOTONMERGE_CERR("Ignoring invalid PHOTONMERGE_LOG_LEVEL value '" << envLevel << "'.");
        return EVerboseLevel::Info;
    }
}

Logger::Logger()
{
    namespace expr = boost::log::expressions;

    boost::log::add_common_attributes();
    boost::log::add_console_log(std::clog,
                                boost::log::keywords::auto_flush = true,
                                boost::log::keywords::format =
                                  (expr::stream << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%H:%M:%S.%f") << "]"
                                                << "[" << boost::log::trivial::severity << "] " << expr::smessage));

    setLogLevel(getDefaultVerboseLevel());
}

void Logger::setLogLevel(EVerboseLevel level)
{
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= toSeverity(level));
    _level = level;
}

}  // namespace system
}  // namespace photonMerge
