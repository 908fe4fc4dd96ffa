// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include <boost/log/trivial.hpp>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

// Console output of the command line tools, outside of the log filter
#define PHOTONMERGE_COUT(x) std::cout << x << std::endl
#define PHOTONMERGE_CERR(x) std::cerr << x << std::endl

#define PHOTONMERGE_LOG(SEVERITY, x) BOOST_LOG_TRIVIAL(SEVERITY) << x

#define PHOTONMERGE_LOG_TRACE(x) PHOTONMERGE_LOG(trace, x)
#define PHOTONMERGE_LOG_DEBUG(x) PHOTONMERGE_LOG(debug, x)
#define PHOTONMERGE_LOG_INFO(x) PHOTONMERGE_LOG(info, x)
#define PHOTONMERGE_LOG_WARNING(x) PHOTONMERGE_LOG(warning, x)
#define PHOTONMERGE_LOG_ERROR(x) PHOTONMERGE_LOG(error, x)
#define PHOTONMERGE_LOG_FATAL(x) PHOTONMERGE_LOG(fatal, x)

#define PHOTONMERGE_THROW_ERROR(x) \
{ \
  std::stringstream s; \
  s << x; \
  throw std::runtime_error(s.str()); \
}

namespace photonMerge {
namespace system {

/**
 * @brief Minimum severity of the displayed log records
 */
enum class EVerboseLevel
{
    Fatal,
    Error,
    Warning,
    Info,
    Debug,
    Trace
};

std::string EVerboseLevel_informations();
std::string EVerboseLevel_enumToString(EVerboseLevel verboseLevel);
EVerboseLevel EVerboseLevel_stringToEnum(const std::string& verboseLevel);
std::ostream& operator<<(std::ostream& os, EVerboseLevel verboseLevel);
std::istream& operator>>(std::istream& in, EVerboseLevel& verboseLevel);

/**
 * @brief Process wide console logger.
 * Records are written to std::clog as "[HH:MM:SS.ffffff][severity] message".
 */
class Logger
{
  public:
    static Logger& get();

    /**
     * @brief Level used at startup: the PHOTONMERGE_LOG_LEVEL environment variable when it is set and valid, info otherwise
     */
    static EVerboseLevel getDefaultVerboseLevel();

    EVerboseLevel getLogLevel() const { return _level; }

    void setLogLevel(EVerboseLevel level);

  private:
    Logger();

    EVerboseLevel _level = EVerboseLevel::Info;
};

}  // namespace system
}  // namespace photonMerge
