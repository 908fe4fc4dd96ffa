// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include <photonMerge/system/hardwareContext.hpp>

#include <boost/any.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <ostream>
#include <string>

namespace photonMerge {

/**
 * @brief Print a parsed option value (used to echo the program parameters).
 */
void printOptionValue(std::ostream& os, const boost::any& value);

/**
 * @brief Print every parsed option, flagging the defaulted ones.
 */
void printVariablesMap(std::ostream& os, const boost::program_options::variables_map& vm);

/**
 * @brief Command line of a tool: the tool option groups plus the common help, log and hardware options.
 */
class CmdLine
{
  public:
    explicit CmdLine(const std::string& name)
      : _allParams(name)
    {}

    void add(const boost::program_options::options_description& options) { _allParams.add(options); }

    /**
     * @brief Parse the command line and apply the log level.
     * The thread limit is applied by the tool with HardwareContext::applyThreadLimit.
     * @return false if the program should stop (help requested or invalid parameters)
     */
    bool execute(int argc, char** argv);

    HardwareContext& getHardwareContext() { return _hContext; }

  private:
    boost::program_options::options_description _allParams;
    HardwareContext _hContext;
};

}  // namespace photonMerge
