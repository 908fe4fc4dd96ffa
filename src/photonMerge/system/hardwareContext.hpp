// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include <boost/program_options/options_description.hpp>

namespace photonMerge {

class HardwareContext
{
  public:
    /**
     * @brief Declare the hardware options (--maxThreads) in the given options description
     */
    void setupFromCommandLine(boost::program_options::options_description& description);

    unsigned int getUserCoresLimit() const { return _limitUserCores; }

    void setUserCoresLimit(unsigned int coresLimit) { _limitUserCores = coresLimit; }

    /**
     * @brief Number of threads the parallel sections may use:
     * the detected core count, bounded by the user limit when it is not zero.
     */
    unsigned int getMaxThreads() const;

    /**
     * @brief Set the OpenMP thread count to getMaxThreads() and log the resulting hardware usage
     */
    void applyThreadLimit() const;

  private:
    void displayHardware() const;

    /// Maximum number of cores the user wants to use, 0 means no limit
    unsigned int _limitUserCores = 0;
};

}  // namespace photonMerge
