// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#include "hardwareContext.hpp"
#include "Logger.hpp"

#include <boost/program_options/value_semantic.hpp>

#include <omp.h>

namespace photonMerge {

void HardwareContext::displayHardware() const
{
    PHOTONMERGE_LOG_INFO("Hardware:");

    PHOTONMERGE_LOG_INFO("\tDetected core count: " << omp_get_num_procs());

    if (_limitUserCores > 0)
    {
        PHOTONMERGE_LOG_INFO("\tUser upper limit on core count: " << _limitUserCores);
    }

    PHOTONMERGE_LOG_INFO("\tOpenMP will use " << omp_get_max_threads() << " cores");
}

void HardwareContext::setupFromCommandLine(boost::program_options::options_description& description)
{
    description.add_options()
        ("maxThreads", boost::program_options::value<unsigned int>(&_limitUserCores)->default_value(_limitUserCores),
         "Maximum number of threads (0 means all available cores).");
}

void HardwareContext::applyThreadLimit() const
{
    omp_set_num_threads(static_cast<int>(getMaxThreads()));
    displayHardware();
}

unsigned int HardwareContext::getMaxThreads() const
{
    unsigned int count = static_cast<unsigned int>(omp_get_num_procs());

    if (_limitUserCores > 0 && count > _limitUserCores)
    {
        count = _limitUserCores;
    }

    return count;
}

}  // namespace photonMerge
