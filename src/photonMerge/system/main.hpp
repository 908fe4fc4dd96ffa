// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include "Logger.hpp"

#include <cstdlib>
#include <exception>

// Entry point of a command line tool. The including file defines it instead of main().
int photonMerge_main(int argc, char** argv);

int main(int argc, char** argv)
{
    try
    {
        return photonMerge_main(argc, argv);
    }
    catch (const std::exception& e)
    {
        PHOTONMERGE_LOG_FATAL("Unhandled error: " << e.what());
    }
    return EXIT_FAILURE;
}
