// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include <chrono>

namespace photonMerge {
namespace system {

/**
 * @brief Wall clock timer, started at construction
 */
class Timer
{
  public:
    Timer() { reset(); }

    void reset();

    /// Elapsed time in seconds
    double elapsed() const;

  private:
    std::chrono::steady_clock::time_point _start;
};

}  // namespace system
}  // namespace photonMerge
