// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#include "Timer.hpp"

namespace photonMerge {
namespace system {

void Timer::reset() { _start = std::chrono::steady_clock::now(); }

double Timer::elapsed() const { return std::chrono::duration<double>(std::chrono::steady_clock::now() - _start).count(); }

}  // namespace system
}  // namespace photonMerge
