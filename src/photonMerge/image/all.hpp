// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include "photonMerge/image/Image.hpp"
#include "photonMerge/image/pixelTypes.hpp"
#include "photonMerge/image/io.hpp"
