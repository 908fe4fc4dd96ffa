// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#include "ImageDecoder.hpp"
#include "hdrError.hpp"

#include <photonMerge/image/io.hpp>

namespace photonMerge {
namespace hdr {

void ImageFileDecoder::readImage(const std::string& path, image::Image<image::RGBfColor>& image) const
{
    try
    {
        image::readImage(path, image);
    }
    catch (const std::runtime_error& e)
    {
        PHOTONMERGE_THROW_HDR(EHdrErrorType::DECODE, e.what());
    }
}

}  // namespace hdr
}  // namespace photonMerge
