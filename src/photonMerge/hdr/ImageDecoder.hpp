// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include <photonMerge/image/Image.hpp>
#include <photonMerge/image/pixelTypes.hpp>

#include <string>

namespace photonMerge {
namespace hdr {

/**
 * @brief Source of the RGB float pixels of an image.
 * Implementations must reject any image which is not 3 channels RGB.
 */
class IImageDecoder
{
  public:
    virtual ~IImageDecoder() = default;

    virtual void readImage(const std::string& path, image::Image<image::RGBfColor>& image) const = 0;
};

/**
 * @brief Decode image files with OpenImageIO
 */
class ImageFileDecoder : public IImageDecoder
{
  public:
    void readImage(const std::string& path, image::Image<image::RGBfColor>& image) const override;
};

}  // namespace hdr
}  // namespace photonMerge
