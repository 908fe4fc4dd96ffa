// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include "ImageDecoder.hpp"
#include "MetadataProvider.hpp"

#include <photonMerge/image/Image.hpp>
#include <photonMerge/image/pixelTypes.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace photonMerge {
namespace hdr {
namespace test {

/**
 * @brief Metadata provider returning fixed values without any validation
 */
class FakeMetadataProvider : public IMetadataProvider
{
  public:
    FakeMetadataProvider(const std::vector<float>& exposures, const std::vector<float>& gains)
      : _exposures(exposures),
        _gains(gains)
    {}

    std::vector<float> getExposures(const std::vector<std::string>&) const override
    {
        if (failure)
            throw std::runtime_error("metadata unavailable");
        return _exposures;
    }

    std::vector<float> getGains(const std::vector<std::string>&) const override
    {
        if (failure)
            throw std::runtime_error("metadata unavailable");
        return _gains;
    }

    bool failure = false;

  private:
    std::vector<float> _exposures;
    std::vector<float> _gains;
};

/**
 * @brief Image decoder serving in-memory images by name
 */
class FakeImageDecoder : public IImageDecoder
{
  public:
    void addImage(const std::string& path, const image::Image<image::RGBfColor>& img) { _images[path] = img; }

    void readImage(const std::string& path, image::Image<image::RGBfColor>& img) const override
    {
        const auto it = _images.find(path);
        if (it == _images.end())
            throw std::runtime_error("no image named '" + path + "'");
        img = it->second;
    }

  private:
    std::map<std::string, image::Image<image::RGBfColor>> _images;
};

/**
 * @brief Build an image of one row from RGB triplets
 */
inline image::Image<image::RGBfColor> makeRowImage(const std::vector<image::RGBfColor>& pixels)
{
    image::Image<image::RGBfColor> img(static_cast<int>(pixels.size()), 1);
    for (int x = 0; x < img.width(); ++x)
        img(0, x) = pixels[x];
    return img;
}

}  // namespace test
}  // namespace hdr
}  // namespace photonMerge
