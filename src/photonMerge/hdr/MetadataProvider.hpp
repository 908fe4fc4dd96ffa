// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include <photonMerge/exif/ExposureInfo.hpp>

#include <map>
#include <string>
#include <vector>

namespace photonMerge {
namespace hdr {

/**
 * @brief Source of the shooting parameters of an image set.
 * Returned vectors are index-aligned with the given paths and hold strictly positive values.
 */
class IMetadataProvider
{
  public:
    virtual ~IMetadataProvider() = default;

    virtual std::vector<float> getExposures(const std::vector<std::string>& paths) const = 0;
    virtual std::vector<float> getGains(const std::vector<std::string>& paths) const = 0;
};

/**
 * @brief Read the exposure time and the ISO of each image from its header (OpenImageIO).
 * The gain is the ISO relative to exif::referenceISO.
 * Each header is read once: the parsed metadata is kept for the later requests on the same path.
 * Not thread safe.
 */
class ImageMetadataProvider : public IMetadataProvider
{
  public:
    std::vector<float> getExposures(const std::vector<std::string>& paths) const override;
    std::vector<float> getGains(const std::vector<std::string>& paths) const override;

  private:
    const exif::ExposureInfo& getExposureInfo(const std::string& path) const;

    mutable std::map<std::string, exif::ExposureInfo> _exposureInfos;
};

/**
 * @brief Provide user supplied exposures and gains (eg. from the command line).
 */
class StaticMetadataProvider : public IMetadataProvider
{
  public:
    StaticMetadataProvider(const std::vector<float>& exposures, const std::vector<float>& gains)
      : _exposures(exposures),
        _gains(gains)
    {}

    std::vector<float> getExposures(const std::vector<std::string>& paths) const override;
    std::vector<float> getGains(const std::vector<std::string>& paths) const override;

  private:
    std::vector<float> _exposures;
    std::vector<float> _gains;
};

}  // namespace hdr
}  // namespace photonMerge
