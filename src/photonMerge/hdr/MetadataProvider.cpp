// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#include "MetadataProvider.hpp"
#include "hdrError.hpp"

#include <photonMerge/image/io.hpp>
#include <photonMerge/system/Logger.hpp>

#include <cmath>
#include <utility>

namespace photonMerge {
namespace hdr {

namespace {

void checkValues(const std::vector<float>& values, std::size_t expectedCount, const std::string& name)
{
    if (values.size() != expectedCount)
        PHOTONMERGE_THROW_HDR(EHdrErrorType::METADATA, "Expected " << expectedCount << " " << name << ", got " << values.size() << ".");

    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (!(values[i] > 0.f) || !std::isfinite(values[i]))
            PHOTONMERGE_THROW_HDR(EHdrErrorType::METADATA, "Invalid " << name << " value for image " << i << ": " << values[i] << ".");
    }
}

}  // namespace

const exif::ExposureInfo& ImageMetadataProvider::getExposureInfo(const std::string& path) const
{
    const auto it = _exposureInfos.find(path);
    if (it != _exposureInfos.end())
        return it->second;

    try
    {
        exif::ExposureInfo info(image::getMapFromMetadata(image::readImageMetadata(path)));
        return _exposureInfos.emplace(path, std::move(info)).first->second;
    }
    catch (const std::runtime_error& e)
    {
        PHOTONMERGE_THROW_HDR(EHdrErrorType::METADATA, "Cannot read the metadata of '" << path << "': " << e.what());
    }
}

std::vector<float> ImageMetadataProvider::getExposures(const std::vector<std::string>& paths) const
{
    std::vector<float> exposures;
    exposures.reserve(paths.size());

    for (const std::string& path : paths)
    {
        const exif::ExposureInfo& info = getExposureInfo(path);
        if (!info.hasShutter())
            PHOTONMERGE_THROW_HDR(EHdrErrorType::METADATA, "No valid exposure time in the metadata of '" << path << "'.");

        exposures.push_back(static_cast<float>(info.getMetadataShutter()));
        PHOTONMERGE_LOG_TRACE("[metadata] " << path << ", exposure: " << exposures.back());
    }
    return exposures;
}

std::vector<float> ImageMetadataProvider::getGains(const std::vector<std::string>& paths) const
{
    std::vector<float> gains;
    gains.reserve(paths.size());

    for (const std::string& path : paths)
    {
        const exif::ExposureInfo& info = getExposureInfo(path);
        if (!info.hasGain())
            PHOTONMERGE_THROW_HDR(EHdrErrorType::METADATA, "No valid ISO in the metadata of '" << path << "'.");

        gains.push_back(static_cast<float>(info.getGain()));
        PHOTONMERGE_LOG_TRACE("[metadata] " << path << ", gain: " << gains.back());
    }
    return gains;
}

std::vector<float> StaticMetadataProvider::getExposures(const std::vector<std::string>& paths) const
{
    checkValues(_exposures, paths.size(), "exposures");
    return _exposures;
}

std::vector<float> StaticMetadataProvider::getGains(const std::vector<std::string>& paths) const
{
    checkValues(_gains, paths.size(), "gains");
    return _gains;
}

}  // namespace hdr
}  // namespace photonMerge
