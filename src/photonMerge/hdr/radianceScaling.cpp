// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#include "radianceScaling.hpp"
#include "hdrError.hpp"

#include <photonMerge/system/Logger.hpp>

#include <omp.h>

#include <cmath>
#include <exception>

namespace photonMerge {
namespace hdr {

namespace {

bool isValidFactor(float value) { return value > 0.f && std::isfinite(value); }

}  // namespace

void scaleRadiance(const Vecf& pixels, float exposure, float gain, Vecf& radiance, const ChannelCoefficients& coefficients)
{
    if (pixels.size() % 3 != 0)
        PHOTONMERGE_THROW_HDR(EHdrErrorType::SHAPE,
                              "Invalid channels: the pixel buffer length (" << pixels.size() << ") is not a multiple of 3.");

    if (!isValidFactor(exposure) || !isValidFactor(gain))
        PHOTONMERGE_THROW_HDR(EHdrErrorType::METADATA, "Invalid exposure (" << exposure << ") or gain (" << gain << ").");

    const float scalingFactor = exposure * gain;
    const float redFactor = scalingFactor * coefficients.red;
    const float greenFactor = scalingFactor * coefficients.green;
    const float blueFactor = scalingFactor * coefficients.blue;

    const int pixelCount = static_cast<int>(pixels.size() / 3);
    radiance.resize(pixels.size());

#pragma omp parallel for
    for (int i = 0; i < pixelCount; ++i)
    {
        radiance(3 * i) = pixels(3 * i) / redFactor;
        radiance(3 * i + 1) = pixels(3 * i + 1) / greenFactor;
        radiance(3 * i + 2) = pixels(3 * i + 2) / blueFactor;
    }
}

void scaleRadiances(const std::vector<Vecf>& pixels,
                    const std::vector<float>& exposures,
                    const std::vector<float>& gains,
                    std::vector<Vecf>& radiances,
                    const ChannelCoefficients& coefficients)
{
    if (exposures.size() != pixels.size() || gains.size() != pixels.size())
        PHOTONMERGE_THROW_HDR(EHdrErrorType::METADATA,
                              "Expected one exposure and one gain per image: " << pixels.size() << " images, " << exposures.size()
                                                                               << " exposures, " << gains.size() << " gains.");

    const int imageCount = static_cast<int>(pixels.size());
    radiances.resize(pixels.size());

    // errors raised in the parallel loop are rethrown afterwards, in image order
    std::vector<std::exception_ptr> errors(pixels.size());

#pragma omp parallel for
    for (int i = 0; i < imageCount; ++i)
    {
        try
        {
            scaleRadiance(pixels[i], exposures[i], gains[i], radiances[i], coefficients);
        }
        catch (const std::exception&)
        {
            errors[i] = std::current_exception();
        }
    }

    for (const std::exception_ptr& error : errors)
    {
        if (error)
            std::rethrow_exception(error);
    }

    PHOTONMERGE_LOG_TRACE("[radianceScaling] " << imageCount << " radiance buffers computed.");
}

}  // namespace hdr
}  // namespace photonMerge
