// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include <photonMerge/numeric/numeric.hpp>

#include <vector>

namespace photonMerge {
namespace hdr {

/**
 * @brief Relative sensitivity of the sensor for each color channel
 */
struct ChannelCoefficients
{
    float red;
    float green;
    float blue;
};

constexpr ChannelCoefficients channelCoefficients{1.f, 1.f, 1.f};

/**
 * @brief Remove the exposure and gain contribution of one image.
 * Each sample of the RGB interleaved buffer is divided by exposure * gain * channel coefficient.
 * @param[in] pixels RGB interleaved samples, length must be a multiple of 3
 * @param[in] exposure exposure time, strictly positive
 * @param[in] gain sensor gain, strictly positive
 * @param[out] radiance RGB interleaved radiance, same length as pixels
 * @param[in] coefficients per channel coefficients
 */
void scaleRadiance(const Vecf& pixels,
                   float exposure,
                   float gain,
                   Vecf& radiance,
                   const ChannelCoefficients& coefficients = channelCoefficients);

/**
 * @brief Scale every image of a set, in parallel across images.
 * @param[in] pixels one RGB interleaved buffer per image
 * @param[in] exposures one exposure per image
 * @param[in] gains one gain per image
 * @param[out] radiances one radiance buffer per image, same order
 */
void scaleRadiances(const std::vector<Vecf>& pixels,
                    const std::vector<float>& exposures,
                    const std::vector<float>& gains,
                    std::vector<Vecf>& radiances,
                    const ChannelCoefficients& coefficients = channelCoefficients);

}  // namespace hdr
}  // namespace photonMerge
