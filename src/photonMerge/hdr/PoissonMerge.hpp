// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include "ImageDecoder.hpp"
#include "MetadataProvider.hpp"
#include "radianceScaling.hpp"

#include <photonMerge/image/Image.hpp>
#include <photonMerge/image/pixelTypes.hpp>
#include <photonMerge/numeric/numeric.hpp>

#include <string>
#include <vector>

namespace photonMerge {
namespace hdr {

/**
 * @brief Fold the radiance buffers of an image set into one radiance buffer, weighting each image
 * by its share of the total exposure time.
 *
 * The accumulator is seeded with the first radiance buffer, then for each image i (including the first one):
 *   merged = ((merged + radiances[i]) * exposures[i]) / sum(exposures)
 *
 * @note The first image is counted twice in the first step. This matches the reference
 * implementation of the Poisson photon noise estimator and is kept for output compatibility.
 *
 * @param[in] radiances one RGB interleaved radiance buffer per image, all of the same length
 * @param[in] exposures one exposure time per image, in the same order
 * @param[out] merged the merged radiance buffer
 */
void accumulateRadiances(const std::vector<Vecf>& radiances, const std::vector<float>& exposures, Vecf& merged);

/**
 * @brief HDR merging of an image stack with the Poisson photon noise estimator, as introduced in
 * "Noise-Aware Merging of High Dynamic Range Image Stacks without Camera Calibration" (Hanji, Zhong, Mantiuk 2020).
 *
 * Failures are reported with an HdrError tagged with their category.
 */
class PoissonEstimator
{
  public:
    PoissonEstimator(const IMetadataProvider& metadataProvider, const IImageDecoder& imageDecoder)
      : _metadataProvider(metadataProvider),
        _imageDecoder(imageDecoder)
    {}

    /**
     * @brief Merge the images into one radiance image
     * @param[in] paths the images, in merging order
     * @param[out] radiance the merged radiance, with the dimensions of the input images
     */
    void process(const std::vector<std::string>& paths, image::Image<image::RGBfColor>& radiance) const;

    /**
     * @brief Merge the images into one RGB interleaved radiance buffer
     * @param[in] paths the images, in merging order
     * @param[out] radiance the merged radiance buffer
     */
    void process(const std::vector<std::string>& paths, Vecf& radiance) const;

  private:
    void readMetadata(const std::vector<std::string>& paths, std::vector<float>& exposures, std::vector<float>& gains) const;

    void readImages(const std::vector<std::string>& paths, std::vector<image::Image<image::RGBfColor>>& images) const;

    void merge(const std::vector<std::string>& paths, Vecf& radiance, int& width, int& height) const;

    const IMetadataProvider& _metadataProvider;
    const IImageDecoder& _imageDecoder;
};

}  // namespace hdr
}  // namespace photonMerge
