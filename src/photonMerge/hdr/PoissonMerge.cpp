// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#include "PoissonMerge.hpp"
#include "hdrError.hpp"

#include <photonMerge/system/Logger.hpp>

#include <omp.h>

#include <exception>
#include <numeric>

namespace photonMerge {
namespace hdr {

namespace {

Vecf toPixelBuffer(const image::Image<image::RGBfColor>& img)
{
    const Eigen::Index sampleCount = 3 * img.size();
    if (sampleCount == 0)
        return Vecf();
    return Eigen::Map<const Vecf>(img.data()->data(), sampleCount);
}

}  // namespace

void accumulateRadiances(const std::vector<Vecf>& radiances, const std::vector<float>& exposures, Vecf& merged)
{
    if (radiances.empty())
        PHOTONMERGE_THROW_HDR(EHdrErrorType::INSUFFICIENT_INPUT, "Invalid radiances: no radiance buffer to merge.");

    if (exposures.size() != radiances.size())
        PHOTONMERGE_THROW_HDR(EHdrErrorType::METADATA,
                              "Expected one exposure per radiance buffer: " << radiances.size() << " buffers, " << exposures.size() << " exposures.");

    const Eigen::Index sampleCount = radiances.front().size();
    for (std::size_t i = 1; i < radiances.size(); ++i)
    {
        if (radiances[i].size() != sampleCount)
            PHOTONMERGE_THROW_HDR(EHdrErrorType::SHAPE,
                                  "Radiance buffer " << i << " has " << radiances[i].size() << " samples, expected " << sampleCount << ".");
    }

    const float sumExposures = std::accumulate(exposures.begin(), exposures.end(), 0.f);

    PHOTONMERGE_LOG_DEBUG("[PoissonMerge] Merging " << radiances.size() << " radiance buffers of " << sampleCount
                                                    << " samples, sum of exposures: " << sumExposures);

    merged = radiances.front();

    // each step depends on the previous one, only the samples of a step are processed in parallel
    for (std::size_t i = 0; i < radiances.size(); ++i)
    {
        const Vecf& current = radiances[i];
        const float exposure = exposures[i];

#pragma omp parallel for
        for (Eigen::Index k = 0; k < sampleCount; ++k)
        {
            merged(k) = ((merged(k) + current(k)) * exposure) / sumExposures;
        }
    }
}

void PoissonEstimator::readMetadata(const std::vector<std::string>& paths, std::vector<float>& exposures, std::vector<float>& gains) const
{
    try
    {
        exposures = _metadataProvider.getExposures(paths);
        gains = _metadataProvider.getGains(paths);
    }
    catch (const HdrError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        PHOTONMERGE_THROW_HDR(EHdrErrorType::METADATA, "Cannot get the exposures and gains: " << e.what());
    }

    if (exposures.size() != paths.size() || gains.size() != paths.size())
        PHOTONMERGE_THROW_HDR(EHdrErrorType::METADATA,
                              "Expected one exposure and one gain per image: " << paths.size() << " images, " << exposures.size() << " exposures, "
                                                                               << gains.size() << " gains.");
}

void PoissonEstimator::readImages(const std::vector<std::string>& paths, std::vector<image::Image<image::RGBfColor>>& images) const
{
    const int imageCount = static_cast<int>(paths.size());
    images.resize(paths.size());

    // errors raised in the parallel loop are rethrown afterwards, in image order
    std::vector<std::exception_ptr> errors(paths.size());

#pragma omp parallel for
    for (int i = 0; i < imageCount; ++i)
    {
        try
        {
            _imageDecoder.readImage(paths[i], images[i]);
        }
        catch (const HdrError&)
        {
            errors[i] = std::current_exception();
        }
        catch (const std::exception& e)
        {
            errors[i] = std::make_exception_ptr(HdrError(EHdrErrorType::DECODE, "Cannot read '" + paths[i] + "': " + e.what()));
        }
    }

    for (const std::exception_ptr& error : errors)
    {
        if (error)
            std::rethrow_exception(error);
    }

    const image::Image<image::RGBfColor>& first = images.front();
    for (std::size_t i = 1; i < images.size(); ++i)
    {
        if (images[i].width() != first.width() || images[i].height() != first.height())
            PHOTONMERGE_THROW_HDR(EHdrErrorType::SHAPE,
                                  "Image '" << paths[i] << "' is " << images[i].width() << "x" << images[i].height() << ", expected " << first.width()
                                            << "x" << first.height() << ".");
    }
}

void PoissonEstimator::merge(const std::vector<std::string>& paths, Vecf& radiance, int& width, int& height) const
{
    if (paths.empty())
        PHOTONMERGE_THROW_HDR(EHdrErrorType::INSUFFICIENT_INPUT, "No image to merge.");

    try
    {
        std::vector<float> exposures;
        std::vector<float> gains;
        readMetadata(paths, exposures, gains);

        std::vector<Vecf> radiances;
        {
            std::vector<image::Image<image::RGBfColor>> images;
            readImages(paths, images);

            width = images.front().width();
            height = images.front().height();

            std::vector<Vecf> pixels;
            pixels.reserve(images.size());
            for (const image::Image<image::RGBfColor>& img : images)
                pixels.push_back(toPixelBuffer(img));
            images.clear();

            scaleRadiances(pixels, exposures, gains, radiances);
        }

        PHOTONMERGE_LOG_TRACE("[PoissonMerge] Images to fuse:");
        for (std::size_t i = 0; i < paths.size(); ++i)
        {
            PHOTONMERGE_LOG_TRACE(paths[i] << ", exposure: " << exposures[i] << ", gain: " << gains[i]);
        }

        accumulateRadiances(radiances, exposures, radiance);
    }
    catch (const HdrError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        PHOTONMERGE_THROW_HDR(EHdrErrorType::UNKNOWN, e.what());
    }
}

void PoissonEstimator::process(const std::vector<std::string>& paths, Vecf& radiance) const
{
    int width = 0;
    int height = 0;
    merge(paths, radiance, width, height);
}

void PoissonEstimator::process(const std::vector<std::string>& paths, image::Image<image::RGBfColor>& radiance) const
{
    int width = 0;
    int height = 0;
    Vecf merged;
    merge(paths, merged, width, height);

    radiance.resize(width, height, false);
    if (merged.size() > 0)
        Eigen::Map<Vecf>(radiance.data()->data(), merged.size()) = merged;
}

}  // namespace hdr
}  // namespace photonMerge
