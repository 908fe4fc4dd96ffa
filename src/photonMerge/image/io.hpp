// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include "Image.hpp"
#include "pixelTypes.hpp"

#include <OpenImageIO/paramlist.h>
#include <OpenImageIO/imageio.h>

#include <map>
#include <string>

namespace oiio = OIIO;

namespace photonMerge {
namespace image {

/**
 * @brief Data type use to write the image
 */
enum class EStorageDataType
{
    Float,  //< Use full floating point precision to store
    Half    //< Use half (values out of range could become inf or nan)
};

std::string EStorageDataType_informations();
EStorageDataType EStorageDataType_stringToEnum(const std::string& dataType);
std::string EStorageDataType_enumToString(const EStorageDataType dataType);
std::ostream& operator<<(std::ostream& os, EStorageDataType dataType);
std::istream& operator>>(std::istream& in, EStorageDataType& dataType);

/**
 * @brief convert an oiio::ParamValueList into metadata string map
 * @param[in] metadata An instance of oiio::ParamValueList
 * @return std::map Metadata string map
 */
std::map<std::string, std::string> getMapFromMetadata(const oiio::ParamValueList& metadata);

/**
 * @brief extract entire image specification from an image for a given path
 * @param[in] path The given path to the image
 * @return imageSpec Specification describing the image
 */
oiio::ImageSpec readImageSpec(const std::string& path);

/**
 * @brief extract metadata from an image for a given path
 * @param[in] path The given path to the image
 * @return metadata All metadata find in the image
 */
oiio::ParamValueList readImageMetadata(const std::string& path);

/**
 * @brief read a 3 channels image with a given path, samples converted to float.
 * Images with another channel count (grayscale, alpha, CMYK) are not converted: an error is thrown.
 * @param[in] path The given path to the image
 * @param[out] image The output image buffer
 */
void readImage(const std::string& path, Image<RGBfColor>& image);

/**
 * @brief write an RGB float image with a given path
 * @param[in] path The given path to the image
 * @param[in] image The image buffer
 * @param[in] storageDataType sample storage, Half is only valid for EXR outputs
 * @param[in] metadata custom metadata added to the image header
 */
void writeImage(const std::string& path,
                const Image<RGBfColor>& image,
                EStorageDataType storageDataType = EStorageDataType::Float,
                const oiio::ParamValueList& metadata = oiio::ParamValueList());

}  // namespace image
}  // namespace photonMerge
