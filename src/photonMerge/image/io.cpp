// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#include "io.hpp"

#include <photonMerge/system/Logger.hpp>
#include <photonMerge/utils/filesIO.hpp>

#include <OpenImageIO/imagebuf.h>

#include <boost/algorithm/string.hpp>

#include <filesystem>
#include <stdexcept>

namespace photonMerge {
namespace image {

namespace fs = std::filesystem;

std::string EStorageDataType_informations()
{
    return EStorageDataType_enumToString(EStorageDataType::Float) + ", " +
           EStorageDataType_enumToString(EStorageDataType::Half);
}

EStorageDataType EStorageDataType_stringToEnum(const std::string& dataType)
{
    const std::string type = boost::to_lower_copy(dataType);

    if (type == "float")
        return EStorageDataType::Float;
    if (type == "half")
        return EStorageDataType::Half;

    throw std::out_of_range("Invalid EStorageDataType: " + dataType);
}

std::string EStorageDataType_enumToString(const EStorageDataType dataType)
{
    switch (dataType)
    {
        case EStorageDataType::Float:
            return "float";
        case EStorageDataType::Half:
            return "half";
    }
    throw std::out_of_range("Invalid EStorageDataType enum");
}

std::ostream& operator<<(std::ostream& os, EStorageDataType dataType) { return os << EStorageDataType_enumToString(dataType); }

std::istream& operator>>(std::istream& in, EStorageDataType& dataType)
{
    std::string token;
    in >> token;
    dataType = EStorageDataType_stringToEnum(token);
    return in;
}

std::map<std::string, std::string> getMapFromMetadata(const oiio::ParamValueList& metadata)
{
    std::map<std::string, std::string> metadataMap;

    for (const auto& param : metadata)
        metadataMap.emplace(param.name().string(), param.get_string());

    return metadataMap;
}

oiio::ImageSpec readImageSpec(const std::string& path)
{
    std::unique_ptr<oiio::ImageInput> in(oiio::ImageInput::open(path));

    if (!in)
        PHOTONMERGE_THROW_ERROR("Can't find/open image file '" << path << "': " << oiio::geterror());

    oiio::ImageSpec spec = in->spec();

    in->close();

    return spec;
}

oiio::ParamValueList readImageMetadata(const std::string& path) { return readImageSpec(path).extra_attribs; }

void readImage(const std::string& path, Image<RGBfColor>& image)
{
    PHOTONMERGE_LOG_DEBUG("[IO] Read Image: " << path);

    oiio::ImageBuf inBuf(path);

    // force image convertion to float
    if (!inBuf.read(0, 0, true, oiio::TypeDesc::FLOAT) || !inBuf.initialized())
        PHOTONMERGE_THROW_ERROR("Failed to open the image file: '" << path << "'. " << inBuf.geterror());

    // no channel conversion: grayscale and alpha images are rejected
    const int nchannels = inBuf.spec().nchannels;
    if (nchannels != 3)
        PHOTONMERGE_THROW_ERROR("Only RGB images are supported, '" << path << "' has " << nchannels << " channel(s).");

    // copy pixels from oiio to eigen
    image.resize(inBuf.spec().width, inBuf.spec().height, false);
    if (image.size() == 0)
        return;

    oiio::ROI exportROI = inBuf.roi();
    exportROI.chbegin = 0;
    exportROI.chend = 3;

    if (!inBuf.get_pixels(exportROI, oiio::TypeDesc::FLOAT, image.data()))
        PHOTONMERGE_THROW_ERROR("Failed to read the pixels of '" << path << "'. " << inBuf.geterror());
}

void writeImage(const std::string& path,
                const Image<RGBfColor>& image,
                EStorageDataType storageDataType,
                const oiio::ParamValueList& metadata)
{
    const fs::path bPath = fs::path(path);
    const std::string extension = boost::to_lower_copy(bPath.extension().string());
    const std::string tmpPath = (bPath.parent_path() / bPath.stem()).string() + "." + utils::generateUniqueFilename() + extension;
    const bool isEXR = (extension == ".exr");

    if (storageDataType == EStorageDataType::Half && !isEXR)
        PHOTONMERGE_THROW_ERROR("Half storage is only available for EXR images, cannot write '" << path << "'.");

    PHOTONMERGE_LOG_DEBUG("[IO] Write Image: " << path << "\n"
                                               << "\t- width: " << image.width() << "\n"
                                               << "\t- height: " << image.height() << "\n"
                                               << "\t- storage: " << storageDataType);

    oiio::ImageSpec imageSpec(image.width(), image.height(), 3, oiio::TypeDesc::FLOAT);
    imageSpec.extra_attribs = metadata;  // add custom metadata
    imageSpec.attribute("compression", isEXR ? "zips" : "none");

    const oiio::ImageBuf imgBuf = oiio::ImageBuf(imageSpec, const_cast<RGBfColor*>(image.data()));
    const oiio::ImageBuf* outBuf = &imgBuf;

    oiio::ImageBuf formatBuf;
    if (isEXR && storageDataType == EStorageDataType::Half)
    {
        formatBuf.copy(*outBuf, oiio::TypeDesc::HALF);  // override format, use half instead of float
        outBuf = &formatBuf;
    }

    if (!outBuf->write(tmpPath))
        PHOTONMERGE_THROW_ERROR("Can't write output image file '" << path << "'. " << outBuf->geterror());

    // rename temporary filename
    fs::rename(tmpPath, path);
}

}  // namespace image
}  // namespace photonMerge
