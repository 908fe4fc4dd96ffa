// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#include <photonMerge/hdr/ImageDecoder.hpp>
#include <photonMerge/hdr/MetadataProvider.hpp>
#include <photonMerge/hdr/PoissonMerge.hpp>
#include <photonMerge/hdr/hdrError.hpp>
#include <photonMerge/image/io.hpp>
#include <photonMerge/utils/filesIO.hpp>

#define BOOST_TEST_MODULE hdrCollaborators

#include <boost/test/unit_test.hpp>
#include <boost/test/tools/floating_point_comparison.hpp>

#include <OpenImageIO/imageio.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace photonMerge;
using namespace photonMerge::hdr;
using image::RGBfColor;

namespace {

template <typename Function>
EHdrErrorType errorType(Function function)
{
    try
    {
        function();
    }
    catch (const HdrError& e)
    {
        return e.getType();
    }
    BOOST_FAIL("no exception raised");
    return EHdrErrorType::UNKNOWN;
}

std::string writeChannels(int nchannels)
{
    const std::string path = utils::generateTemporaryFilePath(".exr");
    const oiio::ImageSpec spec(2, 2, nchannels, oiio::TypeDesc::FLOAT);
    const std::vector<float> pixels(4 * nchannels, 0.5f);

    std::unique_ptr<oiio::ImageOutput> out(oiio::ImageOutput::create(path));
    BOOST_REQUIRE(out);
    BOOST_REQUIRE(out->open(path, spec));
    BOOST_REQUIRE(out->write_image(oiio::TypeDesc::FLOAT, pixels.data()));
    out->close();

    return path;
}

std::string writeShot(float value, float exposureTime, int iso)
{
    oiio::ImageSpec metadataSpec;
    metadataSpec.attribute("ExposureTime", exposureTime);
    if (iso > 0)
        metadataSpec.attribute("PhotographicSensitivity", iso);

    const std::string path = utils::generateTemporaryFilePath(".exr");
    image::writeImage(path, image::Image<RGBfColor>(2, 1, true, RGBfColor(value)), image::EStorageDataType::Float, metadataSpec.extra_attribs);
    return path;
}

}  // namespace

BOOST_AUTO_TEST_CASE(ImageFileDecoder_rgbOnly)
{
    const ImageFileDecoder decoder;

    const std::string rgb = writeChannels(3);
    image::Image<RGBfColor> img;
    decoder.readImage(rgb, img);
    BOOST_CHECK_EQUAL(img.width(), 2);
    BOOST_CHECK_EQUAL(img.height(), 2);
    BOOST_CHECK_EQUAL(img(1, 1).g(), 0.5f);

    const std::string rgba = writeChannels(4);
    const std::string gray = writeChannels(1);
    BOOST_CHECK(errorType([&] { decoder.readImage(rgba, img); }) == EHdrErrorType::DECODE);
    BOOST_CHECK(errorType([&] { decoder.readImage(gray, img); }) == EHdrErrorType::DECODE);
    BOOST_CHECK(errorType([&] { decoder.readImage(utils::generateTemporaryFilePath(".exr"), img); }) == EHdrErrorType::DECODE);

    std::filesystem::remove(rgb);
    std::filesystem::remove(rgba);
    std::filesystem::remove(gray);
}

BOOST_AUTO_TEST_CASE(StaticMetadataProvider_validation)
{
    const std::vector<std::string> paths = {"a", "b"};

    const StaticMetadataProvider provider({0.5f, 2.f}, {1.f, 4.f});
    BOOST_CHECK(provider.getExposures(paths) == std::vector<float>({0.5f, 2.f}));
    BOOST_CHECK(provider.getGains(paths) == std::vector<float>({1.f, 4.f}));

    BOOST_CHECK(errorType([&] { provider.getExposures({"a"}); }) == EHdrErrorType::METADATA);

    const StaticMetadataProvider invalid({0.5f, -1.f}, {1.f, 0.f});
    BOOST_CHECK(errorType([&] { invalid.getExposures(paths); }) == EHdrErrorType::METADATA);
    BOOST_CHECK(errorType([&] { invalid.getGains(paths); }) == EHdrErrorType::METADATA);
}

BOOST_AUTO_TEST_CASE(ImageMetadataProvider_readHeaders)
{
    const std::vector<std::string> paths = {writeShot(0.5f, 0.01f, 100), writeShot(0.5f, 0.04f, 400)};

    const ImageMetadataProvider provider;
    const std::vector<float> exposures = provider.getExposures(paths);
    const std::vector<float> gains = provider.getGains(paths);

    BOOST_REQUIRE_EQUAL(exposures.size(), 2);
    BOOST_REQUIRE_EQUAL(gains.size(), 2);
    BOOST_CHECK_CLOSE(exposures[0], 0.01f, 1e-3);
    BOOST_CHECK_CLOSE(exposures[1], 0.04f, 1e-3);
    BOOST_CHECK_CLOSE(gains[0], 1.f, 1e-3);
    BOOST_CHECK_CLOSE(gains[1], 4.f, 1e-3);

    for (const std::string& path : paths)
        std::filesystem::remove(path);
}

BOOST_AUTO_TEST_CASE(ImageMetadataProvider_readsEachHeaderOnce)
{
    const std::vector<std::string> paths = {writeShot(0.5f, 0.02f, 200)};

    const ImageMetadataProvider provider;
    BOOST_CHECK_CLOSE(provider.getExposures(paths).front(), 0.02f, 1e-3);

    // the gains come from the header parsed for the exposures
    std::filesystem::remove(paths.front());
    BOOST_REQUIRE(!std::filesystem::exists(paths.front()));
    BOOST_CHECK_CLOSE(provider.getGains(paths).front(), 2.f, 1e-3);
    BOOST_CHECK_CLOSE(provider.getExposures(paths).front(), 0.02f, 1e-3);

    const ImageMetadataProvider otherProvider;
    BOOST_CHECK(errorType([&] { otherProvider.getGains(paths); }) == EHdrErrorType::METADATA);
}

BOOST_AUTO_TEST_CASE(ImageMetadataProvider_missingData)
{
    const ImageMetadataProvider provider;

    const std::vector<std::string> noIso = {writeShot(1.f, 0.1f, 0)};
    BOOST_CHECK_NO_THROW(provider.getExposures(noIso));
    BOOST_CHECK(errorType([&] { provider.getGains(noIso); }) == EHdrErrorType::METADATA);
    std::filesystem::remove(noIso.front());

    const std::vector<std::string> missing = {utils::generateTemporaryFilePath(".exr")};
    BOOST_CHECK(errorType([&] { provider.getExposures(missing); }) == EHdrErrorType::METADATA);
}

BOOST_AUTO_TEST_CASE(PoissonEstimator_files)
{
    const std::vector<std::string> paths = {writeShot(0.2f, 0.5f, 100), writeShot(0.8f, 2.f, 100)};

    const ImageMetadataProvider metadata;
    const ImageFileDecoder decoder;

    image::Image<RGBfColor> merged;
    PoissonEstimator(metadata, decoder).process(paths, merged);

    // radiances are 0.4 for both shots, sum of exposures is 2.5
    const float expected = (((0.4f + 0.4f) * 0.5f / 2.5f) + 0.4f) * 2.f / 2.5f;
    BOOST_REQUIRE_EQUAL(merged.width(), 2);
    BOOST_REQUIRE_EQUAL(merged.height(), 1);
    BOOST_CHECK_CLOSE(merged(0, 0).r(), expected, 1e-3);
    BOOST_CHECK_CLOSE(merged(0, 1).b(), expected, 1e-3);

    for (const std::string& path : paths)
        std::filesystem::remove(path);
}
