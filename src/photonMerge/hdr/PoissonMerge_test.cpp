// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#include <photonMerge/hdr/PoissonMerge.hpp>
#include <photonMerge/hdr/hdrError.hpp>
#include <photonMerge/hdr/hdrTestCommon.hpp>

#define BOOST_TEST_MODULE PoissonMerge

#include <boost/test/unit_test.hpp>
#include <boost/test/tools/floating_point_comparison.hpp>

#include <random>

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

Vecf makeBuffer(std::initializer_list<float> values)
{
    Vecf buffer(values.size());
    Eigen::Index i = 0;
    for (float value : values)
        buffer(i++) = value;
    return buffer;
}

}  // namespace

BOOST_AUTO_TEST_CASE(PoissonMerge_twoImagesScenario)
{
    test::FakeMetadataProvider metadata({1.f, 3.f}, {1.f, 1.f});
    test::FakeImageDecoder decoder;
    decoder.addImage("a.exr", test::makeRowImage({RGBfColor(10.f, 20.f, 30.f)}));
    decoder.addImage("b.exr", test::makeRowImage({RGBfColor(5.f, 10.f, 15.f)}));

    const PoissonEstimator estimator(metadata, decoder);

    Vecf merged;
    estimator.process({"a.exr", "b.exr"}, merged);

    BOOST_REQUIRE_EQUAL(merged.size(), 3);
    BOOST_CHECK_CLOSE(merged(0), 5.f, 1e-4);
    BOOST_CHECK_CLOSE(merged(1), 10.f, 1e-4);
    BOOST_CHECK_CLOSE(merged(2), 15.f, 1e-4);
}

BOOST_AUTO_TEST_CASE(PoissonMerge_accumulatorSteps)
{
    const std::vector<Vecf> radiances = {makeBuffer({10.f, 20.f, 30.f}), makeBuffer({5.f / 3.f, 10.f / 3.f, 5.f})};

    Vecf merged;
    accumulateRadiances({radiances.front()}, {4.f}, merged);
    // the first image is folded on top of itself
    BOOST_CHECK_CLOSE(merged(0), 20.f, 1e-4);

    accumulateRadiances(radiances, {1.f, 3.f}, merged);
    BOOST_CHECK_CLOSE(merged(0), 5.f, 1e-4);
    BOOST_CHECK_CLOSE(merged(1), 10.f, 1e-4);
    BOOST_CHECK_CLOSE(merged(2), 15.f, 1e-4);
}

BOOST_AUTO_TEST_CASE(PoissonMerge_singleImage)
{
    const float exposure = 0.25f;
    const float gain = 4.f;

    std::vector<RGBfColor> pixels = {RGBfColor(0.1f, 0.2f, 0.3f), RGBfColor(1.f, 0.f, 0.5f)};
    test::FakeMetadataProvider metadata({exposure}, {gain});
    test::FakeImageDecoder decoder;
    decoder.addImage("single", test::makeRowImage(pixels));

    image::Image<RGBfColor> merged;
    PoissonEstimator(metadata, decoder).process({"single"}, merged);

    BOOST_REQUIRE_EQUAL(merged.width(), 2);
    BOOST_REQUIRE_EQUAL(merged.height(), 1);
    for (int x = 0; x < merged.width(); ++x)
    {
        for (int c = 0; c < 3; ++c)
        {
            const float expected = 2.f * pixels[x](c) / (exposure * gain);
            BOOST_CHECK_CLOSE(merged(0, x)(c), expected, 1e-4);
        }
    }
}

BOOST_AUTO_TEST_CASE(PoissonMerge_outputDimensions)
{
    const int width = 7;
    const int height = 5;

    std::mt19937 generator(42);
    std::uniform_real_distribution<float> distribution(0.f, 1.f);

    test::FakeMetadataProvider metadata({0.01f, 0.04f, 0.16f}, {1.f, 1.f, 2.f});
    test::FakeImageDecoder decoder;
    for (const std::string path : {"0", "1", "2"})
    {
        image::Image<RGBfColor> img(width, height);
        for (int y = 0; y < height; ++y)
            for (int x = 0; x < width; ++x)
                img(y, x) = RGBfColor(distribution(generator), distribution(generator), distribution(generator));
        decoder.addImage(path, img);
    }

    const PoissonEstimator estimator(metadata, decoder);

    image::Image<RGBfColor> mergedImage;
    estimator.process({"0", "1", "2"}, mergedImage);
    BOOST_CHECK_EQUAL(mergedImage.width(), width);
    BOOST_CHECK_EQUAL(mergedImage.height(), height);

    Vecf mergedBuffer;
    estimator.process({"0", "1", "2"}, mergedBuffer);
    BOOST_REQUIRE_EQUAL(mergedBuffer.size(), width * height * 3);

    // pixel (y, x) channel c is sample 3 * (y * width + x) + c
    BOOST_CHECK_EQUAL(mergedImage(2, 3)(1), mergedBuffer(3 * (2 * width + 3) + 1));
    BOOST_CHECK_EQUAL(mergedImage(4, 6)(2), mergedBuffer(mergedBuffer.size() - 1));
}

BOOST_AUTO_TEST_CASE(PoissonMerge_pixelScaling)
{
    const float k = 2.f;
    const std::vector<float> exposures = {0.5f, 1.f, 2.f};

    test::FakeMetadataProvider metadata(exposures, {1.f, 1.f, 1.f});
    test::FakeImageDecoder decoder;
    test::FakeImageDecoder scaledDecoder;
    for (int i = 0; i < 3; ++i)
    {
        const RGBfColor pixel(0.1f * (i + 1), 0.3f, 0.05f * (i + 2));
        decoder.addImage(std::to_string(i), test::makeRowImage({pixel, RGBfColor(pixel * 0.5f)}));
        scaledDecoder.addImage(std::to_string(i), test::makeRowImage({RGBfColor(pixel * k), RGBfColor(pixel * 0.5f * k)}));
    }

    Vecf merged;
    Vecf scaledMerged;
    PoissonEstimator(metadata, decoder).process({"0", "1", "2"}, merged);
    PoissonEstimator(metadata, scaledDecoder).process({"0", "1", "2"}, scaledMerged);

    BOOST_REQUIRE_EQUAL(merged.size(), scaledMerged.size());
    for (Eigen::Index i = 0; i < merged.size(); ++i)
        BOOST_CHECK_CLOSE(scaledMerged(i), k * merged(i), 1e-3);
}

BOOST_AUTO_TEST_CASE(PoissonMerge_exposureWeight)
{
    // contribution of the last image is exposure / sum of exposures
    const std::vector<Vecf> radiances = {Vecf::Zero(3), Vecf::Ones(3)};

    Vecf lowWeight;
    Vecf highWeight;
    accumulateRadiances(radiances, {1.f, 1.f}, lowWeight);
    accumulateRadiances(radiances, {1.f, 2.f}, highWeight);

    BOOST_CHECK_CLOSE(lowWeight(0), 0.5f, 1e-4);
    BOOST_CHECK_CLOSE(highWeight(0), 2.f / 3.f, 1e-4);
    BOOST_CHECK_GT(highWeight(1), lowWeight(1));
}

BOOST_AUTO_TEST_CASE(PoissonMerge_accumulatorErrors)
{
    Vecf merged;
    BOOST_CHECK(errorType([&] { accumulateRadiances({}, {}, merged); }) == EHdrErrorType::INSUFFICIENT_INPUT);
    BOOST_CHECK(errorType([&] { accumulateRadiances({Vecf::Ones(3)}, {1.f, 2.f}, merged); }) == EHdrErrorType::METADATA);
    BOOST_CHECK(errorType([&] { accumulateRadiances({Vecf::Ones(3), Vecf::Ones(6)}, {1.f, 2.f}, merged); }) == EHdrErrorType::SHAPE);
}

BOOST_AUTO_TEST_CASE(PoissonMerge_emptyImageSet)
{
    test::FakeMetadataProvider metadata({}, {});
    test::FakeImageDecoder decoder;
    const PoissonEstimator estimator(metadata, decoder);

    Vecf merged;
    BOOST_CHECK(errorType([&] { estimator.process({}, merged); }) == EHdrErrorType::INSUFFICIENT_INPUT);
}

BOOST_AUTO_TEST_CASE(PoissonMerge_mismatchedDimensions)
{
    test::FakeMetadataProvider metadata({1.f, 2.f}, {1.f, 1.f});
    test::FakeImageDecoder decoder;
    decoder.addImage("small", image::Image<RGBfColor>(2, 2, true, RGBfColor(1.f)));
    decoder.addImage("large", image::Image<RGBfColor>(4, 1, true, RGBfColor(1.f)));

    const PoissonEstimator estimator(metadata, decoder);

    Vecf merged;
    BOOST_CHECK(errorType([&] { estimator.process({"small", "large"}, merged); }) == EHdrErrorType::SHAPE);
}

BOOST_AUTO_TEST_CASE(PoissonMerge_collaboratorErrors)
{
    test::FakeImageDecoder decoder;
    decoder.addImage("a", test::makeRowImage({RGBfColor(1.f)}));
    decoder.addImage("b", test::makeRowImage({RGBfColor(2.f)}));

    Vecf merged;

    test::FakeMetadataProvider failingMetadata({1.f, 2.f}, {1.f, 1.f});
    failingMetadata.failure = true;
    BOOST_CHECK(errorType([&] { PoissonEstimator(failingMetadata, decoder).process({"a", "b"}, merged); }) == EHdrErrorType::METADATA);

    test::FakeMetadataProvider missingGain({1.f, 2.f}, {1.f});
    BOOST_CHECK(errorType([&] { PoissonEstimator(missingGain, decoder).process({"a", "b"}, merged); }) == EHdrErrorType::METADATA);

    test::FakeMetadataProvider invalidExposure({1.f, 0.f}, {1.f, 1.f});
    BOOST_CHECK(errorType([&] { PoissonEstimator(invalidExposure, decoder).process({"a", "b"}, merged); }) == EHdrErrorType::METADATA);

    test::FakeMetadataProvider metadata({1.f, 2.f}, {1.f, 1.f});
    BOOST_CHECK(errorType([&] { PoissonEstimator(metadata, decoder).process({"a", "missing"}, merged); }) == EHdrErrorType::DECODE);
}
