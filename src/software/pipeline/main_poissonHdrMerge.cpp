// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#include <photonMerge/image/all.hpp>
#include <photonMerge/image/io.hpp>
#include <photonMerge/system/Logger.hpp>
#include <photonMerge/system/Timer.hpp>
#include <photonMerge/cmdline/cmdline.hpp>
#include <photonMerge/system/main.hpp>

// HDR Related
#include <photonMerge/hdr/hdrError.hpp>
#include <photonMerge/hdr/ImageDecoder.hpp>
#include <photonMerge/hdr/MetadataProvider.hpp>
#include <photonMerge/hdr/PoissonMerge.hpp>

// Command line parameters
#include <boost/program_options.hpp>
#include <boost/algorithm/string.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

// These constants define the current software version.
// They must be updated when the command line is changed.
#define PHOTONMERGE_SOFTWARE_VERSION_MAJOR 1
#define PHOTONMERGE_SOFTWARE_VERSION_MINOR 0

using namespace photonMerge;

namespace po = boost::program_options;
namespace fs = std::filesystem;

int photonMerge_main(int argc, char** argv)
{
    std::vector<std::string> inputImagePaths;
    std::string outputImagePath;
    std::vector<float> exposures;
    std::vector<float> gains;

    image::EStorageDataType storageDataType = image::EStorageDataType::Float;

    // Command line parameters
    // clang-format off
    po::options_description requiredParams("Required parameters");
    requiredParams.add_options()
        ("input,i", po::value<std::vector<std::string>>(&inputImagePaths)->required()->multitoken(),
         "Images of the exposure stack, in merging order.")
        ("output,o", po::value<std::string>(&outputImagePath)->required(),
         "Output HDR image path.");

    po::options_description optionalParams("Optional parameters");
    optionalParams.add_options()
        ("exposures", po::value<std::vector<float>>(&exposures)->multitoken(),
         "Exposure time of each input image, in seconds. Replaces the image metadata (requires --gains).")
        ("gains", po::value<std::vector<float>>(&gains)->multitoken(),
         "Sensor gain of each input image (ISO / 100). Replaces the image metadata (requires --exposures).")
        ("storageDataType", po::value<image::EStorageDataType>(&storageDataType)->default_value(storageDataType),
         ("Storage data type: " + image::EStorageDataType_informations()).c_str());
    // clang-format on

    CmdLine cmdline("This program merges an exposure stack into an HDR image with the Poisson photon noise estimator.\n"
                    "photonMerge poissonHdrMerge");

    cmdline.add(requiredParams);
    cmdline.add(optionalParams);
    if (!cmdline.execute(argc, argv))
    {
        return EXIT_FAILURE;
    }

    // Set maxThreads
    cmdline.getHardwareContext().applyThreadLimit();

    if (exposures.empty() != gains.empty())
    {
        PHOTONMERGE_LOG_ERROR("Exposures and gains must be given together.");
        return EXIT_FAILURE;
    }

    if (storageDataType == image::EStorageDataType::Half && boost::to_lower_copy(fs::path(outputImagePath).extension().string()) != ".exr")
    {
        PHOTONMERGE_LOG_ERROR("Half storage is only available for EXR outputs.");
        return EXIT_FAILURE;
    }

    const std::string outputFolder = fs::path(outputImagePath).parent_path().string();
    if (!outputFolder.empty() && !fs::is_directory(outputFolder))
    {
        PHOTONMERGE_LOG_ERROR("The output folder '" << outputFolder << "' does not exist.");
        return EXIT_FAILURE;
    }

    system::Timer timer;

    std::unique_ptr<hdr::IMetadataProvider> metadataProvider;
    if (exposures.empty())
    {
        PHOTONMERGE_LOG_INFO("Read exposures and gains from the image metadata.");
        metadataProvider = std::make_unique<hdr::ImageMetadataProvider>();
    }
    else
    {
        PHOTONMERGE_LOG_INFO("Use the exposures and gains from the command line.");
        metadataProvider = std::make_unique<hdr::StaticMetadataProvider>(exposures, gains);
    }

    const hdr::ImageFileDecoder imageDecoder;
    const hdr::PoissonEstimator estimator(*metadataProvider, imageDecoder);

    PHOTONMERGE_LOG_INFO("Merge " << inputImagePaths.size() << " images.");

    image::Image<image::RGBfColor> hdrImage;
    try
    {
        estimator.process(inputImagePaths, hdrImage);
    }
    catch (const hdr::HdrError& e)
    {
        PHOTONMERGE_LOG_ERROR("HDR merging failed (" << e.getType() << " error): " << e.what());
        return EXIT_FAILURE;
    }

    image::writeImage(outputImagePath, hdrImage, storageDataType);
    PHOTONMERGE_LOG_INFO("HDR image written: " << outputImagePath << " (" << hdrImage.width() << "x" << hdrImage.height() << ").");

    PHOTONMERGE_LOG_INFO("Task done in (s): " + std::to_string(timer.elapsed()));
    return EXIT_SUCCESS;
}
