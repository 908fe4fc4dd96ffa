// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include <filesystem>
#include <random>
#include <string>

namespace photonMerge {
namespace utils {

/**
 * @brief Generate a random alphanumeric filename (without extension).
 * @param[in] length the number of characters
 */
inline std::string generateUniqueFilename(const int length = 16)
{
    static const char characters[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

    std::random_device rd;
    std::mt19937 randomTwEngine(rd());
    const int nbChars = sizeof(characters) - 1;  // exclude the null character
    std::uniform_int_distribution<> randomDist(0, nbChars - 1);

    std::string filename;
    filename.resize(length);

    for (int i = 0; i < length; ++i)
        filename[i] = characters[randomDist(randomTwEngine)];

    return filename;
}

/**
 * @brief Path of a not yet existing file in the system temporary directory
 * @param[in] extension extension with the dot (eg ".exr")
 */
inline std::string generateTemporaryFilePath(const std::string& extension)
{
    std::filesystem::path temp = std::filesystem::temp_directory_path();
    temp /= generateUniqueFilename();
    temp += extension;
    return temp.string();
}

}  // namespace utils
}  // namespace photonMerge
