// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include <map>
#include <string>
#include <vector>

namespace photonMerge {
namespace exif {

/**
 * @brief ISO value corresponding to a unit sensor gain
 */
constexpr double referenceISO = 100.0;

/**
 * @brief Shooting parameters of one image, read from its metadata.
 * Values that are missing or cannot be parsed are reported as -1.
 */
class ExposureInfo
{
  public:
    explicit ExposureInfo(const std::map<std::string, std::string>& metadata = std::map<std::string, std::string>())
      : _metadata(metadata)
    {}

    const std::map<std::string, std::string>& getMetadata() const { return _metadata; }

    /**
     * @brief Get the value of the first existing metadata name
     * @param[in] names List of possible names for the metadata
     * @return the metadata value or an empty string
     */
    const std::string& getMetadata(const std::vector<std::string>& names) const;

    /**
     * @brief Get the value of the first existing metadata name as a real number
     * @param[in] names List of possible names for the metadata
     * @return the value or -1.0 if missing or unreadable
     */
    double getDoubleMetadata(const std::vector<std::string>& names) const;

    /**
     * @brief Exposure time in seconds
     */
    double getMetadataShutter() const { return getDoubleMetadata({"ExposureTime", "Shutter Speed Value"}); }

    double getMetadataISO() const
    {
        return getDoubleMetadata({"PhotographicSensitivity", "Photographic Sensitivity", "ISOSpeedRatings", "ISO"});
    }

    /**
     * @brief Sensor gain, relative to the reference ISO
     * @return the gain or -1.0 if the ISO is unknown
     */
    double getGain() const;

    bool hasShutter() const;
    bool hasGain() const;

    /**
     * @brief Parse a decimal ("0.004") or rational ("1/250") number
     * @return the value, 0 for a null denominator, -1.0 if unreadable
     */
    static double readRealNumber(const std::string& str);

  private:
    /**
     * @brief Find a metadata by name, ignoring case and namespace prefixes ("Exif:", "raw:")
     */
    std::map<std::string, std::string>::const_iterator findMetadataIterator(const std::string& name) const;

    std::map<std::string, std::string> _metadata;
};

}  // namespace exif
}  // namespace photonMerge
