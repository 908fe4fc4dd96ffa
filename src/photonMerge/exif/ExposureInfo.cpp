// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#include "ExposureInfo.hpp"

#include <boost/algorithm/string.hpp>

#include <cmath>
#include <regex>
#include <stdexcept>

namespace photonMerge {
namespace exif {

std::map<std::string, std::string>::const_iterator ExposureInfo::findMetadataIterator(const std::string& name) const
{
    auto it = _metadata.find(name);
    if (it != _metadata.end())
        return it;
    const std::string nameLower = boost::algorithm::to_lower_copy(name);
    for (auto mIt = _metadata.begin(); mIt != _metadata.end(); ++mIt)
    {
        std::string key = boost::algorithm::to_lower_copy(mIt->first);
        if (key.size() > name.size())
        {
            const auto delimiterIt = key.find_last_of("/:");
            if (delimiterIt != std::string::npos)
                key = key.substr(delimiterIt + 1);
        }
        if (key == nameLower)
        {
            return mIt;
        }
    }
    return _metadata.end();
}

const std::string& ExposureInfo::getMetadata(const std::vector<std::string>& names) const
{
    static const std::string emptyString;
    for (const std::string& name : names)
    {
        const auto it = findMetadataIterator(name);
        if (it != _metadata.end())
            return it->second;
    }
    return emptyString;
}

double ExposureInfo::readRealNumber(const std::string& str)
{
    try
    {
        std::smatch m;
        const std::regex pattern_frac("([0-9]+)\\/([0-9]+)");

        if (!std::regex_search(str, m, pattern_frac))
        {
            return std::stod(str);
        }

        const int num = std::stoi(m[1].str());
        const int denum = std::stoi(m[2].str());

        if (denum != 0)
            return double(num) / double(denum);
        else
            return 0.0;
    }
    catch (const std::logic_error&)
    {
        return -1.0;
    }
}

double ExposureInfo::getDoubleMetadata(const std::vector<std::string>& names) const
{
    const std::string& value = getMetadata(names);
    if (value.empty())
        return -1.0;
    return readRealNumber(value);
}

double ExposureInfo::getGain() const
{
    const double iso = getMetadataISO();
    if (iso <= 0.0)
        return -1.0;
    return iso / referenceISO;
}

bool ExposureInfo::hasShutter() const
{
    const double shutter = getMetadataShutter();
    return shutter > 0.0 && std::isfinite(shutter);
}

bool ExposureInfo::hasGain() const
{
    const double gain = getGain();
    return gain > 0.0 && std::isfinite(gain);
}

}  // namespace exif
}  // namespace photonMerge
