// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#include "hdrError.hpp"

#include <boost/algorithm/string.hpp>

namespace photonMerge {
namespace hdr {

std::string EHdrErrorType_enumToString(EHdrErrorType errorType)
{
    switch (errorType)
    {
        case EHdrErrorType::METADATA:
            return "metadata";
        case EHdrErrorType::DECODE:
            return "decode";
        case EHdrErrorType::SHAPE:
            return "shape";
        case EHdrErrorType::INSUFFICIENT_INPUT:
            return "insufficient_input";
        case EHdrErrorType::UNKNOWN:
            return "unknown";
    }
    throw std::out_of_range("Invalid hdr error type enum");
}

EHdrErrorType EHdrErrorType_stringToEnum(const std::string& errorType)
{
    const std::string type = boost::to_lower_copy(errorType);

    if (type == "metadata")
        return EHdrErrorType::METADATA;
    if (type == "decode")
        return EHdrErrorType::DECODE;
    if (type == "shape")
        return EHdrErrorType::SHAPE;
    if (type == "insufficient_input")
        return EHdrErrorType::INSUFFICIENT_INPUT;
    if (type == "unknown")
        return EHdrErrorType::UNKNOWN;

    throw std::out_of_range("Invalid hdr error type: '" + errorType + "'");
}

std::ostream& operator<<(std::ostream& os, EHdrErrorType errorType)
{
    os << EHdrErrorType_enumToString(errorType);
    return os;
}

std::istream& operator>>(std::istream& in, EHdrErrorType& errorType)
{
    std::string token;
    in >> token;
    errorType = EHdrErrorType_stringToEnum(token);
    return in;
}

}  // namespace hdr
}  // namespace photonMerge
