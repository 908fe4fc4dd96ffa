// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

#define PHOTONMERGE_THROW_HDR(TYPE, x) \
{ \
  std::stringstream s; \
  s << x; \
  throw ::photonMerge::hdr::HdrError(TYPE, s.str()); \
}

namespace photonMerge {
namespace hdr {

/**
 * @brief Category of a failure of the HDR merging
 */
enum class EHdrErrorType
{
    METADATA,            //< exposure or gain missing or malformed
    DECODE,              //< image unreadable or not a 3 channels RGB image
    SHAPE,               //< buffer length not a multiple of 3 or mismatched between images
    INSUFFICIENT_INPUT,  //< nothing to merge
    UNKNOWN
};

std::string EHdrErrorType_enumToString(EHdrErrorType errorType);
EHdrErrorType EHdrErrorType_stringToEnum(const std::string& errorType);
std::ostream& operator<<(std::ostream& os, EHdrErrorType errorType);
std::istream& operator>>(std::istream& in, EHdrErrorType& errorType);

/**
 * @brief Exception raised by the HDR merging, tagged with its category
 */
class HdrError : public std::runtime_error
{
  public:
    HdrError(EHdrErrorType type, const std::string& message)
      : std::runtime_error(message),
        _type(type)
    {}

    EHdrErrorType getType() const { return _type; }

  private:
    EHdrErrorType _type;
};

}  // namespace hdr
}  // namespace photonMerge
