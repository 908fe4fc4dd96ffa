// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include <photonMerge/numeric/numeric.hpp>

#include <ostream>

namespace photonMerge {
namespace image {

/**
 * Red Green Blue template pixel type
 * @tparam T type of each channel
 */
template <typename T>
class Rgb : public Eigen::Matrix<T, 3, 1, 0, 3, 1>
{
    using Base = Eigen::Matrix<T, 3, 1, 0, 3, 1>;

  public:
    /**
     * @brief Full constructor
     * @param red Red value
     * @param green value
     * @param blue value
     */
    inline Rgb(T red, T green, T blue)
      : Base(red, green, blue)
    {}

    explicit inline Rgb(const Base& val)
      : Base(val)
    {}

    /**
     * @brief Single value construction
     * @note This is equivalent to Rgb(val, val, val)
     */
    explicit inline Rgb(const T val = 0)
      : Base(val, val, val)
    {}

    inline const T& r() const { return (*this)(0); }
    inline T& r() { return (*this)(0); }

    inline const T& g() const { return (*this)(1); }
    inline T& g() { return (*this)(1); }

    inline const T& b() const { return (*this)(2); }
    inline T& b() { return (*this)(2); }

    friend std::ostream& operator<<(std::ostream& os, const Rgb& col)
    {
        os << " {";
        for (int i = 0; i < 2; ++i)
            os << col(i) << ",";
        os << col(2) << "} ";
        return os;
    }
};

using RGBfColor = Rgb<float>;

static_assert(sizeof(RGBfColor) == 3 * sizeof(float), "RGBfColor must be tightly packed");

}  // namespace image
}  // namespace photonMerge
