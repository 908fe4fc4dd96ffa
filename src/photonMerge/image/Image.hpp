// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#pragma once

#include <photonMerge/numeric/numeric.hpp>

namespace photonMerge {
namespace image {

/* An image is always a dynamic array with row major pixel ordering */
template <typename T>
using EigenRowMatrixT = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * @brief Dense in-core image, stored in a row major Eigen matrix.
 * Pixel (y, x) is at offset y * width + x, so an image of RGB pixels is an
 * interleaved R, G, B sample sequence.
 */
template <typename T>
class Image : public EigenRowMatrixT<T>
{
  public:
    using Base = EigenRowMatrixT<T>;

    /**
     * @brief Default constructor
     * @note This create an empty image
     */
    inline Image() = default;

    /**
     * @brief Full constructor
     * @param width Width of the image (ie number of column)
     * @param height Height of the image (ie number of row)
     * @param fInit Tell if the image should be initialized
     * @param val If fInit is true, set all pixel to the specified value
     */
    inline Image(int width, int height, bool fInit = false, const T val = T())
      : Base(height, width)
    {
        if (fInit)
            this->fill(val);
    }

    /**
     * @brief Change geometry of image
     * @param width New width of image
     * @param height New height of image
     * @param fInit Indicate if new image should be initialized
     * @param val if fInit is true all pixel in the new image are set to this value
     */
    inline void resize(int width, int height, bool fInit = true, const T val = T(0))
    {
        Base::resize(height, width);
        if (fInit)
            this->fill(val);
    }

    inline int width() const { return static_cast<int>(this->cols()); }

    inline int height() const { return static_cast<int>(this->rows()); }

    inline const T& operator()(int y, int x) const { return Base::operator()(y, x); }

    inline T& operator()(int y, int x) { return Base::operator()(y, x); }
};

}  // namespace image
}  // namespace photonMerge
