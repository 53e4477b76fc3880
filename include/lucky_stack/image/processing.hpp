#pragma once

#include "lucky_stack/core/types.hpp"

namespace lucky_stack::image {

// Translate an image: out(y, x) = in(y - dy, x - dx). Bilinear interpolation,
// samples from outside the frame are zero.
Matrix2Df shift_image(const Matrix2Df& img, float dy, float dx);

// Remove `margin_rows` from top and bottom and `margin_cols` from left and right.
Matrix2Df crop_symmetric(const Matrix2Df& img, int margin_rows, int margin_cols);

// Extract a search sub-window; throws DimensionError if it leaves the frame.
Matrix2Df extract_window(const Matrix2Df& img, const SearchWindow& w);

bool window_fits(const SearchWindow& w, int rows, int cols);

} // namespace lucky_stack::image
