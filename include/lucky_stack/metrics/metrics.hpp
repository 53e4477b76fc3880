#pragma once

#include "lucky_stack/core/types.hpp"

namespace lucky_stack::metrics {

// Strehl ratio: peak of `psf` over the peak of the diffraction-limited `psf_dl`.
float strehl_ratio(const Matrix2Df& psf, const Matrix2Df& psf_dl);

} // namespace lucky_stack::metrics
