#pragma once

#include "lucky_stack/core/types.hpp"

#include <optional>
#include <utility>

namespace lucky_stack::registration {

struct PeakLocation {
    int row = 0;
    int col = 0;
    float value = 0.0f;
};

// Maximum sample in the frame or in `window` (absolute frame coordinates).
// Ties resolve to the first sample in row-major order.
PeakLocation find_peak(const Matrix2Df& img,
                       const std::optional<SearchWindow>& window = std::nullopt);

// Intensity-weighted centre of mass (row, col). Throws NumericError when the
// total intensity is zero or not finite.
std::pair<double, double> centroid(const Matrix2Df& img);

// Cross-correlation of `img` against `ref` in "same" geometry: the sample at
// (rows/2 - dy, cols/2 - dx) holds the overlap for `img` displaced by (dy, dx).
Matrix2Df cross_correlate(const Matrix2Df& ref, const Matrix2Df& img);

// Divide by the maximum. Throws NumericError if the maximum is <= 0 or not finite.
Matrix2Df normalize_by_max(const Matrix2Df& corr);

// Offset of the correlation peak from the surface centre (rows/2, cols/2),
// integer argmax or Gaussian-refined inside `border_margin`.
ShiftVector correlation_peak_offset(const Matrix2Df& corr, bool subpixel, int border_margin);

// Parameter checks against a frame shape; run once before any frame is processed.
void validate_params(const RegistrationParams& params, int rows, int cols);

ReferenceAnchor prepare_reference(const Matrix2Df& reference, const RegistrationParams& params);

/**
 * Register one candidate frame against the reference.
 *
 * The returned shift is the displacement of `frame` relative to `reference`;
 * `shifted` is `frame` moved back by that amount. For PEAK_PIXEL the peak
 * intensity inside the search region is reported for frame selection.
 */
FrameRegistration register_frame(const Matrix2Df& frame, const Matrix2Df& reference,
                                 const ReferenceAnchor& anchor,
                                 const RegistrationParams& params);

} // namespace lucky_stack::registration
