#pragma once

#include "lucky_stack/core/types.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace lucky_stack::synthetic {

struct TipTiltOptions {
    std::optional<float> sigma_px;                   // Gaussian tip/tilt per axis
    std::optional<std::vector<ShiftVector>> shifts;  // explicit (dy, dx) per copy
    int n_copies = 1;                                // used for a single input frame
    std::array<int, 2> crop_px{0, 0};                // (rows, cols) margin after shifting
    uint64_t seed = 0;
};

struct TipTiltResult {
    std::vector<Matrix2Df> frames;
    std::vector<ShiftVector> shifts;                 // shift applied to each output frame
};

/**
 * Displace copies of the input frames by known tip/tilt.
 *
 * A single input frame yields `n_copies` displaced copies; a sequence of
 * several frames yields one displacement per frame. Exactly one of
 * `sigma_px` and `shifts` must be set. Gaussian draws come from `rng`,
 * dy before dx for each frame.
 */
TipTiltResult add_tip_tilt(const std::vector<Matrix2Df>& images, const TipTiltOptions& opts,
                           std::mt19937_64& rng);

// Same, with an engine seeded from `opts.seed`.
TipTiltResult add_tip_tilt(const std::vector<Matrix2Df>& images, const TipTiltOptions& opts);

TipTiltResult add_tip_tilt(const Matrix2Df& truth, const TipTiltOptions& opts);

// Noiseless circular Gaussian point source centred at (center_row, center_col).
Matrix2Df render_gaussian_spot(int rows, int cols, float center_row, float center_col,
                               float sigma_px, float amplitude = 1.0f);

} // namespace lucky_stack::synthetic
