#include "lucky_stack/synthetic/tiptilt.hpp"
#include "lucky_stack/core/errors.hpp"
#include "lucky_stack/core/utils.hpp"
#include "lucky_stack/image/processing.hpp"

#include <cmath>
#include <iostream>

namespace lucky_stack::synthetic {

TipTiltResult add_tip_tilt(const std::vector<Matrix2Df>& images, const TipTiltOptions& opts,
                           std::mt19937_64& rng) {
    if (!opts.sigma_px && !opts.shifts) {
        throw ConfigError("either sigma_px or explicit shifts must be specified");
    }
    if (opts.sigma_px && opts.shifts) {
        throw ConfigError("sigma_px and explicit shifts are mutually exclusive");
    }
    if (opts.sigma_px && !(*opts.sigma_px >= 0.0f)) {
        throw ConfigError("sigma_px must be >= 0");
    }
    if (opts.crop_px[0] < 0 || opts.crop_px[1] < 0) {
        throw ConfigError("crop_px must be >= 0");
    }
    if (images.empty()) {
        throw DegenerateInputError("no truth image to displace");
    }

    const size_t n_in = images.size();
    int n_tt = opts.n_copies;
    if (n_in != 1) {
        n_tt = static_cast<int>(n_in);
    } else if (n_tt < 1) {
        throw ConfigError("n_copies must be >= 1");
    }
    if (opts.shifts && opts.shifts->size() < static_cast<size_t>(n_tt)) {
        throw DimensionError(std::to_string(opts.shifts->size()) + " explicit shifts for " +
                             std::to_string(n_tt) + " frames");
    }
    for (size_t i = 1; i < n_in; ++i) {
        if (!core::same_shape(images[i], images[0])) {
            throw DimensionError("frame " + std::to_string(i) + " is " +
                                 core::shape_string(images[i]) + ", frame 0 is " +
                                 core::shape_string(images[0]));
        }
    }

    std::cerr << "[TIPTILT] Adding tip/tilt to " << n_tt << " images" << std::endl;

    std::normal_distribution<float> normal(0.0f, 1.0f);
    TipTiltResult out;
    out.frames.reserve(static_cast<size_t>(n_tt));
    out.shifts.reserve(static_cast<size_t>(n_tt));

    for (int j = 0; j < n_tt; ++j) {
        const Matrix2Df& image = (n_in == 1) ? images[0] : images[static_cast<size_t>(j)];

        ShiftVector s;
        if (opts.sigma_px) {
            s.dy = normal(rng) * *opts.sigma_px;
            s.dx = normal(rng) * *opts.sigma_px;
        } else {
            s = (*opts.shifts)[static_cast<size_t>(j)];
        }

        Matrix2Df shifted = image::shift_image(image, s.dy, s.dx);
        if (opts.crop_px[0] > 0 || opts.crop_px[1] > 0) {
            shifted = image::crop_symmetric(shifted, opts.crop_px[0], opts.crop_px[1]);
        }
        out.frames.push_back(std::move(shifted));
        out.shifts.push_back(s);
    }
    return out;
}

TipTiltResult add_tip_tilt(const std::vector<Matrix2Df>& images, const TipTiltOptions& opts) {
    std::mt19937_64 rng(opts.seed);
    return add_tip_tilt(images, opts, rng);
}

TipTiltResult add_tip_tilt(const Matrix2Df& truth, const TipTiltOptions& opts) {
    return add_tip_tilt(std::vector<Matrix2Df>{truth}, opts);
}

Matrix2Df render_gaussian_spot(int rows, int cols, float center_row, float center_col,
                               float sigma_px, float amplitude) {
    if (rows <= 0 || cols <= 0) {
        throw ConfigError("spot frame size must be positive");
    }
    if (!(sigma_px > 0.0f)) {
        throw ConfigError("spot sigma must be > 0");
    }
    Matrix2Df img(rows, cols);
    const float inv_2s2 = 1.0f / (2.0f * sigma_px * sigma_px);
    for (int y = 0; y < rows; ++y) {
        const float dy = static_cast<float>(y) - center_row;
        for (int x = 0; x < cols; ++x) {
            const float dx = static_cast<float>(x) - center_col;
            img(y, x) = amplitude * std::exp(-(dx * dx + dy * dy) * inv_2s2);
        }
    }
    return img;
}

} // namespace lucky_stack::synthetic
