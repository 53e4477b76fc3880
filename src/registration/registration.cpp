#include "lucky_stack/registration/registration.hpp"
#include "lucky_stack/core/errors.hpp"
#include "lucky_stack/core/utils.hpp"
#include "lucky_stack/image/processing.hpp"
#include "lucky_stack/registration/gaussian_fit.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <cstring>

namespace lucky_stack::registration {

PeakLocation find_peak(const Matrix2Df& img, const std::optional<SearchWindow>& window) {
    Matrix2Df region;
    if (window) {
        region = image::extract_window(img, *window);
    }
    const Matrix2Df& src = window ? region : img;
    if (src.size() == 0) {
        throw DegenerateInputError("cannot locate the peak of an empty frame");
    }

    // minMaxLoc scans row-major and keeps the first maximum.
    cv::Mat cv_src(static_cast<int>(src.rows()), static_cast<int>(src.cols()), CV_32F,
                   const_cast<float*>(src.data()));
    double max_val = 0.0;
    cv::Point max_loc;
    cv::minMaxLoc(cv_src, nullptr, &max_val, nullptr, &max_loc);

    PeakLocation peak;
    peak.row = max_loc.y + (window ? window->y : 0);
    peak.col = max_loc.x + (window ? window->x : 0);
    peak.value = static_cast<float>(max_val);
    return peak;
}

std::pair<double, double> centroid(const Matrix2Df& img) {
    double m00 = 0.0;
    double m10 = 0.0;  // row moment
    double m01 = 0.0;  // col moment
    for (int r = 0; r < img.rows(); ++r) {
        for (int c = 0; c < img.cols(); ++c) {
            const double v = static_cast<double>(img(r, c));
            m00 += v;
            m10 += r * v;
            m01 += c * v;
        }
    }
    if (m00 == 0.0 || !std::isfinite(m00)) {
        throw NumericError("centroid undefined: total intensity is " + std::to_string(m00));
    }
    return {m10 / m00, m01 / m00};
}

Matrix2Df cross_correlate(const Matrix2Df& ref, const Matrix2Df& img) {
    if (!core::same_shape(ref, img)) {
        throw DimensionError("cross-correlation of " + core::shape_string(img) +
                             " frame against " + core::shape_string(ref) + " reference");
    }
    cv::Mat cv_ref(ref.rows(), ref.cols(), CV_32F, const_cast<float*>(ref.data()));
    cv::Mat cv_img(img.rows(), img.cols(), CV_32F, const_cast<float*>(img.data()));

    // filter2D correlates (no kernel flip); anchor at the kernel centre gives
    // the "same" window of the full correlation.
    cv::Mat corr;
    const cv::Point anchor(static_cast<int>(img.cols()) / 2, static_cast<int>(img.rows()) / 2);
    cv::filter2D(cv_ref, corr, CV_32F, cv_img, anchor, 0.0, cv::BORDER_CONSTANT);

    Matrix2Df result(ref.rows(), ref.cols());
    std::memcpy(result.data(), corr.ptr<float>(), ref.size() * sizeof(float));
    return result;
}

Matrix2Df normalize_by_max(const Matrix2Df& corr) {
    if (corr.size() == 0) {
        throw DegenerateInputError("empty correlation surface");
    }
    const float max_val = corr.maxCoeff();
    if (!(max_val > 0.0f) || !std::isfinite(max_val)) {
        throw NumericError("correlation surface maximum is " + std::to_string(max_val) +
                           ", cannot normalize");
    }
    return corr / max_val;
}

ShiftVector correlation_peak_offset(const Matrix2Df& corr, bool subpixel, int border_margin) {
    const int h = static_cast<int>(corr.rows());
    const int w = static_cast<int>(corr.cols());
    const int cy = h / 2;
    const int cx = w / 2;

    if (!subpixel) {
        PeakLocation peak = find_peak(corr);
        return {static_cast<float>(peak.row - cy), static_cast<float>(peak.col - cx)};
    }

    const int inner_h = h - 2 * border_margin;
    const int inner_w = w - 2 * border_margin;
    if (border_margin < 0 || inner_h < 3 || inner_w < 3) {
        throw ConfigError("border_margin " + std::to_string(border_margin) +
                          " leaves no fit region in a " + std::to_string(h) + "x" +
                          std::to_string(w) + " correlation surface");
    }

    const Matrix2Df inner = corr.block(border_margin, border_margin, inner_h, inner_w);
    const double origin_y = static_cast<double>(border_margin - cy);
    const double origin_x = static_cast<double>(border_margin - cx);
    GaussianFitResult fit = fit_gaussian_2d(inner, origin_y, origin_x);

    const double y0 = fit.model.y0;
    const double x0 = fit.model.x0;
    if (y0 < origin_y || y0 > origin_y + inner_h - 1 ||
        x0 < origin_x || x0 > origin_x + inner_w - 1) {
        throw RegistrationError("fitted correlation peak (" + std::to_string(y0) + ", " +
                                std::to_string(x0) + ") outside the fit region");
    }
    return {static_cast<float>(y0), static_cast<float>(x0)};
}

void validate_params(const RegistrationParams& params, int rows, int cols) {
    switch (params.method) {
        case AlignmentMethod::PEAK_PIXEL:
            if (params.search_window &&
                !image::window_fits(*params.search_window, rows, cols)) {
                const SearchWindow& w = *params.search_window;
                throw DimensionError("search window [" + std::to_string(w.x) + ", " +
                                     std::to_string(w.y) + ", " + std::to_string(w.width) +
                                     ", " + std::to_string(w.height) + "] outside " +
                                     std::to_string(rows) + "x" + std::to_string(cols) +
                                     " frames");
            }
            break;
        case AlignmentMethod::CENTROID:
            break;
        case AlignmentMethod::CROSS_CORRELATION:
            if (params.subpixel &&
                (params.border_margin < 0 || rows - 2 * params.border_margin < 3 ||
                 cols - 2 * params.border_margin < 3)) {
                throw ConfigError("border_margin " + std::to_string(params.border_margin) +
                                  " too large for " + std::to_string(rows) + "x" +
                                  std::to_string(cols) + " frames");
            }
            break;
        default:
            throw ConfigError("unsupported alignment method " +
                              std::to_string(static_cast<int>(params.method)));
    }
}

ReferenceAnchor prepare_reference(const Matrix2Df& reference, const RegistrationParams& params) {
    ReferenceAnchor anchor;
    switch (params.method) {
        case AlignmentMethod::PEAK_PIXEL: {
            PeakLocation peak = find_peak(reference, params.search_window);
            anchor.peak_row = peak.row;
            anchor.peak_col = peak.col;
            anchor.peak_value = peak.value;
            break;
        }
        case AlignmentMethod::CENTROID: {
            auto [cr, cc] = centroid(reference);
            anchor.centroid_row = cr;
            anchor.centroid_col = cc;
            break;
        }
        case AlignmentMethod::CROSS_CORRELATION:
            break;
        default:
            throw ConfigError("unsupported alignment method " +
                              std::to_string(static_cast<int>(params.method)));
    }
    return anchor;
}

FrameRegistration register_frame(const Matrix2Df& frame, const Matrix2Df& reference,
                                 const ReferenceAnchor& anchor,
                                 const RegistrationParams& params) {
    if (!core::same_shape(frame, reference)) {
        throw DimensionError("frame " + core::shape_string(frame) +
                             " does not match reference " + core::shape_string(reference));
    }

    // raw_* is the correction applied to the frame; the reported shift is its negation.
    float raw_dy = 0.0f;
    float raw_dx = 0.0f;
    FrameRegistration out;

    switch (params.method) {
        case AlignmentMethod::PEAK_PIXEL: {
            PeakLocation peak = find_peak(frame, params.search_window);
            raw_dy = static_cast<float>(anchor.peak_row - peak.row);
            raw_dx = static_cast<float>(anchor.peak_col - peak.col);
            out.peak_value = peak.value;
            break;
        }
        case AlignmentMethod::CENTROID: {
            auto [cr, cc] = centroid(frame);
            raw_dy = static_cast<float>(anchor.centroid_row - cr);
            raw_dx = static_cast<float>(anchor.centroid_col - cc);
            break;
        }
        case AlignmentMethod::CROSS_CORRELATION: {
            Matrix2Df corr = normalize_by_max(cross_correlate(reference, frame));
            ShiftVector offset =
                correlation_peak_offset(corr, params.subpixel, params.border_margin);
            raw_dy = offset.dy;
            raw_dx = offset.dx;
            break;
        }
        default:
            throw ConfigError("unsupported alignment method " +
                              std::to_string(static_cast<int>(params.method)));
    }

    out.shifted = image::shift_image(frame, raw_dy, raw_dx);
    out.shift = {-raw_dy, -raw_dx};
    return out;
}

} // namespace lucky_stack::registration
