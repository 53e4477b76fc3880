#include "lucky_stack/image/processing.hpp"
#include "lucky_stack/core/errors.hpp"
#include "lucky_stack/core/utils.hpp"

#include <opencv2/imgproc.hpp>
#include <cstring>

namespace lucky_stack::image {

Matrix2Df shift_image(const Matrix2Df& img, float dy, float dx) {
    if (img.size() == 0) {
        return img;
    }
    if (dy == 0.0f && dx == 0.0f) {
        return img;
    }

    cv::Mat cv_img(img.rows(), img.cols(), CV_32F, const_cast<float*>(img.data()));
    cv::Mat warp_matrix = (cv::Mat_<float>(2, 3) << 1.0f, 0.0f, dx,
                                                    0.0f, 1.0f, dy);

    cv::Mat shifted;
    cv::warpAffine(cv_img, shifted, warp_matrix, cv_img.size(), cv::INTER_LINEAR,
                   cv::BORDER_CONSTANT, cv::Scalar(0.0));

    Matrix2Df result(img.rows(), img.cols());
    std::memcpy(result.data(), shifted.ptr<float>(), img.size() * sizeof(float));
    return result;
}

Matrix2Df crop_symmetric(const Matrix2Df& img, int margin_rows, int margin_cols) {
    if (margin_rows < 0 || margin_cols < 0) {
        throw ConfigError("crop margin must be >= 0");
    }
    const int out_h = static_cast<int>(img.rows()) - 2 * margin_rows;
    const int out_w = static_cast<int>(img.cols()) - 2 * margin_cols;
    if (out_h <= 0 || out_w <= 0) {
        throw DimensionError("crop margin (" + std::to_string(margin_rows) + ", " +
                             std::to_string(margin_cols) + ") leaves nothing of a " +
                             core::shape_string(img) + " frame");
    }
    return img.block(margin_rows, margin_cols, out_h, out_w);
}

bool window_fits(const SearchWindow& w, int rows, int cols) {
    return w.width > 0 && w.height > 0 && w.x >= 0 && w.y >= 0 &&
           w.x + w.width <= cols && w.y + w.height <= rows;
}

Matrix2Df extract_window(const Matrix2Df& img, const SearchWindow& w) {
    if (!window_fits(w, static_cast<int>(img.rows()), static_cast<int>(img.cols()))) {
        throw DimensionError("search window [" + std::to_string(w.x) + ", " +
                             std::to_string(w.y) + ", " + std::to_string(w.width) + ", " +
                             std::to_string(w.height) + "] outside " +
                             core::shape_string(img) + " frame");
    }
    return img.block(w.y, w.x, w.height, w.width);
}

} // namespace lucky_stack::image
