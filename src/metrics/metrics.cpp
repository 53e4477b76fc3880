#include "lucky_stack/metrics/metrics.hpp"
#include "lucky_stack/core/errors.hpp"

#include <cmath>
#include <string>

namespace lucky_stack::metrics {

float strehl_ratio(const Matrix2Df& psf, const Matrix2Df& psf_dl) {
    if (psf.size() == 0 || psf_dl.size() == 0) {
        throw DegenerateInputError("Strehl ratio of an empty image");
    }
    const float peak_dl = psf_dl.maxCoeff();
    if (peak_dl == 0.0f || !std::isfinite(peak_dl)) {
        throw NumericError("diffraction-limited peak is " + std::to_string(peak_dl));
    }
    return psf.maxCoeff() / peak_dl;
}

} // namespace lucky_stack::metrics
