#include "lucky_stack/registration/gaussian_fit.hpp"
#include "lucky_stack/core/errors.hpp"

#include <Eigen/Dense>
#include <unsupported/Eigen/NonLinearOptimization>
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>

namespace lucky_stack::registration {

namespace {

constexpr int kParams = 5;  // A, y0, x0, sy, sx
constexpr double kHalfMaxToSigma = 2.0 / 2.354820045;
constexpr double kPi = 3.14159265358979323846;

Gaussian2D to_model(const Eigen::VectorXd& p) {
    Gaussian2D g;
    g.amplitude = p(0);
    g.y0 = p(1);
    g.x0 = p(2);
    g.sigma_y = std::abs(p(3));
    g.sigma_x = std::abs(p(4));
    return g;
}

// Residuals model - data over every sample, row-major.
struct GaussianResidual {
    using Scalar = double;
    enum { InputsAtCompileTime = Eigen::Dynamic, ValuesAtCompileTime = Eigen::Dynamic };

    const Matrix2Df& data;
    double origin_y;
    double origin_x;

    int inputs() const { return kParams; }
    int values() const { return static_cast<int>(data.size()); }

    int operator()(const Eigen::VectorXd& p, Eigen::VectorXd& fvec) const {
        int k = 0;
        for (int r = 0; r < data.rows(); ++r) {
            const double v = (r + origin_y - p(1)) / p(3);
            for (int c = 0; c < data.cols(); ++c, ++k) {
                const double u = (c + origin_x - p(2)) / p(4);
                fvec(k) = p(0) * std::exp(-0.5 * (u * u + v * v)) -
                          static_cast<double>(data(r, c));
            }
        }
        return 0;
    }

    int df(const Eigen::VectorXd& p, Eigen::MatrixXd& fjac) const {
        int k = 0;
        for (int r = 0; r < data.rows(); ++r) {
            const double v = (r + origin_y - p(1)) / p(3);
            for (int c = 0; c < data.cols(); ++c, ++k) {
                const double u = (c + origin_x - p(2)) / p(4);
                const double g = std::exp(-0.5 * (u * u + v * v));
                const double model = p(0) * g;
                fjac(k, 0) = g;
                fjac(k, 1) = model * v / p(3);
                fjac(k, 2) = model * u / p(4);
                fjac(k, 3) = model * v * v / p(3);
                fjac(k, 4) = model * u * u / p(4);
            }
        }
        return 0;
    }
};

Eigen::VectorXd initial_guess(const Matrix2Df& data, double origin_y, double origin_x) {
    cv::Mat cv_data(static_cast<int>(data.rows()), static_cast<int>(data.cols()), CV_32F,
                    const_cast<float*>(data.data()));
    double best = 0.0;
    cv::Point best_loc;
    cv::minMaxLoc(cv_data, nullptr, &best, nullptr, &best_loc);

    const int n_half = cv::countNonZero(cv_data >= 0.5 * best);
    // Half-maximum area ~ pi * (FWHM/2)^2
    double sigma = kHalfMaxToSigma * std::sqrt(static_cast<double>(n_half) / kPi);
    sigma = std::max(0.5, sigma);

    Eigen::VectorXd p(kParams);
    p << best, best_loc.y + origin_y, best_loc.x + origin_x, sigma, sigma;
    return p;
}

bool solver_failed(Eigen::LevenbergMarquardtSpace::Status status) {
    switch (status) {
        case Eigen::LevenbergMarquardtSpace::ImproperInputParameters:
        case Eigen::LevenbergMarquardtSpace::TooManyFunctionEvaluation:
        case Eigen::LevenbergMarquardtSpace::UserAsked:
            return true;
        default:
            return false;
    }
}

} // namespace

GaussianFitResult fit_gaussian_2d(const Matrix2Df& data, double origin_y, double origin_x,
                                  const GaussianFitOptions& opts) {
    if (data.size() < kParams) {
        throw RegistrationError("Gaussian fit needs at least " + std::to_string(kParams) +
                                " samples, got " + std::to_string(data.size()));
    }

    Eigen::VectorXd p = initial_guess(data, origin_y, origin_x);
    if (!p.allFinite() || p(0) <= 0.0) {
        throw RegistrationError("Gaussian fit: surface has no positive maximum");
    }

    GaussianResidual residual{data, origin_y, origin_x};
    Eigen::LevenbergMarquardt<GaussianResidual> lm(residual);
    lm.parameters.maxfev = opts.max_evaluations;
    lm.parameters.xtol = opts.xtol;
    lm.parameters.ftol = opts.ftol;

    const Eigen::LevenbergMarquardtSpace::Status status = lm.minimize(p);
    if (solver_failed(status)) {
        throw RegistrationError("Gaussian fit did not converge (solver status " +
                                std::to_string(static_cast<int>(status)) + ")");
    }
    if (!p.allFinite() || p(3) == 0.0 || p(4) == 0.0) {
        throw RegistrationError("Gaussian fit did not converge to a finite peak");
    }

    GaussianFitResult result;
    result.model = to_model(p);
    result.iterations = static_cast<int>(lm.iter);
    result.rms = lm.fnorm / std::sqrt(static_cast<double>(data.size()));
    return result;
}

} // namespace lucky_stack::registration
