#pragma once

#include "lucky_stack/core/types.hpp"

namespace lucky_stack::registration {

// Axis-aligned 2-D Gaussian:
//   f(y, x) = A * exp(-0.5 * ((x - x0)^2 / sx^2 + (y - y0)^2 / sy^2))
struct Gaussian2D {
    double amplitude = 1.0;
    double y0 = 0.0;
    double x0 = 0.0;
    double sigma_y = 1.0;
    double sigma_x = 1.0;
};

struct GaussianFitResult {
    Gaussian2D model;
    int iterations = 0;
    double rms = 0.0;
};

struct GaussianFitOptions {
    int max_evaluations = 400;   // residual evaluations before giving up
    double xtol = 1.0e-8;        // relative parameter change to stop at
    double ftol = 1.0e-8;        // relative cost reduction to stop at
};

/**
 * Levenberg-Marquardt least-squares fit of a Gaussian2D to `data`
 * (Eigen's MINPACK port, analytic Jacobian).
 * Sample (r, c) sits at coordinates y = r + origin_y, x = c + origin_x.
 * The initial guess is taken from the data maximum and its half-maximum area.
 * Throws RegistrationError if the solver gives up or the fit does not produce
 * finite, positive widths.
 */
GaussianFitResult fit_gaussian_2d(const Matrix2Df& data, double origin_y, double origin_x,
                                  const GaussianFitOptions& opts = GaussianFitOptions());

} // namespace lucky_stack::registration
