#include "lucky_stack/registration/registration.hpp"
#include "lucky_stack/core/errors.hpp"
#include "lucky_stack/image/processing.hpp"
#include "lucky_stack/registration/gaussian_fit.hpp"
#include "lucky_stack/synthetic/tiptilt.hpp"

#include <cmath>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace lucky_stack;

namespace {

constexpr int kSize = 64;

Matrix2Df spot(float row, float col, float amplitude = 100.0f) {
    return synthetic::render_gaussian_spot(kSize, kSize, row, col, 2.0f, amplitude);
}

RegistrationParams params_for(AlignmentMethod method) {
    RegistrationParams p;
    p.method = method;
    p.border_margin = 16;
    return p;
}

ShiftVector register_one(const Matrix2Df& frame, const Matrix2Df& ref,
                         const RegistrationParams& p) {
    auto anchor = registration::prepare_reference(ref, p);
    return registration::register_frame(frame, ref, anchor, p).shift;
}

float distance(const ShiftVector& a, const ShiftVector& b) {
    return std::hypot(a.dy - b.dy, a.dx - b.dx);
}

} // namespace

TEST_CASE("shift_image_moves_content_by_integer_offsets") {
    Matrix2Df img = Matrix2Df::Zero(8, 8);
    img(2, 3) = 5.0f;

    Matrix2Df out = image::shift_image(img, 1.0f, -2.0f);
    REQUIRE(out(3, 1) == Catch::Approx(5.0f));
    REQUIRE(out.sum() == Catch::Approx(5.0f));
}

TEST_CASE("extract_window_returns_block_and_rejects_out_of_frame") {
    Matrix2Df img(4, 5);
    for (int r = 0; r < 4; ++r)
        for (int c = 0; c < 5; ++c) img(r, c) = static_cast<float>(r * 10 + c);

    Matrix2Df w = image::extract_window(img, SearchWindow{1, 2, 3, 2});
    REQUIRE(w.rows() == 2);
    REQUIRE(w.cols() == 3);
    REQUIRE(w(0, 0) == 21.0f);
    REQUIRE(w(1, 2) == 33.0f);

    REQUIRE_THROWS_AS(image::extract_window(img, SearchWindow{3, 0, 3, 2}), DimensionError);
}

TEST_CASE("find_peak_resolves_ties_to_first_row_major_sample") {
    Matrix2Df img = Matrix2Df::Zero(5, 5);
    img(3, 1) = 7.0f;
    img(1, 4) = 7.0f;

    auto peak = registration::find_peak(img);
    REQUIRE(peak.row == 1);
    REQUIRE(peak.col == 4);
    REQUIRE(peak.value == 7.0f);

    auto windowed = registration::find_peak(img, SearchWindow{0, 2, 3, 3});
    REQUIRE(windowed.row == 3);
    REQUIRE(windowed.col == 1);
}

TEST_CASE("centroid_of_symmetric_pattern_is_its_center") {
    auto [r, c] = registration::centroid(spot(30.0f, 35.0f));
    REQUIRE(r == Catch::Approx(30.0).margin(1e-4));
    REQUIRE(c == Catch::Approx(35.0).margin(1e-4));
}

TEST_CASE("centroid_of_zero_frame_is_numeric_error") {
    REQUIRE_THROWS_AS(registration::centroid(Matrix2Df::Zero(8, 8)), NumericError);
}

TEST_CASE("peak_pixel_recovers_integer_shift") {
    const Matrix2Df ref = spot(32.0f, 32.0f);
    const Matrix2Df frame = spot(35.0f, 30.0f);

    ShiftVector s = register_one(frame, ref, params_for(AlignmentMethod::PEAK_PIXEL));
    REQUIRE(s.dy == Catch::Approx(3.0f));
    REQUIRE(s.dx == Catch::Approx(-2.0f));
}

TEST_CASE("peak_pixel_reports_peak_value_and_realigns_frame") {
    const Matrix2Df ref = spot(32.0f, 32.0f);
    const Matrix2Df frame = spot(30.0f, 36.0f, 80.0f);
    auto p = params_for(AlignmentMethod::PEAK_PIXEL);
    auto anchor = registration::prepare_reference(ref, p);

    FrameRegistration reg = registration::register_frame(frame, ref, anchor, p);
    REQUIRE(reg.peak_value == Catch::Approx(80.0f));
    auto peak = registration::find_peak(reg.shifted);
    REQUIRE(peak.row == 32);
    REQUIRE(peak.col == 32);
}

TEST_CASE("centroid_round_trips_injected_subpixel_shift") {
    const Matrix2Df ref = spot(32.0f, 32.0f);
    synthetic::TipTiltOptions opts;
    opts.shifts = std::vector<ShiftVector>{{1.25f, -2.5f}};
    auto injected = synthetic::add_tip_tilt(ref, opts);

    ShiftVector s =
        register_one(injected.frames[0], ref, params_for(AlignmentMethod::CENTROID));
    REQUIRE(s.dy == Catch::Approx(1.25f).margin(1e-3));
    REQUIRE(s.dx == Catch::Approx(-2.5f).margin(1e-3));
}

TEST_CASE("cross_correlation_peak_sits_at_center_minus_shift") {
    const Matrix2Df ref = spot(32.0f, 32.0f);
    const Matrix2Df frame = spot(34.0f, 29.0f);

    Matrix2Df corr = registration::cross_correlate(ref, frame);
    auto peak = registration::find_peak(corr);
    REQUIRE(peak.row == kSize / 2 - 2);
    REQUIRE(peak.col == kSize / 2 + 3);
}

TEST_CASE("cross_correlation_integer_mode_recovers_integer_shift") {
    const Matrix2Df ref = spot(32.0f, 32.0f);
    const Matrix2Df frame = spot(29.0f, 36.0f);
    auto p = params_for(AlignmentMethod::CROSS_CORRELATION);
    p.subpixel = false;

    ShiftVector s = register_one(frame, ref, p);
    REQUIRE(s.dy == -3.0f);
    REQUIRE(s.dx == 4.0f);
}

TEST_CASE("cross_correlation_subpixel_recovers_integer_shift_within_threshold") {
    const Matrix2Df ref = spot(32.0f, 32.0f);
    const Matrix2Df frame = spot(34.0f, 30.0f);

    ShiftVector s = register_one(frame, ref, params_for(AlignmentMethod::CROSS_CORRELATION));
    REQUIRE(distance(s, ShiftVector{2.0f, -2.0f}) < kMisalignmentThresholdPx);
}

TEST_CASE("cross_correlation_subpixel_beats_integer_argmax_for_fractional_shift") {
    const ShiftVector truth{0.3f, -0.4f};
    const Matrix2Df ref = spot(32.0f, 32.0f);
    const Matrix2Df frame = spot(32.0f + truth.dy, 32.0f + truth.dx);

    auto p = params_for(AlignmentMethod::CROSS_CORRELATION);
    p.subpixel = false;
    const ShiftVector integer = register_one(frame, ref, p);
    p.subpixel = true;
    const ShiftVector sub = register_one(frame, ref, p);

    REQUIRE(distance(sub, truth) <= distance(integer, truth));
    REQUIRE(distance(sub, truth) < 0.05f);
}

TEST_CASE("cross_correlation_of_zero_frame_is_numeric_error") {
    const Matrix2Df ref = spot(32.0f, 32.0f);
    auto p = params_for(AlignmentMethod::CROSS_CORRELATION);
    auto anchor = registration::prepare_reference(ref, p);

    REQUIRE_THROWS_AS(
        registration::register_frame(Matrix2Df::Zero(kSize, kSize), ref, anchor, p),
        NumericError);
}

TEST_CASE("register_frame_rejects_shape_mismatch") {
    const Matrix2Df ref = spot(32.0f, 32.0f);
    auto p = params_for(AlignmentMethod::PEAK_PIXEL);
    auto anchor = registration::prepare_reference(ref, p);

    REQUIRE_THROWS_AS(registration::register_frame(Matrix2Df::Ones(32, 64), ref, anchor, p),
                      DimensionError);
}

TEST_CASE("validate_params_checks_margin_and_window") {
    auto xc = params_for(AlignmentMethod::CROSS_CORRELATION);
    xc.border_margin = 31;
    REQUIRE_THROWS_AS(registration::validate_params(xc, kSize, kSize), ConfigError);
    xc.subpixel = false;
    REQUIRE_NOTHROW(registration::validate_params(xc, kSize, kSize));

    auto pk = params_for(AlignmentMethod::PEAK_PIXEL);
    pk.search_window = SearchWindow{50, 0, 20, 10};
    REQUIRE_THROWS_AS(registration::validate_params(pk, kSize, kSize), DimensionError);
    pk.search_window = SearchWindow{10, 10, 40, 40};
    REQUIRE_NOTHROW(registration::validate_params(pk, kSize, kSize));
}

TEST_CASE("fit_gaussian_2d_recovers_center_and_width") {
    Matrix2Df data = synthetic::render_gaussian_spot(21, 21, 10.4f, 9.7f, 2.5f, 3.0f);

    auto fit = registration::fit_gaussian_2d(data, -10.0, -10.0);
    REQUIRE(fit.model.y0 == Catch::Approx(0.4).margin(1e-3));
    REQUIRE(fit.model.x0 == Catch::Approx(-0.3).margin(1e-3));
    REQUIRE(fit.model.sigma_y == Catch::Approx(2.5).margin(1e-3));
    REQUIRE(fit.model.sigma_x == Catch::Approx(2.5).margin(1e-3));
    REQUIRE(fit.model.amplitude == Catch::Approx(3.0).margin(1e-3));
    REQUIRE(fit.rms < 1e-4);
}

TEST_CASE("fit_gaussian_2d_rejects_non_positive_surface") {
    REQUIRE_THROWS_AS(registration::fit_gaussian_2d(Matrix2Df::Zero(5, 5), 0.0, 0.0),
                      RegistrationError);
}

TEST_CASE("peak_pixel_search_window_ignores_brighter_source_outside_it") {
    const Matrix2Df distractor = spot(8.0f, 8.0f, 500.0f);
    const Matrix2Df ref = spot(32.0f, 32.0f) + distractor;
    const Matrix2Df frame = spot(34.0f, 30.0f, 90.0f) + distractor;

    auto p = params_for(AlignmentMethod::PEAK_PIXEL);
    p.search_window = SearchWindow{16, 16, 32, 32};
    auto anchor = registration::prepare_reference(ref, p);
    REQUIRE(anchor.peak_row == 32);
    REQUIRE(anchor.peak_col == 32);

    FrameRegistration reg = registration::register_frame(frame, ref, anchor, p);
    REQUIRE(reg.shift.dy == Catch::Approx(2.0f));
    REQUIRE(reg.shift.dx == Catch::Approx(-2.0f));
    REQUIRE(reg.peak_value == Catch::Approx(90.0f).margin(1e-3));

    p.search_window.reset();
    anchor = registration::prepare_reference(ref, p);
    reg = registration::register_frame(frame, ref, anchor, p);
    REQUIRE(reg.peak_value == Catch::Approx(500.0f).margin(1e-3));
    REQUIRE(reg.shift.dy == 0.0f);
    REQUIRE(reg.shift.dx == 0.0f);
}

TEST_CASE("correlation_peak_offset_recovers_fractional_shifts_across_sizes") {
    struct Geometry {
        int size;
        int margin;
    };
    for (Geometry g : {Geometry{64, 16}, Geometry{128, 25}}) {
        for (float sigma : {2.0f, 4.0f}) {
            const float c = static_cast<float>(g.size / 2);
            const Matrix2Df ref =
                synthetic::render_gaussian_spot(g.size, g.size, c, c, sigma, 100.0f);
            for (float dy : {-1.75f, 0.0f, 0.6f}) {
                for (float dx : {-0.3f, 1.5f}) {
                    const Matrix2Df frame = synthetic::render_gaussian_spot(
                        g.size, g.size, c + dy, c + dx, sigma, 100.0f);
                    Matrix2Df corr = registration::normalize_by_max(
                        registration::cross_correlate(ref, frame));
                    ShiftVector raw = registration::correlation_peak_offset(corr, true, g.margin);
                    REQUIRE(raw.dy == Catch::Approx(-dy).margin(0.01));
                    REQUIRE(raw.dx == Catch::Approx(-dx).margin(0.01));
                }
            }
        }
    }
}

TEST_CASE("fit_gaussian_2d_reports_exhausted_evaluation_budget") {
    Matrix2Df data = synthetic::render_gaussian_spot(21, 21, 10.4f, 9.7f, 2.5f, 3.0f);
    registration::GaussianFitOptions opts;
    opts.max_evaluations = 1;

    REQUIRE_THROWS_AS(registration::fit_gaussian_2d(data, -10.0, -10.0, opts),
                      RegistrationError);
}
