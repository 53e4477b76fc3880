#include "lucky_stack/synthetic/tiptilt.hpp"
#include "lucky_stack/core/errors.hpp"
#include "lucky_stack/registration/registration.hpp"

#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace lucky_stack;

TEST_CASE("render_gaussian_spot_peaks_at_center_with_amplitude") {
    Matrix2Df spot = synthetic::render_gaussian_spot(33, 41, 16.0f, 20.0f, 2.0f, 50.0f);

    REQUIRE(spot.rows() == 33);
    REQUIRE(spot.cols() == 41);
    REQUIRE(spot(16, 20) == Catch::Approx(50.0f));
    REQUIRE(spot(16, 22) == Catch::Approx(spot(16, 18)));
    REQUIRE(spot(18, 20) == Catch::Approx(spot(14, 20)));
    REQUIRE(spot(16, 22) < spot(16, 21));
}

TEST_CASE("add_tip_tilt_applies_explicit_shifts") {
    Matrix2Df truth = synthetic::render_gaussian_spot(64, 64, 32.0f, 32.0f, 2.0f, 100.0f);

    synthetic::TipTiltOptions opts;
    opts.shifts = std::vector<ShiftVector>{{2.0f, -3.0f}, {-4.0f, 1.0f}};
    opts.n_copies = 2;

    auto res = synthetic::add_tip_tilt(truth, opts);
    REQUIRE(res.frames.size() == 2);
    REQUIRE(res.shifts.size() == 2);
    REQUIRE(res.shifts[0].dy == 2.0f);
    REQUIRE(res.shifts[0].dx == -3.0f);

    auto p0 = registration::find_peak(res.frames[0]);
    REQUIRE(p0.row == 34);
    REQUIRE(p0.col == 29);
    REQUIRE(p0.value == Catch::Approx(100.0f));

    auto p1 = registration::find_peak(res.frames[1]);
    REQUIRE(p1.row == 28);
    REQUIRE(p1.col == 33);
}

TEST_CASE("add_tip_tilt_gaussian_draws_are_reproducible_per_seed") {
    Matrix2Df truth = synthetic::render_gaussian_spot(32, 32, 16.0f, 16.0f, 2.0f);

    synthetic::TipTiltOptions opts;
    opts.sigma_px = 1.5f;
    opts.n_copies = 5;
    opts.seed = 42;

    auto a = synthetic::add_tip_tilt(truth, opts);
    auto b = synthetic::add_tip_tilt(truth, opts);
    REQUIRE(a.shifts.size() == 5);
    for (size_t i = 0; i < a.shifts.size(); ++i) {
        REQUIRE(a.shifts[i].dy == b.shifts[i].dy);
        REQUIRE(a.shifts[i].dx == b.shifts[i].dx);
    }

    opts.seed = 43;
    auto c = synthetic::add_tip_tilt(truth, opts);
    bool any_differs = false;
    for (size_t i = 0; i < a.shifts.size(); ++i) {
        if (a.shifts[i].dy != c.shifts[i].dy || a.shifts[i].dx != c.shifts[i].dx) {
            any_differs = true;
        }
    }
    REQUIRE(any_differs);
}

TEST_CASE("add_tip_tilt_zero_sigma_leaves_frames_unchanged") {
    Matrix2Df truth = synthetic::render_gaussian_spot(32, 32, 16.0f, 16.0f, 2.0f);

    synthetic::TipTiltOptions opts;
    opts.sigma_px = 0.0f;
    opts.n_copies = 3;

    auto res = synthetic::add_tip_tilt(truth, opts);
    REQUIRE(res.frames.size() == 3);
    for (const auto& f : res.frames) {
        REQUIRE((f - truth).cwiseAbs().maxCoeff() == Catch::Approx(0.0f).margin(1e-6));
    }
}

TEST_CASE("add_tip_tilt_sequence_input_gets_one_shift_per_frame") {
    std::vector<Matrix2Df> seq(4, synthetic::render_gaussian_spot(32, 32, 16.0f, 16.0f, 2.0f));

    synthetic::TipTiltOptions opts;
    opts.sigma_px = 1.0f;
    opts.n_copies = 10;  // ignored for sequences

    auto res = synthetic::add_tip_tilt(seq, opts);
    REQUIRE(res.frames.size() == 4);
    REQUIRE(res.shifts.size() == 4);
}

TEST_CASE("add_tip_tilt_crops_symmetric_margin") {
    Matrix2Df truth = synthetic::render_gaussian_spot(40, 50, 20.0f, 25.0f, 2.0f);

    synthetic::TipTiltOptions opts;
    opts.shifts = std::vector<ShiftVector>{{1.0f, 1.0f}};
    opts.crop_px = {5, 3};

    auto res = synthetic::add_tip_tilt(truth, opts);
    REQUIRE(res.frames[0].rows() == 30);
    REQUIRE(res.frames[0].cols() == 44);

    opts.crop_px = {20, 0};
    REQUIRE_THROWS_AS(synthetic::add_tip_tilt(truth, opts), DimensionError);
}

TEST_CASE("add_tip_tilt_rejects_invalid_options") {
    Matrix2Df truth = synthetic::render_gaussian_spot(16, 16, 8.0f, 8.0f, 2.0f);

    synthetic::TipTiltOptions none;
    REQUIRE_THROWS_AS(synthetic::add_tip_tilt(truth, none), ConfigError);

    synthetic::TipTiltOptions both;
    both.sigma_px = 1.0f;
    both.shifts = std::vector<ShiftVector>{{0.0f, 0.0f}};
    REQUIRE_THROWS_AS(synthetic::add_tip_tilt(truth, both), ConfigError);

    synthetic::TipTiltOptions negative;
    negative.sigma_px = -1.0f;
    REQUIRE_THROWS_AS(synthetic::add_tip_tilt(truth, negative), ConfigError);

    synthetic::TipTiltOptions no_copies;
    no_copies.sigma_px = 1.0f;
    no_copies.n_copies = 0;
    REQUIRE_THROWS_AS(synthetic::add_tip_tilt(truth, no_copies), ConfigError);

    synthetic::TipTiltOptions too_few;
    too_few.shifts = std::vector<ShiftVector>{{1.0f, 0.0f}};
    too_few.n_copies = 3;
    REQUIRE_THROWS_AS(synthetic::add_tip_tilt(truth, too_few), DimensionError);

    synthetic::TipTiltOptions ok;
    ok.sigma_px = 1.0f;
    REQUIRE_THROWS_AS(synthetic::add_tip_tilt(std::vector<Matrix2Df>{}, ok),
                      DegenerateInputError);
}
