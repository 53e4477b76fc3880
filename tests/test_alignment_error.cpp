#include "lucky_stack/analysis/alignment_error.hpp"
#include "lucky_stack/core/errors.hpp"

#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace lucky_stack;

TEST_CASE("alignment_error_of_identical_shifts_is_zero") {
    std::vector<ShiftVector> s{{1.0f, 2.0f}, {-0.5f, 0.25f}, {0.0f, 0.0f}};

    auto report = analysis::alignment_error(s, s);
    REQUIRE(report.n_misaligned == 0);
    REQUIRE(report.errors.size() == 3);
    for (float e : report.errors) {
        REQUIRE(e == 0.0f);
    }
    REQUIRE(report.mean_error == 0.0f);
}

TEST_CASE("alignment_error_counts_frames_above_threshold") {
    std::vector<ShiftVector> injected{{0.0f, 0.0f}, {1.0f, 1.0f}, {2.0f, -2.0f}};
    std::vector<ShiftVector> recovered{{3.0f, 4.0f}, {1.05f, 1.0f}, {2.0f, -2.2f}};

    auto report = analysis::alignment_error(injected, recovered);
    REQUIRE(report.errors[0] == Catch::Approx(5.0f));
    REQUIRE(report.errors[1] == Catch::Approx(0.05f).margin(1e-5));
    REQUIRE(report.errors[2] == Catch::Approx(0.2f).margin(1e-5));
    REQUIRE(report.n_misaligned == 2);
    REQUIRE(report.mean_error == Catch::Approx(5.25f / 3.0f).margin(1e-5));
}

TEST_CASE("alignment_error_rejects_mismatched_or_empty_input") {
    std::vector<ShiftVector> two{{0.0f, 0.0f}, {1.0f, 1.0f}};
    std::vector<ShiftVector> one{{0.0f, 0.0f}};

    REQUIRE_THROWS_AS(analysis::alignment_error(two, one), DimensionError);
    REQUIRE_THROWS_AS(analysis::alignment_error({}, {}), DegenerateInputError);
}

TEST_CASE("format_alignment_table_lists_every_frame_and_the_mean") {
    std::vector<ShiftVector> injected{{1.0f, 2.0f}, {-3.0f, 0.5f}};
    std::vector<ShiftVector> recovered{{1.0f, 2.0f}, {-3.0f, 1.5f}};
    auto report = analysis::alignment_error(injected, recovered);

    const std::string table = analysis::format_alignment_table(injected, recovered, report);
    REQUIRE(table.find("(  1.00,  2.00)") != std::string::npos);
    REQUIRE(table.find("1.50)") != std::string::npos);
    REQUIRE(table.find("Mean\t0.50") != std::string::npos);
    REQUIRE(table.find("1/2") != std::string::npos);
}
