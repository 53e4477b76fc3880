#include "lucky_stack/selection/frame_selection.hpp"
#include "lucky_stack/core/errors.hpp"

#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace lucky_stack;

TEST_CASE("selected_count_is_ceiling_of_fraction_times_n") {
    REQUIRE(selection::selected_count(1.0, 7) == 7);
    REQUIRE(selection::selected_count(0.3, 10) == 3);
    REQUIRE(selection::selected_count(0.25, 10) == 3);
    REQUIRE(selection::selected_count(0.5, 5) == 3);
    REQUIRE(selection::selected_count(0.01, 5) == 1);
    REQUIRE(selection::selected_count(0.5, 0) == 0);
}

TEST_CASE("selected_count_rejects_fraction_outside_unit_interval") {
    REQUIRE_THROWS_AS(selection::selected_count(0.0, 10), ConfigError);
    REQUIRE_THROWS_AS(selection::selected_count(-0.2, 10), ConfigError);
    REQUIRE_THROWS_AS(selection::selected_count(1.5, 10), ConfigError);
}

TEST_CASE("select_top_fraction_keeps_highest_peaks_first") {
    std::vector<float> peaks{5.0f, 9.0f, 1.0f, 7.0f, 3.0f};

    auto idx = selection::select_top_fraction(peaks, 0.6);
    REQUIRE(idx == std::vector<int>{1, 3, 0});

    auto all = selection::select_top_fraction(peaks, 1.0);
    REQUIRE(all == std::vector<int>{1, 3, 0, 4, 2});
}

TEST_CASE("select_top_fraction_equal_peaks_prefer_lower_index") {
    std::vector<float> peaks{4.0f, 8.0f, 4.0f, 8.0f, 4.0f};

    auto idx = selection::select_top_fraction(peaks, 0.6);
    REQUIRE(idx == std::vector<int>{1, 3, 0});
}
