#include "lucky_stack/selection/frame_selection.hpp"
#include "lucky_stack/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <string>

namespace lucky_stack::selection {

namespace {
// Absorbs representation error in fraction * n (e.g. 0.3 * 10) before ceil.
constexpr double kCountEpsilon = 1.0e-9;
}

int selected_count(double fraction, int n) {
    if (!(fraction > 0.0) || fraction > 1.0) {
        throw ConfigError("selection fraction must be in (0, 1], got " +
                          std::to_string(fraction));
    }
    if (n <= 0) {
        return 0;
    }
    int count = static_cast<int>(std::ceil(fraction * static_cast<double>(n) - kCountEpsilon));
    return std::clamp(count, 1, n);
}

std::vector<int> select_top_fraction(const std::vector<float>& peak_values, double fraction) {
    const int n = static_cast<int>(peak_values.size());
    const int keep = selected_count(fraction, n);

    std::vector<int> order(static_cast<size_t>(n));
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
        return peak_values[static_cast<size_t>(a)] > peak_values[static_cast<size_t>(b)];
    });
    order.resize(static_cast<size_t>(keep));

    std::cerr << "[SELECT] keeping " << keep << "/" << n << " frames (fraction="
              << fraction << ")";
    if (keep > 0) {
        std::cerr << " peak range " << peak_values[static_cast<size_t>(order.back())]
                  << ".." << peak_values[static_cast<size_t>(order.front())];
    }
    std::cerr << std::endl;
    return order;
}

} // namespace lucky_stack::selection
