#pragma once

#include <vector>

namespace lucky_stack::selection {

// Number of frames kept for a selection fraction in (0, 1]: ceil(fraction * n),
// clamped to [1, n]. Throws ConfigError for fractions outside (0, 1].
int selected_count(double fraction, int n);

// Indices of the top ceil(fraction * n) frames by peak value, highest first.
// Equal peak values keep the lower frame index first.
std::vector<int> select_top_fraction(const std::vector<float>& peak_values, double fraction);

} // namespace lucky_stack::selection
