#pragma once

#include "lucky_stack/core/types.hpp"

#include <string>
#include <vector>

namespace lucky_stack::analysis {

// Per-frame Euclidean distance between injected and recovered shifts, the
// number of frames above kMisalignmentThresholdPx and the mean distance.
AlignmentErrorReport alignment_error(const std::vector<ShiftVector>& injected,
                                     const std::vector<ShiftVector>& recovered);

// Input / output / error table with a trailing mean row.
std::string format_alignment_table(const std::vector<ShiftVector>& injected,
                                   const std::vector<ShiftVector>& recovered,
                                   const AlignmentErrorReport& report);

} // namespace lucky_stack::analysis
