#pragma once

#include "lucky_stack/core/types.hpp"

#include <vector>

namespace lucky_stack::stacking {

// (reference + sum of aligned[i] for i in indices) / (indices.size() + 1)
StackedImage stack_frames(const Matrix2Df& reference, const std::vector<Matrix2Df>& aligned,
                          const std::vector<int>& indices);

// Mean of the reference and every aligned frame.
StackedImage stack_frames(const Matrix2Df& reference, const std::vector<Matrix2Df>& aligned);

} // namespace lucky_stack::stacking
