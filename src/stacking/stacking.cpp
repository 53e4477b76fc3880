#include "lucky_stack/stacking/stacking.hpp"
#include "lucky_stack/core/errors.hpp"
#include "lucky_stack/core/utils.hpp"

#include <iostream>
#include <numeric>

namespace lucky_stack::stacking {

StackedImage stack_frames(const Matrix2Df& reference, const std::vector<Matrix2Df>& aligned,
                          const std::vector<int>& indices) {
    Matrix2Df sum = reference;
    for (int idx : indices) {
        if (idx < 0 || idx >= static_cast<int>(aligned.size())) {
            throw DimensionError("stack index " + std::to_string(idx) + " outside " +
                                 std::to_string(aligned.size()) + " aligned frames");
        }
        const Matrix2Df& frame = aligned[static_cast<size_t>(idx)];
        if (!core::same_shape(frame, reference)) {
            throw DimensionError("aligned frame " + std::to_string(idx) + " is " +
                                 core::shape_string(frame) + ", reference is " +
                                 core::shape_string(reference));
        }
        sum += frame;
    }

    StackedImage out;
    out.n_candidates_used = static_cast<int>(indices.size());
    out.n_frames_combined = out.n_candidates_used + 1;
    out.image = sum / static_cast<float>(out.n_frames_combined);

    std::cerr << "[STACK] combined " << out.n_frames_combined << " frames ("
              << out.n_candidates_used << " + reference) into "
              << core::shape_string(out.image) << std::endl;
    return out;
}

StackedImage stack_frames(const Matrix2Df& reference, const std::vector<Matrix2Df>& aligned) {
    std::vector<int> all(aligned.size());
    std::iota(all.begin(), all.end(), 0);
    return stack_frames(reference, aligned, all);
}

} // namespace lucky_stack::stacking
