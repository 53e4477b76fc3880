#pragma once

#include "lucky_stack/core/types.hpp"
#include "lucky_stack/pipeline/execution.hpp"

#include <optional>
#include <vector>

namespace lucky_stack::pipeline {

struct LuckyImagingOptions {
    RegistrationParams registration;
    double selection_fraction = 1.0;   // < 1 only acts on PEAK_PIXEL
    ExecutionMode mode = ExecutionMode::PARALLEL;
    int workers = 0;
    int max_frames = 0;                // 0 = every candidate frame
};

struct LuckyImagingResult {
    StackedImage stacked;
    std::vector<ShiftVector> shifts;   // one per registered candidate, input order
    std::vector<float> peak_values;
    std::vector<int> selected;         // candidates that went into the stack
    double elapsed_seconds = 0.0;
};

/**
 * Shift-and-stack a frame sequence.
 *
 * Without an explicit reference, frames[0] is the reference and frames[1..]
 * are the candidates. All input checks run before any frame is registered.
 */
LuckyImagingResult lucky_imaging(const std::vector<Matrix2Df>& frames,
                                 const std::optional<Matrix2Df>& reference,
                                 const LuckyImagingOptions& options,
                                 const ProgressFn& progress = ProgressFn());

} // namespace lucky_stack::pipeline
