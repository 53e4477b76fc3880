#pragma once

#include "lucky_stack/core/types.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace lucky_stack::pipeline {

// Called with (frames done, frames total); invocations are serialized.
using ProgressFn = std::function<void(size_t, size_t)>;

// Index-aligned registration output, one slot per candidate frame
struct RegistrationBatch {
    std::vector<Matrix2Df> shifted_frames;
    std::vector<ShiftVector> shifts;
    std::vector<float> peak_values;
};

// requested < 1 means "all hardware threads"; capped by the hardware and task counts.
int compute_worker_count(int requested, size_t task_count);

/**
 * Register every frame against the reference.
 *
 * SERIAL walks the frames in order. PARALLEL runs a pool of worker threads
 * pulling frame indices from a shared counter; each task reads the shared
 * reference and writes only its own result slot, and the call returns after
 * all workers have joined. The first task error stops the remaining workers
 * from taking new frames and is rethrown after the join.
 */
RegistrationBatch register_frames(const std::vector<Matrix2Df>& frames,
                                  const Matrix2Df& reference,
                                  const RegistrationParams& params,
                                  ExecutionMode mode,
                                  int workers = 0,
                                  const ProgressFn& progress = ProgressFn());

// Same, over frames[first, first + count) without copying them; result slot i
// holds frames[first + i]. Throws DimensionError if the range leaves `frames`.
RegistrationBatch register_frames(const std::vector<Matrix2Df>& frames,
                                  size_t first,
                                  size_t count,
                                  const Matrix2Df& reference,
                                  const RegistrationParams& params,
                                  ExecutionMode mode,
                                  int workers = 0,
                                  const ProgressFn& progress = ProgressFn());

} // namespace lucky_stack::pipeline
