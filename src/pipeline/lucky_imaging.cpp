#include "lucky_stack/pipeline/lucky_imaging.hpp"
#include "lucky_stack/core/errors.hpp"
#include "lucky_stack/core/utils.hpp"
#include "lucky_stack/registration/registration.hpp"
#include "lucky_stack/selection/frame_selection.hpp"
#include "lucky_stack/stacking/stacking.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <numeric>

namespace lucky_stack::pipeline {

namespace {

bool is_known_method(AlignmentMethod m) {
    switch (m) {
        case AlignmentMethod::PEAK_PIXEL:
        case AlignmentMethod::CENTROID:
        case AlignmentMethod::CROSS_CORRELATION:
            return true;
    }
    return false;
}

void validate_options(const LuckyImagingOptions& options) {
    const RegistrationParams& p = options.registration;
    if (!is_known_method(p.method)) {
        throw ConfigError("unsupported alignment method " +
                          std::to_string(static_cast<int>(p.method)));
    }
    if (options.mode != ExecutionMode::PARALLEL && options.mode != ExecutionMode::SERIAL) {
        throw ConfigError("unsupported execution mode " +
                          std::to_string(static_cast<int>(options.mode)));
    }
    // Range check only; the count itself is taken after registration.
    selection::selected_count(options.selection_fraction, 1);
    if (p.border_margin < 0) {
        throw ConfigError("border_margin must be >= 0");
    }
    if (p.search_window && (p.search_window->width <= 0 || p.search_window->height <= 0)) {
        throw ConfigError("search window must have positive width and height");
    }
    if (options.max_frames < 0) {
        throw ConfigError("max_frames must be >= 0");
    }
}

} // namespace

LuckyImagingResult lucky_imaging(const std::vector<Matrix2Df>& frames,
                                 const std::optional<Matrix2Df>& reference,
                                 const LuckyImagingOptions& options,
                                 const ProgressFn& progress) {
    validate_options(options);

    if (frames.empty()) {
        throw DegenerateInputError("no frames to shift and stack");
    }
    if (!reference && frames.size() < 2) {
        throw DegenerateInputError("cannot shift and stack a single frame without a reference");
    }

    // Reference resolution: explicit, or frames[0] excluded from the candidates.
    const size_t first = reference ? 0 : 1;
    const Matrix2Df& ref = reference ? *reference : frames.front();
    const size_t available = frames.size() - first;

    size_t n = available;
    if (options.max_frames > 0) {
        if (static_cast<size_t>(options.max_frames) > available) {
            throw DimensionError("requested " + std::to_string(options.max_frames) +
                                 " frames but only " + std::to_string(available) +
                                 " candidates are available");
        }
        n = static_cast<size_t>(options.max_frames);
    }

    if (ref.size() == 0) {
        throw DegenerateInputError("reference frame is empty");
    }
    for (size_t i = first; i < first + n; ++i) {
        if (!core::same_shape(frames[i], ref)) {
            throw DimensionError("frame " + std::to_string(i) + " is " +
                                 core::shape_string(frames[i]) + ", reference is " +
                                 core::shape_string(ref));
        }
    }
    registration::validate_params(options.registration, static_cast<int>(ref.rows()),
                                  static_cast<int>(ref.cols()));

    std::cerr << "[LUCKY] Applying '"
              << alignment_method_to_string(options.registration.method) << "' to "
              << n << " frames (" << execution_mode_to_string(options.mode) << ")"
              << std::endl;

    const auto t0 = std::chrono::steady_clock::now();
    RegistrationBatch batch = register_frames(frames, first, n, ref, options.registration,
                                              options.mode, options.workers, progress);
    const auto t1 = std::chrono::steady_clock::now();

    LuckyImagingResult result;
    result.elapsed_seconds = std::chrono::duration<double>(t1 - t0).count();
    std::cerr << "[LUCKY] Elapsed time for " << n << " frames in "
              << execution_mode_to_string(options.mode) << " mode: " << std::fixed
              << std::setprecision(5) << result.elapsed_seconds << " s"
              << std::defaultfloat << std::endl;

    if (options.selection_fraction < 1.0) {
        if (options.registration.method == AlignmentMethod::PEAK_PIXEL) {
            result.selected = selection::select_top_fraction(batch.peak_values,
                                                             options.selection_fraction);
        } else {
            std::cerr << "[SELECT] WARNING: selection fraction "
                      << options.selection_fraction << " ignored for method '"
                      << alignment_method_to_string(options.registration.method) << "'"
                      << std::endl;
        }
    }
    if (result.selected.empty()) {
        result.selected.resize(n);
        std::iota(result.selected.begin(), result.selected.end(), 0);
    }

    result.stacked = stacking::stack_frames(ref, batch.shifted_frames, result.selected);
    result.shifts = std::move(batch.shifts);
    result.peak_values = std::move(batch.peak_values);
    return result;
}

} // namespace lucky_stack::pipeline
