#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lucky_stack {

namespace fs = std::filesystem;

// Matrix types
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;
using VectorXd = Eigen::VectorXd;

// Misalignment above this distance (px) counts as an alignment error
constexpr float kMisalignmentThresholdPx = 0.1f;

// Displacement of a frame relative to the reference, in (row, col) order
struct ShiftVector {
    float dy = 0.0f;
    float dx = 0.0f;
};

inline std::string normalize_name(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(norm.begin(), norm.end(), '-', '_');
    return norm;
}

// Alignment method
enum class AlignmentMethod {
    PEAK_PIXEL,
    CENTROID,
    CROSS_CORRELATION
};

inline std::string alignment_method_to_string(AlignmentMethod method) {
    switch (method) {
        case AlignmentMethod::PEAK_PIXEL: return "peak_pixel";
        case AlignmentMethod::CENTROID: return "centroid";
        case AlignmentMethod::CROSS_CORRELATION: return "xcorr";
        default: return "unknown";
    }
}

// Returns std::nullopt for names outside the closed set
inline std::optional<AlignmentMethod> string_to_alignment_method(const std::string& s) {
    const std::string norm = normalize_name(s);
    if (norm == "peak_pixel" || norm == "peakpixel") return AlignmentMethod::PEAK_PIXEL;
    if (norm == "centroid") return AlignmentMethod::CENTROID;
    if (norm == "xcorr" || norm == "cross_correlation") return AlignmentMethod::CROSS_CORRELATION;
    return std::nullopt;
}

// Execution mode
enum class ExecutionMode {
    PARALLEL,
    SERIAL
};

inline std::string execution_mode_to_string(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::PARALLEL: return "parallel";
        case ExecutionMode::SERIAL: return "serial";
        default: return "unknown";
    }
}

inline std::optional<ExecutionMode> string_to_execution_mode(const std::string& s) {
    const std::string norm = normalize_name(s);
    if (norm == "parallel") return ExecutionMode::PARALLEL;
    if (norm == "serial" || norm == "sequential") return ExecutionMode::SERIAL;
    return std::nullopt;
}

// Peak-pixel search sub-window ("bid area")
struct SearchWindow {
    int x;       // Top-left x coordinate
    int y;       // Top-left y coordinate
    int width;
    int height;
};

// Per-call registration parameters, shared read-only by all frame tasks
struct RegistrationParams {
    AlignmentMethod method = AlignmentMethod::CROSS_CORRELATION;
    std::optional<SearchWindow> search_window;  // PEAK_PIXEL only
    bool subpixel = true;                       // CROSS_CORRELATION only
    int border_margin = 25;                     // CROSS_CORRELATION + subpixel
};

// Quantities derived once from the reference frame
struct ReferenceAnchor {
    int peak_row = 0;
    int peak_col = 0;
    float peak_value = 0.0f;
    double centroid_row = 0.0;
    double centroid_col = 0.0;
};

// Single-frame registration result
struct FrameRegistration {
    Matrix2Df shifted;
    ShiftVector shift;
    float peak_value = 0.0f;  // PEAK_PIXEL: max inside the search region
};

// Mean-combined composite
struct StackedImage {
    Matrix2Df image;
    int n_candidates_used = 0;   // shifted frames summed
    int n_frames_combined = 0;   // candidates + reference
};

// Injected vs. recovered shift comparison
struct AlignmentErrorReport {
    int n_misaligned = 0;
    std::vector<float> errors;
    float mean_error = 0.0f;
};

// Pipeline phase enumeration
enum class Phase {
    SCAN_INPUT = 0,
    TIPTILT = 1,
    REGISTRATION = 2,
    FRAME_SELECTION = 3,
    STACKING = 4,
    ERROR_ANALYSIS = 5,
    DONE = 6
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCAN_INPUT: return "SCAN_INPUT";
        case Phase::TIPTILT: return "TIPTILT";
        case Phase::REGISTRATION: return "REGISTRATION";
        case Phase::FRAME_SELECTION: return "FRAME_SELECTION";
        case Phase::STACKING: return "STACKING";
        case Phase::ERROR_ANALYSIS: return "ERROR_ANALYSIS";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace lucky_stack
