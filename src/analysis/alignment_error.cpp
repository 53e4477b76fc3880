#include "lucky_stack/analysis/alignment_error.hpp"
#include "lucky_stack/core/errors.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace lucky_stack::analysis {

AlignmentErrorReport alignment_error(const std::vector<ShiftVector>& injected,
                                     const std::vector<ShiftVector>& recovered) {
    if (injected.size() != recovered.size()) {
        throw DimensionError("injected (" + std::to_string(injected.size()) +
                             ") and recovered (" + std::to_string(recovered.size()) +
                             ") shift arrays differ in length");
    }
    if (injected.empty()) {
        throw DegenerateInputError("no shifts to compare");
    }

    AlignmentErrorReport report;
    report.errors.reserve(injected.size());
    double total = 0.0;
    for (size_t k = 0; k < injected.size(); ++k) {
        const double ddy = static_cast<double>(injected[k].dy) - recovered[k].dy;
        const double ddx = static_cast<double>(injected[k].dx) - recovered[k].dx;
        const float err = static_cast<float>(std::sqrt(ddy * ddy + ddx * ddx));
        report.errors.push_back(err);
        if (err > kMisalignmentThresholdPx) {
            report.n_misaligned++;
        }
        total += err;
    }
    report.mean_error = static_cast<float>(total / static_cast<double>(injected.size()));
    return report;
}

std::string format_alignment_table(const std::vector<ShiftVector>& injected,
                                   const std::vector<ShiftVector>& recovered,
                                   const AlignmentErrorReport& report) {
    const std::string rule(48, '-');
    std::ostringstream oss;
    char line[96];

    oss << rule << "\n"
        << "Tip/tilt coordinates\nInput\t\tOutput\t\tError\n"
        << rule << "\n";
    for (size_t k = 0; k < report.errors.size() && k < injected.size() &&
                       k < recovered.size(); ++k) {
        std::snprintf(line, sizeof(line), "(%6.2f,%6.2f)\t(%6.2f,%6.2f)\t%4.2f\n",
                      injected[k].dy, injected[k].dx, recovered[k].dy, recovered[k].dx,
                      report.errors[k]);
        oss << line;
    }
    oss << rule << "\n";
    std::snprintf(line, sizeof(line), "\t\t\tMean\t%4.2f\n", report.mean_error);
    oss << line;
    std::snprintf(line, sizeof(line), "\t\t\t> %.2f px\t%d/%zu\n", kMisalignmentThresholdPx,
                  report.n_misaligned, report.errors.size());
    oss << line;
    return oss.str();
}

} // namespace lucky_stack::analysis
