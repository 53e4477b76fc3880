#pragma once

#include <string>

namespace lucky_stack::runner {

// Displace a truth image (or the synthetic point source from the config) and
// write the frame cube plus the injected shifts. Returns the process exit code.
int inject_command(const std::string &config_path, const std::string &truth_path,
                   const std::string &output_path, const std::string &shifts_out);

// Register, select and stack a frame cube into `output_dir`. Events go to
// stdout and `output_dir/events.jsonl`; any failure is reported as an `error`
// event followed by `run_end` and exit code 1.
int run_command(const std::string &config_path, const std::string &input_path,
                const std::string &reference_path, const std::string &output_dir,
                const std::string &truth_shifts_path, const std::string &truth_image_path);

} // namespace lucky_stack::runner
