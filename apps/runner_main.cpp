// lucky_stack_runner: tip/tilt injection and shift-and-stack runs from a YAML config

#include "runner_commands.hpp"

#include <CLI/CLI.hpp>

#include <string>

int main(int argc, char *argv[]) {
  CLI::App app{"Lucky-imaging runner"};
  app.require_subcommand(1);

  std::string config_path, truth_path, output_path, shifts_out;
  auto inject_cmd = app.add_subcommand("inject", "Displace a truth image by known tip/tilt");
  inject_cmd->add_option("--config", config_path, "Path to config.yaml")->required();
  inject_cmd->add_option("--truth", truth_path,
                         "Truth image (FITS); a synthetic point source if omitted");
  inject_cmd->add_option("--output", output_path, "Output frame cube (FITS)")->required();
  inject_cmd->add_option("--shifts-out", shifts_out, "Injected shifts (JSON)")->required();

  std::string run_config, input_path, reference_path, output_dir;
  std::string truth_shifts, truth_image;
  auto run_cmd = app.add_subcommand("run", "Register, select and stack a frame cube");
  run_cmd->add_option("--config", run_config, "Path to config.yaml")->required();
  run_cmd->add_option("--input", input_path, "Input frame cube (FITS)")->required();
  run_cmd->add_option("--reference", reference_path,
                      "Reference frame (FITS); frame 0 of the input if omitted");
  run_cmd->add_option("--output-dir", output_dir, "Output directory")->required();
  run_cmd->add_option("--truth-shifts", truth_shifts,
                      "Injected shifts (JSON) for alignment error analysis");
  run_cmd->add_option("--truth-image", truth_image,
                      "Diffraction-limited image (FITS) for the Strehl ratio");

  CLI11_PARSE(app, argc, argv);

  if (inject_cmd->parsed()) {
    return lucky_stack::runner::inject_command(config_path, truth_path, output_path, shifts_out);
  }
  if (run_cmd->parsed()) {
    return lucky_stack::runner::run_command(run_config, input_path, reference_path, output_dir, truth_shifts,
                       truth_image);
  }
  return 1;
}
