#include "runner_commands.hpp"

#include "lucky_stack/analysis/alignment_error.hpp"
#include "lucky_stack/config/configuration.hpp"
#include "lucky_stack/core/errors.hpp"
#include "lucky_stack/core/events.hpp"
#include "lucky_stack/core/utils.hpp"
#include "lucky_stack/image/processing.hpp"
#include "lucky_stack/io/fits_io.hpp"
#include "lucky_stack/metrics/metrics.hpp"
#include "lucky_stack/pipeline/lucky_imaging.hpp"
#include "lucky_stack/synthetic/tiptilt.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace lucky_stack;
using core::json;

json shifts_to_json(const std::vector<ShiftVector> &shifts) {
  json arr = json::array();
  for (const auto &s : shifts) {
    arr.push_back({s.dy, s.dx});
  }
  return {{"shifts", arr}};
}

std::vector<ShiftVector> shifts_from_json(const fs::path &path) {
  json doc;
  try {
    doc = json::parse(core::read_text(path));
  } catch (const json::exception &e) {
    throw IOError("invalid shifts file " + path.string() + ": " + e.what());
  }
  if (!doc.contains("shifts") || !doc["shifts"].is_array()) {
    throw IOError("shifts file without a 'shifts' array: " + path.string());
  }
  std::vector<ShiftVector> out;
  for (const auto &item : doc["shifts"]) {
    if (!item.is_array() || item.size() != 2) {
      throw IOError("shift entries must be [dy, dx] pairs: " + path.string());
    }
    out.push_back({item[0].get<float>(), item[1].get<float>()});
  }
  return out;
}

config::Config load_config(const std::string &config_path) {
  fs::path cfg_path(config_path);
  if (!fs::exists(cfg_path)) {
    throw ConfigError("config file not found: " + config_path);
  }
  config::Config cfg = config::Config::load(cfg_path);
  cfg.validate();
  return cfg;
}

// Ground truth aligned to the registered candidates. With an implicit
// reference the recovered shifts are relative to frame 0.
std::vector<ShiftVector> expected_shifts(const std::vector<ShiftVector> &truth,
                                         size_t n_recovered, bool implicit_reference) {
  std::vector<ShiftVector> out;
  if (implicit_reference) {
    if (truth.size() < n_recovered + 1) {
      throw DimensionError("truth shifts cover " + std::to_string(truth.size()) +
                           " frames, need " + std::to_string(n_recovered + 1));
    }
    for (size_t i = 0; i < n_recovered; ++i) {
      out.push_back({truth[i + 1].dy - truth[0].dy, truth[i + 1].dx - truth[0].dx});
    }
  } else {
    if (truth.size() < n_recovered) {
      throw DimensionError("truth shifts cover " + std::to_string(truth.size()) +
                           " frames, need " + std::to_string(n_recovered));
    }
    out.assign(truth.begin(), truth.begin() + static_cast<long>(n_recovered));
  }
  return out;
}

int report_failure(core::EventEmitter &emitter, const std::string &run_id,
                   const char *what) {
  emitter.error(run_id, what);
  emitter.run_end(run_id, false, "error");
  std::cerr << "Error: " << what << std::endl;
  return 1;
}

} // namespace

namespace lucky_stack::runner {

int inject_command(const std::string &config_path, const std::string &truth_path,
                   const std::string &output_path, const std::string &shifts_out) {
  const std::string run_id = core::get_run_id();
  core::EventEmitter emitter(std::cout);

  try {
    config::Config cfg = load_config(config_path);
    emitter.run_start(run_id, {{"command", "inject"},
                               {"config_path", config_path},
                               {"truth", truth_path},
                               {"output", output_path}});

    emitter.phase_start(run_id, Phase::SCAN_INPUT);
    Matrix2Df truth;
    if (!truth_path.empty()) {
      truth = io::read_fits_float(truth_path).first;
    } else {
      const auto &syn = cfg.synthetic;
      truth = synthetic::render_gaussian_spot(
          syn.rows, syn.cols, static_cast<float>(syn.rows / 2),
          static_cast<float>(syn.cols / 2), syn.sigma_px, syn.amplitude);
    }
    emitter.phase_end(run_id, Phase::SCAN_INPUT, "ok",
                      {{"rows", truth.rows()},
                       {"cols", truth.cols()},
                       {"source", truth_path.empty() ? "synthetic" : "fits"}});

    emitter.phase_start(run_id, Phase::TIPTILT);
    synthetic::TipTiltResult injected =
        synthetic::add_tip_tilt(truth, cfg.tiptilt_options());

    io::FitsHeader hdr;
    hdr.set("NFRAMES", static_cast<int>(injected.frames.size()));
    hdr.set("SHIFTSRC", std::string(cfg.tiptilt.shifts ? "explicit" : "gaussian"));
    if (cfg.tiptilt.sigma_px) {
      hdr.set("TTSIGMA", static_cast<double>(*cfg.tiptilt.sigma_px));
    }
    io::write_fits_cube(output_path, injected.frames, hdr);
    core::write_text(shifts_out, shifts_to_json(injected.shifts).dump(2) + "\n");

    emitter.phase_end(run_id, Phase::TIPTILT, "ok",
                      {{"frames", injected.frames.size()},
                       {"output", output_path},
                       {"shifts_out", shifts_out}});
  } catch (const LuckyStackError &e) {
    return report_failure(emitter, run_id, e.what());
  } catch (const std::exception &e) {
    return report_failure(emitter, run_id, e.what());
  }

  emitter.run_end(run_id, true, "ok");
  return 0;
}

int run_command(const std::string &config_path, const std::string &input_path,
                const std::string &reference_path, const std::string &output_dir,
                const std::string &truth_shifts_path, const std::string &truth_image_path) {
  const std::string run_id = core::get_run_id();
  fs::path out_dir(output_dir);
  std::error_code ec;
  fs::create_directories(out_dir, ec);
  if (ec) {
    std::cerr << "Error: cannot create output directory " << output_dir << ": "
              << ec.message() << std::endl;
    return 1;
  }

  std::ofstream event_log(out_dir / "events.jsonl");
  core::EventEmitter emitter(std::cout, &event_log);

  try {
    config::Config cfg = load_config(config_path);
    pipeline::LuckyImagingOptions opts = cfg.lucky_imaging_options();

    emitter.run_start(run_id, {{"command", "run"},
                               {"config_path", config_path},
                               {"input", input_path},
                               {"reference", reference_path},
                               {"output_dir", output_dir},
                               {"method", cfg.registration.method},
                               {"mode", cfg.execution.mode}});

    // Phase 0: SCAN_INPUT
    emitter.phase_start(run_id, Phase::SCAN_INPUT);
    if (!io::is_fits_image_path(input_path)) {
      emitter.warning(run_id, "input '" + input_path + "' has no FITS extension");
    }
    std::vector<Matrix2Df> frames = io::read_fits_cube(input_path).first;
    std::optional<Matrix2Df> reference;
    if (!reference_path.empty()) {
      reference = io::read_fits_float(reference_path).first;
    }
    emitter.phase_end(run_id, Phase::SCAN_INPUT, "ok",
                      {{"frames", frames.size()},
                       {"rows", frames.empty() ? 0 : frames.front().rows()},
                       {"cols", frames.empty() ? 0 : frames.front().cols()},
                       {"explicit_reference", reference.has_value()}});

    // Phase 2: REGISTRATION (selection and stacking follow inside lucky_imaging)
    emitter.phase_start(run_id, Phase::REGISTRATION);
    auto progress = [&](size_t done, size_t total) {
      emitter.phase_progress(run_id, Phase::REGISTRATION, static_cast<int>(done),
                             static_cast<int>(total));
    };
    pipeline::LuckyImagingResult result =
        pipeline::lucky_imaging(frames, reference, opts, progress);
    emitter.phase_end(run_id, Phase::REGISTRATION, "ok",
                      {{"registered", result.shifts.size()},
                       {"elapsed_s", result.elapsed_seconds}});

    emitter.phase_start(run_id, Phase::FRAME_SELECTION);
    emitter.phase_end(run_id, Phase::FRAME_SELECTION, "ok",
                      {{"fraction", opts.selection_fraction},
                       {"selected", result.selected.size()},
                       {"candidates", result.shifts.size()}});

    // Phase 4: STACKING (outputs)
    emitter.phase_start(run_id, Phase::STACKING);
    io::FitsHeader out_hdr;
    out_hdr.set("NCOMB", result.stacked.n_frames_combined);
    out_hdr.set("NCAND", result.stacked.n_candidates_used);
    out_hdr.set("ALIGN", alignment_method_to_string(opts.registration.method));
    const fs::path stack_path = out_dir / cfg.output.stack_name;
    io::write_fits_float(stack_path, result.stacked.image, out_hdr);

    if (cfg.output.write_shifts) {
      json shifts_doc = shifts_to_json(result.shifts);
      shifts_doc["peak_values"] = result.peak_values;
      shifts_doc["selected"] = result.selected;
      core::write_text(out_dir / "shifts.json", shifts_doc.dump(2) + "\n");
    }
    if (cfg.output.write_shifted_frames && !result.shifts.empty()) {
      // Re-derive the shifted candidates from the recovered shifts.
      std::vector<Matrix2Df> shifted;
      const size_t offset = reference ? 0 : 1;
      for (size_t i = 0; i < result.shifts.size(); ++i) {
        shifted.push_back(image::shift_image(frames[i + offset], -result.shifts[i].dy,
                                             -result.shifts[i].dx));
      }
      io::write_fits_cube(out_dir / "shifted_frames.fits", shifted, io::FitsHeader());
    }
    emitter.phase_end(run_id, Phase::STACKING, "ok",
                      {{"stack", stack_path.string()},
                       {"frames_combined", result.stacked.n_frames_combined}});

    // Phase 5: ERROR_ANALYSIS
    if (!truth_shifts_path.empty() || !truth_image_path.empty()) {
      emitter.phase_start(run_id, Phase::ERROR_ANALYSIS);
      json extra = json::object();
      if (!truth_shifts_path.empty()) {
        std::vector<ShiftVector> truth = expected_shifts(
            shifts_from_json(truth_shifts_path), result.shifts.size(), !reference);
        AlignmentErrorReport report = analysis::alignment_error(truth, result.shifts);
        std::cerr << analysis::format_alignment_table(truth, result.shifts, report);

        json report_doc = {{"n_misaligned", report.n_misaligned},
                           {"mean_error", report.mean_error},
                           {"errors", report.errors},
                           {"threshold_px", kMisalignmentThresholdPx}};
        core::write_text(out_dir / "alignment_error.json", report_doc.dump(2) + "\n");
        extra["n_misaligned"] = report.n_misaligned;
        extra["mean_error"] = report.mean_error;
        if (report.n_misaligned > 0) {
          emitter.warning(run_id, std::to_string(report.n_misaligned) +
                                      " frame(s) misaligned by more than " +
                                      std::to_string(kMisalignmentThresholdPx) + " px");
        }
      }
      if (!truth_image_path.empty()) {
        Matrix2Df truth_img = io::read_fits_float(truth_image_path).first;
        const float strehl = metrics::strehl_ratio(result.stacked.image, truth_img);
        std::cerr << "[METRICS] Strehl ratio of stack: " << strehl << std::endl;
        extra["strehl"] = strehl;
      }
      emitter.phase_end(run_id, Phase::ERROR_ANALYSIS, "ok", extra);
    }

    emitter.phase_start(run_id, Phase::DONE);
    emitter.phase_end(run_id, Phase::DONE, "ok");
  } catch (const LuckyStackError &e) {
    return report_failure(emitter, run_id, e.what());
  } catch (const std::exception &e) {
    return report_failure(emitter, run_id, e.what());
  }

  emitter.run_end(run_id, true, "ok");
  return 0;
}

} // namespace lucky_stack::runner
