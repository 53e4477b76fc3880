#pragma once

#include "lucky_stack/core/types.hpp"
#include "lucky_stack/pipeline/lucky_imaging.hpp"
#include "lucky_stack/synthetic/tiptilt.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace lucky_stack::config {

namespace fs = std::filesystem;

struct DataConfig {
  int max_frames = 0; // 0 = every candidate frame
};

struct RegistrationConfig {
  std::string method = "xcorr"; // peak_pixel | centroid | xcorr
  bool subpixel = true;
  int border_margin = 25;
  // [x, y, width, height]; peak_pixel only
  std::optional<std::array<int, 4>> search_window;
};

struct SelectionConfig {
  double fraction = 1.0;
};

struct ExecutionConfig {
  std::string mode = "parallel"; // parallel | serial
  int workers = 0;               // 0 = hardware concurrency
};

struct TipTiltConfig {
  // Giving `shifts` without `sigma_px` clears the default sigma.
  std::optional<float> sigma_px = 1.0f;
  std::optional<std::vector<std::array<float, 2>>> shifts;
  int n_copies = 10;
  std::array<int, 2> crop_px{0, 0};
  uint64_t seed = 0;
};

struct SyntheticConfig {
  int rows = 128;
  int cols = 128;
  float sigma_px = 2.0f;
  float amplitude = 1000.0f;
};

struct OutputConfig {
  std::string stack_name = "stack.fits";
  bool write_shifted_frames = false;
  bool write_shifts = true;
};

struct Config {
  DataConfig data;
  RegistrationConfig registration;
  SelectionConfig selection;
  ExecutionConfig execution;
  TipTiltConfig tiptilt;
  SyntheticConfig synthetic;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Resolvers to library types; unknown names raise ConfigError.
  AlignmentMethod alignment_method() const;
  ExecutionMode execution_mode() const;
  pipeline::LuckyImagingOptions lucky_imaging_options() const;
  synthetic::TipTiltOptions tiptilt_options() const;
};

} // namespace lucky_stack::config
