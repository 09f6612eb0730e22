#pragma once

#include "stack_clip/clip/column_clip.hpp"

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace stack_clip::config {

namespace fs = std::filesystem;

struct InputConfig {
  std::string pattern = "*.fits;*.fit;*.fts";
  int max_frames = 0; // 0 = no limit
  bool use_variance = true;
  bool use_mask = true;
  std::string variance_extname = "VAR";
  std::string mask_extname = "DQ";
};

struct ClipConfig {
  double lsigma = 3.0;
  double hsigma = 3.0;
  int max_iters = 0; // 0 = 100
  bool mclip = true;
  bool sigclip = false;
  int reject_bit = 1;
  int capacity = 10000;
};

struct CombineConfig {
  std::string method = "mean"; // mean | median
};

struct OutputConfig {
  std::string combined_file = "stack.fits";
  bool write_masks = false;
  std::string mask_suffix = "_clipmask";
};

struct RuntimeConfig {
  int parallel_workers = 4;
  int batch_pixels = 4096;
};

struct Config {
  InputConfig input;
  ClipConfig clip;
  CombineConfig combine;
  OutputConfig output;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  clip::ClipParams clip_params() const;
  CombineMethod combine_method() const;
};

std::string get_schema_json();

} // namespace stack_clip::config
