#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace flat_tune::config {

namespace fs = std::filesystem;

struct AcquisitionConfig {
  std::vector<std::string> image_dirs;
  std::string flat_files =
      "/mnt/cephfs/SmartSPIM_CEPH/IlluC_asset/pystripe_flats/*.tif";
};

struct VoxelSizeConfig {
  double xy = 1.8;
  double z = 2.0;
};

struct TuningConfig {
  int dark_default = 100;
  int dark_max = 250;
  int offset_limit = 200;
  int max_z_choices = 20;
};

struct PreviewConfig {
  float percentile = 99.0f;
  int debounce_ms = 150;
};

struct OutputConfig {
  std::string output_dir;  // empty = parent of the first image dir
  std::string flats_subdir = "flats";
  std::string script_name = "run_pystripe.sh";
  std::string destriped_suffix = "_destriped";
};

struct PystripeConfig {
  std::string command = "pystripe";
  std::string args = "--sigma1 256 --sigma2 256 --wavelet db5 --crossover 10";
};

struct Config {
  AcquisitionConfig acquisition;
  VoxelSizeConfig voxel_size;
  TuningConfig tuning;
  PreviewConfig preview;
  OutputConfig output;
  PystripeConfig pystripe;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Output directory with the default applied.
  fs::path resolved_output_dir() const;
};

} // namespace flat_tune::config
