#pragma once

#include "flat_tune/config/configuration.hpp"

#include <CLI/CLI.hpp>

#include <optional>
#include <string>
#include <vector>

namespace flat_tune::config {

// Flags shared by the GUI and the command line tool. Unset values keep the
// config file (or built-in) defaults.
struct CommandLineOptions {
  std::string config_path;
  std::vector<std::string> image_dirs;
  std::optional<std::string> flat_files;
  std::optional<double> xy_voxel_size;
  std::optional<double> z_voxel_size;
  std::optional<std::string> output_dir;
  std::optional<std::string> pystripe_args;
};

void add_common_options(CLI::App &app, CommandLineOptions &opts);

// Loads --config if given, applies the flags and validates the result.
Config build_config(const CommandLineOptions &opts);

} // namespace flat_tune::config
