#include "flat_tune/config/command_line.hpp"
#include "flat_tune/core/errors.hpp"

namespace flat_tune::config {

void add_common_options(CLI::App& app, CommandLineOptions& opts) {
    app.add_option("--config", opts.config_path, "Path to a YAML config file");
    app.add_option_function<std::string>(
        "--flat-files",
        [&opts](const std::string& v) { opts.flat_files = v; },
        "Glob expression for the flat-field reference files");
    app.add_option_function<double>(
        "--xy-voxel-size",
        [&opts](const double& v) { opts.xy_voxel_size = v; },
        "Size of a voxel in the X and Y directions in microns (default 1.8)");
    app.add_option_function<double>(
        "--z-voxel-size",
        [&opts](const double& v) { opts.z_voxel_size = v; },
        "Size of a voxel in the Z direction in microns (default 2.0)");
    app.add_option_function<std::string>(
        "--output-dir",
        [&opts](const std::string& v) { opts.output_dir = v; },
        "Output directory for flats and destriped stacks "
        "(default: parent of the first image directory)");
    app.add_option_function<std::string>(
        "--pystripe-args",
        [&opts](const std::string& v) { opts.pystripe_args = v; },
        "Extra arguments passed to every pystripe command");
    app.add_option("image_dir", opts.image_dirs,
                   "Acquisition root directories (<X>/<X>_<Y>/<Z> layout)");
}

Config build_config(const CommandLineOptions& opts) {
    Config cfg;
    if (!opts.config_path.empty()) {
        cfg = Config::load(opts.config_path);
    }

    if (!opts.image_dirs.empty()) cfg.acquisition.image_dirs = opts.image_dirs;
    if (opts.flat_files) cfg.acquisition.flat_files = *opts.flat_files;
    if (opts.xy_voxel_size) cfg.voxel_size.xy = *opts.xy_voxel_size;
    if (opts.z_voxel_size) cfg.voxel_size.z = *opts.z_voxel_size;
    if (opts.output_dir) cfg.output.output_dir = *opts.output_dir;
    if (opts.pystripe_args) cfg.pystripe.args = *opts.pystripe_args;

    if (cfg.acquisition.image_dirs.empty()) {
        throw ConfigError("At least one image directory is required");
    }
    cfg.validate();
    return cfg;
}

} // namespace flat_tune::config
