#include "flat_tune/config/configuration.hpp"
#include "flat_tune/core/errors.hpp"

#include <fstream>

namespace flat_tune::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["acquisition"]) {
            auto a = node["acquisition"];
            if (a["image_dirs"] && a["image_dirs"].IsSequence()) {
                for (const auto& d : a["image_dirs"]) {
                    cfg.acquisition.image_dirs.push_back(d.as<std::string>());
                }
            }
            if (a["flat_files"]) cfg.acquisition.flat_files = a["flat_files"].as<std::string>();
        }

        if (node["voxel_size"]) {
            auto v = node["voxel_size"];
            if (v["xy"]) cfg.voxel_size.xy = v["xy"].as<double>();
            if (v["z"]) cfg.voxel_size.z = v["z"].as<double>();
        }

        if (node["tuning"]) {
            auto t = node["tuning"];
            if (t["dark_default"]) cfg.tuning.dark_default = t["dark_default"].as<int>();
            if (t["dark_max"]) cfg.tuning.dark_max = t["dark_max"].as<int>();
            if (t["offset_limit"]) cfg.tuning.offset_limit = t["offset_limit"].as<int>();
            if (t["max_z_choices"]) cfg.tuning.max_z_choices = t["max_z_choices"].as<int>();
        }

        if (node["preview"]) {
            auto p = node["preview"];
            if (p["percentile"]) cfg.preview.percentile = p["percentile"].as<float>();
            if (p["debounce_ms"]) cfg.preview.debounce_ms = p["debounce_ms"].as<int>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["output_dir"]) cfg.output.output_dir = o["output_dir"].as<std::string>();
            if (o["flats_subdir"]) cfg.output.flats_subdir = o["flats_subdir"].as<std::string>();
            if (o["script_name"]) cfg.output.script_name = o["script_name"].as<std::string>();
            if (o["destriped_suffix"]) {
                cfg.output.destriped_suffix = o["destriped_suffix"].as<std::string>();
            }
        }

        if (node["pystripe"]) {
            auto s = node["pystripe"];
            if (s["command"]) cfg.pystripe.command = s["command"].as<std::string>();
            if (s["args"]) cfg.pystripe.args = s["args"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    std::ofstream ofs(path);
    if (!ofs) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    ofs << to_yaml();
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    for (const auto& d : acquisition.image_dirs) {
        node["acquisition"]["image_dirs"].push_back(d);
    }
    node["acquisition"]["flat_files"] = acquisition.flat_files;

    node["voxel_size"]["xy"] = voxel_size.xy;
    node["voxel_size"]["z"] = voxel_size.z;

    node["tuning"]["dark_default"] = tuning.dark_default;
    node["tuning"]["dark_max"] = tuning.dark_max;
    node["tuning"]["offset_limit"] = tuning.offset_limit;
    node["tuning"]["max_z_choices"] = tuning.max_z_choices;

    node["preview"]["percentile"] = preview.percentile;
    node["preview"]["debounce_ms"] = preview.debounce_ms;

    node["output"]["output_dir"] = output.output_dir;
    node["output"]["flats_subdir"] = output.flats_subdir;
    node["output"]["script_name"] = output.script_name;
    node["output"]["destriped_suffix"] = output.destriped_suffix;

    node["pystripe"]["command"] = pystripe.command;
    node["pystripe"]["args"] = pystripe.args;

    return node;
}

void Config::validate() const {
    if (!(voxel_size.xy > 0.0) || !(voxel_size.z > 0.0)) {
        throw ValidationError("voxel_size.xy and voxel_size.z must be > 0");
    }

    if (tuning.dark_max < 0) {
        throw ValidationError("tuning.dark_max must be >= 0");
    }
    if (tuning.dark_default < 0 || tuning.dark_default > tuning.dark_max) {
        throw ValidationError("tuning.dark_default must be in [0, tuning.dark_max]");
    }
    if (tuning.offset_limit < 0) {
        throw ValidationError("tuning.offset_limit must be >= 0");
    }
    if (tuning.max_z_choices < 1) {
        throw ValidationError("tuning.max_z_choices must be >= 1");
    }

    if (preview.percentile <= 0.0f || preview.percentile > 100.0f) {
        throw ValidationError("preview.percentile must be in (0,100]");
    }
    if (preview.debounce_ms < 0) {
        throw ValidationError("preview.debounce_ms must be >= 0");
    }

    if (output.flats_subdir.empty()) {
        throw ValidationError("output.flats_subdir must not be empty");
    }
    if (output.script_name.empty() ||
        output.script_name.find('/') != std::string::npos) {
        throw ValidationError("output.script_name must be a plain file name");
    }

    if (pystripe.command.empty()) {
        throw ValidationError("pystripe.command must not be empty");
    }
    if (acquisition.flat_files.empty()) {
        throw ValidationError("acquisition.flat_files must not be empty");
    }
}

fs::path Config::resolved_output_dir() const {
    if (!output.output_dir.empty()) {
        return fs::path(output.output_dir);
    }
    if (acquisition.image_dirs.empty()) {
        throw ConfigError("output.output_dir is unset and no image directory is configured");
    }
    // Trailing separators would make the parent the directory itself.
    fs::path first = fs::path(acquisition.image_dirs.front()).lexically_normal();
    if (!first.has_filename()) {
        first = first.parent_path();
    }
    return first.parent_path();
}

} // namespace flat_tune::config
