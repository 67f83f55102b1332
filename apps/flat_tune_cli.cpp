#include "flat_tune/config/command_line.hpp"
#include "flat_tune/config/configuration.hpp"
#include "flat_tune/core/errors.hpp"
#include "flat_tune/core/events.hpp"
#include "flat_tune/image/preview.hpp"
#include "flat_tune/io/image_io.hpp"
#include "flat_tune/output/correction_writer.hpp"
#include "flat_tune/session/session_state.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace flat_tune;

namespace {

json catalog_summary(const catalog::TileCatalog& cat, int max_z_choices) {
    json stacks = json::array();
    for (const auto& [key, entry] : cat.stacks()) {
        stacks.push_back({
            {"grid", entry.grid_dir_name},
            {"x_um", key.x_um},
            {"y_um", key.y_um},
            {"stack_dir", entry.stack_dir.string()},
            {"planes", entry.planes.size()}
        });
    }

    json out;
    out["root"] = cat.root().string();
    out["format"] = image_format_to_string(cat.format());
    out["tiles"] = cat.size();
    out["files"] = cat.file_count();
    out["planes"] = cat.plane_count();
    out["plane_names"] = cat.plane_names();
    out["preview_planes"] = cat.preview_plane_indices(max_z_choices);
    out["stacks"] = stacks;
    return out;
}

// Loads --state if given; otherwise the session keeps its defaults.
void apply_state_file(session::SessionState& session, const std::string& state_path) {
    if (!state_path.empty()) {
        session.load(state_path);
    }
}

// ============================================================================
// scan
// ============================================================================
int cmd_scan(const config::Config& cfg, core::EventEmitter& events) {
    json roots = json::array();
    for (const auto& dir : cfg.acquisition.image_dirs) {
        auto cat = catalog::TileCatalog::scan(dir, &events);
        roots.push_back(catalog_summary(cat, cfg.tuning.max_z_choices));
    }

    auto library = catalog::FlatFieldLibrary::load(cfg.acquisition.flat_files, &events);
    json flats = json::array();
    for (const auto& key : library.keys()) {
        flats.push_back(key);
    }

    json result;
    result["roots"] = roots;
    result["flats"] = flats;
    core::emit_event("scan_result", result, std::cout);
    return 0;
}

// ============================================================================
// preview
// ============================================================================
int cmd_preview(const config::Config& cfg, core::EventEmitter& events,
                std::optional<size_t> z, std::optional<int> dark,
                const std::string& state_path, const std::string& out_path,
                const std::string& png_path) {
    auto session = session::open_session(cfg, &events);
    apply_state_file(session, state_path);

    if (dark) {
        session.set_dark_level(*dark);
    }
    if (z) {
        session.select_plane(*z);
    } else if (!session.plane_index()) {
        auto indices = session.preview_catalog().preview_plane_indices(cfg.tuning.max_z_choices);
        if (indices.empty()) {
            throw ValidationError("No planes to preview under " +
                                  session.preview_catalog().root().string(),
                                  session.preview_catalog().root().string());
        }
        session.select_plane(indices.front());
    }

    image::Composite composite = session.compose();

    json result;
    result["plane"] = *session.plane_index();
    result["dark"] = session.dark_level();
    result["rows"] = composite.image.rows();
    result["cols"] = composite.image.cols();
    result["tiles"] = composite.tiles;
    result["grid_columns"] = composite.grid_lines.columns;
    result["grid_rows"] = composite.grid_lines.rows;

    if (!out_path.empty() && composite.image.size() > 0) {
        io::write_tiff_float(out_path, composite.image, true);
        result["composite"] = out_path;
    }
    if (!png_path.empty() && composite.image.size() > 0) {
        image::PreviewImage preview =
            image::render_preview(composite.image, cfg.preview.percentile);
        io::write_image_u8(png_path, preview.pixels, preview.rows, preview.cols);
        result["preview"] = png_path;
        result["display_high"] = preview.high;
    }

    core::emit_event("preview_result", result, std::cout);
    return 0;
}

// ============================================================================
// save
// ============================================================================
int cmd_save(const config::Config& cfg, core::EventEmitter& events,
             std::optional<int> dark, const std::string& state_path) {
    auto session = session::open_session(cfg, &events);
    apply_state_file(session, state_path);
    if (dark) {
        session.set_dark_level(*dark);
    }

    output::SaveReport report = output::save_session(session, &events);

    json flats = json::array();
    for (const auto& p : report.flats) flats.push_back(p.string());
    json scripts = json::array();
    for (const auto& p : report.scripts) scripts.push_back(p.string());

    json result;
    result["flats"] = flats;
    result["scripts"] = scripts;
    result["commands"] = report.commands;
    core::emit_event("save_result", result, std::cout);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"flat_tune: flat-field tuning for tiled light-sheet stacks"};
    app.require_subcommand(1);

    config::CommandLineOptions opts;
    config::add_common_options(app, opts);

    auto scan_cmd = app.add_subcommand("scan", "Print the tile catalog of every image directory");

    std::optional<size_t> z;
    std::optional<int> preview_dark;
    std::string preview_state, composite_out, preview_png;
    auto preview_cmd = app.add_subcommand("preview", "Build the composite for one Z plane");
    preview_cmd->add_option_function<size_t>(
        "--z", [&z](const size_t& v) { z = v; }, "Plane index");
    preview_cmd->add_option_function<int>(
        "--dark", [&preview_dark](const int& v) { preview_dark = v; }, "Dark level");
    preview_cmd->add_option("--state", preview_state, "Session state JSON to apply");
    preview_cmd->add_option("--out", composite_out, "Write the composite as float TIFF");
    preview_cmd->add_option("--png", preview_png, "Write the 8-bit display rendering");

    std::optional<int> save_dark;
    std::string save_state;
    auto save_cmd = app.add_subcommand("save", "Write correction flats and pystripe scripts");
    save_cmd->add_option_function<int>(
        "--dark", [&save_dark](const int& v) { save_dark = v; }, "Dark level");
    save_cmd->add_option("--state", save_state, "Session state JSON to apply");

    CLI11_PARSE(app, argc, argv);

    core::EventEmitter events(&std::cout);
    try {
        config::Config cfg = config::build_config(opts);

        if (scan_cmd->parsed()) {
            return cmd_scan(cfg, events);
        }
        if (preview_cmd->parsed()) {
            return cmd_preview(cfg, events, z, preview_dark, preview_state,
                               composite_out, preview_png);
        }
        if (save_cmd->parsed()) {
            return cmd_save(cfg, events, save_dark, save_state);
        }
    } catch (const FlatTuneError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        events.error(error_kind_to_string(e.kind()), e.subject(), e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        events.error("GENERIC", "", e.what());
        return 1;
    }

    std::cerr << app.help() << std::endl;
    return 1;
}
