#include "flat_tune/output/correction_writer.hpp"
#include "flat_tune/core/errors.hpp"
#include "flat_tune/image/divisor.hpp"
#include "flat_tune/io/image_io.hpp"
#include "flat_tune/session/session_state.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace flat_tune::output {

fs::path flat_path_for(const fs::path& output_dir, const config::OutputConfig& cfg,
                       const std::string& grid_dir_name) {
    return output_dir / cfg.flats_subdir / (grid_dir_name + ".tif");
}

fs::path destriped_path_for(const fs::path& output_dir, const config::OutputConfig& cfg,
                            const fs::path& root, const catalog::StackEntry& entry) {
    fs::path normalized = root.lexically_normal();
    if (!normalized.has_filename()) {
        normalized = normalized.parent_path();
    }
    return output_dir / (normalized.filename().string() + cfg.destriped_suffix) /
           entry.x_dir_name / entry.grid_dir_name;
}

std::vector<fs::path> write_corrections(const catalog::TileCatalog& catalog,
                                        const TileStateMap& tiles,
                                        const catalog::FlatFieldLibrary& library,
                                        const fs::path& output_dir,
                                        const config::OutputConfig& cfg,
                                        std::set<std::string>& written,
                                        core::EventEmitter* events) {
    std::vector<fs::path> out;
    const fs::path flats_dir = output_dir / cfg.flats_subdir;
    std::error_code ec;
    fs::create_directories(flats_dir, ec);
    if (ec) {
        throw IOError("Cannot create " + flats_dir.string() + ": " + ec.message(),
                      flats_dir.string());
    }

    for (const auto& [key, entry] : catalog.stacks()) {
        if (written.count(entry.grid_dir_name)) continue;
        if (entry.planes.empty()) continue;

        auto it = tiles.find(key);
        if (it == tiles.end()) {
            throw ValidationError("No tuning state for grid position " + entry.grid_dir_name +
                                  " of " + catalog.root().string(),
                                  entry.stack_dir.string());
        }

        ImageShape shape = catalog.dimensions(entry.planes.front());
        VectorXf divisor = image::divisor_for_tile(key, it->second, library, shape.rows);
        fs::path path = flat_path_for(output_dir, cfg, entry.grid_dir_name);
        io::write_tiff_float(path, image::expand_divisor(divisor, shape.cols), true);

        written.insert(entry.grid_dir_name);
        out.push_back(path);
        if (events) {
            events->flat_written(path, entry.grid_dir_name);
        }
    }
    return out;
}

std::string build_script(const catalog::TileCatalog& catalog,
                         const fs::path& output_dir,
                         const config::Config& cfg,
                         int dark) {
    std::ostringstream ss;
    for (const auto& item : catalog.stacks()) {
        const catalog::StackEntry& entry = item.second;
        ss << "\n"
           << cfg.pystripe.command << " --input " << entry.stack_dir.string() << " \\\n"
           << "         --output "
           << destriped_path_for(output_dir, cfg.output, catalog.root(), entry).string()
           << " \\\n"
           << "         --flat "
           << flat_path_for(output_dir, cfg.output, entry.grid_dir_name).string() << " \\\n"
           << "         --dark " << dark << " \\\n"
           << "         " << cfg.pystripe.args << "\n";
    }
    return ss.str();
}

fs::path write_script(const catalog::TileCatalog& catalog,
                      const fs::path& output_dir,
                      const config::Config& cfg,
                      int dark,
                      core::EventEmitter* events) {
    fs::path path = catalog.root() / cfg.output.script_name;
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw IOError("Cannot write script: " + path.string(), path.string());
    }
    out << build_script(catalog, output_dir, cfg, dark);
    out.close();
    if (!out) {
        throw IOError("Failed writing script: " + path.string(), path.string());
    }

    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_all | fs::perms::group_all |
                        fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);
    if (ec) {
        throw IOError("Cannot set permissions on " + path.string() + ": " + ec.message(),
                      path.string());
    }

    if (events) {
        events->script_written(path, static_cast<int>(catalog.size()));
    }
    return path;
}

SaveReport save_session(const session::SessionState& session, core::EventEmitter* events) {
    const config::Config& cfg = session.config();
    const fs::path output_dir = cfg.resolved_output_dir();

    SaveReport report;
    std::set<std::string> written;
    for (const auto& catalog : session.catalogs()) {
        auto flats = write_corrections(catalog, session.tiles(), session.library(),
                                       output_dir, cfg.output, written, events);
        report.flats.insert(report.flats.end(), flats.begin(), flats.end());
        report.scripts.push_back(
            write_script(catalog, output_dir, cfg, session.dark_level(), events));
        report.commands += static_cast<int>(catalog.size());
    }

    std::cerr << "[SAVE] Wrote " << report.flats.size() << " flat(s) and "
              << report.scripts.size() << " script(s) under " << output_dir.string()
              << std::endl;
    return report;
}

} // namespace flat_tune::output
