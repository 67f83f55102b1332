#pragma once

#include "flat_tune/catalog/flat_library.hpp"
#include "flat_tune/catalog/tile_catalog.hpp"
#include "flat_tune/config/configuration.hpp"
#include "flat_tune/core/events.hpp"
#include "flat_tune/core/types.hpp"

#include <set>
#include <string>
#include <vector>

namespace flat_tune::session {
class SessionState;
}

namespace flat_tune::output {

struct SaveReport {
    std::vector<fs::path> flats;    // in write order
    std::vector<fs::path> scripts;  // one per acquisition root
    int commands = 0;
};

fs::path flat_path_for(const fs::path& output_dir, const config::OutputConfig& cfg,
                       const std::string& grid_dir_name);

fs::path destriped_path_for(const fs::path& output_dir, const config::OutputConfig& cfg,
                            const fs::path& root, const catalog::StackEntry& entry);

// Writes one expanded divisor per grid directory name not yet in `written`.
// Tile dimensions come from the first plane of each stack.
std::vector<fs::path> write_corrections(const catalog::TileCatalog& catalog,
                                        const TileStateMap& tiles,
                                        const catalog::FlatFieldLibrary& library,
                                        const fs::path& output_dir,
                                        const config::OutputConfig& cfg,
                                        std::set<std::string>& written,
                                        core::EventEmitter* events = nullptr);

// One pystripe command block per stack of the catalog.
std::string build_script(const catalog::TileCatalog& catalog,
                         const fs::path& output_dir,
                         const config::Config& cfg,
                         int dark);

// Writes <root>/<script_name> and marks it executable (0775).
fs::path write_script(const catalog::TileCatalog& catalog,
                      const fs::path& output_dir,
                      const config::Config& cfg,
                      int dark,
                      core::EventEmitter* events = nullptr);

// Flats and scripts for every catalog of the session.
SaveReport save_session(const session::SessionState& session,
                        core::EventEmitter* events = nullptr);

} // namespace flat_tune::output
