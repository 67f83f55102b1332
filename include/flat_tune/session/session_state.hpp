#pragma once

#include "flat_tune/catalog/flat_library.hpp"
#include "flat_tune/catalog/tile_catalog.hpp"
#include "flat_tune/config/configuration.hpp"
#include "flat_tune/core/events.hpp"
#include "flat_tune/core/types.hpp"
#include "flat_tune/image/composite.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flat_tune::session {

// Tuning state of one session. The first catalog is the one previewed; the
// others share its grid and are only used when saving.
class SessionState {
public:
    SessionState(std::vector<catalog::TileCatalog> catalogs,
                 catalog::FlatFieldLibrary library,
                 config::Config cfg,
                 core::EventEmitter* events = nullptr);

    const std::vector<catalog::TileCatalog>& catalogs() const { return catalogs_; }
    const catalog::TileCatalog& preview_catalog() const { return catalogs_.front(); }
    const catalog::FlatFieldLibrary& library() const { return library_; }
    const config::Config& config() const { return config_; }
    VoxelSize voxel_size() const;

    const TileStateMap& tiles() const { return tiles_; }
    const TileState& tile(const GridKey& key) const;
    int dark_level() const { return dark_; }
    std::optional<size_t> plane_index() const { return plane_; }

    // Incremented by every command.
    uint64_t version() const { return version_; }

    void set_dark_level(int dark);
    void set_offset(const GridKey& key, int offset);
    void select_flat(const GridKey& key, const std::string& flat_key);

    // Loads the index-th plane of every stack; stacks without it are cleared.
    void select_plane(size_t index);

    image::Composite compose() const;

    nlohmann::json to_json() const;
    void apply_json(const nlohmann::json& state);
    void save(const fs::path& path) const;
    void load(const fs::path& path);

private:
    TileState& mutable_tile(const GridKey& key);

    std::vector<catalog::TileCatalog> catalogs_;
    catalog::FlatFieldLibrary library_;
    config::Config config_;
    core::EventEmitter* events_;

    TileStateMap tiles_;
    int dark_ = 0;
    std::optional<size_t> plane_;
    uint64_t version_ = 0;
};

// Scans every configured image directory and loads the flat-field library.
SessionState open_session(const config::Config& cfg, core::EventEmitter* events = nullptr);

} // namespace flat_tune::session
