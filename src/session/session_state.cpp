#include "flat_tune/session/session_state.hpp"
#include "flat_tune/core/errors.hpp"
#include "flat_tune/core/utils.hpp"
#include "flat_tune/io/image_io.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <utility>

namespace flat_tune::session {

SessionState::SessionState(std::vector<catalog::TileCatalog> catalogs,
                           catalog::FlatFieldLibrary library,
                           config::Config cfg,
                           core::EventEmitter* events)
    : catalogs_(std::move(catalogs)),
      library_(std::move(library)),
      config_(std::move(cfg)),
      events_(events) {
    if (catalogs_.empty()) {
        throw ValidationError("At least one acquisition root is required");
    }
    config_.validate();

    dark_ = config_.tuning.dark_default;
    const auto default_flat = library_.first_key();
    for (const auto& key : preview_catalog().keys()) {
        TileState state;
        state.flat_key = default_flat;
        tiles_.emplace(key, std::move(state));
    }
}

VoxelSize SessionState::voxel_size() const {
    VoxelSize v;
    v.z = config_.voxel_size.z;
    v.y = config_.voxel_size.xy;
    v.x = config_.voxel_size.xy;
    return v;
}

const TileState& SessionState::tile(const GridKey& key) const {
    auto it = tiles_.find(key);
    if (it == tiles_.end()) {
        throw ValidationError("Unknown grid position " + grid_key_name(key), grid_key_name(key));
    }
    return it->second;
}

TileState& SessionState::mutable_tile(const GridKey& key) {
    auto it = tiles_.find(key);
    if (it == tiles_.end()) {
        throw ValidationError("Unknown grid position " + grid_key_name(key), grid_key_name(key));
    }
    return it->second;
}

void SessionState::set_dark_level(int dark) {
    if (dark < 0 || dark > config_.tuning.dark_max) {
        throw ValidationError("Dark level " + std::to_string(dark) + " outside [0," +
                              std::to_string(config_.tuning.dark_max) + "]");
    }
    dark_ = dark;
    ++version_;
}

void SessionState::set_offset(const GridKey& key, int offset) {
    const int limit = config_.tuning.offset_limit;
    if (offset < -limit || offset > limit) {
        throw ValidationError("Offset " + std::to_string(offset) + " outside [" +
                              std::to_string(-limit) + "," + std::to_string(limit) + "]",
                              grid_key_name(key));
    }
    mutable_tile(key).offset = offset;
    ++version_;
}

void SessionState::select_flat(const GridKey& key, const std::string& flat_key) {
    TileState& state = mutable_tile(key);
    if (!library_.contains(flat_key)) {
        throw MissingFlatSelectionError(grid_key_name(key), "reference not loaded: " + flat_key);
    }
    state.flat_key = flat_key;
    ++version_;
}

void SessionState::select_plane(size_t index) {
    const catalog::TileCatalog& cat = preview_catalog();
    if (index >= cat.plane_count()) {
        throw ValidationError("Plane index " + std::to_string(index) + " out of range (" +
                              std::to_string(cat.plane_count()) + " planes)");
    }

    // Nothing is committed until every tile of the plane has been read.
    std::map<GridKey, std::optional<Matrix2Df>> planes;
    int loaded = 0;
    int missing = 0;
    for (const auto& item : tiles_) {
        const GridKey& key = item.first;
        auto path = cat.plane_path(key, index);
        if (path) {
            planes[key] = io::read_image_float(*path);
            ++loaded;
        } else {
            planes[key] = std::nullopt;
            ++missing;
        }
    }
    for (auto& [key, pixels] : planes) {
        tiles_.at(key).pixels = std::move(pixels);
    }
    plane_ = index;
    ++version_;

    if (missing > 0) {
        std::cerr << "[SESSION] Plane " << index << " missing in " << missing
                  << " stack(s)" << std::endl;
    }
    if (events_) {
        events_->plane_loaded(static_cast<int>(index), loaded, missing);
    }
}

image::Composite SessionState::compose() const {
    auto t0 = std::chrono::steady_clock::now();
    image::Composite composite = image::build_composite(
        tiles_, library_, voxel_size(), static_cast<float>(dark_));
    auto t1 = std::chrono::steady_clock::now();
    double seconds = std::chrono::duration<double>(t1 - t0).count();

    std::cerr << "[COMPOSITE] Image compositing time: " << std::fixed
              << std::setprecision(1) << seconds << " sec" << std::endl;
    if (events_) {
        events_->composite_built(static_cast<int>(composite.image.rows()),
                                 static_cast<int>(composite.image.cols()),
                                 composite.tiles, seconds);
    }
    return composite;
}

nlohmann::json SessionState::to_json() const {
    nlohmann::json tiles = nlohmann::json::object();
    for (const auto& [key, state] : tiles_) {
        nlohmann::json t;
        t["offset"] = state.offset;
        if (state.flat_key) {
            t["flat"] = *state.flat_key;
        } else {
            t["flat"] = nullptr;
        }
        tiles[grid_key_name(key)] = t;
    }

    nlohmann::json out;
    out["dark"] = dark_;
    if (plane_) {
        out["plane"] = *plane_;
    } else {
        out["plane"] = nullptr;
    }
    out["tiles"] = tiles;
    return out;
}

void SessionState::apply_json(const nlohmann::json& state) {
    try {
        if (state.contains("dark") && !state["dark"].is_null()) {
            set_dark_level(state["dark"].get<int>());
        }

        if (state.contains("tiles") && state["tiles"].is_object()) {
            for (const auto& [name, t] : state["tiles"].items()) {
                GridKey key = catalog::parse_grid_name(name, name);
                if (!tiles_.count(key)) {
                    std::cerr << "[SESSION] Ignoring state for unknown grid position "
                              << name << std::endl;
                    if (events_) {
                        events_->warning("Ignoring state for unknown grid position " + name);
                    }
                    continue;
                }
                if (t.contains("offset")) {
                    set_offset(key, t["offset"].get<int>());
                }
                if (t.contains("flat") && t["flat"].is_string()) {
                    std::string flat = t["flat"].get<std::string>();
                    if (!library_.contains(flat)) {
                        // Accept references saved from another flats directory.
                        auto by_name = library_.find_by_name(
                            catalog::FlatFieldLibrary::display_name(flat));
                        if (by_name) flat = *by_name;
                    }
                    select_flat(key, flat);
                }
            }
        }

        if (state.contains("plane") && !state["plane"].is_null()) {
            select_plane(state["plane"].get<size_t>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("Malformed session state: ") + e.what());
    }
}

void SessionState::save(const fs::path& path) const {
    core::write_text(path, to_json().dump(2) + "\n");
}

void SessionState::load(const fs::path& path) {
    nlohmann::json state;
    try {
        state = nlohmann::json::parse(core::read_text(path));
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("Cannot parse session state " + path.string() + ": " + e.what(),
                              path.string());
    }
    apply_json(state);
}

SessionState open_session(const config::Config& cfg, core::EventEmitter* events) {
    std::vector<catalog::TileCatalog> catalogs;
    for (const auto& dir : cfg.acquisition.image_dirs) {
        catalogs.push_back(catalog::TileCatalog::scan(dir, events));
    }
    catalog::FlatFieldLibrary library =
        catalog::FlatFieldLibrary::load(cfg.acquisition.flat_files, events);
    return SessionState(std::move(catalogs), std::move(library), cfg, events);
}

} // namespace flat_tune::session
