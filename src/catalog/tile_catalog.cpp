#include "flat_tune/catalog/tile_catalog.hpp"
#include "flat_tune/core/errors.hpp"
#include "flat_tune/core/utils.hpp"
#include "flat_tune/io/image_io.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <iostream>
#include <regex>

namespace flat_tune::catalog {

ImageShape DimensionCache::get(const fs::path& path) {
    auto it = shapes_.find(path.string());
    if (it != shapes_.end()) {
        return it->second;
    }
    ImageShape shape = io::probe_dimensions(path);
    shapes_[path.string()] = shape;
    return shape;
}

bool DimensionCache::contains(const fs::path& path) const {
    return shapes_.count(path.string()) != 0;
}

GridKey parse_grid_name(const std::string& name, const fs::path& path) {
    static const std::regex re("^(-?[0-9]+)_(-?[0-9]+)$");
    std::smatch m;
    if (!std::regex_match(name, m, re)) {
        throw InvalidGridCoordinateError(path.string());
    }

    try {
        long long x = std::stoll(m[1].str());
        long long y = std::stoll(m[2].str());
        return {static_cast<double>(x) / 10.0, static_cast<double>(y) / 10.0};
    } catch (const std::out_of_range&) {
        throw InvalidGridCoordinateError(path.string());
    }
}

bool plane_order_less(const fs::path& a, const fs::path& b) {
    auto plane_number = [](const fs::path& p) -> std::optional<unsigned long long> {
        const std::string stem = p.stem().string();
        if (stem.empty() || stem.size() > 18 ||
            !std::all_of(stem.begin(), stem.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::nullopt;
        }
        return std::stoull(stem);
    };

    auto na = plane_number(a);
    auto nb = plane_number(b);
    if (na && nb && *na != *nb) return *na < *nb;
    if (na.has_value() != nb.has_value()) return na.has_value();
    return a.filename() < b.filename();
}

TileCatalog TileCatalog::scan(const fs::path& root, core::EventEmitter* events) {
    TileCatalog catalog(root);
    catalog.rescan(events);
    return catalog;
}

void TileCatalog::rescan(core::EventEmitter* events) {
    std::error_code root_ec;
    if (!fs::is_directory(root_, root_ec)) {
        throw IOError("Acquisition root is not a directory: " + root_.string(), root_.string());
    }

    struct Candidate {
        fs::path file;
        fs::path x_dir;
        fs::path grid_dir;
    };
    std::vector<Candidate> tiffs;
    std::vector<Candidate> raws;

    std::error_code ec;
    for (const auto& x_entry : core::list_directory(root_)) {
        if (!x_entry.is_directory(ec)) continue;
        for (const auto& grid_entry : core::list_directory(x_entry.path())) {
            if (!grid_entry.is_directory(ec)) continue;
            for (const auto& file_entry : core::list_directory(grid_entry.path())) {
                if (!file_entry.is_regular_file(ec)) continue;
                const fs::path& file = file_entry.path();
                if (io::is_tiff_path(file)) {
                    tiffs.push_back({file, x_entry.path(), grid_entry.path()});
                } else if (io::is_raw_path(file)) {
                    raws.push_back({file, x_entry.path(), grid_entry.path()});
                }
            }
        }
    }

    const bool use_tiff = !tiffs.empty();
    std::vector<Candidate>& files = use_tiff ? tiffs : raws;
    std::sort(files.begin(), files.end(), [](const Candidate& a, const Candidate& b) {
        if (a.grid_dir != b.grid_dir) return a.grid_dir < b.grid_dir;
        return plane_order_less(a.file, b.file);
    });

    std::map<GridKey, StackEntry> stacks;
    for (const auto& c : files) {
        const std::string grid_name = c.grid_dir.filename().string();
        GridKey key = parse_grid_name(grid_name, c.grid_dir);

        auto it = stacks.find(key);
        if (it == stacks.end()) {
            StackEntry entry;
            entry.x_dir_name = c.x_dir.filename().string();
            entry.grid_dir_name = grid_name;
            entry.stack_dir = c.grid_dir;
            it = stacks.emplace(key, std::move(entry)).first;
        } else if (it->second.stack_dir != c.grid_dir) {
            throw ValidationError("Grid position " + grid_name + " appears in both " +
                                  it->second.stack_dir.string() + " and " +
                                  c.grid_dir.string(),
                                  c.grid_dir.string());
        }
        it->second.planes.push_back(c.file);
    }

    stacks_ = std::move(stacks);
    format_ = use_tiff ? ImageFormat::TIFF : ImageFormat::RAW;
    cache_.clear();

    if (stacks_.empty()) {
        std::cerr << "[CATALOG] No image files under " << root_ << std::endl;
        if (events) {
            events->warning("No image files under " + root_.string());
        }
    }
    if (events) {
        events->catalog_scanned(root_, format_, static_cast<int>(stacks_.size()),
                                static_cast<int>(files.size()));
    }
}

size_t TileCatalog::file_count() const {
    size_t n = 0;
    for (const auto& [key, entry] : stacks_) {
        n += entry.planes.size();
    }
    return n;
}

std::vector<GridKey> TileCatalog::keys() const {
    std::vector<GridKey> out;
    out.reserve(stacks_.size());
    for (const auto& [key, entry] : stacks_) {
        out.push_back(key);
    }
    return out;
}

const StackEntry& TileCatalog::stack(const GridKey& key) const {
    auto it = stacks_.find(key);
    if (it == stacks_.end()) {
        throw ValidationError("Unknown grid position " + grid_key_name(key), grid_key_name(key));
    }
    return it->second;
}

std::optional<fs::path> TileCatalog::plane_path(const GridKey& key, size_t index) const {
    const StackEntry& entry = stack(key);
    if (index >= entry.planes.size()) {
        return std::nullopt;
    }
    return entry.planes[index];
}

size_t TileCatalog::plane_count() const {
    size_t n = 0;
    for (const auto& [key, entry] : stacks_) {
        n = std::max(n, entry.planes.size());
    }
    return n;
}

std::vector<std::string> TileCatalog::plane_names() const {
    const StackEntry* longest = nullptr;
    for (const auto& [key, entry] : stacks_) {
        if (!longest || entry.planes.size() > longest->planes.size()) {
            longest = &entry;
        }
    }

    std::vector<std::string> names;
    if (!longest) return names;
    names.reserve(longest->planes.size());
    for (const auto& p : longest->planes) {
        names.push_back(p.stem().string());
    }
    return names;
}

std::vector<size_t> TileCatalog::preview_plane_indices(int max_choices) const {
    const size_t n = plane_count();
    const size_t limit = static_cast<size_t>(std::max(max_choices, 1));
    size_t spacing = 1;
    if (n > 2 * limit) {
        spacing = n / limit;
    }

    std::vector<size_t> out;
    for (size_t i = 0; i < n; i += spacing) {
        out.push_back(i);
    }
    return out;
}

ImageShape TileCatalog::dimensions(const fs::path& path) const {
    return cache_.get(path);
}

} // namespace flat_tune::catalog
