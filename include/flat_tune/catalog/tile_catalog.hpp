#pragma once

#include "flat_tune/core/events.hpp"
#include "flat_tune/core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace flat_tune::catalog {

// Image dimensions keyed by path. Entries live until clear().
class DimensionCache {
public:
    ImageShape get(const fs::path& path);
    bool contains(const fs::path& path) const;
    void clear() { shapes_.clear(); }
    size_t size() const { return shapes_.size(); }

private:
    std::map<std::string, ImageShape> shapes_;
};

// One Z-stack: the files of a single <X>/<X>_<Y> directory.
struct StackEntry {
    std::string x_dir_name;
    std::string grid_dir_name;
    fs::path stack_dir;
    std::vector<fs::path> planes;  // sorted by file name
};

// Parses "<X>_<Y>" (tenths of a micron) into a key in microns. `path` is only
// used for the error message.
GridKey parse_grid_name(const std::string& name, const fs::path& path);

// Z ordering of plane files: numeric stems by value ("2" before "10"), then
// non-numeric stems by file name.
bool plane_order_less(const fs::path& a, const fs::path& b);

class TileCatalog {
public:
    // Indexes <root>/<X>/<X>_<Y>/<Z>.<ext>. TIFF files win over .raw.
    static TileCatalog scan(const fs::path& root, core::EventEmitter* events = nullptr);

    // Re-reads the directory tree and drops cached dimensions.
    void rescan(core::EventEmitter* events = nullptr);

    const fs::path& root() const { return root_; }
    ImageFormat format() const { return format_; }
    bool empty() const { return stacks_.empty(); }
    size_t size() const { return stacks_.size(); }
    size_t file_count() const;

    const std::map<GridKey, StackEntry>& stacks() const { return stacks_; }
    std::vector<GridKey> keys() const;
    bool contains(const GridKey& key) const { return stacks_.count(key) != 0; }
    const StackEntry& stack(const GridKey& key) const;

    // Path of the index-th plane of a stack, if the stack has that many.
    std::optional<fs::path> plane_path(const GridKey& key, size_t index) const;

    // Largest plane count across stacks.
    size_t plane_count() const;

    // File stems of the longest stack, used as Z labels.
    std::vector<std::string> plane_names() const;

    // All plane indices, or an evenly spaced subset of roughly max_choices
    // entries when there are more than twice that many.
    std::vector<size_t> preview_plane_indices(int max_choices) const;

    ImageShape dimensions(const fs::path& path) const;
    const DimensionCache& dimension_cache() const { return cache_; }

private:
    explicit TileCatalog(fs::path root) : root_(std::move(root)) {}

    fs::path root_;
    ImageFormat format_ = ImageFormat::TIFF;
    std::map<GridKey, StackEntry> stacks_;
    mutable DimensionCache cache_;
};

} // namespace flat_tune::catalog
