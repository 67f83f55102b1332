#pragma once

#include "flat_tune/core/events.hpp"
#include "flat_tune/core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace flat_tune::catalog {

// Throws NonPositiveFlatError unless the reference is non-empty and its first
// column (the profile the divisor is built from) is finite and > 0.
void validate_flat_reference(const Matrix2Df& flat, const std::string& path);

// Flat-field references keyed by file path. Read-only after construction.
class FlatFieldLibrary {
public:
    FlatFieldLibrary() = default;

    // Loads every file matching the glob expression, sorted by path.
    static FlatFieldLibrary load(const std::string& glob_expr,
                                 core::EventEmitter* events = nullptr);

    // Wraps already decoded references, validating each.
    static FlatFieldLibrary from_images(std::map<std::string, Matrix2Df> images);

    bool empty() const { return images_.empty(); }
    size_t size() const { return images_.size(); }
    std::vector<std::string> keys() const;
    std::optional<std::string> first_key() const;
    bool contains(const std::string& key) const { return images_.count(key) != 0; }

    const Matrix2Df& get(const std::string& key) const;

    // Key whose file name equals `file_name`.
    std::optional<std::string> find_by_name(const std::string& file_name) const;

    static std::string display_name(const std::string& key);

private:
    std::map<std::string, Matrix2Df> images_;
};

} // namespace flat_tune::catalog
