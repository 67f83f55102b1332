#include "flat_tune/catalog/flat_library.hpp"
#include "flat_tune/core/errors.hpp"
#include "flat_tune/core/utils.hpp"
#include "flat_tune/io/image_io.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace flat_tune::catalog {

void validate_flat_reference(const Matrix2Df& flat, const std::string& path) {
    if (flat.rows() == 0 || flat.cols() == 0) {
        throw NonPositiveFlatError(path, "empty image");
    }
    for (Eigen::Index r = 0; r < flat.rows(); ++r) {
        const float v = flat(r, 0);
        if (!std::isfinite(v) || v <= 0.0f) {
            throw NonPositiveFlatError(path, "row " + std::to_string(r) +
                                                 " value " + std::to_string(v));
        }
    }
}

FlatFieldLibrary FlatFieldLibrary::load(const std::string& glob_expr,
                                        core::EventEmitter* events) {
    std::map<std::string, Matrix2Df> images;
    for (const auto& path : core::glob_expression(glob_expr)) {
        if (!io::detect_image_format(path)) {
            continue;
        }
        images[path.string()] = io::read_image_float(path);
    }

    if (images.empty()) {
        std::cerr << "[FLATS] No flat-field references match " << glob_expr << std::endl;
        if (events) {
            events->warning("No flat-field references match " + glob_expr);
        }
    }

    return from_images(std::move(images));
}

FlatFieldLibrary FlatFieldLibrary::from_images(std::map<std::string, Matrix2Df> images) {
    for (const auto& [key, flat] : images) {
        validate_flat_reference(flat, key);
    }
    FlatFieldLibrary lib;
    lib.images_ = std::move(images);
    return lib;
}

std::vector<std::string> FlatFieldLibrary::keys() const {
    std::vector<std::string> out;
    out.reserve(images_.size());
    for (const auto& [key, flat] : images_) {
        out.push_back(key);
    }
    return out;
}

std::optional<std::string> FlatFieldLibrary::first_key() const {
    if (images_.empty()) return std::nullopt;
    return images_.begin()->first;
}

const Matrix2Df& FlatFieldLibrary::get(const std::string& key) const {
    auto it = images_.find(key);
    if (it == images_.end()) {
        throw ValidationError("Unknown flat-field reference: " + key, key);
    }
    return it->second;
}

std::optional<std::string> FlatFieldLibrary::find_by_name(const std::string& file_name) const {
    for (const auto& [key, flat] : images_) {
        if (display_name(key) == file_name) {
            return key;
        }
    }
    return std::nullopt;
}

std::string FlatFieldLibrary::display_name(const std::string& key) {
    return fs::path(key).filename().string();
}

} // namespace flat_tune::catalog
