#include "flat_tune/grid/coordinate_mapper.hpp"
#include "flat_tune/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace flat_tune::grid {

static int to_pixel(double um, double voxel_um, const char* axis) {
    if (!(voxel_um > 0.0)) {
        throw ValidationError(std::string("voxel size along ") + axis + " must be > 0");
    }
    return static_cast<int>(std::floor(um / voxel_um));
}

int pixel_column(double x_um, const VoxelSize& voxel) {
    return to_pixel(x_um, voxel.x, "x");
}

int pixel_row(double y_um, const VoxelSize& voxel) {
    return to_pixel(y_um, voxel.y, "y");
}

static std::vector<double> sorted_unique(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

std::vector<double> distinct_x(const std::vector<GridKey>& keys) {
    std::vector<double> xs;
    xs.reserve(keys.size());
    for (const auto& k : keys) xs.push_back(k.x_um);
    return sorted_unique(std::move(xs));
}

std::vector<double> distinct_y(const std::vector<GridKey>& keys) {
    std::vector<double> ys;
    ys.reserve(keys.size());
    for (const auto& k : keys) ys.push_back(k.y_um);
    return sorted_unique(std::move(ys));
}

std::map<GridKey, Placement> compute_placements(const std::vector<GridKey>& keys,
                                                const VoxelSize& voxel) {
    std::map<GridKey, Placement> out;
    if (keys.empty()) return out;

    int min_row = 0;
    int min_col = 0;
    bool first = true;
    for (const auto& k : keys) {
        Placement p{pixel_row(k.y_um, voxel), pixel_column(k.x_um, voxel)};
        if (first) {
            min_row = p.row;
            min_col = p.col;
            first = false;
        } else {
            min_row = std::min(min_row, p.row);
            min_col = std::min(min_col, p.col);
        }
        out[k] = p;
    }

    for (auto& [k, p] : out) {
        p.row -= min_row;
        p.col -= min_col;
    }
    return out;
}

GridLines compute_grid_lines(const std::vector<GridKey>& keys, const VoxelSize& voxel) {
    GridLines lines;
    auto xs = distinct_x(keys);
    auto ys = distinct_y(keys);

    if (!xs.empty()) {
        const int origin = pixel_column(xs.front(), voxel);
        for (size_t i = 1; i < xs.size(); ++i) {
            lines.columns.push_back(pixel_column(xs[i], voxel) - origin);
        }
    }
    if (!ys.empty()) {
        const int origin = pixel_row(ys.front(), voxel);
        for (size_t i = 1; i < ys.size(); ++i) {
            lines.rows.push_back(pixel_row(ys[i], voxel) - origin);
        }
    }
    return lines;
}

} // namespace flat_tune::grid
