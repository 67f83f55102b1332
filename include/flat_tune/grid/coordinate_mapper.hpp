#pragma once

#include "flat_tune/core/types.hpp"

#include <map>
#include <vector>

namespace flat_tune::grid {

// floor(x_um / voxel.x)
int pixel_column(double x_um, const VoxelSize& voxel);

// floor(y_um / voxel.y)
int pixel_row(double y_um, const VoxelSize& voxel);

// Sorted, de-duplicated coordinates of a key set.
std::vector<double> distinct_x(const std::vector<GridKey>& keys);
std::vector<double> distinct_y(const std::vector<GridKey>& keys);

// Pixel placement of every key, shifted so the minimum row and column are 0.
std::map<GridKey, Placement> compute_placements(const std::vector<GridKey>& keys,
                                                const VoxelSize& voxel);

// Interior separator positions relative to the composite origin: one column
// per distinct X after the first, one row per distinct Y after the first.
struct GridLines {
    std::vector<int> columns;
    std::vector<int> rows;
};

GridLines compute_grid_lines(const std::vector<GridKey>& keys, const VoxelSize& voxel);

} // namespace flat_tune::grid
