#pragma once

#include "flat_tune/catalog/flat_library.hpp"
#include "flat_tune/core/types.hpp"
#include "flat_tune/grid/coordinate_mapper.hpp"

#include <map>

namespace flat_tune::image {

struct Composite {
    Matrix2Df image;  // zero-sized when no tile has pixel data
    grid::GridLines grid_lines;
    std::map<GridKey, Placement> placements;
    ImageShape tile_shape;
    int tiles = 0;
};

// max(p, dark) - dark
Matrix2Df subtract_dark(const Matrix2Df& tile, float dark);

// Divides row i by divisor(i). Throws ShapeMismatchError when the divisor
// length differs from the tile row count.
Matrix2Df normalize_rows(const Matrix2Df& tile, const VectorXf& divisor);

// Common shape of all tiles that carry pixel data. Throws
// HeterogeneousTilesError naming every key whose shape differs from the first.
ImageShape validate_tile_shapes(const TileStateMap& states);

// Stitches every tile with pixel data into one image. Divisors must be
// strictly positive; the flat-field library enforces that on load.
Composite build_composite(const TileStateMap& states,
                          const catalog::FlatFieldLibrary& library,
                          const VoxelSize& voxel,
                          float dark);

} // namespace flat_tune::image
