#include "flat_tune/image/composite.hpp"
#include "flat_tune/core/errors.hpp"
#include "flat_tune/image/divisor.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace flat_tune::image {

Matrix2Df subtract_dark(const Matrix2Df& tile, float dark) {
    return (tile.array().max(dark) - dark).matrix();
}

Matrix2Df normalize_rows(const Matrix2Df& tile, const VectorXf& divisor) {
    if (divisor.size() != tile.rows()) {
        throw ShapeMismatchError("divisor has " + std::to_string(divisor.size()) +
                                 " rows, tile has " + std::to_string(tile.rows()));
    }
    Matrix2Df out = tile;
    out.array().colwise() /= divisor.array();
    return out;
}

ImageShape validate_tile_shapes(const TileStateMap& states) {
    ImageShape reference;
    bool have_reference = false;
    std::vector<std::string> offending;

    for (const auto& [key, state] : states) {
        if (!state.pixels) continue;
        ImageShape shape{static_cast<int>(state.pixels->rows()),
                         static_cast<int>(state.pixels->cols())};
        if (!have_reference) {
            reference = shape;
            have_reference = true;
        } else if (shape != reference) {
            offending.push_back(grid_key_name(key) + "(" + shape_to_string(shape) + ")");
        }
    }

    if (!offending.empty()) {
        throw HeterogeneousTilesError("expected " + shape_to_string(reference) +
                                      ", " + std::to_string(offending.size()) +
                                      " tile(s) differ",
                                      offending);
    }
    return reference;
}

Composite build_composite(const TileStateMap& states,
                          const catalog::FlatFieldLibrary& library,
                          const VoxelSize& voxel,
                          float dark) {
    Composite result;

    std::vector<GridKey> keys;
    for (const auto& [key, state] : states) {
        if (state.pixels) keys.push_back(key);
    }
    if (keys.empty()) {
        return result;
    }

    result.tile_shape = validate_tile_shapes(states);
    result.placements = grid::compute_placements(keys, voxel);
    result.grid_lines = grid::compute_grid_lines(keys, voxel);

    int max_row = 0;
    int max_col = 0;
    for (const auto& [key, p] : result.placements) {
        max_row = std::max(max_row, p.row);
        max_col = std::max(max_col, p.col);
    }

    const int rows = result.tile_shape.rows;
    const int cols = result.tile_shape.cols;
    result.image = Matrix2Df::Zero(max_row + rows, max_col + cols);

    for (const auto& key : keys) {
        const TileState& state = states.at(key);
        const Placement& p = result.placements.at(key);
        VectorXf divisor = divisor_for_tile(key, state, library, rows);
        // Later tiles overwrite earlier ones where placements overlap.
        result.image.block(p.row, p.col, rows, cols) =
            normalize_rows(subtract_dark(*state.pixels, dark), divisor);
        ++result.tiles;
    }

    return result;
}

} // namespace flat_tune::image
