#pragma once

#include "flat_tune/catalog/flat_library.hpp"
#include "flat_tune/core/types.hpp"

namespace flat_tune::image {

// First column of a flat-field reference: one correction factor per row.
VectorXf reference_profile(const Matrix2Df& flat);

// Shifts the profile by `offset` rows and returns exactly `tile_rows` values.
// offset < 0 drops the first |offset| values, offset > 0 prepends copies of
// the first value; any shortfall is filled with the last value.
VectorXf build_divisor_from_profile(const VectorXf& profile, int tile_rows, int offset);

VectorXf build_divisor(const Matrix2Df& flat, int tile_rows, int offset);

// Replicates the divisor across `cols` columns.
Matrix2Df expand_divisor(const VectorXf& divisor, int cols);

// Divisor for one grid position using its selected reference.
VectorXf divisor_for_tile(const GridKey& key, const TileState& state,
                          const catalog::FlatFieldLibrary& library, int tile_rows);

} // namespace flat_tune::image
