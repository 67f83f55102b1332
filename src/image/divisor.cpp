#include "flat_tune/image/divisor.hpp"
#include "flat_tune/core/errors.hpp"

namespace flat_tune::image {

VectorXf reference_profile(const Matrix2Df& flat) {
    if (flat.rows() == 0 || flat.cols() == 0) {
        throw ValidationError("Flat-field reference is empty");
    }
    return flat.col(0);
}

VectorXf build_divisor_from_profile(const VectorXf& profile, int tile_rows, int offset) {
    if (profile.size() == 0) {
        throw ValidationError("Flat-field profile is empty");
    }
    if (tile_rows < 0) {
        throw ValidationError("Tile row count must be >= 0");
    }

    const long long n = static_cast<long long>(profile.size());
    const float first = profile(0);
    const float last = profile(profile.size() - 1);

    // Row i of the tile sees profile row (i - offset); rows shifted in from
    // outside the profile take the nearest edge value.
    VectorXf divisor(tile_rows);
    for (int i = 0; i < tile_rows; ++i) {
        const long long src = static_cast<long long>(i) - offset;
        if (src < 0) {
            divisor(i) = first;
        } else if (src >= n) {
            divisor(i) = last;
        } else {
            divisor(i) = profile(static_cast<Eigen::Index>(src));
        }
    }
    return divisor;
}

VectorXf build_divisor(const Matrix2Df& flat, int tile_rows, int offset) {
    return build_divisor_from_profile(reference_profile(flat), tile_rows, offset);
}

Matrix2Df expand_divisor(const VectorXf& divisor, int cols) {
    if (cols < 0) {
        throw ValidationError("Column count must be >= 0");
    }
    return divisor.replicate(1, cols);
}

VectorXf divisor_for_tile(const GridKey& key, const TileState& state,
                          const catalog::FlatFieldLibrary& library, int tile_rows) {
    const std::string name = grid_key_name(key);
    if (!state.flat_key) {
        throw MissingFlatSelectionError(name, "no reference selected");
    }
    if (!library.contains(*state.flat_key)) {
        throw MissingFlatSelectionError(name, "reference not loaded: " + *state.flat_key);
    }
    return build_divisor(library.get(*state.flat_key), tile_rows, state.offset);
}

} // namespace flat_tune::image
