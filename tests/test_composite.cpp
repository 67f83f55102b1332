#include "flat_tune/catalog/flat_library.hpp"
#include "flat_tune/core/errors.hpp"
#include "flat_tune/image/composite.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <map>
#include <string>

using flat_tune::GridKey;
using flat_tune::Matrix2Df;
using flat_tune::TileState;
using flat_tune::TileStateMap;
using flat_tune::VectorXf;
using flat_tune::VoxelSize;
using flat_tune::catalog::FlatFieldLibrary;

namespace {

const char *kOnes = "/flats/ones.tif";

FlatFieldLibrary ones_library(int rows) {
    std::map<std::string, Matrix2Df> images;
    images[kOnes] = Matrix2Df::Ones(rows, 1);
    return FlatFieldLibrary::from_images(images);
}

TileState tile(const Matrix2Df &pixels, int offset = 0) {
    TileState s;
    s.flat_key = kOnes;
    s.offset = offset;
    s.pixels = pixels;
    return s;
}

VoxelSize voxel(double xy) {
    VoxelSize v;
    v.x = xy;
    v.y = xy;
    return v;
}

} // namespace

TEST_CASE("dark_subtraction_is_a_floor_at_zero") {
    Matrix2Df t(1, 5);
    t << 0.0f, 9.0f, 10.0f, 11.0f, 300.0f;

    Matrix2Df out = flat_tune::image::subtract_dark(t, 10.0f);

    REQUIRE(out(0, 0) == 0.0f);
    REQUIRE(out(0, 1) == 0.0f);
    REQUIRE(out(0, 2) == 0.0f);
    REQUIRE(out(0, 3) == 1.0f);
    REQUIRE(out(0, 4) == 290.0f);
    REQUIRE((out.array() >= 0.0f).all());
}

TEST_CASE("normalize_rows_divides_each_row_by_its_divisor") {
    Matrix2Df t(2, 3);
    t << 2.0f, 4.0f, 6.0f,
         9.0f, 3.0f, 6.0f;
    VectorXf d(2);
    d << 2.0f, 3.0f;

    Matrix2Df out = flat_tune::image::normalize_rows(t, d);

    REQUIRE(out(0, 0) == Catch::Approx(1.0f));
    REQUIRE(out(0, 2) == Catch::Approx(3.0f));
    REQUIRE(out(1, 0) == Catch::Approx(3.0f));
    REQUIRE(out(1, 1) == Catch::Approx(1.0f));

    VectorXf wrong(3);
    wrong << 1.0f, 1.0f, 1.0f;
    REQUIRE_THROWS_AS(flat_tune::image::normalize_rows(t, wrong), flat_tune::ShapeMismatchError);
}

TEST_CASE("single_tile_with_unit_reference_round_trips") {
    Matrix2Df pixels(3, 4);
    pixels << 1.0f, 2.0f, 3.0f, 4.0f,
              5.0f, 6.0f, 7.0f, 8.0f,
              9.0f, 10.0f, 11.0f, 12.0f;
    TileStateMap states;
    states[GridKey{123.4, 56.7}] = tile(pixels);

    auto c = flat_tune::image::build_composite(states, ones_library(3), voxel(1.8), 0.0f);

    REQUIRE(c.tiles == 1);
    REQUIRE(c.image.rows() == 3);
    REQUIRE(c.image.cols() == 4);
    REQUIRE(c.image == pixels);
    REQUIRE(c.grid_lines.columns.empty());
    REQUIRE(c.grid_lines.rows.empty());
}

TEST_CASE("composite_of_2x2_grid_covers_bounding_box") {
    const int rows = 8;
    const int cols = 12;
    TileStateMap states;
    states[GridKey{0.0, 0.0}] = tile(Matrix2Df::Constant(rows, cols, 1.0f));
    states[GridKey{0.0, 20.0}] = tile(Matrix2Df::Constant(rows, cols, 2.0f));
    states[GridKey{20.0, 0.0}] = tile(Matrix2Df::Constant(rows, cols, 3.0f));
    states[GridKey{20.0, 20.0}] = tile(Matrix2Df::Constant(rows, cols, 4.0f));

    auto c = flat_tune::image::build_composite(states, ones_library(rows), voxel(2.0), 0.0f);

    // placements at 0 and 10 pixels on both axes
    REQUIRE(c.image.rows() == 10 + rows);
    REQUIRE(c.image.cols() == 10 + cols);
    REQUIRE(c.tiles == 4);

    REQUIRE(c.image(0, 0) == 1.0f);
    REQUIRE(c.image(10, 0) == 2.0f);
    REQUIRE(c.image(0, 21) == 3.0f);
    REQUIRE(c.image(17, 21) == 4.0f);
    // rows 8 and 9 lie between the two tile rows
    REQUIRE(c.image(8, 0) == 0.0f);
    REQUIRE(c.image(9, 0) == 0.0f);

    REQUIRE(c.grid_lines.columns == std::vector<int>{10});
    REQUIRE(c.grid_lines.rows == std::vector<int>{10});
}

TEST_CASE("adjacent_tiles_with_dark_floor_are_uniform") {
    TileStateMap states;
    states[GridKey{0.0, 0.0}] = tile(Matrix2Df::Constant(100, 100, 50.0f));
    states[GridKey{10.0, 0.0}] = tile(Matrix2Df::Constant(100, 100, 50.0f));

    auto c = flat_tune::image::build_composite(states, ones_library(100), voxel(1.8), 10.0f);

    REQUIRE(c.image.rows() == 100);
    REQUIRE(c.image.cols() == 105);
    REQUIRE(c.image.minCoeff() == Catch::Approx(40.0f));
    REQUIRE(c.image.maxCoeff() == Catch::Approx(40.0f));
}

TEST_CASE("offset_changes_row_normalization") {
    std::map<std::string, Matrix2Df> images;
    Matrix2Df flat(4, 1);
    flat << 1.0f, 2.0f, 4.0f, 8.0f;
    images[kOnes] = flat;
    auto library = FlatFieldLibrary::from_images(images);

    TileStateMap states;
    states[GridKey{0.0, 0.0}] = tile(Matrix2Df::Constant(4, 2, 8.0f), -1);

    auto c = flat_tune::image::build_composite(states, library, voxel(1.0), 0.0f);

    REQUIRE(c.image(0, 0) == Catch::Approx(4.0f));
    REQUIRE(c.image(1, 0) == Catch::Approx(2.0f));
    REQUIRE(c.image(2, 0) == Catch::Approx(1.0f));
    REQUIRE(c.image(3, 0) == Catch::Approx(1.0f));
}

TEST_CASE("tiles_without_pixels_are_left_out") {
    TileStateMap states;
    states[GridKey{0.0, 0.0}] = tile(Matrix2Df::Constant(4, 4, 5.0f));
    TileState absent;
    absent.flat_key = kOnes;
    states[GridKey{100.0, 0.0}] = absent;

    auto c = flat_tune::image::build_composite(states, ones_library(4), voxel(1.0), 0.0f);

    REQUIRE(c.tiles == 1);
    REQUIRE(c.image.cols() == 4);
    REQUIRE(c.placements.size() == 1);
}

TEST_CASE("no_loaded_tiles_yield_empty_composite") {
    TileStateMap states;
    TileState absent;
    absent.flat_key = kOnes;
    states[GridKey{0.0, 0.0}] = absent;

    auto c = flat_tune::image::build_composite(states, ones_library(4), voxel(1.0), 0.0f);

    REQUIRE(c.tiles == 0);
    REQUIRE(c.image.size() == 0);
}

TEST_CASE("heterogeneous_tile_shapes_are_reported_per_key") {
    TileStateMap states;
    states[GridKey{0.0, 0.0}] = tile(Matrix2Df::Constant(4, 4, 1.0f));
    states[GridKey{10.0, 0.0}] = tile(Matrix2Df::Constant(4, 4, 1.0f));
    states[GridKey{20.0, 0.0}] = tile(Matrix2Df::Constant(5, 4, 1.0f));
    states[GridKey{30.0, 0.0}] = tile(Matrix2Df::Constant(4, 3, 1.0f));

    try {
        flat_tune::image::build_composite(states, ones_library(4), voxel(1.0), 0.0f);
        FAIL("expected HeterogeneousTilesError");
    } catch (const flat_tune::HeterogeneousTilesError &e) {
        REQUIRE(e.kind() == flat_tune::ErrorKind::HETEROGENEOUS_TILES);
        REQUIRE(e.offending_keys().size() == 2);
        REQUIRE(e.offending_keys()[0] == "200_0(5x4)");
        REQUIRE(e.offending_keys()[1] == "300_0(4x3)");
    }
}

TEST_CASE("composite_without_flat_selection_fails_fast") {
    TileStateMap states;
    TileState s;
    s.pixels = Matrix2Df::Constant(4, 4, 1.0f);
    states[GridKey{0.0, 0.0}] = s;

    REQUIRE_THROWS_AS(
        flat_tune::image::build_composite(states, ones_library(4), voxel(1.0), 0.0f),
        flat_tune::MissingFlatSelectionError);
}
