#include "flat_tune/catalog/flat_library.hpp"
#include "flat_tune/core/errors.hpp"
#include "flat_tune/image/divisor.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <map>

using flat_tune::Matrix2Df;
using flat_tune::VectorXf;
using flat_tune::image::build_divisor;
using flat_tune::image::build_divisor_from_profile;

namespace {

VectorXf ramp(int n) {
    VectorXf p(n);
    for (int i = 0; i < n; ++i) p(i) = static_cast<float>(i + 1);
    return p;
}

} // namespace

TEST_CASE("divisor_length_equals_tile_rows_for_all_offsets") {
    for (int profile_rows : {1, 7, 50, 120}) {
        VectorXf profile = ramp(profile_rows);
        for (int tile_rows : {1, 10, 50, 200}) {
            for (int offset : {-500, -120, -51, -50, -5, -1, 0, 1, 5, 49, 50, 51, 120, 500}) {
                VectorXf d = build_divisor_from_profile(profile, tile_rows, offset);
                REQUIRE(d.size() == tile_rows);
            }
        }
    }
}

TEST_CASE("divisor_zero_offset_copies_profile_verbatim") {
    VectorXf profile = ramp(30);

    VectorXf shorter = build_divisor_from_profile(profile, 20, 0);
    for (int i = 0; i < 20; ++i) {
        REQUIRE(shorter(i) == profile(i));
    }

    VectorXf longer = build_divisor_from_profile(profile, 40, 0);
    for (int i = 0; i < 30; ++i) {
        REQUIRE(longer(i) == profile(i));
    }
    for (int i = 30; i < 40; ++i) {
        REQUIRE(longer(i) == 30.0f);
    }
}

TEST_CASE("divisor_negative_offset_drops_head_and_repeats_last_value") {
    VectorXf d = build_divisor_from_profile(ramp(50), 50, -5);

    REQUIRE(d.size() == 50);
    for (int i = 0; i < 45; ++i) {
        REQUIRE(d(i) == static_cast<float>(i + 6));
    }
    for (int i = 45; i < 50; ++i) {
        REQUIRE(d(i) == 50.0f);
    }
}

TEST_CASE("divisor_positive_offset_repeats_first_value") {
    VectorXf d = build_divisor_from_profile(ramp(10), 10, 3);

    REQUIRE(d(0) == 1.0f);
    REQUIRE(d(1) == 1.0f);
    REQUIRE(d(2) == 1.0f);
    REQUIRE(d(3) == 1.0f);
    REQUIRE(d(4) == 2.0f);
    REQUIRE(d(9) == 7.0f);
}

TEST_CASE("divisor_padding_only_uses_edge_values") {
    VectorXf profile = ramp(8);
    for (int offset : {-100, -9, 9, 100}) {
        VectorXf d = build_divisor_from_profile(profile, 16, offset);
        for (int i = 0; i < d.size(); ++i) {
            REQUIRE(d(i) >= 1.0f);
            REQUIRE(d(i) <= 8.0f);
        }
    }
    VectorXf all_first = build_divisor_from_profile(profile, 16, 100);
    REQUIRE((all_first.array() == 1.0f).all());
    VectorXf all_last = build_divisor_from_profile(profile, 16, -100);
    REQUIRE((all_last.array() == 8.0f).all());
}

TEST_CASE("divisor_uses_first_column_of_reference") {
    Matrix2Df flat(4, 3);
    flat << 2.0f, 9.0f, 9.0f,
            3.0f, 9.0f, 9.0f,
            4.0f, 9.0f, 9.0f,
            5.0f, 9.0f, 9.0f;

    VectorXf d = build_divisor(flat, 4, 0);
    REQUIRE(d(0) == 2.0f);
    REQUIRE(d(3) == 5.0f);
}

TEST_CASE("divisor_rejects_empty_reference") {
    Matrix2Df empty(0, 0);
    REQUIRE_THROWS_AS(build_divisor(empty, 10, 0), flat_tune::ValidationError);
}

TEST_CASE("expand_divisor_replicates_across_columns") {
    Matrix2Df m = flat_tune::image::expand_divisor(ramp(3), 4);
    REQUIRE(m.rows() == 3);
    REQUIRE(m.cols() == 4);
    for (int c = 0; c < 4; ++c) {
        REQUIRE(m(0, c) == 1.0f);
        REQUIRE(m(2, c) == 3.0f);
    }
}

TEST_CASE("divisor_for_tile_requires_a_loaded_selection") {
    std::map<std::string, Matrix2Df> images;
    images["/flats/a.tif"] = Matrix2Df::Constant(5, 2, 2.0f);
    auto library = flat_tune::catalog::FlatFieldLibrary::from_images(images);
    flat_tune::GridKey key{10.0, 20.0};

    flat_tune::TileState none;
    try {
        flat_tune::image::divisor_for_tile(key, none, library, 5);
        FAIL("expected MissingFlatSelectionError");
    } catch (const flat_tune::MissingFlatSelectionError &e) {
        REQUIRE(e.subject() == "100_200");
        REQUIRE(e.kind() == flat_tune::ErrorKind::MISSING_FLAT_SELECTION);
    }

    flat_tune::TileState unknown;
    unknown.flat_key = "/flats/b.tif";
    REQUIRE_THROWS_AS(flat_tune::image::divisor_for_tile(key, unknown, library, 5),
                      flat_tune::MissingFlatSelectionError);

    flat_tune::TileState ok;
    ok.flat_key = "/flats/a.tif";
    ok.offset = 2;
    VectorXf d = flat_tune::image::divisor_for_tile(key, ok, library, 7);
    REQUIRE(d.size() == 7);
    REQUIRE(d(6) == Catch::Approx(2.0f));
}
