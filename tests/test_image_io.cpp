#include "flat_tune/core/errors.hpp"
#include "flat_tune/io/image_io.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <fstream>
#include <vector>

using flat_tune::Matrix2Df;
using flat_tune_test::TempDir;

TEST_CASE("raw_reader_decodes_little_endian_header_and_pixels") {
    TempDir tmp;
    auto path = tmp.path() / "plane.raw";
    {
        std::ofstream out(path, std::ios::binary);
        const unsigned char bytes[] = {
                3, 0, 0, 0,  // width
                2, 0, 0, 0,  // height
                1, 0, 2, 0, 0, 1,
                0xff, 0xff, 7, 0, 0, 0};
        out.write(reinterpret_cast<const char *>(bytes), sizeof(bytes));
    }

    Matrix2Df img = flat_tune::io::read_raw_float(path);

    REQUIRE(img.rows() == 2);
    REQUIRE(img.cols() == 3);
    REQUIRE(img(0, 0) == 1.0f);
    REQUIRE(img(0, 1) == 2.0f);
    REQUIRE(img(0, 2) == 256.0f);
    REQUIRE(img(1, 0) == 65535.0f);
    REQUIRE(img(1, 1) == 7.0f);
    REQUIRE(img(1, 2) == 0.0f);

    auto shape = flat_tune::io::probe_dimensions(path);
    REQUIRE(shape.rows == 2);
    REQUIRE(shape.cols == 3);
}

TEST_CASE("raw_writer_clamps_and_rounds") {
    TempDir tmp;
    auto path = tmp.path() / "out.raw";
    Matrix2Df data(1, 4);
    data << -5.0f, 1.4f, 1.6f, 70000.0f;

    flat_tune::io::write_raw_u16(path, data);
    Matrix2Df back = flat_tune::io::read_image_float(path);

    REQUIRE(back(0, 0) == 0.0f);
    REQUIRE(back(0, 1) == 1.0f);
    REQUIRE(back(0, 2) == 2.0f);
    REQUIRE(back(0, 3) == 65535.0f);
}

TEST_CASE("truncated_raw_file_is_an_io_error") {
    TempDir tmp;
    auto path = tmp.path() / "short.raw";
    {
        std::ofstream out(path, std::ios::binary);
        const unsigned char bytes[] = {4, 0, 0, 0, 4, 0, 0, 0, 1, 0};
        out.write(reinterpret_cast<const char *>(bytes), sizeof(bytes));
    }
    REQUIRE_THROWS_AS(flat_tune::io::read_raw_float(path), flat_tune::IOError);
}

TEST_CASE("unsupported_extension_is_an_io_error") {
    TempDir tmp;
    auto path = tmp.path() / "plane.png";
    std::ofstream(path) << "x";
    REQUIRE_FALSE(flat_tune::io::detect_image_format(path).has_value());
    REQUIRE_THROWS_AS(flat_tune::io::read_image_float(path), flat_tune::IOError);
}

TEST_CASE("float_tiff_round_trips_through_opencv") {
    TempDir tmp;
    auto path = tmp.path() / "divisor.tif";
    Matrix2Df data(3, 2);
    data << 0.5f, 0.5f,
            1.25f, 1.25f,
            2.0f, 2.0f;

    flat_tune::io::write_tiff_float(path, data, true);
    Matrix2Df back = flat_tune::io::read_image_float(path);

    REQUIRE(back.rows() == 3);
    REQUIRE(back.cols() == 2);
    REQUIRE(back(1, 0) == Catch::Approx(1.25f));
    REQUIRE(back(2, 1) == Catch::Approx(2.0f));
    REQUIRE(flat_tune::io::probe_dimensions(path).rows == 3);
}

TEST_CASE("tiff_extension_detection_is_case_insensitive") {
    REQUIRE(flat_tune::io::is_tiff_path("a/B.TIF"));
    REQUIRE(flat_tune::io::is_tiff_path("a/b.tiff"));
    REQUIRE(flat_tune::io::is_raw_path("a/b.RAW"));
    REQUIRE_FALSE(flat_tune::io::is_tiff_path("a/b.tif.bak"));
}

TEST_CASE("display_image_writes_eight_bit_pixels") {
    TempDir tmp;
    auto path = tmp.path() / "preview.tif";
    std::vector<uint8_t> pixels = {0, 64, 128, 255, 10, 20};

    flat_tune::io::write_image_u8(path, pixels, 2, 3);
    Matrix2Df back = flat_tune::io::read_image_float(path);

    REQUIRE(back.rows() == 2);
    REQUIRE(back.cols() == 3);
    REQUIRE(back(0, 2) == Catch::Approx(128.0f));
    REQUIRE(back(1, 0) == Catch::Approx(255.0f));

    REQUIRE_THROWS_AS(flat_tune::io::write_image_u8(path, pixels, 3, 3), flat_tune::IOError);
}
