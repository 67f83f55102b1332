#include "flat_tune/core/errors.hpp"
#include "flat_tune/core/events.hpp"
#include "flat_tune/core/utils.hpp"
#include "flat_tune/image/preview.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using flat_tune::Matrix2Df;
using flat_tune_test::TempDir;

namespace fs = std::filesystem;
namespace core = flat_tune::core;

TEST_CASE("percentile_interpolates_between_ranks") {
    Matrix2Df data(1, 5);
    data << 5.0f, 1.0f, 4.0f, 2.0f, 3.0f;

    REQUIRE(core::compute_percentile(data, 0.0f) == Catch::Approx(1.0f));
    REQUIRE(core::compute_percentile(data, 50.0f) == Catch::Approx(3.0f));
    REQUIRE(core::compute_percentile(data, 100.0f) == Catch::Approx(5.0f));
    REQUIRE(core::compute_percentile(data, 12.5f) == Catch::Approx(1.5f));
}

TEST_CASE("glob_match_supports_star_and_question_mark") {
    REQUIRE(core::glob_match("*.tif", "flat_01.tif"));
    REQUIRE(core::glob_match("flat_??.tif", "flat_01.tif"));
    REQUIRE_FALSE(core::glob_match("*.tif", "flat_01.tiff"));
    REQUIRE_FALSE(core::glob_match("flat_?.tif", "flat_01.tif"));
    REQUIRE(core::glob_match("a+b(1).tif", "a+b(1).tif"));
}

TEST_CASE("glob_expression_lists_regular_files_sorted") {
    TempDir tmp;
    std::ofstream(tmp.path() / "b.tif") << "x";
    std::ofstream(tmp.path() / "a.tif") << "x";
    std::ofstream(tmp.path() / "c.raw") << "x";
    std::filesystem::create_directories(tmp.path() / "dir.tif");

    auto files = core::glob_expression((tmp.path() / "*.tif").string());

    REQUIRE(files.size() == 2);
    REQUIRE(files[0].filename() == "a.tif");
    REQUIRE(files[1].filename() == "b.tif");
    REQUIRE(core::glob_expression((tmp.path() / "missing" / "*.tif").string()).empty());
}

TEST_CASE("to_lower_handles_extensions") {
    REQUIRE(core::to_lower("AbC.TIF") == "abc.tif");
}

TEST_CASE("text_files_round_trip_and_missing_file_throws") {
    TempDir tmp;
    auto path = tmp.path() / "note.txt";
    core::write_text(path, "hello\n");
    REQUIRE(core::read_text(path) == "hello\n");
    REQUIRE_THROWS_AS(core::read_text(tmp.path() / "nope.txt"), flat_tune::IOError);
}

TEST_CASE("event_emitter_writes_one_json_object_per_line") {
    std::ostringstream out;
    core::EventEmitter events(&out);
    events.flat_written("/out/flats/0_0.tif", "0_0");
    events.error("VALIDATION", "0_0", "bad");

    std::istringstream lines(out.str());
    std::string line;
    std::vector<nlohmann::json> parsed;
    while (std::getline(lines, line)) {
        parsed.push_back(nlohmann::json::parse(line));
    }

    REQUIRE(parsed.size() == 2);
    REQUIRE(parsed[0]["type"].get<std::string>() == "flat_written");
    REQUIRE(parsed[0]["grid"].get<std::string>() == "0_0");
    REQUIRE(parsed[0].contains("ts"));
    REQUIRE(parsed[1]["type"].get<std::string>() == "error");
    REQUIRE(parsed[1]["kind"].get<std::string>() == "VALIDATION");
}

TEST_CASE("event_emitter_without_stream_is_silent") {
    core::EventEmitter events;
    REQUIRE_NOTHROW(events.warning("nothing listens"));
}

TEST_CASE("preview_clips_at_percentile_and_scales_to_8_bit") {
    Matrix2Df composite(1, 5);
    composite << -3.0f, 0.0f, 50.0f, 100.0f, 1000.0f;

    auto preview = flat_tune::image::render_preview(composite, 75.0f);

    REQUIRE(preview.rows == 1);
    REQUIRE(preview.cols == 5);
    REQUIRE(preview.high == Catch::Approx(100.0f));
    REQUIRE(preview.pixels[0] == 0);
    REQUIRE(preview.pixels[1] == 0);
    REQUIRE(preview.pixels[2] == 128);
    REQUIRE(preview.pixels[3] == 255);
    REQUIRE(preview.pixels[4] == 255);
}

TEST_CASE("preview_of_dark_composite_is_black") {
    Matrix2Df composite = Matrix2Df::Zero(2, 2);
    auto preview = flat_tune::image::render_preview(composite, 99.0f);
    REQUIRE(preview.pixels.size() == 4);
    REQUIRE(preview.pixels[3] == 0);

    auto empty = flat_tune::image::render_preview(Matrix2Df(0, 0), 99.0f);
    REQUIRE(empty.pixels.empty());
}

TEST_CASE("list_directory_failures_are_io_errors") {
    TempDir tmp;
    auto file = tmp.path() / "plain.txt";
    std::ofstream(file) << "x";
    fs::create_directories(tmp.path() / "sub");

    REQUIRE(flat_tune::core::list_directory(tmp.path()).size() == 2);
    REQUIRE_THROWS_AS(flat_tune::core::list_directory(file), flat_tune::IOError);
    REQUIRE_THROWS_AS(flat_tune::core::list_directory(tmp.path() / "missing"),
                      flat_tune::IOError);
}

TEST_CASE("glob_treats_brackets_literally") {
    REQUIRE(flat_tune::core::glob_match("FLAT_[1].tif", "FLAT_[1].tif"));
    REQUIRE_FALSE(flat_tune::core::glob_match("FLAT_[1].tif", "FLAT_1.tif"));
    REQUIRE(flat_tune::core::glob_match("[*].tif", "[a].tif"));

    TempDir tmp;
    std::ofstream(tmp.path() / "FLAT_[1].tif") << "x";
    std::ofstream(tmp.path() / "FLAT_1.tif") << "x";
    auto files = flat_tune::core::glob_expression((tmp.path() / "FLAT_[1].tif").string());
    REQUIRE(files.size() == 1);
    REQUIRE(files[0].filename() == "FLAT_[1].tif");
}
