#include <catch2/catch_test_macros.hpp>
#include "image.hpp"
#include "test_helpers.hpp"
#include <opencv2/imgcodecs.hpp>
#include <cstdio>
#include <fstream>

using namespace papernotes;
using namespace papernotes::testing;

// ── load_image ──────────────────────────────────────────────────

TEST_CASE("load_image: decodes a PNG file", "[image]") {
    std::string path = write_test_image("load_ok", 320, 240);
    auto img = load_image(path);
    REQUIRE(img.has_value());
    REQUIRE(img->width() == 320);
    REQUIRE(img->height() == 240);
    REQUIRE(img->source == path);
    REQUIRE(img->pixels.channels() == 3);
    std::remove(path.c_str());
}

TEST_CASE("load_image: missing file yields nullopt", "[image]") {
    REQUIRE_FALSE(load_image(temp_path("does_not_exist") + ".png").has_value());
}

TEST_CASE("load_image: directory yields nullopt", "[image]") {
    REQUIRE_FALSE(load_image("/tmp").has_value());
}

TEST_CASE("load_image: undecodable bytes yield nullopt", "[image]") {
    std::string path = temp_path("garbage") + ".png";
    {
        std::ofstream f(path, std::ios::binary);
        f << "this is not an image";
    }
    REQUIRE_FALSE(load_image(path).has_value());
    std::remove(path.c_str());
}

// ── validate_image ──────────────────────────────────────────────

static Image blank(int w, int h) {
    Image img;
    img.pixels = cv::Mat(h, w, CV_8UC3, cv::Scalar(0, 0, 0));
    return img;
}

TEST_CASE("validate_image: normal size has no warnings", "[image]") {
    auto notes = validate_image(blank(640, 480), ImageLimits{});
    REQUIRE(notes.size() == 1);
    REQUIRE(notes[0] == "Size: 640x480");
    REQUIRE_FALSE(has_warnings(notes));
}

TEST_CASE("validate_image: small image warns", "[image]") {
    auto notes = validate_image(blank(80, 300), ImageLimits{});
    REQUIRE(notes.size() == 2);
    REQUIRE(notes[1].find("too small") != std::string::npos);
    REQUIRE(has_warnings(notes));
}

TEST_CASE("validate_image: large image warns", "[image]") {
    ImageLimits limits;
    limits.max_side = 500;
    auto notes = validate_image(blank(600, 200), limits);
    REQUIRE(notes.size() == 2);
    REQUIRE(notes[1].find("very large") != std::string::npos);
    REQUIRE(has_warnings(notes));
}

TEST_CASE("validate_image: limits are inclusive", "[image]") {
    ImageLimits limits;
    limits.min_side = 100;
    limits.max_side = 200;
    REQUIRE_FALSE(has_warnings(validate_image(blank(100, 200), limits)));
}

// ── preprocess_for_ocr ──────────────────────────────────────────

TEST_CASE("preprocess_for_ocr: grayscale and upscaled", "[image]") {
    Image img = blank(320, 160);
    img.source = "note.png";
    Image out = preprocess_for_ocr(img, 640);
    REQUIRE(out.pixels.channels() == 1);
    REQUIRE(out.height() == 640);
    REQUIRE(out.width() == 1280);
    REQUIRE(out.source == "note.png");
    // Input untouched
    REQUIRE(img.pixels.channels() == 3);
}

TEST_CASE("preprocess_for_ocr: large image keeps its size", "[image]") {
    Image out = preprocess_for_ocr(blank(1000, 800), 640);
    REQUIRE(out.pixels.channels() == 1);
    REQUIRE(out.width() == 1000);
    REQUIRE(out.height() == 800);
}

TEST_CASE("preprocess_for_ocr: empty image stays empty", "[image]") {
    REQUIRE(preprocess_for_ocr(Image{}, 640).empty());
}

// ── encode_png ──────────────────────────────────────────────────

TEST_CASE("encode_png: produces a decodable PNG", "[image]") {
    std::string bytes = encode_png(blank(16, 12));
    REQUIRE(bytes.size() > 8);
    REQUIRE(bytes.compare(1, 3, "PNG") == 0);

    std::vector<uchar> buf(bytes.begin(), bytes.end());
    cv::Mat decoded = cv::imdecode(buf, cv::IMREAD_COLOR);
    REQUIRE(decoded.cols == 16);
    REQUIRE(decoded.rows == 12);
}

TEST_CASE("encode_png: empty image throws", "[image]") {
    REQUIRE_THROWS_AS(encode_png(Image{}), std::runtime_error);
}
