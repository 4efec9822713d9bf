#pragma once
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace papernotes {

// A decoded input image. Pixels are 8-bit BGR (or single-channel after
// OCR preprocessing).
struct Image {
    std::string source;
    cv::Mat pixels;

    int width() const { return pixels.cols; }
    int height() const { return pixels.rows; }
    bool empty() const { return pixels.empty(); }
};

struct ImageLimits {
    uint32_t min_side = 100;
    uint32_t max_side = 4000;
};

// Decode an image file. Returns nullopt when the file is missing,
// unreadable or not a decodable image.
std::optional<Image> load_image(const std::string& path);

// Sanity checks on image dimensions. Returns human-readable annotations
// ("Size: WxH", warnings for too small / very large). Never fails.
std::vector<std::string> validate_image(const Image& image, const ImageLimits& limits);

// True if any annotation from validate_image is a warning
bool has_warnings(const std::vector<std::string>& annotations);

// Grayscale copy, upscaled so the shorter side is at least `min_short_side`
// pixels. OCR engines receive this instead of the raw scan when enabled.
Image preprocess_for_ocr(const Image& image, int min_short_side = 640);

// Encode as PNG bytes. Throws std::runtime_error if encoding fails.
std::string encode_png(const Image& image);

} // namespace papernotes
