#include "image.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace papernotes {

static const char* kWarningPrefix = "warning: ";

std::optional<Image> load_image(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        std::cerr << "[image] Not a readable file: " << path << "\n";
        return std::nullopt;
    }

    Image image;
    image.source = path;
    try {
        image.pixels = cv::imread(path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        std::cerr << "[image] Decoder error for " << path << ": " << e.what() << "\n";
        return std::nullopt;
    }
    if (image.empty()) {
        std::cerr << "[image] Could not decode " << path << "\n";
        return std::nullopt;
    }
    return image;
}

std::vector<std::string> validate_image(const Image& image, const ImageLimits& limits) {
    std::vector<std::string> notes;
    int w = image.width();
    int h = image.height();
    notes.push_back("Size: " + std::to_string(w) + "x" + std::to_string(h));

    auto min_side = static_cast<int>(limits.min_side);
    auto max_side = static_cast<int>(limits.max_side);
    if (w < min_side || h < min_side) {
        notes.push_back(std::string(kWarningPrefix) + "image too small (min " +
                        std::to_string(min_side) + "x" + std::to_string(min_side) + ")");
    }
    if (w > max_side || h > max_side) {
        notes.push_back(std::string(kWarningPrefix) + "image very large (max side " +
                        std::to_string(max_side) + ", may be slow)");
    }
    return notes;
}

bool has_warnings(const std::vector<std::string>& annotations) {
    for (const auto& a : annotations) {
        if (a.rfind(kWarningPrefix, 0) == 0) return true;
    }
    return false;
}

Image preprocess_for_ocr(const Image& image, int min_short_side) {
    Image out;
    out.source = image.source;
    if (image.empty()) return out;

    cv::Mat gray;
    if (image.pixels.channels() == 1) {
        gray = image.pixels.clone();
    } else {
        cv::cvtColor(image.pixels, gray, cv::COLOR_BGR2GRAY);
    }

    int short_side = std::min(gray.cols, gray.rows);
    if (short_side > 0 && short_side < min_short_side) {
        double scale = static_cast<double>(min_short_side) / short_side;
        cv::resize(gray, out.pixels, cv::Size(), scale, scale, cv::INTER_CUBIC);
    } else {
        out.pixels = gray;
    }
    return out;
}

std::string encode_png(const Image& image) {
    if (image.empty()) {
        throw std::runtime_error("cannot encode an empty image");
    }
    std::vector<uchar> buf;
    if (!cv::imencode(".png", image.pixels, buf)) {
        throw std::runtime_error("PNG encoding failed for " + image.source);
    }
    return std::string(buf.begin(), buf.end());
}

} // namespace papernotes
