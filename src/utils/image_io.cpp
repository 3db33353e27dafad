/**
 * @file    image_io.cpp
 * @brief   Decode and encode image files at the core boundary
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 */

#include "utils/image_io.hpp"
#include "utils/path_formatter.hpp"
#include "core/errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fstream>
#include <iterator>

namespace pngp {

namespace {

// Bring any decoded matrix to CV_8UC1/3/4
cv::Mat to_canonical(cv::Mat image) {
    switch (image.depth()) {
        case CV_8U:
            break;
        case CV_16U:
            image.convertTo(image, CV_8U, 1.0 / 257.0);
            break;
        case CV_32F:
        case CV_64F:
            image.convertTo(image, CV_8U, 255.0);
            break;
        default:
            throw InvalidImageError(fmt::format("Unsupported sample depth {}", image.depth()));
    }

    if (image.channels() == 2) {
        // Gray + alpha
        std::vector<cv::Mat> planes;
        cv::split(image, planes);
        cv::Mat bgra;
        cv::merge(std::vector<cv::Mat>{planes[0], planes[0], planes[0], planes[1]}, bgra);
        image = bgra;
    }
    return image;
}

std::vector<int> encode_params(const std::string& ext) {
    if (ext == ".jpg" || ext == ".jpeg") {
        // Still lossy, but best quality
        return {cv::IMWRITE_JPEG_QUALITY, 100};
    }
    if (ext == ".png") {
        return {cv::IMWRITE_PNG_COMPRESSION, 6};
    }
    if (ext == ".webp") {
        // 101+ selects lossless mode
        return {cv::IMWRITE_WEBP_QUALITY, 101};
    }
    return {};
}

void ensure_parent(const std::filesystem::path& path) {
    auto output_dir = path.parent_path();
    if (!output_dir.empty() && !std::filesystem::exists(output_dir)) {
        std::filesystem::create_directories(output_dir);
    }
}

}  // namespace

PixelBuffer decode_pixel_buffer(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        throw InvalidImageError("decode: empty input");
    }

    const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8U, const_cast<uint8_t*>(bytes.data()));
    cv::Mat image = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    if (image.empty()) {
        throw InvalidImageError(fmt::format("decode: {} bytes are not a supported image", bytes.size()));
    }
    return PixelBuffer(to_canonical(std::move(image)));
}

PixelBuffer load_pixel_buffer(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IoError(fmt::format("Failed to open image: {}", path));
    }
    const std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                     std::istreambuf_iterator<char>());

    try {
        PixelBuffer buffer = decode_pixel_buffer(bytes);
        spdlog::debug("Loaded {} ({}x{}x{})", path.filename(),
                      buffer.width(), buffer.height(), buffer.channels());
        return buffer;
    } catch (const InvalidImageError& e) {
        throw InvalidImageError(fmt::format("{}: {}", path, e.what()));
    }
}

std::vector<uint8_t> encode_png(const PixelBuffer& image) {
    image.validate("encode");
    std::vector<uint8_t> bytes;
    if (!cv::imencode(".png", image.samples(), bytes, encode_params(".png"))) {
        throw IoError("PNG encoding failed");
    }
    return bytes;
}

std::filesystem::path save_pixel_buffer(const std::filesystem::path& path, const PixelBuffer& image) {
    image.validate("save");

    std::filesystem::path output = path;
    if (extension_lower(output) != ".png") {
        output.replace_extension(".png");
        spdlog::warn("Lossy or unknown output format for {}, writing {} instead",
                     path.filename(), output.filename());
    }

    ensure_parent(output);
    if (!cv::imwrite(output.string(), image.samples(), encode_params(".png"))) {
        throw IoError(fmt::format("Failed to write image: {}", output));
    }

    spdlog::info("Saved: {}", output.filename());
    return output;
}

void strip_metadata(const std::filesystem::path& input, const std::filesystem::path& output) {
    const PixelBuffer image = load_pixel_buffer(input);

    ensure_parent(output);
    if (!cv::imwrite(output.string(), image.samples(), encode_params(extension_lower(output)))) {
        throw IoError(fmt::format("Failed to write image: {}", output));
    }

    spdlog::info("Stripped metadata: {} -> {}", input.filename(), output.filename());
}

}  // namespace pngp
