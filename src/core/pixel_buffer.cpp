/**
 * @file    pixel_buffer.cpp
 * @brief   PixelBuffer implementation
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 */

#include "core/pixel_buffer.hpp"
#include "core/errors.hpp"

#include <fmt/format.h>
#include <cstring>

namespace pngp {

namespace {

bool is_supported_channel_count(int channels) {
    return channels == 1 || channels == 3 || channels == 4;
}

}  // namespace

PixelBuffer::PixelBuffer(int height, int width, int channels) {
    if (height <= 0 || width <= 0) {
        throw InvalidImageError(fmt::format("Invalid image size {}x{}", width, height));
    }
    if (!is_supported_channel_count(channels)) {
        throw InvalidImageError(fmt::format("Unsupported channel count {}", channels));
    }
    samples_ = cv::Mat::zeros(height, width, CV_8UC(channels));
}

PixelBuffer::PixelBuffer(cv::Mat samples) {
    if (samples.empty()) {
        // An empty buffer is representable; engines reject it in validate()
        return;
    }
    if (samples.depth() != CV_8U || !is_supported_channel_count(samples.channels())) {
        throw InvalidImageError(fmt::format(
            "Unsupported sample layout: depth {} with {} channels (expected 8-bit, 1/3/4 channels)",
            samples.depth(), samples.channels()));
    }
    // Detach from the caller's header so no two owners share samples
    samples_ = samples.clone();
}

PixelBuffer::PixelBuffer(const PixelBuffer& other)
    : samples_(other.samples_.clone()) {}

PixelBuffer& PixelBuffer::operator=(const PixelBuffer& other) {
    if (this != &other) {
        samples_ = other.samples_.clone();
    }
    return *this;
}

PixelBuffer PixelBuffer::from_float(const cv::Mat& values) {
    if (values.empty()) {
        return PixelBuffer();
    }
    if (values.depth() != CV_32F || !is_supported_channel_count(values.channels())) {
        throw InvalidImageError("Float view must be CV_32F with 1, 3 or 4 channels");
    }
    cv::Mat quantized;
    // convertTo rounds to nearest and saturates to [0, 255]
    values.convertTo(quantized, CV_8U, 255.0);
    return PixelBuffer(std::move(quantized));
}

cv::Mat PixelBuffer::to_float() const {
    cv::Mat view;
    samples_.convertTo(view, CV_32F, 1.0 / 255.0);
    return view;
}

void PixelBuffer::validate(const char* operation) const {
    if (samples_.empty() || samples_.rows <= 0 || samples_.cols <= 0) {
        throw InvalidImageError(fmt::format("{}: empty image provided", operation));
    }
}

bool PixelBuffer::operator==(const PixelBuffer& other) const {
    if (samples_.rows != other.samples_.rows ||
        samples_.cols != other.samples_.cols ||
        channels() != other.channels()) {
        return false;
    }
    if (samples_.empty()) {
        return true;
    }
    return std::memcmp(samples_.data, other.samples_.data, sample_count()) == 0;
}

}  // namespace pngp
