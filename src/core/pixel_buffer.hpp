/**
 * @file    pixel_buffer.hpp
 * @brief   Normalized in-memory image representation
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 *
 * @details
 * A PixelBuffer owns a dense height x width x channels grid of 8-bit
 * samples (1, 3 or 4 channels). Numeric engines work on the derived float
 * view in [0, 1]; from_float() quantizes back to the canonical form.
 *
 * Copies are deep: two buffers never share sample storage.
 */

#pragma once

#include <opencv2/core.hpp>
#include <cstddef>
#include <cstdint>

namespace pngp {

class PixelBuffer {
public:
    PixelBuffer() = default;

    /**
     * Allocate a zero-filled buffer
     *
     * @throws InvalidImageError  on non-positive dimensions or unsupported channel count
     */
    PixelBuffer(int height, int width, int channels);

    /**
     * Take ownership of decoded samples
     *
     * @param samples  CV_8UC1, CV_8UC3 or CV_8UC4 matrix (always cloned)
     * @throws InvalidImageError  on any other type
     */
    explicit PixelBuffer(cv::Mat samples);

    PixelBuffer(const PixelBuffer& other);
    PixelBuffer& operator=(const PixelBuffer& other);
    PixelBuffer(PixelBuffer&&) noexcept = default;
    PixelBuffer& operator=(PixelBuffer&&) noexcept = default;
    ~PixelBuffer() = default;

    /**
     * Quantize a float view back to canonical samples
     *
     * Values are scaled by 255, rounded to nearest and saturated.
     *
     * @param values  CV_32FC1/3/4 matrix with samples in [0, 1]
     */
    static PixelBuffer from_float(const cv::Mat& values);

    int height() const noexcept { return samples_.rows; }
    int width() const noexcept { return samples_.cols; }
    int channels() const noexcept { return samples_.empty() ? 0 : samples_.channels(); }

    // Channels that carry colour (alpha excluded)
    int color_channels() const noexcept { return channels() == 4 ? 3 : channels(); }
    bool has_alpha() const noexcept { return channels() == 4; }

    bool empty() const noexcept { return samples_.empty(); }
    size_t pixel_count() const noexcept { return samples_.total(); }
    size_t sample_count() const noexcept { return samples_.total() * static_cast<size_t>(channels()); }

    const cv::Mat& samples() const noexcept { return samples_; }
    cv::Mat& samples() noexcept { return samples_; }

    uint8_t* data() noexcept { return samples_.data; }
    const uint8_t* data() const noexcept { return samples_.data; }

    uint8_t at(int y, int x, int c) const {
        return samples_.ptr<uint8_t>(y)[x * channels() + c];
    }

    /**
     * Float view (CV_32FC(n), samples / 255)
     */
    cv::Mat to_float() const;

    /**
     * Throw InvalidImageError unless the buffer holds at least one pixel
     *
     * @param operation  Name used in the error message
     */
    void validate(const char* operation) const;

    bool operator==(const PixelBuffer& other) const;
    bool operator!=(const PixelBuffer& other) const { return !(*this == other); }

private:
    cv::Mat samples_;
};

}  // namespace pngp
