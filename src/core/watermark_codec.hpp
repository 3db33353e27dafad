/**
 * @file    watermark_codec.hpp
 * @brief   LSB ownership watermark codec with cyclic redundancy
 * @author  pngprotect contributors
 * @date    2026.10.16
 * @license MIT
 *
 * @details
 * The serialized payload is written into the low bit planes of the colour
 * channels in raster order (row-major, channel-major within a pixel, bit
 * plane 0 first) and repeated cyclically until the carrier is full.
 *
 * Strength selects a carrier plan:
 *
 *   strength | pixel step | bits per colour channel | bits / pixel (RGB)
 *   ---------+------------+-------------------------+-------------------
 *       1    |     2      |        1, 0, 0          |       0.5
 *       2    |     1      |        1, 0, 0          |       1
 *       3    |     1      |        1, 1, 0          |       2
 *       4    |     1      |        1, 1, 1          |       3
 *       5    |     1      |        2, 1, 1          |       4
 *       6    |     1      |        2, 2, 1          |       5
 *       7    |     1      |        2, 2, 2          |       6
 *       8    |     1      |        3, 2, 2          |       7
 *       9    |     1      |        3, 3, 2          |       8
 *      10    |     1      |        3, 3, 3          |       9
 *
 * Extraction is not told the strength, so it walks the plans in order and
 * votes across the repeated copies found in each.
 */

#pragma once

#include "core/pixel_buffer.hpp"
#include "core/watermark_payload.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pngp {

constexpr int kMinStrength = 1;
constexpr int kMaxStrength = 10;

/**
 * Which samples and bit planes carry payload bits at a given strength
 */
struct CarrierPlan {
    int strength;
    int pixel_step;             // Use every Nth pixel in raster order
    std::array<int, 3> bits;    // Low bit planes used per colour channel

    int bits_for(int channel) const { return channel < 3 ? bits[channel] : 0; }

    // Carrier bits per used pixel for an image with this many colour channels
    int bits_per_pixel(int color_channels) const;

    // Plans that touch exactly the same slots on such an image are equivalent
    bool equivalent(const CarrierPlan& other, int color_channels) const;
};

/**
 * @throws std::invalid_argument  if strength is outside [1, 10]
 */
CarrierPlan carrier_plan(int strength);

/**
 * Number of carrier bits available at a strength.
 * Deterministic in (height, width, channels, strength).
 */
size_t carrier_capacity_bits(int height, int width, int channels, int strength);

/**
 * Longest owner id (bytes) for which one full copy fits
 */
size_t max_payload_length(int height, int width, int channels, int strength);

enum class WatermarkValidity {
    Valid,
    NotFound,
    Corrupted,
};

const char* to_string(WatermarkValidity validity);

struct EmbedResult {
    PixelBuffer image;              // Watermarked copy of the input
    int strength;
    int bits_per_pixel;             // Carrier bits per used pixel
    size_t capacity_bits;
    size_t payload_bits;            // Bits of one serialized copy
    size_t copies_written;          // Complete copies (a trailing partial copy is not counted)
    double capacity_utilization;    // payload_bits / capacity_bits
};

// Carrier stream packed MSB first, slot 0 in the top bit of bytes[0]
struct CarrierBits {
    std::vector<uint8_t> bytes;
    size_t bit_count = 0;

    uint8_t bit(size_t index) const noexcept {
        return (bytes[index >> 3] >> (7 - (index & 7))) & 1;
    }

    // Whole bytes of the stream starting at any bit offset
    std::vector<uint8_t> realign(size_t bit_offset) const;
};

struct ExtractResult {
    std::optional<WatermarkPayload> payload;
    WatermarkValidity validity = WatermarkValidity::NotFound;
    bool partial_recovery = false;  // Some copies failed their checksum
    int strength = 0;               // Strength whose plan held the marker (0 if none)
    int carrier_phase = 0;          // First carrier pixel of a sparse plan
    size_t copies_found = 0;
    size_t copies_intact = 0;
    double bit_error_rate = 0.0;    // Carrier bits disagreeing with the recovered copy
    float confidence = 0.0f;        // [0, 1]

    bool valid() const noexcept { return validity == WatermarkValidity::Valid; }
};

class WatermarkCodec {
public:
    WatermarkCodec() = default;

    /**
     * Embed an owner id
     *
     * @param image     Cover image (not modified)
     * @param payload   Owner payload
     * @param strength  1..10, see the plan table
     * @return          New watermarked buffer and embedding statistics
     * @throws InvalidImageError  on an empty buffer
     * @throws CapacityError      if one full copy does not fit
     */
    EmbedResult embed(const PixelBuffer& image,
                      const WatermarkPayload& payload,
                      int strength) const;

    EmbedResult embed(const PixelBuffer& image,
                      const std::string& owner_id,
                      int strength) const;

    /**
     * Recover the owner id, scanning every supported strength
     *
     * Never throws for missing or damaged watermarks; see ExtractResult.
     *
     * @throws InvalidImageError  on an empty buffer
     */
    ExtractResult extract(const PixelBuffer& image) const;

    /**
     * Recover using a single known plan, at every pixel phase of a sparse plan
     */
    ExtractResult extract_with_plan(const PixelBuffer& image, const CarrierPlan& plan) const;

    /**
     * Quick check used before re-watermarking
     */
    bool has_watermark(const PixelBuffer& image) const;

    /**
     * Read every carrier bit of a plan in slot order
     *
     * @param first_pixel  Pixel holding slot 0, the phase of a sparse plan
     */
    static CarrierBits read_carrier(const PixelBuffer& image,
                                    const CarrierPlan& plan,
                                    size_t first_pixel = 0);

    /**
     * Fill every carrier slot of a plan, repeating stream_bits cyclically
     */
    static void write_carrier(PixelBuffer& image,
                              const CarrierPlan& plan,
                              std::span<const uint8_t> stream_bits);
};

}  // namespace pngp
