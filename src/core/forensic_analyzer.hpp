/**
 * @file    forensic_analyzer.hpp
 * @brief   Tamper and watermark-stripping forensics
 * @author  pngprotect contributors
 * @date    2026.10.16
 * @license MIT
 *
 * @details
 * Three integrity signals, each in [0, 1] with 1 meaning "looks tampered":
 *
 * 1. LSB disorder
 *    - watermark located: 2 x carrier bit error rate (saturating)
 *    - otherwise: max(H, 1 - H) for the normalized entropy H of 2x2 LSB
 *      patterns per colour channel
 * 2. Watermark state: valid 0, valid with damaged copies 0.35,
 *    corrupted 0.75, absent 1
 * 3. Recompression: period-8 spectral peak of the luminance difference
 *    profiles (JPEG block grid), measured with the carrier planes removed
 *
 * confidence = 100 * (w1*s1 + w2*s2 + w3*s3) / (w1 + w2 + w3)
 *
 * Deterministic for identical input bytes.
 */

#pragma once

#include "core/pixel_buffer.hpp"
#include "core/watermark_codec.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pngp {

struct ForensicConfig {
    double lsb_weight = 0.4;
    double watermark_weight = 0.4;
    double recompression_weight = 0.2;

    double ber_flag_threshold = 0.02;           // "lsb-plane-disturbed" above this
    double recompression_flag_threshold = 0.5;  // "recompression-detected" at or above this
    double peak_ratio_floor = 3.0;              // Peak ratio mapped to signal 0
    double peak_ratio_span = 7.0;               // floor + span maps to signal 1
};

enum class TamperStatus {
    Intact,         // Valid watermark, every copy clean, no recompression
    Modified,       // Watermark present but damaged, or recompressed
    NoWatermark,
};

const char* to_string(TamperStatus status);

namespace flags {
constexpr std::string_view kLsbPlaneDisturbed = "lsb-plane-disturbed";
constexpr std::string_view kWatermarkMissing = "watermark-missing";
constexpr std::string_view kWatermarkCorrupted = "watermark-corrupted";
constexpr std::string_view kWatermarkPartial = "watermark-partial";
constexpr std::string_view kRecompressionDetected = "recompression-detected";
constexpr std::string_view kOwnerMismatch = "owner-mismatch";
constexpr std::string_view kOwnerUnverified = "owner-unverified";
}  // namespace flags

struct TamperVerdict {
    double confidence = 0.0;                // [0, 100]
    std::vector<std::string> flags;         // Fixed order, no duplicates
    std::optional<bool> owner_match;        // Set only when an owner was claimed
    TamperStatus status = TamperStatus::NoWatermark;
    ExtractResult watermark;

    double lsb_disorder = 0.0;
    double watermark_signal = 0.0;
    double recompression_signal = 0.0;

    bool has_flag(std::string_view flag) const;

    bool operator==(const TamperVerdict& other) const;
};

class ForensicAnalyzer {
public:
    explicit ForensicAnalyzer(ForensicConfig config = {});

    /**
     * @param image          Image to examine (not modified)
     * @param claimed_owner  Optional owner id to compare with the watermark
     * @throws InvalidImageError  on an empty buffer
     */
    TamperVerdict analyze(const PixelBuffer& image,
                          const std::optional<std::string>& claimed_owner = std::nullopt) const;

    /**
     * Normalized entropy of non-overlapping 2x2 LSB patterns, averaged
     * over colour channels. 1 for uniform noise, 0 for a constant plane.
     */
    static double lsb_pattern_entropy(const PixelBuffer& image);

    /**
     * Period-8 peak ratio of the column and row difference profiles
     * (the larger of the two). 0 when the image is too small.
     *
     * @param carrier  Bit planes of this plan are cleared first (optional)
     */
    static double block_grid_ratio(const PixelBuffer& image, const CarrierPlan* carrier = nullptr);

    const ForensicConfig& config() const noexcept { return config_; }

private:
    ForensicConfig config_;
    WatermarkCodec codec_;
};

}  // namespace pngp
