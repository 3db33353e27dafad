/**
 * @file    adversarial_shield.hpp
 * @brief   Bounded adversarial perturbation against a feature extractor
 * @author  pngprotect contributors
 * @date    2026.10.16
 * @license MIT
 *
 * @details
 * Projected gradient-sign ascent inside an L-infinity ball:
 *
 *   delta_0   = uniform(-eps, eps)               seeded, colour channels only
 *   delta_t+1 = clip(delta_t + alpha * sign(dJ/dx), -eps, eps)
 *   x_t       = clip(x0 + delta_t, 0, 1)
 *
 * The last iterate is pushed onto the faces of the ball (|delta| = eps
 * wherever it is non-zero) before 8-bit quantization. Epsilon is kept on
 * the 8-bit grid and never above the perceptual threshold, so the mean
 * absolute delta after quantization stays within the threshold and grows
 * with the level.
 *
 * The robustness score is the model's clean-image deviation mapped to
 * [0, 100]; a higher score means the model sees less of the image.
 */

#pragma once

#include "core/feature_extractor.hpp"
#include "core/pixel_buffer.hpp"
#include "core/watermark_codec.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace pngp {

enum class TargetMode {
    Untargeted,             // Maximize clean_deviation()
    EmbeddingDistance,      // Maximize log-embedding distance from the input
};

const char* to_string(TargetMode mode);
std::optional<TargetMode> parse_target_mode(std::string_view text);

struct PerturbationSpec {
    double epsilon = 0.0;   // Max per-sample |delta|, normalized units
    int steps = 0;
    double step_size = 0.0; // alpha
    TargetMode mode = TargetMode::Untargeted;
    bool capped = false;    // Epsilon limited by the perceptual threshold
};

struct ShieldConfig {
    double max_epsilon = 12.0 / 255.0;      // Epsilon at level 100
    int min_steps = 2;
    int max_steps = 10;
    double step_scale = 2.5;                // alpha = step_scale * eps / steps
    TargetMode target_mode = TargetMode::Untargeted;
    double perceptual_threshold = 0.04;     // Max mean |delta| after quantization
    uint64_t seed = 0x504E4750;
    bool preserve_watermark = true;         // Keep carrier bit planes of a detected watermark
};

struct ShieldResult {
    PixelBuffer image;
    double robustness_score = 0.0;          // Score of the protected image, [0, 100]
    double baseline_score = 0.0;            // Score of the input, [0, 100]
    double distortion = 0.0;                // Mean |delta| over colour samples, normalized
    double max_abs_delta = 0.0;
    double psnr = 0.0;                      // dB, infinite for an unchanged image
    double epsilon = 0.0;                   // Per-sample bound actually applied
    int steps = 0;
    double embedding_shift = 0.0;           // RMS change of the log embedding
    int watermark_strength = 0;             // Strength whose carrier was preserved (0 if none)
    bool capped = false;                    // Perceptual threshold limited epsilon
};

class AdversarialShield {
public:
    /**
     * @param model   Shared read-only extractor, usually from ModelRegistry
     * @throws ModelUnavailableError  if model is null
     */
    explicit AdversarialShield(std::shared_ptr<const FeatureExtractor> model,
                               ShieldConfig config = {});

    /**
     * Linear map from protection level to perturbation parameters
     *
     * Epsilon is floored to whole 8-bit steps and capped at the largest
     * step within the perceptual threshold; steps follow epsilon.
     *
     * @throws std::invalid_argument  if level is outside [0, 100]
     */
    PerturbationSpec spec_for_level(int level) const;

    /**
     * Synthesize a protected copy
     *
     * @param image        Input (not modified)
     * @param level        0..100, an unchanged copy when epsilon is below one 8-bit step
     * @param cancel_flag  Optional, checked before every gradient step
     * @throws InvalidImageError      on an empty buffer
     * @throws ModelUnavailableError  if the model has no gradient
     * @throws Cancelled              if cancel_flag was raised
     */
    ShieldResult protect(const PixelBuffer& image,
                         int level,
                         const std::atomic<bool>* cancel_flag = nullptr) const;

    /**
     * Robustness score in [0, 100]
     *
     * @throws InvalidImageError  on an empty buffer
     */
    double score(const PixelBuffer& image) const;

    const ShieldConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<const FeatureExtractor> model_;
    ShieldConfig config_;
    WatermarkCodec codec_;

    // Objective value at embedding, gradient written to d_embedding
    double objective(const cv::Mat& embedding,
                     const cv::Mat& reference,
                     TargetMode mode,
                     cv::Mat& d_embedding) const;
};

}  // namespace pngp
