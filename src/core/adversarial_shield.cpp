/**
 * @file    adversarial_shield.cpp
 * @brief   Projected gradient-sign perturbation and robustness scoring
 * @author  pngprotect contributors
 * @date    2026.10.16
 * @license MIT
 */

#include "core/adversarial_shield.hpp"
#include "core/errors.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace pngp {

namespace {

constexpr double kEmbeddingFloor = 1e-6;

// Carrier bit planes that quantization must leave untouched
struct CarrierLock {
    int pixel_step = 1;
    int phase = 0;
    std::array<int, 3> bits{0, 0, 0};
};

struct Distortion {
    double mean_abs = 0.0;
    double max_abs = 0.0;
    double psnr = std::numeric_limits<double>::infinity();
};

inline bool cancelled(const std::atomic<bool>* cancel_flag) {
    return cancel_flag && cancel_flag->load(std::memory_order_relaxed);
}

cv::Mat color_view(const cv::Mat& samples) {
    if (samples.channels() != 4) {
        return samples;
    }
    cv::Mat bgr;
    cv::cvtColor(samples, bgr, cv::COLOR_BGRA2BGR);
    return bgr;
}

// Statistics over colour samples in normalized units
Distortion measure(const PixelBuffer& original, const PixelBuffer& perturbed) {
    cv::Mat diff;
    cv::absdiff(color_view(original.samples()), color_view(perturbed.samples()), diff);

    Distortion d;
    double max_value = 0.0;
    cv::minMaxLoc(diff.reshape(1), nullptr, &max_value);
    d.max_abs = max_value / 255.0;

    diff.convertTo(diff, CV_32F);
    const cv::Scalar sum_abs = cv::sum(diff);
    const cv::Scalar sum_sq = cv::sum(diff.mul(diff));

    const double samples = static_cast<double>(diff.total()) * diff.channels();
    double abs_total = 0.0, sq_total = 0.0;
    for (int c = 0; c < diff.channels(); ++c) {
        abs_total += sum_abs[c];
        sq_total += sum_sq[c];
    }

    d.mean_abs = abs_total / samples / 255.0;
    if (sq_total > 0.0) {
        const double mse = sq_total / samples;
        d.psnr = 10.0 * std::log10((255.0 * 255.0) / mse);
    }
    return d;
}

/**
 * Round x0 + delta to 8 bits
 *
 * Locked samples only take values that share their original low bits.
 * Every sample ends within bound (normalized) of its original value;
 * alpha is copied through.
 */
PixelBuffer quantize(const PixelBuffer& original,
                     const cv::Mat& delta,
                     double bound,
                     const std::optional<CarrierLock>& lock) {
    PixelBuffer out(original);

    const int channels = original.channels();
    const int colors = original.color_channels();
    const size_t samples = original.sample_count();
    const double limit = bound * 255.0 + 1e-6;

    const uint8_t* src = original.data();
    uint8_t* dst = out.data();
    const float* d = delta.ptr<float>();

    for (size_t i = 0; i < samples; ++i) {
        const int c = static_cast<int>(i % static_cast<size_t>(channels));
        if (c >= colors) {
            continue;
        }

        int quantum = 1;
        if (lock) {
            const size_t pixel = i / static_cast<size_t>(channels);
            const size_t step = static_cast<size_t>(lock->pixel_step);
            if (pixel % step == static_cast<size_t>(lock->phase) && c < 3) {
                quantum = 1 << lock->bits[c];
            }
        }

        const int v0 = src[i];
        const int low = v0 & (quantum - 1);
        const double target = std::clamp(v0 + 255.0 * d[i], 0.0, 255.0);

        int v = static_cast<int>(std::lround((target - low) / quantum)) * quantum + low;
        while (v > 255) v -= quantum;
        while (v < 0) v += quantum;
        while (std::abs(v - v0) > limit) {
            v += v > v0 ? -quantum : quantum;
        }
        dst[i] = static_cast<uint8_t>(v);
    }
    return out;
}

double embedding_shift(const cv::Mat& a, const cv::Mat& b) {
    const float* pa = a.ptr<float>();
    const float* pb = b.ptr<float>();
    const int n = static_cast<int>(a.total());
    double sum = 0.0;
    for (int i = 0; i < n; ++i) {
        const double diff = std::log(pa[i] + kEmbeddingFloor) - std::log(pb[i] + kEmbeddingFloor);
        sum += diff * diff;
    }
    return n > 0 ? std::sqrt(sum / n) : 0.0;
}

}  // namespace

const char* to_string(TargetMode mode) {
    switch (mode) {
        case TargetMode::Untargeted:        return "untargeted";
        case TargetMode::EmbeddingDistance: return "embedding-distance";
    }
    return "unknown";
}

std::optional<TargetMode> parse_target_mode(std::string_view text) {
    if (text == "untargeted") return TargetMode::Untargeted;
    if (text == "embedding-distance") return TargetMode::EmbeddingDistance;
    return std::nullopt;
}

// =============================================================================
// AdversarialShield
// =============================================================================

AdversarialShield::AdversarialShield(std::shared_ptr<const FeatureExtractor> model,
                                     ShieldConfig config)
    : model_(std::move(model))
    , config_(config) {
    if (!model_) {
        throw ModelUnavailableError("Adversarial shield requires a feature extractor");
    }
}

PerturbationSpec AdversarialShield::spec_for_level(int level) const {
    if (level < 0 || level > 100) {
        throw std::invalid_argument(fmt::format("Protection level {} out of range [0, 100]", level));
    }

    PerturbationSpec spec;
    spec.mode = config_.target_mode;
    if (level == 0) {
        return spec;
    }

    // Only whole 8-bit steps survive quantization
    double epsilon = std::floor(config_.max_epsilon * level / 100.0 * 255.0 + 1e-9) / 255.0;
    const double ceiling = std::floor(config_.perceptual_threshold * 255.0 + 1e-9) / 255.0;
    if (epsilon > ceiling) {
        epsilon = ceiling;
        spec.capped = true;
    }
    if (epsilon <= 0.0) {
        return spec;
    }

    const double t = epsilon / config_.max_epsilon;
    spec.epsilon = epsilon;
    spec.steps = static_cast<int>(std::lround(
        config_.min_steps + (config_.max_steps - config_.min_steps) * t));
    spec.steps = std::max(spec.steps, 1);
    spec.step_size = config_.step_scale * spec.epsilon / spec.steps;
    return spec;
}

double AdversarialShield::score(const PixelBuffer& image) const {
    image.validate("score");
    const cv::Mat embedding = model_->forward(image.to_float());
    return model_->robustness_from_deviation(model_->clean_deviation(embedding));
}

double AdversarialShield::objective(const cv::Mat& embedding,
                                    const cv::Mat& reference,
                                    TargetMode mode,
                                    cv::Mat& d_embedding) const {
    if (mode == TargetMode::Untargeted) {
        return model_->clean_deviation(embedding, &d_embedding);
    }

    // J = mean((log(e + f) - log(e0 + f))^2)
    const int n = static_cast<int>(embedding.total());
    d_embedding = cv::Mat::zeros(1, n, CV_32F);
    const float* e = embedding.ptr<float>();
    const float* e0 = reference.ptr<float>();
    float* d = d_embedding.ptr<float>();

    double value = 0.0;
    for (int i = 0; i < n; ++i) {
        const double shifted = e[i] + kEmbeddingFloor;
        const double diff = std::log(shifted) - std::log(e0[i] + kEmbeddingFloor);
        value += diff * diff;
        d[i] = static_cast<float>(2.0 * diff / (shifted * n));
    }
    return value / n;
}

ShieldResult AdversarialShield::protect(const PixelBuffer& image,
                                        int level,
                                        const std::atomic<bool>* cancel_flag) const {
    image.validate("protect");
    const PerturbationSpec spec = spec_for_level(level);

    if (!model_->differentiable()) {
        throw ModelUnavailableError(fmt::format(
            "Model '{}' does not provide gradients", model_->name()));
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    const cv::Mat x0 = image.to_float();
    const cv::Mat e0 = model_->forward(x0);
    const double baseline = model_->robustness_from_deviation(model_->clean_deviation(e0));

    ShieldResult result;
    result.baseline_score = baseline;
    result.steps = spec.steps;

    if (spec.steps == 0) {
        result.image = image;
        result.robustness_score = baseline;
        return result;
    }

    // Locate a watermark to keep intact through quantization
    std::optional<CarrierLock> lock;
    if (config_.preserve_watermark) {
        const ExtractResult mark = codec_.extract(image);
        if (mark.strength > 0) {
            const CarrierPlan plan = carrier_plan(mark.strength);
            lock = CarrierLock{plan.pixel_step, mark.carrier_phase, plan.bits};
            result.watermark_strength = mark.strength;
            spdlog::debug("Protect: preserving {} watermark carrier at strength {}",
                          to_string(mark.validity), mark.strength);
        }
    }

    const int channels = image.channels();
    const int colors = image.color_channels();
    const size_t samples = image.sample_count();
    const float eps = static_cast<float>(spec.epsilon);
    const float alpha = static_cast<float>(spec.step_size);

    const float* base = x0.ptr<float>();

    // Random start inside the ball
    cv::RNG rng(config_.seed);
    cv::Mat delta = cv::Mat::zeros(x0.size(), x0.type());
    float* d = delta.ptr<float>();
    for (size_t i = 0; i < samples; ++i) {
        if (static_cast<int>(i % static_cast<size_t>(channels)) < colors) {
            const float v = rng.uniform(-eps, eps);
            d[i] = std::clamp(base[i] + v, 0.0f, 1.0f) - base[i];
        }
    }

    cv::Mat x(x0.size(), x0.type());
    float* px = x.ptr<float>();
    auto apply = [&]() {
        for (size_t i = 0; i < samples; ++i) {
            px[i] = std::clamp(base[i] + d[i], 0.0f, 1.0f);
            d[i] = px[i] - base[i];
        }
    };
    apply();

    double first_objective = 0.0;
    double last_objective = 0.0;
    cv::Mat d_embedding;

    for (int step = 0; step < spec.steps; ++step) {
        if (cancelled(cancel_flag)) {
            spdlog::info("Protect cancelled at step {}/{}", step, spec.steps);
            throw Cancelled();
        }

        const cv::Mat embedding = model_->forward(x);
        last_objective = objective(embedding, e0, spec.mode, d_embedding);
        if (step == 0) {
            first_objective = last_objective;
        }

        const cv::Mat gradient = model_->backward(x, d_embedding);
        const float* g = gradient.ptr<float>();
        for (size_t i = 0; i < samples; ++i) {
            const float direction = g[i] > 0.0f ? 1.0f : (g[i] < 0.0f ? -1.0f : 0.0f);
            d[i] = std::clamp(d[i] + alpha * direction, -eps, eps);
        }
        apply();
    }

    if (cancelled(cancel_flag)) {
        throw Cancelled();
    }

    // Push onto the faces of the ball
    for (size_t i = 0; i < samples; ++i) {
        if (d[i] > 0.0f) d[i] = eps;
        else if (d[i] < 0.0f) d[i] = -eps;
    }
    apply();

    // Each sample moves at most epsilon, which is within the threshold
    PixelBuffer protected_image = quantize(image, delta, spec.epsilon, lock);
    const Distortion distortion = measure(image, protected_image);
    if (spec.capped) {
        spdlog::debug("Protect: level {} capped at eps={:.5f} by threshold {:.4f}",
                      level, spec.epsilon, config_.perceptual_threshold);
    }

    const cv::Mat e_final = model_->forward(protected_image.to_float());

    result.robustness_score = model_->robustness_from_deviation(model_->clean_deviation(e_final));
    result.distortion = distortion.mean_abs;
    result.max_abs_delta = distortion.max_abs;
    result.psnr = distortion.psnr;
    result.epsilon = spec.epsilon;
    result.capped = spec.capped;
    result.embedding_shift = embedding_shift(e_final, e0);
    result.image = std::move(protected_image);

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();

    spdlog::debug("Protect: objective {:.4f} -> {:.4f} ({})", first_objective, last_objective,
                  to_string(spec.mode));
    spdlog::info("Protect level {}: eps={:.4f} steps={} distortion={:.4f} psnr={:.2f} "
                 "score {:.1f} -> {:.1f} in {} us",
                 level, result.epsilon, spec.steps, result.distortion, result.psnr,
                 result.baseline_score, result.robustness_score, elapsed);

    return result;
}

}  // namespace pngp
