/**
 * @file    forensic_analyzer.cpp
 * @brief   Tamper and watermark-stripping forensics
 * @author  pngprotect contributors
 * @date    2026.10.16
 * @license MIT
 */

#include "core/forensic_analyzer.hpp"

#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>

namespace pngp {

namespace {

constexpr int kBlockPeriod = 8;
constexpr int kMinProfileLength = 32;
constexpr double kUnboundedRatio = 1e6;

double plane_entropy(const std::array<size_t, 16>& histogram, size_t total, double max_bits) {
    if (total == 0) {
        return 0.0;
    }
    double entropy = 0.0;
    for (size_t count : histogram) {
        if (count > 0) {
            const double p = static_cast<double>(count) / static_cast<double>(total);
            entropy -= p * std::log2(p);
        }
    }
    return entropy / max_bits;
}

/**
 * Ratio of the spectral magnitude at frequency 1/8 to the median of its
 * neighbouring bins. Smooth profiles have slowly varying spectra, so only
 * a genuine 8-pixel periodicity stands out.
 */
double period8_peak_ratio(const std::vector<double>& profile) {
    const int n = static_cast<int>(profile.size()) / kBlockPeriod * kBlockPeriod;
    if (n < kMinProfileLength) {
        return 0.0;
    }

    cv::Mat signal(1, n, CV_64F);
    double mean = 0.0;
    for (int i = 0; i < n; ++i) {
        mean += profile[i];
    }
    mean /= n;
    for (int i = 0; i < n; ++i) {
        signal.at<double>(0, i) = profile[i] - mean;
    }

    cv::Mat spectrum;
    cv::dft(signal, spectrum, cv::DFT_COMPLEX_OUTPUT);

    auto magnitude = [&](int k) {
        const cv::Vec2d bin = spectrum.at<cv::Vec2d>(0, k);
        return std::hypot(bin[0], bin[1]);
    };

    const int peak_bin = n / kBlockPeriod;
    const int half_width = std::max(2, n / 16);
    std::vector<double> neighbours;
    for (int k = std::max(1, peak_bin - half_width);
         k <= std::min(n / 2, peak_bin + half_width); ++k) {
        if (k != peak_bin) {
            neighbours.push_back(magnitude(k));
        }
    }

    const double peak = magnitude(peak_bin);
    auto mid = neighbours.begin() + static_cast<std::ptrdiff_t>(neighbours.size() / 2);
    std::nth_element(neighbours.begin(), mid, neighbours.end());
    const double median = *mid;

    if (median <= 1e-12) {
        return peak > 1e-9 ? kUnboundedRatio : 0.0;
    }
    return peak / median;
}

double watermark_state_signal(const ExtractResult& mark) {
    switch (mark.validity) {
        case WatermarkValidity::Valid:     return mark.partial_recovery ? 0.35 : 0.0;
        case WatermarkValidity::Corrupted: return 0.75;
        case WatermarkValidity::NotFound:  return 1.0;
    }
    return 1.0;
}

}  // namespace

const char* to_string(TamperStatus status) {
    switch (status) {
        case TamperStatus::Intact:      return "intact";
        case TamperStatus::Modified:    return "modified";
        case TamperStatus::NoWatermark: return "no_watermark";
    }
    return "unknown";
}

bool TamperVerdict::has_flag(std::string_view flag) const {
    return std::find(flags.begin(), flags.end(), flag) != flags.end();
}

bool TamperVerdict::operator==(const TamperVerdict& other) const {
    return confidence == other.confidence &&
           flags == other.flags &&
           owner_match == other.owner_match &&
           status == other.status &&
           lsb_disorder == other.lsb_disorder &&
           watermark_signal == other.watermark_signal &&
           recompression_signal == other.recompression_signal &&
           watermark.payload == other.watermark.payload &&
           watermark.validity == other.watermark.validity &&
           watermark.strength == other.watermark.strength &&
           watermark.bit_error_rate == other.watermark.bit_error_rate;
}

// =============================================================================
// Signals
// =============================================================================

double ForensicAnalyzer::lsb_pattern_entropy(const PixelBuffer& image) {
    const int channels = image.channels();
    const int colors = image.color_channels();
    const int block_rows = image.height() / 2;
    const int block_cols = image.width() / 2;
    const cv::Mat& samples = image.samples();

    double total = 0.0;
    for (int c = 0; c < colors; ++c) {
        std::array<size_t, 16> histogram{};

        if (block_rows == 0 || block_cols == 0) {
            // Too small for 2x2 patterns: single-bit entropy
            size_t count = 0;
            for (int y = 0; y < image.height(); ++y) {
                const uint8_t* row = samples.ptr<uint8_t>(y);
                for (int x = 0; x < image.width(); ++x) {
                    ++histogram[row[x * channels + c] & 1];
                    ++count;
                }
            }
            total += plane_entropy(histogram, count, 1.0);
            continue;
        }

        for (int by = 0; by < block_rows; ++by) {
            const uint8_t* top = samples.ptr<uint8_t>(2 * by);
            const uint8_t* bottom = samples.ptr<uint8_t>(2 * by + 1);
            for (int bx = 0; bx < block_cols; ++bx) {
                const int x0 = (2 * bx) * channels + c;
                const int x1 = (2 * bx + 1) * channels + c;
                const int symbol = ((top[x0] & 1) << 3) | ((top[x1] & 1) << 2) |
                                   ((bottom[x0] & 1) << 1) | (bottom[x1] & 1);
                ++histogram[symbol];
            }
        }
        total += plane_entropy(histogram, static_cast<size_t>(block_rows) * block_cols, 4.0);
    }

    return colors > 0 ? total / colors : 0.0;
}

double ForensicAnalyzer::block_grid_ratio(const PixelBuffer& image, const CarrierPlan* carrier) {
    const int h = image.height();
    const int w = image.width();
    const int channels = image.channels();
    const int colors = image.color_channels();

    // Luminance with carrier planes cleared
    std::array<int, 3> masks{0xFF, 0xFF, 0xFF};
    if (carrier) {
        for (int c = 0; c < 3; ++c) {
            masks[c] = 0xFF & ~((1 << carrier->bits[c]) - 1);
        }
    }

    cv::Mat luma(h, w, CV_64F);
    for (int y = 0; y < h; ++y) {
        const uint8_t* row = image.samples().ptr<uint8_t>(y);
        double* out = luma.ptr<double>(y);
        for (int x = 0; x < w; ++x) {
            double sum = 0.0;
            for (int c = 0; c < colors; ++c) {
                const int mask = c < 3 ? masks[c] : 0xFF;
                sum += row[x * channels + c] & mask;
            }
            out[x] = sum / colors;
        }
    }

    std::vector<double> columns(w > 1 ? w - 1 : 0, 0.0);
    std::vector<double> rows(h > 1 ? h - 1 : 0, 0.0);
    for (int y = 0; y < h; ++y) {
        const double* row = luma.ptr<double>(y);
        for (int x = 0; x + 1 < w; ++x) {
            columns[x] += std::abs(row[x + 1] - row[x]);
        }
        if (y + 1 < h) {
            const double* next = luma.ptr<double>(y + 1);
            double sum = 0.0;
            for (int x = 0; x < w; ++x) {
                sum += std::abs(next[x] - row[x]);
            }
            rows[y] = sum / w;
        }
    }
    for (auto& v : columns) {
        v /= h;
    }

    return std::max(period8_peak_ratio(columns), period8_peak_ratio(rows));
}

// =============================================================================
// ForensicAnalyzer
// =============================================================================

ForensicAnalyzer::ForensicAnalyzer(ForensicConfig config)
    : config_(config) {
}

TamperVerdict ForensicAnalyzer::analyze(const PixelBuffer& image,
                                        const std::optional<std::string>& claimed_owner) const {
    image.validate("analyze");

    auto start_time = std::chrono::high_resolution_clock::now();

    TamperVerdict verdict;
    verdict.watermark = codec_.extract(image);
    const ExtractResult& mark = verdict.watermark;

    // Signal 1: LSB disorder
    if (mark.valid()) {
        verdict.lsb_disorder = std::min(1.0, 2.0 * mark.bit_error_rate);
    } else {
        // Flattened and randomized planes both depart from a carrier
        const double entropy = lsb_pattern_entropy(image);
        verdict.lsb_disorder = std::max(entropy, 1.0 - entropy);
    }

    // Signal 2: watermark state
    verdict.watermark_signal = watermark_state_signal(mark);

    // Signal 3: recompression
    std::optional<CarrierPlan> carrier;
    if (mark.strength > 0) {
        carrier = carrier_plan(mark.strength);
    }
    const double ratio = block_grid_ratio(image, carrier ? &*carrier : nullptr);
    verdict.recompression_signal = std::clamp(
        (ratio - config_.peak_ratio_floor) / config_.peak_ratio_span, 0.0, 1.0);

    const double weight_sum = config_.lsb_weight + config_.watermark_weight +
                              config_.recompression_weight;
    const double fused = weight_sum > 0.0
        ? (config_.lsb_weight * verdict.lsb_disorder +
           config_.watermark_weight * verdict.watermark_signal +
           config_.recompression_weight * verdict.recompression_signal) / weight_sum
        : 0.0;
    verdict.confidence = 100.0 * std::clamp(fused, 0.0, 1.0);

    // Flags
    const bool recompressed = verdict.recompression_signal >= config_.recompression_flag_threshold;
    const bool disturbed = mark.valid() && mark.bit_error_rate > config_.ber_flag_threshold;

    if (disturbed) {
        verdict.flags.emplace_back(flags::kLsbPlaneDisturbed);
    }
    switch (mark.validity) {
        case WatermarkValidity::NotFound:
            verdict.flags.emplace_back(flags::kWatermarkMissing);
            break;
        case WatermarkValidity::Corrupted:
            verdict.flags.emplace_back(flags::kWatermarkCorrupted);
            break;
        case WatermarkValidity::Valid:
            if (mark.partial_recovery) {
                verdict.flags.emplace_back(flags::kWatermarkPartial);
            }
            break;
    }
    if (recompressed) {
        verdict.flags.emplace_back(flags::kRecompressionDetected);
    }

    if (claimed_owner) {
        if (mark.valid()) {
            verdict.owner_match = mark.payload->owner_id() == *claimed_owner;
            if (!*verdict.owner_match) {
                verdict.flags.emplace_back(flags::kOwnerMismatch);
            }
        } else {
            verdict.owner_match = false;
            verdict.flags.emplace_back(flags::kOwnerUnverified);
        }
    }

    // Summary status
    if (mark.validity == WatermarkValidity::NotFound) {
        verdict.status = TamperStatus::NoWatermark;
    } else if (mark.valid() && !mark.partial_recovery && !disturbed && !recompressed) {
        verdict.status = TamperStatus::Intact;
    } else {
        verdict.status = TamperStatus::Modified;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();

    spdlog::debug("Analyze: lsb={:.3f} watermark={:.3f} recompression={:.3f} (ratio {:.2f})",
                  verdict.lsb_disorder, verdict.watermark_signal,
                  verdict.recompression_signal, ratio);
    spdlog::info("Analyze: {} confidence={:.1f} flags=[{}] in {} us",
                 to_string(verdict.status), verdict.confidence,
                 fmt::join(verdict.flags, ", "), elapsed);

    return verdict;
}

}  // namespace pngp
