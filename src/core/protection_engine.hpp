/**
 * @file    protection_engine.hpp
 * @brief   Facade over the watermark codec, shield and forensic analyzer
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 *
 * @details
 * Every call takes a buffer and returns new data; nothing is persisted.
 * The feature extractor is acquired from ModelRegistry on the first
 * protect() or score() call, so watermark-only users never load it.
 */

#pragma once

#include "core/adversarial_shield.hpp"
#include "core/forensic_analyzer.hpp"
#include "core/pixel_buffer.hpp"
#include "core/watermark_codec.hpp"
#include "utils/config.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace pngp {

class ProtectionEngine {
public:
    explicit ProtectionEngine(EngineConfig config = {});

    /**
     * Use a specific model instead of the registry
     */
    ProtectionEngine(EngineConfig config, std::shared_ptr<const FeatureExtractor> model);

    ProtectionEngine(const ProtectionEngine&) = delete;
    ProtectionEngine& operator=(const ProtectionEngine&) = delete;

    EmbedResult embed(const PixelBuffer& image, const std::string& owner_id, int strength) const;
    ExtractResult extract(const PixelBuffer& image) const;
    bool has_watermark(const PixelBuffer& image) const;

    /**
     * @throws ModelUnavailableError  if the model cannot be loaded (retried on the next call)
     */
    ShieldResult protect(const PixelBuffer& image,
                         int level,
                         const std::atomic<bool>* cancel_flag = nullptr);

    double score(const PixelBuffer& image);

    TamperVerdict analyze(const PixelBuffer& image,
                          const std::optional<std::string>& claimed_owner = std::nullopt) const;

    const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;
    WatermarkCodec codec_;
    ForensicAnalyzer analyzer_;

    std::mutex shield_mutex_;
    std::shared_ptr<const FeatureExtractor> model_;
    std::optional<AdversarialShield> shield_;

    const AdversarialShield& shield();
};

}  // namespace pngp
