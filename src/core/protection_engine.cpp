/**
 * @file    protection_engine.cpp
 * @brief   Facade over the watermark codec, shield and forensic analyzer
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 */

#include "core/protection_engine.hpp"
#include "core/model_registry.hpp"

#include <spdlog/spdlog.h>

namespace pngp {

ProtectionEngine::ProtectionEngine(EngineConfig config)
    : config_(std::move(config))
    , analyzer_(config_.forensic) {
}

ProtectionEngine::ProtectionEngine(EngineConfig config, std::shared_ptr<const FeatureExtractor> model)
    : config_(std::move(config))
    , analyzer_(config_.forensic)
    , model_(std::move(model)) {
}

const AdversarialShield& ProtectionEngine::shield() {
    std::lock_guard<std::mutex> lock(shield_mutex_);
    if (!shield_) {
        if (!model_) {
            model_ = ModelRegistry::acquire(config_.model);
        }
        shield_.emplace(model_, config_.shield);
        spdlog::debug("Shield ready with model '{}'", model_->name());
    }
    return *shield_;
}

EmbedResult ProtectionEngine::embed(const PixelBuffer& image,
                                    const std::string& owner_id,
                                    int strength) const {
    return codec_.embed(image, owner_id, strength);
}

ExtractResult ProtectionEngine::extract(const PixelBuffer& image) const {
    return codec_.extract(image);
}

bool ProtectionEngine::has_watermark(const PixelBuffer& image) const {
    return codec_.has_watermark(image);
}

ShieldResult ProtectionEngine::protect(const PixelBuffer& image,
                                       int level,
                                       const std::atomic<bool>* cancel_flag) {
    image.validate("protect");
    return shield().protect(image, level, cancel_flag);
}

double ProtectionEngine::score(const PixelBuffer& image) {
    image.validate("score");
    return shield().score(image);
}

TamperVerdict ProtectionEngine::analyze(const PixelBuffer& image,
                                        const std::optional<std::string>& claimed_owner) const {
    return analyzer_.analyze(image, claimed_owner);
}

}  // namespace pngp
