/**
 * @file    model_registry.cpp
 * @brief   Process-wide lazily loaded feature extractor
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 */

#include "core/model_registry.hpp"
#include "core/errors.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>
#include <chrono>

namespace pngp {

std::mutex ModelRegistry::mutex_;
std::shared_ptr<const FeatureExtractor> ModelRegistry::model_;

std::shared_ptr<const FeatureExtractor> ModelRegistry::acquire(const ModelConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (model_) {
        return model_;
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    // Construction errors propagate; model_ stays empty for the next attempt
    FilterBankWeights weights = config.weights_path
        ? FilterBankWeights::load(*config.weights_path)
        : FilterBankWeights::builtin();
    auto model = std::make_shared<const FilterBankExtractor>(std::move(weights));

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();

    if (config.weights_path) {
        spdlog::info("Model '{}' loaded from {} in {} us", model->name(), *config.weights_path, elapsed);
    } else {
        spdlog::info("Model '{}' (built-in) ready in {} us", model->name(), elapsed);
    }

    model_ = std::move(model);
    return model_;
}

void ModelRegistry::install(std::shared_ptr<const FeatureExtractor> model) {
    std::lock_guard<std::mutex> lock(mutex_);
    model_ = std::move(model);
}

void ModelRegistry::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (model_) {
        spdlog::debug("Releasing model '{}'", model_->name());
    }
    model_.reset();
}

bool ModelRegistry::loaded() {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(model_);
}

}  // namespace pngp
