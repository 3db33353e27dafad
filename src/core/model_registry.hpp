/**
 * @file    model_registry.hpp
 * @brief   Process-wide lazily loaded feature extractor
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 *
 * @details
 * The model is the only state shared between engine calls. The registry
 * loads it on the first acquire() and hands out shared, read-only
 * references; engines receive those references through their
 * constructors and never reach into the registry themselves.
 *
 * A failed load leaves the registry empty, so the next acquire() retries.
 */

#pragma once

#include "core/feature_extractor.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

namespace pngp {

struct ModelConfig {
    // Weights written by FilterBankWeights::save(); built-in weights if unset
    std::optional<std::filesystem::path> weights_path;
};

class ModelRegistry {
public:
    /**
     * Return the loaded model, loading it first if needed
     *
     * The config is only consulted by the call that performs the load.
     *
     * @throws ModelUnavailableError  if loading fails
     */
    static std::shared_ptr<const FeatureExtractor> acquire(const ModelConfig& config = {});

    /**
     * Install a model directly (custom backends, tests)
     */
    static void install(std::shared_ptr<const FeatureExtractor> model);

    /**
     * Drop the registry's reference. Holders keep theirs until released.
     */
    static void shutdown();

    static bool loaded();

private:
    static std::mutex mutex_;
    static std::shared_ptr<const FeatureExtractor> model_;
};

}  // namespace pngp
