/**
 * @file    config.hpp
 * @brief   Engine configuration file (YAML / JSON / XML)
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 *
 * @details
 * Read and written through cv::FileStorage; the format follows the file
 * extension. Missing keys keep their defaults.
 *
 *   log_level: info
 *   shield:
 *     max_epsilon: 0.0470588
 *     min_steps: 2
 *     max_steps: 10
 *     step_scale: 2.5
 *     target_mode: untargeted
 *     perceptual_threshold: 0.04
 *     seed: 1347307344
 *     preserve_watermark: 1
 *   forensic:
 *     lsb_weight: 0.4
 *     ...
 *   model:
 *     weights_path: weights.yml     relative to this file
 */

#pragma once

#include "core/adversarial_shield.hpp"
#include "core/forensic_analyzer.hpp"
#include "core/model_registry.hpp"

#include <filesystem>
#include <string>

namespace pngp {

struct EngineConfig {
    ShieldConfig shield;
    ForensicConfig forensic;
    ModelConfig model;
    std::string log_level = "info";
};

/**
 * @throws ConfigError  if the file cannot be parsed or a value is out of range
 */
EngineConfig load_engine_config(const std::filesystem::path& path);

/**
 * @throws ConfigError  if the file cannot be written
 */
void save_engine_config(const std::filesystem::path& path, const EngineConfig& config);

/**
 * @throws ConfigError  naming the first invalid setting
 */
void validate_engine_config(const EngineConfig& config);

}  // namespace pngp
