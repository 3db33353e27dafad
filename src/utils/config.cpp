/**
 * @file    config.cpp
 * @brief   Engine configuration file (YAML / JSON / XML)
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 */

#include "utils/config.hpp"
#include "utils/logging.hpp"
#include "utils/path_formatter.hpp"
#include "core/errors.hpp"

#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace pngp {

namespace {

template <typename T>
void read_if_present(const cv::FileNode& node, const char* key, T& value) {
    const cv::FileNode child = node[key];
    if (!child.empty()) {
        child >> value;
    }
}

void read_flag(const cv::FileNode& node, const char* key, bool& value) {
    const cv::FileNode child = node[key];
    if (!child.empty()) {
        int raw = value ? 1 : 0;
        child >> raw;
        value = raw != 0;
    }
}

}  // namespace

void validate_engine_config(const EngineConfig& config) {
    const ShieldConfig& s = config.shield;
    if (!(s.max_epsilon > 0.0 && s.max_epsilon <= 1.0)) {
        throw ConfigError(fmt::format("shield.max_epsilon must be in (0, 1], got {}", s.max_epsilon));
    }
    if (s.min_steps < 1 || s.max_steps < s.min_steps) {
        throw ConfigError(fmt::format("shield steps must satisfy 1 <= min_steps <= max_steps, got {} / {}",
                                      s.min_steps, s.max_steps));
    }
    if (!(s.step_scale > 0.0)) {
        throw ConfigError(fmt::format("shield.step_scale must be positive, got {}", s.step_scale));
    }
    if (!(s.perceptual_threshold > 0.0 && s.perceptual_threshold <= 1.0)) {
        throw ConfigError(fmt::format("shield.perceptual_threshold must be in (0, 1], got {}",
                                      s.perceptual_threshold));
    }

    const ForensicConfig& f = config.forensic;
    if (f.lsb_weight < 0.0 || f.watermark_weight < 0.0 || f.recompression_weight < 0.0 ||
        f.lsb_weight + f.watermark_weight + f.recompression_weight <= 0.0) {
        throw ConfigError("forensic weights must be non-negative with a positive sum");
    }
    if (!(f.peak_ratio_span > 0.0)) {
        throw ConfigError(fmt::format("forensic.peak_ratio_span must be positive, got {}",
                                      f.peak_ratio_span));
    }

    if (!parse_log_level(config.log_level)) {
        throw ConfigError(fmt::format("Unknown log_level '{}'", config.log_level));
    }
}

EngineConfig load_engine_config(const std::filesystem::path& path) {
    EngineConfig config;

    try {
        cv::FileStorage fs(path.string(), cv::FileStorage::READ);
        if (!fs.isOpened()) {
            throw ConfigError(fmt::format("Cannot open config file: {}", path));
        }

        read_if_present(fs.root(), "log_level", config.log_level);

        const cv::FileNode shield = fs["shield"];
        if (!shield.empty()) {
            ShieldConfig& s = config.shield;
            read_if_present(shield, "max_epsilon", s.max_epsilon);
            read_if_present(shield, "min_steps", s.min_steps);
            read_if_present(shield, "max_steps", s.max_steps);
            read_if_present(shield, "step_scale", s.step_scale);
            read_if_present(shield, "perceptual_threshold", s.perceptual_threshold);
            read_flag(shield, "preserve_watermark", s.preserve_watermark);

            // FileStorage has no 64-bit integers
            double seed = static_cast<double>(s.seed);
            read_if_present(shield, "seed", seed);
            if (seed < 0.0) {
                throw ConfigError(fmt::format("shield.seed must be non-negative, got {}", seed));
            }
            s.seed = static_cast<uint64_t>(seed);

            std::string mode;
            read_if_present(shield, "target_mode", mode);
            if (!mode.empty()) {
                auto parsed = parse_target_mode(mode);
                if (!parsed) {
                    throw ConfigError(fmt::format("Unknown shield.target_mode '{}'", mode));
                }
                s.target_mode = *parsed;
            }
        }

        const cv::FileNode forensic = fs["forensic"];
        if (!forensic.empty()) {
            ForensicConfig& f = config.forensic;
            read_if_present(forensic, "lsb_weight", f.lsb_weight);
            read_if_present(forensic, "watermark_weight", f.watermark_weight);
            read_if_present(forensic, "recompression_weight", f.recompression_weight);
            read_if_present(forensic, "ber_flag_threshold", f.ber_flag_threshold);
            read_if_present(forensic, "recompression_flag_threshold", f.recompression_flag_threshold);
            read_if_present(forensic, "peak_ratio_floor", f.peak_ratio_floor);
            read_if_present(forensic, "peak_ratio_span", f.peak_ratio_span);
        }

        const cv::FileNode model = fs["model"];
        if (!model.empty()) {
            std::string weights;
            read_if_present(model, "weights_path", weights);
            if (!weights.empty()) {
                std::filesystem::path weights_path(weights);
                // Relative paths are resolved against the config file
                if (weights_path.is_relative()) {
                    weights_path = path.parent_path() / weights_path;
                }
                config.model.weights_path = weights_path;
            }
        }
    } catch (const cv::Exception& e) {
        throw ConfigError(fmt::format("Malformed config file {}: {}", path, e.what()));
    }

    validate_engine_config(config);
    spdlog::debug("Loaded configuration from {}", path);
    return config;
}

void save_engine_config(const std::filesystem::path& path, const EngineConfig& config) {
    try {
        cv::FileStorage fs(path.string(), cv::FileStorage::WRITE);
        if (!fs.isOpened()) {
            throw ConfigError(fmt::format("Cannot write config file: {}", path));
        }

        fs << "log_level" << config.log_level;

        const ShieldConfig& s = config.shield;
        fs << "shield" << "{";
        fs << "max_epsilon" << s.max_epsilon;
        fs << "min_steps" << s.min_steps;
        fs << "max_steps" << s.max_steps;
        fs << "step_scale" << s.step_scale;
        fs << "target_mode" << std::string(to_string(s.target_mode));
        fs << "perceptual_threshold" << s.perceptual_threshold;
        fs << "seed" << static_cast<double>(s.seed);
        fs << "preserve_watermark" << (s.preserve_watermark ? 1 : 0);
        fs << "}";

        const ForensicConfig& f = config.forensic;
        fs << "forensic" << "{";
        fs << "lsb_weight" << f.lsb_weight;
        fs << "watermark_weight" << f.watermark_weight;
        fs << "recompression_weight" << f.recompression_weight;
        fs << "ber_flag_threshold" << f.ber_flag_threshold;
        fs << "recompression_flag_threshold" << f.recompression_flag_threshold;
        fs << "peak_ratio_floor" << f.peak_ratio_floor;
        fs << "peak_ratio_span" << f.peak_ratio_span;
        fs << "}";

        if (config.model.weights_path) {
            fs << "model" << "{";
            fs << "weights_path" << to_utf8(*config.model.weights_path);
            fs << "}";
        }
    } catch (const cv::Exception& e) {
        throw ConfigError(fmt::format("Cannot write config file {}: {}", path, e.what()));
    }
}

}  // namespace pngp
