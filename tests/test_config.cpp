/**
 * @file    test_config.cpp
 * @brief   Engine configuration and logging tests
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 */

#include "core/errors.hpp"
#include "utils/config.hpp"
#include "utils/logging.hpp"
#include "test_images.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <string>

using namespace pngp;

namespace {

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

}  // namespace

TEST(EngineConfig, DefaultsAreValid) {
    EXPECT_NO_THROW(validate_engine_config(EngineConfig{}));
}

TEST(EngineConfig, SaveLoadRoundTrip) {
    test::ScratchDir dir;

    EngineConfig config;
    config.log_level = "debug";
    config.shield.max_epsilon = 8.0 / 255.0;
    config.shield.min_steps = 3;
    config.shield.max_steps = 7;
    config.shield.step_scale = 1.5;
    config.shield.target_mode = TargetMode::EmbeddingDistance;
    config.shield.perceptual_threshold = 0.025;
    config.shield.seed = 123456789;
    config.shield.preserve_watermark = false;
    config.forensic.lsb_weight = 0.5;
    config.forensic.watermark_weight = 0.3;
    config.forensic.recompression_weight = 0.2;
    config.forensic.peak_ratio_floor = 4.0;
    config.model.weights_path = dir.path() / "weights.yml";

    for (const char* name : {"engine.yml", "engine.json", "engine.xml"}) {
        const auto path = dir / name;
        save_engine_config(path, config);
        const EngineConfig loaded = load_engine_config(path);

        EXPECT_EQ(loaded.log_level, "debug") << name;
        EXPECT_DOUBLE_EQ(loaded.shield.max_epsilon, config.shield.max_epsilon) << name;
        EXPECT_EQ(loaded.shield.min_steps, 3) << name;
        EXPECT_EQ(loaded.shield.max_steps, 7) << name;
        EXPECT_DOUBLE_EQ(loaded.shield.step_scale, 1.5) << name;
        EXPECT_EQ(loaded.shield.target_mode, TargetMode::EmbeddingDistance) << name;
        EXPECT_DOUBLE_EQ(loaded.shield.perceptual_threshold, 0.025) << name;
        EXPECT_EQ(loaded.shield.seed, 123456789u) << name;
        EXPECT_FALSE(loaded.shield.preserve_watermark) << name;
        EXPECT_DOUBLE_EQ(loaded.forensic.lsb_weight, 0.5) << name;
        EXPECT_DOUBLE_EQ(loaded.forensic.watermark_weight, 0.3) << name;
        EXPECT_DOUBLE_EQ(loaded.forensic.peak_ratio_floor, 4.0) << name;
        ASSERT_TRUE(loaded.model.weights_path.has_value()) << name;
        EXPECT_EQ(*loaded.model.weights_path, *config.model.weights_path) << name;
    }
}

TEST(EngineConfig, MissingKeysKeepDefaults) {
    test::ScratchDir dir;
    const auto path = dir / "partial.yml";
    write_text(path, "%YAML:1.0\n---\nshield:\n   min_steps: 3\n");

    const EngineConfig loaded = load_engine_config(path);
    const EngineConfig defaults;

    EXPECT_EQ(loaded.shield.min_steps, 3);
    EXPECT_EQ(loaded.shield.max_steps, defaults.shield.max_steps);
    EXPECT_DOUBLE_EQ(loaded.shield.max_epsilon, defaults.shield.max_epsilon);
    EXPECT_EQ(loaded.shield.seed, defaults.shield.seed);
    EXPECT_EQ(loaded.shield.target_mode, defaults.shield.target_mode);
    EXPECT_TRUE(loaded.shield.preserve_watermark);
    EXPECT_DOUBLE_EQ(loaded.forensic.recompression_weight, defaults.forensic.recompression_weight);
    EXPECT_EQ(loaded.log_level, "info");
    EXPECT_FALSE(loaded.model.weights_path.has_value());
}

TEST(EngineConfig, RelativeWeightsPathFollowsConfigFile) {
    test::ScratchDir dir;
    const auto path = dir / "engine.yml";
    write_text(path, "%YAML:1.0\n---\nmodel:\n   weights_path: \"models/bank.yml\"\n");

    const EngineConfig loaded = load_engine_config(path);
    ASSERT_TRUE(loaded.model.weights_path.has_value());
    EXPECT_EQ(*loaded.model.weights_path, dir.path() / "models" / "bank.yml");
}

TEST(EngineConfig, InvalidValuesAreRejected) {
    test::ScratchDir dir;

    const auto steps = dir / "steps.yml";
    write_text(steps, "%YAML:1.0\n---\nshield:\n   min_steps: 8\n   max_steps: 4\n");
    EXPECT_THROW(load_engine_config(steps), ConfigError);

    const auto mode = dir / "mode.yml";
    write_text(mode, "%YAML:1.0\n---\nshield:\n   target_mode: \"targeted\"\n");
    EXPECT_THROW(load_engine_config(mode), ConfigError);

    const auto level = dir / "level.yml";
    write_text(level, "%YAML:1.0\n---\nlog_level: \"chatty\"\n");
    EXPECT_THROW(load_engine_config(level), ConfigError);

    EXPECT_THROW(load_engine_config(dir / "missing.yml"), ConfigError);
}

TEST(EngineConfig, ValidationNamesTheSetting) {
    EngineConfig config;
    config.shield.max_epsilon = 0.0;
    try {
        validate_engine_config(config);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("max_epsilon"), std::string::npos);
    }

    EngineConfig weights;
    weights.forensic.lsb_weight = 0.0;
    weights.forensic.watermark_weight = 0.0;
    weights.forensic.recompression_weight = 0.0;
    EXPECT_THROW(validate_engine_config(weights), ConfigError);

    EngineConfig threshold;
    threshold.shield.perceptual_threshold = 1.5;
    EXPECT_THROW(validate_engine_config(threshold), ConfigError);
}

TEST(Logging, ParsesLevelNames) {
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
    EXPECT_FALSE(parse_log_level("chatty").has_value());
}

TEST(Logging, InitIsRepeatable) {
    EXPECT_NO_THROW(init_logging("warn"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    EXPECT_NO_THROW(init_logging("info"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
}
