/**
 * @file    main.cpp
 * @brief   pngprotect command line tool
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 *
 * @details
 * Usage:
 *   pngprotect embed   <input> <output> --owner <id> [--strength 1-10]
 *   pngprotect extract <input>
 *   pngprotect detect  <input>
 *   pngprotect protect <input> <output> [--level 0-100]
 *   pngprotect score   <input>
 *   pngprotect analyze <input> [--claim <id>]
 *   pngprotect strip   <input> <output>
 *   pngprotect config  <output>
 *
 * Global options: --config <file>, --log-level <level>
 *
 * Exit codes: 0 success, 1 usage, 2 engine error, 3 I/O error
 */

#include "core/errors.hpp"
#include "core/protection_engine.hpp"
#include "utils/config.hpp"
#include "utils/image_io.hpp"
#include "utils/logging.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitEngine = 2;
constexpr int kExitIo = 3;

constexpr int kDefaultStrength = 5;
constexpr int kDefaultLevel = 50;

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Arguments {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;

    std::optional<std::string> option(const std::string& name) const {
        auto it = options.find(name);
        if (it == options.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    int int_option(const std::string& name, int fallback) const {
        auto value = option(name);
        if (!value) {
            return fallback;
        }
        int parsed = 0;
        auto [end, ec] = std::from_chars(value->data(), value->data() + value->size(), parsed);
        if (ec != std::errc() || end != value->data() + value->size()) {
            throw UsageError(fmt::format("--{} expects an integer, got '{}'", name, *value));
        }
        return parsed;
    }

    const std::string& input(size_t index, const char* what) const {
        if (index >= positional.size()) {
            throw UsageError(fmt::format("'{}' needs {}", command, what));
        }
        return positional[index];
    }
};

const std::vector<std::string> kValueOptions = {
    "owner", "strength", "level", "claim", "config", "log-level"
};

void print_usage() {
    fmt::print(stderr,
        "Usage: pngprotect <command> [arguments] [options]\n"
        "\n"
        "Commands:\n"
        "  embed   <input> <output> --owner <id> [--strength 1-10]\n"
        "  extract <input>\n"
        "  detect  <input>\n"
        "  protect <input> <output> [--level 0-100]\n"
        "  score   <input>\n"
        "  analyze <input> [--claim <id>]\n"
        "  strip   <input> <output>\n"
        "  config  <output>\n"
        "\n"
        "Options:\n"
        "  --config <file>       Engine configuration (YAML, JSON or XML)\n"
        "  --log-level <level>   trace, debug, info, warn, error, off\n");
}

Arguments parse_arguments(int argc, char** argv) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        std::string token = argv[i];
        if (token.rfind("--", 0) == 0) {
            std::string name = token.substr(2);
            if (std::find(kValueOptions.begin(), kValueOptions.end(), name) == kValueOptions.end()) {
                throw UsageError(fmt::format("Unknown option '{}'", token));
            }
            if (i + 1 >= argc) {
                throw UsageError(fmt::format("Option '{}' needs a value", token));
            }
            args.options[name] = argv[++i];
        } else if (args.command.empty()) {
            args.command = token;
        } else {
            args.positional.push_back(token);
        }
    }
    if (args.command.empty()) {
        throw UsageError("No command given");
    }
    return args;
}

// =============================================================================
// Commands
// =============================================================================

int run_embed(pngp::ProtectionEngine& engine, const Arguments& args) {
    const fs::path input = args.input(0, "an input image");
    const fs::path output = args.input(1, "an output image");
    const auto owner = args.option("owner");
    if (!owner) {
        throw UsageError("'embed' needs --owner <id>");
    }
    const int strength = args.int_option("strength", kDefaultStrength);

    const pngp::PixelBuffer image = pngp::load_pixel_buffer(input);
    const pngp::EmbedResult result = engine.embed(image, *owner, strength);
    const fs::path written = pngp::save_pixel_buffer(output, result.image);

    fmt::print("output:       {}\n", written);
    fmt::print("owner:        {}\n", *owner);
    fmt::print("strength:     {} ({} bits/pixel)\n", result.strength, result.bits_per_pixel);
    fmt::print("copies:       {}\n", result.copies_written);
    fmt::print("utilization:  {:.4f}\n", result.capacity_utilization);
    return 0;
}

int run_extract(pngp::ProtectionEngine& engine, const Arguments& args) {
    const pngp::PixelBuffer image = pngp::load_pixel_buffer(args.input(0, "an input image"));
    const pngp::ExtractResult result = engine.extract(image);

    fmt::print("validity:     {}\n", pngp::to_string(result.validity));
    if (result.payload) {
        fmt::print("owner:        {}\n", result.payload->owner_id());
    }
    if (result.strength > 0) {
        fmt::print("strength:     {}\n", result.strength);
        fmt::print("copies:       {} intact / {} found\n", result.copies_intact, result.copies_found);
    }
    if (result.valid()) {
        fmt::print("partial:      {}\n", result.partial_recovery ? "yes" : "no");
        fmt::print("bit errors:   {:.4f}\n", result.bit_error_rate);
        fmt::print("confidence:   {:.4f}\n", result.confidence);
    }
    return 0;
}

int run_detect(pngp::ProtectionEngine& engine, const Arguments& args) {
    const pngp::PixelBuffer image = pngp::load_pixel_buffer(args.input(0, "an input image"));
    fmt::print("watermark:    {}\n", engine.has_watermark(image) ? "yes" : "no");
    return 0;
}

int run_protect(pngp::ProtectionEngine& engine, const Arguments& args) {
    const fs::path input = args.input(0, "an input image");
    const fs::path output = args.input(1, "an output image");
    const int level = args.int_option("level", kDefaultLevel);

    const pngp::PixelBuffer image = pngp::load_pixel_buffer(input);
    const pngp::ShieldResult result = engine.protect(image, level);
    const fs::path written = pngp::save_pixel_buffer(output, result.image);

    fmt::print("output:       {}\n", written);
    fmt::print("level:        {} (eps {:.4f}{}, {} steps)\n", level, result.epsilon,
               result.capped ? " capped" : "", result.steps);
    fmt::print("score:        {:.1f} -> {:.1f}\n", result.baseline_score, result.robustness_score);
    fmt::print("distortion:   {:.4f} (max {:.4f}, psnr {:.2f} dB)\n",
               result.distortion, result.max_abs_delta, result.psnr);
    if (result.watermark_strength > 0) {
        fmt::print("watermark:    preserved (strength {})\n", result.watermark_strength);
    }
    return 0;
}

int run_score(pngp::ProtectionEngine& engine, const Arguments& args) {
    const pngp::PixelBuffer image = pngp::load_pixel_buffer(args.input(0, "an input image"));
    fmt::print("score:        {:.2f}\n", engine.score(image));
    return 0;
}

int run_analyze(pngp::ProtectionEngine& engine, const Arguments& args) {
    const pngp::PixelBuffer image = pngp::load_pixel_buffer(args.input(0, "an input image"));
    const pngp::TamperVerdict verdict = engine.analyze(image, args.option("claim"));

    fmt::print("status:       {}\n", pngp::to_string(verdict.status));
    fmt::print("confidence:   {:.1f}\n", verdict.confidence);
    fmt::print("flags:        {}\n", verdict.flags.empty() ? std::string("none")
                                                          : fmt::format("{}", fmt::join(verdict.flags, ", ")));
    if (verdict.watermark.payload) {
        fmt::print("owner:        {}\n", verdict.watermark.payload->owner_id());
    }
    if (verdict.owner_match) {
        fmt::print("owner match:  {}\n", *verdict.owner_match ? "yes" : "no");
    }
    fmt::print("signals:      lsb {:.3f}, watermark {:.3f}, recompression {:.3f}\n",
               verdict.lsb_disorder, verdict.watermark_signal, verdict.recompression_signal);
    return 0;
}

int run_strip(const Arguments& args) {
    pngp::strip_metadata(args.input(0, "an input image"), args.input(1, "an output image"));
    return 0;
}

int run_config(const pngp::EngineConfig& config, const Arguments& args) {
    const fs::path output = args.input(0, "an output file");
    pngp::save_engine_config(output, config);
    fmt::print("config:       {}\n", output);
    return 0;
}

int dispatch(const Arguments& args, const pngp::EngineConfig& config) {
    if (args.command == "strip") {
        return run_strip(args);
    }
    if (args.command == "config") {
        return run_config(config, args);
    }

    pngp::ProtectionEngine engine(config);
    if (args.command == "embed")   return run_embed(engine, args);
    if (args.command == "extract") return run_extract(engine, args);
    if (args.command == "detect")  return run_detect(engine, args);
    if (args.command == "protect") return run_protect(engine, args);
    if (args.command == "score")   return run_score(engine, args);
    if (args.command == "analyze") return run_analyze(engine, args);

    throw UsageError(fmt::format("Unknown command '{}'", args.command));
}

}  // namespace

int main(int argc, char** argv) {
    Arguments args;
    try {
        args = parse_arguments(argc, argv);
    } catch (const UsageError& e) {
        fmt::print(stderr, "error: {}\n\n", e.what());
        print_usage();
        return kExitUsage;
    }

    if (args.command == "help") {
        print_usage();
        return 0;
    }

    pngp::init_logging(args.option("log-level").value_or("info"));

    try {
        pngp::EngineConfig config;
        if (auto path = args.option("config")) {
            config = pngp::load_engine_config(*path);
            if (!args.option("log-level")) {
                pngp::init_logging(config.log_level);
            }
        }
        return dispatch(args, config);

    } catch (const UsageError& e) {
        fmt::print(stderr, "error: {}\n\n", e.what());
        print_usage();
        return kExitUsage;
    } catch (const std::invalid_argument& e) {
        spdlog::error("{}", e.what());
        return kExitUsage;
    } catch (const pngp::IoError& e) {
        spdlog::error("{}", e.what());
        return kExitIo;
    } catch (const fs::filesystem_error& e) {
        spdlog::error("{}", e.what());
        return kExitIo;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return kExitEngine;
    }
}
