/**
 * @file    logging.cpp
 * @brief   Default spdlog logger setup
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 */

#include "utils/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace pngp {

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info")  return spdlog::level::info;
    if (name == "warn")  return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off")   return spdlog::level::off;
    return std::nullopt;
}

void init_logging(std::string_view level) {
    // Log to stderr so command output on stdout stays machine readable
    auto logger = spdlog::get("pngprotect");
    if (!logger) {
        logger = spdlog::stderr_color_mt("pngprotect");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    const auto parsed = parse_log_level(level);
    spdlog::set_level(parsed.value_or(spdlog::level::info));
    if (!parsed) {
        spdlog::warn("Unknown log level '{}', using info", std::string(level));
    }
}

}  // namespace pngp
