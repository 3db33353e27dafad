/**
 * @file    logging.hpp
 * @brief   Default spdlog logger setup
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 */

#pragma once

#include <spdlog/common.h>
#include <optional>
#include <string_view>

namespace pngp {

/**
 * trace | debug | info | warn | error | off
 */
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

/**
 * Configure the default logger (stderr, colour when attached to a terminal)
 *
 * Unknown level names fall back to info with a warning.
 */
void init_logging(std::string_view level = "info");

}  // namespace pngp
