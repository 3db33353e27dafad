/**
 * @file    path_formatter.hpp
 * @brief   fmt formatter for std::filesystem::path (UTF-8 output)
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 *
 * @details
 * path.string() is in the local codepage on Windows, while spdlog and fmt
 * expect UTF-8. Paths are therefore always formatted through u8string().
 * Under C++20 u8string() yields std::u8string, so the bytes are
 * reinterpreted as char.
 *
 * Usage:
 *   #include "utils/path_formatter.hpp"
 *   spdlog::info("Saved {}", output_path);
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace pngp {

/**
 * UTF-8 encoded copy of a path
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(reinterpret_cast<const char*>(u8str.data()), u8str.size());
}

/**
 * Lower-case extension including the dot, e.g. ".png"
 */
inline std::string extension_lower(const std::filesystem::path& path) {
    std::string ext = to_utf8(path.extension());
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return ext;
}

}  // namespace pngp

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        const std::string utf8 = pngp::to_utf8(p);
        return fmt::formatter<std::string_view>::format(std::string_view(utf8), ctx);
    }
};
