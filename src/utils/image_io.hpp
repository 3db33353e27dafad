/**
 * @file    image_io.hpp
 * @brief   Decode and encode image files at the core boundary
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 *
 * @details
 * Any format OpenCV decodes is accepted on input. Watermarks live in the
 * low bit planes, so protected output is always written as PNG.
 */

#pragma once

#include "core/pixel_buffer.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace pngp {

/**
 * @throws IoError            if the file cannot be read
 * @throws InvalidImageError  if the bytes are not a decodable image
 */
PixelBuffer load_pixel_buffer(const std::filesystem::path& path);

/**
 * @throws InvalidImageError  if the bytes are not a decodable image
 */
PixelBuffer decode_pixel_buffer(std::span<const uint8_t> bytes);

/**
 * Lossless PNG encoding
 */
std::vector<uint8_t> encode_png(const PixelBuffer& image);

/**
 * Write a buffer as PNG
 *
 * A path with another extension is rewritten to ".png" with a warning.
 *
 * @return  The path actually written
 * @throws IoError  on write failure
 */
std::filesystem::path save_pixel_buffer(const std::filesystem::path& path, const PixelBuffer& image);

/**
 * Re-encode an image without its ancillary metadata (EXIF, text chunks,
 * ICC profiles). The output format follows the output extension.
 *
 * @throws IoError, InvalidImageError
 */
void strip_metadata(const std::filesystem::path& input, const std::filesystem::path& output);

}  // namespace pngp
