/**
 * @file    errors.hpp
 * @brief   Exception types raised by the protection engines
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 *
 * @details
 * Hard failures are exceptions. Negative extraction outcomes (no watermark,
 * checksum mismatch) are reported through result structs instead.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace pngp {

/**
 * Common base for every engine error
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Image too small for the requested payload and strength
 */
class CapacityError : public Error {
public:
    CapacityError(const std::string& message,
                  size_t required_bits,
                  size_t available_bits,
                  int min_square_side)
        : Error(message)
        , required_bits_(required_bits)
        , available_bits_(available_bits)
        , min_square_side_(min_square_side) {}

    size_t required_bits() const noexcept { return required_bits_; }
    size_t available_bits() const noexcept { return available_bits_; }

    // Smallest N such that an NxN image of the same channel count fits
    int min_square_side() const noexcept { return min_square_side_; }

private:
    size_t required_bits_;
    size_t available_bits_;
    int min_square_side_;
};

/**
 * Feature extractor could not be loaded. Later calls may retry.
 */
class ModelUnavailableError : public Error {
public:
    using Error::Error;
};

/**
 * Empty, zero-size or unsupported pixel buffer
 */
class InvalidImageError : public Error {
public:
    using Error::Error;
};

/**
 * Cooperative cancellation was honored; no partial result exists
 */
class Cancelled : public Error {
public:
    Cancelled() : Error("Operation cancelled") {}
};

/**
 * Image file could not be read or written
 */
class IoError : public Error {
public:
    using Error::Error;
};

/**
 * Malformed configuration file or out-of-range setting
 */
class ConfigError : public Error {
public:
    using Error::Error;
};

}  // namespace pngp
