/**
 * @file    watermark_payload.hpp
 * @brief   Owner-id payload and its serialized wire format
 * @author  pngprotect contributors
 * @date    2026.10.16
 * @license MIT
 *
 * @details
 * Serialized layout (one copy):
 *
 *   +--------+--------+----------------+-------+
 *   | "PNGP" | len:16 | owner id bytes | crc:8 |
 *   +--------+--------+----------------+-------+
 *
 * len is big-endian. The CRC-8 (poly 0x07, init 0x00) covers every byte
 * before it. The bit-stream is produced MSB first.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pngp {

/**
 * Outcome of parsing a single serialized copy
 */
enum class PayloadParse {
    Ok,
    BadMagic,
    BadLength,
    BadChecksum,
};

class WatermarkPayload {
public:
    static constexpr std::array<uint8_t, 4> kMagic{'P', 'N', 'G', 'P'};
    static constexpr size_t kMagicSize = kMagic.size();
    static constexpr size_t kHeaderSize = kMagicSize + 2;        // magic + length
    static constexpr size_t kOverheadSize = kHeaderSize + 1;     // + checksum
    static constexpr size_t kMaxOwnerIdLength = 0xFFFF;

    /**
     * @throws std::invalid_argument  on an empty or over-long owner id
     */
    explicit WatermarkPayload(std::string owner_id);

    const std::string& owner_id() const noexcept { return owner_id_; }

    // Bytes of one serialized copy
    size_t serialized_size() const noexcept { return kOverheadSize + owner_id_.size(); }
    size_t serialized_bits() const noexcept { return serialized_size() * 8; }

    std::vector<uint8_t> serialize() const;

    /**
     * Parse exactly one copy
     *
     * @param bytes   Candidate copy, starting at the magic
     * @param status  Receives the parse outcome
     * @return        The payload when status is Ok
     */
    static std::optional<WatermarkPayload> parse(std::span<const uint8_t> bytes,
                                                 PayloadParse& status);

    /**
     * Length field of a candidate header, or nullopt if the magic is absent
     */
    static std::optional<size_t> peek_length(std::span<const uint8_t> bytes);

    bool operator==(const WatermarkPayload& other) const { return owner_id_ == other.owner_id_; }

private:
    std::string owner_id_;
};

/**
 * CRC-8, polynomial 0x07, initial value 0x00, no reflection
 */
uint8_t crc8(std::span<const uint8_t> data, uint8_t crc = 0x00) noexcept;

/**
 * Expand bytes into a bit vector, most significant bit first
 */
std::vector<uint8_t> bytes_to_bits(std::span<const uint8_t> bytes);

}  // namespace pngp
