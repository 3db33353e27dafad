/**
 * @file    watermark_payload.cpp
 * @brief   Payload serialization and CRC-8
 * @author  pngprotect contributors
 * @date    2026.10.16
 * @license MIT
 */

#include "core/watermark_payload.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

namespace pngp {

namespace {

constexpr uint8_t kCrcPolynomial = 0x07;

constexpr auto generate_crc8_table() {
    std::array<uint8_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint8_t crc = static_cast<uint8_t>(i);
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 0x80) ? static_cast<uint8_t>((crc << 1) ^ kCrcPolynomial)
                               : static_cast<uint8_t>(crc << 1);
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto kCrc8Table = generate_crc8_table();

}  // namespace

uint8_t crc8(std::span<const uint8_t> data, uint8_t crc) noexcept {
    for (uint8_t byte : data) {
        crc = kCrc8Table[crc ^ byte];
    }
    return crc;
}

std::vector<uint8_t> bytes_to_bits(std::span<const uint8_t> bytes) {
    std::vector<uint8_t> bits;
    bits.reserve(bytes.size() * 8);
    for (uint8_t byte : bytes) {
        for (int i = 7; i >= 0; --i) {
            bits.push_back((byte >> i) & 1);
        }
    }
    return bits;
}

WatermarkPayload::WatermarkPayload(std::string owner_id)
    : owner_id_(std::move(owner_id)) {
    if (owner_id_.empty()) {
        throw std::invalid_argument("Owner id must not be empty");
    }
    if (owner_id_.size() > kMaxOwnerIdLength) {
        throw std::invalid_argument(fmt::format(
            "Owner id is {} bytes, limit is {}", owner_id_.size(), kMaxOwnerIdLength));
    }
}

std::vector<uint8_t> WatermarkPayload::serialize() const {
    std::vector<uint8_t> out;
    out.reserve(serialized_size());

    out.insert(out.end(), kMagic.begin(), kMagic.end());
    const auto length = static_cast<uint16_t>(owner_id_.size());
    out.push_back(static_cast<uint8_t>(length >> 8));
    out.push_back(static_cast<uint8_t>(length & 0xFF));
    out.insert(out.end(), owner_id_.begin(), owner_id_.end());
    out.push_back(crc8(out));

    return out;
}

std::optional<size_t> WatermarkPayload::peek_length(std::span<const uint8_t> bytes) {
    if (bytes.size() < kHeaderSize ||
        !std::equal(kMagic.begin(), kMagic.end(), bytes.begin())) {
        return std::nullopt;
    }
    return (static_cast<size_t>(bytes[kMagicSize]) << 8) | bytes[kMagicSize + 1];
}

std::optional<WatermarkPayload> WatermarkPayload::parse(std::span<const uint8_t> bytes,
                                                        PayloadParse& status) {
    const auto length = peek_length(bytes);
    if (!length) {
        status = PayloadParse::BadMagic;
        return std::nullopt;
    }
    if (*length == 0 || bytes.size() < kOverheadSize + *length) {
        status = PayloadParse::BadLength;
        return std::nullopt;
    }

    const size_t body = kHeaderSize + *length;
    if (crc8(bytes.first(body)) != bytes[body]) {
        status = PayloadParse::BadChecksum;
        return std::nullopt;
    }

    status = PayloadParse::Ok;
    return WatermarkPayload(std::string(bytes.begin() + kHeaderSize, bytes.begin() + body));
}

}  // namespace pngp
