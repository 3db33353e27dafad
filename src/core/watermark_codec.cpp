/**
 * @file    watermark_codec.cpp
 * @brief   LSB watermark embedding and majority-vote extraction
 * @author  pngprotect contributors
 * @date    2026.10.16
 * @license MIT
 *
 * @details
 * Extraction per plan, repeated for every pixel phase of a sparse plan:
 *   1. Read the carrier packed MSB first.
 *   2. Find every "PNGP" marker at any bit offset and the length it
 *      declares. Cropping rows off the top shifts the stream by an
 *      arbitrary number of slots.
 *   3. Adopt the most frequent plausible (length, grid) pair; its first
 *      marker anchors the copy grid, so copies with a damaged marker
 *      still take part.
 *   4. Re-pack the stream from the anchor, majority-vote each byte
 *      position across all copies and verify the CRC. If the vote fails,
 *      fall back to any copy that verifies alone.
 */

#include "core/watermark_codec.hpp"
#include "core/errors.hpp"

#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <bit>
#include <chrono>
#include <cmath>
#include <map>
#include <stdexcept>
#include <utility>

namespace pngp {

namespace {

constexpr std::array<CarrierPlan, kMaxStrength> kPlans{{
    {.strength = 1,  .pixel_step = 2, .bits = {1, 0, 0}},
    {.strength = 2,  .pixel_step = 1, .bits = {1, 0, 0}},
    {.strength = 3,  .pixel_step = 1, .bits = {1, 1, 0}},
    {.strength = 4,  .pixel_step = 1, .bits = {1, 1, 1}},
    {.strength = 5,  .pixel_step = 1, .bits = {2, 1, 1}},
    {.strength = 6,  .pixel_step = 1, .bits = {2, 2, 1}},
    {.strength = 7,  .pixel_step = 1, .bits = {2, 2, 2}},
    {.strength = 8,  .pixel_step = 1, .bits = {3, 2, 2}},
    {.strength = 9,  .pixel_step = 1, .bits = {3, 3, 2}},
    {.strength = 10, .pixel_step = 1, .bits = {3, 3, 3}},
}};

size_t used_pixels(size_t pixel_count, int pixel_step) {
    return (pixel_count + static_cast<size_t>(pixel_step) - 1) / static_cast<size_t>(pixel_step);
}

int color_channels_of(int channels) {
    return channels == 4 ? 3 : channels;
}

constexpr uint32_t magic_word() {
    uint32_t word = 0;
    for (uint8_t byte : WatermarkPayload::kMagic) {
        word = (word << 8) | byte;
    }
    return word;
}

constexpr uint32_t kMagicWord = magic_word();
constexpr size_t kHeaderBits = WatermarkPayload::kHeaderSize * 8;

struct MarkerHit {
    size_t count = 0;
    size_t first_offset = 0;    // Bit offset
};

}  // namespace

// =============================================================================
// Carrier plans
// =============================================================================

int CarrierPlan::bits_per_pixel(int color_channels) const {
    int total = 0;
    for (int c = 0; c < std::min(color_channels, 3); ++c) {
        total += bits[c];
    }
    return total;
}

bool CarrierPlan::equivalent(const CarrierPlan& other, int color_channels) const {
    if (pixel_step != other.pixel_step) {
        return false;
    }
    for (int c = 0; c < std::min(color_channels, 3); ++c) {
        if (bits[c] != other.bits[c]) {
            return false;
        }
    }
    return true;
}

CarrierPlan carrier_plan(int strength) {
    if (strength < kMinStrength || strength > kMaxStrength) {
        throw std::invalid_argument(fmt::format(
            "Strength {} out of range [{}, {}]", strength, kMinStrength, kMaxStrength));
    }
    return kPlans[static_cast<size_t>(strength - 1)];
}

size_t carrier_capacity_bits(int height, int width, int channels, int strength) {
    if (height <= 0 || width <= 0) {
        return 0;
    }
    const CarrierPlan plan = carrier_plan(strength);
    const size_t pixels = static_cast<size_t>(height) * static_cast<size_t>(width);
    return used_pixels(pixels, plan.pixel_step) *
           static_cast<size_t>(plan.bits_per_pixel(color_channels_of(channels)));
}

size_t max_payload_length(int height, int width, int channels, int strength) {
    const size_t capacity_bytes = carrier_capacity_bits(height, width, channels, strength) / 8;
    if (capacity_bytes <= WatermarkPayload::kOverheadSize) {
        return 0;
    }
    return std::min(capacity_bytes - WatermarkPayload::kOverheadSize,
                    WatermarkPayload::kMaxOwnerIdLength);
}

const char* to_string(WatermarkValidity validity) {
    switch (validity) {
        case WatermarkValidity::Valid:     return "valid";
        case WatermarkValidity::NotFound:  return "not_found";
        case WatermarkValidity::Corrupted: return "corrupted";
    }
    return "unknown";
}

// =============================================================================
// Carrier access
// =============================================================================

std::vector<uint8_t> CarrierBits::realign(size_t bit_offset) const {
    const size_t count = bit_offset < bit_count ? (bit_count - bit_offset) / 8 : 0;
    const size_t first = bit_offset >> 3;
    const unsigned shift = static_cast<unsigned>(bit_offset & 7);

    std::vector<uint8_t> out(count);
    for (size_t k = 0; k < count; ++k) {
        const unsigned hi = bytes[first + k];
        const unsigned lo = shift != 0 && first + k + 1 < bytes.size() ? bytes[first + k + 1] : 0;
        out[k] = static_cast<uint8_t>((hi << shift) | (lo >> (8 - shift)));
    }
    return out;
}

CarrierBits WatermarkCodec::read_carrier(const PixelBuffer& image,
                                         const CarrierPlan& plan,
                                         size_t first_pixel) {
    const int channels = image.channels();
    const int colors = image.color_channels();
    const size_t pixels = image.pixel_count();

    CarrierBits carrier;
    if (first_pixel >= pixels) {
        return carrier;
    }
    const size_t slots = used_pixels(pixels - first_pixel, plan.pixel_step) *
                         static_cast<size_t>(plan.bits_per_pixel(colors));
    carrier.bytes.reserve((slots + 7) / 8);

    const uint8_t* data = image.data();
    unsigned pending = 0;
    for (size_t i = first_pixel; i < pixels; i += static_cast<size_t>(plan.pixel_step)) {
        const uint8_t* pixel = data + i * static_cast<size_t>(channels);
        for (int c = 0; c < colors; ++c) {
            for (int b = 0; b < plan.bits_for(c); ++b) {
                pending = (pending << 1) | ((pixel[c] >> b) & 1u);
                if ((++carrier.bit_count & 7) == 0) {
                    carrier.bytes.push_back(static_cast<uint8_t>(pending));
                    pending = 0;
                }
            }
        }
    }

    const size_t tail = carrier.bit_count & 7;
    if (tail != 0) {
        carrier.bytes.push_back(static_cast<uint8_t>(pending << (8 - tail)));
    }
    return carrier;
}

void WatermarkCodec::write_carrier(PixelBuffer& image,
                                   const CarrierPlan& plan,
                                   std::span<const uint8_t> stream_bits) {
    if (stream_bits.empty()) {
        return;
    }

    const int channels = image.channels();
    const int colors = image.color_channels();
    const size_t pixels = image.pixel_count();
    const size_t period = stream_bits.size();

    uint8_t* data = image.data();
    size_t slot = 0;
    for (size_t i = 0; i < pixels; i += static_cast<size_t>(plan.pixel_step)) {
        uint8_t* pixel = data + i * static_cast<size_t>(channels);
        for (int c = 0; c < colors; ++c) {
            for (int b = 0; b < plan.bits_for(c); ++b) {
                const uint8_t bit = stream_bits[slot % period] & 1;
                pixel[c] = static_cast<uint8_t>((pixel[c] & ~(1u << b)) | (bit << b));
                ++slot;
            }
        }
    }
}

// =============================================================================
// Embed
// =============================================================================

EmbedResult WatermarkCodec::embed(const PixelBuffer& image,
                                  const std::string& owner_id,
                                  int strength) const {
    return embed(image, WatermarkPayload(owner_id), strength);
}

EmbedResult WatermarkCodec::embed(const PixelBuffer& image,
                                  const WatermarkPayload& payload,
                                  int strength) const {
    image.validate("embed");
    const CarrierPlan plan = carrier_plan(strength);

    const size_t capacity = carrier_capacity_bits(
        image.height(), image.width(), image.channels(), strength);
    const size_t required = payload.serialized_bits();

    if (required > capacity) {
        // Smallest square of the same channel layout that would hold one copy
        const int bpp = plan.bits_per_pixel(image.color_channels());
        int side = static_cast<int>(std::ceil(std::sqrt(
            static_cast<double>(required) * plan.pixel_step / std::max(bpp, 1))));
        while (carrier_capacity_bits(side, side, image.channels(), strength) < required) {
            ++side;
        }
        throw CapacityError(
            fmt::format("Image {}x{}x{} holds {} carrier bits at strength {}, "
                        "payload needs {} (minimum {}x{} pixels)",
                        image.width(), image.height(), image.channels(),
                        capacity, strength, required, side, side),
            required, capacity, side);
    }

    const std::vector<uint8_t> stream = bytes_to_bits(payload.serialize());

    EmbedResult result{
        .image = image,
        .strength = strength,
        .bits_per_pixel = plan.bits_per_pixel(image.color_channels()),
        .capacity_bits = capacity,
        .payload_bits = required,
        .copies_written = capacity / required,
        .capacity_utilization = static_cast<double>(required) / static_cast<double>(capacity),
    };

    write_carrier(result.image, plan, stream);

    spdlog::debug("Embedded {}-byte owner id at strength {}: {} copies, utilization {:.4f}",
                  payload.owner_id().size(), strength, result.copies_written,
                  result.capacity_utilization);

    return result;
}

// =============================================================================
// Extract
// =============================================================================

namespace {

ExtractResult extract_at_phase(const PixelBuffer& image, const CarrierPlan& plan, int phase) {
    ExtractResult result{};

    const CarrierBits stream = WatermarkCodec::read_carrier(image, plan, static_cast<size_t>(phase));
    const size_t n_bits = stream.bit_count;
    if (n_bits < (WatermarkPayload::kOverheadSize + 1) * 8) {
        return result;
    }

    // Collect markers with a plausible declared length, keyed by (length, grid anchor)
    std::map<std::pair<size_t, size_t>, MarkerHit> hits;
    bool any_marker = false;
    uint64_t window = 0;
    for (size_t i = 0; i < n_bits; ++i) {
        window = (window << 1) | stream.bit(i);
        if (i + 1 < kHeaderBits || static_cast<uint32_t>(window >> 16) != kMagicWord) {
            continue;
        }
        any_marker = true;

        const size_t offset = i + 1 - kHeaderBits;
        const size_t length = static_cast<size_t>(window & 0xFFFF);
        const size_t copy_bits = (WatermarkPayload::kOverheadSize + length) * 8;
        if (length == 0 || offset + copy_bits > n_bits) {
            continue;
        }
        MarkerHit& hit = hits[{length, offset % copy_bits}];
        if (hit.count++ == 0) {
            hit.first_offset = offset;
        }
    }

    if (!any_marker) {
        return result;
    }

    result.strength = plan.strength;
    result.carrier_phase = phase;
    result.validity = WatermarkValidity::Corrupted;

    if (hits.empty()) {
        spdlog::debug("Strength {}: marker present but no plausible length", plan.strength);
        return result;
    }

    // Most frequent grid wins; ties go to the earliest marker
    auto best = hits.begin();
    for (auto it = hits.begin(); it != hits.end(); ++it) {
        if (it->second.count > best->second.count ||
            (it->second.count == best->second.count &&
             it->second.first_offset < best->second.first_offset)) {
            best = it;
        }
    }

    const size_t copy_size = WatermarkPayload::kOverheadSize + best->first.first;
    const std::vector<uint8_t> bytes = stream.realign(best->first.second);
    const std::span<const uint8_t> carrier(bytes);
    const size_t n = bytes.size();

    std::vector<size_t> copies;
    for (size_t offset = 0; offset + copy_size <= n; offset += copy_size) {
        copies.push_back(offset);
    }
    result.copies_found = copies.size();

    // Per-copy verification
    std::optional<size_t> first_intact;
    for (size_t offset : copies) {
        PayloadParse status;
        if (WatermarkPayload::parse(carrier.subspan(offset, copy_size), status)) {
            ++result.copies_intact;
            if (!first_intact) {
                first_intact = offset;
            }
        }
    }

    // Per-byte majority vote
    std::vector<uint8_t> consensus(copy_size);
    std::array<uint32_t, 256> votes{};
    for (size_t pos = 0; pos < copy_size; ++pos) {
        votes.fill(0);
        for (size_t offset : copies) {
            ++votes[bytes[offset + pos]];
        }
        consensus[pos] = static_cast<uint8_t>(
            std::distance(votes.begin(), std::max_element(votes.begin(), votes.end())));
    }

    PayloadParse status;
    auto payload = WatermarkPayload::parse(consensus, status);
    if (!payload && first_intact) {
        std::copy_n(bytes.begin() + static_cast<std::ptrdiff_t>(*first_intact), copy_size,
                    consensus.begin());
        payload = WatermarkPayload::parse(consensus, status);
    }

    if (!payload) {
        spdlog::debug("Strength {}: {} copies, none verifies", plan.strength, copies.size());
        return result;
    }

    size_t differing_bits = 0;
    for (size_t offset : copies) {
        for (size_t pos = 0; pos < copy_size; ++pos) {
            differing_bits += static_cast<size_t>(
                std::popcount(static_cast<unsigned>(bytes[offset + pos] ^ consensus[pos])));
        }
    }

    result.payload = std::move(payload);
    result.validity = WatermarkValidity::Valid;
    result.partial_recovery = result.copies_intact < result.copies_found;
    result.bit_error_rate = static_cast<double>(differing_bits) /
                            static_cast<double>(copies.size() * copy_size * 8);
    result.confidence = static_cast<float>(1.0 - result.bit_error_rate);

    return result;
}

}  // namespace

ExtractResult WatermarkCodec::extract_with_plan(const PixelBuffer& image,
                                                const CarrierPlan& plan) const {
    // Sparse plans are read at every phase, a crop can move the carrier pixels
    std::optional<ExtractResult> corrupted;
    for (int phase = 0; phase < plan.pixel_step; ++phase) {
        ExtractResult attempt = extract_at_phase(image, plan, phase);
        if (attempt.valid()) {
            return attempt;
        }
        if (attempt.validity == WatermarkValidity::Corrupted && !corrupted) {
            corrupted = std::move(attempt);
        }
    }
    return corrupted ? std::move(*corrupted) : ExtractResult{};
}

ExtractResult WatermarkCodec::extract(const PixelBuffer& image) const {
    image.validate("extract");

    auto start_time = std::chrono::high_resolution_clock::now();

    const int colors = image.color_channels();
    std::vector<CarrierPlan> scanned;
    std::optional<ExtractResult> corrupted;

    for (int strength = kMinStrength; strength <= kMaxStrength; ++strength) {
        const CarrierPlan plan = carrier_plan(strength);

        // Skip plans that read the same slots as one already scanned
        const bool duplicate = std::any_of(scanned.begin(), scanned.end(),
            [&](const CarrierPlan& p) { return p.equivalent(plan, colors); });
        if (duplicate) {
            continue;
        }
        scanned.push_back(plan);

        ExtractResult attempt = extract_with_plan(image, plan);
        if (attempt.valid()) {
            auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::high_resolution_clock::now() - start_time).count();
            spdlog::debug("Extract: '{}' at strength {} ({} / {} copies intact, ber={:.4f}) in {} us",
                          attempt.payload->owner_id(), strength,
                          attempt.copies_intact, attempt.copies_found,
                          attempt.bit_error_rate, elapsed);
            return attempt;
        }
        if (attempt.validity == WatermarkValidity::Corrupted && !corrupted) {
            corrupted = std::move(attempt);
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::high_resolution_clock::now() - start_time).count();

    if (corrupted) {
        spdlog::debug("Extract: marker at strength {} but checksum fails in every copy ({} us)",
                      corrupted->strength, elapsed);
        return *corrupted;
    }

    spdlog::debug("Extract: no watermark marker in {} plans ({} us)", scanned.size(), elapsed);
    return ExtractResult{};
}

bool WatermarkCodec::has_watermark(const PixelBuffer& image) const {
    return extract(image).valid();
}

}  // namespace pngp
