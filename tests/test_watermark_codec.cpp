/**
 * @file    test_watermark_codec.cpp
 * @brief   Carrier plan and watermark codec tests
 * @author  pngprotect contributors
 * @date    2026.10.16
 * @license MIT
 */

#include "core/errors.hpp"
#include "core/watermark_codec.hpp"
#include "test_images.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace pngp;

class WatermarkCodecTest : public ::testing::Test {
protected:
    WatermarkCodec codec;
};

// =============================================================================
// Carrier plans and capacity
// =============================================================================

TEST(CarrierPlan, StrengthOutOfRangeThrows) {
    EXPECT_THROW(carrier_plan(0), std::invalid_argument);
    EXPECT_THROW(carrier_plan(11), std::invalid_argument);
    EXPECT_NO_THROW(carrier_plan(kMinStrength));
    EXPECT_NO_THROW(carrier_plan(kMaxStrength));
}

TEST(CarrierPlan, CapacityStrictlyIncreasesWithStrength) {
    for (int channels : {3, 4}) {
        size_t previous_bits = 0;
        size_t previous_length = 0;
        for (int strength = kMinStrength; strength <= kMaxStrength; ++strength) {
            const size_t bits = carrier_capacity_bits(64, 64, channels, strength);
            const size_t length = max_payload_length(64, 64, channels, strength);
            EXPECT_GT(bits, previous_bits) << "channels " << channels << " strength " << strength;
            EXPECT_GT(length, previous_length) << "channels " << channels << " strength " << strength;
            previous_bits = bits;
            previous_length = length;
        }
    }
}

TEST(CarrierPlan, CapacityIsDeterministicAndIgnoresAlpha) {
    EXPECT_EQ(carrier_capacity_bits(64, 64, 3, 1), 2048u);
    EXPECT_EQ(carrier_capacity_bits(64, 64, 3, 4), 3u * 4096u);
    EXPECT_EQ(carrier_capacity_bits(64, 64, 3, 10), 9u * 4096u);
    EXPECT_EQ(carrier_capacity_bits(64, 64, 4, 10), carrier_capacity_bits(64, 64, 3, 10));
    EXPECT_EQ(carrier_capacity_bits(0, 64, 3, 5), 0u);
}

TEST(CarrierPlan, GrayscalePlansCollapse) {
    // Only the first channel exists, so strengths 2, 3 and 4 touch the same slots
    EXPECT_TRUE(carrier_plan(2).equivalent(carrier_plan(4), 1));
    EXPECT_FALSE(carrier_plan(2).equivalent(carrier_plan(4), 3));
    EXPECT_FALSE(carrier_plan(1).equivalent(carrier_plan(2), 1));
}

// =============================================================================
// Round trip
// =============================================================================

TEST_F(WatermarkCodecTest, RoundTripAtEveryStrength) {
    const PixelBuffer cover = test::smooth_image(64, 64, 3, 42);

    for (int strength = kMinStrength; strength <= kMaxStrength; ++strength) {
        const EmbedResult embedded = codec.embed(cover, "artist-42", strength);
        EXPECT_EQ(embedded.strength, strength);
        EXPECT_GT(embedded.copies_written, 0u);
        EXPECT_GT(embedded.capacity_utilization, 0.0);
        EXPECT_LE(embedded.capacity_utilization, 1.0);

        const ExtractResult extracted = codec.extract(embedded.image);
        ASSERT_TRUE(extracted.valid()) << "strength " << strength;
        EXPECT_EQ(extracted.payload->owner_id(), "artist-42");
        EXPECT_EQ(extracted.strength, strength);
        EXPECT_FALSE(extracted.partial_recovery);
        EXPECT_DOUBLE_EQ(extracted.bit_error_rate, 0.0);
        EXPECT_FLOAT_EQ(extracted.confidence, 1.0f);
        EXPECT_EQ(extracted.copies_intact, extracted.copies_found);
    }
}

TEST_F(WatermarkCodecTest, RoundTripWithAlphaAndGrayscale) {
    const PixelBuffer rgba = test::smooth_image(32, 32, 4, 3);
    const EmbedResult rgba_result = codec.embed(rgba, "alpha-owner", 6);

    // Alpha samples are never carriers
    for (int y = 0; y < rgba.height(); ++y) {
        for (int x = 0; x < rgba.width(); ++x) {
            ASSERT_EQ(rgba_result.image.at(y, x, 3), rgba.at(y, x, 3));
        }
    }
    const ExtractResult rgba_extracted = codec.extract(rgba_result.image);
    ASSERT_TRUE(rgba_extracted.valid());
    EXPECT_EQ(rgba_extracted.payload->owner_id(), "alpha-owner");

    const PixelBuffer gray = test::noise_image(32, 32, 1, 5);
    const ExtractResult gray_extracted = codec.extract(codec.embed(gray, "gray-owner", 3).image);
    ASSERT_TRUE(gray_extracted.valid());
    EXPECT_EQ(gray_extracted.payload->owner_id(), "gray-owner");
    // Strength 3 reads the same slots as strength 2 on one channel
    EXPECT_EQ(gray_extracted.strength, 2);
}

TEST_F(WatermarkCodecTest, EmbedDoesNotMutateInput) {
    const PixelBuffer cover = test::smooth_image(32, 32, 3, 8);
    const PixelBuffer snapshot = cover;

    const EmbedResult embedded = codec.embed(cover, "owner", 10);
    EXPECT_EQ(cover, snapshot);
    EXPECT_NE(embedded.image, cover);
}

TEST_F(WatermarkCodecTest, ReEmbedOverwritesPreviousOwner) {
    const PixelBuffer cover = test::smooth_image(64, 64, 3, 9);

    for (int strength : {1, 5, 10}) {
        const EmbedResult first = codec.embed(cover, "first-owner-with-a-long-id", strength);
        const EmbedResult second = codec.embed(first.image, "second", strength);

        const ExtractResult extracted = codec.extract(second.image);
        ASSERT_TRUE(extracted.valid()) << "strength " << strength;
        EXPECT_EQ(extracted.payload->owner_id(), "second");
        EXPECT_FALSE(extracted.partial_recovery);
    }
}

TEST_F(WatermarkCodecTest, HasWatermark) {
    const PixelBuffer cover = test::smooth_image(32, 32, 3, 10);
    EXPECT_FALSE(codec.has_watermark(cover));
    EXPECT_TRUE(codec.has_watermark(codec.embed(cover, "owner", 4).image));
}

// =============================================================================
// Failure modes
// =============================================================================

TEST_F(WatermarkCodecTest, OnePixelImageFailsWithCapacityError) {
    const PixelBuffer tiny(1, 1, 3);
    for (int strength = kMinStrength; strength <= kMaxStrength; ++strength) {
        EXPECT_THROW(codec.embed(tiny, "a", strength), CapacityError) << "strength " << strength;
    }
}

TEST_F(WatermarkCodecTest, CapacityErrorReportsMinimumSize) {
    const PixelBuffer small(8, 8, 3);
    try {
        codec.embed(small, "artist-42", 1);
        FAIL() << "expected CapacityError";
    } catch (const CapacityError& e) {
        // 128 bits at half a bit per pixel
        EXPECT_EQ(e.required_bits(), 128u);
        EXPECT_EQ(e.available_bits(), 32u);
        EXPECT_EQ(e.min_square_side(), 16);
    }

    const PixelBuffer exact = test::smooth_image(16, 16, 3, 12);
    EXPECT_NO_THROW(codec.embed(exact, "artist-42", 1));
}

TEST_F(WatermarkCodecTest, EmptyBufferIsInvalid) {
    const PixelBuffer empty;
    EXPECT_THROW(codec.embed(empty, "owner", 5), InvalidImageError);
    EXPECT_THROW(codec.extract(empty), InvalidImageError);
}

TEST_F(WatermarkCodecTest, CleanImageIsNotFound) {
    const ExtractResult result = codec.extract(test::smooth_image(64, 64, 3, 13));
    EXPECT_EQ(result.validity, WatermarkValidity::NotFound);
    EXPECT_FALSE(result.payload.has_value());
    EXPECT_EQ(result.strength, 0);
    EXPECT_STREQ(to_string(result.validity), "not_found");
}

TEST_F(WatermarkCodecTest, ChecksumFailureInOnlyCopyIsCorrupted) {
    // 10 x 4 pixels at strength 4 hold exactly one 15-byte copy of "artist42"
    const PixelBuffer cover = test::noise_image(4, 10, 3, 14);
    const EmbedResult embedded = codec.embed(cover, "artist42", 4);
    ASSERT_EQ(embedded.capacity_bits, embedded.payload_bits);
    ASSERT_EQ(embedded.copies_written, 1u);

    // Pixel 20 carries bits 60..62, inside the owner id
    PixelBuffer damaged = embedded.image;
    uint8_t* pixel = damaged.data() + 20 * 3;
    for (int c = 0; c < 3; ++c) {
        pixel[c] ^= 0x01;
    }

    const ExtractResult result = codec.extract(damaged);
    EXPECT_EQ(result.validity, WatermarkValidity::Corrupted);
    EXPECT_FALSE(result.payload.has_value());
    EXPECT_EQ(result.strength, 4);
    EXPECT_EQ(result.copies_found, 1u);
    EXPECT_EQ(result.copies_intact, 0u);
}

TEST_F(WatermarkCodecTest, LocalizedDamageIsOutvoted) {
    const PixelBuffer cover = test::smooth_image(64, 64, 3, 15);
    const EmbedResult embedded = codec.embed(cover, "artist-42", 4);

    // Overwrite the first 8 rows, destroying the leading copies and their markers
    PixelBuffer damaged = embedded.image;
    cv::Mat top = damaged.samples()(cv::Rect(0, 0, 64, 8));
    cv::RNG rng(99);
    rng.fill(top, cv::RNG::UNIFORM, 0, 256);

    const ExtractResult result = codec.extract(damaged);
    ASSERT_TRUE(result.valid());
    EXPECT_EQ(result.payload->owner_id(), "artist-42");
    EXPECT_TRUE(result.partial_recovery);
    EXPECT_LT(result.copies_intact, result.copies_found);
    EXPECT_GT(result.bit_error_rate, 0.0);
    EXPECT_LT(result.confidence, 1.0f);
}

TEST_F(WatermarkCodecTest, ExtractWithPlanOnlyReadsThatPlan) {
    const PixelBuffer cover = test::smooth_image(32, 32, 3, 16);
    const EmbedResult embedded = codec.embed(cover, "owner", 7);

    EXPECT_TRUE(codec.extract_with_plan(embedded.image, carrier_plan(7)).valid());
    EXPECT_FALSE(codec.extract_with_plan(embedded.image, carrier_plan(9)).valid());
}

// =============================================================================
// Carrier stream and cropping
// =============================================================================

TEST(CarrierBits, PacksSlotsMostSignificantBitFirst) {
    const std::vector<uint8_t> lsbs{1, 0, 1, 1, 0, 0, 1, 0, 1, 1, 1, 1};
    cv::Mat samples(1, static_cast<int>(lsbs.size()), CV_8UC1);
    for (size_t i = 0; i < lsbs.size(); ++i) {
        samples.at<uint8_t>(0, static_cast<int>(i)) = static_cast<uint8_t>(0x40 | lsbs[i]);
    }
    const PixelBuffer image(samples);

    const CarrierBits dense = WatermarkCodec::read_carrier(image, carrier_plan(2));
    EXPECT_EQ(dense.bit_count, 12u);
    EXPECT_EQ(dense.bytes, (std::vector<uint8_t>{0xB2, 0xF0}));
    EXPECT_EQ(dense.bit(2), 1);
    EXPECT_EQ(dense.bit(4), 0);
    EXPECT_EQ(dense.realign(4), std::vector<uint8_t>{0x2F});
    EXPECT_TRUE(dense.realign(12).empty());

    // Odd pixels of a sparse plan
    const CarrierBits odd = WatermarkCodec::read_carrier(image, carrier_plan(1), 1);
    EXPECT_EQ(odd.bit_count, 6u);
    EXPECT_EQ(odd.bytes, std::vector<uint8_t>{0x4C});
}

TEST_F(WatermarkCodecTest, RowCropOfOddWidthImageStillExtracts) {
    const PixelBuffer cover = test::smooth_image(64, 63, 3, 17);

    for (int strength : {2, 5}) {
        const EmbedResult embedded = codec.embed(cover, "artist-42", strength);
        for (int rows : {1, 3, 5}) {
            const PixelBuffer cropped(embedded.image.samples()(cv::Rect(0, rows, 63, 64 - rows)));

            const ExtractResult result = codec.extract(cropped);
            ASSERT_TRUE(result.valid()) << "strength " << strength << " rows " << rows;
            EXPECT_EQ(result.payload->owner_id(), "artist-42");
            EXPECT_EQ(result.strength, strength);
            EXPECT_FALSE(result.partial_recovery);
            EXPECT_DOUBLE_EQ(result.bit_error_rate, 0.0);
        }
    }
}

TEST_F(WatermarkCodecTest, RowCropShiftsSparseCarrierPhase) {
    const EmbedResult embedded = codec.embed(test::smooth_image(64, 63, 3, 18), "artist-42", 1);

    const PixelBuffer cropped(embedded.image.samples()(cv::Rect(0, 1, 63, 63)));
    const ExtractResult result = codec.extract(cropped);
    ASSERT_TRUE(result.valid());
    EXPECT_EQ(result.payload->owner_id(), "artist-42");
    EXPECT_EQ(result.strength, 1);
    EXPECT_EQ(result.carrier_phase, 1);

    const ExtractResult uncropped = codec.extract(embedded.image);
    EXPECT_EQ(uncropped.carrier_phase, 0);
}
