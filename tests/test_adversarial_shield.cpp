/**
 * @file    test_adversarial_shield.cpp
 * @brief   AdversarialShield tests
 * @author  pngprotect contributors
 * @date    2026.10.16
 * @license MIT
 */

#include "core/adversarial_shield.hpp"
#include "core/errors.hpp"
#include "core/feature_extractor.hpp"
#include "core/watermark_codec.hpp"
#include "test_images.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <cmath>
#include <stdexcept>

using namespace pngp;

namespace {

// Forward-only backend
class FrozenExtractor final : public FeatureExtractor {
public:
    std::string name() const override { return "frozen"; }
    cv::Mat forward(const cv::Mat& tensor) const override { return inner_.forward(tensor); }
    bool differentiable() const override { return false; }
    cv::Mat backward(const cv::Mat& tensor, const cv::Mat&) const override {
        return cv::Mat::zeros(tensor.size(), tensor.type());
    }
    double clean_deviation(const cv::Mat& embedding, cv::Mat* d_embedding) const override {
        return inner_.clean_deviation(embedding, d_embedding);
    }
    double robustness_from_deviation(double deviation) const override {
        return inner_.robustness_from_deviation(deviation);
    }

private:
    FilterBankExtractor inner_;
};

}  // namespace

class AdversarialShieldTest : public ::testing::Test {
protected:
    std::shared_ptr<const FeatureExtractor> model = std::make_shared<const FilterBankExtractor>();
    AdversarialShield shield{model};
};

TEST_F(AdversarialShieldTest, LevelMapsLinearlyToSpec) {
    const ShieldConfig& config = shield.config();

    const PerturbationSpec zero = shield.spec_for_level(0);
    EXPECT_EQ(zero.epsilon, 0.0);
    EXPECT_EQ(zero.steps, 0);

    // 12/255 at level 100 is capped at the largest step under 0.04
    const PerturbationSpec full = shield.spec_for_level(100);
    EXPECT_DOUBLE_EQ(full.epsilon, 10.0 / 255.0);
    EXPECT_TRUE(full.capped);
    EXPECT_EQ(full.steps, 9);
    EXPECT_DOUBLE_EQ(full.step_size, config.step_scale * full.epsilon / full.steps);

    const PerturbationSpec saturated = shield.spec_for_level(84);
    EXPECT_DOUBLE_EQ(saturated.epsilon, full.epsilon);
    EXPECT_EQ(saturated.steps, full.steps);

    const PerturbationSpec half = shield.spec_for_level(50);
    EXPECT_DOUBLE_EQ(half.epsilon, config.max_epsilon * 0.5);
    EXPECT_EQ(half.steps, 6);
    EXPECT_FALSE(half.capped);

    // Below one 8-bit step nothing can change
    EXPECT_EQ(shield.spec_for_level(8).epsilon, 0.0);
    EXPECT_GT(shield.spec_for_level(9).epsilon, 0.0);

    PerturbationSpec previous;
    for (int level = 0; level <= 100; ++level) {
        const PerturbationSpec spec = shield.spec_for_level(level);
        EXPECT_GE(spec.epsilon, previous.epsilon) << "level " << level;
        EXPECT_GE(spec.steps, previous.steps) << "level " << level;
        EXPECT_LE(spec.epsilon, config.perceptual_threshold) << "level " << level;
        EXPECT_NEAR(spec.epsilon * 255.0, std::round(spec.epsilon * 255.0), 1e-9) << "level " << level;
        previous = spec;
    }

    EXPECT_THROW(shield.spec_for_level(-1), std::invalid_argument);
    EXPECT_THROW(shield.spec_for_level(101), std::invalid_argument);
}

TEST_F(AdversarialShieldTest, LevelZeroReturnsUnchangedCopy) {
    const PixelBuffer image = test::smooth_image(32, 32, 3, 1);
    const ShieldResult result = shield.protect(image, 0);

    EXPECT_EQ(result.image, image);
    EXPECT_EQ(result.distortion, 0.0);
    EXPECT_EQ(result.steps, 0);
    EXPECT_DOUBLE_EQ(result.robustness_score, result.baseline_score);

    const ShieldResult faint = shield.protect(image, 5);
    EXPECT_EQ(faint.image, image);
    EXPECT_EQ(faint.distortion, 0.0);
}

TEST_F(AdversarialShieldTest, PerturbationStaysInsideEpsilonBall) {
    const PixelBuffer image = test::smooth_image(48, 48, 3, 2);

    for (int level : {10, 35, 60, 85, 100}) {
        const ShieldResult result = shield.protect(image, level);
        const PerturbationSpec spec = shield.spec_for_level(level);

        EXPECT_LE(result.max_abs_delta, spec.epsilon + 1e-9) << "level " << level;
        EXPECT_LE(result.max_abs_delta, result.epsilon + 1e-9) << "level " << level;
        EXPECT_LE(result.distortion, shield.config().perceptual_threshold) << "level " << level;
        EXPECT_GT(result.distortion, 0.0) << "level " << level;
        EXPECT_TRUE(std::isfinite(result.psnr));

        cv::Mat diff;
        cv::absdiff(result.image.samples(), image.samples(), diff);
        double max_diff = 0.0;
        cv::minMaxLoc(diff.reshape(1), nullptr, &max_diff);
        EXPECT_LE(max_diff, std::floor(spec.epsilon * 255.0 + 1e-6)) << "level " << level;
    }
}

TEST_F(AdversarialShieldTest, PerceptualThresholdCapsEpsilon) {
    ShieldConfig config;
    config.max_epsilon = 24.0 / 255.0;
    config.perceptual_threshold = 0.03;
    const AdversarialShield strict(model, config);

    const ShieldResult result = strict.protect(test::smooth_image(32, 32, 3, 3), 100);
    EXPECT_TRUE(result.capped);
    EXPECT_LE(result.distortion, 0.03);
    EXPECT_DOUBLE_EQ(result.epsilon, 7.0 / 255.0);
    EXPECT_LE(result.max_abs_delta, result.epsilon + 1e-9);

    // Every level past the cap gives the same image
    EXPECT_EQ(strict.protect(test::smooth_image(32, 32, 3, 3), 60).image, result.image);
}

TEST_F(AdversarialShieldTest, DistortionNeverDecreasesWithLevel) {
    for (uint64_t seed : {4u, 5u, 6u}) {
        const PixelBuffer image = test::smooth_image(48, 48, 3, seed);
        double previous = 0.0;
        for (int level = 0; level <= 100; ++level) {
            const ShieldResult result = shield.protect(image, level);
            EXPECT_LE(result.distortion, shield.config().perceptual_threshold)
                << "seed " << seed << " level " << level;
            EXPECT_GE(result.distortion, previous) << "seed " << seed << " level " << level;
            previous = result.distortion;
        }
    }
}

TEST_F(AdversarialShieldTest, AverageScoreNeverDecreasesWithLevel) {
    const std::vector<PixelBuffer> corpus = test::smooth_corpus(20, 48, 48);
    std::vector<int> levels{0, 10, 20, 30, 40, 50, 60, 70};
    for (int level = 75; level <= 100; ++level) {
        levels.push_back(level);
    }

    std::vector<double> averages;
    for (int level : levels) {
        double total = 0.0;
        for (const PixelBuffer& image : corpus) {
            total += shield.protect(image, level).robustness_score;
        }
        averages.push_back(total / static_cast<double>(corpus.size()));
    }

    for (size_t i = 1; i < averages.size(); ++i) {
        EXPECT_GE(averages[i], averages[i - 1] - 1e-9)
            << "level " << levels[i - 1] << " -> " << levels[i];
    }
    EXPECT_GT(averages.back(), averages.front() + 25.0);
}

TEST_F(AdversarialShieldTest, ScoreIsInRangeAndMatchesProtectResult) {
    const PixelBuffer image = test::smooth_image(32, 32, 3, 7);
    const double baseline = shield.score(image);
    EXPECT_GE(baseline, 0.0);
    EXPECT_LE(baseline, 100.0);

    const ShieldResult result = shield.protect(image, 70);
    EXPECT_DOUBLE_EQ(result.baseline_score, baseline);
    EXPECT_DOUBLE_EQ(result.robustness_score, shield.score(result.image));
    EXPECT_GT(result.robustness_score, baseline);
    EXPECT_GT(result.embedding_shift, 0.0);
}

TEST_F(AdversarialShieldTest, EmbeddingDistanceModeMovesEmbedding) {
    ShieldConfig config;
    config.target_mode = TargetMode::EmbeddingDistance;
    const AdversarialShield distance(model, config);

    const PixelBuffer image = test::smooth_image(32, 32, 3, 8);
    const ShieldResult result = distance.protect(image, 60);
    EXPECT_GT(result.embedding_shift, 0.5);
    EXPECT_LE(result.max_abs_delta, distance.spec_for_level(60).epsilon + 1e-9);
}

TEST_F(AdversarialShieldTest, IsDeterministic) {
    const PixelBuffer image = test::smooth_image(32, 32, 3, 9);
    const ShieldResult a = shield.protect(image, 55);
    const ShieldResult b = shield.protect(image, 55);
    EXPECT_EQ(a.image, b.image);
    EXPECT_DOUBLE_EQ(a.robustness_score, b.robustness_score);
}

TEST_F(AdversarialShieldTest, AlphaIsNeverPerturbed) {
    const PixelBuffer image = test::smooth_image(24, 24, 4, 10);
    const ShieldResult result = shield.protect(image, 90);

    std::vector<cv::Mat> before, after;
    cv::split(image.samples(), before);
    cv::split(result.image.samples(), after);
    EXPECT_EQ(cv::norm(before[3], after[3], cv::NORM_INF), 0.0);
    EXPECT_GT(cv::norm(before[0], after[0], cv::NORM_INF), 0.0);
}

TEST_F(AdversarialShieldTest, PreservesWatermarkCarrier) {
    WatermarkCodec codec;
    const PixelBuffer image = codec.embed(test::smooth_image(64, 64, 3, 11), "owner-7", 8).image;

    const ShieldResult result = shield.protect(image, 100);
    EXPECT_EQ(result.watermark_strength, 8);

    const ExtractResult extracted = codec.extract(result.image);
    ASSERT_TRUE(extracted.valid());
    EXPECT_EQ(extracted.payload->owner_id(), "owner-7");
    EXPECT_FALSE(extracted.partial_recovery);
}

TEST_F(AdversarialShieldTest, PreservesShiftedSparseCarrier) {
    WatermarkCodec codec;
    const PixelBuffer marked = codec.embed(test::smooth_image(64, 63, 3, 14), "owner-9", 1).image;
    const PixelBuffer cropped(marked.samples()(cv::Rect(0, 1, 63, 63)));

    const ShieldResult result = shield.protect(cropped, 100);
    EXPECT_EQ(result.watermark_strength, 1);

    const ExtractResult extracted = codec.extract(result.image);
    ASSERT_TRUE(extracted.valid());
    EXPECT_EQ(extracted.payload->owner_id(), "owner-9");
    EXPECT_EQ(extracted.carrier_phase, 1);
    EXPECT_FALSE(extracted.partial_recovery);
}

TEST_F(AdversarialShieldTest, CancellationThrowsWithoutResult) {
    std::atomic<bool> cancel{true};
    EXPECT_THROW(shield.protect(test::smooth_image(32, 32, 3, 12), 80, &cancel), Cancelled);

    cancel = false;
    EXPECT_NO_THROW(shield.protect(test::smooth_image(32, 32, 3, 12), 80, &cancel));
}

TEST_F(AdversarialShieldTest, MissingModelIsReported) {
    EXPECT_THROW(AdversarialShield(nullptr), ModelUnavailableError);

    const AdversarialShield frozen(std::make_shared<const FrozenExtractor>());
    const PixelBuffer image = test::smooth_image(16, 16, 3, 13);
    EXPECT_THROW(frozen.protect(image, 50), ModelUnavailableError);
    EXPECT_NO_THROW(frozen.score(image));
}

TEST_F(AdversarialShieldTest, EmptyBufferIsInvalid) {
    const PixelBuffer empty;
    EXPECT_THROW(shield.protect(empty, 50), InvalidImageError);
    EXPECT_THROW(shield.score(empty), InvalidImageError);
}
