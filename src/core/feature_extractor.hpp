/**
 * @file    feature_extractor.hpp
 * @brief   Differentiable feature-extractor capability and filter-bank model
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 *
 * @details
 * The adversarial shield treats the vision model as an opaque function
 * with a vector-Jacobian product. Any backend that can provide
 * forward() and backward() plugs in behind FeatureExtractor.
 *
 * FilterBankExtractor is the bundled model:
 *
 *   gray   = mean of colour channels
 *   r_k    = gray (*) kernel_k              zero padding, k = 0..K-1
 *   e[k,g] = mean over grid cell g of r_k^2
 *
 * Kernels are zero-mean and unit-norm and split into a fine band
 * (pixel-scale differences) and a coarse band (Gabor, wavelength 8).
 * Natural images concentrate energy in the coarse band; the
 * clean_deviation() statistic is the mean log ratio of fine to coarse
 * energy across grid cells.
 */

#pragma once

#include <opencv2/core.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace pngp {

/**
 * Abstract differentiable feature extractor
 *
 * Implementations must be safe for concurrent const calls.
 */
class FeatureExtractor {
public:
    virtual ~FeatureExtractor() = default;

    virtual std::string name() const = 0;

    /**
     * Forward pass
     *
     * @param tensor  CV_32FC(n) image, samples in [0, 1]
     * @return        1 x N CV_32F embedding
     */
    virtual cv::Mat forward(const cv::Mat& tensor) const = 0;

    /**
     * Whether backward() is implemented
     */
    virtual bool differentiable() const = 0;

    /**
     * Vector-Jacobian product
     *
     * @param tensor       Same input as the forward pass
     * @param d_embedding  dJ/d(embedding), 1 x N CV_32F
     * @return             dJ/d(tensor), same shape and type as tensor
     */
    virtual cv::Mat backward(const cv::Mat& tensor, const cv::Mat& d_embedding) const = 0;

    /**
     * Distance of an embedding from clean-image statistics
     *
     * Larger means less like a clean natural image.
     *
     * @param embedding    Output of forward()
     * @param d_embedding  Optional, receives d(deviation)/d(embedding)
     */
    virtual double clean_deviation(const cv::Mat& embedding, cv::Mat* d_embedding = nullptr) const = 0;

    /**
     * Logistic mapping of clean_deviation() onto [0, 100]
     */
    virtual double robustness_from_deviation(double deviation) const = 0;
};

/**
 * Weights of the filter-bank model
 */
struct FilterBankWeights {
    std::string name = "filterbank-v1";
    std::vector<cv::Mat> fine_kernels;      // CV_32F, odd square size
    std::vector<cv::Mat> coarse_kernels;    // CV_32F, odd square size
    int grid = 4;                           // Pooling grid is grid x grid
    double fine_floor = 1e-7;               // Added to fine energy
    double coarse_floor = 1e-5;             // Added to coarse energy
    double score_center = -2.0;             // Deviation mapped to score 50
    double score_width = 0.75;

    /**
     * The built-in weights
     */
    static FilterBankWeights builtin();

    /**
     * Load weights written by save()
     *
     * @throws ModelUnavailableError  if the file is missing or malformed
     */
    static FilterBankWeights load(const std::filesystem::path& path);

    /**
     * Write weights through cv::FileStorage (format chosen by extension)
     */
    void save(const std::filesystem::path& path) const;
};

class FilterBankExtractor final : public FeatureExtractor {
public:
    /**
     * @throws ModelUnavailableError  if the weights are inconsistent
     */
    explicit FilterBankExtractor(FilterBankWeights weights = FilterBankWeights::builtin());

    std::string name() const override { return weights_.name; }
    cv::Mat forward(const cv::Mat& tensor) const override;
    bool differentiable() const override { return true; }
    cv::Mat backward(const cv::Mat& tensor, const cv::Mat& d_embedding) const override;
    double clean_deviation(const cv::Mat& embedding, cv::Mat* d_embedding = nullptr) const override;
    double robustness_from_deviation(double deviation) const override;

    int kernel_count() const noexcept { return static_cast<int>(kernels_.size()); }
    int fine_count() const noexcept { return fine_count_; }
    int cells() const noexcept { return weights_.grid * weights_.grid; }
    int embedding_size() const noexcept { return kernel_count() * cells(); }

    const FilterBankWeights& weights() const noexcept { return weights_; }

private:
    FilterBankWeights weights_;
    std::vector<cv::Mat> kernels_;          // fine band first, then coarse
    std::vector<cv::Mat> flipped_kernels_;  // adjoint kernels
    int fine_count_ = 0;

    struct CellLayout {
        std::vector<int> row_cell;          // grid row of each image row
        std::vector<int> col_cell;          // grid column of each image column
        std::vector<int> sizes;             // pixels per cell
    };

    cv::Mat luminance(const cv::Mat& tensor) const;
    CellLayout cell_layout(int rows, int cols) const;
    cv::Mat respond(const cv::Mat& gray, size_t kernel) const;
};

}  // namespace pngp
