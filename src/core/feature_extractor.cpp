/**
 * @file    feature_extractor.cpp
 * @brief   Filter-bank feature extractor with analytic gradients
 * @author  pngprotect contributors
 * @date    2026.10.02
 * @license MIT
 *
 * @details
 * Convolutions use zero padding so the adjoint of each filter2D pass is
 * another filter2D pass with the kernel flipped on both axes.
 */

#include "core/feature_extractor.hpp"
#include "core/errors.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>
#include <cstdint>
#include <numbers>

namespace pngp {

namespace {

cv::Mat normalized_kernel(cv::Mat kernel) {
    kernel.convertTo(kernel, CV_32F);
    kernel -= cv::mean(kernel)[0];
    const double norm = cv::norm(kernel, cv::NORM_L2);
    if (norm > 0.0) {
        kernel /= norm;
    }
    return kernel;
}

bool is_valid_kernel(const cv::Mat& kernel) {
    return !kernel.empty() &&
           kernel.type() == CV_32FC1 &&
           kernel.rows == kernel.cols &&
           (kernel.rows % 2) == 1;
}

std::vector<cv::Mat> read_kernel_list(const cv::FileNode& node) {
    std::vector<cv::Mat> kernels;
    if (node.empty() || !node.isSeq()) {
        return kernels;
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        cv::Mat kernel;
        *it >> kernel;
        kernels.push_back(kernel);
    }
    return kernels;
}

}  // namespace

// =============================================================================
// Weights
// =============================================================================

FilterBankWeights FilterBankWeights::builtin() {
    FilterBankWeights weights;

    // Fine band: pixel-scale differences
    weights.fine_kernels.push_back(normalized_kernel(
        (cv::Mat_<float>(3, 3) << 0, 1, 0, 1, -4, 1, 0, 1, 0)));
    weights.fine_kernels.push_back(normalized_kernel(
        (cv::Mat_<float>(3, 3) << 0, 0, 0, 0, -1, 1, 0, 0, 0)));
    weights.fine_kernels.push_back(normalized_kernel(
        (cv::Mat_<float>(3, 3) << 0, 0, 0, 0, -1, 0, 0, 1, 0)));
    weights.fine_kernels.push_back(normalized_kernel(
        (cv::Mat_<float>(3, 3) << 1, -1, 0, -1, 1, 0, 0, 0, 0)));

    // Coarse band: oriented Gabor filters, wavelength 8
    for (int i = 0; i < 4; ++i) {
        const double theta = i * std::numbers::pi / 4.0;
        weights.coarse_kernels.push_back(normalized_kernel(
            cv::getGaborKernel(cv::Size(9, 9), 2.5, theta, 8.0, 0.6, 0.0, CV_32F)));
    }

    return weights;
}

FilterBankWeights FilterBankWeights::load(const std::filesystem::path& path) {
    FilterBankWeights weights;
    try {
        cv::FileStorage fs(path.string(), cv::FileStorage::READ);
        if (!fs.isOpened()) {
            throw ModelUnavailableError("Cannot open model weights: " + path.string());
        }

        if (!fs["name"].empty()) {
            fs["name"] >> weights.name;
        }
        weights.fine_kernels = read_kernel_list(fs["fine_kernels"]);
        weights.coarse_kernels = read_kernel_list(fs["coarse_kernels"]);
        if (!fs["grid"].empty()) fs["grid"] >> weights.grid;
        if (!fs["fine_floor"].empty()) fs["fine_floor"] >> weights.fine_floor;
        if (!fs["coarse_floor"].empty()) fs["coarse_floor"] >> weights.coarse_floor;
        if (!fs["score_center"].empty()) fs["score_center"] >> weights.score_center;
        if (!fs["score_width"].empty()) fs["score_width"] >> weights.score_width;
    } catch (const cv::Exception& e) {
        throw ModelUnavailableError(fmt::format(
            "Malformed model weights {}: {}", path.string(), e.what()));
    }

    spdlog::info("Loaded model weights '{}' ({} fine, {} coarse kernels)",
                 weights.name, weights.fine_kernels.size(), weights.coarse_kernels.size());
    return weights;
}

void FilterBankWeights::save(const std::filesystem::path& path) const {
    cv::FileStorage fs(path.string(), cv::FileStorage::WRITE);
    if (!fs.isOpened()) {
        throw std::runtime_error("Cannot write model weights: " + path.string());
    }

    fs << "name" << name;
    fs << "grid" << grid;
    fs << "fine_floor" << fine_floor;
    fs << "coarse_floor" << coarse_floor;
    fs << "score_center" << score_center;
    fs << "score_width" << score_width;

    fs << "fine_kernels" << "[";
    for (const auto& kernel : fine_kernels) {
        fs << kernel;
    }
    fs << "]";

    fs << "coarse_kernels" << "[";
    for (const auto& kernel : coarse_kernels) {
        fs << kernel;
    }
    fs << "]";
}

// =============================================================================
// FilterBankExtractor
// =============================================================================

FilterBankExtractor::FilterBankExtractor(FilterBankWeights weights)
    : weights_(std::move(weights)) {
    if (weights_.fine_kernels.empty() || weights_.coarse_kernels.empty()) {
        throw ModelUnavailableError(fmt::format(
            "Model '{}' needs at least one fine and one coarse kernel", weights_.name));
    }
    if (weights_.grid < 1 || weights_.score_width <= 0.0 ||
        weights_.fine_floor <= 0.0 || weights_.coarse_floor <= 0.0) {
        throw ModelUnavailableError(fmt::format(
            "Model '{}' has invalid pooling or scoring parameters", weights_.name));
    }

    for (const auto* band : {&weights_.fine_kernels, &weights_.coarse_kernels}) {
        for (const auto& kernel : *band) {
            if (!is_valid_kernel(kernel)) {
                throw ModelUnavailableError(fmt::format(
                    "Model '{}' contains a kernel that is not an odd square CV_32FC1 matrix",
                    weights_.name));
            }
            cv::Mat flipped;
            cv::flip(kernel, flipped, -1);
            kernels_.push_back(kernel);
            flipped_kernels_.push_back(flipped);
        }
    }
    fine_count_ = static_cast<int>(weights_.fine_kernels.size());

    spdlog::debug("FilterBankExtractor '{}': {} kernels, {}x{} grid, embedding size {}",
                  weights_.name, kernels_.size(), weights_.grid, weights_.grid,
                  embedding_size());
}

cv::Mat FilterBankExtractor::luminance(const cv::Mat& tensor) const {
    CV_Assert(tensor.depth() == CV_32F);

    const int colors = tensor.channels() == 4 ? 3 : tensor.channels();
    if (tensor.channels() == 1) {
        return tensor.clone();
    }

    std::vector<cv::Mat> planes;
    cv::split(tensor, planes);

    cv::Mat gray = cv::Mat::zeros(tensor.size(), CV_32F);
    for (int c = 0; c < colors; ++c) {
        gray += planes[c];
    }
    gray *= 1.0 / colors;
    return gray;
}

FilterBankExtractor::CellLayout FilterBankExtractor::cell_layout(int rows, int cols) const {
    const int grid = weights_.grid;

    CellLayout layout;
    layout.row_cell.resize(rows);
    layout.col_cell.resize(cols);
    layout.sizes.assign(cells(), 0);

    for (int y = 0; y < rows; ++y) {
        layout.row_cell[y] = static_cast<int>(static_cast<int64_t>(y) * grid / rows);
    }
    for (int x = 0; x < cols; ++x) {
        layout.col_cell[x] = static_cast<int>(static_cast<int64_t>(x) * grid / cols);
    }

    std::vector<int> row_counts(grid, 0), col_counts(grid, 0);
    for (int r : layout.row_cell) ++row_counts[r];
    for (int c : layout.col_cell) ++col_counts[c];
    for (int gy = 0; gy < grid; ++gy) {
        for (int gx = 0; gx < grid; ++gx) {
            layout.sizes[gy * grid + gx] = row_counts[gy] * col_counts[gx];
        }
    }
    return layout;
}

cv::Mat FilterBankExtractor::respond(const cv::Mat& gray, size_t kernel) const {
    cv::Mat response;
    cv::filter2D(gray, response, CV_32F, kernels_[kernel],
                 cv::Point(-1, -1), 0.0, cv::BORDER_CONSTANT);
    return response;
}

cv::Mat FilterBankExtractor::forward(const cv::Mat& tensor) const {
    const cv::Mat gray = luminance(tensor);
    const CellLayout layout = cell_layout(gray.rows, gray.cols);
    const int grid = weights_.grid;

    cv::Mat embedding = cv::Mat::zeros(1, embedding_size(), CV_32F);
    float* out = embedding.ptr<float>();
    std::vector<double> sums(cells());

    for (size_t k = 0; k < kernels_.size(); ++k) {
        const cv::Mat response = respond(gray, k);

        std::fill(sums.begin(), sums.end(), 0.0);
        for (int y = 0; y < response.rows; ++y) {
            const float* row = response.ptr<float>(y);
            const int base = layout.row_cell[y] * grid;
            for (int x = 0; x < response.cols; ++x) {
                sums[base + layout.col_cell[x]] += static_cast<double>(row[x]) * row[x];
            }
        }

        for (int g = 0; g < cells(); ++g) {
            out[k * cells() + g] = layout.sizes[g] > 0
                ? static_cast<float>(sums[g] / layout.sizes[g])
                : 0.0f;
        }
    }

    return embedding;
}

cv::Mat FilterBankExtractor::backward(const cv::Mat& tensor, const cv::Mat& d_embedding) const {
    CV_Assert(d_embedding.type() == CV_32FC1 &&
              static_cast<int>(d_embedding.total()) == embedding_size());

    const cv::Mat gray = luminance(tensor);
    const CellLayout layout = cell_layout(gray.rows, gray.cols);
    const int grid = weights_.grid;
    const float* d_e = d_embedding.ptr<float>();

    cv::Mat d_gray = cv::Mat::zeros(gray.size(), CV_32F);
    cv::Mat d_response(gray.size(), CV_32F);

    for (size_t k = 0; k < kernels_.size(); ++k) {
        const cv::Mat response = respond(gray, k);

        // de[k,g]/dr(p) = 2 r(p) / |g|
        for (int y = 0; y < response.rows; ++y) {
            const float* r = response.ptr<float>(y);
            float* d = d_response.ptr<float>(y);
            const int base = layout.row_cell[y] * grid;
            for (int x = 0; x < response.cols; ++x) {
                const int g = base + layout.col_cell[x];
                d[x] = d_e[k * cells() + g] * 2.0f * r[x] / static_cast<float>(layout.sizes[g]);
            }
        }

        cv::Mat contribution;
        cv::filter2D(d_response, contribution, CV_32F, flipped_kernels_[k],
                     cv::Point(-1, -1), 0.0, cv::BORDER_CONSTANT);
        d_gray += contribution;
    }

    // Distribute over colour channels; alpha receives no gradient
    const int channels = tensor.channels();
    const int colors = channels == 4 ? 3 : channels;
    if (channels == 1) {
        return d_gray;
    }

    std::vector<cv::Mat> planes(channels);
    const cv::Mat shared = d_gray * (1.0 / colors);
    for (int c = 0; c < channels; ++c) {
        planes[c] = c < colors ? shared : cv::Mat::zeros(gray.size(), CV_32F);
    }
    cv::Mat d_tensor;
    cv::merge(planes, d_tensor);
    return d_tensor;
}

double FilterBankExtractor::clean_deviation(const cv::Mat& embedding, cv::Mat* d_embedding) const {
    CV_Assert(embedding.type() == CV_32FC1 &&
              static_cast<int>(embedding.total()) == embedding_size());

    const float* e = embedding.ptr<float>();
    const int n_cells = cells();
    const int n_kernels = kernel_count();

    if (d_embedding) {
        *d_embedding = cv::Mat::zeros(1, embedding_size(), CV_32F);
    }

    double deviation = 0.0;
    for (int g = 0; g < n_cells; ++g) {
        double fine = weights_.fine_floor;
        double coarse = weights_.coarse_floor;
        for (int k = 0; k < n_kernels; ++k) {
            (k < fine_count_ ? fine : coarse) += e[k * n_cells + g];
        }
        deviation += std::log(fine) - std::log(coarse);

        if (d_embedding) {
            float* d = d_embedding->ptr<float>();
            for (int k = 0; k < n_kernels; ++k) {
                d[k * n_cells + g] = k < fine_count_
                    ? static_cast<float>(1.0 / (n_cells * fine))
                    : static_cast<float>(-1.0 / (n_cells * coarse));
            }
        }
    }

    return deviation / n_cells;
}

double FilterBankExtractor::robustness_from_deviation(double deviation) const {
    return 100.0 / (1.0 + std::exp(-(deviation - weights_.score_center) / weights_.score_width));
}

}  // namespace pngp
