#include "cacorr/arbitration.hpp"
#include "cacorr/transpose.hpp"
#include <stdexcept>
#include <string>

namespace cacorr {

namespace {

void check_pair(const cv::Mat& a, const cv::Mat& b, const char* where) {
    if (a.empty() || b.empty()) {
        throw std::invalid_argument(std::string(where) + ": Input plane is empty.");
    }
    if (a.type() != CV_32FC1 || b.type() != CV_32FC1) {
        throw std::invalid_argument(std::string(where) + ": Input planes must be CV_32FC1.");
    }
    if (a.size() != b.size()) {
        throw std::invalid_argument(std::string(where) + ": Input planes differ in size.");
    }
}

} // namespace

cv::Mat biased_contrast(const cv::Mat& X, const cv::Mat& G, int L, float beta) {
    check_pair(X, G, "biased_contrast");
    if (L < 0) {
        throw std::invalid_argument("biased_contrast: Half-window must be non-negative.");
    }
    if (L > (X.cols - 1) / 2) {
        throw std::invalid_argument("biased_contrast: Window 2*" + std::to_string(L) +
                                    "+1 exceeds plane width " + std::to_string(X.cols) + ".");
    }
    if (beta < 0.0f) {
        throw std::invalid_argument("biased_contrast: beta must be non-negative.");
    }

    const cv::Mat bias = beta * cv::abs(X - G);
    const cv::Mat max_candidates = X - bias;
    const cv::Mat min_candidates = X + bias;

    cv::Mat contrast = cv::Mat::zeros(X.size(), CV_32F);
    const int cols = X.cols;

    cv::parallel_for_(cv::Range(0, X.rows), [&](const cv::Range& range) {
        for (int i = range.start; i < range.end; ++i) {
            const float* hi = max_candidates.ptr<float>(i);
            const float* lo = min_candidates.ptr<float>(i);
            float* c = contrast.ptr<float>(i);
            for (int j = L; j < cols - L; ++j) {
                const Envelope env = select_envelope(hi, lo, j, L);
                c[j] = env.max - env.min;
            }
        }
    });

    return contrast;
}

cv::Mat merge_contrast(const cv::Mat& contrast_hor, const cv::Mat& contrast_ver) {
    check_pair(contrast_hor, contrast_ver, "merge_contrast");
    cv::Mat contrast;
    cv::max(contrast_hor, contrast_ver, contrast);
    return contrast;
}

cv::Mat blend_weight(const cv::Mat& contrast, const cv::Mat& X_max, const cv::Mat& X_min,
                     float gamma_1, float gamma_2)
{
    check_pair(contrast, X_max, "blend_weight");
    check_pair(X_max, X_min, "blend_weight");
    if (!(gamma_2 > 0.0f) || gamma_2 > gamma_1) {
        throw std::invalid_argument("blend_weight: Requires gamma_1 >= gamma_2 > 0.");
    }

    cv::Mat range = X_max - X_min;
    range = cv::max(range, static_cast<double>(gamma_2));
    range = cv::min(range, static_cast<double>(gamma_1));

    cv::Mat weight = cv::max(contrast, 0.0);
    cv::divide(weight, range, weight);
    weight = cv::min(weight, 1.0);
    return weight;
}

cv::Mat arbitrate(const FilterResult& merged, const cv::Mat& X, const cv::Mat& G,
                  float beta, int L_hor, int L_ver, float gamma_1, float gamma_2)
{
    check_pair(X, G, "arbitrate");
    check_pair(merged.K, X, "arbitrate");
    check_pair(merged.K_TI, X, "arbitrate");

    const cv::Mat contrast_hor = biased_contrast(X, G, L_hor, beta);
    const cv::Mat contrast_ver = transpose_plane(
        biased_contrast(transpose_plane(X), transpose_plane(G), L_ver, beta));
    const cv::Mat contrast = merge_contrast(contrast_hor, contrast_ver);

    const cv::Mat alpha = blend_weight(contrast, merged.X_max, merged.X_min, gamma_1, gamma_2);
    const cv::Mat trust_ti = 1.0 - alpha;

    cv::Mat k_out = trust_ti.mul(merged.K_TI) + alpha.mul(merged.K);
    return k_out;
}

} // namespace cacorr
