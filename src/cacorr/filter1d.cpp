#include "cacorr/filter1d.hpp"
#include "cacorr/transpose.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace cacorr {

namespace {

void check_plane(const cv::Mat& plane, const cv::Size& size, const char* name) {
    if (plane.empty()) {
        throw std::invalid_argument(std::string("filter_1d: Plane ") + name + " is empty.");
    }
    if (plane.type() != CV_32FC1) {
        throw std::invalid_argument(std::string("filter_1d: Plane ") + name + " must be CV_32FC1.");
    }
    if (plane.size() != size) {
        throw std::invalid_argument(std::string("filter_1d: Plane ") + name + " size mismatch.");
    }
}

inline int sign_of(float v) {
    return (v > 0.0f) - (v < 0.0f);
}

} // namespace

float clip_chroma(float k, float k_ref) {
    if (k_ref > 0.0f) {
        return std::min(k, k_ref);
    }
    if (k_ref < 0.0f) {
        return std::max(k, k_ref);
    }
    return 0.0f;
}

Envelope select_envelope(const float* max_row, const float* min_row, int j, int L) {
    float east_max = max_row[j];
    float west_max = max_row[j];
    float east_min = min_row[j];
    float west_min = min_row[j];
    for (int l = 1; l <= L; ++l) {
        east_max = std::max(east_max, max_row[j + l]);
        east_min = std::min(east_min, min_row[j + l]);
        west_max = std::max(west_max, max_row[j - l]);
        west_min = std::min(west_min, min_row[j - l]);
    }

    if (east_max - west_min >= west_max - east_min) {
        return {east_max, west_min};
    }
    return {west_max, east_min};
}

FilterResult filter_1d(const cv::Mat& X, const cv::Mat& G, const cv::Mat& Y,
                       int L, const cv::Vec3f& rho, float alpha, float tau)
{
    check_plane(X, X.size(), "X");
    check_plane(G, X.size(), "G");
    check_plane(Y, X.size(), "Y");
    if (L < 0) {
        throw std::invalid_argument("filter_1d: Half-window must be non-negative.");
    }
    if (L > (X.cols - 1) / 2) {
        throw std::invalid_argument("filter_1d: Window 2*" + std::to_string(L) +
                                    "+1 exceeds plane width " + std::to_string(X.cols) + ".");
    }

    const cv::Mat grad_X = backward_gradient(X);
    const cv::Mat grad_G = backward_gradient(G);

    FilterResult result;
    result.K = cv::Mat::zeros(X.size(), CV_32F);
    result.K_TI = cv::Mat::zeros(X.size(), CV_32F);
    result.X_max = cv::Mat::zeros(X.size(), CV_32F);
    result.X_min = cv::Mat::zeros(X.size(), CV_32F);

    const int cols = X.cols;
    const int window = 2 * L + 1;

    // Rows are independent; each worker owns its output rows and scratch buffer.
    cv::parallel_for_(cv::Range(0, X.rows), [&](const cv::Range& range) {
        std::vector<float> k_offset(window);

        for (int i = range.start; i < range.end; ++i) {
            const float* x = X.ptr<float>(i);
            const float* g = G.ptr<float>(i);
            const float* y = Y.ptr<float>(i);
            const float* gx = grad_X.ptr<float>(i);
            const float* gg = grad_G.ptr<float>(i);
            float* k_out = result.K.ptr<float>(i);
            float* k_ti_out = result.K_TI.ptr<float>(i);
            float* x_max_out = result.X_max.ptr<float>(i);
            float* x_min_out = result.X_min.ptr<float>(i);

            for (int j = L; j < cols - L; ++j) {
                const Envelope env = select_envelope(x, x, j, L);
                const bool bright = x[j] > g[j];

                // TI reconstruction at every offset, as chroma
                for (int l = -L; l <= L; ++l) {
                    const float x_l = x[j + l];
                    const float g_l = g[j + l];
                    float x_pf, lower, upper;
                    if (bright) {
                        x_pf = rho[0] * env.max + rho[1] * x_l + rho[2] * env.min;
                        lower = std::max(env.min, g_l);
                        upper = x_l;
                    } else {
                        x_pf = rho[0] * env.min + rho[1] * x_l + rho[2] * env.max;
                        lower = x_l;
                        upper = std::min(env.max, g_l);
                    }
                    // Crossed bounds resolve to the upper one
                    const float x_ti = std::min(std::max(x_pf, lower), upper);
                    k_offset[l + L] = x_ti - g_l;
                }

                const float k_center = k_offset[L];
                const int center_sign = sign_of(k_center);

                // FC weighted average, fixed accumulation order l = -L..L
                float numerator = 0.0f;
                float denominator = 0.0f;
                for (int l = -L; l <= L; ++l) {
                    const float k_l = k_offset[l + L];
                    if (sign_of(k_l) != center_sign && std::abs(k_l) >= tau) {
                        continue;
                    }
                    const float falloff = std::abs(gg[j + l])
                                        + std::max(std::abs(gx[j + l]), alpha * std::abs(k_l))
                                        + std::abs(y[j] - y[j + l])
                                        + kEpsilon;
                    const float weight = 1.0f / falloff;
                    numerator += weight * clip_chroma(k_l, k_center);
                    denominator += weight;
                }

                k_out[j] = numerator / (denominator + kEpsilon);
                k_ti_out[j] = k_center;
                x_max_out[j] = env.max;
                x_min_out[j] = env.min;
            }
        }
    });

    return result;
}

FilterResult transpose_result(const FilterResult& result) {
    FilterResult transposed;
    transposed.K = transpose_plane(result.K);
    transposed.K_TI = transpose_plane(result.K_TI);
    transposed.X_max = transpose_plane(result.X_max);
    transposed.X_min = transpose_plane(result.X_min);
    return transposed;
}

} // namespace cacorr
