#ifndef CACORR_ARBITRATION_HPP
#define CACORR_ARBITRATION_HPP

#include "cacorr/filter1d.hpp"
#include <opencv2/core.hpp>

namespace cacorr {

/**
 * @brief Bias-adjusted local contrast along rows.
 *
 * Max candidates are X - beta*|X - G|, min candidates X + beta*|X - G|; the
 * East/West envelope is selected as in filter_1d and the contrast is
 * selected_max - selected_min. It can be negative for large beta.
 *
 * @param X Channel plane (CV_32FC1)
 * @param G Green plane (CV_32FC1, same size)
 * @param L Half-window, 0 <= L and 2L+1 <= cols
 * @param beta Bias of the channel, >= 0
 * @return Contrast plane; columns outside [L, cols-L) are zero
 * @throws std::invalid_argument
 */
cv::Mat biased_contrast(const cv::Mat& X, const cv::Mat& G, int L, float beta);

// Element-wise maximum of the two axis contrasts.
cv::Mat merge_contrast(const cv::Mat& contrast_hor, const cv::Mat& contrast_ver);

/**
 * @brief Blend weight alpha = clamp(max(contrast, 0) / range, 0, 1) with
 *        range = clamp(X_max - X_min, gamma_2, gamma_1).
 * @throws std::invalid_argument on bad planes or if not gamma_1 >= gamma_2 > 0
 */
cv::Mat blend_weight(const cv::Mat& contrast, const cv::Mat& X_max, const cv::Mat& X_min,
                     float gamma_1, float gamma_2);

/**
 * @brief Arbitrates between the TI and FC chroma of one merged channel.
 * K_out = (1 - alpha) * K_TI + alpha * K, alpha from blend_weight over the
 * axis-merged biased contrast.
 * @param merged Output of merge_directions for the channel
 * @param X Channel plane
 * @param G Green plane
 * @return Arbitrated chroma plane (CV_32FC1)
 */
cv::Mat arbitrate(const FilterResult& merged, const cv::Mat& X, const cv::Mat& G,
                  float beta, int L_hor, int L_ver, float gamma_1, float gamma_2);

} // namespace cacorr

#endif // CACORR_ARBITRATION_HPP
