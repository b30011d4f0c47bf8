#ifndef CACORR_FILTER1D_HPP
#define CACORR_FILTER1D_HPP

#include <opencv2/core.hpp>

namespace cacorr {

// Additive guard for the fall-off and normalization divisions
const float kEpsilon = 1e-8f;

// Output of one directional pass for one channel. All planes are CV_32FC1 of the
// channel size. Only columns [L, cols-L) are filtered; the rest are zero.
struct FilterResult {
    cv::Mat K;     // FC-filtered chroma
    cv::Mat K_TI;  // TI chroma at the window center
    cv::Mat X_max; // Selected envelope, upper bound
    cv::Mat X_min; // Selected envelope, lower bound
};

struct Envelope {
    float max;
    float min;
};

/**
 * @brief Bounds k so it does not pass k_ref in the direction away from zero.
 * k_ref > 0 caps at k_ref, k_ref < 0 floors at k_ref, k_ref == 0 gives 0.
 */
float clip_chroma(float k, float k_ref);

/**
 * @brief East/West envelope selection around column j of a row.
 *
 * Maxima are taken over max_row, minima over min_row, on [j, j+L] (East) and
 * [j-L, j] (West). Returns (East max, West min) when that pair spans at least as
 * much as (West max, East min), otherwise the latter.
 * The caller guarantees L <= j < cols - L.
 */
Envelope select_envelope(const float* max_row, const float* min_row, int j, int L);

/**
 * @brief Transient-improvement and false-color filtering of one channel along rows.
 * @param X Channel plane (R or B), CV_32FC1
 * @param G Green plane, CV_32FC1, same size
 * @param Y Luma plane, CV_32FC1, same size
 * @param L Half-window, 0 <= L and 2L+1 <= cols
 * @param rho TI prefilter coefficients (envelope-near, center, envelope-far)
 * @param alpha FC regularization of the channel
 * @param tau Chroma magnitude below which an offset is accepted regardless of sign
 * @return K, K_TI and envelope planes; columns outside [L, cols-L) are zero
 * @throws std::invalid_argument on empty, mistyped or mismatched planes, or bad L
 */
FilterResult filter_1d(const cv::Mat& X, const cv::Mat& G, const cv::Mat& Y,
                       int L, const cv::Vec3f& rho, float alpha, float tau);

// Transposes all four planes of a result.
FilterResult transpose_result(const FilterResult& result);

} // namespace cacorr

#endif // CACORR_FILTER1D_HPP
