#ifndef CACORR_PARAMETERS_HPP
#define CACORR_PARAMETERS_HPP

#include <opencv2/core.hpp>

namespace cacorr {

// Scalar configuration of the correction. Defaults are the reference settings
// used for 8-bit photographs normalized to [0, 1].
struct FilterParameters {
    int L_hor = 14;   // Half-window along rows
    int L_ver = 4;    // Half-window along columns
    cv::Vec3f rho = cv::Vec3f(-0.25f, 1.375f, -0.125f);
    float tau = 15.0f / 255.0f;
    float alpha_R = 0.5f;
    float alpha_B = 1.0f;
    float beta_R = 1.0f;
    float beta_B = 0.25f;
    float gamma_1 = 128.0f / 255.0f;
    float gamma_2 = 64.0f / 255.0f;
    bool clip_output = false; // Clamp reconstructed planes to [0, 1]
};

/**
 * @brief Checks the scalar invariants of the parameters.
 * @throws std::invalid_argument naming the first offending field
 */
void validate_parameters(const FilterParameters& params);

/**
 * @brief Checks that the image is a non-empty CV_32FC3 array large enough for
 *        both windows (2*L_hor+1 <= cols, 2*L_ver+1 <= rows).
 * @throws std::invalid_argument
 */
void validate_image(const cv::Mat& image, const FilterParameters& params);

} // namespace cacorr

#endif // CACORR_PARAMETERS_HPP
