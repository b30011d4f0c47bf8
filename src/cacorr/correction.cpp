#include "cacorr/correction.hpp"
#include "cacorr/arbitration.hpp"
#include "cacorr/channel_split.hpp"
#include "cacorr/directional_merge.hpp"
#include "cacorr/filter1d.hpp"
#include "cacorr/reconstruct.hpp"
#include "cacorr/transpose.hpp"

#include <opencv2/core.hpp>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#define LOG_CA(message) std::cout << "[CA LOG] " << message << std::endl

namespace cacorr {

namespace {

struct DirectionalPasses {
    FilterResult hor;
    FilterResult ver;
};

// Runs filter_1d along rows and along columns for one channel.
DirectionalPasses filter_both_axes(const cv::Mat& X, const ChannelPlanes& planes,
                                   const cv::Mat& G_t, const cv::Mat& Y_t,
                                   const FilterParameters& params, float alpha)
{
    DirectionalPasses passes;
    passes.hor = filter_1d(X, planes.G, planes.Y, params.L_hor, params.rho, alpha, params.tau);
    passes.ver = transpose_result(
        filter_1d(transpose_plane(X), G_t, Y_t, params.L_ver, params.rho, alpha, params.tau));
    return passes;
}

} // namespace

cv::Rect corrected_region(const cv::Size& size, const FilterParameters& params) {
    const int width = std::max(0, size.width - 2 * params.L_hor);
    const int height = std::max(0, size.height - 2 * params.L_ver);
    return cv::Rect(params.L_hor, params.L_ver, width, height);
}

cv::Mat correct_chromatic_aberration(const cv::Mat& image, const FilterParameters& params) {
    validate_parameters(params);
    validate_image(image, params);

    auto start_time = std::chrono::high_resolution_clock::now();
    LOG_CA("Correcting " << image.cols << "x" << image.rows << " image (L_hor=" << params.L_hor
           << ", L_ver=" << params.L_ver << ")");

    // 1. Planes, plus the transposed green and luma shared by both vertical passes
    const ChannelPlanes planes = split_channels(image);
    const cv::Mat G_t = transpose_plane(planes.G);
    const cv::Mat Y_t = transpose_plane(planes.Y);

    // 2. TI + FC filtering, four (channel, axis) passes
    const DirectionalPasses red = filter_both_axes(planes.R, planes, G_t, Y_t, params, params.alpha_R);
    const DirectionalPasses blue = filter_both_axes(planes.B, planes, G_t, Y_t, params, params.alpha_B);
    LOG_CA("Directional filtering complete.");

    // 3. Horizontal/vertical merge
    const FilterResult red_merged = merge_directions(red.hor, red.ver);
    const FilterResult blue_merged = merge_directions(blue.hor, blue.ver);

    // 4. TI/FC arbitration
    const cv::Mat K_r = arbitrate(red_merged, planes.R, planes.G, params.beta_R,
                                  params.L_hor, params.L_ver, params.gamma_1, params.gamma_2);
    const cv::Mat K_b = arbitrate(blue_merged, planes.B, planes.G, params.beta_B,
                                  params.L_hor, params.L_ver, params.gamma_1, params.gamma_2);
    LOG_CA("Arbitration complete.");

    // 5. Back onto green
    cv::Mat corrected = reconstruct_image(planes, K_r, K_b,
                                          corrected_region(image.size(), params), params.clip_output);

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    LOG_CA("Correction time: " << duration.count() << " ms");
    return corrected;
}

cv::Mat correct_chromatic_aberration_padded(const cv::Mat& image, const FilterParameters& params,
                                            int border_mode)
{
    validate_parameters(params);
    if (image.empty()) {
        throw std::invalid_argument("Input image is empty.");
    }
    if (image.type() != CV_32FC3) {
        throw std::invalid_argument("Input image must be type CV_32FC3.");
    }

    cv::Mat padded;
    cv::copyMakeBorder(image, padded, params.L_ver, params.L_ver, params.L_hor, params.L_hor,
                       border_mode, cv::Scalar::all(0));
    LOG_CA("Padded input to " << padded.cols << "x" << padded.rows);

    const cv::Mat corrected = correct_chromatic_aberration(padded, params);
    return corrected(cv::Rect(params.L_hor, params.L_ver, image.cols, image.rows)).clone();
}

} // namespace cacorr
