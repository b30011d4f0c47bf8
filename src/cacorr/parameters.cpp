#include "cacorr/parameters.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace cacorr {

namespace {

void require_finite(float value, const char* name) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument(std::string("Parameter ") + name + " must be finite.");
    }
}

} // namespace

void validate_parameters(const FilterParameters& params) {
    if (params.L_hor < 1) {
        throw std::invalid_argument("L_hor must be positive (got " + std::to_string(params.L_hor) + ").");
    }
    if (params.L_ver < 1) {
        throw std::invalid_argument("L_ver must be positive (got " + std::to_string(params.L_ver) + ").");
    }

    require_finite(params.rho[0], "rho[0]");
    require_finite(params.rho[1], "rho[1]");
    require_finite(params.rho[2], "rho[2]");
    require_finite(params.tau, "tau");
    require_finite(params.alpha_R, "alpha_R");
    require_finite(params.alpha_B, "alpha_B");
    require_finite(params.beta_R, "beta_R");
    require_finite(params.beta_B, "beta_B");
    require_finite(params.gamma_1, "gamma_1");
    require_finite(params.gamma_2, "gamma_2");

    if (params.tau < 0.0f) {
        throw std::invalid_argument("tau must be non-negative.");
    }
    if (params.alpha_R <= 0.0f || params.alpha_B <= 0.0f) {
        throw std::invalid_argument("alpha_R and alpha_B must be positive.");
    }
    if (params.beta_R < 0.0f || params.beta_B < 0.0f) {
        throw std::invalid_argument("beta_R and beta_B must be non-negative.");
    }
    if (params.gamma_2 <= 0.0f) {
        throw std::invalid_argument("gamma_2 must be positive.");
    }
    if (params.gamma_2 > params.gamma_1) {
        throw std::invalid_argument("gamma_2 (" + std::to_string(params.gamma_2) +
                                    ") must not exceed gamma_1 (" + std::to_string(params.gamma_1) + ").");
    }
}

void validate_image(const cv::Mat& image, const FilterParameters& params) {
    if (image.empty()) {
        throw std::invalid_argument("Input image is empty.");
    }
    if (image.channels() != 3) {
        throw std::invalid_argument("Input image must have 3 channels (RGB).");
    }
    if (image.type() != CV_32FC3) {
        throw std::invalid_argument("Input image must be type CV_32FC3.");
    }
    if (params.L_hor > (image.cols - 1) / 2) {
        throw std::invalid_argument("Horizontal window (2*" + std::to_string(params.L_hor) +
                                    "+1) exceeds image width " + std::to_string(image.cols) + ".");
    }
    if (params.L_ver > (image.rows - 1) / 2) {
        throw std::invalid_argument("Vertical window (2*" + std::to_string(params.L_ver) +
                                    "+1) exceeds image height " + std::to_string(image.rows) + ".");
    }
}

} // namespace cacorr
