#include "cacorr/transpose.hpp"
#include <stdexcept>

namespace cacorr {

cv::Mat transpose_plane(const cv::Mat& plane) {
    if (plane.empty()) {
        throw std::invalid_argument("transpose_plane: Input plane is empty.");
    }
    if (plane.type() != CV_32FC1) {
        throw std::invalid_argument("transpose_plane: Input plane must be CV_32FC1.");
    }

    cv::Mat transposed;
    cv::transpose(plane, transposed);
    return transposed;
}

cv::Mat backward_gradient(const cv::Mat& plane) {
    if (plane.empty()) {
        throw std::invalid_argument("backward_gradient: Input plane is empty.");
    }
    if (plane.type() != CV_32FC1) {
        throw std::invalid_argument("backward_gradient: Input plane must be CV_32FC1.");
    }

    cv::Mat grad = cv::Mat::zeros(plane.size(), CV_32F);
    if (plane.cols < 2) {
        return grad;
    }

    // Writes through the ROI header, column 0 stays zero
    cv::Mat tail = grad.colRange(1, plane.cols);
    cv::subtract(plane.colRange(1, plane.cols), plane.colRange(0, plane.cols - 1), tail);
    return grad;
}

} // namespace cacorr
