#ifndef CACORR_TRANSPOSE_HPP
#define CACORR_TRANSPOSE_HPP

#include <opencv2/core.hpp>

namespace cacorr {

/**
 * @brief Returns a row/column-swapped copy of a single-channel float plane.
 * Lets the row-wise filters run along columns.
 * @throws std::invalid_argument if plane is empty or not CV_32FC1
 */
cv::Mat transpose_plane(const cv::Mat& plane);

/**
 * @brief First-order backward difference along rows: grad(i, j) = X(i, j) - X(i, j-1).
 * Column 0 has no left neighbour and is set to zero.
 * @throws std::invalid_argument if plane is empty or not CV_32FC1
 */
cv::Mat backward_gradient(const cv::Mat& plane);

} // namespace cacorr

#endif // CACORR_TRANSPOSE_HPP
