#ifndef CACORR_CHANNEL_SPLIT_HPP
#define CACORR_CHANNEL_SPLIT_HPP

#include <opencv2/core.hpp>

namespace cacorr {

// Luma weights applied to (R, G, B)
const cv::Matx13f RGB2Y_WEIGHTS(0.299f, 0.587f, 0.114f);

// Planar decomposition of an RGB image, every plane CV_32FC1 of the image size.
struct ChannelPlanes {
    cv::Mat R;
    cv::Mat G;
    cv::Mat B;
    cv::Mat Y;
};

/**
 * @brief Splits an RGB image into R, G, B planes and derives the luma plane
 *        Y = 0.299 R + 0.587 G + 0.114 B.
 * @param image Input image (CV_32FC3, channel order R, G, B)
 * @throws std::invalid_argument if image is empty or not CV_32FC3
 */
ChannelPlanes split_channels(const cv::Mat& image);

/**
 * @brief Interleaves three CV_32FC1 planes into an RGB image (CV_32FC3).
 * @throws std::invalid_argument if a plane is empty, not CV_32FC1 or the sizes differ
 */
cv::Mat merge_channels(const cv::Mat& R, const cv::Mat& G, const cv::Mat& B);

} // namespace cacorr

#endif // CACORR_CHANNEL_SPLIT_HPP
