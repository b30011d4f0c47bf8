#include "cacorr/channel_split.hpp"
#include <stdexcept>
#include <vector>

namespace cacorr {

ChannelPlanes split_channels(const cv::Mat& image) {
    if (image.empty()) {
        throw std::invalid_argument("Input RGB image is empty.");
    }
    if (image.channels() != 3) {
        throw std::invalid_argument("Input image must have 3 channels (RGB).");
    }
    if (image.type() != CV_32FC3) {
        throw std::invalid_argument("Input RGB image must be type CV_32FC3.");
    }

    std::vector<cv::Mat> channels;
    cv::split(image, channels);

    ChannelPlanes planes;
    planes.R = channels[0];
    planes.G = channels[1];
    planes.B = channels[2];
    cv::transform(image, planes.Y, RGB2Y_WEIGHTS);
    return planes;
}

cv::Mat merge_channels(const cv::Mat& R, const cv::Mat& G, const cv::Mat& B) {
    if (R.empty() || G.empty() || B.empty()) {
        throw std::invalid_argument("merge_channels: Input plane is empty.");
    }
    if (R.type() != CV_32FC1 || G.type() != CV_32FC1 || B.type() != CV_32FC1) {
        throw std::invalid_argument("merge_channels: Input planes must be CV_32FC1.");
    }
    if (R.size() != G.size() || R.size() != B.size()) {
        throw std::invalid_argument("merge_channels: Input planes must have the same size.");
    }

    cv::Mat image;
    const cv::Mat planes[] = {R, G, B};
    cv::merge(planes, 3, image);
    return image;
}

} // namespace cacorr
