#include "cacorr/reconstruct.hpp"
#include <stdexcept>

namespace cacorr {

namespace {

void check_plane(const cv::Mat& plane, const cv::Size& size) {
    if (plane.empty()) {
        throw std::invalid_argument("reconstruct_image: Input plane is empty.");
    }
    if (plane.type() != CV_32FC1) {
        throw std::invalid_argument("reconstruct_image: Input planes must be CV_32FC1.");
    }
    if (plane.size() != size) {
        throw std::invalid_argument("reconstruct_image: Input planes differ in size.");
    }
}

cv::Mat clamp_unit(const cv::Mat& plane) {
    cv::Mat clamped = cv::max(plane, 0.0);
    clamped = cv::min(clamped, 1.0);
    return clamped;
}

} // namespace

cv::Mat reconstruct_image(const ChannelPlanes& planes, const cv::Mat& K_r, const cv::Mat& K_b,
                          const cv::Rect& region, bool clip_output)
{
    if (planes.G.empty()) {
        throw std::invalid_argument("reconstruct_image: Green plane is empty.");
    }
    const cv::Size size = planes.G.size();
    check_plane(planes.R, size);
    check_plane(planes.G, size);
    check_plane(planes.B, size);
    check_plane(K_r, size);
    check_plane(K_b, size);
    if ((region & cv::Rect(cv::Point(0, 0), size)) != region) {
        throw std::invalid_argument("reconstruct_image: Region lies outside the image.");
    }

    cv::Mat R_out = planes.R.clone();
    cv::Mat B_out = planes.B.clone();
    if (region.area() > 0) {
        cv::Mat R_roi = R_out(region);
        cv::Mat B_roi = B_out(region);
        cv::add(K_r(region), planes.G(region), R_roi);
        cv::add(K_b(region), planes.G(region), B_roi);
    }

    if (clip_output) {
        return merge_channels(clamp_unit(R_out), clamp_unit(planes.G), clamp_unit(B_out));
    }
    return merge_channels(R_out, planes.G, B_out);
}

} // namespace cacorr
