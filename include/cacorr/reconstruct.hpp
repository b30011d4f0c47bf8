#ifndef CACORR_RECONSTRUCT_HPP
#define CACORR_RECONSTRUCT_HPP

#include "cacorr/channel_split.hpp"
#include <opencv2/core.hpp>

namespace cacorr {

/**
 * @brief Adds arbitrated chroma back onto green and reassembles the RGB image.
 *
 * Inside region: R_out = K_r + G, B_out = K_b + G. Outside region R and B are
 * copied from planes unchanged. G_out = G everywhere.
 *
 * @param planes Planes of the input image
 * @param K_r Arbitrated red chroma (CV_32FC1, image size)
 * @param K_b Arbitrated blue chroma (CV_32FC1, image size)
 * @param region Corrected region, must lie inside the image
 * @param clip_output Clamp all three output planes to [0, 1]
 * @return Freshly allocated CV_32FC3 image
 * @throws std::invalid_argument on mismatched planes or a region outside the image
 */
cv::Mat reconstruct_image(const ChannelPlanes& planes, const cv::Mat& K_r, const cv::Mat& K_b,
                          const cv::Rect& region, bool clip_output);

} // namespace cacorr

#endif // CACORR_RECONSTRUCT_HPP
