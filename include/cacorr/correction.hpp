#ifndef CACORR_CORRECTION_HPP
#define CACORR_CORRECTION_HPP

#include "cacorr/parameters.hpp"
#include <opencv2/core.hpp>

namespace cacorr {

/**
 * @brief Region where full windows fit along both axes:
 *        rows [L_ver, rows-L_ver), cols [L_hor, cols-L_hor).
 * Pixels outside it pass through the correction unchanged.
 */
cv::Rect corrected_region(const cv::Size& size, const FilterParameters& params);

/**
 * @brief Removes chromatic-aberration fringes from an RGB image.
 *
 * Splits the image, runs the TI/FC filter for R and B along rows and columns,
 * merges the two directions, arbitrates TI against FC chroma and adds the
 * result back onto green. Outside corrected_region() R and B are copied from
 * the input.
 *
 * @param image Input image (CV_32FC3, channel order R, G, B, nominally in [0, 1])
 * @param params Filter parameters
 * @return Corrected image, same size and type, freshly allocated
 * @throws std::invalid_argument on invalid parameters or image shape, before any work
 */
cv::Mat correct_chromatic_aberration(const cv::Mat& image, const FilterParameters& params);

/**
 * @brief Pads by (L_ver, L_hor) on each side, corrects and crops back, so the
 *        whole input lies inside the corrected region.
 * @param border_mode cv::BORDER_CONSTANT (zero padding) or a reflecting mode
 */
cv::Mat correct_chromatic_aberration_padded(const cv::Mat& image, const FilterParameters& params,
                                            int border_mode = cv::BORDER_CONSTANT);

} // namespace cacorr

#endif // CACORR_CORRECTION_HPP
