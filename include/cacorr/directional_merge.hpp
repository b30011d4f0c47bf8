#ifndef CACORR_DIRECTIONAL_MERGE_HPP
#define CACORR_DIRECTIONAL_MERGE_HPP

#include "cacorr/filter1d.hpp"

namespace cacorr {

/**
 * @brief Combines the horizontal and vertical pass of one channel.
 *
 * Per pixel, K is taken from the pass with the smaller |K|, and the triple
 * (K_TI, X_max, X_min) is taken as a whole from the pass with the smaller |K_TI|.
 * Ties go to the vertical pass. The two choices are independent.
 *
 * @param hor Horizontal pass result
 * @param ver Vertical pass result, already transposed back to the image orientation
 * @return Freshly allocated merged result; neither input is modified
 * @throws std::invalid_argument if any plane is empty, not CV_32FC1 or sizes differ
 */
FilterResult merge_directions(const FilterResult& hor, const FilterResult& ver);

} // namespace cacorr

#endif // CACORR_DIRECTIONAL_MERGE_HPP
