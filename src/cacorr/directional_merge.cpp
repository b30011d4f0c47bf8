#include "cacorr/directional_merge.hpp"
#include <stdexcept>

namespace cacorr {

namespace {

void check_result(const FilterResult& r, const cv::Size& size) {
    const cv::Mat* planes[] = {&r.K, &r.K_TI, &r.X_max, &r.X_min};
    for (const cv::Mat* plane : planes) {
        if (plane->empty()) {
            throw std::invalid_argument("merge_directions: Input plane is empty.");
        }
        if (plane->type() != CV_32FC1) {
            throw std::invalid_argument("merge_directions: Input planes must be CV_32FC1.");
        }
        if (plane->size() != size) {
            throw std::invalid_argument("merge_directions: Horizontal and vertical results differ in size.");
        }
    }
}

} // namespace

FilterResult merge_directions(const FilterResult& hor, const FilterResult& ver) {
    if (ver.K.empty()) {
        throw std::invalid_argument("merge_directions: Input plane is empty.");
    }
    check_result(hor, ver.K.size());
    check_result(ver, ver.K.size());

    // Start from the vertical pass, then overwrite where the horizontal pass wins
    FilterResult merged;
    merged.K = ver.K.clone();
    merged.K_TI = ver.K_TI.clone();
    merged.X_max = ver.X_max.clone();
    merged.X_min = ver.X_min.clone();

    const cv::Mat abs_k_hor = cv::abs(hor.K);
    const cv::Mat abs_k_ver = cv::abs(ver.K);
    const cv::Mat fc_from_hor = abs_k_hor < abs_k_ver;
    hor.K.copyTo(merged.K, fc_from_hor);

    const cv::Mat abs_ti_hor = cv::abs(hor.K_TI);
    const cv::Mat abs_ti_ver = cv::abs(ver.K_TI);
    const cv::Mat ti_from_hor = abs_ti_hor < abs_ti_ver;
    hor.K_TI.copyTo(merged.K_TI, ti_from_hor);
    hor.X_max.copyTo(merged.X_max, ti_from_hor);
    hor.X_min.copyTo(merged.X_min, ti_from_hor);

    return merged;
}

} // namespace cacorr
