#ifndef CACORR_TEST_HELPERS_HPP
#define CACORR_TEST_HELPERS_HPP

#include <gtest/gtest.h> // For ::testing::AssertionResult
#include <opencv2/core.hpp>
#include <cstdint>
#include <vector>

// Function to compare two float matrices element-wise with tolerance
::testing::AssertionResult CompareMatrices(const cv::Mat& mat1, const cv::Mat& mat2, double tolerance = 1e-5);

// True when every element of a CV_32F matrix is finite
::testing::AssertionResult AllFinite(const cv::Mat& mat);

// Builds a CV_32FC1 plane from row-major values
cv::Mat makePlane(int rows, int cols, const std::vector<float>& values);

// Builds a CV_32FC3 image from three planes (R, G, B)
cv::Mat makeImage(const cv::Mat& R, const cv::Mat& G, const cv::Mat& B);

// Uniform random CV_32FC3 image in [0, 1), reproducible for a given seed
cv::Mat makeRandomImage(int rows, int cols, uint64_t seed);

// Random gray image: R == G == B
cv::Mat makeGrayImage(int rows, int cols, uint64_t seed);

// Gray background with a red fringe on the dark side of a vertical edge
cv::Mat makeFringedEdgeImage(int rows, int cols, int edge_col, int fringe_width);

#endif // CACORR_TEST_HELPERS_HPP
