#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include "cacorr/correction.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <vector>

class CorrectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        params_.L_hor = 4;
        params_.L_ver = 2;
    }

    cacorr::FilterParameters params_;
};

TEST_F(CorrectionTest, GrayImageUnchanged) {
    cv::Mat gray = makeGrayImage(12, 20, 99);
    cv::Mat result = cacorr::correct_chromatic_aberration(gray, params_);
    ASSERT_EQ(result.type(), CV_32FC3);
    ASSERT_EQ(result.size(), gray.size());
    EXPECT_TRUE(CompareMatrices(result, gray, 0.0));
}

TEST_F(CorrectionTest, RedFringeReduced) {
    const int rows = 12;
    const int edge_col = 16;
    cv::Mat image = makeFringedEdgeImage(rows, 32, edge_col, 2);
    cv::Mat result = cacorr::correct_chromatic_aberration(image, params_);

    for (int j = edge_col - 2; j < edge_col; ++j) {
        const cv::Vec3f in = image.at<cv::Vec3f>(rows / 2, j);
        const cv::Vec3f out = result.at<cv::Vec3f>(rows / 2, j);
        EXPECT_EQ(out[1], in[1]) << "green must pass through at column " << j;
        EXPECT_LT(std::abs(out[0] - out[1]), 0.2f) << "column " << j;
        EXPECT_LT(std::abs(out[0] - out[1]), std::abs(in[0] - in[1])) << "column " << j;
    }
}

TEST_F(CorrectionTest, BorderPassesThrough) {
    cv::Mat image = makeRandomImage(15, 25, 5);
    cv::Mat result = cacorr::correct_chromatic_aberration(image, params_);
    const cv::Rect region = cacorr::corrected_region(image.size(), params_);
    EXPECT_EQ(region, cv::Rect(4, 2, 17, 11));

    for (int i = 0; i < image.rows; ++i) {
        for (int j = 0; j < image.cols; ++j) {
            const cv::Vec3f in = image.at<cv::Vec3f>(i, j);
            const cv::Vec3f out = result.at<cv::Vec3f>(i, j);
            EXPECT_EQ(out[1], in[1]) << "at (" << i << ", " << j << ")";
            if (!region.contains(cv::Point(j, i))) {
                EXPECT_EQ(out[0], in[0]) << "at (" << i << ", " << j << ")";
                EXPECT_EQ(out[2], in[2]) << "at (" << i << ", " << j << ")";
            }
        }
    }
}

TEST_F(CorrectionTest, RepeatedRunsAreBitIdentical) {
    cv::Mat image = makeRandomImage(24, 36, 17);
    cv::Mat first = cacorr::correct_chromatic_aberration(image, params_);
    cv::Mat second = cacorr::correct_chromatic_aberration(image, params_);
    EXPECT_EQ(cv::norm(first, second, cv::NORM_INF), 0.0);
}

TEST_F(CorrectionTest, DefaultParametersGiveFiniteOutput) {
    cacorr::FilterParameters defaults;
    cv::Mat image = makeRandomImage(20, 40, 3);
    cv::Mat result = cacorr::correct_chromatic_aberration(image, defaults);
    EXPECT_TRUE(AllFinite(result));
}

TEST_F(CorrectionTest, ClipOutputBoundsRange) {
    cv::Mat image(16, 24, CV_32FC3);
    cv::RNG rng(21);
    rng.fill(image, cv::RNG::UNIFORM, -0.5, 1.5);

    params_.clip_output = true;
    cv::Mat result = cacorr::correct_chromatic_aberration(image, params_);
    double min_val = 0.0, max_val = 0.0;
    cv::minMaxLoc(result.reshape(1), &min_val, &max_val);
    EXPECT_GE(min_val, 0.0);
    EXPECT_LE(max_val, 1.0);
}

TEST_F(CorrectionTest, InputNotModified) {
    cv::Mat image = makeRandomImage(10, 14, 8);
    const cv::Mat copy = image.clone();
    cv::Mat result = cacorr::correct_chromatic_aberration(image, params_);
    EXPECT_TRUE(CompareMatrices(image, copy, 0.0));
    EXPECT_NE(result.data, image.data);
}

TEST_F(CorrectionTest, PaddedKeepsSizeAndGray) {
    cv::Mat gray = makeGrayImage(6, 7, 4);
    cv::Mat zero_padded = cacorr::correct_chromatic_aberration_padded(gray, params_);
    EXPECT_TRUE(CompareMatrices(zero_padded, gray, 0.0));

    cv::Mat reflected = cacorr::correct_chromatic_aberration_padded(gray, params_, cv::BORDER_REFLECT_101);
    EXPECT_TRUE(CompareMatrices(reflected, gray, 0.0));
}

TEST_F(CorrectionTest, PaddedCorrectsImageEdge) {
    // Fringe in the first columns lies outside the unpadded corrected region
    cv::Mat image = makeFringedEdgeImage(10, 20, 2, 2);
    cv::Mat plain = cacorr::correct_chromatic_aberration(image, params_);
    cv::Mat padded = cacorr::correct_chromatic_aberration_padded(image, params_);
    ASSERT_EQ(padded.size(), image.size());
    EXPECT_TRUE(AllFinite(padded));

    const cv::Vec3f in = image.at<cv::Vec3f>(5, 1);
    EXPECT_EQ(plain.at<cv::Vec3f>(5, 1)[0], in[0]);

    // Zero padding puts the fringe inside the window: the red excess shrinks but keeps its sign
    const cv::Vec3f out = padded.at<cv::Vec3f>(5, 1);
    EXPECT_EQ(out[1], in[1]);
    EXPECT_LT(std::abs(out[0] - out[1]), std::abs(in[0] - in[1]));
    EXPECT_GT(out[0] - out[1], 0.0f);
}

TEST_F(CorrectionTest, PaddedMatchesUnpaddedInInterior) {
    cv::Mat image = makeRandomImage(10, 20, 13);
    cv::Mat plain = cacorr::correct_chromatic_aberration(image, params_);
    cv::Mat padded = cacorr::correct_chromatic_aberration_padded(image, params_);

    // Windows and the gradient's left neighbour stay inside the image here
    const cv::Rect interior(params_.L_hor + 1, params_.L_ver + 1, 11, 5);
    EXPECT_TRUE(CompareMatrices(padded(interior), plain(interior), 1e-6));
}

TEST_F(CorrectionTest, RejectsInvalidInputBeforeWork) {
    cv::Mat empty;
    EXPECT_THROW(cacorr::correct_chromatic_aberration(empty, params_), std::invalid_argument);

    cv::Mat single(20, 20, CV_32FC1, cv::Scalar(0.5f));
    EXPECT_THROW(cacorr::correct_chromatic_aberration(single, params_), std::invalid_argument);

    cv::Mat bytes(20, 20, CV_8UC3, cv::Scalar::all(10));
    EXPECT_THROW(cacorr::correct_chromatic_aberration(bytes, params_), std::invalid_argument);

    // 2*4+1 columns needed
    cv::Mat narrow = makeRandomImage(20, 8, 1);
    EXPECT_THROW(cacorr::correct_chromatic_aberration(narrow, params_), std::invalid_argument);

    // 2*2+1 rows needed
    cv::Mat flat = makeRandomImage(4, 20, 1);
    EXPECT_THROW(cacorr::correct_chromatic_aberration(flat, params_), std::invalid_argument);

    cacorr::FilterParameters bad = params_;
    bad.gamma_2 = bad.gamma_1 * 2.0f;
    EXPECT_THROW(cacorr::correct_chromatic_aberration(makeRandomImage(20, 20, 1), bad), std::invalid_argument);
    EXPECT_THROW(cacorr::correct_chromatic_aberration_padded(makeRandomImage(20, 20, 1), bad), std::invalid_argument);
}
