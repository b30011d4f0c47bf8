#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include "cacorr/channel_split.hpp"
#include "cacorr/transpose.hpp"
#include "test_helpers.hpp"

class ChannelSplitTest : public ::testing::Test {
protected:
    void SetUp() override {
        image_ = makeRandomImage(6, 10, 42);
    }

    cv::Mat image_;
};

TEST_F(ChannelSplitTest, PlanesMatchInterleavedChannels) {
    cacorr::ChannelPlanes planes = cacorr::split_channels(image_);
    ASSERT_EQ(planes.R.type(), CV_32FC1);
    ASSERT_EQ(planes.Y.size(), image_.size());

    for (int i = 0; i < image_.rows; ++i) {
        for (int j = 0; j < image_.cols; ++j) {
            const cv::Vec3f& px = image_.at<cv::Vec3f>(i, j);
            EXPECT_EQ(planes.R.at<float>(i, j), px[0]);
            EXPECT_EQ(planes.G.at<float>(i, j), px[1]);
            EXPECT_EQ(planes.B.at<float>(i, j), px[2]);
            EXPECT_NEAR(planes.Y.at<float>(i, j), 0.299f * px[0] + 0.587f * px[1] + 0.114f * px[2], 1e-6);
        }
    }
}

TEST_F(ChannelSplitTest, MergeRestoresImage) {
    cacorr::ChannelPlanes planes = cacorr::split_channels(image_);
    cv::Mat merged = cacorr::merge_channels(planes.R, planes.G, planes.B);
    EXPECT_TRUE(CompareMatrices(merged, image_, 0.0));
}

TEST_F(ChannelSplitTest, InvalidInputs) {
    cv::Mat empty;
    EXPECT_THROW(cacorr::split_channels(empty), std::invalid_argument);

    cv::Mat single(4, 4, CV_32FC1, cv::Scalar(0.5f));
    EXPECT_THROW(cacorr::split_channels(single), std::invalid_argument);

    cv::Mat bytes(4, 4, CV_8UC3, cv::Scalar::all(10));
    EXPECT_THROW(cacorr::split_channels(bytes), std::invalid_argument);

    cv::Mat other(3, 4, CV_32FC1, cv::Scalar(0.5f));
    EXPECT_THROW(cacorr::merge_channels(single, other, single), std::invalid_argument);
}

TEST(Transpose, SwapsRowsAndColumns) {
    cv::Mat plane = makePlane(2, 3, {1.0f, 2.0f, 3.0f,
                                     4.0f, 5.0f, 6.0f});
    cv::Mat t = cacorr::transpose_plane(plane);
    ASSERT_EQ(t.rows, 3);
    ASSERT_EQ(t.cols, 2);
    EXPECT_EQ(t.at<float>(2, 1), 6.0f);
    EXPECT_EQ(t.at<float>(0, 1), 4.0f);
    EXPECT_TRUE(CompareMatrices(cacorr::transpose_plane(t), plane, 0.0));
}

TEST(Transpose, GradientIsBackwardDifference) {
    cv::Mat plane = makePlane(2, 4, {0.0f, 1.0f, 3.0f, 2.0f,
                                     5.0f, 5.0f, 4.0f, 8.0f});
    cv::Mat expected = makePlane(2, 4, {0.0f, 1.0f, 2.0f, -1.0f,
                                        0.0f, 0.0f, -1.0f, 4.0f});
    EXPECT_TRUE(CompareMatrices(cacorr::backward_gradient(plane), expected, 0.0));

    cv::Mat column = makePlane(3, 1, {1.0f, 2.0f, 3.0f});
    EXPECT_TRUE(CompareMatrices(cacorr::backward_gradient(column), cv::Mat::zeros(3, 1, CV_32F), 0.0));
}

TEST(Transpose, InvalidInputs) {
    cv::Mat empty;
    EXPECT_THROW(cacorr::transpose_plane(empty), std::invalid_argument);
    EXPECT_THROW(cacorr::backward_gradient(empty), std::invalid_argument);

    cv::Mat color(3, 3, CV_32FC3);
    EXPECT_THROW(cacorr::transpose_plane(color), std::invalid_argument);
    EXPECT_THROW(cacorr::backward_gradient(color), std::invalid_argument);
}
