/**
 * @file test_artifact_cleaner.cpp
 * @brief 영역 격리 및 밝은 아티팩트 제거 테스트
 */

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include "facemask/artifact_cleaner.h"

namespace facemask {
namespace testing {

class ArtifactCleanerTest : public ::testing::Test {
protected:
    /// 회색 픽셀은 휘도 = 값
    static cv::Vec3b gray(uint8_t value) { return cv::Vec3b(value, value, value); }
};

// ------------------------------------------------------------
// isolateRegion
// ------------------------------------------------------------

TEST_F(ArtifactCleanerTest, IsolateKeepsMaskedPixelsOnly) {
    cv::Mat frame(4, 4, CV_8UC3, cv::Scalar(10, 20, 30));
    cv::Mat mask = cv::Mat::zeros(4, 4, CV_8UC1);
    mask.at<uint8_t>(2, 1) = 255;

    const cv::Mat isolated = isolateRegion(frame, mask);
    ASSERT_EQ(isolated.size(), frame.size());
    EXPECT_EQ(isolated.at<cv::Vec3b>(2, 1), cv::Vec3b(10, 20, 30));
    EXPECT_EQ(isolated.at<cv::Vec3b>(0, 0), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(isolated.at<cv::Vec3b>(3, 3), cv::Vec3b(0, 0, 0));
}

TEST_F(ArtifactCleanerTest, IsolateWithEmptyMaskIsBlack) {
    cv::Mat frame(3, 3, CV_8UC3, cv::Scalar(50, 60, 70));
    const cv::Mat isolated = isolateRegion(frame, cv::Mat());
    EXPECT_EQ(cv::countNonZero(isolated.reshape(1)), 0);
}

TEST_F(ArtifactCleanerTest, IsolateDoesNotModifyInput) {
    cv::Mat frame(3, 3, CV_8UC3, cv::Scalar(50, 60, 70));
    const cv::Mat original = frame.clone();
    const cv::Mat mask = cv::Mat::zeros(3, 3, CV_8UC1);

    isolateRegion(frame, mask);
    EXPECT_EQ(cv::norm(frame, original, cv::NORM_INF), 0.0);
}

// ------------------------------------------------------------
// removeBrightArtifacts
// ------------------------------------------------------------

TEST_F(ArtifactCleanerTest, BrightThreshold) {
    cv::Mat frame(1, 4, CV_8UC3);
    frame.at<cv::Vec3b>(0, 0) = gray(219);
    frame.at<cv::Vec3b>(0, 1) = gray(220);
    frame.at<cv::Vec3b>(0, 2) = gray(255);
    frame.at<cv::Vec3b>(0, 3) = gray(0);

    const cv::Mat cleaned = removeBrightArtifacts(frame);

    // 219는 유지, 220~255는 검정
    EXPECT_EQ(cleaned.at<cv::Vec3b>(0, 0), gray(219));
    EXPECT_EQ(cleaned.at<cv::Vec3b>(0, 1), gray(0));
    EXPECT_EQ(cleaned.at<cv::Vec3b>(0, 2), gray(0));
    EXPECT_EQ(cleaned.at<cv::Vec3b>(0, 3), gray(0));
}

TEST_F(ArtifactCleanerTest, BrightRemovalUsesLuma) {
    // 순수 파랑은 채널값 255여도 휘도가 낮음
    cv::Mat frame(1, 1, CV_8UC3, cv::Scalar(255, 0, 0));
    const cv::Mat cleaned = removeBrightArtifacts(frame);
    EXPECT_EQ(cleaned.at<cv::Vec3b>(0, 0), cv::Vec3b(255, 0, 0));
}

TEST_F(ArtifactCleanerTest, BrightRemovalIsIdempotent) {
    cv::Mat frame(8, 8, CV_8UC3);
    cv::randu(frame, cv::Scalar::all(0), cv::Scalar::all(256));

    const cv::Mat once = removeBrightArtifacts(frame);
    const cv::Mat twice = removeBrightArtifacts(once);
    EXPECT_EQ(cv::norm(once, twice, cv::NORM_INF), 0.0);
}

TEST_F(ArtifactCleanerTest, BrightRemovalOnEmptyFrame) {
    EXPECT_TRUE(removeBrightArtifacts(cv::Mat()).empty());
}

// ------------------------------------------------------------
// smoothMask
// ------------------------------------------------------------

TEST_F(ArtifactCleanerTest, SmoothRemovesIsolatedPixel) {
    cv::Mat mask = cv::Mat::zeros(9, 9, CV_8UC1);
    mask.at<uint8_t>(4, 4) = 255;

    const cv::Mat smoothed = smoothMask(mask);
    EXPECT_EQ(cv::countNonZero(smoothed), 0);
}

TEST_F(ArtifactCleanerTest, SmoothKeepsSolidBlock) {
    cv::Mat mask = cv::Mat::zeros(12, 12, CV_8UC1);
    mask(cv::Rect(2, 2, 8, 8)).setTo(255);

    const cv::Mat smoothed = smoothMask(mask);
    EXPECT_EQ(cv::countNonZero(smoothed), 64);
}

TEST_F(ArtifactCleanerTest, SmoothFillsPinhole) {
    cv::Mat mask = cv::Mat::zeros(12, 12, CV_8UC1);
    mask(cv::Rect(2, 2, 8, 8)).setTo(255);
    mask.at<uint8_t>(5, 5) = 0;

    const cv::Mat smoothed = smoothMask(mask);
    EXPECT_EQ(smoothed.at<uint8_t>(5, 5), 255);
}

} // namespace testing
} // namespace facemask
