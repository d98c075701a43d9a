/**
 * @file test_region_mask.cpp
 * @brief 다각형 마스크 래스터화 테스트
 */

#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <vector>

#include "facemask/face_regions.h"
#include "facemask/region_mask.h"
#include "test_fixtures.h"

namespace facemask {
namespace testing {

class RegionMaskTest : public ::testing::Test {
protected:
    static constexpr int kWidth = 200;
    static constexpr int kHeight = 200;
};

TEST_F(RegionMaskTest, FullFramePolygonCoversEveryPixel) {
    cv::Mat mask;
    const std::vector<LandmarkPoint> corners = {{0, 0}, {99, 0}, {99, 99}, {0, 99}};
    ASSERT_EQ(buildRegionMask(100, 100, corners, mask), ErrorCode::Success);

    EXPECT_EQ(mask.type(), CV_8UC1);
    EXPECT_EQ(mask.rows, 100);
    EXPECT_EQ(mask.cols, 100);
    EXPECT_EQ(cv::countNonZero(mask), 100 * 100);
}

TEST_F(RegionMaskTest, OutOfFrameVerticesAreClamped) {
    cv::Mat mask;
    const std::vector<LandmarkPoint> corners = {{-20, -20}, {300, -20}, {300, 300}, {-20, 300}};
    ASSERT_EQ(buildRegionMask(50, 80, corners, mask), ErrorCode::Success);
    EXPECT_EQ(cv::countNonZero(mask), 50 * 80);
}

TEST_F(RegionMaskTest, TriangleInteriorOnly) {
    cv::Mat mask;
    const std::vector<LandmarkPoint> triangle = {{10, 10}, {50, 10}, {10, 50}};
    ASSERT_EQ(buildRegionMask(kHeight, kWidth, triangle, mask), ErrorCode::Success);

    // 값은 0 또는 255만
    EXPECT_EQ(mask.at<uint8_t>(15, 15), MASK_ON);
    EXPECT_EQ(mask.at<uint8_t>(45, 45), MASK_OFF);
    EXPECT_EQ(mask.at<uint8_t>(100, 100), MASK_OFF);

    cv::Mat other_values;
    cv::inRange(mask, cv::Scalar(1), cv::Scalar(254), other_values);
    EXPECT_EQ(cv::countNonZero(other_values), 0);
}

TEST_F(RegionMaskTest, RepeatedPointIsInvalid) {
    cv::Mat mask;
    const std::vector<LandmarkPoint> collapsed(6, LandmarkPoint{40, 40});
    EXPECT_EQ(buildRegionMask(kHeight, kWidth, collapsed, mask), ErrorCode::InvalidRegion);
}

TEST_F(RegionMaskTest, TwoDistinctPointsAreInvalid) {
    cv::Mat mask;
    const std::vector<LandmarkPoint> segment = {{10, 10}, {20, 20}, {10, 10}, {20, 20}};
    EXPECT_EQ(buildRegionMask(kHeight, kWidth, segment, mask), ErrorCode::InvalidRegion);
}

TEST_F(RegionMaskTest, InvalidFrameSize) {
    cv::Mat mask;
    const std::vector<LandmarkPoint> triangle = {{1, 1}, {5, 1}, {1, 5}};
    EXPECT_EQ(buildRegionMask(0, 10, triangle, mask), ErrorCode::InvalidRegion);
    EXPECT_EQ(buildRegionMask(10, -1, triangle, mask), ErrorCode::InvalidRegion);
}

TEST_F(RegionMaskTest, FaceOvalFromLandmarks) {
    const std::vector<LandmarkPoint> points =
        toPixelPoints(makeSyntheticFace(), kWidth, kHeight);

    cv::Mat mask;
    ASSERT_EQ(buildRegionMaskFromLandmarks(RegionId::FaceOval, points, kHeight, kWidth, mask),
              ErrorCode::Success);

    EXPECT_EQ(mask.at<uint8_t>(100, 100), MASK_ON);
    EXPECT_EQ(mask.at<uint8_t>(2, 2), MASK_OFF);
    EXPECT_EQ(mask.at<uint8_t>(197, 197), MASK_OFF);
}

TEST_F(RegionMaskTest, CollapsedLandmarksAreInvalid) {
    const std::vector<LandmarkPoint> points(FACE_LANDMARK_COUNT, LandmarkPoint{50, 50});

    cv::Mat mask;
    EXPECT_EQ(buildRegionMaskFromLandmarks(RegionId::Lips, points, kHeight, kWidth, mask),
              ErrorCode::InvalidRegion);
}

TEST_F(RegionMaskTest, TooFewLandmarks) {
    const std::vector<LandmarkPoint> points(10, LandmarkPoint{50, 50});

    cv::Mat mask;
    EXPECT_EQ(buildRegionMaskFromLandmarks(RegionId::FaceOval, points, kHeight, kWidth, mask),
              ErrorCode::LandmarkIndexOutOfRange);
}

} // namespace testing
} // namespace facemask
