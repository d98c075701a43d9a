/**
 * @file test_mask_compositor.cpp
 * @brief 영역 마스크 합성 테스트
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <opencv2/core.hpp>

#include "facemask/config.h"
#include "facemask/face_regions.h"
#include "facemask/mask_compositor.h"
#include "facemask/region_mask.h"
#include "test_fixtures.h"

namespace facemask {
namespace testing {

class MaskCompositorTest : public ::testing::Test {
protected:
    static constexpr int kSize = 200;

    void SetUp() override {
        const std::vector<LandmarkPoint> points =
            toPixelPoints(makeSyntheticFace(), kSize, kSize);

        for (int i = 0; i < REGION_COUNT; ++i) {
            const auto region = static_cast<RegionId>(i);
            cv::Mat mask;
            ASSERT_EQ(buildRegionMaskFromLandmarks(region, points, kSize, kSize, mask),
                      ErrorCode::Success) << toString(region);
            masks_[region] = mask;
        }
    }

    /// a에 있고 b에 없는 픽셀 수
    static int countOutside(const cv::Mat& a, const cv::Mat& b) {
        return cv::countNonZero(subtractMask(a, b));
    }

    RegionMaskSet masks_;
};

TEST_F(MaskCompositorTest, RecipeContents) {
    const CompositeRecipe& skin = getCompositeRecipe(MaskType::FaceSkin);
    EXPECT_STREQ(skin.name, "faceSkin");
    ASSERT_EQ(skin.include.size(), 1u);
    EXPECT_EQ(skin.include[0], RegionId::FaceOval);
    EXPECT_EQ(skin.exclude.size(), 3u);

    const CompositeRecipe& cheeks = getCompositeRecipe(MaskType::FaceCheeks);
    EXPECT_EQ(cheeks.include.size(), 2u);
    EXPECT_TRUE(cheeks.exclude.empty());

    EXPECT_TRUE(getCompositeRecipe(MaskType::FaceOutline).exclude.empty());
}

TEST_F(MaskCompositorTest, RequiredRegionsAreUnique) {
    const std::vector<RegionId> regions = requiredRegions(MaskType::FaceSkin);
    EXPECT_EQ(regions.size(), 4u);
    EXPECT_NE(std::find(regions.begin(), regions.end(), RegionId::Lips), regions.end());
    EXPECT_EQ(std::find(regions.begin(), regions.end(), RegionId::LeftCheek), regions.end());
}

TEST_F(MaskCompositorTest, OutlineEqualsFaceOval) {
    cv::Mat outline;
    ASSERT_EQ(composeRegion(MaskType::FaceOutline, masks_, outline), ErrorCode::Success);
    EXPECT_EQ(countOutside(outline, masks_[RegionId::FaceOval]), 0);
    EXPECT_EQ(countOutside(masks_[RegionId::FaceOval], outline), 0);
}

TEST_F(MaskCompositorTest, SkinIsSubsetOfOutline) {
    cv::Mat outline;
    cv::Mat skin;
    ASSERT_EQ(composeRegion(MaskType::FaceOutline, masks_, outline), ErrorCode::Success);
    ASSERT_EQ(composeRegion(MaskType::FaceSkin, masks_, skin), ErrorCode::Success);

    EXPECT_EQ(countOutside(skin, outline), 0);
    EXPECT_LT(cv::countNonZero(skin), cv::countNonZero(outline));
}

TEST_F(MaskCompositorTest, OutlineMinusFeaturesIsSkin) {
    cv::Mat skin;
    ASSERT_EQ(composeRegion(MaskType::FaceSkin, masks_, skin), ErrorCode::Success);

    cv::Mat expected = masks_[RegionId::FaceOval].clone();
    expected = subtractMask(expected, masks_[RegionId::LeftEye]);
    expected = subtractMask(expected, masks_[RegionId::RightEye]);
    expected = subtractMask(expected, masks_[RegionId::Lips]);

    EXPECT_EQ(countOutside(skin, expected), 0);
    EXPECT_EQ(countOutside(expected, skin), 0);
}

TEST_F(MaskCompositorTest, SkinExcludesEyesAndLips) {
    cv::Mat skin;
    ASSERT_EQ(composeRegion(MaskType::FaceSkin, masks_, skin), ErrorCode::Success);

    // 얼굴 중심은 피부, 눈/입술 중심은 제외
    EXPECT_EQ(skin.at<uint8_t>(100, 100), MASK_ON);
    EXPECT_EQ(skin.at<uint8_t>(76, 66), MASK_OFF);
    EXPECT_EQ(skin.at<uint8_t>(76, 134), MASK_OFF);
    EXPECT_EQ(skin.at<uint8_t>(144, 100), MASK_OFF);

    cv::Mat overlap;
    cv::bitwise_and(skin, masks_[RegionId::Lips], overlap);
    EXPECT_EQ(cv::countNonZero(overlap), 0);
}

TEST_F(MaskCompositorTest, CheeksIsUnionOfCheeks) {
    cv::Mat cheeks;
    ASSERT_EQ(composeRegion(MaskType::FaceCheeks, masks_, cheeks), ErrorCode::Success);

    cv::Mat expected;
    cv::bitwise_or(masks_[RegionId::LeftCheek], masks_[RegionId::RightCheek], expected);
    EXPECT_EQ(countOutside(cheeks, expected), 0);
    EXPECT_EQ(countOutside(expected, cheeks), 0);
    EXPECT_GT(cv::countNonZero(cheeks), 0);
}

TEST_F(MaskCompositorTest, MissingRegionIsInvalid) {
    masks_.erase(RegionId::Lips);
    cv::Mat skin;
    EXPECT_EQ(composeRegion(MaskType::FaceSkin, masks_, skin), ErrorCode::InvalidRegion);
}

TEST_F(MaskCompositorTest, SizeMismatch) {
    masks_[RegionId::LeftEye] = cv::Mat::zeros(10, 10, CV_8UC1);
    cv::Mat skin;
    EXPECT_EQ(composeRegion(MaskType::FaceSkin, masks_, skin), ErrorCode::FrameSizeMismatch);
}

TEST_F(MaskCompositorTest, EmptyRecipeRejected) {
    const CompositeRecipe empty = {"empty", {}, {}};
    cv::Mat out;
    EXPECT_EQ(composeRegion(empty, masks_, out), ErrorCode::InvalidParameter);
}

TEST_F(MaskCompositorTest, SubtractMask) {
    cv::Mat base(4, 4, CV_8UC1, cv::Scalar(MASK_ON));
    cv::Mat removal = cv::Mat::zeros(4, 4, CV_8UC1);
    removal.at<uint8_t>(1, 1) = MASK_ON;

    const cv::Mat result = subtractMask(base, removal);
    EXPECT_EQ(cv::countNonZero(result), 15);
    EXPECT_EQ(result.at<uint8_t>(1, 1), MASK_OFF);
}

} // namespace testing
} // namespace facemask
