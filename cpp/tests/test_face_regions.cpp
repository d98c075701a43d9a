/**
 * @file test_face_regions.cpp
 * @brief 고정 얼굴 영역 테이블 및 좌표 변환 테스트
 */

#include <gtest/gtest.h>
#include <set>
#include <vector>

#include "facemask/face_regions.h"
#include "facemask/path_builder.h"

namespace facemask {
namespace testing {

class FaceRegionsTest : public ::testing::Test {
protected:
    static std::vector<RegionId> allRegions() {
        std::vector<RegionId> regions;
        for (int i = 0; i < REGION_COUNT; ++i) {
            regions.push_back(static_cast<RegionId>(i));
        }
        return regions;
    }
};

TEST_F(FaceRegionsTest, DefinitionsAreValid) {
    EXPECT_EQ(validateRegionDefinitions(), ErrorCode::Success);
}

TEST_F(FaceRegionsTest, EveryListIsClosedAndInRange) {
    for (RegionId region : allRegions()) {
        const std::vector<int>& indices = getRegionIndices(region);
        ASSERT_GE(indices.size(), 4u) << static_cast<int>(region);
        EXPECT_EQ(indices.front(), indices.back()) << static_cast<int>(region);

        for (int index : indices) {
            EXPECT_GE(index, 0);
            EXPECT_LT(index, FACE_LANDMARK_COUNT);
        }
    }
}

TEST_F(FaceRegionsTest, EveryPathIsClosed) {
    for (RegionId region : allRegions()) {
        std::vector<LandmarkEdge> path;
        ASSERT_EQ(getRegionPath(region, path), ErrorCode::Success)
            << static_cast<int>(region);
        EXPECT_TRUE(isClosedPath(path));
        EXPECT_EQ(path.size(), getRegionIndices(region).size() - 1);
    }
}

TEST_F(FaceRegionsTest, KnownTableContents) {
    // 윤곽은 이마 중앙 10번에서 시작
    const std::vector<int>& oval = getRegionIndices(RegionId::FaceOval);
    EXPECT_EQ(oval.front(), 10);
    EXPECT_EQ(std::set<int>(oval.begin(), oval.end()).size(), 36u);

    const std::vector<int>& lips = getRegionIndices(RegionId::Lips);
    EXPECT_EQ(lips.front(), 164);
    EXPECT_EQ(lips.size(), 21u);
}

TEST_F(FaceRegionsTest, EyeAndCheekShareBoundary) {
    // 눈 아래 경계와 볼 위 경계는 같은 랜드마크
    const std::vector<int>& eye = getRegionIndices(RegionId::LeftEye);
    const std::vector<int>& cheek = getRegionIndices(RegionId::LeftCheek);
    const std::set<int> eye_set(eye.begin(), eye.end());

    int shared = 0;
    for (int index : cheek) {
        if (eye_set.count(index)) {
            ++shared;
        }
    }
    EXPECT_GT(shared, 3);
}

TEST_F(FaceRegionsTest, ToPixelPointsTruncates) {
    const std::vector<NormalizedLandmark> landmarks = {
        {0.0f, 0.0f, 0.0f},
        {0.5f, 0.25f, 0.0f},
        {0.999f, 0.999f, 0.0f}
    };

    const std::vector<LandmarkPoint> points = toPixelPoints(landmarks, 640, 480);
    ASSERT_EQ(points.size(), 3u);
    EXPECT_EQ(points[0].x, 0);
    EXPECT_EQ(points[0].y, 0);
    EXPECT_EQ(points[1].x, 320);
    EXPECT_EQ(points[1].y, 120);
    EXPECT_EQ(points[2].x, 639);
    EXPECT_EQ(points[2].y, 479);
}

TEST_F(FaceRegionsTest, ResolveVerticesFollowsEdges) {
    const std::vector<LandmarkEdge> path = {{0, 1}, {1, 2}, {2, 0}};
    const std::vector<LandmarkPoint> points = {{1, 1}, {5, 1}, {3, 4}};

    std::vector<LandmarkPoint> vertices;
    ASSERT_EQ(resolveRegionVertices(path, points, vertices), ErrorCode::Success);

    // 간선마다 (from, to) 두 정점
    ASSERT_EQ(vertices.size(), 6u);
    EXPECT_EQ(vertices[0].x, 1);
    EXPECT_EQ(vertices[1].x, 5);
    EXPECT_EQ(vertices[5].x, 1);
    EXPECT_EQ(vertices[5].y, 1);
}

TEST_F(FaceRegionsTest, ResolveVerticesRejectsMissingLandmark) {
    std::vector<LandmarkEdge> path;
    ASSERT_EQ(getRegionPath(RegionId::FaceOval, path), ErrorCode::Success);

    const std::vector<LandmarkPoint> too_few(100, LandmarkPoint{0, 0});
    std::vector<LandmarkPoint> vertices;
    EXPECT_EQ(resolveRegionVertices(path, too_few, vertices),
              ErrorCode::LandmarkIndexOutOfRange);
    EXPECT_TRUE(vertices.empty());
}

} // namespace testing
} // namespace facemask
