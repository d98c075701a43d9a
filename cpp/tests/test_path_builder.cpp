/**
 * @file test_path_builder.cpp
 * @brief 닫힌 간선 경로 생성 테스트
 */

#include <gtest/gtest.h>
#include <vector>

#include "facemask/path_builder.h"

namespace facemask {
namespace testing {

class PathBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(PathBuilderTest, TriangleFormsClosedPath) {
    std::vector<LandmarkEdge> path;
    ASSERT_EQ(buildEdgePath({1, 2, 3, 1}, path), ErrorCode::Success);

    ASSERT_EQ(path.size(), 3u);
    EXPECT_TRUE(isClosedPath(path));

    // 두 번째 간선에서 시작하여 첫 간선으로 닫힘
    EXPECT_EQ(path[0].from, 2);
    EXPECT_EQ(path[0].to, 3);
    EXPECT_EQ(path[1].from, 3);
    EXPECT_EQ(path[1].to, 1);
    EXPECT_EQ(path[2].from, 1);
    EXPECT_EQ(path[2].to, 2);
}

TEST_F(PathBuilderTest, EdgeCountMatchesListLength) {
    const std::vector<int> indices = {10, 338, 297, 332, 284, 251, 10};
    std::vector<LandmarkEdge> path;
    ASSERT_EQ(buildEdgePath(indices, path), ErrorCode::Success);
    EXPECT_EQ(path.size(), indices.size() - 1);
    EXPECT_TRUE(isClosedPath(path));
}

TEST_F(PathBuilderTest, RejectsOpenList) {
    std::vector<LandmarkEdge> path = {{0, 1}};
    EXPECT_EQ(buildEdgePath({1, 2, 3, 4}, path), ErrorCode::MalformedRegionDefinition);
    // 실패 시 출력 비움
    EXPECT_TRUE(path.empty());
}

TEST_F(PathBuilderTest, RejectsTooShortList) {
    std::vector<LandmarkEdge> path;
    EXPECT_EQ(buildEdgePath({}, path), ErrorCode::MalformedRegionDefinition);
    EXPECT_EQ(buildEdgePath({5, 6, 5}, path), ErrorCode::MalformedRegionDefinition);
}

TEST_F(PathBuilderTest, RejectsTooFewDistinctVertices) {
    std::vector<LandmarkEdge> path;
    EXPECT_EQ(buildEdgePath({4, 7, 4, 7, 4}, path), ErrorCode::MalformedRegionDefinition);
}

TEST_F(PathBuilderTest, RejectsVertexStartingTwoEdges) {
    // 1에서 나가는 간선이 (1,2), (1,3) 두 개
    std::vector<LandmarkEdge> path = {{0, 1}};
    EXPECT_EQ(buildEdgePath({1, 2, 1, 3, 1}, path), ErrorCode::MalformedRegionDefinition);
    EXPECT_TRUE(path.empty());
}

TEST_F(PathBuilderTest, EveryCandidateEdgeEmittedOnce) {
    const std::vector<int> indices = {5, 9, 2, 7, 4, 5};
    std::vector<LandmarkEdge> path;
    ASSERT_EQ(buildEdgePath(indices, path), ErrorCode::Success);
    ASSERT_EQ(path.size(), indices.size() - 1);

    for (size_t i = 0; i + 1 < indices.size(); ++i) {
        int count = 0;
        for (const auto& edge : path) {
            if (edge.from == indices[i] && edge.to == indices[i + 1]) {
                ++count;
            }
        }
        EXPECT_EQ(count, 1) << "edge " << indices[i] << "->" << indices[i + 1];
    }
}

TEST_F(PathBuilderTest, RejectsNegativeIndex) {
    std::vector<LandmarkEdge> path;
    EXPECT_EQ(buildEdgePath({1, -2, 3, 1}, path), ErrorCode::MalformedRegionDefinition);
}

TEST_F(PathBuilderTest, IsClosedPathChecksContinuity) {
    EXPECT_FALSE(isClosedPath({}));
    EXPECT_TRUE(isClosedPath({{1, 2}, {2, 3}, {3, 1}}));
    // 중간 단절
    EXPECT_FALSE(isClosedPath({{1, 2}, {3, 4}, {4, 1}}));
    // 끝이 시작으로 돌아오지 않음
    EXPECT_FALSE(isClosedPath({{1, 2}, {2, 3}, {3, 4}}));
}

} // namespace testing
} // namespace facemask
