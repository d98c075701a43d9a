/**
 * @file region_mask.cpp
 * @brief 다각형 마스크 래스터화 구현
 */

#include "facemask/region_mask.h"
#include "facemask/config.h"
#include "facemask/face_regions.h"

#include <algorithm>
#include <set>
#include <utility>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "logging.h"

namespace facemask {

namespace {
    /// 다각형 최소 고유 정점 수
    constexpr size_t MIN_POLYGON_VERTICES = 3;
}

ErrorCode buildRegionMask(int height, int width,
                          const std::vector<LandmarkPoint>& vertices,
                          cv::Mat& out_mask) {
    if (height <= 0 || width <= 0) {
        return ErrorCode::InvalidRegion;
    }

    // 프레임 경계로 클램핑
    std::vector<cv::Point> polygon;
    polygon.reserve(vertices.size());
    std::set<std::pair<int, int>> distinct;

    for (const auto& v : vertices) {
        const int x = std::clamp(v.x, 0, width - 1);
        const int y = std::clamp(v.y, 0, height - 1);
        polygon.emplace_back(x, y);
        distinct.emplace(x, y);
    }

    if (distinct.size() < MIN_POLYGON_VERTICES) {
        detail::getLogger("facemask.mask")->debug(
            "degenerate polygon: {} distinct vertices", distinct.size());
        return ErrorCode::InvalidRegion;
    }

    cv::Mat mask = cv::Mat::zeros(height, width, CV_8UC1);
    cv::fillConvexPoly(mask, polygon, cv::Scalar(MASK_ON));

    out_mask = mask;
    return ErrorCode::Success;
}

ErrorCode buildRegionMaskFromLandmarks(RegionId region,
                                       const std::vector<LandmarkPoint>& points,
                                       int height, int width,
                                       cv::Mat& out_mask) {
    std::vector<LandmarkEdge> path;
    ErrorCode code = getRegionPath(region, path);
    if (code != ErrorCode::Success) {
        return code;
    }

    std::vector<LandmarkPoint> vertices;
    code = resolveRegionVertices(path, points, vertices);
    if (code != ErrorCode::Success) {
        detail::getLogger("facemask.mask")->error(
            "region {} references a landmark beyond the {} supplied",
            toString(region), points.size());
        return code;
    }

    return buildRegionMask(height, width, vertices, out_mask);
}

} // namespace facemask
