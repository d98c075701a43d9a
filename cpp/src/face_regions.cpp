/**
 * @file face_regions.cpp
 * @brief 고정 얼굴 영역 테이블 및 좌표 해석 구현
 */

#include "facemask/face_regions.h"
#include "facemask/config.h"
#include "facemask/path_builder.h"

#include <array>

#include "logging.h"

namespace facemask {

// ============================================================
// 영역 인덱스 테이블 (MediaPipe Face Mesh 기준)
// ============================================================
namespace {

const std::vector<int> LEFT_EYE_INDICES = {
    301, 334, 296, 336, 285, 413, 464, 453, 452, 451, 450, 449, 448, 261, 265, 383, 301
};

const std::vector<int> LEFT_CHEEK_INDICES = {
    265, 261, 448, 449, 450, 451, 452, 350, 277, 371, 266, 425, 280, 346, 340, 265
};

const std::vector<int> RIGHT_EYE_INDICES = {
    71, 105, 66, 107, 55, 189, 244, 233, 232, 231, 230, 229, 228, 31, 35, 156, 71
};

const std::vector<int> RIGHT_CHEEK_INDICES = {
    35, 31, 228, 229, 230, 231, 232, 233, 128, 114, 126, 142, 36, 205, 50, 117, 111, 35
};

const std::vector<int> LIPS_INDICES = {
    164, 393, 391, 322, 410, 287, 273, 335, 406, 313, 18, 83, 182, 106, 43, 57,
    186, 92, 165, 167, 164
};

const std::vector<int> FACE_OVAL_INDICES = {
    10, 338, 297, 332, 284, 251, 389, 356, 345, 352, 376, 433, 397, 365, 379, 378,
    400, 377, 152, 148, 176, 149, 150, 136, 172, 213, 147, 123, 116, 127, 162, 21,
    54, 103, 67, 109, 10
};

const std::vector<int> EMPTY_INDICES;

/**
 * @brief 영역 경로 캐시
 * 최초 접근 시 한 번 계산, 이후 불변
 */
struct RegionPathCache {
    std::array<std::vector<LandmarkEdge>, REGION_COUNT> paths;
    ErrorCode status = ErrorCode::Success;

    RegionPathCache() {
        for (int i = 0; i < REGION_COUNT; ++i) {
            const auto region = static_cast<RegionId>(i);
            const ErrorCode code = buildEdgePath(getRegionIndices(region), paths[i]);
            if (code != ErrorCode::Success) {
                detail::getLogger("facemask.regions")->error(
                    "failed to build path for region {}: {}",
                    toString(region), errorCodeToString(code));
                status = code;
            }
        }
    }
};

const RegionPathCache& regionPathCache() {
    static const RegionPathCache cache;
    return cache;
}

} // anonymous namespace

// ============================================================
// 공개 함수
// ============================================================

const std::vector<int>& getRegionIndices(RegionId region) {
    switch (region) {
        case RegionId::LeftEye:    return LEFT_EYE_INDICES;
        case RegionId::RightEye:   return RIGHT_EYE_INDICES;
        case RegionId::LeftCheek:  return LEFT_CHEEK_INDICES;
        case RegionId::RightCheek: return RIGHT_CHEEK_INDICES;
        case RegionId::Lips:       return LIPS_INDICES;
        case RegionId::FaceOval:   return FACE_OVAL_INDICES;
        default:                   return EMPTY_INDICES;
    }
}

ErrorCode getRegionPath(RegionId region, std::vector<LandmarkEdge>& out_path) {
    const int slot = static_cast<int>(region);
    if (slot < 0 || slot >= REGION_COUNT) {
        out_path.clear();
        return ErrorCode::InvalidParameter;
    }

    const RegionPathCache& cache = regionPathCache();
    if (cache.paths[slot].empty()) {
        out_path.clear();
        return ErrorCode::MalformedRegionDefinition;
    }

    out_path = cache.paths[slot];
    return ErrorCode::Success;
}

ErrorCode validateRegionDefinitions() {
    const RegionPathCache& cache = regionPathCache();
    if (cache.status != ErrorCode::Success) {
        return cache.status;
    }

    for (int i = 0; i < REGION_COUNT; ++i) {
        for (int index : getRegionIndices(static_cast<RegionId>(i))) {
            if (index >= FACE_LANDMARK_COUNT) {
                return ErrorCode::LandmarkIndexOutOfRange;
            }
        }
    }
    return ErrorCode::Success;
}

std::vector<LandmarkPoint> toPixelPoints(const std::vector<NormalizedLandmark>& landmarks,
                                         int width, int height) {
    std::vector<LandmarkPoint> points;
    points.reserve(landmarks.size());

    for (const auto& lm : landmarks) {
        points.push_back({
            static_cast<int>(lm.x * static_cast<float>(width)),
            static_cast<int>(lm.y * static_cast<float>(height))
        });
    }
    return points;
}

ErrorCode resolveRegionVertices(const std::vector<LandmarkEdge>& path,
                                const std::vector<LandmarkPoint>& points,
                                std::vector<LandmarkPoint>& out_vertices) {
    out_vertices.clear();
    out_vertices.reserve(path.size() * 2);

    const int point_count = static_cast<int>(points.size());
    for (const auto& edge : path) {
        if (edge.from < 0 || edge.from >= point_count ||
            edge.to < 0 || edge.to >= point_count) {
            out_vertices.clear();
            return ErrorCode::LandmarkIndexOutOfRange;
        }
        out_vertices.push_back(points[edge.from]);
        out_vertices.push_back(points[edge.to]);
    }
    return ErrorCode::Success;
}

} // namespace facemask
