/**
 * @file region_mask.h
 * @brief 다각형 정점 목록 → 픽셀 마스크 래스터화
 */

#ifndef FACEMASK_REGION_MASK_H
#define FACEMASK_REGION_MASK_H

#include <vector>

#include "facemask/export.h"
#include "facemask/types.h"

// OpenCV 전방 선언
namespace cv { class Mat; }

namespace facemask {

/// 마스크 포함 픽셀 값
constexpr unsigned char MASK_ON = 255;

/// 마스크 제외 픽셀 값
constexpr unsigned char MASK_OFF = 0;

/**
 * @brief 정점 목록으로 채워진 다각형 마스크 생성
 *
 * 정점을 [0, width) x [0, height) 범위로 클램핑한 뒤
 * cv::fillConvexPoly로 내부 및 경계를 MASK_ON으로 채운다.
 *
 * @param height 프레임 높이
 * @param width 프레임 너비
 * @param vertices 다각형 정점 (PathBuilder 출력 순서, 중복 허용)
 * @param out_mask 출력 마스크 (CV_8UC1, height x width)
 * @return Success 또는 InvalidRegion (크기 <= 0, 클램핑 후 고유 정점 3개 미만)
 */
FACEMASK_EXPORT ErrorCode buildRegionMask(int height, int width,
                                          const std::vector<LandmarkPoint>& vertices,
                                          cv::Mat& out_mask);

/**
 * @brief 랜드마크로부터 영역 마스크 생성
 *
 * getRegionPath → resolveRegionVertices → buildRegionMask 순서로 수행.
 *
 * @param region 영역 식별자
 * @param points 현재 프레임의 랜드마크 픽셀 좌표
 * @param height 프레임 높이
 * @param width 프레임 너비
 * @param out_mask 출력 마스크
 */
FACEMASK_EXPORT ErrorCode buildRegionMaskFromLandmarks(RegionId region,
                                                       const std::vector<LandmarkPoint>& points,
                                                       int height, int width,
                                                       cv::Mat& out_mask);

} // namespace facemask

#endif // FACEMASK_REGION_MASK_H
