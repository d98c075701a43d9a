/**
 * @file face_regions.h
 * @brief 고정 얼굴 영역 정의 및 랜드마크 좌표 해석
 *
 * MediaPipe Face Mesh 인덱스 기준 6개 영역(왼쪽/오른쪽 눈, 왼쪽/오른쪽 볼,
 * 입술, 얼굴 윤곽)의 닫힌 인덱스 목록과, 이를 프레임 픽셀 좌표로 해석하는 함수.
 */

#ifndef FACEMASK_FACE_REGIONS_H
#define FACEMASK_FACE_REGIONS_H

#include <vector>

#include "facemask/export.h"
#include "facemask/types.h"

namespace facemask {

/**
 * @brief 영역의 원본 인덱스 목록 (닫힌 목록, 첫 값 == 마지막 값)
 * @param region 영역 식별자
 * @return 프로세스 전역 상수 테이블 참조
 */
FACEMASK_EXPORT const std::vector<int>& getRegionIndices(RegionId region);

/**
 * @brief 영역의 닫힌 간선 경로
 *
 * 최초 호출 시 buildEdgePath로 6개 영역 경로를 모두 계산하여 캐시.
 * 이후 호출은 캐시된 불변 경로를 반환. 스레드 안전.
 *
 * @param region 영역 식별자
 * @param out_path 출력 간선 경로
 * @return Success 또는 MalformedRegionDefinition
 */
FACEMASK_EXPORT ErrorCode getRegionPath(RegionId region,
                                        std::vector<LandmarkEdge>& out_path);

/**
 * @brief 6개 영역 정의 전체 검증
 *
 * 프로세스 시작 시 한 번 호출하여 설정 오류를 프레임 처리 전에 보고.
 */
FACEMASK_EXPORT ErrorCode validateRegionDefinitions();

/**
 * @brief 정규화 랜드마크를 픽셀 좌표로 변환
 *
 * x = trunc(lm.x * width), y = trunc(lm.y * height).
 *
 * @param landmarks 정규화 랜드마크 목록
 * @param width 프레임 너비
 * @param height 프레임 높이
 * @return 랜드마크 인덱스 순서의 픽셀 좌표
 */
FACEMASK_EXPORT std::vector<LandmarkPoint> toPixelPoints(
    const std::vector<NormalizedLandmark>& landmarks, int width, int height);

/**
 * @brief 간선 경로를 픽셀 정점 목록으로 해석
 *
 * 각 간선마다 from, to 좌표를 차례로 추가 (중복 정점 유지).
 *
 * @param path 간선 경로
 * @param points 현재 프레임의 랜드마크 픽셀 좌표
 * @param out_vertices 출력 정점 목록 (길이 = 2 * path.size())
 * @return Success 또는 LandmarkIndexOutOfRange
 */
FACEMASK_EXPORT ErrorCode resolveRegionVertices(const std::vector<LandmarkEdge>& path,
                                                const std::vector<LandmarkPoint>& points,
                                                std::vector<LandmarkPoint>& out_vertices);

} // namespace facemask

#endif // FACEMASK_FACE_REGIONS_H
