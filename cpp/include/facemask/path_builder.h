/**
 * @file path_builder.h
 * @brief 랜드마크 인덱스 목록 → 닫힌 간선 경로 변환
 */

#ifndef FACEMASK_PATH_BUILDER_H
#define FACEMASK_PATH_BUILDER_H

#include <vector>

#include "facemask/export.h"
#include "facemask/types.h"

namespace facemask {

/**
 * @brief 닫힌 인덱스 목록으로부터 연결된 간선 경로 생성
 *
 * 연속된 두 인덱스 (indices[i], indices[i+1])를 후보 간선으로 만들고,
 * 첫 번째 후보 간선에서 출발하여 현재 간선의 to와 같은 from을 가진
 * 후보 간선을 차례로 이어 붙인다. 후보 간선 개수만큼 반복하므로
 * 결과는 두 번째 후보 간선에서 시작해 첫 번째 후보 간선으로 끝난다.
 * 같은 from을 가진 후보가 여럿이면 경로가 모호하므로 잘못된 정의로 처리.
 * 각 후보 간선은 결과에 정확히 한 번 나타남.
 *
 * @param indices 닫힌 인덱스 목록 (첫 값 == 마지막 값, 고유 정점 3개 이상)
 * @param out_path 출력 간선 경로 (후보 간선 개수와 같은 길이)
 * @return Success 또는 MalformedRegionDefinition
 *
 * @note out_path는 실패 시 비어 있음
 */
FACEMASK_EXPORT ErrorCode buildEdgePath(const std::vector<int>& indices,
                                        std::vector<LandmarkEdge>& out_path);

/**
 * @brief 간선 경로가 하나의 닫힌 고리인지 검사
 *
 * 모든 i에 대해 path[i].to == path[i+1].from 이고
 * 마지막 간선의 to가 첫 간선의 from과 같으면 true.
 */
FACEMASK_EXPORT bool isClosedPath(const std::vector<LandmarkEdge>& path);

} // namespace facemask

#endif // FACEMASK_PATH_BUILDER_H
