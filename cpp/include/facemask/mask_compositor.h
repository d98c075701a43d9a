/**
 * @file mask_compositor.h
 * @brief 영역 마스크 합성 (합집합 + 차집합)
 *
 * 합성 규칙(recipe)은 고정 테이블:
 * - faceOutline = faceOval
 * - faceSkin    = faceOval - leftEye - rightEye - lips
 * - faceCheeks  = leftCheek + rightCheek
 */

#ifndef FACEMASK_MASK_COMPOSITOR_H
#define FACEMASK_MASK_COMPOSITOR_H

#include <map>
#include <vector>

#include <opencv2/core.hpp>

#include "facemask/export.h"
#include "facemask/types.h"

namespace facemask {

/// 영역별 마스크 모음 (한 프레임 범위)
using RegionMaskSet = std::map<RegionId, cv::Mat>;

/**
 * @brief 합성 규칙
 */
struct CompositeRecipe {
    const char* name;                   ///< 합성 영역 이름
    std::vector<RegionId> include;      ///< 합집합으로 더할 영역
    std::vector<RegionId> exclude;      ///< 순서대로 제거할 영역
};

/**
 * @brief 마스크 종류에 해당하는 합성 규칙
 */
FACEMASK_EXPORT const CompositeRecipe& getCompositeRecipe(MaskType type);

/**
 * @brief 합성에 필요한 기본 영역 목록 (include + exclude)
 */
FACEMASK_EXPORT std::vector<RegionId> requiredRegions(MaskType type);

/**
 * @brief 합성 규칙 적용
 *
 * 0으로 시작하여 include 마스크를 OR, exclude 마스크를 순서대로 AND-NOT.
 *
 * @param recipe 합성 규칙
 * @param masks 현재 프레임의 영역 마스크
 * @param out_mask 출력 마스크 (CV_8UC1, 0/255)
 * @return Success, InvalidRegion(필요 마스크 누락) 또는 FrameSizeMismatch
 */
FACEMASK_EXPORT ErrorCode composeRegion(const CompositeRecipe& recipe,
                                        const RegionMaskSet& masks,
                                        cv::Mat& out_mask);

/**
 * @brief 마스크 종류로 합성
 */
FACEMASK_EXPORT ErrorCode composeRegion(MaskType type,
                                        const RegionMaskSet& masks,
                                        cv::Mat& out_mask);

/**
 * @brief 마스크에서 다른 마스크 영역 제거 (a AND NOT b)
 * @return 새 마스크 (입력 불변)
 */
FACEMASK_EXPORT cv::Mat subtractMask(const cv::Mat& base, const cv::Mat& removal);

} // namespace facemask

#endif // FACEMASK_MASK_COMPOSITOR_H
