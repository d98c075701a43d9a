/**
 * @file artifact_cleaner.h
 * @brief 마스크 경계 래스터화/반사광 아티팩트 제거
 */

#ifndef FACEMASK_ARTIFACT_CLEANER_H
#define FACEMASK_ARTIFACT_CLEANER_H

#include "facemask/export.h"

// OpenCV 전방 선언
namespace cv { class Mat; }

namespace facemask {

/// 아티팩트로 간주할 휘도 하한 (포함)
constexpr int ARTIFACT_LUMA_MIN = 220;

/// 아티팩트로 간주할 휘도 상한 (포함)
constexpr int ARTIFACT_LUMA_MAX = 255;

/// 형태학 연산 구조 요소 크기
constexpr int MORPH_KERNEL_SIZE = 3;

/**
 * @brief 마스크 영역만 남긴 프레임 복사본
 * @param frame BGR 프레임 (CV_8UC3)
 * @param mask 단일 채널 마스크 (0이 아닌 픽셀 포함)
 * @return 마스크 밖 픽셀이 0인 새 프레임
 */
FACEMASK_EXPORT cv::Mat isolateRegion(const cv::Mat& frame, const cv::Mat& mask);

/**
 * @brief 밝은 아티팩트 제거
 *
 * 휘도(BGR→Gray)가 [ARTIFACT_LUMA_MIN, ARTIFACT_LUMA_MAX]인 픽셀의
 * 세 채널을 모두 0으로 만든다. 두 번 적용해도 결과 동일.
 *
 * @param frame BGR 프레임 (마스크 밖은 이미 0)
 * @return 정리된 새 프레임 (빈 입력이면 빈 Mat)
 */
FACEMASK_EXPORT cv::Mat removeBrightArtifacts(const cv::Mat& frame);

/**
 * @brief 마스크 평활화: 3x3 사각 구조 요소로 열림 후 닫힘
 * @param mask 단일 채널 마스크
 * @return 정리된 새 마스크
 */
FACEMASK_EXPORT cv::Mat smoothMask(const cv::Mat& mask);

} // namespace facemask

#endif // FACEMASK_ARTIFACT_CLEANER_H
