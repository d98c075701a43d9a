/**
 * @file overlay_blender.h
 * @brief 얼굴 영역 단색 알파 블렌딩 (컬러 필터)
 */

#ifndef FACEMASK_OVERLAY_BLENDER_H
#define FACEMASK_OVERLAY_BLENDER_H

#include "facemask/export.h"
#include "facemask/types.h"

// OpenCV 전방 선언
namespace cv { class Mat; }

namespace facemask {

/**
 * @brief 관심 채널에 해당하는 BGR 칠 색상
 *
 * Red → (0, 0, 255), Green → (0, 255, 0), Blue → (255, 0, 0)
 */
FACEMASK_EXPORT PixelColor colorForChannel(FocusChannel channel);

/**
 * @brief 마스크 영역에 단색 오버레이 합성
 *
 * 1. smoothMask()로 마스크 정리
 * 2. 마스크 픽셀: out = trunc(alpha * color + (1 - alpha) * frame), 채널별
 * 3. 마스크 밖 픽셀: 원본 그대로
 *
 * 예: alpha 0.5, 픽셀 (100, 100, 100), 색상 (0, 0, 255) → (50, 50, 177)
 *
 * @param frame BGR 프레임 (CV_8UC3)
 * @param mask 단일 채널 마스크 (frame과 같은 크기)
 * @param color 칠 색상 (BGR)
 * @param alpha 불투명도 [0.0, 1.0]
 * @param out_frame 출력 프레임 (새 Mat)
 * @return Success, AlphaOutOfRange, EmptyFrame 또는 FrameSizeMismatch
 */
FACEMASK_EXPORT ErrorCode blendOverlay(const cv::Mat& frame,
                                       const cv::Mat& mask,
                                       const PixelColor& color,
                                       float alpha,
                                       cv::Mat& out_frame);

} // namespace facemask

#endif // FACEMASK_OVERLAY_BLENDER_H
