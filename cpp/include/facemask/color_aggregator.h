/**
 * @file color_aggregator.h
 * @brief 마스크 영역 평균 색상 추출
 */

#ifndef FACEMASK_COLOR_AGGREGATOR_H
#define FACEMASK_COLOR_AGGREGATOR_H

#include "facemask/export.h"
#include "facemask/types.h"

// OpenCV 전방 선언
namespace cv { class Mat; }

namespace facemask {

/**
 * @brief 색 공간별 채널 수 (RGB/HSV = 3, Grayscale = 1)
 */
FACEMASK_EXPORT int channelCount(ColorSpace space);

/**
 * @brief 마스크 영역 평균 색상 계산
 *
 * 프레임 전체를 먼저 대상 색 공간으로 변환한 뒤, 마스크가 0이 아닌
 * 픽셀만으로 채널별 산술 평균을 계산한다. 마스크 밖 픽셀은 평균에서 제외.
 *
 * 채널 순서: RGB → (R, G, B), HSV → (H, S, V), Grayscale → (Luma).
 * 마스크 픽셀이 0개이면 valid = false, channels = NaN.
 *
 * @param frame_bgr 원본 BGR 프레임 (CV_8UC3)
 * @param mask 단일 채널 마스크 (frame과 같은 크기)
 * @param space 색 공간
 * @param timestamp_sec 프레임 재생 위치 (초)
 * @return 색상 샘플 (입력 크기 불일치 시에도 valid = false)
 */
FACEMASK_EXPORT ColorSample computeColorSample(const cv::Mat& frame_bgr,
                                               const cv::Mat& mask,
                                               ColorSpace space,
                                               double timestamp_sec);

/**
 * @brief 무효 샘플 생성 (채널 NaN)
 */
FACEMASK_EXPORT ColorSample makeInvalidSample(ColorSpace space, double timestamp_sec);

} // namespace facemask

#endif // FACEMASK_COLOR_AGGREGATOR_H
