/**
 * @file config.h
 * @brief 설정 값 정규화 및 검증
 *
 * 문자열/레거시 정수 코드를 열거형으로 변환하는 함수들.
 * 변환은 설정 시점에 한 번만 수행하고 프레임 처리 중에는 열거형만 사용.
 */

#ifndef FACEMASK_CONFIG_H
#define FACEMASK_CONFIG_H

#include <string>

#include "facemask/export.h"
#include "facemask/types.h"

namespace facemask {

/**
 * @brief 배치 처리 설정
 */
struct BatchConfig {
    std::string input_dir;                  ///< 입력 영상 디렉토리
    std::string output_dir;                 ///< 출력 루트 디렉토리
    std::string model_path;                 ///< TFLite 모델 디렉토리
    bool recurse_subdirectories = false;    ///< 하위 디렉토리 포함 여부
    double output_fps = 30.0;               ///< 출력 영상 FPS
};

// ========================================
// 문자열 → 열거형
// ========================================

/**
 * @brief 마스크 종류 파싱
 *
 * 대소문자 무시. "faceoutline"/"face_outline"/"outline"/"oval"/"1",
 * "faceskin"/"face_skin"/"skin"/"2", "facecheeks"/"face_cheeks"/"cheeks"/"3".
 *
 * @param text 입력 문자열
 * @param out 변환 결과
 * @return Success 또는 InvalidMaskType
 */
FACEMASK_EXPORT ErrorCode parseMaskType(const std::string& text, MaskType& out);

/**
 * @brief 색 공간 파싱 ("rgb", "hsv", "grayscale"/"gray"/"grey")
 * @return Success 또는 InvalidColorSpace
 */
FACEMASK_EXPORT ErrorCode parseColorSpace(const std::string& text, ColorSpace& out);

/**
 * @brief 색상 채널 파싱
 *
 * 대소문자 무시한 "red"/"green"/"blue" 또는 레거시 정수 코드
 * (3 = red, 4 = blue, 5 = green).
 *
 * @return Success 또는 InvalidFocusChannel
 */
FACEMASK_EXPORT ErrorCode parseFocusChannel(const std::string& text, FocusChannel& out);

/**
 * @brief 레거시 정수 코드로 색상 채널 변환 (3 = red, 4 = blue, 5 = green)
 */
FACEMASK_EXPORT ErrorCode focusChannelFromCode(int code, FocusChannel& out);

/**
 * @brief 얼굴 미검출 정책 파싱 ("skip", "blank")
 */
FACEMASK_EXPORT ErrorCode parseNoFacePolicy(const std::string& text, NoFacePolicy& out);

/**
 * @brief alpha 문자열 파싱 및 범위 검사
 * @return Success, InvalidParameter(숫자 아님) 또는 AlphaOutOfRange
 */
FACEMASK_EXPORT ErrorCode parseAlpha(const std::string& text, float& out);

// ========================================
// 검증
// ========================================

/**
 * @brief alpha 범위 검사 ([0, 1], NaN 거부)
 */
FACEMASK_EXPORT ErrorCode validateAlpha(float alpha);

/**
 * @brief 파이프라인 설정 전체 검증
 *
 * 프레임 처리 시작 전 한 번 호출. 열거형 범위와 alpha를 검사.
 */
FACEMASK_EXPORT ErrorCode validateConfig(const PipelineConfig& config);

// ========================================
// 열거형 → 문자열
// ========================================

FACEMASK_EXPORT const char* toString(MaskType type);
FACEMASK_EXPORT const char* toString(ColorSpace space);
FACEMASK_EXPORT const char* toString(FocusChannel channel);
FACEMASK_EXPORT const char* toString(RegionId region);

/**
 * @brief 에러 코드 이름 ("AlphaOutOfRange" 등)
 */
FACEMASK_EXPORT const char* errorCodeToString(ErrorCode code);

/**
 * @brief 에러 코드 분류 (번대 기준)
 */
FACEMASK_EXPORT ErrorCategory getErrorCategory(ErrorCode code);

} // namespace facemask

#endif // FACEMASK_CONFIG_H
