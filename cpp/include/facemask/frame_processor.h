/**
 * @file frame_processor.h
 * @brief 프레임 처리 파이프라인 선언
 *
 * 랜드마크 검출, 영역 마스크 합성, 격리/컬러 필터, 색상 통계를
 * 하나의 설정 기반 파이프라인으로 제공.
 */

#pragma once

#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include "facemask/export.h"
#include "facemask/types.h"

namespace facemask {

// 전방 선언
class LandmarkDetector;

/**
 * @brief 프레임 처리 결과
 *
 * error_code가 Success이면 output_frame이 채워진다.
 * NoFaceDetected는 오류가 아닌 스킵 조건.
 */
struct FACEMASK_EXPORT FrameResult {
    ErrorCode error_code = ErrorCode::Success;  ///< 처리 결과 코드
    bool face_detected = false;                 ///< 얼굴 검출 여부
    cv::Mat output_frame;                       ///< 출력 프레임 (BGR)
    cv::Mat region_mask;                        ///< 사용한 합성 마스크 (0/255)
    bool has_sample = false;                    ///< 색상 샘플 포함 여부
    ColorSample sample{};                       ///< 색상 샘플
    float processing_time_ms = 0.0f;            ///< 총 처리 시간 (밀리초)
    float detection_time_ms = 0.0f;             ///< 검출 시간 (밀리초)
};

/**
 * @brief 프레임 처리 파이프라인
 *
 * PipelineConfig의 mode에 따라:
 * - MaskIsolation: 합성 영역만 남기고 밝은 아티팩트 제거.
 *   extract_color_info가 true이면 원본 프레임의 합성 영역 평균 색상 샘플 포함.
 * - ColorFilter: 합성 영역에 filter_color 단색을 alpha로 블렌딩.
 *
 * @note Pimpl 패턴으로 구현 세부사항 은닉
 * @note 스레드 안전하지 않음 - 단일 스레드에서 사용
 *
 * 사용 예시:
 * @code
 * PipelineConfig config;
 * config.mask_type = MaskType::FaceSkin;
 * config.extract_color_info = true;
 *
 * FrameProcessor processor;
 * if (processor.initialize(config, "models/") != ErrorCode::Success) {
 *     return;
 * }
 *
 * FrameResult result = processor.processFrame(frame, position_ms);
 * if (result.error_code == ErrorCode::Success) {
 *     writer.write(result.output_frame);
 * }
 * @endcode
 */
class FACEMASK_EXPORT FrameProcessor {
public:
    FrameProcessor();
    ~FrameProcessor();

    // 복사 금지 (Pimpl 사용)
    FrameProcessor(const FrameProcessor&) = delete;
    FrameProcessor& operator=(const FrameProcessor&) = delete;

    // 이동 지원
    FrameProcessor(FrameProcessor&&) noexcept;
    FrameProcessor& operator=(FrameProcessor&&) noexcept;

    // ========================================
    // 초기화 및 해제
    // ========================================

    /**
     * @brief 초기화된 검출기로 프로세서 초기화
     *
     * 설정과 영역 정의를 검증한 뒤 검출기 소유권을 가져온다.
     *
     * @param config 파이프라인 설정
     * @param detector 초기화 완료된 검출기
     * @return Success, 설정 에러(200번대), InvalidParameter(검출기 없음)
     *         또는 NotInitialized(검출기 미초기화)
     */
    ErrorCode initialize(const PipelineConfig& config,
                         std::unique_ptr<LandmarkDetector> detector);

    /**
     * @brief 모델 디렉토리로 Face Mesh 검출기를 생성하여 초기화
     *
     * @param config 파이프라인 설정
     * @param model_path 모델 디렉토리 경로
     * @return Success, 설정 에러 또는 ModelLoadFailed
     */
    ErrorCode initialize(const PipelineConfig& config, const std::string& model_path);

    /**
     * @brief 리소스 해제
     */
    void release();

    bool isInitialized() const noexcept;

    /**
     * @brief 현재 설정
     */
    const PipelineConfig& config() const noexcept;

    // ========================================
    // 프레임 처리
    // ========================================

    /**
     * @brief 프레임 하나 처리
     *
     * @param frame BGR 프레임 (CV_8UC3, 변경하지 않음)
     * @param position_ms 프레임 재생 위치 (밀리초), 샘플 타임스탬프에 사용
     * @return 처리 결과
     */
    FrameResult processFrame(const cv::Mat& frame, double position_ms);

    /**
     * @brief 새 영상 시작 전 검출기 상태 초기화
     */
    void resetSequence();

    // ========================================
    // 통계
    // ========================================

    /**
     * @brief 마지막 처리 시간 (밀리초)
     */
    double getLastProcessingTimeMs() const noexcept;

    /**
     * @brief 평균 FPS (최근 30프레임 기준, 기록 없으면 0.0)
     */
    double getAverageFPS() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace facemask
