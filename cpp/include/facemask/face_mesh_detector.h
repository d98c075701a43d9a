/**
 * @file face_mesh_detector.h
 * @brief TFLite Face Mesh 기반 얼굴 랜드마크 검출기 선언
 *
 * TensorFlow Lite로 BlazeFace(short range) 얼굴 검출 모델과
 * Face Mesh 랜드마크 모델을 실행하는 LandmarkDetector 구현체
 */

#pragma once

#include "facemask/landmark_detector.h"
#include <memory>

namespace facemask {

/**
 * @brief TFLite Face Mesh 검출기
 *
 * 첫 번째 얼굴의 468개 랜드마크를 프레임 기준 정규화 좌표로 반환.
 *
 * @note TensorFlow Lite 런타임 필요 (FACEMASK_HAS_TFLITE).
 *       없이 빌드된 경우 initialize()는 항상 실패.
 * @note 모델 파일 필요:
 *       - face_detection_short_range.tflite
 *       - face_landmark.tflite
 */
class FACEMASK_EXPORT FaceMeshDetector : public LandmarkDetector {
public:
    FaceMeshDetector();
    ~FaceMeshDetector() override;

    // 복사/이동 금지 (Pimpl 사용)
    FaceMeshDetector(const FaceMeshDetector&) = delete;
    FaceMeshDetector& operator=(const FaceMeshDetector&) = delete;
    FaceMeshDetector(FaceMeshDetector&&) = delete;
    FaceMeshDetector& operator=(FaceMeshDetector&&) = delete;

    // ========================================
    // LandmarkDetector 인터페이스 구현
    // ========================================

    /**
     * @brief 검출기 초기화
     * @param model_path 모델 파일들이 있는 디렉토리 경로
     * @return 초기화 성공 여부
     */
    bool initialize(const std::string& model_path) override;

    /**
     * @brief 얼굴 랜드마크 검출
     * @param frame_bgr BGR 프레임
     * @return 검출 결과 (미초기화/빈 프레임이면 detected = false)
     */
    LandmarkResult detect(const cv::Mat& frame_bgr) override;

    void reset() override;
    void release() override;
    bool isInitialized() const override;
    DetectorType getDetectorType() const override;

    // ========================================
    // 검출 설정
    // ========================================

    /**
     * @brief 얼굴 검출 최소 신뢰도 설정
     * @param confidence 신뢰도 (0.0 ~ 1.0)
     */
    void setMinDetectionConfidence(float confidence);

    /**
     * @brief 랜드마크 모델 얼굴 존재 점수 최소값 설정
     * @param confidence 신뢰도 (0.0 ~ 1.0)
     */
    void setMinTrackingConfidence(float confidence);

    /**
     * @brief TFLite 추론 스레드 수 설정 (초기화 전 호출)
     * @param num_threads 스레드 수 (1 ~ 16)
     */
    void setNumThreads(int num_threads);

    /**
     * @brief 추적 모드 활성화/비활성화
     *
     * 활성화 시 직전 프레임 랜드마크 범위로 얼굴 검출을 생략.
     * 기본값: true
     */
    void setTrackingEnabled(bool enable);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace facemask
