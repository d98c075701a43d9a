/**
 * @file landmark_detector.h
 * @brief 얼굴 랜드마크 검출기 추상 인터페이스
 *
 * Strategy 패턴을 사용하여 검출기 구현체를 교체 가능하게 함.
 * 파이프라인과 테스트는 이 인터페이스에만 의존.
 */

#ifndef FACEMASK_LANDMARK_DETECTOR_H
#define FACEMASK_LANDMARK_DETECTOR_H

#include <memory>
#include <string>
#include <vector>

#include "facemask/export.h"
#include "facemask/types.h"

// OpenCV 전방 선언
namespace cv { class Mat; }

namespace facemask {

/**
 * @brief 랜드마크 검출 결과
 *
 * detected가 true이면 landmarks는 FACE_LANDMARK_COUNT개의
 * 프레임 기준 정규화 좌표 (첫 번째 얼굴만).
 */
struct LandmarkResult {
    bool detected = false;                          ///< 얼굴 검출 여부
    float confidence = 0.0f;                        ///< 검출 신뢰도 (0.0~1.0)
    std::vector<NormalizedLandmark> landmarks;      ///< 468개 얼굴 랜드마크
};

/**
 * @brief 얼굴 랜드마크 검출기 추상 인터페이스
 *
 * 구현체:
 * - FaceMeshDetector (TFLite BlazeFace + Face Mesh)
 */
class FACEMASK_EXPORT LandmarkDetector {
public:
    /**
     * @brief 가상 소멸자
     */
    virtual ~LandmarkDetector() = default;

    /**
     * @brief 검출기 초기화
     * @param model_path 모델 디렉토리 경로
     * @return 초기화 성공 여부
     */
    virtual bool initialize(const std::string& model_path) = 0;

    /**
     * @brief 프레임에서 얼굴 랜드마크 검출
     * @param frame_bgr 입력 BGR 프레임 (CV_8UC3)
     * @return 검출 결과
     */
    virtual LandmarkResult detect(const cv::Mat& frame_bgr) = 0;

    /**
     * @brief 프레임 간 상태 초기화
     *
     * 새 영상을 시작할 때 호출. 이전 영상의 추적 상태를 버리고
     * 다음 detect()를 독립적인 첫 프레임으로 처리.
     */
    virtual void reset() = 0;

    /**
     * @brief 리소스 해제
     */
    virtual void release() = 0;

    /**
     * @brief 초기화 상태 확인
     */
    virtual bool isInitialized() const = 0;

    /**
     * @brief 검출기 종류 반환
     */
    virtual DetectorType getDetectorType() const = 0;

    // 복사 금지
    LandmarkDetector(const LandmarkDetector&) = delete;
    LandmarkDetector& operator=(const LandmarkDetector&) = delete;

    // 이동 금지
    LandmarkDetector(LandmarkDetector&&) = delete;
    LandmarkDetector& operator=(LandmarkDetector&&) = delete;

protected:
    LandmarkDetector() = default;
};

namespace detail {

/**
 * @brief 검출기 팩토리 함수
 * @param type 생성할 검출기 종류
 * @return 검출기 인스턴스 (알 수 없는 종류이면 nullptr)
 */
FACEMASK_EXPORT std::unique_ptr<LandmarkDetector> createDetector(DetectorType type);

/**
 * @brief 문자열로 검출기 생성
 * @param type_name 검출기 이름 ("facemesh", "face_mesh")
 */
FACEMASK_EXPORT std::unique_ptr<LandmarkDetector> createDetector(const std::string& type_name);

} // namespace detail

} // namespace facemask

#endif // FACEMASK_LANDMARK_DETECTOR_H
