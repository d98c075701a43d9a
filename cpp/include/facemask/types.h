/**
 * @file types.h
 * @brief FaceMask SDK 핵심 데이터 타입 정의
 *
 * 얼굴 영역 마스킹 및 색상 통계 파이프라인 전반에서 사용되는 기본 데이터 구조체.
 * OpenCV 의존성 없는 POD 타입으로 유지.
 */

#ifndef FACEMASK_TYPES_H
#define FACEMASK_TYPES_H

#include <cstdint>

namespace facemask {

// ============================================================
// 상수 정의
// ============================================================

/// MediaPipe Face Mesh 랜드마크 개수 (인덱스 범위: 0 ~ 467)
constexpr int FACE_LANDMARK_COUNT = 468;

/// ColorSample 최대 채널 수
constexpr int MAX_SAMPLE_CHANNELS = 3;

// ============================================================
// 열거형 정의
// ============================================================

/**
 * @brief 마스크 종류 열거형
 * 파이프라인이 출력할 합성 영역 선택
 */
enum class MaskType : int {
    FaceOutline = 1,    ///< 얼굴 윤곽(oval) 전체
    FaceSkin = 2,       ///< 윤곽 - (왼쪽 눈 + 오른쪽 눈 + 입술)
    FaceCheeks = 3      ///< 왼쪽 볼 + 오른쪽 볼
};

/**
 * @brief 색상 통계 추출에 사용할 색 공간
 */
enum class ColorSpace : int {
    RGB = 0,        ///< (Red, Green, Blue)
    HSV = 1,        ///< (Hue, Saturation, Value), 8비트 Hue 0~179
    Grayscale = 2   ///< (Luma)
};

/**
 * @brief 관심 색상 채널 (극값 추적 및 컬러 필터용)
 */
enum class FocusChannel : int {
    Red = 0,
    Green = 1,
    Blue = 2
};

/**
 * @brief 고정 얼굴 영역 식별자
 * face_regions.h의 랜드마크 인덱스 테이블과 1:1 대응
 */
enum class RegionId : int {
    LeftEye = 0,
    RightEye = 1,
    LeftCheek = 2,
    RightCheek = 3,
    Lips = 4,
    FaceOval = 5
};

/// RegionId 개수
constexpr int REGION_COUNT = 6;

/**
 * @brief 파이프라인 동작 모드
 */
enum class PipelineMode : int {
    MaskIsolation = 0,  ///< 영역만 남기고 나머지 제거 (+ 색상 통계)
    ColorFilter = 1     ///< 영역에 단색 알파 블렌딩
};

/**
 * @brief 얼굴 미검출 프레임 처리 정책
 */
enum class NoFacePolicy : int {
    Skip = 0,       ///< 프레임 소비 후 출력 없음
    EmitBlank = 1   ///< 검은 프레임과 무효 샘플 행 출력 (출력 길이 유지)
};

/**
 * @brief 에러 코드 열거형
 * SDK 작업 결과 상태
 */
enum class ErrorCode : int {
    // 성공
    Success = 0,

    // 100번대: 리소스 에러
    NotInitialized = 100,       ///< 초기화되지 않음
    AlreadyInitialized = 101,   ///< 이미 초기화됨
    ModelLoadFailed = 102,      ///< 모델 로드 실패
    InvalidPath = 103,          ///< 잘못된 경로
    SourceOpenFailed = 104,     ///< 입력 영상 열기 실패
    SinkOpenFailed = 105,       ///< 출력 영상 생성 실패
    SampleFileOpenFailed = 106, ///< CSV 파일 생성 실패
    SampleFileWriteFailed = 107, ///< CSV 파일 쓰기 실패

    // 200번대: 설정 에러
    InvalidParameter = 200,             ///< 잘못된 파라미터
    InvalidMaskType = 201,              ///< 알 수 없는 마스크 종류
    InvalidColorSpace = 202,            ///< 알 수 없는 색 공간
    InvalidFocusChannel = 203,          ///< 알 수 없는 색상 채널
    AlphaOutOfRange = 204,              ///< alpha가 [0, 1] 범위 밖
    MalformedRegionDefinition = 205,    ///< 닫힌 경로를 만들 수 없는 인덱스 목록
    LandmarkIndexOutOfRange = 206,      ///< 랜드마크 개수를 넘는 인덱스

    // 300번대: 검출 에러
    DetectionFailed = 300,      ///< 검출 실패
    NoFaceDetected = 301,       ///< 얼굴 미검출 (프레임 스킵 조건)

    // 400번대: 영역 에러
    InvalidRegion = 400,        ///< 퇴화된 다각형 (고유 정점 3개 미만)
    FrameSizeMismatch = 401,    ///< 마스크/프레임 크기 불일치
    EmptyFrame = 402,           ///< 빈 프레임

    // 일반 에러
    Unknown = 999               ///< 알 수 없는 에러
};

/**
 * @brief 에러 분류
 * ErrorCode 번대와 대응
 */
enum class ErrorCategory : int {
    None = 0,
    Resource = 1,
    Configuration = 2,
    Detection = 3,
    InvalidRegion = 4,
    Unknown = 5
};

/**
 * @brief 랜드마크 검출기 종류
 */
enum class DetectorType : int {
    Unknown = 0,    ///< 알 수 없음
    FaceMesh = 1    ///< TFLite BlazeFace + Face Mesh
};

// ============================================================
// 기본 데이터 구조체
// ============================================================

/**
 * @brief 정규화 랜드마크 좌표 (0.0~1.0)
 * POD 타입
 */
struct NormalizedLandmark {
    float x;    ///< X 좌표 (정규화)
    float y;    ///< Y 좌표 (정규화)
    float z;    ///< 깊이 (상대값)
};

/**
 * @brief 픽셀 좌표 랜드마크
 * 정규화 좌표에 프레임 크기를 곱한 뒤 정수로 절삭한 값
 */
struct LandmarkPoint {
    int x;
    int y;
};

/**
 * @brief 랜드마크 인덱스 간 간선
 */
struct LandmarkEdge {
    int from;
    int to;
};

/**
 * @brief 8비트 BGR 픽셀 색상
 */
struct PixelColor {
    uint8_t b;
    uint8_t g;
    uint8_t r;
};

/**
 * @brief 프레임별 평균 색상 샘플
 *
 * channel_count: RGB/HSV = 3, Grayscale = 1.
 * 마스크 픽셀이 0개이면 valid = false, channels는 NaN.
 */
struct ColorSample {
    double timestamp_sec;                   ///< 프레임 재생 위치 (초)
    int channel_count;                      ///< 유효 채널 수 (1~3)
    double channels[MAX_SAMPLE_CHANNELS];   ///< 채널 평균값
    int pixel_count;                        ///< 평균에 포함된 픽셀 수
    bool valid;                             ///< 평균 정의 여부
};

/**
 * @brief 영상 전체의 단일 채널 극값 기록
 *
 * has_min/has_max가 false이면 해당 극값은 초기 센티널을 넘지 못한 것.
 */
struct ExtremumRecord {
    bool has_min;
    bool has_max;
    PixelColor min_color;       ///< 최소값 위치의 전체 BGR 색상
    PixelColor max_color;       ///< 최대값 위치의 전체 BGR 색상
    int min_value;              ///< 관심 채널 최소값
    int max_value;              ///< 관심 채널 최대값
    LandmarkPoint min_location; ///< 최소값 픽셀 위치
    LandmarkPoint max_location; ///< 최대값 픽셀 위치
    int64_t min_frame_index;    ///< 최소값이 기록된 프레임 번호 (0부터)
    int64_t max_frame_index;    ///< 최대값이 기록된 프레임 번호 (0부터)
};

/**
 * @brief 파이프라인 설정
 * 기본값은 생성 시 설정
 */
struct PipelineConfig {
    PipelineMode mode = PipelineMode::MaskIsolation;
    MaskType mask_type = MaskType::FaceSkin;
    ColorSpace color_space = ColorSpace::RGB;
    bool extract_color_info = false;                ///< 색상 통계 CSV 출력 여부
    FocusChannel filter_color = FocusChannel::Red;  ///< ColorFilter 모드 색상
    float alpha = 0.15f;                            ///< ColorFilter 모드 불투명도 (0.0~1.0)
    NoFacePolicy no_face_policy = NoFacePolicy::Skip;
};

} // namespace facemask

#endif // FACEMASK_TYPES_H
