/**
 * @file video_processor.h
 * @brief 영상 단위 및 디렉토리 단위 일괄 처리
 *
 * 출력 구조 (output_dir 기준):
 * - MaskIsolation: Video_Output/<stem>_masked.mp4
 *                  CSV_Output/<stem>_<RGB|HSV|GRAYSCALE>.csv (extract_color_info)
 * - ColorFilter:   <stem>_color_filter.mp4
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "facemask/config.h"
#include "facemask/export.h"
#include "facemask/types.h"

namespace facemask {

// 전방 선언
class LandmarkDetector;
class SampleWriter;
class VideoSink;
class VideoSource;

/// 마스크 영상 출력 하위 디렉토리
constexpr const char* VIDEO_OUTPUT_DIR = "Video_Output";

/// 색상 샘플 출력 하위 디렉토리
constexpr const char* CSV_OUTPUT_DIR = "CSV_Output";

/**
 * @brief 영상 하나의 처리 결과
 */
struct FACEMASK_EXPORT VideoReport {
    std::string input_path;             ///< 입력 파일 (processVideo는 빈 문자열)
    std::string output_path;            ///< 출력 영상 파일
    std::string sample_path;            ///< CSV 파일 (없으면 빈 문자열)
    int64_t frames_read = 0;            ///< 입력에서 읽은 프레임 수
    int64_t frames_written = 0;         ///< 출력에 기록한 프레임 수 (빈 프레임 포함)
    int64_t frames_skipped = 0;         ///< 얼굴 미검출/퇴화 영역 프레임 수
    int64_t samples_written = 0;        ///< CSV 데이터 행 수
    ErrorCode error_code = ErrorCode::Success;
};

/**
 * @brief 영상 처리기
 *
 * FrameProcessor로 프레임을 순서대로 처리하여 VideoSink와 SampleWriter에 기록.
 * 얼굴 미검출 프레임은 NoFacePolicy에 따라 처리:
 * - Skip: 출력 없음
 * - EmitBlank: 검은 프레임(컬러 필터 모드는 원본 프레임)과 nan 샘플 행
 *
 * @note 스레드 안전하지 않음
 */
class FACEMASK_EXPORT VideoProcessor {
public:
    VideoProcessor();
    ~VideoProcessor();

    // 복사 금지 (Pimpl 사용)
    VideoProcessor(const VideoProcessor&) = delete;
    VideoProcessor& operator=(const VideoProcessor&) = delete;

    /**
     * @brief 초기화된 검출기로 초기화
     * @return FrameProcessor::initialize와 동일
     */
    ErrorCode initialize(const PipelineConfig& config,
                         std::unique_ptr<LandmarkDetector> detector);

    /**
     * @brief 모델 디렉토리로 초기화
     */
    ErrorCode initialize(const PipelineConfig& config, const std::string& model_path);

    void release();
    bool isInitialized() const noexcept;

    /**
     * @brief 열린 입력/출력으로 영상 하나 처리
     *
     * @param source 열린 입력
     * @param sink 출력
     * @param samples 색상 샘플 기록기 (nullptr이면 샘플 기록 안 함)
     * @return 처리 결과 (입력이 열리지 않았으면 NotInitialized)
     */
    VideoReport processVideo(VideoSource& source, VideoSink& sink, SampleWriter* samples);

    /**
     * @brief 영상 파일 하나 처리
     *
     * 출력 하위 디렉토리가 없으면 생성.
     *
     * @param input_path 입력 영상 파일
     * @param output_dir 출력 루트 디렉토리 (존재해야 함)
     * @param output_fps 출력 FPS
     * @return 처리 결과 (InvalidPath, SourceOpenFailed, SampleFileOpenFailed 등)
     */
    VideoReport processFile(const std::string& input_path,
                            const std::string& output_dir,
                            double output_fps = 30.0);

    /**
     * @brief 디렉토리의 모든 영상 처리
     *
     * 일반 파일을 경로 순으로 정렬하여 처리. 파일 단위 실패는 해당
     * VideoReport에 기록되고 다음 파일을 계속 처리.
     *
     * @param batch 배치 설정
     * @param out_reports 파일별 처리 결과
     * @return Success, NotInitialized 또는 InvalidPath (입력/출력 디렉토리 없음)
     */
    ErrorCode processDirectory(const BatchConfig& batch, std::vector<VideoReport>& out_reports);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief 입력 디렉토리의 일반 파일 목록 (정렬)
 * @param input_dir 입력 디렉토리
 * @param recursive 하위 디렉토리 포함 여부
 * @param out_files 출력 파일 경로 목록
 * @return Success 또는 InvalidPath
 */
FACEMASK_EXPORT ErrorCode listInputFiles(const std::string& input_dir,
                                         bool recursive,
                                         std::vector<std::string>& out_files);

/**
 * @brief 입력 파일에 대한 출력 영상 경로
 */
FACEMASK_EXPORT std::string outputVideoPath(const std::string& input_path,
                                            const std::string& output_dir,
                                            PipelineMode mode);

/**
 * @brief 입력 파일에 대한 CSV 경로
 */
FACEMASK_EXPORT std::string sampleFilePath(const std::string& input_path,
                                           const std::string& output_dir,
                                           ColorSpace space);

} // namespace facemask
