/**
 * @file video_io.h
 * @brief 영상 입출력 추상 인터페이스 및 OpenCV 구현체
 *
 * 파이프라인은 VideoSource/VideoSink 인터페이스에만 의존.
 * 테스트는 메모리 기반 구현체로 코덱 없이 파이프라인을 구동.
 */

#ifndef FACEMASK_VIDEO_IO_H
#define FACEMASK_VIDEO_IO_H

#include <memory>
#include <string>

#include "facemask/export.h"
#include "facemask/types.h"

// OpenCV 전방 선언
namespace cv { class Mat; }

namespace facemask {

/**
 * @brief 순차 프레임 입력 인터페이스
 */
class FACEMASK_EXPORT VideoSource {
public:
    virtual ~VideoSource() = default;

    /**
     * @brief 다음 프레임 읽기
     * @param frame 출력 BGR 프레임
     * @return 프레임을 읽었으면 true, 스트림 끝 또는 읽기 실패 시 false
     */
    virtual bool read(cv::Mat& frame) = 0;

    /**
     * @brief 마지막으로 읽은 프레임의 재생 위치 (밀리초)
     */
    virtual double positionMs() const = 0;

    /**
     * @brief 프레임 속도 (알 수 없으면 0)
     */
    virtual double fps() const = 0;

    /**
     * @brief 열림 상태
     */
    virtual bool isOpened() const = 0;

    /**
     * @brief 리소스 해제
     */
    virtual void release() = 0;

    VideoSource(const VideoSource&) = delete;
    VideoSource& operator=(const VideoSource&) = delete;

protected:
    VideoSource() = default;
};

/**
 * @brief 순차 프레임 출력 인터페이스
 *
 * 프레임 크기는 첫 write()에서 고정.
 */
class FACEMASK_EXPORT VideoSink {
public:
    virtual ~VideoSink() = default;

    /**
     * @brief 프레임 쓰기
     * @return Success, SinkOpenFailed 또는 FrameSizeMismatch
     */
    virtual ErrorCode write(const cv::Mat& frame) = 0;

    /**
     * @brief 기록한 프레임 수
     */
    virtual int64_t framesWritten() const = 0;

    /**
     * @brief 리소스 해제
     */
    virtual void release() = 0;

    VideoSink(const VideoSink&) = delete;
    VideoSink& operator=(const VideoSink&) = delete;

protected:
    VideoSink() = default;
};

// ============================================================
// OpenCV 구현체
// ============================================================

/**
 * @brief cv::VideoCapture 기반 입력
 */
class FACEMASK_EXPORT OpenCvVideoSource : public VideoSource {
public:
    OpenCvVideoSource();
    ~OpenCvVideoSource() override;

    /**
     * @brief 영상 파일 열기
     * @param path 파일 경로
     * @return Success, InvalidPath 또는 SourceOpenFailed
     */
    ErrorCode open(const std::string& path);

    bool read(cv::Mat& frame) override;
    double positionMs() const override;
    double fps() const override;
    bool isOpened() const override;
    void release() override;

    /**
     * @brief 프레임 크기 (열리지 않았으면 0)
     */
    int width() const;
    int height() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief cv::VideoWriter 기반 출력
 *
 * open()은 경로와 FPS만 기록하고, 실제 writer는 첫 프레임 크기로 생성.
 */
class FACEMASK_EXPORT OpenCvVideoSink : public VideoSink {
public:
    OpenCvVideoSink();
    ~OpenCvVideoSink() override;

    /**
     * @brief 출력 파일 설정
     * @param path 출력 파일 경로 (.avi는 fourcc MJPG, 그 외 mp4v)
     * @param fps 출력 FPS (0 이하이면 30)
     * @return Success 또는 InvalidPath (상위 디렉토리 없음)
     */
    ErrorCode open(const std::string& path, double fps);

    ErrorCode write(const cv::Mat& frame) override;
    int64_t framesWritten() const override;
    void release() override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace facemask

#endif // FACEMASK_VIDEO_IO_H
