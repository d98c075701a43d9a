/**
 * @file video_io.cpp
 * @brief OpenCV 영상 입출력 구현
 */

#include "facemask/video_io.h"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "logging.h"

namespace facemask {

namespace {
    /// 출력 FPS 기본값
    constexpr double DEFAULT_OUTPUT_FPS = 30.0;

    /// 확장자별 fourcc (.avi는 OpenCV 내장 MJPEG, 그 외 mp4v)
    int fourccForPath(const std::string& path) {
        std::string ext = std::filesystem::path(path).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (ext == ".avi") {
            return cv::VideoWriter::fourcc('M', 'J', 'P', 'G');
        }
        return cv::VideoWriter::fourcc('m', 'p', '4', 'v');
    }
}

// ============================================================
// OpenCvVideoSource
// ============================================================

class OpenCvVideoSource::Impl {
public:
    cv::VideoCapture capture;
    std::string path;
    double position_ms = 0.0;
};

OpenCvVideoSource::OpenCvVideoSource()
    : impl_(std::make_unique<Impl>()) {
}

OpenCvVideoSource::~OpenCvVideoSource() {
    release();
}

ErrorCode OpenCvVideoSource::open(const std::string& path) {
    auto logger = detail::getLogger("facemask.video");
    release();

    if (path.empty() || !std::filesystem::is_regular_file(path)) {
        logger->error("input video not found: {}", path);
        return ErrorCode::InvalidPath;
    }

    try {
        if (!impl_->capture.open(path)) {
            logger->error("cannot open input video: {}", path);
            return ErrorCode::SourceOpenFailed;
        }
    } catch (const cv::Exception& e) {
        logger->error("OpenCV failed to open {}: {}", path, e.what());
        impl_->capture.release();
        return ErrorCode::SourceOpenFailed;
    }

    impl_->path = path;
    impl_->position_ms = 0.0;
    logger->debug("opened {} ({}x{}, {:.2f} fps)", path, width(), height(), fps());
    return ErrorCode::Success;
}

bool OpenCvVideoSource::read(cv::Mat& frame) {
    if (!impl_->capture.isOpened()) {
        return false;
    }

    try {
        if (!impl_->capture.read(frame) || frame.empty()) {
            return false;
        }
    } catch (const cv::Exception& e) {
        detail::getLogger("facemask.video")->error(
            "frame decode failed in {}: {}", impl_->path, e.what());
        return false;
    }

    impl_->position_ms = impl_->capture.get(cv::CAP_PROP_POS_MSEC);
    return true;
}

double OpenCvVideoSource::positionMs() const {
    return impl_->position_ms;
}

double OpenCvVideoSource::fps() const {
    if (!impl_->capture.isOpened()) {
        return 0.0;
    }
    return impl_->capture.get(cv::CAP_PROP_FPS);
}

bool OpenCvVideoSource::isOpened() const {
    return impl_->capture.isOpened();
}

void OpenCvVideoSource::release() {
    if (impl_ && impl_->capture.isOpened()) {
        impl_->capture.release();
    }
}

int OpenCvVideoSource::width() const {
    if (!impl_->capture.isOpened()) {
        return 0;
    }
    return static_cast<int>(impl_->capture.get(cv::CAP_PROP_FRAME_WIDTH));
}

int OpenCvVideoSource::height() const {
    if (!impl_->capture.isOpened()) {
        return 0;
    }
    return static_cast<int>(impl_->capture.get(cv::CAP_PROP_FRAME_HEIGHT));
}

// ============================================================
// OpenCvVideoSink
// ============================================================

class OpenCvVideoSink::Impl {
public:
    cv::VideoWriter writer;
    std::string path;
    double fps = DEFAULT_OUTPUT_FPS;
    cv::Size frame_size;
    int64_t frames_written = 0;
    bool configured = false;
};

OpenCvVideoSink::OpenCvVideoSink()
    : impl_(std::make_unique<Impl>()) {
}

OpenCvVideoSink::~OpenCvVideoSink() {
    release();
}

ErrorCode OpenCvVideoSink::open(const std::string& path, double fps) {
    release();

    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (path.empty() || (!parent.empty() && !std::filesystem::is_directory(parent))) {
        detail::getLogger("facemask.video")->error("output directory missing for {}", path);
        return ErrorCode::InvalidPath;
    }

    impl_->path = path;
    impl_->fps = fps > 0.0 ? fps : DEFAULT_OUTPUT_FPS;
    impl_->frame_size = cv::Size();
    impl_->frames_written = 0;
    impl_->configured = true;
    return ErrorCode::Success;
}

ErrorCode OpenCvVideoSink::write(const cv::Mat& frame) {
    auto logger = detail::getLogger("facemask.video");

    if (!impl_->configured) {
        return ErrorCode::NotInitialized;
    }
    if (frame.empty()) {
        return ErrorCode::EmptyFrame;
    }

    // 첫 프레임에서 writer 생성
    if (!impl_->writer.isOpened()) {
        try {
            const int fourcc = fourccForPath(impl_->path);
            if (!impl_->writer.open(impl_->path, fourcc, impl_->fps, frame.size(), true)) {
                logger->error("cannot create output video: {}", impl_->path);
                return ErrorCode::SinkOpenFailed;
            }
        } catch (const cv::Exception& e) {
            logger->error("OpenCV failed to create {}: {}", impl_->path, e.what());
            return ErrorCode::SinkOpenFailed;
        }
        impl_->frame_size = frame.size();
    }

    if (frame.size() != impl_->frame_size) {
        logger->error("frame size {}x{} differs from sink size {}x{}",
                      frame.cols, frame.rows,
                      impl_->frame_size.width, impl_->frame_size.height);
        return ErrorCode::FrameSizeMismatch;
    }

    impl_->writer.write(frame);
    ++impl_->frames_written;
    return ErrorCode::Success;
}

int64_t OpenCvVideoSink::framesWritten() const {
    return impl_->frames_written;
}

void OpenCvVideoSink::release() {
    if (!impl_) {
        return;
    }
    if (impl_->writer.isOpened()) {
        impl_->writer.release();
    }
    impl_->configured = false;
}

} // namespace facemask
