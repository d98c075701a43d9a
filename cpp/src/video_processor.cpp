/**
 * @file video_processor.cpp
 * @brief 영상/디렉토리 일괄 처리 구현
 */

#include "facemask/video_processor.h"
#include "facemask/color_aggregator.h"
#include "facemask/frame_processor.h"
#include "facemask/landmark_detector.h"
#include "facemask/sample_writer.h"
#include "facemask/video_io.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <opencv2/core.hpp>

#include "logging.h"

namespace fs = std::filesystem;

namespace facemask {

namespace {

/// 프레임 단위로 건너뛰는 결과 코드
bool isSkippableFrame(ErrorCode code) {
    return code == ErrorCode::NoFaceDetected || code == ErrorCode::InvalidRegion;
}

bool ensureDirectory(const fs::path& dir) {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        return true;
    }
    fs::create_directories(dir, ec);
    if (ec) {
        detail::getLogger("facemask.batch")->error(
            "cannot create directory {}: {}", dir.string(), ec.message());
        return false;
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// 경로 함수
// ============================================================================

ErrorCode listInputFiles(const std::string& input_dir,
                         bool recursive,
                         std::vector<std::string>& out_files) {
    out_files.clear();

    std::error_code ec;
    if (input_dir.empty() || !fs::is_directory(input_dir, ec)) {
        return ErrorCode::InvalidPath;
    }

    if (recursive) {
        for (fs::recursive_directory_iterator it(input_dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file(ec)) {
                out_files.push_back(it->path().string());
            }
        }
    } else {
        for (fs::directory_iterator it(input_dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file(ec)) {
                out_files.push_back(it->path().string());
            }
        }
    }

    if (ec) {
        detail::getLogger("facemask.batch")->error(
            "cannot list {}: {}", input_dir, ec.message());
        return ErrorCode::InvalidPath;
    }

    std::sort(out_files.begin(), out_files.end());
    return ErrorCode::Success;
}

std::string outputVideoPath(const std::string& input_path,
                            const std::string& output_dir,
                            PipelineMode mode) {
    const std::string stem = fs::path(input_path).stem().string();
    if (mode == PipelineMode::ColorFilter) {
        return (fs::path(output_dir) / (stem + "_color_filter.mp4")).string();
    }
    return (fs::path(output_dir) / VIDEO_OUTPUT_DIR / (stem + "_masked.mp4")).string();
}

std::string sampleFilePath(const std::string& input_path,
                           const std::string& output_dir,
                           ColorSpace space) {
    const std::string stem = fs::path(input_path).stem().string();
    return (fs::path(output_dir) / CSV_OUTPUT_DIR /
            (stem + "_" + sampleFileSuffix(space) + ".csv")).string();
}

// ============================================================================
// Impl 클래스 정의
// ============================================================================

class VideoProcessor::Impl {
public:
    FrameProcessor processor;

    bool writesSamples() const {
        const PipelineConfig& config = processor.config();
        return config.mode == PipelineMode::MaskIsolation && config.extract_color_info;
    }

    VideoReport processVideo(VideoSource& source, VideoSink& sink, SampleWriter* samples);
    VideoReport processFile(const std::string& input_path, const std::string& output_dir,
                            double output_fps);

private:
    ErrorCode emitBlank(const cv::Mat& frame, double position_ms,
                        VideoSink& sink, SampleWriter* samples, VideoReport& report);
};

ErrorCode VideoProcessor::Impl::emitBlank(const cv::Mat& frame, double position_ms,
                                          VideoSink& sink, SampleWriter* samples,
                                          VideoReport& report) {
    const PipelineConfig& config = processor.config();

    // 컬러 필터는 원본 유지, 격리 모드는 검은 프레임
    const cv::Mat blank = config.mode == PipelineMode::ColorFilter
        ? frame
        : cv::Mat(cv::Mat::zeros(frame.size(), frame.type()));

    const ErrorCode write_code = sink.write(blank);
    if (write_code != ErrorCode::Success) {
        return write_code;
    }
    ++report.frames_written;

    if (samples && samples->isOpen() && writesSamples()) {
        const ErrorCode sample_code = samples->write(
            makeInvalidSample(config.color_space, position_ms / 1000.0));
        if (sample_code != ErrorCode::Success) {
            return sample_code;
        }
        ++report.samples_written;
    }
    return ErrorCode::Success;
}

VideoReport VideoProcessor::Impl::processVideo(VideoSource& source, VideoSink& sink,
                                               SampleWriter* samples) {
    auto logger = detail::getLogger("facemask.pipeline");
    VideoReport report;

    if (!processor.isInitialized() || !source.isOpened()) {
        report.error_code = ErrorCode::NotInitialized;
        return report;
    }

    // 이전 영상의 추적 상태를 가져오지 않음
    processor.resetSequence();

    const PipelineConfig& config = processor.config();
    cv::Mat frame;

    while (source.read(frame)) {
        ++report.frames_read;
        const double position_ms = source.positionMs();

        FrameResult result = processor.processFrame(frame, position_ms);

        if (isSkippableFrame(result.error_code)) {
            ++report.frames_skipped;
            logger->debug("frame {} skipped: {}", report.frames_read - 1,
                          errorCodeToString(result.error_code));

            if (config.no_face_policy == NoFacePolicy::EmitBlank) {
                const ErrorCode blank_code = emitBlank(frame, position_ms, sink, samples, report);
                if (blank_code != ErrorCode::Success) {
                    report.error_code = blank_code;
                    break;
                }
            }
            continue;
        }

        if (result.error_code != ErrorCode::Success) {
            logger->error("frame {} failed: {}", report.frames_read - 1,
                          errorCodeToString(result.error_code));
            report.error_code = result.error_code;
            break;
        }

        const ErrorCode write_code = sink.write(result.output_frame);
        if (write_code != ErrorCode::Success) {
            report.error_code = write_code;
            break;
        }
        ++report.frames_written;

        if (samples && samples->isOpen() && result.has_sample) {
            const ErrorCode sample_code = samples->write(result.sample);
            if (sample_code != ErrorCode::Success) {
                report.error_code = sample_code;
                break;
            }
            ++report.samples_written;
        }
    }

    if (report.frames_skipped > 0) {
        logger->warn("{} of {} frames had no usable face", report.frames_skipped,
                     report.frames_read);
    }
    return report;
}

VideoReport VideoProcessor::Impl::processFile(const std::string& input_path,
                                              const std::string& output_dir,
                                              double output_fps) {
    auto logger = detail::getLogger("facemask.batch");
    VideoReport report;
    report.input_path = input_path;

    if (!processor.isInitialized()) {
        report.error_code = ErrorCode::NotInitialized;
        return report;
    }

    std::error_code ec;
    if (output_dir.empty() || !fs::is_directory(output_dir, ec)) {
        logger->error("output directory not found: {}", output_dir);
        report.error_code = ErrorCode::InvalidPath;
        return report;
    }

    const PipelineConfig& config = processor.config();
    report.output_path = outputVideoPath(input_path, output_dir, config.mode);
    if (!ensureDirectory(fs::path(report.output_path).parent_path())) {
        report.error_code = ErrorCode::InvalidPath;
        return report;
    }

    OpenCvVideoSource source;
    ErrorCode code = source.open(input_path);
    if (code != ErrorCode::Success) {
        report.error_code = code;
        return report;
    }

    SampleWriter samples;
    if (writesSamples()) {
        report.sample_path = sampleFilePath(input_path, output_dir, config.color_space);
        if (!ensureDirectory(fs::path(report.sample_path).parent_path())) {
            report.error_code = ErrorCode::InvalidPath;
            return report;
        }
        code = samples.open(report.sample_path, config.color_space);
        if (code != ErrorCode::Success) {
            report.error_code = code;
            return report;
        }
    }

    OpenCvVideoSink sink;
    code = sink.open(report.output_path, output_fps);
    if (code != ErrorCode::Success) {
        report.error_code = code;
        return report;
    }

    VideoReport run = processVideo(source, sink, writesSamples() ? &samples : nullptr);
    run.input_path = report.input_path;
    run.output_path = report.output_path;
    run.sample_path = report.sample_path;

    sink.release();
    const ErrorCode close_code = samples.close();
    if (run.error_code == ErrorCode::Success) {
        run.error_code = close_code;
    }
    source.release();

    logger->info("{}: {} frames read, {} written, {} skipped{}",
                 fs::path(input_path).filename().string(), run.frames_read,
                 run.frames_written, run.frames_skipped,
                 run.error_code == ErrorCode::Success
                     ? "" : std::string(" (") + errorCodeToString(run.error_code) + ")");
    return run;
}

// ============================================================================
// VideoProcessor 공개 인터페이스
// ============================================================================

VideoProcessor::VideoProcessor() : impl_(std::make_unique<Impl>()) {}

VideoProcessor::~VideoProcessor() = default;

ErrorCode VideoProcessor::initialize(const PipelineConfig& config,
                                     std::unique_ptr<LandmarkDetector> detector) {
    return impl_->processor.initialize(config, std::move(detector));
}

ErrorCode VideoProcessor::initialize(const PipelineConfig& config, const std::string& model_path) {
    return impl_->processor.initialize(config, model_path);
}

void VideoProcessor::release() {
    impl_->processor.release();
}

bool VideoProcessor::isInitialized() const noexcept {
    return impl_->processor.isInitialized();
}

VideoReport VideoProcessor::processVideo(VideoSource& source, VideoSink& sink,
                                         SampleWriter* samples) {
    return impl_->processVideo(source, sink, samples);
}

VideoReport VideoProcessor::processFile(const std::string& input_path,
                                        const std::string& output_dir,
                                        double output_fps) {
    return impl_->processFile(input_path, output_dir, output_fps);
}

ErrorCode VideoProcessor::processDirectory(const BatchConfig& batch,
                                           std::vector<VideoReport>& out_reports) {
    auto logger = detail::getLogger("facemask.batch");
    out_reports.clear();

    if (!isInitialized()) {
        return ErrorCode::NotInitialized;
    }

    std::error_code ec;
    if (batch.output_dir.empty() || !fs::is_directory(batch.output_dir, ec)) {
        logger->error("output directory not found: {}", batch.output_dir);
        return ErrorCode::InvalidPath;
    }

    std::vector<std::string> files;
    const ErrorCode list_code = listInputFiles(batch.input_dir, batch.recurse_subdirectories, files);
    if (list_code != ErrorCode::Success) {
        logger->error("input directory not found: {}", batch.input_dir);
        return list_code;
    }

    logger->info("processing {} files from {}", files.size(), batch.input_dir);
    for (const std::string& file : files) {
        out_reports.push_back(processFile(file, batch.output_dir, batch.output_fps));
    }
    return ErrorCode::Success;
}

} // namespace facemask
