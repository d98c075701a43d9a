/**
 * @file frame_processor.cpp
 * @brief 프레임 처리 파이프라인 구현
 *
 * 검출 → 영역 마스크 → 합성 → (격리 + 아티팩트 제거 | 컬러 필터) → 색상 샘플
 */

#include "facemask/frame_processor.h"
#include "facemask/artifact_cleaner.h"
#include "facemask/color_aggregator.h"
#include "facemask/config.h"
#include "facemask/face_regions.h"
#include "facemask/landmark_detector.h"
#include "facemask/mask_compositor.h"
#include "facemask/overlay_blender.h"
#include "facemask/region_mask.h"

#include <chrono>
#include <deque>
#include <numeric>

#include "logging.h"

namespace facemask {

// ============================================================================
// Impl 클래스 정의
// ============================================================================

class FrameProcessor::Impl {
public:
    Impl() = default;
    ~Impl() { release(); }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    ErrorCode initialize(const PipelineConfig& config,
                         std::unique_ptr<LandmarkDetector> detector);
    void release();
    bool isInitialized() const noexcept { return initialized_; }
    const PipelineConfig& config() const noexcept { return config_; }

    FrameResult processFrame(const cv::Mat& frame, double position_ms);
    void resetSequence();

    double getLastProcessingTimeMs() const noexcept { return last_processing_time_ms_; }
    double getAverageFPS() const noexcept;

private:
    ErrorCode buildCompositeMask(const std::vector<LandmarkPoint>& points,
                                 int height, int width, cv::Mat& out_mask);
    void recordProcessingTime(double time_ms);

    bool initialized_ = false;
    PipelineConfig config_;
    std::unique_ptr<LandmarkDetector> detector_;

    // 통계
    double last_processing_time_ms_ = 0.0;
    std::deque<double> processing_times_;
    static constexpr size_t MAX_FPS_SAMPLES = 30;
};

// ============================================================================
// Impl 구현 - 초기화
// ============================================================================

ErrorCode FrameProcessor::Impl::initialize(const PipelineConfig& config,
                                           std::unique_ptr<LandmarkDetector> detector) {
    auto logger = detail::getLogger("facemask.pipeline");

    if (initialized_) {
        release();
    }

    const ErrorCode config_code = validateConfig(config);
    if (config_code != ErrorCode::Success) {
        logger->error("invalid pipeline configuration: {}", errorCodeToString(config_code));
        return config_code;
    }

    const ErrorCode region_code = validateRegionDefinitions();
    if (region_code != ErrorCode::Success) {
        logger->error("region definitions rejected: {}", errorCodeToString(region_code));
        return region_code;
    }

    if (!detector) {
        return ErrorCode::InvalidParameter;
    }
    if (!detector->isInitialized()) {
        return ErrorCode::NotInitialized;
    }

    config_ = config;
    detector_ = std::move(detector);
    initialized_ = true;

    logger->debug("pipeline ready: mode={}, mask={}, color_space={}, extract={}",
                  config_.mode == PipelineMode::ColorFilter ? "color_filter" : "mask_isolation",
                  toString(config_.mask_type), toString(config_.color_space),
                  config_.extract_color_info);
    return ErrorCode::Success;
}

void FrameProcessor::Impl::release() {
    if (detector_) {
        detector_->release();
        detector_.reset();
    }
    processing_times_.clear();
    last_processing_time_ms_ = 0.0;
    initialized_ = false;
}

void FrameProcessor::Impl::resetSequence() {
    if (detector_) {
        detector_->reset();
    }
    processing_times_.clear();
    last_processing_time_ms_ = 0.0;
}

// ============================================================================
// Impl 구현 - 처리
// ============================================================================

ErrorCode FrameProcessor::Impl::buildCompositeMask(const std::vector<LandmarkPoint>& points,
                                                   int height, int width, cv::Mat& out_mask) {
    RegionMaskSet masks;
    for (RegionId region : requiredRegions(config_.mask_type)) {
        cv::Mat region_mask;
        const ErrorCode code = buildRegionMaskFromLandmarks(region, points, height, width,
                                                            region_mask);
        if (code != ErrorCode::Success) {
            detail::getLogger("facemask.pipeline")->debug(
                "{} region rejected: {}", toString(region), errorCodeToString(code));
            return code;
        }
        masks.emplace(region, region_mask);
    }

    return composeRegion(config_.mask_type, masks, out_mask);
}

FrameResult FrameProcessor::Impl::processFrame(const cv::Mat& frame, double position_ms) {
    FrameResult result;

    if (!initialized_) {
        result.error_code = ErrorCode::NotInitialized;
        return result;
    }
    if (frame.empty()) {
        result.error_code = ErrorCode::EmptyFrame;
        return result;
    }
    if (frame.type() != CV_8UC3) {
        result.error_code = ErrorCode::InvalidParameter;
        return result;
    }

    auto total_start = std::chrono::high_resolution_clock::now();

    // 1. 랜드마크 검출
    auto detect_start = std::chrono::high_resolution_clock::now();
    const LandmarkResult landmarks = detector_->detect(frame);
    auto detect_end = std::chrono::high_resolution_clock::now();
    result.detection_time_ms = std::chrono::duration<float, std::milli>(
        detect_end - detect_start).count();

    if (!landmarks.detected || landmarks.landmarks.size() < static_cast<size_t>(FACE_LANDMARK_COUNT)) {
        result.error_code = ErrorCode::NoFaceDetected;
        return result;
    }
    result.face_detected = true;

    // 2. 영역 마스크 합성
    const std::vector<LandmarkPoint> points = toPixelPoints(landmarks.landmarks,
                                                            frame.cols, frame.rows);
    const ErrorCode mask_code = buildCompositeMask(points, frame.rows, frame.cols,
                                                   result.region_mask);
    if (mask_code != ErrorCode::Success) {
        result.error_code = mask_code;
        return result;
    }

    // 3. 모드별 출력
    if (config_.mode == PipelineMode::ColorFilter) {
        const ErrorCode blend_code = blendOverlay(frame, result.region_mask,
                                                  colorForChannel(config_.filter_color),
                                                  config_.alpha, result.output_frame);
        if (blend_code != ErrorCode::Success) {
            result.error_code = blend_code;
            return result;
        }
    } else {
        result.output_frame = removeBrightArtifacts(isolateRegion(frame, result.region_mask));

        // 샘플은 아티팩트 제거 전 원본 프레임 기준
        if (config_.extract_color_info) {
            result.sample = computeColorSample(frame, result.region_mask,
                                               config_.color_space, position_ms / 1000.0);
            result.has_sample = true;
        }
    }

    auto total_end = std::chrono::high_resolution_clock::now();
    result.processing_time_ms = std::chrono::duration<float, std::milli>(
        total_end - total_start).count();
    result.error_code = ErrorCode::Success;

    recordProcessingTime(result.processing_time_ms);
    last_processing_time_ms_ = result.processing_time_ms;

    return result;
}

// ============================================================================
// Impl 구현 - 통계
// ============================================================================

void FrameProcessor::Impl::recordProcessingTime(double time_ms) {
    processing_times_.push_back(time_ms);
    if (processing_times_.size() > MAX_FPS_SAMPLES) {
        processing_times_.pop_front();
    }
}

double FrameProcessor::Impl::getAverageFPS() const noexcept {
    if (processing_times_.empty()) {
        return 0.0;
    }

    double avg_time = std::accumulate(processing_times_.begin(),
                                      processing_times_.end(), 0.0) /
                      processing_times_.size();

    if (avg_time <= 0.0) {
        return 0.0;
    }

    return 1000.0 / avg_time;
}

// ============================================================================
// FrameProcessor 공개 인터페이스
// ============================================================================

FrameProcessor::FrameProcessor() : impl_(std::make_unique<Impl>()) {}

FrameProcessor::~FrameProcessor() = default;

FrameProcessor::FrameProcessor(FrameProcessor&&) noexcept = default;

FrameProcessor& FrameProcessor::operator=(FrameProcessor&&) noexcept = default;

ErrorCode FrameProcessor::initialize(const PipelineConfig& config,
                                     std::unique_ptr<LandmarkDetector> detector) {
    return impl_ ? impl_->initialize(config, std::move(detector)) : ErrorCode::NotInitialized;
}

ErrorCode FrameProcessor::initialize(const PipelineConfig& config, const std::string& model_path) {
    if (!impl_) {
        return ErrorCode::NotInitialized;
    }

    // 모델 로드 전에 설정 오류 보고
    const ErrorCode config_code = validateConfig(config);
    if (config_code != ErrorCode::Success) {
        return config_code;
    }

    std::unique_ptr<LandmarkDetector> detector = detail::createDetector(DetectorType::FaceMesh);
    if (!detector || !detector->initialize(model_path)) {
        return ErrorCode::ModelLoadFailed;
    }

    return impl_->initialize(config, std::move(detector));
}

void FrameProcessor::release() {
    if (impl_) {
        impl_->release();
    }
}

bool FrameProcessor::isInitialized() const noexcept {
    return impl_ && impl_->isInitialized();
}

const PipelineConfig& FrameProcessor::config() const noexcept {
    static const PipelineConfig default_config{};
    return impl_ ? impl_->config() : default_config;
}

FrameResult FrameProcessor::processFrame(const cv::Mat& frame, double position_ms) {
    if (!impl_) {
        FrameResult result;
        result.error_code = ErrorCode::NotInitialized;
        return result;
    }
    return impl_->processFrame(frame, position_ms);
}

void FrameProcessor::resetSequence() {
    if (impl_) {
        impl_->resetSequence();
    }
}

double FrameProcessor::getLastProcessingTimeMs() const noexcept {
    return impl_ ? impl_->getLastProcessingTimeMs() : 0.0;
}

double FrameProcessor::getAverageFPS() const noexcept {
    return impl_ ? impl_->getAverageFPS() : 0.0;
}

} // namespace facemask
