/**
 * @file extremum_tracker.cpp
 * @brief 단일 채널 극값 추적 구현
 */

#include "facemask/extremum_tracker.h"
#include "facemask/config.h"
#include "facemask/video_io.h"

#include <opencv2/core.hpp>

#include "logging.h"

namespace facemask {

namespace {

PixelColor pixelAt(const cv::Mat& frame, const cv::Point& location) {
    const cv::Vec3b& bgr = frame.at<cv::Vec3b>(location);
    return PixelColor{bgr[0], bgr[1], bgr[2]};
}

} // anonymous namespace

int bgrChannelIndex(FocusChannel channel) {
    switch (channel) {
        case FocusChannel::Blue:  return 0;
        case FocusChannel::Green: return 1;
        case FocusChannel::Red:
        default:                  return 2;
    }
}

// ============================================================
// ExtremumTracker
// ============================================================

ExtremumTracker::ExtremumTracker(FocusChannel channel, int initial_max, int initial_min)
    : channel_(channel)
    , initial_max_(initial_max)
    , initial_min_(initial_min)
    , record_(emptyRecord(initial_max, initial_min)) {
}

ExtremumRecord ExtremumTracker::emptyRecord(int initial_max, int initial_min) {
    ExtremumRecord record{};
    record.has_min = false;
    record.has_max = false;
    record.min_value = initial_min;
    record.max_value = initial_max;
    record.min_frame_index = -1;
    record.max_frame_index = -1;
    return record;
}

void ExtremumTracker::reset() {
    record_ = emptyRecord(initial_max_, initial_min_);
    frames_seen_ = 0;
}

ErrorCode ExtremumTracker::update(const cv::Mat& frame) {
    if (frame.empty()) {
        return ErrorCode::EmptyFrame;
    }
    if (frame.type() != CV_8UC3) {
        return ErrorCode::InvalidParameter;
    }

    cv::Mat plane;
    cv::extractChannel(frame, plane, bgrChannelIndex(channel_));

    // minMaxLoc은 래스터 순서상 첫 번째 극값 위치를 반환
    double min_value = 0.0;
    double max_value = 0.0;
    cv::Point min_location;
    cv::Point max_location;
    cv::minMaxLoc(plane, &min_value, &max_value, &min_location, &max_location);

    const int frame_max = static_cast<int>(max_value);
    const int frame_min = static_cast<int>(min_value);

    if (frame_max > record_.max_value) {
        record_.max_value = frame_max;
        record_.max_color = pixelAt(frame, max_location);
        record_.max_location = {max_location.x, max_location.y};
        record_.max_frame_index = frames_seen_;
        record_.has_max = true;
    }

    if (frame_min < record_.min_value) {
        record_.min_value = frame_min;
        record_.min_color = pixelAt(frame, min_location);
        record_.min_location = {min_location.x, min_location.y};
        record_.min_frame_index = frames_seen_;
        record_.has_min = true;
    }

    ++frames_seen_;
    return ErrorCode::Success;
}

ExtremumRecord ExtremumTracker::combine(const ExtremumRecord& earlier,
                                        const ExtremumRecord& later,
                                        int64_t frame_offset) {
    ExtremumRecord merged = earlier;

    if (later.has_max && later.max_value > merged.max_value) {
        merged.max_value = later.max_value;
        merged.max_color = later.max_color;
        merged.max_location = later.max_location;
        merged.max_frame_index = later.max_frame_index + frame_offset;
        merged.has_max = true;
    }

    if (later.has_min && later.min_value < merged.min_value) {
        merged.min_value = later.min_value;
        merged.min_color = later.min_color;
        merged.min_location = later.min_location;
        merged.min_frame_index = later.min_frame_index + frame_offset;
        merged.has_min = true;
    }

    return merged;
}

// ============================================================
// 영상 단위 함수
// ============================================================

ErrorCode scanVideo(VideoSource& source, FocusChannel channel, ExtremumRecord& out_record) {
    if (!source.isOpened()) {
        return ErrorCode::NotInitialized;
    }

    ExtremumTracker tracker(channel);
    cv::Mat frame;
    while (source.read(frame)) {
        const ErrorCode code = tracker.update(frame);
        if (code != ErrorCode::Success) {
            detail::getLogger("facemask.extremum")->warn(
                "frame {} ignored: {}", tracker.framesSeen(), errorCodeToString(code));
        }
    }

    out_record = tracker.result();
    detail::getLogger("facemask.extremum")->debug(
        "{} channel scanned over {} frames (min {}, max {})",
        toString(channel), tracker.framesSeen(), out_record.min_value, out_record.max_value);
    return ErrorCode::Success;
}

ErrorCode findExtremumColors(const std::string& path,
                             FocusChannel channel,
                             ExtremumRecord& out_record) {
    OpenCvVideoSource source;
    const ErrorCode code = source.open(path);
    if (code != ErrorCode::Success) {
        return code;
    }

    const ErrorCode scan_code = scanVideo(source, channel, out_record);
    source.release();
    return scan_code;
}

} // namespace facemask
