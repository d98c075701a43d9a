/**
 * @file color_aggregator.cpp
 * @brief 마스크 영역 평균 색상 추출 구현
 */

#include "facemask/color_aggregator.h"

#include <limits>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "logging.h"

namespace facemask {

int channelCount(ColorSpace space) {
    return space == ColorSpace::Grayscale ? 1 : 3;
}

ColorSample makeInvalidSample(ColorSpace space, double timestamp_sec) {
    ColorSample sample{};
    sample.timestamp_sec = timestamp_sec;
    sample.channel_count = channelCount(space);
    for (int i = 0; i < MAX_SAMPLE_CHANNELS; ++i) {
        sample.channels[i] = std::numeric_limits<double>::quiet_NaN();
    }
    sample.pixel_count = 0;
    sample.valid = false;
    return sample;
}

ColorSample computeColorSample(const cv::Mat& frame_bgr,
                               const cv::Mat& mask,
                               ColorSpace space,
                               double timestamp_sec) {
    ColorSample sample = makeInvalidSample(space, timestamp_sec);

    if (frame_bgr.empty() || frame_bgr.type() != CV_8UC3 ||
        mask.empty() || mask.channels() != 1 || mask.size() != frame_bgr.size()) {
        detail::getLogger("facemask.color")->warn(
            "color sample at {:.3f}s skipped: frame/mask mismatch", timestamp_sec);
        return sample;
    }

    cv::Mat mask_8u;
    if (mask.type() == CV_8UC1) {
        mask_8u = mask;
    } else {
        mask.convertTo(mask_8u, CV_8U);
    }

    sample.pixel_count = cv::countNonZero(mask_8u);
    if (sample.pixel_count == 0) {
        detail::getLogger("facemask.color")->debug(
            "empty mask at {:.3f}s, mean undefined", timestamp_sec);
        return sample;
    }

    // 변환 후 마스킹
    cv::Mat converted;
    switch (space) {
        case ColorSpace::HSV:
            cv::cvtColor(frame_bgr, converted, cv::COLOR_BGR2HSV);
            break;
        case ColorSpace::Grayscale:
            cv::cvtColor(frame_bgr, converted, cv::COLOR_BGR2GRAY);
            break;
        case ColorSpace::RGB:
        default:
            converted = frame_bgr;
            break;
    }

    const cv::Scalar mean = cv::mean(converted, mask_8u);

    switch (space) {
        case ColorSpace::RGB:
            sample.channels[0] = mean[2];
            sample.channels[1] = mean[1];
            sample.channels[2] = mean[0];
            break;
        case ColorSpace::HSV:
            sample.channels[0] = mean[0];
            sample.channels[1] = mean[1];
            sample.channels[2] = mean[2];
            break;
        case ColorSpace::Grayscale:
        default:
            sample.channels[0] = mean[0];
            break;
    }

    sample.valid = true;
    return sample;
}

} // namespace facemask
