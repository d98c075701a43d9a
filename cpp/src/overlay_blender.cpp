/**
 * @file overlay_blender.cpp
 * @brief 단색 알파 블렌딩 구현
 */

#include "facemask/overlay_blender.h"
#include "facemask/artifact_cleaner.h"
#include "facemask/config.h"

#include <cmath>

#include <opencv2/core.hpp>

namespace facemask {

namespace {
    /// 부동소수 표현 오차 보정값
    constexpr double TRUNCATION_EPSILON = 1e-4;

    inline uint8_t blendChannel(double paint, double original, double alpha) {
        const double value = alpha * paint + (1.0 - alpha) * original;
        const double truncated = std::floor(value + TRUNCATION_EPSILON);
        if (truncated <= 0.0) {
            return 0;
        }
        if (truncated >= 255.0) {
            return 255;
        }
        return static_cast<uint8_t>(truncated);
    }
}

PixelColor colorForChannel(FocusChannel channel) {
    switch (channel) {
        case FocusChannel::Green: return PixelColor{0, 255, 0};
        case FocusChannel::Blue:  return PixelColor{255, 0, 0};
        case FocusChannel::Red:
        default:                  return PixelColor{0, 0, 255};
    }
}

ErrorCode blendOverlay(const cv::Mat& frame,
                       const cv::Mat& mask,
                       const PixelColor& color,
                       float alpha,
                       cv::Mat& out_frame) {
    const ErrorCode alpha_code = validateAlpha(alpha);
    if (alpha_code != ErrorCode::Success) {
        return alpha_code;
    }
    if (frame.empty()) {
        return ErrorCode::EmptyFrame;
    }
    if (frame.type() != CV_8UC3) {
        return ErrorCode::InvalidParameter;
    }
    if (mask.empty() || mask.size() != frame.size() || mask.type() != CV_8UC1) {
        return ErrorCode::FrameSizeMismatch;
    }

    const cv::Mat smoothed = smoothMask(mask);
    out_frame = frame.clone();

    const double a = static_cast<double>(alpha);
    const double paint[3] = {
        static_cast<double>(color.b),
        static_cast<double>(color.g),
        static_cast<double>(color.r)
    };

    for (int y = 0; y < frame.rows; ++y) {
        const uint8_t* mask_row = smoothed.ptr<uint8_t>(y);
        const uint8_t* src_row = frame.ptr<uint8_t>(y);
        uint8_t* dst_row = out_frame.ptr<uint8_t>(y);

        for (int x = 0; x < frame.cols; ++x) {
            if (mask_row[x] == 0) {
                continue;
            }
            for (int c = 0; c < 3; ++c) {
                const int idx = x * 3 + c;
                dst_row[idx] = blendChannel(paint[c], src_row[idx], a);
            }
        }
    }

    return ErrorCode::Success;
}

} // namespace facemask
