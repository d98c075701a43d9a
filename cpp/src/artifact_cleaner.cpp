/**
 * @file artifact_cleaner.cpp
 * @brief 아티팩트 제거 구현
 */

#include "facemask/artifact_cleaner.h"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace facemask {

cv::Mat isolateRegion(const cv::Mat& frame, const cv::Mat& mask) {
    if (frame.empty()) {
        return cv::Mat();
    }

    cv::Mat isolated = cv::Mat::zeros(frame.size(), frame.type());
    if (mask.empty()) {
        return isolated;
    }

    frame.copyTo(isolated, mask);
    return isolated;
}

cv::Mat removeBrightArtifacts(const cv::Mat& frame) {
    if (frame.empty()) {
        return cv::Mat();
    }

    cv::Mat cleaned = frame.clone();

    cv::Mat luma;
    if (frame.channels() == 1) {
        luma = frame;
    } else {
        cv::cvtColor(frame, luma, cv::COLOR_BGR2GRAY);
    }

    cv::Mat bright;
    cv::inRange(luma, cv::Scalar(ARTIFACT_LUMA_MIN), cv::Scalar(ARTIFACT_LUMA_MAX), bright);
    cleaned.setTo(cv::Scalar::all(0), bright);

    return cleaned;
}

cv::Mat smoothMask(const cv::Mat& mask) {
    if (mask.empty()) {
        return cv::Mat();
    }

    const cv::Mat kernel = cv::getStructuringElement(
        cv::MORPH_RECT, cv::Size(MORPH_KERNEL_SIZE, MORPH_KERNEL_SIZE));

    cv::Mat opened;
    cv::morphologyEx(mask, opened, cv::MORPH_OPEN, kernel);

    cv::Mat closed;
    cv::morphologyEx(opened, closed, cv::MORPH_CLOSE, kernel);
    return closed;
}

} // namespace facemask
