/**
 * @file landmark_detector.cpp
 * @brief LandmarkDetector 팩토리 함수 구현
 */

#include "facemask/landmark_detector.h"
#include "facemask/face_mesh_detector.h"

#include <algorithm>
#include <cctype>

namespace facemask {
namespace detail {

std::unique_ptr<LandmarkDetector> createDetector(DetectorType type) {
    switch (type) {
        case DetectorType::FaceMesh:
            return std::make_unique<FaceMeshDetector>();

        case DetectorType::Unknown:
        default:
            return nullptr;
    }
}

std::unique_ptr<LandmarkDetector> createDetector(const std::string& type_name) {
    // 소문자로 변환
    std::string lower_name = type_name;
    std::transform(lower_name.begin(), lower_name.end(), lower_name.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower_name == "facemesh" || lower_name == "face_mesh") {
        return createDetector(DetectorType::FaceMesh);
    }

    return nullptr;
}

} // namespace detail
} // namespace facemask
