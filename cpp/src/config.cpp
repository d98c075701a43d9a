/**
 * @file config.cpp
 * @brief 설정 값 정규화 및 검증 구현
 */

#include "facemask/config.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace facemask {

namespace {

/**
 * @brief 소문자 변환 + 앞뒤 공백 제거
 */
std::string normalizeToken(const std::string& text) {
    std::string token = text;
    token.erase(token.begin(),
                std::find_if(token.begin(), token.end(),
                             [](unsigned char c) { return !std::isspace(c); }));
    token.erase(std::find_if(token.rbegin(), token.rend(),
                             [](unsigned char c) { return !std::isspace(c); }).base(),
                token.end());
    std::transform(token.begin(), token.end(), token.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return token;
}

} // anonymous namespace

// ============================================================
// 문자열 → 열거형
// ============================================================

ErrorCode parseMaskType(const std::string& text, MaskType& out) {
    const std::string token = normalizeToken(text);

    if (token == "faceoutline" || token == "face_outline" ||
        token == "outline" || token == "oval" || token == "1") {
        out = MaskType::FaceOutline;
    } else if (token == "faceskin" || token == "face_skin" ||
               token == "skin" || token == "2") {
        out = MaskType::FaceSkin;
    } else if (token == "facecheeks" || token == "face_cheeks" ||
               token == "cheeks" || token == "3") {
        out = MaskType::FaceCheeks;
    } else {
        return ErrorCode::InvalidMaskType;
    }
    return ErrorCode::Success;
}

ErrorCode parseColorSpace(const std::string& text, ColorSpace& out) {
    const std::string token = normalizeToken(text);

    if (token == "rgb") {
        out = ColorSpace::RGB;
    } else if (token == "hsv") {
        out = ColorSpace::HSV;
    } else if (token == "grayscale" || token == "gray" || token == "grey") {
        out = ColorSpace::Grayscale;
    } else {
        return ErrorCode::InvalidColorSpace;
    }
    return ErrorCode::Success;
}

ErrorCode focusChannelFromCode(int code, FocusChannel& out) {
    switch (code) {
        case 3:
            out = FocusChannel::Red;
            return ErrorCode::Success;
        case 4:
            out = FocusChannel::Blue;
            return ErrorCode::Success;
        case 5:
            out = FocusChannel::Green;
            return ErrorCode::Success;
        default:
            return ErrorCode::InvalidFocusChannel;
    }
}

ErrorCode parseFocusChannel(const std::string& text, FocusChannel& out) {
    const std::string token = normalizeToken(text);

    if (token == "red") {
        out = FocusChannel::Red;
        return ErrorCode::Success;
    }
    if (token == "green") {
        out = FocusChannel::Green;
        return ErrorCode::Success;
    }
    if (token == "blue") {
        out = FocusChannel::Blue;
        return ErrorCode::Success;
    }

    // 레거시 정수 코드
    if (token.size() == 1 && std::isdigit(static_cast<unsigned char>(token[0]))) {
        return focusChannelFromCode(token[0] - '0', out);
    }
    return ErrorCode::InvalidFocusChannel;
}

ErrorCode parseNoFacePolicy(const std::string& text, NoFacePolicy& out) {
    const std::string token = normalizeToken(text);

    if (token == "skip") {
        out = NoFacePolicy::Skip;
    } else if (token == "blank" || token == "emit_blank") {
        out = NoFacePolicy::EmitBlank;
    } else {
        return ErrorCode::InvalidParameter;
    }
    return ErrorCode::Success;
}

ErrorCode parseAlpha(const std::string& text, float& out) {
    const std::string token = normalizeToken(text);
    if (token.empty()) {
        return ErrorCode::InvalidParameter;
    }

    char* end = nullptr;
    const float value = std::strtof(token.c_str(), &end);
    if (end == token.c_str() || *end != '\0') {
        return ErrorCode::InvalidParameter;
    }

    const ErrorCode code = validateAlpha(value);
    if (code != ErrorCode::Success) {
        return code;
    }
    out = value;
    return ErrorCode::Success;
}

// ============================================================
// 검증
// ============================================================

ErrorCode validateAlpha(float alpha) {
    if (std::isnan(alpha) || alpha < 0.0f || alpha > 1.0f) {
        return ErrorCode::AlphaOutOfRange;
    }
    return ErrorCode::Success;
}

ErrorCode validateConfig(const PipelineConfig& config) {
    switch (config.mode) {
        case PipelineMode::MaskIsolation:
        case PipelineMode::ColorFilter:
            break;
        default:
            return ErrorCode::InvalidParameter;
    }

    switch (config.mask_type) {
        case MaskType::FaceOutline:
        case MaskType::FaceSkin:
        case MaskType::FaceCheeks:
            break;
        default:
            return ErrorCode::InvalidMaskType;
    }

    switch (config.color_space) {
        case ColorSpace::RGB:
        case ColorSpace::HSV:
        case ColorSpace::Grayscale:
            break;
        default:
            return ErrorCode::InvalidColorSpace;
    }

    switch (config.filter_color) {
        case FocusChannel::Red:
        case FocusChannel::Green:
        case FocusChannel::Blue:
            break;
        default:
            return ErrorCode::InvalidFocusChannel;
    }

    switch (config.no_face_policy) {
        case NoFacePolicy::Skip:
        case NoFacePolicy::EmitBlank:
            break;
        default:
            return ErrorCode::InvalidParameter;
    }

    return validateAlpha(config.alpha);
}

// ============================================================
// 열거형 → 문자열
// ============================================================

const char* toString(MaskType type) {
    switch (type) {
        case MaskType::FaceOutline: return "faceOutline";
        case MaskType::FaceSkin:    return "faceSkin";
        case MaskType::FaceCheeks:  return "faceCheeks";
        default:                    return "unknown";
    }
}

const char* toString(ColorSpace space) {
    switch (space) {
        case ColorSpace::RGB:       return "RGB";
        case ColorSpace::HSV:       return "HSV";
        case ColorSpace::Grayscale: return "GRAYSCALE";
        default:                    return "unknown";
    }
}

const char* toString(FocusChannel channel) {
    switch (channel) {
        case FocusChannel::Red:   return "red";
        case FocusChannel::Green: return "green";
        case FocusChannel::Blue:  return "blue";
        default:                  return "unknown";
    }
}

const char* toString(RegionId region) {
    switch (region) {
        case RegionId::LeftEye:    return "leftEye";
        case RegionId::RightEye:   return "rightEye";
        case RegionId::LeftCheek:  return "leftCheek";
        case RegionId::RightCheek: return "rightCheek";
        case RegionId::Lips:       return "lips";
        case RegionId::FaceOval:   return "faceOval";
        default:                   return "unknown";
    }
}

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:                    return "Success";
        case ErrorCode::NotInitialized:             return "NotInitialized";
        case ErrorCode::AlreadyInitialized:         return "AlreadyInitialized";
        case ErrorCode::ModelLoadFailed:            return "ModelLoadFailed";
        case ErrorCode::InvalidPath:                return "InvalidPath";
        case ErrorCode::SourceOpenFailed:           return "SourceOpenFailed";
        case ErrorCode::SinkOpenFailed:             return "SinkOpenFailed";
        case ErrorCode::SampleFileOpenFailed:       return "SampleFileOpenFailed";
        case ErrorCode::SampleFileWriteFailed:      return "SampleFileWriteFailed";
        case ErrorCode::InvalidParameter:           return "InvalidParameter";
        case ErrorCode::InvalidMaskType:            return "InvalidMaskType";
        case ErrorCode::InvalidColorSpace:          return "InvalidColorSpace";
        case ErrorCode::InvalidFocusChannel:        return "InvalidFocusChannel";
        case ErrorCode::AlphaOutOfRange:            return "AlphaOutOfRange";
        case ErrorCode::MalformedRegionDefinition:  return "MalformedRegionDefinition";
        case ErrorCode::LandmarkIndexOutOfRange:    return "LandmarkIndexOutOfRange";
        case ErrorCode::DetectionFailed:            return "DetectionFailed";
        case ErrorCode::NoFaceDetected:             return "NoFaceDetected";
        case ErrorCode::InvalidRegion:              return "InvalidRegion";
        case ErrorCode::FrameSizeMismatch:          return "FrameSizeMismatch";
        case ErrorCode::EmptyFrame:                 return "EmptyFrame";
        case ErrorCode::Unknown:                    return "Unknown";
        default:                                    return "Unknown";
    }
}

ErrorCategory getErrorCategory(ErrorCode code) {
    const int value = static_cast<int>(code);

    if (value == 0) {
        return ErrorCategory::None;
    }
    if (value >= 100 && value < 200) {
        return ErrorCategory::Resource;
    }
    if (value >= 200 && value < 300) {
        return ErrorCategory::Configuration;
    }
    if (value >= 300 && value < 400) {
        return ErrorCategory::Detection;
    }
    if (value >= 400 && value < 500) {
        return ErrorCategory::InvalidRegion;
    }
    return ErrorCategory::Unknown;
}

} // namespace facemask
