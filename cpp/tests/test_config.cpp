/**
 * @file test_config.cpp
 * @brief 설정 값 파싱/검증 테스트
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <string>

#include "facemask/config.h"

namespace facemask {
namespace testing {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// ------------------------------------------------------------
// 마스크 종류
// ------------------------------------------------------------

TEST_F(ConfigTest, ParseMaskTypeNames) {
    MaskType type = MaskType::FaceSkin;

    EXPECT_EQ(parseMaskType("faceOutline", type), ErrorCode::Success);
    EXPECT_EQ(type, MaskType::FaceOutline);

    EXPECT_EQ(parseMaskType("  SKIN ", type), ErrorCode::Success);
    EXPECT_EQ(type, MaskType::FaceSkin);

    EXPECT_EQ(parseMaskType("face_cheeks", type), ErrorCode::Success);
    EXPECT_EQ(type, MaskType::FaceCheeks);
}

TEST_F(ConfigTest, ParseMaskTypeLegacyCodes) {
    MaskType type = MaskType::FaceSkin;
    EXPECT_EQ(parseMaskType("1", type), ErrorCode::Success);
    EXPECT_EQ(type, MaskType::FaceOutline);
    EXPECT_EQ(parseMaskType("3", type), ErrorCode::Success);
    EXPECT_EQ(type, MaskType::FaceCheeks);
}

TEST_F(ConfigTest, ParseMaskTypeRejectsUnknown) {
    MaskType type = MaskType::FaceCheeks;
    EXPECT_EQ(parseMaskType("forehead", type), ErrorCode::InvalidMaskType);
    EXPECT_EQ(parseMaskType("", type), ErrorCode::InvalidMaskType);
    // 실패 시 출력 유지
    EXPECT_EQ(type, MaskType::FaceCheeks);
}

// ------------------------------------------------------------
// 색 공간
// ------------------------------------------------------------

TEST_F(ConfigTest, ParseColorSpace) {
    ColorSpace space = ColorSpace::RGB;
    EXPECT_EQ(parseColorSpace("HSV", space), ErrorCode::Success);
    EXPECT_EQ(space, ColorSpace::HSV);
    EXPECT_EQ(parseColorSpace("grayscale", space), ErrorCode::Success);
    EXPECT_EQ(space, ColorSpace::Grayscale);
    EXPECT_EQ(parseColorSpace("gray", space), ErrorCode::Success);
    EXPECT_EQ(space, ColorSpace::Grayscale);
    EXPECT_EQ(parseColorSpace("rgb", space), ErrorCode::Success);
    EXPECT_EQ(space, ColorSpace::RGB);
}

TEST_F(ConfigTest, ParseColorSpaceRejectsUnknown) {
    ColorSpace space = ColorSpace::RGB;
    EXPECT_EQ(parseColorSpace("lab", space), ErrorCode::InvalidColorSpace);
}

// ------------------------------------------------------------
// 관심 채널
// ------------------------------------------------------------

TEST_F(ConfigTest, ParseFocusChannelNames) {
    FocusChannel channel = FocusChannel::Red;
    EXPECT_EQ(parseFocusChannel("Blue", channel), ErrorCode::Success);
    EXPECT_EQ(channel, FocusChannel::Blue);
    EXPECT_EQ(parseFocusChannel("green", channel), ErrorCode::Success);
    EXPECT_EQ(channel, FocusChannel::Green);
    EXPECT_EQ(parseFocusChannel("red", channel), ErrorCode::Success);
    EXPECT_EQ(channel, FocusChannel::Red);
}

TEST_F(ConfigTest, ParseFocusChannelLegacyCodes) {
    // 3=red, 4=blue, 5=green
    FocusChannel channel = FocusChannel::Red;
    EXPECT_EQ(parseFocusChannel("4", channel), ErrorCode::Success);
    EXPECT_EQ(channel, FocusChannel::Blue);
    EXPECT_EQ(parseFocusChannel("5", channel), ErrorCode::Success);
    EXPECT_EQ(channel, FocusChannel::Green);
    EXPECT_EQ(parseFocusChannel("3", channel), ErrorCode::Success);
    EXPECT_EQ(channel, FocusChannel::Red);
}

TEST_F(ConfigTest, FocusChannelCodeOutOfRange) {
    FocusChannel channel = FocusChannel::Red;
    EXPECT_EQ(focusChannelFromCode(0, channel), ErrorCode::InvalidFocusChannel);
    EXPECT_EQ(focusChannelFromCode(6, channel), ErrorCode::InvalidFocusChannel);
    EXPECT_EQ(parseFocusChannel("7", channel), ErrorCode::InvalidFocusChannel);
    EXPECT_EQ(parseFocusChannel("purple", channel), ErrorCode::InvalidFocusChannel);
}

// ------------------------------------------------------------
// 미검출 정책 / alpha
// ------------------------------------------------------------

TEST_F(ConfigTest, ParseNoFacePolicy) {
    NoFacePolicy policy = NoFacePolicy::Skip;
    EXPECT_EQ(parseNoFacePolicy("blank", policy), ErrorCode::Success);
    EXPECT_EQ(policy, NoFacePolicy::EmitBlank);
    EXPECT_EQ(parseNoFacePolicy("skip", policy), ErrorCode::Success);
    EXPECT_EQ(policy, NoFacePolicy::Skip);
    EXPECT_EQ(parseNoFacePolicy("drop", policy), ErrorCode::InvalidParameter);
}

TEST_F(ConfigTest, ParseAlphaAcceptsBoundaries) {
    float alpha = 0.5f;
    EXPECT_EQ(parseAlpha("0", alpha), ErrorCode::Success);
    EXPECT_FLOAT_EQ(alpha, 0.0f);
    EXPECT_EQ(parseAlpha("1.0", alpha), ErrorCode::Success);
    EXPECT_FLOAT_EQ(alpha, 1.0f);
    EXPECT_EQ(parseAlpha("0.15", alpha), ErrorCode::Success);
    EXPECT_FLOAT_EQ(alpha, 0.15f);
}

TEST_F(ConfigTest, ParseAlphaRejectsInvalidText) {
    float alpha = 0.5f;
    EXPECT_EQ(parseAlpha("", alpha), ErrorCode::InvalidParameter);
    EXPECT_EQ(parseAlpha("half", alpha), ErrorCode::InvalidParameter);
    EXPECT_EQ(parseAlpha("0.3x", alpha), ErrorCode::InvalidParameter);
    EXPECT_EQ(parseAlpha("1.5", alpha), ErrorCode::AlphaOutOfRange);
    EXPECT_EQ(parseAlpha("-0.1", alpha), ErrorCode::AlphaOutOfRange);
    EXPECT_FLOAT_EQ(alpha, 0.5f);
}

TEST_F(ConfigTest, ValidateAlpha) {
    EXPECT_EQ(validateAlpha(0.0f), ErrorCode::Success);
    EXPECT_EQ(validateAlpha(1.0f), ErrorCode::Success);
    EXPECT_EQ(validateAlpha(1.0001f), ErrorCode::AlphaOutOfRange);
    EXPECT_EQ(validateAlpha(std::numeric_limits<float>::quiet_NaN()),
              ErrorCode::AlphaOutOfRange);
}

// ------------------------------------------------------------
// 전체 설정 검증
// ------------------------------------------------------------

TEST_F(ConfigTest, ValidateDefaultConfig) {
    PipelineConfig config;
    EXPECT_EQ(validateConfig(config), ErrorCode::Success);
}

TEST_F(ConfigTest, ValidateConfigRejectsOutOfRangeEnums) {
    PipelineConfig config;
    config.mask_type = static_cast<MaskType>(9);
    EXPECT_EQ(validateConfig(config), ErrorCode::InvalidMaskType);

    config = PipelineConfig{};
    config.color_space = static_cast<ColorSpace>(7);
    EXPECT_EQ(validateConfig(config), ErrorCode::InvalidColorSpace);

    config = PipelineConfig{};
    config.filter_color = static_cast<FocusChannel>(5);
    EXPECT_EQ(validateConfig(config), ErrorCode::InvalidFocusChannel);

    config = PipelineConfig{};
    config.alpha = 2.0f;
    EXPECT_EQ(validateConfig(config), ErrorCode::AlphaOutOfRange);
}

// ------------------------------------------------------------
// 문자열 변환
// ------------------------------------------------------------

TEST_F(ConfigTest, ToStringNames) {
    EXPECT_STREQ(toString(MaskType::FaceSkin), "faceSkin");
    EXPECT_STREQ(toString(ColorSpace::Grayscale), "GRAYSCALE");
    EXPECT_STREQ(toString(FocusChannel::Green), "green");
    EXPECT_STREQ(toString(RegionId::FaceOval), "faceOval");
}

TEST_F(ConfigTest, ErrorCodeToString) {
    EXPECT_STREQ(errorCodeToString(ErrorCode::Success), "Success");
    EXPECT_STREQ(errorCodeToString(ErrorCode::NoFaceDetected), "NoFaceDetected");
    EXPECT_STREQ(errorCodeToString(ErrorCode::AlphaOutOfRange), "AlphaOutOfRange");
    EXPECT_STREQ(errorCodeToString(ErrorCode::SampleFileWriteFailed), "SampleFileWriteFailed");
    EXPECT_STREQ(errorCodeToString(static_cast<ErrorCode>(12345)), "Unknown");
}

TEST_F(ConfigTest, ErrorCategories) {
    EXPECT_EQ(getErrorCategory(ErrorCode::Success), ErrorCategory::None);
    EXPECT_EQ(getErrorCategory(ErrorCode::SourceOpenFailed), ErrorCategory::Resource);
    EXPECT_EQ(getErrorCategory(ErrorCode::SampleFileWriteFailed), ErrorCategory::Resource);
    EXPECT_EQ(getErrorCategory(ErrorCode::MalformedRegionDefinition),
              ErrorCategory::Configuration);
    EXPECT_EQ(getErrorCategory(ErrorCode::NoFaceDetected), ErrorCategory::Detection);
    EXPECT_EQ(getErrorCategory(ErrorCode::InvalidRegion), ErrorCategory::InvalidRegion);
    EXPECT_EQ(getErrorCategory(ErrorCode::Unknown), ErrorCategory::Unknown);
}

} // namespace testing
} // namespace facemask
