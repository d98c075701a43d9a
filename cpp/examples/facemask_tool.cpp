/**
 * @file facemask_tool.cpp
 * @brief 얼굴 영역 마스킹 / 컬러 필터 / 극값 색상 명령행 도구
 *
 * 사용법:
 *   facemask_tool mask     --input DIR --output DIR --models DIR
 *                          [--mask-type skin] [--extract-color] [--color-space rgb]
 *                          [--recursive] [--no-face skip|blank]
 *   facemask_tool filter   --input DIR --output DIR --models DIR
 *                          [--color red] [--alpha 0.15] [--recursive]
 *   facemask_tool extremum --input FILE [--color red]
 *
 * 공통: --verbose (debug 로그)
 * 종료 코드: 0 성공, 1 설정/리소스 실패
 */

#include <cstdlib>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "facemask.h"

namespace {

/**
 * @brief 명령행 옵션
 */
struct ToolOptions {
    std::string command;
    std::string input;
    std::string output;
    std::string models;
    std::string mask_type = "skin";
    std::string color_space = "rgb";
    std::string color = "red";
    std::string alpha = "0.15";
    std::string no_face = "skip";
    bool extract_color = false;
    bool recursive = false;
    bool verbose = false;
};

void printUsage(const char* program) {
    spdlog::info("usage: {} <mask|filter|extremum> [options]", program);
    spdlog::info("  --input PATH        input directory (mask/filter) or video file (extremum)");
    spdlog::info("  --output DIR        output directory");
    spdlog::info("  --models DIR        directory with face_detection_short_range.tflite, face_landmark.tflite");
    spdlog::info("  --mask-type TYPE    outline | skin | cheeks (default skin)");
    spdlog::info("  --color-space CS    rgb | hsv | grayscale (default rgb)");
    spdlog::info("  --extract-color     write per-frame mean color CSV");
    spdlog::info("  --recursive         include subdirectories");
    spdlog::info("  --color C           red | green | blue (default red)");
    spdlog::info("  --alpha A           filter opacity in [0, 1] (default 0.15)");
    spdlog::info("  --no-face POLICY    skip | blank (default skip)");
    spdlog::info("  --verbose           debug logging");
}

/**
 * @brief argv 파싱
 * @return 파싱 성공 여부 (알 수 없는 옵션, 값 누락 시 false)
 */
bool parseArguments(int argc, char* argv[], ToolOptions& options) {
    if (argc < 2) {
        return false;
    }
    options.command = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--extract-color") {
            options.extract_color = true;
            continue;
        }
        if (arg == "--recursive") {
            options.recursive = true;
            continue;
        }
        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }

        if (i + 1 >= argc) {
            spdlog::error("missing value for {}", arg);
            return false;
        }
        const std::string value = argv[++i];

        if (arg == "--input") {
            options.input = value;
        } else if (arg == "--output") {
            options.output = value;
        } else if (arg == "--models") {
            options.models = value;
        } else if (arg == "--mask-type") {
            options.mask_type = value;
        } else if (arg == "--color-space") {
            options.color_space = value;
        } else if (arg == "--color") {
            options.color = value;
        } else if (arg == "--alpha") {
            options.alpha = value;
        } else if (arg == "--no-face") {
            options.no_face = value;
        } else {
            spdlog::error("unknown option {}", arg);
            return false;
        }
    }
    return true;
}

int fail(facemask::ErrorCode code, const std::string& context) {
    spdlog::error("{}: {}", context, facemask::errorCodeToString(code));
    return 1;
}

/**
 * @brief mask / filter 명령 공통 설정 구성
 */
facemask::ErrorCode buildPipelineConfig(const ToolOptions& options,
                                        facemask::PipelineConfig& config) {
    using facemask::ErrorCode;

    config.mode = options.command == "filter"
        ? facemask::PipelineMode::ColorFilter
        : facemask::PipelineMode::MaskIsolation;
    config.extract_color_info = options.extract_color;

    ErrorCode code = facemask::parseMaskType(options.mask_type, config.mask_type);
    if (code != ErrorCode::Success) return code;

    code = facemask::parseColorSpace(options.color_space, config.color_space);
    if (code != ErrorCode::Success) return code;

    code = facemask::parseFocusChannel(options.color, config.filter_color);
    if (code != ErrorCode::Success) return code;

    code = facemask::parseAlpha(options.alpha, config.alpha);
    if (code != ErrorCode::Success) return code;

    code = facemask::parseNoFacePolicy(options.no_face, config.no_face_policy);
    if (code != ErrorCode::Success) return code;

    return facemask::validateConfig(config);
}

int runBatch(const ToolOptions& options) {
    using facemask::ErrorCode;

    facemask::PipelineConfig config;
    ErrorCode code = buildPipelineConfig(options, config);
    if (code != ErrorCode::Success) {
        return fail(code, "invalid configuration");
    }

    facemask::BatchConfig batch;
    batch.input_dir = options.input;
    batch.output_dir = options.output;
    batch.model_path = options.models;
    batch.recurse_subdirectories = options.recursive;

    facemask::VideoProcessor processor;
    code = processor.initialize(config, batch.model_path);
    if (code != ErrorCode::Success) {
        return fail(code, "cannot initialize pipeline");
    }

    std::vector<facemask::VideoReport> reports;
    code = processor.processDirectory(batch, reports);
    if (code != ErrorCode::Success) {
        return fail(code, "cannot process directory");
    }

    int failures = 0;
    for (const auto& report : reports) {
        if (report.error_code != ErrorCode::Success) {
            spdlog::warn("{} failed: {}", report.input_path,
                         facemask::errorCodeToString(report.error_code));
            ++failures;
        }
    }
    spdlog::info("{} videos processed, {} failed", reports.size(), failures);
    return failures == 0 ? 0 : 1;
}

int runExtremum(const ToolOptions& options) {
    using facemask::ErrorCode;

    facemask::FocusChannel channel;
    ErrorCode code = facemask::parseFocusChannel(options.color, channel);
    if (code != ErrorCode::Success) {
        return fail(code, "invalid color");
    }

    facemask::ExtremumRecord record{};
    code = facemask::findExtremumColors(options.input, channel, record);
    if (code != ErrorCode::Success) {
        return fail(code, "cannot scan " + options.input);
    }

    const auto print = [](const char* label, bool present, const facemask::PixelColor& c,
                          int value, const facemask::LandmarkPoint& at, int64_t frame) {
        if (!present) {
            spdlog::info("{}: none", label);
            return;
        }
        spdlog::info("{}: {} at ({}, {}) frame {} -> BGR ({}, {}, {})",
                     label, value, at.x, at.y, frame, c.b, c.g, c.r);
    };
    print("max", record.has_max, record.max_color, record.max_value,
          record.max_location, record.max_frame_index);
    print("min", record.has_min, record.min_color, record.min_value,
          record.min_location, record.min_frame_index);
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    ToolOptions options;
    if (!parseArguments(argc, argv, options)) {
        printUsage(argv[0]);
        return 1;
    }

    spdlog::set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::debug("facemask {}", facemask::get_version());

    if (options.command == "mask" || options.command == "filter") {
        return runBatch(options);
    }
    if (options.command == "extremum") {
        return runExtremum(options);
    }

    spdlog::error("unknown command {}", options.command);
    printUsage(argv[0]);
    return 1;
}
