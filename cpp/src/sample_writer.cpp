/**
 * @file sample_writer.cpp
 * @brief CSV 샘플 기록 구현
 */

#include "facemask/sample_writer.h"
#include "facemask/color_aggregator.h"

#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>

#include <fmt/format.h>

#include "logging.h"

namespace facemask {

namespace {

void appendValue(fmt::memory_buffer& buffer, double value) {
    if (std::isnan(value)) {
        fmt::format_to(std::back_inserter(buffer), "nan");
    } else {
        fmt::format_to(std::back_inserter(buffer), "{:.5f}", value);
    }
}

} // anonymous namespace

std::string csvHeader(ColorSpace space) {
    switch (space) {
        case ColorSpace::HSV:       return "Timestamp,Hue,Saturation,Value";
        case ColorSpace::Grayscale: return "Timestamp,Value";
        case ColorSpace::RGB:
        default:                    return "Timestamp,Red,Green,Blue";
    }
}

const char* sampleFileSuffix(ColorSpace space) {
    switch (space) {
        case ColorSpace::HSV:       return "HSV";
        case ColorSpace::Grayscale: return "GRAYSCALE";
        case ColorSpace::RGB:
        default:                    return "RGB";
    }
}

std::string formatSampleRow(const ColorSample& sample) {
    fmt::memory_buffer buffer;
    appendValue(buffer, sample.timestamp_sec);

    const int count = sample.channel_count < MAX_SAMPLE_CHANNELS
        ? sample.channel_count : MAX_SAMPLE_CHANNELS;
    for (int i = 0; i < count; ++i) {
        buffer.push_back(',');
        appendValue(buffer, sample.valid
            ? sample.channels[i] : std::numeric_limits<double>::quiet_NaN());
    }

    return fmt::to_string(buffer);
}

// ============================================================
// SampleWriter
// ============================================================

class SampleWriter::Impl {
public:
    std::ofstream stream;
    std::string path;
    ColorSpace space = ColorSpace::RGB;
    int64_t rows = 0;
};

SampleWriter::SampleWriter()
    : impl_(std::make_unique<Impl>()) {
}

SampleWriter::~SampleWriter() {
    // 실패는 close()가 로그로 남김
    close();
}

ErrorCode SampleWriter::open(const std::string& path, ColorSpace space) {
    close();

    impl_->stream.open(path, std::ios::out | std::ios::trunc);
    if (!impl_->stream.is_open()) {
        detail::getLogger("facemask.csv")->error("cannot create sample file: {}", path);
        return ErrorCode::SampleFileOpenFailed;
    }

    impl_->path = path;
    impl_->space = space;
    impl_->rows = 0;
    impl_->stream << csvHeader(space) << '\n';
    if (!impl_->stream) {
        detail::getLogger("facemask.csv")->error("cannot write header to {}", path);
        impl_->stream.close();
        return ErrorCode::SampleFileWriteFailed;
    }
    return ErrorCode::Success;
}

ErrorCode SampleWriter::write(const ColorSample& sample) {
    if (!impl_->stream.is_open()) {
        return ErrorCode::NotInitialized;
    }
    if (sample.channel_count != channelCount(impl_->space)) {
        return ErrorCode::InvalidParameter;
    }

    impl_->stream << formatSampleRow(sample) << '\n';
    if (!impl_->stream) {
        detail::getLogger("facemask.csv")->error(
            "write failed on {} after {} rows", impl_->path, impl_->rows);
        return ErrorCode::SampleFileWriteFailed;
    }
    ++impl_->rows;
    return ErrorCode::Success;
}

ErrorCode SampleWriter::close() {
    if (!impl_ || !impl_->stream.is_open()) {
        return ErrorCode::Success;
    }

    auto logger = detail::getLogger("facemask.csv");
    impl_->stream.flush();
    const bool flushed = static_cast<bool>(impl_->stream);
    impl_->stream.close();

    if (!flushed) {
        logger->error("{}: flush failed, sample file is incomplete", impl_->path);
        return ErrorCode::SampleFileWriteFailed;
    }
    logger->debug("{}: {} rows written", impl_->path, impl_->rows);
    return ErrorCode::Success;
}

bool SampleWriter::isOpen() const {
    return impl_->stream.is_open();
}

int64_t SampleWriter::rowsWritten() const {
    return impl_->rows;
}

ColorSpace SampleWriter::colorSpace() const {
    return impl_->space;
}

} // namespace facemask
