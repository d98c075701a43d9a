/**
 * @file sample_writer.h
 * @brief 프레임별 색상 샘플 CSV 출력
 *
 * 헤더 (색 공간별):
 * - RGB:       Timestamp,Red,Green,Blue
 * - HSV:       Timestamp,Hue,Saturation,Value
 * - Grayscale: Timestamp,Value
 *
 * 값은 소수점 5자리 고정, 무효 샘플 채널은 "nan".
 */

#ifndef FACEMASK_SAMPLE_WRITER_H
#define FACEMASK_SAMPLE_WRITER_H

#include <cstdint>
#include <memory>
#include <string>

#include "facemask/export.h"
#include "facemask/types.h"

namespace facemask {

/**
 * @brief 색 공간별 CSV 헤더 (개행 제외)
 */
FACEMASK_EXPORT std::string csvHeader(ColorSpace space);

/**
 * @brief 색 공간별 파일명 접미사 ("RGB", "HSV", "GRAYSCALE")
 */
FACEMASK_EXPORT const char* sampleFileSuffix(ColorSpace space);

/**
 * @brief 샘플 한 행 포맷 (개행 제외)
 * @param sample 색상 샘플 (channel_count개 채널 사용)
 */
FACEMASK_EXPORT std::string formatSampleRow(const ColorSample& sample);

/**
 * @brief CSV 샘플 파일 기록기
 *
 * 소멸 시 파일을 닫는다.
 */
class FACEMASK_EXPORT SampleWriter {
public:
    SampleWriter();
    ~SampleWriter();

    // 복사 금지
    SampleWriter(const SampleWriter&) = delete;
    SampleWriter& operator=(const SampleWriter&) = delete;

    /**
     * @brief 파일 생성 및 헤더 기록
     * @param path 출력 파일 경로 (기존 파일 덮어씀)
     * @param space 색 공간
     * @return Success 또는 SampleFileOpenFailed
     */
    ErrorCode open(const std::string& path, ColorSpace space);

    /**
     * @brief 샘플 한 행 기록
     * @return Success, NotInitialized, InvalidParameter (채널 수 불일치)
     *         또는 SampleFileWriteFailed (스트림 오류)
     */
    ErrorCode write(const ColorSample& sample);

    /**
     * @brief 버퍼 비우고 파일 닫기
     * @return Success 또는 SampleFileWriteFailed (flush 실패). 열려 있지 않으면 Success
     */
    ErrorCode close();

    bool isOpen() const;

    /**
     * @brief 기록한 데이터 행 수 (헤더 제외)
     */
    int64_t rowsWritten() const;

    ColorSpace colorSpace() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace facemask

#endif // FACEMASK_SAMPLE_WRITER_H
