/**
 * @file extremum_tracker.h
 * @brief 영상 전체의 단일 채널 최소/최대 색상 추적
 */

#ifndef FACEMASK_EXTREMUM_TRACKER_H
#define FACEMASK_EXTREMUM_TRACKER_H

#include <cstdint>
#include <string>

#include "facemask/export.h"
#include "facemask/types.h"

// OpenCV 전방 선언
namespace cv { class Mat; }

namespace facemask {

class VideoSource;

/// 8비트 채널 최대값 초기 센티널
constexpr int DEFAULT_INITIAL_MAX = 0;

/// 8비트 채널 최소값 초기 센티널
constexpr int DEFAULT_INITIAL_MIN = 255;

/**
 * @brief 단일 채널 극값 추적기
 *
 * 프레임마다 관심 채널의 최대/최소 픽셀(래스터 순서상 첫 번째)을 찾고,
 * 누적 최대값보다 엄격히 클 때만 최대 기록을, 누적 최소값보다
 * 엄격히 작을 때만 최소 기록을 갱신한다. 갱신 시 해당 위치의
 * 전체 BGR 색상을 저장.
 *
 * @note 스레드 안전하지 않음. 병렬 구간 처리 시 구간별 추적기 결과를
 *       combine()으로 프레임 순서대로 병합.
 *
 * 사용 예시:
 * @code
 * ExtremumTracker tracker(FocusChannel::Red);
 * cv::Mat frame;
 * while (source.read(frame)) {
 *     tracker.update(frame);
 * }
 * ExtremumRecord record = tracker.result();
 * @endcode
 */
class FACEMASK_EXPORT ExtremumTracker {
public:
    /**
     * @param channel 관심 채널
     * @param initial_max 누적 최대값 초기 센티널
     * @param initial_min 누적 최소값 초기 센티널
     */
    explicit ExtremumTracker(FocusChannel channel,
                             int initial_max = DEFAULT_INITIAL_MAX,
                             int initial_min = DEFAULT_INITIAL_MIN);

    /**
     * @brief 프레임 하나 반영
     * @param frame BGR 프레임 (CV_8UC3)
     * @return Success 또는 EmptyFrame/InvalidParameter (프레임 미반영)
     */
    ErrorCode update(const cv::Mat& frame);

    /**
     * @brief 현재까지의 결과
     */
    ExtremumRecord result() const { return record_; }

    /**
     * @brief 반영한 프레임 수
     */
    int64_t framesSeen() const noexcept { return frames_seen_; }

    FocusChannel channel() const noexcept { return channel_; }

    /**
     * @brief 초기 상태로 되돌림
     */
    void reset();

    /**
     * @brief 앞 구간과 뒤 구간 결과 병합
     *
     * 순차 처리와 같은 결과가 되도록 뒤 구간 값이 엄격히 더 극단일 때만 교체.
     * later의 프레임 번호는 frame_offset만큼 이동.
     *
     * @param earlier 앞 구간 결과
     * @param later 뒤 구간 결과
     * @param frame_offset 뒤 구간 첫 프레임의 전체 프레임 번호
     */
    static ExtremumRecord combine(const ExtremumRecord& earlier,
                                  const ExtremumRecord& later,
                                  int64_t frame_offset);

    /**
     * @brief 빈 기록 (센티널 값으로 초기화)
     */
    static ExtremumRecord emptyRecord(int initial_max = DEFAULT_INITIAL_MAX,
                                      int initial_min = DEFAULT_INITIAL_MIN);

private:
    FocusChannel channel_;
    int initial_max_;
    int initial_min_;
    ExtremumRecord record_;
    int64_t frames_seen_ = 0;
};

/**
 * @brief 입력 영상 전체를 한 번 훑어 극값 계산
 * @param source 열린 입력
 * @param channel 관심 채널
 * @param out_record 출력 기록
 * @return Success 또는 NotInitialized(입력이 열리지 않음)
 */
FACEMASK_EXPORT ErrorCode scanVideo(VideoSource& source,
                                    FocusChannel channel,
                                    ExtremumRecord& out_record);

/**
 * @brief 영상 파일의 극값 색상 계산
 * @param path 영상 파일 경로
 * @param channel 관심 채널
 * @param out_record 출력 기록
 * @return Success, InvalidPath 또는 SourceOpenFailed
 */
FACEMASK_EXPORT ErrorCode findExtremumColors(const std::string& path,
                                             FocusChannel channel,
                                             ExtremumRecord& out_record);

/**
 * @brief BGR 프레임에서 관심 채널 인덱스 (Blue = 0, Green = 1, Red = 2)
 */
FACEMASK_EXPORT int bgrChannelIndex(FocusChannel channel);

} // namespace facemask

#endif // FACEMASK_EXTREMUM_TRACKER_H
