/**
 * @file logging.h
 * @brief 내부 로거 접근자 (spdlog)
 *
 * 서브시스템별 이름 있는 로거를 기본 로거에서 복제하여 사용.
 * 레벨은 매 조회 시 기본 로거 레벨과 동기화.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace facemask {
namespace detail {

/**
 * @brief 이름 있는 로거 조회 (최초 조회 시 기본 로거에서 복제)
 * @param name 로거 이름 (예: "facemask.pipeline")
 */
inline std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    static std::mutex mutex;
    static std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;

    std::lock_guard<std::mutex> lock(mutex);
    auto& logger = loggers[name];
    if (!logger) {
        logger = spdlog::default_logger()->clone(name);
    }
    logger->set_level(spdlog::default_logger()->level());
    return logger;
}

} // namespace detail
} // namespace facemask
