#pragma once

#include <cstdlib>
#include <memory>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tr2collapse {
namespace log {

inline constexpr const char* LOGGER_NAME = "tr2collapse";
inline constexpr const char* DEFAULT_PATTERN = "[%^%l%$] %v";

// stdout 只留给折叠结果, 所有诊断都走 stderr
inline std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_pattern(DEFAULT_PATTERN);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

/**
 * @brief --debug 等级到日志等级的映射
 *
 * 0: 只输出 warn 及以上
 * 1: 可恢复的异常数据 (丢弃的行/region, 信号代替 exit 等)
 * 2+: 全部, 包括逐行回显
 */
inline spdlog::level::level_enum level_for_debug(int debug_level) {
    if (debug_level <= 0) return spdlog::level::warn;
    if (debug_level == 1) return spdlog::level::debug;
    return spdlog::level::trace;
}

inline void init_logging(int debug_level) {
    auto lg = logger();

    if (const char* level = std::getenv("TR2COLLAPSE_LOG_LEVEL")) {
        lg->set_level(spdlog::level::from_str(level));
    } else {
        lg->set_level(level_for_debug(debug_level));
    }

    if (const char* pattern = std::getenv("TR2COLLAPSE_LOG_PATTERN")) {
        lg->set_pattern(pattern);
    } else {
        lg->set_pattern(DEFAULT_PATTERN);
    }

    lg->flush_on(spdlog::level::warn);
}

inline void shutdown_logging() {
    logger()->flush();
    spdlog::shutdown();
}

} // namespace log
} // namespace tr2collapse
