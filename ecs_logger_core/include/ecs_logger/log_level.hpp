#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ecs_logger {

enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4
};

// 过滤阈值，比 LogLevel 多一个 Off
enum class LevelFilter : uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Off   = 5
};

constexpr std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

constexpr std::string_view to_string(LevelFilter filter) {
    switch (filter) {
        case LevelFilter::Trace: return "TRACE";
        case LevelFilter::Debug: return "DEBUG";
        case LevelFilter::Info:  return "INFO";
        case LevelFilter::Warn:  return "WARN";
        case LevelFilter::Error: return "ERROR";
        case LevelFilter::Off:   return "OFF";
    }
    return "UNKNOWN";
}

constexpr bool allows(LevelFilter filter, LogLevel level) {
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(filter);
}

// Case-insensitive: "off", "error", "warn", "info", "debug", "trace".
constexpr std::optional<LevelFilter> parse_level_filter(std::string_view name) {
    constexpr std::string_view kNames[] = {"trace", "debug", "info", "warn", "error", "off"};
    for (size_t i = 0; i < 6; ++i) {
        std::string_view candidate = kNames[i];
        if (candidate.size() != name.size()) {
            continue;
        }
        bool equal = true;
        for (size_t j = 0; j < name.size(); ++j) {
            char c = name[j];
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
            if (c != candidate[j]) {
                equal = false;
                break;
            }
        }
        if (equal) {
            return static_cast<LevelFilter>(i);
        }
    }
    return std::nullopt;
}

// 编译期最低活跃级别（通过 CMake -DECS_LOG_ACTIVE_LEVEL=2 注入，5 表示全部关闭）
#ifndef ECS_LOG_ACTIVE_LEVEL
    #ifdef NDEBUG
        #define ECS_LOG_ACTIVE_LEVEL 2  // Info
    #else
        #define ECS_LOG_ACTIVE_LEVEL 0  // Trace
    #endif
#endif

} // namespace ecs_logger
