#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

#include "log_level.hpp"

namespace ecs_logger {

// 一次格式化调用期间只读借用，不拥有任何字符串
struct LogRecord {
    uint64_t         wall_clock_ns;   // UTC, since Unix epoch

    LogLevel         level;

    std::string_view message;
    std::string_view target;

    std::optional<std::string_view> module_path;
    std::optional<std::string_view> file_path;
    std::optional<uint32_t>         line;
};

} // namespace ecs_logger
