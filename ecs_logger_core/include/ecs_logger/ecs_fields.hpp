#pragma once
#include <string_view>

// Field names of the ECS logging layout: https://github.com/elastic/ecs-logging/tree/main/spec
namespace ecs_logger::ecs {

inline constexpr std::string_view kVersion = "1.12.1";

// Top-level keys; extra fields may never replace them.
inline constexpr std::string_view kTimestamp  = "@timestamp";
inline constexpr std::string_view kLogLevel   = "log.level";
inline constexpr std::string_view kMessage    = "message";
inline constexpr std::string_view kEcsVersion = "ecs.version";
inline constexpr std::string_view kLogOrigin  = "log.origin";

inline constexpr std::string_view kReservedKeys[] = {
    kTimestamp, kLogLevel, kMessage, kEcsVersion, kLogOrigin
};

// Members of log.origin
inline constexpr std::string_view kOriginFile     = "file";
inline constexpr std::string_view kOriginLine     = "line";
inline constexpr std::string_view kOriginName     = "name";
inline constexpr std::string_view kOriginLanguage = "cpp";
inline constexpr std::string_view kOriginTarget   = "target";
inline constexpr std::string_view kOriginModule   = "module_path";
inline constexpr std::string_view kOriginFilePath = "file_path";

constexpr bool is_reserved_key(std::string_view key) {
    for (std::string_view reserved : kReservedKeys) {
        if (reserved == key) {
            return true;
        }
    }
    return false;
}

} // namespace ecs_logger::ecs
