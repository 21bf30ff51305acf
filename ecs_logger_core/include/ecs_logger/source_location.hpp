#pragma once
#include <cstdint>
#include <string_view>

namespace ecs_logger {

struct SourceLocation {
    const char* file_path;
    const char* file_name;
    uint32_t    line;

    static constexpr const char* extract_filename(const char* path) {
        const char* name = path;
        for (const char* p = path; *p != '\0'; ++p) {
            if (*p == '/' || *p == '\\') name = p + 1;
        }
        return name;
    }

    static constexpr std::string_view extract_filename(std::string_view path) {
        size_t pos = path.find_last_of("/\\");
        return pos == std::string_view::npos ? path : path.substr(pos + 1);
    }
};

#if __cplusplus >= 202002L && __has_include(<source_location>)
    #include <source_location>
    #define ECS_LOG_HAS_SOURCE_LOCATION 1
    #define ECS_LOG_CURRENT_LOCATION() \
        ::ecs_logger::SourceLocation { \
            std::source_location::current().file_name(), \
            ::ecs_logger::SourceLocation::extract_filename(std::source_location::current().file_name()), \
            std::source_location::current().line() \
        }
#else
    #define ECS_LOG_HAS_SOURCE_LOCATION 0
    #define ECS_LOG_CURRENT_LOCATION() \
        ::ecs_logger::SourceLocation { \
            __FILE__, \
            ::ecs_logger::SourceLocation::extract_filename(__FILE__), \
            static_cast<uint32_t>(__LINE__) \
        }
#endif

} // namespace ecs_logger
