#include "ecs_logger/timestamp.hpp"
#include "ecs_logger/platform.hpp"
#include <cstdio>
#include <ctime>

#if defined(ECS_LOG_PLATFORM_LINUX) || defined(ECS_LOG_PLATFORM_MACOS)

#include <time.h>

namespace ecs_logger {

uint64_t wall_clock_now_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL
         + static_cast<uint64_t>(ts.tv_nsec);
}

static bool utc_calendar(time_t sec, struct tm& tm_out) {
    return gmtime_r(&sec, &tm_out) != nullptr;
}

} // namespace ecs_logger

#elif defined(ECS_LOG_PLATFORM_WINDOWS)

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

namespace ecs_logger {

uint64_t wall_clock_now_ns() {
    FILETIME ft;
    GetSystemTimePreciseAsFileTime(&ft);
    uint64_t ticks = (static_cast<uint64_t>(ft.dwHighDateTime) << 32)
                   | static_cast<uint64_t>(ft.dwLowDateTime);
    // FILETIME epoch: 1601-01-01, Unix epoch offset: 11644473600 seconds
    constexpr uint64_t epoch_offset = 11644473600ULL * 10'000'000ULL;
    return (ticks - epoch_offset) * 100ULL;
}

static bool utc_calendar(time_t sec, struct tm& tm_out) {
    return gmtime_s(&tm_out, &sec) == 0;
}

} // namespace ecs_logger

#endif

namespace ecs_logger {

size_t format_rfc3339_ns(uint64_t wall_ns, char* buf, size_t buf_size) {
    if (buf_size < kRfc3339NsBufferSize) return 0;
    time_t sec = static_cast<time_t>(wall_ns / 1'000'000'000ULL);
    auto ns = static_cast<uint32_t>(wall_ns % 1'000'000'000ULL);
    struct tm tm_val{};
    if (!utc_calendar(sec, tm_val)) return 0;
    int n = snprintf(buf, buf_size, "%04d-%02d-%02dT%02d:%02d:%02d.%09uZ",
                     tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                     tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec, ns);
    return (n > 0 && static_cast<size_t>(n) < buf_size)
         ? static_cast<size_t>(n) : 0;
}

} // namespace ecs_logger
