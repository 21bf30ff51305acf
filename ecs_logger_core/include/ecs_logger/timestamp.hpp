#pragma once
#include <cstddef>
#include <cstdint>

namespace ecs_logger
{

// "YYYY-MM-DDTHH:MM:SS.nnnnnnnnnZ" 加结尾 '\0'
constexpr size_t kRfc3339NsBufferSize = 31;

uint64_t wall_clock_now_ns();

// RFC 3339, UTC, nine fractional digits. Returns 0 when buf is too small.
size_t format_rfc3339_ns(uint64_t wall_ns, char* buf, size_t buf_size);

}  // namespace ecs_logger
