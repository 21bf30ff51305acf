#pragma once
#include <cstdint>
#include <string_view>

namespace ecs_logger {

enum class Status : uint8_t {
    Ok                       = 0,
    // extra fields 无法表示为 JSON object
    SerializationUnsupported = 1,
    // sink 写入失败
    WriteFailed              = 2
};

constexpr std::string_view to_string(Status status) {
    switch (status) {
        case Status::Ok:                       return "ok";
        case Status::SerializationUnsupported: return "the data cannot be converted into a JSON object";
        case Status::WriteFailed:              return "the log line could not be written";
    }
    return "unknown";
}

} // namespace ecs_logger
