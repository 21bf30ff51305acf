#pragma once
#include "log_level.hpp"
#include "log_record.hpp"
#include "log_filter.hpp"
#include "extra_fields.hpp"
#include "platform.hpp"
#include "source_location.hpp"
#include "status.hpp"
#include "timestamp.hpp"
#include "sinks/sink_interface.hpp"

#include <atomic>
#include <cstdio>  // snprintf fallback
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifdef ECS_LOG_USE_FMTLIB
#include <fmt/format.h>
#endif

// 翻译单元可在 include 之前定义：写入 log.origin.cpp.module_path，并作为默认 target
#ifndef ECS_LOG_MODULE
    #define ECS_LOG_MODULE nullptr
#endif

namespace ecs_logger {

class Logger {
public:
    // 进程级 logger，首次使用时构造，进程退出时析构
    static Logger& Instance();

    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<ExtraFieldsStore> ExtraFields() const { return extra_fields_; }

    // Sinks without a formatter get an EcsFormatter bound to this logger's extra fields.
    void AddSink(std::unique_ptr<ILogSink> sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetFilter(LogFilter filter);
    void SetLevel(LevelFilter level);
    // Filter from the environment variable `var`; ECS_LOG_DEFAULT_FILTER when unset.
    void InitFromEnv(const char* var = ECS_LOG_ENV_VAR);
    LogFilter Filter() const;
    LevelFilter MaxLevel() const;
    bool Enabled(LogLevel level, std::string_view target) const;

    // Filters, then writes the record to every sink on the calling thread.
    // WriteFailed when any sink failed. No logger lock is held while sinks
    // write, so a sink may log through this logger again.
    Status Log(const LogRecord& record);
    void Flush();

    uint64_t WriteFailureCount() const;
    void ResetWriteFailureCount();

    // Core log method, defined in header
    template <typename... Args>
    Status LogImpl(LogLevel level, const char* target, const SourceLocation& loc,
                   const char* module_path, const char* fmt_str, Args&&... args);

private:
    friend class LoggerBuilder;

    using SinkList = std::vector<std::shared_ptr<ILogSink>>;

    std::shared_ptr<const SinkList> Sinks() const;

    std::shared_ptr<ExtraFieldsStore> extra_fields_;

    // 写时复制：Log() 在锁内只复制指针
    mutable std::shared_mutex config_mutex_;
    std::shared_ptr<const SinkList> sinks_;
    LogFilter filter_;

    std::atomic<LevelFilter> max_level_;
    std::atomic<uint64_t> write_failures_{0};
    std::atomic<bool> initialized_{false};
};

// Configures Logger::Instance() once per process, or builds a standalone logger.
class LoggerBuilder {
public:
    LoggerBuilder();

    LoggerBuilder& Filter(std::string_view spec);
    LoggerBuilder& Sink(std::unique_ptr<ILogSink> sink);
    LoggerBuilder& WriterStdout();
    LoggerBuilder& WriterStderr();

    // false when the logger was already initialized; the logger is left untouched
    bool Init();

    // A configured logger that is not installed as Logger::Instance().
    std::unique_ptr<Logger> Build();

private:
    void Configure(Logger& logger);

    std::string filter_spec_;
    std::unique_ptr<ILogSink> sink_;
};

// Reads the filter from ECS_LOG_ENV_VAR and logs to stderr.
bool TryInit();
void Init();

template <typename T>
Status SetExtraFields(const T& payload) {
    return Logger::Instance().ExtraFields()->Set(payload);
}

void ClearExtraFields();

namespace detail {

template <typename... Args>
std::string format_message(const char* fmt_str, Args&&... args) {
#ifdef ECS_LOG_USE_FMTLIB
    try {
        return fmt::format(fmt::runtime(fmt_str), std::forward<Args>(args)...);
    } catch (const fmt::format_error&) {
        return std::string(fmt_str);
    }
#else
    int n = std::snprintf(nullptr, 0, fmt_str, args...);
    if (n <= 0) {
        return std::string();
    }
    std::string msg(static_cast<size_t>(n), '\0');
    std::snprintf(msg.data(), msg.size() + 1, fmt_str, args...);
    return msg;
#endif
}

} // namespace detail

// ===== LogImpl template implementation =====

template <typename... Args>
Status Logger::LogImpl(LogLevel level, const char* target, const SourceLocation& loc,
                       const char* module_path, const char* fmt_str, Args&&... args) {
    LogRecord record{};

    // 1. Timestamp
    record.wall_clock_ns = wall_clock_now_ns();

    // 2. Level
    record.level = level;

    // 3. Source location
    if (loc.file_path) record.file_path = loc.file_path;
    if (loc.line > 0)  record.line = loc.line;
    if (module_path)   record.module_path = module_path;

    // 4. Target
    if (target) {
        record.target = target;
    } else if (module_path) {
        record.target = module_path;
    } else if (loc.file_name) {
        record.target = loc.file_name;
    }

    // 5. Format message
    std::string message = detail::format_message(fmt_str, std::forward<Args>(args)...);
    record.message = message;

    // 6. Write
    return Log(record);
}

} // namespace ecs_logger

// ===== Logging macros =====

#define ECS_LOG_CALL(lvl, target, fmt_str, ...) \
    do { \
        constexpr auto _ecs_lvl = ::ecs_logger::LogLevel::lvl; \
        if (static_cast<int>(_ecs_lvl) >= ECS_LOG_ACTIVE_LEVEL) { \
            auto& _ecs_logger = ::ecs_logger::Logger::Instance(); \
            if (::ecs_logger::allows(_ecs_logger.MaxLevel(), _ecs_lvl)) { \
                static_cast<void>(_ecs_logger.LogImpl( \
                    _ecs_lvl, target, ECS_LOG_CURRENT_LOCATION(), \
                    ECS_LOG_MODULE, fmt_str, ##__VA_ARGS__)); \
            } \
        } \
    } while (0)

#define LOG_TRACE(fmt, ...) ECS_LOG_CALL(Trace, nullptr, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) ECS_LOG_CALL(Debug, nullptr, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  ECS_LOG_CALL(Info,  nullptr, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  ECS_LOG_CALL(Warn,  nullptr, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) ECS_LOG_CALL(Error, nullptr, fmt, ##__VA_ARGS__)

// Explicit target, e.g. LOG_TARGET(Info, "net::http", "status %d", 200)
#define LOG_TARGET(lvl, target, fmt, ...) ECS_LOG_CALL(lvl, target, fmt, ##__VA_ARGS__)
