#pragma once
#include <memory>
#include <string>

#include "../formatters/ecs_formatter.hpp"
#include "../formatters/formatter_interface.hpp"
#include "../log_level.hpp"
#include "../log_record.hpp"
#include "../status.hpp"

namespace ecs_logger
{

class ILogSink
{
 public:
  virtual ~ILogSink() = default;

  // 写入一条日志（调用线程同步执行，可并发调用），每次恰好一行
  virtual Status Write(const LogRecord& record) = 0;

  // 刷新缓冲区
  virtual void Flush() = 0;

  // 设置该 Sink 的格式化器（需在开始写日志之前完成）
  void SetFormatter(std::unique_ptr<IFormatter> formatter)
  {
    formatter_ = std::move(formatter);
  }

  bool HasFormatter() const { return formatter_ != nullptr; }

  // 设置该 Sink 的最低输出级别（独立于 Logger 的过滤规则）
  void SetLevel(LevelFilter level) { min_level_ = level; }

  LevelFilter Level() const { return min_level_; }

  // Sink 级别过滤
  bool ShouldLog(LogLevel record_level) const { return allows(min_level_, record_level); }

 protected:
  std::unique_ptr<IFormatter> formatter_;
  LevelFilter min_level_ = LevelFilter::Trace;

  // 格式化后的完整一行，结尾带 '\n'；未设置格式化器时使用不带 extra fields 的 EcsFormatter
  std::string FormatLine(const LogRecord& record) const
  {
    static const EcsFormatter kPlainFormatter{};
    std::string line;
    line.reserve(256);
    if (formatter_)
    {
      formatter_->Format(record, line);
    }
    else
    {
      kPlainFormatter.Format(record, line);
    }
    line += '\n';
    return line;
  }
};

}  // namespace ecs_logger
