#include "ecs_logger/sinks/console_sink.hpp"

#include <mutex>
#include <string>

namespace ecs_logger
{

ConsoleSink::ConsoleSink(ConsoleTarget target)
    : target_(target), stream_(target == ConsoleTarget::Stdout ? stdout : stderr)
{
}

Status ConsoleSink::Write(const LogRecord& record)
{
  if (!ShouldLog(record.level))
  {
    return Status::Ok;
  }

  std::string line = FormatLine(record);

  // 单次 fwrite，多线程下行不会交错
  std::lock_guard<std::mutex> lock(write_mutex_);
  size_t written = std::fwrite(line.data(), 1, line.size(), stream_);
  if (written != line.size() || std::ferror(stream_) != 0)
  {
    std::clearerr(stream_);
    return Status::WriteFailed;
  }
  return Status::Ok;
}

void ConsoleSink::Flush()
{
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::fflush(stream_);
}

}  // namespace ecs_logger
