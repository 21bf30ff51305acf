#include "ecs_logger/sinks/callback_sink.hpp"

#include <mutex>
#include <string>

namespace ecs_logger
{

CallbackSink::CallbackSink(Callback cb) : callback_(std::move(cb)) {}

Status CallbackSink::Write(const LogRecord& record)
{
  if (!ShouldLog(record.level) || !callback_)
  {
    return Status::Ok;
  }
  std::string line = FormatLine(record);
  line.pop_back();

  std::lock_guard<std::mutex> lock(write_mutex_);
  return callback_(line) ? Status::Ok : Status::WriteFailed;
}

void CallbackSink::Flush() {}

}  // namespace ecs_logger
