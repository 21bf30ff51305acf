#pragma once
#include <cstdint>
#include <cstdio>
#include <mutex>

#include "sink_interface.hpp"

namespace ecs_logger
{

enum class ConsoleTarget : uint8_t
{
  Stderr,
  Stdout
};

class ConsoleSink : public ILogSink
{
 public:
  explicit ConsoleSink(ConsoleTarget target = ConsoleTarget::Stderr);

  Status Write(const LogRecord& record) override;
  void Flush() override;

  ConsoleTarget Target() const { return target_; }

 private:
  ConsoleTarget target_;
  FILE* stream_;
  std::mutex write_mutex_;
};

}  // namespace ecs_logger
