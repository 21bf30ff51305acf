#pragma once
#include <functional>
#include <mutex>
#include <string_view>

#include "sink_interface.hpp"

namespace ecs_logger
{

class CallbackSink : public ILogSink
{
 public:
  // 参数为格式化后的一行（不含 '\n'），返回 false 表示写入失败。
  // 回调在该 Sink 的锁内串行执行；回调里再写日志时，该记录不能再路由回同一个 Sink
  using Callback = std::function<bool(std::string_view line)>;

  explicit CallbackSink(Callback cb);

  Status Write(const LogRecord& record) override;
  void Flush() override;

 private:
  Callback callback_;
  std::mutex write_mutex_;
};

}  // namespace ecs_logger
