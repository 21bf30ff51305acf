#pragma once
#include <cstddef>
#include <string>

#include "../log_record.hpp"

namespace ecs_logger
{

class IFormatter
{
 public:
  virtual ~IFormatter() = default;
  // 追加一行（不含换行符）到 out，返回追加的字节数；可被多个线程同时调用
  virtual size_t Format(const LogRecord& record, std::string& out) const = 0;
};

}  // namespace ecs_logger
