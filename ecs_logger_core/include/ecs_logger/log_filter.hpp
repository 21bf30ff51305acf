#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "log_level.hpp"

namespace ecs_logger
{

// Directive-based filter, e.g. "warn,net=debug,net::tls=off".
//
// Each comma-separated directive is `level`, `target` or `target=level`. A
// bare target enables every level for that target. The directive with the
// longest target matching the record wins; a target matches itself and every
// `target::...` below it. Records matched by no directive are dropped. A string
// without any valid directive enables errors only.
//
// Unlike env_logger, matching stops at `::` boundaries: `net` does not match
// `network`. env_logger's `/regex` message filter is not supported; the suffix
// is reported on stderr and ignored.
class LogFilter
{
 public:
  struct Directive
  {
    std::string target;  // empty: applies to every target
    LevelFilter level;
  };

  // ECS_LOG_DEFAULT_FILTER
  LogFilter();

  static LogFilter Parse(std::string_view spec);

  bool Enabled(LogLevel level, std::string_view target) const;

  // 所有规则中最详细的级别，用于宏里的快速判断
  LevelFilter MaxLevel() const;

  const std::vector<Directive>& Directives() const { return directives_; }

 private:
  explicit LogFilter(std::vector<Directive> directives);

  void Insert(Directive directive);

  // 按 target 长度降序，同名规则后者覆盖前者
  std::vector<Directive> directives_;
};

}  // namespace ecs_logger
