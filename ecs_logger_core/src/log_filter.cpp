#include "ecs_logger/log_filter.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

#include "ecs_logger/platform.hpp"

namespace ecs_logger
{

namespace
{

std::string_view trim(std::string_view s)
{
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
  {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
  {
    s.remove_suffix(1);
  }
  return s;
}

bool target_matches(std::string_view directive_target, std::string_view target)
{
  if (directive_target.empty())
  {
    return true;
  }
  if (target.size() < directive_target.size() ||
      target.compare(0, directive_target.size(), directive_target) != 0)
  {
    return false;
  }
  std::string_view rest = target.substr(directive_target.size());
  return rest.empty() || rest.compare(0, 2, "::") == 0;
}

void report_invalid(std::string_view directive)
{
  std::fprintf(stderr, "ecs_logger: ignoring invalid filter directive '%.*s'\n",
               static_cast<int>(directive.size()), directive.data());
}

}  // namespace

LogFilter::LogFilter() : LogFilter(Parse(ECS_LOG_DEFAULT_FILTER)) {}

LogFilter::LogFilter(std::vector<Directive> directives) : directives_(std::move(directives)) {}

LogFilter LogFilter::Parse(std::string_view spec)
{
  LogFilter filter{std::vector<Directive>{}};

  // 不支持 env_logger 的 "/regex" 后缀
  size_t slash = spec.find('/');
  if (slash != std::string_view::npos)
  {
    report_invalid(spec.substr(slash));
    spec = spec.substr(0, slash);
  }

  while (!spec.empty())
  {
    size_t comma = spec.find(',');
    std::string_view part = trim(spec.substr(0, comma));
    spec = (comma == std::string_view::npos) ? std::string_view{} : spec.substr(comma + 1);
    if (part.empty())
    {
      continue;
    }

    size_t eq = part.find('=');
    if (eq == std::string_view::npos)
    {
      // "info" 是默认级别，"net" 是打开全部级别的 target
      if (auto level = parse_level_filter(part))
      {
        filter.Insert({std::string{}, *level});
      }
      else
      {
        filter.Insert({std::string(part), LevelFilter::Trace});
      }
      continue;
    }

    std::string_view target = trim(part.substr(0, eq));
    std::string_view level_name = trim(part.substr(eq + 1));
    if (part.find('=', eq + 1) != std::string_view::npos)
    {
      report_invalid(part);
      continue;
    }
    auto level = parse_level_filter(level_name);
    if (target.empty() || !level)
    {
      report_invalid(part);
      continue;
    }
    filter.Insert({std::string(target), *level});
  }

  if (filter.directives_.empty())
  {
    filter.Insert({std::string{}, LevelFilter::Error});
  }
  return filter;
}

bool LogFilter::Enabled(LogLevel level, std::string_view target) const
{
  for (const auto& directive : directives_)
  {
    if (target_matches(directive.target, target))
    {
      return allows(directive.level, level);
    }
  }
  return false;
}

LevelFilter LogFilter::MaxLevel() const
{
  LevelFilter max_level = LevelFilter::Off;
  for (const auto& directive : directives_)
  {
    if (directive.level < max_level)
    {
      max_level = directive.level;
    }
  }
  return max_level;
}

void LogFilter::Insert(Directive directive)
{
  auto same = std::find_if(directives_.begin(), directives_.end(),
                           [&](const Directive& d) { return d.target == directive.target; });
  if (same != directives_.end())
  {
    same->level = directive.level;
    return;
  }
  auto pos = std::find_if(directives_.begin(), directives_.end(),
                          [&](const Directive& d)
                          { return d.target.size() < directive.target.size(); });
  directives_.insert(pos, std::move(directive));
}

}  // namespace ecs_logger
