#include "ecs_logger/logger.hpp"

#include <cstdlib>
#include <mutex>
#include <utility>

#include "ecs_logger/formatters/ecs_formatter.hpp"
#include "ecs_logger/sinks/console_sink.hpp"

namespace ecs_logger
{

Logger& Logger::Instance()
{
  static Logger inst;
  return inst;
}

Logger::Logger()
    : extra_fields_(std::make_shared<ExtraFieldsStore>()),
      sinks_(std::make_shared<SinkList>()),
      max_level_(filter_.MaxLevel())
{
}

Logger::~Logger() { Flush(); }

std::shared_ptr<const Logger::SinkList> Logger::Sinks() const
{
  std::shared_lock<std::shared_mutex> lock(config_mutex_);
  return sinks_;
}

void Logger::AddSink(std::unique_ptr<ILogSink> sink)
{
  if (!sink)
  {
    return;
  }
  if (!sink->HasFormatter())
  {
    sink->SetFormatter(std::make_unique<EcsFormatter>(extra_fields_));
  }
  std::unique_lock<std::shared_mutex> lock(config_mutex_);
  auto next = std::make_shared<SinkList>(*sinks_);
  next->push_back(std::move(sink));
  sinks_ = std::move(next);
}

void Logger::ClearSinks()
{
  std::shared_ptr<const SinkList> old;
  {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    old = std::exchange(sinks_, std::make_shared<SinkList>());
  }
  // 旧的 sink 在锁外析构（FileSink 会 fsync）
}

size_t Logger::SinkCount() const { return Sinks()->size(); }

void Logger::SetFilter(LogFilter filter)
{
  std::unique_lock<std::shared_mutex> lock(config_mutex_);
  filter_ = std::move(filter);
  max_level_.store(filter_.MaxLevel(), std::memory_order_relaxed);
}

void Logger::SetLevel(LevelFilter level) { SetFilter(LogFilter::Parse(to_string(level))); }

void Logger::InitFromEnv(const char* var)
{
  const char* spec = var ? std::getenv(var) : nullptr;
  SetFilter(spec ? LogFilter::Parse(spec) : LogFilter());
}

LogFilter Logger::Filter() const
{
  std::shared_lock<std::shared_mutex> lock(config_mutex_);
  return filter_;
}

LevelFilter Logger::MaxLevel() const { return max_level_.load(std::memory_order_relaxed); }

bool Logger::Enabled(LogLevel level, std::string_view target) const
{
  std::shared_lock<std::shared_mutex> lock(config_mutex_);
  return filter_.Enabled(level, target);
}

Status Logger::Log(const LogRecord& record)
{
  std::shared_ptr<const SinkList> sinks;
  {
    std::shared_lock<std::shared_mutex> lock(config_mutex_);
    if (!filter_.Enabled(record.level, record.target))
    {
      return Status::Ok;
    }
    sinks = sinks_;
  }

  Status result = Status::Ok;
  for (const auto& sink : *sinks)
  {
    if (sink->Write(record) != Status::Ok)
    {
      result = Status::WriteFailed;
    }
  }
  if (result != Status::Ok)
  {
    write_failures_.fetch_add(1, std::memory_order_relaxed);
  }
  return result;
}

void Logger::Flush()
{
  auto sinks = Sinks();
  for (const auto& sink : *sinks)
  {
    sink->Flush();
  }
}

uint64_t Logger::WriteFailureCount() const
{
  return write_failures_.load(std::memory_order_relaxed);
}

void Logger::ResetWriteFailureCount() { write_failures_.store(0, std::memory_order_relaxed); }

LoggerBuilder::LoggerBuilder() : filter_spec_(ECS_LOG_DEFAULT_FILTER) {}

LoggerBuilder& LoggerBuilder::Filter(std::string_view spec)
{
  filter_spec_ = std::string(spec);
  return *this;
}

LoggerBuilder& LoggerBuilder::Sink(std::unique_ptr<ILogSink> sink)
{
  sink_ = std::move(sink);
  return *this;
}

LoggerBuilder& LoggerBuilder::WriterStdout()
{
  return Sink(std::make_unique<ConsoleSink>(ConsoleTarget::Stdout));
}

LoggerBuilder& LoggerBuilder::WriterStderr()
{
  return Sink(std::make_unique<ConsoleSink>(ConsoleTarget::Stderr));
}

bool LoggerBuilder::Init()
{
  auto& logger = Logger::Instance();
  if (logger.initialized_.exchange(true))
  {
    return false;
  }
  Configure(logger);
  return true;
}

std::unique_ptr<Logger> LoggerBuilder::Build()
{
  auto logger = std::make_unique<Logger>();
  Configure(*logger);
  return logger;
}

void LoggerBuilder::Configure(Logger& logger)
{
  if (!sink_)
  {
    sink_ = std::make_unique<ConsoleSink>(ConsoleTarget::Stderr);
  }
  logger.ClearSinks();
  logger.AddSink(std::move(sink_));
  logger.SetFilter(LogFilter::Parse(filter_spec_));
}

bool TryInit()
{
  LoggerBuilder builder;
  if (const char* spec = std::getenv(ECS_LOG_ENV_VAR))
  {
    builder.Filter(spec);
  }
  return builder.Init();
}

void Init()
{
  if (!TryInit())
  {
    std::fprintf(stderr, "ecs_logger::Init should not be called after the logger is initialized\n");
  }
}

void ClearExtraFields() { Logger::Instance().ExtraFields()->Clear(); }

}  // namespace ecs_logger
