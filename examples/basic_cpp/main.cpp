#define ECS_LOG_MODULE "basic_example"
#include <ecs_logger/logger.hpp>
#include <ecs_logger/sinks/callback_sink.hpp>
#include <ecs_logger/sinks/console_sink.hpp>
#include <ecs_logger/sinks/file_sink.hpp>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace
{

struct ServiceInfo
{
  std::string name;
  std::string version;
  std::string environment;
};

void to_json(nlohmann::ordered_json& j, const ServiceInfo& info)
{
  j = nlohmann::ordered_json{
      {"service.name", info.name},
      {"service.version", info.version},
      {"service.environment", info.environment},
  };
}

}  // namespace

int main()
{
  // --- Sink setup ---

  // 1) stdout, filter from $ECS_LOG (everything when unset)
  const char* spec = std::getenv(ECS_LOG_ENV_VAR);
  if (!ecs_logger::LoggerBuilder()
           .Filter(spec ? spec : "trace")
           .WriterStdout()
           .Init())
  {
    std::fprintf(stderr, "logger already initialized\n");
    return 1;
  }

  auto& logger = ecs_logger::Logger::Instance();

  // 2) File sink, warnings and above only
  auto file_sink = std::make_unique<ecs_logger::FileSink>("/tmp/ecs_logger_example.json");
  file_sink->SetLevel(ecs_logger::LevelFilter::Warn);
  logger.AddSink(std::move(file_sink));

  // 3) Callback sink (custom processing)
  logger.AddSink(std::make_unique<ecs_logger::CallbackSink>(
      [](std::string_view line)
      {
        if (line.find("\"log.level\":\"ERROR\"") != std::string_view::npos)
        {
          std::fprintf(stderr, "[ALERT] %.*s\n", static_cast<int>(line.size()), line.data());
        }
        return true;
      }));

  // --- Basic logging ---

  LOG_TRACE("application started");
#ifdef ECS_LOG_USE_FMTLIB
  LOG_DEBUG("debug value: {}", 42);
  LOG_INFO("hello {}, version {}", "world", "1.0");
  LOG_WARN("disk usage at {}%", 85);
  LOG_ERROR("connection failed: {}", "timeout");
#else
  LOG_DEBUG("debug value: %d", 42);
  LOG_INFO("hello %s, version %s", "world", "1.0");
  LOG_WARN("disk usage at %d%%", 85);
  LOG_ERROR("connection failed: %s", "timeout");
#endif

  // --- Explicit target ---

  LOG_TARGET(Info, "basic_example::net", "sending request to api.example.com");

  // --- Extra fields ---

  auto status = ecs_logger::SetExtraFields(ServiceInfo{"basic_example", "1.0.0", "dev"});
  if (status != ecs_logger::Status::Ok)
  {
    std::fprintf(stderr, "extra fields rejected: %s\n", ecs_logger::to_string(status).data());
  }
  LOG_INFO("this line carries the service fields");

  // 数组不是 JSON object：返回错误，之前的 extra fields 保持不变
  status = ecs_logger::SetExtraFields(std::vector<int>{1, 2, 3});
#ifdef ECS_LOG_USE_FMTLIB
  LOG_INFO("array payload: {}", ecs_logger::to_string(status));
#else
  LOG_INFO("array payload: %s", ecs_logger::to_string(status).data());
#endif

  // --- Multi-thread demo ---

  auto worker = [](int id)
  {
    for (int i = 0; i < 3; ++i)
    {
#ifdef ECS_LOG_USE_FMTLIB
      LOG_INFO("task {} processing step {}", id, i);
#else
      LOG_INFO("task %d processing step %d", id, i);
#endif
    }
  };

  std::thread t1(worker, 1);
  std::thread t2(worker, 2);
  t1.join();
  t2.join();

  ecs_logger::ClearExtraFields();

  // --- Shutdown ---

  LOG_INFO("shutting down");
  logger.Flush();

  if (logger.WriteFailureCount() > 0)
  {
    std::fprintf(stderr, "%llu log lines could not be written\n",
                 static_cast<unsigned long long>(logger.WriteFailureCount()));
    return 1;
  }
  return 0;
}
