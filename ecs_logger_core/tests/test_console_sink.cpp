#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "ecs_logger/formatters/formatter_interface.hpp"
#include "ecs_logger/log_level.hpp"
#include "ecs_logger/log_record.hpp"
#include "ecs_logger/sinks/console_sink.hpp"

static ecs_logger::LogRecord make_test_record(
    ecs_logger::LogLevel level = ecs_logger::LogLevel::Info)
{
  ecs_logger::LogRecord record{};
  record.wall_clock_ns = 1680254706576136800ULL;
  record.level = level;
  record.message = "test message";
  record.target = "console::tests";
  record.file_path = "/src/main.cpp";
  record.line = 42;
  return record;
}

class MockFormatter : public ecs_logger::IFormatter
{
 public:
  mutable std::string last_formatted;

  size_t Format(const ecs_logger::LogRecord& record, std::string& out) const override
  {
    last_formatted = std::string(record.message);
    out += last_formatted;
    return last_formatted.size();
  }
};

TEST(ConsoleSink, DefaultTargetIsStderr)
{
  ecs_logger::ConsoleSink sink;
  EXPECT_EQ(sink.Target(), ecs_logger::ConsoleTarget::Stderr);
  EXPECT_EQ(sink.Level(), ecs_logger::LevelFilter::Trace);
  EXPECT_FALSE(sink.HasFormatter());
}

TEST(ConsoleSink, StdoutTarget)
{
  ecs_logger::ConsoleSink sink(ecs_logger::ConsoleTarget::Stdout);
  EXPECT_EQ(sink.Target(), ecs_logger::ConsoleTarget::Stdout);
}

TEST(ConsoleSink, SetLevel)
{
  ecs_logger::ConsoleSink sink;
  sink.SetLevel(ecs_logger::LevelFilter::Warn);
  EXPECT_EQ(sink.Level(), ecs_logger::LevelFilter::Warn);
  EXPECT_FALSE(sink.ShouldLog(ecs_logger::LogLevel::Info));
  EXPECT_TRUE(sink.ShouldLog(ecs_logger::LogLevel::Error));
}

TEST(ConsoleSink, WriteToStdoutSucceeds)
{
  ecs_logger::ConsoleSink sink(ecs_logger::ConsoleTarget::Stdout);
  EXPECT_EQ(sink.Write(make_test_record()), ecs_logger::Status::Ok);
  sink.Flush();
}

TEST(ConsoleSink, WriteUsesCustomFormatter)
{
  ecs_logger::ConsoleSink sink(ecs_logger::ConsoleTarget::Stdout);
  auto formatter = std::make_unique<MockFormatter>();
  MockFormatter* raw = formatter.get();
  sink.SetFormatter(std::move(formatter));
  EXPECT_TRUE(sink.HasFormatter());

  EXPECT_EQ(sink.Write(make_test_record()), ecs_logger::Status::Ok);
  EXPECT_EQ(raw->last_formatted, "test message");
}

TEST(ConsoleSink, FilteredRecordIsNotFormatted)
{
  ecs_logger::ConsoleSink sink(ecs_logger::ConsoleTarget::Stdout);
  auto formatter = std::make_unique<MockFormatter>();
  MockFormatter* raw = formatter.get();
  sink.SetFormatter(std::move(formatter));
  sink.SetLevel(ecs_logger::LevelFilter::Off);

  EXPECT_EQ(sink.Write(make_test_record(ecs_logger::LogLevel::Error)), ecs_logger::Status::Ok);
  EXPECT_TRUE(raw->last_formatted.empty());
}

TEST(ConsoleSink, ConcurrentLinesDoNotInterleave)
{
  constexpr int kThreads = 4;
  constexpr int kPerThread = 100;

  ecs_logger::ConsoleSink sink(ecs_logger::ConsoleTarget::Stdout);
  testing::internal::CaptureStdout();
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t)
  {
    threads.emplace_back(
        [&sink]()
        {
          for (int i = 0; i < kPerThread; ++i)
          {
            EXPECT_EQ(sink.Write(make_test_record()), ecs_logger::Status::Ok);
          }
        });
  }
  for (auto& th : threads)
  {
    th.join();
  }
  sink.Flush();
  std::string output = testing::internal::GetCapturedStdout();

  std::istringstream lines(output);
  std::string line;
  int count = 0;
  while (std::getline(lines, line))
  {
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find("\"message\":\"test message\""), std::string::npos);
    ++count;
  }
  EXPECT_EQ(count, kThreads * kPerThread);
}
