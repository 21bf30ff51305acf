#pragma once
#include <mutex>
#include <string>

#include "sink_interface.hpp"

namespace ecs_logger
{

class FileSink : public ILogSink
{
 public:
  // path: e.g. "/var/log/app.json"，以追加方式打开
  explicit FileSink(const std::string& path);
  ~FileSink();

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  Status Write(const LogRecord& record) override;
  void Flush() override;

  bool IsOpen() const { return fd_ >= 0; }
  const std::string& Path() const { return path_; }

 private:
  std::string path_;
  int fd_;
  std::mutex write_mutex_;

  void OpenFile();
};

}  // namespace ecs_logger
