#include "ecs_logger/sinks/file_sink.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace ecs_logger {

FileSink::FileSink(const std::string& path)
    : path_(path)
    , fd_(-1)
{
    OpenFile();
}

FileSink::~FileSink() {
    if (fd_ >= 0) {
        ::fsync(fd_);
        ::close(fd_);
        fd_ = -1;
    }
}

void FileSink::OpenFile() {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        std::fprintf(stderr, "FileSink: failed to open '%s': %s\n",
                     path_.c_str(), std::strerror(errno));
    }
}

Status FileSink::Write(const LogRecord& record) {
    if (!ShouldLog(record.level)) {
        return Status::Ok;
    }
    if (fd_ < 0) {
        return Status::WriteFailed;
    }

    std::string line = FormatLine(record);

    std::lock_guard<std::mutex> lock(write_mutex_);
    const char* data = line.data();
    size_t remaining = line.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Status::WriteFailed;
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    return Status::Ok;
}

void FileSink::Flush() {
    if (fd_ >= 0) {
        ::fdatasync(fd_);
    }
}

} // namespace ecs_logger
