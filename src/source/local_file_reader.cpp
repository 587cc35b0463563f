#include "stream_ingest/positional_reader.hpp"
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>
#include <fcntl.h>
#include <unistd.h>

namespace si {

LocalFileReader::LocalFileReader(std::string path) : path_(std::move(path)) {}

LocalFileReader::~LocalFileReader() {
  if (fd_ >= 0) ::close(fd_);
}

ReadResult LocalFileReader::read_at(char* dst, std::size_t capacity, std::uint64_t offset) {
  ReadResult r;
  if (fd_ < 0) {
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
      r.ec = std::error_code(errno, std::generic_category());
      r.message = "open " + path_ + ": " + r.ec.message();
      return r;
    }
  }

  std::size_t got = 0;
  while (got < capacity) {
    ssize_t n = ::pread(fd_, dst + got, capacity - got, static_cast<off_t>(offset + got));
    if (n < 0) {
      if (errno == EINTR) continue;
      r.ec = std::error_code(errno, std::generic_category());
      r.message = "pread " + path_ + " at " + std::to_string(offset + got) + ": " + r.ec.message();
      return r;
    }
    if (n == 0) { r.eof = true; break; }
    got += static_cast<std::size_t>(n);
  }
  r.bytes = got;
  return r;
}

}
