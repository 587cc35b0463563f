#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

namespace si {

struct ReadResult {
  std::size_t bytes = 0;   // bytes copied into the caller's buffer
  bool eof = false;        // no bytes exist past offset + bytes
  std::error_code ec;      // set on failure; bytes/eof are then meaningless
  std::string message;

  bool ok() const noexcept { return !ec; }
};

// Offset-addressed reads against a local file or a remote object.
// A reader is driven by exactly one thread at a time.
class PositionalReader {
public:
  virtual ~PositionalReader() = default;

  virtual ReadResult read_at(char* dst, std::size_t capacity, std::uint64_t offset) = 0;

  // Human readable origin for logs and the run summary.
  virtual std::string describe() const = 0;
};

// pread(2) over a local file; the descriptor is opened on first use.
class LocalFileReader : public PositionalReader {
public:
  explicit LocalFileReader(std::string path);
  ~LocalFileReader() override;

  LocalFileReader(const LocalFileReader&) = delete;
  LocalFileReader& operator=(const LocalFileReader&) = delete;

  ReadResult read_at(char* dst, std::size_t capacity, std::uint64_t offset) override;
  std::string describe() const override { return path_; }

  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  int fd_{-1};
};

// In-memory source. `max_bytes_per_read` (0 = unlimited) simulates short reads.
class StringReader : public PositionalReader {
public:
  explicit StringReader(std::string data, std::size_t max_bytes_per_read = 0);

  ReadResult read_at(char* dst, std::size_t capacity, std::uint64_t offset) override;
  std::string describe() const override { return "memory"; }

  std::uint64_t reads() const noexcept { return reads_; }

private:
  std::string data_;
  std::size_t max_per_read_;
  std::uint64_t reads_{0};
};

}
