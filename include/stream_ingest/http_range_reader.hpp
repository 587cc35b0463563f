#pragma once
#include "stream_ingest/positional_reader.hpp"
#include <string>

namespace si {

// Remote object reader over cpp-httplib; each read_at() is one
// `Range: bytes=a-b` GET against the object URL.
class HttpRangeReader : public PositionalReader {
public:
  struct Config {
    int connect_timeout_sec = 10;
    int read_timeout_sec    = 30;
  };

  explicit HttpRangeReader(std::string url);   // uses default Config{}
  HttpRangeReader(std::string url, Config cfg);
  ~HttpRangeReader() override;

  HttpRangeReader(const HttpRangeReader&) = delete;
  HttpRangeReader& operator=(const HttpRangeReader&) = delete;

  ReadResult read_at(char* dst, std::size_t capacity, std::uint64_t offset) override;
  std::string describe() const override;

  // Object size from the last Content-Range header, or -1 if unknown.
  long long object_size() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
