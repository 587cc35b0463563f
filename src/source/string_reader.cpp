#include "stream_ingest/positional_reader.hpp"
#include <algorithm>
#include <cstring>

namespace si {

StringReader::StringReader(std::string data, std::size_t max_bytes_per_read)
  : data_(std::move(data)), max_per_read_(max_bytes_per_read) {}

ReadResult StringReader::read_at(char* dst, std::size_t capacity, std::uint64_t offset) {
  ++reads_;
  ReadResult r;
  if (offset >= data_.size()) { r.eof = true; return r; }

  std::size_t want = capacity;
  if (max_per_read_ > 0) want = std::min(want, max_per_read_);
  const std::size_t left = data_.size() - static_cast<std::size_t>(offset);
  r.bytes = std::min(want, left);
  std::memcpy(dst, data_.data() + offset, r.bytes);
  r.eof = (offset + r.bytes == data_.size());
  return r;
}

}
