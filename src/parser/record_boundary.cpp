#include "stream_ingest/record_boundary.hpp"

namespace si {

std::size_t record_end(std::string_view bytes, std::size_t from) noexcept {
  if (from >= bytes.size()) return std::string_view::npos;
  std::size_t pos = bytes.find(kRecordTerminator, from);
  return pos == std::string_view::npos ? pos : pos + 1;
}

bool ends_with_terminator(std::string_view bytes) noexcept {
  return !bytes.empty() && bytes.back() == kRecordTerminator;
}

std::string_view trim_cr(std::string_view line) noexcept {
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  return line;
}

}
