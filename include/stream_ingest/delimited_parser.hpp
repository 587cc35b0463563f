#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace si {

struct ParseConfig {
  char delimiter = ',';
  char comment   = '\0';          // lines starting with this byte are skipped; '\0' disables
  bool strip_cr  = true;          // trim trailing '\r' (CRLF)
  bool skip_empty_lines = true;
  std::size_t fields_per_record = 0;  // 0 = ragged
};

enum class ParseStatus {
  Record,     // one complete record in `fields`
  Dangling,   // input ended mid-record; offset() is the fragment start
  Exhausted,  // no bytes left
  Malformed,  // complete record rejected; see error()
};

// Bounded-input parser over exactly one byte run. Fields are views into that
// run and stay valid only as long as it does.
class DelimitedParser {
public:
  // With `at_eof` set, end of input also ends a record (end-of-stream flush).
  DelimitedParser(const ParseConfig& cfg, std::string_view input, bool at_eof = false);

  ParseStatus next(std::vector<std::string_view>& fields);

  std::size_t offset() const noexcept { return pos_; }
  std::size_t record_start() const noexcept { return record_start_; }
  std::size_t size() const noexcept { return in_.size(); }
  const std::string& error() const noexcept { return err_; }

private:
  void split(std::string_view line, std::vector<std::string_view>& fields) const;

  ParseConfig cfg_;
  std::string_view in_;
  bool at_eof_;
  std::size_t pos_{0};
  std::size_t record_start_{0};
  std::string err_;
};

}
