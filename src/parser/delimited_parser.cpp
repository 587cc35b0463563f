#include "stream_ingest/delimited_parser.hpp"
#include "stream_ingest/record_boundary.hpp"

namespace si {

DelimitedParser::DelimitedParser(const ParseConfig& cfg, std::string_view input, bool at_eof)
  : cfg_(cfg), in_(input), at_eof_(at_eof) {}

void DelimitedParser::split(std::string_view line, std::vector<std::string_view>& fields) const {
  const char* s = line.data();
  const char* e = s + line.size();
  const char* field_start = s;
  for (const char* p = s; p <= e; ++p) {
    // sentinel delimiter at end
    if (p == e || *p == cfg_.delimiter) {
      fields.emplace_back(field_start, static_cast<std::size_t>(p - field_start));
      field_start = p + 1;
    }
  }
}

ParseStatus DelimitedParser::next(std::vector<std::string_view>& fields) {
  fields.clear();
  while (pos_ < in_.size()) {
    const std::size_t start = pos_;
    const std::size_t end = record_end(in_, pos_);

    std::string_view line;
    std::size_t next_pos;
    if (end == std::string_view::npos) {
      if (!at_eof_) return ParseStatus::Dangling;
      line = in_.substr(start);
      next_pos = in_.size();
    } else {
      line = in_.substr(start, end - 1 - start);
      next_pos = end;
    }
    if (cfg_.strip_cr) line = trim_cr(line);

    if ((cfg_.skip_empty_lines && line.empty()) ||
        (cfg_.comment != '\0' && !line.empty() && line.front() == cfg_.comment)) {
      pos_ = next_pos;
      continue;
    }

    split(line, fields);
    record_start_ = start;
    pos_ = next_pos;

    if (cfg_.fields_per_record > 0 && fields.size() != cfg_.fields_per_record) {
      err_ = "expected " + std::to_string(cfg_.fields_per_record) + " fields, got " +
             std::to_string(fields.size());
      return ParseStatus::Malformed;
    }
    return ParseStatus::Record;
  }
  return ParseStatus::Exhausted;
}

}
