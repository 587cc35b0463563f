#include "stream_ingest/delimited_parser.hpp"
#include "stream_ingest/record_reassembler.hpp"
#include <algorithm>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// Chunking must not change what a stream parses to: for every chunk size the
// reassembled records equal a single pass over the whole stream.

struct Rec {
  std::uint64_t offset;
  std::vector<std::string> fields;
  bool operator==(const Rec& o) const { return offset == o.offset && fields == o.fields; }
};

static std::string random_stream(std::mt19937& rng, std::size_t* longest_line) {
  static const std::string alphabet = "abcXYZ019 ,,,;#\r";
  std::uniform_int_distribution<int> nlines(0, 40), len(0, 24), pick(0, static_cast<int>(alphabet.size()) - 1);
  std::uniform_int_distribution<int> coin(0, 9);
  std::string s;
  *longest_line = 0;
  const int lines = nlines(rng);
  for (int i = 0; i < lines; ++i) {
    std::string line;
    const int kind = coin(rng);
    if (kind == 0) line = "";                      // blank
    else if (kind == 1) line = "#comment";         // comment
    else for (int k = len(rng); k > 0; --k) line += alphabet[static_cast<std::size_t>(pick(rng))];
    if (coin(rng) == 0) line += '\r';              // CRLF
    line += '\n';
    *longest_line = std::max(*longest_line, line.size());
    s += line;
  }
  if (coin(rng) < 3) {                             // unterminated tail
    std::string tail = "tail,";
    for (int k = len(rng); k > 0; --k) tail += alphabet[static_cast<std::size_t>(pick(rng))];
    tail.erase(std::remove(tail.begin(), tail.end(), '\r'), tail.end());
    *longest_line = std::max(*longest_line, tail.size());
    s += tail;
  }
  return s;
}

static std::vector<Rec> one_pass(const si::ParseConfig& cfg, const std::string& s) {
  std::vector<Rec> out;
  std::vector<std::string_view> f;
  si::DelimitedParser p(cfg, s, true);
  while (p.next(f) == si::ParseStatus::Record)
    out.push_back(Rec{p.record_start(), std::vector<std::string>(f.begin(), f.end())});
  return out;
}

int main() {
  std::mt19937 rng(20240611u);
  si::ReassemblerConfig cfg;
  cfg.parse.comment = '#';

  int failures = 0;
  int streams = 0;
  for (int iter = 0; iter < 150 && failures < 5; ++iter) {
    std::size_t longest = 0;
    const std::string s = random_stream(rng, &longest);
    const std::vector<Rec> want = one_pass(cfg.parse, s);
    ++streams;

    for (std::size_t chunk = 1; chunk <= 48 && failures < 5; ++chunk) {
      std::vector<Rec> got;
      std::size_t errors = 0;
      si::RecordReassembler r(cfg,
        [&](const si::RecordView& rv, std::string*) {
          auto v = rv.to_strings();
          got.push_back(Rec{rv.offset(), v});
          return true;
        },
        [&](const si::IngestError&) { ++errors; });

      for (std::size_t i = 0; i < s.size(); i += chunk) r.feed(std::string_view(s).substr(i, chunk));
      r.finish();

      if (got != want || errors != 0) {
        std::cerr << "[FAIL] stream " << iter << " chunk=" << chunk << " got " << got.size()
                  << " records, want " << want.size() << " (errors=" << errors << ")\n";
        ++failures;
        continue;
      }
      if (r.bytes() != s.size()) {
        std::cerr << "[FAIL] stream " << iter << " chunk=" << chunk << " byte count " << r.bytes() << "\n";
        ++failures;
      }
      // Carry never exceeds a chunk while every record fits in one.
      if (longest <= chunk && r.carry_high_water() > chunk) {
        std::cerr << "[FAIL] stream " << iter << " chunk=" << chunk
                  << " carry_high_water=" << r.carry_high_water() << "\n";
        ++failures;
      }
      if (r.carry_size() != 0) {
        std::cerr << "[FAIL] stream " << iter << " chunk=" << chunk << " carry not drained\n";
        ++failures;
      }
    }
  }

  if (failures) { std::cerr << "[FAIL] boundary property: " << failures << " failure(s)\n"; return 1; }
  std::cout << "[PASS] boundary property over " << streams << " streams, chunk sizes 1..48\n";
  return 0;
}
