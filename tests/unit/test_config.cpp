#include "stream_ingest/config.hpp"
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int failures = 0;

static void expect(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static void fixture_file() {
  const fs::path f = "tests/data/ingest_config.json";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; ++failures; return; }
  si::IngestConfig cfg;
  std::string err;
  expect(si::load_config_file(f.string(), cfg, &err), "fixture loads: " + err);
  expect(cfg.chunk_bytes == 64, "chunk_bytes");
  expect(cfg.reassembly.parse.delimiter == '|', "delimiter");
  expect(cfg.reassembly.parse.comment == '#', "comment");
  expect(cfg.reassembly.parse.fields_per_record == 3, "fields_per_record");
  expect(cfg.reassembly.max_record_bytes == 4096, "max_record_bytes");
  expect(cfg.max_reported_errors == 10, "max_reported_errors");
  expect(cfg.digest, "digest");
  expect(si::validate(cfg, &err), "fixture validates");
}

static void partial_json_keeps_defaults() {
  si::IngestConfig cfg;
  std::string err;
  expect(si::load_config_json(R"({"strip_cr": false, "comment": "", "unknown_key": [1,2]})", cfg, &err),
         "partial config loads: " + err);
  expect(!cfg.reassembly.parse.strip_cr, "strip_cr overridden");
  expect(cfg.reassembly.parse.comment == '\0', "empty comment disables comments");
  expect(cfg.chunk_bytes == 512 && cfg.reassembly.parse.delimiter == ',', "defaults kept");
}

static void rejects_bad_json() {
  si::IngestConfig cfg;
  std::string err;
  expect(!si::load_config_json(R"({"chunk_bytes": "big"})", cfg, &err), "string for number rejected");
  expect(err.find("chunk_bytes") != std::string::npos, "error names the key");
  expect(!si::load_config_json(R"({"delimiter": "||"})", cfg, &err), "multi-char delimiter rejected");
  expect(!si::load_config_json(R"([1,2,3])", cfg, &err), "non-object root rejected");
  expect(!si::load_config_file("tests/data/does_not_exist.json", cfg, &err), "missing file rejected");
}

static void validation() {
  std::string err;
  si::IngestConfig ok;
  expect(si::validate(ok, &err), "defaults are valid");

  si::IngestConfig a; a.chunk_bytes = 0;
  expect(!si::validate(a, &err), "chunk_bytes 0 invalid");
  si::IngestConfig b; b.reassembly.max_record_bytes = 0;
  expect(!si::validate(b, &err), "max_record_bytes 0 invalid");
  si::IngestConfig c; c.reassembly.parse.delimiter = '\n';
  expect(!si::validate(c, &err), "newline delimiter invalid");
  si::IngestConfig d; d.reassembly.parse.comment = ',';
  expect(!si::validate(d, &err), "comment equal to delimiter invalid");
  si::IngestConfig e; e.timeout_ms = -1;
  expect(!si::validate(e, &err), "negative timeout invalid");
  si::IngestConfig f; f.chunk_bytes = static_cast<std::size_t>(-1);
  expect(!si::validate(f, &err), "wrapped chunk_bytes invalid");
  expect(err.find("chunk_bytes") != std::string::npos, "chunk_bytes named in error");
  si::IngestConfig g; g.chunk_bytes = si::kMaxChunkBytes;
  expect(si::validate(g, &err), "largest chunk_bytes valid");
}

static void size_arguments() {
  std::size_t n = 7;
  expect(si::parse_size("4096", n) && n == 4096, "plain size parses");
  expect(!si::parse_size("-1", n), "negative size rejected");
  expect(!si::parse_size("+5", n), "signed size rejected");
  expect(!si::parse_size("12k", n), "trailing text rejected");
  expect(!si::parse_size("", n), "empty size rejected");
  expect(!si::parse_size("99999999999999999999999", n), "overflow rejected");
  expect(n == 4096, "failed parse leaves the value alone");
}

int main() {
  fixture_file();
  partial_json_keeps_defaults();
  rejects_bad_json();
  validation();
  size_arguments();
  if (failures) { std::cerr << "[FAIL] config: " << failures << " failure(s)\n"; return 1; }
  std::cout << "[PASS] config\n";
  return 0;
}
