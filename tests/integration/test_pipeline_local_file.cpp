#include "stream_ingest/pipeline.hpp"
#include "stream_ingest/run_json.hpp"
#include "stream_ingest/stream_digest.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <simdjson.h>

namespace fs = std::filesystem;

static int failures = 0;

static void expect(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static si::IngestConfig pipe_config(std::size_t chunk) {
  si::IngestConfig cfg;
  cfg.chunk_bytes = chunk;
  cfg.reassembly.parse.delimiter = '|';
  cfg.reassembly.parse.comment = '#';
  cfg.reassembly.parse.fields_per_record = 3;
  return cfg;
}

static si::RunResult run_file(const fs::path& f, const si::IngestConfig& cfg,
                              std::vector<std::string>* ids = nullptr) {
  si::LocalFileReader reader(f.string());
  si::IngestPipeline pipeline(reader, cfg);
  si::CancelToken cancel;
  return pipeline.run([&](const si::RecordView& rv, std::string*) {
    if (ids) ids->emplace_back(rv.at(0));
    return true;
  }, cancel, si::ErrorCallback{});
}

static void chunk_size_does_not_change_records(const fs::path& f) {
  std::string err;
  const std::string want_sha = si::StreamDigest::file_sha256_hex(f.string(), &err);
  expect(!want_sha.empty(), "reference digest: " + err);
  const auto size = fs::file_size(f);

  std::vector<std::string> baseline;
  for (std::size_t chunk : {1, 7, 16, 64, 4096}) {
    std::vector<std::string> ids;
    si::RunResult r = run_file(f, pipe_config(chunk), &ids);
    const std::string tag = " (chunk=" + std::to_string(chunk) + ")";
    expect(r.ok(), "status ok" + tag + ": " + r.error);
    expect(r.stats.records == 12 && ids.size() == 12, "12 records" + tag);
    expect(r.stats.bytes == size, "every byte consumed" + tag);
    expect(r.stats.chunks == (size + chunk - 1) / chunk, "chunk count" + tag);
    expect(r.stats.parse_errors == 0 && r.errors.empty(), "no errors" + tag);
    expect(r.sha256 == want_sha, "digest matches file" + tag);
    if (baseline.empty()) baseline = ids;
    expect(ids == baseline, "same records in the same order" + tag);
  }
  expect(!baseline.empty() && baseline.front() == "1001" && baseline.back() == "1012", "first and last ids");
}

static void run_summary_round_trip(const fs::path& f) {
  si::RunResult r = run_file(f, pipe_config(16));
  si::RunJsonPayload p;
  p.status = si::to_string(r.status);
  p.error = r.error;
  p.stats = r.stats;
  p.errors = r.errors;
  p.errors_dropped = r.errors_dropped;
  p.source = f.string();
  p.sha256 = r.sha256;
  p.delimiter = '|';

  const fs::path out = fs::temp_directory_path() / "si-it" / "run.json";
  std::string err;
  expect(si::write_run_summary(out.string(), si::RunJsonWriter::to_json(p), &err), "write run.json: " + err);

  simdjson::ondemand::parser parser;
  auto json = simdjson::padded_string::load(out.string());
  auto doc = parser.iterate(json);
  std::string_view status = doc["status"].get_string().value_or("");
  uint64_t records = doc["records"].get_uint64().value_or(0);
  uint64_t chunk_bytes = doc["chunk_bytes"].get_uint64().value_or(0);
  double mbps = double(doc["throughput_mb_s"].get_double().value_or(-1.0));
  std::string_view delim = doc["delimiter"].get_string().value_or("");
  std::string_view sha = doc["sha256"].get_string().value_or("");

  expect(status == "ok", "run.json status");
  expect(records == 12, "run.json records");
  expect(chunk_bytes == 16, "run.json chunk_bytes");
  expect(mbps >= 0.0, "run.json throughput");
  expect(delim == "|", "run.json delimiter");
  expect(sha == r.sha256, "run.json sha256");
  fs::remove_all(out.parent_path());
}

static void unterminated_crlf_file() {
  const fs::path f = "tests/data/no_trailing_newline.txt";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; ++failures; return; }
  for (std::size_t chunk : {1, 5, 11, 64}) {
    std::vector<std::string> ids;
    si::RunResult r = run_file(f, pipe_config(chunk), &ids);
    expect(r.ok() && ids == std::vector<std::string>{"10", "11", "12", "13"},
           "last unterminated record emitted once (chunk=" + std::to_string(chunk) + ")");
  }
}

static void malformed_rows_are_reported() {
  const fs::path f = "tests/data/malformed_rows.txt";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; ++failures; return; }

  std::vector<std::string> ids;
  si::RunResult r = run_file(f, pipe_config(1), &ids);
  expect(r.ok(), "malformed rows do not fail the run");
  expect(r.stats.parse_errors == 2, "two malformed rows");
  expect(ids == std::vector<std::string>{"1", "2", "4", "5", "7"}, "only the malformed rows lost at 1-byte chunks");
  expect(r.stats.errors_by_kind.count("parse") == 1 && r.stats.errors_by_kind.at("parse") == 2, "errors_by_kind");

  si::RunResult whole = run_file(f, pipe_config(4096));
  expect(whole.stats.parse_errors == 1 && whole.stats.records == 2,
         "one chunk: the first malformed row drops the rest of the chunk");

  si::IngestConfig capped = pipe_config(1);
  capped.max_reported_errors = 1;
  si::RunResult c = run_file(f, capped);
  expect(c.errors.size() == 1 && c.errors_dropped == 1, "error list is capped");
}

static void missing_file_and_bad_config() {
  si::RunResult r = run_file("tests/data/does_not_exist.txt", pipe_config(64));
  expect(r.status == si::RunStatus::ReadError, "missing file is a read error");
  expect(!r.error.empty() && r.sha256.empty(), "read error message, no digest");

  si::RunResult c = run_file("tests/data/orders_pipe.txt", pipe_config(0));
  expect(c.status == si::RunStatus::ConfigError, "chunk_bytes 0 rejected before reading");
}

int main() {
  const fs::path f = "tests/data/orders_pipe.txt";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }

  chunk_size_does_not_change_records(f);
  run_summary_round_trip(f);
  unterminated_crlf_file();
  malformed_rows_are_reported();
  missing_file_and_bad_config();

  if (failures) { std::cerr << "[FAIL] pipeline local file: " << failures << " failure(s)\n"; return 1; }
  std::cout << "[PASS] pipeline local file\n";
  return 0;
}
