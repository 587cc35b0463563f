#include "stream_ingest/config.hpp"
#include "stream_ingest/http_range_reader.hpp"
#include "stream_ingest/path_utils.hpp"
#include "stream_ingest/pipeline.hpp"
#include "stream_ingest/positional_reader.hpp"
#include "stream_ingest/record_view.hpp"
#include "stream_ingest/run_json.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_interrupted{false};

void on_sigint(int) { g_interrupted.store(true); }

struct Cli {
  std::string config;
  std::string summary;
  bool print = false;
  bool quiet = false;
  std::string source;

  // Overrides applied on top of the config file.
  std::optional<std::size_t> chunk_bytes;
  std::optional<char> delimiter;
  std::optional<char> comment;
  std::optional<std::size_t> fields;
  std::optional<std::size_t> max_record_bytes;
  std::optional<long long> timeout_ms;
  bool no_digest = false;
};

void usage() {
  std::cout <<
    "Usage: stream-ingest [--config=FILE] [--chunk-bytes=N] [--delimiter=C] [--comment=C]\n"
    "                     [--fields=N] [--max-record-bytes=N] [--timeout-ms=N] [--no-digest]\n"
    "                     [--summary=FILE] [--print] [--quiet] <path | http://host:port/object>\n";
}

// Accepts a literal character or the escapes \t and \\.
bool parse_char(const std::string& s, char& out) {
  if (s == "\\t") { out = '\t'; return true; }
  if (s == "\\\\") { out = '\\'; return true; }
  if (s.size() != 1) return false;
  out = s[0];
  return true;
}

bool parse_cli(int argc, char** argv, Cli& c, std::string& err) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto value_of = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    std::size_t n = 0;
    if (value_of("--config=", &c.config)) continue;
    if (value_of("--summary=", &c.summary)) continue;
    if (value_of("--chunk-bytes=", &v)) {
      if (!si::parse_size(v, n)) { err = "bad numeric value: " + a; return false; }
      c.chunk_bytes = n;
      continue;
    }
    if (value_of("--fields=", &v)) {
      if (!si::parse_size(v, n)) { err = "bad numeric value: " + a; return false; }
      c.fields = n;
      continue;
    }
    if (value_of("--max-record-bytes=", &v)) {
      if (!si::parse_size(v, n)) { err = "bad numeric value: " + a; return false; }
      c.max_record_bytes = n;
      continue;
    }
    if (value_of("--timeout-ms=", &v)) {
      try {
        c.timeout_ms = std::stoll(v);
      } catch (const std::exception&) {
        err = "bad numeric value: " + a;
        return false;
      }
      continue;
    }
    if (value_of("--delimiter=", &v)) {
      char ch;
      if (!parse_char(v, ch)) { err = "delimiter must be one character: " + a; return false; }
      c.delimiter = ch;
      continue;
    }
    if (value_of("--comment=", &v)) {
      char ch = '\0';
      if (!v.empty() && !parse_char(v, ch)) { err = "comment must be one character: " + a; return false; }
      c.comment = ch;
      continue;
    }
    if (a == "--no-digest") { c.no_digest = true; continue; }
    if (a == "--print")     { c.print = true; continue; }
    if (a == "--quiet")     { c.quiet = true; continue; }
    if (a == "-h" || a == "--help") { usage(); std::exit(0); }
    if (a.rfind("--", 0) == 0) { err = "unknown option: " + a; return false; }
    if (!c.source.empty()) { err = "more than one source given"; return false; }
    c.source = a;
  }
  if (c.source.empty()) { err = "missing source"; return false; }
  return true;
}

void apply_overrides(const Cli& c, si::IngestConfig& cfg) {
  si::ParseConfig& pc = cfg.reassembly.parse;
  if (c.chunk_bytes)      cfg.chunk_bytes = *c.chunk_bytes;
  if (c.delimiter)        pc.delimiter = *c.delimiter;
  if (c.comment)          pc.comment = *c.comment;
  if (c.fields)           pc.fields_per_record = *c.fields;
  if (c.max_record_bytes) cfg.reassembly.max_record_bytes = *c.max_record_bytes;
  if (c.timeout_ms)       cfg.timeout_ms = *c.timeout_ms;
  if (c.no_digest)        cfg.digest = false;
}

std::unique_ptr<si::PositionalReader> open_source(const std::string& source, std::string& err) {
  switch (si::detect_source_kind(source)) {
    case si::SourceKind::LocalFile: return std::make_unique<si::LocalFileReader>(source);
    case si::SourceKind::Http:      return std::make_unique<si::HttpRangeReader>(source);
    case si::SourceKind::Unknown:   break;
  }
  err = "unsupported source: " + source;
  return nullptr;
}

int exit_code_for(const si::RunResult& r) {
  switch (r.status) {
    case si::RunStatus::ConfigError: return 2;
    case si::RunStatus::ReadError:   return 3;
    case si::RunStatus::Cancelled:   return 4;
    case si::RunStatus::Ok:          break;
  }
  return r.stats.parse_errors > 0 ? 5 : 0;
}

}

int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);

  Cli cli;
  std::string err;
  if (!parse_cli(argc, argv, cli, err)) {
    std::cerr << "[ingest] " << err << "\n";
    usage();
    return 2;
  }

  si::IngestConfig cfg;
  if (!cli.config.empty() && !si::load_config_file(cli.config, cfg, &err)) {
    std::cerr << "[config] " << err << "\n";
    return 2;
  }
  apply_overrides(cli, cfg);
  if (!si::validate(cfg, &err)) {
    std::cerr << "[config] " << err << "\n";
    return 2;
  }

  auto reader = open_source(cli.source, err);
  if (!reader) {
    std::cerr << "[ingest] " << err << "\n";
    return 2;
  }

  // Ctrl-C cancels the run; the flag is polled because cancel() is not signal-safe.
  si::CancelToken cancel;
  std::signal(SIGINT, on_sigint);
  std::atomic<bool> done{false};
  std::thread watcher([&]{
    while (!done.load()) {
      if (g_interrupted.load()) { cancel.cancel(); break; }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });

  const char delim = cfg.reassembly.parse.delimiter;
  auto on_record = [&](const si::RecordView& rv, std::string*) {
    if (cli.print) {
      for (std::size_t i = 0; i < rv.size(); ++i) {
        if (i) std::cout << delim;
        std::cout << rv.at(i);
      }
      std::cout << '\n';
    }
    return true;
  };
  si::ErrorCallback on_error = cli.quiet ? si::ErrorCallback{} : si::ErrorCallback{si::log_error};

  si::IngestPipeline pipeline(*reader, cfg);
  si::RunResult result = pipeline.run(on_record, cancel, on_error);
  done.store(true);
  watcher.join();
  std::cout.flush();

  if (!cli.summary.empty()) {
    si::RunJsonPayload p;
    p.status = si::to_string(result.status);
    p.error = result.error;
    p.stats = result.stats;
    p.errors = result.errors;
    p.errors_dropped = result.errors_dropped;
    p.source = reader->describe();
    p.sha256 = result.sha256;
    p.delimiter = delim;
    if (!si::write_run_summary(cli.summary, si::RunJsonWriter::to_json(p), &err)) {
      std::cerr << "[ingest] summary: " << err << "\n";
    }
  }

  const auto& s = result.stats;
  std::cerr << "[ingest] " << si::to_string(result.status) << ": " << reader->describe()
            << " records=" << s.records << " bytes=" << s.bytes << " chunks=" << s.chunks
            << " parse_errors=" << s.parse_errors << " handler_errors=" << s.handler_errors
            << " mb/s=" << s.throughput_mb_s;
  if (!result.error.empty()) std::cerr << " error=\"" << result.error << "\"";
  if (!result.sha256.empty()) std::cerr << " sha256=" << result.sha256;
  std::cerr << "\n";
  return exit_code_for(result);
}
