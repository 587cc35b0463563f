#include "stream_ingest/run_json.hpp"
#include "stream_ingest/path_utils.hpp"

#include <cmath> // std::isfinite
#include <cstdio>
#include <fstream>
#include <sstream>

namespace si {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  const RunStats& s = p.stats;
  std::ostringstream o;
  o << "{";
  o << "\"status\":"; esc(o, p.status); o << ",";
  o << "\"error\":";  esc(o, p.error);  o << ",";
  o << "\"records\":" << s.records << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"chunks\":" << s.chunks << ",";
  o << "\"chunk_bytes\":" << s.chunk_bytes << ",";
  o << "\"carry_high_water\":" << s.carry_high_water << ",";
  o << "\"parse_errors\":" << s.parse_errors << ",";
  o << "\"handler_errors\":" << s.handler_errors << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"records_per_sec\":" << safe_num(s.records_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stages[i].name);
    o << ",\"duration_ms\":" << safe_num(s.stages[i].duration_ms) << "}";
  }
  o << "],";

  o << "\"errors_by_kind\":{";
  bool first=true;
  for (auto& kv : s.errors_by_kind) {
    if (!first) o << ",";
    first=false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "},";

  o << "\"errors\":[";
  for (size_t i=0;i<p.errors.size();++i){
    if (i) o << ",";
    const auto& e = p.errors[i];
    o << "{\"kind\":"; esc(o, to_string(e.kind));
    o << ",\"offset\":" << e.offset;
    o << ",\"message\":"; esc(o, e.message);
    o << "}";
  }
  o << "],";
  o << "\"errors_dropped\":" << p.errors_dropped << ",";

  o << "\"source\":"; esc(o, p.source); o << ",";
  o << "\"delimiter\":"; esc(o, std::string(1, p.delimiter)); o << ",";
  o << "\"sha256\":"; esc(o, p.sha256);

  o << "}";
  return o.str();
}

bool write_run_summary(const std::string& path, const std::string& json, std::string* err_out) {
  if (!ensure_parent_dirs(path)) {
    if (err_out) *err_out = "failed to create parent directories for " + path;
    return false;
  }
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    if (err_out) *err_out = "failed to open " + path;
    return false;
  }
  out.write(json.data(), static_cast<std::streamsize>(json.size()));
  out.flush();
  if (!out) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  return true;
}

}
