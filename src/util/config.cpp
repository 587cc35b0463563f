#include "stream_ingest/config.hpp"
#include <simdjson.h>

#include <charconv>
#include <iostream>
#include <string_view>

namespace si {

namespace {

bool fail(std::string* err_out, std::string msg) {
  if (err_out) *err_out = std::move(msg);
  return false;
}

bool read_char(simdjson::ondemand::value& v, std::string_view key, bool allow_empty,
               char& out, std::string* err_out) {
  std::string_view s;
  if (auto error = v.get_string().get(s))
    return fail(err_out, std::string(key) + ": " + simdjson::error_message(error));
  if (s.empty() && allow_empty) { out = '\0'; return true; }
  if (s.size() != 1) return fail(err_out, std::string(key) + ": expected a single character");
  out = s.front();
  return true;
}

bool read_size(simdjson::ondemand::value& v, std::string_view key, std::size_t& out,
               std::string* err_out) {
  std::uint64_t n = 0;
  if (auto error = v.get_uint64().get(n))
    return fail(err_out, std::string(key) + ": " + simdjson::error_message(error));
  out = static_cast<std::size_t>(n);
  return true;
}

bool read_bool(simdjson::ondemand::value& v, std::string_view key, bool& out,
               std::string* err_out) {
  if (auto error = v.get_bool().get(out))
    return fail(err_out, std::string(key) + ": " + simdjson::error_message(error));
  return true;
}

bool apply(simdjson::ondemand::document& doc, IngestConfig& cfg, std::string* err_out) {
  simdjson::ondemand::object obj;
  if (auto error = doc.get_object().get(obj))
    return fail(err_out, std::string("config root must be an object: ") + simdjson::error_message(error));

  ParseConfig& pc = cfg.reassembly.parse;
  for (auto field : obj) {
    std::string_view key;
    if (auto error = field.unescaped_key().get(key))
      return fail(err_out, std::string("bad key: ") + simdjson::error_message(error));
    simdjson::ondemand::value v;
    if (auto error = field.value().get(v))
      return fail(err_out, std::string(key) + ": " + simdjson::error_message(error));

    bool ok = true;
    if (key == "chunk_bytes")               ok = read_size(v, key, cfg.chunk_bytes, err_out);
    else if (key == "delimiter")            ok = read_char(v, key, false, pc.delimiter, err_out);
    else if (key == "comment")              ok = read_char(v, key, true, pc.comment, err_out);
    else if (key == "strip_cr")             ok = read_bool(v, key, pc.strip_cr, err_out);
    else if (key == "skip_empty_lines")     ok = read_bool(v, key, pc.skip_empty_lines, err_out);
    else if (key == "fields_per_record")    ok = read_size(v, key, pc.fields_per_record, err_out);
    else if (key == "max_record_bytes")     ok = read_size(v, key, cfg.reassembly.max_record_bytes, err_out);
    else if (key == "digest")               ok = read_bool(v, key, cfg.digest, err_out);
    else if (key == "max_reported_errors")  ok = read_size(v, key, cfg.max_reported_errors, err_out);
    else if (key == "timeout_ms") {
      if (auto error = v.get_int64().get(cfg.timeout_ms))
        return fail(err_out, std::string("timeout_ms: ") + simdjson::error_message(error));
    } else {
      std::cerr << "[config] ignoring unknown key: " << key << "\n";
    }
    if (!ok) return false;
  }
  return true;
}

}

bool load_config_json(const std::string& json, IngestConfig& cfg, std::string* err_out) {
  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(json);
  simdjson::ondemand::document doc;
  if (auto error = parser.iterate(padded).get(doc))
    return fail(err_out, std::string("config: ") + simdjson::error_message(error));
  return apply(doc, cfg, err_out);
}

bool load_config_file(const std::string& path, IngestConfig& cfg, std::string* err_out) {
  simdjson::padded_string json;
  if (auto error = simdjson::padded_string::load(path).get(json))
    return fail(err_out, "config " + path + ": " + simdjson::error_message(error));
  simdjson::ondemand::parser parser;
  simdjson::ondemand::document doc;
  if (auto error = parser.iterate(json).get(doc))
    return fail(err_out, "config " + path + ": " + simdjson::error_message(error));
  return apply(doc, cfg, err_out);
}

bool validate(const IngestConfig& cfg, std::string* err_out) {
  const ParseConfig& pc = cfg.reassembly.parse;
  if (cfg.chunk_bytes == 0) return fail(err_out, "chunk_bytes must be > 0");
  if (cfg.chunk_bytes > kMaxChunkBytes)
    return fail(err_out, "chunk_bytes must be <= " + std::to_string(kMaxChunkBytes));
  if (cfg.reassembly.max_record_bytes == 0) return fail(err_out, "max_record_bytes must be > 0");
  if (pc.delimiter == '\n' || pc.delimiter == '\r')
    return fail(err_out, "delimiter cannot be a line terminator");
  if (pc.comment != '\0' && pc.comment == pc.delimiter)
    return fail(err_out, "comment character must differ from the delimiter");
  if (pc.comment == '\n' || pc.comment == '\r')
    return fail(err_out, "comment character cannot be a line terminator");
  if (cfg.timeout_ms < 0) return fail(err_out, "timeout_ms must be >= 0");
  return true;
}

bool parse_size(const std::string& s, std::size_t& out) {
  if (s.empty()) return false;
  std::size_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return false;
  out = v;
  return true;
}

}
