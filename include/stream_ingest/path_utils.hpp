#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace si {

enum class SourceKind { LocalFile, Http, Unknown };

struct HttpUrl {
  std::string host;
  int port = 80;
  std::string path = "/";

  // "http://host:port", the form httplib::Client accepts.
  std::string origin() const;
};

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// "http://..." -> Http, "https://..." and other schemes -> Unknown, anything else -> LocalFile.
SourceKind detect_source_kind(std::string_view source);

// Accepts http://host[:port][/path]; fills `out`.
bool parse_http_url(std::string_view url, HttpUrl& out, std::string* err_out = nullptr);

}
