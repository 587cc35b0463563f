#include "stream_ingest/path_utils.hpp"
#include <charconv>

namespace si {

std::string HttpUrl::origin() const {
  return "http://" + host + ":" + std::to_string(port);
}

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

SourceKind detect_source_kind(std::string_view source) {
  if (source.empty()) return SourceKind::Unknown;
  if (source.rfind("http://", 0) == 0) return SourceKind::Http;
  if (source.find("://") != std::string_view::npos) return SourceKind::Unknown;
  return SourceKind::LocalFile;
}

bool parse_http_url(std::string_view url, HttpUrl& out, std::string* err_out) {
  const std::string full(url);
  auto fail = [&](const char* why){
    if (err_out) *err_out = std::string(why) + ": " + full;
    return false;
  };
  constexpr std::string_view scheme = "http://";
  if (url.rfind(scheme, 0) != 0) return fail("not an http:// url");
  url.remove_prefix(scheme.size());

  const auto slash = url.find('/');
  std::string_view authority = url.substr(0, slash);
  out.path = (slash == std::string_view::npos) ? "/" : std::string(url.substr(slash));

  const auto colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    std::string_view port = authority.substr(colon + 1);
    int p = 0;
    auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), p);
    if (ec != std::errc() || ptr != port.data() + port.size() || p <= 0 || p > 65535)
      return fail("bad port");
    out.port = p;
    authority = authority.substr(0, colon);
  } else {
    out.port = 80;
  }
  if (authority.empty()) return fail("missing host");
  out.host = std::string(authority);
  return true;
}

}
