#include "stream_ingest/http_range_reader.hpp"
#include "stream_ingest/path_utils.hpp"
#include <httplib.h>

#include <algorithm>
#include <charconv>
#include <cstring>
#include <iostream>
#include <memory>
#include <string_view>

namespace si {

static long long parse_length(std::string_view v) {
  long long n = -1;
  auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
  if (ec != std::errc() || ptr != v.data() + v.size()) return -1;
  return n;
}

// "bytes 0-99/1234" -> 1234; "bytes */1234" -> 1234; unknown total -> -1.
static long long total_from_content_range(std::string_view v) {
  auto slash = v.rfind('/');
  if (slash == std::string_view::npos) return -1;
  return parse_length(v.substr(slash + 1));
}

struct HttpRangeReader::Impl {
  std::string url;
  Config cfg;
  HttpUrl target;
  std::string url_err;
  std::unique_ptr<httplib::Client> cli;
  long long size{-1};
  bool warned_full_body{false};

  Impl(std::string u, Config c) : url(std::move(u)), cfg(c) {
    if (parse_http_url(url, target, &url_err)) {
      cli = std::make_unique<httplib::Client>(target.origin());
      cli->set_connection_timeout(cfg.connect_timeout_sec, 0);
      cli->set_read_timeout(cfg.read_timeout_sec, 0);
      cli->set_keep_alive(true);
    }
  }

  ReadResult read_at(char* dst, std::size_t capacity, std::uint64_t offset) {
    ReadResult r;
    if (!cli) {
      r.ec = std::make_error_code(std::errc::invalid_argument);
      r.message = url_err;
      return r;
    }
    if (capacity == 0) return r;

    const auto first = static_cast<ssize_t>(offset);
    const auto last  = static_cast<ssize_t>(offset + capacity - 1);
    httplib::Headers headers = { httplib::make_range_header({{first, last}}) };

    // The body is streamed straight into dst. A server that ignores Range
    // answers 200 with the whole object; its bytes before offset are skipped
    // and the transfer is aborted once the window is full, so no more than
    // capacity bytes are ever held.
    int status = 0;
    long long content_length = -1;
    std::uint64_t skip = 0;
    std::size_t got = 0;
    bool window_full = false;

    auto res = cli->Get(target.path, headers,
      [&](const httplib::Response& head) {
        status = head.status;
        if (status == 206) {
          size = total_from_content_range(head.get_header_value("Content-Range"));
          return true;
        }
        if (status == 200) {
          if (!warned_full_body) {
            std::cerr << "[http] " << url << ": server ignored Range, skipping to each offset\n";
            warned_full_body = true;
          }
          if (head.has_header("Content-Length"))
            content_length = parse_length(head.get_header_value("Content-Length"));
          size = content_length;
          skip = offset;
          return true;
        }
        return false;  // 416 or an error status; the body is not needed
      },
      [&](const char* data, std::size_t len) {
        if (skip > 0) {
          const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(skip, len));
          skip -= n;
          data += n;
          len -= n;
        }
        const std::size_t take = std::min(len, capacity - got);
        std::memcpy(dst + got, data, take);
        got += take;
        if (got == capacity) { window_full = true; return false; }
        return true;
      });

    if (status == 0) {
      r.ec = std::make_error_code(std::errc::io_error);
      r.message = "GET " + url + ": " + httplib::to_string(res.error());
      return r;
    }

    if (status == 416) {
      // Range starts at or past the end of the object.
      r.eof = true;
      return r;
    }

    if (status != 200 && status != 206) {
      r.ec = std::make_error_code(std::errc::io_error);
      r.message = "GET " + url + ": HTTP " + std::to_string(status);
      return r;
    }

    // A transfer we did not abort ourselves must have run to completion.
    if (!res && !window_full) {
      r.ec = std::make_error_code(std::errc::io_error);
      r.message = "GET " + url + ": " + httplib::to_string(res.error());
      return r;
    }

    r.bytes = got;
    if (size >= 0) {
      r.eof = offset + got >= static_cast<std::uint64_t>(size);
    } else {
      // Unknown length: only a body that ended before the window filled is the end.
      r.eof = !window_full;
    }
    return r;
  }
};

HttpRangeReader::HttpRangeReader(std::string url)
  : HttpRangeReader(std::move(url), Config{}) {}

HttpRangeReader::HttpRangeReader(std::string url, Config cfg)
  : p_(new Impl(std::move(url), cfg)) {}

HttpRangeReader::~HttpRangeReader() { delete p_; }

ReadResult HttpRangeReader::read_at(char* dst, std::size_t capacity, std::uint64_t offset) {
  return p_->read_at(dst, capacity, offset);
}

std::string HttpRangeReader::describe() const { return p_->url; }
long long HttpRangeReader::object_size() const noexcept { return p_->size; }

}
