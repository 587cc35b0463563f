#include "stream_ingest/stream_digest.hpp"
#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace si {

struct StreamDigest::Impl {
  EVP_MD_CTX* ctx{nullptr};
  bool done{false};

  Impl() : ctx(EVP_MD_CTX_new()) {}
  ~Impl() { if (ctx) EVP_MD_CTX_free(ctx); }
};

StreamDigest::StreamDigest() : p_(new Impl) {
  if (!p_->ctx || EVP_DigestInit_ex(p_->ctx, EVP_sha256(), nullptr) != 1) {
    err_ = "EVP_DigestInit_ex failed";
    p_->done = true;
  }
}

StreamDigest::~StreamDigest() { delete p_; }

bool StreamDigest::update(std::string_view bytes) {
  if (p_->done) { if (err_.empty()) err_ = "digest already finished"; return false; }
  if (bytes.empty()) return true;
  if (EVP_DigestUpdate(p_->ctx, bytes.data(), bytes.size()) != 1) {
    err_ = "EVP_DigestUpdate failed";
    return false;
  }
  return true;
}

std::string StreamDigest::finish_hex() {
  if (p_->done) return {};
  p_->done = true;
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(p_->ctx, md, &len) != 1) {
    err_ = "EVP_DigestFinal_ex failed";
    return {};
  }
  std::ostringstream o;
  for (unsigned int i = 0; i < len; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
  return o.str();
}

std::string StreamDigest::file_sha256_hex(const std::string& path, std::string* err_out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (err_out) *err_out = "open failed: " + path;
    return {};
  }
  StreamDigest d;
  std::vector<char> buf(64 * 1024);
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto n = static_cast<std::size_t>(in.gcount());
    if (n > 0 && !d.update(std::string_view(buf.data(), n))) {
      if (err_out) *err_out = d.error();
      return {};
    }
  }
  std::string hex = d.finish_hex();
  if (hex.empty() && err_out) *err_out = d.error();
  return hex;
}

}
