#pragma once
#include <string>
#include <string_view>

namespace si {

// Incremental SHA-256 over the bytes of a stream (OpenSSL EVP).
class StreamDigest {
public:
  StreamDigest();
  ~StreamDigest();

  StreamDigest(const StreamDigest&) = delete;
  StreamDigest& operator=(const StreamDigest&) = delete;

  bool update(std::string_view bytes);

  // Lowercase hex; empty on failure. The digest cannot be updated afterwards.
  std::string finish_hex();

  const std::string& error() const noexcept { return err_; }

  // One-shot helper for whole files.
  static std::string file_sha256_hex(const std::string& path, std::string* err_out = nullptr);

private:
  struct Impl; Impl* p_;
  std::string err_;
};

}
