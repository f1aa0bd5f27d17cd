#include "ace/hash.hpp"

// SHA-256 goes through the EVP interface; the low-level SHA256_* calls are
// deprecated in OpenSSL 3.x.
//
// to_hex() uses a lookup table for nibble encoding rather than snprintf.

#include <array>
#include <fstream>
#include <initializer_list>
#include <memory>

#include <openssl/evp.h>

extern "C" {
#include <blake3.h>
}

namespace ace {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";
constexpr std::string_view kSha256Prefix = "sha256:";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string hex;
  hex.reserve(len * 2);
  for (const unsigned char* p = data; p != data + len; ++p) {
    hex.push_back(kHexChars[*p >> 4]);
    hex.push_back(kHexChars[*p & 0x0f]);
  }
  return hex;
}

std::string blake3_of(std::initializer_list<std::string_view> parts) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  for (const auto part : parts) blake3_hasher_update(&hasher, part.data(), part.size());
  unsigned char digest[BLAKE3_OUT_LEN];
  blake3_hasher_finalize(&hasher, digest, BLAKE3_OUT_LEN);
  return to_hex(digest, BLAKE3_OUT_LEN);
}

struct EvpCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpCtx = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

// Incremental SHA-256. ok() is false if any EVP call failed; the digest is
// then unusable and callers return "".
class Sha256 {
 public:
  Sha256() : ctx_(EVP_MD_CTX_new()) {
    ok_ = ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1;
  }

  void update(const void* data, std::size_t len) {
    if (ok_ && EVP_DigestUpdate(ctx_.get(), data, len) != 1) ok_ = false;
  }

  std::string finalize_hex() {
    if (!ok_) return {};
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int n = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &n) != 1) return {};
    return to_hex(out.data(), n);
  }

  bool ok() const { return ok_; }

 private:
  EvpCtx ctx_;
  bool ok_{false};
};

}  // namespace

std::string sha256_hex(std::string_view payload) {
  Sha256 h;
  h.update(payload.data(), payload.size());
  return h.finalize_hex();
}

std::string sha256_file_hex(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return {};

  Sha256 h;
  constexpr std::size_t buffer_size = 65536;
  std::array<char, buffer_size> buffer{};
  while (file.good()) {
    file.read(buffer.data(), buffer_size);
    const std::streamsize count = file.gcount();
    if (count > 0) h.update(buffer.data(), static_cast<std::size_t>(count));
  }
  if (file.bad()) return {};
  return h.finalize_hex();
}

std::string content_hash(std::string_view payload) {
  return std::string(kSha256Prefix) + sha256_hex(payload);
}

// Strips "<alg>:" when <alg> is alphanumeric (dashes allowed) and the rest is
// a non-empty lowercase hex digest. Anything else comes back unchanged.
std::string strip_hash_prefix(const std::string& hash) {
  const auto colon = hash.find(':');
  if (colon == std::string::npos || colon == 0) return hash;
  for (std::size_t i = 0; i < colon; ++i) {
    const char c = hash[i];
    if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-')) {
      return hash;
    }
  }
  const std::string digest = hash.substr(colon + 1);
  if (digest.empty() || !is_hex_digest(digest, digest.size())) return hash;
  return digest;
}

std::string blake3_hex(std::string_view payload) { return blake3_of({payload}); }

// The domain is hashed as a plain prefix of the payload.
std::string hash_domain(std::string_view domain, std::string_view payload) {
  return blake3_of({domain, payload});
}

std::string fingerprint(std::string_view domain, std::string_view payload, std::size_t len) {
  return hash_domain(domain, payload).substr(0, len);
}

bool is_hex_digest(const std::string& s, std::size_t len) {
  if (s.size() != len) return false;
  for (char c : s) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

}  // namespace ace
