#pragma once

// ace/hash.hpp - Content hashing and fingerprint authority.
//
// TWO PRIMITIVES, TWO JOBS:
//   SHA-256 (OpenSSL EVP) is the content hash. Every hash that is persisted in
//   a journal, receipt or index entry is SHA-256 over raw bytes, hex-encoded,
//   so those files stay comparable across runs and tools.
//   BLAKE3 is the fingerprint primitive for identifiers the engine mints
//   itself (receipt ids, run ids, backup object keys). Fingerprints are
//   always domain separated.
//
// INVARIANT: persisted content hashes are raw lowercase hex with no algorithm
// prefix. content_hash() returns the prefixed form for display; callers that
// persist must go through strip_hash_prefix().

#include <string>
#include <string_view>

namespace ace {

// SHA-256 of raw bytes, 64 lowercase hex chars.
std::string sha256_hex(std::string_view payload);

// Stream-hash a file with SHA-256. Returns "" when the file cannot be read.
std::string sha256_file_hex(const std::string& path);

// "sha256:<hex>" form.
std::string content_hash(std::string_view payload);
std::string strip_hash_prefix(const std::string& hash);

// BLAKE3
std::string blake3_hex(std::string_view payload);
std::string hash_domain(std::string_view domain, std::string_view payload);

// Short fingerprint: first `len` hex chars of hash_domain(domain, payload).
std::string fingerprint(std::string_view domain, std::string_view payload, std::size_t len = 16);

bool is_hex_digest(const std::string& s, std::size_t len = 64);

}  // namespace ace
