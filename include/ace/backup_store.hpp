#pragma once

// ace/backup_store.hpp - Content-addressed store for file pre-images.
//
// Every file the commit path touches has its pre-image stored here before
// the journal intent is written. The journal carries the pre-image inline as
// well; this store is the second copy used when a journal line turns out to
// be damaged.
//
// DESIGN INVARIANTS:
//   1. key = hash_domain("bak:", original_bytes). The key scheme never
//      changes without a BACKUP_FORMAT_VERSION bump.
//   2. Objects and .meta sidecars are written with atomic_write().
//   3. get() verifies the stored blob hash and the decoded content key before
//      returning. Any mismatch yields nullopt, never corrupted data.
//   4. A second put() of the same content returns the same key.
//
// LAYOUT:
//   <root>/objects/AB/CD/<64-hex-key>
//   <root>/objects/AB/CD/<64-hex-key>.meta

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "ace/jsonlite.hpp"

namespace ace {

struct BackupObjectInfo {
  std::string key;
  std::string encoding{"identity"};  // identity | zstd
  uint64_t original_size{0};
  uint64_t stored_size{0};
  std::string stored_blob_hash;  // plain BLAKE3 of the stored bytes
  uint64_t created_at_ms{0};
  uint64_t format_version{0};

  jsonlite::Value to_value() const;
  static BackupObjectInfo from_value(const jsonlite::Value& v);
};

class BackupStore {
 public:
  // Creates <root>/objects. Throws std::filesystem::filesystem_error if the
  // directory cannot be created.
  explicit BackupStore(std::string root);

  // Returns the object key, or "" on failure. `compression` is "zstd" or
  // "off"; zstd is honoured only when built with ACE_WITH_ZSTD.
  std::string put(const std::string& data, const std::string& compression = "zstd");

  std::optional<std::string> get(const std::string& key) const;
  std::optional<BackupObjectInfo> info(const std::string& key) const;
  bool contains(const std::string& key) const;

  const std::string& root() const { return root_; }

  static std::string key_for(const std::string& data);

 private:
  std::string root_;
  mutable std::mutex mu_;
  mutable std::map<std::string, BackupObjectInfo> meta_cache_;

  std::string object_path(const std::string& key) const;
  std::string meta_path(const std::string& key) const;
};

}  // namespace ace
