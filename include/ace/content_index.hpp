#pragma once

// ace/content_index.hpp - Per-file content fingerprints for incremental runs.
//
// Entries are keyed by absolute, lexically normalized path. Hashing is
// SHA-256 over raw bytes. clean_runs_count resets to 0 whenever add_file()
// sees new content and increments once per clean analysis pass.
//
// PERSISTENCE: .ace/index.json,
//   {"entries": {abs_path: {size, sha256, clean_runs_count}}, "format_version": 1}
// save() goes through atomic_write(), so a failed save leaves the previous
// file intact. A corrupted file loads as an empty index.
//
// THREAD SAFETY: none. The index is touched only on the committing path.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ace/jsonlite.hpp"

namespace ace {

struct IndexEntry {
  std::string path;
  uint64_t size{0};
  std::string sha256;
  uint64_t clean_runs_count{0};

  jsonlite::Value to_value() const;
  static IndexEntry from_value(const std::string& path, const jsonlite::Value& v);
};

struct IndexStats {
  uint64_t total_files{0};
  uint64_t total_size{0};
  uint64_t clean_files{0};  // clean_runs_count > 0

  jsonlite::Value to_value() const;
};

class ContentIndex {
 public:
  explicit ContentIndex(std::string index_path);

  void load();
  bool save(std::string* error = nullptr) const;

  // nullopt when the file cannot be read. preserve_clean_runs keeps the count
  // only if the content is unchanged.
  std::optional<IndexEntry> add_file(const std::string& path, bool preserve_clean_runs = false);

  // True when the path is not indexed, no longer exists, or its bytes differ.
  bool has_changed(const std::string& path) const;

  void increment_clean_runs(const std::string& path);
  void reset_clean_runs(const std::string& path);
  bool should_skip_deep_scan(const std::string& path, uint64_t threshold) const;

  std::vector<std::string> get_changed_files(const std::vector<std::string>& paths) const;
  void rebuild(const std::vector<std::string>& paths);
  void remove_file(const std::string& path);

  std::optional<IndexEntry> entry(const std::string& path) const;
  IndexStats get_stats() const;
  const std::string& path() const { return index_path_; }

  static std::string normalize(const std::string& path);

 private:
  std::string index_path_;
  std::map<std::string, IndexEntry> entries_;
};

// Rejects hidden files, common binary extensions and files over 10 MiB.
bool is_indexable(const std::string& path);

}  // namespace ace
