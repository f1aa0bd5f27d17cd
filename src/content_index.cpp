#include "ace/content_index.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

#include "ace/fileio.hpp"
#include "ace/hash.hpp"
#include "ace/observability.hpp"
#include "ace/version.hpp"

namespace fs = std::filesystem;

namespace ace {

namespace {

constexpr uint64_t kMaxIndexableBytes = 10ull * 1024 * 1024;

}  // namespace

jsonlite::Value IndexEntry::to_value() const {
  jsonlite::Object o;
  o["size"] = size;
  o["sha256"] = sha256;
  o["clean_runs_count"] = clean_runs_count;
  return o;
}

IndexEntry IndexEntry::from_value(const std::string& path, const jsonlite::Value& v) {
  IndexEntry e;
  e.path = path;
  if (const auto* o = v.as_object()) {
    e.size = jsonlite::get_u64(*o, "size");
    e.sha256 = jsonlite::get_string(*o, "sha256");
    e.clean_runs_count = jsonlite::get_u64(*o, "clean_runs_count");
  }
  return e;
}

jsonlite::Value IndexStats::to_value() const {
  jsonlite::Object o;
  o["total_files"] = total_files;
  o["total_size"] = total_size;
  o["clean_files"] = clean_files;
  return o;
}

ContentIndex::ContentIndex(std::string index_path) : index_path_(std::move(index_path)) {}

std::string ContentIndex::normalize(const std::string& path) {
  std::error_code ec;
  fs::path abs = fs::absolute(path, ec);
  if (ec) abs = fs::path(path);
  return abs.lexically_normal().string();
}

void ContentIndex::load() {
  entries_.clear();
  std::error_code ec;
  if (!fs::exists(index_path_, ec)) return;

  std::string error;
  auto text = read_file_bytes(index_path_, &error);
  if (!text) {
    log(LogLevel::warn, "index", "cannot read " + index_path_ + ", starting fresh: " + error);
    return;
  }
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(*text, &err);
  if (err) {
    log(LogLevel::warn, "index", index_path_ + " is corrupted, starting fresh: " + err->message);
    return;
  }
  std::string version_error;
  if (!version::check_format_version("index", jsonlite::get_u64(obj, "format_version"),
                                     version::INDEX_FORMAT_VERSION, &version_error)) {
    log(LogLevel::warn, "index", version_error + ", starting fresh");
    return;
  }
  if (const auto* entries = jsonlite::get_object(obj, "entries")) {
    for (const auto& [path, value] : *entries) {
      IndexEntry e = IndexEntry::from_value(path, value);
      if (!is_hex_digest(e.sha256)) {
        log(LogLevel::warn, "index", "dropping malformed entry for " + path);
        continue;
      }
      entries_[path] = std::move(e);
    }
  }
}

bool ContentIndex::save(std::string* error) const {
  jsonlite::Object entries;
  for (const auto& [path, e] : entries_) entries[path] = e.to_value();
  jsonlite::Object doc;
  doc["entries"] = std::move(entries);
  doc["format_version"] = static_cast<uint64_t>(version::INDEX_FORMAT_VERSION);
  return atomic_write(index_path_, jsonlite::to_json_pretty(doc) + "\n", error);
}

std::optional<IndexEntry> ContentIndex::add_file(const std::string& path, bool preserve_clean_runs) {
  const std::string key = normalize(path);
  auto data = read_file_bytes(key);
  if (!data) return std::nullopt;

  IndexEntry e;
  e.path = key;
  e.size = data->size();
  e.sha256 = sha256_hex(*data);

  auto it = entries_.find(key);
  if (preserve_clean_runs && it != entries_.end() && it->second.sha256 == e.sha256) {
    e.clean_runs_count = it->second.clean_runs_count;
  }
  entries_[key] = e;
  return e;
}

bool ContentIndex::has_changed(const std::string& path) const {
  const std::string key = normalize(path);
  auto it = entries_.find(key);
  if (it == entries_.end()) return true;

  std::error_code ec;
  const auto size = fs::file_size(key, ec);
  if (ec || size != it->second.size) return true;
  return sha256_file_hex(key) != it->second.sha256;
}

void ContentIndex::increment_clean_runs(const std::string& path) {
  auto it = entries_.find(normalize(path));
  if (it != entries_.end()) ++it->second.clean_runs_count;
}

void ContentIndex::reset_clean_runs(const std::string& path) {
  auto it = entries_.find(normalize(path));
  if (it != entries_.end()) it->second.clean_runs_count = 0;
}

bool ContentIndex::should_skip_deep_scan(const std::string& path, uint64_t threshold) const {
  auto it = entries_.find(normalize(path));
  return it != entries_.end() && it->second.clean_runs_count >= threshold;
}

std::vector<std::string> ContentIndex::get_changed_files(const std::vector<std::string>& paths) const {
  std::vector<std::string> changed;
  for (const auto& p : paths) {
    if (has_changed(p)) changed.push_back(p);
  }
  return changed;
}

void ContentIndex::rebuild(const std::vector<std::string>& paths) {
  entries_.clear();
  for (const auto& p : paths) {
    if (!add_file(p)) log(LogLevel::debug, "index", "rebuild skipped unreadable " + p);
  }
}

void ContentIndex::remove_file(const std::string& path) { entries_.erase(normalize(path)); }

std::optional<IndexEntry> ContentIndex::entry(const std::string& path) const {
  auto it = entries_.find(normalize(path));
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

IndexStats ContentIndex::get_stats() const {
  IndexStats s;
  s.total_files = entries_.size();
  for (const auto& [_, e] : entries_) {
    s.total_size += e.size;
    if (e.clean_runs_count > 0) ++s.clean_files;
  }
  return s;
}

bool is_indexable(const std::string& path) {
  const fs::path p(path);
  const std::string name = p.filename().string();
  if (name.empty() || name[0] == '.') return false;

  static const std::set<std::string> kBinaryExts = {
      ".pyc", ".pyo", ".so",  ".dylib", ".dll", ".exe", ".bin", ".jpg",
      ".jpeg", ".png", ".gif", ".pdf",  ".zip", ".tar", ".gz",  ".bz2",
  };
  std::string ext = p.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (kBinaryExts.count(ext)) return false;

  std::error_code ec;
  if (fs::exists(p, ec)) {
    const auto size = fs::file_size(p, ec);
    if (ec || size > kMaxIndexableBytes) return false;
  }
  return true;
}

}  // namespace ace
