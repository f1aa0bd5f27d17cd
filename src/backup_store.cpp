#include "ace/backup_store.hpp"

#include <filesystem>

#if defined(ACE_WITH_ZSTD)
#include <zstd.h>
#endif

#include "ace/fileio.hpp"
#include "ace/hash.hpp"
#include "ace/observability.hpp"
#include "ace/version.hpp"

namespace fs = std::filesystem;

namespace ace {

namespace {

#if defined(ACE_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  const size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, uint64_t original_size) {
  std::string out;
  out.resize(static_cast<size_t>(original_size));
  const size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != original_size) return std::nullopt;
  return out;
}
#endif

}  // namespace

jsonlite::Value BackupObjectInfo::to_value() const {
  jsonlite::Object o;
  o["key"] = key;
  o["encoding"] = encoding;
  o["original_size"] = original_size;
  o["stored_size"] = stored_size;
  o["stored_blob_hash"] = stored_blob_hash;
  o["created_at_ms"] = created_at_ms;
  o["format_version"] = static_cast<uint64_t>(version::BACKUP_FORMAT_VERSION);
  return o;
}

BackupObjectInfo BackupObjectInfo::from_value(const jsonlite::Value& v) {
  BackupObjectInfo info;
  const auto* o = v.as_object();
  if (!o) return info;
  info.key = jsonlite::get_string(*o, "key");
  info.encoding = jsonlite::get_string(*o, "encoding", "identity");
  info.original_size = jsonlite::get_u64(*o, "original_size");
  info.stored_size = jsonlite::get_u64(*o, "stored_size");
  info.stored_blob_hash = jsonlite::get_string(*o, "stored_blob_hash");
  info.created_at_ms = jsonlite::get_u64(*o, "created_at_ms");
  info.format_version = jsonlite::get_u64(*o, "format_version");
  return info;
}

BackupStore::BackupStore(std::string root) : root_(std::move(root)) {
  fs::create_directories(fs::path(root_) / "objects");
}

std::string BackupStore::key_for(const std::string& data) { return hash_domain("bak:", data); }

std::string BackupStore::object_path(const std::string& key) const {
  return (fs::path(root_) / "objects" / key.substr(0, 2) / key.substr(2, 2) / key).string();
}

std::string BackupStore::meta_path(const std::string& key) const {
  return object_path(key) + ".meta";
}

std::string BackupStore::put(const std::string& data, const std::string& compression) {
  const std::string key = key_for(data);
  if (!is_hex_digest(key)) return {};

  // Dedup: an existing object must still decode to the same bytes.
  if (contains(key)) {
    auto existing = get(key);
    if (existing && *existing == data) return key;
    log(LogLevel::warn, "backup", "existing object " + key.substr(0, 16) + " failed verification, rewriting");
  }

  std::string stored = data;
  std::string encoding = "identity";
#if defined(ACE_WITH_ZSTD)
  if (compression == "zstd" && !data.empty()) {
    auto c = compress_zstd(data);
    if (!c.empty() && c.size() < data.size()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#else
  (void)compression;
#endif

  std::string error;
  if (!atomic_write(object_path(key), stored, &error)) {
    log(LogLevel::error, "backup", "object write failed: " + error);
    return {};
  }

  BackupObjectInfo info;
  info.key = key;
  info.encoding = encoding;
  info.original_size = data.size();
  info.stored_size = stored.size();
  info.stored_blob_hash = blake3_hex(stored);
  info.created_at_ms = unix_time_ms();
  info.format_version = version::BACKUP_FORMAT_VERSION;

  if (!atomic_write(meta_path(key), jsonlite::to_json(info.to_value()), &error)) {
    log(LogLevel::error, "backup", "meta write failed: " + error);
    std::error_code ec;
    fs::remove(object_path(key), ec);
    return {};
  }

  std::lock_guard<std::mutex> lk(mu_);
  meta_cache_[key] = std::move(info);
  return key;
}

std::optional<BackupObjectInfo> BackupStore::info(const std::string& key) const {
  if (!is_hex_digest(key)) return std::nullopt;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = meta_cache_.find(key);
    if (it != meta_cache_.end()) return it->second;
  }

  auto text = read_file_bytes(meta_path(key));
  if (!text) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  const auto value = jsonlite::parse_value(*text, &err);
  if (err) {
    log(LogLevel::warn, "backup", "unreadable meta for " + key.substr(0, 16) + ": " + err->message);
    return std::nullopt;
  }
  auto parsed = BackupObjectInfo::from_value(value);
  std::string version_error;
  if (parsed.key != key ||
      !version::check_format_version("backup", parsed.format_version,
                                     version::BACKUP_FORMAT_VERSION, &version_error)) {
    if (!version_error.empty()) log(LogLevel::warn, "backup", version_error);
    return std::nullopt;
  }

  std::lock_guard<std::mutex> lk(mu_);
  meta_cache_[key] = parsed;
  return parsed;
}

std::optional<std::string> BackupStore::get(const std::string& key) const {
  if (!is_hex_digest(key)) return std::nullopt;
  auto meta = info(key);
  if (!meta) return std::nullopt;

  auto data = read_file_bytes(object_path(key));
  if (!data) return std::nullopt;
  if (blake3_hex(*data) != meta->stored_blob_hash) return std::nullopt;

  if (meta->encoding == "zstd") {
#if defined(ACE_WITH_ZSTD)
    auto decoded = decompress_zstd(*data, meta->original_size);
    if (!decoded) return std::nullopt;
    data = std::move(decoded);
#else
    log(LogLevel::error, "backup", "object " + key.substr(0, 16) + " is zstd-encoded but zstd is not built in");
    return std::nullopt;
#endif
  }

  if (key_for(*data) != key) return std::nullopt;
  return data;
}

bool BackupStore::contains(const std::string& key) const {
  if (!is_hex_digest(key)) return false;
  std::error_code ec;
  return fs::exists(object_path(key), ec) && fs::exists(meta_path(key), ec);
}

}  // namespace ace
