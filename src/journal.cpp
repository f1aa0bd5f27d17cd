#include "ace/journal.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <map>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

#include "ace/backup_store.hpp"
#include "ace/fileio.hpp"
#include "ace/hash.hpp"
#include "ace/observability.hpp"
#include "ace/version.hpp"

namespace fs = std::filesystem;

namespace ace {

namespace {

const std::string kGenesisDigest(64, '0');

std::string chain_digest(const std::string& line) { return hash_domain("jnl:", line); }

JournalEntryType type_from_string(const std::string& s) {
  if (s == "intent") return JournalEntryType::intent;
  if (s == "success") return JournalEntryType::success;
  if (s == "revert") return JournalEntryType::revert;
  return JournalEntryType::unknown;
}

bool write_all(int fd, const std::string& data) {
  size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
}

bool blank(const std::string& line) {
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

}  // namespace

std::string to_string(JournalEntryType t) {
  switch (t) {
    case JournalEntryType::intent: return "intent";
    case JournalEntryType::success: return "success";
    case JournalEntryType::revert: return "revert";
    case JournalEntryType::unknown: break;
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// JournalEntry
// ---------------------------------------------------------------------------

jsonlite::Value JournalEntry::to_value() const {
  jsonlite::Object o;
  o["type"] = to_string(type);
  o["seq"] = seq;
  o["prev"] = prev;
  o["timestamp"] = timestamp;
  o["file"] = file;
  o["format_version"] = static_cast<uint64_t>(version::JOURNAL_FORMAT_VERSION);
  switch (type) {
    case JournalEntryType::intent:
      o["before_sha"] = before_sha;
      o["before_size"] = before_size;
      o["rule_ids"] = jsonlite::to_array(rule_ids);
      o["plan_id"] = plan_id;
      o["pre_image"] = pre_image;
      if (!backup_key.empty()) o["backup_key"] = backup_key;
      if (!context_key.empty()) o["context_key"] = context_key;
      break;
    case JournalEntryType::success:
      o["after_sha"] = after_sha;
      o["after_size"] = after_size;
      o["receipt_id"] = receipt_id;
      if (receipt) o["receipt"] = receipt->to_value();
      break;
    case JournalEntryType::revert:
      o["from_sha"] = from_sha;
      o["to_sha"] = to_sha;
      o["reason"] = reason;
      break;
    case JournalEntryType::unknown:
      break;
  }
  return o;
}

JournalEntry JournalEntry::from_value(const jsonlite::Value& v) {
  JournalEntry e;
  const auto* o = v.as_object();
  if (!o) return e;
  e.type = type_from_string(jsonlite::get_string(*o, "type"));
  e.seq = jsonlite::get_u64(*o, "seq");
  e.prev = jsonlite::get_string(*o, "prev");
  e.timestamp = jsonlite::get_string(*o, "timestamp");
  e.file = jsonlite::get_string(*o, "file");
  e.before_sha = jsonlite::get_string(*o, "before_sha");
  e.before_size = jsonlite::get_u64(*o, "before_size");
  e.rule_ids = jsonlite::get_string_array(*o, "rule_ids");
  e.plan_id = jsonlite::get_string(*o, "plan_id");
  e.pre_image = jsonlite::get_string(*o, "pre_image");
  e.backup_key = jsonlite::get_string(*o, "backup_key");
  e.context_key = jsonlite::get_string(*o, "context_key");
  e.after_sha = jsonlite::get_string(*o, "after_sha");
  e.after_size = jsonlite::get_u64(*o, "after_size");
  e.receipt_id = jsonlite::get_string(*o, "receipt_id");
  if (auto it = o->find("receipt"); it != o->end() && it->second.as_object()) {
    e.receipt = Receipt::from_value(it->second);
  }
  e.from_sha = jsonlite::get_string(*o, "from_sha");
  e.to_sha = jsonlite::get_string(*o, "to_sha");
  e.reason = jsonlite::get_string(*o, "reason");
  return e;
}

// ---------------------------------------------------------------------------
// Journal
// ---------------------------------------------------------------------------

Journal::Journal(std::string run_id, std::string dir)
    : run_id_(std::move(run_id)), last_digest_(kGenesisDigest) {
  fs::create_directories(dir);
  path_ = (fs::path(dir) / (run_id_ + ".jsonl")).string();
}

Journal::~Journal() { close(); }

ErrorCode Journal::append(JournalEntry entry) {
  std::lock_guard<std::mutex> lk(mu_);
  if (closed_) return ErrorCode::journal_closed;

  if (fd_ < 0) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      log(LogLevel::error, "journal", "open " + path_ + ": " + std::strerror(errno));
      return ErrorCode::io_error;
    }
  }

  entry.seq = seq_ + 1;
  entry.prev = last_digest_;
  entry.timestamp = iso8601_utc_ms();
  const std::string line = jsonlite::to_json(entry.to_value());

  if (!write_all(fd_, line + "\n") || ::fsync(fd_) != 0) {
    log(LogLevel::error, "journal", "append to " + path_ + " failed: " + std::strerror(errno));
    return ErrorCode::io_error;
  }
  ++seq_;
  last_digest_ = chain_digest(line);
  return ErrorCode::none;
}

ErrorCode Journal::log_intent(const std::string& file, const std::string& before_sha,
                              uint64_t before_size, std::vector<std::string> rule_ids,
                              const std::string& plan_id, const std::string& pre_image,
                              const std::string& backup_key, const std::string& context_key) {
  std::sort(rule_ids.begin(), rule_ids.end());
  JournalEntry e;
  e.type = JournalEntryType::intent;
  e.file = file;
  e.before_sha = before_sha;
  e.before_size = before_size;
  e.rule_ids = std::move(rule_ids);
  e.plan_id = plan_id;
  e.pre_image = pre_image;
  e.backup_key = backup_key;
  e.context_key = context_key;
  return append(std::move(e));
}

ErrorCode Journal::log_success(const std::string& file, const std::string& after_sha,
                               uint64_t after_size, const std::string& receipt_id,
                               const Receipt* receipt) {
  JournalEntry e;
  e.type = JournalEntryType::success;
  e.file = file;
  e.after_sha = after_sha;
  e.after_size = after_size;
  e.receipt_id = receipt_id;
  if (receipt) e.receipt = *receipt;
  return append(std::move(e));
}

ErrorCode Journal::log_revert(const std::string& file, const std::string& from_sha,
                              const std::string& to_sha, const std::string& reason) {
  JournalEntry e;
  e.type = JournalEntryType::revert;
  e.file = file;
  e.from_sha = from_sha;
  e.to_sha = to_sha;
  e.reason = reason;
  return append(std::move(e));
}

void Journal::close() {
  std::lock_guard<std::mutex> lk(mu_);
  if (closed_) return;
  closed_ = true;
  if (fd_ >= 0) {
    if (::fsync(fd_) != 0 || ::close(fd_) != 0) {
      log(LogLevel::warn, "journal", "close " + path_ + ": " + std::strerror(errno));
    }
    fd_ = -1;
  }
}

bool Journal::closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

uint64_t Journal::entry_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return seq_;
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

std::vector<JournalEntry> read_journal(const std::string& path) {
  std::vector<JournalEntry> entries;
  std::error_code ec;
  if (!fs::exists(path, ec)) return entries;

  std::string error;
  auto text = read_file_bytes(path, &error);
  if (!text) {
    log(LogLevel::warn, "journal", "cannot read " + path + ": " + error);
    return entries;
  }

  uint64_t line_no = 0;
  for (const auto& line : split_lines(*text)) {
    ++line_no;
    if (blank(line)) continue;
    std::optional<jsonlite::JsonError> err;
    const auto value = jsonlite::parse_value(line, &err);
    if (err || !value.as_object()) {
      log(LogLevel::warn, "journal", path + ":" + std::to_string(line_no) + " skipped: invalid JSON");
      continue;
    }
    std::string version_error;
    if (!version::check_format_version("journal",
                                       jsonlite::get_u64(*value.as_object(), "format_version"),
                                       version::JOURNAL_FORMAT_VERSION, &version_error)) {
      log(LogLevel::warn, "journal", path + ":" + std::to_string(line_no) + " skipped: " + version_error);
      continue;
    }
    entries.push_back(JournalEntry::from_value(value));
  }
  return entries;
}

bool verify_journal_chain(const std::string& path, std::string* error) {
  std::string read_error;
  auto text = read_file_bytes(path, &read_error);
  if (!text) {
    if (error) *error = read_error;
    return false;
  }

  std::string expected_prev = kGenesisDigest;
  uint64_t expected_seq = 1;
  uint64_t line_no = 0;
  for (const auto& line : split_lines(*text)) {
    ++line_no;
    if (blank(line)) continue;
    const std::string where = "line " + std::to_string(line_no) + ": ";
    std::optional<jsonlite::JsonError> err;
    const auto obj = jsonlite::parse(line, &err);
    if (err) {
      if (error) *error = where + "invalid JSON";
      return false;
    }
    if (jsonlite::get_u64(obj, "seq") != expected_seq) {
      if (error) *error = where + "expected seq " + std::to_string(expected_seq);
      return false;
    }
    if (jsonlite::get_string(obj, "prev") != expected_prev) {
      if (error) *error = where + "chain digest mismatch";
      return false;
    }
    expected_prev = chain_digest(line);
    ++expected_seq;
  }
  return true;
}

std::vector<RevertContext> build_revert_plan(const std::string& path) {
  std::map<std::string, JournalEntry> pending;
  std::vector<RevertContext> plan;
  for (auto& e : read_journal(path)) {
    if (e.type == JournalEntryType::intent) {
      pending[e.file] = std::move(e);
    } else if (e.type == JournalEntryType::success) {
      auto it = pending.find(e.file);
      if (it == pending.end()) continue;
      RevertContext ctx;
      ctx.file = e.file;
      ctx.expected_current_sha = e.after_sha;
      ctx.original_sha = it->second.before_sha;
      ctx.restore_content = std::move(it->second.pre_image);
      ctx.plan_id = it->second.plan_id;
      ctx.rule_ids = it->second.rule_ids;
      ctx.backup_key = it->second.backup_key;
      ctx.context_key = it->second.context_key;
      plan.push_back(std::move(ctx));
      pending.erase(it);
    }
  }
  std::reverse(plan.begin(), plan.end());
  return plan;
}

std::optional<std::string> find_latest_journal(const std::string& dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return std::nullopt;

  std::optional<fs::path> latest;
  fs::file_time_type latest_time{};
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file(ec) || entry.path().extension() != ".jsonl") continue;
    const auto t = entry.last_write_time(ec);
    if (ec) continue;
    if (!latest || t > latest_time || (t == latest_time && entry.path() > *latest)) {
      latest = entry.path();
      latest_time = t;
    }
  }
  if (!latest) return std::nullopt;
  return latest->string();
}

std::string get_journal_id_from_path(const std::string& path) {
  return fs::path(path).stem().string();
}

// ---------------------------------------------------------------------------
// Revert executor
// ---------------------------------------------------------------------------

RevertOutcome revert_from_journal(const std::string& journal_path, Journal& revert_journal,
                                  const BackupStore* backups) {
  RevertOutcome out;
  const std::string reason = "revert of " + get_journal_id_from_path(journal_path);

  for (const auto& ctx : build_revert_plan(journal_path)) {
    const std::string current = sha256_file_hex(ctx.file);
    if (current != ctx.expected_current_sha) {
      out.conflicts.push_back(ctx.file + ": modified since commit (expected " +
                              ctx.expected_current_sha.substr(0, 8) + "..., found " +
                              (current.empty() ? std::string("missing file") : current.substr(0, 8) + "...") +
                              ")");
      continue;
    }

    std::string restore = ctx.restore_content;
    if (sha256_hex(restore) != ctx.original_sha) {
      std::optional<std::string> from_backup;
      if (backups && !ctx.backup_key.empty()) from_backup = backups->get(ctx.backup_key);
      if (!from_backup || sha256_hex(*from_backup) != ctx.original_sha) {
        out.errors.push_back(ctx.file + ": no intact pre-image in journal or backup store");
        continue;
      }
      log(LogLevel::warn, "journal", ctx.file + ": journal pre-image damaged, restored from backup store");
      restore = std::move(*from_backup);
    }

    std::string write_error;
    if (!atomic_write(ctx.file, restore, &write_error)) {
      out.errors.push_back(ctx.file + ": " + write_error);
      continue;
    }
    const std::string restored = sha256_file_hex(ctx.file);
    if (restored != ctx.original_sha) {
      out.errors.push_back(ctx.file + ": restored content hash mismatch");
      continue;
    }
    const ErrorCode logged = revert_journal.log_revert(ctx.file, current, restored, reason);
    if (logged != ErrorCode::none) {
      out.errors.push_back(ctx.file + ": reverted but journal write failed: " + to_string(logged));
    }
    ++out.reverted;
    RevertContext done = ctx;
    done.restore_content.clear();
    out.restored.push_back(std::move(done));
  }
  return out;
}

}  // namespace ace
