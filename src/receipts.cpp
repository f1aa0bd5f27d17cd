#include "ace/receipts.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <set>
#include <sstream>
#include <utility>

#include "ace/fileio.hpp"
#include "ace/hash.hpp"
#include "ace/observability.hpp"

namespace fs = std::filesystem;

namespace ace {

jsonlite::Value Receipt::to_value() const {
  jsonlite::Object o;
  o["plan_id"] = plan_id;
  o["file"] = file;
  o["before_hash"] = before_hash;
  o["after_hash"] = after_hash;
  o["parse_valid"] = parse_valid;
  o["invariants_met"] = invariants_met;
  o["estimated_risk"] = estimated_risk;
  o["duration_ms"] = duration_ms;
  o["timestamp"] = timestamp;
  if (!policy_hash.empty()) o["policy_hash"] = policy_hash;
  return o;
}

Receipt Receipt::from_value(const jsonlite::Value& v) {
  Receipt r;
  const auto* o = v.as_object();
  if (!o) return r;
  r.plan_id = jsonlite::get_string(*o, "plan_id");
  r.file = jsonlite::get_string(*o, "file");
  r.before_hash = strip_hash_prefix(jsonlite::get_string(*o, "before_hash"));
  r.after_hash = strip_hash_prefix(jsonlite::get_string(*o, "after_hash"));
  r.parse_valid = jsonlite::get_bool(*o, "parse_valid");
  r.invariants_met = jsonlite::get_bool(*o, "invariants_met");
  r.estimated_risk = jsonlite::get_double(*o, "estimated_risk");
  r.duration_ms = jsonlite::get_u64(*o, "duration_ms");
  r.timestamp = jsonlite::get_string(*o, "timestamp");
  r.policy_hash = jsonlite::get_string(*o, "policy_hash");
  return r;
}

Receipt create_receipt(const std::string& plan_id, const std::string& file,
                       const std::string& before_content, const std::string& after_content,
                       bool parse_valid, bool invariants_met, double estimated_risk,
                       uint64_t duration_ms, const std::string& policy_hash) {
  Receipt r;
  r.plan_id = plan_id;
  r.file = file;
  r.before_hash = strip_hash_prefix(content_hash(before_content));
  r.after_hash = strip_hash_prefix(content_hash(after_content));
  r.parse_valid = parse_valid;
  r.invariants_met = invariants_met;
  r.estimated_risk = estimated_risk;
  r.duration_ms = duration_ms;
  r.timestamp = iso8601_utc_ms();
  r.policy_hash = policy_hash;
  return r;
}

bool verify_receipt(const Receipt& receipt, const std::string& current_content) {
  return sha256_hex(current_content) == strip_hash_prefix(receipt.after_hash);
}

bool is_idempotent_transformation(const std::string& before, const std::string& after) {
  return sha256_hex(before) == sha256_hex(after);
}

std::string receipt_id(const Receipt& receipt) {
  return fingerprint("rcpt:", jsonlite::to_json(receipt.to_value()));
}

namespace {

struct JournalLine {
  std::string where;
  std::optional<jsonlite::Object> obj;  // nullopt: invalid JSON
};

std::string normalized(const fs::path& p) {
  std::error_code ec;
  fs::path abs = fs::absolute(p, ec);
  if (ec) abs = p;
  return abs.lexically_normal().string();
}

}  // namespace

std::vector<std::string> verify_receipts(const std::string& root_dir) {
  std::vector<std::string> failures;
  const fs::path journals = fs::path(root_dir) / ".ace" / "journals";
  std::error_code ec;
  if (!fs::is_directory(journals, ec)) return failures;

  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(journals, ec)) {
    if (entry.path().extension() == ".jsonl") files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());

  std::vector<JournalLine> lines;
  // (absolute file, sha the revert started from)
  std::set<std::pair<std::string, std::string>> reverted;
  for (const auto& journal : files) {
    const std::string name = journal.filename().string();
    std::string read_error;
    auto text = read_file_bytes(journal.string(), &read_error);
    if (!text) {
      failures.push_back(name + " - Cannot read journal: " + read_error);
      continue;
    }

    std::istringstream in(*text);
    std::string line;
    uint64_t line_no = 0;
    while (std::getline(in, line)) {
      ++line_no;
      if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
      JournalLine jl;
      jl.where = name + ":" + std::to_string(line_no) + " - ";
      std::optional<jsonlite::JsonError> err;
      auto obj = jsonlite::parse(line, &err);
      if (!err) {
        if (jsonlite::get_string(obj, "type") == "revert") {
          reverted.emplace(normalized(jsonlite::get_string(obj, "file")),
                           jsonlite::get_string(obj, "from_sha"));
        }
        jl.obj = std::move(obj);
      }
      lines.push_back(std::move(jl));
    }
  }

  for (const auto& jl : lines) {
    if (!jl.obj) {
      failures.push_back(jl.where + "Invalid JSON");
      continue;
    }
    const auto& obj = *jl.obj;
    if (jsonlite::get_string(obj, "type") != "success") continue;
    auto it = obj.find("receipt");
    if (it == obj.end() || !it->second.as_object()) continue;

    const Receipt receipt = Receipt::from_value(it->second);
    const fs::path target = fs::path(root_dir) / receipt.file;
    if (reverted.count({normalized(target), strip_hash_prefix(receipt.after_hash)})) continue;
    if (!fs::exists(target, ec)) {
      failures.push_back(jl.where + "File no longer exists: " + receipt.file);
      continue;
    }
    std::string file_error;
    auto current = read_file_bytes(target.string(), &file_error);
    if (!current) {
      failures.push_back(jl.where + "Cannot read " + receipt.file + ": " + file_error);
      continue;
    }
    if (!verify_receipt(receipt, *current)) {
      failures.push_back(jl.where + "Hash mismatch for " + receipt.file + " (expected " +
                         receipt.after_hash.substr(0, 8) + "...)");
    }
  }

  if (!failures.empty()) {
    log(LogLevel::warn, "receipts", std::to_string(failures.size()) + " receipt check(s) failed");
  }
  return failures;
}

}  // namespace ace
