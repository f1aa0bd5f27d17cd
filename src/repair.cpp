#include "ace/repair.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

#include "ace/edits.hpp"
#include "ace/fileio.hpp"
#include "ace/observability.hpp"

namespace fs = std::filesystem;

namespace ace {

namespace {

struct Range {
  size_t lo;
  size_t hi;  // exclusive
};

std::vector<uint64_t> to_u64(const std::vector<size_t>& v) {
  return std::vector<uint64_t>(v.begin(), v.end());
}

std::string format_reason(const GuardResult& g) {
  if (g.errors.empty()) return "Guard failed: " + g.guard_type;
  std::string out = g.guard_type + ": ";
  const size_t n = std::min<size_t>(g.errors.size(), 3);
  for (size_t i = 0; i < n; ++i) {
    if (i) out += "; ";
    out += g.errors[i];
  }
  return out;
}

std::string index_list(const std::vector<size_t>& v) {
  std::string out = "[";
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) out += ", ";
    out += std::to_string(v[i]);
  }
  return out + "]";
}

std::vector<std::string> suggestions_for(const GuardResult& g, const std::vector<size_t>& failed) {
  std::vector<std::string> s;
  if (g.guard_type == "parse") {
    s.push_back("Syntax error introduced by edit");
    s.push_back("Review the transformation logic for parse correctness");
  } else if (g.guard_type == "ast_equiv") {
    s.push_back("Semantic change detected (AST mismatch)");
    s.push_back("Edit may have unintended side effects");
  } else if (g.guard_type == "cst_apply") {
    s.push_back("Edited source does not round-trip through the token stream");
  } else if (g.guard_type == "apply") {
    s.push_back("Edits overlap or fall outside the file");
    s.push_back("Check the line ranges produced by the codemod");
  }
  if (failed.size() == 1) {
    s.push_back("Only edit #" + std::to_string(failed.front()) + " failed");
  } else {
    s.push_back("Edits " + index_list(failed) + " failed guard checks");
  }
  s.push_back("Manual review recommended before re-attempting");
  return s;
}

// Applies the subset and runs the guard. Edits that cannot be applied count
// as a guard failure of type "apply".
GuardResult check_subset(const std::string& file, const std::vector<Edit>& sorted,
                         const std::string& original, const std::vector<size_t>& subset,
                         const GuardFn& guard, std::string* content, uint64_t& calls) {
  auto applied = apply_edits(original, sorted, subset);
  if (!applied.ok()) {
    GuardResult g;
    g.passed = false;
    g.file = file;
    g.before_content = original;
    g.guard_type = "apply";
    g.errors.push_back(to_string(applied.error) + ": " + applied.message);
    return g;
  }
  ++calls;
  GuardResult g = guard(file, original, applied.content);
  if (content) *content = std::move(applied.content);
  return g;
}

}  // namespace

jsonlite::Value RepairReport::to_value() const {
  jsonlite::Array safe, failed;
  for (auto i : safe_edit_indices) safe.emplace_back(i);
  for (auto i : failed_edit_indices) failed.emplace_back(i);
  jsonlite::Object o;
  o["run_id"] = run_id;
  o["file"] = file;
  o["total_edits"] = total_edits;
  o["safe_edits"] = safe_edits;
  o["failed_edits"] = failed_edits;
  o["safe_edit_indices"] = std::move(safe);
  o["failed_edit_indices"] = std::move(failed);
  o["guard_failure_reason"] = guard_failure_reason;
  o["repair_suggestions"] = jsonlite::to_array(repair_suggestions);
  o["timestamp"] = timestamp;
  return o;
}

RepairReport RepairReport::from_value(const jsonlite::Value& v) {
  RepairReport r;
  const auto* o = v.as_object();
  if (!o) return r;
  r.run_id = jsonlite::get_string(*o, "run_id");
  r.file = jsonlite::get_string(*o, "file");
  r.total_edits = jsonlite::get_u64(*o, "total_edits");
  r.safe_edits = jsonlite::get_u64(*o, "safe_edits");
  r.failed_edits = jsonlite::get_u64(*o, "failed_edits");
  r.safe_edit_indices = jsonlite::get_u64_array(*o, "safe_edit_indices");
  r.failed_edit_indices = jsonlite::get_u64_array(*o, "failed_edit_indices");
  r.guard_failure_reason = jsonlite::get_string(*o, "guard_failure_reason");
  r.repair_suggestions = jsonlite::get_string_array(*o, "repair_suggestions");
  r.timestamp = jsonlite::get_string(*o, "timestamp");
  return r;
}

TryApplyResult try_apply_with_repair(const std::string& file, const std::vector<Edit>& edits,
                                     const std::string& original, const GuardFn& guard,
                                     const std::string& run_id) {
  TryApplyResult result;
  result.content = original;
  if (edits.empty()) {
    result.success = true;
    return result;
  }

  const std::vector<Edit> sorted = sort_edits(edits);
  const size_t n = sorted.size();

  std::vector<size_t> all(n);
  for (size_t i = 0; i < n; ++i) all[i] = i;

  std::string merged;
  const GuardResult full = check_subset(file, sorted, original, all, guard, &merged, result.guard_calls);
  if (full.passed) {
    result.success = true;
    result.content = std::move(merged);
    return result;
  }

  // Bisection over an explicit stack; the top is always the lowest pending range.
  std::vector<size_t> accepted;
  std::vector<size_t> failed;
  std::string accepted_content = original;
  std::vector<Range> stack;
  if (n == 1) {
    failed.push_back(0);
  } else {
    stack.push_back({n / 2, n});
    stack.push_back({0, n / 2});
  }

  while (!stack.empty()) {
    const Range r = stack.back();
    stack.pop_back();

    std::vector<size_t> candidate = accepted;
    for (size_t i = r.lo; i < r.hi; ++i) candidate.push_back(i);

    std::string content;
    const GuardResult g = check_subset(file, sorted, original, candidate, guard, &content, result.guard_calls);
    if (g.passed) {
      accepted = std::move(candidate);
      accepted_content = std::move(content);
    } else if (r.hi - r.lo == 1) {
      failed.push_back(r.lo);
    } else {
      const size_t mid = r.lo + (r.hi - r.lo) / 2;
      stack.push_back({mid, r.hi});
      stack.push_back({r.lo, mid});
    }
  }

  RepairReport report;
  report.run_id = run_id;
  report.file = file;
  report.total_edits = n;
  report.safe_edits = accepted.size();
  report.failed_edits = failed.size();
  report.safe_edit_indices = to_u64(accepted);
  report.failed_edit_indices = to_u64(failed);
  report.guard_failure_reason = format_reason(full);
  report.timestamp = iso8601_utc_ms();

  if (accepted.empty()) {
    report.repair_suggestions = {"All edits failed guard checks",
                                 "Review the rule logic or file structure",
                                 "Consider filing a bug report if this seems incorrect"};
    result.success = false;
    result.content = original;
  } else {
    report.repair_suggestions = suggestions_for(full, failed);
    result.success = true;
    result.partial_apply = true;
    result.content = std::move(accepted_content);
  }
  log(LogLevel::info, "repair",
      file + ": kept " + std::to_string(accepted.size()) + "/" + std::to_string(n) + " edits after " +
          std::to_string(result.guard_calls) + " guard calls");
  result.report = std::move(report);
  return result;
}

std::optional<std::string> write_repair_report(const RepairReport& report, const std::string& dir,
                                               std::string* error) {
  std::string flat = fs::path(report.file).relative_path().generic_string();
  std::replace(flat.begin(), flat.end(), '/', '_');
  std::replace(flat.begin(), flat.end(), '\\', '_');
  const std::string name = report.run_id + "-" + flat + ".json";
  const fs::path path = fs::path(dir) / name;
  if (!atomic_write(path.string(), jsonlite::to_json_pretty(report.to_value()) + "\n", error)) {
    return std::nullopt;
  }
  return path.string();
}

std::optional<RepairReport> read_latest_repair_report(const std::string& dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return std::nullopt;

  std::optional<fs::path> latest;
  fs::file_time_type latest_time{};
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file(ec) || entry.path().extension() != ".json") continue;
    const auto t = entry.last_write_time(ec);
    if (ec) continue;
    // Ties go to the lexicographically greater name so the pick is stable.
    if (!latest || t > latest_time || (t == latest_time && entry.path() > *latest)) {
      latest = entry.path();
      latest_time = t;
    }
  }
  if (!latest) return std::nullopt;

  std::string read_error;
  auto text = read_file_bytes(latest->string(), &read_error);
  if (!text) {
    log(LogLevel::warn, "repair", "cannot read " + latest->string() + ": " + read_error);
    return std::nullopt;
  }
  std::optional<jsonlite::JsonError> err;
  const auto value = jsonlite::parse_value(*text, &err);
  if (err) {
    log(LogLevel::warn, "repair", latest->string() + ": " + err->message);
    return std::nullopt;
  }
  return RepairReport::from_value(value);
}

}  // namespace ace
