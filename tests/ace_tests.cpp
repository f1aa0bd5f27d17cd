#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "ace/backup_store.hpp"
#include "ace/config.hpp"
#include "ace/content_index.hpp"
#include "ace/edits.hpp"
#include "ace/fileio.hpp"
#include "ace/guard.hpp"
#include "ace/hash.hpp"
#include "ace/journal.hpp"
#include "ace/jsonlite.hpp"
#include "ace/learn.hpp"
#include "ace/observability.hpp"
#include "ace/pipeline.hpp"
#include "ace/policy.hpp"
#include "ace/receipts.hpp"
#include "ace/repair.hpp"
#include "ace/types.hpp"
#include "ace/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

fs::path scratch_dir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / ("ace_test_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void write_file(const fs::path& p, const std::string& data) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << data;
}

std::string read_file(const fs::path& p) {
  auto data = ace::read_file_bytes(p.string());
  expect(data.has_value(), "read " + p.string());
  return *data;
}

ace::Edit replace_line(const std::string& file, uint64_t line, const std::string& payload) {
  ace::Edit e;
  e.file = file;
  e.start_line = line;
  e.end_line = line;
  e.op = "replace";
  e.payload = payload;
  return e;
}

ace::Finding make_finding(const std::string& file, uint64_t line, const std::string& rule,
                          ace::Severity severity, const std::string& snippet = "") {
  ace::Finding f;
  f.file = file;
  f.line = line;
  f.rule = rule;
  f.severity = severity;
  f.message = rule + " at line " + std::to_string(line);
  f.snippet = snippet;
  return f;
}

const std::string kFiveLines = "a = 1\nb = 2\nc = 3\nd = 4\ne = 5\n";

// Edits 1 and 3 each leave an unclosed bracket; 0, 2 and 4 are safe.
std::vector<ace::Edit> five_edits(const std::string& file) {
  return {replace_line(file, 1, "a = 10"), replace_line(file, 2, "b = ("),
          replace_line(file, 3, "c = 30"), replace_line(file, 4, "d = ("),
          replace_line(file, 5, "e = 50")};
}

// ============================================================================
// Hashing & JSON
// ============================================================================

void test_sha256_vectors() {
  expect(ace::sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
         "SHA-256 empty vector");
  expect(ace::sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
         "SHA-256 abc vector");
  expect(ace::content_hash("abc") == "sha256:" + ace::sha256_hex("abc"), "content_hash carries prefix");
  expect(ace::strip_hash_prefix(ace::content_hash("abc")) == ace::sha256_hex("abc"), "prefix stripped");
  expect(ace::strip_hash_prefix("deadbeef") == "deadbeef", "unprefixed hash unchanged");
  expect(ace::strip_hash_prefix("blake3:" + ace::blake3_hex("abc")) == ace::blake3_hex("abc"),
         "any algorithm prefix stripped");
  expect(ace::strip_hash_prefix("sha-512:00ff") == "00ff", "dashed algorithm name stripped");
  expect(ace::strip_hash_prefix("note:hello") == "note:hello", "non-hex suffix kept");
  expect(ace::strip_hash_prefix(":abcd") == ":abcd", "empty algorithm name kept");
  expect(ace::strip_hash_prefix("sha256:") == "sha256:", "empty digest kept");
}

void test_blake3_vectors() {
  expect(ace::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(ace::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  expect(ace::hash_domain("rcpt:", "x") != ace::hash_domain("run:", "x"), "domains separate");
  expect(ace::hash_domain("rcpt:", "x") == ace::hash_domain("rcpt:", "x"), "domain hash deterministic");
  expect(ace::fingerprint("rcpt:", "x").size() == 16, "fingerprint is 16 hex chars");
  expect(ace::is_hex_digest(ace::sha256_hex("x")), "sha256 is a hex digest");
  expect(!ace::is_hex_digest("xyz"), "short non-hex is not a digest");
}

void test_file_hashing() {
  const auto dir = scratch_dir("file_hash");
  write_file(dir / "f.bin", std::string("a\0b", 3));
  expect(ace::sha256_file_hex((dir / "f.bin").string()) == ace::sha256_hex(std::string("a\0b", 3)),
         "file hash equals hash of its bytes");
  expect(ace::sha256_file_hex((dir / "missing").string()).empty(), "missing file hashes to empty");
  fs::remove_all(dir);
}

void test_json_sorted_and_strict() {
  std::optional<ace::jsonlite::JsonError> err;
  const auto obj = ace::jsonlite::parse(R"({"b":1,"a":[true,null,"x"]})", &err);
  expect(!err, "valid JSON parses");
  expect(ace::jsonlite::to_json(obj) == R"({"a":[true,null,"x"],"b":1})", "keys serialized sorted");

  ace::jsonlite::parse(R"({"a":1,"a":2})", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate keys rejected");
  ace::jsonlite::parse("{not json", &err);
  expect(err.has_value(), "garbage rejected");
}

void test_json_byte_string_roundtrip() {
  const std::string raw = std::string("line1\r\nnul\0ctl\x01 high\xff end", 25);
  const std::string text = ace::jsonlite::to_json(ace::jsonlite::Value(raw));
  std::optional<ace::jsonlite::JsonError> err;
  const auto back = ace::jsonlite::parse_value(text, &err);
  expect(!err && back.as_string() && *back.as_string() == raw, "arbitrary bytes survive JSON");
}

// ============================================================================
// Configuration
// ============================================================================

void clear_env() {
  for (const char* name : {"ACE_JOBS", "ACE_STRICT_GUARD", "ACE_CLEAN_RUN_THRESHOLD", "ACE_EVENT_LOG",
                           "ACE_LOG_LEVEL"}) {
    ::unsetenv(name);
  }
}

void test_config_defaults() {
  clear_env();
  const auto dir = scratch_dir("config_defaults");
  const auto r = ace::load_config(dir.string());
  expect(r.ok(), "missing config file is not an error");
  expect(r.config.jobs == 1 && !r.config.strict_guard && r.config.clean_run_threshold == 3, "defaults");
  expect(near(r.config.policy.alpha, 0.7) && near(r.config.policy.beta, 0.3), "default weights");
  expect(near(r.config.policy.auto_threshold, 0.70) && near(r.config.policy.suggest_threshold, 0.50),
         "default thresholds");
  fs::remove_all(dir);
}

void test_config_file_and_env() {
  clear_env();
  const auto dir = scratch_dir("config_file");
  fs::create_directories(dir / ".ace");
  write_file(dir / ".ace" / "config.json", R"({
  "jobs": 2,
  "strict_guard": true,
  "policy": {
    "auto_threshold": 0.8,
    "modes": {"R2": "detect-only"},
    "suppressions": {"paths": ["generated_*.py"], "rules": {"R3": ["legacy.py"]}}
  }
})");
  auto r = ace::load_config(dir.string());
  expect(r.ok(), "config loads: " + r.message);
  expect(r.config.jobs == 2 && r.config.strict_guard, "file values applied");
  expect(near(r.config.policy.auto_threshold, 0.8), "policy threshold applied");
  expect(r.config.policy.is_detect_only("R2") && !r.config.policy.is_detect_only("R1"), "modes");
  expect(r.config.policy.is_suppressed("src/generated_api.py", "R1"), "path suppression by basename");
  expect(r.config.policy.is_suppressed("legacy.py", "R3"), "rule suppression");
  expect(!r.config.policy.is_suppressed("legacy.py", "R1"), "rule suppression is per rule");

  ::setenv("ACE_JOBS", "4", 1);
  r = ace::load_config(dir.string());
  expect(r.ok() && r.config.jobs == 4, "environment overrides file");
  clear_env();
  fs::remove_all(dir);
}

void test_config_validation() {
  ace::PolicyConfig p;
  expect(ace::validate_policy_config(p).empty(), "defaults valid");
  p.auto_threshold = 0.4;
  expect(!ace::validate_policy_config(p).empty(), "auto < suggest rejected");
  p = ace::PolicyConfig{};
  p.alpha = 1.5;
  expect(!ace::validate_policy_config(p).empty(), "alpha out of range rejected");
  p = ace::PolicyConfig{};
  p.modes["R1"] = "sometimes";
  expect(!ace::validate_policy_config(p).empty(), "unknown mode rejected");

  clear_env();
  const auto dir = scratch_dir("config_invalid");
  fs::create_directories(dir / ".ace");
  write_file(dir / ".ace" / "config.json", R"({"policy": {"suggest_threshold": 0.9}})");
  const auto r = ace::load_config(dir.string());
  expect(!r.ok() && r.error == ace::ErrorCode::config_invalid, "invalid policy refused");
  expect(ace::exit_code_for(r.error) == ace::ExitCode::invalid_args, "config error maps to invalid_args");
  fs::remove_all(dir);
}

void test_policy_hash() {
  ace::PolicyConfig a;
  ace::PolicyConfig b;
  expect(ace::policy_hash(a).size() == 16, "policy hash is 16 hex chars");
  expect(ace::policy_hash(a) == ace::policy_hash(b), "equal policies hash equally");
  b.alpha = 0.6;
  expect(ace::policy_hash(a) != ace::policy_hash(b), "policy change changes hash");
}

// ============================================================================
// File I/O and edits
// ============================================================================

void test_atomic_write() {
  const auto dir = scratch_dir("atomic");
  const auto target = dir / "out.txt";
  std::string error;
  expect(ace::atomic_write(target.string(), "first", &error), "create: " + error);
  expect(ace::atomic_write(target.string(), "second", &error), "overwrite: " + error);
  expect(read_file(target) == "second", "content replaced");

  int entries = 0;
  for (const auto& e : fs::directory_iterator(dir)) {
    (void)e;
    ++entries;
  }
  expect(entries == 1, "no temp files left behind");

  write_file(dir / "plain", "x");
  expect(!ace::atomic_write((dir / "plain" / "child.txt").string(), "y", &error), "write under a file fails");
  expect(!error.empty(), "failure carries a message");
  expect(read_file(dir / "plain") == "x", "existing file untouched");
  fs::remove_all(dir);
}

void test_newline_detection() {
  expect(ace::detect_newline_style("a\nb\n") == "LF", "LF");
  expect(ace::detect_newline_style("a\r\nb\r\n") == "CRLF", "CRLF");
  expect(ace::detect_newline_style("a\rb\r") == "CR", "CR");
  expect(ace::detect_newline_style("a\nb\r\n") == "MIXED", "MIXED");
  expect(ace::normalize_newlines("x\ny", "CRLF") == "x\r\ny", "normalize to CRLF");
}

void test_edit_overlap_rules() {
  auto ins = [](uint64_t before) {
    ace::Edit e;
    e.start_line = before;
    e.end_line = before - 1;
    e.op = "insert";
    return e;
  };
  expect(ace::check_edit_overlap(replace_line("f", 1, ""), replace_line("f", 1, "")), "same line overlaps");
  expect(!ace::check_edit_overlap(replace_line("f", 1, ""), replace_line("f", 2, "")), "adjacent lines do not");
  expect(ace::check_edit_overlap(ins(2), ins(2)), "two inserts at one point overlap");
  expect(!ace::check_edit_overlap(ins(2), replace_line("f", 1, "")), "insert after a replaced line is fine");
  ace::Edit range = replace_line("f", 1, "");
  range.end_line = 3;
  expect(ace::check_edit_overlap(ins(2), range), "insert inside a replaced range overlaps");

  std::string error;
  expect(!ace::validate_non_overlapping({range, replace_line("f", 3, "")}, &error), "overlap reported");
  expect(!error.empty(), "overlap message");
  expect(ace::validate_non_overlapping(five_edits("f"), &error), "disjoint edits valid");
}

void test_apply_edits_ops() {
  const std::string original = "a\nb\nc\n";
  ace::Edit ins;
  ins.start_line = 1;
  ins.end_line = 0;
  ins.op = "insert";
  ins.payload = "z";
  ace::Edit del;
  del.start_line = 3;
  del.end_line = 3;
  del.op = "delete";
  ace::Edit app;
  app.start_line = 4;
  app.end_line = 3;
  app.op = "insert";
  app.payload = "d";

  expect(ace::apply_edits(original, {replace_line("f", 2, "B")}, {0}).content == "a\nB\nc\n", "replace");
  expect(ace::apply_edits(original, {ins}, {0}).content == "z\na\nb\nc\n", "insert at top");
  expect(ace::apply_edits(original, {del}, {0}).content == "a\nb\n", "delete");
  expect(ace::apply_edits(original, {app}, {0}).content == "a\nb\nc\nd\n", "append");

  const std::vector<ace::Edit> all = ace::sort_edits({app, del, replace_line("f", 2, "B"), ins});
  expect(ace::apply_edits(original, all, {0, 1, 2, 3}).content == "z\na\nB\nd\n", "combined edits");
  expect(ace::apply_edits(original, all, {}).content == original, "empty subset is identity");
}

void test_apply_edits_newlines() {
  expect(ace::apply_edits("a\r\nb\r\n", {replace_line("f", 1, "x\ny")}, {0}).content == "x\r\ny\r\nb\r\n",
         "payload adopts CRLF");
  ace::Edit app;
  app.start_line = 3;
  app.end_line = 2;
  app.op = "insert";
  app.payload = "c";
  expect(ace::apply_edits("a\nb", {app}, {0}).content == "a\nb\nc", "append after unterminated line");
  expect(ace::apply_edits("a\nb", {replace_line("f", 2, "B")}, {0}).content == "a\nB",
         "unterminated last line stays unterminated");
}

void test_apply_edits_errors() {
  auto r = ace::apply_edits("a\nb\n", {replace_line("f", 5, "x")}, {0});
  expect(r.error == ace::ErrorCode::edit_out_of_range, "out-of-range edit rejected");
  ace::Edit bad = replace_line("f", 1, "x");
  bad.op = "rewrite";
  r = ace::apply_edits("a\nb\n", {bad}, {0});
  expect(!r.ok(), "unknown op rejected");
  r = ace::apply_edits("a\nb\n", {replace_line("f", 1, "x"), replace_line("f", 1, "y")}, {0, 1});
  expect(r.error == ace::ErrorCode::edit_overlap, "overlapping subset rejected");
  expect(ace::count_lines("a\nb") == 2 && ace::count_lines("") == 0, "count_lines");
}

// ============================================================================
// Guard & repair
// ============================================================================

void test_guard_summary() {
  std::vector<ace::GuardResult> results;
  results.push_back(ace::guard_edit("a.py", "x = 1\n", "x = 2\n", false));
  results.push_back(ace::guard_edit("b.py", "x = 1\n", "x = 1  # same\n", true));
  results.push_back(ace::guard_edit("c.py", "x = 1\n", "x = (\n", false));
  const auto s = ace::get_guard_summary(results);
  expect(s.total == 3 && s.passed == 2 && s.failed == 1, "summary counts");
  expect(s.failures_by_type.at("parse") == 1, "failures grouped by type");
  expect(near(s.pass_rate, 2.0 / 3.0), "pass rate");

  const std::string text = ace::format_guard_error(results[2]);
  expect(text.find("PATCH GUARD FAILED") != std::string::npos, "error banner");
  expect(text.find("c.py") != std::string::npos, "banner names the file");

  const auto guard = ace::make_guard(true);
  expect(guard("notes.txt", "a", "anything (").guard_type == "non-python", "non-python passes through");
}

void test_guard_file_edit() {
  const auto dir = scratch_dir("guard_file");
  write_file(dir / "m.py", "x = 1\n");
  auto r = ace::guard_file_edit((dir / "m.py").string(), "x = 1 # c\n", true);
  expect(r.passed && r.guard_type == "all", "formatting-only edit passes strict guard");
  r = ace::guard_file_edit((dir / "missing.py").string(), "x = 1\n", false);
  expect(!r.passed && r.guard_type == "read", "missing before-image reported as read failure");
  fs::remove_all(dir);
}

void test_repair_five_edit_scenario() {
  const auto r = ace::try_apply_with_repair("m.py", five_edits("m.py"), kFiveLines, ace::make_guard(false),
                                            "run1");
  expect(r.success && r.partial_apply, "partial apply succeeds");
  expect(r.content == "a = 10\nb = 2\nc = 30\nd = 4\ne = 50\n", "safe edits applied: " + r.content);
  expect(r.report.has_value(), "repair report produced");
  expect(r.report->total_edits == 5 && r.report->safe_edits == 3 && r.report->failed_edits == 2,
         "3 safe, 2 failed");
  expect(r.report->failed_edit_indices == std::vector<uint64_t>({1, 3}), "failed {1,3}");
  expect(r.report->safe_edit_indices == std::vector<uint64_t>({0, 2, 4}), "safe {0,2,4}");
  expect(r.report->guard_failure_reason.rfind("parse: ", 0) == 0, "failure reason names guard type");
  expect(r.report->repair_suggestions.back() == "Manual review recommended before re-attempting",
         "suggestions end with manual review");
}

void test_repair_determinism() {
  auto edits = five_edits("m.py");
  const auto guard = ace::make_guard(false);
  const auto first = ace::try_apply_with_repair("m.py", edits, kFiveLines, guard, "run");
  for (int i = 0; i < 3; ++i) {
    std::reverse(edits.begin(), edits.end());
    const auto again = ace::try_apply_with_repair("m.py", edits, kFiveLines, guard, "run");
    expect(again.content == first.content, "same content regardless of submission order");
    expect(again.report->safe_edit_indices == first.report->safe_edit_indices, "same safe indices");
    expect(again.report->failed_edit_indices == first.report->failed_edit_indices, "same failed indices");
    expect(again.guard_calls == first.guard_calls, "same number of guard calls");
  }
}

void test_repair_all_fail_and_clean() {
  const auto guard = ace::make_guard(false);
  const auto none = ace::try_apply_with_repair("m.py", {replace_line("m.py", 1, "a = (")}, kFiveLines,
                                               guard, "run");
  expect(!none.success && !none.partial_apply, "no safe edit means failure");
  expect(none.content == kFiveLines, "original content returned untouched");
  expect(none.report && none.report->safe_edits == 0, "report with zero safe edits");
  expect(none.report->repair_suggestions.front() == "All edits failed guard checks", "all-failed suggestion");

  const auto clean = ace::try_apply_with_repair("m.py", {replace_line("m.py", 2, "b = 20")}, kFiveLines,
                                                guard, "run");
  expect(clean.success && !clean.partial_apply && !clean.report, "clean edit set needs no repair");
  expect(clean.guard_calls == 1, "one guard call for a passing set");
}

void test_repair_overlap_is_guard_failure() {
  const std::vector<ace::Edit> edits = {replace_line("m.py", 1, "a = 10"), replace_line("m.py", 1, "a = 11")};
  const auto r = ace::try_apply_with_repair("m.py", edits, kFiveLines, ace::make_guard(false), "run");
  expect(r.success && r.partial_apply, "first of two overlapping edits survives");
  expect(r.report->failed_edit_indices == std::vector<uint64_t>({1}), "overlapping edit dropped");
  expect(r.report->guard_failure_reason.rfind("apply", 0) == 0, "overlap reported as apply failure");
}

void test_repair_same_range_order_independent() {
  const ace::GuardFn always_pass = [](const std::string& file, const std::string& before,
                                      const std::string& after) {
    ace::GuardResult g;
    g.passed = true;
    g.file = file;
    g.before_content = before;
    g.after_content = after;
    g.guard_type = "all";
    return g;
  };
  const ace::Edit ten = replace_line("m.py", 1, "a = 10");
  const ace::Edit eleven = replace_line("m.py", 1, "a = 11");
  const auto forward = ace::try_apply_with_repair("m.py", {ten, eleven}, kFiveLines, always_pass, "run");
  const auto backward = ace::try_apply_with_repair("m.py", {eleven, ten}, kFiveLines, always_pass, "run");
  expect(forward.success && backward.success, "one of the two same-range edits survives");
  expect(forward.content == backward.content, "same content for either submission order");
  expect(forward.content.rfind("a = 10\n", 0) == 0, "lower payload sorts first: " + forward.content);
  expect(forward.report && backward.report, "both runs report the dropped edit");
  expect(forward.report->safe_edit_indices == backward.report->safe_edit_indices, "same safe indices");
  expect(forward.report->failed_edit_indices == backward.report->failed_edit_indices, "same failed indices");

  ace::Edit del = ten;
  del.op = "delete";
  del.payload.clear();
  const auto a = ace::sort_edits({ten, del});
  const auto b = ace::sort_edits({del, ten});
  expect(a.size() == 2 && a[0].op == b[0].op && a[1].op == b[1].op, "op breaks same-range ties");
}

void test_repair_report_persistence() {
  const auto dir = scratch_dir("repairs");
  const auto r = ace::try_apply_with_repair("pkg/m.py", five_edits("pkg/m.py"), kFiveLines,
                                            ace::make_guard(false), "runA");
  std::string error;
  const auto path = ace::write_repair_report(*r.report, dir.string(), &error);
  expect(path.has_value(), "report written: " + error);
  expect(fs::path(*path).filename() == "runA-pkg_m.py.json", "report named <run_id>-<flattened path>.json");
  const std::string text = read_file(*path);
  expect(!text.empty() && text.back() == '\n', "report ends with newline");

  const auto back = ace::read_latest_repair_report(dir.string());
  expect(back.has_value(), "latest report readable");
  expect(back->run_id == "runA" && back->failed_edit_indices == r.report->failed_edit_indices,
         "report round-trips");
  expect(!ace::read_latest_repair_report((dir / "nope").string()), "missing dir yields nothing");
  fs::remove_all(dir);
}

void test_repair_reports_same_basename() {
  const auto dir = scratch_dir("repairs_basename");
  const auto guard = ace::make_guard(false);
  const auto first = ace::try_apply_with_repair("pkg/m.py", five_edits("pkg/m.py"), kFiveLines, guard, "runB");
  const auto second = ace::try_apply_with_repair("lib/m.py", five_edits("lib/m.py"), kFiveLines, guard, "runB");
  const auto p1 = ace::write_repair_report(*first.report, dir.string());
  const auto p2 = ace::write_repair_report(*second.report, dir.string());
  expect(p1 && p2 && *p1 != *p2, "files sharing a basename get separate reports");
  expect(fs::exists(*p1) && fs::exists(*p2), "neither report overwritten");
  std::optional<ace::jsonlite::JsonError> err;
  const auto doc = ace::jsonlite::parse(read_file(*p1), &err);
  expect(!err && ace::jsonlite::get_string(doc, "file") == "pkg/m.py", "first report keeps its own file");
  fs::remove_all(dir);
}

// ============================================================================
// Receipts
// ============================================================================

void test_receipt_roundtrip() {
  const std::string after = "x = 2\n";
  const auto r = ace::create_receipt("plan-1", "m.py", "x = 1\n", after, true, true, 0.25, 12);
  expect(r.before_hash.size() == 64 && r.after_hash.size() == 64, "raw hex hashes, no prefix");
  expect(r.timestamp.size() == 24 && r.timestamp.back() == 'Z', "ISO-8601 ms timestamp");
  expect(ace::verify_receipt(r, after), "receipt verifies its own content");

  std::string changed = after;
  changed[0] = 'y';
  expect(!ace::verify_receipt(r, changed), "one changed byte fails verification");

  const auto back = ace::Receipt::from_value(r.to_value());
  expect(ace::receipt_id(back) == ace::receipt_id(r), "receipt id stable through JSON");
  expect(ace::receipt_id(r).size() == 16, "receipt id is 16 hex chars");
  ace::Receipt other = r;
  other.plan_id = "plan-2";
  expect(ace::receipt_id(other) != ace::receipt_id(r), "receipt id covers sealed fields");

  expect(ace::is_idempotent_transformation("a", "a"), "same content is idempotent");
  expect(!ace::is_idempotent_transformation("a", "b"), "changed content is not");
}

void test_verify_receipts() {
  const auto root = scratch_dir("verify_receipts");
  expect(ace::verify_receipts(root.string()).empty(), "no journals, no failures");

  write_file(root / "m.py", "x = 2\n");
  {
    ace::Journal j("run1", (root / ".ace" / "journals").string());
    const auto receipt = ace::create_receipt("p", "m.py", "x = 1\n", "x = 2\n", true, true, 0.1, 1);
    expect(j.log_success((root / "m.py").string(), receipt.after_hash, 6, ace::receipt_id(receipt),
                         &receipt) == ace::ErrorCode::none,
           "success logged");
  }
  expect(ace::verify_receipts(root.string()).empty(), "matching file verifies");

  write_file(root / "m.py", "x = 3\n");
  auto failures = ace::verify_receipts(root.string());
  expect(failures.size() == 1 && failures[0].find("Hash mismatch for m.py") != std::string::npos,
         "modified file flagged");
  expect(failures[0].rfind("run1.jsonl:1 - ", 0) == 0, "failure names journal and line");

  fs::remove(root / "m.py");
  failures = ace::verify_receipts(root.string());
  expect(failures.size() == 1 && failures[0].find("no longer exists") != std::string::npos,
         "deleted file flagged");
  fs::remove_all(root);
}

// ============================================================================
// Journal & revert
// ============================================================================

void test_journal_chain() {
  const auto dir = scratch_dir("journal_chain");
  ace::Journal j("run", dir.string());
  expect(j.log_intent("f", ace::sha256_hex("a"), 1, {"R2", "R1"}, "p", "a") == ace::ErrorCode::none, "intent");
  expect(j.log_success("f", ace::sha256_hex("b"), 1, "rid") == ace::ErrorCode::none, "success");
  expect(j.log_revert("f", ace::sha256_hex("b"), ace::sha256_hex("a"), "test") == ace::ErrorCode::none,
         "revert");
  expect(j.entry_count() == 3, "three entries");

  const auto entries = ace::read_journal(j.path());
  expect(entries.size() == 3, "entries read back");
  expect(entries[0].type == ace::JournalEntryType::intent && entries[0].seq == 1, "first is intent #1");
  expect(entries[0].prev == std::string(64, '0'), "first entry chains to genesis");
  expect(entries[0].rule_ids == std::vector<std::string>({"R1", "R2"}), "rule ids sorted");
  expect(entries[2].type == ace::JournalEntryType::revert && entries[2].reason == "test", "revert entry");

  std::string error;
  expect(ace::verify_journal_chain(j.path(), &error), "chain intact: " + error);
  fs::remove_all(dir);
}

void test_journal_tamper_detected() {
  const auto dir = scratch_dir("journal_tamper");
  std::string path;
  {
    ace::Journal j("run", dir.string());
    expect(j.log_intent("f", ace::sha256_hex("a"), 1, {"R1"}, "p", "a") == ace::ErrorCode::none, "intent");
    expect(j.log_success("f", ace::sha256_hex("b"), 1, "rid") == ace::ErrorCode::none, "success");
    path = j.path();
  }
  std::istringstream in(read_file(path));
  std::string first, second;
  std::getline(in, first);
  std::getline(in, second);
  write_file(path, second + "\n");

  std::string error;
  expect(!ace::verify_journal_chain(path, &error), "dropped entry detected");
  expect(!error.empty(), "chain error message");
  fs::remove_all(dir);
}

void test_journal_closed() {
  const auto dir = scratch_dir("journal_closed");
  ace::Journal j("run", dir.string());
  expect(j.log_intent("f", ace::sha256_hex("a"), 1, {}, "p", "a") == ace::ErrorCode::none, "intent");
  j.close();
  expect(j.closed(), "closed");
  expect(j.log_success("f", ace::sha256_hex("b"), 1, "rid") == ace::ErrorCode::journal_closed,
         "logging after close fails");
  expect(ace::read_journal(j.path()).size() == 1, "nothing written after close");
  expect(ace::read_journal((dir / "missing.jsonl").string()).empty(), "missing journal is empty");
  fs::remove_all(dir);
}

void test_build_revert_plan() {
  const auto dir = scratch_dir("revert_plan");
  ace::Journal j("run", dir.string());
  expect(j.log_intent("a", "sa0", 1, {"R1"}, "p1", "A0") == ace::ErrorCode::none, "intent a");
  expect(j.log_success("a", "sa1", 1, "r1") == ace::ErrorCode::none, "success a");
  expect(j.log_intent("b", "sb0", 1, {"R1"}, "p2", "B0") == ace::ErrorCode::none, "intent b only");
  expect(j.log_intent("c", "sc0", 1, {"R2"}, "p3", "C0") == ace::ErrorCode::none, "intent c");
  expect(j.log_success("c", "sc1", 1, "r3") == ace::ErrorCode::none, "success c");

  const auto plan = ace::build_revert_plan(j.path());
  expect(plan.size() == 2, "intent-only file excluded");
  expect(plan[0].file == "c" && plan[1].file == "a", "most recent commit first");
  expect(plan[1].expected_current_sha == "sa1" && plan[1].original_sha == "sa0", "hashes paired");
  expect(plan[1].restore_content == "A0" && plan[1].plan_id == "p1", "pre-image and plan carried");
  expect(ace::get_journal_id_from_path(j.path()) == "run", "journal id is the file stem");
  fs::remove_all(dir);
}

void test_find_latest_journal() {
  const auto dir = scratch_dir("latest_journal");
  expect(!ace::find_latest_journal((dir / "none").string()), "missing dir yields nothing");
  expect(!ace::find_latest_journal(dir.string()), "empty dir yields nothing");
  write_file(dir / "old.jsonl", "{}\n");
  fs::last_write_time(dir / "old.jsonl", fs::file_time_type::clock::now() - std::chrono::hours(1));
  write_file(dir / "new.jsonl", "{}\n");
  write_file(dir / "notes.txt", "x");
  const auto latest = ace::find_latest_journal(dir.string());
  expect(latest && fs::path(*latest).filename() == "new.jsonl", "newest journal chosen");
  fs::remove_all(dir);
}

void test_revert_exactness() {
  const auto dir = scratch_dir("revert_exact");
  const auto target = (dir / "data.py").string();
  const std::string pre = std::string("x = 1\r\n# \xc3\xa9\0tail", 16);
  const std::string post = "x = 2\n";
  write_file(target, pre);

  {
    ace::Journal j("commit", (dir / "journals").string());
    expect(j.log_intent(target, ace::sha256_hex(pre), pre.size(), {"R1"}, "p", pre) == ace::ErrorCode::none,
           "intent");
    expect(ace::atomic_write(target, post), "write");
    expect(j.log_success(target, ace::sha256_hex(post), post.size(), "rid") == ace::ErrorCode::none,
           "success");
  }

  ace::Journal undo("undo", (dir / "journals").string());
  const auto outcome = ace::revert_from_journal((dir / "journals" / "commit.jsonl").string(), undo, nullptr);
  expect(outcome.ok() && outcome.reverted == 1, "one file reverted");
  expect(read_file(target) == pre, "restored bytes identical to the pre-image");
  expect(outcome.restored.size() == 1 && outcome.restored[0].rule_ids == std::vector<std::string>({"R1"}),
         "restored context reported");
  const auto log = ace::read_journal(undo.path());
  expect(log.size() == 1 && log[0].type == ace::JournalEntryType::revert, "revert journaled");
  expect(log[0].reason == "revert of commit", "revert reason names the journal");
  fs::remove_all(dir);
}

void test_revert_conflict_and_backup_fallback() {
  const auto dir = scratch_dir("revert_conflict");
  const auto a = (dir / "a.py").string();
  const auto b = (dir / "b.py").string();
  ace::BackupStore store((dir / "backups").string());
  {
    ace::Journal j("commit", (dir / "journals").string());
    // a: committed, then edited by someone else.
    expect(j.log_intent(a, ace::sha256_hex("A0"), 2, {"R1"}, "p", "A0") == ace::ErrorCode::none, "intent a");
    write_file(a, "A1");
    expect(j.log_success(a, ace::sha256_hex("A1"), 2, "r") == ace::ErrorCode::none, "success a");
    write_file(a, "A2 local change");
    // b: journal pre-image damaged, backup intact.
    const std::string key = store.put("B0");
    expect(!key.empty(), "backup stored");
    expect(j.log_intent(b, ace::sha256_hex("B0"), 2, {"R1"}, "p", "garbled", key) == ace::ErrorCode::none,
           "intent b");
    write_file(b, "B1");
    expect(j.log_success(b, ace::sha256_hex("B1"), 2, "r") == ace::ErrorCode::none, "success b");
  }
  ace::Journal undo("undo", (dir / "journals").string());
  const auto outcome = ace::revert_from_journal((dir / "journals" / "commit.jsonl").string(), undo, &store);
  expect(outcome.conflicts.size() == 1 && outcome.conflicts[0].find(a) == 0, "locally changed file is a conflict");
  expect(read_file(a) == "A2 local change", "conflicting file left untouched");
  expect(outcome.reverted == 1 && read_file(b) == "B0", "backup store used for damaged pre-image");
  fs::remove_all(dir);
}

// ============================================================================
// Backup store
// ============================================================================

void test_backup_store_put_get() {
  const auto dir = scratch_dir("backup_store");
  ace::BackupStore store(dir.string());
  const std::string data = "def f():\n    return 1\n";
  const std::string key = store.put(data);
  expect(ace::is_hex_digest(key), "key is a 64-char digest");
  expect(key == ace::BackupStore::key_for(data), "key derived from content");
  expect(store.put(data) == key, "dedup returns the same key");
  expect(store.contains(key), "contains");
  expect(store.get(key) == data, "get returns stored bytes");

  const auto info = store.info(key);
  expect(info && info->original_size == data.size(), "meta records original size");
  expect(info->format_version == ace::version::BACKUP_FORMAT_VERSION, "meta carries format version");

  const std::string big(64 * 1024, 'x');
  const std::string big_key = store.put(big);
  expect(store.get(big_key) == big, "large object round-trips");
  expect(store.info(big_key)->stored_size <= big.size(), "stored size never exceeds original");
  fs::remove_all(dir);
}

void test_backup_store_corruption() {
  const auto dir = scratch_dir("backup_corrupt");
  ace::BackupStore store(dir.string());
  const std::string key = store.put("payload");
  const auto object = dir / "objects" / key.substr(0, 2) / key.substr(2, 2) / key;
  expect(fs::exists(object), "sharded object path");
  write_file(object, "tampered");
  expect(!store.get(key).has_value(), "corrupted object refused");
  expect(store.put("payload") == key, "corrupted object rewritten on put");
  expect(store.get(key) == std::string("payload"), "rewritten object verifies");
  expect(!store.get("xyz").has_value(), "invalid key refused");
  expect(!store.get(std::string(64, 'a')).has_value(), "unknown key refused");
  fs::remove_all(dir);
}

// ============================================================================
// Learning
// ============================================================================

void test_learning_floor_and_ceiling() {
  const auto dir = scratch_dir("learn_bounds");
  ace::LearningEngine engine((dir / "learn.json").string());
  for (int i = 0; i < 50; ++i) engine.record_outcome("BAD", ace::Outcome::reverted);
  for (int i = 0; i < 50; ++i) engine.record_outcome("GOOD", ace::Outcome::applied);
  for (int i = 0; i < 4; ++i) engine.record_outcome("NEW", ace::Outcome::reverted);

  const auto bad = engine.tuned_thresholds("BAD");
  const auto good = engine.tuned_thresholds("GOOD");
  expect(bad.first <= ace::learn::kCeilMinAuto && near(bad.first, 0.75), "high revert rate raises auto");
  expect(good.first >= ace::learn::kFloorMinAuto && near(good.first, 0.65), "high apply rate lowers auto");
  expect(near(engine.tuned_thresholds("NEW").first, 0.70), "too few samples keep the default");
  expect(near(bad.second, 0.50) && near(good.second, 0.50), "suggest threshold never tuned");

  const auto tuned = engine.get_tuned_rules();
  expect(tuned.size() == 2 && tuned[0].rule_id == "BAD" && tuned[1].rule_id == "GOOD",
         "tuned rules, most conservative first");
  const auto top = engine.get_top_rules_by_revert_rate(1);
  expect(top.size() == 1 && top[0].first == "BAD", "top revert rate");

  engine.set_base_thresholds(0.84, 0.5);
  expect(near(engine.tuned_thresholds("BAD").first, 0.85), "clamped to ceiling");
  engine.set_base_thresholds(0.61, 0.5);
  expect(near(engine.tuned_thresholds("GOOD").first, 0.60), "clamped to floor");
  fs::remove_all(dir);
}

void test_learning_skiplist() {
  const auto dir = scratch_dir("learn_skip");
  ace::LearningEngine engine((dir / "learn.json").string());
  engine.record_outcome("R1", ace::Outcome::reverted, "", "a.py");
  engine.record_outcome("R1", ace::Outcome::reverted, "", "a.py");
  expect(!engine.should_skip_file_for_rule("R1", "a.py"), "two reverts are not enough");
  engine.record_outcome("R1", ace::Outcome::reverted, "", "a.py");
  expect(engine.should_skip_file_for_rule("R1", "a.py"), "three consecutive reverts skip the pair");
  expect(!engine.should_skip_file_for_rule("R1", "b.py"), "other files unaffected");
  expect(!engine.should_skip_file_for_rule("R2", "a.py"), "other rules unaffected");

  engine.record_outcome("R1", ace::Outcome::applied, "", "a.py");
  expect(!engine.should_skip_file_for_rule("R1", "a.py"), "non-revert outcome resets the streak");
  engine.record_outcome("R1", ace::Outcome::reverted, "", "a.py");
  engine.record_outcome("R1", ace::Outcome::reverted, "", "a.py");
  expect(!engine.should_skip_file_for_rule("R1", "a.py"), "streak counts from the reset");
  fs::remove_all(dir);
}

void test_learning_context_gate() {
  const auto dir = scratch_dir("learn_ctx");
  ace::LearningEngine engine((dir / "learn.json").string());
  engine.record_outcome("R1", ace::Outcome::reverted, "ctx");
  engine.record_outcome("R1", ace::Outcome::reverted, "ctx");
  expect(!engine.should_skip_context("ctx", 0.5), "fewer than three hits never skips");
  engine.record_outcome("R1", ace::Outcome::reverted, "ctx");
  expect(engine.should_skip_context("ctx", 0.5), "three reverted hits skip");
  engine.record_outcome("R1", ace::Outcome::applied, "ctx");
  engine.record_outcome("R1", ace::Outcome::applied, "ctx");
  engine.record_outcome("R1", ace::Outcome::applied, "ctx");
  expect(!engine.should_skip_context("ctx", 0.5), "rate 0.5 is not above 0.5");
  expect(!engine.should_skip_context("unknown", 0.0), "unknown context never skips");

  ace::EditPlan p1;
  p1.id = "one";
  p1.findings.push_back(make_finding("m.py", 3, "R1", ace::Severity::high, "eval(x)"));
  ace::EditPlan p2 = p1;
  p2.id = "two";
  expect(ace::context_key(p1) == ace::context_key(p2), "context key ignores plan id");
  p2.findings[0].snippet = "exec(x)";
  expect(ace::context_key(p1) != ace::context_key(p2), "context key covers the snippet");

  // Snippets are cut at 100 code points, not 100 bytes.
  std::string accents;
  for (int i = 0; i < 100; ++i) accents += "\xc3\xa9";
  p1.findings[0].snippet = accents + "tail one";
  p2.findings[0].snippet = accents + "tail two";
  expect(ace::context_key(p1) == ace::context_key(p2), "text past 100 code points ignored");
  expect(ace::context_key(p1) == "m.py:R1:" + ace::sha256_hex(accents).substr(0, 8),
         "key hashes the first 100 code points");
  const std::string half = accents.substr(0, 100);
  p1.findings[0].snippet = half + "abc";
  p2.findings[0].snippet = half + "xyz";
  expect(ace::context_key(p1) != ace::context_key(p2), "text within 100 code points counted");
  fs::remove_all(dir);
}

void test_learning_persistence_and_corruption() {
  const auto dir = scratch_dir("learn_persist");
  const auto path = (dir / "learn.json").string();
  {
    ace::LearningEngine engine(path);
    engine.record_outcome("R1", ace::Outcome::applied);
    engine.record_outcome("R1", ace::Outcome::suggested);
    engine.record_outcome("R1", ace::Outcome::skipped);
  }
  {
    ace::LearningEngine engine(path);
    const auto data = engine.snapshot();
    expect(data.rules.at("R1").applied == 1 && data.rules.at("R1").suggested == 1 &&
               data.rules.at("R1").skipped == 1,
           "counters survive a restart");
    engine.reset();
    expect(!fs::exists(path), "reset deletes the file");
    expect(engine.snapshot().rules.empty(), "reset clears data");
  }

  write_file(path, "{ this is not json");
  ace::LearningEngine engine(path);
  expect(engine.snapshot().rules.empty(), "corrupted file loads as empty data");
  expect(engine.record_outcome("R1", ace::Outcome::applied), "recording works after corruption");
  expect(ace::LearningEngine(path).snapshot().rules.at("R1").applied == 1, "file replaced with valid data");
  fs::remove_all(dir);
}

void test_learning_weekly_decay() {
  const auto dir = scratch_dir("learn_decay");
  double now = 1.7e9;
  ace::LearningEngine engine((dir / "learn.json").string(), [&now]() { return now; });
  for (int i = 0; i < 10; ++i) engine.record_outcome("R1", ace::Outcome::applied);
  now += 3600.0;  // under a tenth of a week: no decay
  engine.record_outcome("R1", ace::Outcome::applied);
  expect(engine.snapshot().rules.at("R1").applied == 11, "no decay within the same week");
  now += 7.0 * 24.0 * 3600.0;
  engine.record_outcome("R1", ace::Outcome::applied);
  expect(engine.snapshot().rules.at("R1").applied == 9, "one week decays by 0.8 before counting");
  fs::remove_all(dir);
}

// ============================================================================
// Policy
// ============================================================================

ace::EditPlan plan_with(ace::Severity severity, std::size_t edits, const std::string& rule = "R1",
                        const std::string& file = "m.py") {
  ace::EditPlan p;
  p.id = "plan-" + rule;
  p.findings.push_back(make_finding(file, 1, rule, severity, "snippet"));
  for (std::size_t i = 0; i < edits; ++i) p.edits.push_back(replace_line(file, i + 1, "x = 1"));
  return p;
}

void test_rstar_and_decision() {
  expect(near(ace::rstar(1.0, 0.5), 0.85), "R* = 0.7 * value + 0.3 * impact");
  expect(near(ace::rstar(0.5, 0.5, 0.5, 0.5), 0.5), "custom weights");
  const ace::Thresholds t;
  expect(ace::decision(0.70, t) == ace::Decision::auto_apply, "auto at threshold");
  expect(ace::decision(0.69, t) == ace::Decision::suggest, "suggest below auto");
  expect(ace::decision(0.50, t) == ace::Decision::suggest, "suggest at threshold");
  expect(ace::decision(0.49, t) == ace::Decision::deny, "deny below suggest");
  expect(ace::to_string(ace::Decision::auto_apply) == "auto", "decision names");

  const auto s = ace::compute_plan_rstar(plan_with(ace::Severity::critical, 20), ace::PolicyConfig{});
  expect(near(s.value, 1.0) && near(s.impact, 1.0) && near(s.score, 1.0), "impact capped at 1");
}

void test_enforce_policy() {
  ace::PolicyConfig config;
  ace::PolicyContext ctx{&config, nullptr};

  auto r = ace::enforce_policy(plan_with(ace::Severity::critical, 5), ctx);
  expect(r.decision == ace::Decision::auto_apply && near(r.score.score, 0.85), "critical plan auto-applies");
  r = ace::enforce_policy(plan_with(ace::Severity::high, 1), ctx);
  expect(r.decision == ace::Decision::suggest, "high severity single edit is a suggestion");
  r = ace::enforce_policy(plan_with(ace::Severity::info, 1), ctx);
  expect(r.decision == ace::Decision::deny, "info finding denied");

  config.modes["R1"] = "detect-only";
  r = ace::enforce_policy(plan_with(ace::Severity::critical, 5), ctx);
  expect(r.decision == ace::Decision::suggest && !r.reasons.empty(), "detect-only capped at suggest");
  config.modes.clear();

  config.suppressed_paths = {"generated_*.py"};
  r = ace::enforce_policy(plan_with(ace::Severity::critical, 5, "R1", "generated_api.py"), ctx);
  expect(r.decision == ace::Decision::deny, "suppressed path denied");
}

void test_enforce_policy_with_learning() {
  const auto dir = scratch_dir("policy_learning");
  ace::PolicyConfig config;
  ace::LearningEngine engine((dir / "learn.json").string());
  ace::PolicyContext ctx{&config, &engine};

  const auto plan = plan_with(ace::Severity::critical, 0);
  expect(ace::enforce_policy(plan, ctx).decision == ace::Decision::auto_apply, "score 0.70 auto at default");
  for (int i = 0; i < 10; ++i) engine.record_outcome("R1", ace::Outcome::reverted);
  auto r = ace::enforce_policy(plan, ctx);
  expect(near(r.thresholds.auto_threshold, 0.75), "tuned threshold consumed");
  expect(r.decision == ace::Decision::suggest, "raised threshold demotes to suggest");

  for (int i = 0; i < 3; ++i) engine.record_outcome("R2", ace::Outcome::reverted, "", "m.py");
  r = ace::enforce_policy(plan_with(ace::Severity::critical, 5, "R2"), ctx);
  expect(r.decision == ace::Decision::deny, "auto-skipped pair denied");
  fs::remove_all(dir);
}

// ============================================================================
// Content index
// ============================================================================

void test_index_idempotence() {
  const auto dir = scratch_dir("index_idem");
  const auto f = (dir / "a.py").string();
  write_file(f, "x = 1\n");
  ace::ContentIndex index((dir / "index.json").string());
  expect(index.has_changed(f), "unindexed file counts as changed");
  const auto entry = index.add_file(f);
  expect(entry && entry->size == 6 && entry->sha256 == ace::sha256_hex("x = 1\n"), "entry hashed");
  expect(!index.has_changed(f), "unchanged immediately after add");
  write_file(f, "x = 2\n");
  expect(index.has_changed(f), "modified bytes detected");
  expect(index.has_changed(f), "has_changed does not update the entry");
  expect(!index.add_file((dir / "missing.py").string()), "unreadable file not added");
  fs::remove_all(dir);
}

void test_index_clean_runs() {
  const auto dir = scratch_dir("index_clean");
  const auto f = (dir / "a.py").string();
  write_file(f, "x = 1\n");
  ace::ContentIndex index((dir / "index.json").string());
  index.add_file(f);
  for (int i = 0; i < 2; ++i) index.increment_clean_runs(f);
  expect(!index.should_skip_deep_scan(f, 3), "two clean runs below threshold");
  index.increment_clean_runs(f);
  expect(index.should_skip_deep_scan(f, 3), "three clean runs reach threshold");
  index.reset_clean_runs(f);
  expect(!index.should_skip_deep_scan(f, 3), "reset clears the count");

  for (int i = 0; i < 3; ++i) index.increment_clean_runs(f);
  index.add_file(f, true);
  expect(index.should_skip_deep_scan(f, 3), "preserve keeps the count for unchanged content");
  write_file(f, "x = 2\n");
  index.add_file(f, true);
  expect(!index.should_skip_deep_scan(f, 3), "changed content resets the count");
  fs::remove_all(dir);
}

void test_index_persistence() {
  const auto dir = scratch_dir("index_persist");
  const auto a = (dir / "a.py").string();
  const auto b = (dir / "b.py").string();
  write_file(a, "a\n");
  write_file(b, "bb\n");
  const auto path = (dir / "index.json").string();
  {
    ace::ContentIndex index(path);
    index.rebuild({a, b});
    index.increment_clean_runs(a);
    std::string error;
    expect(index.save(&error), "save: " + error);
  }
  const std::string text = read_file(path);
  expect(text.find("\"entries\"") != std::string::npos && text.back() == '\n', "index document layout");

  ace::ContentIndex index(path);
  index.load();
  const auto stats = index.get_stats();
  expect(stats.total_files == 2 && stats.total_size == 5 && stats.clean_files == 1, "stats after reload");
  expect(index.entry(a)->clean_runs_count == 1, "clean runs persisted");
  write_file(b, "changed\n");
  expect(index.get_changed_files({a, b}) == std::vector<std::string>({b}), "changed files listed");
  index.remove_file(b);
  expect(index.get_stats().total_files == 1, "remove_file");

  write_file(path, "[broken");
  ace::ContentIndex corrupt(path);
  corrupt.load();
  expect(corrupt.get_stats().total_files == 0, "corrupted index loads empty");
  fs::remove_all(dir);
}

void test_index_keys_and_filters() {
  const auto dir = scratch_dir("index_keys");
  write_file(dir / "a.py", "x\n");
  ace::ContentIndex index((dir / "index.json").string());
  index.add_file((dir / "sub" / ".." / "a.py").string());
  expect(!index.has_changed((dir / "a.py").string()), "keys are normalized absolute paths");

  expect(ace::is_indexable((dir / "a.py").string()), "source file indexable");
  expect(!ace::is_indexable((dir / ".hidden.py").string()), "hidden file excluded");
  expect(!ace::is_indexable((dir / "logo.PNG").string()), "binary extension excluded");
  expect(!ace::is_indexable((dir / "mod.pyc").string()), "bytecode excluded");
  write_file(dir / "huge.py", std::string(10 * 1024 * 1024 + 1, 'x'));
  expect(!ace::is_indexable((dir / "huge.py").string()), "oversized file excluded");
  fs::remove_all(dir);
}

// ============================================================================
// Pipeline
// ============================================================================

// One low-severity finding per line containing TODO.
class TodoAnalyzer : public ace::IAnalyzer {
 public:
  std::vector<ace::Finding> analyze(const std::string& file) const override {
    std::vector<ace::Finding> out;
    auto data = ace::read_file_bytes(file);
    if (!data) return out;
    std::istringstream in(*data);
    std::string line;
    uint64_t n = 0;
    while (std::getline(in, line)) {
      ++n;
      if (line.find("TODO") != std::string::npos) {
        out.push_back(make_finding(file, n, "todo", ace::Severity::low, line));
      }
      if (line.find("FIXME") != std::string::npos) {
        out.push_back(make_finding(file, n, "fixme", ace::Severity::medium, line));
      }
    }
    return out;
  }
};

ace::AceConfig quiet_config() {
  ace::AceConfig config;
  config.log_level = "error";
  return config;
}

void test_pipeline_parallel_determinism() {
  const auto root = scratch_dir("pipeline_jobs");
  std::vector<std::string> files;
  for (int i = 0; i < 15; ++i) {
    const auto f = root / ("mod" + std::to_string(i) + ".py");
    std::string body;
    for (int l = 0; l < 20 + i; ++l) {
      if ((l + i) % 3 == 0) body += "x = 1  # TODO tidy\n";
      else if ((l * i) % 7 == 1) body += "y = 2  # FIXME TODO\n";
      else body += "z = 3\n";
    }
    write_file(f, body);
    files.push_back(f.string());
  }
  // Submission order must not matter either.
  std::vector<std::string> shuffled(files.rbegin(), files.rend());

  ace::Pipeline pipeline(root.string(), quiet_config());
  const TodoAnalyzer analyzer;
  const std::string serial = ace::findings_to_json(pipeline.analyze(files, analyzer, 1));
  const std::string parallel = ace::findings_to_json(pipeline.analyze(shuffled, analyzer, 4));
  expect(serial.size() > 2, "findings produced");
  expect(serial == parallel, "jobs=1 and jobs=4 produce byte-identical findings");
  for (int i = 0; i < 3; ++i) {
    expect(ace::findings_to_json(pipeline.analyze(files, analyzer, 8)) == serial, "repeatable output");
  }
  expect(pipeline.stats().files_analyzed.load() == 15 * 5, "every file analyzed once per pass");
  fs::remove_all(root);
}

void test_findings_order_total() {
  ace::Finding a = make_finding("m.py", 4, "R1", ace::Severity::high, "eval(x)");
  ace::Finding b = a;
  b.severity = ace::Severity::low;
  b.snippet = "exec(x)";
  ace::Finding c = a;
  c.suggestion = "use ast.literal_eval";
  expect(ace::findings_to_json({a, b, c}) == ace::findings_to_json({c, b, a}),
         "findings differing past the message serialize the same in any order");
  expect(ace::findings_to_json({a, b}) == ace::findings_to_json({b, a}), "severity and snippet break ties");
  expect(ace::finding_less(a, b) != ace::finding_less(b, a), "distinct findings are ordered");
  expect(!ace::finding_less(a, a), "irreflexive");
}

ace::EditPlan five_edit_plan() {
  ace::EditPlan plan;
  plan.id = "plan-five";
  plan.findings.push_back(make_finding("m.py", 1, "R1", ace::Severity::critical, "a = 1"));
  plan.edits = five_edits("m.py");
  plan.invariants = {"parses"};
  plan.estimated_risk = 0.2;
  return plan;
}

void test_pipeline_commit_and_revert() {
  const auto root = scratch_dir("pipeline_commit");
  write_file(root / "m.py", kFiveLines);

  ace::Pipeline pipeline(root.string(), quiet_config());
  const auto out = pipeline.apply_plan(five_edit_plan());
  expect(out.ok() && out.committed() == 1, "plan committed: " + out.message);
  expect(out.policy.decision == ace::Decision::auto_apply, "plan auto-approved");
  const auto& fc = out.files.at(0);
  expect(fc.partial && fc.repair && fc.repair->failed_edit_indices == std::vector<uint64_t>({1, 3}),
         "repair salvaged edits 0, 2, 4");
  expect(read_file(root / "m.py") == "a = 10\nb = 2\nc = 30\nd = 4\ne = 50\n", "safe subset on disk");
  expect(fc.receipt && ace::verify_receipt(*fc.receipt, read_file(root / "m.py")), "receipt matches disk");
  expect(!fc.receipt->invariants_met, "partial apply does not claim invariants");
  expect(fc.receipt->policy_hash == ace::policy_hash(pipeline.config().policy), "receipt stamped with policy");
  expect(ace::read_latest_repair_report(pipeline.repairs_dir()).has_value(), "repair report on disk");

  std::string error;
  expect(ace::verify_journal_chain(pipeline.journal().path(), &error), "journal chain intact: " + error);
  const auto entries = ace::read_journal(pipeline.journal().path());
  expect(entries.size() == 2 && entries[0].type == ace::JournalEntryType::intent &&
             entries[1].type == ace::JournalEntryType::success,
         "intent precedes success");
  expect(entries[0].pre_image == kFiveLines && !entries[0].backup_key.empty(), "pre-image journaled and backed up");
  expect(entries[1].receipt.has_value(), "receipt embedded in success entry");
  expect(pipeline.verify().empty(), "receipts verify after commit");
  expect(pipeline.stats().commits.load() == 1 && pipeline.stats().repairs.load() == 1, "stats counted");
  expect(pipeline.stats().edits_salvaged.load() == 3, "salvaged edits counted");

  const auto reverted = pipeline.revert_latest();
  expect(reverted.ok() && reverted.reverted == 1, "latest run reverted");
  expect(read_file(root / "m.py") == kFiveLines, "original bytes restored");
  expect(pipeline.verify().empty(), "reverted commit is not an integrity failure");
  const auto data = pipeline.learning().snapshot();
  expect(data.rules.at("R1").applied == 1 && data.rules.at("R1").reverted == 1, "outcomes fed to learning");
  fs::remove_all(root);
}

ace::EditPlan single_line_plan(const std::string& rule, uint64_t line, const std::string& payload) {
  ace::EditPlan plan = plan_with(ace::Severity::critical, 0, rule);
  plan.edits = {replace_line("m.py", line, payload)};
  return plan;
}

// A revert racing a commit on the same file: the commit either lands on the
// restored bytes or is itself undone, never writes over a revert.
void test_pipeline_commit_revert_race() {
  const std::string after_b = "a = 1\nb = 2\nc = 3\nd = 4\ne = 50\n";
  for (int round = 0; round < 12; ++round) {
    const auto root = scratch_dir("pipeline_race");
    write_file(root / "m.py", kFiveLines);
    ace::Pipeline pipeline(root.string(), quiet_config());
    const auto first = pipeline.apply_plan(single_line_plan("R1", 1, "a = 10"));
    expect(first.ok() && first.committed() == 1, "first plan committed: " + first.message);

    ace::ApplyOutcome second;
    ace::RevertOutcome reverted;
    std::thread committer([&] { second = pipeline.apply_plan(single_line_plan("R2", 5, "e = 50")); });
    std::thread reverter([&] { reverted = pipeline.revert_latest(); });
    committer.join();
    reverter.join();

    expect(second.ok() && second.committed() == 1, "second commit never sees a torn file: " + second.message);
    expect(reverted.ok() && reverted.reverted >= 1, "revert applied without conflicts");
    const std::string final_bytes = read_file(root / "m.py");
    if (reverted.reverted == 2) {
      expect(final_bytes == kFiveLines, "both commits undone");
    } else {
      expect(final_bytes == after_b, "second commit built on restored bytes: " + final_bytes);
    }
    std::string error;
    expect(ace::verify_journal_chain(pipeline.journal().path(), &error), "journal chain intact: " + error);
    expect(pipeline.verify().empty(), "receipts agree with disk");
  }
  fs::remove_all(fs::temp_directory_path() / "ace_test_pipeline_race");
}

void test_pipeline_integrity_failure_reported() {
  const auto root = scratch_dir("pipeline_integrity");
  write_file(root / "m.py", kFiveLines);
  ace::Pipeline pipeline(root.string(), quiet_config());
  expect(pipeline.apply_plan(five_edit_plan()).ok(), "committed");
  write_file(root / "m.py", "tampered = True\n");
  const auto failures = pipeline.verify();
  expect(failures.size() == 1 && failures[0].find("Hash mismatch") != std::string::npos, "mismatch reported");
  expect(read_file(root / "m.py") == "tampered = True\n", "mismatch never auto-corrected");
  expect(pipeline.stats().integrity_failures.load() == 1, "integrity failure counted");
  fs::remove_all(root);
}

void test_pipeline_deny_and_suggest_write_nothing() {
  const auto root = scratch_dir("pipeline_deny");
  write_file(root / "m.py", kFiveLines);
  ace::Pipeline pipeline(root.string(), quiet_config());

  auto denied = pipeline.apply_plan(plan_with(ace::Severity::info, 1));
  expect(denied.error == ace::ErrorCode::policy_denied, "info plan denied");
  expect(ace::exit_code_for(denied.error) == ace::ExitCode::policy_deny, "deny exit code");

  auto suggested = pipeline.apply_plan(plan_with(ace::Severity::high, 1));
  expect(suggested.ok() && suggested.policy.decision == ace::Decision::suggest, "high plan suggested");
  expect(suggested.files.empty(), "suggestion never reaches the write path");

  expect(read_file(root / "m.py") == kFiveLines, "file untouched");
  expect(!fs::exists(pipeline.journal().path()), "no journal entries written");
  expect(pipeline.learning().snapshot().rules.at("R1").suggested == 1, "suggestion recorded");
  expect(pipeline.stats().plans_deny.load() == 1 && pipeline.stats().plans_suggest.load() == 1, "decisions counted");
  fs::remove_all(root);
}

void test_pipeline_unparsable_original() {
  const auto root = scratch_dir("pipeline_unparsable");
  const std::string broken = "def (:\n    pass\n";
  write_file(root / "m.py", broken);
  ace::Pipeline pipeline(root.string(), quiet_config());
  auto plan = plan_with(ace::Severity::critical, 1);
  const auto out = pipeline.apply_plan(plan);
  expect(out.error == ace::ErrorCode::parse_error, "unparsable original is an operational error");
  expect(ace::exit_code_for(out.error) == ace::ExitCode::operational_error, "operational exit code");
  expect(read_file(root / "m.py") == broken, "file untouched");
  expect(!fs::exists(pipeline.journal().path()), "no journal entry for a skipped plan");
  fs::remove_all(root);
}

void test_pipeline_no_safe_edit() {
  const auto root = scratch_dir("pipeline_no_safe");
  write_file(root / "m.py", kFiveLines);
  ace::Pipeline pipeline(root.string(), quiet_config());
  ace::EditPlan plan = plan_with(ace::Severity::critical, 0);
  plan.edits = {replace_line("m.py", 2, "b = ("), replace_line("m.py", 4, "d = [")};
  const auto out = pipeline.apply_plan(plan);
  expect(out.error == ace::ErrorCode::repair_exhausted, "no safe edit reported");
  expect(read_file(root / "m.py") == kFiveLines, "file untouched");
  const auto report = ace::read_latest_repair_report(pipeline.repairs_dir());
  expect(report && report->safe_edits == 0, "diagnostic report written with zero safe edits");
  expect(!fs::exists(pipeline.journal().path()), "nothing journaled");
  fs::remove_all(root);
}

void test_pipeline_clean_run_skip() {
  const auto root = scratch_dir("pipeline_clean");
  write_file(root / "a.py", "x = 1\n");
  write_file(root / "logo.png", "binary");
  ace::AceConfig config = quiet_config();
  config.clean_run_threshold = 2;
  {
    ace::Pipeline pipeline(root.string(), config);
    expect(pipeline.select_files_for_scan({"a.py", "logo.png"}) == std::vector<std::string>({"a.py"}),
           "non-indexable file filtered");
    pipeline.record_scan_result("a.py", 0);
    expect(pipeline.select_files_for_scan({"a.py"}).size() == 1, "one clean run is not enough");
    pipeline.record_scan_result("a.py", 0);
    expect(pipeline.select_files_for_scan({"a.py"}).empty(), "two clean runs skip the file");
  }
  // Index persisted by the first pipeline.
  ace::Pipeline again(root.string(), config);
  expect(again.select_files_for_scan({"a.py"}).empty(), "skip survives a restart");
  write_file(root / "a.py", "x = 2\n");
  expect(again.select_files_for_scan({"a.py"}).size() == 1, "changed file scanned again");
  again.record_scan_result("a.py", 1);
  again.record_scan_result("a.py", 0);
  expect(again.select_files_for_scan({"a.py"}).size() == 1, "a finding resets the clean streak");
  fs::remove_all(root);
}

void test_pipeline_events() {
  const auto root = scratch_dir("pipeline_events");
  write_file(root / "m.py", kFiveLines);
  ace::AceConfig config = quiet_config();
  config.event_log_path = (root / "events.jsonl").string();
  {
    ace::Pipeline pipeline(root.string(), config);
    expect(pipeline.apply_plan(five_edit_plan()).ok(), "committed");
  }
  const std::string events = read_file(root / "events.jsonl");
  for (const char* name : {"plan_scored", "repair", "commit", "run_closed"}) {
    expect(events.find(std::string("\"event\":\"") + name + "\"") != std::string::npos,
           std::string("event emitted: ") + name);
  }
  std::istringstream in(events);
  std::string line;
  std::string last_event;
  while (std::getline(in, line)) {
    std::optional<ace::jsonlite::JsonError> err;
    const auto event = ace::jsonlite::parse(line, &err);
    expect(!err, "each event line is a JSON object");
    last_event = ace::jsonlite::get_string(event, "event");
    if (last_event != "run_closed") continue;
    expect(ace::jsonlite::get_string(event, "engine") == ace::version::ENGINE_SEMVER, "engine version stamped");
    const auto* stats = event.at("stats").as_object();
    expect(stats != nullptr, "stats snapshot attached");
    expect(ace::jsonlite::get_u64(*stats, "commits") == 1 && ace::jsonlite::get_u64(*stats, "repairs") == 1,
           "snapshot carries run counters");
    const auto* policy = stats->at("policy").as_object();
    expect(policy && ace::jsonlite::get_u64(*policy, "auto") == 1, "policy counters nested");
  }
  expect(last_event == "run_closed", "run_closed is the last event");
  fs::remove_all(root);
}

}  // namespace

int main() {
  std::cout << "=== Ace Safety-Gated Transformation Test Suite ===\n";

  std::cout << "\n[Hashing & JSON]\n";
  run_test("SHA-256 known vectors", test_sha256_vectors);
  run_test("BLAKE3 known vectors", test_blake3_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("file hashing", test_file_hashing);
  run_test("JSON sorted + strict", test_json_sorted_and_strict);
  run_test("JSON byte-string roundtrip", test_json_byte_string_roundtrip);

  std::cout << "\n[Configuration]\n";
  run_test("defaults", test_config_defaults);
  run_test("file + environment", test_config_file_and_env);
  run_test("validation", test_config_validation);
  run_test("policy hash", test_policy_hash);

  std::cout << "\n[File I/O & edits]\n";
  run_test("atomic write", test_atomic_write);
  run_test("newline detection", test_newline_detection);
  run_test("edit overlap rules", test_edit_overlap_rules);
  run_test("apply edits ops", test_apply_edits_ops);
  run_test("apply edits newlines", test_apply_edits_newlines);
  run_test("apply edits errors", test_apply_edits_errors);

  std::cout << "\n[Guard & repair]\n";
  run_test("guard summary", test_guard_summary);
  run_test("guard file edit", test_guard_file_edit);
  run_test("five-edit bisection scenario", test_repair_five_edit_scenario);
  run_test("bisection determinism (3x)", test_repair_determinism);
  run_test("all-fail and clean sets", test_repair_all_fail_and_clean);
  run_test("overlap treated as guard failure", test_repair_overlap_is_guard_failure);
  run_test("same-range edits order-independent", test_repair_same_range_order_independent);
  run_test("repair report persistence", test_repair_report_persistence);
  run_test("reports for files sharing a basename", test_repair_reports_same_basename);

  std::cout << "\n[Receipts]\n";
  run_test("receipt roundtrip + one-byte change", test_receipt_roundtrip);
  run_test("verify receipts over journals", test_verify_receipts);

  std::cout << "\n[Journal & revert]\n";
  run_test("journal chain", test_journal_chain);
  run_test("journal tamper detected", test_journal_tamper_detected);
  run_test("journal closed", test_journal_closed);
  run_test("build revert plan", test_build_revert_plan);
  run_test("find latest journal", test_find_latest_journal);
  run_test("revert exactness", test_revert_exactness);
  run_test("revert conflict + backup fallback", test_revert_conflict_and_backup_fallback);

  std::cout << "\n[Backup store]\n";
  run_test("put/get/dedup", test_backup_store_put_get);
  run_test("corruption detection", test_backup_store_corruption);

  std::cout << "\n[Learning]\n";
  run_test("floor/ceiling (50 outcomes)", test_learning_floor_and_ceiling);
  run_test("auto-skiplist", test_learning_skiplist);
  run_test("context gate + context key", test_learning_context_gate);
  run_test("persistence + corruption", test_learning_persistence_and_corruption);
  run_test("weekly decay", test_learning_weekly_decay);

  std::cout << "\n[Policy]\n";
  run_test("R* and decision", test_rstar_and_decision);
  run_test("enforce policy", test_enforce_policy);
  run_test("enforce policy with learning", test_enforce_policy_with_learning);

  std::cout << "\n[Content index]\n";
  run_test("index idempotence", test_index_idempotence);
  run_test("clean-run counting", test_index_clean_runs);
  run_test("index persistence", test_index_persistence);
  run_test("keys and filters", test_index_keys_and_filters);

  std::cout << "\n[Pipeline]\n";
  run_test("jobs=1 vs jobs=4 determinism (15 files)", test_pipeline_parallel_determinism);
  run_test("findings order is total", test_findings_order_total);
  run_test("commit, verify, revert", test_pipeline_commit_and_revert);
  run_test("commit racing revert (12 rounds)", test_pipeline_commit_revert_race);
  run_test("integrity failure reported", test_pipeline_integrity_failure_reported);
  run_test("deny and suggest write nothing", test_pipeline_deny_and_suggest_write_nothing);
  run_test("unparsable original skipped", test_pipeline_unparsable_original);
  run_test("no safe edit", test_pipeline_no_safe_edit);
  run_test("clean-run skip", test_pipeline_clean_run_skip);
  run_test("structured events", test_pipeline_events);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
