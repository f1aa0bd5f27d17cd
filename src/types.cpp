#include "ace/types.hpp"

#include <tuple>

namespace ace {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::parse_error: return "parse_error";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::guard_failed: return "guard_failed";
    case ErrorCode::repair_exhausted: return "repair_exhausted";
    case ErrorCode::policy_denied: return "policy_denied";
    case ErrorCode::integrity_failed: return "integrity_failed";
    case ErrorCode::journal_closed: return "journal_closed";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::edit_out_of_range: return "edit_out_of_range";
    case ErrorCode::edit_overlap: return "edit_overlap";
    case ErrorCode::write_conflict: return "write_conflict";
  }
  return "";
}

ExitCode exit_code_for(ErrorCode code) {
  switch (code) {
    case ErrorCode::none:
      return ExitCode::success;
    case ErrorCode::policy_denied:
      return ExitCode::policy_deny;
    case ErrorCode::config_invalid:
      return ExitCode::invalid_args;
    default:
      return ExitCode::operational_error;
  }
}

std::string to_string(Severity s) {
  switch (s) {
    case Severity::critical: return "critical";
    case Severity::high: return "high";
    case Severity::medium: return "medium";
    case Severity::low: return "low";
    case Severity::info: return "info";
  }
  return "info";
}

Severity severity_from_string(const std::string& s) {
  if (s == "critical") return Severity::critical;
  if (s == "high") return Severity::high;
  if (s == "medium") return Severity::medium;
  if (s == "low") return Severity::low;
  return Severity::info;
}

double severity_weight(Severity s) {
  switch (s) {
    case Severity::critical: return 1.0;
    case Severity::high: return 0.75;
    case Severity::medium: return 0.5;
    case Severity::low: return 0.25;
    case Severity::info: return 0.1;
  }
  return 0.1;
}

// ---------------------------------------------------------------------------
// Finding
// ---------------------------------------------------------------------------

jsonlite::Value Finding::to_value() const {
  jsonlite::Object o;
  o["file"] = file;
  o["line"] = line;
  o["rule"] = rule;
  o["severity"] = to_string(severity);
  o["message"] = message;
  o["snippet"] = snippet;
  o["suggestion"] = suggestion;
  return o;
}

Finding Finding::from_value(const jsonlite::Value& v) {
  Finding f;
  const auto* o = v.as_object();
  if (!o) return f;
  f.file = jsonlite::get_string(*o, "file");
  f.line = jsonlite::get_u64(*o, "line");
  f.rule = jsonlite::get_string(*o, "rule");
  f.severity = severity_from_string(jsonlite::get_string(*o, "severity", "info"));
  f.message = jsonlite::get_string(*o, "message");
  f.snippet = jsonlite::get_string(*o, "snippet");
  f.suggestion = jsonlite::get_string(*o, "suggestion");
  return f;
}

bool finding_less(const Finding& a, const Finding& b) {
  return std::tie(a.file, a.line, a.rule, a.message, a.severity, a.snippet, a.suggestion) <
         std::tie(b.file, b.line, b.rule, b.message, b.severity, b.snippet, b.suggestion);
}

// ---------------------------------------------------------------------------
// Edit / EditPlan
// ---------------------------------------------------------------------------

jsonlite::Value Edit::to_value() const {
  jsonlite::Object o;
  o["file"] = file;
  o["start_line"] = start_line;
  o["end_line"] = end_line;
  o["op"] = op;
  o["payload"] = payload;
  return o;
}

Edit Edit::from_value(const jsonlite::Value& v) {
  Edit e;
  const auto* o = v.as_object();
  if (!o) return e;
  e.file = jsonlite::get_string(*o, "file");
  e.start_line = jsonlite::get_u64(*o, "start_line");
  e.end_line = jsonlite::get_u64(*o, "end_line");
  e.op = jsonlite::get_string(*o, "op", "replace");
  e.payload = jsonlite::get_string(*o, "payload");
  return e;
}

jsonlite::Value EditPlan::to_value() const {
  jsonlite::Object o;
  o["id"] = id;
  jsonlite::Array fs;
  for (const auto& f : findings) fs.push_back(f.to_value());
  o["findings"] = std::move(fs);
  jsonlite::Array es;
  for (const auto& e : edits) es.push_back(e.to_value());
  o["edits"] = std::move(es);
  o["invariants"] = jsonlite::to_array(invariants);
  o["estimated_risk"] = estimated_risk;
  return o;
}

EditPlan EditPlan::from_value(const jsonlite::Value& v) {
  EditPlan p;
  const auto* o = v.as_object();
  if (!o) return p;
  p.id = jsonlite::get_string(*o, "id");
  if (const auto* arr = jsonlite::get_array(*o, "findings")) {
    for (const auto& item : *arr) p.findings.push_back(Finding::from_value(item));
  }
  if (const auto* arr = jsonlite::get_array(*o, "edits")) {
    for (const auto& item : *arr) p.edits.push_back(Edit::from_value(item));
  }
  p.invariants = jsonlite::get_string_array(*o, "invariants");
  p.estimated_risk = jsonlite::get_double(*o, "estimated_risk");
  return p;
}

}  // namespace ace
