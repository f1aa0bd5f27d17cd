#pragma once

// ace/types.hpp - Core data structures shared by every stage of the
// safety-gated transformation pipeline.
//
// OWNERSHIP:
//   - Finding, Edit, EditPlan and GuardResult are value types. Producers hand
//     them over by value or const reference; nothing here borrows memory.
//   - An EditPlan is immutable once built. The commit path reads it and never
//     writes back into it.
//
// DETERMINISM:
//   - Every to_value() emits a jsonlite Object, so serialized key order is
//     always sorted.
//   - findings are ordered by (file, line, rule) wherever more than one
//     producer contributes; see finding_less().

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ace/jsonlite.hpp"

namespace ace {

enum class ErrorCode {
  none,
  io_error,
  parse_error,
  json_parse_error,
  json_duplicate_key,
  guard_failed,
  repair_exhausted,
  policy_denied,
  integrity_failed,
  journal_closed,
  config_invalid,
  edit_out_of_range,
  edit_overlap,
  write_conflict,  // target changed on disk between read and commit
};

std::string to_string(ErrorCode code);

// Exit status taxonomy for outer tools built on this library.
enum class ExitCode : int {
  success = 0,
  operational_error = 1,
  policy_deny = 2,
  invalid_args = 3,
};

ExitCode exit_code_for(ErrorCode code);

// ---------------------------------------------------------------------------
// Findings
// ---------------------------------------------------------------------------

enum class Severity { critical, high, medium, low, info };

std::string to_string(Severity s);
// Unknown names map to Severity::info.
Severity severity_from_string(const std::string& s);
// critical 1.0, high 0.75, medium 0.5, low 0.25, info 0.1
double severity_weight(Severity s);

struct Finding {
  std::string file;
  std::uint64_t line{0};
  std::string rule;
  Severity severity{Severity::info};
  std::string message;
  std::string snippet;
  std::string suggestion;

  jsonlite::Value to_value() const;
  static Finding from_value(const jsonlite::Value& v);
};

// (file, line, rule) ascending, then message, severity, snippet and suggestion,
// so two findings compare equal only when every serialized field matches.
bool finding_less(const Finding& a, const Finding& b);

// ---------------------------------------------------------------------------
// Edits and plans
// ---------------------------------------------------------------------------

// Line-range edit, 1-based and inclusive. An insert before line L is the
// zero-width range [L, L-1]; appending to a file of N lines is [N+1, N].
struct Edit {
  std::string file;
  std::uint64_t start_line{0};
  std::uint64_t end_line{0};
  std::string op{"replace"};   // replace | insert | delete
  std::string payload;         // replacement text; ignored for delete

  jsonlite::Value to_value() const;
  static Edit from_value(const jsonlite::Value& v);
};

struct EditPlan {
  std::string id;
  std::vector<Finding> findings;
  std::vector<Edit> edits;
  std::vector<std::string> invariants;
  double estimated_risk{0.0};

  jsonlite::Value to_value() const;
  static EditPlan from_value(const jsonlite::Value& v);
};

// ---------------------------------------------------------------------------
// Guard results
// ---------------------------------------------------------------------------

// guard_type: "all" on a full pass; otherwise the first failing check
// (parse | ast_equiv | cst_apply), or "non-python" / "read" for the
// file-level wrapper.
struct GuardResult {
  bool passed{false};
  std::string file;
  std::string before_content;
  std::string after_content;
  std::string guard_type;
  std::vector<std::string> errors;
};

}  // namespace ace
