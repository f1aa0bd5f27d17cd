#pragma once

// ace/repair.hpp - Salvage of the maximal guard-passing subset of an edit set.
//
// ALGORITHM:
//   Edits are sorted by sort_edits(); indices in reports refer to that
//   order. The full set is tried first. On failure a work
//   stack of half-open index ranges is seeded with the two halves, lower half
//   on top. Each popped range is applied together with the edits accepted so
//   far, always against the original content:
//     pass                -> the range joins the accepted set
//     fail, one edit      -> that index is recorded as failed
//     fail, several edits -> split, lower half pushed last
//   Lower ranges are always decided before higher ones, so an edit is only
//   ever judged together with accepted edits at earlier lines.
//
// DETERMINISM:
//   Same edits (in any submission order), same content and same guard give
//   the same safe/failed indices. No clock or randomness reaches the search;
//   the report timestamp is the only varying field.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ace/guard.hpp"
#include "ace/jsonlite.hpp"
#include "ace/types.hpp"

namespace ace {

struct RepairReport {
  std::string run_id;
  std::string file;
  uint64_t total_edits{0};
  uint64_t safe_edits{0};
  uint64_t failed_edits{0};
  std::vector<uint64_t> safe_edit_indices;
  std::vector<uint64_t> failed_edit_indices;
  std::string guard_failure_reason;
  std::vector<std::string> repair_suggestions;
  std::string timestamp;

  jsonlite::Value to_value() const;
  static RepairReport from_value(const jsonlite::Value& v);
};

struct TryApplyResult {
  bool success{false};
  bool partial_apply{false};
  std::string content;
  std::optional<RepairReport> report;
  uint64_t guard_calls{0};
};

TryApplyResult try_apply_with_repair(const std::string& file, const std::vector<Edit>& edits,
                                     const std::string& original, const GuardFn& guard,
                                     const std::string& run_id);

// Writes <dir>/<run_id>-<file>.json as indented sorted-key JSON with a
// trailing newline. Separators in `file` become '_', so files sharing a
// basename get distinct reports. Returns the path, or nullopt with *error set.
std::optional<std::string> write_repair_report(const RepairReport& report, const std::string& dir,
                                               std::string* error = nullptr);

// Most recently modified report in `dir`, or nullopt if there is none.
std::optional<RepairReport> read_latest_repair_report(const std::string& dir);

}  // namespace ace
