#pragma once

// ace/guard.hpp - Verification of a single proposed file transformation.
//
// LAYERS (first failure wins, a result never partially passes):
//   1. parse      `after` must tokenize and parse.
//   2. ast_equiv  only when strict: dump(parse(before)) == dump(parse(after)).
//   3. cst_apply  `after` must survive token render and reparse unchanged.
//
// Guard functions are pure: no file is written, no event is emitted. The
// pipeline owns stats and logging for guard outcomes.

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "ace/jsonlite.hpp"
#include "ace/types.hpp"

namespace ace {

// Oracle signature used by the RepairEngine: (file, before, after).
using GuardFn =
    std::function<GuardResult(const std::string&, const std::string&, const std::string&)>;

using CheckResult = std::pair<bool, std::vector<std::string>>;

CheckResult verify_python_parse(const std::string& source);
CheckResult verify_ast_equivalence(const std::string& before, const std::string& after);
CheckResult verify_cst_roundtrip(const std::string& source);

GuardResult guard_edit(const std::string& path, const std::string& before,
                       const std::string& after, bool strict);

// Reads the before-image from `path`. Files without a .py suffix pass with
// guard_type "non-python"; an unreadable file fails with guard_type "read".
GuardResult guard_file_edit(const std::string& path, const std::string& after, bool strict);

// Guard oracle bound to a strictness setting.
GuardFn make_guard(bool strict);

// Multi-line banner for terminal output.
std::string format_guard_error(const GuardResult& result);

struct GuardSummary {
  uint64_t total{0};
  uint64_t passed{0};
  uint64_t failed{0};
  double pass_rate{0.0};
  std::map<std::string, uint64_t> failures_by_type;

  jsonlite::Value to_value() const;
};

GuardSummary get_guard_summary(const std::vector<GuardResult>& results);

}  // namespace ace
