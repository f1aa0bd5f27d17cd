#include "ace/guard.hpp"

#include <filesystem>

#include "ace/fileio.hpp"
#include "ace/pysyntax.hpp"

namespace ace {

namespace {

GuardResult make_result(bool passed, const std::string& file, const std::string& before,
                        const std::string& after, std::string guard_type,
                        std::vector<std::string> errors) {
  GuardResult r;
  r.passed = passed;
  r.file = file;
  r.before_content = before;
  r.after_content = after;
  r.guard_type = std::move(guard_type);
  r.errors = std::move(errors);
  return r;
}

}  // namespace

CheckResult verify_python_parse(const std::string& source) {
  const auto parsed = pysyntax::parse(source);
  if (!parsed.ok()) return {false, {"SyntaxError: " + parsed.error->to_string()}};
  return {true, {}};
}

CheckResult verify_ast_equivalence(const std::string& before, const std::string& after) {
  const auto a = pysyntax::parse(before);
  if (!a.ok()) return {false, {"Parse error during AST comparison: " + a.error->to_string()}};
  const auto b = pysyntax::parse(after);
  if (!b.ok()) return {false, {"Parse error during AST comparison: " + b.error->to_string()}};
  if (pysyntax::dump(a.module) != pysyntax::dump(b.module)) {
    return {false, {"AST structures differ (semantic change detected)"}};
  }
  return {true, {}};
}

CheckResult verify_cst_roundtrip(const std::string& source) {
  const auto first = pysyntax::parse(source);
  if (!first.ok()) return {false, {"CST roundtrip error: " + first.error->to_string()}};

  const std::string rendered = pysyntax::render(first.tokens);
  if (rendered != source) return {false, {"CST roundtrip produced different source"}};

  const auto second = pysyntax::parse(rendered);
  if (!second.ok()) return {false, {"CST roundtrip error: " + second.error->to_string()}};
  if (pysyntax::dump(first.module) != pysyntax::dump(second.module)) {
    return {false, {"CST roundtrip produced different tree"}};
  }
  return {true, {}};
}

GuardResult guard_edit(const std::string& path, const std::string& before,
                       const std::string& after, bool strict) {
  auto [parse_ok, parse_errors] = verify_python_parse(after);
  if (!parse_ok) return make_result(false, path, before, after, "parse", std::move(parse_errors));

  if (strict) {
    auto [equiv, ast_errors] = verify_ast_equivalence(before, after);
    if (!equiv) return make_result(false, path, before, after, "ast_equiv", std::move(ast_errors));
  }

  auto [cst_ok, cst_errors] = verify_cst_roundtrip(after);
  if (!cst_ok) return make_result(false, path, before, after, "cst_apply", std::move(cst_errors));

  return make_result(true, path, before, after, "all", {});
}

GuardResult guard_file_edit(const std::string& path, const std::string& after, bool strict) {
  std::string error;
  auto before = read_file_bytes(path, &error);
  if (!before) {
    return make_result(false, path, "", after, "read", {"Failed to read original file: " + error});
  }
  if (std::filesystem::path(path).extension() != ".py") {
    return make_result(true, path, *before, after, "non-python", {});
  }
  return guard_edit(path, *before, after, strict);
}

GuardFn make_guard(bool strict) {
  return [strict](const std::string& file, const std::string& before, const std::string& after) {
    if (std::filesystem::path(file).extension() != ".py") {
      return make_result(true, file, before, after, "non-python", {});
    }
    return guard_edit(file, before, after, strict);
  };
}

std::string format_guard_error(const GuardResult& result) {
  const std::string rule(60, '=');
  std::string out;
  out += rule + "\n";
  out += "PATCH GUARD FAILED\n";
  out += rule + "\n";
  out += "File: " + result.file + "\n";
  out += "Guard Type: " + result.guard_type + "\n";
  out += "\n";
  out += "Errors:\n";
  for (const auto& e : result.errors) out += "  - " + e + "\n";
  out += "\n";
  out += "Action: Edit aborted, original content kept\n";
  out += rule;
  return out;
}

jsonlite::Value GuardSummary::to_value() const {
  jsonlite::Object by_type;
  for (const auto& [type, n] : failures_by_type) by_type[type] = n;
  jsonlite::Object o;
  o["total"] = total;
  o["passed"] = passed;
  o["failed"] = failed;
  o["pass_rate"] = pass_rate;
  o["failures_by_type"] = std::move(by_type);
  return o;
}

GuardSummary get_guard_summary(const std::vector<GuardResult>& results) {
  GuardSummary s;
  s.total = results.size();
  for (const auto& r : results) {
    if (r.passed) {
      ++s.passed;
    } else {
      ++s.failed;
      ++s.failures_by_type[r.guard_type];
    }
  }
  s.pass_rate = s.total ? static_cast<double>(s.passed) / static_cast<double>(s.total) : 0.0;
  return s;
}

}  // namespace ace
