#include "ace/config.hpp"

#include <cstdlib>
#include <filesystem>

#include <fnmatch.h>

#include "ace/fileio.hpp"
#include "ace/hash.hpp"
#include "ace/observability.hpp"

namespace fs = std::filesystem;

namespace ace {

namespace {

bool in_unit_range(double v) { return v >= 0.0 && v <= 1.0; }

std::string fmt(double v) { return jsonlite::format_double(v); }

// Leaves `out` untouched when the variable is unset or not a number.
void env_u64(const char* name, uint64_t& out) {
  const char* env = std::getenv(name);
  if (!env || !env[0]) return;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(env, &end, 10);
  if (end == env || *end != '\0') {
    log(LogLevel::warn, "config", std::string("ignoring non-numeric ") + name + "=" + env);
    return;
  }
  out = v;
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyConfig
// ---------------------------------------------------------------------------

std::string PolicyConfig::mode_for(const std::string& rule_id) const {
  auto it = modes.find(rule_id);
  return it == modes.end() ? "auto-fix" : it->second;
}

bool PolicyConfig::is_detect_only(const std::string& rule_id) const {
  return mode_for(rule_id) == "detect-only";
}

bool PolicyConfig::is_suppressed(const std::string& file, const std::string& rule_id) const {
  for (const auto& pattern : suppressed_paths) {
    if (glob_match(file, pattern)) return true;
  }
  auto it = suppressed_rules.find(rule_id);
  if (it == suppressed_rules.end()) return false;
  for (const auto& pattern : it->second) {
    if (glob_match(file, pattern)) return true;
  }
  return false;
}

jsonlite::Value PolicyConfig::to_value() const {
  jsonlite::Object o;
  o["alpha"] = alpha;
  o["beta"] = beta;
  o["auto_threshold"] = auto_threshold;
  o["suggest_threshold"] = suggest_threshold;

  jsonlite::Object m;
  for (const auto& [rule, mode] : modes) m[rule] = mode;
  o["modes"] = std::move(m);

  jsonlite::Object rules;
  for (const auto& [rule, globs] : suppressed_rules) rules[rule] = jsonlite::to_array(globs);
  jsonlite::Object sup;
  sup["paths"] = jsonlite::to_array(suppressed_paths);
  sup["rules"] = std::move(rules);
  o["suppressions"] = std::move(sup);
  return o;
}

PolicyConfig PolicyConfig::from_value(const jsonlite::Value& v) {
  PolicyConfig p;
  const auto* o = v.as_object();
  if (!o) return p;
  p.alpha = jsonlite::get_double(*o, "alpha", kDefaultAlpha);
  p.beta = jsonlite::get_double(*o, "beta", kDefaultBeta);
  p.auto_threshold = jsonlite::get_double(*o, "auto_threshold", kDefaultAutoThreshold);
  p.suggest_threshold = jsonlite::get_double(*o, "suggest_threshold", kDefaultSuggestThreshold);
  p.modes = jsonlite::get_string_map(*o, "modes");
  if (const auto* sup = jsonlite::get_object(*o, "suppressions")) {
    p.suppressed_paths = jsonlite::get_string_array(*sup, "paths");
    if (const auto* rules = jsonlite::get_object(*sup, "rules")) {
      for (const auto& [rule, _] : *rules) {
        p.suppressed_rules[rule] = jsonlite::get_string_array(*rules, rule);
      }
    }
  }
  return p;
}

std::string validate_policy_config(const PolicyConfig& policy) {
  if (!in_unit_range(policy.alpha)) return "alpha must be in [0.0, 1.0], got " + fmt(policy.alpha);
  if (!in_unit_range(policy.beta)) return "beta must be in [0.0, 1.0], got " + fmt(policy.beta);
  if (!in_unit_range(policy.auto_threshold)) {
    return "auto_threshold must be in [0.0, 1.0], got " + fmt(policy.auto_threshold);
  }
  if (!in_unit_range(policy.suggest_threshold)) {
    return "suggest_threshold must be in [0.0, 1.0], got " + fmt(policy.suggest_threshold);
  }
  if (policy.auto_threshold < policy.suggest_threshold) {
    return "auto_threshold (" + fmt(policy.auto_threshold) + ") must be >= suggest_threshold (" +
           fmt(policy.suggest_threshold) + ")";
  }
  for (const auto& [rule, mode] : policy.modes) {
    if (mode != "auto-fix" && mode != "detect-only") {
      return "invalid mode for " + rule + ": " + mode + " (expected auto-fix or detect-only)";
    }
  }
  return {};
}

std::string policy_hash(const PolicyConfig& policy) {
  return sha256_hex(jsonlite::to_json(policy.to_value())).substr(0, 16);
}

bool glob_match(const std::string& path, const std::string& pattern) {
  if (::fnmatch(pattern.c_str(), path.c_str(), 0) == 0) return true;
  const std::string base = fs::path(path).filename().string();
  return ::fnmatch(pattern.c_str(), base.c_str(), 0) == 0;
}

// ---------------------------------------------------------------------------
// AceConfig
// ---------------------------------------------------------------------------

void apply_env_overrides(AceConfig& config) {
  env_u64("ACE_JOBS", config.jobs);
  env_u64("ACE_CLEAN_RUN_THRESHOLD", config.clean_run_threshold);
  if (const char* env = std::getenv("ACE_STRICT_GUARD"); env && env[0]) {
    const std::string v = env;
    config.strict_guard = (v == "1" || v == "true" || v == "yes");
  }
  if (const char* env = std::getenv("ACE_EVENT_LOG"); env && env[0]) {
    config.event_log_path = env;
  }
  if (const char* env = std::getenv("ACE_LOG_LEVEL"); env && env[0]) {
    config.log_level = env;
  }
}

ConfigLoadResult parse_config(const std::string& json_text) {
  ConfigLoadResult r;
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(json_text, &err);
  if (err) {
    r.error = ErrorCode::config_invalid;
    r.message = err->code + ": " + err->message;
    return r;
  }
  r.config.jobs = jsonlite::get_u64(obj, "jobs", r.config.jobs);
  r.config.strict_guard = jsonlite::get_bool(obj, "strict_guard", r.config.strict_guard);
  r.config.clean_run_threshold =
      jsonlite::get_u64(obj, "clean_run_threshold", r.config.clean_run_threshold);
  r.config.event_log_path = jsonlite::get_string(obj, "event_log_path");
  r.config.log_level = jsonlite::get_string(obj, "log_level", r.config.log_level);
  if (auto it = obj.find("policy"); it != obj.end()) {
    r.config.policy = PolicyConfig::from_value(it->second);
  }
  return r;
}

ConfigLoadResult load_config(const std::string& root) {
  ConfigLoadResult r;
  const fs::path path = fs::path(root) / ".ace" / "config.json";
  std::error_code ec;
  if (fs::exists(path, ec)) {
    std::string read_error;
    auto text = read_file_bytes(path.string(), &read_error);
    if (!text) {
      r.error = ErrorCode::io_error;
      r.message = read_error;
      return r;
    }
    r = parse_config(*text);
    if (!r.ok()) {
      r.message = path.string() + ": " + r.message;
      return r;
    }
  }

  apply_env_overrides(r.config);
  if (r.config.jobs == 0) r.config.jobs = 1;

  const std::string violation = validate_policy_config(r.config.policy);
  if (!violation.empty()) {
    r.error = ErrorCode::config_invalid;
    r.message = violation;
    return r;
  }
  return r;
}

}  // namespace ace
