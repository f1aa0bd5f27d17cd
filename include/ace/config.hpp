#pragma once

// ace/config.hpp - Run configuration and policy configuration.
//
// SOURCES, lowest precedence first:
//   1. Compiled defaults (the member initializers below).
//   2. <root>/.ace/config.json. A missing file is not an error.
//   3. Environment: ACE_JOBS, ACE_STRICT_GUARD, ACE_CLEAN_RUN_THRESHOLD,
//      ACE_EVENT_LOG, ACE_LOG_LEVEL.
//
// INVARIANT: a PolicyConfig handed to the PolicyEngine has passed
// validate_policy_config(). load_config() refuses to return anything else.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "ace/jsonlite.hpp"
#include "ace/types.hpp"

namespace ace {

constexpr double kDefaultAlpha = 0.7;
constexpr double kDefaultBeta = 0.3;
constexpr double kDefaultAutoThreshold = 0.70;
constexpr double kDefaultSuggestThreshold = 0.50;

struct PolicyConfig {
  double alpha{kDefaultAlpha};
  double beta{kDefaultBeta};
  double auto_threshold{kDefaultAutoThreshold};
  double suggest_threshold{kDefaultSuggestThreshold};

  // rule_id -> "auto-fix" | "detect-only". Unlisted rules are auto-fix.
  std::map<std::string, std::string> modes;

  // Glob patterns matched against the full path and against the basename.
  std::vector<std::string> suppressed_paths;
  std::map<std::string, std::vector<std::string>> suppressed_rules;

  std::string mode_for(const std::string& rule_id) const;
  bool is_detect_only(const std::string& rule_id) const;
  bool is_suppressed(const std::string& file, const std::string& rule_id) const;

  jsonlite::Value to_value() const;
  static PolicyConfig from_value(const jsonlite::Value& v);
};

struct AceConfig {
  uint64_t jobs{1};
  bool strict_guard{false};
  uint64_t clean_run_threshold{3};
  std::string event_log_path;
  std::string log_level{"warn"};
  PolicyConfig policy;
};

struct ConfigLoadResult {
  AceConfig config;
  ErrorCode error{ErrorCode::none};
  std::string message;

  bool ok() const { return error == ErrorCode::none; }
};

// Reads <root>/.ace/config.json, applies environment overrides, validates.
ConfigLoadResult load_config(const std::string& root);

// Parses a config document already in memory. No environment overrides.
ConfigLoadResult parse_config(const std::string& json_text);

void apply_env_overrides(AceConfig& config);

// Empty string if valid, otherwise the first violation.
std::string validate_policy_config(const PolicyConfig& policy);

// First 16 hex chars of SHA-256 over the canonical JSON of the policy block.
std::string policy_hash(const PolicyConfig& policy);

// fnmatch-style match against `path` or its final component.
bool glob_match(const std::string& path, const std::string& pattern);

}  // namespace ace
