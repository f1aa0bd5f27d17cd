#pragma once

// ace/learn.hpp - Outcome-driven threshold tuning.
//
// DESIGN:
//   The learning engine observes what happened to committed and suggested
//   plans and proposes a per-rule auto-apply threshold.
//
//   FEEDBACK LOOP:
//     1. Observe: record_outcome() after every apply attempt.
//     2. Evaluate: rates over applied + reverted outcomes of one rule.
//     3. Propose: tuned_thresholds() shifts auto by one step.
//     4. Persist: .ace/learn.json is rewritten atomically after each record.
//
// GUARDRAILS:
//   - No proposal below kMinSampleSize applied+reverted outcomes.
//   - auto is clamped to [kFloorMinAuto, kCeilMinAuto]; suggest is never
//     adjusted.
//   - Counters decay by kWeeklyDecay per elapsed week (only once more than
//     0.1 week has passed since the rule was last updated).
//   - Three consecutive reverts of a (rule, file) pair put it on the
//     auto-skiplist; any other outcome for the pair takes it off again.
//   - A corrupted or unreadable learn.json yields empty data and a log line,
//     never an error.
//
// THREAD SAFETY: all public methods lock an internal mutex.

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "ace/jsonlite.hpp"
#include "ace/types.hpp"

namespace ace {

namespace learn {

constexpr double kDefaultMinAuto = 0.70;
constexpr double kDefaultMinSuggest = 0.50;
constexpr double kFloorMinAuto = 0.60;
constexpr double kCeilMinAuto = 0.85;
constexpr double kThresholdDelta = 0.05;
constexpr double kHighRevertRate = 0.25;
constexpr double kHighApplyRate = 0.80;
constexpr uint64_t kMinSampleSize = 5;
constexpr double kWeeklyDecay = 0.8;
constexpr uint64_t kRevertSkiplistThreshold = 3;

}  // namespace learn

enum class Outcome { applied, reverted, suggested, skipped };

std::string to_string(Outcome o);

struct RuleStats {
  uint64_t applied{0};
  uint64_t reverted{0};
  uint64_t suggested{0};
  uint64_t skipped{0};
  double last_updated{0.0};  // unix seconds
  std::map<std::string, uint64_t> consecutive_reverts;  // file -> count

  uint64_t sample_size() const { return applied + reverted; }
  double revert_rate() const;
  double apply_rate() const;
  void apply_decay(double weeks_elapsed, double factor = learn::kWeeklyDecay);

  jsonlite::Value to_value() const;
  static RuleStats from_value(const jsonlite::Value& v);
};

struct ContextStats {
  uint64_t hits{0};
  uint64_t reverts{0};

  double revert_rate() const;

  jsonlite::Value to_value() const;
  static ContextStats from_value(const jsonlite::Value& v);
};

struct LearningData {
  std::map<std::string, RuleStats> rules;
  std::map<std::string, ContextStats> contexts;
  std::map<std::string, double> tuning{{"alpha", 0.7},
                                       {"beta", 0.3},
                                       {"min_auto", learn::kDefaultMinAuto},
                                       {"min_suggest", learn::kDefaultMinSuggest}};
  std::map<std::string, std::vector<std::string>> auto_skiplist;  // rule -> files

  jsonlite::Value to_value() const;
  static LearningData from_value(const jsonlite::Value& v);
};

struct TunedRule {
  std::string rule_id;
  double auto_threshold{0.0};
  RuleStats stats;
};

class LearningEngine {
 public:
  using Clock = std::function<double()>;  // unix seconds

  // `now` defaults to the system clock.
  explicit LearningEngine(std::string learn_path, Clock now = nullptr);

  // Reads the file now. Later calls are no-ops unless reset() ran.
  void load();
  bool save(std::string* error = nullptr);

  // Updates counters and persists. Returns false only if persisting failed.
  bool record_outcome(const std::string& rule_id, Outcome outcome,
                      const std::string& context_key = "", const std::string& file_path = "");

  // (auto, suggest)
  std::pair<double, double> tuned_thresholds(const std::string& rule_id);
  bool should_skip_context(const std::string& context_key, double threshold = 0.5);
  bool should_skip_file_for_rule(const std::string& rule_id, const std::string& file_path);

  // Seeds tuning.min_auto / tuning.min_suggest (e.g. from PolicyConfig).
  void set_base_thresholds(double min_auto, double min_suggest);

  // Rules with enough samples whose auto threshold moved, most conservative first.
  std::vector<TunedRule> get_tuned_rules();
  // Rules with at least two applied+reverted outcomes, highest revert rate first.
  std::vector<std::pair<std::string, double>> get_top_rules_by_revert_rate(std::size_t limit = 10);

  // Drops all data and deletes the file.
  void reset();

  LearningData snapshot();
  const std::string& path() const { return path_; }

 private:
  void ensure_loaded();
  double tuned_auto(const std::string& rule_id) const;
  bool save_locked(std::string* error);

  std::string path_;
  Clock now_;
  std::mutex mu_;
  bool loaded_{false};
  LearningData data_;
};

// "<file>:<rule>:<sha256(snippet[:100])[:8]>" of the first finding, or
// "no-findings".
std::string context_key(const EditPlan& plan);

// Unique rule ids of the plan's findings, sorted.
std::vector<std::string> get_rule_ids_from_plan(const EditPlan& plan);

}  // namespace ace
