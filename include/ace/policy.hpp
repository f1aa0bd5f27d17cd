#pragma once

// ace/policy.hpp - R* scoring and the auto / suggest / deny decision.
//
//   R* = alpha * value + beta * impact
//     value  = highest severity weight among the plan's findings
//     impact = min(1, edits / 10)
//
// enforce_policy() order of evaluation:
//   1. deny when any (file, rule) of the plan is suppressed by config
//   2. deny when the learning engine auto-skips any (rule, file) pair
//   3. thresholds = most conservative tuned thresholds over the plan's rules
//   4. decision(R*, thresholds)
//   5. cap at suggest for detect-only rules and high-revert contexts
//
// A deny is a normal outcome. Denied plans never reach the commit path.

#include <string>
#include <vector>

#include "ace/config.hpp"
#include "ace/jsonlite.hpp"
#include "ace/types.hpp"

namespace ace {

class LearningEngine;

enum class Decision { auto_apply, suggest, deny };

// "auto" | "suggest" | "deny"
std::string to_string(Decision d);

struct Thresholds {
  double auto_threshold{kDefaultAutoThreshold};
  double suggest_threshold{kDefaultSuggestThreshold};
};

double rstar(double value, double impact, double alpha = kDefaultAlpha, double beta = kDefaultBeta);

Decision decision(double score, const Thresholds& thresholds);

struct PlanScore {
  double value{0.0};
  double impact{0.0};
  double score{0.0};
};

PlanScore compute_plan_rstar(const EditPlan& plan, const PolicyConfig& policy);

struct PolicyContext {
  const PolicyConfig* config{nullptr};  // required
  LearningEngine* learning{nullptr};    // optional; config thresholds when null
};

struct PolicyResult {
  Decision decision{Decision::deny};
  PlanScore score;
  Thresholds thresholds;
  std::string context_key;
  std::vector<std::string> reasons;

  jsonlite::Value to_value() const;
};

PolicyResult enforce_policy(const EditPlan& plan, const PolicyContext& context);

}  // namespace ace
