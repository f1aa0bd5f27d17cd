#include "ace/policy.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "ace/learn.hpp"

namespace ace {

namespace {

// (file, rule) pairs a plan touches: every finding, plus every edited file
// against every rule of the plan.
std::set<std::pair<std::string, std::string>> plan_pairs(const EditPlan& plan) {
  std::set<std::pair<std::string, std::string>> pairs;
  for (const auto& f : plan.findings) pairs.emplace(f.file, f.rule);
  for (const auto& e : plan.edits) {
    for (const auto& f : plan.findings) pairs.emplace(e.file, f.rule);
  }
  return pairs;
}

}  // namespace

std::string to_string(Decision d) {
  switch (d) {
    case Decision::auto_apply: return "auto";
    case Decision::suggest: return "suggest";
    case Decision::deny: return "deny";
  }
  return "deny";
}

double rstar(double value, double impact, double alpha, double beta) {
  return alpha * value + beta * impact;
}

Decision decision(double score, const Thresholds& thresholds) {
  if (score >= thresholds.auto_threshold) return Decision::auto_apply;
  if (score >= thresholds.suggest_threshold) return Decision::suggest;
  return Decision::deny;
}

PlanScore compute_plan_rstar(const EditPlan& plan, const PolicyConfig& policy) {
  PlanScore s;
  for (const auto& f : plan.findings) s.value = std::max(s.value, severity_weight(f.severity));
  s.impact = std::min(1.0, static_cast<double>(plan.edits.size()) / 10.0);
  s.score = std::clamp(rstar(s.value, s.impact, policy.alpha, policy.beta), 0.0, 1.0);
  return s;
}

jsonlite::Value PolicyResult::to_value() const {
  jsonlite::Object o;
  o["decision"] = to_string(decision);
  o["score"] = score.score;
  o["value"] = score.value;
  o["impact"] = score.impact;
  o["auto_threshold"] = thresholds.auto_threshold;
  o["suggest_threshold"] = thresholds.suggest_threshold;
  o["context_key"] = context_key;
  o["reasons"] = jsonlite::to_array(reasons);
  return o;
}

PolicyResult enforce_policy(const EditPlan& plan, const PolicyContext& context) {
  const PolicyConfig& config = *context.config;
  PolicyResult r;
  r.context_key = context_key(plan);
  r.score = compute_plan_rstar(plan, config);
  r.thresholds = Thresholds{config.auto_threshold, config.suggest_threshold};

  const auto pairs = plan_pairs(plan);
  for (const auto& [file, rule] : pairs) {
    if (config.is_suppressed(file, rule)) {
      r.reasons.push_back("suppressed: " + rule + " in " + file);
    } else if (context.learning && context.learning->should_skip_file_for_rule(rule, file)) {
      r.reasons.push_back("auto-skipped after repeated reverts: " + rule + " in " + file);
    }
  }
  if (!r.reasons.empty()) {
    r.decision = Decision::deny;
    return r;
  }

  const auto rules = get_rule_ids_from_plan(plan);
  if (context.learning && !rules.empty()) {
    Thresholds strictest{0.0, 0.0};
    for (const auto& rule : rules) {
      const auto [a, s] = context.learning->tuned_thresholds(rule);
      strictest.auto_threshold = std::max(strictest.auto_threshold, a);
      strictest.suggest_threshold = std::max(strictest.suggest_threshold, s);
    }
    r.thresholds = strictest;
  }

  r.decision = decision(r.score.score, r.thresholds);

  if (r.decision == Decision::auto_apply) {
    for (const auto& rule : rules) {
      if (config.is_detect_only(rule)) r.reasons.push_back("detect-only rule: " + rule);
    }
    if (context.learning && context.learning->should_skip_context(r.context_key, 0.5)) {
      r.reasons.push_back("context reverted too often: " + r.context_key);
    }
    if (!r.reasons.empty()) r.decision = Decision::suggest;
  }
  return r;
}

}  // namespace ace
