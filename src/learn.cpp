#include "ace/learn.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <set>

#include "ace/fileio.hpp"
#include "ace/hash.hpp"
#include "ace/observability.hpp"
#include "ace/version.hpp"

namespace fs = std::filesystem;

namespace ace {

namespace {

constexpr double kSecondsPerWeek = 7.0 * 24.0 * 3600.0;

// First `count` UTF-8 code points of `s`; continuation bytes never start one.
std::string utf8_prefix(const std::string& s, std::size_t count) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) continue;
    if (seen == count) return s.substr(0, i);
    ++seen;
  }
  return s;
}

double system_now() {
  return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

uint64_t decayed(uint64_t v, double multiplier) {
  return static_cast<uint64_t>(std::floor(static_cast<double>(v) * multiplier));
}

}  // namespace

std::string to_string(Outcome o) {
  switch (o) {
    case Outcome::applied: return "applied";
    case Outcome::reverted: return "reverted";
    case Outcome::suggested: return "suggested";
    case Outcome::skipped: return "skipped";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// RuleStats / ContextStats
// ---------------------------------------------------------------------------

double RuleStats::revert_rate() const {
  const uint64_t n = sample_size();
  return n ? static_cast<double>(reverted) / static_cast<double>(n) : 0.0;
}

double RuleStats::apply_rate() const {
  const uint64_t n = sample_size();
  return n ? static_cast<double>(applied) / static_cast<double>(n) : 0.0;
}

void RuleStats::apply_decay(double weeks_elapsed, double factor) {
  if (weeks_elapsed <= 0.0) return;
  const double m = std::pow(factor, weeks_elapsed);
  applied = decayed(applied, m);
  reverted = decayed(reverted, m);
  suggested = decayed(suggested, m);
  skipped = decayed(skipped, m);
}

jsonlite::Value RuleStats::to_value() const {
  jsonlite::Object streaks;
  for (const auto& [file, n] : consecutive_reverts) streaks[file] = n;
  jsonlite::Object o;
  o["applied"] = applied;
  o["reverted"] = reverted;
  o["suggested"] = suggested;
  o["skipped"] = skipped;
  o["last_updated"] = last_updated;
  o["consecutive_reverts"] = std::move(streaks);
  return o;
}

RuleStats RuleStats::from_value(const jsonlite::Value& v) {
  RuleStats s;
  const auto* o = v.as_object();
  if (!o) return s;
  s.applied = jsonlite::get_u64(*o, "applied");
  s.reverted = jsonlite::get_u64(*o, "reverted");
  s.suggested = jsonlite::get_u64(*o, "suggested");
  s.skipped = jsonlite::get_u64(*o, "skipped");
  s.last_updated = jsonlite::get_double(*o, "last_updated");
  if (const auto* streaks = jsonlite::get_object(*o, "consecutive_reverts")) {
    for (const auto& [file, _] : *streaks) {
      s.consecutive_reverts[file] = jsonlite::get_u64(*streaks, file);
    }
  }
  return s;
}

double ContextStats::revert_rate() const {
  return hits ? static_cast<double>(reverts) / static_cast<double>(hits) : 0.0;
}

jsonlite::Value ContextStats::to_value() const {
  jsonlite::Object o;
  o["hits"] = hits;
  o["reverts"] = reverts;
  return o;
}

ContextStats ContextStats::from_value(const jsonlite::Value& v) {
  ContextStats c;
  const auto* o = v.as_object();
  if (!o) return c;
  c.hits = jsonlite::get_u64(*o, "hits");
  c.reverts = jsonlite::get_u64(*o, "reverts");
  return c;
}

// ---------------------------------------------------------------------------
// LearningData
// ---------------------------------------------------------------------------

jsonlite::Value LearningData::to_value() const {
  jsonlite::Object r, c, t, skip;
  for (const auto& [id, s] : rules) r[id] = s.to_value();
  for (const auto& [key, s] : contexts) c[key] = s.to_value();
  for (const auto& [key, val] : tuning) t[key] = val;
  for (const auto& [id, files] : auto_skiplist) skip[id] = jsonlite::to_array(files);

  jsonlite::Object o;
  o["rules"] = std::move(r);
  o["contexts"] = std::move(c);
  o["tuning"] = std::move(t);
  o["auto_skiplist"] = std::move(skip);
  o["format_version"] = static_cast<uint64_t>(version::LEARN_FORMAT_VERSION);
  return o;
}

LearningData LearningData::from_value(const jsonlite::Value& v) {
  LearningData d;
  const auto* o = v.as_object();
  if (!o) return d;
  if (const auto* r = jsonlite::get_object(*o, "rules")) {
    for (const auto& [id, val] : *r) d.rules[id] = RuleStats::from_value(val);
  }
  if (const auto* c = jsonlite::get_object(*o, "contexts")) {
    for (const auto& [key, val] : *c) d.contexts[key] = ContextStats::from_value(val);
  }
  if (const auto* t = jsonlite::get_object(*o, "tuning")) {
    for (const auto& [key, _] : *t) d.tuning[key] = jsonlite::get_double(*t, key, d.tuning[key]);
  }
  if (const auto* skip = jsonlite::get_object(*o, "auto_skiplist")) {
    for (const auto& [id, _] : *skip) d.auto_skiplist[id] = jsonlite::get_string_array(*skip, id);
  }
  return d;
}

// ---------------------------------------------------------------------------
// LearningEngine
// ---------------------------------------------------------------------------

LearningEngine::LearningEngine(std::string learn_path, Clock now)
    : path_(std::move(learn_path)), now_(now ? std::move(now) : Clock(system_now)) {}

void LearningEngine::load() {
  std::lock_guard<std::mutex> lk(mu_);
  ensure_loaded();
}

void LearningEngine::ensure_loaded() {
  if (loaded_) return;
  loaded_ = true;
  data_ = LearningData{};

  std::error_code ec;
  if (!fs::exists(path_, ec)) return;

  std::string error;
  auto text = read_file_bytes(path_, &error);
  if (!text) {
    log(LogLevel::warn, "learn", "cannot read " + path_ + ", starting fresh: " + error);
    return;
  }
  std::optional<jsonlite::JsonError> err;
  const auto value = jsonlite::parse_value(*text, &err);
  if (err || !value.as_object()) {
    log(LogLevel::warn, "learn", path_ + " is corrupted, starting fresh");
    return;
  }
  std::string version_error;
  if (!version::check_format_version("learn", jsonlite::get_u64(*value.as_object(), "format_version"),
                                     version::LEARN_FORMAT_VERSION, &version_error)) {
    log(LogLevel::warn, "learn", version_error + ", starting fresh");
    return;
  }
  data_ = LearningData::from_value(value);
}

bool LearningEngine::save(std::string* error) {
  std::lock_guard<std::mutex> lk(mu_);
  ensure_loaded();
  return save_locked(error);
}

bool LearningEngine::save_locked(std::string* error) {
  return atomic_write(path_, jsonlite::to_json_pretty(data_.to_value()) + "\n", error);
}

bool LearningEngine::record_outcome(const std::string& rule_id, Outcome outcome,
                                    const std::string& context_key, const std::string& file_path) {
  std::lock_guard<std::mutex> lk(mu_);
  ensure_loaded();

  RuleStats& stats = data_.rules[rule_id];
  const double now = now_();
  if (stats.last_updated > 0.0) {
    const double weeks = (now - stats.last_updated) / kSecondsPerWeek;
    if (weeks > 0.1) stats.apply_decay(weeks);
  }
  stats.last_updated = now;

  switch (outcome) {
    case Outcome::applied: ++stats.applied; break;
    case Outcome::reverted: ++stats.reverted; break;
    case Outcome::suggested: ++stats.suggested; break;
    case Outcome::skipped: ++stats.skipped; break;
  }

  if (!file_path.empty()) {
    auto& files = data_.auto_skiplist[rule_id];
    if (outcome == Outcome::reverted) {
      const uint64_t streak = ++stats.consecutive_reverts[file_path];
      if (streak >= learn::kRevertSkiplistThreshold &&
          std::find(files.begin(), files.end(), file_path) == files.end()) {
        files.push_back(file_path);
        log(LogLevel::info, "learn", rule_id + " auto-skipped for " + file_path);
      }
    } else {
      stats.consecutive_reverts.erase(file_path);
      files.erase(std::remove(files.begin(), files.end(), file_path), files.end());
    }
    if (files.empty()) data_.auto_skiplist.erase(rule_id);
  }

  if (!context_key.empty()) {
    ContextStats& ctx = data_.contexts[context_key];
    ++ctx.hits;
    if (outcome == Outcome::reverted) ++ctx.reverts;
  }

  std::string error;
  if (!save_locked(&error)) {
    log(LogLevel::warn, "learn", "save failed: " + error);
    return false;
  }
  return true;
}

double LearningEngine::tuned_auto(const std::string& rule_id) const {
  auto base_it = data_.tuning.find("min_auto");
  double min_auto = base_it == data_.tuning.end() ? learn::kDefaultMinAuto : base_it->second;

  auto it = data_.rules.find(rule_id);
  if (it != data_.rules.end() && it->second.sample_size() >= learn::kMinSampleSize) {
    if (it->second.revert_rate() > learn::kHighRevertRate) {
      min_auto += learn::kThresholdDelta;
    } else if (it->second.apply_rate() > learn::kHighApplyRate) {
      min_auto -= learn::kThresholdDelta;
    }
  }
  return std::clamp(min_auto, learn::kFloorMinAuto, learn::kCeilMinAuto);
}

std::pair<double, double> LearningEngine::tuned_thresholds(const std::string& rule_id) {
  std::lock_guard<std::mutex> lk(mu_);
  ensure_loaded();
  auto it = data_.tuning.find("min_suggest");
  const double suggest = it == data_.tuning.end() ? learn::kDefaultMinSuggest : it->second;
  return {tuned_auto(rule_id), suggest};
}

bool LearningEngine::should_skip_context(const std::string& context_key, double threshold) {
  std::lock_guard<std::mutex> lk(mu_);
  ensure_loaded();
  auto it = data_.contexts.find(context_key);
  if (it == data_.contexts.end() || it->second.hits < 3) return false;
  return it->second.revert_rate() > threshold;
}

bool LearningEngine::should_skip_file_for_rule(const std::string& rule_id,
                                               const std::string& file_path) {
  std::lock_guard<std::mutex> lk(mu_);
  ensure_loaded();
  auto it = data_.auto_skiplist.find(rule_id);
  if (it == data_.auto_skiplist.end()) return false;
  return std::find(it->second.begin(), it->second.end(), file_path) != it->second.end();
}

void LearningEngine::set_base_thresholds(double min_auto, double min_suggest) {
  std::lock_guard<std::mutex> lk(mu_);
  ensure_loaded();
  data_.tuning["min_auto"] = min_auto;
  data_.tuning["min_suggest"] = min_suggest;
}

std::vector<TunedRule> LearningEngine::get_tuned_rules() {
  std::lock_guard<std::mutex> lk(mu_);
  ensure_loaded();
  std::vector<TunedRule> out;
  for (const auto& [id, stats] : data_.rules) {
    if (stats.sample_size() < learn::kMinSampleSize) continue;
    const double t = tuned_auto(id);
    if (std::fabs(t - learn::kDefaultMinAuto) > 0.001) out.push_back({id, t, stats});
  }
  std::stable_sort(out.begin(), out.end(), [](const TunedRule& a, const TunedRule& b) {
    return a.auto_threshold > b.auto_threshold;
  });
  return out;
}

std::vector<std::pair<std::string, double>> LearningEngine::get_top_rules_by_revert_rate(
    std::size_t limit) {
  std::lock_guard<std::mutex> lk(mu_);
  ensure_loaded();
  std::vector<std::pair<std::string, double>> out;
  for (const auto& [id, stats] : data_.rules) {
    if (stats.sample_size() >= 2) out.emplace_back(id, stats.revert_rate());
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const auto& a, const auto& b) { return a.second > b.second; });
  if (out.size() > limit) out.resize(limit);
  return out;
}

void LearningEngine::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  data_ = LearningData{};
  loaded_ = true;
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) log(LogLevel::warn, "learn", "cannot remove " + path_ + ": " + ec.message());
}

LearningData LearningEngine::snapshot() {
  std::lock_guard<std::mutex> lk(mu_);
  ensure_loaded();
  return data_;
}

// ---------------------------------------------------------------------------
// Plan helpers
// ---------------------------------------------------------------------------

std::string context_key(const EditPlan& plan) {
  if (plan.findings.empty()) return "no-findings";
  const Finding& f = plan.findings.front();
  const std::string snippet = utf8_prefix(f.snippet, 100);
  return f.file + ":" + f.rule + ":" + sha256_hex(snippet).substr(0, 8);
}

std::vector<std::string> get_rule_ids_from_plan(const EditPlan& plan) {
  std::set<std::string> ids;
  for (const auto& f : plan.findings) ids.insert(f.rule);
  return {ids.begin(), ids.end()};
}

}  // namespace ace
