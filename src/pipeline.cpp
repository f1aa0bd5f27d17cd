#include "ace/pipeline.hpp"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <set>
#include <thread>

#include "ace/fileio.hpp"
#include "ace/guard.hpp"
#include "ace/hash.hpp"
#include "ace/pysyntax.hpp"
#include "ace/version.hpp"

namespace fs = std::filesystem;

namespace ace {

namespace {

std::atomic<uint64_t> g_run_counter{0};

std::string normalize_root(const std::string& root) {
  fs::path p = fs::absolute(root).lexically_normal();
  if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) p = p.parent_path();
  return p.string();
}

uint64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now() - since)
                                   .count());
}

}  // namespace

uint64_t ApplyOutcome::committed() const {
  uint64_t n = 0;
  for (const auto& f : files) {
    if (f.committed) ++n;
  }
  return n;
}

std::string make_run_id(const std::string& root) {
  const std::string seed = root + "|" + iso8601_utc_ms() + "|" + std::to_string(::getpid()) + "|" +
                           std::to_string(g_run_counter.fetch_add(1));
  return fingerprint("run:", seed);
}

std::string findings_to_json(std::vector<Finding> findings) {
  std::sort(findings.begin(), findings.end(), finding_less);
  jsonlite::Array arr;
  arr.reserve(findings.size());
  for (const auto& f : findings) arr.push_back(f.to_value());
  return jsonlite::to_json(arr);
}

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

Pipeline::Pipeline(std::string root, AceConfig config)
    : root_(normalize_root(root)),
      config_(std::move(config)),
      run_id_(make_run_id(root_)),
      events_(config_.event_log_path),
      learning_((fs::path(root_) / ".ace" / "learn.json").string()),
      index_((fs::path(root_) / ".ace" / "index.json").string()),
      backups_((fs::path(root_) / ".ace" / "backups").string()),
      journal_(run_id_, journals_dir()) {
  fs::create_directories(repairs_dir());
  set_log_level(log_level_from_string(config_.log_level));
  learning_.set_base_thresholds(config_.policy.auto_threshold, config_.policy.suggest_threshold);
  index_.load();
  log(LogLevel::info, "pipeline", "run " + run_id_ + " rooted at " + root_);
}

Pipeline::~Pipeline() {
  std::string error;
  if (!close(&error)) log(LogLevel::warn, "pipeline", "close: " + error);
}

bool Pipeline::close(std::string* error) {
  std::lock_guard<std::mutex> lk(commit_mu_);
  if (closed_) return true;
  closed_ = true;
  journal_.close();
  jsonlite::Object fields;
  fields["engine"] = version::ENGINE_SEMVER;
  fields["stats"] = stats_.to_value();
  emit("run_closed", std::move(fields));
  return index_.save(error);
}

std::string Pipeline::state_dir() const { return (fs::path(root_) / ".ace").string(); }
std::string Pipeline::journals_dir() const { return (fs::path(root_) / ".ace" / "journals").string(); }
std::string Pipeline::repairs_dir() const { return (fs::path(root_) / ".ace" / "repairs").string(); }

std::string Pipeline::resolve(const std::string& rel) const {
  const fs::path p(rel);
  if (p.is_absolute()) return p.lexically_normal().string();
  return (fs::path(root_) / p).lexically_normal().string();
}

std::string Pipeline::relative(const std::string& abs) const {
  const fs::path rel = fs::path(abs).lexically_relative(root_);
  if (rel.empty() || *rel.begin() == "..") return abs;
  return rel.string();
}

std::mutex& Pipeline::file_mutex(const std::string& abs) {
  std::lock_guard<std::mutex> lk(files_mu_);
  auto& slot = file_locks_[abs];
  if (!slot) slot = std::make_unique<std::mutex>();
  return *slot;
}

void Pipeline::emit(const std::string& name, jsonlite::Object fields) {
  fields["run_id"] = run_id_;
  if (!events_.emit(name, std::move(fields))) {
    stats_.sink_failures.fetch_add(1, std::memory_order_relaxed);
  }
}

// ---------------------------------------------------------------------------
// Analysis
// ---------------------------------------------------------------------------

std::vector<Finding> Pipeline::analyze(const std::vector<std::string>& files,
                                       const IAnalyzer& analyzer, uint64_t jobs) {
  if (jobs == 0) jobs = config_.jobs;
  const std::size_t workers =
      std::max<std::size_t>(1, std::min<std::size_t>(static_cast<std::size_t>(jobs), files.size()));

  // One slot per input file; workers never share a slot.
  std::vector<std::vector<Finding>> per_file(files.size());
  std::atomic<std::size_t> next{0};
  uint64_t wall_ms = 0;
  {
    ScopeTimer timer(wall_ms);
    auto work = [&]() {
      for (std::size_t i = next.fetch_add(1); i < files.size(); i = next.fetch_add(1)) {
        try {
          per_file[i] = analyzer.analyze(files[i]);
        } catch (const std::exception& e) {
          log(LogLevel::error, "pipeline", "analyzer failed on " + files[i] + ": " + e.what());
        }
        stats_.files_analyzed.fetch_add(1, std::memory_order_relaxed);
      }
    };
    if (workers == 1) {
      work();
    } else {
      std::vector<std::thread> threads;
      threads.reserve(workers);
      for (std::size_t w = 0; w < workers; ++w) threads.emplace_back(work);
      for (auto& t : threads) t.join();
    }
  }

  std::vector<Finding> merged;
  for (auto& slot : per_file) {
    merged.insert(merged.end(), std::make_move_iterator(slot.begin()),
                  std::make_move_iterator(slot.end()));
  }
  std::sort(merged.begin(), merged.end(), finding_less);
  log(LogLevel::debug, "pipeline",
      "analyzed " + std::to_string(files.size()) + " files with " + std::to_string(workers) +
          " workers in " + std::to_string(wall_ms) + "ms, " + std::to_string(merged.size()) +
          " findings");
  return merged;
}

std::vector<std::string> Pipeline::select_files_for_scan(const std::vector<std::string>& files) {
  std::lock_guard<std::mutex> lk(commit_mu_);
  std::vector<std::string> selected;
  for (const auto& f : files) {
    const std::string abs = resolve(f);
    if (!is_indexable(abs)) {
      stats_.files_skipped.fetch_add(1, std::memory_order_relaxed);
      continue;
    }
    if (!index_.has_changed(abs) && index_.should_skip_deep_scan(abs, config_.clean_run_threshold)) {
      log(LogLevel::debug, "pipeline", "clean-run skip: " + f);
      stats_.files_skipped.fetch_add(1, std::memory_order_relaxed);
      continue;
    }
    selected.push_back(f);
  }
  return selected;
}

void Pipeline::record_scan_result(const std::string& file, std::size_t finding_count) {
  std::lock_guard<std::mutex> lk(commit_mu_);
  const std::string abs = resolve(file);
  if (!index_.add_file(abs, /*preserve_clean_runs=*/true)) {
    log(LogLevel::warn, "pipeline", "cannot index " + file);
    return;
  }
  if (finding_count == 0) {
    index_.increment_clean_runs(abs);
  } else {
    index_.reset_clean_runs(abs);
  }
}

// ---------------------------------------------------------------------------
// Policy and commit
// ---------------------------------------------------------------------------

PolicyResult Pipeline::score(const EditPlan& plan) {
  PolicyResult r = enforce_policy(plan, PolicyContext{&config_.policy, &learning_});
  stats_.plans_scored.fetch_add(1, std::memory_order_relaxed);
  switch (r.decision) {
    case Decision::auto_apply: stats_.plans_auto.fetch_add(1, std::memory_order_relaxed); break;
    case Decision::suggest: stats_.plans_suggest.fetch_add(1, std::memory_order_relaxed); break;
    case Decision::deny: stats_.plans_deny.fetch_add(1, std::memory_order_relaxed); break;
  }
  jsonlite::Object fields;
  fields["plan_id"] = plan.id;
  fields["policy"] = r.to_value();
  emit("plan_scored", std::move(fields));
  return r;
}

ApplyOutcome Pipeline::apply_plan(const EditPlan& plan) {
  ApplyOutcome out;
  out.policy = score(plan);

  if (out.policy.decision == Decision::deny) {
    out.error = ErrorCode::policy_denied;
    out.message = "plan " + plan.id + " denied";
    if (!out.policy.reasons.empty()) out.message += ": " + out.policy.reasons.front();
    log(LogLevel::info, "pipeline", out.message);
    return out;
  }

  if (out.policy.decision == Decision::suggest) {
    std::lock_guard<std::mutex> lk(commit_mu_);
    for (const auto& rule : get_rule_ids_from_plan(plan)) {
      if (!learning_.record_outcome(rule, Outcome::suggested, out.policy.context_key)) {
        log(LogLevel::debug, "pipeline", "suggested outcome for " + rule + " not persisted");
      }
    }
    out.message = "plan " + plan.id + " suggested, nothing written";
    return out;
  }

  std::map<std::string, std::vector<Edit>> by_file;
  for (const auto& e : plan.edits) by_file[e.file].push_back(e);

  for (const auto& [rel, edits] : by_file) {
    FileCommit c = commit_file(plan, out.policy, rel, edits);
    if (c.error != ErrorCode::none && out.ok()) {
      out.error = c.error;
      out.message = c.message;
    }
    out.files.push_back(std::move(c));
  }
  return out;
}

FileCommit Pipeline::commit_file(const EditPlan& plan, const PolicyResult& policy,
                                 const std::string& rel, const std::vector<Edit>& edits) {
  FileCommit c;
  c.file = rel;
  const std::string abs = resolve(rel);
  const bool is_python = fs::path(rel).extension() == ".py";

  std::lock_guard<std::mutex> file_lock(file_mutex(abs));
  const auto started = std::chrono::steady_clock::now();

  std::string read_error;
  const auto original = read_file_bytes(abs, &read_error);
  if (!original) {
    c.error = ErrorCode::io_error;
    c.message = rel + ": " + read_error;
    log(LogLevel::error, "pipeline", c.message);
    return c;
  }

  if (is_python) {
    const auto parsed = pysyntax::parse(*original);
    if (!parsed.ok()) {
      c.error = ErrorCode::parse_error;
      c.message = rel + ": original does not parse (" + parsed.error->to_string() + ")";
      log(LogLevel::error, "pipeline", c.message);
      return c;
    }
  }

  const TryApplyResult applied =
      try_apply_with_repair(rel, edits, *original, make_guard(config_.strict_guard), run_id_);
  stats_.guard_checks.fetch_add(applied.guard_calls, std::memory_order_relaxed);

  if (applied.report) {
    const RepairReport& report = *applied.report;
    c.repair = report;
    stats_.guard_failures.fetch_add(1, std::memory_order_relaxed);
    stats_.repairs.fetch_add(1, std::memory_order_relaxed);
    stats_.edits_salvaged.fetch_add(report.safe_edits, std::memory_order_relaxed);

    std::string report_error;
    if (!write_repair_report(report, repairs_dir(), &report_error)) {
      log(LogLevel::warn, "pipeline", "repair report for " + rel + " not written: " + report_error);
    }
    jsonlite::Object fields;
    fields["file"] = rel;
    fields["plan_id"] = plan.id;
    fields["report"] = report.to_value();
    emit("repair", std::move(fields));
  }

  if (!applied.success) {
    c.error = ErrorCode::repair_exhausted;
    c.message = rel + ": no edit passed the guard";
    jsonlite::Object fields;
    fields["file"] = rel;
    fields["plan_id"] = plan.id;
    fields["reason"] = applied.report ? applied.report->guard_failure_reason : std::string();
    emit("guard_failed", std::move(fields));
    log(LogLevel::warn, "pipeline", c.message);
    return c;
  }
  c.partial = applied.partial_apply;

  if (is_idempotent_transformation(*original, applied.content)) {
    c.message = rel + ": no change";
    return c;
  }

  std::lock_guard<std::mutex> commit_lock(commit_mu_);
  const std::vector<std::string> rules = get_rule_ids_from_plan(plan);
  const std::string before_sha = sha256_hex(*original);
  const std::string after_sha = sha256_hex(applied.content);

  // The edits were judged against `original`; if the target moved since, the
  // intent would describe bytes that are no longer there.
  if (sha256_file_hex(abs) != before_sha) {
    c.error = ErrorCode::write_conflict;
    c.message = rel + ": changed on disk during commit, file untouched";
    log(LogLevel::warn, "pipeline", c.message);
    return c;
  }

  const std::string backup_key = backups_.put(*original);
  if (backup_key.empty()) {
    log(LogLevel::warn, "pipeline", rel + ": pre-image backup failed, journal copy only");
  }

  ErrorCode logged = journal_.log_intent(abs, before_sha, original->size(), rules, plan.id,
                                         *original, backup_key, policy.context_key);
  if (logged != ErrorCode::none) {
    c.error = logged;
    c.message = rel + ": intent not journaled (" + to_string(logged) + "), file untouched";
    log(LogLevel::error, "pipeline", c.message);
    return c;
  }

  std::string write_error;
  if (!atomic_write(abs, applied.content, &write_error)) {
    c.error = ErrorCode::io_error;
    c.message = rel + ": " + write_error;
    log(LogLevel::error, "pipeline", c.message);
    return c;
  }

  if (sha256_file_hex(abs) != after_sha) {
    stats_.integrity_failures.fetch_add(1, std::memory_order_relaxed);
    c.error = ErrorCode::integrity_failed;
    c.message = rel + ": content on disk does not match the written bytes";
    jsonlite::Object fields;
    fields["file"] = rel;
    fields["message"] = c.message;
    emit("integrity_failure", std::move(fields));
    log(LogLevel::error, "pipeline", c.message);
    return c;
  }

  const Receipt receipt =
      create_receipt(plan.id, rel, *original, applied.content, is_python, !applied.partial_apply,
                     plan.estimated_risk, elapsed_ms(started), policy_hash(config_.policy));
  const std::string rid = receipt_id(receipt);
  logged = journal_.log_success(abs, after_sha, applied.content.size(), rid, &receipt);
  if (logged != ErrorCode::none) {
    // Without a success entry the commit cannot be reverted; put the pre-image back.
    std::string restore_error;
    if (!atomic_write(abs, *original, &restore_error)) {
      log(LogLevel::error, "pipeline", rel + ": restore after journal failure failed: " + restore_error);
    }
    c.error = logged;
    c.message = rel + ": success not journaled (" + to_string(logged) + "), pre-image restored";
    log(LogLevel::error, "pipeline", c.message);
    return c;
  }

  c.committed = true;
  c.receipt = receipt;
  stats_.commits.fetch_add(1, std::memory_order_relaxed);

  for (const auto& rule : rules) {
    if (!learning_.record_outcome(rule, Outcome::applied, policy.context_key, rel)) {
      log(LogLevel::debug, "pipeline", "applied outcome for " + rule + " not persisted");
    }
  }
  if (!index_.add_file(abs)) log(LogLevel::warn, "pipeline", "cannot re-index " + rel);

  jsonlite::Object fields;
  fields["file"] = rel;
  fields["plan_id"] = plan.id;
  fields["receipt_id"] = rid;
  fields["partial"] = applied.partial_apply;
  emit("commit", std::move(fields));
  log(LogLevel::info, "pipeline", "committed " + rel + " (" + rid + ")");
  return c;
}

// ---------------------------------------------------------------------------
// Revert and verification
// ---------------------------------------------------------------------------

RevertOutcome Pipeline::revert_latest() {
  RevertOutcome out;
  std::optional<std::string> latest;
  std::vector<std::unique_lock<std::mutex>> file_locks;
  std::unique_lock<std::mutex> lk;
  // File mutexes come before commit_mu_, as on the commit path. A commit can
  // change which journal is latest, or add a file to it, while we wait; both
  // are re-checked under commit_mu_ and the locks retaken if either moved.
  auto revert_targets = [](const std::string& journal) {
    std::set<std::string> targets;
    for (const auto& ctx : build_revert_plan(journal)) targets.insert(ctx.file);
    return targets;
  };
  for (;;) {
    latest = find_latest_journal(journals_dir());
    if (!latest) {
      log(LogLevel::info, "pipeline", "no journal to revert");
      return out;
    }
    const std::set<std::string> targets = revert_targets(*latest);
    file_locks.clear();
    for (const auto& file : targets) file_locks.emplace_back(file_mutex(file));
    lk = std::unique_lock<std::mutex>(commit_mu_);
    if (find_latest_journal(journals_dir()) == latest && revert_targets(*latest) == targets) break;
    lk.unlock();
  }

  Journal revert_journal(make_run_id(root_), journals_dir());
  out = revert_from_journal(*latest, revert_journal, &backups_);
  revert_journal.close();

  for (const auto& ctx : out.restored) {
    const std::string rel = relative(ctx.file);
    for (const auto& rule : ctx.rule_ids) {
      if (!learning_.record_outcome(rule, Outcome::reverted, ctx.context_key, rel)) {
        log(LogLevel::debug, "pipeline", "reverted outcome for " + rule + " not persisted");
      }
    }
    if (!index_.add_file(ctx.file)) log(LogLevel::warn, "pipeline", "cannot re-index " + rel);
  }
  for (const auto& conflict : out.conflicts) log(LogLevel::warn, "pipeline", "revert conflict: " + conflict);
  for (const auto& err : out.errors) log(LogLevel::error, "pipeline", "revert error: " + err);

  stats_.reverts.fetch_add(out.reverted, std::memory_order_relaxed);
  jsonlite::Object fields;
  fields["journal"] = get_journal_id_from_path(*latest);
  fields["reverted"] = out.reverted;
  fields["conflicts"] = jsonlite::to_array(out.conflicts);
  fields["errors"] = jsonlite::to_array(out.errors);
  emit("revert", std::move(fields));
  return out;
}

std::vector<std::string> Pipeline::verify() {
  std::vector<std::string> failures = verify_receipts(root_);
  stats_.integrity_failures.fetch_add(failures.size(), std::memory_order_relaxed);
  for (const auto& f : failures) {
    jsonlite::Object fields;
    fields["message"] = f;
    emit("integrity_failure", std::move(fields));
  }
  return failures;
}

}  // namespace ace
