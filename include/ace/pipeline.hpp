#pragma once

// ace/pipeline.hpp - Run context tying analysis, policy, guarded commit,
// journaling, receipts, learning and the content index together.
//
// DESIGN:
//   One Pipeline per run. It owns every long-lived collaborator (stats,
//   event sink, learning engine, content index, backup store, journal) and
//   hands them to each stage by reference. Nothing here is process-global.
//
// CONCURRENCY:
//   analyze() fans out over a std::thread pool. Analyzers only produce
//   findings and never touch the journal, index or learning state. Their
//   output is merged and sorted by (file, line, rule), so any job count yields
//   byte-identical findings_to_json() output.
//   apply_plan() and revert_latest() may be called from several threads.
//   Each target file is serialized by its own mutex; journal, receipt,
//   learning and index updates are serialized by one commit mutex. File
//   mutexes are always taken before the commit mutex, several at once only in
//   path order. A commit whose target changed after it was read fails with
//   write_conflict.
//
// COMMIT PATH (per file of an approved plan):
//   read original -> parse original (failure: operational error, no journal)
//   -> guard + bisection repair -> re-hash target -> backup pre-image -> log_intent
//   -> atomic_write -> verify after hash -> receipt -> log_success
//   -> learning outcome -> index update
//
// PATHS: plan file paths are relative to the root. The journal records
// absolute paths; receipts and learning keep the root-relative form.

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ace/backup_store.hpp"
#include "ace/config.hpp"
#include "ace/content_index.hpp"
#include "ace/journal.hpp"
#include "ace/learn.hpp"
#include "ace/observability.hpp"
#include "ace/policy.hpp"
#include "ace/receipts.hpp"
#include "ace/repair.hpp"
#include "ace/types.hpp"

namespace ace {

// Findings producer. Must be safe to call concurrently for distinct files.
class IAnalyzer {
 public:
  virtual ~IAnalyzer() = default;
  virtual std::vector<Finding> analyze(const std::string& file) const = 0;
};

struct FileCommit {
  std::string file;
  bool committed{false};
  bool partial{false};
  std::optional<Receipt> receipt;
  std::optional<RepairReport> repair;
  ErrorCode error{ErrorCode::none};
  std::string message;
};

struct ApplyOutcome {
  PolicyResult policy;
  std::vector<FileCommit> files;  // sorted by file
  ErrorCode error{ErrorCode::none};  // first failure, policy_denied on deny
  std::string message;

  bool ok() const { return error == ErrorCode::none; }
  uint64_t committed() const;
};

class Pipeline {
 public:
  // State lives under <root>/.ace. Throws std::filesystem::filesystem_error
  // when the state directories cannot be created.
  Pipeline(std::string root, AceConfig config);
  ~Pipeline();

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  // jobs == 0 uses config().jobs.
  std::vector<Finding> analyze(const std::vector<std::string>& files, const IAnalyzer& analyzer,
                               uint64_t jobs = 0);

  // Indexable files that changed or have not yet been clean for
  // clean_run_threshold consecutive passes.
  std::vector<std::string> select_files_for_scan(const std::vector<std::string>& files);
  void record_scan_result(const std::string& file, std::size_t finding_count);

  PolicyResult score(const EditPlan& plan);
  ApplyOutcome apply_plan(const EditPlan& plan);

  // Reverts the most recent journal under .ace/journals.
  RevertOutcome revert_latest();

  // Receipt integrity over every journal. Empty means clean.
  std::vector<std::string> verify();

  // Persists the index and closes the journal. Called by the destructor.
  bool close(std::string* error = nullptr);

  const std::string& root() const { return root_; }
  const std::string& run_id() const { return run_id_; }
  const AceConfig& config() const { return config_; }
  std::string state_dir() const;
  std::string journals_dir() const;
  std::string repairs_dir() const;

  PipelineStats& stats() { return stats_; }
  LearningEngine& learning() { return learning_; }
  ContentIndex& index() { return index_; }
  BackupStore& backups() { return backups_; }
  Journal& journal() { return journal_; }

 private:
  FileCommit commit_file(const EditPlan& plan, const PolicyResult& policy,
                         const std::string& rel, const std::vector<Edit>& edits);
  std::mutex& file_mutex(const std::string& abs);
  std::string resolve(const std::string& rel) const;
  std::string relative(const std::string& abs) const;
  void emit(const std::string& name, jsonlite::Object fields);

  std::string root_;
  AceConfig config_;
  std::string run_id_;
  PipelineStats stats_;
  EventSink events_;
  LearningEngine learning_;
  ContentIndex index_;
  BackupStore backups_;
  Journal journal_;

  std::mutex commit_mu_;
  std::mutex files_mu_;
  std::map<std::string, std::unique_ptr<std::mutex>> file_locks_;
  bool closed_{false};
};

// Sorted by finding_less, compact JSON array. Byte-stable for equal input.
std::string findings_to_json(std::vector<Finding> findings);

// fingerprint("run:", root + wall clock + pid + per-process counter)
std::string make_run_id(const std::string& root);

}  // namespace ace
