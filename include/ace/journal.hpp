#pragma once

// ace/journal.hpp - Append-only per-run journal and the revert executor.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: the file is opened O_APPEND; entries are never modified
//      or deleted.
//   2. DURABLE: every entry is fsynced before the log call returns.
//   3. WRITE-AHEAD: log_intent() for a file precedes any byte written to it
//      and carries the full pre-image.
//   4. CHAINED: each line carries `seq` (1-based, strictly increasing) and
//      `prev`, the BLAKE3 ("jnl:" domain) of the previous line's text. The
//      first line's prev is 64 zeros. verify_journal_chain() detects edits,
//      deletions and reordering.
//   5. CLOSED IS FINAL: after close() every log call fails with
//      ErrorCode::journal_closed and writes nothing.
//
// LOCATION: <root>/.ace/journals/<run_id>.jsonl

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ace/jsonlite.hpp"
#include "ace/receipts.hpp"
#include "ace/types.hpp"

namespace ace {

class BackupStore;

enum class JournalEntryType { intent, success, revert, unknown };

std::string to_string(JournalEntryType t);

struct JournalEntry {
  JournalEntryType type{JournalEntryType::unknown};
  uint64_t seq{0};
  std::string prev;
  std::string timestamp;
  std::string file;

  // intent
  std::string before_sha;
  uint64_t before_size{0};
  std::vector<std::string> rule_ids;  // sorted
  std::string plan_id;
  std::string pre_image;
  std::string backup_key;  // empty when no backup store was used
  std::string context_key;

  // success
  std::string after_sha;
  uint64_t after_size{0};
  std::string receipt_id;
  std::optional<Receipt> receipt;

  // revert
  std::string from_sha;
  std::string to_sha;
  std::string reason;

  jsonlite::Value to_value() const;
  static JournalEntry from_value(const jsonlite::Value& v);
};

class Journal {
 public:
  // Creates `dir` if needed. Throws std::filesystem::filesystem_error when it
  // cannot. The file itself is opened on the first entry.
  Journal(std::string run_id, std::string dir);
  ~Journal();

  Journal(const Journal&) = delete;
  Journal& operator=(const Journal&) = delete;

  ErrorCode log_intent(const std::string& file, const std::string& before_sha,
                       uint64_t before_size, std::vector<std::string> rule_ids,
                       const std::string& plan_id, const std::string& pre_image,
                       const std::string& backup_key = "",
                       const std::string& context_key = "");

  ErrorCode log_success(const std::string& file, const std::string& after_sha,
                        uint64_t after_size, const std::string& receipt_id,
                        const Receipt* receipt = nullptr);

  ErrorCode log_revert(const std::string& file, const std::string& from_sha,
                       const std::string& to_sha, const std::string& reason);

  void close();
  bool closed() const;

  const std::string& run_id() const { return run_id_; }
  const std::string& path() const { return path_; }
  uint64_t entry_count() const;

 private:
  ErrorCode append(JournalEntry entry);

  std::string run_id_;
  std::string path_;
  mutable std::mutex mu_;
  int fd_{-1};
  bool closed_{false};
  uint64_t seq_{0};
  std::string last_digest_;
};

// Entries in file order. A missing file yields an empty list. Lines that do
// not parse are skipped with a warning.
std::vector<JournalEntry> read_journal(const std::string& path);

// Returns false with *error naming the first broken line.
bool verify_journal_chain(const std::string& path, std::string* error = nullptr);

struct RevertContext {
  std::string file;
  std::string expected_current_sha;
  std::string original_sha;
  std::string restore_content;
  std::string plan_id;
  std::vector<std::string> rule_ids;
  std::string backup_key;
  std::string context_key;
};

// Pairs each intent with the following success for the same file. Intent-only
// files are left out. Most recent commit first.
std::vector<RevertContext> build_revert_plan(const std::string& path);

// Newest *.jsonl in `dir` by modification time, ties broken by name.
std::optional<std::string> find_latest_journal(const std::string& dir);

std::string get_journal_id_from_path(const std::string& path);

struct RevertOutcome {
  uint64_t reverted{0};
  std::vector<RevertContext> restored;  // restore_content cleared
  std::vector<std::string> conflicts;  // file changed since commit; left untouched
  std::vector<std::string> errors;

  bool ok() const { return conflicts.empty() && errors.empty(); }
};

// Restores every committed file of `journal_path` whose current SHA-256 still
// equals the recorded after_sha. Each restore is logged to `revert_journal`.
// `backups` may be null; it is consulted when a journal pre-image does not
// hash to its before_sha.
RevertOutcome revert_from_journal(const std::string& journal_path, Journal& revert_journal,
                                  const BackupStore* backups);

}  // namespace ace
