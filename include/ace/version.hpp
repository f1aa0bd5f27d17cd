#pragma once

// ace/version.hpp - Explicit version manifest for every on-disk format.
//
// PURPOSE:
//   Prevent silent format drift across the journal, receipt, learning, index
//   and backup-store layers. Every component that writes a versioned format
//   stamps its constant from here.
//
// INVARIANT:
//   All version constants are compile-time. Readers accept documents that
//   carry no version field (treated as version 1) and reject nothing else
//   silently: a newer version than compiled in is reported by
//   check_format_version().

#include <cstdint>
#include <string>

namespace ace {
namespace version {

constexpr const char* ENGINE_SEMVER = "0.4.0";

// ---------------------------------------------------------------------------
// JOURNAL_FORMAT_VERSION
// One JSON object per line, {type: intent|success|revert, ...}.
// Adding or removing required fields in any entry type requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t JOURNAL_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// RECEIPT_FORMAT_VERSION
// Field set of Receipt::to_value(). receipt_id() hashes that JSON, so any
// field change alters every id and requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t RECEIPT_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// LEARN_FORMAT_VERSION
// .ace/learn.json: {rules, contexts, tuning, auto_skiplist}.
// ---------------------------------------------------------------------------
constexpr uint32_t LEARN_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// INDEX_FORMAT_VERSION
// .ace/index.json: {entries: {abs_path: {size, sha256, clean_runs_count}}}.
// ---------------------------------------------------------------------------
constexpr uint32_t INDEX_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// BACKUP_FORMAT_VERSION
// Backup store layout: objects/AB/CD/<64-char-digest> with a JSON .meta
// sidecar. Changing the shard depth or the key domain requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t BACKUP_FORMAT_VERSION = 1;

// Returns false and fills *error when `found` is newer than `supported`.
// A missing version (0) is accepted as version 1.
bool check_format_version(const std::string& format, uint64_t found, uint32_t supported,
                          std::string* error);

}  // namespace version
}  // namespace ace
