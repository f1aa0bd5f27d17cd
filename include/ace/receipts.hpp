#pragma once

// ace/receipts.hpp - Hash-sealed proof that a plan produced specific content.
//
// INVARIANTS:
//   1. before_hash and after_hash are raw SHA-256 hex, never prefixed.
//   2. A receipt is created once per applied plan and never modified.
//   3. receipt_id() is a BLAKE3 fingerprint of the canonical receipt JSON,
//      so the id changes whenever any sealed field changes.
//   4. A mismatch found by verify_receipts() is reported, never repaired.

#include <cstdint>
#include <string>
#include <vector>

#include "ace/jsonlite.hpp"

namespace ace {

struct Receipt {
  std::string plan_id;
  std::string file;
  std::string before_hash;
  std::string after_hash;
  bool parse_valid{false};
  bool invariants_met{false};
  double estimated_risk{0.0};
  uint64_t duration_ms{0};
  std::string timestamp;    // ISO-8601 UTC, millisecond precision, Z suffix
  std::string policy_hash;  // omitted from JSON when empty

  jsonlite::Value to_value() const;
  static Receipt from_value(const jsonlite::Value& v);
};

Receipt create_receipt(const std::string& plan_id, const std::string& file,
                       const std::string& before_content, const std::string& after_content,
                       bool parse_valid, bool invariants_met, double estimated_risk,
                       uint64_t duration_ms, const std::string& policy_hash = "");

bool verify_receipt(const Receipt& receipt, const std::string& current_content);

bool is_idempotent_transformation(const std::string& before, const std::string& after);

// 16 hex chars, domain "rcpt:".
std::string receipt_id(const Receipt& receipt);

// Scans <root>/.ace/journals/*.jsonl (sorted by name) for success entries that
// embed a receipt and checks each referenced file. Returns one message per
// failure, e.g.
//   "<journal>:<line> - File no longer exists: <file>"
//   "<journal>:<line> - Hash mismatch for <file> (expected 1a2b3c4d...)"
//   "<journal>:<line> - Invalid JSON"
// A receipt whose commit was undone by a journal `revert` entry (same file,
// from_sha == after_hash) is not checked.
std::vector<std::string> verify_receipts(const std::string& root_dir);

}  // namespace ace
