#pragma once

// ace/observability.hpp - Diagnostic logging, structured pipeline events and
// pipeline counters.
//
// DESIGN:
//   Three separate channels, none of which may block or fail the pipeline:
//     - log(): human diagnostics on stderr as "[ace:<component>] <msg>",
//       filtered by level. Level comes from ACE_LOG_LEVEL (default warn) and
//       can be overridden with set_log_level().
//     - EventSink: one compact JSON object per line, appended to a file
//       configured by AceConfig::event_log_path or ACE_EVENT_LOG. Emission
//       failures are counted, never raised.
//     - PipelineStats: atomic counters owned by the Pipeline instance. There
//       is no process-wide stats object.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "ace/jsonlite.hpp"

namespace ace {

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

enum class LogLevel { error = 0, warn = 1, info = 2, debug = 3 };

// "error" | "warn" | "info" | "debug"; anything else yields warn.
LogLevel log_level_from_string(const std::string& s);

void set_log_level(LogLevel level);
LogLevel current_log_level();

void log(LogLevel level, const std::string& component, const std::string& message);

// ---------------------------------------------------------------------------
// PipelineStats
// ---------------------------------------------------------------------------
// Thread-safe. Counters may be bumped from analysis workers and from the
// commit path concurrently.
class PipelineStats {
 public:
  alignas(64) std::atomic<uint64_t> plans_scored{0};
  alignas(64) std::atomic<uint64_t> plans_auto{0};
  alignas(64) std::atomic<uint64_t> plans_suggest{0};
  alignas(64) std::atomic<uint64_t> plans_deny{0};

  alignas(64) std::atomic<uint64_t> guard_checks{0};
  alignas(64) std::atomic<uint64_t> guard_failures{0};

  alignas(64) std::atomic<uint64_t> repairs{0};
  alignas(64) std::atomic<uint64_t> edits_salvaged{0};

  alignas(64) std::atomic<uint64_t> commits{0};
  alignas(64) std::atomic<uint64_t> reverts{0};
  alignas(64) std::atomic<uint64_t> integrity_failures{0};
  alignas(64) std::atomic<uint64_t> sink_failures{0};

  alignas(64) std::atomic<uint64_t> files_analyzed{0};
  alignas(64) std::atomic<uint64_t> files_skipped{0};

  // {policy: {scored, auto, suggest, deny}, guard: {checks, failures,
  // pass_rate}, repairs, edits_salvaged, commits, reverts, ...}
  jsonlite::Value to_value() const;
};

// ---------------------------------------------------------------------------
// EventSink - JSONL structured events
// ---------------------------------------------------------------------------
class EventSink {
 public:
  // Empty path disables the sink; emit() then succeeds without writing.
  explicit EventSink(std::string path = "");

  // Appends {"event": name, "ts_ms": <unix ms>, ...fields} as one line.
  // Returns false if the line could not be written.
  bool emit(const std::string& name, jsonlite::Object fields);

  bool enabled() const { return !path_.empty(); }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::mutex mu_;
};

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ms;
  explicit ScopeTimer(uint64_t& out) : out_ms(out) {}
  ~ScopeTimer() {
    out_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count());
  }
};

uint64_t unix_time_ms();

// ISO-8601 UTC with millisecond precision and a Z suffix,
// e.g. 2024-05-01T12:30:45.123Z
std::string iso8601_utc_ms();

}  // namespace ace
