#include "ace/observability.hpp"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>

namespace ace {

namespace {

LogLevel level_from_env() {
  const char* env = std::getenv("ACE_LOG_LEVEL");
  if (!env || !env[0]) return LogLevel::warn;
  return log_level_from_string(env);
}

std::atomic<int>& log_level_slot() {
  static std::atomic<int> level{static_cast<int>(level_from_env())};
  return level;
}

const char* level_tag(LogLevel level) {
  switch (level) {
    case LogLevel::error: return "error";
    case LogLevel::warn: return "warn";
    case LogLevel::info: return "info";
    case LogLevel::debug: return "debug";
  }
  return "warn";
}

std::mutex& stderr_mutex() {
  static std::mutex mu;
  return mu;
}

}  // namespace

LogLevel log_level_from_string(const std::string& s) {
  if (s == "error") return LogLevel::error;
  if (s == "info") return LogLevel::info;
  if (s == "debug") return LogLevel::debug;
  return LogLevel::warn;
}

void set_log_level(LogLevel level) {
  log_level_slot().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel current_log_level() {
  return static_cast<LogLevel>(log_level_slot().load(std::memory_order_relaxed));
}

void log(LogLevel level, const std::string& component, const std::string& message) {
  if (static_cast<int>(level) > log_level_slot().load(std::memory_order_relaxed)) return;
  std::lock_guard<std::mutex> lk(stderr_mutex());
  std::cerr << "[ace:" << component << "] " << level_tag(level) << ": " << message << "\n";
}

// ---------------------------------------------------------------------------
// PipelineStats
// ---------------------------------------------------------------------------

jsonlite::Value PipelineStats::to_value() const {
  auto get = [](const std::atomic<uint64_t>& a) {
    return jsonlite::Value{static_cast<std::uint64_t>(a.load(std::memory_order_relaxed))};
  };
  jsonlite::Object policy;
  policy["scored"] = get(plans_scored);
  policy["auto"] = get(plans_auto);
  policy["suggest"] = get(plans_suggest);
  policy["deny"] = get(plans_deny);

  jsonlite::Object guard;
  guard["checks"] = get(guard_checks);
  guard["failures"] = get(guard_failures);
  const uint64_t checks = guard_checks.load(std::memory_order_relaxed);
  const uint64_t failures = guard_failures.load(std::memory_order_relaxed);
  guard["pass_rate"] = checks > 0
      ? static_cast<double>(checks - failures) / static_cast<double>(checks)
      : 0.0;

  jsonlite::Object o;
  o["policy"] = std::move(policy);
  o["guard"] = std::move(guard);
  o["repairs"] = get(repairs);
  o["edits_salvaged"] = get(edits_salvaged);
  o["commits"] = get(commits);
  o["reverts"] = get(reverts);
  o["integrity_failures"] = get(integrity_failures);
  o["sink_failures"] = get(sink_failures);
  o["files_analyzed"] = get(files_analyzed);
  o["files_skipped"] = get(files_skipped);
  return o;
}

// ---------------------------------------------------------------------------
// EventSink
// ---------------------------------------------------------------------------

EventSink::EventSink(std::string path) : path_(std::move(path)) {}

bool EventSink::emit(const std::string& name, jsonlite::Object fields) {
  if (path_.empty()) return true;

  fields["event"] = name;
  fields["ts_ms"] = unix_time_ms();
  const std::string line = jsonlite::to_json(fields) + "\n";

  std::lock_guard<std::mutex> lk(mu_);
  FILE* f = std::fopen(path_.c_str(), "a");
  if (!f) return false;
  const bool written = std::fwrite(line.data(), 1, line.size(), f) == line.size();
  const bool closed = std::fclose(f) == 0;
  return written && closed;
}

// ---------------------------------------------------------------------------
// Time helpers
// ---------------------------------------------------------------------------

uint64_t unix_time_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());
}

std::string iso8601_utc_ms() {
  const uint64_t ms = unix_time_ms();
  const std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
                tm.tm_sec, static_cast<unsigned>(ms % 1000));
  return buf;
}

}  // namespace ace
