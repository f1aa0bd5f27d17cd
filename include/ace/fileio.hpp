#pragma once

// ace/fileio.hpp - Byte-exact file I/O and crash-safe replacement.
//
// DESIGN INVARIANTS:
//   1. Files are read and written as raw bytes. No newline translation, no
//      encoding step; a pre-image restored through atomic_write() is
//      byte-identical to what was captured.
//   2. atomic_write() never exposes a partial file: the temp file lives in the
//      target's directory (same filesystem), is fsynced, then renamed over the
//      target. On every failure path the temp file is unlinked.
//   3. Failures are reported through the return value and an optional
//      `std::string* error`; nothing here throws.

#include <optional>
#include <string>

namespace ace {

// Returns nullopt if the file cannot be opened or read completely.
std::optional<std::string> read_file_bytes(const std::string& path, std::string* error = nullptr);

// Write `data` to `path` atomically. Creates the parent directory if needed.
bool atomic_write(const std::string& path, const std::string& data, std::string* error = nullptr);

// "LF", "CRLF", "CR" or "MIXED". Content without newlines reports "LF".
std::string detect_newline_style(const std::string& content);

// Rewrite every newline in `content` to `style` ("LF" or "CRLF").
std::string normalize_newlines(const std::string& content, const std::string& style);

}  // namespace ace
