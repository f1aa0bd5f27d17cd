#include "ace/edits.hpp"

#include <algorithm>
#include <tuple>

#include "ace/fileio.hpp"

namespace ace {

namespace {

// Splits into lines, each keeping its terminator (\n, \r\n or \r).
std::vector<std::string> split_lines(const std::string& content) {
  std::vector<std::string> lines;
  std::string cur;
  for (size_t i = 0; i < content.size(); ++i) {
    const char c = content[i];
    cur += c;
    if (c == '\n' || (c == '\r' && (i + 1 >= content.size() || content[i + 1] != '\n'))) {
      lines.push_back(std::move(cur));
      cur.clear();
    }
  }
  if (!cur.empty()) lines.push_back(std::move(cur));
  return lines;
}

bool ends_with_newline(const std::string& s) {
  return !s.empty() && (s.back() == '\n' || s.back() == '\r');
}

bool is_insert(const Edit& e) { return e.end_line + 1 == e.start_line; }

std::string describe(const Edit& e) {
  return e.op + "[" + std::to_string(e.start_line) + "," + std::to_string(e.end_line) + "]";
}

}  // namespace

std::vector<Edit> sort_edits(std::vector<Edit> edits) {
  std::stable_sort(edits.begin(), edits.end(), [](const Edit& a, const Edit& b) {
    return std::tie(a.start_line, a.end_line, a.op, a.payload, a.file) <
           std::tie(b.start_line, b.end_line, b.op, b.payload, b.file);
  });
  return edits;
}

bool check_edit_overlap(const Edit& a, const Edit& b) {
  const bool ai = is_insert(a);
  const bool bi = is_insert(b);
  if (ai && bi) return a.start_line == b.start_line;
  if (ai) return b.start_line < a.start_line && a.start_line <= b.end_line;
  if (bi) return a.start_line < b.start_line && b.start_line <= a.end_line;
  return std::max(a.start_line, b.start_line) <= std::min(a.end_line, b.end_line);
}

bool validate_non_overlapping(const std::vector<Edit>& edits, std::string* error) {
  for (size_t i = 0; i < edits.size(); ++i) {
    for (size_t j = i + 1; j < edits.size(); ++j) {
      if (check_edit_overlap(edits[i], edits[j])) {
        if (error) *error = "edits " + describe(edits[i]) + " and " + describe(edits[j]) + " overlap";
        return false;
      }
    }
  }
  return true;
}

std::size_t count_lines(const std::string& content) { return split_lines(content).size(); }

ApplyEditsResult apply_edits(const std::string& original, const std::vector<Edit>& edits,
                             const std::vector<std::size_t>& indices) {
  ApplyEditsResult r;
  const auto lines = split_lines(original);
  const uint64_t n = lines.size();

  std::vector<const Edit*> chosen;
  chosen.reserve(indices.size());
  for (size_t idx : indices) {
    if (idx >= edits.size()) {
      r.error = ErrorCode::edit_out_of_range;
      r.message = "edit index " + std::to_string(idx) + " out of range";
      return r;
    }
    const Edit& e = edits[idx];
    if (e.start_line < 1 || e.end_line + 1 < e.start_line || e.end_line > n) {
      r.error = ErrorCode::edit_out_of_range;
      r.message = describe(e) + " outside 1.." + std::to_string(n);
      return r;
    }
    if (e.op != "replace" && e.op != "insert" && e.op != "delete") {
      r.error = ErrorCode::edit_out_of_range;
      r.message = "unknown edit op " + e.op;
      return r;
    }
    if (!chosen.empty() && check_edit_overlap(*chosen.back(), e)) {
      r.error = ErrorCode::edit_overlap;
      r.message = describe(*chosen.back()) + " overlaps " + describe(e);
      return r;
    }
    chosen.push_back(&e);
  }

  const std::string style = detect_newline_style(original);
  const std::string eol = style == "CRLF" ? "\r\n" : (style == "CR" ? "\r" : "\n");

  std::string out;
  out.reserve(original.size());
  uint64_t next_line = 1;  // first original line not yet copied
  for (const Edit* e : chosen) {
    for (; next_line < e->start_line; ++next_line) out += lines[next_line - 1];

    if (e->op != "delete" && !e->payload.empty()) {
      std::string payload = e->payload;
      if (style == "LF" || style == "CRLF") payload = normalize_newlines(payload, style);
      // The last original line may lack a terminator; edits touching the end
      // of the file keep that property.
      const bool at_unterminated_end = e->end_line == n && n > 0 && !ends_with_newline(lines[n - 1]);
      if (at_unterminated_end && is_insert(*e)) out += eol;
      if (!ends_with_newline(payload) && !at_unterminated_end) payload += eol;
      out += payload;
    }
    next_line = std::max(next_line, e->end_line + 1);
  }
  for (; next_line <= n; ++next_line) out += lines[next_line - 1];

  r.content = std::move(out);
  return r;
}

}  // namespace ace
