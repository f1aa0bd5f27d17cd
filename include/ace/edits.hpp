#pragma once

// ace/edits.hpp - Line-range edit application.
//
// Edits address the ORIGINAL content. A subset is applied in one pass, so the
// line numbers of one edit never shift because of another. Payload newlines
// are rewritten to the file's newline style (LF or CRLF; CR and mixed files
// keep payloads as given).

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "ace/types.hpp"

namespace ace {

// Sort by (start_line, end_line), then op, payload and file, so the result does
// not depend on submission order. The only ordering the repair engine ever uses.
std::vector<Edit> sort_edits(std::vector<Edit> edits);

// True when the two edits touch a common line, or when an insert point falls
// inside the other edit's range, or both insert at the same point.
bool check_edit_overlap(const Edit& a, const Edit& b);

// Returns false and fills *error (naming the first overlapping pair) if any
// two edits overlap.
bool validate_non_overlapping(const std::vector<Edit>& edits, std::string* error = nullptr);

struct ApplyEditsResult {
  std::string content;
  ErrorCode error{ErrorCode::none};
  std::string message;

  bool ok() const { return error == ErrorCode::none; }
};

// Applies edits[i] for every i in `indices` to `original`. `edits` must be
// sorted; `indices` ascending. Fails with edit_out_of_range or edit_overlap.
ApplyEditsResult apply_edits(const std::string& original, const std::vector<Edit>& edits,
                             const std::vector<std::size_t>& indices);

// Number of lines as the editor sees them; a trailing newline does not start
// a new line.
std::size_t count_lines(const std::string& content);

}  // namespace ace
