#include "ace/pysyntax.hpp"

// Lossless Python tokenizer.
//
// INVARIANT: every input byte lands in exactly one token's text, in order.
// The only tokens with empty text are INDENT, DEDENT, ENDMARKER and a NEWLINE
// synthesized at EOF when the last logical line has no terminator.

#include <array>
#include <cstdio>

namespace ace::pysyntax {

namespace {

constexpr uint32_t kTabSize = 8;
constexpr size_t kMaxIndentLevels = 100;
constexpr size_t kMaxBracketDepth = 200;

// Longest operators first so a greedy scan picks "**=" over "**" over "*".
constexpr std::array<std::string_view, 47> kOperators = {
    "**=", "//=", ">>=", "<<=", "...", "->", ":=", "**", "//", ">>", "<<", "<=",
    ">=",  "==",  "!=",  "+=",  "-=",  "*=", "/=", "%=", "&=", "|=", "^=", "@=",
    "+",   "-",   "*",   "/",   "%",   "@",  "&",  "|",  "^",  "~",  "<",  ">",
    "(",   ")",   "[",   "]",   "{",   "}",  ",",  ":",  ";",  ".",  "=",
};

bool is_digit(unsigned char c) { return c >= '0' && c <= '9'; }
bool is_hex(unsigned char c) {
  return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}
bool is_name_start(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c >= 0x80;
}
bool is_name_char(unsigned char c) { return is_name_start(c) || is_digit(c); }

bool is_string_prefix(std::string_view s) {
  if (s.empty() || s.size() > 2) return false;
  std::string lower;
  for (char c : s) lower += static_cast<char>(c >= 'A' && c <= 'Z' ? c + 32 : c);
  return lower == "r" || lower == "u" || lower == "b" || lower == "f" || lower == "br" ||
         lower == "rb" || lower == "fr" || lower == "rf";
}

bool has_prefix_char(std::string_view prefix, char c) {
  for (char p : prefix) {
    if (p == c || p == c - 32) return true;
  }
  return false;
}

// Keywords that may directly follow a numeric literal ("1if x else 2").
bool may_follow_number(std::string_view word) {
  return word == "and" || word == "else" || word == "for" || word == "if" || word == "in" ||
         word == "is" || word == "not" || word == "or";
}

char closing_for(char open) {
  switch (open) {
    case '(': return ')';
    case '[': return ']';
    default: return '}';
  }
}

class Lexer {
 public:
  explicit Lexer(std::string_view src) : src_(src) {}

  TokenizeResult run() {
    TokenizeResult result;
    if (src_.substr(0, 3) == "\xEF\xBB\xBF") {
      emit(TokenKind::whitespace, 0, 3);
      pos_ = 3;
    }

    bool at_line_start = true;
    while (pos_ < src_.size() && !err_) {
      if (at_line_start) {
        at_line_start = false;
        if (brackets_.empty() && !continuation_) {
          indentation();
          if (err_ || pos_ >= src_.size()) break;
        }
        continuation_ = false;
      }
      at_line_start = step();
    }

    if (!err_) finish();
    result.tokens = std::move(out_);
    result.error = err_;
    return result;
  }

 private:
  struct OpenBracket {
    char ch;
    uint32_t line;
    uint32_t col;
  };

  std::string_view src_;
  size_t pos_{0};
  uint32_t line_{1};
  size_t line_start_{0};
  std::vector<Token> out_;
  std::vector<uint32_t> indents_{0};
  std::vector<OpenBracket> brackets_;
  bool continuation_{false};
  bool line_has_content_{false};
  std::optional<SyntaxError> err_;

  uint32_t col_of(size_t p) const { return static_cast<uint32_t>(p - line_start_); }

  void fail(const std::string& msg, size_t at) {
    if (!err_) err_ = SyntaxError{msg, line_, col_of(at)};
  }

  void emit(TokenKind kind, size_t start, size_t end) {
    Token t;
    t.kind = kind;
    t.text = std::string(src_.substr(start, end - start));
    t.line = line_;
    t.col = col_of(start);
    out_.push_back(std::move(t));
  }

  void emit_significant(TokenKind kind, size_t start, size_t end) {
    emit(kind, start, end);
    line_has_content_ = true;
  }

  void emit_zero_width(TokenKind kind) {
    Token t;
    t.kind = kind;
    t.line = line_;
    t.col = col_of(pos_);
    out_.push_back(std::move(t));
  }

  // Length of the newline sequence at p, 0 if none.
  size_t newline_len(size_t p) const {
    if (p >= src_.size()) return 0;
    if (src_[p] == '\r') return (p + 1 < src_.size() && src_[p + 1] == '\n') ? 2 : 1;
    return src_[p] == '\n' ? 1 : 0;
  }

  void next_line(size_t after_newline) {
    ++line_;
    line_start_ = after_newline;
  }

  // Measures leading whitespace of a logical line and emits INDENT/DEDENT.
  // Blank and comment-only lines leave the indent stack untouched.
  void indentation() {
    const size_t start = pos_;
    uint32_t col = 0;
    while (pos_ < src_.size()) {
      const char c = src_[pos_];
      if (c == ' ') {
        ++col;
      } else if (c == '\t') {
        col = (col / kTabSize + 1) * kTabSize;
      } else if (c == '\f') {
        col = 0;
      } else {
        break;
      }
      ++pos_;
    }
    if (pos_ > start) emit(TokenKind::whitespace, start, pos_);
    if (pos_ >= src_.size()) return;

    const char c = src_[pos_];
    if (c == '#' || c == '\n' || c == '\r') return;

    if (col > indents_.back()) {
      if (indents_.size() >= kMaxIndentLevels) {
        fail("too many levels of indentation", pos_);
        return;
      }
      indents_.push_back(col);
      emit_zero_width(TokenKind::indent);
      return;
    }
    while (col < indents_.back()) {
      indents_.pop_back();
      emit_zero_width(TokenKind::dedent);
    }
    if (col != indents_.back()) fail("unindent does not match any outer indentation level", pos_);
  }

  // Consumes one token. Returns true when the token ended a physical line.
  bool step() {
    const size_t start = pos_;
    const auto c = static_cast<unsigned char>(src_[pos_]);

    if (c == '\0') {
      fail("source code cannot contain null bytes", pos_);
      return false;
    }
    if (c == ' ' || c == '\t' || c == '\f') {
      while (pos_ < src_.size() && (src_[pos_] == ' ' || src_[pos_] == '\t' || src_[pos_] == '\f')) {
        ++pos_;
      }
      emit(TokenKind::whitespace, start, pos_);
      return false;
    }
    if (c == '#') {
      while (pos_ < src_.size() && src_[pos_] != '\n' && src_[pos_] != '\r') ++pos_;
      emit(TokenKind::comment, start, pos_);
      return false;
    }
    if (c == '\\') {
      const size_t nl = newline_len(pos_ + 1);
      if (nl == 0) {
        if (pos_ + 1 >= src_.size()) {
          fail("unexpected EOF while parsing", pos_);
        } else {
          fail("unexpected character after line continuation character", pos_);
        }
        return false;
      }
      pos_ += 1 + nl;
      emit(TokenKind::continuation, start, pos_);
      next_line(pos_);
      continuation_ = true;
      return true;
    }
    if (c == '\n' || c == '\r') {
      pos_ += newline_len(pos_);
      const bool logical = brackets_.empty() && line_has_content_;
      emit(logical ? TokenKind::newline : TokenKind::nl, start, pos_);
      if (logical) line_has_content_ = false;
      next_line(pos_);
      return true;
    }
    if (c == '"' || c == '\'') {
      string_literal(start, start);
      return false;
    }
    if (is_digit(c) || (c == '.' && pos_ + 1 < src_.size() && is_digit(src_[pos_ + 1]))) {
      number();
      return false;
    }
    if (is_name_start(c)) {
      while (pos_ < src_.size() && is_name_char(src_[pos_])) ++pos_;
      const std::string_view word = src_.substr(start, pos_ - start);
      if (pos_ < src_.size() && (src_[pos_] == '"' || src_[pos_] == '\'') && is_string_prefix(word)) {
        string_literal(start, pos_);
        return false;
      }
      emit_significant(TokenKind::name, start, pos_);
      return false;
    }
    return op();
  }

  bool op() {
    const size_t start = pos_;
    for (const auto& candidate : kOperators) {
      if (src_.compare(pos_, candidate.size(), candidate) != 0) continue;
      pos_ += candidate.size();
      if (candidate.size() == 1) bracket(candidate[0], start);
      if (err_) return false;
      emit_significant(TokenKind::op, start, pos_);
      return false;
    }
    const auto c = static_cast<unsigned char>(src_[pos_]);
    char buf[64];
    if (c >= 0x20 && c < 0x7f) {
      std::snprintf(buf, sizeof(buf), "invalid character '%c' (U+%04X)", c, c);
    } else {
      std::snprintf(buf, sizeof(buf), "invalid non-printable character U+%04X", c);
    }
    fail(buf, pos_);
    return false;
  }

  void bracket(char c, size_t at) {
    if (c == '(' || c == '[' || c == '{') {
      if (brackets_.size() >= kMaxBracketDepth) {
        fail("too many nested parentheses", at);
        return;
      }
      brackets_.push_back(OpenBracket{c, line_, col_of(at)});
      return;
    }
    if (c != ')' && c != ']' && c != '}') return;
    if (brackets_.empty()) {
      fail(std::string("unmatched '") + c + "'", at);
      return;
    }
    const char open = brackets_.back().ch;
    if (closing_for(open) != c) {
      fail(std::string("closing parenthesis '") + c + "' does not match opening parenthesis '" +
               open + "'",
           at);
      return;
    }
    brackets_.pop_back();
  }

  // Scans a string literal whose prefix starts at `start` and whose opening
  // quote is at `quote_pos`. f-string replacement fields may contain nested
  // strings using the same quote character.
  void string_literal(size_t start, size_t quote_pos) {
    const std::string_view prefix = src_.substr(start, quote_pos - start);
    const bool is_f = has_prefix_char(prefix, 'f');
    const uint32_t start_line = line_;
    const size_t start_line_start = line_start_;
    pos_ = quote_pos;
    if (!string_body(is_f)) {
      if (err_) {
        err_->line = start_line;
        err_->col = static_cast<uint32_t>(start - start_line_start);
      }
      return;
    }
    // A multi-line string is reported at the line it starts on.
    Token t;
    t.kind = TokenKind::string;
    t.text = std::string(src_.substr(start, pos_ - start));
    t.line = start_line;
    t.col = static_cast<uint32_t>(start - start_line_start);
    out_.push_back(std::move(t));
    line_has_content_ = true;
  }

  bool string_body(bool is_f) {
    const char quote = src_[pos_];
    const bool triple = pos_ + 2 < src_.size() && src_[pos_ + 1] == quote && src_[pos_ + 2] == quote;
    pos_ += triple ? 3 : 1;

    int depth = 0;
    while (true) {
      if (pos_ >= src_.size()) {
        fail(triple ? "unterminated triple-quoted string literal" : "unterminated string literal",
             pos_);
        return false;
      }
      const char c = src_[pos_];
      if (c == '\0') {
        fail("source code cannot contain null bytes", pos_);
        return false;
      }
      if (c == '\\') {
        const size_t nl = newline_len(pos_ + 1);
        if (nl > 0) {
          pos_ += 1 + nl;
          next_line(pos_);
        } else {
          pos_ += (pos_ + 1 < src_.size()) ? 2 : 1;
        }
        continue;
      }
      if (c == '\n' || c == '\r') {
        if (!triple && depth == 0) {
          fail("unterminated string literal", pos_);
          return false;
        }
        pos_ += newline_len(pos_);
        next_line(pos_);
        continue;
      }
      if (is_f) {
        if (c == '{') {
          if (depth == 0 && pos_ + 1 < src_.size() && src_[pos_ + 1] == '{') {
            pos_ += 2;
          } else {
            ++depth;
            ++pos_;
          }
          continue;
        }
        if (c == '}') {
          if (depth == 0) {
            pos_ += (pos_ + 1 < src_.size() && src_[pos_ + 1] == '}') ? 2 : 1;
          } else {
            --depth;
            ++pos_;
          }
          continue;
        }
        if (depth > 0 && (c == '"' || c == '\'')) {
          if (!string_body(false)) return false;
          continue;
        }
      }
      if (c == quote && depth == 0) {
        if (!triple) {
          ++pos_;
          return true;
        }
        if (pos_ + 2 < src_.size() && src_[pos_ + 1] == quote && src_[pos_ + 2] == quote) {
          pos_ += 3;
          return true;
        }
      }
      ++pos_;
    }
  }

  // Digits of the given class with single underscores allowed between them.
  // Returns false on a misplaced underscore.
  template <typename Pred>
  bool digits(Pred pred, bool require_one) {
    const size_t start = pos_;
    while (pos_ < src_.size()) {
      if (pred(static_cast<unsigned char>(src_[pos_]))) {
        ++pos_;
      } else if (src_[pos_] == '_' && pos_ > start && pos_ + 1 < src_.size() &&
                 pred(static_cast<unsigned char>(src_[pos_ + 1]))) {
        ++pos_;
      } else {
        break;
      }
    }
    if (pos_ < src_.size() && src_[pos_] == '_') return false;
    return !require_one || pos_ > start;
  }

  void number() {
    const size_t start = pos_;
    const auto bad = [&](const char* kind) {
      fail(std::string("invalid ") + kind + " literal", start);
    };

    if (src_[pos_] == '0' && pos_ + 1 < src_.size()) {
      const char k = src_[pos_ + 1];
      if (k == 'x' || k == 'X' || k == 'o' || k == 'O' || k == 'b' || k == 'B') {
        pos_ += 2;
        if (pos_ < src_.size() && src_[pos_] == '_') ++pos_;
        bool ok = false;
        const char* kind = "hexadecimal";
        if (k == 'x' || k == 'X') {
          ok = digits(is_hex, true);
        } else if (k == 'o' || k == 'O') {
          kind = "octal";
          ok = digits([](unsigned char d) { return d >= '0' && d <= '7'; }, true);
        } else {
          kind = "binary";
          ok = digits([](unsigned char d) { return d == '0' || d == '1'; }, true);
        }
        if (!ok || (pos_ < src_.size() && is_digit(src_[pos_]))) {
          bad(kind);
          return;
        }
        finish_number(start, kind);
        return;
      }
    }

    bool is_int = true;
    if (src_[pos_] != '.') {
      if (!digits(is_digit, true)) {
        bad("decimal");
        return;
      }
    }
    if (pos_ < src_.size() && src_[pos_] == '.') {
      is_int = false;
      ++pos_;
      if (!digits(is_digit, false)) {
        bad("decimal");
        return;
      }
    }
    if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
      const size_t save = pos_;
      ++pos_;
      if (pos_ < src_.size() && (src_[pos_] == '+' || src_[pos_] == '-')) ++pos_;
      if (pos_ < src_.size() && is_digit(src_[pos_])) {
        is_int = false;
        if (!digits(is_digit, true)) {
          bad("decimal");
          return;
        }
      } else {
        pos_ = save;
      }
    }
    if (pos_ < src_.size() && (src_[pos_] == 'j' || src_[pos_] == 'J')) {
      is_int = false;
      ++pos_;
    }

    if (is_int) {
      const std::string_view text = src_.substr(start, pos_ - start);
      if (text.size() > 1 && text[0] == '0') {
        for (char d : text) {
          if (d != '0' && d != '_') {
            fail("leading zeros in decimal integer literals are not permitted; "
                 "use an 0o prefix for octal integers",
                 start);
            return;
          }
        }
      }
    }
    finish_number(start, "decimal");
  }

  void finish_number(size_t start, const char* kind) {
    if (pos_ < src_.size() && is_name_start(src_[pos_])) {
      size_t end = pos_;
      while (end < src_.size() && is_name_char(src_[end])) ++end;
      if (!may_follow_number(src_.substr(pos_, end - pos_))) {
        fail(std::string("invalid ") + kind + " literal", start);
        return;
      }
    }
    emit_significant(TokenKind::number, start, pos_);
  }

  void finish() {
    if (continuation_) {
      fail("unexpected EOF while parsing", pos_);
      return;
    }
    if (!brackets_.empty()) {
      const auto& b = brackets_.back();
      err_ = SyntaxError{std::string("'") + b.ch + "' was never closed", b.line, b.col};
      return;
    }
    if (line_has_content_) emit_zero_width(TokenKind::newline);
    while (indents_.size() > 1) {
      indents_.pop_back();
      emit_zero_width(TokenKind::dedent);
    }
    emit_zero_width(TokenKind::endmarker);
  }
};

}  // namespace

const char* to_string(TokenKind kind) {
  switch (kind) {
    case TokenKind::name: return "NAME";
    case TokenKind::number: return "NUMBER";
    case TokenKind::string: return "STRING";
    case TokenKind::op: return "OP";
    case TokenKind::newline: return "NEWLINE";
    case TokenKind::nl: return "NL";
    case TokenKind::comment: return "COMMENT";
    case TokenKind::whitespace: return "WS";
    case TokenKind::continuation: return "CONTINUATION";
    case TokenKind::indent: return "INDENT";
    case TokenKind::dedent: return "DEDENT";
    case TokenKind::endmarker: return "ENDMARKER";
  }
  return "?";
}

std::string SyntaxError::to_string() const {
  return "line " + std::to_string(line) + ", col " + std::to_string(col) + ": " + message;
}

TokenizeResult tokenize(std::string_view source) { return Lexer(source).run(); }

std::string render(const std::vector<Token>& tokens) {
  size_t total = 0;
  for (const auto& t : tokens) total += t.text.size();
  std::string out;
  out.reserve(total);
  for (const auto& t : tokens) out += t.text;
  return out;
}

}  // namespace ace::pysyntax
