#pragma once

// ace/pysyntax.hpp - Python 3 syntax front-end used by the guard.
//
// Two views of one source text:
//
//   Concrete: tokenize() yields every byte of the input inside some token,
//   including whitespace, comments, line continuations and non-logical
//   newlines. INDENT, DEDENT and ENDMARKER are zero-width. Hence
//       render(tokenize(src).tokens) == src
//   for every input that tokenizes.
//
//   Abstract: parse() runs a recursive-descent parser over the significant
//   tokens and builds a Node tree. dump() of that tree ignores layout,
//   comments, redundant parentheses, string quote style and prefix case,
//   implicit string concatenation and numeric spelling (0x10 == 16,
//   1_000 == 1000, 1.0 == 1.), so two sources with equal dumps are the same
//   program text modulo formatting.
//
// COVERAGE: the Python 3.12 statement and expression grammar, including
// decorators, async constructs, comprehensions, lambda, the walrus operator,
// `match`, `type` aliases and generic parameter lists. f-strings are treated
// as opaque literals: their body is compared as written.
//
// NOT CHECKED: anything Python reports only at compile time (return outside a
// function, break outside a loop, nonlocal binding errors).

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ace::pysyntax {

enum class TokenKind {
  name,
  number,
  string,
  op,
  newline,       // end of a logical line; empty text at EOF without trailing newline
  nl,            // non-logical newline (blank line, inside brackets, after comment)
  comment,
  whitespace,
  continuation,  // backslash plus the newline it escapes
  indent,
  dedent,
  endmarker,
};

const char* to_string(TokenKind kind);

struct Token {
  TokenKind kind{TokenKind::endmarker};
  std::string text;
  uint32_t line{1};  // 1-based
  uint32_t col{0};   // 0-based byte offset in the line
};

struct SyntaxError {
  std::string message;
  uint32_t line{0};
  uint32_t col{0};

  // "line 3, col 4: invalid syntax"
  std::string to_string() const;
};

struct TokenizeResult {
  std::vector<Token> tokens;
  std::optional<SyntaxError> error;

  bool ok() const { return !error.has_value(); }
};

TokenizeResult tokenize(std::string_view source);

// Concatenation of every token's text.
std::string render(const std::vector<Token>& tokens);

struct Node {
  std::string kind;
  std::string value;
  std::vector<Node> children;

  Node() = default;
  explicit Node(std::string k, std::string v = "") : kind(std::move(k)), value(std::move(v)) {}

  Node& add(Node child) {
    children.push_back(std::move(child));
    return *this;
  }
};

// Canonical single-line form: Kind['value'](child, child, ...)
std::string dump(const Node& node);

struct ParseResult {
  Node module;
  std::vector<Token> tokens;
  std::optional<SyntaxError> error;

  bool ok() const { return !error.has_value(); }
};

ParseResult parse(std::string_view source);

}  // namespace ace::pysyntax
