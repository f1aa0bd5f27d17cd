#include "ace/pysyntax.hpp"

// Recursive-descent parser over the significant tokens produced by
// tokenize(). Grammar rule names follow the Python PEG grammar so that each
// function here can be checked against the rule it implements.
//
// Parse failures unwind through a private exception type and are converted
// to ParseResult::error at the public boundary; parse() never throws. The
// same mechanism gives cheap backtracking for the soft-keyword `match`
// statement and parenthesized `with` items.
//
// DETERMINISM RISKS:
//   - Float literals are normalized with std::strtod, which honours the C
//     locale's decimal point. The engine never calls setlocale().

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <set>
#include <utility>

namespace ace::pysyntax {

namespace {

constexpr int kMaxNesting = 400;

struct ParseFailure {
  SyntaxError error;
};

bool is_keyword(std::string_view s) {
  static const std::set<std::string_view> kKeywords = {
      "False", "None",   "True",    "and",      "as",     "assert", "async",
      "await", "break",  "class",   "continue", "def",    "del",    "elif",
      "else",  "except", "finally", "for",      "from",   "global", "if",
      "import", "in",    "is",      "lambda",   "nonlocal", "not",  "or",
      "pass",  "raise",  "return",  "try",      "while",  "with",   "yield",
  };
  return kKeywords.count(s) > 0;
}

// ---------------------------------------------------------------------------
// Literal normalization
// ---------------------------------------------------------------------------

void append_utf8(std::string& o, uint32_t cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xF0 | (cp >> 18));
    o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

struct StringPart {
  bool is_bytes{false};
  bool is_raw{false};
  bool is_f{false};
  std::string body;
};

StringPart split_string(const std::string& text) {
  StringPart p;
  const size_t q = text.find_first_of("'\"");
  for (size_t i = 0; i < q; ++i) {
    const char c = text[i];
    if (c == 'b' || c == 'B') p.is_bytes = true;
    if (c == 'r' || c == 'R') p.is_raw = true;
    if (c == 'f' || c == 'F') p.is_f = true;
  }
  const char quote = text[q];
  const bool triple = text.size() >= q + 6 && text[q + 1] == quote && text[q + 2] == quote;
  const size_t qlen = triple ? 3 : 1;
  p.body = text.substr(q + qlen, text.size() - q - 2 * qlen);
  return p;
}

// Decodes backslash escapes the way the Python compiler does for non-raw
// literals. Unknown escapes keep the backslash.
bool decode_escapes(const std::string& body, bool is_bytes, std::string& out, std::string& error) {
  for (size_t i = 0; i < body.size(); ++i) {
    const char c = body[i];
    if (c != '\\' || i + 1 >= body.size()) {
      out += c;
      continue;
    }
    const char e = body[++i];
    switch (e) {
      case '\n': break;
      case '\r':
        if (i + 1 < body.size() && body[i + 1] == '\n') ++i;
        break;
      case '\\': out += '\\'; break;
      case '\'': out += '\''; break;
      case '"': out += '"'; break;
      case 'a': out += '\a'; break;
      case 'b': out += '\b'; break;
      case 'f': out += '\f'; break;
      case 'n': out += '\n'; break;
      case 'r': out += '\r'; break;
      case 't': out += '\t'; break;
      case 'v': out += '\v'; break;
      case '0': case '1': case '2': case '3': case '4': case '5': case '6': case '7': {
        uint32_t v = static_cast<uint32_t>(e - '0');
        for (int k = 0; k < 2 && i + 1 < body.size() && body[i + 1] >= '0' && body[i + 1] <= '7'; ++k) {
          v = v * 8 + static_cast<uint32_t>(body[++i] - '0');
        }
        if (is_bytes) {
          out += static_cast<char>(v & 0xFF);
        } else {
          append_utf8(out, v);
        }
        break;
      }
      case 'x': {
        if (i + 2 >= body.size() || hex_value(body[i + 1]) < 0 || hex_value(body[i + 2]) < 0) {
          error = "truncated \\xXX escape";
          return false;
        }
        const uint32_t v = static_cast<uint32_t>(hex_value(body[i + 1]) * 16 + hex_value(body[i + 2]));
        i += 2;
        if (is_bytes) {
          out += static_cast<char>(v);
        } else {
          append_utf8(out, v);
        }
        break;
      }
      case 'u':
      case 'U': {
        if (is_bytes) {
          out += '\\';
          out += e;
          break;
        }
        const size_t n = (e == 'u') ? 4 : 8;
        uint32_t v = 0;
        for (size_t k = 1; k <= n; ++k) {
          const int h = (i + k < body.size()) ? hex_value(body[i + k]) : -1;
          if (h < 0) {
            error = std::string("truncated \\") + e + (n == 4 ? "XXXX" : "XXXXXXXX") + " escape";
            return false;
          }
          v = v * 16 + static_cast<uint32_t>(h);
        }
        if (v > 0x10FFFF) {
          error = "illegal Unicode character";
          return false;
        }
        i += n;
        append_utf8(out, v);
        break;
      }
      default:
        // \N{...} and unrecognized escapes are kept verbatim.
        out += '\\';
        out += e;
        break;
    }
  }
  return true;
}

// Arbitrary-size conversion of an unsigned digit string to decimal.
std::string to_decimal(const std::string& digits, int base) {
  std::vector<int> dec{0};  // little-endian decimal digits
  for (char c : digits) {
    int carry = hex_value(c);
    for (auto& d : dec) {
      const int v = d * base + carry;
      d = v % 10;
      carry = v / 10;
    }
    while (carry > 0) {
      dec.push_back(carry % 10);
      carry /= 10;
    }
  }
  while (dec.size() > 1 && dec.back() == 0) dec.pop_back();
  std::string out;
  for (auto it = dec.rbegin(); it != dec.rend(); ++it) out += static_cast<char>('0' + *it);
  return out;
}

std::string format_float(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.17g", v);
  return buf;
}

Node number_node(const std::string& text) {
  std::string s;
  for (char c : text) {
    if (c == '_') continue;
    s += static_cast<char>(c >= 'A' && c <= 'Z' ? c + 32 : c);
  }
  if (s.back() == 'j') {
    return Node("Complex", format_float(std::strtod(s.substr(0, s.size() - 1).c_str(), nullptr)));
  }
  if (s.size() > 1 && s[0] == '0' && (s[1] == 'x' || s[1] == 'o' || s[1] == 'b')) {
    const int base = s[1] == 'x' ? 16 : (s[1] == 'o' ? 8 : 2);
    return Node("Int", to_decimal(s.substr(2), base));
  }
  if (s.find_first_of(".e") != std::string::npos) {
    return Node("Float", format_float(std::strtod(s.c_str(), nullptr)));
  }
  const size_t nz = s.find_first_not_of('0');
  return Node("Int", nz == std::string::npos ? "0" : s.substr(nz));
}

std::string describe(const Node& n) {
  const std::string& k = n.kind;
  if (k == "Call") return "function call";
  if (k == "Constant") return n.value;
  if (k == "Str" || k == "Bytes" || k == "Int" || k == "Float" || k == "Complex" || k == "JoinedStr") {
    return "literal";
  }
  if (k == "Compare") return "comparison";
  if (k == "Lambda") return "lambda";
  if (k == "IfExp") return "conditional expression";
  if (k == "NamedExpr") return "named expression";
  if (k == "Await") return "await expression";
  if (k == "Yield" || k == "YieldFrom") return "yield expression";
  if (k == "Dict") return "dict literal";
  if (k == "Set") return "set display";
  if (k == "ListComp") return "list comprehension";
  if (k == "SetComp") return "set comprehension";
  if (k == "DictComp") return "dict comprehension";
  if (k == "GeneratorExp") return "generator expression";
  return "expression";
}

const char* augassign_name(const std::string& op) {
  if (op == "+=") return "Add";
  if (op == "-=") return "Sub";
  if (op == "*=") return "Mult";
  if (op == "@=") return "MatMult";
  if (op == "/=") return "Div";
  if (op == "%=") return "Mod";
  if (op == "&=") return "BitAnd";
  if (op == "|=") return "BitOr";
  if (op == "^=") return "BitXor";
  if (op == "<<=") return "LShift";
  if (op == ">>=") return "RShift";
  if (op == "**=") return "Pow";
  if (op == "//=") return "FloorDiv";
  return nullptr;
}

bool significant(TokenKind k) {
  return k != TokenKind::whitespace && k != TokenKind::comment && k != TokenKind::nl &&
         k != TokenKind::continuation;
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------

class Parser {
 public:
  explicit Parser(const std::vector<Token>& all) {
    for (const auto& t : all) {
      if (significant(t.kind)) toks_.push_back(&t);
    }
  }

  Node module() {
    Node m("Module");
    while (!at(TokenKind::endmarker)) {
      if (at(TokenKind::indent)) fail("unexpected indent");
      statement(m.children);
    }
    return m;
  }

 private:
  std::vector<const Token*> toks_;
  size_t i_{0};
  int depth_{0};

  struct DepthGuard {
    Parser& p;
    explicit DepthGuard(Parser& parser) : p(parser) {
      if (++p.depth_ > kMaxNesting) p.fail("too many nested expressions or statements");
    }
    ~DepthGuard() { --p.depth_; }
  };

  // --- token access -------------------------------------------------------

  const Token& peek(size_t k = 0) const {
    return *toks_[std::min(i_ + k, toks_.size() - 1)];
  }
  bool at(TokenKind kind) const { return peek().kind == kind; }
  bool at_op(std::string_view s, size_t k = 0) const {
    const Token& t = peek(k);
    return t.kind == TokenKind::op && t.text == s;
  }
  bool at_kw(std::string_view s, size_t k = 0) const {
    const Token& t = peek(k);
    return t.kind == TokenKind::name && t.text == s;
  }
  bool at_name(size_t k = 0) const {
    const Token& t = peek(k);
    return t.kind == TokenKind::name && !is_keyword(t.text);
  }
  const Token& next() {
    const Token& t = peek();
    if (i_ + 1 < toks_.size()) ++i_;
    return t;
  }

  [[noreturn]] void fail(const std::string& msg) const {
    const Token& t = peek();
    throw ParseFailure{SyntaxError{msg, t.line, t.col}};
  }

  void expect_op(std::string_view s) {
    if (!at_op(s)) fail("expected '" + std::string(s) + "'");
    next();
  }
  void expect_kw(std::string_view s) {
    if (!at_kw(s)) fail("expected '" + std::string(s) + "'");
    next();
  }
  void expect_newline() {
    if (!at(TokenKind::newline)) fail("invalid syntax");
    next();
  }
  std::string expect_name() {
    if (!at_name()) fail("invalid syntax");
    return next().text;
  }

  bool at_comprehension() const { return at_kw("for") || (at_kw("async") && at_kw("for", 1)); }

  bool starts_expression() const {
    const Token& t = peek();
    switch (t.kind) {
      case TokenKind::name:
        return !is_keyword(t.text) || t.text == "not" || t.text == "lambda" ||
               t.text == "await" || t.text == "True" || t.text == "False" || t.text == "None";
      case TokenKind::number:
      case TokenKind::string:
        return true;
      case TokenKind::op:
        return t.text == "(" || t.text == "[" || t.text == "{" || t.text == "-" ||
               t.text == "+" || t.text == "~" || t.text == "*" || t.text == "...";
      default:
        return false;
    }
  }

  // --- target validation --------------------------------------------------

  void validate_store(const Node& n) const {
    const std::string& k = n.kind;
    if (k == "Name" || k == "Attribute" || k == "Subscript") return;
    if (k == "Starred") {
      validate_store(n.children.front());
      return;
    }
    if (k == "Tuple" || k == "List") {
      int starred = 0;
      for (const auto& c : n.children) {
        if (c.kind == "Starred") ++starred;
        validate_store(c);
      }
      if (starred > 1) fail("multiple starred expressions in assignment");
      return;
    }
    fail("cannot assign to " + describe(n));
  }

  void validate_del(const Node& n) const {
    const std::string& k = n.kind;
    if (k == "Name" || k == "Attribute" || k == "Subscript") return;
    if (k == "Tuple" || k == "List") {
      for (const auto& c : n.children) validate_del(c);
      return;
    }
    fail("cannot delete " + describe(n));
  }

  // --- statements ---------------------------------------------------------

  void statement(std::vector<Node>& out) {
    DepthGuard guard(*this);
    if (auto n = compound()) {
      out.push_back(std::move(*n));
      return;
    }
    simple_statements(out);
  }

  void simple_statements(std::vector<Node>& out) {
    while (true) {
      out.push_back(simple_statement());
      if (!at_op(";")) break;
      next();
      if (at(TokenKind::newline)) break;
    }
    expect_newline();
  }

  Node block() {
    Node body("Body");
    if (!at(TokenKind::newline)) {
      simple_statements(body.children);
      return body;
    }
    next();
    if (!at(TokenKind::indent)) fail("expected an indented block");
    next();
    while (!at(TokenKind::dedent) && !at(TokenKind::endmarker)) {
      if (at(TokenKind::indent)) fail("unexpected indent");
      statement(body.children);
    }
    if (at(TokenKind::dedent)) next();
    return body;
  }

  std::optional<Node> compound() {
    if (at_op("@")) return decorated();
    const Token& t = peek();
    if (t.kind != TokenKind::name) return std::nullopt;
    const std::string& w = t.text;
    if (w == "def") return funcdef(Node("Decorators"), false);
    if (w == "class") return classdef(Node("Decorators"));
    if (w == "if") return if_stmt();
    if (w == "while") return while_stmt();
    if (w == "for") return for_stmt(false);
    if (w == "with") return with_stmt(false);
    if (w == "try") return try_stmt();
    if (w == "async") {
      next();
      if (at_kw("def")) return funcdef(Node("Decorators"), true);
      if (at_kw("for")) return for_stmt(true);
      if (at_kw("with")) return with_stmt(true);
      fail("invalid syntax");
    }
    if (w == "match") return match_stmt();
    return std::nullopt;
  }

  Node decorated() {
    Node decos("Decorators");
    while (at_op("@")) {
      next();
      decos.add(named_expression());
      expect_newline();
    }
    if (at_kw("def")) return funcdef(std::move(decos), false);
    if (at_kw("class")) return classdef(std::move(decos));
    if (at_kw("async") && at_kw("def", 1)) {
      next();
      return funcdef(std::move(decos), true);
    }
    fail("invalid syntax");
  }

  Node funcdef(Node decos, bool is_async) {
    expect_kw("def");
    Node fn(is_async ? "AsyncFunctionDef" : "FunctionDef", expect_name());
    fn.add(std::move(decos));
    fn.add(type_params());
    expect_op("(");
    fn.add(parameters(")", true));
    expect_op(")");
    Node returns("Returns");
    if (at_op("->")) {
      next();
      returns.add(expression());
    }
    fn.add(std::move(returns));
    expect_op(":");
    fn.add(block());
    return fn;
  }

  Node classdef(Node decos) {
    expect_kw("class");
    Node cls("ClassDef", expect_name());
    cls.add(std::move(decos));
    cls.add(type_params());
    Node bases("Args");
    Node keywords("Keywords");
    if (at_op("(")) {
      next();
      call_arguments(bases, keywords);
      expect_op(")");
    }
    cls.add(std::move(bases));
    cls.add(std::move(keywords));
    expect_op(":");
    cls.add(block());
    return cls;
  }

  Node type_params() {
    Node tp("TypeParams");
    if (!at_op("[")) return tp;
    next();
    while (!at_op("]")) {
      Node p;
      if (at_op("*")) {
        next();
        p = Node("TypeVarTuple", expect_name());
      } else if (at_op("**")) {
        next();
        p = Node("ParamSpec", expect_name());
      } else {
        p = Node("TypeVar", expect_name());
        if (at_op(":")) {
          next();
          p.add(Node("Bound").add(expression()));
        }
      }
      if (at_op("=")) {
        next();
        p.add(Node("Default").add(star_expression()));
      }
      tp.add(std::move(p));
      if (!at_op(",")) break;
      next();
    }
    if (tp.children.empty()) fail("Type parameter list cannot be empty");
    expect_op("]");
    return tp;
  }

  void annotation(Node& param, bool allowed, bool star_ok) {
    if (!allowed || !at_op(":")) return;
    next();
    Node ann("Annotation");
    if (star_ok && at_op("*")) {
      next();
      ann.add(Node("Starred").add(bitwise_or()));
    } else {
      ann.add(expression());
    }
    param.add(std::move(ann));
  }

  // Parameter list of a def (closing ")") or a lambda (closing ":").
  Node parameters(std::string_view closing, bool annotations) {
    Node args("arguments");
    std::vector<size_t> positional;
    bool seen_slash = false, seen_star = false, seen_kwarg = false, seen_default = false;
    while (!at_op(closing)) {
      if (seen_kwarg) fail("arguments cannot follow var-keyword argument");
      if (at_op("/")) {
        if (seen_slash) fail("/ may appear only once");
        if (seen_star) fail("/ must be ahead of *");
        if (positional.empty()) fail("at least one argument must precede /");
        for (size_t idx : positional) args.children[idx].kind = "posonlyarg";
        seen_slash = true;
        next();
      } else if (at_op("**")) {
        next();
        Node a("kwarg", expect_name());
        annotation(a, annotations, false);
        args.add(std::move(a));
        seen_kwarg = true;
      } else if (at_op("*")) {
        if (seen_star) fail("* argument may appear only once");
        next();
        seen_star = true;
        if (at_op(",") || at_op(closing)) {
          if (at_op(closing) || at_op(closing, 1)) fail("named arguments must follow bare *");
          args.add(Node("bare_star"));
        } else {
          Node a("vararg", expect_name());
          annotation(a, annotations, true);
          args.add(std::move(a));
        }
      } else {
        Node a(seen_star ? "kwonlyarg" : "arg", expect_name());
        annotation(a, annotations, false);
        if (at_op("=")) {
          next();
          a.add(Node("Default").add(expression()));
          if (!seen_star) seen_default = true;
        } else if (!seen_star && seen_default) {
          fail("parameter without a default follows parameter with a default");
        }
        if (!seen_star) positional.push_back(args.children.size());
        args.add(std::move(a));
      }
      if (!at_op(",")) break;
      next();
    }
    return args;
  }

  Node if_stmt() {
    next();  // 'if' or 'elif'
    Node n("If");
    n.add(named_expression());
    expect_op(":");
    n.add(block());
    Node orelse("Orelse");
    if (at_kw("elif")) {
      orelse.add(if_stmt());
    } else if (at_kw("else")) {
      next();
      expect_op(":");
      orelse.children = block().children;
    }
    n.add(std::move(orelse));
    return n;
  }

  Node else_block() {
    Node orelse("Orelse");
    if (at_kw("else")) {
      next();
      expect_op(":");
      orelse.children = block().children;
    }
    return orelse;
  }

  Node while_stmt() {
    expect_kw("while");
    Node n("While");
    n.add(named_expression());
    expect_op(":");
    n.add(block());
    n.add(else_block());
    return n;
  }

  Node for_stmt(bool is_async) {
    expect_kw("for");
    Node n(is_async ? "AsyncFor" : "For");
    n.add(star_targets());
    expect_kw("in");
    n.add(star_expressions());
    expect_op(":");
    n.add(block());
    n.add(else_block());
    return n;
  }

  Node with_item() {
    Node item("withitem");
    item.add(expression());
    if (at_kw("as")) {
      next();
      item.add(star_target());
    }
    return item;
  }

  Node with_stmt(bool is_async) {
    expect_kw("with");
    Node w(is_async ? "AsyncWith" : "With");
    bool parsed = false;
    if (at_op("(")) {
      const size_t save = i_;
      try {
        next();
        std::vector<Node> items;
        while (true) {
          items.push_back(with_item());
          if (!at_op(",")) break;
          next();
          if (at_op(")")) break;
        }
        expect_op(")");
        if (!at_op(":")) fail("invalid syntax");
        for (auto& item : items) w.add(std::move(item));
        parsed = true;
      } catch (const ParseFailure&) {
        // Not the parenthesized form; reparse as plain expressions.
        i_ = save;
      }
    }
    if (!parsed) {
      while (true) {
        w.add(with_item());
        if (!at_op(",")) break;
        next();
      }
    }
    expect_op(":");
    w.add(block());
    return w;
  }

  Node try_stmt() {
    expect_kw("try");
    expect_op(":");
    Node t("Try");
    t.add(block());
    Node handlers("Handlers");
    bool star_seen = false, plain_seen = false;
    while (at_kw("except")) {
      next();
      const bool star = at_op("*");
      if (star) next();
      (star ? star_seen : plain_seen) = true;
      Node h("ExceptHandler");
      if (!at_op(":")) {
        h.add(expression());
        if (at_op(",")) fail("multiple exception types must be parenthesized");
        if (at_kw("as")) {
          next();
          h.value = expect_name();
        }
      } else if (star) {
        fail("expected one or more exception types");
      }
      expect_op(":");
      h.add(block());
      handlers.add(std::move(h));
    }
    if (star_seen && plain_seen) fail("cannot have both 'except' and 'except*' on the same 'try'");
    if (star_seen) t.kind = "TryStar";
    t.add(std::move(handlers));

    Node orelse("Orelse");
    if (at_kw("else")) {
      if (!star_seen && !plain_seen) fail("invalid syntax");
      orelse = else_block();
    }
    t.add(std::move(orelse));

    Node finalbody("Finalbody");
    bool has_finally = false;
    if (at_kw("finally")) {
      next();
      expect_op(":");
      finalbody.children = block().children;
      has_finally = true;
    }
    if (!star_seen && !plain_seen && !has_finally) fail("expected 'except' or 'finally' block");
    t.add(std::move(finalbody));
    return t;
  }

  // --- match statement ----------------------------------------------------

  std::optional<Node> match_stmt() {
    const size_t save = i_;
    Node m("Match");
    try {
      next();  // 'match'
      Node first = star_named_expression();
      if (at_op(",")) {
        Node tup("Tuple");
        tup.add(std::move(first));
        while (at_op(",")) {
          next();
          if (at_op(":")) break;
          tup.add(star_named_expression());
        }
        first = std::move(tup);
      } else if (first.kind == "Starred") {
        fail("invalid syntax");
      }
      expect_op(":");
      if (!at(TokenKind::newline) || peek(1).kind != TokenKind::indent || !at_kw("case", 2)) {
        fail("invalid syntax");
      }
      m.add(std::move(first));
    } catch (const ParseFailure&) {
      // `match` used as an ordinary identifier.
      i_ = save;
      return std::nullopt;
    }
    next();  // NEWLINE
    next();  // INDENT
    while (at_kw("case")) {
      next();
      Node c("match_case");
      c.add(patterns());
      if (at_kw("if")) {
        next();
        c.add(Node("Guard").add(named_expression()));
      }
      expect_op(":");
      c.add(block());
      m.add(std::move(c));
    }
    if (!at(TokenKind::dedent)) fail("expected 'case' block");
    next();
    return m;
  }

  Node patterns() {
    Node first = maybe_star_pattern();
    if (!at_op(",")) {
      if (first.kind == "MatchStar") fail("invalid syntax");
      return first;
    }
    Node seq("MatchSequence");
    seq.add(std::move(first));
    while (at_op(",")) {
      next();
      if (at_op(":") || at_kw("if")) break;
      seq.add(maybe_star_pattern());
    }
    return seq;
  }

  Node maybe_star_pattern() {
    if (!at_op("*")) return pattern();
    next();
    const std::string n = expect_name();
    return Node("MatchStar", n == "_" ? "" : n);
  }

  Node pattern() {
    Node p = or_pattern();
    if (!at_kw("as")) return p;
    next();
    const std::string n = expect_name();
    if (n == "_") fail("cannot use '_' as a target");
    Node as("MatchAs", n);
    as.add(std::move(p));
    return as;
  }

  Node or_pattern() {
    Node first = closed_pattern();
    if (!at_op("|")) return first;
    Node alt("MatchOr");
    alt.add(std::move(first));
    while (at_op("|")) {
      next();
      alt.add(closed_pattern());
    }
    return alt;
  }

  Node signed_number() {
    bool negative = false;
    if (at_op("-")) {
      next();
      negative = true;
    }
    if (!at(TokenKind::number)) fail("invalid pattern");
    Node v = number_node(next().text);
    if (negative) v = Node("UnaryOp", "USub").add(std::move(v));
    if (at_op("+") || at_op("-")) {
      const std::string op = next().text == "+" ? "Add" : "Sub";
      if (!at(TokenKind::number)) fail("invalid pattern");
      Node rhs = number_node(next().text);
      if (rhs.kind != "Complex") fail("imaginary number required in complex literal");
      Node b("BinOp", op);
      b.add(std::move(v));
      b.add(std::move(rhs));
      v = std::move(b);
    }
    return v;
  }

  Node dotted_value() {
    Node v("Name", expect_name());
    while (at_op(".")) {
      next();
      Node a("Attribute", expect_name());
      a.add(std::move(v));
      v = std::move(a);
    }
    return v;
  }

  Node closed_pattern() {
    DepthGuard guard(*this);
    if (at(TokenKind::number) || at_op("-")) return Node("MatchValue").add(signed_number());
    if (at(TokenKind::string)) return Node("MatchValue").add(strings());
    if (at_kw("None") || at_kw("True") || at_kw("False")) {
      return Node("MatchSingleton", next().text);
    }
    if (at_name()) {
      const bool dotted = at_op(".", 1);
      const bool is_class = at_op("(", 1);
      if (dotted || is_class) {
        Node v = dotted_value();
        if (at_op("(")) return class_pattern(std::move(v));
        return Node("MatchValue").add(std::move(v));
      }
      const std::string n = next().text;
      return n == "_" ? Node("MatchAs") : Node("MatchAs", n);
    }
    if (at_op("(")) {
      next();
      if (at_op(")")) {
        next();
        return Node("MatchSequence");
      }
      Node p = maybe_star_pattern();
      if (!at_op(",")) {
        expect_op(")");
        if (p.kind == "MatchStar") fail("invalid syntax");
        return p;
      }
      Node seq("MatchSequence");
      seq.add(std::move(p));
      while (at_op(",")) {
        next();
        if (at_op(")")) break;
        seq.add(maybe_star_pattern());
      }
      expect_op(")");
      return seq;
    }
    if (at_op("[")) {
      next();
      Node seq("MatchSequence");
      while (!at_op("]")) {
        seq.add(maybe_star_pattern());
        if (!at_op(",")) break;
        next();
      }
      expect_op("]");
      return seq;
    }
    if (at_op("{")) {
      next();
      Node m("MatchMapping");
      while (!at_op("}")) {
        if (at_op("**")) {
          next();
          m.add(Node("MatchRest", expect_name()));
        } else {
          Node pair("pair");
          pair.add(mapping_key());
          expect_op(":");
          pair.add(pattern());
          m.add(std::move(pair));
        }
        if (!at_op(",")) break;
        next();
      }
      expect_op("}");
      return m;
    }
    fail("invalid pattern");
  }

  Node mapping_key() {
    if (at(TokenKind::number) || at_op("-")) return signed_number();
    if (at(TokenKind::string)) return strings();
    if (at_kw("None") || at_kw("True") || at_kw("False")) return Node("Constant", next().text);
    if (at_name() && at_op(".", 1)) return dotted_value();
    fail("mapping pattern keys may only match literals and attribute lookups");
  }

  Node class_pattern(Node cls) {
    expect_op("(");
    Node c("MatchClass");
    c.add(std::move(cls));
    Node positional("Patterns");
    Node keywords("KwdPatterns");
    while (!at_op(")")) {
      if (at_name() && at_op("=", 1)) {
        Node kw("kwd", next().text);
        next();
        kw.add(pattern());
        keywords.add(std::move(kw));
      } else {
        if (!keywords.children.empty()) fail("positional patterns follow keyword patterns");
        positional.add(pattern());
      }
      if (!at_op(",")) break;
      next();
    }
    expect_op(")");
    c.add(std::move(positional));
    c.add(std::move(keywords));
    return c;
  }

  // --- simple statements --------------------------------------------------

  Node simple_statement() {
    if (peek().kind == TokenKind::name) {
      const std::string w = peek().text;
      if (w == "pass" || w == "break" || w == "continue") {
        next();
        return Node(w == "pass" ? "Pass" : (w == "break" ? "Break" : "Continue"));
      }
      if (w == "return") {
        next();
        Node r("Return");
        if (starts_expression()) r.add(star_expressions());
        return r;
      }
      if (w == "raise") {
        next();
        Node r("Raise");
        if (starts_expression()) {
          r.add(expression());
          if (at_kw("from")) {
            next();
            r.add(Node("Cause").add(expression()));
          }
        }
        return r;
      }
      if (w == "global" || w == "nonlocal") {
        next();
        Node g(w == "global" ? "Global" : "Nonlocal");
        while (true) {
          g.add(Node("Name", expect_name()));
          if (!at_op(",")) break;
          next();
        }
        return g;
      }
      if (w == "del") {
        next();
        Node d("Delete");
        while (true) {
          Node target = bitwise_or();
          validate_del(target);
          d.add(std::move(target));
          if (!at_op(",")) break;
          next();
          if (!starts_expression()) break;
        }
        return d;
      }
      if (w == "assert") {
        next();
        Node a("Assert");
        a.add(expression());
        if (at_op(",")) {
          next();
          a.add(expression());
        }
        return a;
      }
      if (w == "import") return import_stmt();
      if (w == "from") return from_import();
      if (w == "type" && at_name(1) && (at_op("=", 2) || at_op("[", 2))) {
        next();
        Node t("TypeAlias", expect_name());
        t.add(type_params());
        expect_op("=");
        t.add(expression());
        return t;
      }
    }
    return expression_statement();
  }

  std::string dotted_name() {
    std::string n = expect_name();
    while (at_op(".")) {
      next();
      n += "." + expect_name();
    }
    return n;
  }

  Node import_stmt() {
    expect_kw("import");
    Node n("Import");
    while (true) {
      Node alias("alias", dotted_name());
      if (at_kw("as")) {
        next();
        alias.add(Node("asname", expect_name()));
      }
      n.add(std::move(alias));
      if (!at_op(",")) break;
      next();
    }
    return n;
  }

  Node from_import() {
    expect_kw("from");
    size_t level = 0;
    while (at_op(".") || at_op("...")) level += next().text.size();
    std::string module;
    if (!at_kw("import")) {
      module = dotted_name();
    } else if (level == 0) {
      fail("invalid syntax");
    }
    expect_kw("import");
    Node n("ImportFrom", std::string(level, '.') + module);
    if (at_op("*")) {
      next();
      n.add(Node("alias", "*"));
      return n;
    }
    const bool paren = at_op("(");
    if (paren) next();
    while (true) {
      Node alias("alias", expect_name());
      if (at_kw("as")) {
        next();
        alias.add(Node("asname", expect_name()));
      }
      n.add(std::move(alias));
      if (!at_op(",")) break;
      next();
      if (paren && at_op(")")) break;
      if (!paren && !at_name()) fail("trailing comma not allowed without surrounding parentheses");
    }
    if (paren) expect_op(")");
    return n;
  }

  Node assignment_value() { return at_kw("yield") ? yield_expr() : star_expressions(); }

  Node expression_statement() {
    Node first = assignment_value();

    if (at_op(":")) {
      if (first.kind == "Tuple") fail("only single target (not tuple) can be annotated");
      if (first.kind != "Name" && first.kind != "Attribute" && first.kind != "Subscript") {
        fail("illegal target for annotation");
      }
      next();
      Node a("AnnAssign");
      a.add(std::move(first));
      a.add(expression());
      if (at_op("=")) {
        next();
        a.add(assignment_value());
      }
      return a;
    }

    if (peek().kind == TokenKind::op) {
      if (const char* name = augassign_name(peek().text)) {
        if (first.kind != "Name" && first.kind != "Attribute" && first.kind != "Subscript") {
          fail("'" + describe(first) + "' is an illegal expression for augmented assignment");
        }
        next();
        Node a("AugAssign", name);
        a.add(std::move(first));
        a.add(assignment_value());
        return a;
      }
    }

    if (at_op("=")) {
      std::vector<Node> parts;
      parts.push_back(std::move(first));
      while (at_op("=")) {
        next();
        parts.push_back(assignment_value());
      }
      Node a("Assign");
      for (size_t k = 0; k + 1 < parts.size(); ++k) {
        validate_store(parts[k]);
        a.add(std::move(parts[k]));
      }
      if (parts.back().kind == "Starred") fail("can't use starred expression here");
      a.add(std::move(parts.back()));
      return a;
    }

    if (first.kind == "Starred") fail("can't use starred expression here");
    return Node("Expr").add(std::move(first));
  }

  // --- expressions --------------------------------------------------------

  Node yield_expr() {
    expect_kw("yield");
    if (at_kw("from")) {
      next();
      return Node("YieldFrom").add(expression());
    }
    Node y("Yield");
    if (starts_expression()) y.add(star_expressions());
    return y;
  }

  Node star_expressions() {
    Node first = star_expression();
    if (!at_op(",")) return first;
    Node tup("Tuple");
    tup.add(std::move(first));
    while (at_op(",")) {
      next();
      if (!starts_expression()) break;
      tup.add(star_expression());
    }
    return tup;
  }

  Node star_expression() {
    if (!at_op("*")) return expression();
    next();
    return Node("Starred").add(bitwise_or());
  }

  Node star_named_expression() {
    if (!at_op("*")) return named_expression();
    next();
    return Node("Starred").add(bitwise_or());
  }

  Node named_expression() {
    if (at_name() && at_op(":=", 1)) {
      Node n("NamedExpr");
      n.add(Node("Name", next().text));
      next();
      n.add(expression());
      return n;
    }
    Node e = expression();
    if (at_op(":=")) fail("cannot use assignment expressions with " + describe(e));
    return e;
  }

  Node expression() {
    DepthGuard guard(*this);
    if (at_kw("lambda")) return lambda();
    Node body = disjunction();
    if (!at_kw("if")) return body;
    next();
    Node test = disjunction();
    if (!at_kw("else")) fail("expected 'else' after 'if' expression");
    next();
    Node n("IfExp");
    n.add(std::move(test));
    n.add(std::move(body));
    n.add(expression());
    return n;
  }

  Node lambda() {
    expect_kw("lambda");
    Node l("Lambda");
    l.add(parameters(":", false));
    expect_op(":");
    l.add(expression());
    return l;
  }

  Node disjunction() {
    Node first = conjunction();
    if (!at_kw("or")) return first;
    Node n("BoolOp", "Or");
    n.add(std::move(first));
    while (at_kw("or")) {
      next();
      n.add(conjunction());
    }
    return n;
  }

  Node conjunction() {
    Node first = inversion();
    if (!at_kw("and")) return first;
    Node n("BoolOp", "And");
    n.add(std::move(first));
    while (at_kw("and")) {
      next();
      n.add(inversion());
    }
    return n;
  }

  Node inversion() {
    DepthGuard guard(*this);
    if (!at_kw("not")) return comparison();
    next();
    return Node("UnaryOp", "Not").add(inversion());
  }

  Node comparison() {
    Node left = bitwise_or();
    Node cmp("Compare");
    while (true) {
      std::string op;
      if (at_op("==")) op = "Eq";
      else if (at_op("!=")) op = "NotEq";
      else if (at_op("<")) op = "Lt";
      else if (at_op("<=")) op = "LtE";
      else if (at_op(">")) op = "Gt";
      else if (at_op(">=")) op = "GtE";
      else if (at_kw("in")) op = "In";
      else if (at_kw("not") && at_kw("in", 1)) op = "NotIn";
      else if (at_kw("is")) op = at_kw("not", 1) ? "IsNot" : "Is";
      else break;

      next();
      if (op == "NotIn" || op == "IsNot") next();
      if (cmp.children.empty()) cmp.add(std::move(left));
      cmp.add(Node("cmpop", op));
      cmp.add(bitwise_or());
    }
    return cmp.children.empty() ? left : cmp;
  }

  // Left-associative binary level. `ops` maps operator text to AST op name.
  template <typename Sub>
  Node binary(Sub sub, std::initializer_list<std::pair<std::string_view, const char*>> ops) {
    Node left = (this->*sub)();
    while (true) {
      const char* name = nullptr;
      for (const auto& [text, op_name] : ops) {
        if (at_op(text)) {
          name = op_name;
          break;
        }
      }
      if (!name) return left;
      next();
      Node b("BinOp", name);
      b.add(std::move(left));
      b.add((this->*sub)());
      left = std::move(b);
    }
  }

  Node bitwise_or() { return binary(&Parser::bitwise_xor, {{"|", "BitOr"}}); }
  Node bitwise_xor() { return binary(&Parser::bitwise_and, {{"^", "BitXor"}}); }
  Node bitwise_and() { return binary(&Parser::shift_expr, {{"&", "BitAnd"}}); }
  Node shift_expr() { return binary(&Parser::sum, {{"<<", "LShift"}, {">>", "RShift"}}); }
  Node sum() { return binary(&Parser::term, {{"+", "Add"}, {"-", "Sub"}}); }
  Node term() {
    return binary(&Parser::factor,
                  {{"*", "Mult"}, {"/", "Div"}, {"//", "FloorDiv"}, {"%", "Mod"}, {"@", "MatMult"}});
  }

  Node factor() {
    DepthGuard guard(*this);
    const char* op = nullptr;
    if (at_op("+")) op = "UAdd";
    else if (at_op("-")) op = "USub";
    else if (at_op("~")) op = "Invert";
    if (!op) return power();
    next();
    return Node("UnaryOp", op).add(factor());
  }

  Node power() {
    Node base = await_primary();
    if (!at_op("**")) return base;
    next();
    Node b("BinOp", "Pow");
    b.add(std::move(base));
    b.add(factor());
    return b;
  }

  Node await_primary() {
    if (!at_kw("await")) return primary();
    next();
    return Node("Await").add(primary());
  }

  Node primary() {
    Node e = atom();
    while (true) {
      if (at_op(".")) {
        next();
        Node a("Attribute", expect_name());
        a.add(std::move(e));
        e = std::move(a);
      } else if (at_op("(")) {
        next();
        Node call("Call");
        call.add(std::move(e));
        Node args("Args");
        Node keywords("Keywords");
        call_arguments(args, keywords);
        expect_op(")");
        call.add(std::move(args));
        call.add(std::move(keywords));
        e = std::move(call);
      } else if (at_op("[")) {
        next();
        Node sub("Subscript");
        sub.add(std::move(e));
        sub.add(slices());
        expect_op("]");
        e = std::move(sub);
      } else {
        return e;
      }
    }
  }

  void call_arguments(Node& args, Node& keywords) {
    bool seen_keyword = false, seen_unpack = false;
    while (!at_op(")")) {
      if (at_op("*")) {
        next();
        if (seen_unpack) fail("iterable argument unpacking follows keyword argument unpacking");
        args.add(Node("Starred").add(expression()));
      } else if (at_op("**")) {
        next();
        keywords.add(Node("keyword").add(expression()));
        seen_unpack = true;
      } else if (at_name() && at_op("=", 1)) {
        Node kw("keyword", next().text);
        next();
        kw.add(expression());
        keywords.add(std::move(kw));
        seen_keyword = true;
      } else {
        Node e = named_expression();
        if (at_comprehension()) {
          Node gen("GeneratorExp");
          gen.add(std::move(e));
          comprehensions(gen);
          const bool more = at_op(",") && !at_op(")", 1);
          if (!args.children.empty() || !keywords.children.empty() || more) {
            fail("Generator expression must be parenthesized");
          }
          e = std::move(gen);
        }
        if (seen_unpack) fail("positional argument follows keyword argument unpacking");
        if (seen_keyword) fail("positional argument follows keyword argument");
        args.add(std::move(e));
      }
      if (!at_op(",")) break;
      next();
    }
  }

  Node slices() {
    Node first = slice_item();
    if (!at_op(",")) return first;
    Node tup("Tuple");
    tup.add(std::move(first));
    while (at_op(",")) {
      next();
      if (at_op("]")) break;
      tup.add(slice_item());
    }
    return tup;
  }

  Node slice_item() {
    if (at_op("*")) {
      next();
      return Node("Starred").add(bitwise_or());
    }
    Node lower("Empty");
    if (!at_op(":")) {
      lower = named_expression();
      if (!at_op(":")) return lower;
    }
    next();  // ':'
    Node s("Slice");
    s.add(std::move(lower));
    if (!at_op(":") && !at_op(",") && !at_op("]")) {
      s.add(expression());
    } else {
      s.add(Node("Empty"));
    }
    if (at_op(":")) {
      next();
      if (!at_op(",") && !at_op("]")) {
        s.add(expression());
      } else {
        s.add(Node("Empty"));
      }
    } else {
      s.add(Node("Empty"));
    }
    return s;
  }

  void comprehensions(Node& parent) {
    while (at_comprehension()) {
      Node c("comprehension");
      if (at_kw("async")) {
        next();
        c.value = "async";
      }
      expect_kw("for");
      c.add(star_targets());
      expect_kw("in");
      c.add(disjunction());
      while (at_kw("if")) {
        next();
        c.add(Node("if").add(disjunction()));
      }
      parent.add(std::move(c));
    }
  }

  Node star_target() {
    if (at_op("*")) {
      next();
      Node s("Starred");
      s.add(star_target());
      validate_store(s);
      return s;
    }
    Node t = bitwise_or();
    validate_store(t);
    return t;
  }

  Node star_targets() {
    Node first = star_target();
    if (!at_op(",")) {
      if (first.kind == "Starred") fail("starred assignment target must be in a list or tuple");
      return first;
    }
    Node tup("Tuple");
    tup.add(std::move(first));
    while (at_op(",")) {
      next();
      if (at_kw("in") || !starts_expression()) break;
      tup.add(star_target());
    }
    validate_store(tup);
    return tup;
  }

  Node strings() {
    std::vector<StringPart> parts;
    while (at(TokenKind::string)) parts.push_back(split_string(next().text));

    bool any_bytes = false, any_text = false, any_f = false;
    for (const auto& p : parts) {
      (p.is_bytes ? any_bytes : any_text) = true;
      any_f = any_f || p.is_f;
    }
    if (any_bytes && any_text) fail("cannot mix bytes and nonbytes literals");

    auto decoded = [&](const StringPart& p) {
      if (p.is_raw) return p.body;
      std::string out, error;
      if (!decode_escapes(p.body, p.is_bytes, out, error)) fail("(unicode error) " + error);
      return out;
    };

    if (!any_f) {
      std::string value;
      for (const auto& p : parts) value += decoded(p);
      return Node(any_bytes ? "Bytes" : "Str", value);
    }

    Node joined("JoinedStr");
    std::string pending;
    for (const auto& p : parts) {
      if (!p.is_f) {
        pending += decoded(p);
        continue;
      }
      if (!pending.empty()) joined.add(Node("Str", std::move(pending)));
      pending.clear();
      joined.add(Node("FStr", p.body));
    }
    if (!pending.empty()) joined.add(Node("Str", std::move(pending)));
    return joined;
  }

  Node atom() {
    const Token& t = peek();
    switch (t.kind) {
      case TokenKind::name: {
        const std::string text = t.text;
        if (text == "True" || text == "False" || text == "None") {
          next();
          return Node("Constant", text);
        }
        if (is_keyword(text)) fail("invalid syntax");
        next();
        return Node("Name", text);
      }
      case TokenKind::number:
        return number_node(next().text);
      case TokenKind::string:
        return strings();
      case TokenKind::op:
        if (t.text == "...") {
          next();
          return Node("Constant", "Ellipsis");
        }
        if (t.text == "(") return paren_atom();
        if (t.text == "[") return list_atom();
        if (t.text == "{") return brace_atom();
        break;
      default:
        break;
    }
    fail("invalid syntax");
  }

  Node paren_atom() {
    expect_op("(");
    if (at_op(")")) {
      next();
      return Node("Tuple");
    }
    if (at_kw("yield")) {
      Node y = yield_expr();
      expect_op(")");
      return y;
    }
    Node first = star_named_expression();
    if (at_comprehension()) {
      if (first.kind == "Starred") fail("iterable unpacking cannot be used in comprehension");
      Node gen("GeneratorExp");
      gen.add(std::move(first));
      comprehensions(gen);
      expect_op(")");
      return gen;
    }
    if (at_op(",")) {
      Node tup("Tuple");
      tup.add(std::move(first));
      while (at_op(",")) {
        next();
        if (at_op(")")) break;
        tup.add(star_named_expression());
      }
      expect_op(")");
      return tup;
    }
    expect_op(")");
    if (first.kind == "Starred") fail("cannot use starred expression here");
    return first;
  }

  Node list_atom() {
    expect_op("[");
    Node list("List");
    if (at_op("]")) {
      next();
      return list;
    }
    Node first = star_named_expression();
    if (at_comprehension()) {
      if (first.kind == "Starred") fail("iterable unpacking cannot be used in comprehension");
      Node comp("ListComp");
      comp.add(std::move(first));
      comprehensions(comp);
      expect_op("]");
      return comp;
    }
    list.add(std::move(first));
    while (at_op(",")) {
      next();
      if (at_op("]")) break;
      list.add(star_named_expression());
    }
    expect_op("]");
    return list;
  }

  void dict_item(Node& dict) {
    if (at_op("**")) {
      next();
      dict.add(Node("unpack").add(bitwise_or()));
      return;
    }
    Node pair("pair");
    pair.add(expression());
    expect_op(":");
    pair.add(expression());
    dict.add(std::move(pair));
  }

  Node brace_atom() {
    expect_op("{");
    if (at_op("}")) {
      next();
      return Node("Dict");
    }

    if (at_op("**")) {
      Node dict("Dict");
      dict_item(dict);
      if (at_comprehension()) fail("dict unpacking cannot be used in dict comprehension");
      while (at_op(",")) {
        next();
        if (at_op("}")) break;
        dict_item(dict);
      }
      expect_op("}");
      return dict;
    }

    Node first = star_named_expression();
    if (at_op(":")) {
      if (first.kind == "Starred") fail("cannot use a starred expression in a dictionary value");
      next();
      Node pair("pair");
      pair.add(std::move(first));
      pair.add(expression());
      if (at_comprehension()) {
        Node comp("DictComp");
        comp.add(std::move(pair));
        comprehensions(comp);
        expect_op("}");
        return comp;
      }
      Node dict("Dict");
      dict.add(std::move(pair));
      while (at_op(",")) {
        next();
        if (at_op("}")) break;
        dict_item(dict);
      }
      expect_op("}");
      return dict;
    }

    if (at_comprehension()) {
      if (first.kind == "Starred") fail("iterable unpacking cannot be used in comprehension");
      Node comp("SetComp");
      comp.add(std::move(first));
      comprehensions(comp);
      expect_op("}");
      return comp;
    }
    Node set("Set");
    set.add(std::move(first));
    while (at_op(",")) {
      next();
      if (at_op("}")) break;
      set.add(star_named_expression());
    }
    expect_op("}");
    return set;
  }
};

void dump_into(const Node& n, std::string& out) {
  out += n.kind;
  if (!n.value.empty()) {
    out += '\'';
    for (char c : n.value) {
      const auto uc = static_cast<unsigned char>(c);
      if (c == '\\' || c == '\'') {
        out += '\\';
        out += c;
      } else if (uc < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02x", uc);
        out += buf;
      } else {
        out += c;
      }
    }
    out += '\'';
  }
  if (n.children.empty()) return;
  out += '(';
  for (size_t i = 0; i < n.children.size(); ++i) {
    if (i) out += ", ";
    dump_into(n.children[i], out);
  }
  out += ')';
}

}  // namespace

std::string dump(const Node& node) {
  std::string out;
  dump_into(node, out);
  return out;
}

ParseResult parse(std::string_view source) {
  ParseResult r;
  auto tokens = tokenize(source);
  r.tokens = std::move(tokens.tokens);
  if (tokens.error) {
    r.error = tokens.error;
    return r;
  }
  try {
    Parser parser(r.tokens);
    r.module = parser.module();
  } catch (const ParseFailure& failure) {
    r.error = failure.error;
    r.module = Node("Module");
  }
  return r;
}

}  // namespace ace::pysyntax
