#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "ace/guard.hpp"
#include "ace/pysyntax.hpp"

namespace py = ace::pysyntax;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool parses(const std::string& src) { return py::parse(src).ok(); }

std::string dump_of(const std::string& src) {
  const auto r = py::parse(src);
  expect(r.ok(), "expected to parse: " + src + (r.error ? " (" + r.error->to_string() + ")" : ""));
  return py::dump(r.module);
}

bool same_tree(const std::string& a, const std::string& b) { return dump_of(a) == dump_of(b); }

const std::vector<std::string> kValidPrograms = {
    "",
    "x = 1\n",
    "x = 1",  // no trailing newline
    "import os, sys as system\nfrom . import a\nfrom ..pkg.mod import (b, c as d,)\n",
    "@decorator\n@other(arg=1)\nclass C(Base, metaclass=Meta):\n    \"\"\"doc\"\"\"\n"
    "    def method(self, a, /, b=2, *args, c, d=4, **kw) -> int:\n        return a + b\n",
    "async def f():\n    async with a as b, c:\n        await g()\n    async for x in y:\n        pass\n",
    "squares = [x * x for x in range(10) if x % 2]\nd = {k: v for k, v in items}\n"
    "s = {x for x in y}\ng = (x async for x in y)\n",
    "f = lambda a, *b, c=1, **d: (a, b, c, d)\n",
    "if (n := len(a)) > 10:\n    print(f\"too long ({n} elements)\")\n",
    "try:\n    pass\nexcept* ValueError as e:\n    raise\nexcept* (TypeError, KeyError):\n    pass\n",
    "try:\n    x()\nexcept Exception as exc:\n    raise RuntimeError('x') from exc\nelse:\n    y()\n"
    "finally:\n    z()\n",
    "with (open(a) as f, open(b) as g):\n    pass\n",
    "match command.split():\n    case [\"go\", direction]:\n        pass\n"
    "    case Point(x=0, y=0) | None:\n        pass\n    case {\"k\": v, **rest} if v:\n        pass\n"
    "    case _:\n        pass\n",
    "type Alias[T] = list[T]\ndef first[T: int, *Ts, **P](x: T) -> T:\n    return x\n",
    "x = a if b else c\ny = not a and b or c\nz = a < b <= c != d is not e in f not in g\n",
    "global g\ndef outer():\n    v = 1\n    def inner():\n        nonlocal v\n        v += 1\n",
    "print(*args, sep='', **kwargs)\nt = a[1:2, ::3, ...]\n",
    "x = 1; y = 2; del x, y\nassert x, 'msg'\n",
    "value = 0x_ff + 0o17 + 0b1010 + 1_000_000 + 1.5e-3 + 3j + .5\n",
    "s = b'bytes' + rb'raw\\d'\nt = '''triple\nquoted'''\nu = u'unicode'\n",
    "def gen():\n    x = yield\n    yield from other()\n",
    "if a:\n    pass\nelif b:\n    pass\nelse:\n    pass\nwhile True:\n    break\nelse:\n    pass\n",
    "x = [\n    1,  # comment\n    2,\n]\ny = 1 + \\\n    2\n",
    "class E: pass\n",
    "match = 1\ncase = 2\ntype = 3\n",  // soft keywords as names
};

// ---------------------------------------------------------------------------
// Tokenizer
// ---------------------------------------------------------------------------

void test_render_roundtrip() {
  for (const auto& src : kValidPrograms) {
    const auto t = py::tokenize(src);
    expect(t.ok(), "tokenize failed: " + src);
    expect(py::render(t.tokens) == src, "render(tokenize(src)) != src for: " + src);
  }
}

void test_render_roundtrip_crlf_and_tabs() {
  const std::string src = "def f():\r\n\tif x:\r\n\t\treturn 1  # one\r\n\r\n\treturn 2\r\n";
  const auto t = py::tokenize(src);
  expect(t.ok(), "CRLF source must tokenize");
  expect(py::render(t.tokens) == src, "CRLF source must render byte-identically");
}

void test_token_positions() {
  const auto t = py::tokenize("x = 1\nyy = 2\n");
  expect(t.ok(), "tokenize ok");
  bool found = false;
  for (const auto& tok : t.tokens) {
    if (tok.kind == py::TokenKind::name && tok.text == "yy") {
      expect(tok.line == 2 && tok.col == 0, "yy must be at line 2, col 0");
      found = true;
    }
  }
  expect(found, "yy token present");
  expect(t.tokens.back().kind == py::TokenKind::endmarker, "stream ends with ENDMARKER");
}

void test_indent_dedent_balance() {
  const auto t = py::tokenize("if a:\n    if b:\n        c\nd\n");
  expect(t.ok(), "tokenize ok");
  int depth = 0;
  for (const auto& tok : t.tokens) {
    if (tok.kind == py::TokenKind::indent) ++depth;
    if (tok.kind == py::TokenKind::dedent) --depth;
    expect(depth >= 0, "dedent never outruns indent");
  }
  expect(depth == 0, "indents balanced at EOF");
}

// ---------------------------------------------------------------------------
// Parser: acceptance and rejection
// ---------------------------------------------------------------------------

void test_valid_programs_parse() {
  for (const auto& src : kValidPrograms) {
    const auto r = py::parse(src);
    expect(r.ok(), "expected to parse: " + src + (r.error ? " -> " + r.error->to_string() : ""));
  }
}

void test_invalid_programs_rejected() {
  const std::vector<std::string> bad = {
      "def f(:\n    pass\n",
      "x = (1,\n",
      "return = 1\n",
      "  x = 1\n",
      "if x:\npass\n",
      "x + 1 = 2\n",
      "s = 'abc\n",
      "n = 0777\n",
      "def f(a=1, b):\n    pass\n",
      "f(**a, *b)\n",
      "a, *b, *c = d\n",
      "try:\n    pass\n",
      "x = ]\n",
      "class\n",
      "x = = 1\n",
      "for x in :\n    pass\n",
      "f(x for x in y, 1)\n",
      "try:\n    pass\nexcept* A:\n    pass\nexcept B:\n    pass\n",
      "x = b'a' 'b'\n",
  };
  for (const auto& src : bad) expect(!parses(src), "expected a syntax error for: " + src);
}

void test_error_location() {
  const auto r = py::parse("x = 1\ny = (2,\n");
  expect(!r.ok(), "unclosed bracket rejected");
  expect(r.error->line == 2, "error reported on line 2");
  expect(r.error->message.find("never closed") != std::string::npos, "message names the bracket");
  expect(r.error->to_string().rfind("line 2, col ", 0) == 0, "to_string is 'line L, col C: ...'");
}

void test_parse_never_throws_on_garbage() {
  const std::vector<std::string> junk = {
      std::string("\0\0", 2), "(((((((((", "\"\"\"", "@", "\\", "def", ":::", "\t\t\tx", "x = $",
  };
  for (const auto& src : junk) {
    const auto r = py::parse(src);
    expect(!r.ok(), "garbage input must produce an error, not a tree");
  }
}

void test_deep_nesting_bounded() {
  const std::string src = "x = " + std::string(2000, '[') + std::string(2000, ']') + "\n";
  const auto r = py::parse(src);
  expect(!r.ok(), "pathological nesting is rejected instead of overflowing the stack");
}

// ---------------------------------------------------------------------------
// Parser: canonical dump
// ---------------------------------------------------------------------------

void test_dump_ignores_formatting() {
  expect(same_tree("x=1\n", "x = 1  # set x\n"), "spacing and comments ignored");
  expect(same_tree("s = 'a'\n", "s = \"a\"\n"), "quote style ignored");
  expect(same_tree("n = 0x10\n", "n = 16\n"), "hex spelling ignored");
  expect(same_tree("n = 1_000\n", "n = 1000\n"), "digit separators ignored");
  expect(same_tree("f = 1.0\n", "f = 1.\n"), "float spelling ignored");
  expect(same_tree("y = (a)\n", "y = a\n"), "redundant parentheses ignored");
  expect(same_tree("s = 'a' 'b'\n", "s = 'ab'\n"), "implicit concatenation folded");
  expect(same_tree("x = [1,\n     2]\n", "x = [1, 2]\n"), "line breaks inside brackets ignored");
  expect(same_tree("s = '\\x41'\n", "s = 'A'\n"), "escape sequences decoded");
  expect(same_tree("if a:\n    b\n", "if a:\n        b\n"), "indent width ignored");
}

void test_dump_detects_semantic_change() {
  expect(!same_tree("x = 1\n", "x = 2\n"), "literal change detected");
  expect(!same_tree("y = a - b\n", "y = b - a\n"), "operand order detected");
  expect(!same_tree("f(a, b)\n", "f(b, a)\n"), "argument order detected");
  expect(!same_tree("y = (a + b) * c\n", "y = a + b * c\n"), "grouping that changes precedence detected");
  expect(!same_tree("s = 'a'\n", "s = b'a'\n"), "str vs bytes detected");
  expect(!same_tree("if a:\n    b\nc\n", "if a:\n    b\n    c\n"), "block membership detected");
  expect(!same_tree("x = f'{a}'\n", "x = f'{b}'\n"), "f-string body compared as written");
}

void test_dump_value_normalization() {
  expect(dump_of("n = 0x10\n").find("Int'16'") != std::string::npos, "hex normalized to decimal");
  expect(dump_of("n = 0b101\n").find("Int'5'") != std::string::npos, "binary normalized to decimal");
  expect(dump_of("n = 0o777\n").find("Int'511'") != std::string::npos, "octal normalized to decimal");
  expect(dump_of("x = 1\n").rfind("Module", 0) == 0, "dump root is Module");
}

void test_dump_escapes_control_bytes() {
  const std::string d = dump_of("s = '\\n'\n");
  expect(d.find("\\x0a") != std::string::npos, "newline inside a value is dumped as \\x0a");
  expect(d.find('\n') == std::string::npos, "dump is single-line");
}

// ---------------------------------------------------------------------------
// Guard checks built on the front-end
// ---------------------------------------------------------------------------

void test_guard_checks() {
  auto ok = ace::verify_python_parse("def f():\n    return 1\n");
  expect(ok.first && ok.second.empty(), "valid source passes parse check");

  auto bad = ace::verify_python_parse("def f(:\n");
  expect(!bad.first && bad.second.size() == 1, "invalid source fails with one error");
  expect(bad.second[0].rfind("SyntaxError: ", 0) == 0, "parse error prefixed with SyntaxError");

  auto eq = ace::verify_ast_equivalence("x=1\n", "x = 1\n");
  expect(eq.first, "formatting-only change is AST-equivalent");
  auto ne = ace::verify_ast_equivalence("x = 1\n", "x = 2\n");
  expect(!ne.first, "semantic change is not AST-equivalent");
  expect(ne.second[0] == "AST structures differ (semantic change detected)", "AST mismatch message");

  auto rt = ace::verify_cst_roundtrip("x = [\n  1,  # one\n]\n");
  expect(rt.first, "CST roundtrip is lossless");
}

void test_guard_edit_strictness() {
  const std::string before = "x = 1\n";
  const std::string after = "x = 2\n";
  auto lax = ace::guard_edit("m.py", before, after, false);
  expect(lax.passed && lax.guard_type == "all", "non-strict guard allows semantic changes");
  auto strict = ace::guard_edit("m.py", before, after, true);
  expect(!strict.passed && strict.guard_type == "ast_equiv", "strict guard rejects semantic changes");
  auto broken = ace::guard_edit("m.py", before, "x = (\n", false);
  expect(!broken.passed && broken.guard_type == "parse", "parse failure reported first");
}

}  // namespace

int main() {
  std::cout << "=== Ace Python Syntax Front-end Tests ===\n";

  std::cout << "\n[Tokenizer]\n";
  run_test("render roundtrip", test_render_roundtrip);
  run_test("render roundtrip CRLF + tabs", test_render_roundtrip_crlf_and_tabs);
  run_test("token positions", test_token_positions);
  run_test("indent/dedent balance", test_indent_dedent_balance);

  std::cout << "\n[Parser]\n";
  run_test("valid programs parse", test_valid_programs_parse);
  run_test("invalid programs rejected", test_invalid_programs_rejected);
  run_test("error location", test_error_location);
  run_test("garbage input never throws", test_parse_never_throws_on_garbage);
  run_test("deep nesting bounded", test_deep_nesting_bounded);

  std::cout << "\n[Canonical dump]\n";
  run_test("formatting ignored", test_dump_ignores_formatting);
  run_test("semantic change detected", test_dump_detects_semantic_change);
  run_test("value normalization", test_dump_value_normalization);
  run_test("control bytes escaped", test_dump_escapes_control_bytes);

  std::cout << "\n[Guard]\n";
  run_test("guard checks", test_guard_checks);
  run_test("guard_edit strictness", test_guard_edit_strictness);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
