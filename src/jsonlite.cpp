#include "ace/jsonlite.hpp"

// Numbers are read with std::from_chars and written with format_double(), so
// neither direction depends on the C locale. Non-negative integers are kept
// as u64; anything with a sign, fraction or exponent becomes a double.

#include <charconv>
#include <cstdio>
#include <string_view>
#include <system_error>

namespace ace::jsonlite {

namespace {

constexpr std::size_t kMaxDepth = 512;

bool is_json_ws(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }
bool is_digit(char c) { return c >= '0' && c <= '9'; }

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

void put_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
    return;
  }
  char buf[4];
  int len = 0;
  if (cp < 0x800) {
    buf[len++] = static_cast<char>(0xC0 | (cp >> 6));
  } else if (cp < 0x10000) {
    buf[len++] = static_cast<char>(0xE0 | (cp >> 12));
    buf[len++] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
  } else {
    buf[len++] = static_cast<char>(0xF0 | (cp >> 18));
    buf[len++] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    buf[len++] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
  }
  buf[len++] = static_cast<char>(0x80 | (cp & 0x3F));
  out.append(buf, static_cast<std::size_t>(len));
}

// Recursive-descent reader. The first error sticks; every routine returns
// early once `error` is set.
class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {}

  Value document() {
    Value v = value(0);
    skip_ws();
    if (!error && pos_ != text_.size()) fail("json_parse_error", "unexpected data after value");
    return error ? Value{} : v;
  }

  std::optional<JsonError> error;

 private:
  void fail(const char* code, const std::string& what) {
    if (!error) error = JsonError{code, what + " at offset " + std::to_string(pos_)};
  }

  void skip_ws() {
    while (pos_ < text_.size() && is_json_ws(text_[pos_])) ++pos_;
  }

  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return text_[pos_]; }

  bool consume(char c) {
    skip_ws();
    if (at_end() || peek() != c) return false;
    ++pos_;
    return true;
  }

  bool literal(std::string_view word) {
    if (text_.compare(pos_, word.size(), word) != 0) return false;
    pos_ += word.size();
    return true;
  }

  Value value(std::size_t depth) {
    skip_ws();
    if (at_end()) {
      fail("json_parse_error", "unexpected end of input");
      return {};
    }
    if (depth > kMaxDepth) {
      fail("json_parse_error", "nesting too deep");
      return {};
    }
    switch (peek()) {
      case '{': return Value{object(depth + 1)};
      case '[': return Value{array(depth + 1)};
      case '"': return Value{string()};
      default: break;
    }
    if (literal("true")) return Value{true};
    if (literal("false")) return Value{false};
    if (literal("null")) return Value{nullptr};
    return number();
  }

  Object object(std::size_t depth) {
    Object out;
    ++pos_;  // '{'
    if (consume('}')) return out;
    do {
      skip_ws();
      if (at_end() || peek() != '"') {
        fail("json_parse_error", "expected object key");
        break;
      }
      std::string key = string();
      if (error) break;
      if (out.count(key)) {
        fail("json_duplicate_key", "duplicate key \"" + key + "\"");
        break;
      }
      if (!consume(':')) {
        fail("json_parse_error", "expected ':'");
        break;
      }
      Value v = value(depth);
      if (error) break;
      out.emplace(std::move(key), std::move(v));
      if (consume('}')) return out;
    } while (consume(','));
    fail("json_parse_error", "expected ',' or '}'");
    return out;
  }

  Array array(std::size_t depth) {
    Array out;
    ++pos_;  // '['
    if (consume(']')) return out;
    do {
      Value v = value(depth);
      if (error) break;
      out.push_back(std::move(v));
      if (consume(']')) return out;
    } while (consume(','));
    fail("json_parse_error", "expected ',' or ']'");
    return out;
  }

  bool hex4(std::uint32_t& cp) {
    if (pos_ + 4 > text_.size()) return false;
    cp = 0;
    for (std::size_t k = 0; k < 4; ++k) {
      const int h = hex_value(text_[pos_ + k]);
      if (h < 0) return false;
      cp = (cp << 4) | static_cast<std::uint32_t>(h);
    }
    pos_ += 4;
    return true;
  }

  std::string string() {
    std::string out;
    ++pos_;  // opening quote
    while (!at_end()) {
      const char c = text_[pos_++];
      if (c == '"') return out;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (at_end()) break;
      const char esc = text_[pos_++];
      switch (esc) {
        case '"': case '\\': case '/': out.push_back(esc); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          std::uint32_t cp = 0;
          if (!hex4(cp)) {
            fail("json_parse_error", "bad \\u escape");
            return {};
          }
          // Surrogate pair.
          if (cp >= 0xD800 && cp <= 0xDBFF && text_.compare(pos_, 2, "\\u") == 0) {
            const std::size_t save = pos_;
            pos_ += 2;
            std::uint32_t low = 0;
            if (hex4(low) && low >= 0xDC00 && low <= 0xDFFF) {
              cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            } else {
              pos_ = save;
            }
          }
          put_utf8(out, cp);
          break;
        }
        default:
          fail("json_parse_error", std::string("unknown escape \\") + esc);
          return {};
      }
    }
    fail("json_parse_error", "unterminated string");
    return {};
  }

  Value number() {
    const std::size_t begin = pos_;
    bool integral = true;
    if (!at_end() && peek() == '-') {
      integral = false;
      ++pos_;
    }
    if (at_end() || !is_digit(peek())) {
      pos_ = begin;
      fail("json_parse_error", "unexpected character");
      return {};
    }
    while (!at_end() && is_digit(peek())) ++pos_;
    if (!at_end() && peek() == '.') {
      integral = false;
      ++pos_;
      if (at_end() || !is_digit(peek())) {
        fail("json_parse_error", "digit expected after '.'");
        return {};
      }
      while (!at_end() && is_digit(peek())) ++pos_;
    }
    if (!at_end() && (peek() == 'e' || peek() == 'E')) {
      integral = false;
      ++pos_;
      if (!at_end() && (peek() == '+' || peek() == '-')) ++pos_;
      if (at_end() || !is_digit(peek())) {
        fail("json_parse_error", "digit expected in exponent");
        return {};
      }
      while (!at_end() && is_digit(peek())) ++pos_;
    }

    const char* first = text_.data() + begin;
    const char* last = text_.data() + pos_;
    if (integral) {
      std::uint64_t n = 0;
      const auto [ptr, ec] = std::from_chars(first, last, n);
      if (ec == std::errc() && ptr == last) return Value{n};
    } else {
      double d = 0.0;
      const auto [ptr, ec] = std::from_chars(first, last, d);
      if (ec == std::errc() && ptr == last) return Value{d};
    }
    fail("json_parse_error", "number out of range");
    return {};
  }

  const std::string& text_;
  std::size_t pos_{0};
};

void escape_into(std::string& out, const std::string& s) {
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
}

void quote_into(std::string& out, const std::string& s) {
  out.push_back('"');
  escape_into(out, s);
  out.push_back('"');
}

// indent < 0 selects the compact form.
void write(std::string& out, const Value& v, int indent, int depth) {
  const bool pretty = indent >= 0;
  auto newline = [&](int level) {
    if (!pretty) return;
    out.push_back('\n');
    out.append(static_cast<std::size_t>(indent * level), ' ');
  };

  if (const auto* obj = v.as_object()) {
    if (obj->empty()) {
      out += "{}";
      return;
    }
    out.push_back('{');
    bool first = true;
    for (const auto& [key, member] : *obj) {
      if (!first) out.push_back(',');
      first = false;
      newline(depth + 1);
      quote_into(out, key);
      out += pretty ? ": " : ":";
      write(out, member, indent, depth + 1);
    }
    newline(depth);
    out.push_back('}');
  } else if (const auto* arr = v.as_array()) {
    if (arr->empty()) {
      out += "[]";
      return;
    }
    out.push_back('[');
    for (std::size_t k = 0; k < arr->size(); ++k) {
      if (k) out.push_back(',');
      newline(depth + 1);
      write(out, (*arr)[k], indent, depth + 1);
    }
    newline(depth);
    out.push_back(']');
  } else if (const auto* str = v.as_string()) {
    quote_into(out, *str);
  } else if (v.is<bool>()) {
    out += std::get<bool>(v.v) ? "true" : "false";
  } else if (v.is<std::uint64_t>()) {
    out += std::to_string(std::get<std::uint64_t>(v.v));
  } else if (v.is<double>()) {
    out += format_double(std::get<double>(v.v));
  } else {
    out += "null";
  }
}

template <typename T>
const T* member_as(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : std::get_if<T>(&it->second.v);
}

}  // namespace

// Fixed, 6 decimals, trailing zeros trimmed, keeping one digit after the point.
std::string format_double(double d) {
  char buf[400];
  const auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::fixed, 6);
  if (ec != std::errc()) return "0.0";
  std::string text(buf, end);
  const auto last = text.find_last_not_of('0');
  text.erase(text[last] == '.' ? last + 2 : last + 1);
  return text;
}

std::string to_json(const Value& v) {
  std::string out;
  write(out, v, -1, 0);
  return out;
}

std::string to_json_pretty(const Value& v, int indent) {
  std::string out;
  write(out, v, indent < 0 ? 0 : indent, 0);
  return out;
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  Value v = reader.document();
  if (error) *error = reader.error;
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value v = parse_value(text, &err);
  if (!err && !v.is<Object>()) err = JsonError{"json_parse_error", "document is not a JSON object"};
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(v.v));
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* s = member_as<std::string>(obj, key);
  return s ? *s : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* b = member_as<bool>(obj, key);
  return b ? *b : def;
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const auto* n = member_as<std::uint64_t>(obj, key);
  return n ? *n : def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  if (const auto* d = member_as<double>(obj, key)) return *d;
  if (const auto* n = member_as<std::uint64_t>(obj, key)) return static_cast<double>(*n);
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  const Array* arr = get_array(obj, key);
  if (!arr) return out;
  for (const auto& item : *arr) {
    if (const auto* s = item.as_string()) out.push_back(*s);
  }
  return out;
}

std::vector<std::uint64_t> get_u64_array(const Object& obj, const std::string& key) {
  std::vector<std::uint64_t> out;
  const Array* arr = get_array(obj, key);
  if (!arr) return out;
  for (const auto& item : *arr) {
    if (item.is<std::uint64_t>()) out.push_back(std::get<std::uint64_t>(item.v));
  }
  return out;
}

std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  const Object* inner = get_object(obj, key);
  if (!inner) return out;
  for (const auto& [k, v] : *inner) {
    if (const auto* s = v.as_string()) out[k] = *s;
  }
  return out;
}

const Object* get_object(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return it->second.as_object();
}

const Array* get_array(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return it->second.as_array();
}

Array to_array(const std::vector<std::string>& items) {
  Array out;
  out.reserve(items.size());
  for (const auto& s : items) out.emplace_back(s);
  return out;
}

}  // namespace ace::jsonlite
