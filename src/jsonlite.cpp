#include "cellstash/jsonlite.hpp"

// Strict JSON reader/writer used for every persisted and exchanged record.
//
// DETERMINISM RISKS:
//   - Fractional numbers are accepted on input (config files) but no stash
//     record writes one. Commitments only ever cover integers and strings.
//   - \u escapes are decoded to UTF-8 so that two spellings of the same
//     string canonicalize identically.

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace cellstash::jsonlite {

namespace {

void append_utf8(std::string& o, unsigned cp) {
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

struct Parser {
  const std::string& s;
  size_t i{0};
  std::optional<JsonError> err;
  int depth{0};

  static constexpr int kMaxDepth = 64;

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }
  void fail(const std::string& msg) { if (!err) err = JsonError{"json_parse_error", msg}; }

  // Reads the four hex digits of a \u escape.
  bool hex4(unsigned* cp) {
    if (i + 4 > s.size()) { fail("short \\u escape"); return false; }
    unsigned v = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = s[i++];
      v <<= 4;
      if (h >= '0' && h <= '9') v |= static_cast<unsigned>(h - '0');
      else if (h >= 'a' && h <= 'f') v |= static_cast<unsigned>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') v |= static_cast<unsigned>(h - 'A' + 10);
      else { fail("bad \\u escape"); return false; }
    }
    *cp = v;
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { fail("expected string"); return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (static_cast<unsigned char>(c) < 0x20) { fail("control character in string"); return {}; }
      if (c != '\\') { o += c; continue; }
      if (i >= s.size()) break;
      char n = s[i++];
      switch (n) {
        case 'n': o += '\n'; break;
        case 't': o += '\t'; break;
        case 'r': o += '\r'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case '/': o += '/'; break;
        case '\\': o += '\\'; break;
        case '"': o += '"'; break;
        case 'u': {
          unsigned cp = 0;
          if (!hex4(&cp)) return {};
          if (cp >= 0xDC00 && cp <= 0xDFFF) { fail("unpaired low surrogate"); return {}; }
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            unsigned low = 0;
            if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') {
              fail("unpaired high surrogate");
              return {};
            }
            i += 2;
            if (!hex4(&low)) return {};
            if (low < 0xDC00 || low > 0xDFFF) { fail("unpaired high surrogate"); return {}; }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          }
          append_utf8(o, cp);
          break;
        }
        default: fail("bad escape"); return {};
      }
    }
    fail("unterminated string");
    return {};
  }

  bool parse_number(Value& out) {
    ws();
    const size_t start = i;
    bool negative = false;
    if (i < s.size() && s[i] == '-') { negative = true; ++i; }
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    bool fractional = false;
    if (i < s.size() && s[i] == '.') {
      fractional = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) { fail("invalid number format"); return false; }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      fractional = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) { fail("invalid exponent"); return false; }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    const std::string num = s.substr(start, i - start);
    try {
      if (fractional || negative) out = Value{std::stod(num)};
      else out = Value{static_cast<std::uint64_t>(std::stoull(num))};
    } catch (const std::exception&) {
      fail("number out of range");
      return false;
    }
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { fail("unexpected eof"); return {}; }
    if (++depth > kMaxDepth) { fail("nesting too deep"); return {}; }
    Value out;
    if (s[i] == '{') out = Value{parse_object()};
    else if (s[i] == '[') out = Value{parse_array()};
    else if (s[i] == '"') out = Value{parse_string()};
    else if (s.compare(i, 4, "true") == 0) { i += 4; out = Value{true}; }
    else if (s.compare(i, 5, "false") == 0) { i += 5; out = Value{false}; }
    else if (s.compare(i, 4, "null") == 0) { i += 4; out = Value{nullptr}; }
    else if (!parse_number(out)) fail("unexpected token");
    --depth;
    return out;
  }

  Object parse_object() {
    Object out;
    eat('{');
    if (eat('}')) return out;
    while (!err) {
      ws();
      auto k = parse_string();
      if (err) break;
      if (out.count(k)) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { fail("expected :"); break; }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { fail("expected ,"); break; }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { fail("expected ,"); break; }
    }
    return out;
  }

  Value parse_document() {
    Value v = parse_value();
    ws();
    if (!err && i != s.size()) fail("trailing data");
    return v;
  }
};

std::string format_double(double d) {
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string result(buf, static_cast<size_t>(n));
  while (!result.empty() && result.back() == '0') result.pop_back();
  if (!result.empty() && result.back() == '.') result.push_back('0');
  return result;
}

}  // namespace

std::string escape(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) { needs_escape = true; break; }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    } else {
      o += c;
    }
  }
  return o;
}

std::string serialize(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (const auto* b = std::get_if<bool>(&v.v)) return *b ? "true" : "false";
  if (const auto* str = std::get_if<std::string>(&v.v)) return "\"" + escape(*str) + "\"";
  if (const auto* u = std::get_if<std::uint64_t>(&v.v)) return std::to_string(*u);
  if (const auto* d = std::get_if<double>(&v.v)) return format_double(*d);
  if (const auto* obj = std::get_if<Object>(&v.v)) return serialize(*obj);
  std::string out = "[";
  bool first = true;
  for (const auto& item : std::get<Array>(v.v)) {
    if (!first) out += ",";
    first = false;
    out += serialize(item);
  }
  out += "]";
  return out;
}

std::string serialize(const Object& obj) {
  std::string out = "{";
  bool first = true;
  for (const auto& [k, vv] : obj) {
    if (!first) out += ",";
    first = false;
    out += "\"";
    out += escape(k);
    out += "\":";
    out += serialize(vv);
  }
  out += "}";
  return out;
}

std::optional<JsonError> validate_strict(const std::string& text) {
  Parser p{text};
  (void)p.parse_document();
  return p.err;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_document();
  if (!p.err && !std::holds_alternative<Object>(v.v)) {
    p.err = JsonError{"json_parse_error", "top-level value is not an object"};
  }
  if (error) *error = p.err;
  if (p.err) return {};
  return std::get<Object>(v.v);
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) return def;
  return std::get<bool>(it->second.v);
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) return def;
  return std::get<std::uint64_t>(it->second.v);
}

const Array* get_array(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return std::get_if<Array>(&it->second.v);
}

const Object* get_object(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return std::get_if<Object>(&it->second.v);
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  const Array* arr = get_array(obj, key);
  if (!arr) return out;
  for (const auto& item : *arr) {
    if (const auto* s = as_string(item)) out.push_back(*s);
  }
  return out;
}

}  // namespace cellstash::jsonlite
