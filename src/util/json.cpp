#include "agripv/util/json.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace agripv::json {
namespace {

bool has_utf8_bom(const std::string& s) {
  return s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF &&
         static_cast<unsigned char>(s[1]) == 0xBB && static_cast<unsigned char>(s[2]) == 0xBF;
}

class Reader {
 public:
  explicit Reader(const std::string& text) : s_(text), pos_(has_utf8_bom(text) ? 3 : 0) {}

  Value document() {
    Value v = value();
    skip_ws();
    if (pos_ != s_.size()) fail("trailing characters after document");
    return v;
  }

 private:
  const std::string& s_;
  std::size_t pos_;

  char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }
  char next() { return pos_ < s_.size() ? s_[pos_++] : '\0'; }
  bool at_end() const { return pos_ >= s_.size(); }

  void skip_ws() {
    while (!at_end() && std::isspace(static_cast<unsigned char>(s_[pos_]))) ++pos_;
  }

  [[noreturn]] void fail(const std::string& what) const {
    const std::size_t at = std::min(pos_, s_.size());
    std::size_t line_begin = has_utf8_bom(s_) ? 3 : 0;
    int line = 1;
    for (std::size_t k = line_begin; k < at; ++k) {
      if (s_[k] == '\n') {
        ++line;
        line_begin = k + 1;
      }
    }
    std::size_t line_end = line_begin;
    while (line_end < s_.size() && s_[line_end] != '\n' && s_[line_end] != '\r') ++line_end;
    const int col = static_cast<int>(at - line_begin) + 1;

    // Long lines (minified documents) are windowed around the error position.
    constexpr std::size_t kWindow = 60;
    std::size_t from = line_begin;
    std::size_t to = line_end;
    if (at > from + kWindow) from = at - kWindow;
    if (to > at + kWindow) to = at + kWindow;

    std::ostringstream ss;
    ss << "JSON parse error at " << at << " (line " << line << ", col " << col << "): " << what;
    if (to > from) {
      ss << "\n" << s_.substr(from, to - from) << "\n" << std::string(at - from, ' ') << "^";
    }
    throw std::runtime_error(ss.str());
  }

  void expect(char c) {
    skip_ws();
    if (peek() != c) fail(std::string("expected '") + c + "'");
    ++pos_;
  }

  bool accept(char c) {
    skip_ws();
    if (peek() != c) return false;
    ++pos_;
    return true;
  }

  Value value() {
    skip_ws();
    switch (peek()) {
      case 'n': keyword("null"); return nullptr;
      case 't': keyword("true"); return true;
      case 'f': keyword("false"); return false;
      case '"': return string();
      case '[': return array_value();
      case '{': return object_value();
      default: break;
    }
    if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) return number();
    if (at_end()) fail("unexpected end of input");
    fail("unexpected character");
  }

  void keyword(const char* word) {
    for (const char* p = word; *p; ++p) {
      if (next() != *p) fail(std::string("invalid literal, expected ") + word);
    }
  }

  void digits(const char* what) {
    if (!std::isdigit(static_cast<unsigned char>(peek()))) fail(what);
    while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
  }

  Value number() {
    const std::size_t begin = pos_;
    if (peek() == '-') ++pos_;
    if (peek() == '0') {
      ++pos_;
    } else {
      digits("invalid number");
    }
    if (peek() == '.') {
      ++pos_;
      digits("invalid number fraction");
    }
    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      digits("invalid exponent");
    }
    std::istringstream in(s_.substr(begin, pos_ - begin));
    in.imbue(std::locale::classic());
    double d = 0.0;
    in >> d;
    if (in.fail()) fail("number out of range");
    return d;
  }

  unsigned hex4() {
    unsigned code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = next();
      code <<= 4;
      if (h >= '0' && h <= '9') {
        code |= static_cast<unsigned>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code |= static_cast<unsigned>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code |= static_cast<unsigned>(h - 'A' + 10);
      } else {
        fail("bad \\u escape");
      }
    }
    return code;
  }

  static void put_utf8(std::uint32_t cp, std::string& out) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  std::string string() {
    expect('"');
    std::string out;
    for (;;) {
      if (at_end()) fail("unterminated string");
      const char c = next();
      if (c == '"') return out;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      const char e = next();
      switch (e) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          std::uint32_t cp = hex4();
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (next() != '\\' || next() != 'u') fail("expected low surrogate");
            const unsigned lo = hex4();
            if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
            cp = 0x10000u + ((cp - 0xD800u) << 10) + (lo - 0xDC00u);
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unexpected low surrogate");
          }
          put_utf8(cp, out);
          break;
        }
        default: fail("unknown escape");
      }
    }
  }

  Value array_value() {
    expect('[');
    Array out;
    if (accept(']')) return out;
    do {
      out.push_back(value());
    } while (accept(','));
    expect(']');
    return out;
  }

  Value object_value() {
    expect('{');
    Object out;
    if (accept('}')) return out;
    do {
      skip_ws();
      if (peek() != '"') fail("expected string key");
      std::string key = string();
      expect(':');
      out[std::move(key)] = value();
    } while (accept(','));
    expect('}');
    return out;
  }
};

void write_escaped(const std::string& in, std::ostringstream& out) {
  out << '"';
  for (const char c : in) {
    switch (c) {
      case '"': out << "\\\""; break;
      case '\\': out << "\\\\"; break;
      case '\n': out << "\\n"; break;
      case '\r': out << "\\r"; break;
      case '\t': out << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(static_cast<unsigned char>(c)) << std::dec << std::setfill(' ');
        } else {
          out << c;
        }
    }
  }
  out << '"';
}

void write_number(double d, std::ostringstream& out) {
  if (!std::isfinite(d)) {
    out << "null";
    return;
  }
  if (std::fabs(d) < 9.0e15 && d == std::floor(d)) {
    out << static_cast<std::int64_t>(d);
    return;
  }
  out << std::setprecision(std::numeric_limits<double>::max_digits10) << d;
}

void write_value(const Value& v, std::ostringstream& out, int indent, int depth) {
  const auto newline = [&](int d) {
    if (indent <= 0) return;
    out << '\n' << std::string(static_cast<std::size_t>(d * indent), ' ');
  };

  if (v.is_null()) {
    out << "null";
  } else if (const bool* b = v.as_bool()) {
    out << (*b ? "true" : "false");
  } else if (const double* d = v.as_number()) {
    write_number(*d, out);
  } else if (const std::string* s = v.as_string()) {
    write_escaped(*s, out);
  } else if (const Array* a = v.as_array()) {
    out << '[';
    for (std::size_t i = 0; i < a->size(); ++i) {
      if (i) out << ',';
      newline(depth + 1);
      write_value((*a)[i], out, indent, depth + 1);
    }
    if (!a->empty()) newline(depth);
    out << ']';
  } else {
    const Object& o = v.object();
    std::vector<const std::string*> keys;
    keys.reserve(o.size());
    for (const auto& kv : o) keys.push_back(&kv.first);
    std::sort(keys.begin(), keys.end(), [](const std::string* x, const std::string* y) { return *x < *y; });

    out << '{';
    for (std::size_t i = 0; i < keys.size(); ++i) {
      if (i) out << ',';
      newline(depth + 1);
      write_escaped(*keys[i], out);
      out << (indent > 0 ? ": " : ":");
      write_value(o.at(*keys[i]), out, indent, depth + 1);
    }
    if (!keys.empty()) newline(depth);
    out << '}';
  }
}

} // namespace

bool Value::is_null() const { return std::holds_alternative<std::nullptr_t>(*this); }
bool Value::is_bool() const { return std::holds_alternative<bool>(*this); }
bool Value::is_number() const { return std::holds_alternative<double>(*this); }
bool Value::is_string() const { return std::holds_alternative<std::string>(*this); }
bool Value::is_array() const { return std::holds_alternative<Array>(*this); }
bool Value::is_object() const { return std::holds_alternative<Object>(*this); }

const bool* Value::as_bool() const { return std::get_if<bool>(this); }
const double* Value::as_number() const { return std::get_if<double>(this); }
const std::string* Value::as_string() const { return std::get_if<std::string>(this); }
const Array* Value::as_array() const { return std::get_if<Array>(this); }
const Object* Value::as_object() const { return std::get_if<Object>(this); }

const Value& Value::at(const std::string& key) const {
  const Object& o = object();
  const auto it = o.find(key);
  if (it == o.end()) throw std::runtime_error("JSON object missing key: " + key);
  return it->second;
}

const Value& Value::at(std::size_t index) const {
  const Array& a = array();
  if (index >= a.size()) throw std::runtime_error("JSON array index out of range");
  return a[index];
}

const Value* Value::find(const std::string& key) const {
  const Object* o = as_object();
  if (!o) return nullptr;
  const auto it = o->find(key);
  return it == o->end() ? nullptr : &it->second;
}

bool Value::bool_value(bool def) const {
  const bool* p = as_bool();
  return p ? *p : def;
}

double Value::number_value(double def) const {
  const double* p = as_number();
  return p ? *p : def;
}

std::int64_t Value::int_value(std::int64_t def) const {
  const double* p = as_number();
  return p ? static_cast<std::int64_t>(*p) : def;
}

std::string Value::string_value(const std::string& def) const {
  const std::string* p = as_string();
  return p ? *p : def;
}

const Object& Value::object() const {
  const Object* o = as_object();
  if (!o) throw std::runtime_error("JSON value is not an object");
  return *o;
}

const Array& Value::array() const {
  const Array* a = as_array();
  if (!a) throw std::runtime_error("JSON value is not an array");
  return *a;
}

Value parse(const std::string& text) { return Reader(text).document(); }

std::string stringify(const Value& v, int indent) {
  std::ostringstream out;
  write_value(v, out, indent, 0);
  return out.str();
}

Value object(Object o) { return Value(std::move(o)); }
Value array(Array a) { return Value(std::move(a)); }

} // namespace agripv::json
