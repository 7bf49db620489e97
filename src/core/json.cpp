// core/json.cpp - JSON serialisation and parsing
#include "json.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace clinic {
namespace json {

Value Value::object() {
  Value v;
  v.type_ = Type::Object;
  return v;
}

Value Value::array() {
  Value v;
  v.type_ = Type::Array;
  return v;
}

Value &Value::operator[](const std::string &key) {
  if (type_ == Type::Null) {
    type_ = Type::Object;
  }
  return object_[key];
}

const Value *Value::find(const std::string &key) const {
  if (type_ != Type::Object) {
    return nullptr;
  }
  auto it = object_.find(key);
  return it == object_.end() ? nullptr : &it->second;
}

void Value::push_back(const Value &v) {
  if (type_ == Type::Null) {
    type_ = Type::Array;
  }
  array_.push_back(v);
}

size_t Value::size() const {
  if (type_ == Type::Array)
    return array_.size();
  if (type_ == Type::Object)
    return object_.size();
  return 0;
}

static void escape_string(std::ostringstream &out, const std::string &s) {
  out << '"';
  for (unsigned char c : s) {
    switch (c) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default:
      if (c < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
        out << buf;
      } else {
        out << c;
      }
    }
  }
  out << '"';
}

static void dump_value(std::ostringstream &out, const Value &v, int indent,
                       int depth) {
  auto newline = [&](int d) {
    if (indent > 0) {
      out << '\n' << std::string(static_cast<size_t>(indent * d), ' ');
    }
  };

  switch (v.type()) {
  case Value::Type::Null:
    out << "null";
    break;
  case Value::Type::Bool:
    out << (v.as_bool() ? "true" : "false");
    break;
  case Value::Type::Number: {
    double n = v.as_number();
    if (std::floor(n) == n && std::fabs(n) < 1e15) {
      out << static_cast<long long>(n);
    } else {
      out << n;
    }
    break;
  }
  case Value::Type::String:
    escape_string(out, v.as_string());
    break;
  case Value::Type::Array: {
    if (v.items().empty()) {
      out << "[]";
      break;
    }
    out << '[';
    bool first = true;
    for (const auto &item : v.items()) {
      if (!first)
        out << ',';
      first = false;
      newline(depth + 1);
      dump_value(out, item, indent, depth + 1);
    }
    newline(depth);
    out << ']';
    break;
  }
  case Value::Type::Object: {
    if (v.members().empty()) {
      out << "{}";
      break;
    }
    out << '{';
    bool first = true;
    for (const auto &[key, member] : v.members()) {
      if (!first)
        out << ',';
      first = false;
      newline(depth + 1);
      escape_string(out, key);
      out << (indent > 0 ? ": " : ":");
      dump_value(out, member, indent, depth + 1);
    }
    newline(depth);
    out << '}';
    break;
  }
  }
}

std::string dump(const Value &v, int indent) {
  std::ostringstream out;
  dump_value(out, v, indent, 0);
  return out.str();
}

namespace {

class Parser {
public:
  explicit Parser(const std::string &text) : text_(text) {}

  Value parse_document() {
    Value v = parse_value(0);
    skip_ws();
    if (pos_ != text_.size()) {
      fail("trailing characters");
    }
    return v;
  }

private:
  [[noreturn]] void fail(const std::string &what) const {
    throw ParseError("JSON parse error at offset " + std::to_string(pos_) +
                     ": " + what);
  }

  void skip_ws() {
    while (pos_ < text_.size() &&
           std::isspace(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
  }

  bool consume(const char *literal) {
    size_t len = std::char_traits<char>::length(literal);
    if (text_.compare(pos_, len, literal) == 0) {
      pos_ += len;
      return true;
    }
    return false;
  }

  Value parse_value(int depth) {
    if (depth > 64) {
      fail("nesting too deep");
    }
    skip_ws();
    if (pos_ >= text_.size()) {
      fail("unexpected end of input");
    }

    char c = text_[pos_];
    if (c == '{')
      return parse_object(depth);
    if (c == '[')
      return parse_array(depth);
    if (c == '"')
      return Value(parse_string());
    if (consume("true"))
      return Value(true);
    if (consume("false"))
      return Value(false);
    if (consume("null"))
      return Value();
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parse_number();
    fail(std::string("unexpected character '") + c + "'");
  }

  Value parse_object(int depth) {
    Value obj = Value::object();
    ++pos_;
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return obj;
    }
    while (true) {
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        fail("expected object key");
      }
      std::string key = parse_string();
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        fail("expected ':'");
      }
      ++pos_;
      obj[key] = parse_value(depth + 1);
      skip_ws();
      if (pos_ < text_.size() && text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (pos_ < text_.size() && text_[pos_] == '}') {
        ++pos_;
        return obj;
      }
      fail("expected ',' or '}'");
    }
  }

  Value parse_array(int depth) {
    Value arr = Value::array();
    ++pos_;
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return arr;
    }
    while (true) {
      arr.push_back(parse_value(depth + 1));
      skip_ws();
      if (pos_ < text_.size() && text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (pos_ < text_.size() && text_[pos_] == ']') {
        ++pos_;
        return arr;
      }
      fail("expected ',' or ']'");
    }
  }

  static void append_utf8(std::string &out, unsigned cp) {
    if (cp < 0x80) {
      out += static_cast<char>(cp);
    } else if (cp < 0x800) {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  std::string parse_string() {
    std::string out;
    ++pos_;
    while (pos_ < text_.size()) {
      char c = text_[pos_++];
      if (c == '"')
        return out;
      if (c != '\\') {
        out += c;
        continue;
      }
      if (pos_ >= text_.size())
        break;
      char e = text_[pos_++];
      switch (e) {
      case '"':
      case '\\':
      case '/':
        out += e;
        break;
      case 'b':
        out += '\b';
        break;
      case 'f':
        out += '\f';
        break;
      case 'n':
        out += '\n';
        break;
      case 'r':
        out += '\r';
        break;
      case 't':
        out += '\t';
        break;
      case 'u': {
        unsigned cp = read_hex4();
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          // High surrogate: the low half must follow as another \u escape
          if (text_.compare(pos_, 2, "\\u") != 0)
            fail("unpaired surrogate in \\u escape");
          pos_ += 2;
          unsigned low = read_hex4();
          if (low < 0xDC00 || low > 0xDFFF)
            fail("unpaired surrogate in \\u escape");
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          fail("unpaired surrogate in \\u escape");
        }
        append_utf8(out, cp);
        break;
      }
      default:
        fail("invalid escape");
      }
    }
    fail("unterminated string");
  }

  unsigned read_hex4() {
    if (pos_ + 4 > text_.size())
      fail("truncated \\u escape");
    std::string hex = text_.substr(pos_, 4);
    for (char h : hex) {
      if (!std::isxdigit(static_cast<unsigned char>(h)))
        fail("invalid \\u escape");
    }
    pos_ += 4;
    return static_cast<unsigned>(std::stoul(hex, nullptr, 16));
  }

  Value parse_number() {
    size_t start = pos_;
    if (text_[pos_] == '-')
      ++pos_;
    while (pos_ < text_.size() &&
           (std::isdigit(static_cast<unsigned char>(text_[pos_])) ||
            text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E' ||
            text_[pos_] == '+' || text_[pos_] == '-')) {
      ++pos_;
    }
    std::string num = text_.substr(start, pos_ - start);
    char *end = nullptr;
    double d = std::strtod(num.c_str(), &end);
    if (end == num.c_str() || *end != '\0') {
      fail("invalid number '" + num + "'");
    }
    return Value(d);
  }

  const std::string &text_;
  size_t pos_ = 0;
};

} // namespace

Value parse(const std::string &text) { return Parser(text).parse_document(); }

} // namespace json
} // namespace clinic
