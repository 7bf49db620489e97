// core/json.hpp - Minimal JSON document model
#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace clinic {
namespace json {

class ParseError : public std::runtime_error {
public:
  explicit ParseError(const std::string &msg) : std::runtime_error(msg) {}
};

class Value {
public:
  enum class Type { Null, Bool, Number, String, Array, Object };

  Value() = default;
  Value(bool b) : type_(Type::Bool), bool_(b) {}
  Value(int n) : type_(Type::Number), number_(n) {}
  Value(double n) : type_(Type::Number), number_(n) {}
  Value(const char *s) : type_(Type::String), string_(s) {}
  Value(const std::string &s) : type_(Type::String), string_(s) {}

  static Value object();
  static Value array();

  Type type() const { return type_; }
  bool is_null() const { return type_ == Type::Null; }
  bool is_bool() const { return type_ == Type::Bool; }
  bool is_number() const { return type_ == Type::Number; }
  bool is_string() const { return type_ == Type::String; }
  bool is_array() const { return type_ == Type::Array; }
  bool is_object() const { return type_ == Type::Object; }

  bool as_bool() const { return bool_; }
  double as_number() const { return number_; }
  const std::string &as_string() const { return string_; }

  // Object access. operator[] turns a null value into an object.
  Value &operator[](const std::string &key);
  const Value *find(const std::string &key) const;
  const std::map<std::string, Value> &members() const { return object_; }

  // Array access. push_back turns a null value into an array.
  void push_back(const Value &v);
  const std::vector<Value> &items() const { return array_; }
  size_t size() const;

private:
  Type type_ = Type::Null;
  bool bool_ = false;
  double number_ = 0;
  std::string string_;
  std::vector<Value> array_;
  std::map<std::string, Value> object_;
};

std::string dump(const Value &v, int indent = 0);

// Throws ParseError on malformed input.
Value parse(const std::string &text);

} // namespace json
} // namespace clinic
