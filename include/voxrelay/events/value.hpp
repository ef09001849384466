#pragma once

#include "voxrelay/common/result.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace voxrelay::events {

class Value;
using Array = std::vector<Value>;

/// JSON object that preserves insertion order. `set` replaces an existing key in
/// place, so overriding a field never moves it.
class Object {
public:
  using Entry = std::pair<std::string, Value>;

  Object() = default;
  Object(std::initializer_list<Entry> entries);

  [[nodiscard]] bool empty() const { return entries_.empty(); }
  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] bool contains(const std::string &key) const;
  [[nodiscard]] const Value *find(const std::string &key) const;
  [[nodiscard]] Value *find(const std::string &key);
  [[nodiscard]] const std::vector<Entry> &entries() const { return entries_; }

  void set(const std::string &key, Value value);
  /// Applies `set` for every entry of `other`, in its order.
  void merge(const Object &other);
  bool erase(const std::string &key);

  bool operator==(const Object &other) const;

private:
  std::vector<Entry> entries_;
};

class Value {
public:
  using Storage = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array,
                               Object>;

  Value() : data_(nullptr) {}
  Value(std::nullptr_t) : data_(nullptr) {}
  Value(bool value) : data_(value) {}
  Value(int value) : data_(static_cast<std::int64_t>(value)) {}
  Value(long value) : data_(static_cast<std::int64_t>(value)) {}
  Value(long long value) : data_(static_cast<std::int64_t>(value)) {}
  Value(unsigned int value) : data_(static_cast<std::int64_t>(value)) {}
  Value(unsigned long value) : data_(static_cast<std::int64_t>(value)) {}
  Value(unsigned long long value) : data_(static_cast<std::int64_t>(value)) {}
  Value(double value) : data_(value) {}
  Value(const char *value) : data_(std::string(value)) {}
  Value(std::string value) : data_(std::move(value)) {}
  Value(Array value) : data_(std::move(value)) {}
  Value(Object value) : data_(std::move(value)) {}

  [[nodiscard]] bool is_null() const { return std::holds_alternative<std::nullptr_t>(data_); }
  [[nodiscard]] bool is_bool() const { return std::holds_alternative<bool>(data_); }
  [[nodiscard]] bool is_int() const { return std::holds_alternative<std::int64_t>(data_); }
  [[nodiscard]] bool is_double() const { return std::holds_alternative<double>(data_); }
  [[nodiscard]] bool is_number() const { return is_int() || is_double(); }
  [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(data_); }
  [[nodiscard]] bool is_array() const { return std::holds_alternative<Array>(data_); }
  [[nodiscard]] bool is_object() const { return std::holds_alternative<Object>(data_); }

  [[nodiscard]] bool as_bool() const { return std::get<bool>(data_); }
  [[nodiscard]] std::int64_t as_int() const { return std::get<std::int64_t>(data_); }
  /// Integers widen to double.
  [[nodiscard]] double as_double() const;
  [[nodiscard]] const std::string &as_string() const { return std::get<std::string>(data_); }
  [[nodiscard]] const Array &as_array() const { return std::get<Array>(data_); }
  [[nodiscard]] Array &as_array() { return std::get<Array>(data_); }
  [[nodiscard]] const Object &as_object() const { return std::get<Object>(data_); }
  [[nodiscard]] Object &as_object() { return std::get<Object>(data_); }

  [[nodiscard]] const Storage &storage() const { return data_; }

  bool operator==(const Value &other) const;

private:
  Storage data_;
};

[[nodiscard]] std::string to_json(const Value &value);
[[nodiscard]] std::string to_json(const Object &object);

/// Strict JSON reader. Integers without fraction or exponent become int values.
[[nodiscard]] common::Result<Value> parse_json(const std::string &text);

} // namespace voxrelay::events
