#include "voxrelay/events/value.hpp"

#include "voxrelay/common/json_util.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <type_traits>

namespace voxrelay::events {

Object::Object(std::initializer_list<Entry> entries) {
  for (const auto &entry : entries) {
    set(entry.first, entry.second);
  }
}

bool Object::contains(const std::string &key) const { return find(key) != nullptr; }

const Value *Object::find(const std::string &key) const {
  for (const auto &[name, value] : entries_) {
    if (name == key) {
      return &value;
    }
  }
  return nullptr;
}

Value *Object::find(const std::string &key) {
  for (auto &[name, value] : entries_) {
    if (name == key) {
      return &value;
    }
  }
  return nullptr;
}

void Object::set(const std::string &key, Value value) {
  if (auto *existing = find(key); existing != nullptr) {
    *existing = std::move(value);
    return;
  }
  entries_.emplace_back(key, std::move(value));
}

void Object::merge(const Object &other) {
  for (const auto &[key, value] : other.entries_) {
    set(key, value);
  }
}

bool Object::erase(const std::string &key) {
  const auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const Entry &entry) { return entry.first == key; });
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it);
  return true;
}

bool Object::operator==(const Object &other) const { return entries_ == other.entries_; }

double Value::as_double() const {
  if (is_int()) {
    return static_cast<double>(as_int());
  }
  return std::get<double>(data_);
}

bool Value::operator==(const Value &other) const { return data_ == other.data_; }

namespace {

void write_json(const Value &value, std::string &out);

void write_object(const Object &object, std::string &out) {
  out.push_back('{');
  bool first = true;
  for (const auto &[key, member] : object.entries()) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    out += "\"" + common::json_escape(key) + "\":";
    write_json(member, out);
  }
  out.push_back('}');
}

void write_double(double value, std::string &out) {
  if (!std::isfinite(value)) {
    out += "null";
    return;
  }
  char buffer[64];
  const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc()) {
    out += "null";
    return;
  }
  out.append(buffer, ptr);
}

void write_json(const Value &value, std::string &out) {
  std::visit(
      [&out](const auto &item) {
        using T = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          out += item ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          out += std::to_string(item);
        } else if constexpr (std::is_same_v<T, double>) {
          write_double(item, out);
        } else if constexpr (std::is_same_v<T, std::string>) {
          out += "\"" + common::json_escape(item) + "\"";
        } else if constexpr (std::is_same_v<T, Array>) {
          out.push_back('[');
          for (std::size_t i = 0; i < item.size(); ++i) {
            if (i > 0) {
              out.push_back(',');
            }
            write_json(item[i], out);
          }
          out.push_back(']');
        } else if constexpr (std::is_same_v<T, Object>) {
          write_object(item, out);
        }
      },
      value.storage());
}

class JsonReader {
public:
  explicit JsonReader(const std::string &text) : text_(text) {}

  common::Result<Value> read_document() {
    auto value = read_value(0);
    if (!value.ok()) {
      return value;
    }
    pos_ = common::json_skip_ws(text_, pos_);
    if (pos_ != text_.size()) {
      return fail("trailing characters");
    }
    return value;
  }

private:
  static constexpr std::size_t kMaxDepth = 64;

  common::Result<Value> fail(const std::string &what) const {
    return common::Result<Value>::failure("invalid JSON at offset " + std::to_string(pos_) + ": " +
                                          what);
  }

  bool consume_literal(const char *literal) {
    const std::string word(literal);
    if (text_.compare(pos_, word.size(), word) != 0) {
      return false;
    }
    pos_ += word.size();
    return true;
  }

  common::Result<Value> read_value(std::size_t depth) {
    if (depth > kMaxDepth) {
      return fail("nesting too deep");
    }
    pos_ = common::json_skip_ws(text_, pos_);
    if (pos_ >= text_.size()) {
      return fail("unexpected end of input");
    }
    const char ch = text_[pos_];
    if (ch == '{') {
      return read_object(depth);
    }
    if (ch == '[') {
      return read_array(depth);
    }
    if (ch == '"') {
      auto text = read_string();
      if (!text.ok()) {
        return common::Result<Value>::failure(text.error());
      }
      return common::Result<Value>::success(Value(text.value()));
    }
    if (consume_literal("true")) {
      return common::Result<Value>::success(Value(true));
    }
    if (consume_literal("false")) {
      return common::Result<Value>::success(Value(false));
    }
    if (consume_literal("null")) {
      return common::Result<Value>::success(Value(nullptr));
    }
    return read_number();
  }

  common::Result<std::string> read_string() {
    const auto end = common::json_find_string_end(text_, pos_);
    if (end == std::string::npos) {
      return common::Result<std::string>::failure("invalid JSON at offset " +
                                                  std::to_string(pos_) + ": unterminated string");
    }
    std::string decoded = common::json_unescape(text_.substr(pos_ + 1, end - pos_ - 1));
    pos_ = end + 1;
    return common::Result<std::string>::success(std::move(decoded));
  }

  common::Result<Value> read_number() {
    const std::size_t start = pos_;
    bool integral = true;
    if (pos_ < text_.size() && text_[pos_] == '-') {
      ++pos_;
    }
    while (pos_ < text_.size()) {
      const char ch = text_[pos_];
      if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
        ++pos_;
      } else if (ch == '.' || ch == 'e' || ch == 'E' || ch == '+' || ch == '-') {
        integral = false;
        ++pos_;
      } else {
        break;
      }
    }
    const std::string literal = text_.substr(start, pos_ - start);
    if (literal.empty() || literal == "-") {
      pos_ = start;
      return fail("unexpected character");
    }
    if (integral) {
      std::int64_t parsed = 0;
      const auto [ptr, ec] =
          std::from_chars(literal.data(), literal.data() + literal.size(), parsed);
      if (ec == std::errc() && ptr == literal.data() + literal.size()) {
        return common::Result<Value>::success(Value(parsed));
      }
    }
    char *end = nullptr;
    const double parsed = std::strtod(literal.c_str(), &end);
    if (end == nullptr || *end != '\0') {
      pos_ = start;
      return fail("malformed number");
    }
    return common::Result<Value>::success(Value(parsed));
  }

  common::Result<Value> read_array(std::size_t depth) {
    ++pos_;
    Array items;
    pos_ = common::json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return common::Result<Value>::success(Value(std::move(items)));
    }
    while (true) {
      auto item = read_value(depth + 1);
      if (!item.ok()) {
        return item;
      }
      items.push_back(std::move(item.value()));
      pos_ = common::json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        return fail("unterminated array");
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return common::Result<Value>::success(Value(std::move(items)));
      }
      return fail("expected ',' or ']'");
    }
  }

  common::Result<Value> read_object(std::size_t depth) {
    ++pos_;
    Object object;
    pos_ = common::json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return common::Result<Value>::success(Value(std::move(object)));
    }
    while (true) {
      pos_ = common::json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        return fail("expected object key");
      }
      auto key = read_string();
      if (!key.ok()) {
        return common::Result<Value>::failure(key.error());
      }
      pos_ = common::json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        return fail("expected ':'");
      }
      ++pos_;
      auto member = read_value(depth + 1);
      if (!member.ok()) {
        return member;
      }
      object.set(key.value(), std::move(member.value()));
      pos_ = common::json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        return fail("unterminated object");
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return common::Result<Value>::success(Value(std::move(object)));
      }
      return fail("expected ',' or '}'");
    }
  }

  const std::string &text_;
  std::size_t pos_ = 0;
};

} // namespace

std::string to_json(const Value &value) {
  std::string out;
  write_json(value, out);
  return out;
}

std::string to_json(const Object &object) {
  std::string out;
  write_object(object, out);
  return out;
}

common::Result<Value> parse_json(const std::string &text) { return JsonReader(text).read_document(); }

} // namespace voxrelay::events
