#include "core/json_dom.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>

namespace camlink::core::json {

namespace {

class Reader {
public:
  explicit Reader(std::string_view input) : input_(input) {}

  bool ReadDocument(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ReadValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ReadValue(Value& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    switch (Peek()) {
    case '{':
      return ReadObject(value, error);
    case '[':
      return ReadArray(value, error);
    case '"':
      value.type = Value::Type::kString;
      return ReadString(value.string_value, error);
    case 't':
      return ReadLiteral("true", value, Value::Type::kBool, true, error);
    case 'f':
      return ReadLiteral("false", value, Value::Type::kBool, false, error);
    case 'n':
      return ReadLiteral("null", value, Value::Type::kNull, false, error);
    default:
      break;
    }

    if (Peek() == '-' || std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      value.type = Value::Type::kNumber;
      return ReadNumber(value.number_value, error);
    }
    return Fail("expected JSON value", error);
  }

  bool ReadLiteral(std::string_view token, Value& value, Value::Type type, bool bool_value,
                   std::string& error) {
    if (input_.substr(pos_, token.size()) != token) {
      return Fail("invalid literal", error);
    }
    for (std::size_t i = 0; i < token.size(); ++i) {
      Advance();
    }
    value.type = type;
    value.bool_value = bool_value;
    return true;
  }

  bool ReadObject(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kObject;
    Advance(); // '{'
    SkipWhitespace();
    if (Consume('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (AtEnd() || Peek() != '"') {
        return Fail("expected string key in object", error);
      }
      if (!ReadString(key, error)) {
        return false;
      }
      SkipWhitespace();
      if (!Consume(':')) {
        return Fail("expected ':' after object key", error);
      }
      SkipWhitespace();

      Value member;
      if (!ReadValue(member, error)) {
        return false;
      }
      if (value.object_value.count(key) != 0U) {
        return Fail("duplicate object key '" + key + "'", error);
      }
      value.object_value.emplace(std::move(key), std::move(member));

      SkipWhitespace();
      if (Consume('}')) {
        return true;
      }
      if (!Consume(',')) {
        return Fail("expected ',' between object entries", error);
      }
    }
  }

  bool ReadArray(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kArray;
    Advance(); // '['
    SkipWhitespace();
    if (Consume(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ReadValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Consume(']')) {
        return true;
      }
      if (!Consume(',')) {
        return Fail("expected ',' between array items", error);
      }
    }
  }

  bool ReadString(std::string& out, std::string& error) {
    out.clear();
    Advance(); // opening quote

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }

      if (AtEnd()) {
        break;
      }
      const char escaped = Advance();
      switch (escaped) {
      case '"':
      case '\\':
      case '/':
        out.push_back(escaped);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        return Fail("unsupported escape sequence in string", error);
      }
    }

    return Fail("unterminated string literal", error);
  }

  bool ReadNumber(double& out, std::string& error) {
    const std::size_t start = pos_;
    Consume('-');
    if (!Consume('0') && ConsumeDigits() == 0U) {
      return Fail("expected digits in number", error);
    }
    if (Consume('.') && ConsumeDigits() == 0U) {
      return Fail("expected digits after decimal point", error);
    }
    if (Consume('e') || Consume('E')) {
      if (!Consume('+')) {
        Consume('-');
      }
      if (ConsumeDigits() == 0U) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string token(input_.substr(start, pos_ - start));
    errno = 0;
    char* end = nullptr;
    out = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size() || errno == ERANGE) {
      return Fail("invalid numeric value '" + token + "'", error);
    }
    return true;
  }

  std::size_t ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool Consume(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

} // namespace

const Value* Value::Find(std::string_view key) const {
  if (type != Type::kObject) {
    return nullptr;
  }
  const auto it = object_value.find(std::string(key));
  return it == object_value.end() ? nullptr : &it->second;
}

std::optional<std::uint64_t> Value::AsUInt() const {
  if (type != Type::kNumber || !std::isfinite(number_value) || number_value < 0.0) {
    return std::nullopt;
  }
  const double floored = std::floor(number_value);
  if (floored != number_value ||
      floored > static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(floored);
}

std::optional<double> Value::AsNumber() const {
  if (type != Type::kNumber || !std::isfinite(number_value)) {
    return std::nullopt;
  }
  return number_value;
}

std::optional<std::string> Value::AsString() const {
  if (type != Type::kString) {
    return std::nullopt;
  }
  return string_value;
}

std::optional<bool> Value::AsBool() const {
  if (type != Type::kBool) {
    return std::nullopt;
  }
  return bool_value;
}

bool Parse(std::string_view input, Value& root, std::string& error) {
  Reader reader(input);
  return reader.ReadDocument(root, error);
}

bool ParseFile(const std::string& path, Value& root, std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open file: " + path;
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(input)),
                         std::istreambuf_iterator<char>());
  if (text.empty()) {
    error = "file is empty: " + path;
    return false;
  }
  return Parse(text, root, error);
}

} // namespace camlink::core::json
