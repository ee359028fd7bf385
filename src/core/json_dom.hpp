#ifndef CAMLINK_CORE_JSON_DOM_HPP_
#define CAMLINK_CORE_JSON_DOM_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace camlink::core::json {

// Small STL-only DOM for configuration and simulation plans.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  bool IsObject() const {
    return type == Type::kObject;
  }
  bool IsArray() const {
    return type == Type::kArray;
  }

  // Member lookup; nullptr when this is not an object or the key is absent.
  const Value* Find(std::string_view key) const;

  // Typed views. Each returns nullopt when the stored type does not match
  // (or, for integers, when the number is fractional/negative/out of range).
  std::optional<std::uint64_t> AsUInt() const;
  std::optional<double> AsNumber() const;
  std::optional<std::string> AsString() const;
  std::optional<bool> AsBool() const;
};

// Parses a complete JSON document. Errors carry line/column so a broken
// config file points at the offending character.
bool Parse(std::string_view input, Value& root, std::string& error);

// Reads and parses a file in one step.
bool ParseFile(const std::string& path, Value& root, std::string& error);

} // namespace camlink::core::json

#endif // CAMLINK_CORE_JSON_DOM_HPP_
