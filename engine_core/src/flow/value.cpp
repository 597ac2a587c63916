#include "ConvoFlow/flow/value.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>

namespace ConvoFlow::flow {

ValueMap::ValueMap() = default;

ValueMap::ValueMap(std::initializer_list<Entry> entries) {
  for (const auto& entry : entries) {
    set(entry.first, entry.second);
  }
}

void ValueMap::set(const std::string& key, Value value) {
  for (auto& entry : m_entries) {
    if (entry.first == key) {
      entry.second = std::move(value);
      return;
    }
  }
  m_entries.emplace_back(key, std::move(value));
}

const Value* ValueMap::find(const std::string& key) const {
  for (const auto& entry : m_entries) {
    if (entry.first == key) {
      return &entry.second;
    }
  }
  return nullptr;
}

bool ValueMap::contains(const std::string& key) const {
  return find(key) != nullptr;
}

ValueMap ValueMap::sortedByKey() const {
  ValueMap sorted;
  sorted.m_entries = m_entries;
  std::stable_sort(sorted.m_entries.begin(), sorted.m_entries.end(),
                   [](const Entry& a, const Entry& b) { return a.first < b.first; });
  return sorted;
}

bool ValueMap::operator==(const ValueMap& other) const {
  return m_entries == other.m_entries;
}

ValueType Value::type() const {
  switch (m_data.index()) {
  case 0:
    return ValueType::Null;
  case 1:
    return ValueType::Bool;
  case 2:
    return ValueType::Int;
  case 3:
    return ValueType::Double;
  case 4:
    return ValueType::String;
  case 5:
    return ValueType::List;
  default:
    return ValueType::Map;
  }
}

bool Value::isTruthy() const {
  switch (type()) {
  case ValueType::Null:
    return false;
  case ValueType::Bool:
    return asBool();
  case ValueType::Int:
    return asInt() != 0;
  case ValueType::Double:
    return asDouble() != 0.0;
  case ValueType::String:
    return !asString().empty();
  case ValueType::List:
    return !asList().empty();
  case ValueType::Map:
    return !asMap().empty();
  }
  return false;
}

std::string Value::toScalarString() const {
  switch (type()) {
  case ValueType::Null:
    return "null";
  case ValueType::Bool:
    return asBool() ? "true" : "false";
  case ValueType::Int:
    return std::to_string(asInt());
  case ValueType::Double: {
    const f64 number = asDouble();
    if (std::isnan(number)) {
      return ".nan";
    }
    if (std::isinf(number)) {
      return number > 0 ? ".inf" : "-.inf";
    }
    std::array<char, 64> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), number);
    if (ec != std::errc()) {
      return std::to_string(number);
    }
    std::string text(buffer.data(), end);
    // Keep integral doubles distinguishable from integers
    if (text.find_first_of(".eE") == std::string::npos) {
      text += ".0";
    }
    return text;
  }
  case ValueType::String:
    return asString();
  case ValueType::List:
  case ValueType::Map:
    break;
  }
  return {};
}

} // namespace ConvoFlow::flow
