#pragma once

/**
 * @file value.hpp
 * @brief JSON-like tagged value used for open-ended node/edge/flow data
 *
 * Flow authors attach arbitrary extra fields to nodes, edges and flows.
 * Those fields are carried as Value trees so unknown keys survive
 * validation and canonical serialization untouched.
 *
 * ValueMap keeps keys in insertion order; canonical output sorts them
 * explicitly via ValueMap::sortedByKey().
 */

#include "ConvoFlow/core/types.hpp"
#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ConvoFlow::flow {

class Value;

using ValueList = std::vector<Value>;

/**
 * @brief Insertion-ordered string-keyed map of Values
 */
class ValueMap {
public:
  using Entry = std::pair<std::string, Value>;
  using const_iterator = std::vector<Entry>::const_iterator;

  ValueMap();
  ValueMap(std::initializer_list<Entry> entries);

  /**
   * @brief Insert or replace a key; replaced keys keep their original position
   */
  void set(const std::string& key, Value value);

  [[nodiscard]] const Value* find(const std::string& key) const;
  [[nodiscard]] bool contains(const std::string& key) const;

  [[nodiscard]] usize size() const;
  [[nodiscard]] bool empty() const;

  [[nodiscard]] const_iterator begin() const;
  [[nodiscard]] const_iterator end() const;

  /**
   * @brief Copy of this map with keys in lexicographic order (not recursive)
   */
  [[nodiscard]] ValueMap sortedByKey() const;

  bool operator==(const ValueMap& other) const;
  bool operator!=(const ValueMap& other) const { return !(*this == other); }

private:
  std::vector<Entry> m_entries;
};

enum class ValueType { Null, Bool, Int, Double, String, List, Map };

class Value {
public:
  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool value) : m_data(value) {}
  Value(i32 value) : m_data(static_cast<i64>(value)) {}
  Value(i64 value) : m_data(value) {}
  Value(f64 value) : m_data(value) {}
  Value(const char* value) : m_data(std::string(value)) {}
  Value(std::string value) : m_data(std::move(value)) {}
  Value(ValueList value) : m_data(std::move(value)) {}
  Value(ValueMap value) : m_data(std::move(value)) {}

  [[nodiscard]] ValueType type() const;

  [[nodiscard]] bool isNull() const { return type() == ValueType::Null; }
  [[nodiscard]] bool isBool() const { return type() == ValueType::Bool; }
  [[nodiscard]] bool isInt() const { return type() == ValueType::Int; }
  [[nodiscard]] bool isDouble() const { return type() == ValueType::Double; }
  [[nodiscard]] bool isNumber() const { return isInt() || isDouble(); }
  [[nodiscard]] bool isString() const { return type() == ValueType::String; }
  [[nodiscard]] bool isList() const { return type() == ValueType::List; }
  [[nodiscard]] bool isMap() const { return type() == ValueType::Map; }

  // Accessors throw std::bad_variant_access on a type mismatch
  [[nodiscard]] bool asBool() const { return std::get<bool>(m_data); }
  [[nodiscard]] i64 asInt() const { return std::get<i64>(m_data); }
  [[nodiscard]] f64 asDouble() const { return std::get<f64>(m_data); }
  [[nodiscard]] const std::string& asString() const { return std::get<std::string>(m_data); }
  [[nodiscard]] const ValueList& asList() const { return std::get<ValueList>(m_data); }
  [[nodiscard]] const ValueMap& asMap() const { return std::get<ValueMap>(m_data); }

  /**
   * @brief Whether the value counts as "set" for optional fields
   *
   * Null, false, zero, the empty string and empty containers are unset.
   */
  [[nodiscard]] bool isTruthy() const;

  /**
   * @brief Plain text form of a scalar
   *
   * Strings are returned verbatim, booleans as true/false, null as null,
   * numbers in their shortest round-trip decimal form. Containers yield
   * an empty string.
   */
  [[nodiscard]] std::string toScalarString() const;

  bool operator==(const Value& other) const { return m_data == other.m_data; }
  bool operator!=(const Value& other) const { return !(*this == other); }

private:
  std::variant<std::nullptr_t, bool, i64, f64, std::string, ValueList, ValueMap> m_data{nullptr};
};

// Defined here because Entry needs Value to be complete
inline usize ValueMap::size() const {
  return m_entries.size();
}

inline bool ValueMap::empty() const {
  return m_entries.empty();
}

inline ValueMap::const_iterator ValueMap::begin() const {
  return m_entries.begin();
}

inline ValueMap::const_iterator ValueMap::end() const {
  return m_entries.end();
}

} // namespace ConvoFlow::flow
