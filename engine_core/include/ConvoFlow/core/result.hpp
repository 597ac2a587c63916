#pragma once

/**
 * @file result.hpp
 * @brief Result<T> - value-or-error return type used for fallible operations
 *
 * Structural findings about a flow are never reported through Result; they
 * are data in ValidationReport. Result is reserved for I/O, parsing and
 * configuration failures.
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace ConvoFlow {

template <typename T> class Result {
public:
  [[nodiscard]] static Result ok(T value) {
    Result result;
    result.m_value = std::move(value);
    return result;
  }

  [[nodiscard]] static Result error(std::string message) {
    Result result;
    result.m_error = std::move(message);
    return result;
  }

  [[nodiscard]] bool isOk() const { return m_value.has_value(); }
  [[nodiscard]] bool isError() const { return !m_value.has_value(); }

  [[nodiscard]] T& value() & {
    if (!m_value) {
      throw std::logic_error("Result::value() called on error: " + m_error);
    }
    return *m_value;
  }

  [[nodiscard]] const T& value() const& {
    if (!m_value) {
      throw std::logic_error("Result::value() called on error: " + m_error);
    }
    return *m_value;
  }

  [[nodiscard]] T&& value() && {
    if (!m_value) {
      throw std::logic_error("Result::value() called on error: " + m_error);
    }
    return std::move(*m_value);
  }

  [[nodiscard]] const std::string& error() const { return m_error; }

private:
  Result() = default;

  std::optional<T> m_value;
  std::string m_error;
};

template <> class Result<void> {
public:
  [[nodiscard]] static Result ok() {
    Result result;
    result.m_ok = true;
    return result;
  }

  [[nodiscard]] static Result error(std::string message) {
    Result result;
    result.m_ok = false;
    result.m_error = std::move(message);
    return result;
  }

  [[nodiscard]] bool isOk() const { return m_ok; }
  [[nodiscard]] bool isError() const { return !m_ok; }

  [[nodiscard]] const std::string& error() const { return m_error; }

private:
  Result() = default;

  bool m_ok = false;
  std::string m_error;
};

} // namespace ConvoFlow
