#pragma once

/**
 * @file serializer_backend.hpp
 * @brief Text renderers for canonical flow documents
 *
 * A backend receives a fully ordered document tree (see
 * CanonicalSerializer::buildDocument) and only decides how to spell it.
 * Both backends keep key order exactly as given and render block-style
 * mappings and sequences; they may differ in scalar quoting.
 */

#include "ConvoFlow/flow/value.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace ConvoFlow::flow {

enum class SerializerKind {
  Plain,  // built-in renderer, byte-stable canonical text
  YamlCpp // yaml-cpp emitter
};

[[nodiscard]] const char* serializerKindToString(SerializerKind kind);
bool parseSerializerKind(std::string_view name, SerializerKind& outKind);

class SerializerBackend {
public:
  virtual ~SerializerBackend() = default;

  [[nodiscard]] virtual SerializerKind kind() const = 0;
  [[nodiscard]] virtual std::string render(const ValueMap& document) const = 0;
};

/**
 * @brief Indentation-based renderer with no external dependencies
 *
 * Two spaces per level, "key: value" for scalars, "- item" for list
 * entries, "{}" and "[]" for empty containers.
 */
class PlainYamlBackend final : public SerializerBackend {
public:
  [[nodiscard]] SerializerKind kind() const override { return SerializerKind::Plain; }
  [[nodiscard]] std::string render(const ValueMap& document) const override;
};

/**
 * @brief Renderer built on YAML::Emitter
 */
class YamlCppBackend final : public SerializerBackend {
public:
  [[nodiscard]] SerializerKind kind() const override { return SerializerKind::YamlCpp; }
  [[nodiscard]] std::string render(const ValueMap& document) const override;
};

[[nodiscard]] std::unique_ptr<SerializerBackend> createSerializerBackend(SerializerKind kind);

/**
 * @brief Whether a string would read back as a non-string YAML scalar
 *        (number, boolean, null) if written unquoted
 *
 * "yes"/"no"/"on"/"off" are not treated as booleans.
 */
[[nodiscard]] bool looksLikeNonStringScalar(const std::string& text);

} // namespace ConvoFlow::flow
