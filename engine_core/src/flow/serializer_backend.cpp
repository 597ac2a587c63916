#include "ConvoFlow/flow/serializer_backend.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace ConvoFlow::flow {

const char* serializerKindToString(SerializerKind kind) {
  switch (kind) {
  case SerializerKind::Plain:
    return "plain";
  case SerializerKind::YamlCpp:
    return "yaml-cpp";
  }
  return "plain";
}

bool parseSerializerKind(std::string_view name, SerializerKind& outKind) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "plain" || lowered == "builtin") {
    outKind = SerializerKind::Plain;
    return true;
  }
  if (lowered == "yaml-cpp" || lowered == "yamlcpp" || lowered == "yaml") {
    outKind = SerializerKind::YamlCpp;
    return true;
  }
  return false;
}

std::unique_ptr<SerializerBackend> createSerializerBackend(SerializerKind kind) {
  switch (kind) {
  case SerializerKind::Plain:
    return std::make_unique<PlainYamlBackend>();
  case SerializerKind::YamlCpp:
    return std::make_unique<YamlCppBackend>();
  }
  return std::make_unique<PlainYamlBackend>();
}

bool looksLikeNonStringScalar(const std::string& text) {
  static const std::regex numberPattern(
      R"([-+]?(\d+|\d+\.\d*|\.\d+|\d+(\.\d*)?[eE][-+]?\d+|\.\d+[eE][-+]?\d+|0x[0-9a-fA-F]+|0o[0-7]+))");
  static const std::regex specialPattern(
      R"(true|True|TRUE|false|False|FALSE|null|Null|NULL|~|[-+]?\.(inf|Inf|INF)|\.(nan|NaN|NAN))");

  if (text.empty()) {
    return false;
  }
  return std::regex_match(text, numberPattern) || std::regex_match(text, specialPattern);
}

} // namespace ConvoFlow::flow
