#include "ConvoFlow/core/logger.hpp"
#include "ConvoFlow/flow/serializer_backend.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace ConvoFlow::flow {

namespace {

void emitValue(YAML::Emitter& out, const Value& value);

void emitString(YAML::Emitter& out, const std::string& text) {
  // Keep "30" or "true" strings from reading back as numbers or booleans
  if (looksLikeNonStringScalar(text)) {
    out << YAML::SingleQuoted << text;
  } else {
    out << text;
  }
}

void emitMap(YAML::Emitter& out, const ValueMap& map) {
  if (map.empty()) {
    out << YAML::Flow << YAML::BeginMap << YAML::EndMap;
    return;
  }
  out << YAML::BeginMap;
  for (const auto& [key, value] : map) {
    out << YAML::Key;
    emitString(out, key);
    out << YAML::Value;
    emitValue(out, value);
  }
  out << YAML::EndMap;
}

void emitList(YAML::Emitter& out, const ValueList& list) {
  if (list.empty()) {
    out << YAML::Flow << YAML::BeginSeq << YAML::EndSeq;
    return;
  }
  out << YAML::BeginSeq;
  for (const auto& item : list) {
    emitValue(out, item);
  }
  out << YAML::EndSeq;
}

void emitValue(YAML::Emitter& out, const Value& value) {
  switch (value.type()) {
  case ValueType::Null:
    out << YAML::Null;
    break;
  case ValueType::Bool:
    out << value.asBool();
    break;
  case ValueType::Int:
    out << static_cast<long long>(value.asInt());
    break;
  case ValueType::Double:
    // Shortest round-trip text rather than the emitter's fixed precision
    out << value.toScalarString();
    break;
  case ValueType::String:
    emitString(out, value.asString());
    break;
  case ValueType::List:
    emitList(out, value.asList());
    break;
  case ValueType::Map:
    emitMap(out, value.asMap());
    break;
  }
}

} // namespace

std::string YamlCppBackend::render(const ValueMap& document) const {
  YAML::Emitter out;
  out.SetIndent(2);
  out.SetMapFormat(YAML::Block);
  out.SetSeqFormat(YAML::Block);
  out.SetBoolFormat(YAML::TrueFalseBool);

  emitMap(out, document);

  if (!out.good()) {
    CONVOFLOW_LOG_ERROR("yaml-cpp emitter failed: " + out.GetLastError());
    throw std::logic_error("yaml-cpp emitter failed: " + out.GetLastError());
  }

  std::string text = out.c_str();
  if (!text.empty() && text.back() != '\n') {
    text += '\n';
  }
  return text;
}

} // namespace ConvoFlow::flow
