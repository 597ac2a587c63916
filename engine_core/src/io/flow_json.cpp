/**
 * @file flow_json.cpp
 * @brief Flow JSON reader and report writers
 */

#include "ConvoFlow/io/flow_json.hpp"
#include "ConvoFlow/core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace ConvoFlow::io {

namespace {

constexpr const char* kFieldRequired = "Field required";
constexpr const char* kNotString = "Input should be a valid string";
constexpr const char* kNotList = "Input should be a valid list";
constexpr const char* kNotDictionary = "Input should be a valid dictionary";
constexpr const char* kNestedTooDeeply = "Input nested too deeply";

std::string joinLocation(const std::string& location, const std::string& key) {
  return location.empty() ? key : location + "." + key;
}

std::string joinErrors(const std::vector<std::string>& errors) {
  std::string joined;
  for (const auto& error : errors) {
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += error;
  }
  return joined;
}

// Container nesting of a document, counting the outermost container as 1.
// Walks with an explicit stack and stops once the limit is passed.
usize nestingDepth(const Json& root, usize limit) {
  std::vector<std::pair<const Json*, usize>> pending{{&root, 1}};
  usize deepest = 0;
  while (!pending.empty()) {
    auto [json, depth] = pending.back();
    pending.pop_back();
    if (!json->is_structured()) {
      continue;
    }
    deepest = std::max(deepest, depth);
    if (deepest > limit) {
      break;
    }
    for (const auto& child : *json) {
      pending.emplace_back(&child, depth + 1);
    }
  }
  return deepest;
}

flow::Value convertValue(const Json& json, usize depth);

} // namespace

// ============================================================================
// FlowJsonReader
// ============================================================================

Result<flow::Flow> FlowJsonReader::read(const Json& document) {
  m_errors.clear();
  flow::Flow result;

  if (!document.is_object()) {
    addError("", kNotDictionary);
    return finish(std::move(result));
  }

  requireString(document, "id", "", result.id);
  requireString(document, "name", "", result.name);

  auto nodes = document.find("nodes");
  if (nodes == document.end()) {
    addError("nodes", kFieldRequired);
  } else if (!nodes->is_array()) {
    addError("nodes", kNotList);
  } else {
    usize position = 0;
    for (const auto& node : *nodes) {
      readNode(node, "nodes." + std::to_string(position++), result);
    }
  }

  auto edges = document.find("edges");
  if (edges != document.end()) {
    if (!edges->is_array()) {
      addError("edges", kNotList);
    } else {
      usize position = 0;
      for (const auto& edge : *edges) {
        readEdge(edge, "edges." + std::to_string(position++), result);
      }
    }
  }

  optionalMap(document, "metadata", "", result.metadata);

  return finish(std::move(result));
}

Result<flow::Flow> FlowJsonReader::readString(const std::string& text) {
  Json document;
  try {
    document = Json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    m_errors.clear();
    addError("", std::string("Invalid JSON: ") + e.what());
    return Result<flow::Flow>::error(m_errors.front());
  }
  return read(document);
}

Result<flow::Flow> FlowJsonReader::loadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_errors.clear();
    addError("", "Cannot open flow file: " + path);
    return Result<flow::Flow>::error(m_errors.front());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  CONVOFLOW_LOG_DEBUG("Loaded flow file " + path);
  return readString(buffer.str());
}

void FlowJsonReader::readNode(const Json& json, const std::string& location, flow::Flow& flow) {
  if (!json.is_object()) {
    addError(location, kNotDictionary);
    return;
  }

  flow::Node node;
  bool ok = requireString(json, "id", location, node.id);
  ok = requireString(json, "type", location, node.type) && ok;
  ok = optionalString(json, "label", location, node.label) && ok;
  ok = optionalMap(json, "data", location, node.data) && ok;
  if (!ok) {
    return;
  }

  node.kind = flow::nodeKindFromString(node.type);
  flow.nodes.push_back(std::move(node));
}

void FlowJsonReader::readEdge(const Json& json, const std::string& location, flow::Flow& flow) {
  if (!json.is_object()) {
    addError(location, kNotDictionary);
    return;
  }

  flow::Edge edge;
  bool ok = optionalString(json, "id", location, edge.id);
  ok = requireString(json, "source", location, edge.source) && ok;
  ok = requireString(json, "target", location, edge.target) && ok;

  const char* labelKey = json.contains("viaLabel") ? "viaLabel" : "via_label";
  ok = optionalString(json, labelKey, location, edge.viaLabel) && ok;
  ok = optionalMap(json, "data", location, edge.data) && ok;
  if (!ok) {
    return;
  }

  flow.edges.push_back(std::move(edge));
}

bool FlowJsonReader::requireString(const Json& object, const std::string& key,
                                   const std::string& location, std::string& out) {
  auto it = object.find(key);
  if (it == object.end()) {
    addError(joinLocation(location, key), kFieldRequired);
    return false;
  }
  if (!it->is_string()) {
    addError(joinLocation(location, key), kNotString);
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool FlowJsonReader::optionalString(const Json& object, const std::string& key,
                                    const std::string& location,
                                    std::optional<std::string>& out) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    out.reset();
    return true;
  }
  if (!it->is_string()) {
    addError(joinLocation(location, key), kNotString);
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool FlowJsonReader::optionalMap(const Json& object, const std::string& key,
                                 const std::string& location, flow::ValueMap& out) {
  auto it = object.find(key);
  if (it == object.end()) {
    return true;
  }
  if (!it->is_object()) {
    addError(joinLocation(location, key), kNotDictionary);
    return false;
  }
  if (nestingDepth(*it, kMaxValueDepth) > kMaxValueDepth) {
    addError(joinLocation(location, key), kNestedTooDeeply);
    return false;
  }
  out = valueFromJson(*it).asMap();
  return true;
}

void FlowJsonReader::addError(const std::string& location, const std::string& message) {
  m_errors.push_back(location.empty() ? message : location + ": " + message);
}

Result<flow::Flow> FlowJsonReader::finish(flow::Flow flow) {
  if (!m_errors.empty()) {
    CONVOFLOW_LOG_DEBUG("Flow document rejected with " + std::to_string(m_errors.size()) +
                        " schema error(s)");
    return Result<flow::Flow>::error(joinErrors(m_errors));
  }
  CONVOFLOW_LOG_DEBUG("Read flow '" + flow.id + "' with " + std::to_string(flow.nodes.size()) +
                      " node(s) and " + std::to_string(flow.edges.size()) + " edge(s)");
  return Result<flow::Flow>::ok(std::move(flow));
}

// ============================================================================
// Value conversion
// ============================================================================

flow::Value valueFromJson(const Json& json) {
  return convertValue(json, 1);
}

namespace {

flow::Value convertValue(const Json& json, usize depth) {
  if (json.is_structured() && depth > kMaxValueDepth) {
    throw std::length_error("JSON value nested deeper than " + std::to_string(kMaxValueDepth) +
                            " levels");
  }

  switch (json.type()) {
  case Json::value_t::boolean:
    return flow::Value(json.get<bool>());
  case Json::value_t::number_integer:
    return flow::Value(json.get<i64>());
  case Json::value_t::number_unsigned: {
    const auto unsignedValue = json.get<u64>();
    if (unsignedValue > static_cast<u64>(std::numeric_limits<i64>::max())) {
      return flow::Value(static_cast<f64>(unsignedValue));
    }
    return flow::Value(static_cast<i64>(unsignedValue));
  }
  case Json::value_t::number_float:
    return flow::Value(json.get<f64>());
  case Json::value_t::string:
    return flow::Value(json.get<std::string>());
  case Json::value_t::array: {
    flow::ValueList list;
    list.reserve(json.size());
    for (const auto& item : json) {
      list.push_back(convertValue(item, depth + 1));
    }
    return flow::Value(std::move(list));
  }
  case Json::value_t::object: {
    flow::ValueMap map;
    for (const auto& [key, item] : json.items()) {
      map.set(key, convertValue(item, depth + 1));
    }
    return flow::Value(std::move(map));
  }
  case Json::value_t::null:
  case Json::value_t::binary:
  case Json::value_t::discarded:
    break;
  }
  return flow::Value();
}

} // namespace

Json valueToJson(const flow::Value& value) {
  switch (value.type()) {
  case flow::ValueType::Null:
    return nullptr;
  case flow::ValueType::Bool:
    return value.asBool();
  case flow::ValueType::Int:
    return value.asInt();
  case flow::ValueType::Double:
    return value.asDouble();
  case flow::ValueType::String:
    return value.asString();
  case flow::ValueType::List: {
    Json list = Json::array();
    for (const auto& item : value.asList()) {
      list.push_back(valueToJson(item));
    }
    return list;
  }
  case flow::ValueType::Map:
    return valueMapToJson(value.asMap());
  }
  return nullptr;
}

Json valueMapToJson(const flow::ValueMap& map) {
  Json object = Json::object();
  for (const auto& [key, item] : map) {
    object[key] = valueToJson(item);
  }
  return object;
}

// ============================================================================
// Reports
// ============================================================================

Json pathsToJson(const std::vector<flow::FlowPath>& paths) {
  Json result = Json::array();
  for (const auto& path : paths) {
    Json steps = Json::array();
    for (const auto& step : path) {
      Json entry = Json::object();
      entry["nodeId"] = step.nodeId;
      if (step.via) {
        entry["via"] = *step.via;
      }
      steps.push_back(std::move(entry));
    }
    result.push_back(std::move(steps));
  }
  return result;
}

Json validationResponseToJson(const flow::ValidationReport& report,
                              const std::vector<flow::FlowPath>& paths) {
  Json response = Json::object();
  response["valid"] = report.valid;
  response["errors"] = report.errors;
  response["warnings"] = report.warnings;
  response["paths"] = pathsToJson(paths);
  return response;
}

Json schemaErrorResponseToJson(const std::vector<std::string>& errors) {
  Json response = Json::object();
  response["valid"] = false;
  response["errors"] = errors;
  response["warnings"] = Json::array();
  response["paths"] = Json::array();
  return response;
}

Json exportResponseToJson(const flow::Flow& flow, const std::string& yaml) {
  Json response = Json::object();
  response["yaml"] = yaml;
  response["filename"] = exportFileName(flow);
  return response;
}

std::string exportFileName(const flow::Flow& flow) {
  const std::string& source = !flow.name.empty() ? flow.name : flow.id;
  return slugify(source.empty() ? std::string("flow") : source, "flow") + ".yaml";
}

std::string slugify(const std::string& value, const std::string& fallback) {
  std::string slug;
  bool pendingDash = false;
  for (char c : value) {
    const auto lowered = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    const bool keep = (lowered >= 'a' && lowered <= 'z') || (lowered >= '0' && lowered <= '9');
    if (!keep) {
      pendingDash = true;
      continue;
    }
    if (pendingDash && !slug.empty()) {
      slug += '-';
    }
    pendingDash = false;
    slug += lowered;
  }
  return slug.empty() ? fallback : slug;
}

} // namespace ConvoFlow::io
