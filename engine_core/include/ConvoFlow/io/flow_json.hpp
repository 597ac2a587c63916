#pragma once

/**
 * @file flow_json.hpp
 * @brief Flow documents to and from JSON
 *
 * Reading applies the schema checks a flow must pass before the analysis
 * code may see it. Every problem is reported with the dotted location of the
 * offending field, e.g. "nodes.0.id: Field required", and all of them are
 * collected rather than stopping at the first.
 *
 * Expected document shape:
 * @code
 * {
 *   "id": "...", "name": "...",
 *   "nodes": [{"id": "...", "type": "question", "label": "...", "data": {}}],
 *   "edges": [{"id": "...", "source": "...", "target": "...",
 *              "viaLabel": "...", "data": {}}],
 *   "metadata": {}
 * }
 * @endcode
 * "edges", "metadata", node "label"/"data" and edge "id"/"viaLabel"/"data"
 * are optional. "via_label" is accepted in place of "viaLabel". Unknown keys
 * are ignored. Open maps nested deeper than kMaxValueDepth are rejected.
 */

#include "ConvoFlow/core/result.hpp"
#include "ConvoFlow/flow/flow_model.hpp"
#include "ConvoFlow/flow/structural_validator.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ConvoFlow::io {

// Object key order is kept so reports read in the order they are built
using Json = nlohmann::ordered_json;

/// Deepest container nesting accepted for data and metadata maps
inline constexpr usize kMaxValueDepth = 256;

class FlowJsonReader {
public:
  FlowJsonReader() = default;

  /**
   * @brief Build a Flow from a parsed JSON document
   * @return The flow, or an error summarizing errors()
   */
  [[nodiscard]] Result<flow::Flow> read(const Json& document);

  /**
   * @brief Parse JSON text and build a Flow from it
   */
  [[nodiscard]] Result<flow::Flow> readString(const std::string& text);

  /**
   * @brief Read a flow document from disk
   */
  [[nodiscard]] Result<flow::Flow> loadFromFile(const std::string& path);

  /**
   * @brief Individual findings of the last read, in document order
   */
  [[nodiscard]] const std::vector<std::string>& errors() const { return m_errors; }

private:
  void readNode(const Json& json, const std::string& location, flow::Flow& flow);
  void readEdge(const Json& json, const std::string& location, flow::Flow& flow);

  bool requireString(const Json& object, const std::string& key, const std::string& location,
                     std::string& out);
  bool optionalString(const Json& object, const std::string& key, const std::string& location,
                      std::optional<std::string>& out);
  bool optionalMap(const Json& object, const std::string& key, const std::string& location,
                   flow::ValueMap& out);

  void addError(const std::string& location, const std::string& message);
  [[nodiscard]] Result<flow::Flow> finish(flow::Flow flow);

  std::vector<std::string> m_errors;
};

/**
 * @brief Convert parsed JSON into a Value tree
 * @throws std::length_error when containers nest deeper than kMaxValueDepth
 */
[[nodiscard]] flow::Value valueFromJson(const Json& json);
[[nodiscard]] Json valueToJson(const flow::Value& value);
[[nodiscard]] Json valueMapToJson(const flow::ValueMap& map);

/**
 * @brief Paths as arrays of {"nodeId", "via"?} steps
 */
[[nodiscard]] Json pathsToJson(const std::vector<flow::FlowPath>& paths);

/**
 * @brief {"valid", "errors", "warnings", "paths"}
 */
[[nodiscard]] Json validationResponseToJson(const flow::ValidationReport& report,
                                            const std::vector<flow::FlowPath>& paths);

/**
 * @brief Response for a document that failed schema checks
 *
 * Same shape as validationResponseToJson with valid=false and no paths.
 */
[[nodiscard]] Json schemaErrorResponseToJson(const std::vector<std::string>& errors);

/**
 * @brief {"yaml", "filename"} for an exported flow
 */
[[nodiscard]] Json exportResponseToJson(const flow::Flow& flow, const std::string& yaml);

/**
 * @brief Suggested file name for an exported flow: slug of name, id or "flow"
 */
[[nodiscard]] std::string exportFileName(const flow::Flow& flow);

/**
 * @brief Lowercase, collapse runs of characters outside [a-z0-9] to '-',
 *        trim '-' from both ends
 * @return fallback when nothing is left
 */
[[nodiscard]] std::string slugify(const std::string& value, const std::string& fallback = "item");

} // namespace ConvoFlow::io
