#pragma once

/**
 * @file flow_model.hpp
 * @brief Conversational flow graph value objects
 *
 * A Flow is a directed graph of Question, Action and Message nodes joined
 * by (optionally labelled) edges. Flows arrive already shape-checked from
 * the JSON reader or from an embedding application; the analysis and
 * serialization code only reads them.
 */

#include "ConvoFlow/flow/value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ConvoFlow::flow {

/**
 * @brief Node kinds understood by the analysis code
 *
 * Any other declared type is kept as Other; it never counts as a terminal
 * and is serialized with the Message projection.
 */
enum class NodeKind { Question, Action, Message, Other };

[[nodiscard]] NodeKind nodeKindFromString(const std::string& type);
[[nodiscard]] const char* nodeKindToString(NodeKind kind);

/**
 * @brief Sort rank used by canonical ordering (Question, Action, Message, other)
 */
[[nodiscard]] int nodeKindRank(NodeKind kind);

struct Node {
  std::string id;
  NodeKind kind = NodeKind::Message;
  std::string type; // declared type name, preserved for Other
  std::optional<std::string> label;
  ValueMap data;

  [[nodiscard]] bool isQuestion() const { return kind == NodeKind::Question; }
  [[nodiscard]] bool isAction() const { return kind == NodeKind::Action; }
  [[nodiscard]] bool isMessage() const { return kind == NodeKind::Message; }

  /**
   * @brief Declared expectedAnswers of a question, stringified, in order
   *
   * Strings are kept as is; true/false/null become True/False/None, floats
   * use their shortest positional form (1.0, 1e+16), containers render as
   * ['a', 1] and {'k': 'v'}. Empty when the field is missing or not a list.
   */
  [[nodiscard]] std::vector<std::string> expectedAnswers() const;

  [[nodiscard]] static Node question(std::string id, ValueMap data = {});
  [[nodiscard]] static Node action(std::string id, ValueMap data = {});
  [[nodiscard]] static Node message(std::string id, ValueMap data = {});
  [[nodiscard]] static Node ofType(std::string id, const std::string& type, ValueMap data = {});
};

struct Edge {
  std::optional<std::string> id;
  std::string source;
  std::string target;
  std::optional<std::string> viaLabel;
  ValueMap data;

  Edge() = default;
  Edge(std::string from, std::string to) : source(std::move(from)), target(std::move(to)) {}
  Edge(std::string from, std::string to, std::string label)
      : source(std::move(from)), target(std::move(to)), viaLabel(std::move(label)) {}

  /**
   * @brief An empty label is treated the same as no label
   */
  [[nodiscard]] bool hasLabel() const { return viaLabel.has_value() && !viaLabel->empty(); }
  [[nodiscard]] std::string labelOrEmpty() const { return hasLabel() ? *viaLabel : std::string(); }
};

struct Flow {
  std::string id;
  std::string name;
  std::vector<Node> nodes;
  std::vector<Edge> edges;
  ValueMap metadata;
};

/**
 * @brief One step of an enumerated conversation path
 *
 * via holds the label of the edge used to arrive here, when it had one.
 */
struct PathStep {
  std::string nodeId;
  std::optional<std::string> via;

  bool operator==(const PathStep& other) const {
    return nodeId == other.nodeId && via == other.via;
  }
  bool operator!=(const PathStep& other) const { return !(*this == other); }
};

using FlowPath = std::vector<PathStep>;

} // namespace ConvoFlow::flow
