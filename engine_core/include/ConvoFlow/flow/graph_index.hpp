#pragma once

/**
 * @file graph_index.hpp
 * @brief Inbound/outbound adjacency over a Flow
 *
 * The index is purely structural and never reports problems. Edges whose
 * endpoints are not declared are still recorded on the side they belong to
 * (outbound by source, inbound by target) so validators can see them, and
 * traversals skip them.
 *
 * The index refers into the Flow it was built from; the Flow must outlive it
 * and must not be modified meanwhile.
 */

#include "ConvoFlow/flow/flow_model.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ConvoFlow::flow {

class GraphIndex {
public:
  explicit GraphIndex(const Flow& flow);
  explicit GraphIndex(Flow&&) = delete;

  [[nodiscard]] const Flow& flow() const { return *m_flow; }

  /**
   * @brief Distinct declared node ids in order of first appearance
   */
  [[nodiscard]] const std::vector<std::string>& nodeIds() const { return m_nodeIds; }

  [[nodiscard]] usize nodeCount() const { return m_nodeIds.size(); }

  [[nodiscard]] bool hasNode(const std::string& id) const;

  /**
   * @brief Node for an id; with duplicate ids the last declaration wins
   * @return nullptr for undeclared ids
   */
  [[nodiscard]] const Node* node(const std::string& id) const;

  /**
   * @brief Dense position of an id within nodeIds()
   */
  [[nodiscard]] std::optional<usize> indexOf(const std::string& id) const;

  [[nodiscard]] const std::vector<const Edge*>& inbound(const std::string& id) const;
  [[nodiscard]] const std::vector<const Edge*>& outbound(const std::string& id) const;

  /**
   * @brief Declared nodes without inbound edges, in nodeIds() order
   */
  [[nodiscard]] std::vector<std::string> roots() const;

  /**
   * @brief Message nodes without outbound edges, in nodeIds() order
   */
  [[nodiscard]] std::vector<std::string> terminals() const;

  [[nodiscard]] bool isTerminal(const std::string& id) const;

private:
  const Flow* m_flow;
  std::vector<std::string> m_nodeIds;
  std::vector<const Node*> m_nodes;
  std::unordered_map<std::string, usize> m_positions;
  std::unordered_map<std::string, std::vector<const Edge*>> m_inbound;
  std::unordered_map<std::string, std::vector<const Edge*>> m_outbound;
};

[[nodiscard]] GraphIndex buildIndex(const Flow& flow);
GraphIndex buildIndex(Flow&&) = delete;

} // namespace ConvoFlow::flow
