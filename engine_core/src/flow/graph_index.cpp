#include "ConvoFlow/flow/graph_index.hpp"
#include "ConvoFlow/core/logger.hpp"

namespace ConvoFlow::flow {

namespace {
const std::vector<const Edge*>& emptyEdgeList() {
  static const std::vector<const Edge*> empty;
  return empty;
}
} // namespace

GraphIndex::GraphIndex(const Flow& flow) : m_flow(&flow) {
  m_nodeIds.reserve(flow.nodes.size());
  m_nodes.reserve(flow.nodes.size());

  for (const auto& node : flow.nodes) {
    auto it = m_positions.find(node.id);
    if (it != m_positions.end()) {
      m_nodes[it->second] = &node;
      continue;
    }
    m_positions.emplace(node.id, m_nodeIds.size());
    m_nodeIds.push_back(node.id);
    m_nodes.push_back(&node);
    m_inbound[node.id];
    m_outbound[node.id];
  }

  for (const auto& edge : flow.edges) {
    m_outbound[edge.source].push_back(&edge);
    m_inbound[edge.target].push_back(&edge);
  }

  CONVOFLOW_LOG_TRACE("Indexed flow '" + flow.id + "': " + std::to_string(m_nodeIds.size()) +
                      " nodes, " + std::to_string(flow.edges.size()) + " edges");
}

bool GraphIndex::hasNode(const std::string& id) const {
  return m_positions.find(id) != m_positions.end();
}

const Node* GraphIndex::node(const std::string& id) const {
  auto it = m_positions.find(id);
  if (it == m_positions.end()) {
    return nullptr;
  }
  return m_nodes[it->second];
}

std::optional<usize> GraphIndex::indexOf(const std::string& id) const {
  auto it = m_positions.find(id);
  if (it == m_positions.end()) {
    return std::nullopt;
  }
  return it->second;
}

const std::vector<const Edge*>& GraphIndex::inbound(const std::string& id) const {
  auto it = m_inbound.find(id);
  return it != m_inbound.end() ? it->second : emptyEdgeList();
}

const std::vector<const Edge*>& GraphIndex::outbound(const std::string& id) const {
  auto it = m_outbound.find(id);
  return it != m_outbound.end() ? it->second : emptyEdgeList();
}

std::vector<std::string> GraphIndex::roots() const {
  std::vector<std::string> result;
  for (const auto& id : m_nodeIds) {
    if (inbound(id).empty()) {
      result.push_back(id);
    }
  }
  return result;
}

std::vector<std::string> GraphIndex::terminals() const {
  std::vector<std::string> result;
  for (const auto& id : m_nodeIds) {
    if (isTerminal(id)) {
      result.push_back(id);
    }
  }
  return result;
}

bool GraphIndex::isTerminal(const std::string& id) const {
  const Node* declared = node(id);
  return declared != nullptr && declared->isMessage() && outbound(id).empty();
}

GraphIndex buildIndex(const Flow& flow) {
  return GraphIndex(flow);
}

} // namespace ConvoFlow::flow
