#include "ConvoFlow/flow/path_enumerator.hpp"
#include "ConvoFlow/core/logger.hpp"

#include <optional>
#include <string>

namespace ConvoFlow::flow {

namespace {

struct Frame {
  usize node;
  usize nextEdge;
  usize depth;
};

} // namespace

PathEnumerator::PathEnumerator(const GraphIndex& index, usize maxDepth)
    : m_index(index), m_maxDepth(maxDepth) {}

std::vector<FlowPath> PathEnumerator::enumerate() const {
  std::vector<FlowPath> results;

  if (m_index.nodeCount() == 0) {
    return results;
  }

  const auto roots = m_index.roots();
  const auto terminals = m_index.terminals();
  if (roots.empty() || terminals.empty()) {
    return results;
  }

  const auto& ids = m_index.nodeIds();
  std::vector<bool> isTerminal(ids.size(), false);
  for (const auto& id : terminals) {
    isTerminal[*m_index.indexOf(id)] = true;
  }

  std::vector<bool> onPath(ids.size(), false);
  std::vector<Frame> stack;
  FlowPath path;
  usize abandonedBranches = 0;

  auto enter = [&](usize node, std::optional<std::string> via, usize depth) {
    if (depth > m_maxDepth) {
      ++abandonedBranches;
      return;
    }
    path.push_back({ids[node], std::move(via)});
    onPath[node] = true;
    if (isTerminal[node]) {
      results.push_back(path);
    }
    stack.push_back({node, 0, depth});
  };

  for (const auto& root : roots) {
    enter(*m_index.indexOf(root), std::nullopt, 1);

    while (!stack.empty()) {
      Frame& frame = stack.back();
      const auto& edges = m_index.outbound(ids[frame.node]);

      if (frame.nextEdge >= edges.size()) {
        onPath[frame.node] = false;
        path.pop_back();
        stack.pop_back();
        continue;
      }

      const Edge* edge = edges[frame.nextEdge++];
      auto target = m_index.indexOf(edge->target);
      if (!target || onPath[*target]) {
        continue;
      }

      const usize depth = frame.depth + 1;
      enter(*target, edge->hasLabel() ? std::optional<std::string>(*edge->viaLabel) : std::nullopt,
            depth);
    }
  }

  if (abandonedBranches > 0) {
    CONVOFLOW_LOG_DEBUG("Path enumeration abandoned " + std::to_string(abandonedBranches) +
                        " branch(es) deeper than " + std::to_string(m_maxDepth) + " steps");
  }
  CONVOFLOW_LOG_TRACE("Enumerated " + std::to_string(results.size()) + " path(s)");
  return results;
}

std::vector<FlowPath> enumeratePaths(const Flow& flow) {
  if (flow.nodes.empty()) {
    return {};
  }
  GraphIndex index(flow);
  PathEnumerator enumerator(index);
  return enumerator.enumerate();
}

} // namespace ConvoFlow::flow
