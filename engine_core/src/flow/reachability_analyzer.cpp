#include "ConvoFlow/flow/reachability_analyzer.hpp"

namespace ConvoFlow::flow {

ReachabilityAnalyzer::ReachabilityAnalyzer(const GraphIndex& index) : m_index(index) {}

std::unordered_set<std::string> ReachabilityAnalyzer::reachableNodes() const {
  std::unordered_set<std::string> reachable;
  std::vector<std::string> toVisit;

  for (const auto& root : m_index.roots()) {
    if (reachable.insert(root).second) {
      toVisit.push_back(root);
    }
  }

  while (!toVisit.empty()) {
    std::string current = std::move(toVisit.back());
    toVisit.pop_back();

    for (const Edge* edge : m_index.outbound(current)) {
      if (!m_index.hasNode(edge->target)) {
        continue;
      }
      if (reachable.insert(edge->target).second) {
        toVisit.push_back(edge->target);
      }
    }
  }

  return reachable;
}

std::vector<std::string> ReachabilityAnalyzer::unreachableNodes() const {
  const auto reachable = reachableNodes();
  std::vector<std::string> unreachable;
  for (const auto& id : m_index.nodeIds()) {
    if (reachable.find(id) == reachable.end()) {
      unreachable.push_back(id);
    }
  }
  return unreachable;
}

} // namespace ConvoFlow::flow
