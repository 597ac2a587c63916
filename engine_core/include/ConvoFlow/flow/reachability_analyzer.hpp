#pragma once

/**
 * @file reachability_analyzer.hpp
 * @brief Forward reachability from the flow's root nodes
 */

#include "ConvoFlow/flow/graph_index.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace ConvoFlow::flow {

class ReachabilityAnalyzer {
public:
  explicit ReachabilityAnalyzer(const GraphIndex& index);
  explicit ReachabilityAnalyzer(GraphIndex&&) = delete;

  /**
   * @brief Ids reachable from any root (roots included)
   */
  [[nodiscard]] std::unordered_set<std::string> reachableNodes() const;

  /**
   * @brief Declared ids not reachable from any root, in declaration order
   */
  [[nodiscard]] std::vector<std::string> unreachableNodes() const;

private:
  const GraphIndex& m_index;
};

} // namespace ConvoFlow::flow
