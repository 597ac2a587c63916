#pragma once

/**
 * @file path_enumerator.hpp
 * @brief Enumerates every simple root-to-terminal conversation path
 *
 * Works on unvalidated graphs: nodes already on the current path are not
 * revisited, edges to undeclared nodes are skipped, and a branch is given up
 * once it is deeper than the depth ceiling. Paths are produced in the order
 * a depth-first walk over roots (declaration order) and outbound edges
 * (declaration order) discovers them.
 */

#include "ConvoFlow/flow/flow_model.hpp"
#include "ConvoFlow/flow/graph_index.hpp"
#include <vector>

namespace ConvoFlow::flow {

inline constexpr usize kMaxPathDepth = 1000;

class PathEnumerator {
public:
  explicit PathEnumerator(const GraphIndex& index, usize maxDepth = kMaxPathDepth);
  PathEnumerator(GraphIndex&&, usize = kMaxPathDepth) = delete;

  /**
   * @brief All paths from a root to a terminal message node
   *
   * Empty when the flow has no roots or no terminals.
   */
  [[nodiscard]] std::vector<FlowPath> enumerate() const;

private:
  const GraphIndex& m_index;
  usize m_maxDepth;
};

[[nodiscard]] std::vector<FlowPath> enumeratePaths(const Flow& flow);

} // namespace ConvoFlow::flow
