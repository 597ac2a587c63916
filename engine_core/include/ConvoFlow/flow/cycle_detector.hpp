#pragma once

/**
 * @file cycle_detector.hpp
 * @brief First-cycle detection over a flow graph
 *
 * Three-color depth-first search (White -> Gray -> Black). Search starts at
 * each root in declaration order and then at any node still unvisited, so
 * cycles in components without a root are found as well. Only the first
 * cycle encountered is reported.
 *
 * The search keeps its own frame stack instead of recursing, so graph depth
 * is limited by memory rather than by the call stack.
 */

#include "ConvoFlow/flow/graph_index.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ConvoFlow::flow {

class CycleDetector {
public:
  explicit CycleDetector(const GraphIndex& index);
  explicit CycleDetector(GraphIndex&&) = delete;

  /**
   * @brief Find the first cycle
   * @return Node ids along the cycle, starting and ending with the repeated
   *         node (e.g. {"A", "B", "A"}), or std::nullopt for an acyclic graph
   */
  [[nodiscard]] std::optional<std::vector<std::string>> findFirstCycle() const;

  /**
   * @brief Join a cycle as "A -> B -> A"
   */
  [[nodiscard]] static std::string formatCycle(const std::vector<std::string>& cycle);

private:
  const GraphIndex& m_index;
};

} // namespace ConvoFlow::flow
