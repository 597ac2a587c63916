#pragma once

/**
 * @file structural_validator.hpp
 * @brief Structural soundness checks for conversational flows
 *
 * Checks performed (all of them run; only an empty flow short-circuits):
 * - At least one node
 * - Unique node identifiers
 * - Edge endpoints reference declared nodes
 * - Duplicate (source, target, label) edges (warning)
 * - At least one start node; several start nodes (warning)
 * - At least one terminal message node
 * - Message nodes with outgoing edges (warning)
 * - Question answer labels drawn from expectedAnswers
 * - Cycles (first one found)
 * - Nodes unreachable from any start node (warning)
 *
 * Findings are plain sentences. Nothing here throws for malformed graphs.
 */

#include "ConvoFlow/flow/flow_model.hpp"
#include "ConvoFlow/flow/graph_index.hpp"
#include <string>
#include <vector>

namespace ConvoFlow::flow {

/**
 * @brief Result of structural validation
 */
struct ValidationReport {
  bool valid = false;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  [[nodiscard]] bool hasErrors() const { return !errors.empty(); }
  [[nodiscard]] bool hasWarnings() const { return !warnings.empty(); }
};

class StructuralValidator {
public:
  StructuralValidator() = default;

  /**
   * @brief Validate a flow using a freshly built index
   */
  [[nodiscard]] ValidationReport validate(const Flow& flow) const;

  /**
   * @brief Validate a flow with an index the caller already built for it
   */
  [[nodiscard]] ValidationReport validate(const Flow& flow, const GraphIndex& index) const;

private:
  void checkDuplicateNodes(const Flow& flow, ValidationReport& report) const;
  void checkEdges(const Flow& flow, const GraphIndex& index, ValidationReport& report) const;
  void checkEntryAndExit(const GraphIndex& index, ValidationReport& report) const;
  void checkNodeTransitions(const GraphIndex& index, ValidationReport& report) const;
  void checkCycles(const GraphIndex& index, ValidationReport& report) const;
  void checkReachability(const GraphIndex& index, ValidationReport& report) const;
};

/**
 * @brief Convenience wrapper around StructuralValidator
 */
[[nodiscard]] ValidationReport validate(const Flow& flow);

} // namespace ConvoFlow::flow
