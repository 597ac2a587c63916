#include "ConvoFlow/flow/structural_validator.hpp"
#include "ConvoFlow/core/logger.hpp"
#include "ConvoFlow/flow/cycle_detector.hpp"
#include "ConvoFlow/flow/reachability_analyzer.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <tuple>
#include <unordered_set>

namespace ConvoFlow::flow {

namespace {

std::string joinSorted(std::vector<std::string> values) {
  std::sort(values.begin(), values.end());
  std::string joined;
  for (usize i = 0; i < values.size(); ++i) {
    if (i > 0) {
      joined += ", ";
    }
    joined += values[i];
  }
  return joined;
}

} // namespace

ValidationReport StructuralValidator::validate(const Flow& flow) const {
  GraphIndex index(flow);
  return validate(flow, index);
}

ValidationReport StructuralValidator::validate(const Flow& flow, const GraphIndex& index) const {
  ValidationReport report;

  if (flow.nodes.empty()) {
    report.errors.push_back("Flow must contain at least one node.");
    report.valid = false;
    return report;
  }

  checkDuplicateNodes(flow, report);
  checkEdges(flow, index, report);
  checkEntryAndExit(index, report);
  checkNodeTransitions(index, report);
  checkCycles(index, report);
  checkReachability(index, report);

  report.valid = report.errors.empty();

  CONVOFLOW_LOG_DEBUG("Validated flow '" + flow.id + "': " +
                      std::to_string(report.errors.size()) + " error(s), " +
                      std::to_string(report.warnings.size()) + " warning(s)");
  return report;
}

void StructuralValidator::checkDuplicateNodes(const Flow& flow, ValidationReport& report) const {
  std::unordered_set<std::string> seen;
  std::set<std::string> duplicates;
  for (const auto& node : flow.nodes) {
    if (!seen.insert(node.id).second) {
      duplicates.insert(node.id);
    }
  }

  if (!duplicates.empty()) {
    report.errors.push_back(
        "Duplicate node identifiers detected: " +
        joinSorted(std::vector<std::string>(duplicates.begin(), duplicates.end())));
  }
}

void StructuralValidator::checkEdges(const Flow& flow, const GraphIndex& index,
                                     ValidationReport& report) const {
  // An absent label and an empty one are different signatures
  std::set<std::tuple<std::string, std::string, std::optional<std::string>>> signatures;

  for (const auto& edge : flow.edges) {
    if (!index.hasNode(edge.source)) {
      report.errors.push_back("Edge references unknown source node '" + edge.source + "'.");
    }
    if (!index.hasNode(edge.target)) {
      report.errors.push_back("Edge references unknown target node '" + edge.target + "'.");
    }

    auto signature = std::make_tuple(edge.source, edge.target, edge.viaLabel);
    if (!signatures.insert(signature).second) {
      report.warnings.push_back("Duplicate edge detected from '" + edge.source + "' to '" +
                                edge.target + "' with label '" + edge.labelOrEmpty() + "'.");
    }
  }
}

void StructuralValidator::checkEntryAndExit(const GraphIndex& index,
                                            ValidationReport& report) const {
  const auto roots = index.roots();
  if (roots.empty()) {
    report.errors.push_back("Flow must contain at least one start node (no incoming edges).");
  } else if (roots.size() > 1) {
    report.warnings.push_back(
        "Multiple start nodes detected; execution order may be ambiguous.");
  }

  if (index.terminals().empty()) {
    report.errors.push_back("Flow must contain at least one terminal message node (message "
                            "without outgoing edges).");
  }
}

void StructuralValidator::checkNodeTransitions(const GraphIndex& index,
                                               ValidationReport& report) const {
  for (const auto& id : index.nodeIds()) {
    const Node* node = index.node(id);
    const auto& outgoing = index.outbound(id);

    switch (node->kind) {
    case NodeKind::Message:
      if (!outgoing.empty()) {
        report.warnings.push_back("Message node '" + id +
                                  "' has outgoing edges and will not terminate the flow.");
      }
      break;

    case NodeKind::Question: {
      const auto answers = node->expectedAnswers();
      if (answers.empty()) {
        break;
      }
      const std::unordered_set<std::string> expected(answers.begin(), answers.end());
      for (const Edge* edge : outgoing) {
        if (edge->hasLabel() && expected.find(*edge->viaLabel) == expected.end()) {
          report.errors.push_back("Edge from question '" + id + "' uses label '" +
                                  *edge->viaLabel + "' not present in expected answers.");
        }
      }
      break;
    }

    case NodeKind::Action:
    case NodeKind::Other:
      break;
    }
  }
}

void StructuralValidator::checkCycles(const GraphIndex& index, ValidationReport& report) const {
  CycleDetector detector(index);
  if (auto cycle = detector.findFirstCycle()) {
    report.errors.push_back("Cycle detected: " + CycleDetector::formatCycle(*cycle));
  }
}

void StructuralValidator::checkReachability(const GraphIndex& index,
                                            ValidationReport& report) const {
  ReachabilityAnalyzer analyzer(index);
  auto unreachable = analyzer.unreachableNodes();
  if (!unreachable.empty()) {
    report.warnings.push_back("Unreachable nodes detected: " + joinSorted(std::move(unreachable)));
  }
}

ValidationReport validate(const Flow& flow) {
  StructuralValidator validator;
  return validator.validate(flow);
}

} // namespace ConvoFlow::flow
