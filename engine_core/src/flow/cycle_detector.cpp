#include "ConvoFlow/flow/cycle_detector.hpp"
#include "ConvoFlow/core/logger.hpp"

namespace ConvoFlow::flow {

namespace {

enum class Color { White, Gray, Black };

struct Frame {
  usize node;
  usize nextEdge;
};

} // namespace

CycleDetector::CycleDetector(const GraphIndex& index) : m_index(index) {}

std::optional<std::vector<std::string>> CycleDetector::findFirstCycle() const {
  const auto& ids = m_index.nodeIds();
  std::vector<Color> colors(ids.size(), Color::White);
  std::vector<Frame> stack;

  auto search = [&](usize start) -> std::optional<std::vector<std::string>> {
    colors[start] = Color::Gray;
    stack.push_back({start, 0});

    while (!stack.empty()) {
      Frame& frame = stack.back();
      const auto& edges = m_index.outbound(ids[frame.node]);

      if (frame.nextEdge >= edges.size()) {
        colors[frame.node] = Color::Black;
        stack.pop_back();
        continue;
      }

      const Edge* edge = edges[frame.nextEdge++];
      auto target = m_index.indexOf(edge->target);
      if (!target) {
        continue;
      }

      if (colors[*target] == Color::Gray) {
        // The gray target is somewhere on the current stack
        std::vector<std::string> cycle;
        bool inCycle = false;
        for (const auto& entry : stack) {
          if (entry.node == *target) {
            inCycle = true;
          }
          if (inCycle) {
            cycle.push_back(ids[entry.node]);
          }
        }
        cycle.push_back(ids[*target]);
        return cycle;
      }

      if (colors[*target] == Color::White) {
        colors[*target] = Color::Gray;
        stack.push_back({*target, 0});
      }
    }
    return std::nullopt;
  };

  for (const auto& root : m_index.roots()) {
    auto position = m_index.indexOf(root);
    if (position && colors[*position] == Color::White) {
      if (auto cycle = search(*position)) {
        CONVOFLOW_LOG_DEBUG("Cycle found from root '" + root + "': " + formatCycle(*cycle));
        return cycle;
      }
    }
  }

  // Components without any root
  for (usize i = 0; i < ids.size(); ++i) {
    if (colors[i] == Color::White) {
      if (auto cycle = search(i)) {
        CONVOFLOW_LOG_DEBUG("Cycle found in rootless component: " + formatCycle(*cycle));
        return cycle;
      }
    }
  }

  return std::nullopt;
}

std::string CycleDetector::formatCycle(const std::vector<std::string>& cycle) {
  std::string result;
  for (usize i = 0; i < cycle.size(); ++i) {
    if (i > 0) {
      result += " -> ";
    }
    result += cycle[i];
  }
  return result;
}

} // namespace ConvoFlow::flow
