#include "ConvoFlow/flow/path_enumerator.hpp"
#include <catch2/catch_test_macros.hpp>
#include <unordered_set>

using namespace ConvoFlow;
using namespace ConvoFlow::flow;

namespace {

Flow makeFlow(std::vector<Node> nodes, std::vector<Edge> edges) {
  Flow flow;
  flow.id = "flow";
  flow.name = "Flow";
  flow.nodes = std::move(nodes);
  flow.edges = std::move(edges);
  return flow;
}

// start -> branch-i -> terminal for i in [0, n)
Flow makeBranchingFlow(usize n) {
  std::vector<Node> nodes{Node::question("start")};
  std::vector<Edge> edges;
  for (usize i = 0; i < n; ++i) {
    const std::string id = "branch-" + std::to_string(i);
    nodes.push_back(Node::action(id));
    edges.emplace_back("start", id);
    edges.emplace_back(id, "terminal");
  }
  nodes.push_back(Node::message("terminal"));
  return makeFlow(std::move(nodes), std::move(edges));
}

Flow makeChain(usize count) {
  Flow flow;
  flow.id = "chain";
  flow.name = "Chain";
  for (usize i = 0; i < count; ++i) {
    const std::string id = "n" + std::to_string(i);
    flow.nodes.push_back(i + 1 == count ? Node::message(id) : Node::action(id));
    if (i > 0) {
      flow.edges.emplace_back("n" + std::to_string(i - 1), id);
    }
  }
  return flow;
}

std::vector<std::string> nodeIds(const FlowPath& path) {
  std::vector<std::string> ids;
  for (const auto& step : path) {
    ids.push_back(step.nodeId);
  }
  return ids;
}

} // namespace

TEST_CASE("PathEnumerator - Branching flow yields one path per branch", "[path_enumerator]") {
  for (usize n : {5u, 12u, 32u}) {
    Flow flow = makeBranchingFlow(n);

    auto paths = enumeratePaths(flow);

    REQUIRE(paths.size() == n);
    for (usize i = 0; i < n; ++i) {
      CHECK(nodeIds(paths[i]) ==
            std::vector<std::string>{"start", "branch-" + std::to_string(i), "terminal"});
      CHECK(paths[i].back().nodeId == "terminal");
    }
  }
}

TEST_CASE("PathEnumerator - Steps carry the label of the edge used", "[path_enumerator]") {
  Flow flow = makeFlow({Node::question("start"), Node::action("act"), Node::message("end")},
                       {Edge("start", "act", "yes"), Edge("act", "end"),
                        Edge("start", "end", "no")});

  auto paths = enumeratePaths(flow);

  REQUIRE(paths.size() == 2);
  CHECK(paths[0] == FlowPath{{"start", std::nullopt}, {"act", "yes"}, {"end", std::nullopt}});
  CHECK(paths[1] == FlowPath{{"start", std::nullopt}, {"end", "no"}});
}

TEST_CASE("PathEnumerator - Empty labels are omitted from steps", "[path_enumerator]") {
  Flow flow = makeFlow({Node::question("start"), Node::message("end")},
                       {Edge("start", "end", "")});

  auto paths = enumeratePaths(flow);

  REQUIRE(paths.size() == 1);
  CHECK_FALSE(paths[0][1].via.has_value());
}

TEST_CASE("PathEnumerator - No roots or no terminals means no paths", "[path_enumerator]") {
  SECTION("Empty flow") {
    CHECK(enumeratePaths(makeFlow({}, {})).empty());
  }

  SECTION("Every node has an inbound edge") {
    Flow flow = makeFlow({Node::question("start"), Node::action("loop"), Node::message("end")},
                         {Edge("start", "loop", "yes"), Edge("loop", "start"),
                          Edge("start", "end", "no")});
    CHECK(enumeratePaths(flow).empty());
  }

  SECTION("No message node without outgoing edges") {
    Flow flow = makeFlow({Node::question("start"), Node::message("relay"), Node::action("act")},
                         {Edge("start", "relay"), Edge("relay", "act")});
    CHECK(enumeratePaths(flow).empty());
  }
}

TEST_CASE("PathEnumerator - Paths start at roots, end at terminals, never revisit",
          "[path_enumerator]") {
  // Two roots, a cycle in the middle, a dangling edge and a dead end
  Flow flow = makeFlow({Node::question("r1"), Node::question("r2"), Node::action("a"),
                        Node::action("b"), Node::action("dead"), Node::message("end"),
                        Node::message("alt-end")},
                       {Edge("r1", "a", "go"), Edge("r2", "b"), Edge("a", "b"), Edge("b", "a"),
                        Edge("a", "ghost"), Edge("a", "dead"), Edge("b", "end"),
                        Edge("a", "alt-end")});
  GraphIndex index(flow);

  auto paths = PathEnumerator(index).enumerate();

  REQUIRE_FALSE(paths.empty());
  for (const auto& path : paths) {
    REQUIRE_FALSE(path.empty());
    CHECK(index.inbound(path.front().nodeId).empty());
    CHECK_FALSE(path.front().via.has_value());
    CHECK(index.isTerminal(path.back().nodeId));

    std::unordered_set<std::string> seen;
    for (const auto& step : path) {
      CHECK(seen.insert(step.nodeId).second);
    }
  }

  CHECK(nodeIds(paths[0]) == std::vector<std::string>{"r1", "a", "b", "end"});
  CHECK(nodeIds(paths[1]) == std::vector<std::string>{"r1", "a", "alt-end"});
  CHECK(nodeIds(paths[2]) == std::vector<std::string>{"r2", "b", "a", "alt-end"});
  CHECK(nodeIds(paths[3]) == std::vector<std::string>{"r2", "b", "end"});
  CHECK(paths.size() == 4);
}

TEST_CASE("PathEnumerator - Long chains are walked without recursion", "[path_enumerator]") {
  Flow flow = makeChain(kMaxPathDepth);

  auto paths = enumeratePaths(flow);

  REQUIRE(paths.size() == 1);
  CHECK(paths[0].size() == kMaxPathDepth);
  CHECK(paths[0].back().nodeId == "n" + std::to_string(kMaxPathDepth - 1));
}

TEST_CASE("PathEnumerator - Branches deeper than the ceiling are abandoned", "[path_enumerator]") {
  SECTION("Default ceiling") {
    Flow flow = makeChain(kMaxPathDepth + 1);
    CHECK(enumeratePaths(flow).empty());
  }

  SECTION("Custom ceiling keeps the shallow path") {
    // start -> end directly, and start -> a -> b -> c -> end
    Flow flow = makeFlow({Node::question("start"), Node::action("a"), Node::action("b"),
                          Node::action("c"), Node::message("end")},
                         {Edge("start", "a"), Edge("a", "b"), Edge("b", "c"), Edge("c", "end"),
                          Edge("start", "end")});
    GraphIndex index(flow);

    auto shallow = PathEnumerator(index, 3).enumerate();
    REQUIRE(shallow.size() == 1);
    CHECK(nodeIds(shallow[0]) == std::vector<std::string>{"start", "end"});

    auto deep = PathEnumerator(index, 5).enumerate();
    CHECK(deep.size() == 2);
  }
}
