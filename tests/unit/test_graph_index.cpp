#include "ConvoFlow/flow/graph_index.hpp"
#include "ConvoFlow/flow/path_enumerator.hpp"
#include <catch2/catch_test_macros.hpp>
#include <type_traits>
#include <utility>

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

template <typename T>
concept BuildableIndex = requires(T&& flow) { buildIndex(std::forward<T>(flow)); };

} // namespace

// An index points into its Flow, so temporaries must not bind
static_assert(std::is_constructible_v<GraphIndex, const Flow&>);
static_assert(std::is_constructible_v<GraphIndex, Flow&>);
static_assert(!std::is_constructible_v<GraphIndex, Flow&&>);
static_assert(!std::is_constructible_v<GraphIndex, Flow>);
static_assert(BuildableIndex<Flow&>);
static_assert(!BuildableIndex<Flow>);
static_assert(!std::is_constructible_v<PathEnumerator, GraphIndex&&>);
static_assert(std::is_constructible_v<PathEnumerator, const GraphIndex&>);

TEST_CASE("GraphIndex - Every declared node gets inbound and outbound entries", "[graph_index]") {
  Flow flow = makeFlow({Node::question("start"), Node::action("act"), Node::message("end")},
                       {Edge("start", "act", "yes"), Edge("act", "end")});
  GraphIndex index(flow);

  REQUIRE(index.nodeCount() == 3);
  CHECK(index.nodeIds() == std::vector<std::string>{"start", "act", "end"});

  CHECK(index.inbound("start").empty());
  REQUIRE(index.outbound("start").size() == 1);
  CHECK(index.outbound("start")[0]->target == "act");

  REQUIRE(index.inbound("act").size() == 1);
  CHECK(index.inbound("act")[0]->source == "start");

  CHECK(index.outbound("end").empty());
  CHECK(index.inbound("end").size() == 1);
}

TEST_CASE("GraphIndex - Edge lists keep declaration order", "[graph_index]") {
  Flow flow = makeFlow({Node::question("q"), Node::message("b"), Node::message("a")},
                       {Edge("q", "b", "no"), Edge("q", "a", "yes")});
  GraphIndex index(flow);

  const auto& out = index.outbound("q");
  REQUIRE(out.size() == 2);
  CHECK(out[0]->target == "b");
  CHECK(out[1]->target == "a");
}

TEST_CASE("GraphIndex - Dangling edges are recorded on the side they own", "[graph_index]") {
  Flow flow = makeFlow({Node::question("only")},
                       {Edge("only", "ghost"), Edge("phantom", "only")});
  GraphIndex index(flow);

  CHECK_FALSE(index.hasNode("ghost"));
  CHECK_FALSE(index.hasNode("phantom"));
  CHECK(index.node("ghost") == nullptr);

  REQUIRE(index.outbound("only").size() == 1);
  CHECK(index.outbound("only")[0]->target == "ghost");
  REQUIRE(index.inbound("ghost").size() == 1);
  REQUIRE(index.outbound("phantom").size() == 1);
  REQUIRE(index.inbound("only").size() == 1);
  CHECK(index.inbound("only")[0]->source == "phantom");

  // Undeclared ids only appear through their edges
  CHECK(index.nodeCount() == 1);
  CHECK(index.roots().empty());
}

TEST_CASE("GraphIndex - Unknown ids have no edges", "[graph_index]") {
  Flow flow = makeFlow({Node::message("end")}, {});
  GraphIndex index(flow);

  CHECK(index.inbound("nowhere").empty());
  CHECK(index.outbound("nowhere").empty());
  CHECK_FALSE(index.indexOf("nowhere").has_value());
}

TEST_CASE("GraphIndex - Roots and terminals", "[graph_index]") {
  Flow flow = makeFlow({Node::question("start"), Node::question("alt"), Node::action("act"),
                        Node::message("relay"), Node::message("end"), Node::action("dead-end")},
                       {Edge("start", "act"), Edge("alt", "relay"), Edge("relay", "act"),
                        Edge("act", "end"), Edge("act", "dead-end")});
  GraphIndex index(flow);

  CHECK(index.roots() == std::vector<std::string>{"start", "alt"});

  SECTION("Only message nodes without outgoing edges terminate") {
    CHECK(index.terminals() == std::vector<std::string>{"end"});
    CHECK(index.isTerminal("end"));
    CHECK_FALSE(index.isTerminal("relay"));
    CHECK_FALSE(index.isTerminal("dead-end"));
    CHECK_FALSE(index.isTerminal("missing"));
  }
}

TEST_CASE("GraphIndex - Duplicate ids resolve to the last declaration", "[graph_index]") {
  Flow flow = makeFlow({Node::question("dup"), Node::action("other"), Node::message("dup")}, {});
  GraphIndex index(flow);

  SECTION("Iteration follows first appearance") {
    CHECK(index.nodeIds() == std::vector<std::string>{"dup", "other"});
    CHECK(index.indexOf("dup") == std::optional<usize>(0));
  }

  SECTION("Lookup returns the later node") {
    REQUIRE(index.node("dup") != nullptr);
    CHECK(index.node("dup")->isMessage());
    CHECK(index.isTerminal("dup"));
  }
}

TEST_CASE("GraphIndex - buildIndex matches direct construction", "[graph_index]") {
  Flow flow = makeFlow({Node::question("a"), Node::message("b")}, {Edge("a", "b")});
  GraphIndex index = buildIndex(flow);

  CHECK(&index.flow() == &flow);
  CHECK(index.roots() == std::vector<std::string>{"a"});
  CHECK(index.terminals() == std::vector<std::string>{"b"});
}
