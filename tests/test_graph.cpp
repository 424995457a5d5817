// tests/test_graph.cpp
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "graph/Graph.hpp"
#include "util/InfoMap.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// A-B(1), B-C(2), A-C(3)
static Graph triangle() {
    return Graph::Builder().addEdge("A", "B", 1).addEdge("B", "C", 2).addEdge("A", "C", 3).build();
}

TEST_CASE("Builder indexes vertices in insertion order") {
    Graph g = triangle();
    CHECK(g.vertexCount() == 3);
    CHECK(g.edgeCount() == 3);
    CHECK(g.indexOf("A") == 0);
    CHECK(g.indexOf("B") == 1);
    CHECK(g.indexOf("C") == 2);
    CHECK(g.indexOf("Z") == Graph::npos);
    CHECK(g.idOf(2) == "C");
    CHECK_THROWS_AS(g.idOf(3), std::out_of_range);
}

TEST_CASE("Builder keeps isolated vertices and ignores duplicates") {
    Graph g = Graph::Builder().addVertex("X").addVertex("X").addEdge("A", "B", 1).build();
    CHECK(g.vertexCount() == 3);
    CHECK(g.vertexIds().front() == "X");
    CHECK(g.degree("X") == 0);
    CHECK_FALSE(g.isConnected());
}

TEST_CASE("tryBuild reports the first bad input without throwing") {
    Graph::Builder b;
    b.addEdge("A", "A", 1).addEdge("A", "B", -2);
    std::string err;
    auto g = b.tryBuild(err);
    CHECK_FALSE(g.has_value());
    CHECK(err.find("Self-loop") != std::string::npos);
    CHECK_THROWS_AS(b.build(), std::invalid_argument);
}

TEST_CASE("Graph from an edge list infers vertices") {
    Graph g({Edge::create("P", "Q", 1), Edge::create("Q", "R", 4)});
    CHECK(g.vertexIds() == std::vector<std::string>{"P", "Q", "R"});
    CHECK(g.hasEdge("R", "Q"));
    CHECK_FALSE(g.hasEdge("P", "R"));
    REQUIRE(g.findEdge("Q", "P") != nullptr);
    CHECK(g.findEdge("Q", "P")->weight() == 1.0);
}

TEST_CASE("Adjacency is symmetric") {
    Graph g = triangle();
    auto adj = g.adjacency();
    CHECK(adj.vertexCount() == 3);
    CHECK(adj.edgeCount() == 3);
    CHECK(adj.incident(0).size() == 2);
    CHECK(adj.incident(1).size() == 2);
    CHECK(adj.endpoints(1) == std::pair<Graph::Vertex, Graph::Vertex>(1, 2));
    CHECK(adj.edge(2).id() == "A-C");
    CHECK_THROWS_AS(adj.incident(9), std::out_of_range);
    CHECK_THROWS_AS(adj.endpoints(9), std::out_of_range);

    auto n = g.neighbors("A");
    std::sort(n.begin(), n.end());
    CHECK(n == std::vector<std::string>{"B", "C"});
    CHECK(g.incidentEdges("B").size() == 2);
    CHECK(g.incidentEdges("nope").empty());
}

TEST_CASE("Density and classification") {
    CHECK(triangle().density() == doctest::Approx(1.0));
    CHECK(triangle().type() == Graph::Type::Dense);

    Graph path = Graph::Builder()
                     .addEdge("1", "2", 1).addEdge("2", "3", 1).addEdge("3", "4", 1)
                     .addEdge("4", "5", 1).addEdge("5", "6", 1).build();
    CHECK(path.density() == doctest::Approx(5.0 / 15.0));
    CHECK(path.type() == Graph::Type::Unknown);

    Graph single = Graph::Builder().addVertex("solo").build();
    CHECK(single.density() == 0.0);
    CHECK(single.type() == Graph::Type::Sparse);
    CHECK(Graph().density() == 0.0);
    CHECK(triangle().label() == "Graph(3V,3E,DENSE)");
}

TEST_CASE("Connectivity and components") {
    CHECK(Graph().isConnected());
    CHECK(triangle().isConnected());

    Graph split = Graph::Builder().addEdge("A", "B", 1).addEdge("C", "D", 2).addVertex("E").build();
    CHECK_FALSE(split.isConnected());
    auto parts = split.connectedComponents();
    REQUIRE(parts.size() == 3);
    CHECK(parts[0].vertexIds() == std::vector<std::string>{"A", "B"});
    CHECK(parts[1].edgeCount() == 1);
    CHECK(parts[2].vertexCount() == 1);
    CHECK(parts[2].edgeCount() == 0);
}

TEST_CASE("subgraph keeps induced edges and fresh annotations") {
    Graph g = triangle();
    g.markInMst(0);
    Graph sub = g.subgraph({"A", "B"});
    CHECK(sub.vertexCount() == 2);
    CHECK(sub.edgeCount() == 1);
    CHECK_FALSE(sub.edges().front().inMst());
    CHECK(g.edges().front().inMst());
}

TEST_CASE("Degree statistics") {
    Graph star = Graph::Builder()
                     .addEdge("c", "l1", 1).addEdge("c", "l2", 1)
                     .addEdge("c", "l3", 1).addEdge("c", "l4", 1).build();
    CHECK(star.degree("c") == 4);
    CHECK(star.minDegree() == 1);
    CHECK(star.maxDegree() == 4);
    CHECK(star.averageDegree() == doctest::Approx(8.0 / 5.0));
    CHECK_THROWS_AS(star.degree("zz"), std::out_of_range);
    CHECK(star.vertex("c")->degree == 4);
    CHECK_FALSE(star.vertex("zz").has_value());

    auto stats = star.statistics();
    CHECK(infoInt(stats, "vertices") == 5);
    CHECK(infoInt(stats, "edges") == 4);
    CHECK(infoBool(stats, "connected"));
    CHECK(infoString(stats, "graphType") == "UNKNOWN");
    CHECK(infoInt(stats, "maxDegree") == 4);
}

TEST_CASE("In-MST marks live on the graph's edges") {
    Graph g = triangle();
    CHECK(g.mstEdges().empty());
    g.markInMst(0);
    g.markInMst(1);
    CHECK(g.mstEdges().size() == 2);
    CHECK(g.mstTotalCost() == doctest::Approx(3.0));
    g.resetMst();
    CHECK(g.mstEdges().empty());
    CHECK_THROWS_AS(g.markInMst(3), std::out_of_range);
}

TEST_CASE("isValid holds for built graphs") {
    CHECK(triangle().isValid());
    CHECK(Graph().isValid());
}

TEST_CASE("isValid rejects the same edge declared twice") {
    Graph g = Graph::Builder().addEdge("A", "B", 1).addEdge("B", "A", 2).build();
    CHECK(g.edgeCount() == 2);
    CHECK_FALSE(g.isValid());
}

static std::vector<std::string> bridgeIds(const Graph& g) {
    std::vector<std::string> out;
    for (const auto& e : g.bridges()) out.push_back(e.id());
    return out;
}

TEST_CASE("Every edge of a path is a bridge") {
    Graph path = Graph::Builder().addEdge("A", "B", 1).addEdge("B", "C", 1).addEdge("C", "D", 1).build();
    CHECK(bridgeIds(path) == std::vector<std::string>{"A-B", "B-C", "C-D"});
    CHECK(path.articulationPoints() == std::vector<std::string>{"B", "C"});
}

TEST_CASE("A cycle has no bridges or articulation points") {
    Graph ring = Graph::Builder()
                     .addEdge("A", "B", 1).addEdge("B", "C", 1)
                     .addEdge("C", "D", 1).addEdge("D", "A", 1).build();
    CHECK(ring.bridges().empty());
    CHECK(ring.articulationPoints().empty());
}

TEST_CASE("Two triangles joined by one edge") {
    Graph g = Graph::Builder()
                  .addEdge("A", "B", 1).addEdge("B", "C", 1).addEdge("C", "A", 1)
                  .addEdge("C", "D", 7)
                  .addEdge("D", "E", 1).addEdge("E", "F", 1).addEdge("F", "D", 1).build();
    REQUIRE(g.bridges().size() == 1);
    CHECK(g.bridges().front().id() == "C-D");
    CHECK(g.bridges().front().weight() == 7.0);
    CHECK(g.articulationPoints() == std::vector<std::string>{"C", "D"});

    auto stats = g.statistics();
    CHECK(infoInt(stats, "bridges") == 1);
    CHECK(infoInt(stats, "articulationPoints") == 2);
}

TEST_CASE("Bridges across components, isolated vertices and parallel edges") {
    Graph g = Graph::Builder()
                  .addEdge("A", "B", 1)
                  .addEdge("X", "Y", 1).addEdge("Y", "Z", 1)
                  .addVertex("solo").build();
    CHECK(bridgeIds(g) == std::vector<std::string>{"A-B", "X-Y", "Y-Z"});
    CHECK(g.articulationPoints() == std::vector<std::string>{"Y"});

    // Two edges between the same pair keep each other alive
    Graph doubled = Graph::Builder().addEdge("A", "B", 1).addEdge("B", "A", 2).addEdge("B", "C", 1).build();
    CHECK(bridgeIds(doubled) == std::vector<std::string>{"B-C"});
    CHECK(doubled.articulationPoints() == std::vector<std::string>{"B"});

    CHECK(Graph().bridges().empty());
    CHECK(Graph().articulationPoints().empty());
}

TEST_CASE("Star center is the only articulation point") {
    Graph star = Graph::Builder()
                     .addEdge("c", "l1", 1).addEdge("c", "l2", 1).addEdge("c", "l3", 1).build();
    CHECK(star.articulationPoints() == std::vector<std::string>{"c"});
    CHECK(star.bridges().size() == 3);
}

TEST_CASE("Long paths do not exhaust the call stack") {
    Graph::Builder b;
    for (int i = 0; i < 100000; ++i) b.addEdge(std::to_string(i), std::to_string(i + 1), 1);
    Graph g = b.build();
    CHECK(g.bridges().size() == 100000);
    CHECK(g.articulationPoints().size() == 99999);
}
