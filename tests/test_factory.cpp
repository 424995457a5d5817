// tests/test_factory.cpp
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "algo/MSTAlgorithm.hpp"
#include "graph/Graph.hpp"
#include "util/InfoMap.hpp"
#include "util/Log.hpp"
#include "util/Strings.hpp"

#include <iostream>
#include <memory>
#include <sstream>
#include <string>

// Small helper to create & run an algorithm by name
static MSTResult run_algo(const char* name, std::shared_ptr<const Graph> g) {
    auto p = AlgorithmFactory::create(name);
    REQUIRE(p != nullptr);
    return p->computeMST(std::move(g));
}

static std::shared_ptr<const Graph> triangle() {
    return std::make_shared<const Graph>(
        Graph::Builder().addEdge("A", "B", 1).addEdge("B", "C", 2).addEdge("A", "C", 3).build());
}

TEST_CASE("Every registered name builds a working algorithm") {
    for (const auto& name : AlgorithmFactory::names()) {
        CAPTURE(name);
        auto r = run_algo(name.c_str(), triangle());
        CHECK(r.totalCost() == doctest::Approx(3.0));
        CHECK(r.isValidMST());
    }
}

TEST_CASE("Names are case-insensitive") {
    auto a = AlgorithmFactory::create("PRIM");
    auto b = AlgorithmFactory::create("prim");
    auto c = AlgorithmFactory::create("KrUsKaL");
    REQUIRE(a != nullptr);
    REQUIRE(b != nullptr);
    REQUIRE(c != nullptr);
    CHECK(a->name() == "Prim");
    CHECK(c->name() == "Kruskal");
}

TEST_CASE("Variants are configured as named") {
    CHECK(infoString(AlgorithmFactory::create("prim-array")->parameters(), "queueStrategy") == "ARRAY_BASED");
    CHECK(infoString(AlgorithmFactory::create("prim-dary")->parameters(), "queueStrategy") == "D_ARY_HEAP");
    CHECK(infoString(AlgorithmFactory::create("prim-dense")->parameters(), "queueStrategy") == "ARRAY_BASED");
    CHECK(infoString(AlgorithmFactory::create("kruskal-array")->parameters(), "unionFindStrategy") == "ARRAY_BASED");
    CHECK(infoString(AlgorithmFactory::create("kruskal-dense")->parameters(), "sortingStrategy") == "BUCKET_SORT");
    CHECK(AlgorithmFactory::create("kruskal-sparse")->optimizedFor() == "SPARSE");
}

TEST_CASE("Unknown names yield nullptr") {
    CHECK(AlgorithmFactory::create("boruvka") == nullptr);
    CHECK(AlgorithmFactory::create("") == nullptr);
}

TEST_CASE("Shared defaults of the interface") {
    auto p = AlgorithmFactory::create("prim");
    REQUIRE(p != nullptr);
    CHECK_FALSE(p->description().empty());
    CHECK(p->spaceComplexity() == "O(V + E)");
}

TEST_CASE("Log level parsing") {
    logging::Level lvl = logging::Level::Off;
    CHECK(logging::parseLevel("DEBUG", lvl));
    CHECK(lvl == logging::Level::Debug);
    CHECK_FALSE(logging::parseLevel("verbose", lvl));
    CHECK(lvl == logging::Level::Debug);

    const auto saved = logging::level();
    logging::setLevel(logging::Level::Error);
    CHECK_FALSE(logging::enabled(logging::Level::Warn));
    CHECK(logging::enabled(logging::Level::Error));
    logging::setLevel(saved);
}

TEST_CASE("Log helpers format their arguments only when enabled") {
    std::ostringstream captured;
    auto* old = std::clog.rdbuf(captured.rdbuf());            // capture std::clog
    const auto saved = logging::level();

    logging::setLevel(logging::Level::Debug);
    logging::debug("prim", "key ", 3, " of ", 2.5);
    logging::warn("kruskal", "disconnected");
    logging::setLevel(logging::Level::Warn);
    logging::debug("prim", "dropped");

    std::clog.rdbuf(old);
    logging::setLevel(saved);

    const std::string out = captured.str();
    CHECK(out.find("[prim] debug: key 3 of 2.5") != std::string::npos);
    CHECK(out.find("[kruskal] warn: disconnected") != std::string::npos);
    CHECK(out.find("dropped") == std::string::npos);
}

TEST_CASE("to_lower handles mixed case and leaves other bytes alone") {
    CHECK(to_lower("KrUsKaL-Dense") == "kruskal-dense");
    CHECK(to_lower("d_ary_HEAP 4") == "d_ary_heap 4");
    CHECK(to_lower("").empty());
}
