// tests/test_kruskal.cpp
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "algo/EdgeSort.hpp"
#include "algo/KruskalAlgorithm.hpp"
#include "algo/MstError.hpp"
#include "algo/PrimAlgorithm.hpp"
#include "graph/Graph.hpp"
#include "util/InfoMap.hpp"

#include <memory>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

static std::shared_ptr<const Graph> share(Graph g) {
    return std::make_shared<const Graph>(std::move(g));
}

// A-B(1), B-C(2), A-C(3)
static std::shared_ptr<const Graph> triangle() {
    return share(Graph::Builder().addEdge("A", "B", 1).addEdge("B", "C", 2).addEdge("A", "C", 3).build());
}

// Connected graph on V vertices: a random spanning tree plus extra edges.
static std::shared_ptr<const Graph> randomConnected(std::size_t V, std::size_t extra, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> weight(1, 20);            // small range forces ties
    Graph::Builder b;
    for (std::size_t i = 1; i < V; ++i) {
        std::uniform_int_distribution<std::size_t> parent(0, i - 1);
        b.addEdge("n" + std::to_string(i), "n" + std::to_string(parent(rng)), weight(rng));
    }
    std::uniform_int_distribution<std::size_t> pick(0, V - 1);
    for (std::size_t k = 0; k < extra; ++k) {
        const auto u = pick(rng), v = pick(rng);
        if (u == v) continue;
        b.addEdge("n" + std::to_string(u), "n" + std::to_string(v), weight(rng));
    }
    return share(b.build());
}

static const SortStrategy kSorts[] = {SortStrategy::QuickSort, SortStrategy::MergeSort,
                                      SortStrategy::HeapSort, SortStrategy::BucketSort,
                                      SortStrategy::Standard};

TEST_CASE("Kruskal picks the two lightest triangle edges") {
    KruskalAlgorithm kruskal;
    auto g = triangle();
    auto r = kruskal.computeMST(g);
    CHECK(r.totalCost() == doctest::Approx(3.0));
    CHECK(r.mstEdges().size() == 2);
    CHECK(g->findEdge("A", "B")->inMst());
    CHECK(g->findEdge("B", "C")->inMst());
    CHECK_FALSE(g->findEdge("A", "C")->inMst());
    CHECK(r.isValidMST());
    CHECK(r.parameters().useUnionFind);
    CHECK(r.parameters().dataStructureVariant == "MAP_BASED_QUICKSORT");
}

TEST_CASE("Kruskal on a star") {
    KruskalAlgorithm kruskal;
    auto g = share(Graph::Builder()
                       .addEdge("X", "a", 1).addEdge("X", "b", 2).addEdge("X", "c", 3)
                       .addEdge("X", "d", 1).addEdge("a", "b", 5).build());
    auto r = kruskal.computeMST(g);
    CHECK(r.totalCost() == doctest::Approx(7.0));
    CHECK(r.mstEdges().size() == 4);
}

TEST_CASE("Kruskal fails on two disjoint components") {
    KruskalAlgorithm kruskal;
    auto g = share(Graph::Builder().addEdge("A", "B", 1).addEdge("C", "D", 1).build());
    CHECK_THROWS_AS(kruskal.computeMST(g), MstComputationError);
    CHECK(g->mstEdges().empty());
}

TEST_CASE("Kruskal rejects null and empty graphs") {
    KruskalAlgorithm kruskal;
    CHECK_THROWS_AS(kruskal.computeMST(nullptr), std::invalid_argument);
    CHECK_THROWS_AS(kruskal.computeMST(std::make_shared<const Graph>()), std::invalid_argument);
}

TEST_CASE("Kruskal on a single vertex") {
    KruskalAlgorithm kruskal;
    auto r = kruskal.computeMST(share(Graph::Builder().addVertex("solo").build()));
    CHECK(r.mstEdges().empty());
    CHECK(r.isValidMST());
}

TEST_CASE("Every sort strategy yields the same order") {
    std::vector<Edge> edges;
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> w(0, 9);
    for (int i = 0; i < 200; ++i)
        edges.push_back(Edge::create("v" + std::to_string(i % 17), "u" + std::to_string(i % 23), w(rng)));

    std::size_t cmp = 0;
    const auto expected = sortEdgeOrder(edges, SortStrategy::Standard, 100, cmp);
    for (std::size_t i = 1; i < expected.size(); ++i)
        CHECK(edges[expected[i - 1]].weight() <= edges[expected[i]].weight());

    for (auto s : kSorts) {
        CAPTURE(toString(s));
        std::size_t count = 0;
        CHECK(sortEdgeOrder(edges, s, 10, count) == expected);
        CHECK(count > 0);
    }
}

TEST_CASE("Sorting handles empty, single and all-zero inputs") {
    for (auto s : kSorts) {
        std::size_t cmp = 0;
        CHECK(sortEdgeOrder({}, s, 100, cmp).empty());
        CHECK(sortEdgeOrder({Edge::create("a", "b", 2)}, s, 100, cmp) == std::vector<std::size_t>{0});
        const std::vector<Edge> zeros = {Edge::create("c", "d", 0), Edge::create("a", "b", 0)};
        CHECK(sortEdgeOrder(zeros, s, 100, cmp) == std::vector<std::size_t>{1, 0});   // by id
    }
}

TEST_CASE("All Kruskal and Prim configurations agree on cost") {
    for (unsigned seed = 1; seed <= 5; ++seed) {
        auto g = randomConnected(40, 120, seed);
        PrimAlgorithm prim;
        const double reference = prim.computeMST(g).totalCost();

        for (auto uf : {UnionFindStrategy::ArrayBased, UnionFindStrategy::MapBased}) {
            for (auto sort : kSorts) {
                for (bool pc : {true, false}) {
                    for (bool early : {true, false}) {
                        KruskalAlgorithm::Options opt;
                        opt.unionFind = uf;
                        opt.sorting = sort;
                        opt.pathCompression = pc;
                        opt.unionByRank = !pc;
                        opt.earlyTermination = early;
                        KruskalAlgorithm kruskal(opt);
                        CAPTURE(kruskal.toString());
                        auto r = kruskal.computeMST(g);
                        CHECK(r.mstEdges().size() == 39);
                        CHECK(r.totalCost() == doctest::Approx(reference));
                        CHECK(r.isValidMST());
                    }
                }
            }
        }

        for (auto q : {QueueStrategy::ArrayBased, QueueStrategy::DaryHeap}) {
            PrimAlgorithm::Options opt;
            opt.queueStrategy = q;
            PrimAlgorithm other(opt);
            CHECK(other.computeMST(g).totalCost() == doctest::Approx(reference));
        }
    }
}

TEST_CASE("Equal weights pick the same tree under every sort") {
    // Square with equal weights: ties resolve by canonical id.
    auto g = share(Graph::Builder()
                       .addEdge("C", "D", 1).addEdge("A", "B", 1)
                       .addEdge("B", "C", 1).addEdge("A", "D", 1).build());
    for (auto s : kSorts) {
        KruskalAlgorithm::Options opt;
        opt.sorting = s;
        KruskalAlgorithm kruskal(opt);
        auto r = kruskal.computeMST(g);
        std::set<std::string> ids;
        for (const auto& e : r.mstEdges()) ids.insert(e.id());
        CHECK(ids == std::set<std::string>{"A-B", "A-D", "B-C"});
    }
}

TEST_CASE("Early termination scans fewer edges") {
    // Light path first, then heavy chords that are never needed.
    Graph::Builder b;
    for (int i = 0; i < 9; ++i) b.addEdge(std::to_string(i), std::to_string(i + 1), 1);
    for (int i = 0; i < 8; ++i) b.addEdge(std::to_string(i), std::to_string(i + 2), 10);
    auto g = share(b.build());

    KruskalAlgorithm::Options stop;
    KruskalAlgorithm::Options scanAll;
    scanAll.earlyTermination = false;
    KruskalAlgorithm fast(stop), slow(scanAll);

    const auto a = fast.computeMST(g).performanceMetrics().counters;
    const auto b2 = slow.computeMST(g).performanceMetrics().counters;
    CHECK(a.findOperations < b2.findOperations);
    CHECK(a.unionOperations == 9);
    CHECK(b2.unionOperations == 9);
}

TEST_CASE("Kruskal counters and reset()") {
    KruskalAlgorithm kruskal;
    kruskal.computeMST(triangle());
    auto m = kruskal.performanceMetrics();
    CHECK(infoInt(m, "unionOperations") == 2);
    CHECK(infoInt(m, "findOperations") >= 4);
    CHECK(infoInt(m, "comparisonsCount") > 0);

    kruskal.reset();
    m = kruskal.performanceMetrics();
    CHECK(infoInt(m, "unionOperations") == 0);
    CHECK(infoInt(m, "operationsCount") == 0);
    CHECK(kruskal.options().sorting == SortStrategy::QuickSort);
}

TEST_CASE("Kruskal identity, parameters, presets and suitability") {
    KruskalAlgorithm kruskal;
    CHECK(kruskal.name() == "Kruskal");
    CHECK(kruskal.timeComplexity() == "O(E log E)");
    CHECK(kruskal.optimizedFor() == "SPARSE");
    CHECK(kruskal.variant() == "MAP_BASED_QUICKSORT");

    auto p = kruskal.parameters();
    CHECK(infoString(p, "unionFindStrategy") == "MAP_BASED");
    CHECK(infoString(p, "sortingStrategy") == "QUICKSORT");
    CHECK(infoBool(p, "pathCompression"));
    CHECK(infoBool(p, "earlyTermination"));

    auto dense = KruskalAlgorithm::createForDenseGraphs();
    CHECK(dense->variant() == "ARRAY_BASED_BUCKET_SORT");
    CHECK_FALSE(dense->options().unionByRank);

    auto a = kruskal.analyzeSuitability(*triangle());
    CHECK_FALSE(infoBool(a, "suitableForKruskal"));
    CHECK(infoString(a, "recommendedSortingStrategy") == "QUICKSORT");
    CHECK(infoString(a, "recommendedUnionFindStrategy") == "ARRAY_BASED");

    KruskalAlgorithm::Options bad;
    bad.bucketCount = 0;
    CHECK_THROWS_AS(KruskalAlgorithm{bad}, std::invalid_argument);
}

TEST_CASE("Sort strategy names") {
    CHECK(parseSortStrategy("quicksort") == SortStrategy::QuickSort);
    CHECK(parseSortStrategy("MERGE") == SortStrategy::MergeSort);
    CHECK(parseSortStrategy("heap_sort") == SortStrategy::HeapSort);
    CHECK(parseSortStrategy("Bucket") == SortStrategy::BucketSort);
    CHECK(toString(SortStrategy::Standard) == "STANDARD");
    CHECK_THROWS_AS(parseSortStrategy("bogo"), std::invalid_argument);
}

TEST_CASE("Kruskal marks only the edges it examined") {
    auto g = share(Graph::Builder()
                       .addEdge("A", "B", 1).addEdge("B", "C", 2)
                       .addEdge("C", "D", 3).addEdge("A", "D", 9).build());
    KruskalAlgorithm kruskal;
    kruskal.computeMST(g);
    CHECK(g->findEdge("A", "B")->visited());
    CHECK(g->findEdge("C", "D")->traversalCount() == 1);
    CHECK_FALSE(g->findEdge("A", "D")->visited());           // tree was complete before it

    kruskal.computeMST(g);                                     // a new run starts from zero
    CHECK(g->findEdge("A", "B")->traversalCount() == 1);
}
