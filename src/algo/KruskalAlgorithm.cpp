// ==========================
// KruskalAlgorithm.cpp
// ==========================
// Kruskal's MST: sort the edge list with the configured strategy, then keep
// each edge whose endpoints are still in different disjoint sets.
// ==========================

#include "algo/KruskalAlgorithm.hpp"
#include "algo/MstError.hpp"
#include "util/Log.hpp"

#include <chrono>             // run timing
#include <cmath>              // std::log
#include <sstream>            // toString
#include <stdexcept>          // std::invalid_argument
#include <utility>            // std::move
#include <vector>

KruskalAlgorithm::KruskalAlgorithm(Options opt) : m_opt(opt) {
    if (m_opt.bucketCount == 0) throw std::invalid_argument("bucket count must be positive");
}

// --------------------------
// Presets
// --------------------------

std::unique_ptr<KruskalAlgorithm> KruskalAlgorithm::createDefault() {
    return std::make_unique<KruskalAlgorithm>();
}

std::unique_ptr<KruskalAlgorithm> KruskalAlgorithm::createForSparseGraphs() {
    Options opt;
    opt.unionFind = UnionFindStrategy::MapBased;
    opt.sorting = SortStrategy::QuickSort;
    return std::make_unique<KruskalAlgorithm>(opt);
}

std::unique_ptr<KruskalAlgorithm> KruskalAlgorithm::createForDenseGraphs() {
    Options opt;
    opt.unionFind = UnionFindStrategy::ArrayBased;
    opt.sorting = SortStrategy::BucketSort;
    opt.unionByRank = false;
    return std::make_unique<KruskalAlgorithm>(opt);
}

// --------------------------
// computeMST
// --------------------------

MSTResult KruskalAlgorithm::computeMST(std::shared_ptr<const Graph> graph) {
    if (!graph) throw std::invalid_argument("Graph cannot be null");
    if (graph->empty()) throw std::invalid_argument("Graph must contain at least one vertex");

    const auto started = std::chrono::steady_clock::now();       // wall-clock start
    OperationCounters counters;                                  // this call only

    graph->resetMst();                                           // forget the previous tree
    graph->resetTraversal();                                     // and its traversal marks
    const auto adj = graph->adjacency();                         // index view of the graph
    const std::size_t n = adj.vertexCount();

    logging::debug("kruskal", "start ", graph->label(), " variant=", variant());

    // Edge indices, lightest first
    const auto order = sortEdgeOrder(graph->edges(), m_opt.sorting, m_opt.bucketCount, counters.comparisons);
    auto sets = makeDisjointSet(m_opt.unionFind, n, m_opt.pathCompression, m_opt.unionByRank);

    std::vector<Edge> tree;                                      // edges accepted so far
    tree.reserve(n - 1);
    std::size_t scanned = 0;                                     // edges looked at

    for (std::size_t e : order) {
        if (m_opt.earlyTermination && tree.size() == n - 1) break; // tree is complete
        ++scanned;
        adj.edge(e).markTraversed();                             // examined by this run
        const auto& ends = adj.endpoints(e);
        if (sets->unite(ends.first, ends.second)) {             // joins two components
            graph->markInMst(e);
            tree.push_back(adj.edge(e));
        }
    }

    counters.unionOperations = sets->unionOperations();
    counters.findOperations = sets->findOperations();
    counters.operations = scanned + sets->operations() + counters.comparisons;
    counters.bytesReserved = order.capacity() * sizeof(std::size_t) +
                             sets->bytesReserved() +
                             tree.capacity() * sizeof(Edge);

    if (tree.size() != n - 1) {                                  // more than one component left
        logging::warn("kruskal", "graph is disconnected: ", tree.size(), " of ", n - 1, " edges, ",
                      sets->setCount(), " components");
        graph->resetMst();                                       // no partial tree stays marked
        throw MstComputationError(name(), n - 1, tree.size());
    }

    PerformanceMetrics metrics;
    metrics.executionTime = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - started);
    metrics.counters = counters;
    storeCounters(counters);                                     // snapshot for performanceMetrics()

    AlgorithmParameters params;
    params.dataStructureVariant = variant();
    params.useUnionFind = true;
    params.optimizeMemory = m_opt.earlyTermination;
    params.initialCapacity = m_opt.initialCapacity;

    MSTResult result(name(), std::move(graph), std::move(tree), metrics, params);
    logging::debug("kruskal", "done cost=", result.totalCost(), " scanned=", scanned,
                   " of ", order.size(), " edges");
    return result;
}

// --------------------------
// Reporting
// --------------------------

std::string KruskalAlgorithm::variant() const {
    return ::toString(m_opt.unionFind) + "_" + ::toString(m_opt.sorting);
}

InfoMap KruskalAlgorithm::analyzeSuitability(const Graph& graph) const {
    const std::size_t v = graph.vertexCount();
    const std::size_t e = graph.edgeCount();
    const double density = graph.density();

    InfoMap a;
    a["vertexCount"] = static_cast<long long>(v);
    a["edgeCount"] = static_cast<long long>(e);
    a["density"] = density;
    a["suitableForKruskal"] = density < defaults::kKruskalDensityLimit;

    // O(E log E) sort plus O(E log V) union-find
    const double edges = static_cast<double>(e);
    const double sortOps = edges * std::log(edges + 1.0);       // sorting the edge list
    const double unionOps = edges * std::log(static_cast<double>(v) + 1.0);
    a["expectedOperations"] = static_cast<long long>(sortOps) + static_cast<long long>(unionOps);

    SortStrategy sorting = SortStrategy::BucketSort;
    if (e < defaults::kQuicksortEdgeLimit)
        sorting = SortStrategy::QuickSort;
    else if (e < defaults::kMergesortEdgeLimit)
        sorting = SortStrategy::MergeSort;
    a["recommendedSortingStrategy"] = ::toString(sorting);

    a["recommendedUnionFindStrategy"] = ::toString(v < defaults::kArrayVertexLimit
                                                       ? UnionFindStrategy::ArrayBased
                                                       : UnionFindStrategy::MapBased);
    return a;
}

InfoMap KruskalAlgorithm::performanceMetrics() const {
    const auto c = lastCounters();
    InfoMap m;
    m["operationsCount"] = static_cast<long long>(c.operations);
    m["comparisonsCount"] = static_cast<long long>(c.comparisons);
    m["unionOperations"] = static_cast<long long>(c.unionOperations);
    m["findOperations"] = static_cast<long long>(c.findOperations);
    m["bytesReserved"] = static_cast<long long>(c.bytesReserved);
    return m;
}

InfoMap KruskalAlgorithm::parameters() const {
    InfoMap p;
    p["unionFindStrategy"] = ::toString(m_opt.unionFind);
    p["sortingStrategy"] = ::toString(m_opt.sorting);
    p["pathCompression"] = m_opt.pathCompression;
    p["unionByRank"] = m_opt.unionByRank;
    p["earlyTermination"] = m_opt.earlyTermination;
    p["initialCapacity"] = static_cast<long long>(m_opt.initialCapacity);
    p["bucketCount"] = static_cast<long long>(m_opt.bucketCount);
    return p;
}

void KruskalAlgorithm::reset() {
    clearCounters();
}

std::string KruskalAlgorithm::toString() const {
    std::ostringstream oss;
    oss << "KruskalAlgorithm{unionFind=" << ::toString(m_opt.unionFind)
        << ", sorting=" << ::toString(m_opt.sorting)
        << ", pathCompression=" << (m_opt.pathCompression ? "true" : "false")
        << ", unionByRank=" << (m_opt.unionByRank ? "true" : "false")
        << ", earlyTermination=" << (m_opt.earlyTermination ? "true" : "false") << "}";
    return oss.str();
}
