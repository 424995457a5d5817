// ==========================
// PrimAlgorithm.cpp
// ==========================
// Prim's MST over the graph's AdjacencyView. Keys start at +inf except the
// start vertex; each extract-min adds the edge that reached the vertex and
// relaxes its still-queued neighbours.
// ==========================

#include "algo/PrimAlgorithm.hpp"
#include "algo/MstError.hpp"
#include "util/Log.hpp"

#include <algorithm>          // std::max
#include <chrono>             // run timing
#include <cmath>              // std::log, std::floor
#include <limits>             // infinity key
#include <sstream>            // toString
#include <stdexcept>          // std::invalid_argument
#include <utility>            // std::move
#include <vector>

namespace {
constexpr std::size_t kNoEdge = static_cast<std::size_t>(-1);   // vertex not reached yet
}

PrimAlgorithm::PrimAlgorithm(Options opt) : m_opt(opt) {
    if (m_opt.queueStrategy == QueueStrategy::DaryHeap && m_opt.heapArity < 2)
        throw std::invalid_argument("heap arity must be at least 2");
}

// --------------------------
// Presets
// --------------------------

std::unique_ptr<PrimAlgorithm> PrimAlgorithm::createDefault() {
    return std::make_unique<PrimAlgorithm>();
}

std::unique_ptr<PrimAlgorithm> PrimAlgorithm::createForSparseGraphs() {
    Options opt;
    opt.queueStrategy = QueueStrategy::BinaryHeap;
    opt.optimizeDenseGraphs = false;
    return std::make_unique<PrimAlgorithm>(opt);
}

std::unique_ptr<PrimAlgorithm> PrimAlgorithm::createForDenseGraphs() {
    Options opt;
    opt.queueStrategy = QueueStrategy::ArrayBased;
    opt.optimizeDenseGraphs = true;
    return std::make_unique<PrimAlgorithm>(opt);
}

std::unique_ptr<PrimAlgorithm> PrimAlgorithm::createForLargeGraphs() {
    Options opt;
    opt.queueStrategy = QueueStrategy::DaryHeap;
    opt.initialCapacity = defaults::kLargeCapacity;
    return std::make_unique<PrimAlgorithm>(opt);
}

// --------------------------
// computeMST
// --------------------------

MSTResult PrimAlgorithm::computeMST(std::shared_ptr<const Graph> graph) {
    if (!graph) throw std::invalid_argument("Graph cannot be null");
    if (graph->empty()) throw std::invalid_argument("Graph must contain at least one vertex");

    const auto started = std::chrono::steady_clock::now();       // wall-clock start
    OperationCounters counters;                                  // this call only

    graph->resetMst();                                           // forget the previous tree
    graph->resetTraversal();                                     // and its traversal marks
    const auto adj = graph->adjacency();                         // index view of the graph
    const std::size_t n = adj.vertexCount();

    logging::debug("prim", "start ", graph->label(), " queue=", ::toString(m_opt.queueStrategy));

    auto queue = makeVertexQueue(m_opt.queueStrategy, std::max(n, m_opt.initialCapacity), m_opt.heapArity);
    std::vector<double> key(n, std::numeric_limits<double>::infinity()); // best known edge weight
    std::vector<std::size_t> minEdge(n, kNoEdge);                // edge that set key[v]
    key[0] = 0.0;                                                // grow the tree from vertex 0

    for (Graph::Vertex v = 0; v < n; ++v) {
        queue->insert(v, key[v]);                                // every vertex starts queued
        ++counters.queueOperations;
    }

    std::vector<Edge> tree;                                      // edges accepted so far
    tree.reserve(n - 1);
    std::size_t relaxations = 0;

    while (!queue->isEmpty() && tree.size() < n - 1) {
        const Graph::Vertex u = queue->extractMin();             // closest vertex outside the tree
        ++counters.queueOperations;

        if (minEdge[u] != kNoEdge) {
            graph->markInMst(minEdge[u]);                        // u joins through its best edge
            tree.push_back(adj.edge(minEdge[u]));
        } else if (u != 0) {
            break;                                               // rest of the queue is unreachable
        }

        for (const auto& inc : adj.incident(u)) {
            ++relaxations;
            ++counters.comparisons;
            adj.edge(inc.edge).markTraversed();                  // examined by this run
            const Graph::Vertex v = inc.neighbor;
            if (queue->contains(v) && inc.weight < key[v]) {     // cheaper way to reach v
                key[v] = inc.weight;
                minEdge[v] = inc.edge;
                if (queue->decreaseKey(v, inc.weight)) ++counters.decreaseKeyOperations;
            }
        }
    }

    counters.comparisons += queue->comparisons();               // heap sift comparisons
    counters.operations = queue->operations() + relaxations + counters.decreaseKeyOperations;
    counters.bytesReserved = queue->bytesReserved() +
                             key.capacity() * sizeof(double) +
                             minEdge.capacity() * sizeof(std::size_t) +
                             tree.capacity() * sizeof(Edge);

    if (tree.size() != n - 1) {                                  // some vertex never reached
        logging::warn("prim", "graph is disconnected: ", tree.size(), " of ", n - 1, " edges");
        graph->resetMst();                                       // no partial tree stays marked
        throw MstComputationError(name(), n - 1, tree.size());
    }

    PerformanceMetrics metrics;
    metrics.executionTime = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - started);
    metrics.counters = counters;
    storeCounters(counters);                                     // snapshot for performanceMetrics()

    AlgorithmParameters params;
    params.dataStructureVariant = ::toString(m_opt.queueStrategy);
    params.useUnionFind = false;
    params.optimizeMemory = m_opt.optimizeDenseGraphs;
    params.initialCapacity = m_opt.initialCapacity;

    MSTResult result(name(), std::move(graph), std::move(tree), metrics, params);
    logging::debug("prim", "done cost=", result.totalCost(), " edges=", result.mstEdges().size(),
                   " ops=", counters.operations);
    return result;
}

// --------------------------
// Reporting
// --------------------------

std::string PrimAlgorithm::timeComplexity() const {
    return m_opt.queueStrategy == QueueStrategy::ArrayBased ? "O(V^2)" : "O(E log V)";
}

InfoMap PrimAlgorithm::analyzeSuitability(const Graph& graph) const {
    const std::size_t v = graph.vertexCount();
    const std::size_t e = graph.edgeCount();
    const double density = graph.density();

    InfoMap a;
    a["vertexCount"] = static_cast<long long>(v);
    a["edgeCount"] = static_cast<long long>(e);
    a["density"] = density;
    a["suitableForPrim"] = density > defaults::kSparseDensity || v < defaults::kArrayVertexLimit;

    // O(V^2) when the array queue would be used on a dense graph, O(E log V) otherwise
    const double vd = static_cast<double>(v);                   // double math: v * v may not fit
    const double ed = static_cast<double>(e);
    double expected = 0.0;
    if (m_opt.optimizeDenseGraphs && v < defaults::kArrayVertexLimit)
        expected = vd * vd;
    else
        expected = ed * std::log(vd + 1.0);
    a["expectedOperations"] = static_cast<long long>(expected);

    QueueStrategy recommended = QueueStrategy::DaryHeap;
    if (v < defaults::kSmallGraphVertices || density > defaults::kDenseDensity)
        recommended = QueueStrategy::ArrayBased;
    else if (v < defaults::kMediumGraphVertices)
        recommended = QueueStrategy::BinaryHeap;
    a["recommendedQueueStrategy"] = ::toString(recommended);

    std::string advice = "Binary heap is optimal for this graph";
    if (ed > std::floor(vd * vd / 4.0))                         // more than a quarter of V^2
        advice = "Use array-based implementation for dense graph";
    else if (v > defaults::kLargeGraphVertices)
        advice = "Use a d-ary heap for large sparse graphs";
    a["recommendedOptimization"] = advice;
    return a;
}

InfoMap PrimAlgorithm::performanceMetrics() const {
    const auto c = lastCounters();
    InfoMap m;
    m["operationsCount"] = static_cast<long long>(c.operations);
    m["comparisonsCount"] = static_cast<long long>(c.comparisons);
    m["queueOperations"] = static_cast<long long>(c.queueOperations);
    m["decreaseKeyOperations"] = static_cast<long long>(c.decreaseKeyOperations);
    m["bytesReserved"] = static_cast<long long>(c.bytesReserved);
    return m;
}

InfoMap PrimAlgorithm::parameters() const {
    InfoMap p;
    p["queueStrategy"] = ::toString(m_opt.queueStrategy);
    p["heapArity"] = static_cast<long long>(m_opt.heapArity);
    p["optimizeDenseGraphs"] = m_opt.optimizeDenseGraphs;
    p["initialCapacity"] = static_cast<long long>(m_opt.initialCapacity);
    return p;
}

void PrimAlgorithm::reset() {
    clearCounters();
}

std::string PrimAlgorithm::toString() const {
    std::ostringstream oss;
    oss << "PrimAlgorithm{queueStrategy=" << ::toString(m_opt.queueStrategy)
        << ", heapArity=" << m_opt.heapArity
        << ", optimizeDense=" << (m_opt.optimizeDenseGraphs ? "true" : "false") << "}";
    return oss.str();
}
