// ==========================
// MSTResult.cpp
// ==========================
// Derived tree properties, validity checks, comparison and reporting for
// the immutable MST outcome.
// ==========================

#include "algo/MSTResult.hpp"
#include "config/Defaults.hpp"

#include <algorithm>          // std::sort, std::min, std::max
#include <cmath>              // std::fabs
#include <cstddef>            // std::ptrdiff_t
#include <iomanip>            // std::setprecision
#include <numeric>            // std::accumulate
#include <queue>              // BFS frontier
#include <sstream>            // std::ostringstream
#include <stdexcept>          // std::invalid_argument
#include <utility>            // std::move

namespace {

double sumWeights(const std::vector<Edge>& edges) {
    return std::accumulate(edges.begin(), edges.end(), 0.0,
                           [](double acc, const Edge& e) { return acc + e.weight(); });
}

// Adjacency of the tree over the graph's vertex indices. Edges whose
// endpoints are not in the graph are reported through `ok`.
std::vector<std::vector<Graph::Vertex>> treeAdjacency(const Graph& g,
                                                      const std::vector<Edge>& edges,
                                                      bool& ok) {
    std::vector<std::vector<Graph::Vertex>> adj(g.vertexCount());
    ok = true;
    for (const auto& e : edges) {
        const auto u = g.indexOf(e.from());
        const auto v = g.indexOf(e.to());
        if (u == Graph::npos || v == Graph::npos) {
            ok = false;                                 // endpoint not in this graph
            continue;
        }
        adj[u].push_back(v);                            // undirected: list both ways
        adj[v].push_back(u);
    }
    return adj;
}

// BFS in hops; returns the farthest vertex and fills `dist`.
Graph::Vertex farthest(const std::vector<std::vector<Graph::Vertex>>& adj,
                       Graph::Vertex start,
                       std::vector<std::size_t>& dist) {
    const std::size_t unreached = static_cast<std::size_t>(-1);
    dist.assign(adj.size(), unreached);
    std::queue<Graph::Vertex> q;
    q.push(start);
    dist[start] = 0;
    Graph::Vertex best = start;
    while (!q.empty()) {
        const auto u = q.front();                       // next vertex in BFS order
        q.pop();
        if (dist[u] > dist[best]) best = u;             // farthest so far
        for (auto v : adj[u]) {
            if (dist[v] == unreached) {
                dist[v] = dist[u] + 1;                  // one hop further
                q.push(v);
            }
        }
    }
    return best;
}

// Longest path in hops (two BFS passes; exact on a tree).
std::size_t treeDiameter(const Graph& g, const std::vector<Edge>& edges) {
    if (edges.empty()) return 0;
    bool ok = false;
    const auto adj = treeAdjacency(g, edges, ok);
    const auto start = g.indexOf(edges.front().from());
    if (start == Graph::npos) return 0;
    std::vector<std::size_t> dist;
    const auto far = farthest(adj, start, dist);        // one end of a longest path
    const auto other = farthest(adj, far, dist);        // the other end
    return dist[other];
}

MSTProperties computeProperties(const Graph& g, const std::vector<Edge>& edges) {
    MSTProperties p;
    p.vertexCount = g.vertexCount();
    p.edgeCount = edges.size();
    p.density = g.density();
    p.averageDegree = p.vertexCount == 0
                          ? 0.0
                          : 2.0 * static_cast<double>(edges.size()) / static_cast<double>(p.vertexCount);
    p.diameter = treeDiameter(g, edges);
    if (!edges.empty()) {
        const auto [lo, hi] = std::minmax_element(
            edges.begin(), edges.end(),
            [](const Edge& a, const Edge& b) { return a.weight() < b.weight(); });
        p.minEdgeWeight = lo->weight();
        p.maxEdgeWeight = hi->weight();
        p.averageEdgeWeight = sumWeights(edges) / static_cast<double>(edges.size());
        for (const auto& e : edges)
            if (e.weight() == p.minEdgeWeight) p.criticalEdges.push_back(e); // all lightest edges
    }
    return p;
}

} // namespace

// --------------------------
// Construction
// --------------------------

MSTResult::MSTResult(std::string algorithmName,
                     std::shared_ptr<const Graph> graph,
                     std::vector<Edge> mstEdges,
                     PerformanceMetrics metrics,
                     AlgorithmParameters parameters)
    : m_algorithm(std::move(algorithmName)),
      m_graph(std::move(graph)),
      m_edges(std::move(mstEdges)),
      m_totalCost(0.0),
      m_metrics(metrics),
      m_params(std::move(parameters)),
      m_timestamp(std::chrono::system_clock::now()) {
    if (m_algorithm.empty()) throw std::invalid_argument("Algorithm name cannot be empty");
    if (!m_graph) throw std::invalid_argument("Graph cannot be null");

    m_totalCost = sumWeights(m_edges);                  // cost is always derived, never passed in
    m_props = computeProperties(*m_graph, m_edges);

    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            m_timestamp.time_since_epoch()).count();
    std::ostringstream id;                              // "<algorithm>-<V>v-<E>e-<millis>"
    id << m_algorithm << "-" << m_graph->vertexCount() << "v-"
       << m_graph->edgeCount() << "e-" << millis;
    m_id = id.str();
}

// --------------------------
// Validity
// --------------------------

bool MSTResult::spansAllVertices() const {
    const Graph& g = *m_graph;
    if (m_edges.empty()) return g.vertexCount() <= 1;

    bool ok = false;
    const auto adj = treeAdjacency(g, m_edges, ok);
    if (!ok) return false;                               // edge outside the graph

    std::vector<std::size_t> dist;
    farthest(adj, g.indexOf(m_edges.front().from()), dist); // BFS over tree edges only
    const std::size_t unreached = static_cast<std::size_t>(-1);
    return std::none_of(dist.begin(), dist.end(),
                        [unreached](std::size_t d) { return d == unreached; });
}

bool MSTResult::isValidMST() const {
    const std::size_t n = m_graph->vertexCount();
    if (n == 0) return m_edges.empty();
    if (m_edges.size() != n - 1) return false;           // a spanning tree has |V|-1 edges
    if (std::fabs(m_totalCost - sumWeights(m_edges)) > defaults::kCostTolerance) return false;
    return spansAllVertices();
}

// --------------------------
// Comparison
// --------------------------

bool MSTResult::isEquivalentTo(const MSTResult& other) const noexcept {
    return costDifference(other) < defaults::kCostTolerance;
}

double MSTResult::costDifference(const MSTResult& other) const noexcept {
    return std::fabs(m_totalCost - other.m_totalCost);
}

double MSTResult::performanceImprovement(const MSTResult& other) const noexcept {
    const double theirs = other.m_metrics.executionTimeMs();
    if (theirs <= 0) return 0.0;                         // nothing to compare against
    return (1.0 - m_metrics.executionTimeMs() / theirs) * 100.0;
}

InfoMap MSTResult::compareResults(const MSTResult& a, const MSTResult& b) {
    InfoMap report;
    report["costEquivalent"] = a.isEquivalentTo(b);
    report["costDifference"] = a.costDifference(b);
    report["performanceImprovement"] = a.performanceImprovement(b);
    report["fasterAlgorithm"] =
        a.m_metrics.executionTime < b.m_metrics.executionTime ? a.m_algorithm : b.m_algorithm;
    report["fewerOperations"] =
        a.m_metrics.counters.operations <= b.m_metrics.counters.operations ? a.m_algorithm : b.m_algorithm;
    return report;
}

// --------------------------
// Analysis
// --------------------------

InfoMap MSTResult::detailedAnalysis() const {
    const std::size_t n = m_graph->vertexCount();
    InfoMap a;
    a["algorithm"] = m_algorithm;
    a["resultId"] = m_id;
    a["validMST"] = isValidMST();
    a["totalCost"] = m_totalCost;
    a["costPerVertex"] = n > 0 ? m_totalCost / static_cast<double>(n) : 0.0;
    a["costPerEdge"] = m_edges.empty() ? 0.0 : m_totalCost / static_cast<double>(m_edges.size());
    a["executionTimeMs"] = m_metrics.executionTimeMs();
    a["operationsCount"] = static_cast<long long>(m_metrics.counters.operations);
    a["efficiency"] = m_metrics.operationsPerMillisecond();
    a["memoryEfficiency"] = m_metrics.counters.bytesReserved > 0
                                ? static_cast<double>(m_metrics.counters.operations) /
                                      static_cast<double>(m_metrics.counters.bytesReserved)
                                : 0.0;
    a["verticesInMST"] = static_cast<long long>(m_props.vertexCount);
    a["edgesInMST"] = static_cast<long long>(m_props.edgeCount);
    a["mstDensity"] = m_props.density;
    a["averageDegree"] = m_props.averageDegree;
    a["diameter"] = static_cast<long long>(m_props.diameter);
    return a;
}

std::vector<Edge> MSTResult::edgesSortedByWeight() const {
    std::vector<Edge> sorted = m_edges;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Edge& a, const Edge& b) { return a.weight() < b.weight(); });
    return sorted;
}

std::vector<Edge> MSTResult::criticalPathEdges() const {
    auto sorted = edgesSortedByWeight();
    const std::size_t keep = std::min(defaults::kCriticalPathEdges, sorted.size());
    sorted.erase(sorted.begin() + static_cast<std::ptrdiff_t>(keep), sorted.end());
    return sorted;
}

std::string MSTResult::toString() const {
    std::ostringstream oss;
    oss << "MSTResult{algorithm=" << m_algorithm
        << ", cost=" << std::fixed << std::setprecision(2) << m_totalCost
        << ", edges=" << m_edges.size()
        << ", time=" << std::setprecision(3) << m_metrics.executionTimeMs() << "ms"
        << ", operations=" << m_metrics.counters.operations
        << ", valid=" << (isValidMST() ? "true" : "false") << "}";
    return oss.str();
}

// --------------------------
// Records
// --------------------------

InfoMap PerformanceMetrics::toInfoMap() const {
    InfoMap m;
    m["executionTimeMs"] = executionTimeMs();
    m["operationsCount"] = static_cast<long long>(counters.operations);
    m["comparisonsCount"] = static_cast<long long>(counters.comparisons);
    m["queueOperations"] = static_cast<long long>(counters.queueOperations);
    m["decreaseKeyOperations"] = static_cast<long long>(counters.decreaseKeyOperations);
    m["unionOperations"] = static_cast<long long>(counters.unionOperations);
    m["findOperations"] = static_cast<long long>(counters.findOperations);
    m["bytesReserved"] = static_cast<long long>(counters.bytesReserved);
    m["operationsPerMillisecond"] = operationsPerMillisecond();
    return m;
}

std::string PerformanceMetrics::toString() const {
    std::ostringstream oss;
    oss << "PerformanceMetrics{time=" << std::fixed << std::setprecision(3) << executionTimeMs()
        << "ms, operations=" << counters.operations
        << ", memory=" << counters.bytesReserved
        << "B, ops/ms=" << std::setprecision(2) << operationsPerMillisecond() << "}";
    return oss.str();
}

std::string AlgorithmParameters::toString() const {
    std::ostringstream oss;
    oss << "AlgorithmParameters{unionFind=" << (useUnionFind ? "true" : "false")
        << ", optimizeMem=" << (optimizeMemory ? "true" : "false")
        << ", capacity=" << initialCapacity
        << ", variant=" << dataStructureVariant << "}";
    return oss.str();
}

std::string MSTProperties::toString() const {
    std::ostringstream oss;
    oss << "MSTProperties{vertices=" << vertexCount << ", edges=" << edgeCount
        << ", density=" << std::fixed << std::setprecision(3) << density
        << ", avgDegree=" << std::setprecision(2) << averageDegree
        << ", diameter=" << diameter << "}";
    return oss.str();
}
