#pragma once                              // ensure this header is included only once per translation unit

#include "graph/Graph.hpp"                // Graph and Edge
#include "util/InfoMap.hpp"               // detailedAnalysis() record

#include <chrono>                         // execution time and timestamp
#include <cstddef>                        // std::size_t
#include <memory>                         // std::shared_ptr to the source graph
#include <string>                         // names and ids
#include <vector>                         // MST edge list

// ==========================
// Instrumentation record
// ==========================
// One per computeMST call. Algorithms fill it while they run and hand it to
// the result; nothing here is shared between calls.
struct OperationCounters {
    std::size_t operations = 0;            // all counted steps
    std::size_t comparisons = 0;           // weight/key comparisons
    std::size_t queueOperations = 0;       // Prim: inserts + extract-mins
    std::size_t decreaseKeyOperations = 0; // Prim: successful decrease-keys
    std::size_t unionOperations = 0;       // Kruskal: successful unions
    std::size_t findOperations = 0;        // Kruskal: finds
    std::size_t bytesReserved = 0;         // working storage reserved by the run

    void clear() noexcept { *this = OperationCounters{}; }
};

// Timing plus counters for one run. Wall-clock and byte figures are
// environment dependent; only the counters are reproducible.
struct PerformanceMetrics {
    std::chrono::nanoseconds executionTime{0};
    OperationCounters counters;

    double executionTimeMs() const noexcept {
        return std::chrono::duration<double, std::milli>(executionTime).count();
    }

    // Operations per millisecond; 0 when the run took no measurable time.
    double operationsPerMillisecond() const noexcept {
        const double ms = executionTimeMs();
        return ms > 0 ? static_cast<double>(counters.operations) / ms : 0.0;
    }

    InfoMap toInfoMap() const;
    std::string toString() const;
};

// How the run was configured.
struct AlgorithmParameters {
    std::string dataStructureVariant = "standard"; // e.g. "BINARY_HEAP", "MAP_BASED_QUICKSORT"
    bool useUnionFind = false;
    bool optimizeMemory = false;                   // dense-graph flag / early termination
    std::size_t initialCapacity = 100;

    std::string toString() const;
};

// Shape of the selected tree.
struct MSTProperties {
    std::size_t vertexCount = 0;
    std::size_t edgeCount = 0;
    double density = 0.0;               // density of the source graph
    double averageDegree = 0.0;         // 2|T| / |V|
    std::size_t diameter = 0;           // longest path in the tree, in edges
    double averageEdgeWeight = 0.0;
    double maxEdgeWeight = 0.0;
    double minEdgeWeight = 0.0;
    std::vector<Edge> criticalEdges;    // edges carrying the minimum weight

    std::string toString() const;
};

// ==========================
// MSTResult
// ==========================
// Immutable outcome of one computeMST call. Holds shared ownership of the
// source graph so validity checks stay possible after the caller drops it.
class MSTResult {
public:
    // Throws std::invalid_argument for an empty algorithm name or null graph.
    MSTResult(std::string algorithmName,
              std::shared_ptr<const Graph> graph,
              std::vector<Edge> mstEdges,
              PerformanceMetrics metrics = {},
              AlgorithmParameters parameters = {});

    // ---- Accessors ----
    const std::string& algorithmName() const noexcept { return m_algorithm; }
    const Graph& graph() const noexcept { return *m_graph; }
    const std::vector<Edge>& mstEdges() const noexcept { return m_edges; }
    double totalCost() const noexcept { return m_totalCost; }
    const PerformanceMetrics& performanceMetrics() const noexcept { return m_metrics; }
    const AlgorithmParameters& parameters() const noexcept { return m_params; }
    const MSTProperties& properties() const noexcept { return m_props; }
    const std::string& resultId() const noexcept { return m_id; }
    std::chrono::system_clock::time_point timestamp() const noexcept { return m_timestamp; }

    // |T| == |V|-1, stored cost == recomputed cost, and the tree edges alone
    // reach every vertex.
    bool isValidMST() const;

    // ---- Comparison ----
    bool isEquivalentTo(const MSTResult& other) const noexcept;      // same cost within tolerance
    double costDifference(const MSTResult& other) const noexcept;
    double performanceImprovement(const MSTResult& other) const noexcept; // percent faster than `other`

    // ---- Analysis ----
    InfoMap detailedAnalysis() const;
    std::vector<Edge> edgesSortedByWeight() const;
    std::vector<Edge> criticalPathEdges() const;                      // up to 3 lightest edges
    std::string toString() const;

    // Side-by-side report of two runs on the same graph.
    static InfoMap compareResults(const MSTResult& a, const MSTResult& b);

private:
    std::string m_algorithm;
    std::shared_ptr<const Graph> m_graph;
    std::vector<Edge> m_edges;
    double m_totalCost;
    PerformanceMetrics m_metrics;
    AlgorithmParameters m_params;
    MSTProperties m_props;
    std::string m_id;
    std::chrono::system_clock::time_point m_timestamp;

    bool spansAllVertices() const;
};
