#pragma once                              // ensure this header is included only once per translation unit

#include "algo/MSTResult.hpp"             // computeMST output
#include "graph/Graph.hpp"                // input graph
#include "util/InfoMap.hpp"               // reporting records

#include <memory>                         // std::shared_ptr / std::unique_ptr
#include <mutex>                          // guards the last-run snapshot
#include <string>
#include <vector>

// Strategy interface all MST algorithms implement
class MSTAlgorithm {
public:
    virtual ~MSTAlgorithm() = default;

    // Minimum spanning tree of `graph`.
    // Throws std::invalid_argument for a null or zero-vertex graph and
    // MstComputationError when the graph is disconnected.
    // Overwrites the in-MST flags on the graph's edges.
    virtual MSTResult computeMST(std::shared_ptr<const Graph> graph) = 0;

    // One result per graph, in input order. Graphs run concurrently unless
    // the same Graph appears more than once. The first failure is rethrown.
    std::vector<MSTResult> computeMSTBatch(const std::vector<std::shared_ptr<const Graph>>& graphs);

    // ---- Identity ----
    virtual std::string name() const = 0;
    virtual std::string timeComplexity() const = 0;
    virtual std::string spaceComplexity() const = 0;
    virtual std::string description() const { return "Minimum Spanning Tree Algorithm"; }
    virtual std::string optimizedFor() const { return "GENERAL"; }   // "SPARSE", "DENSE" or "GENERAL"

    // ---- Reporting ----
    virtual InfoMap analyzeSuitability(const Graph& graph) const = 0;
    virtual InfoMap performanceMetrics() const = 0;   // counters of the last completed run
    virtual InfoMap parameters() const = 0;           // configured strategies and flags

    // Zero the last-run counters; configuration is kept.
    virtual void reset() = 0;

    // Non-null, non-empty and connected.
    virtual bool supportsGraph(const Graph* graph) const;

    // Result belongs to a spanning tree of `graph`: |V|-1 edges and the
    // result's own validity check passes.
    bool isValidMST(const Graph* graph, const MSTResult* result) const;

protected:
    // Last-run snapshot, shared by concurrent computeMST calls.
    void storeCounters(const OperationCounters& counters);
    OperationCounters lastCounters() const;
    void clearCounters();

private:
    mutable std::mutex m_mutex;
    OperationCounters m_last;
};

// Factory that returns a concrete strategy by name
// Accepts (case-insensitive): "PRIM", "PRIM-ARRAY", "PRIM-DARY", "PRIM-SPARSE",
// "PRIM-DENSE", "PRIM-LARGE", "KRUSKAL", "KRUSKAL-ARRAY", "KRUSKAL-SPARSE",
// "KRUSKAL-DENSE". Returns nullptr for anything else.
struct AlgorithmFactory {
    static std::unique_ptr<MSTAlgorithm> create(const std::string& name);
    static std::vector<std::string> names();
};
