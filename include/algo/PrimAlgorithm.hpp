#pragma once                              // ensure this header is included only once per translation unit

#include "algo/MSTAlgorithm.hpp"          // base interface
#include "algo/VertexQueue.hpp"           // frontier strategies
#include "config/Defaults.hpp"            // option defaults

#include <cstddef>
#include <memory>
#include <string>

// ==========================
// Prim's algorithm
// ==========================
// Grows the tree from vertex index 0, always taking the lightest edge that
// leaves it. The frontier is one of the VertexQueue strategies, fixed at
// construction.
// ==========================
class PrimAlgorithm final : public MSTAlgorithm {
public:
    // Construction-time configuration
    struct Options {
        QueueStrategy queueStrategy = QueueStrategy::BinaryHeap;
        unsigned heapArity = defaults::kHeapArity;               // used by DaryHeap only
        bool optimizeDenseGraphs = false;                        // affects suitability advice
        std::size_t initialCapacity = defaults::kInitialCapacity;
    };

    PrimAlgorithm() : PrimAlgorithm(Options{}) {}
    explicit PrimAlgorithm(Options opt);

    // ---- Presets ----
    static std::unique_ptr<PrimAlgorithm> createDefault();
    static std::unique_ptr<PrimAlgorithm> createForSparseGraphs();  // binary heap
    static std::unique_ptr<PrimAlgorithm> createForDenseGraphs();   // array scan
    static std::unique_ptr<PrimAlgorithm> createForLargeGraphs();   // d-ary heap, large capacity

    MSTResult computeMST(std::shared_ptr<const Graph> graph) override;

    std::string name() const override { return "Prim"; }
    std::string timeComplexity() const override;
    std::string spaceComplexity() const override { return "O(V + E)"; }
    std::string description() const override { return "Prim's minimum spanning tree algorithm"; }
    std::string optimizedFor() const override { return "DENSE"; }

    InfoMap analyzeSuitability(const Graph& graph) const override;
    InfoMap performanceMetrics() const override;
    InfoMap parameters() const override;
    void reset() override;

    const Options& options() const noexcept { return m_opt; }
    std::string toString() const;

private:
    Options m_opt;
};
