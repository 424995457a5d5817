#pragma once                              // ensure this header is included only once per translation unit

#include "algo/DisjointSet.hpp"           // component tracking strategies
#include "algo/EdgeSort.hpp"              // edge ordering strategies
#include "algo/MSTAlgorithm.hpp"          // base interface
#include "config/Defaults.hpp"            // option defaults

#include <cstddef>
#include <memory>
#include <string>

// ==========================
// Kruskal's algorithm
// ==========================
// Scans all edges in ascending weight order and keeps every edge that joins
// two different components, tracked by a DisjointSet.
// ==========================
class KruskalAlgorithm final : public MSTAlgorithm {
public:
    // Construction-time configuration
    struct Options {
        UnionFindStrategy unionFind = UnionFindStrategy::MapBased;
        SortStrategy sorting = SortStrategy::QuickSort;
        bool pathCompression = true;
        bool unionByRank = true;
        bool earlyTermination = true;                         // stop at |V|-1 edges
        std::size_t initialCapacity = defaults::kInitialCapacity;
        std::size_t bucketCount = defaults::kMaxBuckets;      // BucketSort only
    };

    KruskalAlgorithm() : KruskalAlgorithm(Options{}) {}
    explicit KruskalAlgorithm(Options opt);

    // ---- Presets ----
    static std::unique_ptr<KruskalAlgorithm> createDefault();
    static std::unique_ptr<KruskalAlgorithm> createForSparseGraphs();  // map union-find, quicksort
    static std::unique_ptr<KruskalAlgorithm> createForDenseGraphs();   // array union-find, bucket sort

    MSTResult computeMST(std::shared_ptr<const Graph> graph) override;

    std::string name() const override { return "Kruskal"; }
    std::string timeComplexity() const override { return "O(E log E)"; }
    std::string spaceComplexity() const override { return "O(V + E)"; }
    std::string description() const override { return "Kruskal's minimum spanning tree algorithm"; }
    std::string optimizedFor() const override { return "SPARSE"; }

    InfoMap analyzeSuitability(const Graph& graph) const override;
    InfoMap performanceMetrics() const override;
    InfoMap parameters() const override;
    void reset() override;

    const Options& options() const noexcept { return m_opt; }

    // "<UNION_FIND>_<SORTING>", e.g. "MAP_BASED_QUICKSORT"
    std::string variant() const;
    std::string toString() const;

private:
    Options m_opt;
};
