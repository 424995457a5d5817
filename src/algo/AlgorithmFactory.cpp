// ===============================================
// AlgorithmFactory.cpp
// Maps algorithm names to configured MST strategies (Strategy pattern):
//   * Prim with a binary heap, array scan or d-ary heap frontier
//   * Kruskal with array- or map-backed union-find and any edge sort
// Exposes AlgorithmFactory::create(name) to instantiate a strategy.
// ===============================================

#include "algo/KruskalAlgorithm.hpp"   // Kruskal strategy and its options
#include "algo/MSTAlgorithm.hpp"       // Include the interface and factory declaration.
#include "algo/PrimAlgorithm.hpp"      // Prim strategy and its options
#include "util/Strings.hpp"            // to_lower for case-insensitive names
#include <memory>                      // std::make_unique for factory
#include <string>                      // std::string
#include <vector>                      // std::vector

// =====================================================
// Factory definition (matches header declaration)
// =====================================================
std::unique_ptr<MSTAlgorithm>                                      // Return unique_ptr to created strategy.
AlgorithmFactory::create(const std::string& name) {                // Define factory method declared in header.
    const auto n = to_lower(name);                                 // Normalize the name to lowercase.

    if (n == "prim")        return PrimAlgorithm::createDefault();
    if (n == "prim-sparse") return PrimAlgorithm::createForSparseGraphs();
    if (n == "prim-dense")  return PrimAlgorithm::createForDenseGraphs();
    if (n == "prim-large")  return PrimAlgorithm::createForLargeGraphs();
    if (n == "prim-array") {
        PrimAlgorithm::Options opt;
        opt.queueStrategy = QueueStrategy::ArrayBased;
        return std::make_unique<PrimAlgorithm>(opt);
    }
    if (n == "prim-dary") {
        PrimAlgorithm::Options opt;
        opt.queueStrategy = QueueStrategy::DaryHeap;
        return std::make_unique<PrimAlgorithm>(opt);
    }

    if (n == "kruskal")        return KruskalAlgorithm::createDefault();
    if (n == "kruskal-sparse") return KruskalAlgorithm::createForSparseGraphs();
    if (n == "kruskal-dense")  return KruskalAlgorithm::createForDenseGraphs();
    if (n == "kruskal-array") {
        KruskalAlgorithm::Options opt;
        opt.unionFind = UnionFindStrategy::ArrayBased;
        return std::make_unique<KruskalAlgorithm>(opt);
    }

    return nullptr;                                                // Unknown name → caller handles error.
}

std::vector<std::string> AlgorithmFactory::names() {
    return {"PRIM", "PRIM-ARRAY", "PRIM-DARY", "PRIM-SPARSE", "PRIM-DENSE", "PRIM-LARGE",
            "KRUSKAL", "KRUSKAL-ARRAY", "KRUSKAL-SPARSE", "KRUSKAL-DENSE"};
}
