#pragma once                              // ensure this header is included only once per translation unit

#include <cstddef>                        // std::size_t

// ==========================
// Shared tuning constants
// ==========================
// Thresholds used by Graph classification, the suitability analysis of the
// algorithms, and the default Options of PrimAlgorithm / KruskalAlgorithm.
// ==========================

namespace defaults {

// ---- Graph classification ----
static constexpr double kSparseDensity = 0.3;   // density below this => SPARSE
static constexpr double kDenseDensity  = 0.7;   // density above this => DENSE

// ---- Result validation ----
static constexpr double kCostTolerance = 1e-10; // stored vs recomputed MST cost

// ---- Algorithm options ----
static constexpr std::size_t kInitialCapacity  = 100;  // reserve hint for working storage
static constexpr std::size_t kLargeCapacity    = 10000; // reserve hint of the large-graph presets
static constexpr unsigned    kHeapArity        = 4;    // arity of the d-ary heap queue
static constexpr std::size_t kArrayVertexLimit = 1000; // array queue pays off below this |V|
static constexpr std::size_t kMaxBuckets       = 100;  // upper bound on bucket-sort buckets

// ---- Suitability recommendations ----
static constexpr std::size_t kSmallGraphVertices   = 500;   // array queue recommended below
static constexpr std::size_t kMediumGraphVertices  = 5000;  // binary heap recommended below
static constexpr std::size_t kLargeGraphVertices   = 10000; // "large sparse graph" advice above
static constexpr std::size_t kQuicksortEdgeLimit   = 1000;  // quicksort recommended below
static constexpr std::size_t kMergesortEdgeLimit   = 10000; // mergesort recommended below
static constexpr double      kKruskalDensityLimit  = 0.5;   // Kruskal suits graphs below this
static constexpr std::size_t kCriticalPathEdges    = 3;     // lightest edges reported

} // namespace defaults
