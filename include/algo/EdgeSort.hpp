#pragma once                              // ensure this header is included only once per translation unit

#include "graph/Edge.hpp"                 // sorted items

#include <cstddef>                        // std::size_t
#include <string>
#include <vector>

// ==========================
// Edge ordering for Kruskal
// ==========================
// Every strategy produces the same total order: weight ascending, then
// canonical edge id, then position in the input. Only the work done (and
// the comparison count) differs.
// ==========================

enum class SortStrategy { QuickSort, MergeSort, HeapSort, BucketSort, Standard };

// "QUICKSORT", "MERGESORT", "HEAP_SORT", "BUCKET_SORT", "STANDARD"
std::string toString(SortStrategy strategy);

// Accepts the names above and "quick", "merge", "heap", "bucket", "std",
// case-insensitive. Throws std::invalid_argument on anything else.
SortStrategy parseSortStrategy(const std::string& name);

// Indices into `edges` in ascending order. `bucketCount` caps the number of
// buckets used by BucketSort. Adds the comparisons performed to `comparisons`.
std::vector<std::size_t> sortEdgeOrder(const std::vector<Edge>& edges,
                                       SortStrategy strategy,
                                       std::size_t bucketCount,
                                       std::size_t& comparisons);
