// ==========================
// EdgeSort.cpp
// ==========================
// Quicksort, mergesort, heapsort, bucket sort and std::sort over an index
// permutation of the edge list, all sharing one counting comparator.
// ==========================

#include "algo/EdgeSort.hpp"
#include "util/Strings.hpp"

#include <algorithm>          // std::sort, std::make_heap, std::sort_heap, std::max_element
#include <numeric>            // std::iota
#include <stdexcept>          // std::invalid_argument
#include <utility>            // std::swap

std::string toString(SortStrategy strategy) {
    switch (strategy) {
        case SortStrategy::QuickSort:  return "QUICKSORT";
        case SortStrategy::MergeSort:  return "MERGESORT";
        case SortStrategy::HeapSort:   return "HEAP_SORT";
        case SortStrategy::BucketSort: return "BUCKET_SORT";
        case SortStrategy::Standard:   return "STANDARD";
    }
    return "STANDARD";
}

SortStrategy parseSortStrategy(const std::string& name) {
    const auto n = to_lower(name);
    if (n == "quicksort" || n == "quick") return SortStrategy::QuickSort;
    if (n == "mergesort" || n == "merge") return SortStrategy::MergeSort;
    if (n == "heap_sort" || n == "heapsort" || n == "heap") return SortStrategy::HeapSort;
    if (n == "bucket_sort" || n == "bucketsort" || n == "bucket") return SortStrategy::BucketSort;
    if (n == "standard" || n == "std") return SortStrategy::Standard;
    throw std::invalid_argument("unknown sorting strategy: " + name);
}

namespace {

using Order = std::vector<std::size_t>;

// Strict weak order over edge indices; counts every call.
struct EdgeLess {
    const std::vector<Edge>* edges;
    std::size_t* count;

    bool operator()(std::size_t a, std::size_t b) const {
        ++*count;
        const Edge& ea = (*edges)[a];
        const Edge& eb = (*edges)[b];
        if (ea.weight() != eb.weight()) return ea.weight() < eb.weight();
        if (ea.id() != eb.id()) return ea.id() < eb.id();
        return a < b;
    }
};

// --------------------------
// Quicksort on [lo, hi)
// --------------------------
// Middle element as pivot (moved to the end), Lomuto partition. Recurses
// into the smaller side and loops on the larger, so the stack stays O(log n).
void quickSort(Order& v, std::size_t lo, std::size_t hi, const EdgeLess& less) {
    while (hi - lo > 1) {
        const std::size_t mid = lo + (hi - lo) / 2;
        std::swap(v[mid], v[hi - 1]);
        const std::size_t pivot = v[hi - 1];

        std::size_t store = lo;
        for (std::size_t i = lo; i + 1 < hi; ++i) {
            if (less(v[i], pivot)) std::swap(v[i], v[store++]);
        }
        std::swap(v[store], v[hi - 1]);                  // pivot into its final slot

        if (store - lo < hi - store - 1) {
            quickSort(v, lo, store, less);
            lo = store + 1;
        } else {
            quickSort(v, store + 1, hi, less);
            hi = store;
        }
    }
}

// --------------------------
// Top-down mergesort on [lo, hi)
// --------------------------
void mergeSort(Order& v, Order& buf, std::size_t lo, std::size_t hi, const EdgeLess& less) {
    if (hi - lo < 2) return;
    const std::size_t mid = lo + (hi - lo) / 2;
    mergeSort(v, buf, lo, mid, less);
    mergeSort(v, buf, mid, hi, less);

    std::size_t i = lo, j = mid, k = lo;
    while (i < mid && j < hi) buf[k++] = less(v[j], v[i]) ? v[j++] : v[i++];
    while (i < mid) buf[k++] = v[i++];
    while (j < hi) buf[k++] = v[j++];
    std::copy(buf.begin() + static_cast<std::ptrdiff_t>(lo),
              buf.begin() + static_cast<std::ptrdiff_t>(hi),
              v.begin() + static_cast<std::ptrdiff_t>(lo));
}

// --------------------------
// Bucket sort by normalised weight
// --------------------------
// Bucket i holds weights in [i, i+1) * max / (buckets-1). The bucket index
// grows with the weight, so sorting each bucket and concatenating is enough.
void bucketSort(Order& v, const std::vector<Edge>& edges, std::size_t cap, const EdgeLess& less) {
    if (v.size() < 2) return;
    const std::size_t count = std::max<std::size_t>(1, std::min(v.size(), cap));

    double maxWeight = 0.0;
    for (auto i : v) maxWeight = std::max(maxWeight, edges[i].weight());

    std::vector<Order> buckets(count);
    for (auto i : v) {
        std::size_t b = 0;
        if (maxWeight > 0.0) {
            b = static_cast<std::size_t>(edges[i].weight() / maxWeight * static_cast<double>(count - 1));
            if (b >= count) b = count - 1;
        }
        buckets[b].push_back(i);
    }

    v.clear();
    for (auto& bucket : buckets) {
        std::sort(bucket.begin(), bucket.end(), less);
        v.insert(v.end(), bucket.begin(), bucket.end());
    }
}

} // namespace

std::vector<std::size_t> sortEdgeOrder(const std::vector<Edge>& edges,
                                       SortStrategy strategy,
                                       std::size_t bucketCount,
                                       std::size_t& comparisons) {
    Order order(edges.size());
    std::iota(order.begin(), order.end(), std::size_t{0});

    std::size_t count = 0;
    const EdgeLess less{&edges, &count};

    switch (strategy) {
        case SortStrategy::QuickSort:
            quickSort(order, 0, order.size(), less);
            break;
        case SortStrategy::MergeSort: {
            Order buf(order.size());
            mergeSort(order, buf, 0, order.size(), less);
            break;
        }
        case SortStrategy::HeapSort:
            std::make_heap(order.begin(), order.end(), less);
            std::sort_heap(order.begin(), order.end(), less);
            break;
        case SortStrategy::BucketSort:
            bucketSort(order, edges, bucketCount, less);
            break;
        case SortStrategy::Standard:
            std::sort(order.begin(), order.end(), less);
            break;
    }

    comparisons += count;
    return order;
}
