// ==========================
// VertexQueue.cpp
// ==========================
// Indexed d-ary heap and linear-scan queue used by Prim's algorithm.
// ==========================

#include "algo/VertexQueue.hpp"
#include "util/Strings.hpp"

#include <algorithm>          // std::min
#include <stdexcept>          // std::invalid_argument, std::logic_error, std::out_of_range
#include <utility>            // std::swap

std::string toString(QueueStrategy strategy) {
    switch (strategy) {
        case QueueStrategy::BinaryHeap: return "BINARY_HEAP";
        case QueueStrategy::ArrayBased: return "ARRAY_BASED";
        case QueueStrategy::DaryHeap:   return "D_ARY_HEAP";
    }
    return "BINARY_HEAP";
}

QueueStrategy parseQueueStrategy(const std::string& name) {
    const auto n = to_lower(name);
    if (n == "binary_heap" || n == "binary" || n == "heap") return QueueStrategy::BinaryHeap;
    if (n == "array_based" || n == "array") return QueueStrategy::ArrayBased;
    if (n == "d_ary_heap" || n == "dary" || n == "d-ary") return QueueStrategy::DaryHeap;
    throw std::invalid_argument("unknown queue strategy: " + name);
}

// =====================================================
// IndexedHeapQueue
// =====================================================

IndexedHeapQueue::IndexedHeapQueue(unsigned arity, std::size_t capacity)
    : m_arity(arity) {
    if (arity < 2) throw std::invalid_argument("heap arity must be at least 2");
    m_heap.reserve(capacity);                            // heap array of vertex ids
    m_key.assign(capacity, 0.0);                         // key per vertex id
    m_slot.assign(capacity, kAbsent);                    // heap position per vertex id
}

QueueStrategy IndexedHeapQueue::strategy() const {
    return m_arity == 2 ? QueueStrategy::BinaryHeap : QueueStrategy::DaryHeap;
}

void IndexedHeapQueue::ensureVertex(std::size_t vertex) {
    if (vertex >= m_slot.size()) {                       // grow tables on demand
        m_slot.resize(vertex + 1, kAbsent);
        m_key.resize(vertex + 1, 0.0);
    }
}

bool IndexedHeapQueue::less(std::size_t i, std::size_t j) {
    const std::size_t a = m_heap[i];
    const std::size_t b = m_heap[j];
    return before(a, m_key[a], b, m_key[b]);
}

// Swap two heap slots and keep the vertex -> slot table in step.
void IndexedHeapQueue::swapSlots(std::size_t i, std::size_t j) {
    std::swap(m_heap[i], m_heap[j]);
    m_slot[m_heap[i]] = i;
    m_slot[m_heap[j]] = j;
    ++m_ops;
}

void IndexedHeapQueue::siftUp(std::size_t i) {
    while (i > 0) {
        const std::size_t parent = (i - 1) / m_arity;    // d-ary parent slot
        if (!less(i, parent)) break;                     // heap order restored
        swapSlots(i, parent);                            // bubble the lighter key up
        i = parent;
    }
}

void IndexedHeapQueue::siftDown(std::size_t i) {
    const std::size_t n = m_heap.size();
    for (;;) {
        const std::size_t first = i * m_arity + 1;       // first child
        if (first >= n) break;
        std::size_t best = i;                            // smallest of i and its children
        const std::size_t last = std::min(first + m_arity, n); // one past the last child
        for (std::size_t c = first; c < last; ++c)
            if (less(c, best)) best = c;
        if (best == i) break;                            // heap order restored
        swapSlots(i, best);
        i = best;
    }
}

void IndexedHeapQueue::insert(std::size_t vertex, double key) {
    ensureVertex(vertex);
    if (m_slot[vertex] != kAbsent)
        throw std::logic_error("vertex " + std::to_string(vertex) + " is already queued");
    m_key[vertex] = key;                                 // remember the key
    m_heap.push_back(vertex);                            // append as a new leaf
    m_slot[vertex] = m_heap.size() - 1;
    ++m_ops;
    siftUp(m_heap.size() - 1);                           // and move it into place
}

std::size_t IndexedHeapQueue::extractMin() {
    if (m_heap.empty()) throw std::out_of_range("extractMin on an empty queue");
    const std::size_t top = m_heap.front();              // current minimum
    swapSlots(0, m_heap.size() - 1);                     // move last leaf to the root
    m_heap.pop_back();
    m_slot[top] = kAbsent;                               // no longer queued
    if (!m_heap.empty()) siftDown(0);                    // restore heap order from the root
    ++m_ops;
    return top;
}

bool IndexedHeapQueue::decreaseKey(std::size_t vertex, double newKey) {
    if (!contains(vertex)) return false;
    ++m_cmps;
    if (!(newKey < m_key[vertex])) return false;         // not a decrease: no-op
    m_key[vertex] = newKey;
    siftUp(m_slot[vertex]);                              // a smaller key can only move up
    ++m_ops;
    return true;
}

bool IndexedHeapQueue::contains(std::size_t vertex) const {
    return vertex < m_slot.size() && m_slot[vertex] != kAbsent;
}

double IndexedHeapQueue::keyOf(std::size_t vertex) const {
    if (!contains(vertex)) throw std::out_of_range("vertex " + std::to_string(vertex) + " is not queued");
    return m_key[vertex];
}

std::size_t IndexedHeapQueue::bytesReserved() const {
    return m_heap.capacity() * sizeof(std::size_t) +
           m_slot.capacity() * sizeof(std::size_t) +
           m_key.capacity() * sizeof(double);
}

// =====================================================
// LinearScanQueue
// =====================================================

LinearScanQueue::LinearScanQueue(std::size_t capacity) {
    m_items.reserve(capacity);
    m_key.assign(capacity, 0.0);
    m_pos.assign(capacity, kAbsent);
}

void LinearScanQueue::ensureVertex(std::size_t vertex) {
    if (vertex >= m_pos.size()) {
        m_pos.resize(vertex + 1, kAbsent);
        m_key.resize(vertex + 1, 0.0);
    }
}

void LinearScanQueue::insert(std::size_t vertex, double key) {
    ensureVertex(vertex);
    if (m_pos[vertex] != kAbsent)
        throw std::logic_error("vertex " + std::to_string(vertex) + " is already queued");
    m_key[vertex] = key;                                 // remember the key
    m_pos[vertex] = m_items.size();                      // position in the unsorted list
    m_items.push_back(vertex);
    ++m_ops;
}

std::size_t LinearScanQueue::extractMin() {
    if (m_items.empty()) throw std::out_of_range("extractMin on an empty queue");
    std::size_t best = 0;
    for (std::size_t i = 1; i < m_items.size(); ++i) {   // O(n) scan
        const std::size_t a = m_items[i];
        const std::size_t b = m_items[best];
        if (before(a, m_key[a], b, m_key[b])) best = i;
    }
    const std::size_t v = m_items[best];                 // minimum found by the scan
    m_items[best] = m_items.back();                      // fill the hole with the last item
    m_pos[m_items[best]] = best;
    m_items.pop_back();
    m_pos[v] = kAbsent;                                  // no longer queued
    ++m_ops;
    return v;
}

bool LinearScanQueue::decreaseKey(std::size_t vertex, double newKey) {
    if (!contains(vertex)) return false;
    ++m_cmps;
    if (!(newKey < m_key[vertex])) return false;
    m_key[vertex] = newKey;                              // the next scan picks it up
    ++m_ops;
    return true;
}

bool LinearScanQueue::contains(std::size_t vertex) const {
    return vertex < m_pos.size() && m_pos[vertex] != kAbsent;
}

double LinearScanQueue::keyOf(std::size_t vertex) const {
    if (!contains(vertex)) throw std::out_of_range("vertex " + std::to_string(vertex) + " is not queued");
    return m_key[vertex];
}

std::size_t LinearScanQueue::bytesReserved() const {
    return m_items.capacity() * sizeof(std::size_t) +
           m_pos.capacity() * sizeof(std::size_t) +
           m_key.capacity() * sizeof(double);
}

// =====================================================
// Factory
// =====================================================
std::unique_ptr<VertexQueue> makeVertexQueue(QueueStrategy strategy,
                                             std::size_t capacity,
                                             unsigned arity) {
    switch (strategy) {
        case QueueStrategy::BinaryHeap: return std::make_unique<IndexedHeapQueue>(2u, capacity);
        case QueueStrategy::DaryHeap:   return std::make_unique<IndexedHeapQueue>(arity, capacity);
        case QueueStrategy::ArrayBased: return std::make_unique<LinearScanQueue>(capacity);
    }
    return std::make_unique<IndexedHeapQueue>(2u, capacity);
}
