#pragma once                              // ensure this header is included only once per translation unit

#include <cstddef>                        // std::size_t
#include <memory>                         // std::unique_ptr for the factory
#include <string>                         // strategy names
#include <vector>                         // heap / list storage

// ==========================
// Min-priority queues over vertex indices (Prim's frontier)
// ==========================
// Every strategy stores vertices 0..n-1 keyed by a double. Equal keys are
// broken by the lower vertex index, so all strategies extract vertices in
// the same order for the same keys.
// ==========================

enum class QueueStrategy { BinaryHeap, ArrayBased, DaryHeap };

// "BINARY_HEAP", "ARRAY_BASED", "D_ARY_HEAP"
std::string toString(QueueStrategy strategy);

// Accepts the names above and short forms ("binary", "array", "dary"),
// case-insensitive. Throws std::invalid_argument on anything else.
QueueStrategy parseQueueStrategy(const std::string& name);

// Strategy interface shared by all queue variants
class VertexQueue {
public:
    virtual ~VertexQueue() = default;

    // Add `vertex` with priority `key`; throws std::logic_error if already queued.
    virtual void insert(std::size_t vertex, double key) = 0;

    // Remove and return the vertex with the smallest key; throws
    // std::out_of_range when the queue is empty.
    virtual std::size_t extractMin() = 0;

    // Lower the key of a queued vertex. Returns false (no change) if
    // `newKey` is not smaller than the current key or the vertex is not queued.
    virtual bool decreaseKey(std::size_t vertex, double newKey) = 0;

    virtual bool contains(std::size_t vertex) const = 0;
    virtual std::size_t size() const = 0;
    bool isEmpty() const { return size() == 0; }

    // Current key of a queued vertex; throws std::out_of_range otherwise.
    virtual double keyOf(std::size_t vertex) const = 0;

    virtual QueueStrategy strategy() const = 0;

    // Bytes reserved by the queue's own containers.
    virtual std::size_t bytesReserved() const = 0;

    // ---- Instrumentation ----
    std::size_t operations() const noexcept { return m_ops; }
    std::size_t comparisons() const noexcept { return m_cmps; }

protected:
    // Strict order: key first, then vertex index.
    bool before(std::size_t a, double ka, std::size_t b, double kb) {
        ++m_cmps;
        return ka < kb || (ka == kb && a < b);
    }

    std::size_t m_ops = 0;   // structural operations (moves, swaps, inserts)
    std::size_t m_cmps = 0;  // key comparisons
};

// --------------------------
// Indexed d-ary heap
// --------------------------
// Array-backed min-heap plus a vertex -> slot table, so decreaseKey can sift
// up without searching. Arity 2 is the classic binary heap.
class IndexedHeapQueue final : public VertexQueue {
public:
    // `capacity` pre-sizes the slot table; larger vertex indices grow it.
    // Throws std::invalid_argument for arity < 2.
    IndexedHeapQueue(unsigned arity, std::size_t capacity);

    void insert(std::size_t vertex, double key) override;
    std::size_t extractMin() override;
    bool decreaseKey(std::size_t vertex, double newKey) override;
    bool contains(std::size_t vertex) const override;
    std::size_t size() const override { return m_heap.size(); }
    double keyOf(std::size_t vertex) const override;
    QueueStrategy strategy() const override;
    std::size_t bytesReserved() const override;

    unsigned arity() const noexcept { return m_arity; }

private:
    static constexpr std::size_t kAbsent = static_cast<std::size_t>(-1);

    unsigned m_arity;                    // children per node
    std::vector<std::size_t> m_heap;     // heap of vertices
    std::vector<double> m_key;           // vertex -> key
    std::vector<std::size_t> m_slot;     // vertex -> heap position, kAbsent if not queued

    void ensureVertex(std::size_t vertex);
    bool less(std::size_t i, std::size_t j);   // compare heap slots i and j
    void swapSlots(std::size_t i, std::size_t j);
    void siftUp(std::size_t i);
    void siftDown(std::size_t i);
};

// --------------------------
// Unsorted array with linear scan
// --------------------------
// extractMin scans every queued vertex (O(n)); decreaseKey only rewrites the
// key (O(1)). Pays off on small or dense graphs where heap upkeep dominates.
class LinearScanQueue final : public VertexQueue {
public:
    explicit LinearScanQueue(std::size_t capacity);

    void insert(std::size_t vertex, double key) override;
    std::size_t extractMin() override;
    bool decreaseKey(std::size_t vertex, double newKey) override;
    bool contains(std::size_t vertex) const override;
    std::size_t size() const override { return m_items.size(); }
    double keyOf(std::size_t vertex) const override;
    QueueStrategy strategy() const override { return QueueStrategy::ArrayBased; }
    std::size_t bytesReserved() const override;

private:
    static constexpr std::size_t kAbsent = static_cast<std::size_t>(-1);

    std::vector<std::size_t> m_items;    // queued vertices, unordered
    std::vector<double> m_key;           // vertex -> key
    std::vector<std::size_t> m_pos;      // vertex -> position in m_items

    void ensureVertex(std::size_t vertex);
};

// Factory: one queue per Prim run. `arity` is used only by DaryHeap.
std::unique_ptr<VertexQueue> makeVertexQueue(QueueStrategy strategy,
                                             std::size_t capacity,
                                             unsigned arity);
