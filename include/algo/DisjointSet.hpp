#pragma once                              // ensure this header is included only once per translation unit

#include <cstddef>                        // std::size_t
#include <memory>                         // std::unique_ptr for the factory
#include <string>                         // strategy names
#include <unordered_map>                  // map-backed storage
#include <vector>                         // array-backed storage

// ==========================
// Disjoint-set union (Kruskal's component tracker)
// ==========================
// Elements are vertex indices 0..n-1. Path compression and union-by-rank are
// independent switches; turning them off only costs speed, `find` always
// returns the real root.
// ==========================

enum class UnionFindStrategy { ArrayBased, MapBased };

// "ARRAY_BASED", "MAP_BASED"
std::string toString(UnionFindStrategy strategy);

// Accepts the names above and "array" / "map", case-insensitive.
// Throws std::invalid_argument on anything else.
UnionFindStrategy parseUnionFindStrategy(const std::string& name);

// Strategy interface shared by all union-find variants
class DisjointSet {
public:
    DisjointSet(std::size_t n, bool pathCompression, bool unionByRank)
        : m_n(n), m_sets(n), m_compress(pathCompression), m_byRank(unionByRank) {}
    virtual ~DisjointSet() = default;

    // Representative of `v`'s set; throws std::out_of_range for v >= size().
    std::size_t find(std::size_t v);

    // Merge the sets of `a` and `b`. Returns false if they were already joined.
    bool unite(std::size_t a, std::size_t b);

    bool connected(std::size_t a, std::size_t b) { return find(a) == find(b); }

    std::size_t size() const noexcept { return m_n; }
    std::size_t setCount() const noexcept { return m_sets; }

    bool pathCompression() const noexcept { return m_compress; }
    bool unionByRank() const noexcept { return m_byRank; }

    virtual UnionFindStrategy strategy() const = 0;
    virtual std::size_t bytesReserved() const = 0;

    // ---- Instrumentation ----
    std::size_t findOperations() const noexcept { return m_finds; }
    std::size_t unionOperations() const noexcept { return m_unions; }
    std::size_t operations() const noexcept { return m_ops; }

protected:
    // Storage hooks implemented by each strategy.
    virtual std::size_t parentOf(std::size_t v) const = 0;
    virtual void setParent(std::size_t v, std::size_t p) = 0;
    virtual unsigned rankOf(std::size_t v) const = 0;
    virtual void setRank(std::size_t v, unsigned r) = 0;

private:
    std::size_t m_n;         // number of elements
    std::size_t m_sets;      // current number of disjoint sets
    bool m_compress;         // path compression on find
    bool m_byRank;           // union by rank
    std::size_t m_finds = 0;
    std::size_t m_unions = 0;
    std::size_t m_ops = 0;   // parent/rank reads and writes

    std::size_t root(std::size_t v);
};

// Parent and rank in flat vectors indexed by vertex.
class ArrayDisjointSet final : public DisjointSet {
public:
    ArrayDisjointSet(std::size_t n, bool pathCompression, bool unionByRank);

    UnionFindStrategy strategy() const override { return UnionFindStrategy::ArrayBased; }
    std::size_t bytesReserved() const override;

protected:
    std::size_t parentOf(std::size_t v) const override { return m_parent[v]; }
    void setParent(std::size_t v, std::size_t p) override { m_parent[v] = p; }
    unsigned rankOf(std::size_t v) const override { return m_rank[v]; }
    void setRank(std::size_t v, unsigned r) override { m_rank[v] = r; }

private:
    std::vector<std::size_t> m_parent;
    std::vector<unsigned> m_rank;
};

// Parent and rank in hash maps; an element gets an entry only once it is
// linked or ranked, so untouched singletons cost nothing.
class MapDisjointSet final : public DisjointSet {
public:
    MapDisjointSet(std::size_t n, bool pathCompression, bool unionByRank);

    UnionFindStrategy strategy() const override { return UnionFindStrategy::MapBased; }
    std::size_t bytesReserved() const override;

protected:
    std::size_t parentOf(std::size_t v) const override;
    void setParent(std::size_t v, std::size_t p) override;
    unsigned rankOf(std::size_t v) const override;
    void setRank(std::size_t v, unsigned r) override;

private:
    std::unordered_map<std::size_t, std::size_t> m_parent;  // absent => own root
    std::unordered_map<std::size_t, unsigned> m_rank;       // absent => rank 0
};

// Factory: one disjoint set per Kruskal run.
std::unique_ptr<DisjointSet> makeDisjointSet(UnionFindStrategy strategy,
                                             std::size_t n,
                                             bool pathCompression,
                                             bool unionByRank);
