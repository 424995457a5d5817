// ==========================
// DisjointSet.cpp
// ==========================
// find / unite shared by both storage strategies, plus the array- and
// map-backed storage itself.
// ==========================

#include "algo/DisjointSet.hpp"
#include "util/Strings.hpp"

#include <numeric>            // std::iota
#include <stdexcept>          // std::out_of_range, std::invalid_argument

std::string toString(UnionFindStrategy strategy) {
    switch (strategy) {
        case UnionFindStrategy::ArrayBased: return "ARRAY_BASED";
        case UnionFindStrategy::MapBased:   return "MAP_BASED";
    }
    return "MAP_BASED";
}

UnionFindStrategy parseUnionFindStrategy(const std::string& name) {
    const auto n = to_lower(name);
    if (n == "array_based" || n == "array") return UnionFindStrategy::ArrayBased;
    if (n == "map_based" || n == "map") return UnionFindStrategy::MapBased;
    throw std::invalid_argument("unknown union-find strategy: " + name);
}

// --------------------------
// root
// --------------------------
// Walk parent links to the root. With path compression every vertex on the
// walked path is re-pointed straight at the root (second pass), which leaves
// the same forest as the recursive formulation without deep recursion.
std::size_t DisjointSet::root(std::size_t v) {
    std::size_t r = v;
    for (std::size_t p = parentOf(r); p != r; p = parentOf(r)) {
        r = p;
        ++m_ops;
    }
    if (m_compress) {
        while (v != r) {
            const std::size_t next = parentOf(v);
            if (next != r) {
                setParent(v, r);
                ++m_ops;
            }
            v = next;
        }
    }
    return r;
}

std::size_t DisjointSet::find(std::size_t v) {
    if (v >= m_n) throw std::out_of_range("element " + std::to_string(v) + " out of range");
    ++m_finds;
    return root(v);
}

bool DisjointSet::unite(std::size_t a, std::size_t b) {
    const std::size_t ra = find(a);
    const std::size_t rb = find(b);
    if (ra == rb) return false;                           // already in the same set

    if (m_byRank) {
        const unsigned rankA = rankOf(ra);
        const unsigned rankB = rankOf(rb);
        if (rankA < rankB) {
            setParent(ra, rb);                            // smaller rank goes under larger
        } else if (rankA > rankB) {
            setParent(rb, ra);
        } else {
            setParent(rb, ra);
            setRank(ra, rankA + 1);                       // tie: new root grows
        }
    } else {
        setParent(ra, rb);                                // plain link
    }

    ++m_unions;
    m_ops += 2;
    --m_sets;
    return true;
}

// =====================================================
// ArrayDisjointSet
// =====================================================

ArrayDisjointSet::ArrayDisjointSet(std::size_t n, bool pathCompression, bool unionByRank)
    : DisjointSet(n, pathCompression, unionByRank), m_parent(n), m_rank(n, 0) {
    std::iota(m_parent.begin(), m_parent.end(), std::size_t{0}); // each element its own root
}

std::size_t ArrayDisjointSet::bytesReserved() const {
    return m_parent.capacity() * sizeof(std::size_t) + m_rank.capacity() * sizeof(unsigned);
}

// =====================================================
// MapDisjointSet
// =====================================================

MapDisjointSet::MapDisjointSet(std::size_t n, bool pathCompression, bool unionByRank)
    : DisjointSet(n, pathCompression, unionByRank) {}

std::size_t MapDisjointSet::parentOf(std::size_t v) const {
    auto it = m_parent.find(v);
    return it == m_parent.end() ? v : it->second;
}

void MapDisjointSet::setParent(std::size_t v, std::size_t p) {
    m_parent[v] = p;
}

unsigned MapDisjointSet::rankOf(std::size_t v) const {
    auto it = m_rank.find(v);
    return it == m_rank.end() ? 0u : it->second;
}

void MapDisjointSet::setRank(std::size_t v, unsigned r) {
    m_rank[v] = r;
}

// Approximate: one node per entry plus the bucket array.
std::size_t MapDisjointSet::bytesReserved() const {
    const std::size_t node = sizeof(std::size_t) * 2 + sizeof(void*);
    return m_parent.size() * node + m_parent.bucket_count() * sizeof(void*) +
           m_rank.size() * node + m_rank.bucket_count() * sizeof(void*);
}

// =====================================================
// Factory
// =====================================================
std::unique_ptr<DisjointSet> makeDisjointSet(UnionFindStrategy strategy,
                                             std::size_t n,
                                             bool pathCompression,
                                             bool unionByRank) {
    if (strategy == UnionFindStrategy::ArrayBased)
        return std::make_unique<ArrayDisjointSet>(n, pathCompression, unionByRank);
    return std::make_unique<MapDisjointSet>(n, pathCompression, unionByRank);
}
