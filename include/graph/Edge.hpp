#pragma once                              // ensure this header is included only once per translation unit

#include <cstddef>       // std::size_t for traversal counters
#include <optional>      // std::optional for the fallible factory
#include <string>        // std::string for vertex keys, ids and labels

// ==========================
// Weighted undirected edge
// ==========================
// An Edge joins two distinct string-keyed vertices with a non-negative weight.
// Its identity is the canonical id "min(from,to)-max(from,to)", so A-B and B-A
// are the same edge. The in-MST / visited flags are annotations written by
// algorithm runs; everything else is fixed at creation.
// ==========================

class Edge {
public:
    // Role of the edge in a transportation-style network
    enum class Type { Standard, Bridge, Critical, Highway, Local };

    // ---- Creation ----

    // Fallible factory: returns std::nullopt and fills `err` when the input
    // is a self-loop, has an empty endpoint, or has a negative/non-finite weight.
    static std::optional<Edge> tryCreate(const std::string& from,
                                         const std::string& to,
                                         double weight,
                                         std::string& err,
                                         Type type = Type::Standard,
                                         std::string label = {});

    // Throwing factory: same checks, reports failures as std::invalid_argument.
    static Edge create(const std::string& from,
                       const std::string& to,
                       double weight = 1.0,
                       Type type = Type::Standard,
                       std::string label = {});

    // Canonical order-independent id for the pair (a, b).
    static std::string canonicalId(const std::string& a, const std::string& b);

    // ---- Immutable properties ----
    const std::string& from() const noexcept { return m_from; }
    const std::string& to() const noexcept { return m_to; }
    double weight() const noexcept { return m_weight; }
    const std::string& id() const noexcept { return m_id; }
    Type type() const noexcept { return m_type; }
    const std::string& label() const noexcept { return m_label; }

    // ---- Topology helpers ----

    // Endpoint opposite to `vertex`; throws std::invalid_argument if `vertex`
    // is not an endpoint of this edge.
    const std::string& otherVertex(const std::string& vertex) const;

    bool containsVertex(const std::string& vertex) const noexcept {
        return m_from == vertex || m_to == vertex;
    }

    // True if the edge joins `a` and `b` in either direction.
    bool connects(const std::string& a, const std::string& b) const noexcept {
        return (m_from == a && m_to == b) || (m_from == b && m_to == a);
    }

    bool isValid() const noexcept;
    bool isCritical() const noexcept { return m_type == Type::Bridge || m_type == Type::Critical; }

    // Weight scaled into [0, 1] against `maxWeight`; 0 when maxWeight <= 0.
    double normalizedWeight(double maxWeight) const noexcept;

    // ---- Run annotations ----
    // These are the only mutable parts of an edge. They are `const` so a Graph
    // can stay immutable while an algorithm run marks its tree.
    bool inMst() const noexcept { return m_inMst; }
    void setInMst(bool on) const noexcept { m_inMst = on; }

    bool visited() const noexcept { return m_visited; }
    std::size_t traversalCount() const noexcept { return m_traversals; }
    void markTraversed() const noexcept { ++m_traversals; m_visited = true; }
    void resetTraversal() const noexcept { m_visited = false; m_traversals = 0; }

    // ---- Comparison ----
    // Order: weight, then from, then to. Equality: canonical id.
    bool operator<(const Edge& other) const noexcept;
    bool operator==(const Edge& other) const noexcept { return m_id == other.m_id; }
    bool operator!=(const Edge& other) const noexcept { return !(*this == other); }

    // "A-B(1.50)" and a longer debugging form.
    std::string toString() const;
    std::string toDetailedString() const;

private:
    Edge(std::string from, std::string to, double weight, Type type, std::string label);

    std::string m_from;                  // first endpoint as declared
    std::string m_to;                    // second endpoint as declared
    double m_weight;                     // non-negative weight
    std::string m_id;                    // canonical id
    Type m_type;                         // network role
    std::string m_label;                 // free-text label

    mutable bool m_inMst = false;        // set by the last MST run
    mutable bool m_visited = false;      // traversal annotation
    mutable std::size_t m_traversals = 0;
};

// "STANDARD", "BRIDGE", ...
std::string toString(Edge::Type type);
