#pragma once                              // ensure this header is included only once per translation unit

#include "graph/Edge.hpp"  // Edge value type
#include "util/InfoMap.hpp" // statistics() record

#include <cstddef>       // defines std::size_t type
#include <limits>        // std::numeric_limits for the "no vertex" marker
#include <optional>      // std::optional for lookups and tryBuild
#include <set>           // std::set for subgraph vertex subsets
#include <stdexcept>     // defines exceptions like out_of_range, invalid_argument
#include <string>        // used for vertex keys and label()
#include <unordered_map> // vertex key -> dense index
#include <unordered_set> // duplicate vertex detection in the builder
#include <utility>       // used for std::pair to represent endpoints
#include <vector>        // used for adjacency lists

// ==========================
// Immutable weighted undirected graph
// ==========================
// This class supports:
// - String-keyed vertices (each also gets a dense index in insertion order)
// - Non-negative weighted edges, no self-loops
// - Symmetric adjacency index (each edge listed under both endpoints)
// - Connectivity, components, subgraphs and density statistics
// - Bridges and articulation points (iterative Tarjan low-link)
// - A read-only AdjacencyView for MST algorithms
// Topology is fixed once built; only the edges' in-MST annotation changes.
// ==========================

class Graph {
public:
    using Vertex = std::size_t;                                  // dense vertex index
    static constexpr Vertex npos = std::numeric_limits<Vertex>::max(); // "no such vertex"

    // Density-based classification
    enum class Type { Sparse, Dense, Unknown };

    // Public, read-only vertex record
    struct VertexInfo {
        std::string id;          // vertex key
        std::size_t degree = 0;  // number of incident edges
    };

    // One adjacency entry: the neighbour reached through edge `edge`
    struct Incidence {
        Vertex neighbor;         // dense index of the other endpoint
        std::size_t edge;        // index into edges()
        double weight;           // copy of the edge weight
    };

    // Index-based adjacency handed to algorithms. It borrows the graph's
    // storage and must not outlive the Graph it came from.
    class AdjacencyView {
    public:
        std::size_t vertexCount() const noexcept { return m_adj->size(); }
        std::size_t edgeCount() const noexcept { return m_edges->size(); }

        // Incidences of vertex `v`; throws std::out_of_range for a bad index.
        const std::vector<Incidence>& incident(Vertex v) const {
            if (v >= m_adj->size()) throw std::out_of_range("vertex index out of range");
            return (*m_adj)[v];
        }

        // Endpoint indices of edge `e`; throws std::out_of_range for a bad index.
        const std::pair<Vertex, Vertex>& endpoints(std::size_t e) const {
            if (e >= m_ends->size()) throw std::out_of_range("edge index out of range");
            return (*m_ends)[e];
        }

        const Edge& edge(std::size_t e) const {
            if (e >= m_edges->size()) throw std::out_of_range("edge index out of range");
            return (*m_edges)[e];
        }

    private:
        friend class Graph;
        AdjacencyView(const std::vector<std::vector<Incidence>>& adj,
                      const std::vector<std::pair<Vertex, Vertex>>& ends,
                      const std::vector<Edge>& edges)
            : m_adj(&adj), m_ends(&ends), m_edges(&edges) {}

        const std::vector<std::vector<Incidence>>* m_adj;
        const std::vector<std::pair<Vertex, Vertex>>* m_ends;
        const std::vector<Edge>* m_edges;
    };

    // Collects vertices and edges, then validates them all at once.
    // Bad input is remembered, never thrown mid-chain; tryBuild()/build() report it.
    class Builder {
    public:
        // Add a vertex (ignored if already present).
        Builder& addVertex(const std::string& id);

        // Add an edge; missing endpoints are added as vertices.
        Builder& addEdge(const std::string& from, const std::string& to, double weight,
                         Edge::Type type = Edge::Type::Standard, std::string label = {});

        // Add an already-validated edge (endpoints added as vertices).
        Builder& addEdge(const Edge& edge);

        // Returns std::nullopt and fills `err` with the first recorded problem.
        std::optional<Graph> tryBuild(std::string& err) const;

        // Throws std::invalid_argument with the first recorded problem.
        Graph build() const;

    private:
        std::vector<std::string> m_vertices;        // insertion order
        std::unordered_set<std::string> m_seen;     // fast duplicate check
        std::vector<Edge> m_edges;                  // declared edges
        std::string m_firstError;                   // first rejected input, if any
    };

    // ---- Constructors ----

    // Empty graph: valid and vacuously connected.
    Graph() = default;

    // Infer vertices from the edge list, in order of first appearance.
    explicit Graph(std::vector<Edge> edges);

    // ---- Vertices ----
    std::size_t vertexCount() const noexcept { return m_ids.size(); }
    bool empty() const noexcept { return m_ids.empty(); }
    bool hasVertex(const std::string& id) const { return m_index.count(id) != 0; }

    // Vertex record, or std::nullopt if `id` is unknown.
    std::optional<VertexInfo> vertex(const std::string& id) const;
    std::vector<VertexInfo> vertices() const;
    const std::vector<std::string>& vertexIds() const noexcept { return m_ids; }

    // Dense index of `id`, or npos if unknown.
    Vertex indexOf(const std::string& id) const;

    // Key of vertex index `v`; throws std::out_of_range for a bad index.
    const std::string& idOf(Vertex v) const {
        checkIndex(v);
        return m_ids[v];
    }

    std::size_t degree(const std::string& id) const;

    // ---- Edges ----
    std::size_t edgeCount() const noexcept { return m_edges.size(); }
    const std::vector<Edge>& edges() const noexcept { return m_edges; }
    bool hasEdge(const std::string& a, const std::string& b) const { return findEdge(a, b) != nullptr; }

    // First edge joining `a` and `b`, or nullptr.
    const Edge* findEdge(const std::string& a, const std::string& b) const;

    // Edges touching `id` (empty for an unknown vertex).
    std::vector<Edge> incidentEdges(const std::string& id) const;

    // Neighbour keys of `id` (empty for an unknown vertex).
    std::vector<std::string> neighbors(const std::string& id) const;

    // Read-only index view used by the MST algorithms.
    AdjacencyView adjacency() const noexcept { return AdjacencyView(m_adj, m_ends, m_edges); }

    // ---- Derived properties ----
    double density() const noexcept;
    Type type() const noexcept;
    bool isConnected() const;
    std::vector<Graph> connectedComponents() const;
    Graph subgraph(const std::set<std::string>& vertexSubset) const;
    bool isValid() const;

    // Edges whose removal disconnects their component, in edge-list order.
    // A pair of parallel edges is never a bridge.
    std::vector<Edge> bridges() const;

    // Vertices whose removal splits their component, in insertion order.
    std::vector<std::string> articulationPoints() const;

    double averageDegree() const noexcept;
    std::size_t minDegree() const noexcept;
    std::size_t maxDegree() const noexcept;
    InfoMap statistics() const;

    // ---- In-MST annotation ----
    // Edges currently flagged by the last algorithm run.
    std::vector<Edge> mstEdges() const;
    double mstTotalCost() const;
    void resetMst() const noexcept;
    void markInMst(std::size_t edgeIndex) const;

    // Clears every edge's visited flag and traversal counter.
    void resetTraversal() const noexcept;

    // Human-readable summary, e.g. "Graph(3V,3E,SPARSE)".
    std::string label() const;

private:
    std::vector<std::string> m_ids;                       // index -> key
    std::unordered_map<std::string, Vertex> m_index;      // key -> index
    std::vector<Edge> m_edges;                            // edge list, declaration order
    std::vector<std::pair<Vertex, Vertex>> m_ends;        // edge -> endpoint indices
    std::vector<std::vector<Incidence>> m_adj;            // symmetric adjacency

    // Builder path: explicit vertex order, endpoints already registered.
    Graph(std::vector<std::string> vertexIds, std::vector<Edge> edges);

    // Shared construction step: index vertices and build adjacency.
    void index(std::vector<std::string> vertexIds, std::vector<Edge> edges);

    // Helper: check if vertex index is valid
    void checkIndex(Vertex v) const {
        if (v >= m_ids.size())
            throw std::out_of_range("vertex index out of range");
    }

    // Depth-first walk from `start`; marks every reached vertex in `seen`.
    void dfs(Vertex start, std::vector<char>& seen) const;

    // Tarjan low-link walk over every component; flags bridge edges (by edge
    // index) and cut vertices (by vertex index).
    void lowLink(std::vector<char>& bridge, std::vector<char>& cut) const;
};

// "SPARSE", "DENSE", "UNKNOWN"
std::string toString(Graph::Type type);
