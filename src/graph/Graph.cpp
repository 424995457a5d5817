// ==========================
// Graph.cpp
// ==========================
// This file implements the out-of-line methods of the Graph class:
// construction/indexing, the Builder, lookups, connectivity, components,
// subgraphs, bridges and articulation points, statistics and the run
// annotation helpers.
// Small accessors stay inline in Graph.hpp.
// ==========================

#include "graph/Graph.hpp"   // include the Graph class declaration
#include "config/Defaults.hpp" // density thresholds

#include <algorithm>         // std::min, std::max, std::count
#include <iomanip>           // std::setprecision
#include <sstream>           // used for building strings in label()
#include <stack>             // explicit DFS stack

// --------------------------
// Construction
// --------------------------

Graph::Graph(std::vector<Edge> edges) {
    std::vector<std::string> ids;                       // vertices in first-appearance order
    std::unordered_set<std::string> seen;
    for (const auto& e : edges) {
        if (seen.insert(e.from()).second) ids.push_back(e.from());
        if (seen.insert(e.to()).second) ids.push_back(e.to());
    }
    index(std::move(ids), std::move(edges));
}

Graph::Graph(std::vector<std::string> vertexIds, std::vector<Edge> edges) {
    index(std::move(vertexIds), std::move(edges));
}

// --------------------------
// index
// --------------------------
// Purpose:
//   Assign dense indices to vertices and build the symmetric adjacency list.
//   Every edge endpoint must already be in `vertexIds`.
void Graph::index(std::vector<std::string> vertexIds, std::vector<Edge> edges) {
    m_ids = std::move(vertexIds);
    m_edges = std::move(edges);
    m_index.clear();
    m_index.reserve(m_ids.size());
    for (Vertex v = 0; v < m_ids.size(); ++v) m_index.emplace(m_ids[v], v);

    m_adj.assign(m_ids.size(), {});
    m_ends.clear();
    m_ends.reserve(m_edges.size());
    for (std::size_t i = 0; i < m_edges.size(); ++i) {
        const Edge& e = m_edges[i];
        const Vertex u = indexOf(e.from());
        const Vertex v = indexOf(e.to());
        if (u == npos || v == npos)                     // builder/edge-list paths never hit this
            throw std::logic_error("edge " + e.id() + " references an unknown vertex");
        m_ends.emplace_back(u, v);
        m_adj[u].push_back({v, i, e.weight()});         // list under both endpoints
        m_adj[v].push_back({u, i, e.weight()});
    }
}

// --------------------------
// Builder
// --------------------------

Graph::Builder& Graph::Builder::addVertex(const std::string& id) {
    if (id.empty()) {
        if (m_firstError.empty()) m_firstError = "Vertex id cannot be empty";
        return *this;
    }
    if (m_seen.insert(id).second) m_vertices.push_back(id);
    return *this;
}

Graph::Builder& Graph::Builder::addEdge(const std::string& from, const std::string& to,
                                        double weight, Edge::Type type, std::string label) {
    std::string err;
    auto e = Edge::tryCreate(from, to, weight, err, type, std::move(label));
    if (!e) {
        if (m_firstError.empty()) m_firstError = err;   // keep the first problem only
        return *this;
    }
    return addEdge(*e);
}

Graph::Builder& Graph::Builder::addEdge(const Edge& edge) {
    addVertex(edge.from());
    addVertex(edge.to());
    m_edges.push_back(edge);
    return *this;
}

std::optional<Graph> Graph::Builder::tryBuild(std::string& err) const {
    if (!m_firstError.empty()) {
        err = m_firstError;
        return std::nullopt;
    }
    return Graph(m_vertices, m_edges);
}

Graph Graph::Builder::build() const {
    std::string err;
    auto g = tryBuild(err);
    if (!g) throw std::invalid_argument(err);
    return std::move(*g);
}

// --------------------------
// Lookups
// --------------------------

Graph::Vertex Graph::indexOf(const std::string& id) const {
    auto it = m_index.find(id);
    return it == m_index.end() ? npos : it->second;
}

std::optional<Graph::VertexInfo> Graph::vertex(const std::string& id) const {
    const Vertex v = indexOf(id);
    if (v == npos) return std::nullopt;
    return VertexInfo{m_ids[v], m_adj[v].size()};
}

std::vector<Graph::VertexInfo> Graph::vertices() const {
    std::vector<VertexInfo> out;
    out.reserve(m_ids.size());
    for (Vertex v = 0; v < m_ids.size(); ++v) out.push_back({m_ids[v], m_adj[v].size()});
    return out;
}

std::size_t Graph::degree(const std::string& id) const {
    const Vertex v = indexOf(id);
    if (v == npos) throw std::out_of_range("unknown vertex " + id);
    return m_adj[v].size();
}

const Edge* Graph::findEdge(const std::string& a, const std::string& b) const {
    const Vertex u = indexOf(a);
    const Vertex v = indexOf(b);
    if (u == npos || v == npos) return nullptr;
    for (const auto& inc : m_adj[u])
        if (inc.neighbor == v) return &m_edges[inc.edge];
    return nullptr;
}

std::vector<Edge> Graph::incidentEdges(const std::string& id) const {
    std::vector<Edge> out;
    const Vertex v = indexOf(id);
    if (v == npos) return out;
    out.reserve(m_adj[v].size());
    for (const auto& inc : m_adj[v]) out.push_back(m_edges[inc.edge]);
    return out;
}

std::vector<std::string> Graph::neighbors(const std::string& id) const {
    std::vector<std::string> out;
    const Vertex v = indexOf(id);
    if (v == npos) return out;
    out.reserve(m_adj[v].size());
    for (const auto& inc : m_adj[v]) out.push_back(m_ids[inc.neighbor]);
    return out;
}

// --------------------------
// Density and classification
// --------------------------
// density = |E| / (|V|(|V|-1)/2), defined as 0 for |V| <= 1.

double Graph::density() const noexcept {
    const std::size_t n = vertexCount();
    if (n <= 1) return 0.0;
    const double maxEdges = static_cast<double>(n) * static_cast<double>(n - 1) / 2.0;
    return static_cast<double>(edgeCount()) / maxEdges;
}

Graph::Type Graph::type() const noexcept {
    const double d = density();
    if (d < defaults::kSparseDensity) return Type::Sparse;
    if (d > defaults::kDenseDensity) return Type::Dense;
    return Type::Unknown;
}

// --------------------------
// Connectivity
// --------------------------

void Graph::dfs(Vertex start, std::vector<char>& seen) const {
    std::stack<Vertex> todo;                            // iterative: deep paths must not overflow
    todo.push(start);
    seen[start] = 1;
    while (!todo.empty()) {
        const Vertex u = todo.top();
        todo.pop();
        for (const auto& inc : m_adj[u]) {
            if (!seen[inc.neighbor]) {
                seen[inc.neighbor] = 1;
                todo.push(inc.neighbor);
            }
        }
    }
}

bool Graph::isConnected() const {
    if (empty()) return true;                           // vacuously connected
    std::vector<char> seen(vertexCount(), 0);
    dfs(0, seen);
    return std::all_of(seen.begin(), seen.end(), [](char c) { return c != 0; });
}

std::vector<Graph> Graph::connectedComponents() const {
    std::vector<Graph> components;
    std::vector<char> seen(vertexCount(), 0);
    for (Vertex v = 0; v < vertexCount(); ++v) {
        if (seen[v]) continue;
        std::vector<char> reached(vertexCount(), 0);
        dfs(v, reached);
        std::set<std::string> members;
        for (Vertex u = 0; u < vertexCount(); ++u) {
            if (reached[u]) {
                seen[u] = 1;
                members.insert(m_ids[u]);
            }
        }
        components.push_back(subgraph(members));
    }
    return components;
}

// --------------------------
// subgraph
// --------------------------
// Keeps the subset's vertices (in this graph's order, isolated ones included)
// and every edge whose endpoints are both inside the subset.
Graph Graph::subgraph(const std::set<std::string>& vertexSubset) const {
    std::vector<std::string> ids;
    for (const auto& id : m_ids)
        if (vertexSubset.count(id)) ids.push_back(id);

    std::vector<Edge> kept;
    for (const auto& e : m_edges) {
        if (vertexSubset.count(e.from()) && vertexSubset.count(e.to())) {
            Edge copy = e;
            copy.setInMst(false);                       // fresh graph, fresh annotations
            copy.resetTraversal();
            kept.push_back(copy);
        }
    }
    return Graph(std::move(ids), std::move(kept));
}

// --------------------------
// Bridges and articulation points
// --------------------------
// One iterative DFS per component. disc[v] is the discovery time of v and
// low[v] the earliest discovery time reachable from v's subtree through one
// back edge. Child w of u makes edge u-w a bridge when low[w] > disc[u], and
// makes u a cut vertex when low[w] >= disc[u] (u not a root). A root is a cut
// vertex when it has more than one DFS child.

void Graph::lowLink(std::vector<char>& bridge, std::vector<char>& cut) const {
    const std::size_t unseen = static_cast<std::size_t>(-1);
    const std::size_t noEdge = static_cast<std::size_t>(-1);

    struct Frame {
        Vertex v;                                       // vertex being expanded
        std::size_t parentEdge;                         // edge used to reach v
        std::size_t next;                               // next incidence to look at
        std::size_t children;                           // DFS children found so far
    };

    bridge.assign(edgeCount(), 0);
    cut.assign(vertexCount(), 0);
    std::vector<std::size_t> disc(vertexCount(), unseen);
    std::vector<std::size_t> low(vertexCount(), 0);
    std::size_t timer = 0;
    std::vector<Frame> stack;                           // explicit recursion stack

    for (Vertex root = 0; root < vertexCount(); ++root) {
        if (disc[root] != unseen) continue;             // already in an earlier component
        disc[root] = low[root] = timer++;
        stack.push_back({root, noEdge, 0, 0});

        while (!stack.empty()) {
            Frame& top = stack.back();
            if (top.next < m_adj[top.v].size()) {
                const Incidence inc = m_adj[top.v][top.next++];
                if (inc.edge == top.parentEdge) continue;   // skip the tree edge we came in by
                const Vertex w = inc.neighbor;
                if (disc[w] == unseen) {
                    ++top.children;
                    disc[w] = low[w] = timer++;
                    stack.push_back({w, inc.edge, 0, 0});   // `top` is stale after this
                } else {
                    low[top.v] = std::min(low[top.v], disc[w]); // back edge
                }
                continue;
            }

            const Frame done = top;                     // v fully expanded
            stack.pop_back();
            if (stack.empty()) {
                if (done.children > 1) cut[done.v] = 1; // root rule
                continue;
            }
            const Vertex u = stack.back().v;
            low[u] = std::min(low[u], low[done.v]);
            if (low[done.v] > disc[u]) bridge[done.parentEdge] = 1;
            if (stack.back().parentEdge != noEdge && low[done.v] >= disc[u]) cut[u] = 1;
        }
    }
}

std::vector<Edge> Graph::bridges() const {
    std::vector<char> bridge, cut;
    lowLink(bridge, cut);
    std::vector<Edge> out;
    for (std::size_t i = 0; i < m_edges.size(); ++i)
        if (bridge[i]) out.push_back(m_edges[i]);
    return out;
}

std::vector<std::string> Graph::articulationPoints() const {
    std::vector<char> bridge, cut;
    lowLink(bridge, cut);
    std::vector<std::string> out;
    for (Vertex v = 0; v < m_ids.size(); ++v)
        if (cut[v]) out.push_back(m_ids[v]);
    return out;
}

// --------------------------
// isValid
// --------------------------
// No duplicate canonical ids, every endpoint present, every edge well-formed.
bool Graph::isValid() const {
    std::unordered_set<std::string> ids;
    for (const auto& e : m_edges) {
        if (!ids.insert(e.id()).second) return false;
        if (!hasVertex(e.from()) || !hasVertex(e.to())) return false;
        if (!e.isValid()) return false;
    }
    return true;
}

// --------------------------
// Degree statistics
// --------------------------

double Graph::averageDegree() const noexcept {
    if (empty()) return 0.0;
    return 2.0 * static_cast<double>(edgeCount()) / static_cast<double>(vertexCount());
}

std::size_t Graph::minDegree() const noexcept {
    if (empty()) return 0;
    std::size_t best = m_adj.front().size();
    for (const auto& lst : m_adj) best = std::min(best, lst.size());
    return best;
}

std::size_t Graph::maxDegree() const noexcept {
    std::size_t best = 0;
    for (const auto& lst : m_adj) best = std::max(best, lst.size());
    return best;
}

InfoMap Graph::statistics() const {
    InfoMap stats;
    stats["vertices"] = static_cast<long long>(vertexCount());
    stats["edges"] = static_cast<long long>(edgeCount());
    stats["density"] = density();
    stats["graphType"] = toString(type());
    stats["connected"] = isConnected();
    stats["averageDegree"] = averageDegree();
    stats["minDegree"] = static_cast<long long>(minDegree());
    stats["maxDegree"] = static_cast<long long>(maxDegree());

    std::vector<char> bridge, cut;
    lowLink(bridge, cut);
    stats["bridges"] = static_cast<long long>(std::count(bridge.begin(), bridge.end(), 1));
    stats["articulationPoints"] = static_cast<long long>(std::count(cut.begin(), cut.end(), 1));
    return stats;
}

// --------------------------
// In-MST annotation
// --------------------------

std::vector<Edge> Graph::mstEdges() const {
    std::vector<Edge> out;
    for (const auto& e : m_edges)
        if (e.inMst()) out.push_back(e);
    return out;
}

double Graph::mstTotalCost() const {
    double total = 0.0;
    for (const auto& e : m_edges)
        if (e.inMst()) total += e.weight();
    return total;
}

void Graph::resetMst() const noexcept {
    for (const auto& e : m_edges) e.setInMst(false);
}

void Graph::resetTraversal() const noexcept {
    for (const auto& e : m_edges) e.resetTraversal();
}

void Graph::markInMst(std::size_t edgeIndex) const {
    if (edgeIndex >= m_edges.size()) throw std::out_of_range("edge index out of range");
    m_edges[edgeIndex].setInMst(true);
}

// --------------------------
// label
// --------------------------
// Format: "Graph(3V,3E,SPARSE)"
std::string Graph::label() const {
    std::ostringstream oss;                                         // create a string stream
    oss << "Graph(" << vertexCount() << "V," << edgeCount() << "E," // add vertex and edge counts
        << toString(type()) << ")";                                 // and the density class
    return oss.str();                                               // return composed string
}

std::string toString(Graph::Type type) {
    switch (type) {
        case Graph::Type::Sparse:  return "SPARSE";
        case Graph::Type::Dense:   return "DENSE";
        case Graph::Type::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}
