// ==========================
// Edge.cpp
// ==========================
// Validation, canonical ids and string forms for Edge.
// ==========================

#include "graph/Edge.hpp"     // Edge declaration

#include <algorithm>          // std::min
#include <cmath>              // std::isfinite
#include <iomanip>            // std::setprecision
#include <sstream>            // std::ostringstream
#include <stdexcept>          // std::invalid_argument
#include <utility>            // std::move

Edge::Edge(std::string from, std::string to, double weight, Type type, std::string label)
    : m_from(std::move(from)),
      m_to(std::move(to)),
      m_weight(weight),
      m_id(canonicalId(m_from, m_to)),
      m_type(type),
      m_label(std::move(label)) {}

std::optional<Edge> Edge::tryCreate(const std::string& from,
                                    const std::string& to,
                                    double weight,
                                    std::string& err,
                                    Type type,
                                    std::string label) {
    if (from.empty() || to.empty()) {                    // endpoints must name a vertex
        err = "From and To vertices cannot be empty";
        return std::nullopt;
    }
    if (from == to) {                                    // undirected simple graphs only
        err = "Self-loops are not allowed (" + from + ")";
        return std::nullopt;
    }
    if (!std::isfinite(weight)) {
        err = "Edge weight must be finite (" + from + "-" + to + ")";
        return std::nullopt;
    }
    if (weight < 0) {
        err = "Edge weight cannot be negative (" + from + "-" + to + ")";
        return std::nullopt;
    }
    return Edge(from, to, weight, type, std::move(label));
}

Edge Edge::create(const std::string& from,
                  const std::string& to,
                  double weight,
                  Type type,
                  std::string label) {
    std::string err;
    auto e = tryCreate(from, to, weight, err, type, std::move(label));
    if (!e) throw std::invalid_argument(err);
    return *e;
}

std::string Edge::canonicalId(const std::string& a, const std::string& b) {
    return a < b ? a + "-" + b : b + "-" + a;
}

const std::string& Edge::otherVertex(const std::string& vertex) const {
    if (vertex == m_from) return m_to;
    if (vertex == m_to) return m_from;
    throw std::invalid_argument("Vertex " + vertex + " is not part of edge " + m_id);
}

bool Edge::isValid() const noexcept {
    return !m_from.empty() && !m_to.empty() && m_from != m_to &&
           std::isfinite(m_weight) && m_weight >= 0 && !m_id.empty();
}

double Edge::normalizedWeight(double maxWeight) const noexcept {
    if (maxWeight <= 0) return 0.0;
    return std::min(m_weight / maxWeight, 1.0);
}

bool Edge::operator<(const Edge& other) const noexcept {
    if (m_weight != other.m_weight) return m_weight < other.m_weight;
    if (m_from != other.m_from) return m_from < other.m_from;
    return m_to < other.m_to;
}

std::string Edge::toString() const {
    std::ostringstream oss;
    oss << m_from << "-" << m_to << "(" << std::fixed << std::setprecision(2) << m_weight << ")";
    return oss.str();
}

std::string Edge::toDetailedString() const {
    std::ostringstream oss;
    oss << "Edge{id='" << m_id << "', from='" << m_from << "', to='" << m_to
        << "', weight=" << std::fixed << std::setprecision(2) << m_weight
        << ", type=" << ::toString(m_type)
        << ", inMST=" << (m_inMst ? "true" : "false")
        << ", visited=" << (m_visited ? "true" : "false")
        << ", traversals=" << m_traversals
        << ", label='" << m_label << "'}";
    return oss.str();
}

std::string toString(Edge::Type type) {
    switch (type) {
        case Edge::Type::Standard: return "STANDARD";
        case Edge::Type::Bridge:   return "BRIDGE";
        case Edge::Type::Critical: return "CRITICAL";
        case Edge::Type::Highway:  return "HIGHWAY";
        case Edge::Type::Local:    return "LOCAL";
    }
    return "STANDARD";
}
