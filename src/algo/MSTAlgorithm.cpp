// ==========================
// MSTAlgorithm.cpp
// ==========================
// Behaviour shared by every MST strategy: batch execution, the graph
// support check, result validation and the last-run counter snapshot.
// ==========================

#include "algo/MSTAlgorithm.hpp"
#include "util/Log.hpp"

#include <future>             // std::async for batch runs
#include <unordered_set>      // duplicate-graph detection

std::vector<MSTResult>
MSTAlgorithm::computeMSTBatch(const std::vector<std::shared_ptr<const Graph>>& graphs) {
    std::vector<MSTResult> results;
    results.reserve(graphs.size());

    // Two runs over one Graph would race on its in-MST flags.
    std::unordered_set<const Graph*> distinct;
    for (const auto& g : graphs) distinct.insert(g.get());
    const bool parallel = distinct.size() == graphs.size();

    if (!parallel) {
        logging::debug("batch", name(), ": repeated graph in batch, running sequentially");
        for (const auto& g : graphs) results.push_back(computeMST(g));
        return results;
    }

    std::vector<std::future<MSTResult>> tasks;
    tasks.reserve(graphs.size());
    for (const auto& g : graphs)
        tasks.push_back(std::async(std::launch::async, [this, g] { return computeMST(g); }));

    for (auto& t : tasks) results.push_back(t.get());   // rethrows the task's exception
    logging::debug("batch", name(), ": ", results.size(), " graphs processed");
    return results;
}

bool MSTAlgorithm::supportsGraph(const Graph* graph) const {
    return graph != nullptr && !graph->empty() && graph->isConnected();
}

bool MSTAlgorithm::isValidMST(const Graph* graph, const MSTResult* result) const {
    if (graph == nullptr || result == nullptr) return false;
    const std::size_t n = graph->vertexCount();
    if (n == 0) return result->mstEdges().empty();
    if (result->mstEdges().size() != n - 1) return false;
    return result->isValidMST();
}

void MSTAlgorithm::storeCounters(const OperationCounters& counters) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last = counters;
}

OperationCounters MSTAlgorithm::lastCounters() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last;
}

void MSTAlgorithm::clearCounters() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last.clear();
}
