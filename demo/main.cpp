// ==========================
// mst_demo: random graph + Prim / Kruskal
// ==========================
// Parses: -v <V> -e <E> -s <seed> [-a <algorithm>]... [--sample] [--log-level <lvl>]
// Builds the A-B-C sample or a random connected weighted graph, runs each
// requested algorithm on it and prints the results side by side.
// ==========================

#include "algo/MSTAlgorithm.hpp"  // AlgorithmFactory, MSTResult
#include "algo/MstError.hpp"      // MstComputationError
#include "graph/Graph.hpp"        // Graph API
#include "util/InfoMap.hpp"       // report printing
#include "util/Log.hpp"           // log threshold
#include <getopt.h>               // getopt_long for command-line parsing
#include <algorithm>              // std::minmax
#include <cstdlib>                // std::atoll, std::exit
#include <iostream>               // I/O
#include <memory>                 // std::shared_ptr
#include <random>                 // PRNG
#include <set>                    // deduplicate edges
#include <string>
#include <vector>

static constexpr long long kMaxVertices = 1000000;            // keeps V*(V-1)/2 well inside long long

static void usage(const char* prog) {                         // print usage and exit
    std::cerr << "Usage: " << prog
              << " [-v <vertices> -e <edges> -s <seed>] [--sample] [-a <algorithm>]..."
              << " [--log-level debug|info|warn|error|off]\n"
              << "Algorithms:";
    for (const auto& n : AlgorithmFactory::names()) std::cerr << " " << n;
    std::cerr << "\n";
    std::exit(1);
}

// A-B(1), B-C(2), A-C(3)
static Graph make_sample_graph() {
    return Graph::Builder()
        .addEdge("A", "B", 1.0)
        .addEdge("B", "C", 2.0)
        .addEdge("A", "C", 3.0)
        .build();
}

// Random connected graph with exactly E unique edges (no self-loops).
// A random spanning tree comes first, so E must be at least V-1.
static Graph make_random_graph(std::size_t V, std::size_t E, unsigned seed) {
    std::mt19937 rng(seed);                                   // PRNG
    std::uniform_int_distribution<int> weight(1, 100);        // integer weights keep output readable

    Graph::Builder b;
    for (std::size_t i = 0; i < V; ++i) b.addVertex("v" + std::to_string(i));

    std::set<std::pair<std::size_t, std::size_t>> used;       // remember edges to avoid duplicates
    auto add = [&](std::size_t u, std::size_t v) {
        auto mm = std::minmax(u, v);                          // canonicalize (small,big)
        if (u == v || used.count(mm)) return false;           // skip self-loops and duplicates
        used.insert(mm);
        b.addEdge("v" + std::to_string(u), "v" + std::to_string(v), weight(rng));
        return true;
    };

    for (std::size_t i = 1; i < V; ++i) {                     // attach each vertex to an earlier one
        std::uniform_int_distribution<std::size_t> parent(0, i - 1);
        add(i, parent(rng));
    }

    std::uniform_int_distribution<std::size_t> pick(0, V - 1); // vertex picker
    std::size_t added = V - 1;
    while (added < E) {
        if (add(pick(rng), pick(rng))) ++added;
    }
    return b.build();
}

int main(int argc, char* argv[]) {                            // entry point
    long long V = -1, E = -1, SEED = -1; bool sample = false; int li = 0;
    std::vector<std::string> algorithms;
    option lo[] = {{"sample",    no_argument,       nullptr, 'S'},
                   {"log-level", required_argument, nullptr, 'L'},
                   {nullptr, 0, nullptr, 0}};                 // long options

    for (int opt; (opt = getopt_long(argc, argv, "v:e:s:a:", lo, &li)) != -1; ) { // parse flags
        if (opt == 'v') V = std::atoll(optarg);               // vertices
        else if (opt == 'e') E = std::atoll(optarg);          // edges
        else if (opt == 's') SEED = std::atoll(optarg);       // seed
        else if (opt == 'a') algorithms.emplace_back(optarg); // algorithm name
        else if (opt == 'S') sample = true;                   // built-in sample graph
        else if (opt == 'L') {
            logging::Level lvl;
            if (!logging::parseLevel(optarg, lvl)) usage(argv[0]);
            logging::setLevel(lvl);
        }
        else usage(argv[0]);                                  // invalid flag
    }

    if (!sample) {
        if (V <= 0 || E < 0 || SEED < 0) usage(argv[0]);      // basic validation
        if (V > kMaxVertices) {
            std::cerr << "At most " << kMaxVertices << " vertices are supported\n";
            return 1;
        }
        if (E < V - 1) {
            std::cerr << "Need at least V-1 edges for a connected graph\n";
            return 1;
        }
        if (E > V * (V - 1) / 2) {                            // max edges in simple undirected graph
            std::cerr << "Too many edges for a simple undirected graph\n";
            return 1;
        }
    }
    if (algorithms.empty()) algorithms = {"prim", "kruskal"};

    auto g = std::make_shared<const Graph>(
        sample ? make_sample_graph()
               : make_random_graph(static_cast<std::size_t>(V), static_cast<std::size_t>(E),
                                   static_cast<unsigned>(SEED)));

    std::cout << "Generated " << g->label() << "\n";          // summary
    std::cout << "Statistics " << toString(g->statistics()) << "\n";

    std::vector<MSTResult> results;
    for (const auto& name : algorithms) {
        auto algo = AlgorithmFactory::create(name);
        if (!algo) {
            std::cerr << "Unknown algorithm: " << name << "\n";
            return 1;
        }
        try {
            results.push_back(algo->computeMST(g));
        } catch (const MstComputationError& ex) {
            std::cerr << ex.what() << "\n";
            return 2;
        }
        const auto& r = results.back();
        std::cout << r.toString() << "\n";
        std::cout << "  " << algo->timeComplexity() << ", " << r.properties().toString() << "\n";
        std::cout << "  metrics " << toString(algo->performanceMetrics()) << "\n";
        if (sample) {
            std::cout << "  edges";
            for (const auto& e : r.mstEdges()) std::cout << " " << e.toString();
            std::cout << "\n";
        }
    }

    for (std::size_t i = 1; i < results.size(); ++i) {        // compare each run with the first
        std::cout << results[0].algorithmName() << " vs " << results[i].algorithmName() << ": "
                  << toString(MSTResult::compareResults(results[0], results[i])) << "\n";
    }

    return 0;                                                 // success
}
