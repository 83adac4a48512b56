#pragma once

#include "graph/digraph.hpp"
#include "graph/graph.hpp"
#include "logging/logging.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <utility>
#include <vector>

namespace pathgraph {

/// Knobs for the random generators. Vertex i (1-based) gets element
/// vertex_element(i); edge (i, j) gets edge_element(vi, vj).
template <typename V, typename E>
struct RandomGraphConfig {
    int vertex_count = 0;
    double edge_probability = 0.0;
    std::function<V(int)> vertex_element;
    std::function<E(const V&, const V&)> edge_element;
    uint64_t seed = 0;
};

namespace detail {

// For every i in 1..n and j in 1..i (self-loops included) the edge
// i -> j is inserted with probability p, so the expected edge count
// is p * n * (n + 1) / 2. Deterministic for a given seed.
template <typename V, typename E>
void populateRandom(Graph<V, E>& graph, const RandomGraphConfig<V, E>& config) {
    std::mt19937_64 rng(config.seed);
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    std::vector<V> elements;
    elements.reserve(config.vertex_count);
    for (int i = 1; i <= config.vertex_count; i++) {
        elements.push_back(config.vertex_element(i));
        graph.insertVertex(elements.back());
    }

    for (int i = 1; i <= config.vertex_count; i++) {
        for (int j = 1; j <= i; j++) {
            if (coin(rng) >= config.edge_probability) continue;
            const V& from = elements[i - 1];
            const V& to = elements[j - 1];
            graph.insertEdge(from, to, config.edge_element(from, to));
        }
    }

    logging::logger()->debug("[{}] generated {} vertices and {} edges (p={}, seed={})",
                             graph.options().name, graph.numVertices(), graph.numEdges(),
                             config.edge_probability, config.seed);
}

} // namespace detail

template <typename V, typename E>
std::unique_ptr<Graph<V, E>> randomGraph(const RandomGraphConfig<V, E>& config,
                                         GraphOptions<V, E> options = GraphOptions<V, E>()) {
    auto graph = std::make_unique<Graph<V, E>>(std::move(options));
    detail::populateRandom(*graph, config);
    return graph;
}

template <typename V, typename E>
std::unique_ptr<Digraph<V, E>> randomDigraph(const RandomGraphConfig<V, E>& config,
                                             GraphOptions<V, E> options = GraphOptions<V, E>()) {
    auto graph = std::make_unique<Digraph<V, E>>(std::move(options));
    detail::populateRandom(*graph, config);
    return graph;
}

} // namespace pathgraph
