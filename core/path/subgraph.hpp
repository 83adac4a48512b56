#pragma once

#include "graph/edge.hpp"
#include "graph/vertex.hpp"

namespace pathgraph {

/// A read-only selection of vertices and edges from a graph.
template <typename V, typename E>
class Subgraph {
public:
    virtual ~Subgraph() = default;

    virtual bool contains(const Vertex<V>& vertex) const = 0;
    virtual bool contains(const Edge<V, E>& edge) const = 0;
};

} // namespace pathgraph
