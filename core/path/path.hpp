#pragma once

#include "graph/edge.hpp"
#include "graph/graph.hpp"
#include "graph/graph_errors.hpp"
#include "graph/vertex.hpp"
#include "path/subgraph.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace pathgraph {

// ─── Path ──────────────────────────────────────────────────────
// An origin-anchored walk: n vertices joined by n-1 edges, where
// edge i leads from vertex i to vertex i+1 (source to target when
// directed). Paths are values. walk() copies the sequences and
// returns a longer path, so derived paths never share mutable state
// and a Path can be read from any thread.

template <typename V, typename E>
class Path : public Subgraph<V, E> {
public:
    using VertexType = Vertex<V>;
    using EdgeType = Edge<V, E>;

    explicit Path(VertexType origin) { vertices_.push_back(std::move(origin)); }

    static Path startFrom(VertexType origin) { return Path(std::move(origin)); }

    const VertexType& origin() const { return vertices_.front(); }
    const VertexType& tail() const { return vertices_.back(); }

    const std::vector<VertexType>& vertices() const { return vertices_; }
    const std::vector<EdgeType>& edges() const { return edges_; }

    /// Number of vertices, always at least one.
    size_t size() const { return vertices_.size(); }

    bool contains(const VertexType& vertex) const override {
        return std::find(vertices_.begin(), vertices_.end(), vertex) != vertices_.end();
    }

    bool contains(const EdgeType& edge) const override {
        return std::find(edges_.begin(), edges_.end(), edge) != edges_.end();
    }

    bool endsWith(const VertexType& vertex) const { return tail() == vertex; }

    /// Sum of edge weights, in walk order. 0.0 for a bare origin.
    double distance() const {
        double total = 0.0;
        for (const auto& e : edges_) total += e.weight();
        return total;
    }

    /// Extend the walk across `edge`. Directed edges must leave the
    /// tail; undirected edges must touch it.
    Path walk(const EdgeType& edge) const {
        const VertexType& from = tail();
        if (!edge.traversableFrom(from)) {
            throw InvalidTraversalError(fmt::format(
                "Cannot walk edge {} from {}", defaultLabel(edge.element()), defaultLabel(from.element())));
        }
        Path next(*this);
        next.edges_.push_back(edge);
        next.vertices_.push_back(*edge.opposite(from));
        return next;
    }

    /// Vertices one traversable hop from the tail in `graph`: targets
    /// of directed edges leaving the tail and far endpoints of
    /// undirected edges touching it. Computed on each call.
    std::vector<VertexType> accessibleVertices(const Graph<V, E>& graph) const {
        const VertexType& from = tail();
        std::vector<VertexType> out;
        for (const auto& e : graph.traversableEdges(from)) {
            if (!e.traversableFrom(from)) continue;
            out.push_back(e.endpointA() == from ? e.endpointB() : e.endpointA());
        }
        return out;
    }

    bool operator==(const Path& other) const {
        return vertices_ == other.vertices_ && edges_ == other.edges_;
    }
    bool operator!=(const Path& other) const { return !(*this == other); }

    std::string toString() const {
        std::string out = defaultLabel(vertices_.front().element());
        for (size_t i = 0; i < edges_.size(); i++) {
            out += fmt::format(" -[{}]-> {}", defaultLabel(edges_[i].element()),
                               defaultLabel(vertices_[i + 1].element()));
        }
        return fmt::format("Path[{}, distance={}]", out, distance());
    }

private:
    std::vector<VertexType> vertices_;
    std::vector<EdgeType> edges_;
};

} // namespace pathgraph
