#pragma once

#include "graph/graph.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace pathgraph {

// ─── Digraph ───────────────────────────────────────────────────
// Directed variant of Graph. Every inserted edge is directed with
// endpointA() as the outbound (source) vertex and endpointB() as the
// inbound (target) vertex.
//
// incidentEdges(v) returns the edges entering v and outboundEdges(v)
// the edges leaving v. The two are disjoint except for self-loops,
// which appear in both, and together they cover every edge touching
// v. Removing a vertex removes both kinds.

template <typename V, typename E>
class Digraph : public Graph<V, E> {
public:
    using Base = Graph<V, E>;
    using typename Base::VertexType;
    using typename Base::EdgeType;
    using typename Base::Options;

    explicit Digraph(Options options = Options())
        : Base(std::move(options)) {}

    /// Edges whose source is v.
    std::vector<EdgeType> outboundEdges(const VertexType& v) const {
        std::lock_guard<std::mutex> lock(this->mutex());
        return this->makeEdges(this->outgoingIds(this->checkVertex(v)));
    }

protected:
    using typename Base::EdgeRecord;

    bool isDirected() const override { return true; }

    bool joins(const EdgeRecord& e, uint64_t from, uint64_t to) const override {
        return e.a == from && e.b == to;
    }

    std::vector<uint64_t> incidentEdgeIds(uint64_t vertex_id) const override {
        return this->incomingIds(vertex_id);
    }

    std::vector<uint64_t> traversableEdgeIds(uint64_t vertex_id) const override {
        return this->outgoingIds(vertex_id);
    }

    std::unique_ptr<Base> createEmpty() const override {
        return std::make_unique<Digraph>(this->options());
    }
};

} // namespace pathgraph
