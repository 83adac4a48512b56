#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

namespace pathgraph {

template <typename V, typename E> class Graph;

/// A vertex snapshot handed out by a Graph.
/// Holds the user element plus an opaque handle (per-graph id and the
/// owning instance id). Equality and hashing use the element only.
template <typename V>
class Vertex {
public:
    const V& element() const { return element_; }

    uint64_t id() const { return id_; }
    uint64_t graphId() const { return graph_id_; }

    bool operator==(const Vertex& other) const { return element_ == other.element_; }
    bool operator!=(const Vertex& other) const { return !(*this == other); }

private:
    template <typename, typename> friend class Graph;

    Vertex(uint64_t id, uint64_t graph_id, V element)
        : id_(id), graph_id_(graph_id), element_(std::move(element)) {}

    uint64_t id_ = 0;
    uint64_t graph_id_ = 0;
    V element_;
};

} // namespace pathgraph

namespace std {

template <typename V>
struct hash<pathgraph::Vertex<V>> {
    size_t operator()(const pathgraph::Vertex<V>& v) const {
        return hash<V>{}(v.element());
    }
};

} // namespace std
