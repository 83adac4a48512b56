#pragma once

#include "graph/vertex.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace pathgraph {

using Properties = std::unordered_map<std::string, std::string>;

/// An edge snapshot handed out by a Graph.
/// For directed edges endpointA() is the source and endpointB() the
/// target. Equality and hashing use the element only, never the
/// endpoints.
template <typename V, typename E>
class Edge {
public:
    const Vertex<V>& endpointA() const { return endpoint_a_; }
    const Vertex<V>& endpointB() const { return endpoint_b_; }
    bool directed() const { return directed_; }
    double weight() const { return weight_; }
    const E& element() const { return element_; }
    const Properties& properties() const { return properties_; }

    uint64_t id() const { return id_; }
    uint64_t graphId() const { return graph_id_; }

    bool contains(const Vertex<V>& vertex) const {
        return endpoint_a_ == vertex || endpoint_b_ == vertex;
    }

    /// The other endpoint relative to `vertex`, or nullopt when the
    /// edge does not touch it. A self-loop yields the vertex itself.
    std::optional<Vertex<V>> opposite(const Vertex<V>& vertex) const {
        if (endpoint_a_ == vertex) return endpoint_b_;
        if (endpoint_b_ == vertex) return endpoint_a_;
        return std::nullopt;
    }

    /// True when a walk standing on `from` may cross this edge.
    bool traversableFrom(const Vertex<V>& from) const {
        return directed_ ? endpoint_a_ == from : contains(from);
    }

    bool hasProperty(const std::string& key) const {
        return properties_.count(key) > 0;
    }

    std::string property(const std::string& key, const std::string& default_val = "") const {
        auto it = properties_.find(key);
        return it != properties_.end() ? it->second : default_val;
    }

    bool operator==(const Edge& other) const { return element_ == other.element_; }
    bool operator!=(const Edge& other) const { return !(*this == other); }

private:
    template <typename, typename> friend class Graph;

    Edge(uint64_t id, uint64_t graph_id, Vertex<V> a, Vertex<V> b,
         bool directed, double weight, E element, Properties properties)
        : id_(id), graph_id_(graph_id),
          endpoint_a_(std::move(a)), endpoint_b_(std::move(b)),
          directed_(directed), weight_(weight),
          element_(std::move(element)), properties_(std::move(properties)) {}

    uint64_t id_ = 0;
    uint64_t graph_id_ = 0;
    Vertex<V> endpoint_a_;
    Vertex<V> endpoint_b_;
    bool directed_ = false;
    double weight_ = 1.0;
    E element_;
    Properties properties_;
};

} // namespace pathgraph

namespace std {

template <typename V, typename E>
struct hash<pathgraph::Edge<V, E>> {
    size_t operator()(const pathgraph::Edge<V, E>& e) const {
        return hash<E>{}(e.element());
    }
};

} // namespace std
