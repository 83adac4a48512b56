#pragma once

#include "graph/edge.hpp"
#include "graph/element_traits.hpp"
#include "graph/graph_errors.hpp"
#include "graph/handles.hpp"
#include "graph/vertex.hpp"
#include "logging/logging.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pathgraph {

// ─── Graph ─────────────────────────────────────────────────────
// Mutable undirected graph over user elements V (vertices) and E
// (edges). Element values are unique per graph for each kind.
//
// The graph owns every record in id-keyed storage and hands out
// Vertex/Edge snapshots carrying (id, instance id) handles. A handle
// is rejected once its element is removed or replaced.
//
// Each public call takes the instance mutex for its own duration.
// Sequences of calls are not transactional: callers that need a
// consistent view across several calls must hold their own lock.
//
// Digraph derives from this class and overrides the direction hooks.

template <typename V, typename E>
class Graph {
public:
    using VertexType = Vertex<V>;
    using EdgeType = Edge<V, E>;
    using Options = GraphOptions<V, E>;

    explicit Graph(Options options = Options())
        : graph_id_(nextGraphInstanceId()), options_(std::move(options)) {}

    virtual ~Graph() = default;

    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;

    // ── Queries ──
    size_t numVertices() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return vertices_.size();
    }

    size_t numEdges() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return edges_.size();
    }

    /// All vertices, in insertion order.
    std::vector<VertexType> vertices() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<VertexType> out;
        out.reserve(vertices_.size());
        for (const auto& [id, _] : vertices_) out.push_back(makeVertex(id));
        return out;
    }

    /// All edges, in insertion order.
    std::vector<EdgeType> edges() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<EdgeType> out;
        out.reserve(edges_.size());
        for (const auto& [id, _] : edges_) out.push_back(makeEdge(id));
        return out;
    }

    bool hasVertex(const VertexType& v) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ownsVertex(v);
    }

    bool hasEdge(const E& element) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return edge_ids_.count(element) > 0;
    }

    std::optional<VertexType> vertex(const V& element) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = vertex_ids_.find(element);
        if (it == vertex_ids_.end()) return std::nullopt;
        return makeVertex(it->second);
    }

    std::optional<EdgeType> findEdge(const E& element) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = edge_ids_.find(element);
        if (it == edge_ids_.end()) return std::nullopt;
        return makeEdge(it->second);
    }

    bool directed() const { return isDirected(); }
    uint64_t instanceId() const { return graph_id_; }
    const Options& options() const { return options_; }

    // ── Adjacency queries ──

    /// Undirected: every edge touching v. Digraph: inbound edges.
    std::vector<EdgeType> incidentEdges(const VertexType& v) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return makeEdges(incidentEdgeIds(checkVertex(v)));
    }

    /// Edges a walk standing on v may cross next.
    std::vector<EdgeType> traversableEdges(const VertexType& v) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return makeEdges(traversableEdgeIds(checkVertex(v)));
    }

    /// The endpoint of `e` other than `v`, or nullopt when `e` does
    /// not touch `v`. Throws when either handle is invalid.
    std::optional<VertexType> opposite(const VertexType& v, const EdgeType& e) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return oppositeOf(checkVertex(v), checkEdge(e));
    }

    std::optional<VertexType> opposite(const V& v, const E& e) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return oppositeOf(requireVertex(v), requireEdge(e));
    }

    bool areAdjacent(const VertexType& u, const VertexType& v) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return adjacent(checkVertex(u), checkVertex(v));
    }

    bool areAdjacent(const V& u, const V& v) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return adjacent(requireVertex(u), requireVertex(v));
    }

    /// The lightest edge joining a to b. Ties go to the earliest
    /// inserted edge.
    std::optional<EdgeType> edge(const VertexType& a, const VertexType& b) const {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t from = checkVertex(a);
        uint64_t to = checkVertex(b);

        std::optional<uint64_t> best;
        for (uint64_t eid : touchingEdgeIds(from)) {
            const EdgeRecord& rec = edges_.at(eid);
            if (!joins(rec, from, to)) continue;
            if (!best || rec.weight < edges_.at(*best).weight) best = eid;
        }
        if (!best) return std::nullopt;
        return makeEdge(*best);
    }

    // ── Vertex mutation ──
    VertexType insertVertex(V element) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (vertex_ids_.count(element)) {
            fail<DuplicateVertexError>(fmt::format(
                "There's already a vertex with this element: {}", vertexLabel(element)));
        }

        uint64_t id = next_vertex_id_++;
        vertex_ids_.emplace(element, id);
        vertices_.emplace(id, VertexRecord{std::move(element)});
        outgoing_[id];  // ensure entry exists
        incoming_[id];

        auto log = logging::logger();
        if (log->should_log(spdlog::level::debug)) {
            log->debug("[{}] inserted vertex {}", options_.name, vertexLabel(vertices_.at(id).element));
        }
        return makeVertex(id);
    }

    /// Removes v together with every edge touching it.
    V removeVertex(const VertexType& v) {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t id = checkVertex(v);

        std::vector<uint64_t> cascade = touchingEdgeIds(id);
        for (uint64_t eid : cascade) eraseEdge(eid);

        auto it = vertices_.find(id);
        V element = std::move(it->second.element);
        vertices_.erase(it);
        vertex_ids_.erase(element);
        outgoing_.erase(id);
        incoming_.erase(id);

        auto log = logging::logger();
        if (log->should_log(spdlog::level::debug)) {
            log->debug("[{}] removed vertex {} and {} incident edge(s)",
                       options_.name, vertexLabel(element), cascade.size());
        }
        return element;
    }

    /// Swaps the element of v. The vertex gets a new identity and every
    /// edge touching it is rewired; edge elements and weights are kept.
    V replace(const VertexType& v, V new_element) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (vertex_ids_.count(new_element)) {
            fail<DuplicateVertexError>(fmt::format(
                "There's already a vertex with this element: {}", vertexLabel(new_element)));
        }
        uint64_t old_id = checkVertex(v);
        uint64_t new_id = next_vertex_id_++;

        auto node = vertices_.extract(old_id);
        V old_element = std::move(node.mapped().element);
        vertex_ids_.erase(old_element);
        vertex_ids_.emplace(new_element, new_id);
        vertices_.emplace(new_id, VertexRecord{std::move(new_element)});

        for (uint64_t eid : outgoing_[old_id]) edges_.at(eid).a = new_id;
        for (uint64_t eid : incoming_[old_id]) edges_.at(eid).b = new_id;
        outgoing_[new_id] = std::move(outgoing_[old_id]);
        incoming_[new_id] = std::move(incoming_[old_id]);
        outgoing_.erase(old_id);
        incoming_.erase(old_id);

        auto log = logging::logger();
        if (log->should_log(spdlog::level::debug)) {
            log->debug("[{}] replaced vertex {} with {}", options_.name,
                       vertexLabel(old_element), vertexLabel(vertices_.at(new_id).element));
        }
        return old_element;
    }

    // ── Edge mutation ──

    /// Weight comes from the configured WeightExtractor.
    EdgeType insertEdge(const VertexType& u, const VertexType& v, E element) {
        double weight = resolveWeight(element);
        return insertEdge(u, v, std::move(element), weight);
    }

    EdgeType insertEdge(const VertexType& u, const VertexType& v, E element,
                        double weight, Properties properties = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        rejectDuplicateEdge(element);
        uint64_t a = checkVertex(u);
        uint64_t b = checkVertex(v);
        return addEdge(a, b, std::move(element), weight, std::move(properties));
    }

    EdgeType insertEdge(const V& u, const V& v, E element) {
        double weight = resolveWeight(element);
        return insertEdge(u, v, std::move(element), weight);
    }

    EdgeType insertEdge(const V& u, const V& v, E element,
                        double weight, Properties properties = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        rejectDuplicateEdge(element);
        uint64_t a = requireVertex(u);
        uint64_t b = requireVertex(v);
        return addEdge(a, b, std::move(element), weight, std::move(properties));
    }

    E removeEdge(const EdgeType& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t id = checkEdge(e);
        E element = eraseEdge(id);

        auto log = logging::logger();
        if (log->should_log(spdlog::level::debug)) {
            log->debug("[{}] removed edge {}", options_.name, edgeLabel(element));
        }
        return element;
    }

    /// Removes the first edge joining u to v and returns its element.
    /// Returns nullopt when no such edge (or no such vertex) exists.
    std::optional<E> removeEdge(const V& u, const V& v) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto from = vertex_ids_.find(u);
        auto to = vertex_ids_.find(v);
        if (from == vertex_ids_.end() || to == vertex_ids_.end()) return std::nullopt;

        for (uint64_t eid : touchingEdgeIds(from->second)) {
            if (!joins(edges_.at(eid), from->second, to->second)) continue;
            E element = eraseEdge(eid);
            auto log = logging::logger();
            if (log->should_log(spdlog::level::debug)) {
                log->debug("[{}] removed edge {}", options_.name, edgeLabel(element));
            }
            return element;
        }
        return std::nullopt;
    }

    /// Swaps the element of e, keeping endpoints, weight, direction
    /// and properties.
    E replace(const EdgeType& e, E new_element) {
        std::lock_guard<std::mutex> lock(mutex_);
        rejectDuplicateEdge(new_element);
        uint64_t id = checkEdge(e);

        EdgeRecord& rec = edges_.at(id);
        E old_element = std::move(rec.element);
        edge_ids_.erase(old_element);
        edge_ids_.emplace(new_element, id);
        rec.element = std::move(new_element);

        auto log = logging::logger();
        if (log->should_log(spdlog::level::debug)) {
            log->debug("[{}] replaced edge {} with {}", options_.name,
                       edgeLabel(old_element), edgeLabel(rec.element));
        }
        return old_element;
    }

    // ── Cloning ──

    /// Deep copy with a fresh instance id. Handles minted by this
    /// graph are foreign to the copy.
    std::unique_ptr<Graph> clone() const {
        std::unique_ptr<Graph> copy = createEmpty();
        std::lock_guard<std::mutex> lock(mutex_);
        copy->next_vertex_id_ = next_vertex_id_;
        copy->next_edge_id_ = next_edge_id_;
        copy->vertices_ = vertices_;
        copy->vertex_ids_ = vertex_ids_;
        copy->edges_ = edges_;
        copy->edge_ids_ = edge_ids_;
        copy->outgoing_ = outgoing_;
        copy->incoming_ = incoming_;
        return copy;
    }

    std::string toString() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string out = fmt::format("{} with {} vertices and {} edges:\n",
                                      isDirected() ? "Digraph" : "Graph",
                                      vertices_.size(), edges_.size());
        out += "--- Vertices: \n";
        for (const auto& [_, rec] : vertices_) {
            out += fmt::format("\t{}\n", vertexLabel(rec.element));
        }
        out += "\n--- Edges: \n";
        for (const auto& [_, rec] : edges_) {
            out += fmt::format("\t{} {} {} ({}, weight={})\n",
                               vertexLabel(vertices_.at(rec.a).element),
                               rec.directed ? "->" : "--",
                               vertexLabel(vertices_.at(rec.b).element),
                               edgeLabel(rec.element), rec.weight);
        }
        return out;
    }

protected:
    struct VertexRecord {
        V element;
    };

    // `a` is where the edge was inserted from, `b` where it goes.
    // For directed edges that is source and target.
    struct EdgeRecord {
        uint64_t a = 0;
        uint64_t b = 0;
        bool directed = false;
        double weight = 1.0;
        E element;
        Properties properties;
    };

    // ── Direction hooks (called with the mutex held) ──

    virtual bool isDirected() const { return false; }

    /// True when the edge connects `from` to `to` under this graph's
    /// direction rules.
    virtual bool joins(const EdgeRecord& e, uint64_t from, uint64_t to) const {
        return (e.a == from && e.b == to) || (e.a == to && e.b == from);
    }

    virtual std::vector<uint64_t> incidentEdgeIds(uint64_t vertex_id) const {
        return touchingEdgeIds(vertex_id);
    }

    virtual std::vector<uint64_t> traversableEdgeIds(uint64_t vertex_id) const {
        return incidentEdgeIds(vertex_id);
    }

    virtual std::unique_ptr<Graph> createEmpty() const {
        return std::make_unique<Graph>(options_);
    }

    // ── Helpers for derived graphs (mutex held) ──

    std::mutex& mutex() const { return mutex_; }

    std::vector<uint64_t> outgoingIds(uint64_t vertex_id) const {
        const auto& ids = outgoing_.at(vertex_id);
        return std::vector<uint64_t>(ids.begin(), ids.end());
    }

    std::vector<uint64_t> incomingIds(uint64_t vertex_id) const {
        const auto& ids = incoming_.at(vertex_id);
        return std::vector<uint64_t>(ids.begin(), ids.end());
    }

    /// Every edge with vertex_id as either endpoint, ascending by id.
    std::vector<uint64_t> touchingEdgeIds(uint64_t vertex_id) const {
        std::set<uint64_t> ids(outgoing_.at(vertex_id).begin(), outgoing_.at(vertex_id).end());
        ids.insert(incoming_.at(vertex_id).begin(), incoming_.at(vertex_id).end());
        return std::vector<uint64_t>(ids.begin(), ids.end());
    }

    std::vector<EdgeType> makeEdges(const std::vector<uint64_t>& ids) const {
        std::vector<EdgeType> out;
        out.reserve(ids.size());
        for (uint64_t id : ids) out.push_back(makeEdge(id));
        return out;
    }

    /// Validates a handle and returns its record id.
    uint64_t checkVertex(const VertexType& v) const {
        if (v.graphId() != graph_id_) {
            fail<InvalidVertexError>(fmt::format(
                "Vertex does not belong to this graph: {}", vertexLabel(v.element())));
        }
        auto it = vertex_ids_.find(v.element());
        if (it == vertex_ids_.end() || it->second != v.id()) {
            fail<InvalidVertexError>(fmt::format(
                "Vertex is no longer part of this graph: {}", vertexLabel(v.element())));
        }
        return it->second;
    }

    uint64_t checkEdge(const EdgeType& e) const {
        if (e.graphId() != graph_id_) {
            fail<InvalidEdgeError>(fmt::format(
                "Edge does not belong to this graph: {}", edgeLabel(e.element())));
        }
        auto it = edge_ids_.find(e.element());
        if (it == edge_ids_.end() || it->second != e.id()) {
            fail<InvalidEdgeError>(fmt::format(
                "Edge is no longer part of this graph: {}", edgeLabel(e.element())));
        }
        return it->second;
    }

    uint64_t requireVertex(const V& element) const {
        auto it = vertex_ids_.find(element);
        if (it == vertex_ids_.end()) {
            fail<InvalidVertexError>(fmt::format("No vertex contains {}", vertexLabel(element)));
        }
        return it->second;
    }

    uint64_t requireEdge(const E& element) const {
        auto it = edge_ids_.find(element);
        if (it == edge_ids_.end()) {
            fail<InvalidEdgeError>(fmt::format("No edge contains {}", edgeLabel(element)));
        }
        return it->second;
    }

    template <typename Error>
    [[noreturn]] void fail(const std::string& message) const {
        logging::logger()->debug("[{}] rejected: {}", options_.name, message);
        throw Error(message);
    }

private:
    VertexType makeVertex(uint64_t id) const {
        return VertexType(id, graph_id_, vertices_.at(id).element);
    }

    EdgeType makeEdge(uint64_t id) const {
        const EdgeRecord& rec = edges_.at(id);
        return EdgeType(id, graph_id_, makeVertex(rec.a), makeVertex(rec.b),
                        rec.directed, rec.weight, rec.element, rec.properties);
    }

    std::optional<VertexType> oppositeOf(uint64_t vertex_id, uint64_t edge_id) const {
        const EdgeRecord& rec = edges_.at(edge_id);
        if (rec.a == vertex_id) return makeVertex(rec.b);
        if (rec.b == vertex_id) return makeVertex(rec.a);
        return std::nullopt;
    }

    bool adjacent(uint64_t u, uint64_t v) const {
        for (uint64_t eid : touchingEdgeIds(u)) {
            if (joins(edges_.at(eid), u, v)) return true;
        }
        return false;
    }

    bool ownsVertex(const VertexType& v) const {
        if (v.graphId() != graph_id_) return false;
        auto it = vertex_ids_.find(v.element());
        return it != vertex_ids_.end() && it->second == v.id();
    }

    void rejectDuplicateEdge(const E& element) const {
        if (edge_ids_.count(element)) {
            fail<DuplicateEdgeError>(fmt::format(
                "There's already an edge with this element: {}", edgeLabel(element)));
        }
    }

    double resolveWeight(const E& element) const {
        return options_.weight ? options_.weight(element) : 1.0;
    }

    EdgeType addEdge(uint64_t a, uint64_t b, E element, double weight, Properties properties) {
        uint64_t id = next_edge_id_++;
        edge_ids_.emplace(element, id);
        edges_.emplace(id, EdgeRecord{a, b, isDirected(), weight,
                                      std::move(element), std::move(properties)});
        outgoing_[a].insert(id);
        incoming_[b].insert(id);

        auto log = logging::logger();
        if (log->should_log(spdlog::level::debug)) {
            const EdgeRecord& rec = edges_.at(id);
            log->debug("[{}] inserted edge {} {} {} {} (weight={})", options_.name,
                       edgeLabel(rec.element), vertexLabel(vertices_.at(a).element),
                       rec.directed ? "->" : "--", vertexLabel(vertices_.at(b).element), weight);
        }
        return makeEdge(id);
    }

    E eraseEdge(uint64_t id) {
        auto node = edges_.extract(id);
        EdgeRecord& rec = node.mapped();
        outgoing_[rec.a].erase(id);
        incoming_[rec.b].erase(id);
        edge_ids_.erase(rec.element);
        return std::move(rec.element);
    }

    std::string vertexLabel(const V& element) const {
        return options_.vertex_label ? options_.vertex_label(element) : defaultLabel(element);
    }

    std::string edgeLabel(const E& element) const {
        return options_.edge_label ? options_.edge_label(element) : defaultLabel(element);
    }

    const uint64_t graph_id_;
    Options options_;
    mutable std::mutex mutex_;

    uint64_t next_vertex_id_ = 1;
    uint64_t next_edge_id_ = 1;

    std::map<uint64_t, VertexRecord> vertices_;
    std::unordered_map<V, uint64_t> vertex_ids_;
    std::map<uint64_t, EdgeRecord> edges_;
    std::unordered_map<E, uint64_t> edge_ids_;

    // Adjacency: vertex id → edge ids leaving (a) / entering (b) it
    std::unordered_map<uint64_t, std::set<uint64_t>> outgoing_;
    std::unordered_map<uint64_t, std::set<uint64_t>> incoming_;
};

} // namespace pathgraph
