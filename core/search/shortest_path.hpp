#pragma once

#include "graph/graph.hpp"
#include "graph/graph_errors.hpp"
#include "logging/logging.hpp"
#include "path/path.hpp"

#include <fmt/format.h>

#include <chrono>
#include <deque>
#include <optional>

namespace pathgraph {

/// Outcome of a shortest-path search. `path` is empty when the
/// destination cannot be reached.
template <typename V, typename E>
struct ShortestPathResult {
    std::optional<Path<V, E>> path;
    int paths_explored = 0;     // paths popped from the queue
    int paths_enqueued = 0;     // paths pushed, origin included
    int paths_pruned = 0;       // popped paths cut by the running bound
    double elapsed_seconds = 0.0;

    bool found() const { return path.has_value(); }
};

// ─── Shortest-path search ──────────────────────────────────────
// Best-first enumeration of simple paths from a FIFO queue.
// A path that reaches the destination becomes the best when it is
// strictly shorter than the current best; any other path is only
// expanded while it is strictly shorter than the best, and never
// into a vertex it already contains. The result is a minimum-distance
// simple path. There is no per-vertex distance table, so the same
// vertex may be reached by many queued paths and the worst case is
// exponential in the graph size.
//
// The search issues many separate graph calls without holding the
// graph lock across them; concurrent mutation during a search gives
// undefined results.

template <typename V, typename E>
class ShortestPathSearch {
public:
    using VertexType = Vertex<V>;
    using PathType = Path<V, E>;

    ShortestPathResult<V, E> search(const Graph<V, E>& graph,
                                    const VertexType& source,
                                    const VertexType& destination) const {
        if (!graph.hasVertex(source)) {
            throw InvalidVertexError(fmt::format(
                "Vertex does not exist! vertex={}", defaultLabel(source.element())));
        }
        if (!graph.hasVertex(destination)) {
            throw InvalidVertexError(fmt::format(
                "Vertex does not exist! vertex={}", defaultLabel(destination.element())));
        }

        auto start = std::chrono::steady_clock::now();
        auto log = logging::logger();
        ShortestPathResult<V, E> result;

        std::deque<PathType> queue;
        queue.push_back(PathType::startFrom(source));
        result.paths_enqueued = 1;

        while (!queue.empty()) {
            PathType path = std::move(queue.front());
            queue.pop_front();
            result.paths_explored++;

            if (path.endsWith(destination)) {
                if (improves(result.path, path)) {
                    if (log->should_log(spdlog::level::trace)) {
                        log->trace("new best {}", path.toString());
                    }
                    result.path = std::move(path);
                }
                continue;
            }
            if (!improves(result.path, path)) {
                result.paths_pruned++;
                continue;
            }

            for (const VertexType& next : path.accessibleVertices(graph)) {
                if (path.contains(next)) continue;
                auto step = graph.edge(path.tail(), next);
                if (!step) continue;
                queue.push_back(path.walk(*step));
                result.paths_enqueued++;
            }
        }

        result.elapsed_seconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();

        log->debug("[{}] shortest path search: explored={} enqueued={} pruned={} found={} ({:.6f}s)",
                   graph.options().name, result.paths_explored, result.paths_enqueued,
                   result.paths_pruned, result.found(), result.elapsed_seconds);
        return result;
    }

private:
    static bool improves(const std::optional<PathType>& best, const PathType& candidate) {
        return !best || candidate.distance() < best->distance();
    }
};

/// Minimum-distance simple path from source to destination, or
/// nullopt when unreachable. Throws InvalidVertexError when either
/// vertex is not in `graph`.
template <typename V, typename E>
std::optional<Path<V, E>> dijkstra(const Graph<V, E>& graph,
                                   const Vertex<V>& source,
                                   const Vertex<V>& destination) {
    return ShortestPathSearch<V, E>().search(graph, source, destination).path;
}

} // namespace pathgraph
