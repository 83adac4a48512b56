// PyBind11 bindings for the pathgraph core.
// Exposes string-keyed Graph, Digraph, Path and the shortest-path search.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "graph/graph.hpp"
#include "graph/digraph.hpp"
#include "graph/graph_errors.hpp"
#include "path/path.hpp"
#include "search/shortest_path.hpp"
#include "generators/random_graph.hpp"
#include "logging/logging.hpp"

#include <string>

namespace py = pybind11;

using StrVertex = pathgraph::Vertex<std::string>;
using StrEdge = pathgraph::Edge<std::string, std::string>;
using StrGraph = pathgraph::Graph<std::string, std::string>;
using StrDigraph = pathgraph::Digraph<std::string, std::string>;
using StrPath = pathgraph::Path<std::string, std::string>;
using StrSearchResult = pathgraph::ShortestPathResult<std::string, std::string>;

PYBIND11_MODULE(pathgraph_bindings, m) {
    m.doc() = "pathgraph C++ Core Bindings";

    // ── Errors ──
    auto graph_error = py::register_exception<pathgraph::GraphError>(m, "GraphError");
    auto invalid_vertex = py::register_exception<pathgraph::InvalidVertexError>(
        m, "InvalidVertexError", graph_error.ptr());
    auto invalid_edge = py::register_exception<pathgraph::InvalidEdgeError>(
        m, "InvalidEdgeError", graph_error.ptr());
    py::register_exception<pathgraph::DuplicateVertexError>(
        m, "DuplicateVertexError", invalid_vertex.ptr());
    py::register_exception<pathgraph::DuplicateEdgeError>(
        m, "DuplicateEdgeError", invalid_edge.ptr());
    py::register_exception<pathgraph::InvalidTraversalError>(
        m, "InvalidTraversalError", graph_error.ptr());

    // ── Logging ──
    py::class_<pathgraph::logging::LogConfig>(m, "LogConfig")
        .def(py::init<>())
        .def_readwrite("level", &pathgraph::logging::LogConfig::level)
        .def_readwrite("pattern", &pathgraph::logging::LogConfig::pattern);
    m.def("configure_logging", &pathgraph::logging::configureLogging);

    // ── Vertex ──
    py::class_<StrVertex>(m, "Vertex")
        .def_property_readonly("element", &StrVertex::element)
        .def_property_readonly("id", &StrVertex::id)
        .def("__eq__", &StrVertex::operator==)
        .def("__hash__", [](const StrVertex& v) { return std::hash<StrVertex>{}(v); })
        .def("__repr__", [](const StrVertex& v) { return "Vertex(" + v.element() + ")"; });

    // ── Edge ──
    py::class_<StrEdge>(m, "Edge")
        .def_property_readonly("endpoint_a", &StrEdge::endpointA)
        .def_property_readonly("endpoint_b", &StrEdge::endpointB)
        .def_property_readonly("directed", &StrEdge::directed)
        .def_property_readonly("weight", &StrEdge::weight)
        .def_property_readonly("element", &StrEdge::element)
        .def_property_readonly("properties", &StrEdge::properties)
        .def("contains", &StrEdge::contains)
        .def("opposite", &StrEdge::opposite)
        .def("get_property", &StrEdge::property,
             py::arg("key"), py::arg("default_val") = "")
        .def("__eq__", &StrEdge::operator==)
        .def("__hash__", [](const StrEdge& e) { return std::hash<StrEdge>{}(e); })
        .def("__repr__", [](const StrEdge& e) { return "Edge(" + e.element() + ")"; });

    // ── Graph ──
    py::class_<StrGraph>(m, "Graph")
        .def(py::init<>())
        .def("num_vertices", &StrGraph::numVertices)
        .def("num_edges", &StrGraph::numEdges)
        .def("vertices", &StrGraph::vertices)
        .def("edges", &StrGraph::edges)
        .def("has_vertex", &StrGraph::hasVertex)
        .def("has_edge", &StrGraph::hasEdge)
        .def("vertex", &StrGraph::vertex)
        .def("find_edge", &StrGraph::findEdge)
        .def("directed", &StrGraph::directed)
        .def("incident_edges", &StrGraph::incidentEdges)
        .def("traversable_edges", &StrGraph::traversableEdges)
        .def("opposite", py::overload_cast<const StrVertex&, const StrEdge&>(
                             &StrGraph::opposite, py::const_))
        .def("are_adjacent", py::overload_cast<const StrVertex&, const StrVertex&>(
                                 &StrGraph::areAdjacent, py::const_))
        .def("are_adjacent", py::overload_cast<const std::string&, const std::string&>(
                                 &StrGraph::areAdjacent, py::const_))
        .def("edge", &StrGraph::edge)
        .def("insert_vertex", &StrGraph::insertVertex)
        .def("insert_edge",
             [](StrGraph& g, const std::string& u, const std::string& v, const std::string& e,
                double weight, const pathgraph::Properties& properties) {
                 return g.insertEdge(u, v, e, weight, properties);
             },
             py::arg("u"), py::arg("v"), py::arg("element"),
             py::arg("weight") = 1.0, py::arg("properties") = pathgraph::Properties())
        .def("remove_vertex", &StrGraph::removeVertex)
        .def("remove_edge", py::overload_cast<const StrEdge&>(&StrGraph::removeEdge))
        .def("remove_edge_between",
             py::overload_cast<const std::string&, const std::string&>(&StrGraph::removeEdge))
        .def("replace_vertex", py::overload_cast<const StrVertex&, std::string>(&StrGraph::replace))
        .def("replace_edge", py::overload_cast<const StrEdge&, std::string>(&StrGraph::replace))
        .def("clone", &StrGraph::clone)
        .def("__str__", &StrGraph::toString);

    // ── Digraph ──
    py::class_<StrDigraph, StrGraph>(m, "Digraph")
        .def(py::init<>())
        .def("outbound_edges", &StrDigraph::outboundEdges);

    // ── Path ──
    py::class_<StrPath>(m, "Path")
        .def(py::init<StrVertex>())
        .def_static("start_from", &StrPath::startFrom)
        .def("walk", &StrPath::walk)
        .def("tail", &StrPath::tail)
        .def("origin", &StrPath::origin)
        .def("distance", &StrPath::distance)
        .def("vertices", &StrPath::vertices)
        .def("edges", &StrPath::edges)
        .def("contains_vertex", py::overload_cast<const StrVertex&>(&StrPath::contains, py::const_))
        .def("contains_edge", py::overload_cast<const StrEdge&>(&StrPath::contains, py::const_))
        .def("ends_with", &StrPath::endsWith)
        .def("accessible_vertices", &StrPath::accessibleVertices)
        .def("__eq__", &StrPath::operator==)
        .def("__len__", &StrPath::size)
        .def("__str__", &StrPath::toString);

    // ── ShortestPathResult ──
    py::class_<StrSearchResult>(m, "ShortestPathResult")
        .def_readonly("path", &StrSearchResult::path)
        .def_readonly("paths_explored", &StrSearchResult::paths_explored)
        .def_readonly("paths_enqueued", &StrSearchResult::paths_enqueued)
        .def_readonly("paths_pruned", &StrSearchResult::paths_pruned)
        .def_readonly("elapsed_seconds", &StrSearchResult::elapsed_seconds)
        .def("found", &StrSearchResult::found);

    m.def("shortest_path",
          [](const StrGraph& g, const StrVertex& source, const StrVertex& destination) {
              return pathgraph::ShortestPathSearch<std::string, std::string>().search(
                  g, source, destination);
          });
    m.def("dijkstra", &pathgraph::dijkstra<std::string, std::string>);

    // ── Random generation ──
    m.def("random_graph",
          [](int n, double p, uint64_t seed, bool directed) -> std::unique_ptr<StrGraph> {
              pathgraph::RandomGraphConfig<std::string, std::string> config;
              config.vertex_count = n;
              config.edge_probability = p;
              config.seed = seed;
              config.vertex_element = [](int i) { return std::to_string(i); };
              config.edge_element = [](const std::string& a, const std::string& b) {
                  return a + "-" + b;
              };
              if (directed) return pathgraph::randomDigraph(config);
              return pathgraph::randomGraph(config);
          },
          py::arg("n"), py::arg("p"), py::arg("seed") = 0, py::arg("directed") = false);
}
