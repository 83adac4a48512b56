#include "graph/graph_errors.hpp"

namespace pathgraph {

GraphError::GraphError(const std::string& message)
    : std::runtime_error(message) {}

InvalidVertexError::InvalidVertexError(const std::string& message)
    : GraphError(message) {}

DuplicateVertexError::DuplicateVertexError(const std::string& message)
    : InvalidVertexError(message) {}

InvalidEdgeError::InvalidEdgeError(const std::string& message)
    : GraphError(message) {}

DuplicateEdgeError::DuplicateEdgeError(const std::string& message)
    : InvalidEdgeError(message) {}

InvalidTraversalError::InvalidTraversalError(const std::string& message)
    : GraphError(message) {}

} // namespace pathgraph
