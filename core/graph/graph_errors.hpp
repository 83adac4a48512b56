#pragma once

#include <stdexcept>
#include <string>

namespace pathgraph {

// ─── Graph Errors ──────────────────────────────────────────────
// All faults are raised synchronously at the point of violation.
// Validation always runs before any mutation, so a thrown call
// leaves the graph untouched.

class GraphError : public std::runtime_error {
public:
    explicit GraphError(const std::string& message);
};

/// A vertex handle that is foreign, stale or absent, or a vertex
/// element that cannot be resolved.
class InvalidVertexError : public GraphError {
public:
    explicit InvalidVertexError(const std::string& message);
};

/// Insert or replace with a vertex element that is already in use.
class DuplicateVertexError : public InvalidVertexError {
public:
    explicit DuplicateVertexError(const std::string& message);
};

/// An edge handle that is foreign, stale or absent.
class InvalidEdgeError : public GraphError {
public:
    explicit InvalidEdgeError(const std::string& message);
};

/// Insert or replace with an edge element that is already in use.
class DuplicateEdgeError : public InvalidEdgeError {
public:
    explicit DuplicateEdgeError(const std::string& message);
};

/// Path::walk() given an edge that does not leave the current tail.
class InvalidTraversalError : public GraphError {
public:
    explicit InvalidTraversalError(const std::string& message);
};

} // namespace pathgraph
