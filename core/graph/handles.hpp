#pragma once

#include <cstdint>

namespace pathgraph {

/// Identifies one graph instance for the lifetime of the process.
/// Vertex and edge handles carry it so a graph can reject handles
/// minted by another instance. Never returns 0.
uint64_t nextGraphInstanceId();

} // namespace pathgraph
