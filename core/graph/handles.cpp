#include "graph/handles.hpp"

#include <atomic>

namespace pathgraph {

uint64_t nextGraphInstanceId() {
    static std::atomic<uint64_t> counter{0};
    return ++counter;
}

} // namespace pathgraph
