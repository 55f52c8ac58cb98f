// src/cpu/adjacency_serial.cpp
#include <glass/adjacency.hpp>
#include "adjacency_common_impl.hpp"

namespace glass {

void build_adjacency_serial(const Config& cfg,
                            const SpatialIndex& index,
                            AdjacencyGraph& out_graph,
                            std::vector<BoundarySample>* boundary)
{
    detail::build_adjacency_common<false>(cfg, index, out_graph, boundary);
}

AdjacencyGraph build_adjacency(const Config& cfg, const std::vector<Site>& sites)
{
    const SpatialIndex index(sites);
    AdjacencyGraph graph;
    build_adjacency_serial(cfg, index, graph, nullptr);
    return graph;
}

} // namespace glass
