// src/cpu/adjacency_openmp.cpp
#include <glass/adjacency.hpp>
#include "adjacency_common_impl.hpp"

#include <omp.h>

namespace glass {

void build_adjacency_omp(const Config& cfg,
                         const SpatialIndex& index,
                         AdjacencyGraph& out_graph,
                         int num_threads,
                         std::vector<BoundarySample>* boundary)
{
    if (num_threads > 0) {
        omp_set_num_threads(num_threads);
    }

    detail::build_adjacency_common<true>(cfg, index, out_graph, boundary);
}

} // namespace glass
