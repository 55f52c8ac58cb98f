// include/glass/coloring.hpp
#pragma once
#include <array>
#include <random>
#include <unordered_set>
#include <vector>
#include <glass/types.hpp>
#include <glass/spatial_index.hpp>
#include <glass/adjacency_graph.hpp>

namespace glass {

inline constexpr std::array<Color, PALETTE_SIZE> PALETTE = {{
    {155,  17,  30},
    {190,  83,  28},
    {241, 196,   0},
    { 19, 104,  67},
    {135, 206, 235},
    { 89,  49,  95},
}};

struct OrderStats {
    int fallback_picks = 0;       // steps where no unseen vertex was under the threshold
    int max_residual_degree = 0;  // over all removals
};

// Smallest-last elimination order. Vertices in pre_seen are skipped and do
// not count towards residual degrees.
EliminationOrder degeneracy_order(const AdjacencyGraph& graph,
                                  int degree_threshold = 6,
                                  const std::unordered_set<Site, SiteHash>& pre_seen = {},
                                  OrderStats* stats = nullptr);

// Colors the order back to front. Throws std::logic_error when a vertex has
// no free palette entry left.
SiteColoring color_in_order(const AdjacencyGraph& graph,
                            const EliminationOrder& order,
                            std::mt19937& rng);

// Every site of the index gets a color, including sites without edges.
SiteColoring color_sites(const AdjacencyGraph& graph,
                         const SpatialIndex& index,
                         unsigned int seed,
                         int degree_threshold = 6,
                         OrderStats* stats = nullptr);

// Number of edges whose endpoints share a color (or miss one).
int count_conflicts(const AdjacencyGraph& graph, const SiteColoring& coloring);

// RGB per site index; uncolored sites are black.
std::vector<Color> site_color_table(const SpatialIndex& index, const SiteColoring& coloring);

} // namespace glass
