// include/glass/adjacency_graph.hpp
#pragma once
#include <cstddef>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include <glass/types.hpp>

namespace glass {

// Undirected Voronoi-cell adjacency keyed by site coordinates.
// link() always records both directions and ignores self-loops.
class AdjacencyGraph {
public:
    using NeighborSet = std::unordered_set<Site, SiteHash>;

    void add_vertex(const Site& s);
    void link(const Site& a, const Site& b);

    bool contains(const Site& s) const;
    bool has_edge(const Site& a, const Site& b) const;

    // Throws std::out_of_range for an unknown vertex.
    const NeighborSet& neighbors(const Site& s) const;

    std::size_t vertex_count() const { return adj_.size(); }
    std::size_t edge_count() const;
    std::size_t max_degree() const;

    // Sorted by Site::operator<; edges as (a, b) with a < b.
    std::vector<Site> vertices() const;
    std::vector<std::pair<Site, Site>> edges() const;

    bool operator==(const AdjacencyGraph& o) const { return adj_ == o.adj_; }
    bool operator!=(const AdjacencyGraph& o) const { return !(*this == o); }

private:
    std::unordered_map<Site, NeighborSet, SiteHash> adj_;
};

} // namespace glass
