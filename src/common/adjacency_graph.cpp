// src/common/adjacency_graph.cpp
#include <glass/adjacency_graph.hpp>
#include <algorithm>
#include <stdexcept>

namespace glass {

void AdjacencyGraph::add_vertex(const Site& s)
{
    adj_[s];
}

void AdjacencyGraph::link(const Site& a, const Site& b)
{
    if (a == b) {
        // duplicate coordinates, never an edge
        add_vertex(a);
        return;
    }
    adj_[a].insert(b);
    adj_[b].insert(a);
}

bool AdjacencyGraph::contains(const Site& s) const
{
    return adj_.find(s) != adj_.end();
}

bool AdjacencyGraph::has_edge(const Site& a, const Site& b) const
{
    auto it = adj_.find(a);
    return it != adj_.end() && it->second.count(b) != 0;
}

const AdjacencyGraph::NeighborSet& AdjacencyGraph::neighbors(const Site& s) const
{
    auto it = adj_.find(s);
    if (it == adj_.end()) {
        throw std::out_of_range("neighbors: site is not a vertex of the graph");
    }
    return it->second;
}

std::size_t AdjacencyGraph::edge_count() const
{
    std::size_t half_edges = 0;
    for (const auto& kv : adj_) {
        half_edges += kv.second.size();
    }
    return half_edges / 2;
}

std::size_t AdjacencyGraph::max_degree() const
{
    std::size_t best = 0;
    for (const auto& kv : adj_) {
        best = std::max(best, kv.second.size());
    }
    return best;
}

std::vector<Site> AdjacencyGraph::vertices() const
{
    std::vector<Site> out;
    out.reserve(adj_.size());
    for (const auto& kv : adj_) {
        out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::pair<Site, Site>> AdjacencyGraph::edges() const
{
    std::vector<std::pair<Site, Site>> out;
    for (const auto& kv : adj_) {
        for (const auto& n : kv.second) {
            if (kv.first < n) {
                out.emplace_back(kv.first, n);
            }
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace glass
