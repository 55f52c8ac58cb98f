// src/coloring/greedy_color.cpp
#include <glass/coloring.hpp>
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace glass {

SiteColoring color_in_order(const AdjacencyGraph& graph,
                            const EliminationOrder& order,
                            std::mt19937& rng)
{
    SiteColoring coloring;
    coloring.reserve(order.size());

    std::array<int, PALETTE_SIZE> preference;
    std::iota(preference.begin(), preference.end(), 0);

    // last eliminated is colored first
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        const Site& v = *it;

        std::array<bool, PALETTE_SIZE> taken{};
        for (const auto& n : graph.neighbors(v)) {
            auto c = coloring.find(n);
            if (c != coloring.end()) taken[c->second] = true;
        }

        std::shuffle(preference.begin(), preference.end(), rng);

        int chosen = NO_COLOR;
        for (int c : preference) {
            if (!taken[c]) {
                chosen = c;
                break;
            }
        }
        if (chosen == NO_COLOR) {
            throw std::logic_error("color_in_order: palette exhausted at site (" +
                                   std::to_string(v.x) + ", " + std::to_string(v.y) +
                                   "); elimination order exceeded the palette bound");
        }
        coloring[v] = chosen;
    }
    return coloring;
}

SiteColoring color_sites(const AdjacencyGraph& graph,
                         const SpatialIndex& index,
                         unsigned int seed,
                         int degree_threshold,
                         OrderStats* stats)
{
    AdjacencyGraph full = graph;
    for (const auto& s : index.sites()) {
        full.add_vertex(s);
    }

    const EliminationOrder order = degeneracy_order(full, degree_threshold, {}, stats);
    std::mt19937 rng(seed);
    return color_in_order(full, order, rng);
}

int count_conflicts(const AdjacencyGraph& graph, const SiteColoring& coloring)
{
    int conflicts = 0;
    for (const auto& e : graph.edges()) {
        auto a = coloring.find(e.first);
        auto b = coloring.find(e.second);
        if (a == coloring.end() || b == coloring.end() || a->second == b->second) {
            ++conflicts;
        }
    }
    return conflicts;
}

std::vector<Color> site_color_table(const SpatialIndex& index, const SiteColoring& coloring)
{
    std::vector<Color> table(index.size(), Color{0, 0, 0});
    for (int i = 0; i < index.size(); ++i) {
        auto it = coloring.find(index.site(i));
        if (it != coloring.end()) {
            table[i] = PALETTE[it->second];
        }
    }
    return table;
}

} // namespace glass
