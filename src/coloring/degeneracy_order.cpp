// src/coloring/degeneracy_order.cpp
#include <glass/coloring.hpp>
#include <algorithm>
#include <set>
#include <unordered_map>
#include <utility>

namespace glass {

EliminationOrder degeneracy_order(const AdjacencyGraph& graph,
                                  int degree_threshold,
                                  const std::unordered_set<Site, SiteHash>& pre_seen,
                                  OrderStats* stats)
{
    // Fixed vertex order: sorted keys. Ids below index into it.
    const std::vector<Site> verts = graph.vertices();
    const int n = static_cast<int>(verts.size());

    std::unordered_map<Site, int, SiteHash> id_of;
    id_of.reserve(verts.size());
    for (int i = 0; i < n; ++i) {
        id_of.emplace(verts[i], i);
    }

    std::vector<char> seen(n, 0);
    for (int i = 0; i < n; ++i) {
        if (pre_seen.count(verts[i])) seen[i] = 1;
    }

    std::vector<std::vector<int>> nbrs(n);
    std::vector<int> residual(n, 0);
    for (int i = 0; i < n; ++i) {
        for (const auto& s : graph.neighbors(verts[i])) {
            const int j = id_of.at(s);
            nbrs[i].push_back(j);
            if (!seen[j]) ++residual[i];
        }
    }

    // (residual degree, id) ordered: begin() is the lowest degree, ties by key
    std::set<std::pair<int, int>> queue;
    for (int i = 0; i < n; ++i) {
        if (!seen[i]) queue.emplace(residual[i], i);
    }

    OrderStats local;
    EliminationOrder order;
    order.reserve(queue.size());
    int cursor = 0;

    while (!queue.empty()) {
        int v;
        if (queue.begin()->first < degree_threshold) {
            v = queue.begin()->second;
        } else {
            // 太密了：照固定順序拿第一個還沒看過的
            while (seen[cursor]) ++cursor;
            v = cursor;
            ++local.fallback_picks;
        }

        queue.erase({residual[v], v});
        seen[v] = 1;
        order.push_back(verts[v]);
        local.max_residual_degree = std::max(local.max_residual_degree, residual[v]);

        for (int u : nbrs[v]) {
            if (seen[u]) continue;
            queue.erase({residual[u], u});
            --residual[u];
            queue.emplace(residual[u], u);
        }
    }

    if (stats) *stats = local;
    return order;
}

} // namespace glass
