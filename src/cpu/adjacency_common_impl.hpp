// src/cpu/adjacency_common_impl.hpp
#pragma once

#include <glass/adjacency.hpp>
#include <algorithm>
#include <cmath>
#include <tuple>
#include <vector>

namespace glass::detail {

// 取最近的兩個 site，距離差小於 tolerance 就當作落在兩個 cell 的邊界上
inline bool classify_sample(const Config& cfg,
                            const SpatialIndex& index,
                            double x, double y,
                            int& a, int& b)
{
    const int k = index.size() >= 3 ? 3 : 2;
    const std::vector<int> nn = index.k_nearest(x, y, k);
    const double d0 = sq_distance(x, y, index.site(nn[0]));
    const double d1 = sq_distance(x, y, index.site(nn[1]));
    if (std::abs(d0 - d1) >= cfg.tolerance) {
        return false;
    }
    // 第三個 site 也一樣近：這是三個以上 cell 的交點，不算兩個 cell 的邊
    if (k == 3) {
        const double d2 = sq_distance(x, y, index.site(nn[2]));
        if (std::abs(d2 - d0) < cfg.tolerance) {
            return false;
        }
    }
    a = nn[0];
    b = nn[1];
    return true;
}

// Samples the bisector of sites i and j, appends every accepted sample.
inline void scan_pair(const Config& cfg,
                      const SpatialIndex& index,
                      int i, int j,
                      std::vector<BoundarySample>& hits)
{
    const Line l = perpendicular_bisector(index.site(i), index.site(j));
    sample_line(cfg, l, [&](double x, double y) {
        int a = NO_SITE;
        int b = NO_SITE;
        if (classify_sample(cfg, index, x, y, a, b)) {
            hits.push_back(BoundarySample{x, y, a, b});
        }
    });
}

inline bool boundary_less(const BoundarySample& l, const BoundarySample& r)
{
    return std::tie(l.x, l.y, l.a, l.b) < std::tie(r.x, r.y, r.a, r.b);
}

inline void merge_hits(const SpatialIndex& index,
                       const std::vector<BoundarySample>& hits,
                       AdjacencyGraph& graph,
                       std::vector<BoundarySample>* boundary)
{
    for (const auto& h : hits) {
        graph.link(index.site(h.a), index.site(h.b));
    }
    if (boundary) {
        boundary->insert(boundary->end(), hits.begin(), hits.end());
    }
}

// 所有 site pair：O(N^2 * samples) 次 2-NN 查詢
template <bool UseOpenMP>
inline void build_adjacency_common(const Config& cfg,
                                   const SpatialIndex& index,
                                   AdjacencyGraph& out_graph,
                                   std::vector<BoundarySample>* boundary)
{
    validate_config(cfg);

    out_graph = AdjacencyGraph{};
    for (const auto& s : index.sites()) {
        out_graph.add_vertex(s);
    }
    if (boundary) {
        boundary->clear();
    }

    const int n = index.size();
    if (n < 2) return;

    if constexpr (UseOpenMP) {
        #pragma omp parallel
        {
            std::vector<BoundarySample> local;

            // later rows have fewer pairs, hence dynamic
            #pragma omp for schedule(dynamic)
            for (int i = 0; i < n; ++i) {
                for (int j = i + 1; j < n; ++j) {
                    scan_pair(cfg, index, i, j, local);
                }
            }

            #pragma omp critical(glass_adjacency_merge)
            {
                merge_hits(index, local, out_graph, boundary);
            }
        }
    } else {
        std::vector<BoundarySample> hits;
        for (int i = 0; i < n; ++i) {
            for (int j = i + 1; j < n; ++j) {
                scan_pair(cfg, index, i, j, hits);
            }
        }
        merge_hits(index, hits, out_graph, boundary);
    }

    // thread merge order is arbitrary
    if (boundary) {
        std::sort(boundary->begin(), boundary->end(), boundary_less);
    }
}

} // namespace glass::detail
