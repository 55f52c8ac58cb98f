// tests/test_coloring.cpp (doctest)
#include <doctest/doctest.h>

#include <glass/adjacency.hpp>
#include <glass/coloring.hpp>
#include <glass/sites.hpp>

#include <random>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <vector>

using glass::AdjacencyGraph;
using glass::Config;
using glass::EliminationOrder;
using glass::OrderStats;
using glass::Site;
using glass::SiteColoring;
using glass::SiteHash;
using glass::SpatialIndex;

namespace glass_coloring_tests {

std::vector<Site> clique_sites(int n)
{
    std::vector<Site> out;
    for (int i = 0; i < n; ++i) {
        out.push_back(Site{static_cast<double>(i), static_cast<double>(i * i)});
    }
    return out;
}

AdjacencyGraph complete_graph(const std::vector<Site>& sites)
{
    AdjacencyGraph g;
    for (std::size_t i = 0; i < sites.size(); ++i) {
        for (std::size_t j = i + 1; j < sites.size(); ++j) {
            g.link(sites[i], sites[j]);
        }
    }
    return g;
}

// Neighbours of order[i] that appear after it.
int later_neighbors(const AdjacencyGraph& g, const EliminationOrder& order, std::size_t i)
{
    std::unordered_map<Site, std::size_t, SiteHash> pos;
    for (std::size_t k = 0; k < order.size(); ++k) pos[order[k]] = k;
    int count = 0;
    for (const auto& n : g.neighbors(order[i])) {
        auto it = pos.find(n);
        if (it != pos.end() && it->second > i) ++count;
    }
    return count;
}

} // namespace glass_coloring_tests

using namespace glass_coloring_tests;

TEST_CASE("degeneracy order visits every vertex exactly once")
{
    const Config cfg{200, 200};
    const auto sites = glass::random_sites(cfg, 40, 2024u);
    const AdjacencyGraph g = glass::build_adjacency(cfg, sites);

    OrderStats stats;
    const EliminationOrder order = glass::degeneracy_order(g, 6, {}, &stats);

    REQUIRE(order.size() == g.vertex_count());
    std::unordered_set<Site, SiteHash> unique(order.begin(), order.end());
    CHECK(unique.size() == order.size());
    for (const auto& v : g.vertices()) {
        CHECK(unique.count(v) == 1);
    }

    // vertices removed with 6+ unseen neighbours are exactly the fallback picks
    int over_threshold = 0;
    for (std::size_t i = 0; i < order.size(); ++i) {
        if (later_neighbors(g, order, i) >= 6) ++over_threshold;
    }
    CHECK(over_threshold == stats.fallback_picks);
}

TEST_CASE("dense graph falls back to fixed order")
{
    const auto sites = clique_sites(7);
    const AdjacencyGraph k7 = complete_graph(sites);

    OrderStats stats;
    const EliminationOrder order = glass::degeneracy_order(k7, 6, {}, &stats);

    REQUIRE(order.size() == 7);
    CHECK(stats.fallback_picks == 1);
    CHECK(stats.max_residual_degree == 6);
    // first unseen vertex in sorted key order
    CHECK(order.front() == k7.vertices().front());
}

TEST_CASE("pre-seen vertices are left out of the order")
{
    const Site a{0, 0};
    const Site b{1, 0};
    const Site c{2, 0};
    AdjacencyGraph path;
    path.link(a, b);
    path.link(b, c);

    const std::unordered_set<Site, SiteHash> seen = {b};
    const EliminationOrder order = glass::degeneracy_order(path, 6, seen);

    REQUIRE(order.size() == 2);
    CHECK(order[0] != b);
    CHECK(order[1] != b);
}

TEST_CASE("palette exhaustion is reported")
{
    const auto sites = clique_sites(7);
    const AdjacencyGraph k7 = complete_graph(sites);
    const EliminationOrder order = glass::degeneracy_order(k7);

    std::mt19937 rng(5u);
    CHECK_THROWS_AS(glass::color_in_order(k7, order, rng), std::logic_error);
    CHECK_THROWS_AS(glass::color_sites(k7, SpatialIndex(sites), 5u), std::logic_error);
}

TEST_CASE("square cycle gets a proper coloring")
{
    const Site s00{0, 0};
    const Site s10{10, 0};
    const Site s01{0, 10};
    const Site s11{10, 10};
    const std::vector<Site> sites = {s00, s10, s01, s11};

    const AdjacencyGraph g = glass::build_adjacency(Config{20, 20}, sites);
    const SiteColoring colors = glass::color_sites(g, SpatialIndex(sites), 42u);

    REQUIRE(colors.size() == 4);
    CHECK(colors.at(s00) != colors.at(s10));
    CHECK(colors.at(s10) != colors.at(s11));
    CHECK(colors.at(s11) != colors.at(s01));
    CHECK(colors.at(s01) != colors.at(s00));
    CHECK(glass::count_conflicts(g, colors) == 0);
}

TEST_CASE("one and two site colorings")
{
    SUBCASE("single site") {
        const std::vector<Site> sites = {Site{3, 3}};
        const AdjacencyGraph g = glass::build_adjacency(Config{10, 10}, sites);
        const SiteColoring colors = glass::color_sites(g, SpatialIndex(sites), 1u);
        REQUIRE(colors.size() == 1);
        CHECK(colors.at(sites[0]) >= 0);
        CHECK(colors.at(sites[0]) < glass::PALETTE_SIZE);
    }

    SUBCASE("two sites") {
        const std::vector<Site> sites = {Site{2, 3}, Site{15, 11}};
        const AdjacencyGraph g = glass::build_adjacency(Config{20, 20}, sites);
        const SiteColoring colors = glass::color_sites(g, SpatialIndex(sites), 1u);
        REQUIRE(colors.size() == 2);
        CHECK(colors.at(sites[0]) != colors.at(sites[1]));
    }
}

TEST_CASE("random site sets are colored without conflicts, reproducibly")
{
    const Config cfg{240, 160};

    for (unsigned int seed : {1u, 2u, 3u}) {
        const auto sites = glass::random_sites(cfg, 40, seed);
        const SpatialIndex index(sites);
        AdjacencyGraph g;
        glass::build_adjacency_serial(cfg, index, g);

        const SiteColoring first = glass::color_sites(g, index, seed);
        const SiteColoring second = glass::color_sites(g, index, seed);

        CHECK(first.size() == sites.size());
        CHECK(glass::count_conflicts(g, first) == 0);
        CHECK(first == second);
    }
}

TEST_CASE("sites missing from the graph still get a color")
{
    const std::vector<Site> sites = {Site{0, 0}, Site{5, 5}, Site{9, 1}};
    AdjacencyGraph g;
    g.link(sites[0], sites[1]);

    const SiteColoring colors = glass::color_sites(g, SpatialIndex(sites), 8u);
    CHECK(colors.size() == 3);
    CHECK(colors.count(sites[2]) == 1);
}

TEST_CASE("conflicts and color table")
{
    const Site a{0, 0};
    const Site b{1, 1};
    AdjacencyGraph g;
    g.link(a, b);

    SiteColoring same;
    same[a] = 2;
    same[b] = 2;
    CHECK(glass::count_conflicts(g, same) == 1);

    SiteColoring partial;
    partial[a] = 0;
    CHECK(glass::count_conflicts(g, partial) == 1);

    const SpatialIndex index({a, b});
    const std::vector<glass::Color> table = glass::site_color_table(index, partial);
    REQUIRE(table.size() == 2);
    CHECK(table[0] == glass::PALETTE[0]);
    const glass::Color black{0, 0, 0};
    CHECK(table[1] == black);
}
