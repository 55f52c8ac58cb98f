// include/glass/adjacency.hpp
#pragma once
#include <vector>
#include <functional>
#include <glass/types.hpp>
#include <glass/spatial_index.hpp>
#include <glass/adjacency_graph.hpp>

namespace glass {

// Implicit line a*x + b*y = c.
struct Line {
    double a, b, c;
};

Line line_through(const Site& p, const Site& q);
Line perpendicular_through(const Line& l, double px, double py);
Line perpendicular_bisector(const Site& p, const Site& q);

inline bool is_degenerate(const Line& l) { return l.a == 0.0 && l.b == 0.0; }

using SampleVisitor = std::function<void(double x, double y)>;

// Walks the line at cfg.sample_step intervals along the axis whose
// coefficient is smaller in magnitude (x when |b| >= |a|, else y), over the
// full width/height. Returns the number of samples, 0 for a degenerate line.
int sample_line(const Config& cfg, const Line& l, const SampleVisitor& visit);

// A sample accepted as lying on the boundary between cells a and b.
struct BoundarySample {
    double x;
    double y;
    int a;
    int b;
};

void build_adjacency_serial(const Config& cfg,
                            const SpatialIndex& index,
                            AdjacencyGraph& out_graph,
                            std::vector<BoundarySample>* boundary = nullptr);

// OpenMP over site pairs. Produces the same graph (and boundary list) as the
// serial version.
void build_adjacency_omp(const Config& cfg,
                         const SpatialIndex& index,
                         AdjacencyGraph& out_graph,
                         int num_threads = 0,
                         std::vector<BoundarySample>* boundary = nullptr);

AdjacencyGraph build_adjacency(const Config& cfg, const std::vector<Site>& sites);

} // namespace glass
