// src/common/bisector.cpp
#include <glass/adjacency.hpp>
#include <cmath>

namespace glass {

Line line_through(const Site& p, const Site& q)
{
    return Line{
        p.y - q.y,             // y0 - y1
        q.x - p.x,             // x1 - x0
        p.y * q.x - q.y * p.x, // y0*x1 - y1*x0
    };
}

Line perpendicular_through(const Line& l, double px, double py)
{
    return Line{l.b, -l.a, l.b * px - l.a * py};
}

Line perpendicular_bisector(const Site& p, const Site& q)
{
    const double mx = (p.x + q.x) / 2;
    const double my = (p.y + q.y) / 2;
    return perpendicular_through(line_through(p, q), mx, my);
}

int sample_line(const Config& cfg, const Line& l, const SampleVisitor& visit)
{
    if (is_degenerate(l)) return 0;

    int count = 0;
    if (std::abs(l.b) >= std::abs(l.a)) {
        // y = (c - a*x) / b, b is the safe divisor
        for (int x = 0; x < cfg.width; x += cfg.sample_step) {
            const double y = (l.c - l.a * x) / l.b;
            visit(static_cast<double>(x), y);
            ++count;
        }
    } else {
        for (int y = 0; y < cfg.height; y += cfg.sample_step) {
            const double x = (l.c - l.b * y) / l.a;
            visit(x, static_cast<double>(y));
            ++count;
        }
    }
    return count;
}

} // namespace glass
