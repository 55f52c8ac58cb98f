// src/exact/nearest_exact.cpp
#include <glass/exact.hpp>
#include <glass/spatial_index.hpp>
#include <limits>

namespace glass {

void nearest_site_exact(const Config& cfg,
                        const std::vector<Site>& sites,
                        LabelBuffer& out_labels)
{
    validate_config(cfg);

    const int W = cfg.width;
    const int H = cfg.height;
    const int N = W * H;

    out_labels.assign(N, NO_SITE);

    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            int best_site = NO_SITE;
            double best_dist = std::numeric_limits<double>::infinity();

            for (int i = 0; i < static_cast<int>(sites.size()); ++i) {
                const double d2 = sq_distance(x, y, sites[i]);
                if (d2 < best_dist ||
                    (d2 == best_dist && sites[i] < sites[best_site])) {
                    best_dist = d2;
                    best_site = i;
                }
            }

            out_labels[y * W + x] = best_site;
        }
    }
}

} // namespace glass
