// src/common/sites.cpp
#include <glass/sites.hpp>
#include <random>
#include <stdexcept>
#include <unordered_set>

namespace glass {

std::vector<Site> random_sites(const Config& cfg, int count, unsigned int seed)
{
    validate_config(cfg);
    if (count < 0) {
        throw std::invalid_argument("site count must not be negative");
    }

    std::vector<Site> sites;
    sites.reserve(count);
    std::unordered_set<Site, SiteHash> taken;

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    // 重複座標會讓 bisector 退化，直接重抽
    while (static_cast<int>(sites.size()) < count) {
        Site s{unit(rng) * cfg.width, unit(rng) * cfg.height};
        if (taken.insert(s).second) {
            sites.push_back(s);
        }
    }
    return sites;
}

} // namespace glass
