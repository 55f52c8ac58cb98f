// include/glass/sites.hpp
#pragma once
#include <vector>
#include <glass/types.hpp>

namespace glass {

// count distinct sites, uniform over [0, width) x [0, height), reproducible
// from seed. Throws std::invalid_argument for a negative count.
std::vector<Site> random_sites(const Config& cfg, int count, unsigned int seed);

} // namespace glass
