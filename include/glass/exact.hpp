// include/glass/exact.hpp
#pragma once
#include <vector>
#include <glass/types.hpp>

namespace glass {

// O(W * H * #sites) brute-force nearest-site labeling, ties go to the
// smaller site coordinates, as in SpatialIndex
void nearest_site_exact(const Config& cfg,
                        const std::vector<Site>& sites,
                        LabelBuffer& out_labels);

} // namespace glass
