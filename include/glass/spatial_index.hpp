// include/glass/spatial_index.hpp
#pragma once
#include <vector>
#include <glass/types.hpp>

namespace glass {

// 2-D kd-tree over a fixed site set. Build once, query many times; all
// queries are const and safe to run from several threads.
//
// Results are ordered by ascending squared distance, ties by site
// coordinates (x, then y) and, for duplicated sites, by index.
class SpatialIndex {
public:
    explicit SpatialIndex(std::vector<Site> sites);

    // Indices of the k nearest sites to (x, y).
    // Throws std::out_of_range unless 1 <= k <= size().
    std::vector<int> k_nearest(double x, double y, int k) const;

    int nearest(double x, double y) const;
    const Site& nearest_site(double x, double y) const;

    const Site& site(int index) const { return sites_[index]; }
    const std::vector<Site>& sites() const { return sites_; }
    int size() const { return static_cast<int>(sites_.size()); }
    bool empty() const { return sites_.empty(); }

private:
    struct Node {
        int site;     // index into sites_
        int cutdim;   // 0: x, 1: y
        int left  = -1;
        int right = -1;
    };

    // Equal distances order by coordinates, so results do not depend on
    // the order the sites were given in. The index only separates duplicates.
    struct Candidate {
        double d2;
        Site key;
        int site;
        bool operator<(const Candidate& o) const
        {
            if (d2 != o.d2) return d2 < o.d2;
            if (key != o.key) return key < o.key;
            return site < o.site;
        }
    };

    int build(std::vector<int>& ids, int begin, int end, int depth);
    void search(int node, double x, double y, std::size_t k,
                std::vector<Candidate>& heap) const;

    std::vector<Site> sites_;
    std::vector<Node> nodes_;
    int root_ = -1;
};

inline double sq_distance(double x, double y, const Site& s)
{
    const double dx = s.x - x;
    const double dy = s.y - y;
    return dx * dx + dy * dy;
}

} // namespace glass
