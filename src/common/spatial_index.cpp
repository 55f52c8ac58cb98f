// src/common/spatial_index.cpp
#include <glass/spatial_index.hpp>
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace glass {

SpatialIndex::SpatialIndex(std::vector<Site> sites)
    : sites_(std::move(sites))
{
    nodes_.reserve(sites_.size());
    std::vector<int> ids(sites_.size());
    std::iota(ids.begin(), ids.end(), 0);
    root_ = build(ids, 0, static_cast<int>(ids.size()), 0);
}

// Median split on alternating axes. Left subtree holds coordinates <= the
// node's, right subtree >=.
int SpatialIndex::build(std::vector<int>& ids, int begin, int end, int depth)
{
    if (begin >= end) return -1;

    const int cutdim = depth % 2;
    const int mid = begin + (end - begin) / 2;
    std::nth_element(ids.begin() + begin, ids.begin() + mid, ids.begin() + end,
                     [&](int a, int b) {
                         const Site& sa = sites_[a];
                         const Site& sb = sites_[b];
                         return cutdim == 0 ? sa.x < sb.x : sa.y < sb.y;
                     });

    const int node = static_cast<int>(nodes_.size());
    nodes_.push_back(Node{ids[mid], cutdim});

    const int left = build(ids, begin, mid, depth + 1);
    const int right = build(ids, mid + 1, end, depth + 1);
    nodes_[node].left = left;
    nodes_[node].right = right;
    return node;
}

void SpatialIndex::search(int node, double x, double y, std::size_t k,
                          std::vector<Candidate>& heap) const
{
    if (node < 0) return;

    const Node& n = nodes_[node];
    const Site& s = sites_[n.site];
    const Candidate c{sq_distance(x, y, s), s, n.site};

    // heap.front() is the worst candidate kept so far
    if (heap.size() < k) {
        heap.push_back(c);
        std::push_heap(heap.begin(), heap.end());
    } else if (c < heap.front()) {
        std::pop_heap(heap.begin(), heap.end());
        heap.back() = c;
        std::push_heap(heap.begin(), heap.end());
    }

    const double diff = (n.cutdim == 0) ? x - s.x : y - s.y;
    const int near_child = diff < 0 ? n.left : n.right;
    const int far_child  = diff < 0 ? n.right : n.left;

    search(near_child, x, y, k, heap);

    // <= keeps equal-distance sites on the far side reachable for the coordinate tie-break
    if (heap.size() < k || diff * diff <= heap.front().d2) {
        search(far_child, x, y, k, heap);
    }
}

std::vector<int> SpatialIndex::k_nearest(double x, double y, int k) const
{
    if (k < 1 || k > size()) {
        throw std::out_of_range("k_nearest: k = " + std::to_string(k) +
                                " with " + std::to_string(size()) + " indexed sites");
    }

    std::vector<Candidate> heap;
    heap.reserve(static_cast<std::size_t>(k) + 1);
    search(root_, x, y, static_cast<std::size_t>(k), heap);
    std::sort_heap(heap.begin(), heap.end());

    std::vector<int> out;
    out.reserve(heap.size());
    for (const auto& c : heap) {
        out.push_back(c.site);
    }
    return out;
}

int SpatialIndex::nearest(double x, double y) const
{
    return k_nearest(x, y, 1).front();
}

const Site& SpatialIndex::nearest_site(double x, double y) const
{
    return sites_[nearest(x, y)];
}

} // namespace glass
