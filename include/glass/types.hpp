// include/glass/types.hpp
#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <unordered_map>

namespace glass {

// A site is identified by its coordinates only.
struct Site {
    double x;
    double y;
};

inline bool operator==(const Site& a, const Site& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Site& a, const Site& b) { return !(a == b); }
inline bool operator<(const Site& a, const Site& b)
{
    return a.x < b.x || (a.x == b.x && a.y < b.y);
}

struct SiteHash {
    std::size_t operator()(const Site& s) const noexcept
    {
        // -0.0 == 0.0, so both must land in the same bucket
        const double x = (s.x == 0.0) ? 0.0 : s.x;
        const double y = (s.y == 0.0) ? 0.0 : s.y;
        std::size_t h = std::hash<double>{}(x);
        h ^= std::hash<double>{}(y) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        return h;
    }
};

struct Color {
    std::uint8_t r, g, b;
};

inline bool operator==(const Color& a, const Color& b) { return a.r == b.r && a.g == b.g && a.b == b.b; }
inline bool operator!=(const Color& a, const Color& b) { return !(a == b); }

constexpr int NO_SITE  = -1;
constexpr int NO_COLOR = -1;

constexpr int PALETTE_SIZE = 6;

using LabelBuffer      = std::vector<int>;   // per pixel nearest site index, row-major
using RGBImage         = std::vector<Color>;
using EliminationOrder = std::vector<Site>;
using SiteColoring     = std::unordered_map<Site, int, SiteHash>; // site -> palette index

struct Config {
    int width;
    int height;
    double tolerance = 1.0;    // max |d0 - d1| (squared distance units) for a boundary sample
    int degree_threshold = 6;  // in [1, PALETTE_SIZE]; orderer picks vertices with fewer unseen neighbours than this
    int sample_step = 1;       // integer step along the sampling axis of a bisector
};

// Throws std::invalid_argument when the drawable area, the sampling step or the
// tolerance is not positive, or degree_threshold is outside [1, PALETTE_SIZE].
void validate_config(const Config& cfg);

} // namespace glass
