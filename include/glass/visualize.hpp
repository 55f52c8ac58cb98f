// include/glass/visualize.hpp
#pragma once
#include <vector>
#include <string>
#include <glass/types.hpp>
#include <glass/spatial_index.hpp>
#include <glass/adjacency.hpp>

namespace glass {

// Nearest site per pixel through the kd-tree (OpenMP over rows).
void label_pixels(const Config& cfg,
                  const SpatialIndex& index,
                  LabelBuffer& out_labels);

// Maps every pixel's site index to that site's color.
void fill_cells(const LabelBuffer& labels,
                const std::vector<Color>& site_colors,
                int width,
                int height,
                RGBImage& out_img);

// Paints the accepted bisector samples that fall inside the image.
void draw_boundaries(const std::vector<BoundarySample>& boundary,
                     Color color,
                     int width,
                     int height,
                     RGBImage& img);

// cols x rows grid lines, 0 disables a direction.
void draw_grid(int cols,
               int rows,
               Color color,
               int width,
               int height,
               RGBImage& img);

// Binary PPM (P6)
bool write_ppm(const std::string& filename,
               int width,
               int height,
               const RGBImage& img);

} // namespace glass
