// src/common/glass_visualize.cpp
#include <glass/visualize.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace glass {

void label_pixels(const Config& cfg,
                  const SpatialIndex& index,
                  LabelBuffer& out_labels)
{
    validate_config(cfg);

    const int W = cfg.width;
    const int H = cfg.height;
    out_labels.assign(W * H, NO_SITE);

    // 沒有 site 就整張都是 NO_SITE
    if (index.empty()) return;

    #pragma omp parallel for schedule(static)
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            out_labels[y * W + x] = index.nearest(x, y);
        }
    }
}

void fill_cells(const LabelBuffer& labels,
                const std::vector<Color>& site_colors,
                int width,
                int height,
                RGBImage& out_img)
{
    const int N = width * height;
    if (static_cast<int>(labels.size()) != N) {
        throw std::invalid_argument("fill_cells: label buffer does not match image size");
    }
    out_img.resize(N);

    for (int i = 0; i < N; ++i) {
        int idx = labels[i];
        if (idx < 0 || idx >= static_cast<int>(site_colors.size())) {
            out_img[i] = Color{0, 0, 0};
        } else {
            out_img[i] = site_colors[idx];
        }
    }
}

void draw_boundaries(const std::vector<BoundarySample>& boundary,
                     Color color,
                     int width,
                     int height,
                     RGBImage& img)
{
    for (const auto& s : boundary) {
        const int x = static_cast<int>(s.x);
        const int y = static_cast<int>(s.y);
        // samples can lie anywhere on the bisector
        if (s.x < 0 || s.y < 0 || x >= width || y >= height) continue;
        img[static_cast<std::size_t>(y) * width + x] = color;
    }
}

void draw_grid(int cols,
               int rows,
               Color color,
               int width,
               int height,
               RGBImage& img)
{
    if (cols > 0) {
        const int step = std::max(1, width / cols);
        for (int x = 0; x < width; x += step) {
            for (int y = 0; y < height; ++y) {
                img[static_cast<std::size_t>(y) * width + x] = color;
            }
        }
    }
    if (rows > 0) {
        const int step = std::max(1, height / rows);
        for (int y = 0; y < height; y += step) {
            for (int x = 0; x < width; ++x) {
                img[static_cast<std::size_t>(y) * width + x] = color;
            }
        }
    }
}

bool write_ppm(const std::string& filename,
               int width,
               int height,
               const RGBImage& img)
{
    const std::size_t expected = static_cast<std::size_t>(width) * height;
    if (img.size() != expected) {
        return false;
    }

    // 確保目錄存在
    std::filesystem::path path(filename);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) return false;
    }

    std::ofstream ofs(filename, std::ios::binary);
    if (!ofs) return false;

    ofs << "P6\n" << width << " " << height << "\n255\n";
    for (const auto& c : img) {
        ofs.put(static_cast<char>(c.r));
        ofs.put(static_cast<char>(c.g));
        ofs.put(static_cast<char>(c.b));
    }
    return static_cast<bool>(ofs);
}

} // namespace glass
