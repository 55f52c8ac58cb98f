// tests/test_visualize.cpp (doctest)
#include <doctest/doctest.h>

#include <glass/exact.hpp>
#include <glass/sites.hpp>
#include <glass/spatial_index.hpp>
#include <glass/visualize.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

using glass::Color;
using glass::Config;
using glass::LabelBuffer;
using glass::RGBImage;
using glass::Site;
using glass::SpatialIndex;

TEST_CASE("kd-tree labels match the brute-force labels")
{
    const Config cfg{64, 48};
    const auto sites = glass::random_sites(cfg, 25, 314u);
    const SpatialIndex index(sites);

    LabelBuffer fast;
    LabelBuffer exact;
    glass::label_pixels(cfg, index, fast);
    glass::nearest_site_exact(cfg, sites, exact);

    REQUIRE(fast.size() == static_cast<std::size_t>(64 * 48));
    CHECK(fast == exact);
}

TEST_CASE("single site owns every pixel")
{
    const Config cfg{8, 6};
    const SpatialIndex index({Site{100.0, -3.0}});

    LabelBuffer labels;
    glass::label_pixels(cfg, index, labels);
    REQUIRE(labels.size() == 48);
    for (int l : labels) CHECK(l == 0);
}

TEST_CASE("fill_cells maps site indices to their colors")
{
    const Color red{255, 0, 0};
    const Color blue{0, 0, 255};
    const Color black{0, 0, 0};

    const LabelBuffer labels = {0, 1, glass::NO_SITE, 1};
    RGBImage img;
    glass::fill_cells(labels, {red, blue}, 2, 2, img);

    REQUIRE(img.size() == 4);
    CHECK(img[0] == red);
    CHECK(img[1] == blue);
    CHECK(img[2] == black);
    CHECK(img[3] == blue);

    CHECK_THROWS_AS(glass::fill_cells(labels, {red}, 3, 3, img), std::invalid_argument);
}

TEST_CASE("overlays stay inside the image")
{
    const Color white{255, 255, 255};
    const Color ink{1, 2, 3};
    RGBImage img(10 * 4, white);

    SUBCASE("grid") {
        glass::draw_grid(2, 0, ink, 10, 4, img);
        for (int y = 0; y < 4; ++y) {
            CHECK(img[y * 10 + 0] == ink);
            CHECK(img[y * 10 + 5] == ink);
            CHECK(img[y * 10 + 3] == white);
        }
    }

    SUBCASE("boundaries") {
        const std::vector<glass::BoundarySample> boundary = {
            {2.5, 1.2, 0, 1},
            {-4.0, 1.0, 0, 1},
            {3.0, 40.0, 0, 1},
        };
        glass::draw_boundaries(boundary, ink, 10, 4, img);
        CHECK(img[1 * 10 + 2] == ink);
        int painted = 0;
        for (const auto& c : img) {
            if (c == ink) ++painted;
        }
        CHECK(painted == 1);
    }
}

TEST_CASE("write_ppm writes a P6 file and rejects a size mismatch")
{
    const RGBImage img(6, Color{10, 20, 30});
    CHECK_FALSE(glass::write_ppm("unused.ppm", 4, 4, img));

    const std::filesystem::path dir =
        std::filesystem::temp_directory_path() / "glass_tests" / "nested";
    const std::filesystem::path file = dir / "tiny.ppm";
    std::filesystem::remove_all(dir);

    REQUIRE(glass::write_ppm(file.string(), 3, 2, img));
    const std::string header = "P6\n3 2\n255\n";
    CHECK(std::filesystem::file_size(file) == header.size() + 3 * 6);

    std::filesystem::remove_all(dir);
}
