// src/apps/glass_demo.cpp
#include <iostream>
#include <string>
#include <vector>
#include <chrono>
#include <cstdlib>
#include <exception>

#include <glass/types.hpp>
#include <glass/sites.hpp>
#include <glass/spatial_index.hpp>
#include <glass/adjacency.hpp>
#include <glass/coloring.hpp>
#include <glass/exact.hpp>
#include <glass/visualize.hpp>

struct Options {
    std::string backend = "omp"; // "serial" or "omp"
    int threads = 8;             // used for omp
    int width = 58 * 40;
    int height = 20 * 40;
    int num_sites = 20;
    unsigned int rng_seed = 42;
    double tolerance = 1.0;
    int degree_threshold = 6;
    int grid_cols = 58;          // 0 disables
    int grid_rows = 20;
    bool draw_boundaries = true;
    bool skip_exact = false;
    bool csv = false;
    std::string output = "output/glass.ppm";
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --backend {serial|omp}   Adjacency backend (default: omp)\n"
              << "  --threads N              Threads for omp (default: 8)\n"
              << "  --width W                Image width  (default: 2320)\n"
              << "  --height H               Image height (default: 800)\n"
              << "  --sites N                Number of random sites (default: 20)\n"
              << "  --seed N                 RNG seed for sites and palette shuffles (default: 42)\n"
              << "  --tolerance E            Max squared-distance gap for a boundary sample (default: 1)\n"
              << "  --threshold D            Degree threshold of the elimination order, 1..6 (default: 6)\n"
              << "  --grid-cols N            Vertical grid lines (default: 58, 0 = off)\n"
              << "  --grid-rows N            Horizontal grid lines (default: 20, 0 = off)\n"
              << "  --no-boundaries          Do not paint sampled cell boundaries\n"
              << "  --skip-exact             Skip the brute-force label check\n"
              << "  --output FILE            PPM output path (default: output/glass.ppm)\n"
              << "  --csv                    Also print a machine-readable CSV summary line\n"
              << "  -h, --help               Show this help message\n";
}

bool parse_int(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_double(const std::string& s, double& out) {
    try {
        size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

Options parse_args(int argc, char** argv) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto get_value = [&](std::string& val) -> bool {
            auto eq_pos = arg.find('=');
            if (eq_pos != std::string::npos) {
                val = arg.substr(eq_pos + 1);
                return true;
            }
            if (i + 1 >= argc) return false;
            val = argv[++i];
            return true;
        };
        // exact flag name, with or without "=value"
        auto is_flag = [&](const char* name) {
            const std::string n(name);
            return arg == n || arg.rfind(n + "=", 0) == 0;
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (is_flag("--backend")) {
            std::string v;
            if (!get_value(v)) {
                std::cerr << "Missing value for --backend\n";
                print_usage(argv[0]);
                std::exit(1);
            }
            opt.backend = v;
        } else if (is_flag("--threads")) {
            std::string v;
            if (!get_value(v) || !parse_int(v, opt.threads) || opt.threads < 1) {
                std::cerr << "Invalid value for --threads\n";
                std::exit(1);
            }
        } else if (is_flag("--width")) {
            std::string v;
            if (!get_value(v) || !parse_int(v, opt.width) || opt.width <= 0) {
                std::cerr << "Invalid value for --width\n";
                std::exit(1);
            }
        } else if (is_flag("--height")) {
            std::string v;
            if (!get_value(v) || !parse_int(v, opt.height) || opt.height <= 0) {
                std::cerr << "Invalid value for --height\n";
                std::exit(1);
            }
        } else if (is_flag("--sites")) {
            std::string v;
            if (!get_value(v) || !parse_int(v, opt.num_sites) || opt.num_sites <= 0) {
                std::cerr << "Invalid value for --sites\n";
                std::exit(1);
            }
        } else if (is_flag("--seed")) {
            std::string v;
            int tmp;
            if (!get_value(v) || !parse_int(v, tmp)) {
                std::cerr << "Invalid value for --seed\n";
                std::exit(1);
            }
            opt.rng_seed = static_cast<unsigned int>(tmp);
        } else if (is_flag("--tolerance")) {
            std::string v;
            if (!get_value(v) || !parse_double(v, opt.tolerance) || !(opt.tolerance > 0.0)) {
                std::cerr << "Invalid value for --tolerance\n";
                std::exit(1);
            }
        } else if (is_flag("--threshold")) {
            std::string v;
            if (!get_value(v) || !parse_int(v, opt.degree_threshold) ||
                opt.degree_threshold < 1 || opt.degree_threshold > glass::PALETTE_SIZE) {
                std::cerr << "Invalid value for --threshold\n";
                std::exit(1);
            }
        } else if (is_flag("--grid-cols")) {
            std::string v;
            if (!get_value(v) || !parse_int(v, opt.grid_cols) || opt.grid_cols < 0) {
                std::cerr << "Invalid value for --grid-cols\n";
                std::exit(1);
            }
        } else if (is_flag("--grid-rows")) {
            std::string v;
            if (!get_value(v) || !parse_int(v, opt.grid_rows) || opt.grid_rows < 0) {
                std::cerr << "Invalid value for --grid-rows\n";
                std::exit(1);
            }
        } else if (arg == "--no-boundaries") {
            opt.draw_boundaries = false;
        } else if (arg == "--skip-exact") {
            opt.skip_exact = true;
        } else if (is_flag("--output")) {
            std::string v;
            if (!get_value(v) || v.empty()) {
                std::cerr << "Missing value for --output\n";
                std::exit(1);
            }
            opt.output = v;
        } else if (arg == "--csv") {
            opt.csv = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }

    if (opt.backend != "serial" && opt.backend != "omp") {
        std::cerr << "Unsupported backend '" << opt.backend
                  << "', falling back to 'omp'\n";
        opt.backend = "omp";
    }

    return opt;
}

int main(int argc, char** argv)
{
    using Clock = std::chrono::high_resolution_clock;
    auto elapsed_ms = [](Clock::time_point t0, Clock::time_point t1) {
        return std::chrono::duration<double, std::milli>(t1 - t0).count();
    };

    Options opt = parse_args(argc, argv);

    glass::Config cfg{opt.width, opt.height};
    cfg.tolerance = opt.tolerance;
    cfg.degree_threshold = opt.degree_threshold;

    std::cout << "Config:\n"
              << "  backend   = " << opt.backend << "\n";
    if (opt.backend == "omp") {
        std::cout << "  threads   = " << opt.threads << "\n";
    }
    std::cout << "  size      = " << cfg.width << " x " << cfg.height << "\n"
              << "  #sites    = " << opt.num_sites << "\n"
              << "  tolerance = " << cfg.tolerance << "\n"
              << "  threshold = " << cfg.degree_threshold << "\n"
              << "  rng_seed  = " << opt.rng_seed << "\n";

    try {
        const std::vector<glass::Site> sites =
            glass::random_sites(cfg, opt.num_sites, opt.rng_seed);
        const glass::SpatialIndex index(sites);

        // 1) adjacency
        glass::AdjacencyGraph graph;
        std::vector<glass::BoundarySample> boundary;
        auto t0 = Clock::now();
        if (opt.backend == "serial") {
            glass::build_adjacency_serial(cfg, index, graph, &boundary);
        } else {
            glass::build_adjacency_omp(cfg, index, graph, opt.threads, &boundary);
        }
        auto t1 = Clock::now();
        const double adjacency_ms = elapsed_ms(t0, t1);
        std::cout << "\n[Adjacency] time = " << adjacency_ms << " ms"
                  << ", vertices = " << graph.vertex_count()
                  << ", edges = " << graph.edge_count()
                  << ", max degree = " << graph.max_degree()
                  << ", boundary samples = " << boundary.size() << "\n";

        // 2) order + color
        t0 = Clock::now();
        glass::OrderStats stats;
        const glass::SiteColoring coloring =
            glass::color_sites(graph, index, opt.rng_seed, cfg.degree_threshold, &stats);
        t1 = Clock::now();
        const double color_ms = elapsed_ms(t0, t1);
        const int conflicts = glass::count_conflicts(graph, coloring);
        std::cout << "[Coloring] time = " << color_ms << " ms"
                  << ", fallback picks = " << stats.fallback_picks
                  << ", max residual degree = " << stats.max_residual_degree
                  << ", conflicts = " << conflicts << "\n";

        // 3) per-pixel labels
        glass::LabelBuffer labels;
        t0 = Clock::now();
        glass::label_pixels(cfg, index, labels);
        t1 = Clock::now();
        const double label_ms = elapsed_ms(t0, t1);

        int diff_exact = -1;
        double exact_ms = 0.0;
        if (!opt.skip_exact) {
            glass::LabelBuffer exact_labels;
            auto te0 = Clock::now();
            glass::nearest_site_exact(cfg, sites, exact_labels);
            auto te1 = Clock::now();
            exact_ms = elapsed_ms(te0, te1);
            diff_exact = 0;
            for (std::size_t i = 0; i < labels.size(); ++i) {
                if (labels[i] != exact_labels[i]) ++diff_exact;
            }
        }

        std::cout << "[Labels] time = " << label_ms << " ms";
        if (!opt.skip_exact) {
            std::cout << ", exact time = " << exact_ms << " ms"
                      << ", diff vs exact = " << diff_exact << " pixels";
        }
        std::cout << "\n";

        // 4) image
        glass::RGBImage rgb;
        glass::fill_cells(labels, glass::site_color_table(index, coloring),
                          cfg.width, cfg.height, rgb);
        if (opt.draw_boundaries) {
            glass::draw_boundaries(boundary, glass::Color{0, 0, 0},
                                   cfg.width, cfg.height, rgb);
        }
        glass::draw_grid(opt.grid_cols, opt.grid_rows, glass::Color{128, 128, 128},
                         cfg.width, cfg.height, rgb);

        if (!glass::write_ppm(opt.output, cfg.width, cfg.height, rgb)) {
            std::cerr << "[ERROR] failed to write " << opt.output << "\n";
            return 1;
        }

        if (opt.csv) {
            std::cout << "CSV,"
                      << opt.backend << ","
                      << (opt.backend == "omp" ? opt.threads : 1) << ","
                      << cfg.width << ","
                      << cfg.height << ","
                      << opt.num_sites << ","
                      << adjacency_ms << ","
                      << color_ms << ","
                      << label_ms << ","
                      << graph.edge_count() << ","
                      << stats.fallback_picks << ","
                      << conflicts << ","
                      << diff_exact << "\n";
        }

        if (conflicts != 0) {
            std::cerr << "[ERROR] coloring has " << conflicts << " conflicting edges\n";
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nok; seed is " << opt.rng_seed
              << ", count is " << opt.num_sites
              << ", image is " << opt.output << "\n";

    return 0;
}
