// src/common/config.cpp
#include <glass/types.hpp>
#include <stdexcept>
#include <string>

namespace glass {

void validate_config(const Config& cfg)
{
    if (cfg.width <= 0 || cfg.height <= 0) {
        throw std::invalid_argument("drawable area must be positive, got " +
                                    std::to_string(cfg.width) + " x " +
                                    std::to_string(cfg.height));
    }
    if (cfg.sample_step <= 0) {
        throw std::invalid_argument("sample_step must be positive");
    }
    if (!(cfg.tolerance > 0.0)) {
        throw std::invalid_argument("tolerance must be positive");
    }
    if (cfg.degree_threshold < 1 || cfg.degree_threshold > PALETTE_SIZE) {
        throw std::invalid_argument("degree_threshold must be in [1, " +
                                    std::to_string(PALETTE_SIZE) + "], got " +
                                    std::to_string(cfg.degree_threshold));
    }
}

} // namespace glass
