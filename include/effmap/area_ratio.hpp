#pragma once

#include <string>
#include <vector>

#include "effmap/grid.hpp"

namespace effmap {

struct AreaRatioEntry {
    double level{0.0};
    double ratio{0.0};
};

/**
 * @brief Parse a level list.
 *
 * Accepts values separated by spaces, commas or semicolons, `start:end`
 * (step 1) and `start:step:end`; range ends are inclusive within step/1000.
 * An empty string gives an empty list.
 * @throws ConfigError for malformed text or a range step that is not positive.
 */
std::vector<double> parseLevelList(const std::string& text);

/**
 * @brief Percentage of the geometry mask whose efficiency reaches each level.
 *
 * Levels are processed in descending order. kEmpty cells never count. Returns
 * an empty list when the mask has no true cell.
 */
std::vector<AreaRatioEntry> computeAreaRatios(const std::vector<double>& eff,
                                              const std::vector<unsigned char>& geometry,
                                              std::vector<double> levels);

std::vector<AreaRatioEntry> computeAreaRatios(const EffMapGrid& grid, std::vector<double> levels);

}  // namespace effmap
