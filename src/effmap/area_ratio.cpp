#include "effmap/area_ratio.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <sstream>

#include "effmap/config.hpp"
#include "effmap/ingest.hpp"

namespace effmap {
namespace {

constexpr std::size_t kMaxRangeLevels = 100000;

double requireLevel(const std::string& token, const std::string& text) {
    const auto value = parseNumericCell(token);
    if (!value) {
        throw ConfigError("Malformed level '" + trim(token) + "' in '" + text + "'");
    }
    return *value;
}

std::vector<double> expandRange(double start, double step, double end, const std::string& text) {
    if (!(step > 0.0)) {
        throw ConfigError("Level range step must be positive in '" + text + "'");
    }
    const double span = std::ceil((end + step / 1000.0 - start) / step);
    if (!(span > 0.0)) {
        return {};
    }
    if (span > static_cast<double>(kMaxRangeLevels)) {
        throw ConfigError("Level range '" + text + "' expands to too many levels");
    }
    std::vector<double> levels(static_cast<std::size_t>(span));
    for (std::size_t i = 0; i < levels.size(); ++i) {
        levels[i] = start + static_cast<double>(i) * step;
    }
    return levels;
}

}  // namespace

std::vector<double> parseLevelList(const std::string& text) {
    if (text.find(':') != std::string::npos) {
        std::vector<double> parts;
        std::stringstream ss(text);
        std::string token;
        while (std::getline(ss, token, ':')) {
            parts.push_back(requireLevel(token, text));
        }
        if (parts.size() == 2) {
            // start:end uses a unit step; the slack is taken from the end value.
            const double slack = parts[1] / 1000.0;
            std::vector<double> levels;
            const double span = std::ceil(parts[1] + slack - parts[0]);
            if (span > static_cast<double>(kMaxRangeLevels)) {
                throw ConfigError("Level range '" + text + "' expands to too many levels");
            }
            for (double i = 0.0; i < span; i += 1.0) {
                levels.push_back(parts[0] + i);
            }
            return levels;
        }
        if (parts.size() == 3) {
            return expandRange(parts[0], parts[1], parts[2], text);
        }
        throw ConfigError("Level range must be start:end or start:step:end, got '" + text + "'");
    }

    std::string normalised = text;
    std::replace(normalised.begin(), normalised.end(), ';', ' ');
    std::replace(normalised.begin(), normalised.end(), ',', ' ');
    std::vector<double> levels;
    std::istringstream stream(normalised);
    std::string token;
    while (stream >> token) {
        levels.push_back(requireLevel(token, text));
    }
    return levels;
}

std::vector<AreaRatioEntry> computeAreaRatios(const std::vector<double>& eff,
                                              const std::vector<unsigned char>& geometry,
                                              std::vector<double> levels) {
    const auto denominator = static_cast<std::size_t>(std::count(geometry.begin(), geometry.end(), 1));
    if (denominator == 0) {
        return {};
    }

    std::sort(levels.begin(), levels.end(), std::greater<double>());
    std::vector<AreaRatioEntry> entries;
    entries.reserve(levels.size());
    for (double level : levels) {
        const auto count = static_cast<std::size_t>(
            std::count_if(eff.begin(), eff.end(), [level](double v) { return v >= level; }));
        entries.push_back(AreaRatioEntry{
            level, 100.0 * static_cast<double>(count) / static_cast<double>(denominator)});
    }
    return entries;
}

std::vector<AreaRatioEntry> computeAreaRatios(const EffMapGrid& grid, std::vector<double> levels) {
    return computeAreaRatios(grid.Eff, grid.geometry, std::move(levels));
}

}  // namespace effmap
