// filename: config.hpp
// part of Motor Efficiency Map Toolkit
// MIT License

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "effmap/types.hpp"

namespace effmap {

/// Flat, case-sensitive key/value configuration as read from an INI or JSON file.
using ConfigMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Parse INI text into a flat mapping.
 *
 * Keys before the first section header are accepted. Full-line comments
 * (`;`, `#`) and inline comments after whitespace are stripped; a key repeated in a later
 * section overrides the earlier value.
 */
ConfigMap parseIniText(const std::string& text);

/**
 * @brief Flatten a JSON configuration document.
 *
 * Accepts a flat object or an object of section objects. Numbers and booleans
 * are converted to their textual form ("1"/"0" for booleans).
 */
ConfigMap parseJsonConfigText(const std::string& text);

/// Load a configuration file; `.json` files go through nlohmann/json, everything else is INI.
ConfigMap loadConfigFile(const std::string& path);

std::string configString(const ConfigMap& config, const std::string& key,
                         const std::string& fallback = std::string{});

/**
 * @brief Resolve a finite numeric value.
 *
 * Missing keys return @p fallback. Blank values return @p fallback only when
 * @p blankMeansFallback is set, otherwise they are malformed.
 * @throws ConfigError when the value is present but not a finite number.
 */
double configNumber(const ConfigMap& config, const std::string& key, double fallback,
                    bool blankMeansFallback = false);

/// True when the key is set to "1".
bool configFlag(const ConfigMap& config, const std::string& key);

/// Strip surrounding whitespace, then surrounding single and double quotes.
std::string cleanColumnAlias(const std::string& alias);

std::string trim(const std::string& text);

struct GridSteps {
    double speed{50.0};
    double torque{5.0};
};

struct CutoffSettings {
    double startSpeed{0.0};
    double startTorque{0.0};
};

/// @throws ConfigError for malformed or non-positive steps.
GridSteps resolveGridSteps(const ConfigMap& config);

/// Empty `StartSpeed`/`StartTorque` values mean 0. @throws ConfigError when malformed.
CutoffSettings resolveCutoff(const ConfigMap& config);

/// `EffMAPStep` levels, default "90 85 80 70". @throws ConfigError when malformed.
std::vector<double> resolveEfficiencyLevels(const ConfigMap& config);

/// `PowerMAPStep` contour levels; empty when unset. @throws ConfigError when malformed.
std::vector<double> resolvePowerLevels(const ConfigMap& config);

/// `MCUMAP` / `MotorMAP` / `SYSMAP` switch for the channel.
bool mapExportEnabled(const ConfigMap& config, EfficiencyChannel channel);

/// `MCUAreaRatioCalculation` / `MotorAreaRatioCalculation` / `SYSAreaRatioCalculation`.
bool areaRatioEnabled(const ConfigMap& config, EfficiencyChannel channel);

}  // namespace effmap
