// filename: config.cpp
// part of Motor Efficiency Map Toolkit
// MIT License

#include "effmap/config.hpp"

#include "effmap/area_ratio.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include <nlohmann/json.hpp>

namespace effmap {
namespace {

std::string readWholeFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ConfigError("Failed to open configuration file: " + path);
    }
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

std::string stripBom(const std::string& text) {
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
        return text.substr(3);
    }
    return text;
}

// An inline comment starts at ';' or '#' preceded by whitespace, so "90;85" stays a value.
std::string stripInlineComment(const std::string& value) {
    for (std::size_t i = 1; i < value.size(); ++i) {
        if ((value[i] == ';' || value[i] == '#') &&
            std::isspace(static_cast<unsigned char>(value[i - 1]))) {
            return trim(value.substr(0, i));
        }
    }
    return trim(value);
}

std::string jsonScalarToString(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "1" : "0";
    }
    if (value.is_number()) {
        return value.dump();
    }
    if (value.is_null()) {
        return std::string{};
    }
    throw ConfigError("Unsupported JSON configuration value: " + value.dump());
}

const char* mapSwitchKey(EfficiencyChannel channel) {
    switch (channel) {
        case EfficiencyChannel::Mcu:
            return "MCUMAP";
        case EfficiencyChannel::Motor:
            return "MotorMAP";
        case EfficiencyChannel::System:
            return "SYSMAP";
    }
    return "MCUMAP";
}

const char* ratioSwitchKey(EfficiencyChannel channel) {
    switch (channel) {
        case EfficiencyChannel::Mcu:
            return "MCUAreaRatioCalculation";
        case EfficiencyChannel::Motor:
            return "MotorAreaRatioCalculation";
        case EfficiencyChannel::System:
            return "SYSAreaRatioCalculation";
    }
    return "MCUAreaRatioCalculation";
}

}  // namespace

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string cleanColumnAlias(const std::string& alias) {
    std::string cleaned = trim(alias);
    while (!cleaned.empty() && cleaned.front() == '\'') {
        cleaned.erase(cleaned.begin());
    }
    while (!cleaned.empty() && cleaned.back() == '\'') {
        cleaned.pop_back();
    }
    while (!cleaned.empty() && cleaned.front() == '"') {
        cleaned.erase(cleaned.begin());
    }
    while (!cleaned.empty() && cleaned.back() == '"') {
        cleaned.pop_back();
    }
    return cleaned;
}

ConfigMap parseIniText(const std::string& text) {
    ConfigMap config;
    std::istringstream stream(stripBom(text));
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(stream, line)) {
        ++lineNumber;
        const std::string content = trim(line);
        if (content.empty() || content.front() == '#' || content.front() == ';') {
            continue;
        }
        if (content.front() == '[') {
            if (content.back() != ']') {
                throw ConfigError("Malformed section header on line " + std::to_string(lineNumber));
            }
            continue;
        }
        const std::size_t delimiter = content.find_first_of("=:");
        if (delimiter == std::string::npos || delimiter == 0) {
            throw ConfigError("Expected 'key = value' on line " + std::to_string(lineNumber) + ": " +
                              content);
        }
        const std::string key = trim(content.substr(0, delimiter));
        config[key] = stripInlineComment(content.substr(delimiter + 1));
    }
    return config;
}

ConfigMap parseJsonConfigText(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ConfigError(std::string("Invalid JSON configuration: ") + ex.what());
    }
    if (!json.is_object()) {
        throw ConfigError("JSON configuration must be an object");
    }

    ConfigMap config;
    for (const auto& kv : json.items()) {
        if (kv.value().is_object()) {
            for (const auto& inner : kv.value().items()) {
                config[inner.key()] = trim(jsonScalarToString(inner.value()));
            }
        } else {
            config[kv.key()] = trim(jsonScalarToString(kv.value()));
        }
    }
    return config;
}

ConfigMap loadConfigFile(const std::string& path) {
    const std::string text = readWholeFile(path);
    if (std::filesystem::path(path).extension() == ".json") {
        return parseJsonConfigText(text);
    }
    return parseIniText(text);
}

std::string configString(const ConfigMap& config, const std::string& key, const std::string& fallback) {
    const auto it = config.find(key);
    return it == config.end() ? fallback : it->second;
}

double configNumber(const ConfigMap& config, const std::string& key, double fallback,
                    bool blankMeansFallback) {
    const auto it = config.find(key);
    if (it == config.end()) {
        return fallback;
    }
    const std::string text = trim(it->second);
    if (text.empty()) {
        if (blankMeansFallback) {
            return fallback;
        }
        throw ConfigError(key + " is empty; expected a number");
    }

    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value)) {
        throw ConfigError(key + " must be a finite number (got '" + text + "')");
    }
    return value;
}

bool configFlag(const ConfigMap& config, const std::string& key) {
    return trim(configString(config, key, "0")) == "1";
}

GridSteps resolveGridSteps(const ConfigMap& config) {
    GridSteps steps{};
    steps.speed = configNumber(config, "SpeedGrid", 50.0);
    steps.torque = configNumber(config, "TorqueGrid", 5.0);
    if (!(steps.speed > 0.0)) {
        throw ConfigError("SpeedGrid must be positive");
    }
    if (!(steps.torque > 0.0)) {
        throw ConfigError("TorqueGrid must be positive");
    }
    return steps;
}

CutoffSettings resolveCutoff(const ConfigMap& config) {
    CutoffSettings cutoff{};
    cutoff.startSpeed = configNumber(config, "StartSpeed", 0.0, true);
    cutoff.startTorque = configNumber(config, "StartTorque", 0.0, true);
    return cutoff;
}

std::vector<double> resolveEfficiencyLevels(const ConfigMap& config) {
    return parseLevelList(configString(config, "EffMAPStep", "90 85 80 70"));
}

std::vector<double> resolvePowerLevels(const ConfigMap& config) {
    return parseLevelList(configString(config, "PowerMAPStep"));
}

bool mapExportEnabled(const ConfigMap& config, EfficiencyChannel channel) {
    return configFlag(config, mapSwitchKey(channel));
}

bool areaRatioEnabled(const ConfigMap& config, EfficiencyChannel channel) {
    return configFlag(config, ratioSwitchKey(channel));
}

}  // namespace effmap
