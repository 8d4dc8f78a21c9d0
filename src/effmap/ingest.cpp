#include "effmap/ingest.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace effmap {
namespace {

constexpr const char* kMeasurementKeys[] = {"Speed", "Toqrue", "P_Motor", "Eff_MCU",
                                            "Eff_Motor", "Eff_SYS", "U_dc"};

std::vector<std::string> splitCsvRecord(const std::string& text, std::size_t& pos) {
    std::vector<std::string> cells;
    std::string cell;
    bool inQuotes = false;
    while (pos < text.size()) {
        const char c = text[pos];
        if (inQuotes) {
            if (c == '"') {
                if (pos + 1 < text.size() && text[pos + 1] == '"') {
                    cell.push_back('"');
                    pos += 2;
                    continue;
                }
                inQuotes = false;
            } else {
                cell.push_back(c);
            }
            ++pos;
            continue;
        }
        if (c == '"') {
            inQuotes = true;
        } else if (c == ',') {
            cells.push_back(cell);
            cell.clear();
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n') {
                ++pos;
            }
            ++pos;
            cells.push_back(cell);
            return cells;
        } else {
            cell.push_back(c);
        }
        ++pos;
    }
    cells.push_back(cell);
    return cells;
}

bool isBlankRecord(const std::vector<std::string>& cells) {
    return cells.size() == 1 && trim(cells.front()).empty();
}

struct ColumnLookup {
    std::vector<double> values;
    bool found{false};
    std::optional<double> rawMean;
};

ColumnLookup lookupColumn(const DataTable& table, const ConfigMap& config, const std::string& key,
                          std::vector<std::string>& warnings) {
    ColumnLookup lookup{};
    lookup.values.assign(table.rowCount(), 0.0);

    const std::string alias = cleanColumnAlias(configString(config, key));
    const auto column = alias.empty() ? std::nullopt : table.findColumn(alias);
    if (alias.empty()) {
        warnings.push_back("No column configured for " + key + "; using zeros");
        return lookup;
    }
    if (!column) {
        warnings.push_back("Column '" + alias + "' (mapped from " + key + ") not found in sheet '" +
                           table.name + "'; using zeros");
        return lookup;
    }

    lookup.found = true;
    double sum = 0.0;
    double absSum = 0.0;
    std::size_t numericCount = 0;
    for (std::size_t row = 0; row < table.rowCount(); ++row) {
        const auto value = parseNumericCell(table.rows[row][*column]);
        if (value) {
            lookup.values[row] = *value;
            sum += *value;
            absSum += std::abs(*value);
            ++numericCount;
        }
    }
    if (numericCount > 0) {
        lookup.rawMean = sum / static_cast<double>(numericCount);
    }
    if (absSum == 0.0) {
        warnings.push_back("Column '" + alias + "' (mapped from " + key + ") is all zero or non-numeric");
    }
    return lookup;
}

std::vector<double> absolute(std::vector<double> values) {
    for (double& v : values) {
        v = std::abs(v);
    }
    return values;
}

}  // namespace

std::optional<std::size_t> DataTable::findColumn(const std::string& header) const {
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] == header) {
            return i;
        }
    }
    return std::nullopt;
}

DataTable parseCsvTable(const std::string& text, const std::string& name) {
    std::string body = text;
    if (body.size() >= 3 && static_cast<unsigned char>(body[0]) == 0xEF &&
        static_cast<unsigned char>(body[1]) == 0xBB && static_cast<unsigned char>(body[2]) == 0xBF) {
        body.erase(0, 3);
    }

    DataTable table{};
    table.name = name;

    std::size_t pos = 0;
    while (pos < body.size() && table.columns.empty()) {
        auto header = splitCsvRecord(body, pos);
        if (isBlankRecord(header)) {
            continue;
        }
        for (auto& cell : header) {
            cell = trim(cell);
        }
        table.columns = std::move(header);
    }

    std::size_t recordNumber = 1;
    while (pos < body.size()) {
        auto cells = splitCsvRecord(body, pos);
        ++recordNumber;
        if (isBlankRecord(cells)) {
            continue;
        }
        if (cells.size() > table.columns.size()) {
            throw std::runtime_error("CSV sheet '" + name + "' record " + std::to_string(recordNumber) +
                                     " has " + std::to_string(cells.size()) + " cells, header has " +
                                     std::to_string(table.columns.size()));
        }
        cells.resize(table.columns.size());
        table.rows.push_back(std::move(cells));
    }
    return table;
}

DataTable loadCsvTable(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open CSV sheet: " + path);
    }
    const std::string text{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    return parseCsvTable(text, std::filesystem::path(path).stem().string());
}

std::optional<double> parseNumericCell(const std::string& cell) {
    const std::string text = trim(cell);
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

const char* directionName(SpeedDirection direction) {
    switch (direction) {
        case SpeedDirection::Forward:
            return "forward";
        case SpeedDirection::Reverse:
            return "reverse";
        case SpeedDirection::Unknown:
            break;
    }
    return "unknown";
}

const char* stateName(MotionState state) {
    switch (state) {
        case MotionState::Motoring:
            return "motoring";
        case MotionState::Generating:
            return "generating";
        case MotionState::Unknown:
            break;
    }
    return "unknown";
}

const std::vector<double>& MappedDataset::efficiency(EfficiencyChannel channel) const {
    switch (channel) {
        case EfficiencyChannel::Mcu:
            return effMcu;
        case EfficiencyChannel::Motor:
            return effMotor;
        case EfficiencyChannel::System:
            return effSys;
    }
    return effMcu;
}

MappedDataset mapColumns(const DataTable& table, const ConfigMap& config) {
    std::size_t matched = 0;
    for (const char* key : kMeasurementKeys) {
        const std::string alias = cleanColumnAlias(configString(config, key));
        if (!alias.empty() && table.findColumn(alias)) {
            ++matched;
        }
    }
    if (matched == 0) {
        throw StructuralError("No configured column matched sheet '" + table.name + "'");
    }

    MappedDataset mapped{};
    mapped.matchedColumns = matched;

    const ColumnLookup speed = lookupColumn(table, config, "Speed", mapped.warnings);
    const ColumnLookup torque = lookupColumn(table, config, "Toqrue", mapped.warnings);
    const ColumnLookup power = lookupColumn(table, config, "P_Motor", mapped.warnings);

    mapped.speed = absolute(speed.values);
    mapped.torque = absolute(torque.values);
    mapped.power = absolute(power.values);
    mapped.effMcu = lookupColumn(table, config, "Eff_MCU", mapped.warnings).values;
    mapped.effMotor = lookupColumn(table, config, "Eff_Motor", mapped.warnings).values;
    mapped.effSys = lookupColumn(table, config, "Eff_SYS", mapped.warnings).values;

    const std::string customUdc = trim(configString(config, "customUdc"));
    if (!customUdc.empty()) {
        const auto voltage = parseNumericCell(customUdc);
        if (voltage) {
            mapped.udc.assign(table.rowCount(), *voltage);
            mapped.customVoltage = true;
        } else {
            mapped.warnings.push_back("customUdc '" + customUdc +
                                      "' is not a valid number; using the U_dc column");
        }
    }
    if (!mapped.customVoltage) {
        mapped.udc = lookupColumn(table, config, "U_dc", mapped.warnings).values;
    }

    if (speed.found && speed.rawMean) {
        mapped.direction = *speed.rawMean > 0.0 ? SpeedDirection::Forward : SpeedDirection::Reverse;
    }
    if (power.found && power.rawMean) {
        mapped.state = *power.rawMean > 0.0 ? MotionState::Motoring : MotionState::Generating;
    }
    return mapped;
}

}  // namespace effmap
