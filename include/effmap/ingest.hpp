#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "effmap/config.hpp"
#include "effmap/types.hpp"

namespace effmap {

/**
 * @brief One rectangular sheet of named text columns, as handed over by a loader.
 */
struct DataTable {
    std::string name;
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;

    [[nodiscard]] std::size_t rowCount() const { return rows.size(); }

    [[nodiscard]] std::optional<std::size_t> findColumn(const std::string& header) const;
};

/**
 * @brief Parse CSV text (header row first) into a table.
 *
 * Quoted fields with doubled quotes, CRLF line endings and a UTF-8 BOM are
 * accepted. Short rows are padded with empty cells; blank lines are skipped.
 * @throws std::runtime_error when a row has more cells than the header.
 */
DataTable parseCsvTable(const std::string& text, const std::string& name);

/// Load a CSV sheet; the table is named after the file stem.
DataTable loadCsvTable(const std::string& path);

/// Numeric value of a cell, or nullopt when it does not parse completely.
std::optional<double> parseNumericCell(const std::string& cell);

enum class SpeedDirection { Forward, Reverse, Unknown };
enum class MotionState { Motoring, Generating, Unknown };

const char* directionName(SpeedDirection direction);
const char* stateName(MotionState state);

/**
 * @brief Measurement channels extracted from a table by configured aliases.
 *
 * Speed, torque and power are magnitudes; efficiencies keep their sign.
 */
struct MappedDataset {
    std::vector<double> speed;
    std::vector<double> torque;
    std::vector<double> power;
    std::vector<double> effMcu;
    std::vector<double> effMotor;
    std::vector<double> effSys;
    std::vector<double> udc;

    SpeedDirection direction{SpeedDirection::Unknown};
    MotionState state{MotionState::Unknown};
    bool customVoltage{false};
    std::size_t matchedColumns{0};
    std::vector<std::string> warnings;

    [[nodiscard]] std::size_t size() const { return speed.size(); }

    [[nodiscard]] const std::vector<double>& efficiency(EfficiencyChannel channel) const;
};

/**
 * @brief Extract the measurement channels of @p table.
 *
 * Missing aliases become all-zero channels with a warning. The DC-bus voltage
 * uses `customUdc` when it parses as a finite number.
 * @throws StructuralError when none of the configured aliases matches a column.
 */
MappedDataset mapColumns(const DataTable& table, const ConfigMap& config);

}  // namespace effmap
