// filename: io_csv.hpp
// part of Motor Efficiency Map Toolkit
// MIT License

#pragma once

#include <string>
#include <vector>

#include "effmap/envelope.hpp"
#include "effmap/grid.hpp"
#include "effmap/session.hpp"

namespace effmap {

struct FieldColumnView {
    std::string header;
    const std::vector<double>* values{nullptr};
};

/// Columns `speed,torque,<headers...>`; kEmpty values are written as empty cells.
void write_csv_field_map(const std::string& path,
                         const std::vector<double>& speed,
                         const std::vector<double>& torque,
                         const std::vector<FieldColumnView>& columns);

/// Valid fill points of @p grid: `speed,torque,<channel>,power,geometry`.
void write_csv_grid(const std::string& path, const EffMapGrid& grid, EfficiencyChannel channel);

/// Envelope samples with the fitted curve at each sample: `speed,torque_max,torque_fit`.
void write_csv_envelope(const std::string& path, const EnvelopeCurve& envelope);

/**
 * @brief Area-ratio table `level,MCU,Motor,SYS`, one row per level.
 *
 * Channels without ratios are left blank. Returns false (and writes nothing)
 * when no channel has ratios.
 */
bool write_csv_area_ratios(const std::string& path, const SheetReport& report);

}  // namespace effmap
