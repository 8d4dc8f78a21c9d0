// filename: io_csv.cpp
// part of Motor Efficiency Map Toolkit
// MIT License

#include "effmap/io_csv.hpp"

#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>

namespace effmap {
namespace {

std::ofstream openCsv(const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open CSV output: " + path);
    }
    ofs << std::setprecision(std::numeric_limits<double>::max_digits10);
    return ofs;
}

void writeCell(std::ofstream& ofs, double value) {
    if (!isEmpty(value)) {
        ofs << value;
    }
}

const AreaRatioEntry* findLevel(const std::vector<AreaRatioEntry>& entries, double level) {
    for (const auto& entry : entries) {
        if (entry.level == level) {
            return &entry;
        }
    }
    return nullptr;
}

}  // namespace

void write_csv_field_map(const std::string& path,
                         const std::vector<double>& speed,
                         const std::vector<double>& torque,
                         const std::vector<FieldColumnView>& columns) {
    const std::size_t n = speed.size();
    if (torque.size() != n) {
        throw std::invalid_argument("write_csv_field_map: mismatched vector sizes");
    }
    for (const auto& column : columns) {
        if (column.values == nullptr) {
            throw std::invalid_argument("write_csv_field_map: null column pointer for '" +
                                        column.header + "'");
        }
        if (column.values->size() != n) {
            throw std::invalid_argument(
                "write_csv_field_map: column size mismatch for '" + column.header + "'");
        }
    }

    std::ofstream ofs = openCsv(path);
    ofs << "speed,torque";
    for (const auto& column : columns) {
        ofs << ',' << column.header;
    }
    ofs << '\n';

    for (std::size_t i = 0; i < n; ++i) {
        ofs << speed[i] << ',' << torque[i];
        for (const auto& column : columns) {
            ofs << ',';
            writeCell(ofs, (*(column.values))[i]);
        }
        ofs << '\n';
    }
}

void write_csv_grid(const std::string& path, const EffMapGrid& grid, EfficiencyChannel channel) {
    const std::size_t count = grid.fillCount();
    std::vector<double> speed;
    std::vector<double> torque;
    std::vector<double> eff;
    std::vector<double> power;
    std::vector<double> geometry;
    speed.reserve(count);
    torque.reserve(count);
    eff.reserve(count);
    power.reserve(count);
    geometry.reserve(count);

    for (std::size_t i = 0; i < grid.nx; ++i) {
        for (std::size_t j = 0; j < grid.fillHeight[i]; ++j) {
            const std::size_t id = grid.idx(i, j);
            speed.push_back(grid.speedAxis[i]);
            torque.push_back(grid.Y[id]);
            eff.push_back(grid.Eff[id]);
            power.push_back(grid.Power[id]);
            geometry.push_back(grid.geometry[id] != 0 ? 1.0 : 0.0);
        }
    }

    write_csv_field_map(path, speed, torque,
                        {{channelKey(channel), &eff}, {"power", &power}, {"geometry", &geometry}});
}

void write_csv_envelope(const std::string& path, const EnvelopeCurve& envelope) {
    std::ofstream ofs = openCsv(path);
    ofs << "speed,torque_max,torque_fit\n";
    for (const auto& sample : envelope.samples()) {
        ofs << sample.speed << ',' << sample.torque << ',' << envelope(sample.speed) << '\n';
    }
}

bool write_csv_area_ratios(const std::string& path, const SheetReport& report) {
    const std::vector<AreaRatioEntry>* columns[3] = {nullptr, nullptr, nullptr};
    const std::vector<AreaRatioEntry>* rowSource = nullptr;
    for (const auto& channel : report.channels) {
        if (!channel.ratioRequested || channel.ratios.empty()) {
            continue;
        }
        const auto slot = static_cast<std::size_t>(channel.channel);
        columns[slot] = &channel.ratios;
        if (rowSource == nullptr) {
            rowSource = &channel.ratios;
        }
    }
    if (rowSource == nullptr) {
        return false;
    }

    std::ofstream ofs = openCsv(path);
    ofs << "level,MCU,Motor,SYS\n";
    for (const auto& row : *rowSource) {
        ofs << row.level;
        for (const auto* column : columns) {
            ofs << ',';
            if (column == nullptr) {
                continue;
            }
            if (const AreaRatioEntry* entry = findLevel(*column, row.level)) {
                ofs << entry->ratio;
            }
        }
        ofs << '\n';
    }
    return true;
}

}  // namespace effmap
