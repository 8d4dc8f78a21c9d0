#include "effmap/config.hpp"
#include "effmap/ingest.hpp"
#include "effmap/types.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

bool hasWarningContaining(const effmap::MappedDataset& mapped, const std::string& needle) {
    return std::any_of(mapped.warnings.begin(), mapped.warnings.end(),
                       [&](const std::string& w) { return w.find(needle) != std::string::npos; });
}

}  // namespace

int main() {
    using namespace effmap;

    const std::string csv =
        "\xEF\xBB\xBF"
        "\"Motor Speed\",Torque,\"Power, kW\",EffA,EffB,EffC,Udc\r\n"
        "-1000,-20,-5.5,91,88,80,320\r\n"
        "\r\n"
        "-2000,40,\"-11\",n/a,89,81,330\r\n"
        "-1500,30,-8\r\n";

    DataTable table;
    try {
        table = parseCsvTable(csv, "bench");
    } catch (const std::exception& ex) {
        std::cerr << "CSV parse failed: " << ex.what() << "\n";
        return 1;
    }
    if (table.columns.size() != 7 || table.columns.front() != "Motor Speed" ||
        table.columns[2] != "Power, kW" || table.rowCount() != 3) {
        std::cerr << "CSV header or row count parsed incorrectly\n";
        return 1;
    }
    if (table.rows[2].size() != 7 || !table.rows[2][5].empty()) {
        std::cerr << "Short CSV row was not padded with empty cells\n";
        return 1;
    }

    ConfigMap config{{"Speed", " 'Motor Speed' "},
                     {"Toqrue", "Torque"},
                     {"P_Motor", "\"Power, kW\""},
                     {"Eff_MCU", "EffA"},
                     {"Eff_Motor", "EffB"},
                     {"Eff_SYS", "Missing column"},
                     {"U_dc", "Udc"}};

    MappedDataset mapped;
    try {
        mapped = mapColumns(table, config);
    } catch (const std::exception& ex) {
        std::cerr << "mapColumns threw: " << ex.what() << "\n";
        return 1;
    }

    if (mapped.size() != 3 || mapped.matchedColumns != 6) {
        std::cerr << "Unexpected mapped size " << mapped.size() << " / matched "
                  << mapped.matchedColumns << "\n";
        return 1;
    }
    if (mapped.speed[0] != 1000.0 || mapped.torque[0] != 20.0 || mapped.power[1] != 11.0) {
        std::cerr << "Speed, torque and power must be stored as magnitudes\n";
        return 1;
    }
    if (mapped.effMcu[1] != 0.0 || mapped.effMcu[0] != 91.0) {
        std::cerr << "Non-numeric efficiency cell should coerce to 0\n";
        return 1;
    }
    if (mapped.effMotor[2] != 0.0 || mapped.udc[2] != 0.0) {
        std::cerr << "Empty cells should coerce to 0\n";
        return 1;
    }
    for (double v : mapped.effSys) {
        if (v != 0.0) {
            std::cerr << "Missing Eff_SYS column should produce zeros\n";
            return 1;
        }
    }
    if (!hasWarningContaining(mapped, "Missing column")) {
        std::cerr << "Missing column did not produce a warning\n";
        return 1;
    }
    if (mapped.direction != SpeedDirection::Reverse || mapped.state != MotionState::Generating) {
        std::cerr << "Negative raw speed/power means should give reverse/generating, got "
                  << directionName(mapped.direction) << "/" << stateName(mapped.state) << "\n";
        return 1;
    }
    if (mapped.customVoltage || mapped.udc[0] != 320.0) {
        std::cerr << "U_dc column should be used when customUdc is unset\n";
        return 1;
    }

    config["customUdc"] = "400";
    try {
        const MappedDataset fixed = mapColumns(table, config);
        if (!fixed.customVoltage ||
            std::any_of(fixed.udc.begin(), fixed.udc.end(), [](double v) { return v != 400.0; })) {
            std::cerr << "customUdc should replace every DC-bus voltage\n";
            return 1;
        }

        config["customUdc"] = "four hundred";
        const MappedDataset fallback = mapColumns(table, config);
        if (fallback.customVoltage || fallback.udc[1] != 330.0 ||
            !hasWarningContaining(fallback, "customUdc")) {
            std::cerr << "Malformed customUdc should warn and fall back to the U_dc column\n";
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "customUdc handling threw: " << ex.what() << "\n";
        return 1;
    }

    const ConfigMap unrelated{{"Speed", "rpm"}, {"Toqrue", "Nm"}};
    try {
        (void)mapColumns(table, unrelated);
        std::cerr << "A table with no matching column must raise StructuralError\n";
        return 1;
    } catch (const StructuralError&) {
    }

    const DataTable noSpeed = parseCsvTable("Torque,EffA\n10,90\n", "torque_only");
    try {
        const MappedDataset partial = mapColumns(noSpeed, config);
        if (partial.direction != SpeedDirection::Unknown || partial.speed.size() != 1 ||
            partial.speed[0] != 0.0) {
            std::cerr << "A missing speed column should give zeros and an unknown direction\n";
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Partial mapping threw: " << ex.what() << "\n";
        return 1;
    }

    try {
        (void)parseCsvTable("a,b\n1,2,3\n", "wide");
        std::cerr << "Rows wider than the header must be rejected\n";
        return 1;
    } catch (const std::runtime_error&) {
    }

    if (parseNumericCell(" 12.5 ") != 12.5 || parseNumericCell("12.5x") || parseNumericCell("inf") ||
        parseNumericCell("")) {
        std::cerr << "parseNumericCell accepted or rejected the wrong cells\n";
        return 1;
    }

    std::cout << "Column mapper validated successfully\n";
    return 0;
}
