#include "effmap/effmap.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Cannot reopen " + path.string());
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

int main() {
    using namespace effmap;

    namespace fs = std::filesystem;
    const fs::path inputs = (fs::path(__FILE__).parent_path() / "../inputs/tests").lexically_normal();
    const fs::path outDir = fs::temp_directory_path() / "effmap_io_output_test";
    std::error_code ec;
    fs::remove_all(outDir, ec);
    fs::create_directories(outDir);

    ConfigMap config;
    try {
        config = loadConfigFile((inputs / "effmap_sheet.ini").string());
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load configuration: " << ex.what() << "\n";
        return 1;
    }

    SheetReport report;
    EffMapSession session(config);
    try {
        session.load(loadCsvTable((inputs / "effmap_sheet.csv").string()));
        report = session.run();
    } catch (const std::exception& ex) {
        std::cerr << "Session run failed: " << ex.what() << "\n";
        return 1;
    }

    const ChannelResult* mcu = nullptr;
    for (const auto& channel : report.channels) {
        if (channel.channel == EfficiencyChannel::Mcu) {
            mcu = &channel;
        }
    }
    if (mcu == nullptr || !mcu->grid) {
        std::cerr << "MCU grid missing from the report\n";
        return 1;
    }

    try {
        const fs::path gridPath = outDir / "grid.csv";
        write_csv_grid(gridPath.string(), *mcu->grid, EfficiencyChannel::Mcu);
        const std::vector<std::string> lines = readLines(gridPath);
        if (lines.empty() || lines.front() != "speed,torque,Eff_MCU,power,geometry") {
            std::cerr << "Grid CSV header wrong\n";
            return 1;
        }
        if (lines.size() != mcu->grid->fillCount() + 1) {
            std::cerr << "Grid CSV should have one line per fill point\n";
            return 1;
        }
        // Column 0 has one cell at torque 0, outside the measurements.
        if (lines[1] != "0,0,,,1") {
            std::cerr << "First grid row should be an empty masked cell, got '" << lines[1] << "'\n";
            return 1;
        }

        const fs::path ratioPath = outDir / "ratios.csv";
        if (!write_csv_area_ratios(ratioPath.string(), report)) {
            std::cerr << "Area ratio table was not written\n";
            return 1;
        }
        const std::vector<std::string> ratioLines = readLines(ratioPath);
        if (ratioLines.size() != 3 || ratioLines[0] != "level,MCU,Motor,SYS" ||
            ratioLines[1] != "90,0,,0" || ratioLines[2].rfind("80,", 0) != 0) {
            std::cerr << "Area ratio table content wrong\n";
            return 1;
        }

        SheetReport noRatios = report;
        for (auto& channel : noRatios.channels) {
            channel.ratios.clear();
        }
        if (write_csv_area_ratios((outDir / "none.csv").string(), noRatios) ||
            fs::exists(outDir / "none.csv")) {
            std::cerr << "A report without ratios should not produce a table\n";
            return 1;
        }

        const fs::path envelopePath = outDir / "envelope.csv";
        write_csv_envelope(envelopePath.string(), session.envelope());
        const std::vector<std::string> envelopeLines = readLines(envelopePath);
        if (envelopeLines.size() != 3 || envelopeLines[0] != "speed,torque_max,torque_fit" ||
            envelopeLines[1] != "902,60,60") {
            std::cerr << "Envelope CSV content wrong\n";
            return 1;
        }

        const std::vector<double> xs = {1.0, 2.0};
        const std::vector<double> ys = {3.0};
        try {
            write_csv_field_map((outDir / "bad.csv").string(), xs, ys, {});
            std::cerr << "Mismatched columns should be rejected\n";
            return 1;
        } catch (const std::invalid_argument&) {
        }
    } catch (const std::exception& ex) {
        std::cerr << "CSV export failed: " << ex.what() << "\n";
        return 1;
    }

    try {
        const fs::path summaryPath = outDir / "summary.json";
        const std::vector<SheetFailure> failures = {{"broken", "structural", "No configured column matched"}};
        write_json_summary(summaryPath.string(), {report}, failures);

        std::ifstream input(summaryPath);
        const nlohmann::json summary = nlohmann::json::parse(input);
        const nlohmann::json& sheet = summary.at("sheets").at(0);
        if (sheet.at("baseName") != "VC1350VForwardDrive" || sheet.at("direction") != "forward" ||
            sheet.at("state") != "motoring" || sheet.at("envelope").at("fit") != "linear_too_few_points") {
            std::cerr << "Summary sheet metadata wrong\n";
            return 1;
        }
        const nlohmann::json& channel = sheet.at("channels").at(0);
        if (channel.at("channel") != "MCU" || channel.at("grid").at("torqueRows") != 12 ||
            channel.at("areaRatios").size() != 2 ||
            channel.at("interpolation").at("status") != "interpolated") {
            std::cerr << "Summary channel entry wrong\n";
            return 1;
        }
        if (summary.at("failures").size() != 1 ||
            summary.at("failures").at(0).at("kind") != "structural") {
            std::cerr << "Summary failures wrong\n";
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "JSON summary failed: " << ex.what() << "\n";
        return 1;
    }

    fs::remove_all(outDir, ec);
    std::cout << "CSV and JSON outputs validated successfully\n";
    return 0;
}
