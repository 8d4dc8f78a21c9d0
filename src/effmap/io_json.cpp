#include "effmap/io_json.hpp"

#include <fstream>
#include <stdexcept>

namespace effmap {
namespace {

nlohmann::json ratiosToJson(const std::vector<AreaRatioEntry>& entries) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& entry : entries) {
        array.push_back({{"level", entry.level}, {"ratio", entry.ratio}});
    }
    return array;
}

nlohmann::json channelToJson(const ChannelResult& result) {
    nlohmann::json json;
    json["channel"] = channelLabel(result.channel);
    json["mapRequested"] = result.mapRequested;
    json["ratioRequested"] = result.ratioRequested;
    if (!result.error.empty()) {
        json["error"] = result.error;
        return json;
    }
    json["interpolation"] = {{"status", interpolationStatusName(result.interpolation.status)},
                             {"triangles", result.interpolation.triangles},
                             {"interpolatedPoints", result.interpolation.interpolatedPoints}};
    if (!result.interpolation.diagnostic.empty()) {
        json["interpolation"]["diagnostic"] = result.interpolation.diagnostic;
    }
    if (result.ratioRequested) {
        json["areaRatios"] = ratiosToJson(result.ratios);
    }
    if (result.grid) {
        const EffMapGrid& grid = *result.grid;
        json["grid"] = {{"speedColumns", grid.nx},
                        {"torqueRows", grid.ny},
                        {"speedStep", grid.speedStep},
                        {"torqueStep", grid.torqueStep},
                        {"fillPoints", grid.fillCount()},
                        {"geometryPoints", grid.geometryCount()}};
    }
    return json;
}

}  // namespace

nlohmann::json reportToJson(const SheetReport& report) {
    nlohmann::json json;
    json["sheet"] = report.sheet;
    json["baseName"] = report.baseName;
    json["direction"] = directionName(report.direction);
    json["state"] = stateName(report.state);
    json["meanBusVoltage"] = report.meanBusVoltage;
    json["rawRows"] = report.rawRows;
    json["normalizedRows"] = report.normalizedRows;

    nlohmann::json envelope = nlohmann::json::array();
    for (const auto& sample : report.envelope) {
        envelope.push_back({sample.speed, sample.torque});
    }
    json["envelope"] = {{"fit", fitKindName(report.envelopeFit)}, {"samples", envelope}};
    json["powerLevels"] = report.powerLevels;

    nlohmann::json channels = nlohmann::json::array();
    for (const auto& channel : report.channels) {
        channels.push_back(channelToJson(channel));
    }
    json["channels"] = channels;
    json["warnings"] = report.warnings;
    return json;
}

nlohmann::json summaryToJson(const std::vector<SheetReport>& reports,
                             const std::vector<SheetFailure>& failures) {
    nlohmann::json json;
    json["sheets"] = nlohmann::json::array();
    for (const auto& report : reports) {
        json["sheets"].push_back(reportToJson(report));
    }
    json["failures"] = nlohmann::json::array();
    for (const auto& failure : failures) {
        json["failures"].push_back(
            {{"sheet", failure.sheet}, {"kind", failure.kind}, {"message", failure.message}});
    }
    return json;
}

void write_json_summary(const std::string& path, const std::vector<SheetReport>& reports,
                        const std::vector<SheetFailure>& failures) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open JSON output: " + path);
    }
    ofs << summaryToJson(reports, failures).dump(2) << '\n';
}

}  // namespace effmap
