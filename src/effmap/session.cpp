#include "effmap/session.hpp"

#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace effmap {
namespace {

constexpr EfficiencyChannel kChannels[] = {EfficiencyChannel::Mcu, EfficiencyChannel::Motor,
                                           EfficiencyChannel::System};

const char* directionTag(SpeedDirection direction) {
    switch (direction) {
        case SpeedDirection::Forward:
            return "Forward";
        case SpeedDirection::Reverse:
            return "Reverse";
        case SpeedDirection::Unknown:
            break;
    }
    return "Unknown";
}

const char* stateTag(MotionState state) {
    switch (state) {
        case MotionState::Motoring:
            return "Drive";
        case MotionState::Generating:
            return "Generate";
        case MotionState::Unknown:
            break;
    }
    return "Unknown";
}

}  // namespace

EffMapSession::EffMapSession(ConfigMap config) : config_(std::move(config)) {}

void EffMapSession::load(const DataTable& table) {
    loaded_ = false;
    MappedDataset mapped = mapColumns(table, config_);
    Dataset dataset = normalizeDataset(mapped);
    EnvelopeCurve envelope = extractEnvelope(dataset);

    sheet_ = table.name;
    mapped_ = std::move(mapped);
    dataset_ = std::move(dataset);
    envelope_ = std::move(envelope);
    loaded_ = true;
}

void EffMapSession::requireLoaded() const {
    if (!loaded_) {
        throw std::logic_error("EffMapSession: no sheet loaded");
    }
}

const MappedDataset& EffMapSession::mapped() const {
    requireLoaded();
    return mapped_;
}

const Dataset& EffMapSession::dataset() const {
    requireLoaded();
    return dataset_;
}

const EnvelopeCurve& EffMapSession::envelope() const {
    requireLoaded();
    return envelope_;
}

ChannelMap EffMapSession::buildMap(EfficiencyChannel channel) const {
    requireLoaded();
    const GridSteps steps = resolveGridSteps(config_);
    const CutoffSettings cutoff = resolveCutoff(config_);

    ChannelMap map{};
    map.channel = channel;
    map.grid = synthesizeGrid(dataset_, envelope_, steps.speed, steps.torque);
    map.interpolation = interpolateGrid(map.grid, dataset_, channel, cutoff);
    return map;
}

std::vector<AreaRatioEntry> EffMapSession::areaRatios(const ChannelMap& map) const {
    return computeAreaRatios(map.grid, resolveEfficiencyLevels(config_));
}

double EffMapSession::meanBusVoltage() const {
    requireLoaded();
    if (mapped_.udc.empty()) {
        return 0.0;
    }
    const double sum = std::accumulate(mapped_.udc.begin(), mapped_.udc.end(), 0.0);
    return sum / static_cast<double>(mapped_.udc.size());
}

std::string EffMapSession::reportBaseName() const {
    const auto volts = static_cast<long long>(std::nearbyint(meanBusVoltage()));
    return trim(configString(config_, "VehicleCode")) + std::to_string(volts) + "V" +
           directionTag(mapped_.direction) + stateTag(mapped_.state);
}

SheetReport EffMapSession::run() const {
    requireLoaded();

    SheetReport report{};
    report.sheet = sheet_;
    report.baseName = reportBaseName();
    report.direction = mapped_.direction;
    report.state = mapped_.state;
    report.meanBusVoltage = meanBusVoltage();
    report.rawRows = mapped_.size();
    report.normalizedRows = dataset_.size();
    report.envelopeFit = envelope_.kind();
    report.envelope = envelope_.samples();
    report.warnings = mapped_.warnings;

    if (envelope_.kind() == EnvelopeFitKind::LinearFitFailed) {
        report.warnings.push_back("Smoothing spline fit failed; envelope uses linear interpolation");
    } else if (!envelope_.residualTargetMet()) {
        report.warnings.push_back("Smoothing spline stopped before reaching its residual target");
    }
    if (dataset_.empty()) {
        report.warnings.push_back("No rows left after normalisation");
    }

    try {
        report.powerLevels = resolvePowerLevels(config_);
    } catch (const ConfigError& ex) {
        report.warnings.push_back(std::string("PowerMAPStep ignored: ") + ex.what());
    }

    for (EfficiencyChannel channel : kChannels) {
        ChannelResult result{};
        result.channel = channel;
        result.mapRequested = mapExportEnabled(config_, channel);
        result.ratioRequested = areaRatioEnabled(config_, channel);
        if (!result.mapRequested && !result.ratioRequested) {
            continue;
        }

        if (dataset_.empty()) {
            // Nothing to grid; the channel is reported without a map or ratios.
            result.interpolation.status = InterpolationStatus::DegenerateCloud;
            result.interpolation.diagnostic = "no measurements after normalisation";
            report.channels.push_back(std::move(result));
            continue;
        }

        try {
            ChannelMap map = buildMap(channel);
            result.interpolation = map.interpolation;
            if (map.interpolation.status == InterpolationStatus::DegenerateCloud) {
                report.warnings.push_back(std::string(channelLabel(channel)) +
                                          ": measurement cloud cannot be triangulated (" +
                                          map.interpolation.diagnostic + ")");
            }
            if (result.ratioRequested) {
                result.ratios = areaRatios(map);
            }
            if (result.mapRequested) {
                result.grid = std::move(map.grid);
            }
        } catch (const ConfigError& ex) {
            result.error = ex.what();
        }
        report.channels.push_back(std::move(result));
    }
    return report;
}

}  // namespace effmap
