#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "effmap/area_ratio.hpp"
#include "effmap/config.hpp"
#include "effmap/envelope.hpp"
#include "effmap/grid.hpp"
#include "effmap/ingest.hpp"
#include "effmap/interpolate.hpp"
#include "effmap/normalize.hpp"

namespace effmap {

struct ChannelMap {
    EfficiencyChannel channel{EfficiencyChannel::Mcu};
    EffMapGrid grid;
    InterpolationReport interpolation;
};

struct ChannelResult {
    EfficiencyChannel channel{EfficiencyChannel::Mcu};
    bool mapRequested{false};
    bool ratioRequested{false};
    std::optional<EffMapGrid> grid;
    InterpolationReport interpolation;
    std::vector<AreaRatioEntry> ratios;
    std::string error;
};

struct SheetReport {
    std::string sheet;
    std::string baseName;
    SpeedDirection direction{SpeedDirection::Unknown};
    MotionState state{MotionState::Unknown};
    double meanBusVoltage{0.0};
    std::size_t rawRows{0};
    std::size_t normalizedRows{0};
    EnvelopeFitKind envelopeFit{EnvelopeFitKind::Empty};
    std::vector<EnvelopeSample> envelope;
    std::vector<double> powerLevels;
    std::vector<ChannelResult> channels;
    std::vector<std::string> warnings;
};

/**
 * @brief Processing context for one sheet.
 *
 * load() replaces the dataset wholesale (map columns, normalise, extract the
 * envelope); the map and ratio operations then read it without mutation. A
 * session is not meant to be shared between threads; run one per sheet.
 */
class EffMapSession {
public:
    explicit EffMapSession(ConfigMap config);

    /// @throws StructuralError when no configured column matches the table.
    void load(const DataTable& table);

    [[nodiscard]] bool loaded() const { return loaded_; }

    [[nodiscard]] const std::string& sheetName() const { return sheet_; }
    [[nodiscard]] const ConfigMap& config() const { return config_; }
    [[nodiscard]] const MappedDataset& mapped() const;
    [[nodiscard]] const Dataset& dataset() const;
    [[nodiscard]] const EnvelopeCurve& envelope() const;

    /**
     * @brief Synthesize and interpolate the grid of one efficiency channel.
     * @throws ConfigError for malformed grid steps or cutoffs.
     * An empty dataset gives an empty grid.
     * @throws StructuralError when the maximum speed of the dataset is 0.
     */
    [[nodiscard]] ChannelMap buildMap(EfficiencyChannel channel) const;

    /// Area ratios of @p map for the configured `EffMAPStep` levels. @throws ConfigError.
    [[nodiscard]] std::vector<AreaRatioEntry> areaRatios(const ChannelMap& map) const;

    /// Mean of the mapped DC-bus voltage over all loaded rows; 0 for an empty sheet.
    [[nodiscard]] double meanBusVoltage() const;

    /// `<VehicleCode><round(mean Udc)>V<Direction><State>`, used to name report files.
    [[nodiscard]] std::string reportBaseName() const;

    /**
     * @brief Run every channel switched on in the configuration.
     *
     * Configuration errors are recorded on the affected channel; structural
     * errors propagate. A sheet with no rows left after normalisation still
     * yields a report: every requested channel is listed without a grid or
     * ratios and the report carries a warning.
     */
    [[nodiscard]] SheetReport run() const;

private:
    void requireLoaded() const;

    ConfigMap config_;
    std::string sheet_;
    MappedDataset mapped_;
    Dataset dataset_;
    EnvelopeCurve envelope_;
    bool loaded_{false};
};

}  // namespace effmap
