#pragma once

#include <vector>

#include "effmap/ingest.hpp"
#include "effmap/types.hpp"

namespace effmap {

struct MeasurementRow {
    double speed{0.0};
    double torque{0.0};
    double power{0.0};
    double effMcu{0.0};
    double effMotor{0.0};
    double effSys{0.0};
    double udc{0.0};

    [[nodiscard]] double efficiency(EfficiencyChannel channel) const {
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
};

using Dataset = std::vector<MeasurementRow>;

/**
 * @brief Replace each run of sorted speeds whose neighbour gaps are at most
 * kSpeedGroupTolerance by the rounded mean of the run (half to even).
 *
 * @p sortedSpeeds must be ascending. The last run is always closed.
 */
std::vector<double> groupSpeeds(const std::vector<double>& sortedSpeeds);

/// Efficiency inside the half-open range [0, 100).
inline bool isValidEfficiency(double value) { return value >= 0.0 && value < 100.0; }

/**
 * @brief Sort, group speeds, re-sort by (speed, torque) and drop rows with NaN
 * or out-of-range efficiencies. An empty result is allowed.
 */
Dataset normalizeDataset(const MappedDataset& mapped);

}  // namespace effmap
