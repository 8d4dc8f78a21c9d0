#include "effmap/normalize.hpp"

#include <algorithm>
#include <cmath>

namespace effmap {
namespace {

// NaN sorts last so the ordering stays a strict weak ordering.
bool lessNanLast(double a, double b) {
    if (std::isnan(a)) {
        return false;
    }
    if (std::isnan(b)) {
        return true;
    }
    return a < b;
}

bool hasNan(const MeasurementRow& row) {
    return std::isnan(row.speed) || std::isnan(row.torque) || std::isnan(row.power) ||
           std::isnan(row.effMcu) || std::isnan(row.effMotor) || std::isnan(row.effSys) ||
           std::isnan(row.udc);
}

void closeGroup(std::vector<double>& grouped, std::size_t last, std::size_t count, double sum) {
    const double mean = std::nearbyint(sum / static_cast<double>(count + 1));
    std::fill(grouped.begin() + static_cast<std::ptrdiff_t>(last - count),
              grouped.begin() + static_cast<std::ptrdiff_t>(last + 1), mean);
}

}  // namespace

std::vector<double> groupSpeeds(const std::vector<double>& sortedSpeeds) {
    std::vector<double> grouped = sortedSpeeds;
    if (sortedSpeeds.empty()) {
        return grouped;
    }

    double sum = sortedSpeeds.front();
    std::size_t count = 0;
    for (std::size_t i = 0; i + 1 < sortedSpeeds.size(); ++i) {
        if (std::abs(sortedSpeeds[i] - sortedSpeeds[i + 1]) <= kSpeedGroupTolerance) {
            sum += sortedSpeeds[i + 1];
            ++count;
        } else {
            closeGroup(grouped, i, count, sum);
            count = 0;
            sum = sortedSpeeds[i + 1];
        }
    }
    closeGroup(grouped, sortedSpeeds.size() - 1, count, sum);
    return grouped;
}

Dataset normalizeDataset(const MappedDataset& mapped) {
    Dataset rows(mapped.size());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        MeasurementRow& row = rows[i];
        row.speed = mapped.speed[i];
        row.torque = mapped.torque[i];
        row.power = mapped.power[i];
        row.effMcu = mapped.effMcu[i];
        row.effMotor = mapped.effMotor[i];
        row.effSys = mapped.effSys[i];
        row.udc = mapped.udc[i];
    }

    std::stable_sort(rows.begin(), rows.end(), [](const MeasurementRow& a, const MeasurementRow& b) {
        return lessNanLast(a.speed, b.speed);
    });

    std::vector<double> speeds(rows.size());
    std::transform(rows.begin(), rows.end(), speeds.begin(),
                   [](const MeasurementRow& row) { return row.speed; });
    const std::vector<double> grouped = groupSpeeds(speeds);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        rows[i].speed = grouped[i];
    }

    std::stable_sort(rows.begin(), rows.end(), [](const MeasurementRow& a, const MeasurementRow& b) {
        if (lessNanLast(a.speed, b.speed)) {
            return true;
        }
        if (lessNanLast(b.speed, a.speed)) {
            return false;
        }
        return lessNanLast(a.torque, b.torque);
    });

    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [](const MeasurementRow& row) {
                                  return hasNan(row) || !isValidEfficiency(row.effMcu) ||
                                         !isValidEfficiency(row.effMotor) ||
                                         !isValidEfficiency(row.effSys);
                              }),
               rows.end());
    return rows;
}

}  // namespace effmap
