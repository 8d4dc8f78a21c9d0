#include "effmap/grid.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace effmap {
namespace {

bool isClose(double a, double b) {
    constexpr double kRelTol = 1e-5;
    constexpr double kAbsTol = 1e-8;
    return std::abs(a - b) <= kAbsTol + kRelTol * std::abs(b);
}

}  // namespace

std::size_t EffMapGrid::fillCount() const {
    return std::accumulate(fillHeight.begin(), fillHeight.end(), std::size_t{0});
}

std::size_t EffMapGrid::geometryCount() const {
    return static_cast<std::size_t>(std::count(geometry.begin(), geometry.end(), 1));
}

std::vector<double> buildSpeedAxis(double maxSpeed, double step) {
    const std::size_t count = static_cast<std::size_t>(std::floor(maxSpeed / step)) + 1;
    std::vector<double> axis(count, 0.0);
    if (count < 2) {
        return axis;
    }
    const double delta = maxSpeed / static_cast<double>(count - 1);
    for (std::size_t i = 0; i < count; ++i) {
        axis[i] = static_cast<double>(i) * delta;
    }
    axis.back() = maxSpeed;
    return axis;
}

std::vector<double> buildTorqueFill(double columnMax, double step) {
    std::vector<double> fill;
    const double stop = columnMax + step / 1000.0;
    if (stop > 0.0) {
        const std::size_t count = static_cast<std::size_t>(std::ceil(stop / step));
        fill.reserve(count + 1);
        for (std::size_t i = 0; i < count; ++i) {
            const double value = static_cast<double>(i) * step;
            if (value <= columnMax) {
                fill.push_back(value);
            }
        }
    }

    if (fill.empty()) {
        if (columnMax > 0.0) {
            return {0.0, columnMax};
        }
        return {0.0};
    }
    if (!isClose(fill.back(), columnMax)) {
        fill.push_back(columnMax);
    }
    return fill;
}

std::size_t gridRowCount(double maxEnvelopeTorque, double step) {
    const double rows = std::ceil(maxEnvelopeTorque / step) + 2.0;
    if (!(rows >= 1.0)) {
        return 1;
    }
    return static_cast<std::size_t>(rows);
}

EffMapGrid synthesizeGrid(const Dataset& data, const EnvelopeCurve& envelope, double speedStep,
                          double torqueStep) {
    if (!(speedStep > 0.0) || !(torqueStep > 0.0)) {
        throw ConfigError("Grid steps must be positive");
    }
    if (data.empty()) {
        return EffMapGrid(0, 0, speedStep, torqueStep);
    }

    double maxSpeed = 0.0;
    for (const auto& row : data) {
        maxSpeed = std::max(maxSpeed, row.speed);
    }
    if (!(maxSpeed > 0.0)) {
        throw StructuralError("No valid speed range: maximum speed is 0");
    }

    const std::vector<double> axis = buildSpeedAxis(maxSpeed, speedStep);
    const std::vector<double> edge = envelope.evaluate(axis);
    const double maxEdge = *std::max_element(edge.begin(), edge.end());

    EffMapGrid grid(axis.size(), gridRowCount(maxEdge, torqueStep), speedStep, torqueStep);
    grid.speedAxis = axis;
    grid.columnMaxTorque = edge;

    for (std::size_t i = 0; i < grid.nx; ++i) {
        const std::vector<double> fill = buildTorqueFill(edge[i], torqueStep);
        const std::size_t height = std::min(fill.size(), grid.ny);
        for (std::size_t j = 0; j < height; ++j) {
            grid.Y[grid.idx(i, j)] = fill[j];
        }
        grid.fillHeight[i] = height;
    }
    return grid;
}

}  // namespace effmap
