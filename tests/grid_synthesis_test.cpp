// filename: grid_synthesis_test.cpp
// part of Motor Efficiency Map Toolkit
// MIT License

#include "effmap/envelope.hpp"
#include "effmap/grid.hpp"
#include "effmap/normalize.hpp"
#include "effmap/types.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

effmap::Dataset makeDataset(const std::vector<std::pair<double, double>>& points) {
    effmap::Dataset data;
    for (const auto& [speed, torque] : points) {
        effmap::MeasurementRow row{};
        row.speed = speed;
        row.torque = torque;
        row.effMcu = 90.0;
        data.push_back(row);
    }
    return data;
}

}  // namespace

int main() {
    using namespace effmap;

    const std::vector<double> axis = buildSpeedAxis(1500.0, 50.0);
    if (axis.size() != 31 || axis.front() != 0.0 || axis[1] != 50.0 || axis.back() != 1500.0) {
        std::cerr << "Speed axis for 1500/50 is wrong\n";
        return 1;
    }
    const std::vector<double> uneven = buildSpeedAxis(1490.0, 50.0);
    if (uneven.size() != 30 || uneven.back() != 1490.0) {
        std::cerr << "Speed axis must end exactly on the maximum speed\n";
        return 1;
    }
    const std::vector<double> single = buildSpeedAxis(40.0, 50.0);
    if (single.size() != 1 || single.front() != 0.0) {
        std::cerr << "A one-point speed axis should be {0}\n";
        return 1;
    }

    struct FillCase {
        double max;
        std::vector<double> expected;
    };
    const std::vector<FillCase> fills = {
        {50.0, {0.0, 10.0, 20.0, 30.0, 40.0, 50.0}},
        {55.0, {0.0, 10.0, 20.0, 30.0, 40.0, 50.0, 55.0}},
        {5.0, {0.0, 5.0}},
        {0.0, {0.0}},
        {-3.0, {0.0}},
    };
    for (const auto& c : fills) {
        const std::vector<double> fill = buildTorqueFill(c.max, 10.0);
        if (fill != c.expected) {
            std::cerr << "Torque fill for maximum " << c.max << " has " << fill.size()
                      << " entries, expected " << c.expected.size() << "\n";
            return 1;
        }
    }
    const std::vector<double> nearStep = buildTorqueFill(49.99999999, 10.0);
    if (nearStep.back() != 49.99999999 || nearStep.size() != 6) {
        std::cerr << "A maximum just below a step multiple must be appended\n";
        return 1;
    }

    if (gridRowCount(100.0, 10.0) != 12 || gridRowCount(95.0, 10.0) != 12 ||
        gridRowCount(0.0, 10.0) != 2 || gridRowCount(-50.0, 10.0) != 1) {
        std::cerr << "gridRowCount is wrong\n";
        return 1;
    }

    const Dataset data = makeDataset({{500.0, 0.0}, {500.0, 40.0}, {1000.0, 0.0}, {1000.0, 80.0}});
    const EnvelopeCurve envelope = extractEnvelope(data);
    EffMapGrid grid;
    try {
        grid = synthesizeGrid(data, envelope, 250.0, 10.0);
    } catch (const std::exception& ex) {
        std::cerr << "synthesizeGrid threw: " << ex.what() << "\n";
        return 1;
    }

    const std::vector<std::size_t> expectedHeights = {1, 3, 5, 7, 9};
    if (grid.nx != 5 || grid.ny != 10 || grid.fillHeight != expectedHeights) {
        std::cerr << "Grid shape is " << grid.nx << "x" << grid.ny << ", fill heights wrong\n";
        return 1;
    }
    try {
        for (std::size_t i = 0; i < grid.nx; ++i) {
            const double columnMax = grid.columnMaxTorque[i];
            for (std::size_t j = 0; j < grid.ny; ++j) {
                const double y = grid.y(i, j);
                if (j < grid.fillHeight[i]) {
                    if (isEmpty(y) || y > columnMax + 1e-9) {
                        std::cerr << "Fill value above the envelope at column " << i << "\n";
                        return 1;
                    }
                } else if (!isEmpty(y) || !isEmpty(grid.eff(i, j)) || !isEmpty(grid.power(i, j)) ||
                           grid.inGeometry(i, j)) {
                    std::cerr << "Padding cell (" << i << ", " << j << ") is not empty\n";
                    return 1;
                }
            }
            if (columnMax > 0.0 && grid.y(i, grid.fillHeight[i] - 1) != columnMax) {
                std::cerr << "Column " << i << " does not end on its envelope value\n";
                return 1;
            }
        }
        if (grid.x(4, 0) != 1000.0 || grid.y(4, 8) != 80.0 || grid.y(1, 2) != 20.0) {
            std::cerr << "Grid coordinates are wrong\n";
            return 1;
        }
    } catch (const std::out_of_range& ex) {
        std::cerr << "Grid accessor out of range: " << ex.what() << "\n";
        return 1;
    }
    if (grid.fillCount() != 25) {
        std::cerr << "Expected 25 fill points, got " << grid.fillCount() << "\n";
        return 1;
    }

    try {
        (void)grid.y(grid.nx, 0);
        std::cerr << "Out-of-range access should throw\n";
        return 1;
    } catch (const std::out_of_range&) {
    }

    try {
        const EffMapGrid none = synthesizeGrid(Dataset{}, EnvelopeCurve{}, 50.0, 5.0);
        if (none.nx != 0 || none.ny != 0 || none.fillCount() != 0 || !none.speedAxis.empty()) {
            std::cerr << "An empty dataset should give an empty grid\n";
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "An empty dataset must not throw: " << ex.what() << "\n";
        return 1;
    }
    const Dataset standstill = makeDataset({{0.0, 10.0}, {0.0, 20.0}});
    try {
        (void)synthesizeGrid(standstill, extractEnvelope(standstill), 50.0, 5.0);
        std::cerr << "A maximum speed of 0 must raise StructuralError\n";
        return 1;
    } catch (const StructuralError&) {
    }
    try {
        (void)synthesizeGrid(data, envelope, 0.0, 5.0);
        std::cerr << "A zero speed step must raise ConfigError\n";
        return 1;
    } catch (const ConfigError&) {
    }

    std::cout << "Grid synthesis validated successfully\n";
    return 0;
}
