#include "effmap/config.hpp"
#include "effmap/grid.hpp"
#include "effmap/interpolate.hpp"
#include "effmap/normalize.hpp"
#include "effmap/types.hpp"

#include <cmath>
#include <iostream>
#include <vector>

namespace {

double planeEff(double speed, double torque) { return 50.0 + 0.1 * speed + 0.2 * torque; }

effmap::Dataset squareCloud() {
    effmap::Dataset data;
    const double corners[][2] = {{0.0, 0.0}, {100.0, 0.0}, {0.0, 100.0}, {100.0, 100.0}, {50.0, 50.0}};
    for (const auto& c : corners) {
        effmap::MeasurementRow row{};
        row.speed = c[0];
        row.torque = c[1];
        row.power = 2.0 * c[0];
        row.effMcu = planeEff(c[0], c[1]);
        row.effMotor = 10.0;
        row.effSys = 20.0;
        data.push_back(row);
    }
    return data;
}

// Three columns at speeds 0, 100, 200, each filled with torques 0, 50, 100.
effmap::EffMapGrid threeColumnGrid() {
    effmap::EffMapGrid grid(3, 4, 100.0, 50.0);
    for (std::size_t i = 0; i < grid.nx; ++i) {
        grid.speedAxis[i] = 100.0 * static_cast<double>(i);
        grid.columnMaxTorque[i] = 100.0;
        grid.fillHeight[i] = 3;
        for (std::size_t j = 0; j < 3; ++j) {
            grid.Y[grid.idx(i, j)] = 50.0 * static_cast<double>(j);
        }
    }
    return grid;
}

}  // namespace

int main() {
    using namespace effmap;

    const Dataset data = squareCloud();
    EffMapGrid grid = threeColumnGrid();
    const InterpolationReport report = interpolateGrid(grid, data, EfficiencyChannel::Mcu, CutoffSettings{});
    if (report.status != InterpolationStatus::Interpolated || report.triangles < 2) {
        std::cerr << "Square cloud should triangulate, status "
                  << interpolationStatusName(report.status) << " (" << report.diagnostic << ")\n";
        return 1;
    }

    for (std::size_t i = 0; i < 2; ++i) {
        for (std::size_t j = 0; j < 3; ++j) {
            const double expected = planeEff(grid.speedAxis[i], grid.y(i, j));
            if (std::abs(grid.eff(i, j) - expected) > 1e-9) {
                std::cerr << "Eff at (" << i << ", " << j << ") = " << grid.eff(i, j) << ", expected "
                          << expected << "\n";
                return 1;
            }
            if (std::abs(grid.power(i, j) - 2.0 * grid.speedAxis[i]) > 1e-9) {
                std::cerr << "Power at (" << i << ", " << j << ") not interpolated linearly\n";
                return 1;
            }
        }
    }
    for (std::size_t j = 0; j < 3; ++j) {
        if (!isEmpty(grid.eff(2, j)) || !isEmpty(grid.power(2, j)) || !grid.inGeometry(2, j)) {
            std::cerr << "Outside the hull Eff must be empty while the mask stays true\n";
            return 1;
        }
    }
    if (grid.inGeometry(0, 3) || report.interpolatedPoints != 6 || grid.geometryCount() != 9) {
        std::cerr << "Mask or interpolated point count wrong (" << report.interpolatedPoints << ", "
                  << grid.geometryCount() << ")\n";
        return 1;
    }

    const InterpolationReport motor = interpolateGrid(grid, data, EfficiencyChannel::Motor, CutoffSettings{});
    if (motor.status != InterpolationStatus::Interpolated || std::abs(grid.eff(1, 1) - 10.0) > 1e-9) {
        std::cerr << "Re-interpolating another channel should replace the Eff layer\n";
        return 1;
    }

    CutoffSettings cutoff{};
    cutoff.startSpeed = 50.0;
    cutoff.startTorque = 40.0;
    const InterpolationReport cut = interpolateGrid(grid, data, EfficiencyChannel::Mcu, cutoff);
    for (std::size_t j = 0; j < 3; ++j) {
        if (grid.inGeometry(0, j) || !isEmpty(grid.eff(0, j))) {
            std::cerr << "Speed cutoff did not clear column 0\n";
            return 1;
        }
    }
    if (grid.inGeometry(1, 0) || !isEmpty(grid.eff(1, 0)) || !grid.inGeometry(1, 1) ||
        isEmpty(grid.eff(1, 1))) {
        std::cerr << "Torque cutoff applied to the wrong rows\n";
        return 1;
    }
    if (cut.interpolatedPoints != 2 || grid.geometryCount() != 4) {
        std::cerr << "Cutoff counts wrong (" << cut.interpolatedPoints << ", " << grid.geometryCount()
                  << ")\n";
        return 1;
    }

    // Collinear measurements cannot be triangulated; the grid stays empty.
    Dataset line;
    for (int k = 0; k < 4; ++k) {
        MeasurementRow row{};
        row.speed = 50.0 * k;
        row.torque = 25.0 * k;
        row.effMcu = 90.0;
        line.push_back(row);
    }
    EffMapGrid lineGrid = threeColumnGrid();
    const InterpolationReport degenerate = interpolateGrid(lineGrid, line, EfficiencyChannel::Mcu, CutoffSettings{});
    if (degenerate.status != InterpolationStatus::DegenerateCloud || degenerate.diagnostic.empty() ||
        degenerate.interpolatedPoints != 0 || lineGrid.geometryCount() != 9) {
        std::cerr << "Collinear cloud should be reported as degenerate with the mask intact\n";
        return 1;
    }

    const DelaunayInterpolant pair({0.0, 10.0, 10.0}, {0.0, 5.0, 5.0});
    if (pair.valid() || pair.diagnostic().find("fewer than 3") == std::string::npos) {
        std::cerr << "Two distinct points should be rejected\n";
        return 1;
    }

    const DelaunayInterpolant triangle({0.0, 10.0, 0.0}, {0.0, 0.0, 10.0});
    if (!triangle.valid() || triangle.locate(8.0, 8.0) || !triangle.locate(5.0, 5.0)) {
        std::cerr << "Triangle point location is wrong\n";
        return 1;
    }
    const auto corner = triangle.locate(10.0, 0.0);
    if (!corner || std::abs(triangle.interpolate(*corner, {1.0, 7.0, 3.0}) - 7.0) > 1e-9) {
        std::cerr << "Interpolation at a vertex should return the vertex value\n";
        return 1;
    }

    // Bench-sized cloud: a jittered 60x40 lattice with a linear field.
    std::vector<double> denseX;
    std::vector<double> denseY;
    std::vector<double> denseValues;
    for (int i = 0; i < 60; ++i) {
        for (int j = 0; j < 40; ++j) {
            const double x = 100.0 * i + 20.0 * std::sin(1.7 * i + 0.3 * j);
            const double y = 5.0 * j + 1.0 * std::cos(0.9 * j + 1.1 * i);
            denseX.push_back(x);
            denseY.push_back(y);
            denseValues.push_back(planeEff(x, y));
        }
    }
    const DelaunayInterpolant dense(denseX, denseY);
    if (!dense.valid() || dense.triangleCount() < 4000) {
        std::cerr << "Dense cloud should triangulate into many triangles, got " << dense.triangleCount() << "\n";
        return 1;
    }
    for (double x = 150.0; x <= 5700.0; x += 37.0) {
        for (double y = 10.0; y <= 185.0; y += 3.5) {
            const auto location = dense.locate(x, y);
            if (!location) {
                std::cerr << "Point (" << x << ", " << y << ") inside the dense cloud was not located\n";
                return 1;
            }
            if (std::abs(dense.interpolate(*location, denseValues) - planeEff(x, y)) > 1e-7) {
                std::cerr << "Dense cloud interpolation wrong at (" << x << ", " << y << ")\n";
                return 1;
            }
        }
    }
    if (dense.locate(-500.0, 50.0) || dense.locate(3000.0, 400.0) || dense.locate(7000.0, -50.0)) {
        std::cerr << "Points outside the dense cloud must not be located\n";
        return 1;
    }

    std::cout << "Interpolator validated successfully\n";
    return 0;
}
