// filename: grid.hpp
// part of Motor Efficiency Map Toolkit
// MIT License

#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

#include "effmap/envelope.hpp"
#include "effmap/normalize.hpp"
#include "effmap/types.hpp"

namespace effmap {

/**
 * @brief Speed x torque resampling grid with envelope-bounded columns.
 *
 * Column i holds speed speedAxis[i]; rows j < fillHeight[i] hold the torque
 * fill of that column, rows beyond it are kEmpty in every layer. Layers are
 * dense and share the index idx(i, j) = j * nx + i.
 */
struct EffMapGrid {
    std::size_t nx{0};
    std::size_t ny{0};
    double speedStep{1.0};
    double torqueStep{1.0};
    std::vector<double> speedAxis;
    std::vector<double> columnMaxTorque;
    std::vector<std::size_t> fillHeight;
    std::vector<double> Y;
    std::vector<double> Eff;
    std::vector<double> Power;
    std::vector<unsigned char> geometry;

    EffMapGrid() = default;

    EffMapGrid(std::size_t nxIn, std::size_t nyIn, double speedStepIn, double torqueStepIn)
        : nx(nxIn), ny(nyIn), speedStep(speedStepIn), torqueStep(torqueStepIn),
          speedAxis(nxIn, 0.0), columnMaxTorque(nxIn, 0.0), fillHeight(nxIn, 0),
          Y(nxIn * nyIn, kEmpty), Eff(nxIn * nyIn, kEmpty), Power(nxIn * nyIn, kEmpty),
          geometry(nxIn * nyIn, 0) {}

    [[nodiscard]] inline std::size_t idx(std::size_t i, std::size_t j) const {
        return j * nx + i;
    }

    [[nodiscard]] inline bool inBounds(std::size_t i, std::size_t j) const {
        return i < nx && j < ny;
    }

    [[nodiscard]] inline double x(std::size_t i, std::size_t j) const {
        if (!inBounds(i, j)) {
            throw std::out_of_range("EffMapGrid::x index out of range");
        }
        return speedAxis[i];
    }

    [[nodiscard]] inline double y(std::size_t i, std::size_t j) const {
        if (!inBounds(i, j)) {
            throw std::out_of_range("EffMapGrid::y index out of range");
        }
        return Y[idx(i, j)];
    }

    [[nodiscard]] inline double eff(std::size_t i, std::size_t j) const {
        if (!inBounds(i, j)) {
            throw std::out_of_range("EffMapGrid::eff index out of range");
        }
        return Eff[idx(i, j)];
    }

    [[nodiscard]] inline double power(std::size_t i, std::size_t j) const {
        if (!inBounds(i, j)) {
            throw std::out_of_range("EffMapGrid::power index out of range");
        }
        return Power[idx(i, j)];
    }

    [[nodiscard]] inline bool inGeometry(std::size_t i, std::size_t j) const {
        if (!inBounds(i, j)) {
            throw std::out_of_range("EffMapGrid::inGeometry index out of range");
        }
        return geometry[idx(i, j)] != 0;
    }

    /// Reset the value layers to kEmpty and clear the mask, keeping the torque fill.
    void clearValues() {
        Eff.assign(nx * ny, kEmpty);
        Power.assign(nx * ny, kEmpty);
        geometry.assign(nx * ny, 0);
    }

    [[nodiscard]] std::size_t fillCount() const;

    [[nodiscard]] std::size_t geometryCount() const;
};

/**
 * @brief Speed axis from 0 to @p maxSpeed with floor(maxSpeed / step) + 1 points.
 *
 * Points are evenly spaced by count; with two or more points the last one is
 * exactly @p maxSpeed, with one point the axis is {0}.
 */
std::vector<double> buildSpeedAxis(double maxSpeed, double step);

/**
 * @brief Torque fill 0, step, 2*step, ... up to @p columnMax, with
 * @p columnMax appended when the last multiple does not land on it.
 *
 * Non-positive maxima give {0}.
 */
std::vector<double> buildTorqueFill(double columnMax, double step);

/// ceil(maxEnvelopeTorque / step) + 2, never less than 1.
std::size_t gridRowCount(double maxEnvelopeTorque, double step);

/**
 * @brief Build the envelope-bounded grid for @p data.
 *
 * The value layers are left empty; see interpolateGrid().
 * An empty dataset gives an empty grid (nx = ny = 0).
 * @throws StructuralError when the maximum speed of a non-empty dataset is 0.
 * @throws ConfigError when a step is not positive.
 */
EffMapGrid synthesizeGrid(const Dataset& data, const EnvelopeCurve& envelope, double speedStep,
                          double torqueStep);

}  // namespace effmap
