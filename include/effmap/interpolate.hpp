#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "effmap/config.hpp"
#include "effmap/grid.hpp"
#include "effmap/normalize.hpp"

namespace effmap {

enum class InterpolationStatus { Interpolated, DegenerateCloud };

const char* interpolationStatusName(InterpolationStatus status);

/**
 * @brief Piecewise-linear interpolant over the Delaunay triangulation of a 2D point cloud.
 *
 * Clouds with fewer than three distinct points, collinear clouds and clouds
 * Qhull rejects leave the interpolant invalid; diagnostic() says why.
 */
class DelaunayInterpolant {
public:
    struct Location {
        std::size_t triangle{0};
        std::array<double, 3> weights{};
    };

    DelaunayInterpolant(std::vector<double> xs, std::vector<double> ys);

    [[nodiscard]] bool valid() const { return !triangles_.empty(); }

    [[nodiscard]] const std::string& diagnostic() const { return diagnostic_; }

    [[nodiscard]] std::size_t triangleCount() const { return triangles_.size(); }

    /// Triangle containing (x, y) with its barycentric weights; nullopt outside the hull.
    [[nodiscard]] std::optional<Location> locate(double x, double y) const;

    /// @p values holds one value per input point.
    [[nodiscard]] double interpolate(const Location& location, const std::vector<double>& values) const;

private:
    struct Triangle {
        std::array<std::size_t, 3> vertices{};
        Eigen::Matrix2d inverse;
        double minX{0.0};
        double maxX{0.0};
        double minY{0.0};
        double maxY{0.0};
        double padX{0.0};
        double padY{0.0};
    };

    void triangulate();
    void buildIndex();
    [[nodiscard]] bool isDegenerateCloud();
    [[nodiscard]] std::size_t cellIndex(double x, double y) const;

    std::vector<double> xs_;
    std::vector<double> ys_;
    std::vector<Triangle> triangles_;
    std::string diagnostic_;

    // Uniform bucket grid over the padded triangle boxes; each cell lists the
    // triangles whose box overlaps it, in ascending order.
    double indexMinX_{0.0};
    double indexMaxX_{0.0};
    double indexMinY_{0.0};
    double indexMaxY_{0.0};
    std::size_t cellsX_{0};
    std::size_t cellsY_{0};
    std::vector<std::vector<std::size_t>> cells_;
};

struct InterpolationReport {
    InterpolationStatus status{InterpolationStatus::DegenerateCloud};
    std::size_t triangles{0};
    std::size_t interpolatedPoints{0};
    std::string diagnostic;
};

/// Force Eff/Power to kEmpty and drop the mask where X < startSpeed or Y < startTorque.
void applyCutoff(EffMapGrid& grid, const CutoffSettings& cutoff);

/**
 * @brief Fill the Eff (for @p channel) and Power layers of @p grid from @p data.
 *
 * Only valid fill points are evaluated; points outside the hull stay kEmpty.
 * The geometry mask is the valid fill minus the cutoff region and does not
 * depend on whether interpolation produced a value.
 */
InterpolationReport interpolateGrid(EffMapGrid& grid, const Dataset& data, EfficiencyChannel channel,
                                    const CutoffSettings& cutoff);

}  // namespace effmap
