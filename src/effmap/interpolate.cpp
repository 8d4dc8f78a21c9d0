#include "effmap/interpolate.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <utility>

#include <libqhullcpp/Qhull.h>
#include <libqhullcpp/QhullError.h>
#include <libqhullcpp/QhullFacet.h>
#include <libqhullcpp/QhullFacetList.h>
#include <libqhullcpp/QhullPoint.h>
#include <libqhullcpp/QhullVertex.h>
#include <libqhullcpp/QhullVertexSet.h>

namespace effmap {
namespace {

constexpr double kBarycentricEps = 1e-10;
constexpr double kCollinearTol = 1e-12;

}  // namespace

const char* interpolationStatusName(InterpolationStatus status) {
    switch (status) {
        case InterpolationStatus::Interpolated:
            return "interpolated";
        case InterpolationStatus::DegenerateCloud:
            break;
    }
    return "degenerate_cloud";
}

DelaunayInterpolant::DelaunayInterpolant(std::vector<double> xs, std::vector<double> ys)
    : xs_(std::move(xs)), ys_(std::move(ys)) {
    if (xs_.size() != ys_.size()) {
        throw std::invalid_argument("DelaunayInterpolant: mismatched coordinate sizes");
    }
    if (isDegenerateCloud()) {
        return;
    }
    triangulate();
}

bool DelaunayInterpolant::isDegenerateCloud() {
    std::set<std::pair<double, double>> distinct;
    for (std::size_t k = 0; k < xs_.size(); ++k) {
        distinct.emplace(xs_[k], ys_[k]);
    }
    if (distinct.size() < 3) {
        diagnostic_ = "fewer than 3 distinct points (" + std::to_string(distinct.size()) + ")";
        return true;
    }

    const double x0 = xs_.front();
    const double y0 = ys_.front();
    std::size_t far = 0;
    double farDist = 0.0;
    for (std::size_t k = 0; k < xs_.size(); ++k) {
        const double d = std::hypot(xs_[k] - x0, ys_[k] - y0);
        if (d > farDist) {
            farDist = d;
            far = k;
        }
    }
    const double dx = xs_[far] - x0;
    const double dy = ys_[far] - y0;
    double maxCross = 0.0;
    for (std::size_t k = 0; k < xs_.size(); ++k) {
        maxCross = std::max(maxCross, std::abs(dx * (ys_[k] - y0) - dy * (xs_[k] - x0)));
    }
    if (maxCross <= kCollinearTol * farDist * farDist) {
        diagnostic_ = "points are collinear";
        return true;
    }
    return false;
}

void DelaunayInterpolant::triangulate() {
    const std::size_t count = xs_.size();
    std::vector<double> coordinates;
    coordinates.reserve(2 * count);
    for (std::size_t k = 0; k < count; ++k) {
        coordinates.push_back(xs_[k]);
        coordinates.push_back(ys_[k]);
    }

    std::vector<std::array<std::size_t, 3>> simplices;
    try {
        orgQhull::Qhull qhull;
        qhull.runQhull("", 2, static_cast<int>(count), coordinates.data(), "d Qbb Qc Qz Q12 Qt");
        for (orgQhull::QhullFacet facet : qhull.facetList()) {
            if (facet.isUpperDelaunay() || !facet.isSimplicial()) {
                continue;
            }
            std::array<std::size_t, 3> simplex{};
            std::size_t corner = 0;
            bool usable = true;
            for (orgQhull::QhullVertex vertex : facet.vertices()) {
                const auto id = static_cast<std::size_t>(vertex.point().id());
                if (corner >= 3 || id >= count) {
                    usable = false;
                    break;
                }
                simplex[corner++] = id;
            }
            if (usable && corner == 3) {
                simplices.push_back(simplex);
            }
        }
    } catch (const orgQhull::QhullError& ex) {
        diagnostic_ = std::string("Qhull error: ") + ex.what();
        return;
    }

    for (const auto& simplex : simplices) {
        const double ax = xs_[simplex[1]] - xs_[simplex[0]];
        const double ay = ys_[simplex[1]] - ys_[simplex[0]];
        const double bx = xs_[simplex[2]] - xs_[simplex[0]];
        const double by = ys_[simplex[2]] - ys_[simplex[0]];
        const double det = ax * by - ay * bx;
        if (std::abs(det) <= kCollinearTol * std::hypot(ax, ay) * std::hypot(bx, by)) {
            continue;
        }

        Triangle triangle{};
        triangle.vertices = simplex;
        Eigen::Matrix2d edges;
        edges << ax, bx, ay, by;
        triangle.inverse = edges.inverse();
        triangle.minX = std::min({xs_[simplex[0]], xs_[simplex[1]], xs_[simplex[2]]});
        triangle.maxX = std::max({xs_[simplex[0]], xs_[simplex[1]], xs_[simplex[2]]});
        triangle.minY = std::min({ys_[simplex[0]], ys_[simplex[1]], ys_[simplex[2]]});
        triangle.maxY = std::max({ys_[simplex[0]], ys_[simplex[1]], ys_[simplex[2]]});
        triangle.padX = kBarycentricEps * (triangle.maxX - triangle.minX + 1.0);
        triangle.padY = kBarycentricEps * (triangle.maxY - triangle.minY + 1.0);
        triangles_.push_back(triangle);
    }
    if (triangles_.empty()) {
        diagnostic_ = "triangulation produced no usable triangles";
        return;
    }
    buildIndex();
}

void DelaunayInterpolant::buildIndex() {
    indexMinX_ = triangles_.front().minX - triangles_.front().padX;
    indexMaxX_ = triangles_.front().maxX + triangles_.front().padX;
    indexMinY_ = triangles_.front().minY - triangles_.front().padY;
    indexMaxY_ = triangles_.front().maxY + triangles_.front().padY;
    for (const Triangle& triangle : triangles_) {
        indexMinX_ = std::min(indexMinX_, triangle.minX - triangle.padX);
        indexMaxX_ = std::max(indexMaxX_, triangle.maxX + triangle.padX);
        indexMinY_ = std::min(indexMinY_, triangle.minY - triangle.padY);
        indexMaxY_ = std::max(indexMaxY_, triangle.maxY + triangle.padY);
    }

    const auto side = static_cast<std::size_t>(std::ceil(std::sqrt(static_cast<double>(triangles_.size()))));
    cellsX_ = std::max<std::size_t>(1, side);
    cellsY_ = cellsX_;
    cells_.assign(cellsX_ * cellsY_, std::vector<std::size_t>{});

    for (std::size_t t = 0; t < triangles_.size(); ++t) {
        const Triangle& triangle = triangles_[t];
        const std::size_t low = cellIndex(triangle.minX - triangle.padX, triangle.minY - triangle.padY);
        const std::size_t high = cellIndex(triangle.maxX + triangle.padX, triangle.maxY + triangle.padY);
        for (std::size_t cy = low / cellsX_; cy <= high / cellsX_; ++cy) {
            for (std::size_t cx = low % cellsX_; cx <= high % cellsX_; ++cx) {
                cells_[cy * cellsX_ + cx].push_back(t);
            }
        }
    }
}

std::size_t DelaunayInterpolant::cellIndex(double x, double y) const {
    const auto bucket = [](double v, double lo, double hi, std::size_t count) -> std::size_t {
        if (!(hi > lo)) {
            return 0;
        }
        const double scaled = std::floor((v - lo) / (hi - lo) * static_cast<double>(count));
        if (!(scaled > 0.0)) {
            return 0;
        }
        return std::min(count - 1, static_cast<std::size_t>(scaled));
    };
    return bucket(y, indexMinY_, indexMaxY_, cellsY_) * cellsX_ + bucket(x, indexMinX_, indexMaxX_, cellsX_);
}

std::optional<DelaunayInterpolant::Location> DelaunayInterpolant::locate(double x, double y) const {
    if (cells_.empty() || !(x >= indexMinX_ && x <= indexMaxX_ && y >= indexMinY_ && y <= indexMaxY_)) {
        return std::nullopt;
    }
    // First match in triangle order, as a full scan would find.
    for (std::size_t t : cells_[cellIndex(x, y)]) {
        const Triangle& triangle = triangles_[t];
        if (x < triangle.minX - triangle.padX || x > triangle.maxX + triangle.padX ||
            y < triangle.minY - triangle.padY || y > triangle.maxY + triangle.padY) {
            continue;
        }

        const std::size_t v0 = triangle.vertices[0];
        const Eigen::Vector2d w = triangle.inverse * Eigen::Vector2d(x - xs_[v0], y - ys_[v0]);
        const double l0 = 1.0 - w(0) - w(1);
        if (l0 >= -kBarycentricEps && w(0) >= -kBarycentricEps && w(1) >= -kBarycentricEps) {
            return Location{t, {l0, w(0), w(1)}};
        }
    }
    return std::nullopt;
}

double DelaunayInterpolant::interpolate(const Location& location, const std::vector<double>& values) const {
    const Triangle& triangle = triangles_.at(location.triangle);
    double result = 0.0;
    for (std::size_t corner = 0; corner < 3; ++corner) {
        result += location.weights[corner] * values.at(triangle.vertices[corner]);
    }
    return result;
}

void applyCutoff(EffMapGrid& grid, const CutoffSettings& cutoff) {
    for (std::size_t j = 0; j < grid.ny; ++j) {
        for (std::size_t i = 0; i < grid.nx; ++i) {
            const std::size_t id = grid.idx(i, j);
            if (grid.speedAxis[i] < cutoff.startSpeed || grid.Y[id] < cutoff.startTorque) {
                grid.Eff[id] = kEmpty;
                grid.Power[id] = kEmpty;
                grid.geometry[id] = 0;
            }
        }
    }
}

InterpolationReport interpolateGrid(EffMapGrid& grid, const Dataset& data, EfficiencyChannel channel,
                                    const CutoffSettings& cutoff) {
    grid.clearValues();
    for (std::size_t i = 0; i < grid.nx; ++i) {
        for (std::size_t j = 0; j < grid.fillHeight[i]; ++j) {
            grid.geometry[grid.idx(i, j)] = 1;
        }
    }

    std::vector<double> xs;
    std::vector<double> ys;
    std::vector<double> eff;
    std::vector<double> power;
    xs.reserve(data.size());
    ys.reserve(data.size());
    eff.reserve(data.size());
    power.reserve(data.size());
    for (const auto& row : data) {
        xs.push_back(row.speed);
        ys.push_back(row.torque);
        eff.push_back(row.efficiency(channel));
        power.push_back(row.power);
    }

    InterpolationReport report{};
    const DelaunayInterpolant interpolant(std::move(xs), std::move(ys));
    report.triangles = interpolant.triangleCount();
    report.diagnostic = interpolant.diagnostic();
    if (interpolant.valid()) {
        report.status = InterpolationStatus::Interpolated;
        for (std::size_t i = 0; i < grid.nx; ++i) {
            for (std::size_t j = 0; j < grid.fillHeight[i]; ++j) {
                const std::size_t id = grid.idx(i, j);
                const auto location = interpolant.locate(grid.speedAxis[i], grid.Y[id]);
                if (!location) {
                    continue;
                }
                grid.Eff[id] = interpolant.interpolate(*location, eff);
                grid.Power[id] = interpolant.interpolate(*location, power);
            }
        }
    }

    applyCutoff(grid, cutoff);
    report.interpolatedPoints = static_cast<std::size_t>(
        std::count_if(grid.Eff.begin(), grid.Eff.end(), [](double v) { return !isEmpty(v); }));
    return report;
}

}  // namespace effmap
