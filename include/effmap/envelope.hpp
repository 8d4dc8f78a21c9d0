#pragma once

#include <vector>

#include "effmap/normalize.hpp"

namespace effmap {

struct EnvelopeSample {
    double speed{0.0};
    double torque{0.0};
};

/// Which curve the extractor ended up with.
enum class EnvelopeFitKind {
    SmoothingSpline,
    LinearTooFewPoints,
    LinearFitFailed,
    Constant,
    Empty
};

const char* fitKindName(EnvelopeFitKind kind);

/**
 * @brief Maximum torque as a function of speed.
 *
 * Holds either a cubic smoothing spline in B-spline form (knot vector with
 * fourfold end knots and coefficients) or a piecewise-linear interpolant.
 * Both are defined for any speed: the spline extends its end polynomial
 * pieces, the linear curve its end segments.
 */
class EnvelopeCurve {
public:
    EnvelopeCurve() = default;

    /**
     * @brief Fit the envelope through @p samples (ascending, distinct speeds).
     *
     * More than three samples try the smoothing spline first and fall back to
     * the linear curve when the fit fails; kind() reports the outcome.
     *
     * The spline follows the FITPACK curfit procedure with unit weights and
     * smoothing factor s = number of samples: the least-squares cubic is kept
     * when its residual is within s, otherwise knots are added at samples until
     * the least-squares spline gets within s, and the smoothing weight is then
     * iterated until the residual equals s to a relative 1e-3.
     */
    static EnvelopeCurve fit(const std::vector<EnvelopeSample>& samples);

    static EnvelopeCurve linear(const std::vector<EnvelopeSample>& samples, EnvelopeFitKind kind);

    [[nodiscard]] double operator()(double speed) const;

    [[nodiscard]] std::vector<double> evaluate(const std::vector<double>& speeds) const;

    [[nodiscard]] EnvelopeFitKind kind() const { return kind_; }

    [[nodiscard]] const std::vector<EnvelopeSample>& samples() const { return samples_; }

    /// Full spline knot vector, end knots repeated four times; empty for linear curves.
    [[nodiscard]] const std::vector<double>& knots() const { return knots_; }

    /// Sum of squared residuals of the spline at the samples; 0 for linear curves.
    [[nodiscard]] double residual() const { return residual_; }

    /// False when the smoothing iteration stopped before the residual reached its target.
    [[nodiscard]] bool residualTargetMet() const { return residualTargetMet_; }

private:
    std::vector<EnvelopeSample> samples_;
    std::vector<double> knots_;
    std::vector<double> coefficients_;
    double residual_{0.0};
    bool residualTargetMet_{true};
    EnvelopeFitKind kind_{EnvelopeFitKind::Empty};
};

/// Maximum torque per grouped speed, ascending in speed.
std::vector<EnvelopeSample> envelopeSamples(const Dataset& data);

EnvelopeCurve extractEnvelope(const Dataset& data);

}  // namespace effmap
