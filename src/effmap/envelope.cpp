#include "effmap/envelope.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <optional>

#include <Eigen/Dense>

namespace effmap {
namespace {

constexpr std::size_t kDegree = 3;
constexpr std::size_t kOrder = kDegree + 1;
constexpr std::size_t kPenaltyWidth = kDegree + 2;
constexpr double kRelativeTolerance = 1e-3;
constexpr int kMaxIterations = 20;

struct SplineFit {
    std::vector<double> knots;
    std::vector<double> coefficients;
    double residual{0.0};
    bool targetMet{true};
};

/// Observation matrix reduced to upper-triangular band form by Givens rotations.
struct TriangularSystem {
    Eigen::MatrixXd band;
    Eigen::VectorXd rhs;
    double residual{0.0};
};

/// l in [kDegree, nk1 - 1] with t[l] <= x < t[l + 1]; the end intervals absorb points outside.
std::size_t knotInterval(const std::vector<double>& t, std::size_t nk1, double x) {
    const auto first = t.begin() + static_cast<std::ptrdiff_t>(kDegree + 1);
    const auto last = t.begin() + static_cast<std::ptrdiff_t>(nk1);
    const auto it = std::upper_bound(first, last, x);
    return static_cast<std::size_t>(it - t.begin()) - 1;
}

/// The kOrder B-splines that are non-zero on interval l, evaluated at x (de Boor-Cox).
std::array<double, kOrder> basisFunctions(const std::vector<double>& t, std::size_t l, double x) {
    std::array<double, kOrder> h{};
    std::array<double, kOrder> previous{};
    h[0] = 1.0;
    for (std::size_t j = 1; j <= kDegree; ++j) {
        std::copy(h.begin(), h.begin() + static_cast<std::ptrdiff_t>(j), previous.begin());
        h[0] = 0.0;
        for (std::size_t i = 1; i <= j; ++i) {
            const double right = t[l + i];
            const double left = t[l + i - j];
            if (right == left) {
                h[i] = 0.0;
                continue;
            }
            const double f = previous[i - 1] / (right - left);
            h[i - 1] += f * (right - x);
            h[i] = f * (x - left);
        }
    }
    return h;
}

double evaluateSpline(const std::vector<double>& t, const std::vector<double>& c, double x) {
    const std::size_t nk1 = t.size() - kOrder;
    const std::size_t l = knotInterval(t, nk1, x);
    const std::array<double, kOrder> h = basisFunctions(t, l, x);
    double sum = 0.0;
    for (std::size_t i = 0; i < kOrder; ++i) {
        sum += c[l - kDegree + i] * h[i];
    }
    return sum;
}

double residualSum(const std::vector<double>& x, const std::vector<double>& y, const std::vector<double>& t,
                   const std::vector<double>& c) {
    double sum = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        const double r = evaluateSpline(t, c, x[i]) - y[i];
        sum += r * r;
    }
    return sum;
}

// Rotation that folds piv into the diagonal element ww; ww receives the new diagonal.
void givens(double piv, double& ww, double& cosine, double& sine) {
    const double store = std::abs(piv);
    double dd = 0.0;
    if (store >= ww) {
        const double ratio = ww / piv;
        dd = store * std::sqrt(1.0 + ratio * ratio);
    } else {
        const double ratio = piv / ww;
        dd = ww * std::sqrt(1.0 + ratio * ratio);
    }
    cosine = ww / dd;
    sine = piv / dd;
    ww = dd;
}

void rotate(double cosine, double sine, double& a, double& b) {
    const double first = a;
    const double second = b;
    b = cosine * second + sine * first;
    a = cosine * first - sine * second;
}

/*
 * Least-squares spline on knots t: each observation row is rotated into the
 * triangle in sample order. The residual is the sum of the squared parts
 * rotated out of the right-hand side.
 */
TriangularSystem triangulateObservations(const std::vector<double>& x, const std::vector<double>& y,
                                         const std::vector<double>& t) {
    const std::size_t nk1 = t.size() - kOrder;
    TriangularSystem system;
    system.band = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(nk1), static_cast<Eigen::Index>(kOrder));
    system.rhs = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(nk1));

    for (std::size_t it = 0; it < x.size(); ++it) {
        const std::size_t l = knotInterval(t, nk1, x[it]);
        std::array<double, kOrder> h = basisFunctions(t, l, x[it]);
        double yi = y[it];
        for (std::size_t i = 0; i < kOrder; ++i) {
            const double piv = h[i];
            if (piv == 0.0) {
                continue;
            }
            const auto row = static_cast<Eigen::Index>(l - kDegree + i);
            double cosine = 0.0;
            double sine = 0.0;
            givens(piv, system.band(row, 0), cosine, sine);
            rotate(cosine, sine, yi, system.rhs(row));
            for (std::size_t i1 = i + 1; i1 < kOrder; ++i1) {
                rotate(cosine, sine, h[i1], system.band(row, static_cast<Eigen::Index>(i1 - i)));
            }
        }
        system.residual += yi * yi;
    }
    return system;
}

std::vector<double> backSubstitute(const Eigen::MatrixXd& band, const Eigen::VectorXd& rhs) {
    const Eigen::Index n = band.rows();
    const Eigen::Index width = band.cols();
    std::vector<double> c(static_cast<std::size_t>(n), 0.0);
    for (Eigen::Index i = n - 1; i >= 0; --i) {
        double store = rhs(i);
        const Eigen::Index reach = std::min<Eigen::Index>(width - 1, n - 1 - i);
        for (Eigen::Index l = 1; l <= reach; ++l) {
            store -= c[static_cast<std::size_t>(i + l)] * band(i, l);
        }
        c[static_cast<std::size_t>(i)] = store / band(i, 0);
    }
    return c;
}

/*
 * Jumps of the third derivative of the B-splines at each interior knot,
 * scaled by (knot span / interval count)^3. Row r covers coefficients
 * r .. r + kPenaltyWidth - 1.
 */
Eigen::MatrixXd discontinuityJumps(const std::vector<double>& t) {
    const std::size_t n = t.size();
    const std::size_t nk1 = n - kOrder;
    const std::size_t interior = n - 2 * kOrder;
    const double fac = static_cast<double>(nk1 - kDegree) / (t[nk1] - t[kDegree]);

    Eigen::MatrixXd jumps =
        Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(interior), static_cast<Eigen::Index>(kPenaltyWidth));
    for (std::size_t row = 0; row < interior; ++row) {
        const std::size_t knot = row + kOrder;
        std::array<double, 2 * kOrder> h{};
        for (std::size_t j = 0; j < kOrder; ++j) {
            h[j] = t[knot] - t[knot - kOrder + j];
            h[j + kOrder] = t[knot] - t[knot + 1 + j];
        }
        for (std::size_t j = 0; j < kPenaltyWidth; ++j) {
            double prod = h[j];
            for (std::size_t i = 1; i <= kDegree; ++i) {
                prod = prod * h[j + i] * fac;
            }
            jumps(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(j)) =
                (t[row + j + kOrder] - t[row + j]) / prod;
        }
    }
    return jumps;
}

/// Coefficients minimising |A c - y|^2 + |B c / p|^2, with A already triangular in @p base.
std::vector<double> solvePenalised(const TriangularSystem& base, const Eigen::MatrixXd& jumps, double p) {
    const Eigen::Index nk1 = base.band.rows();
    const Eigen::Index interior = jumps.rows();
    const auto order = static_cast<Eigen::Index>(kOrder);

    Eigen::MatrixXd g = Eigen::MatrixXd::Zero(nk1, static_cast<Eigen::Index>(kPenaltyWidth));
    g.leftCols(order) = base.band;
    Eigen::VectorXd c = base.rhs;
    const double pinv = 1.0 / p;

    for (Eigen::Index it = 0; it < interior; ++it) {
        std::array<double, kPenaltyWidth> h{};
        for (std::size_t q = 0; q < kPenaltyWidth; ++q) {
            h[q] = jumps(it, static_cast<Eigen::Index>(q)) * pinv;
        }
        double yi = 0.0;
        for (Eigen::Index j = it; j < nk1; ++j) {
            double cosine = 0.0;
            double sine = 0.0;
            givens(h[0], g(j, 0), cosine, sine);
            rotate(cosine, sine, yi, c(j));
            if (j == nk1 - 1) {
                break;
            }
            const Eigen::Index reach = (j >= interior) ? nk1 - 1 - j : order;
            for (Eigen::Index q = 0; q < reach; ++q) {
                const auto next = static_cast<std::size_t>(q + 1);
                rotate(cosine, sine, h[next], g(j, q + 1));
                h[static_cast<std::size_t>(q)] = h[next];
            }
            h[static_cast<std::size_t>(reach)] = 0.0;
        }
    }
    return backSubstitute(g, c);
}

/// Root of the rational r(p) = (u p + v) / (p + w) through three points; p3 < 0 stands for infinity.
double rationalRoot(double& p1, double& f1, double p2, double f2, double& p3, double& f3) {
    double p = 0.0;
    if (p3 > 0.0) {
        const double h1 = f1 * (f2 - f3);
        const double h2 = f2 * (f3 - f1);
        const double h3 = f3 * (f1 - f2);
        p = -(p1 * p2 * h3 + p2 * p3 * h1 + p3 * p1 * h2) / (p1 * h1 + p2 * h2 + p3 * h3);
    } else {
        p = (p1 * (f1 - f3) * f2 - p2 * (f2 - f3) * f1) / ((f1 - f2) * f3);
    }
    // Keep f1 > 0 and f3 < 0.
    if (f2 < 0.0) {
        p3 = p2;
        f3 = f2;
    } else {
        p1 = p2;
        f1 = f2;
    }
    return p;
}

/*
 * Knot placement bookkeeping. fpint[j] is the residual share of knot interval
 * j (samples on a knot count half to each side), nrdata[j] the number of
 * samples strictly inside it.
 */
struct KnotPlacement {
    std::vector<double> t;
    std::vector<double> fpint;
    std::vector<std::size_t> nrdata;
    std::size_t n{0};
    std::size_t intervals{0};
};

void measureIntervals(KnotPlacement& knots, const std::vector<double>& x, const std::vector<double>& y,
                      const std::vector<double>& coefficients, const std::vector<double>& t) {
    const std::size_t nk1 = knots.n - kOrder;
    double part = 0.0;
    std::size_t interval = 0;
    std::size_t nextKnot = kOrder;
    for (std::size_t it = 0; it < x.size(); ++it) {
        const bool crossed = nextKnot < nk1 && x[it] >= t[nextKnot];
        if (crossed) {
            ++nextKnot;
        }
        const double r = evaluateSpline(t, coefficients, x[it]) - y[it];
        const double term = r * r;
        part += term;
        if (crossed) {
            const double store = 0.5 * term;
            knots.fpint[interval++] = part - store;
            part = store;
        }
    }
    knots.fpint[knots.intervals - 1] = part;
}

/// Split the interval with the largest residual share at its middle sample.
bool addKnot(KnotPlacement& knots, const std::vector<double>& x) {
    double fpmax = 0.0;
    std::size_t begin = 1;
    std::size_t number = 0;
    std::size_t maxpt = 0;
    std::size_t maxbeg = 0;
    bool found = false;
    for (std::size_t j = 0; j < knots.intervals; ++j) {
        const std::size_t points = knots.nrdata[j];
        if (!(fpmax >= knots.fpint[j]) && points != 0) {
            fpmax = knots.fpint[j];
            number = j;
            maxpt = points;
            maxbeg = begin;
            found = true;
        }
        begin += points + 1;
    }
    if (!found) {
        return false;
    }

    const std::size_t half = maxpt / 2 + 1;
    const std::size_t sample = maxbeg + half - 1;
    const std::size_t next = number + 1;
    for (std::size_t jj = knots.intervals; jj-- > next;) {
        knots.fpint[jj + 1] = knots.fpint[jj];
        knots.nrdata[jj + 1] = knots.nrdata[jj];
        knots.t[jj + kDegree + 1] = knots.t[jj + kDegree];
    }
    knots.nrdata[number] = half - 1;
    knots.nrdata[next] = maxpt - half;
    const auto total = static_cast<double>(maxpt);
    knots.fpint[number] = fpmax * static_cast<double>(knots.nrdata[number]) / total;
    knots.fpint[next] = fpmax * static_cast<double>(knots.nrdata[next]) / total;
    knots.t[next + kDegree] = x[sample];
    ++knots.n;
    ++knots.intervals;
    return true;
}

bool allFinite(const std::vector<double>& values) {
    return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

/*
 * Cubic smoothing spline with unit weights and smoothing factor s = m.
 *
 * Knot storage starts at max(m / 2, 8) knots. When the search fills it, the
 * search restarts from the current knots with room for m + 4 knots and a
 * single-knot step, as scipy's UnivariateSpline does.
 */
std::optional<SplineFit> fitSmoothingSpline(const std::vector<double>& x, const std::vector<double>& y) {
    const std::size_t m = x.size();
    if (m < kOrder) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < m; ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
            return std::nullopt;
        }
        if (i > 0 && !(x[i] > x[i - 1])) {
            return std::nullopt;
        }
    }

    const double s = static_cast<double>(m);
    const double acc = kRelativeTolerance * s;
    const std::size_t nmin = 2 * kOrder;
    const std::size_t nmax = m + kOrder;
    std::size_t capacity = std::max(m / 2, nmin);

    KnotPlacement knots;
    knots.t.assign(nmax, 0.0);
    knots.fpint.assign(nmax, 0.0);
    knots.nrdata.assign(nmax, 0);
    knots.n = nmin;
    knots.nrdata[0] = m - 2;

    double fp0 = 0.0;
    double fpold = 0.0;
    std::size_t nplus = 0;
    std::vector<double> t;
    std::vector<double> coefficients;
    TriangularSystem system;
    double fpms = 0.0;

    auto finish = [&](bool targetMet) -> std::optional<SplineFit> {
        if (!allFinite(coefficients)) {
            return std::nullopt;
        }
        SplineFit fit{};
        fit.residual = residualSum(x, y, t, coefficients);
        fit.knots = t;
        fit.coefficients = coefficients;
        fit.targetMet = targetMet;
        return fit;
    };

    for (;;) {
        for (std::size_t j = 0; j < kOrder; ++j) {
            knots.t[j] = x.front();
            knots.t[knots.n - 1 - j] = x.back();
        }
        t.assign(knots.t.begin(), knots.t.begin() + static_cast<std::ptrdiff_t>(knots.n));
        system = triangulateObservations(x, y, t);
        coefficients = backSubstitute(system.band, system.rhs);

        const bool polynomial = knots.n == nmin;
        const double fp = system.residual;
        if (polynomial) {
            fp0 = fp;
        }
        fpms = fp - s;
        if (std::abs(fpms) < acc) {
            return finish(true);
        }
        if (fpms < 0.0) {
            if (polynomial) {
                return finish(true);
            }
            break;
        }
        if (knots.n == nmax) {
            return finish(true);
        }

        bool restarted = false;
        if (knots.n == capacity) {
            capacity = nmax;
            restarted = true;
        }
        if (polynomial || restarted) {
            nplus = 1;
        } else {
            std::size_t npl1 = nplus * 2;
            if (fpold - fp > acc) {
                npl1 = static_cast<std::size_t>(static_cast<double>(nplus) * fpms / (fpold - fp));
            }
            nplus = std::min(nplus * 2, std::max({npl1, nplus / 2, std::size_t{1}}));
        }
        fpold = fp;

        knots.intervals = knots.n - nmin + 1;
        measureIntervals(knots, x, y, coefficients, t);

        bool interpolating = false;
        for (std::size_t added = 0; added < nplus; ++added) {
            if (!addKnot(knots, x)) {
                return std::nullopt;
            }
            if (knots.n == nmax) {
                interpolating = true;
                break;
            }
            if (knots.n == capacity) {
                break;
            }
        }
        if (interpolating) {
            // Interior knots at x[2] .. x[m - 3], as for cubic interpolation.
            for (std::size_t q = 0; q + kOrder < m; ++q) {
                knots.t[kOrder + q] = x[q + 2];
            }
        }
    }

    const std::size_t nk1 = t.size() - kOrder;
    const Eigen::MatrixXd jumps = discontinuityJumps(t);
    double p = static_cast<double>(nk1) / system.band.col(0).sum();
    double p1 = 0.0;
    double f1 = fp0 - s;
    double p3 = -1.0;
    double f3 = fpms;
    bool ich1 = false;
    bool ich3 = false;

    for (int iter = 1; iter <= kMaxIterations; ++iter) {
        coefficients = solvePenalised(system, jumps, p);
        if (!allFinite(coefficients)) {
            return std::nullopt;
        }
        const double f2 = residualSum(x, y, t, coefficients) - s;
        if (std::abs(f2) < acc) {
            return finish(true);
        }
        if (iter == kMaxIterations) {
            break;
        }

        const double p2 = p;
        if (!ich3) {
            if (!(f2 - f3 > acc)) {
                // p too large.
                p3 = p2;
                f3 = f2;
                p *= 0.04;
                if (p <= p1) {
                    p = p1 * 0.9 + p2 * 0.1;
                }
                continue;
            }
            if (f2 < 0.0) {
                ich3 = true;
            }
        }
        if (!ich1) {
            if (!(f1 - f2 > acc)) {
                // p too small.
                p1 = p2;
                f1 = f2;
                p /= 0.04;
                if (p3 < 0.0) {
                    continue;
                }
                if (p >= p3) {
                    p = p2 * 0.1 + p3 * 0.9;
                }
                continue;
            }
            if (f2 > 0.0) {
                ich1 = true;
            }
        }
        if (f2 >= f1 || f2 <= f3) {
            break;
        }
        p = rationalRoot(p1, f1, p2, f2, p3, f3);
    }
    return finish(false);
}

}  // namespace

const char* fitKindName(EnvelopeFitKind kind) {
    switch (kind) {
        case EnvelopeFitKind::SmoothingSpline:
            return "smoothing_spline";
        case EnvelopeFitKind::LinearTooFewPoints:
            return "linear_too_few_points";
        case EnvelopeFitKind::LinearFitFailed:
            return "linear_fit_failed";
        case EnvelopeFitKind::Constant:
            return "constant";
        case EnvelopeFitKind::Empty:
            break;
    }
    return "empty";
}

EnvelopeCurve EnvelopeCurve::linear(const std::vector<EnvelopeSample>& samples, EnvelopeFitKind kind) {
    EnvelopeCurve curve{};
    curve.samples_ = samples;
    curve.kind_ = samples.empty() ? EnvelopeFitKind::Empty
                                  : (samples.size() == 1 ? EnvelopeFitKind::Constant : kind);
    return curve;
}

EnvelopeCurve EnvelopeCurve::fit(const std::vector<EnvelopeSample>& samples) {
    if (samples.size() <= 3) {
        return linear(samples, EnvelopeFitKind::LinearTooFewPoints);
    }

    std::vector<double> x;
    std::vector<double> y;
    x.reserve(samples.size());
    y.reserve(samples.size());
    for (const auto& sample : samples) {
        x.push_back(sample.speed);
        y.push_back(sample.torque);
    }

    auto spline = fitSmoothingSpline(x, y);
    if (!spline) {
        return linear(samples, EnvelopeFitKind::LinearFitFailed);
    }

    EnvelopeCurve curve{};
    curve.samples_ = samples;
    curve.knots_ = std::move(spline->knots);
    curve.coefficients_ = std::move(spline->coefficients);
    curve.residual_ = spline->residual;
    curve.residualTargetMet_ = spline->targetMet;
    curve.kind_ = EnvelopeFitKind::SmoothingSpline;
    return curve;
}

double EnvelopeCurve::operator()(double speed) const {
    if (samples_.empty()) {
        return 0.0;
    }
    if (samples_.size() == 1) {
        return samples_.front().torque;
    }
    if (!knots_.empty()) {
        return evaluateSpline(knots_, coefficients_, speed);
    }

    const auto upper = std::upper_bound(samples_.begin(), samples_.end(), speed,
                                        [](double s, const EnvelopeSample& sample) { return s < sample.speed; });
    std::size_t i = static_cast<std::size_t>(upper - samples_.begin());
    i = (i == 0) ? 0 : std::min(i - 1, samples_.size() - 2);
    const EnvelopeSample& a = samples_[i];
    const EnvelopeSample& b = samples_[i + 1];
    return a.torque + (speed - a.speed) * (b.torque - a.torque) / (b.speed - a.speed);
}

std::vector<double> EnvelopeCurve::evaluate(const std::vector<double>& speeds) const {
    std::vector<double> result;
    result.reserve(speeds.size());
    for (double s : speeds) {
        result.push_back((*this)(s));
    }
    return result;
}

std::vector<EnvelopeSample> envelopeSamples(const Dataset& data) {
    std::map<double, double> maxima;
    for (const auto& row : data) {
        const auto it = maxima.find(row.speed);
        if (it == maxima.end()) {
            maxima.emplace(row.speed, row.torque);
        } else {
            it->second = std::max(it->second, row.torque);
        }
    }

    std::vector<EnvelopeSample> samples;
    samples.reserve(maxima.size());
    for (const auto& [speed, torque] : maxima) {
        samples.push_back(EnvelopeSample{speed, torque});
    }
    return samples;
}

EnvelopeCurve extractEnvelope(const Dataset& data) { return EnvelopeCurve::fit(envelopeSamples(data)); }

}  // namespace effmap
