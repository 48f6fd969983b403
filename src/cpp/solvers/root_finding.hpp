#ifndef IVLAB_ROOT_FINDING_HPP
#define IVLAB_ROOT_FINDING_HPP

/**
 * @file root_finding.hpp
 * @brief Bounded one-dimensional root finders
 *
 * All routines are single-threaded, take the objective as any callable
 * double(double), and never throw on non-convergence: the best estimate is
 * returned with converged == false and a message naming the stop reason.
 *
 * Reference: Press, W.H. et al. (2007). "Numerical Recipes", 3rd ed., §9.2-9.4
 */

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace ivlab::solvers {

/**
 * @brief Outcome of a root search.
 */
struct RootResult {
    double root = std::numeric_limits<double>::quiet_NaN();    ///< Best estimate
    double f_root = std::numeric_limits<double>::quiet_NaN();  ///< Objective at root
    int iterations = 0;                                        ///< Iterations performed
    bool converged = false;                                    ///< Stopping test satisfied
    std::string message;                                       ///< Stop reason

    std::string to_string() const {
        return "RootResult(root=" + std::to_string(root) + ", f_root=" + std::to_string(f_root) +
               ", iterations=" + std::to_string(iterations) +
               ", converged=" + (converged ? "true" : "false") + ", message=" + message + ")";
    }
};

/**
 * @brief Newton iteration settings.
 */
struct NewtonConfig {
    double step_tolerance;    ///< Stop when |x_{n+1} - x_n| is below this
    double derivative_floor;  ///< |f'(x)| below this counts as a vanishing derivative
    double f_tolerance;       ///< |f| accepted as a root when the search cannot continue
    double fd_bump;           ///< Half-width h of the centered difference
    double x_min;             ///< Iterates are clamped to x >= x_min
    double x_max;             ///< Iterates are clamped to x <= x_max
    int max_iterations;

    NewtonConfig()
        : step_tolerance(1e-8), derivative_floor(1e-10), f_tolerance(1e-8), fd_bump(1e-5),
          x_min(-std::numeric_limits<double>::infinity()),
          x_max(std::numeric_limits<double>::infinity()), max_iterations(100) {}

    void validate() const {
        if (!(step_tolerance > 0.0)) {
            throw std::invalid_argument("Newton: step_tolerance must be positive, got " +
                                        std::to_string(step_tolerance));
        }
        if (derivative_floor < 0.0) {
            throw std::invalid_argument("Newton: derivative_floor must be non-negative, got " +
                                        std::to_string(derivative_floor));
        }
        if (!(fd_bump > 0.0)) {
            throw std::invalid_argument("Newton: fd_bump must be positive, got " +
                                        std::to_string(fd_bump));
        }
        if (!(x_min < x_max)) {
            throw std::invalid_argument("Newton: x_min must be below x_max, got [" +
                                        std::to_string(x_min) + ", " + std::to_string(x_max) +
                                        "]");
        }
        if (max_iterations <= 0) {
            throw std::invalid_argument("Newton: max_iterations must be positive, got " +
                                        std::to_string(max_iterations));
        }
    }
};

/**
 * @brief Bisection settings.
 */
struct BisectionConfig {
    double x_tolerance;  ///< Stop when the bracket is narrower than this
    double f_tolerance;  ///< Default acceptance: |f(mid)| <= f_tolerance
    int max_iterations;

    BisectionConfig() : x_tolerance(1e-12), f_tolerance(1e-8), max_iterations(200) {}

    void validate() const {
        if (x_tolerance < 0.0) {
            throw std::invalid_argument("Bisection: x_tolerance must be non-negative, got " +
                                        std::to_string(x_tolerance));
        }
        if (!(f_tolerance >= 0.0)) {
            throw std::invalid_argument("Bisection: f_tolerance must be non-negative, got " +
                                        std::to_string(f_tolerance));
        }
        if (max_iterations <= 0) {
            throw std::invalid_argument("Bisection: max_iterations must be positive, got " +
                                        std::to_string(max_iterations));
        }
    }
};

/**
 * @brief Brent's method settings.
 */
struct BrentConfig {
    double x_tolerance;
    double f_tolerance;
    int max_iterations;

    BrentConfig() : x_tolerance(1e-10), f_tolerance(1e-10), max_iterations(100) {}

    void validate() const {
        if (!(x_tolerance > 0.0)) {
            throw std::invalid_argument("Brent: x_tolerance must be positive, got " +
                                        std::to_string(x_tolerance));
        }
        if (max_iterations <= 0) {
            throw std::invalid_argument("Brent: max_iterations must be positive, got " +
                                        std::to_string(max_iterations));
        }
    }
};


/**
 * @brief Centered finite-difference derivative (f(x+h) - f(x-h)) / 2h.
 *
 * Points that would leave [x_min, x_max] are moved onto the bound and the
 * quotient uses the actual spacing.
 */
template <typename Func>
double central_difference(Func& f, double x, double h,
                          double x_min = -std::numeric_limits<double>::infinity(),
                          double x_max = std::numeric_limits<double>::infinity()) {
    double x_lo = std::max(x - h, x_min);
    double x_hi = std::min(x + h, x_max);
    return (f(x_hi) - f(x_lo)) / (x_hi - x_lo);
}


/**
 * @brief Newton's method with a numerical derivative.
 *
 * x_{n+1} = x_n - f(x_n) / f'(x_n), f' from central_difference(), iterates
 * clamped to [x_min, x_max].
 *
 * When both bounds are finite and f changes sign across them the search is
 * safeguarded (Numerical Recipes rtsafe): the bracket shrinks around the
 * root with every iterate, and a Newton step that leaves the bracket or a
 * vanishing derivative is replaced by a bisection step.
 *
 * Stops when:
 * - |x_{n+1} - x_n| < step_tolerance (converged)
 * - |f'(x_n)| < derivative_floor without a bracket (converged only if
 *   |f(x_n)| <= f_tolerance)
 * - the iterate stays pinned at x_min or x_max (converged only if
 *   |f| <= f_tolerance)
 * - max_iterations is reached (not converged, last iterate returned)
 *
 * @param f Objective
 * @param x0 Starting point
 * @param config Iteration settings
 */
template <typename Func>
RootResult newton_fd(Func f, double x0, const NewtonConfig& config = NewtonConfig()) {
    config.validate();

    RootResult result;

    // Bracket with f(x_neg) < 0 < f(x_pos)
    bool bracketed = false;
    double x_neg = 0.0;
    double x_pos = 0.0;
    if (std::isfinite(config.x_min) && std::isfinite(config.x_max)) {
        double f_min = f(config.x_min);
        double f_max = f(config.x_max);
        if (f_min == 0.0 || f_max == 0.0) {
            result.root = f_min == 0.0 ? config.x_min : config.x_max;
            result.f_root = 0.0;
            result.converged = true;
            result.message = "root at search bound";
            return result;
        }
        if (std::isfinite(f_min) && std::isfinite(f_max) && (f_min < 0.0) != (f_max < 0.0)) {
            bracketed = true;
            x_neg = f_min < 0.0 ? config.x_min : config.x_max;
            x_pos = f_min < 0.0 ? config.x_max : config.x_min;
        }
    }

    double x = std::min(std::max(x0, config.x_min), config.x_max);

    for (int iter = 0; iter < config.max_iterations; ++iter) {
        double fx = f(x);
        result.root = x;
        result.f_root = fx;
        result.iterations = iter;

        if (!std::isfinite(fx)) {
            result.message = "objective is not finite at x=" + std::to_string(x);
            return result;
        }
        if (fx == 0.0) {
            result.converged = true;
            result.message = "objective is zero";
            return result;
        }

        if (bracketed) {
            if (fx < 0.0) {
                x_neg = x;
            } else {
                x_pos = x;
            }
        }

        double dfx = central_difference(f, x, config.fd_bump, config.x_min, config.x_max);
        bool flat = !std::isfinite(dfx) || std::abs(dfx) < config.derivative_floor;

        double x_new;
        if (bracketed) {
            double lo = std::min(x_neg, x_pos);
            double hi = std::max(x_neg, x_pos);
            x_new = flat ? 0.5 * (lo + hi) : x - fx / dfx;
            if (!(x_new > lo && x_new < hi)) {
                x_new = 0.5 * (lo + hi);
            }
        } else {
            if (flat) {
                result.converged = std::abs(fx) <= config.f_tolerance;
                result.message = "derivative below floor";
                return result;
            }
            x_new = std::min(std::max(x - fx / dfx, config.x_min), config.x_max);
        }
        result.iterations = iter + 1;

        if (x_new == x && (x == config.x_min || x == config.x_max)) {
            result.converged = std::abs(fx) <= config.f_tolerance;
            result.message = x == config.x_min ? "iterate pinned at lower bound"
                                               : "iterate pinned at upper bound";
            return result;
        }

        if (std::abs(x_new - x) < config.step_tolerance) {
            result.root = x_new;
            result.f_root = f(x_new);
            result.converged = true;
            result.message = "step below tolerance";
            return result;
        }

        x = x_new;
    }

    result.root = x;
    result.f_root = f(x);
    result.iterations = config.max_iterations;
    result.message = "maximum iterations reached";
    return result;
}


/**
 * @brief Bisection with a caller-supplied acceptance test.
 *
 * The bracket [lo, hi] must contain a sign change of f. Each iteration
 * evaluates the midpoint and keeps the half whose endpoints still differ in
 * sign. The search stops as soon as accept(mid, f(mid)) holds, when the
 * bracket is narrower than x_tolerance, or after max_iterations. The
 * acceptance test is applied to midpoints only; an endpoint is returned
 * directly only when f vanishes there.
 *
 * If f(lo) and f(hi) share a sign no iteration is performed and the endpoint
 * with the smaller |f| is returned, not converged.
 *
 * @throws std::invalid_argument if lo >= hi
 */
template <typename Func, typename Accept>
RootResult bisection(Func f, double lo, double hi, Accept accept,
                     const BisectionConfig& config = BisectionConfig()) {
    config.validate();
    if (!(lo < hi)) {
        throw std::invalid_argument("Bisection: lower bound must be below upper bound, got [" +
                                    std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }

    RootResult result;
    double f_lo = f(lo);
    double f_hi = f(hi);

    if (!std::isfinite(f_lo) || !std::isfinite(f_hi)) {
        result.message = "objective is not finite at bracket endpoints";
        return result;
    }
    if (f_lo == 0.0 || f_hi == 0.0) {
        result.root = f_lo == 0.0 ? lo : hi;
        result.f_root = 0.0;
        result.converged = true;
        result.message = "root at bracket endpoint";
        return result;
    }
    if ((f_lo > 0.0) == (f_hi > 0.0)) {
        bool lo_closer = std::abs(f_lo) <= std::abs(f_hi);
        result.root = lo_closer ? lo : hi;
        result.f_root = lo_closer ? f_lo : f_hi;
        result.message = "root not bracketed";
        return result;
    }

    for (int iter = 1; iter <= config.max_iterations; ++iter) {
        double mid = 0.5 * (lo + hi);
        double f_mid = f(mid);
        result.root = mid;
        result.f_root = f_mid;
        result.iterations = iter;

        if (!std::isfinite(f_mid)) {
            result.message = "objective is not finite at x=" + std::to_string(mid);
            return result;
        }
        if (accept(mid, f_mid)) {
            result.converged = true;
            result.message = "acceptance test satisfied";
            return result;
        }

        if ((f_mid > 0.0) == (f_lo > 0.0)) {
            lo = mid;
            f_lo = f_mid;
        } else {
            hi = mid;
        }

        if (hi - lo < config.x_tolerance) {
            result.converged = true;
            result.message = "bracket below tolerance";
            return result;
        }
    }

    result.message = "maximum iterations reached";
    return result;
}

/**
 * @brief Bisection accepting |f(mid)| <= config.f_tolerance.
 */
template <typename Func>
RootResult bisection(Func f, double lo, double hi,
                     const BisectionConfig& config = BisectionConfig()) {
    const double f_tol = config.f_tolerance;
    return bisection(f, lo, hi, [f_tol](double, double fx) { return std::abs(fx) <= f_tol; },
                     config);
}


/**
 * @brief Brent's method: inverse quadratic / secant steps safeguarded by bisection.
 *
 * Same bracketing precondition as bisection(). Converges superlinearly on
 * smooth objectives and never does worse than bisection.
 *
 * @throws std::invalid_argument if lo >= hi
 */
template <typename Func>
RootResult brent(Func f, double lo, double hi, const BrentConfig& config = BrentConfig()) {
    config.validate();
    if (!(lo < hi)) {
        throw std::invalid_argument("Brent: lower bound must be below upper bound, got [" +
                                    std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }

    constexpr double eps = std::numeric_limits<double>::epsilon();

    RootResult result;
    double a = lo, b = hi, c = hi;
    double fa = f(a), fb = f(b), fc = fb;
    double d = b - a, e = d;

    if (!std::isfinite(fa) || !std::isfinite(fb)) {
        result.message = "objective is not finite at bracket endpoints";
        return result;
    }
    if ((fa > 0.0 && fb > 0.0) || (fa < 0.0 && fb < 0.0)) {
        bool a_closer = std::abs(fa) <= std::abs(fb);
        result.root = a_closer ? a : b;
        result.f_root = a_closer ? fa : fb;
        result.converged = std::abs(result.f_root) <= config.f_tolerance;
        result.message = "root not bracketed";
        return result;
    }

    for (int iter = 1; iter <= config.max_iterations; ++iter) {
        // Keep the root bracketed by [b, c]
        if ((fb > 0.0 && fc > 0.0) || (fb < 0.0 && fc < 0.0)) {
            c = a;
            fc = fa;
            e = d = b - a;
        }
        // b is the best estimate
        if (std::abs(fc) < std::abs(fb)) {
            a = b;
            b = c;
            c = a;
            fa = fb;
            fb = fc;
            fc = fa;
        }

        double tol1 = 2.0 * eps * std::abs(b) + 0.5 * config.x_tolerance;
        double xm = 0.5 * (c - b);

        result.root = b;
        result.f_root = fb;
        result.iterations = iter - 1;

        if (std::abs(xm) <= tol1 || std::abs(fb) <= config.f_tolerance) {
            result.converged = true;
            result.message = "tolerance reached";
            return result;
        }

        if (std::abs(e) >= tol1 && std::abs(fa) > std::abs(fb)) {
            double s = fb / fa;
            double p, q;
            if (a == c) {
                // Secant
                p = 2.0 * xm * s;
                q = 1.0 - s;
            } else {
                // Inverse quadratic interpolation
                double qq = fa / fc;
                double r = fb / fc;
                p = s * (2.0 * xm * qq * (qq - r) - (b - a) * (r - 1.0));
                q = (qq - 1.0) * (r - 1.0) * (s - 1.0);
            }
            if (p > 0.0) q = -q;
            p = std::abs(p);

            double min1 = 3.0 * xm * q - std::abs(tol1 * q);
            double min2 = std::abs(e * q);
            if (2.0 * p < std::min(min1, min2)) {
                e = d;
                d = p / q;
            } else {
                d = xm;
                e = d;
            }
        } else {
            d = xm;
            e = d;
        }

        a = b;
        fa = fb;
        b += (std::abs(d) > tol1) ? d : std::copysign(tol1, xm);
        fb = f(b);

        if (!std::isfinite(fb)) {
            result.root = b;
            result.f_root = fb;
            result.iterations = iter;
            result.message = "objective is not finite at x=" + std::to_string(b);
            return result;
        }
    }

    result.root = b;
    result.f_root = fb;
    result.iterations = config.max_iterations;
    result.message = "maximum iterations reached";
    return result;
}

}  // namespace ivlab::solvers

#endif  // IVLAB_ROOT_FINDING_HPP
