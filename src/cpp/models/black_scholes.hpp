#ifndef IVLAB_BLACK_SCHOLES_HPP
#define IVLAB_BLACK_SCHOLES_HPP

/**
 * @file black_scholes.hpp
 * @brief Black-Scholes-Merton closed-form pricing of European options
 *
 * Reference: Black, F., & Scholes, M. (1973). "The Pricing of Options and
 * Corporate Liabilities." Journal of Political Economy, 81(3), 637-654.
 *
 * With continuous dividend yield q (Merton 1973):
 *   C = S e^{-qT} N(d1) - K e^{-rT} N(d2)
 *   P = K e^{-rT} N(-d2) - S e^{-qT} N(-d1)
 *   d1 = [ln(S/K) + (r - q + σ²/2)T] / (σ√T),  d2 = d1 - σ√T
 *
 * This is the objective function of the implied-volatility solvers.
 */

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include <Eigen/Dense>

namespace ivlab::models {

/**
 * @brief Option type enumeration.
 */
enum class OptionType {
    Call,
    Put
};

/// "call" / "put"
std::string to_string(OptionType type);

/**
 * @brief Market observables for a single European option
 *
 * Everything except the volatility: the solvers search over sigma while
 * holding these fixed.
 */
struct MarketInputs {
    double spot;      ///< Current underlying price S
    double strike;    ///< Strike price K
    double rate;      ///< Continuously compounded risk-free rate r
    double dividend;  ///< Continuous dividend yield q
    double maturity;  ///< Time to maturity T (years)

    /// Default constructor: ATM one-year option
    MarketInputs() : spot(100.0), strike(100.0), rate(0.05), dividend(0.0), maturity(1.0) {}

    /// Parameterized constructor
    MarketInputs(double spot_, double strike_, double rate_, double maturity_,
                 double dividend_ = 0.0)
        : spot(spot_), strike(strike_), rate(rate_), dividend(dividend_), maturity(maturity_) {}

    /// Discount factor e^{-rT}
    double discount_factor() const { return std::exp(-rate * maturity); }

    /// Dividend discount factor e^{-qT}
    double dividend_factor() const { return std::exp(-dividend * maturity); }

    /// Forward price F = S e^{(r-q)T}
    double forward() const { return spot * std::exp((rate - dividend) * maturity); }

    /**
     * @brief Validate all inputs are in acceptable ranges
     * @return true if inputs are valid
     */
    bool is_valid() const noexcept {
        return std::isfinite(spot) && std::isfinite(strike) && std::isfinite(rate) &&
               std::isfinite(dividend) && std::isfinite(maturity) && spot > 0.0 &&
               strike > 0.0 && maturity >= 0.0;
    }

    /**
     * @brief Validate inputs and throw if invalid
     * @throws std::invalid_argument naming the offending field
     */
    void validate() const {
        if (!std::isfinite(spot) || spot <= 0.0) {
            throw std::invalid_argument("BlackScholes: spot must be positive, got " +
                                        std::to_string(spot));
        }
        if (!std::isfinite(strike) || strike <= 0.0) {
            throw std::invalid_argument("BlackScholes: strike must be positive, got " +
                                        std::to_string(strike));
        }
        if (!std::isfinite(maturity) || maturity < 0.0) {
            throw std::invalid_argument("BlackScholes: maturity must be non-negative, got " +
                                        std::to_string(maturity));
        }
        if (!std::isfinite(rate)) {
            throw std::invalid_argument("BlackScholes: rate must be finite");
        }
        if (!std::isfinite(dividend)) {
            throw std::invalid_argument("BlackScholes: dividend must be finite");
        }
    }

    /// String representation for logging and debugging
    std::string to_string() const {
        return "MarketInputs(spot=" + std::to_string(spot) + ", strike=" +
               std::to_string(strike) + ", rate=" + std::to_string(rate) +
               ", dividend=" + std::to_string(dividend) + ", maturity=" +
               std::to_string(maturity) + ")";
    }
};

/**
 * @brief No-arbitrage price interval [lower, upper]
 *
 * Every volatility in [0, ∞) maps to a price inside this interval, and the
 * Black-Scholes price is strictly increasing in sigma for T > 0, so a market
 * price has an implied volatility iff it lies strictly inside.
 */
struct PriceBounds {
    double lower;
    double upper;

    /// Strict containment: the endpoints correspond to sigma = 0 and sigma = ∞
    bool contains(double price) const noexcept { return price > lower && price < upper; }
};

/**
 * @brief Black-Scholes closed-form pricer
 *
 * All methods are static.
 */
class BlackScholes {
public:
    /**
     * @brief European option price
     *
     * Degenerate cases:
     * - maturity == 0: intrinsic value max(S-K, 0) / max(K-S, 0)
     * - sigma <= 0: deterministic forward payoff, discounted
     *
     * @param inputs Market observables
     * @param sigma Volatility
     * @param type Call or Put
     * @return Option price
     * @throws std::invalid_argument if inputs are invalid
     */
    static double price(const MarketInputs& inputs, double sigma, OptionType type);

    /**
     * @brief d1 and d2 terms of the closed form
     *
     * Requires maturity > 0 and sigma > 0.
     */
    static std::pair<double, double> d1_d2(const MarketInputs& inputs, double sigma);

    /// Undiscounted intrinsic value at the current spot
    static double intrinsic(const MarketInputs& inputs, OptionType type);

    /**
     * @brief Model-free price bounds
     *
     * Call: [max(S e^{-qT} - K e^{-rT}, 0), S e^{-qT}]
     * Put:  [max(K e^{-rT} - S e^{-qT}, 0), K e^{-rT}]
     */
    static PriceBounds price_bounds(const MarketInputs& inputs, OptionType type);

    /**
     * @brief Put-call parity residual C - P - (S e^{-qT} - K e^{-rT})
     *
     * Zero for prices produced by the same model; used to sanity-check
     * call/put quote pairs.
     */
    static double parity_residual(const MarketInputs& inputs, double call_price,
                                  double put_price);

    /**
     * @brief Price a strip of volatilities at fixed market inputs
     */
    static Eigen::VectorXd price_curve(const MarketInputs& inputs, const Eigen::VectorXd& sigmas,
                                       OptionType type);
};

}  // namespace ivlab::models

#endif  // IVLAB_BLACK_SCHOLES_HPP
