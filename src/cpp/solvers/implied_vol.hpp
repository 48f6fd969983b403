#ifndef IVLAB_IMPLIED_VOL_HPP
#define IVLAB_IMPLIED_VOL_HPP

/**
 * @file implied_vol.hpp
 * @brief Black-Scholes implied volatility by Newton, bisection or Brent
 *
 * Finds σ such that BS(S, K, r, q, T, σ) = P_market. The Black-Scholes price
 * is strictly increasing in σ for T > 0, so a root exists and is unique iff
 * the market price lies strictly inside the no-arbitrage bounds.
 *
 * Methods:
 * - Newton: σ_{n+1} = σ_n - (BS(σ_n) - P) / vega_fd(σ_n), with vega from a
 *   centered finite difference. Iterates stay in [min_volatility, vol_upper];
 *   when that interval brackets the root, steps leaving the bracket and
 *   regions of vanishing vega fall back to bisection.
 * - Bisection: halves [vol_lower, vol_upper] until the model price, rounded
 *   to price_decimals, equals the rounded market price.
 * - Brent: bracketing with superlinear convergence.
 *
 * Reference: Manaster, S., & Koehler, G. (1982). "The Calculation of
 * Implied Variances from the Black-Scholes Model: A Note." Journal of Finance.
 */

#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "models/black_scholes.hpp"
#include "solvers/root_finding.hpp"

namespace ivlab::solvers {

using models::MarketInputs;
using models::OptionType;

/**
 * @brief Root-finding method enumeration.
 */
enum class ImpliedVolMethod {
    Newton,     ///< Newton-Raphson with finite-difference vega
    Bisection,  ///< Interval halving with rounded-price acceptance
    Brent       ///< Brent's method on [vol_lower, vol_upper]
};

/// "newton" / "bisection" / "brent"
std::string to_string(ImpliedVolMethod method);

/**
 * @brief Implied volatility solver settings.
 */
struct ImpliedVolConfig {
    ImpliedVolMethod method;  ///< Method used by ImpliedVolSolver::solve

    // Newton
    double initial_guess;     ///< Starting volatility
    double step_tolerance;    ///< Stop when |Δσ| is below this
    double derivative_floor;  ///< Stop when |vega| is below this
    double fd_bump;           ///< Volatility bump for the centered difference
    double min_volatility;    ///< Iterates are clamped to σ >= min_volatility
    int max_iterations;       ///< Newton and Brent iteration cap

    // Bracketing
    double vol_lower;          ///< Lower end of the search interval
    double vol_upper;          ///< Upper end of the search interval
    int bisection_iterations;  ///< Bisection iteration budget
    int price_decimals;        ///< Bisection stops when prices agree to this many decimals
    double vol_tolerance;      ///< Bracket width at which bisection and Brent stop
    double price_tolerance;    ///< |BS(σ) - P| accepted as a root

    ImpliedVolConfig()
        : method(ImpliedVolMethod::Newton), initial_guess(0.2), step_tolerance(1e-8),
          derivative_floor(1e-10), fd_bump(1e-5), min_volatility(1e-6), max_iterations(100),
          vol_lower(1e-4), vol_upper(5.0), bisection_iterations(200), price_decimals(2),
          vol_tolerance(1e-10), price_tolerance(1e-8) {}

    /**
     * @brief Validate settings and throw if invalid
     * @throws std::invalid_argument naming the offending field
     */
    void validate() const;

    /// String representation for logging and debugging
    std::string to_string() const;
};

/**
 * @brief Implied volatility result with diagnostics.
 */
struct ImpliedVolResult {
    double volatility;       ///< Implied σ (NaN when no estimate exists)
    double model_price;      ///< BS price at volatility
    double price_error;      ///< model_price - market_price
    int iterations = 0;      ///< Iterations performed
    bool converged = false;  ///< Stopping test satisfied
    ImpliedVolMethod method = ImpliedVolMethod::Newton;
    std::string message;     ///< Stop reason or why no solve was attempted

    ImpliedVolResult();

    std::string to_string() const;
};

/**
 * @brief Black-Scholes implied volatility solver
 *
 * Stateless apart from its configuration; const methods may be called
 * repeatedly with different quotes.
 */
class ImpliedVolSolver {
public:
    /// Construct with default configuration
    ImpliedVolSolver();

    /**
     * @brief Construct with given configuration
     * @throws std::invalid_argument if the configuration is invalid
     */
    explicit ImpliedVolSolver(const ImpliedVolConfig& config);

    /// Current configuration
    const ImpliedVolConfig& config() const noexcept { return config_; }

    /// Replace configuration
    void set_config(const ImpliedVolConfig& config);

    /**
     * @brief Solve with the configured method
     *
     * @param inputs Spot, strike, rate, dividend, maturity
     * @param market_price Observed option price
     * @param type Call or Put
     * @return Result; converged == false with the last estimate if the
     *         iteration budget ran out, or NaN volatility when the price
     *         admits no implied volatility
     * @throws std::invalid_argument on invalid inputs or non-positive price
     */
    ImpliedVolResult solve(const MarketInputs& inputs, double market_price,
                           OptionType type) const;

    /// Newton's method with finite-difference vega
    ImpliedVolResult solve_newton(const MarketInputs& inputs, double market_price,
                                  OptionType type) const;

    /// Bisection with rounded-price acceptance
    ImpliedVolResult solve_bisection(const MarketInputs& inputs, double market_price,
                                     OptionType type) const;

    /// Brent's method
    ImpliedVolResult solve_brent(const MarketInputs& inputs, double market_price,
                                 OptionType type) const;

    /**
     * @brief Solve a batch of quotes
     *
     * A quote that fails to converge does not stop the batch.
     *
     * @throws std::invalid_argument if vector sizes differ
     */
    std::vector<ImpliedVolResult> solve_many(const std::vector<MarketInputs>& inputs,
                                             const std::vector<double>& market_prices,
                                             const std::vector<OptionType>& types) const;

    /**
     * @brief Implied volatilities of a strike strip at common market inputs
     *
     * @return Vector of volatilities, NaN where the solve did not converge
     */
    Eigen::VectorXd implied_vols(const MarketInputs& inputs, const Eigen::VectorXd& strikes,
                                 const Eigen::VectorXd& market_prices, OptionType type) const;

private:
    ImpliedVolConfig config_;

    /// Input validation and no-arbitrage pre-check; a value means "do not iterate"
    std::optional<ImpliedVolResult> precheck(const MarketInputs& inputs, double market_price,
                                             OptionType type, ImpliedVolMethod method) const;

    /// Package a root search into an ImpliedVolResult
    ImpliedVolResult finish(const RootResult& root, const MarketInputs& inputs,
                            double market_price, OptionType type,
                            ImpliedVolMethod method) const;
};

/**
 * @brief Convenience wrapper: no dividends, default configuration
 *
 * @return Implied volatility estimate (NaN when none exists)
 */
double implied_volatility(double spot, double strike, double rate, double maturity,
                          double market_price, OptionType type,
                          ImpliedVolMethod method = ImpliedVolMethod::Newton);

}  // namespace ivlab::solvers

#endif  // IVLAB_IMPLIED_VOL_HPP
