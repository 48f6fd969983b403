#include "solvers/implied_vol.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

#include "core/math_utils.hpp"

namespace ivlab::solvers {

using models::BlackScholes;

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

}  // anonymous namespace

std::string to_string(ImpliedVolMethod method) {
    switch (method) {
        case ImpliedVolMethod::Newton:
            return "newton";
        case ImpliedVolMethod::Bisection:
            return "bisection";
        case ImpliedVolMethod::Brent:
            return "brent";
    }
    return "unknown";
}

void ImpliedVolConfig::validate() const {
    if (!(initial_guess > 0.0) || !std::isfinite(initial_guess)) {
        throw std::invalid_argument(
            "ImpliedVol: initial_guess must be positive and finite, got " +
            std::to_string(initial_guess));
    }
    if (!(step_tolerance > 0.0)) {
        throw std::invalid_argument("ImpliedVol: step_tolerance must be positive, got " +
                                    std::to_string(step_tolerance));
    }
    if (!(derivative_floor >= 0.0)) {
        throw std::invalid_argument("ImpliedVol: derivative_floor must be non-negative, got " +
                                    std::to_string(derivative_floor));
    }
    if (!(fd_bump > 0.0)) {
        throw std::invalid_argument("ImpliedVol: fd_bump must be positive, got " +
                                    std::to_string(fd_bump));
    }
    if (!(min_volatility > 0.0)) {
        throw std::invalid_argument("ImpliedVol: min_volatility must be positive, got " +
                                    std::to_string(min_volatility));
    }
    if (max_iterations <= 0) {
        throw std::invalid_argument("ImpliedVol: max_iterations must be positive, got " +
                                    std::to_string(max_iterations));
    }
    if (!(vol_lower > 0.0)) {
        throw std::invalid_argument("ImpliedVol: vol_lower must be positive, got " +
                                    std::to_string(vol_lower));
    }
    if (!(vol_upper > vol_lower) || !std::isfinite(vol_upper)) {
        throw std::invalid_argument(
            "ImpliedVol: vol_upper must be finite and exceed vol_lower, got " +
            std::to_string(vol_upper));
    }
    if (!(min_volatility < vol_upper)) {
        throw std::invalid_argument("ImpliedVol: min_volatility must be below vol_upper, got " +
                                    std::to_string(min_volatility));
    }
    if (bisection_iterations <= 0) {
        throw std::invalid_argument("ImpliedVol: bisection_iterations must be positive, got " +
                                    std::to_string(bisection_iterations));
    }
    if (price_decimals < 0) {
        throw std::invalid_argument("ImpliedVol: price_decimals must be non-negative, got " +
                                    std::to_string(price_decimals));
    }
    if (!(vol_tolerance > 0.0)) {
        throw std::invalid_argument("ImpliedVol: vol_tolerance must be positive, got " +
                                    std::to_string(vol_tolerance));
    }
    if (!(price_tolerance >= 0.0)) {
        throw std::invalid_argument("ImpliedVol: price_tolerance must be non-negative, got " +
                                    std::to_string(price_tolerance));
    }
}

std::string ImpliedVolConfig::to_string() const {
    return "ImpliedVolConfig(method=" + solvers::to_string(method) +
           ", initial_guess=" + std::to_string(initial_guess) +
           ", max_iterations=" + std::to_string(max_iterations) + ", vol_range=[" +
           std::to_string(vol_lower) + ", " + std::to_string(vol_upper) +
           "], price_decimals=" + std::to_string(price_decimals) + ")";
}

ImpliedVolResult::ImpliedVolResult() : volatility(NaN), model_price(NaN), price_error(NaN) {}

std::string ImpliedVolResult::to_string() const {
    return "ImpliedVolResult(volatility=" + std::to_string(volatility) +
           ", model_price=" + std::to_string(model_price) +
           ", price_error=" + std::to_string(price_error) +
           ", iterations=" + std::to_string(iterations) +
           ", converged=" + (converged ? "true" : "false") +
           ", method=" + solvers::to_string(method) + ", message=" + message + ")";
}

ImpliedVolSolver::ImpliedVolSolver() : config_() {}

ImpliedVolSolver::ImpliedVolSolver(const ImpliedVolConfig& config) : config_(config) {
    config_.validate();
}

void ImpliedVolSolver::set_config(const ImpliedVolConfig& config) {
    config.validate();
    config_ = config;
}

std::optional<ImpliedVolResult> ImpliedVolSolver::precheck(const MarketInputs& inputs,
                                                           double market_price, OptionType type,
                                                           ImpliedVolMethod method) const {
    inputs.validate();
    if (!std::isfinite(market_price) || market_price <= 0.0) {
        throw std::invalid_argument("ImpliedVol: market_price must be positive, got " +
                                    std::to_string(market_price));
    }

    ImpliedVolResult result;
    result.method = method;

    if (inputs.maturity <= 0.0) {
        result.model_price = BlackScholes::intrinsic(inputs, type);
        result.price_error = result.model_price - market_price;
        result.message = "zero maturity: price does not depend on volatility";
        return result;
    }

    models::PriceBounds bounds = BlackScholes::price_bounds(inputs, type);
    if (!bounds.contains(market_price)) {
        result.message = "market price " + std::to_string(market_price) +
                         " outside no-arbitrage bounds [" + std::to_string(bounds.lower) +
                         ", " + std::to_string(bounds.upper) + "]";
        return result;
    }

    return std::nullopt;
}

ImpliedVolResult ImpliedVolSolver::finish(const RootResult& root, const MarketInputs& inputs,
                                          double market_price, OptionType type,
                                          ImpliedVolMethod method) const {
    ImpliedVolResult result;
    result.method = method;
    result.volatility = root.root;
    result.iterations = root.iterations;
    result.converged = root.converged;
    result.message = root.message;
    if (std::isfinite(root.root)) {
        result.model_price = BlackScholes::price(inputs, root.root, type);
        result.price_error = result.model_price - market_price;
    }
    return result;
}

ImpliedVolResult ImpliedVolSolver::solve(const MarketInputs& inputs, double market_price,
                                         OptionType type) const {
    switch (config_.method) {
        case ImpliedVolMethod::Bisection:
            return solve_bisection(inputs, market_price, type);
        case ImpliedVolMethod::Brent:
            return solve_brent(inputs, market_price, type);
        case ImpliedVolMethod::Newton:
            return solve_newton(inputs, market_price, type);
    }
    throw std::invalid_argument("ImpliedVol: unknown method");
}

ImpliedVolResult ImpliedVolSolver::solve_newton(const MarketInputs& inputs, double market_price,
                                                OptionType type) const {
    if (auto early = precheck(inputs, market_price, type, ImpliedVolMethod::Newton)) {
        return *early;
    }

    NewtonConfig newton;
    newton.step_tolerance = config_.step_tolerance;
    newton.derivative_floor = config_.derivative_floor;
    newton.f_tolerance = config_.price_tolerance;
    newton.fd_bump = config_.fd_bump;
    newton.x_min = config_.min_volatility;
    newton.x_max = config_.vol_upper;
    newton.max_iterations = config_.max_iterations;

    auto objective = [&](double sigma) {
        return BlackScholes::price(inputs, sigma, type) - market_price;
    };

    RootResult root = newton_fd(objective, config_.initial_guess, newton);
    return finish(root, inputs, market_price, type, ImpliedVolMethod::Newton);
}

ImpliedVolResult ImpliedVolSolver::solve_bisection(const MarketInputs& inputs,
                                                   double market_price, OptionType type) const {
    if (auto early = precheck(inputs, market_price, type, ImpliedVolMethod::Bisection)) {
        return *early;
    }

    BisectionConfig bisect;
    bisect.x_tolerance = config_.vol_tolerance;
    bisect.max_iterations = config_.bisection_iterations;

    auto objective = [&](double sigma) {
        return BlackScholes::price(inputs, sigma, type) - market_price;
    };

    // Quotes are compared the way they are displayed: at price_decimals
    const int decimals = config_.price_decimals;
    const double target = round_to(market_price, decimals);
    auto prices_match = [&](double, double diff) {
        return round_to(market_price + diff, decimals) == target;
    };

    RootResult root = bisection(objective, config_.vol_lower, config_.vol_upper, prices_match,
                                bisect);
    return finish(root, inputs, market_price, type, ImpliedVolMethod::Bisection);
}

ImpliedVolResult ImpliedVolSolver::solve_brent(const MarketInputs& inputs, double market_price,
                                               OptionType type) const {
    if (auto early = precheck(inputs, market_price, type, ImpliedVolMethod::Brent)) {
        return *early;
    }

    BrentConfig brent_config;
    brent_config.x_tolerance = config_.vol_tolerance;
    brent_config.f_tolerance = config_.price_tolerance;
    brent_config.max_iterations = config_.max_iterations;

    auto objective = [&](double sigma) {
        return BlackScholes::price(inputs, sigma, type) - market_price;
    };

    RootResult root = brent(objective, config_.vol_lower, config_.vol_upper, brent_config);
    return finish(root, inputs, market_price, type, ImpliedVolMethod::Brent);
}

std::vector<ImpliedVolResult> ImpliedVolSolver::solve_many(
    const std::vector<MarketInputs>& inputs, const std::vector<double>& market_prices,
    const std::vector<OptionType>& types) const {
    if (inputs.size() != market_prices.size() || inputs.size() != types.size()) {
        throw std::invalid_argument("ImpliedVol: inputs, market_prices and types must have the "
                                    "same size");
    }

    std::vector<ImpliedVolResult> results;
    results.reserve(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        results.push_back(solve(inputs[i], market_prices[i], types[i]));
    }
    return results;
}

Eigen::VectorXd ImpliedVolSolver::implied_vols(const MarketInputs& inputs,
                                               const Eigen::VectorXd& strikes,
                                               const Eigen::VectorXd& market_prices,
                                               OptionType type) const {
    if (strikes.size() != market_prices.size()) {
        throw std::invalid_argument("ImpliedVol: strikes and market_prices must have the same "
                                    "size");
    }

    Eigen::VectorXd vols(strikes.size());
    MarketInputs quote = inputs;
    for (Eigen::Index i = 0; i < strikes.size(); ++i) {
        quote.strike = strikes(i);
        ImpliedVolResult result = solve(quote, market_prices(i), type);
        vols(i) = result.converged ? result.volatility : NaN;
    }
    return vols;
}

double implied_volatility(double spot, double strike, double rate, double maturity,
                          double market_price, OptionType type, ImpliedVolMethod method) {
    ImpliedVolConfig config;
    config.method = method;
    return ImpliedVolSolver(config).solve(MarketInputs(spot, strike, rate, maturity),
                                          market_price, type)
        .volatility;
}

}  // namespace ivlab::solvers
