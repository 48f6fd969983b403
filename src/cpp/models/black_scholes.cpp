#include "models/black_scholes.hpp"

#include <algorithm>
#include <cmath>

#include "core/math_utils.hpp"

namespace ivlab::models {

std::string to_string(OptionType type) {
    return type == OptionType::Call ? "call" : "put";
}

std::pair<double, double> BlackScholes::d1_d2(const MarketInputs& inputs, double sigma) {
    if (inputs.maturity <= 0.0 || sigma <= 0.0) {
        throw std::invalid_argument("BlackScholes: d1/d2 require positive maturity and sigma");
    }
    double sqrt_t = std::sqrt(inputs.maturity);
    double sigma_sqrt_t = sigma * sqrt_t;
    double d1 = (std::log(inputs.spot / inputs.strike) +
                 (inputs.rate - inputs.dividend + 0.5 * sigma * sigma) * inputs.maturity) /
                sigma_sqrt_t;
    return {d1, d1 - sigma_sqrt_t};
}

double BlackScholes::intrinsic(const MarketInputs& inputs, OptionType type) {
    if (type == OptionType::Call) {
        return std::max(inputs.spot - inputs.strike, 0.0);
    }
    return std::max(inputs.strike - inputs.spot, 0.0);
}

double BlackScholes::price(const MarketInputs& inputs, double sigma, OptionType type) {
    inputs.validate();

    if (inputs.maturity <= 0.0) {
        return intrinsic(inputs, type);
    }

    double disc_spot = inputs.spot * inputs.dividend_factor();
    double disc_strike = inputs.strike * inputs.discount_factor();

    // Zero variance: the terminal spot is the forward
    if (!(sigma > 0.0)) {
        if (type == OptionType::Call) {
            return std::max(disc_spot - disc_strike, 0.0);
        }
        return std::max(disc_strike - disc_spot, 0.0);
    }

    auto [d1, d2] = d1_d2(inputs, sigma);

    if (type == OptionType::Call) {
        return disc_spot * norm_cdf(d1) - disc_strike * norm_cdf(d2);
    }
    return disc_strike * norm_cdf(-d2) - disc_spot * norm_cdf(-d1);
}

PriceBounds BlackScholes::price_bounds(const MarketInputs& inputs, OptionType type) {
    inputs.validate();

    double disc_spot = inputs.spot * inputs.dividend_factor();
    double disc_strike = inputs.strike * inputs.discount_factor();

    if (type == OptionType::Call) {
        return PriceBounds{std::max(disc_spot - disc_strike, 0.0), disc_spot};
    }
    return PriceBounds{std::max(disc_strike - disc_spot, 0.0), disc_strike};
}

double BlackScholes::parity_residual(const MarketInputs& inputs, double call_price,
                                     double put_price) {
    inputs.validate();
    double forward_value = inputs.spot * inputs.dividend_factor() -
                           inputs.strike * inputs.discount_factor();
    return call_price - put_price - forward_value;
}

Eigen::VectorXd BlackScholes::price_curve(const MarketInputs& inputs,
                                          const Eigen::VectorXd& sigmas, OptionType type) {
    Eigen::VectorXd prices(sigmas.size());
    for (Eigen::Index i = 0; i < sigmas.size(); ++i) {
        prices(i) = price(inputs, sigmas(i), type);
    }
    return prices;
}

}  // namespace ivlab::models
