#ifndef IVLAB_OPTION_CHAIN_HPP
#define IVLAB_OPTION_CHAIN_HPP

/**
 * @file option_chain.hpp
 * @brief Option chain snapshot and volatility smile extraction
 *
 * An OptionChain holds the quotes of one underlying for one expiry, in the
 * tabular shape option-data providers return (strike, last, bid/ask,
 * provider IV, volume, open interest). compute_smile() runs the implied
 * volatility solver over every quote of one type.
 */

#include <Eigen/Dense>
#include <istream>
#include <string>
#include <vector>

#include "models/black_scholes.hpp"
#include "solvers/implied_vol.hpp"

namespace ivlab::market {

using models::MarketInputs;
using models::OptionType;

/**
 * @brief A single contract quote.
 */
struct OptionQuote {
    double strike = 0.0;
    OptionType type = OptionType::Call;
    double last_price = 0.0;
    double bid = 0.0;
    double ask = 0.0;
    double implied_vol = 0.0;  ///< Provider's implied volatility (0 if absent)
    long volume = 0;
    long open_interest = 0;

    /// Both sides quoted and not crossed
    bool has_two_sided_market() const noexcept { return bid > 0.0 && ask > 0.0 && ask >= bid; }

    /// Mid of bid/ask when two-sided, otherwise the last trade
    double mid() const noexcept {
        return has_two_sided_market() ? 0.5 * (bid + ask) : last_price;
    }
};

/**
 * @brief Quotes for one underlying and one expiry.
 */
struct OptionChain {
    std::string underlying;  ///< Ticker symbol
    std::string expiry;      ///< Expiry label, e.g. "2024-06-21"
    double spot = 0.0;       ///< Underlying price at snapshot time
    double maturity = 0.0;   ///< Time to expiry in years
    double rate = 0.0;       ///< Risk-free rate
    double dividend = 0.0;   ///< Continuous dividend yield
    std::vector<OptionQuote> quotes;

    std::vector<OptionQuote> calls() const;
    std::vector<OptionQuote> puts() const;

    /// Strikes of the given type, ascending, duplicates kept
    std::vector<double> strikes(OptionType type) const;

    /// Market inputs for pricing one quote of this chain
    MarketInputs market_inputs(const OptionQuote& quote) const {
        return MarketInputs(spot, quote.strike, rate, maturity, dividend);
    }

    std::string to_string() const;
};

/**
 * @brief Chain-level fields not carried by the quote table.
 */
struct ChainHeader {
    std::string underlying;
    std::string expiry;
    double spot = 0.0;
    double maturity = 0.0;
    double rate = 0.0;
    double dividend = 0.0;
};

/**
 * @brief Parse quotes from CSV
 *
 * The first line is a header naming the columns; order is free and unknown
 * columns are ignored. Required: strike, type, last_price. Optional: bid,
 * ask, implied_vol, volume, open_interest. The type column accepts
 * call/put/c/p in any case. Blank lines are skipped.
 *
 * @throws std::runtime_error on a missing column or malformed row (message
 *         names the line number)
 */
OptionChain read_option_chain_csv(std::istream& in, const ChainHeader& header);

/**
 * @brief Load quotes from a CSV file
 * @throws std::runtime_error if the file cannot be opened or parsed
 */
OptionChain load_option_chain_csv(const std::string& path, const ChainHeader& header);

/**
 * @brief Which quoted price the smile is backed out of.
 */
enum class PriceSource {
    Last,  ///< Last traded price
    Mid    ///< Bid/ask mid, falling back to last
};

/**
 * @brief Implied volatility by strike for one expiry and option type.
 */
struct VolSmile {
    OptionType type = OptionType::Call;
    Eigen::VectorXd strikes;        ///< Ascending
    Eigen::VectorXd model_vols;     ///< Solver output, NaN where not converged
    Eigen::VectorXd provider_vols;  ///< Provider IV as quoted
    Eigen::VectorXi converged;      ///< 1 where the solve converged
    size_t n_converged = 0;

    size_t size() const { return static_cast<size_t>(strikes.size()); }
};

/**
 * @brief Back out implied volatilities for every quote of one type
 *
 * Quotes whose price is non-positive or outside the no-arbitrage bounds
 * are kept with NaN volatility.
 */
VolSmile compute_smile(const OptionChain& chain, OptionType type,
                       const solvers::ImpliedVolSolver& solver,
                       PriceSource source = PriceSource::Last);

/**
 * @brief Summary statistics over the converged points of a smile.
 */
struct SmileSummary {
    double mean_model_vol;
    double std_model_vol;           ///< 0 for a single point
    double mean_abs_provider_diff;  ///< Mean |model - provider| where provider IV > 0
    double min_model_vol;
    double max_model_vol;
    size_t n_points;
};

/**
 * @throws std::invalid_argument if no point converged
 */
SmileSummary summarize_smile(const VolSmile& smile);

}  // namespace ivlab::market

#endif  // IVLAB_OPTION_CHAIN_HPP
