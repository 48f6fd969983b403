#include "market/option_chain.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>

#include "core/math_utils.hpp"

namespace ivlab::market {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_row(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    // "a,b," has an empty trailing field
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

std::string line_error(size_t line_no, const std::string& what) {
    return "option chain CSV line " + std::to_string(line_no) + ": " + what;
}

double parse_double(const std::string& field, const std::string& column, size_t line_no) {
    if (field.empty()) return 0.0;
    try {
        size_t consumed = 0;
        double value = std::stod(field, &consumed);
        if (consumed != field.size()) {
            throw std::invalid_argument(field);
        }
        return value;
    } catch (const std::exception&) {
        throw std::runtime_error(line_error(line_no, "bad " + column + " '" + field + "'"));
    }
}

long parse_long(const std::string& field, const std::string& column, size_t line_no) {
    // Providers sometimes emit volumes as floats ("12.0") or leave them blank
    double value = parse_double(field, column, line_no);
    // 2^63 as a double: the first value a long cannot hold
    constexpr double long_limit = -2.0 * static_cast<double>(std::numeric_limits<long>::min());
    if (!(value >= 0.0 && value < long_limit)) {
        throw std::runtime_error(line_error(line_no, "bad " + column + " '" + field + "'"));
    }
    return static_cast<long>(value);
}

OptionType parse_type(const std::string& field, size_t line_no) {
    std::string t = lower(field);
    if (t == "call" || t == "c") return OptionType::Call;
    if (t == "put" || t == "p") return OptionType::Put;
    throw std::runtime_error(line_error(line_no, "bad type '" + field + "'"));
}

}  // anonymous namespace

std::vector<OptionQuote> OptionChain::calls() const {
    std::vector<OptionQuote> out;
    std::copy_if(quotes.begin(), quotes.end(), std::back_inserter(out),
                 [](const OptionQuote& q) { return q.type == OptionType::Call; });
    return out;
}

std::vector<OptionQuote> OptionChain::puts() const {
    std::vector<OptionQuote> out;
    std::copy_if(quotes.begin(), quotes.end(), std::back_inserter(out),
                 [](const OptionQuote& q) { return q.type == OptionType::Put; });
    return out;
}

std::vector<double> OptionChain::strikes(OptionType type) const {
    std::vector<double> out;
    for (const auto& q : quotes) {
        if (q.type == type) out.push_back(q.strike);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::string OptionChain::to_string() const {
    return "OptionChain(underlying=" + underlying + ", expiry=" + expiry +
           ", spot=" + std::to_string(spot) + ", maturity=" + std::to_string(maturity) +
           ", quotes=" + std::to_string(quotes.size()) + ")";
}

OptionChain read_option_chain_csv(std::istream& in, const ChainHeader& header) {
    OptionChain chain;
    chain.underlying = header.underlying;
    chain.expiry = header.expiry;
    chain.spot = header.spot;
    chain.maturity = header.maturity;
    chain.rate = header.rate;
    chain.dividend = header.dividend;

    std::string line;
    size_t line_no = 0;

    // Header row
    std::map<std::string, size_t> columns;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        std::vector<std::string> names = split_row(line);
        for (size_t i = 0; i < names.size(); ++i) {
            columns[lower(names[i])] = i;
        }
        break;
    }
    if (columns.empty()) {
        throw std::runtime_error("option chain CSV: missing header row");
    }
    for (const char* required : {"strike", "type", "last_price"}) {
        if (columns.find(required) == columns.end()) {
            throw std::runtime_error(std::string("option chain CSV: missing column '") +
                                     required + "'");
        }
    }

    auto column = [&](const std::vector<std::string>& fields, const std::string& name,
                      std::string& out) {
        auto it = columns.find(name);
        if (it == columns.end()) return false;
        if (it->second >= fields.size()) {
            throw std::runtime_error(line_error(line_no, "missing field '" + name + "'"));
        }
        out = fields[it->second];
        return true;
    };

    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;

        std::vector<std::string> fields = split_row(line);
        OptionQuote quote;
        std::string field;

        column(fields, "strike", field);
        quote.strike = parse_double(field, "strike", line_no);
        if (!(quote.strike > 0.0)) {
            throw std::runtime_error(line_error(line_no, "strike must be positive"));
        }

        column(fields, "type", field);
        quote.type = parse_type(field, line_no);

        column(fields, "last_price", field);
        quote.last_price = parse_double(field, "last_price", line_no);

        if (column(fields, "bid", field)) quote.bid = parse_double(field, "bid", line_no);
        if (column(fields, "ask", field)) quote.ask = parse_double(field, "ask", line_no);
        if (column(fields, "implied_vol", field)) {
            quote.implied_vol = parse_double(field, "implied_vol", line_no);
        }
        if (column(fields, "volume", field)) {
            quote.volume = parse_long(field, "volume", line_no);
        }
        if (column(fields, "open_interest", field)) {
            quote.open_interest = parse_long(field, "open_interest", line_no);
        }

        chain.quotes.push_back(quote);
    }

    return chain;
}

OptionChain load_option_chain_csv(const std::string& path, const ChainHeader& header) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("option chain CSV: cannot open '" + path + "'");
    }
    return read_option_chain_csv(file, header);
}

VolSmile compute_smile(const OptionChain& chain, OptionType type,
                       const solvers::ImpliedVolSolver& solver, PriceSource source) {
    std::vector<OptionQuote> quotes = type == OptionType::Call ? chain.calls() : chain.puts();
    std::sort(quotes.begin(), quotes.end(),
              [](const OptionQuote& a, const OptionQuote& b) { return a.strike < b.strike; });

    const Eigen::Index n = static_cast<Eigen::Index>(quotes.size());
    VolSmile smile;
    smile.type = type;
    smile.strikes.resize(n);
    smile.model_vols.resize(n);
    smile.provider_vols.resize(n);
    smile.converged = Eigen::VectorXi::Zero(n);

    for (Eigen::Index i = 0; i < n; ++i) {
        const OptionQuote& quote = quotes[static_cast<size_t>(i)];
        smile.strikes(i) = quote.strike;
        smile.provider_vols(i) = quote.implied_vol;
        smile.model_vols(i) = NaN;

        double price = source == PriceSource::Mid ? quote.mid() : quote.last_price;
        if (!(price > 0.0)) continue;

        solvers::ImpliedVolResult result = solver.solve(chain.market_inputs(quote), price, type);
        if (result.converged) {
            smile.model_vols(i) = result.volatility;
            smile.converged(i) = 1;
            ++smile.n_converged;
        }
    }

    return smile;
}

SmileSummary summarize_smile(const VolSmile& smile) {
    std::vector<double> vols;
    double abs_diff_sum = 0.0;
    size_t n_diff = 0;

    for (Eigen::Index i = 0; i < smile.strikes.size(); ++i) {
        if (!smile.converged(i)) continue;
        vols.push_back(smile.model_vols(i));
        if (smile.provider_vols(i) > 0.0) {
            abs_diff_sum += std::abs(smile.model_vols(i) - smile.provider_vols(i));
            ++n_diff;
        }
    }

    if (vols.empty()) {
        throw std::invalid_argument("summarize_smile: no converged points");
    }

    SmileSummary summary;
    summary.n_points = vols.size();
    summary.mean_model_vol = mean(vols);
    summary.std_model_vol = vols.size() > 1 ? std_dev(vols) : 0.0;
    summary.mean_abs_provider_diff = n_diff > 0 ? abs_diff_sum / static_cast<double>(n_diff)
                                                : NaN;
    auto [min_it, max_it] = std::minmax_element(vols.begin(), vols.end());
    summary.min_model_vol = *min_it;
    summary.max_model_vol = *max_it;
    return summary;
}

}  // namespace ivlab::market
