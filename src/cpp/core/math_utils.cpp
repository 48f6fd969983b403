#include "core/math_utils.hpp"

#include <string>

namespace ivlab {

double mean(const std::vector<double>& data) {
    if (data.empty()) {
        throw std::invalid_argument("Cannot compute mean of empty vector");
    }
    return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

double variance(const std::vector<double>& data, int ddof) {
    if (ddof < 0) {
        throw std::invalid_argument("ddof must be non-negative");
    }
    if (data.size() <= static_cast<size_t>(ddof)) {
        throw std::invalid_argument("Not enough data points for variance calculation");
    }

    double m = mean(data);
    double sum_sq = 0.0;
    for (const auto& x : data) {
        double diff = x - m;
        sum_sq += diff * diff;
    }
    return sum_sq / static_cast<double>(data.size() - ddof);
}

double std_dev(const std::vector<double>& data, int ddof) {
    return std::sqrt(variance(data, ddof));
}

double norm_cdf(double x) {
    // Phi(x) = 0.5 * erfc(-x / sqrt(2)); erfc keeps precision in the lower tail
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double norm_pdf(double x) {
    constexpr double inv_sqrt_2pi = 0.3989422804014327;
    return inv_sqrt_2pi * std::exp(-0.5 * x * x);
}

double round_to(double x, int decimals) {
    if (decimals < 0) {
        throw std::invalid_argument("round_to: decimals must be non-negative, got " +
                                    std::to_string(decimals));
    }
    double scale = std::pow(10.0, decimals);
    return std::round(x * scale) / scale;
}

} // namespace ivlab
