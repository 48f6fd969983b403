/**
 * @file pricing_bindings.cpp
 * @brief pybind11 bindings for the Black-Scholes pricer
 */

#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "models/black_scholes.hpp"

namespace py = pybind11;
using namespace ivlab::models;

void bind_pricing(py::module_& m) {
    py::enum_<OptionType>(m, "OptionType")
        .value("Call", OptionType::Call)
        .value("Put", OptionType::Put);

    py::class_<MarketInputs>(m, "MarketInputs",
        R"doc(
        Market observables for one European option.

        Attributes:
            spot: Underlying price S
            strike: Strike K
            rate: Continuously compounded risk-free rate r
            dividend: Continuous dividend yield q
            maturity: Time to maturity T in years
        )doc")
        .def(py::init<>())
        .def(py::init<double, double, double, double, double>(),
             py::arg("spot"), py::arg("strike"), py::arg("rate"),
             py::arg("maturity"), py::arg("dividend") = 0.0)
        .def_readwrite("spot", &MarketInputs::spot)
        .def_readwrite("strike", &MarketInputs::strike)
        .def_readwrite("rate", &MarketInputs::rate)
        .def_readwrite("dividend", &MarketInputs::dividend)
        .def_readwrite("maturity", &MarketInputs::maturity)
        .def("forward", &MarketInputs::forward, "Forward price S exp((r - q) T)")
        .def("discount_factor", &MarketInputs::discount_factor)
        .def("is_valid", &MarketInputs::is_valid)
        .def("validate", &MarketInputs::validate,
             "Validate inputs and raise ValueError if invalid")
        .def("__repr__", &MarketInputs::to_string);

    py::class_<PriceBounds>(m, "PriceBounds", "No-arbitrage price interval")
        .def_readonly("lower", &PriceBounds::lower)
        .def_readonly("upper", &PriceBounds::upper)
        .def("contains", &PriceBounds::contains);

    py::class_<BlackScholes>(m, "BlackScholes",
        R"doc(
        Black-Scholes-Merton European option pricing. All methods are static.
        )doc")
        .def_static("price", &BlackScholes::price,
                    py::arg("inputs"), py::arg("sigma"), py::arg("type"),
                    R"doc(
                    European option price.

                    Returns intrinsic value when maturity is zero and the
                    discounted forward payoff when sigma <= 0.
                    )doc")
        .def_static("intrinsic", &BlackScholes::intrinsic,
                    py::arg("inputs"), py::arg("type"))
        .def_static("price_bounds", &BlackScholes::price_bounds,
                    py::arg("inputs"), py::arg("type"),
                    "Model-free [lower, upper] bounds on the option price")
        .def_static("parity_residual", &BlackScholes::parity_residual,
                    py::arg("inputs"), py::arg("call_price"), py::arg("put_price"),
                    "C - P - (S exp(-qT) - K exp(-rT))")
        .def_static("price_curve", &BlackScholes::price_curve,
                    py::arg("inputs"), py::arg("sigmas"), py::arg("type"),
                    "Prices for a vector of volatilities");
}
