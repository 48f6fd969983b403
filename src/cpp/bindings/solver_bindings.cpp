/**
 * @file solver_bindings.cpp
 * @brief pybind11 bindings for the implied volatility solvers
 */

#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "solvers/implied_vol.hpp"

namespace py = pybind11;
using namespace ivlab::solvers;

void bind_implied_vol(py::module_& m) {
    py::enum_<ImpliedVolMethod>(m, "ImpliedVolMethod")
        .value("Newton", ImpliedVolMethod::Newton)
        .value("Bisection", ImpliedVolMethod::Bisection)
        .value("Brent", ImpliedVolMethod::Brent);

    py::class_<ImpliedVolConfig>(m, "ImpliedVolConfig",
        R"doc(
        Implied volatility solver settings.

        Newton uses initial_guess, step_tolerance, derivative_floor, fd_bump,
        min_volatility and max_iterations. Bisection searches
        [vol_lower, vol_upper] for bisection_iterations steps and stops when
        prices agree to price_decimals. Brent searches the same interval.
        )doc")
        .def(py::init<>())
        .def_readwrite("method", &ImpliedVolConfig::method)
        .def_readwrite("initial_guess", &ImpliedVolConfig::initial_guess)
        .def_readwrite("step_tolerance", &ImpliedVolConfig::step_tolerance)
        .def_readwrite("derivative_floor", &ImpliedVolConfig::derivative_floor)
        .def_readwrite("fd_bump", &ImpliedVolConfig::fd_bump)
        .def_readwrite("min_volatility", &ImpliedVolConfig::min_volatility)
        .def_readwrite("max_iterations", &ImpliedVolConfig::max_iterations)
        .def_readwrite("vol_lower", &ImpliedVolConfig::vol_lower)
        .def_readwrite("vol_upper", &ImpliedVolConfig::vol_upper)
        .def_readwrite("bisection_iterations", &ImpliedVolConfig::bisection_iterations)
        .def_readwrite("price_decimals", &ImpliedVolConfig::price_decimals)
        .def_readwrite("vol_tolerance", &ImpliedVolConfig::vol_tolerance)
        .def_readwrite("price_tolerance", &ImpliedVolConfig::price_tolerance)
        .def("validate", &ImpliedVolConfig::validate)
        .def("__repr__", &ImpliedVolConfig::to_string);

    py::class_<ImpliedVolResult>(m, "ImpliedVolResult",
        R"doc(
        Implied volatility with diagnostics.

        Attributes:
            volatility: Estimate (NaN when the price admits none)
            model_price: Black-Scholes price at the estimate
            price_error: model_price - market_price
            iterations: Iterations performed
            converged: Whether the stopping test was met
            method: Method used
            message: Stop reason
        )doc")
        .def(py::init<>())
        .def_readonly("volatility", &ImpliedVolResult::volatility)
        .def_readonly("model_price", &ImpliedVolResult::model_price)
        .def_readonly("price_error", &ImpliedVolResult::price_error)
        .def_readonly("iterations", &ImpliedVolResult::iterations)
        .def_readonly("converged", &ImpliedVolResult::converged)
        .def_readonly("method", &ImpliedVolResult::method)
        .def_readonly("message", &ImpliedVolResult::message)
        .def("__repr__", &ImpliedVolResult::to_string);

    py::class_<ImpliedVolSolver>(m, "ImpliedVolSolver")
        .def(py::init<>())
        .def(py::init<const ImpliedVolConfig&>(), py::arg("config"))
        .def_property("config", &ImpliedVolSolver::config, &ImpliedVolSolver::set_config)
        .def("solve", &ImpliedVolSolver::solve,
             py::arg("inputs"), py::arg("market_price"), py::arg("type"),
             "Solve with the configured method")
        .def("solve_newton", &ImpliedVolSolver::solve_newton,
             py::arg("inputs"), py::arg("market_price"), py::arg("type"))
        .def("solve_bisection", &ImpliedVolSolver::solve_bisection,
             py::arg("inputs"), py::arg("market_price"), py::arg("type"))
        .def("solve_brent", &ImpliedVolSolver::solve_brent,
             py::arg("inputs"), py::arg("market_price"), py::arg("type"))
        .def("solve_many", &ImpliedVolSolver::solve_many,
             py::arg("inputs"), py::arg("market_prices"), py::arg("types"))
        .def("implied_vols", &ImpliedVolSolver::implied_vols,
             py::arg("inputs"), py::arg("strikes"), py::arg("market_prices"), py::arg("type"),
             "Implied volatilities of a strike strip; NaN where not converged");

    m.def("implied_volatility", &implied_volatility,
          py::arg("spot"), py::arg("strike"), py::arg("rate"), py::arg("maturity"),
          py::arg("market_price"), py::arg("type"),
          py::arg("method") = ImpliedVolMethod::Newton,
          "Implied volatility with default settings and no dividends");
}
