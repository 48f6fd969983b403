/**
 * @file ivlab_cpp.cpp
 * @brief Main pybind11 module combining all C++ bindings
 *
 * Builds the 'ivlab_cpp' Python extension module exposing the Black-Scholes
 * pricer, the implied volatility solvers and option chain utilities.
 */

#include <pybind11/pybind11.h>

namespace py = pybind11;

// Forward declarations of binding functions
void bind_pricing(py::module_& m);
void bind_implied_vol(py::module_& m);
void bind_market(py::module_& m);

PYBIND11_MODULE(ivlab_cpp, m) {
    m.doc() = R"doc(
        Implied volatility toolkit

        Submodules:
            pricing: Black-Scholes European option prices and price bounds
            solvers: Implied volatility by Newton, bisection or Brent
            market: Option chain snapshots and volatility smiles

        Example:
            >>> from ivlab_cpp import pricing, solvers
            >>> inputs = pricing.MarketInputs(100.0, 100.0, 0.05, 1.0)
            >>> price = pricing.BlackScholes.price(inputs, 0.2, pricing.OptionType.Call)
            >>> solver = solvers.ImpliedVolSolver()
            >>> result = solver.solve(inputs, price, pricing.OptionType.Call)
            >>> result.volatility
            0.2
    )doc";

    py::module_ pricing_module = m.def_submodule("pricing",
        R"doc(
        Black-Scholes closed-form pricing.

        Classes:
            OptionType: Call or Put
            MarketInputs: spot, strike, rate, dividend, maturity
            PriceBounds: no-arbitrage price interval
            BlackScholes: static pricing functions
        )doc");

    py::module_ solvers_module = m.def_submodule("solvers",
        R"doc(
        Implied volatility root finders.

        Classes:
            ImpliedVolMethod: Newton, Bisection, Brent
            ImpliedVolConfig: solver settings
            ImpliedVolResult: volatility with convergence diagnostics
            ImpliedVolSolver: solve single quotes or batches
        )doc");

    py::module_ market_module = m.def_submodule("market",
        R"doc(
        Option chain data and volatility smiles.

        Classes:
            OptionQuote, OptionChain, ChainHeader: chain snapshot
            VolSmile, SmileSummary: implied volatility by strike
        )doc");

    bind_pricing(pricing_module);
    bind_implied_vol(solvers_module);
    bind_market(market_module);

    m.attr("__version__") = "0.1.0";
}
