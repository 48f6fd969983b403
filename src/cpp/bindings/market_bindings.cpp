/**
 * @file market_bindings.cpp
 * @brief pybind11 bindings for option chains and volatility smiles
 */

#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "market/option_chain.hpp"

namespace py = pybind11;
using namespace ivlab::market;

void bind_market(py::module_& m) {
    py::enum_<PriceSource>(m, "PriceSource")
        .value("Last", PriceSource::Last)
        .value("Mid", PriceSource::Mid);

    py::class_<OptionQuote>(m, "OptionQuote")
        .def(py::init<>())
        .def_readwrite("strike", &OptionQuote::strike)
        .def_readwrite("type", &OptionQuote::type)
        .def_readwrite("last_price", &OptionQuote::last_price)
        .def_readwrite("bid", &OptionQuote::bid)
        .def_readwrite("ask", &OptionQuote::ask)
        .def_readwrite("implied_vol", &OptionQuote::implied_vol)
        .def_readwrite("volume", &OptionQuote::volume)
        .def_readwrite("open_interest", &OptionQuote::open_interest)
        .def("mid", &OptionQuote::mid)
        .def("has_two_sided_market", &OptionQuote::has_two_sided_market);

    py::class_<ChainHeader>(m, "ChainHeader")
        .def(py::init<>())
        .def_readwrite("underlying", &ChainHeader::underlying)
        .def_readwrite("expiry", &ChainHeader::expiry)
        .def_readwrite("spot", &ChainHeader::spot)
        .def_readwrite("maturity", &ChainHeader::maturity)
        .def_readwrite("rate", &ChainHeader::rate)
        .def_readwrite("dividend", &ChainHeader::dividend);

    py::class_<OptionChain>(m, "OptionChain")
        .def(py::init<>())
        .def_readwrite("underlying", &OptionChain::underlying)
        .def_readwrite("expiry", &OptionChain::expiry)
        .def_readwrite("spot", &OptionChain::spot)
        .def_readwrite("maturity", &OptionChain::maturity)
        .def_readwrite("rate", &OptionChain::rate)
        .def_readwrite("dividend", &OptionChain::dividend)
        .def_readwrite("quotes", &OptionChain::quotes)
        .def("calls", &OptionChain::calls)
        .def("puts", &OptionChain::puts)
        .def("strikes", &OptionChain::strikes, py::arg("type"))
        .def("market_inputs", &OptionChain::market_inputs, py::arg("quote"))
        .def("__repr__", &OptionChain::to_string);

    m.def("load_option_chain_csv", &load_option_chain_csv,
          py::arg("path"), py::arg("header"),
          R"doc(
          Load quotes from a CSV file.

          Header row required; columns strike, type, last_price are mandatory,
          bid, ask, implied_vol, volume, open_interest optional.

          Raises:
              RuntimeError: if the file cannot be opened or a row is malformed
          )doc");

    py::class_<VolSmile>(m, "VolSmile")
        .def_readonly("type", &VolSmile::type)
        .def_readonly("strikes", &VolSmile::strikes)
        .def_readonly("model_vols", &VolSmile::model_vols)
        .def_readonly("provider_vols", &VolSmile::provider_vols)
        .def_readonly("converged", &VolSmile::converged)
        .def_readonly("n_converged", &VolSmile::n_converged)
        .def("__len__", &VolSmile::size);

    py::class_<SmileSummary>(m, "SmileSummary")
        .def_readonly("mean_model_vol", &SmileSummary::mean_model_vol)
        .def_readonly("std_model_vol", &SmileSummary::std_model_vol)
        .def_readonly("mean_abs_provider_diff", &SmileSummary::mean_abs_provider_diff)
        .def_readonly("min_model_vol", &SmileSummary::min_model_vol)
        .def_readonly("max_model_vol", &SmileSummary::max_model_vol)
        .def_readonly("n_points", &SmileSummary::n_points);

    m.def("compute_smile", &compute_smile,
          py::arg("chain"), py::arg("type"), py::arg("solver"),
          py::arg("source") = PriceSource::Last,
          "Implied volatility for every quote of one type, sorted by strike");
    m.def("summarize_smile", &summarize_smile, py::arg("smile"),
          "Statistics over converged smile points; raises ValueError if none converged");
}
