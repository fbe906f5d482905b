// SPDX-License-Identifier: MIT
/**
 * @file dvolkit_bindings.cpp
 * @brief Python bindings for the DVOL/VoV pipeline using pybind11
 *
 * Timestamps cross the boundary as epoch milliseconds. Insufficient data
 * comes back as None; invalid input raises ValueError.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <map>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>
#include "src/dvol/dvol_index.hpp"
#include "src/dvol/expiry_variance.hpp"
#include "src/market/option_quote.hpp"
#include "src/pricing/black76.hpp"
#include "src/validation/index_comparator.hpp"
#include "src/vov/daily_resample.hpp"
#include "src/vov/vov_series.hpp"

namespace py = pybind11;

namespace {

// None for routine "no estimate", ValueError for a broken contract
template <typename T>
py::object result_or_none(const std::expected<T, dvolkit::DvolError>& result) {
    if (result.has_value()) {
        return py::cast(result.value());
    }
    if (dvolkit::is_insufficient_data(result.error())) {
        return py::none();
    }
    std::ostringstream msg;
    msg << result.error();
    throw py::value_error(msg.str());
}

std::optional<int64_t> to_optional_ms(const std::optional<dvolkit::UtcTime>& t) {
    if (!t) return std::nullopt;
    return dvolkit::to_epoch_ms(*t);
}

std::optional<dvolkit::UtcTime> from_optional_ms(const std::optional<int64_t>& ms) {
    if (!ms) return std::nullopt;
    return dvolkit::from_epoch_ms(*ms);
}

}  // namespace

PYBIND11_MODULE(dvolkit, m) {
    m.doc() = "Python bindings for dvolkit model-free DVOL and VoV computation";

    py::enum_<dvolkit::OptionType>(m, "OptionType")
        .value("CALL", dvolkit::OptionType::CALL)
        .value("PUT", dvolkit::OptionType::PUT);

    py::enum_<dvolkit::DvolQuality>(m, "DvolQuality")
        .value("HIGH", dvolkit::DvolQuality::High)
        .value("MEDIUM", dvolkit::DvolQuality::Medium)
        .value("LOW", dvolkit::DvolQuality::Low);

    py::class_<dvolkit::OptionQuote>(m, "OptionQuote")
        .def(py::init<>())
        .def(py::init([](double strike, std::optional<int64_t> expiry_ms,
                         dvolkit::OptionType type, double mark_iv) {
            dvolkit::OptionQuote q;
            q.strike = strike;
            q.expiry = from_optional_ms(expiry_ms);
            q.type = type;
            q.mark_iv = mark_iv;
            return q;
        }), py::arg("strike"), py::arg("expiry_ms"), py::arg("type"), py::arg("mark_iv"))
        .def_readwrite("strike", &dvolkit::OptionQuote::strike)
        .def_property("expiry_ms",
            [](const dvolkit::OptionQuote& q) { return to_optional_ms(q.expiry); },
            [](dvolkit::OptionQuote& q, std::optional<int64_t> ms) { q.expiry = from_optional_ms(ms); })
        .def_readwrite("type", &dvolkit::OptionQuote::type)
        .def_readwrite("mark_iv", &dvolkit::OptionQuote::mark_iv)
        .def_readwrite("mark_price", &dvolkit::OptionQuote::mark_price)
        .def_readwrite("underlying_price", &dvolkit::OptionQuote::underlying_price);

    py::class_<dvolkit::VarianceResult>(m, "VarianceResult")
        .def_readonly("variance", &dvolkit::VarianceResult::variance)
        .def_readonly("strike_count", &dvolkit::VarianceResult::strike_count)
        .def_readonly("n_contributions", &dvolkit::VarianceResult::n_contributions)
        .def_readonly("k0", &dvolkit::VarianceResult::k0);

    py::class_<dvolkit::DvolResult>(m, "DvolResult")
        .def_readonly("dvol", &dvolkit::DvolResult::dvol)
        .def_readonly("quality", &dvolkit::DvolResult::quality)
        .def_property_readonly("near_expiry_ms",
            [](const dvolkit::DvolResult& r) { return dvolkit::to_epoch_ms(r.near_expiry); })
        .def_property_readonly("far_expiry_ms",
            [](const dvolkit::DvolResult& r) { return dvolkit::to_epoch_ms(r.far_expiry); })
        .def_readonly("n_near_strikes", &dvolkit::DvolResult::n_near_strikes)
        .def_readonly("n_far_strikes", &dvolkit::DvolResult::n_far_strikes)
        .def("__repr__", [](const dvolkit::DvolResult& r) {
            return "<DvolResult dvol=" + std::to_string(r.dvol) +
                   " quality=" + std::string(dvolkit::to_string(r.quality)) +
                   " n_near=" + std::to_string(r.n_near_strikes) +
                   " n_far=" + std::to_string(r.n_far_strikes) + ">";
        });

    py::class_<dvolkit::DailyDvol>(m, "DailyDvol")
        .def(py::init([](std::string date, int64_t timestamp_ms, double dvol) {
            return dvolkit::DailyDvol{std::move(date), dvolkit::from_epoch_ms(timestamp_ms), dvol};
        }), py::arg("date"), py::arg("timestamp_ms"), py::arg("dvol"))
        .def_readonly("date", &dvolkit::DailyDvol::date)
        .def_property_readonly("timestamp_ms",
            [](const dvolkit::DailyDvol& d) { return dvolkit::to_epoch_ms(d.timestamp); })
        .def_readonly("dvol", &dvolkit::DailyDvol::dvol);

    py::class_<dvolkit::VovRecord>(m, "VovRecord")
        .def_readonly("date", &dvolkit::VovRecord::date)
        .def_property_readonly("timestamp_ms",
            [](const dvolkit::VovRecord& r) { return dvolkit::to_epoch_ms(r.timestamp); })
        .def_readonly("dvol_daily", &dvolkit::VovRecord::dvol_daily)
        .def_readonly("log_return", &dvolkit::VovRecord::log_return)
        .def_readonly("vov", &dvolkit::VovRecord::vov)
        .def_readonly("f_vov", &dvolkit::VovRecord::f_vov);

    py::class_<dvolkit::ComparisonReport>(m, "ComparisonReport")
        .def_readonly("n_days", &dvolkit::ComparisonReport::n_days)
        .def_readonly("correlation", &dvolkit::ComparisonReport::correlation)
        .def_readonly("mae", &dvolkit::ComparisonReport::mae)
        .def_readonly("rmse", &dvolkit::ComparisonReport::rmse)
        .def_readonly("bias", &dvolkit::ComparisonReport::bias)
        .def_readonly("passed", &dvolkit::ComparisonReport::passed);

    py::class_<dvolkit::InstrumentInfo>(m, "InstrumentInfo")
        .def_readonly("asset", &dvolkit::InstrumentInfo::asset)
        .def_property_readonly("expiry_ms",
            [](const dvolkit::InstrumentInfo& i) { return dvolkit::to_epoch_ms(i.expiry); })
        .def_readonly("strike", &dvolkit::InstrumentInfo::strike)
        .def_readonly("type", &dvolkit::InstrumentInfo::type);

    m.def("black76_price",
        [](double forward, double strike, double tau, double sigma,
           dvolkit::OptionType type, double rate) {
            return dvolkit::black76_price(forward, strike, tau, sigma, type, rate);
        },
        py::arg("forward"), py::arg("strike"), py::arg("tau"), py::arg("sigma"),
        py::arg("type"), py::arg("rate") = 0.0,
        "Black-76 price of a European option on a forward");

    m.def("normalize_vol_quote", &dvolkit::normalize_vol_quote, py::arg("raw"),
        "Decimal volatility from a decimal or percentage quote, or None");

    m.def("parse_instrument_name",
        [](const std::string& name) { return dvolkit::parse_instrument_name(name); },
        py::arg("name"));

    m.def("compute_expiry_variance",
        [](const std::vector<dvolkit::OptionQuote>& quotes, double tau, double forward, double rate) {
            return result_or_none(dvolkit::compute_expiry_variance(quotes, tau, forward, rate));
        },
        py::arg("quotes"), py::arg("tau"), py::arg("forward"), py::arg("rate") = 0.0,
        R"pbdoc(
            Model-free variance of one expiry.

            Returns:
                VarianceResult, or None when the strike grid is insufficient

            Raises:
                ValueError: On non-finite or non-positive strikes
        )pbdoc");

    m.def("compute_dvol_at_hour",
        [](const std::vector<dvolkit::OptionQuote>& quotes, int64_t snapshot_hour_ms,
           double spot, std::optional<std::map<int64_t, double>> forwards) {
            dvolkit::ForwardCurve curve;
            if (forwards) {
                for (const auto& [expiry_ms, fwd] : *forwards) {
                    curve.insert(dvolkit::from_epoch_ms(expiry_ms), fwd);
                }
            }
            return result_or_none(dvolkit::compute_dvol_at_hour(
                quotes, dvolkit::from_epoch_ms(snapshot_hour_ms), spot,
                forwards ? &curve : nullptr));
        },
        py::arg("quotes"), py::arg("snapshot_hour_ms"), py::arg("spot"),
        py::arg("forwards") = py::none(),
        "30-day DVOL for one snapshot hour, or None when data is insufficient");

    m.def("resample_dvol_daily",
        [](const std::vector<std::pair<int64_t, double>>& hourly) {
            std::vector<dvolkit::DvolObservation> obs;
            obs.reserve(hourly.size());
            for (const auto& [ts, dvol] : hourly) {
                obs.push_back({dvolkit::from_epoch_ms(ts), dvol});
            }
            return dvolkit::resample_dvol_daily(obs);
        },
        py::arg("hourly"), "Last positive value per UTC day from (timestamp_ms, dvol) pairs");

    m.def("compute_vov_series",
        [](const std::vector<dvolkit::DailyDvol>& daily, size_t window) {
            dvolkit::VovConfig config;
            config.window = window;
            if (auto ok = dvolkit::validate_vov_config(config); !ok) {
                throw py::value_error("window must be at least min_valid_returns");
            }
            return dvolkit::compute_vov_series(daily, config);
        },
        py::arg("daily"), py::arg("window") = 30);

    m.def("add_f_vov_to_series",
        [](std::vector<dvolkit::VovRecord> records, double alpha) {
            dvolkit::VovConfig config;
            config.alpha = alpha;
            if (auto ok = dvolkit::validate_vov_config(config); !ok) {
                throw py::value_error("alpha must be positive");
            }
            dvolkit::add_f_vov_to_series(records, config);
            return records;
        },
        py::arg("records"), py::arg("alpha") = 0.75);

    m.def("compare_with_official_index",
        [](const std::vector<std::pair<int64_t, double>>& official,
           const std::vector<std::tuple<int64_t, double, dvolkit::DvolQuality>>& computed) {
            std::vector<dvolkit::IndexObservation> off;
            for (const auto& [ts, value] : official) {
                off.push_back({dvolkit::from_epoch_ms(ts), value});
            }
            std::vector<dvolkit::QualifiedDvol> comp;
            for (const auto& [ts, dvol, quality] : computed) {
                comp.push_back({dvolkit::from_epoch_ms(ts), dvol, quality});
            }
            return result_or_none(dvolkit::compare_with_official_index(off, comp));
        },
        py::arg("official"), py::arg("computed"),
        "Daily agreement report, or None with fewer than 5 common days");
}
