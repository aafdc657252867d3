#include "bind_forward.hpp"
#include <quotatrack/quotatrack.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>

using namespace quotatrack;

// ---------------------------------------------------------------------------
// bind_analytics  --  window, billing periods, rates, classifications
// ---------------------------------------------------------------------------
void bind_analytics(py::module_& m) {

    // ===================================================================
    // TrackerWindow
    // ===================================================================
    py::class_<WindowPoint>(m, "WindowPoint")
        .def(py::init<>())
        .def_readwrite("timestamp", &WindowPoint::timestamp)
        .def_readwrite("consumed",  &WindowPoint::consumed);

    py::class_<TrackerWindow>(m, "TrackerWindow")
        .def(py::init<Duration>(), py::arg("span") = Duration(std::chrono::minutes(30)))
        .def("add",     &TrackerWindow::add, py::arg("timestamp"), py::arg("consumed"))
        .def("clear",   &TrackerWindow::clear)
        .def("oldest",  &TrackerWindow::oldest)
        .def("newest",  &TrackerWindow::newest)
        .def("points",  &TrackerWindow::points)
        .def("recent_points", &TrackerWindow::recent_points, py::arg("now"))
        .def("elapsed", &TrackerWindow::elapsed)
        .def("span",    &TrackerWindow::span)
        .def("__len__", &TrackerWindow::size);

    // ===================================================================
    // Billing periods
    // ===================================================================
    py::class_<BillingPeriod>(m, "BillingPeriod")
        .def(py::init<>())
        .def_readwrite("start",       &BillingPeriod::start)
        .def_readwrite("end",         &BillingPeriod::end)
        .def_readwrite("max_peak",    &BillingPeriod::max_peak)
        .def_readwrite("cycle_count", &BillingPeriod::cycle_count);

    m.def("group_billing_periods", &group_billing_periods,
          py::arg("cycles_newest_first"), py::arg("min_signal") = 0.0);

    py::class_<BillingSummary>(m, "BillingSummary")
        .def(py::init<>())
        .def(py::init<std::vector<BillingPeriod>>(), py::arg("periods"))
        .def_static("from_cycles", &BillingSummary::from_cycles,
                    py::arg("cycles_newest_first"), py::arg("min_signal") = 0.0)
        .def("count",     &BillingSummary::count)
        .def("sum",       &BillingSummary::sum)
        .def("average",   &BillingSummary::average)
        .def("max",       &BillingSummary::max)
        .def("sum_since", &BillingSummary::sum_since, py::arg("since"))
        .def("recent_and_older_average", &BillingSummary::recent_and_older_average)
        .def("periods",   &BillingSummary::periods);

    // ===================================================================
    // Rates and projections
    // ===================================================================
    py::enum_<RateSource>(m, "RateSource")
        .value("NoRate",       RateSource::None)
        .value("Window",       RateSource::Window)
        .value("CycleAverage", RateSource::CycleAverage)
        .export_values();

    py::class_<RateEstimate>(m, "RateEstimate")
        .def(py::init<>())
        .def_readwrite("per_hour", &RateEstimate::per_hour)
        .def_readwrite("source",   &RateEstimate::source)
        .def_readwrite("basis",    &RateEstimate::basis)
        .def("has_rate", &RateEstimate::has_rate)
        .def("is_idle",  &RateEstimate::is_idle);

    py::class_<Projection>(m, "Projection")
        .def(py::init<>())
        .def_readwrite("current",             &Projection::current)
        .def_readwrite("limit",               &Projection::limit)
        .def_readwrite("rate_per_hour",       &Projection::rate_per_hour)
        .def_readwrite("hours_until_reset",   &Projection::hours_until_reset)
        .def_readwrite("projected",           &Projection::projected)
        .def_readwrite("projected_percent",   &Projection::projected_percent)
        .def_readwrite("hours_to_exhaustion", &Projection::hours_to_exhaustion)
        .def_readwrite("exhaustion_time",     &Projection::exhaustion_time)
        .def_readwrite("exhausts_first",      &Projection::exhausts_first);

    py::class_<RateEngine>(m, "RateEngine")
        .def(py::init<RateConfig>(), py::arg("config") = RateConfig{})
        .def("window_rate",        &RateEngine::window_rate, py::arg("points"))
        .def("cycle_average_rate", &RateEngine::cycle_average_rate,
             py::arg("cycles"), py::arg("now"))
        .def("estimate",           &RateEngine::estimate,
             py::arg("points"), py::arg("cycles"), py::arg("now"))
        .def_static("project",     &RateEngine::project,
                    py::arg("current"), py::arg("limit"), py::arg("rate"),
                    py::arg("resets_at"), py::arg("now"));

    // ===================================================================
    // Classifications
    // ===================================================================
    py::enum_<UsageLevel>(m, "UsageLevel")
        .value("Healthy",  UsageLevel::Healthy)
        .value("Warning",  UsageLevel::Warning)
        .value("Danger",   UsageLevel::Danger)
        .value("Critical", UsageLevel::Critical);

    py::enum_<TrendDirection>(m, "TrendDirection")
        .value("Rising",  TrendDirection::Rising)
        .value("Falling", TrendDirection::Falling)
        .value("Stable",  TrendDirection::Stable);

    py::enum_<VarianceLevel>(m, "VarianceLevel")
        .value("High",       VarianceLevel::High)
        .value("Moderate",   VarianceLevel::Moderate)
        .value("Consistent", VarianceLevel::Consistent);

    py::enum_<UtilizationFit>(m, "UtilizationFit")
        .value("UnderUtilized", UtilizationFit::UnderUtilized)
        .value("Headroom",      UtilizationFit::Headroom)
        .value("GoodFit",       UtilizationFit::GoodFit)
        .value("Approaching",   UtilizationFit::Approaching)
        .value("NearLimit",     UtilizationFit::NearLimit);

    py::enum_<ForecastState>(m, "ForecastState")
        .value("Analyzing",      ForecastState::Analyzing)
        .value("Idle",           ForecastState::Idle)
        .value("ExhaustsFirst",  ForecastState::ExhaustsFirst)
        .value("HighProjection", ForecastState::HighProjection)
        .value("Comfortable",    ForecastState::Comfortable);

    py::class_<UsageClassification>(m, "UsageClassification")
        .def(py::init<>())
        .def_readwrite("percent",  &UsageClassification::percent)
        .def_readwrite("level",    &UsageClassification::level)
        .def_readwrite("severity", &UsageClassification::severity);

    py::class_<TrendClassification>(m, "TrendClassification")
        .def(py::init<>())
        .def_readwrite("recent_average", &TrendClassification::recent_average)
        .def_readwrite("older_average",  &TrendClassification::older_average)
        .def_readwrite("change_percent", &TrendClassification::change_percent)
        .def_readwrite("direction",      &TrendClassification::direction)
        .def_readwrite("severity",       &TrendClassification::severity)
        .def_readwrite("summary",        &TrendClassification::summary);

    py::class_<VarianceClassification>(m, "VarianceClassification")
        .def(py::init<>())
        .def_readwrite("peak",           &VarianceClassification::peak)
        .def_readwrite("average",        &VarianceClassification::average)
        .def_readwrite("spread_percent", &VarianceClassification::spread_percent)
        .def_readwrite("level",          &VarianceClassification::level)
        .def_readwrite("severity",       &VarianceClassification::severity)
        .def_readwrite("summary",        &VarianceClassification::summary);

    py::class_<CycleUtilizationClassification>(m, "CycleUtilizationClassification")
        .def(py::init<>())
        .def_readwrite("percent",  &CycleUtilizationClassification::percent)
        .def_readwrite("fit",      &CycleUtilizationClassification::fit)
        .def_readwrite("severity", &CycleUtilizationClassification::severity)
        .def_readwrite("summary",  &CycleUtilizationClassification::summary);

    py::class_<ForecastClassification>(m, "ForecastClassification")
        .def(py::init<>())
        .def_readwrite("state",    &ForecastClassification::state)
        .def_readwrite("severity", &ForecastClassification::severity)
        .def_readwrite("summary",  &ForecastClassification::summary);

    py::class_<WeeklyPaceClassification>(m, "WeeklyPaceClassification")
        .def(py::init<>())
        .def_readwrite("week_total",         &WeeklyPaceClassification::week_total)
        .def_readwrite("month_total",        &WeeklyPaceClassification::month_total)
        .def_readwrite("monthly_projection", &WeeklyPaceClassification::monthly_projection)
        .def_readwrite("share_percent",      &WeeklyPaceClassification::share_percent)
        .def_readwrite("severity",           &WeeklyPaceClassification::severity)
        .def_readwrite("summary",            &WeeklyPaceClassification::summary);

    m.def("classify_usage",             &classify_usage, py::arg("percent"));
    m.def("severity_from_percent",      &severity_from_percent, py::arg("percent"));
    m.def("classify_trend",             &classify_trend,
          py::arg("recent_average"), py::arg("older_average"));
    m.def("trend_from_periods",         &trend_from_periods, py::arg("summary"));
    m.def("classify_variance",          &classify_variance,
          py::arg("peak"), py::arg("average"));
    m.def("classify_cycle_utilization", &classify_cycle_utilization,
          py::arg("average_per_period"), py::arg("limit"));
    m.def("classify_forecast",          &classify_forecast,
          py::arg("rate"), py::arg("projection"));
    m.def("classify_weekly_pace",       &classify_weekly_pace,
          py::arg("week_total"), py::arg("month_total"),
          py::arg("limit"), py::arg("periods_per_month"));
    m.def("format_hours",               &format_hours, py::arg("hours"));
}
