#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <quotatrack/quotatrack.hpp>

using namespace quotatrack;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_quotatrack, m) {
    m.doc() = "QuotaTrack: quota cycle tracking, billing periods and burn-rate forecasts";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_core(m);
    bind_monitors(m);
    bind_analytics(m);
    bind_providers(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<CounterKind>(m, "CounterKind")
        .value("IncreasingUsage",    CounterKind::IncreasingUsage)
        .value("RemainingBudget",    CounterKind::RemainingBudget)
        .value("UtilizationPercent", CounterKind::UtilizationPercent)
        .export_values();

    py::enum_<IngestOutcome>(m, "IngestOutcome")
        .value("Created",    IngestOutcome::Created)
        .value("Continued",  IngestOutcome::Continued)
        .value("Reset",      IngestOutcome::Reset)
        .value("OutOfOrder", IngestOutcome::OutOfOrder)
        .value("Discarded",  IngestOutcome::Discarded)
        .export_values();

    py::enum_<ResetReason>(m, "ResetReason")
        .value("NoReset",             ResetReason::None)
        .value("DropBelowRatio",      ResetReason::DropBelowRatio)
        .value("ReportedResetPassed", ResetReason::ReportedResetPassed)
        .export_values();

    py::enum_<Severity>(m, "Severity")
        .value("Positive", Severity::Positive)
        .value("Info",     Severity::Info)
        .value("Warning",  Severity::Warning)
        .value("Negative", Severity::Negative)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("QuotaRegistered",  EventType::QuotaRegistered)
        .value("CycleCreated",     EventType::CycleCreated)
        .value("CycleUpdated",     EventType::CycleUpdated)
        .value("ResetDetected",    EventType::ResetDetected)
        .value("CycleClosed",      EventType::CycleClosed)
        .value("SampleOutOfOrder", EventType::SampleOutOfOrder)
        .value("SampleDiscarded",  EventType::SampleDiscarded)
        .value("StoreFailure",     EventType::StoreFailure)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Structs ----------------------------------------------------------

    // QuotaKey
    py::class_<QuotaKey>(m, "QuotaKey")
        .def(py::init<>())
        .def(py::init([](std::string provider, std::string quota) {
                 return QuotaKey{std::move(provider), std::move(quota)};
             }),
             py::arg("provider"), py::arg("quota"))
        .def_readwrite("provider", &QuotaKey::provider)
        .def_readwrite("quota",    &QuotaKey::quota)
        .def("__eq__", &QuotaKey::operator==)
        .def("__hash__", [](const QuotaKey& k) { return std::hash<QuotaKey>{}(k); })
        .def("__str__", &QuotaKey::to_string)
        .def("__repr__", [](const QuotaKey& k) {
            return "<QuotaKey '" + k.to_string() + "'>";
        });

    // QuotaDescriptor
    py::class_<QuotaDescriptor>(m, "QuotaDescriptor")
        .def(py::init<>())
        .def_readwrite("key",          &QuotaDescriptor::key)
        .def_readwrite("kind",         &QuotaDescriptor::kind)
        .def_readwrite("value_field",  &QuotaDescriptor::value_field)
        .def_readwrite("limit_field",  &QuotaDescriptor::limit_field)
        .def_readwrite("fixed_limit",  &QuotaDescriptor::fixed_limit)
        .def_readwrite("display_name", &QuotaDescriptor::display_name)
        .def_readwrite("drop_ratio",   &QuotaDescriptor::drop_ratio)
        .def_readwrite("min_signal",   &QuotaDescriptor::min_signal)
        .def("name", &QuotaDescriptor::name);

    // QuotaSample
    py::class_<QuotaSample>(m, "QuotaSample")
        .def(py::init<>())
        .def_readwrite("key",       &QuotaSample::key)
        .def_readwrite("timestamp", &QuotaSample::timestamp)
        .def_readwrite("fields",    &QuotaSample::fields)
        .def_readwrite("limit",     &QuotaSample::limit)
        .def_readwrite("resets_at", &QuotaSample::resets_at);

    // NormalizedConsumption
    py::class_<NormalizedConsumption>(m, "NormalizedConsumption")
        .def(py::init<>())
        .def_readwrite("consumed", &NormalizedConsumption::consumed)
        .def_readwrite("limit",    &NormalizedConsumption::limit);

    // Cycle
    py::class_<Cycle>(m, "Cycle")
        .def(py::init<>())
        .def_readwrite("id",             &Cycle::id)
        .def_readwrite("key",            &Cycle::key)
        .def_readwrite("start",          &Cycle::start)
        .def_readwrite("end",            &Cycle::end)
        .def_readwrite("peak",           &Cycle::peak)
        .def_readwrite("total_delta",    &Cycle::total_delta)
        .def_readwrite("start_consumed", &Cycle::start_consumed)
        .def_readwrite("last_sample_at", &Cycle::last_sample_at)
        .def_readwrite("last_consumed",  &Cycle::last_consumed)
        .def_readwrite("limit",          &Cycle::limit)
        .def_readwrite("resets_at",      &Cycle::resets_at)
        .def("is_active", &Cycle::is_active)
        .def("__repr__", [](const Cycle& c) {
            return "<Cycle id=" + std::to_string(c.id)
                 + " key='" + c.key.to_string()
                 + "' peak=" + std::to_string(c.peak)
                 + (c.is_active() ? " active>" : " closed>");
        });

    // CycleUpdate
    py::class_<CycleUpdate>(m, "CycleUpdate")
        .def(py::init<>())
        .def_readwrite("peak",           &CycleUpdate::peak)
        .def_readwrite("total_delta",    &CycleUpdate::total_delta)
        .def_readwrite("last_sample_at", &CycleUpdate::last_sample_at)
        .def_readwrite("last_consumed",  &CycleUpdate::last_consumed)
        .def_readwrite("limit",          &CycleUpdate::limit)
        .def_readwrite("resets_at",      &CycleUpdate::resets_at);

    // IngestResult
    py::class_<IngestResult>(m, "IngestResult")
        .def(py::init<>())
        .def_readwrite("outcome",      &IngestResult::outcome)
        .def_readwrite("active_cycle", &IngestResult::active_cycle)
        .def_readwrite("closed_cycle", &IngestResult::closed_cycle)
        .def_readwrite("normalized",   &IngestResult::normalized)
        .def_readwrite("reset_reason", &IngestResult::reset_reason);

    // Configuration
    py::class_<DetectorConfig>(m, "DetectorConfig")
        .def(py::init<>())
        .def_readwrite("drop_ratio",           &DetectorConfig::drop_ratio)
        .def_readwrite("min_signal",           &DetectorConfig::min_signal)
        .def_readwrite("honor_reported_reset", &DetectorConfig::honor_reported_reset)
        .def_readwrite("reset_grace",          &DetectorConfig::reset_grace);

    py::class_<RateConfig>(m, "RateConfig")
        .def(py::init<>())
        .def_readwrite("window_span",       &RateConfig::window_span)
        .def_readwrite("min_window_span",   &RateConfig::min_window_span)
        .def_readwrite("min_fallback_span", &RateConfig::min_fallback_span);

    py::class_<AnalyticsConfig>(m, "AnalyticsConfig")
        .def(py::init<>())
        .def_readwrite("lookback",          &AnalyticsConfig::lookback)
        .def_readwrite("weekly_span",       &AnalyticsConfig::weekly_span)
        .def_readwrite("history_limit",     &AnalyticsConfig::history_limit)
        .def_readwrite("period_min_signal", &AnalyticsConfig::period_min_signal);

    py::class_<TrackerConfig>(m, "TrackerConfig")
        .def(py::init<>())
        .def_readwrite("detector",  &TrackerConfig::detector)
        .def_readwrite("rate",      &TrackerConfig::rate)
        .def_readwrite("analytics", &TrackerConfig::analytics);

    m.def("validate", &validate, py::arg("config"));

    // MonitorEvent
    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",         &MonitorEvent::type)
        .def_readwrite("timestamp",    &MonitorEvent::timestamp)
        .def_readwrite("message",      &MonitorEvent::message)
        .def_readwrite("quota_key",    &MonitorEvent::quota_key)
        .def_readwrite("cycle_id",     &MonitorEvent::cycle_id)
        .def_readwrite("consumed",     &MonitorEvent::consumed)
        .def_readwrite("peak",         &MonitorEvent::peak)
        .def_readwrite("reset_reason", &MonitorEvent::reset_reason)
        .def_readwrite("sample_time",  &MonitorEvent::sample_time);

    // Snapshots
    py::class_<QuotaSnapshot>(m, "QuotaSnapshot")
        .def(py::init<>())
        .def_readwrite("key",              &QuotaSnapshot::key)
        .def_readwrite("kind",             &QuotaSnapshot::kind)
        .def_readwrite("has_active_cycle", &QuotaSnapshot::has_active_cycle)
        .def_readwrite("cycle_start",      &QuotaSnapshot::cycle_start)
        .def_readwrite("current",          &QuotaSnapshot::current)
        .def_readwrite("peak",             &QuotaSnapshot::peak)
        .def_readwrite("limit",            &QuotaSnapshot::limit)
        .def_readwrite("usage_percent",    &QuotaSnapshot::usage_percent)
        .def_readwrite("resets_at",        &QuotaSnapshot::resets_at);

    py::class_<TrackerSnapshot>(m, "TrackerSnapshot")
        .def(py::init<>())
        .def_readwrite("timestamp", &TrackerSnapshot::timestamp)
        .def_readwrite("quotas",    &TrackerSnapshot::quotas);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("samples_ingested",      &MetricsMonitor::Metrics::samples_ingested)
        .def_readwrite("cycles_created",        &MetricsMonitor::Metrics::cycles_created)
        .def_readwrite("resets_detected",       &MetricsMonitor::Metrics::resets_detected)
        .def_readwrite("samples_out_of_order",  &MetricsMonitor::Metrics::samples_out_of_order)
        .def_readwrite("samples_discarded",     &MetricsMonitor::Metrics::samples_discarded)
        .def_readwrite("store_failures",        &MetricsMonitor::Metrics::store_failures)
        .def_readwrite("tracked_quotas",        &MetricsMonitor::Metrics::tracked_quotas)
        .def_readwrite("highest_usage_percent", &MetricsMonitor::Metrics::highest_usage_percent);
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_QuotaTrackError =
        py::register_exception<QuotaTrackException>(m, "QuotaTrackError", PyExc_RuntimeError);

    // Derived from QuotaTrackError
    static auto py_QuotaNotFoundError =
        py::register_exception<QuotaNotFoundException>(m, "QuotaNotFoundError", py_QuotaTrackError.ptr());
    static auto py_QuotaAlreadyRegisteredError =
        py::register_exception<QuotaAlreadyRegisteredException>(m, "QuotaAlreadyRegisteredError", py_QuotaTrackError.ptr());
    static auto py_MalformedSampleError =
        py::register_exception<MalformedSampleException>(m, "MalformedSampleError", py_QuotaTrackError.ptr());
    static auto py_InvalidConfigError =
        py::register_exception<InvalidConfigException>(m, "InvalidConfigError", py_QuotaTrackError.ptr());
    static auto py_StoreError =
        py::register_exception<StoreException>(m, "StoreError", py_QuotaTrackError.ptr());

    // Derived from StoreError
    static auto py_CycleNotFoundError =
        py::register_exception<CycleNotFoundException>(m, "CycleNotFoundError", py_StoreError.ptr());
}
