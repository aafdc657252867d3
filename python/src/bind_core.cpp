#include "bind_forward.hpp"
#include <quotatrack/quotatrack.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace quotatrack;

// Trampoline class to allow Python subclassing of CycleStore
class PyCycleStore : public CycleStore {
public:
    using CycleStore::CycleStore;

    std::optional<Cycle> get_active_cycle(const QuotaKey& key) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::optional<Cycle>, CycleStore, get_active_cycle, key);
    }

    Cycle create_cycle(const QuotaKey& key, Timestamp start, double initial_peak,
                       std::optional<Timestamp> resets_at) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(Cycle, CycleStore, create_cycle, key, start, initial_peak, resets_at);
    }

    void update_cycle(CycleId id, const CycleUpdate& update) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, CycleStore, update_cycle, id, update);
    }

    void close_cycle(CycleId id, Timestamp end, double final_peak, double final_total_delta) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, CycleStore, close_cycle, id, end, final_peak, final_total_delta);
    }

    std::vector<Cycle> list_cycles_since(const QuotaKey& key, Timestamp since) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::vector<Cycle>, CycleStore, list_cycles_since, key, since);
    }

    std::vector<Cycle> list_cycle_history(const QuotaKey& key, std::size_t limit) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::vector<Cycle>, CycleStore, list_cycle_history, key, limit);
    }
};

// ---------------------------------------------------------------------------
// bind_core  --  stores, normalizer, detector, QuotaTracker
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // Cycle stores
    // ===================================================================
    py::class_<CycleStore, PyCycleStore, std::shared_ptr<CycleStore>>(m, "CycleStore")
        .def(py::init<>())
        .def("get_active_cycle",   &CycleStore::get_active_cycle, py::arg("key"))
        .def("create_cycle",       &CycleStore::create_cycle,
             py::arg("key"), py::arg("start"), py::arg("initial_peak"),
             py::arg("resets_at") = std::nullopt)
        .def("update_cycle",       &CycleStore::update_cycle,
             py::arg("id"), py::arg("update"))
        .def("close_cycle",        &CycleStore::close_cycle,
             py::arg("id"), py::arg("end"), py::arg("final_peak"), py::arg("final_total_delta"))
        .def("list_cycles_since",  &CycleStore::list_cycles_since,
             py::arg("key"), py::arg("since"))
        .def("list_cycle_history", &CycleStore::list_cycle_history,
             py::arg("key"), py::arg("limit") = 0);

    py::class_<InMemoryCycleStore, CycleStore, std::shared_ptr<InMemoryCycleStore>>(
            m, "InMemoryCycleStore")
        .def(py::init<>())
        .def("all_cycles",  &InMemoryCycleStore::all_cycles, py::arg("key"))
        .def("cycle_count", &InMemoryCycleStore::cycle_count);

    // ===================================================================
    // Normalizer
    // ===================================================================
    m.def("normalize", &SampleNormalizer::normalize,
          py::arg("sample"), py::arg("descriptor"));
    m.def("resolve_limit", &SampleNormalizer::resolve_limit,
          py::arg("sample"), py::arg("descriptor"));
    m.def("usage_percent", &usage_percent,
          py::arg("consumed"), py::arg("limit"));

    // ===================================================================
    // CycleDetector
    // ===================================================================
    py::class_<CycleDetector>(m, "CycleDetector")
        .def(py::init<std::shared_ptr<CycleStore>, DetectorConfig>(),
             py::arg("store"), py::arg("config") = DetectorConfig{})
        .def("ingest", &CycleDetector::ingest,
             py::arg("descriptor"), py::arg("sample"))
        .def_static("is_drop_reset", &CycleDetector::is_drop_reset,
                    py::arg("peak"), py::arg("consumed"),
                    py::arg("drop_ratio"), py::arg("min_signal"));

    // ===================================================================
    // Query results
    // ===================================================================
    py::class_<UsageSummary>(m, "UsageSummary")
        .def(py::init<>())
        .def_readwrite("key",               &UsageSummary::key)
        .def_readwrite("current",           &UsageSummary::current)
        .def_readwrite("limit",             &UsageSummary::limit)
        .def_readwrite("usage_percent",     &UsageSummary::usage_percent)
        .def_readwrite("resets_at",         &UsageSummary::resets_at)
        .def_readwrite("hours_until_reset", &UsageSummary::hours_until_reset)
        .def_readwrite("completed_cycles",  &UsageSummary::completed_cycles)
        .def_readwrite("average_per_cycle", &UsageSummary::average_per_cycle)
        .def_readwrite("peak_cycle",        &UsageSummary::peak_cycle)
        .def_readwrite("total_tracked",     &UsageSummary::total_tracked)
        .def_readwrite("tracking_since",    &UsageSummary::tracking_since)
        .def_readwrite("active_cycle",      &UsageSummary::active_cycle);

    py::class_<QuotaInsights>(m, "QuotaInsights")
        .def(py::init<>())
        .def_readwrite("key",               &QuotaInsights::key)
        .def_readwrite("usage",             &QuotaInsights::usage)
        .def_readwrite("rate",              &QuotaInsights::rate)
        .def_readwrite("projection",        &QuotaInsights::projection)
        .def_readwrite("forecast",          &QuotaInsights::forecast)
        .def_readwrite("billing",           &QuotaInsights::billing)
        .def_readwrite("variance",          &QuotaInsights::variance)
        .def_readwrite("trend",             &QuotaInsights::trend)
        .def_readwrite("cycle_utilization", &QuotaInsights::cycle_utilization)
        .def_readwrite("weekly_pace",       &QuotaInsights::weekly_pace);

    // ===================================================================
    // QuotaTracker
    // ===================================================================
    using When = std::optional<Timestamp>;

    py::class_<QuotaTracker>(m, "QuotaTracker")
        .def(py::init<std::shared_ptr<CycleStore>, TrackerConfig>(),
             py::arg("store"), py::arg("config") = TrackerConfig{})

        // ------------- Registration -------------
        .def("register_quota", &QuotaTracker::register_quota, py::arg("descriptor"))
        .def("is_registered",  &QuotaTracker::is_registered, py::arg("key"))
        .def("get_descriptor", &QuotaTracker::get_descriptor, py::arg("key"))
        .def("quota_keys",     &QuotaTracker::quota_keys)
        .def("quota_count",    &QuotaTracker::quota_count)

        // ------------- Ingestion -------------
        .def("ingest", &QuotaTracker::ingest, py::arg("sample"),
             py::call_guard<py::gil_scoped_release>())
        .def("ingest_all", &QuotaTracker::ingest_all, py::arg("samples"),
             py::call_guard<py::gil_scoped_release>())

        // ------------- Queries -------------
        .def("active_cycle", &QuotaTracker::active_cycle, py::arg("key"))
        .def("rate",
             [](const QuotaTracker& self, const QuotaKey& key, When now) {
                 return self.rate(key, now.value_or(Clock::now()));
             },
             py::arg("key"), py::arg("now") = std::nullopt)
        .def("projection",
             [](const QuotaTracker& self, const QuotaKey& key, When now) {
                 return self.projection(key, now.value_or(Clock::now()));
             },
             py::arg("key"), py::arg("now") = std::nullopt)
        .def("billing_periods",
             [](const QuotaTracker& self, const QuotaKey& key, When now) {
                 return self.billing_periods(key, now.value_or(Clock::now()));
             },
             py::arg("key"), py::arg("now") = std::nullopt)
        .def("billing_summary",
             [](const QuotaTracker& self, const QuotaKey& key, When now) {
                 return self.billing_summary(key, now.value_or(Clock::now()));
             },
             py::arg("key"), py::arg("now") = std::nullopt)
        .def("usage_summary",
             [](const QuotaTracker& self, const QuotaKey& key, When now) {
                 return self.usage_summary(key, now.value_or(Clock::now()));
             },
             py::arg("key"), py::arg("now") = std::nullopt)
        .def("insights",
             [](const QuotaTracker& self, const QuotaKey& key, When now) {
                 return self.insights(key, now.value_or(Clock::now()));
             },
             py::arg("key"), py::arg("now") = std::nullopt)
        .def("get_snapshot", &QuotaTracker::get_snapshot)

        // ------------- Configuration -------------
        .def("set_monitor",      &QuotaTracker::set_monitor, py::arg("monitor"))
        .def("publish_snapshot", &QuotaTracker::publish_snapshot)
        .def("config",           &QuotaTracker::config, py::return_value_policy::copy);
}
