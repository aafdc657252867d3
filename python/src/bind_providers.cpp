#include "bind_forward.hpp"
#include <quotatrack/quotatrack.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>

using namespace quotatrack;
using namespace quotatrack::providers;

// ---------------------------------------------------------------------------
// bind_providers  --  descriptor and sample builders per counter family
// ---------------------------------------------------------------------------
void bind_providers(py::module_& m) {
    auto p = m.def_submodule("providers", "Counter-family helpers");

    // ===================================================================
    // RequestCounter
    // ===================================================================
    py::class_<RequestCounterReading>(p, "RequestCounterReading")
        .def(py::init<>())
        .def_readwrite("requests",  &RequestCounterReading::requests)
        .def_readwrite("limit",     &RequestCounterReading::limit)
        .def_readwrite("renews_at", &RequestCounterReading::renews_at);

    py::class_<RequestCounter>(p, "RequestCounter")
        .def_static("descriptor", &RequestCounter::descriptor,
                    py::arg("provider"), py::arg("quota"),
                    py::arg("fixed_limit") = std::nullopt,
                    py::arg("display_name") = "")
        .def_static("sample", &RequestCounter::sample,
                    py::arg("key"), py::arg("at"), py::arg("reading"));

    // ===================================================================
    // RemainingBudget
    // ===================================================================
    py::class_<RemainingBudgetReading>(p, "RemainingBudgetReading")
        .def(py::init<>())
        .def_readwrite("total",    &RemainingBudgetReading::total)
        .def_readwrite("remain",   &RemainingBudgetReading::remain)
        .def_readwrite("reset_in", &RemainingBudgetReading::reset_in);

    py::class_<RemainingBudget>(p, "RemainingBudget")
        .def_static("descriptor", &RemainingBudget::descriptor,
                    py::arg("provider"), py::arg("quota"),
                    py::arg("display_name") = "")
        .def_static("sample", &RemainingBudget::sample,
                    py::arg("key"), py::arg("at"), py::arg("reading"));

    // ===================================================================
    // UtilizationWindow
    // ===================================================================
    py::class_<UtilizationReading>(p, "UtilizationReading")
        .def(py::init<>())
        .def_readwrite("utilization", &UtilizationReading::utilization)
        .def_readwrite("resets_at",   &UtilizationReading::resets_at);

    py::class_<UtilizationWindow>(p, "UtilizationWindow")
        .def_static("descriptor", &UtilizationWindow::descriptor,
                    py::arg("provider"), py::arg("quota"),
                    py::arg("display_name") = "")
        .def_static("sample", &UtilizationWindow::sample,
                    py::arg("key"), py::arg("at"), py::arg("reading"));
}
