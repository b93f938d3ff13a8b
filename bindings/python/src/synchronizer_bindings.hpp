#pragma once
// Synchronizer bindings: context manager freezing the global clock

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

#include <utcnow/synchronizer.hpp>

#include "py_types.hpp"

#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace utcnow_python {

inline void bind_synchronizer(nb::module_& m) {
    nb::enum_<utcnow::FrameState>(m, "FrameState", "Lifecycle of a synchronizer frame")
        .value("pending", utcnow::FrameState::pending, "Created, not yet entered")
        .value("active", utcnow::FrameState::active, "Holding the frozen clock")
        .value("superseded", utcnow::FrameState::superseded,
               "Replaced by a newer frame; further use raises")
        .value("closed", utcnow::FrameState::closed, "Exited")
        .def("__str__",
             [](utcnow::FrameState s) { return std::string(utcnow::frame_state_string(s)); });

    // =========================================================================
    // Synchronizer
    // =========================================================================

    nb::class_<PySynchronizer>(
        m, "Synchronizer",
        "Context manager that freezes 'now' for every conversion in this process")
        .def(
            "__init__",
            [](PySynchronizer* self, nb::handle value, nb::handle modifier) {
                new (self) PySynchronizer(to_timestamp_input(value), to_modifier_input(modifier));
            },
            "value"_a = nb::none(), "modifier"_a = nb::none())
        .def(
            "__enter__",
            [](PySynchronizer& self) -> PySynchronizer& {
                unwrap(self.frame.enter());
                return self;
            },
            nb::rv_policy::reference)
        .def(
            "__exit__",
            [](PySynchronizer& self, nb::handle, nb::handle, nb::handle) {
                unwrap(self.frame.exit());
                return false;
            },
            "exc_type"_a.none(), "exc_value"_a.none(), "traceback"_a.none())
        .def_prop_ro("state", [](const PySynchronizer& self) { return self.frame.state(); })
        .def_prop_ro("active", [](const PySynchronizer& self) { return self.frame.is_active(); })
        .def(
            "rfc3339_timestamp",
            [](const PySynchronizer& self) { return unwrap(self.frame.rfc3339()).str(); },
            "Frozen instant as a canonical string")
        .def(
            "as_unixtime", [](const PySynchronizer& self) { return unwrap(self.frame.unixtime()); },
            "Frozen instant as epoch seconds")
        .def(
            "as_datetime",
            [](const PySynchronizer& self) { return to_py_datetime(unwrap(self.frame.datetime())); },
            "Frozen instant as an aware datetime")
        .def(
            "time_ns", [](const PySynchronizer& self) { return unwrap(self.frame.time_ns()); },
            "Frozen instant as integer nanoseconds")
        .def("__str__",
             [](const PySynchronizer& self) { return unwrap(self.frame.rfc3339()).str(); })
        .def("__repr__", [](const PySynchronizer& self) {
            return std::string("Synchronizer(state=") +
                   utcnow::frame_state_string(self.frame.state()) + ")";
        });

    m.attr("synchronizer") = m.attr("Synchronizer");
    m.attr("freeze") = m.attr("Synchronizer");

    m.def(
        "synchronizer_active", [] { return utcnow::Synchronizer::global().active(); },
        "True while a Synchronizer is entered");
}

} // namespace utcnow_python
