#pragma once
// Error bindings: ErrorCode, ErrorCategory, InvalidFormatError, SynchronizerMisuseError

#include <nanobind/nanobind.h>

#include <utcnow/error.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace utcnow_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // ErrorCode enum
    // =========================================================================

    nb::enum_<utcnow::ErrorCode>(m, "ErrorCode", "Reasons a conversion or frame operation failed")
        .value("invalid_format", utcnow::ErrorCode::invalid_format,
               "Text does not match any accepted timestamp shape")
        .value("out_of_range", utcnow::ErrorCode::out_of_range,
               "Field or instant outside years 1..9999")
        .value("invalid_offset", utcnow::ErrorCode::invalid_offset,
               "Unrecognized UTC offset or timezone")
        .value("invalid_modifier", utcnow::ErrorCode::invalid_modifier,
               "Malformed modifier value")
        .value("unknown_unit", utcnow::ErrorCode::unknown_unit, "Unrecognized time unit")
        .value("invalid_message", utcnow::ErrorCode::invalid_message,
               "Malformed binary timestamp message")
        .value("frame_not_pending", utcnow::ErrorCode::frame_not_pending,
               "Synchronizer entered twice")
        .value("frame_superseded", utcnow::ErrorCode::frame_superseded,
               "Synchronizer replaced by a newer one")
        .value("frame_not_active", utcnow::ErrorCode::frame_not_active,
               "Synchronizer exited or read while not active")
        .def("__str__",
             [](utcnow::ErrorCode c) { return std::string(utcnow::error_code_string(c)); });

    nb::enum_<utcnow::ErrorCategory>(m, "ErrorCategory")
        .value("invalid_format", utcnow::ErrorCategory::invalid_format)
        .value("synchronizer_misuse", utcnow::ErrorCategory::synchronizer_misuse);

    m.def("error_category", &utcnow::error_category, "Category of an error code", "code"_a);

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // InvalidFormatError - malformed or unrepresentable input values
    auto invalid_format =
        nb::exception<std::runtime_error>(m, "InvalidFormatError", PyExc_ValueError);
    invalid_format_error_type = invalid_format.ptr();

    // SynchronizerMisuseError - re-entering, double-closing or reading a stale frame
    auto misuse =
        nb::exception<std::runtime_error>(m, "SynchronizerMisuseError", PyExc_RuntimeError);
    synchronizer_misuse_error_type = misuse.ptr();
}

} // namespace utcnow_python
