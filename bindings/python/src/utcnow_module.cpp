// utcnow Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "error_bindings.hpp"
#include "synchronizer_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointers (declared extern in py_types.hpp)
namespace utcnow_python {
PyObject* invalid_format_error_type = nullptr;
PyObject* synchronizer_misuse_error_type = nullptr;
} // namespace utcnow_python

NB_MODULE(_utcnow, m) {
    m.doc() = "utcnow - timestamps normalized to RFC 3339 UTC";

    // Bind components in dependency order:
    // 1. Error types (sets the exception pointers) - no dependencies
    utcnow_python::bind_errors(m);

    // 2. Core types and conversion functions - need the exception pointers
    utcnow_python::bind_core(m);
    utcnow_python::bind_conversions(m);

    // 3. Synchronizer context manager - needs conversions of values and modifiers
    utcnow_python::bind_synchronizer(m);
}
