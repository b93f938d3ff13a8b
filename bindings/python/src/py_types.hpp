#pragma once
// Python value conversions for utcnow bindings

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

#include <utcnow.hpp>

#include <string>
#include <utility>

#include <cstdint>

namespace nb = nanobind;

namespace utcnow_python {

// Exception type pointers (set during module init)
extern PyObject* invalid_format_error_type;
extern PyObject* synchronizer_misuse_error_type;

/**
 * @brief Raise the Python exception matching an Error's category
 *
 * Invalid-Format errors raise InvalidFormatError (a ValueError), misuse of a
 * synchronizer frame raises SynchronizerMisuseError (a RuntimeError).
 */
[[noreturn]] inline void raise_error(const utcnow::Error& err) {
    PyObject* type = err.category() == utcnow::ErrorCategory::synchronizer_misuse
                         ? synchronizer_misuse_error_type
                         : invalid_format_error_type;
    PyErr_SetString(type, err.describe().c_str());
    throw nb::python_error();
}

template <typename T>
T unwrap(utcnow::Result<T>&& result) {
    if (!result.has_value()) {
        raise_error(result.error());
    }
    return std::move(*result);
}

inline void unwrap(utcnow::Result<void>&& result) {
    if (!result.has_value()) {
        raise_error(result.error());
    }
}

inline nb::module_ datetime_module() {
    return nb::module_::import_("datetime");
}

/// datetime.datetime -> DateTime, naive when tzinfo is unset
inline utcnow::DateTime to_date_time(nb::handle obj) {
    utcnow::DateTime dt;
    dt.year = nb::cast<int64_t>(obj.attr("year"));
    dt.month = nb::cast<int>(obj.attr("month"));
    dt.day = nb::cast<int>(obj.attr("day"));
    dt.hour = nb::cast<int>(obj.attr("hour"));
    dt.minute = nb::cast<int>(obj.attr("minute"));
    dt.second = nb::cast<int>(obj.attr("second"));
    dt.microsecond = nb::cast<int>(obj.attr("microsecond"));

    nb::object offset = obj.attr("utcoffset")();
    if (!offset.is_none()) {
        const int64_t days = nb::cast<int64_t>(offset.attr("days"));
        const int64_t seconds = nb::cast<int64_t>(offset.attr("seconds"));
        dt.utc_offset_seconds = static_cast<int32_t>(days * 86'400 + seconds);
    }
    return dt;
}

/// DateTime -> timezone-aware datetime.datetime in UTC
inline nb::object to_py_datetime(const utcnow::DateTime& dt) {
    nb::module_ mod = datetime_module();
    return mod.attr("datetime")(dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second,
                                dt.microsecond, mod.attr("timezone").attr("utc"));
}

/**
 * @brief Map a Python object onto a TimestampInput
 *
 * None means now. Integers too large for int64 go through the numeric
 * string path, which reports them as out of range.
 */
inline utcnow::TimestampInput to_timestamp_input(nb::handle obj) {
    if (obj.is_none()) {
        return utcnow::Now{};
    }
    if (nb::isinstance<nb::bool_>(obj)) {
        raise_error(utcnow::Error{utcnow::ErrorCode::invalid_format,
                                  nb::cast<std::string>(nb::repr(obj))});
    }
    if (nb::isinstance<nb::str>(obj)) {
        return nb::cast<std::string>(obj);
    }
    if (nb::isinstance<nb::int_>(obj)) {
        int64_t value = 0;
        if (nb::try_cast<int64_t>(obj, value)) {
            return value;
        }
        return nb::cast<std::string>(nb::str(obj));
    }
    if (nb::isinstance<nb::float_>(obj)) {
        return nb::cast<double>(obj);
    }
    if (nb::isinstance<nb::bytes>(obj)) {
        auto bytes = nb::borrow<nb::bytes>(obj);
        const auto* data = reinterpret_cast<const uint8_t*>(bytes.c_str());
        return utcnow::WireBytes(data, data + bytes.size());
    }
    if (nb::isinstance<utcnow::TimestampMessage>(obj)) {
        return nb::cast<utcnow::TimestampMessage>(obj);
    }
    nb::object datetime_type = datetime_module().attr("datetime");
    if (PyObject_IsInstance(obj.ptr(), datetime_type.ptr()) == 1) {
        return to_date_time(obj);
    }
    raise_error(utcnow::Error{utcnow::ErrorCode::invalid_format,
                              nb::cast<std::string>(nb::repr(obj))});
}

/// None, int or float seconds, or an expression string such as "+7d"
inline utcnow::ModifierInput to_modifier_input(nb::handle obj) {
    if (obj.is_none()) {
        return {};
    }
    if (nb::isinstance<nb::str>(obj)) {
        return nb::cast<std::string>(obj);
    }
    if (nb::isinstance<nb::int_>(obj) && !nb::isinstance<nb::bool_>(obj)) {
        int64_t value = 0;
        if (nb::try_cast<int64_t>(obj, value)) {
            return value;
        }
    }
    if (nb::isinstance<nb::float_>(obj)) {
        return nb::cast<double>(obj);
    }
    raise_error(utcnow::Error{utcnow::ErrorCode::invalid_modifier,
                              nb::cast<std::string>(nb::repr(obj))});
}

/**
 * @brief Python wrapper for a SyncFrame bound to the global Synchronizer
 *
 * Used as a context manager: __enter__ freezes the clock, __exit__ releases
 * it. The frame is created pending so construction never raises.
 */
struct PySynchronizer {
    utcnow::SyncFrame frame;

    PySynchronizer(utcnow::TimestampInput value, utcnow::ModifierInput modifier)
        : frame(utcnow::Synchronizer::global().frame(std::move(value), std::move(modifier))) {}

    PySynchronizer(const PySynchronizer&) = delete;
    PySynchronizer& operator=(const PySynchronizer&) = delete;
};

} // namespace utcnow_python
