#pragma once
// Core bindings: TimestampMessage, TimeUnit, conversion functions and their aliases

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

#include <utcnow.hpp>

#include "py_types.hpp"

#include <initializer_list>
#include <string>

#include <cstdint>

namespace nb = nanobind;
using namespace nb::literals;

namespace utcnow_python {

/// Bind every alias in `names` to the already-registered function `target`
inline void alias(nb::module_& m, const char* target, std::initializer_list<const char*> names) {
    nb::object fn = m.attr(target);
    for (const char* name : names) {
        m.attr(name) = fn;
    }
}

inline void bind_core(nb::module_& m) {
    // =========================================================================
    // TimeUnit
    // =========================================================================

    nb::enum_<utcnow::TimeUnit>(m, "TimeUnit", "Units accepted by timediff()")
        .value("nanoseconds", utcnow::TimeUnit::nanoseconds)
        .value("microseconds", utcnow::TimeUnit::microseconds)
        .value("milliseconds", utcnow::TimeUnit::milliseconds)
        .value("seconds", utcnow::TimeUnit::seconds)
        .value("minutes", utcnow::TimeUnit::minutes)
        .value("hours", utcnow::TimeUnit::hours)
        .value("days", utcnow::TimeUnit::days)
        .value("weeks", utcnow::TimeUnit::weeks)
        .value("months", utcnow::TimeUnit::months, "Fixed 30 days")
        .value("years", utcnow::TimeUnit::years, "Fixed 365 days");

    // =========================================================================
    // TimestampMessage
    // =========================================================================

    nb::class_<utcnow::TimestampMessage>(m, "TimestampMessage",
                                         "{seconds, nanos} timestamp message")
        .def(
            "__init__",
            [](utcnow::TimestampMessage* self, int64_t seconds, int32_t nanos) {
                new (self) utcnow::TimestampMessage{seconds, nanos};
            },
            "seconds"_a = 0, "nanos"_a = 0)
        .def_rw("seconds", &utcnow::TimestampMessage::seconds, "Seconds since the epoch")
        .def_rw("nanos", &utcnow::TimestampMessage::nanos,
                "Non-negative nanoseconds within the second")
        .def(
            "SerializeToString",
            [](const utcnow::TimestampMessage& msg) {
                auto bytes = msg.encode();
                return nb::bytes(reinterpret_cast<const char*>(bytes.data()), bytes.size());
            },
            "Encode using the protocol buffer wire format")
        .def_static(
            "FromString",
            [](nb::bytes data) {
                const auto* ptr = reinterpret_cast<const uint8_t*>(data.c_str());
                return unwrap(utcnow::TimestampMessage::decode({ptr, data.size()}));
            },
            "Decode from the protocol buffer wire format", "data"_a)
        .def("__eq__", [](const utcnow::TimestampMessage& a,
                          const utcnow::TimestampMessage& b) { return a == b; })
        .def("__repr__", [](const utcnow::TimestampMessage& msg) {
            return "TimestampMessage(" + msg.describe() + ")";
        });

    // Constants
    m.attr("__version__") = utcnow::version();
    m.attr("__version_info__") =
        nb::make_tuple(utcnow::VERSION_MAJOR, utcnow::VERSION_MINOR, utcnow::VERSION_PATCH);
    m.attr("CANONICAL_LENGTH") = utcnow::CanonicalString::LENGTH;
}

inline void bind_conversions(nb::module_& m) {
    // All functions read "now" through the global Synchronizer
    static const utcnow::Converter convert{};

    m.def(
        "rfc3339_timestamp",
        [](nb::handle value, nb::handle modifier) {
            return unwrap(
                       convert.rfc3339_timestamp(to_timestamp_input(value),
                                                 to_modifier_input(modifier)))
                .str();
        },
        "Normalize a timestamp to 'YYYY-MM-DDTHH:MM:SS.ffffffZ'", "value"_a = nb::none(),
        "modifier"_a = nb::none());

    m.def(
        "as_datetime",
        [](nb::handle value, nb::handle modifier) {
            return to_py_datetime(unwrap(convert.as_datetime(to_timestamp_input(value),
                                                             to_modifier_input(modifier))));
        },
        "Timezone-aware datetime in UTC", "value"_a = nb::none(), "modifier"_a = nb::none());

    m.def(
        "as_unixtime",
        [](nb::handle value, nb::handle modifier) {
            return unwrap(
                convert.as_unixtime(to_timestamp_input(value), to_modifier_input(modifier)));
        },
        "Seconds since the epoch as a float", "value"_a = nb::none(), "modifier"_a = nb::none());

    m.def(
        "as_protobuf",
        [](nb::handle value, nb::handle modifier) {
            return unwrap(
                convert.as_message(to_timestamp_input(value), to_modifier_input(modifier)));
        },
        "{seconds, nanos} timestamp message", "value"_a = nb::none(),
        "modifier"_a = nb::none());

    m.def(
        "as_date_string",
        [](nb::handle value, const std::string& tz) {
            return unwrap(convert.as_date_string(to_timestamp_input(value), tz));
        },
        "'YYYY-MM-DD' at a fixed UTC offset such as '+01:00'", "value"_a = nb::none(),
        "tz"_a = "");

    m.def(
        "timediff",
        [](nb::handle begin, nb::handle end, const std::string& unit) {
            return unwrap(
                convert.timediff(to_timestamp_input(begin), to_timestamp_input(end), unit));
        },
        "end - begin in the given unit", "begin"_a, "end"_a, "unit"_a = "seconds");

    alias(m, "rfc3339_timestamp",
          {"as_string", "as_str", "as_rfc3339", "to_string", "to_str", "to_rfc3339",
           "get_string", "get_str", "get_rfc3339", "get", "string", "rfc3339",
           "timestamp_rfc3339", "ts_rfc3339", "rfc3339_ts", "utcnow_rfc3339", "rfc3339_utcnow",
           "now_rfc3339", "rfc3339_now", "get_now", "utcnow", "now"});
    alias(m, "as_datetime",
          {"as_date", "as_dt", "to_datetime", "to_date", "to_dt", "get_datetime", "get_date",
           "get_dt", "datetime", "date", "dt"});
    alias(m, "as_unixtime",
          {"as_unix", "as_time", "as_timestamp", "as_ut", "as_ts", "as_float", "to_unixtime",
           "to_unix", "to_time", "to_timestamp", "to_ut", "to_ts", "to_float", "get_unixtime",
           "get_unix", "get_time", "get_timestamp", "get_ut", "get_ts", "get_float", "unixtime",
           "unix", "time", "timestamp", "ut", "ts"});
    alias(m, "as_protobuf",
          {"as_proto", "as_protobuf_timestamp", "as_proto_timestamp", "as_pb", "to_protobuf",
           "to_proto", "to_protobuf_timestamp", "to_proto_timestamp", "to_pb", "get_protobuf",
           "get_proto", "get_protobuf_timestamp", "get_proto_timestamp", "get_pb", "protobuf",
           "proto", "protobuf_timestamp", "proto_timestamp", "pb"});
    alias(m, "timediff", {"time_diff", "diff", "timedelta", "delta"});
    alias(m, "as_date_string",
          {"as_datestring", "as_date_str", "as_datestr", "to_date_string", "to_datestring",
           "to_date_str", "to_datestr", "get_date_string", "get_datestring", "get_date_str",
           "get_datestr", "get_today", "get_today_date", "get_todays_date", "get_date_today",
           "date_today", "today_date", "todays_date", "today", "date_string", "datestring",
           "date_str", "datestr"});
}

} // namespace utcnow_python
