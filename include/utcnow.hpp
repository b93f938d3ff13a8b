#pragma once

/**
 * @file utcnow.hpp
 * @brief Convenience header for the timestamp normalization library
 *
 * Primary types:
 * - CanonicalString: fixed 27-character "YYYY-MM-DDTHH:MM:SS.ffffffZ" value
 * - Instant: epoch seconds + microseconds with floor semantics
 * - Modifier: signed microsecond shift ("+10d", "-1h", 0.5)
 * - DateTime: structured calendar value with optional UTC offset
 * - TimestampMessage: {seconds, nanos} with protobuf wire encoding
 * - Synchronizer / SyncFrame: deterministic "current instant" override
 * - Converter: conversion entry points bound to one Synchronizer
 * - Result: expected<T, Error> for every fallible operation
 *
 * Free functions (bound to Synchronizer::global()):
 * - rfc3339_timestamp(), as_datetime(), as_unixtime(), as_message(),
 *   as_date_string(), timediff(), apply_modifier()
 * - cache_info(), clear_caches()
 */

#include "utcnow/canonical.hpp"
#include "utcnow/converter.hpp"
#include "utcnow/date_time.hpp"
#include "utcnow/error.hpp"
#include "utcnow/expected.hpp"
#include "utcnow/input.hpp"
#include "utcnow/instant.hpp"
#include "utcnow/message.hpp"
#include "utcnow/modifier.hpp"
#include "utcnow/synchronizer.hpp"
#include "utcnow/utils/lru_cache.hpp"
#include "utcnow/version.hpp"
